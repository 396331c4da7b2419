#include "xxhash64.h"

#include <QDebug>
#include <QFile>
#include <QtEndian>

#include <cstring>

namespace {
constexpr quint64 kPrime1 = 11400714785074694791ULL;
constexpr quint64 kPrime2 = 14029467366897019727ULL;
constexpr quint64 kPrime3 = 1609587929392839161ULL;
constexpr quint64 kPrime4 = 9650029242287828579ULL;
constexpr quint64 kPrime5 = 2870177450012600261ULL;

inline quint64 rotl(quint64 value, int bits)
{
    return (value << bits) | (value >> (64 - bits));
}

inline quint64 laneRound(quint64 acc, quint64 input)
{
    acc += input * kPrime2;
    acc = rotl(acc, 31);
    return acc * kPrime1;
}

inline quint64 mergeRound(quint64 hash, quint64 lane)
{
    hash ^= laneRound(0, lane);
    return hash * kPrime1 + kPrime4;
}

inline quint64 readLane(const uchar* bytes, int offset)
{
    return qFromLittleEndian<quint64>(bytes + offset);
}

inline quint32 readWord(const uchar* bytes, int offset)
{
    return qFromLittleEndian<quint32>(bytes + offset);
}
}

XXHash64::XXHash64(quint64 seed)
{
    reset(seed);
}

void XXHash64::reset(quint64 seed)
{
    m_seed = seed;
    m_lanes[0] = seed + kPrime1 + kPrime2;
    m_lanes[1] = seed + kPrime2;
    m_lanes[2] = seed;
    m_lanes[3] = seed - kPrime1;
    m_carry.fill(0);
    m_carrySize = 0;
    m_totalLength = 0;
}

void XXHash64::consumeStripe(const uchar* stripe)
{
    for (int lane = 0; lane < 4; ++lane) {
        m_lanes[lane] = laneRound(m_lanes[lane], readLane(stripe, lane * 8));
    }
}

void XXHash64::update(const char* data, qsizetype length)
{
    if (!data || length <= 0) return;

    const auto* input = reinterpret_cast<const uchar*>(data);
    m_totalLength += quint64(length);
    qsizetype offset = 0;

    // Top up a partially filled stripe first
    if (m_carrySize > 0) {
        const qsizetype take = qMin<qsizetype>(StripeSize - m_carrySize, length);
        std::memcpy(m_carry.data() + m_carrySize, input, size_t(take));
        m_carrySize += int(take);
        offset = take;
        if (m_carrySize < StripeSize) return;
        consumeStripe(m_carry.data());
        m_carrySize = 0;
    }

    while (length - offset >= StripeSize) {
        consumeStripe(input + offset);
        offset += StripeSize;
    }

    const qsizetype rest = length - offset;
    if (rest > 0) {
        std::memcpy(m_carry.data(), input + offset, size_t(rest));
        m_carrySize = int(rest);
    }
}

quint64 XXHash64::finalize() const
{
    quint64 hash;
    if (m_totalLength >= quint64(StripeSize)) {
        hash = rotl(m_lanes[0], 1) + rotl(m_lanes[1], 7) + rotl(m_lanes[2], 12) + rotl(m_lanes[3], 18);
        for (quint64 lane : m_lanes) hash = mergeRound(hash, lane);
    } else {
        hash = m_seed + kPrime5;
    }
    hash += m_totalLength;

    const uchar* tail = m_carry.data();
    int pos = 0;
    while (pos + 8 <= m_carrySize) {
        hash ^= laneRound(0, readLane(tail, pos));
        hash = rotl(hash, 27) * kPrime1 + kPrime4;
        pos += 8;
    }
    if (pos + 4 <= m_carrySize) {
        hash ^= quint64(readWord(tail, pos)) * kPrime1;
        hash = rotl(hash, 23) * kPrime2 + kPrime3;
        pos += 4;
    }
    while (pos < m_carrySize) {
        hash ^= quint64(tail[pos]) * kPrime5;
        hash = rotl(hash, 11) * kPrime1;
        ++pos;
    }

    // Avalanche
    hash ^= hash >> 33;
    hash *= kPrime2;
    hash ^= hash >> 29;
    hash *= kPrime3;
    hash ^= hash >> 32;
    return hash;
}

quint64 XXHash64::hash(const QByteArray& data, quint64 seed)
{
    XXHash64 hasher(seed);
    hasher.update(data);
    return hasher.finalize();
}

bool XXHash64::hashFile(const QString& filePath, quint64& digest, quint64 seed)
{
    QFile in(filePath);
    if (!in.open(QIODevice::ReadOnly)) {
        qWarning() << "[XXHash64] Cannot open" << filePath << in.errorString();
        return false;
    }
    XXHash64 hasher(seed);
    QByteArray buf;
    buf.resize(FileChunkSize);
    while (true) {
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) {
            qWarning() << "[XXHash64] Read error" << filePath << in.errorString();
            return false;
        }
        if (r == 0) break;
        hasher.update(buf.constData(), qsizetype(r));
    }
    digest = hasher.finalize();
    return true;
}

QString XXHash64::toHex(quint64 digest)
{
    return QStringLiteral("%1").arg(digest, 16, 16, QLatin1Char('0'));
}
