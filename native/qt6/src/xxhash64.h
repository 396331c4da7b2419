#pragma once
#include <QByteArray>
#include <QString>
#include <QtGlobal>
#include <array>

/**
 * XXHash64 - streaming implementation of the 64-bit xxHash algorithm.
 *
 * Input is consumed in 32-byte stripes spread over four accumulator lanes.
 * Bytes that do not fill a stripe are carried in an internal buffer until the
 * next update() or until finalize(). Digests match the reference XXH64 for the
 * same input and seed regardless of how the input is split across updates.
 *
 * Instances are not thread-safe; use one instance per stream.
 */
class XXHash64 {
public:
    static constexpr int StripeSize = 32;
    static constexpr qint64 FileChunkSize = 1024 * 1024;

    explicit XXHash64(quint64 seed = 0);

    void reset(quint64 seed = 0);
    void update(const char* data, qsizetype length);
    void update(const QByteArray& data) { update(data.constData(), data.size()); }

    // Digest of everything passed to update() so far. Does not modify the state.
    quint64 finalize() const;

    quint64 seed() const { return m_seed; }
    quint64 totalLength() const { return m_totalLength; }

    // One-shot helpers
    static quint64 hash(const QByteArray& data, quint64 seed = 0);
    static bool hashFile(const QString& filePath, quint64& digest, quint64 seed = 0);

    // 16 lowercase hex digits, most significant first
    static QString toHex(quint64 digest);

private:
    void consumeStripe(const uchar* stripe);

    quint64 m_seed = 0;
    std::array<quint64, 4> m_lanes{};
    std::array<uchar, StripeSize> m_carry{};
    int m_carrySize = 0;
    quint64 m_totalLength = 0;
};
