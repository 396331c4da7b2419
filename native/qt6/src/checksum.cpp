#include "checksum.h"
#include "transfer_task.h"
#include "xxhash64.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QFile>

namespace {

// Uniform streaming front for the three digest kinds
class StreamingDigest {
public:
    explicit StreamingDigest(ChecksumAlgorithm algorithm)
        : m_algorithm(algorithm)
        , m_crypto(algorithm == ChecksumAlgorithm::Sha1 ? QCryptographicHash::Sha1 : QCryptographicHash::Md5)
    {
    }

    void addData(const char* data, qsizetype length)
    {
        if (m_algorithm == ChecksumAlgorithm::XxHash64) m_xxh.update(data, length);
        else m_crypto.addData(data, length);
    }

    QString hex() const
    {
        if (m_algorithm == ChecksumAlgorithm::XxHash64) return XXHash64::toHex(m_xxh.finalize());
        return QString::fromLatin1(m_crypto.result().toHex());
    }

private:
    ChecksumAlgorithm m_algorithm;
    QCryptographicHash m_crypto;
    XXHash64 m_xxh;
};

}

namespace Checksum {

QString tagName(ChecksumAlgorithm algorithm)
{
    switch (algorithm) {
        case ChecksumAlgorithm::Md5: return QStringLiteral("md5");
        case ChecksumAlgorithm::Sha1: return QStringLiteral("sha1");
        case ChecksumAlgorithm::XxHash64: return QStringLiteral("xxh64");
    }
    return QString();
}

QString displayName(ChecksumAlgorithm algorithm)
{
    switch (algorithm) {
        case ChecksumAlgorithm::Md5: return QStringLiteral("MD5");
        case ChecksumAlgorithm::Sha1: return QStringLiteral("SHA1");
        case ChecksumAlgorithm::XxHash64: return QStringLiteral("xxHash64");
    }
    return QString();
}

bool fromName(const QString& name, ChecksumAlgorithm& algorithm)
{
    const QString n = name.trimmed().toLower();
    if (n == "md5") { algorithm = ChecksumAlgorithm::Md5; return true; }
    if (n == "sha1" || n == "sha-1") { algorithm = ChecksumAlgorithm::Sha1; return true; }
    if (n == "xxh64" || n == "xxhash64" || n == "xxhash") { algorithm = ChecksumAlgorithm::XxHash64; return true; }
    return false;
}

QStringList tagNames()
{
    return { tagName(ChecksumAlgorithm::Md5), tagName(ChecksumAlgorithm::Sha1), tagName(ChecksumAlgorithm::XxHash64) };
}

QString bytesHex(const QByteArray& data, ChecksumAlgorithm algorithm)
{
    StreamingDigest digest(algorithm);
    digest.addData(data.constData(), data.size());
    return digest.hex();
}

QString fileHex(const QString& filePath, ChecksumAlgorithm algorithm, TransferControl* control, qint64 chunkSize)
{
    QFile in(filePath);
    if (!in.open(QIODevice::ReadOnly)) {
        qWarning() << "[Checksum] Cannot open" << filePath << in.errorString();
        return QString();
    }
    StreamingDigest digest(algorithm);
    QByteArray buf;
    buf.resize(qMax<qint64>(chunkSize, 4096));
    while (true) {
        if (control && !control->checkpoint()) return QString();
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) {
            qWarning() << "[Checksum] Read error" << filePath << in.errorString();
            return QString();
        }
        if (r == 0) break;
        digest.addData(buf.constData(), qsizetype(r));
    }
    return digest.hex();
}

bool matches(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) return false;
    return a.compare(b, Qt::CaseInsensitive) == 0;
}

} // namespace Checksum
