#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>

class TransferControl;

enum class ChecksumAlgorithm { Md5, Sha1, XxHash64 };

/**
 * Checksum - digest helpers shared by the copy engine and the MHL code.
 *
 * MD5 and SHA-1 come from QCryptographicHash; xxh64 uses XXHash64.
 * Files are streamed in fixed chunks so memory stays bounded for any size.
 * All digests are returned as lowercase hex. An empty string means failure.
 */
namespace Checksum {

constexpr qint64 DefaultChunkSize = 1024 * 1024;

// Element name used in MHL files: "md5", "sha1", "xxh64"
QString tagName(ChecksumAlgorithm algorithm);
// Human readable name: "MD5", "SHA1", "xxHash64"
QString displayName(ChecksumAlgorithm algorithm);
// Accepts tag or display names, case-insensitive. Returns false if unknown.
bool fromName(const QString& name, ChecksumAlgorithm& algorithm);
QStringList tagNames();

QString bytesHex(const QByteArray& data, ChecksumAlgorithm algorithm);

// Streams the file; returns an empty string on I/O failure or when control is cancelled.
QString fileHex(const QString& filePath, ChecksumAlgorithm algorithm,
                TransferControl* control = nullptr, qint64 chunkSize = DefaultChunkSize);

// Case-insensitive digest comparison; empty digests never match
bool matches(const QString& a, const QString& b);

} // namespace Checksum
