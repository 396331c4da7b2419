#pragma once
#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

#include "checksum.h"

class TransferControl;

struct ManifestEntry {
    QString fileName;
    QString directory;          // name of the parent directory only
    qint64 size = 0;
    ChecksumAlgorithm algorithm = ChecksumAlgorithm::Md5;
    QString digest;             // lowercase hex
    QDateTime lastModified;
};

// A prior manifest in the audit chain: its file name and SHA-1 of its bytes
struct ManifestHistoryEntry {
    QString path;
    QString sha1;
};

struct Manifest {
    QString version;
    QString creatorName;
    QString creatorVersion;
    QDateTime created;
    QString comment;
    QList<ManifestHistoryEntry> history;
    QList<ManifestEntry> entries;

    bool isValid() const { return !entries.isEmpty(); }
};

struct ManifestWriteResult {
    bool ok = false;
    QString error;
    int entryCount = 0;
};

struct VerificationResult {
    bool success = false;
    QString message;
    QStringList verifiedFiles;
    QStringList missingFiles;
    QStringList invalidFiles;

    int verifiedCount() const { return verifiedFiles.size(); }
    int missingCount() const { return missingFiles.size(); }
    int invalidCount() const { return invalidFiles.size(); }
    int totalFiles() const { return verifiedCount() + missingCount() + invalidCount(); }
};

/**
 * MediaHashList - reads, writes and verifies MHL (media hash list) files.
 *
 * Layout written:
 *   <hashlist version="1.3">
 *     <creatorinfo><name/><version/><datetime/></creatorinfo>
 *     <comment/>                                   (optional)
 *     <history><hashlist><path/><hash alg="sha1"/></hashlist>...</history>  (optional)
 *     <hash><file/><dir/><size/><md5|sha1|xxh64/><lastmodificationdate/></hash>...
 *   </hashlist>
 *
 * Only top-level <hash> elements are file entries. Timestamps are ISO-8601 UTC.
 * All functions block on file I/O.
 */
class MediaHashList {
public:
    static const QString FormatVersion;
    static const QString CreatorName;

    // Hashes every file and writes the manifest. Files that cannot be read are
    // left out; if none remain nothing is written and ok is false.
    static ManifestWriteResult generateManifest(const QStringList& files, const QString& outputPath,
                                                ChecksumAlgorithm algorithm = ChecksumAlgorithm::Md5,
                                                const QString& comment = QString(),
                                                const QStringList& priorManifests = QStringList(),
                                                TransferControl* control = nullptr);

    // Serializes an already built manifest; refuses one without entries
    static bool writeManifest(const Manifest& manifest, const QString& outputPath, QString* errorOut = nullptr);
    static bool readManifest(const QString& manifestPath, Manifest& manifest, QString* errorOut = nullptr);

    // Looks for each entry at basePath/dir/file, or next to the manifest when basePath is empty
    static VerificationResult verifyManifest(const QString& manifestPath, const QString& basePath = QString());
    // Matches entries against the given files by parent directory name and file name
    static VerificationResult verifyFileSet(const QString& manifestPath, const QStringList& files);

    static QString defaultManifestName(const QString& directory, const QDateTime& when = QDateTime::currentDateTime());
    static QString formatTimestamp(const QDateTime& when);
    static QDateTime parseTimestamp(const QString& text);

private:
    static void checkEntry(const ManifestEntry& entry, const QString& filePath, VerificationResult& result);
    static void finish(VerificationResult& result);
};
