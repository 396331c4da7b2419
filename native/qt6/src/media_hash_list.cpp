#include "media_hash_list.h"
#include "file_utils.h"
#include "transfer_task.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSaveFile>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>
#include <utility>

const QString MediaHashList::FormatVersion = QStringLiteral("1.3");
const QString MediaHashList::CreatorName = QStringLiteral("KOffload");

namespace {

QString creatorVersion()
{
    const QString v = QCoreApplication::applicationVersion();
    return v.isEmpty() ? QStringLiteral("1.0") : v;
}

void readCreatorInfo(QXmlStreamReader& xml, Manifest& manifest)
{
    while (xml.readNextStartElement()) {
        const auto name = xml.name();
        if (name == QLatin1String("name")) manifest.creatorName = xml.readElementText();
        else if (name == QLatin1String("version")) manifest.creatorVersion = xml.readElementText();
        else if (name == QLatin1String("datetime")) manifest.created = MediaHashList::parseTimestamp(xml.readElementText());
        else xml.skipCurrentElement();
    }
}

void readHistory(QXmlStreamReader& xml, Manifest& manifest)
{
    while (xml.readNextStartElement()) {
        if (xml.name() != QLatin1String("hashlist")) {
            xml.skipCurrentElement();
            continue;
        }
        ManifestHistoryEntry h;
        while (xml.readNextStartElement()) {
            if (xml.name() == QLatin1String("path")) h.path = xml.readElementText();
            else if (xml.name() == QLatin1String("hash")) h.sha1 = xml.readElementText().trimmed().toLower();
            else xml.skipCurrentElement();
        }
        if (!h.path.isEmpty()) manifest.history.append(h);
    }
}

// False when the block lacks a file name or a known digest element
bool readEntry(QXmlStreamReader& xml, ManifestEntry& entry)
{
    bool haveDigest = false;
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        ChecksumAlgorithm alg;
        if (name == QLatin1String("file")) entry.fileName = xml.readElementText();
        else if (name == QLatin1String("dir")) entry.directory = xml.readElementText();
        else if (name == QLatin1String("size")) entry.size = xml.readElementText().trimmed().toLongLong();
        else if (name == QLatin1String("lastmodificationdate")) entry.lastModified = MediaHashList::parseTimestamp(xml.readElementText());
        else if (!haveDigest && Checksum::tagNames().contains(name) && Checksum::fromName(name, alg)) {
            entry.algorithm = alg;
            entry.digest = xml.readElementText().trimmed().toLower();
            haveDigest = !entry.digest.isEmpty();
        } else {
            xml.skipCurrentElement();
        }
    }
    return !entry.fileName.isEmpty() && haveDigest;
}

}

QString MediaHashList::formatTimestamp(const QDateTime& when)
{
    return when.toUTC().toString(Qt::ISODate);
}

QDateTime MediaHashList::parseTimestamp(const QString& text)
{
    return QDateTime::fromString(text.trimmed(), Qt::ISODate);
}

QString MediaHashList::defaultManifestName(const QString& directory, const QDateTime& when)
{
    QString base = QFileInfo(QDir::cleanPath(directory)).fileName();
    if (base.isEmpty()) base = QStringLiteral("offload");
    return QStringLiteral("%1_%2.mhl").arg(base, when.toString(QStringLiteral("yyyy-MM-dd_HHmmss")));
}

ManifestWriteResult MediaHashList::generateManifest(const QStringList& files, const QString& outputPath,
                                                    ChecksumAlgorithm algorithm, const QString& comment,
                                                    const QStringList& priorManifests, TransferControl* control)
{
    ManifestWriteResult result;

    Manifest manifest;
    manifest.version = FormatVersion;
    manifest.creatorName = CreatorName;
    manifest.creatorVersion = creatorVersion();
    manifest.created = QDateTime::currentDateTimeUtc();
    manifest.comment = comment;

    for (const QString& prior : priorManifests) {
        if (!prior.endsWith(QLatin1String(".mhl"), Qt::CaseInsensitive)) {
            qDebug() << "[MediaHashList] Ignoring non-MHL history entry" << prior;
            continue;
        }
        QFile f(prior);
        if (!f.open(QIODevice::ReadOnly)) {
            qWarning() << "[MediaHashList] Cannot read prior manifest" << prior << f.errorString();
            continue;
        }
        ManifestHistoryEntry h;
        h.path = QFileInfo(prior).fileName();
        h.sha1 = Checksum::bytesHex(f.readAll(), ChecksumAlgorithm::Sha1);
        manifest.history.append(h);
    }

    for (const QString& file : files) {
        if (control && control->isCancelled()) {
            result.error = QStringLiteral("Cancelled");
            return result;
        }
        const QFileInfo fi(file);
        if (!fi.isFile()) {
            qWarning() << "[MediaHashList] Skipping missing file" << file;
            continue;
        }
        const QString digest = Checksum::fileHex(fi.absoluteFilePath(), algorithm, control);
        if (digest.isEmpty()) {
            if (control && control->isCancelled()) {
                result.error = QStringLiteral("Cancelled");
                return result;
            }
            qWarning() << "[MediaHashList] Could not hash" << file;
            continue;
        }
        ManifestEntry e;
        e.fileName = fi.fileName();
        e.directory = fi.absoluteDir().dirName();
        e.size = fi.size();
        e.algorithm = algorithm;
        e.digest = digest;
        e.lastModified = fi.lastModified().toUTC();
        manifest.entries.append(e);
    }

    if (manifest.entries.isEmpty()) {
        result.error = QStringLiteral("No valid hashes were generated for the MHL");
        qWarning() << "[MediaHashList]" << result.error;
        return result;
    }

    if (!writeManifest(manifest, outputPath, &result.error)) return result;
    result.ok = true;
    result.entryCount = manifest.entries.size();
    qInfo() << "[MediaHashList] Wrote" << result.entryCount << "entries to" << outputPath;
    return result;
}

bool MediaHashList::writeManifest(const Manifest& manifest, const QString& outputPath, QString* errorOut)
{
    if (manifest.entries.isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("Manifest has no entries");
        return false;
    }
    if (!FileUtils::ensureDir(QFileInfo(outputPath).absolutePath())) {
        if (errorOut) *errorOut = QStringLiteral("Cannot create directory for %1").arg(outputPath);
        return false;
    }

    QSaveFile out(outputPath);
    if (!out.open(QIODevice::WriteOnly)) {
        if (errorOut) *errorOut = out.errorString();
        return false;
    }

    QXmlStreamWriter xml(&out);
    xml.setAutoFormatting(true);
    xml.setAutoFormattingIndent(4);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("hashlist"));
    xml.writeAttribute(QStringLiteral("version"), manifest.version.isEmpty() ? FormatVersion : manifest.version);

    xml.writeStartElement(QStringLiteral("creatorinfo"));
    xml.writeTextElement(QStringLiteral("name"), manifest.creatorName.isEmpty() ? CreatorName : manifest.creatorName);
    xml.writeTextElement(QStringLiteral("version"), manifest.creatorVersion.isEmpty() ? creatorVersion() : manifest.creatorVersion);
    xml.writeTextElement(QStringLiteral("datetime"),
                         formatTimestamp(manifest.created.isValid() ? manifest.created : QDateTime::currentDateTimeUtc()));
    xml.writeEndElement();

    if (!manifest.comment.isEmpty()) xml.writeTextElement(QStringLiteral("comment"), manifest.comment);

    if (!manifest.history.isEmpty()) {
        xml.writeStartElement(QStringLiteral("history"));
        for (const ManifestHistoryEntry& h : manifest.history) {
            xml.writeStartElement(QStringLiteral("hashlist"));
            xml.writeTextElement(QStringLiteral("path"), h.path);
            xml.writeStartElement(QStringLiteral("hash"));
            xml.writeAttribute(QStringLiteral("alg"), QStringLiteral("sha1"));
            xml.writeCharacters(h.sha1);
            xml.writeEndElement();
            xml.writeEndElement();
        }
        xml.writeEndElement();
    }

    for (const ManifestEntry& e : manifest.entries) {
        xml.writeStartElement(QStringLiteral("hash"));
        xml.writeTextElement(QStringLiteral("file"), e.fileName);
        xml.writeTextElement(QStringLiteral("dir"), e.directory);
        xml.writeTextElement(QStringLiteral("size"), QString::number(e.size));
        xml.writeTextElement(Checksum::tagName(e.algorithm), e.digest.toLower());
        xml.writeTextElement(QStringLiteral("lastmodificationdate"), formatTimestamp(e.lastModified));
        xml.writeEndElement();
    }

    xml.writeEndElement();
    xml.writeEndDocument();

    if (xml.hasError() || !out.commit()) {
        if (errorOut) *errorOut = QStringLiteral("Failed to write MHL file: %1").arg(out.errorString());
        return false;
    }
    return true;
}

bool MediaHashList::readManifest(const QString& manifestPath, Manifest& manifest, QString* errorOut)
{
    QFile f(manifestPath);
    if (!f.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = f.errorString();
        return false;
    }

    manifest = Manifest();
    QXmlStreamReader xml(&f);
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("hashlist")) {
        if (errorOut) *errorOut = xml.hasError() ? xml.errorString() : QStringLiteral("Missing hashlist root element");
        return false;
    }
    manifest.version = xml.attributes().value(QLatin1String("version")).toString();

    while (xml.readNextStartElement()) {
        const auto name = xml.name();
        if (name == QLatin1String("creatorinfo")) {
            readCreatorInfo(xml, manifest);
        } else if (name == QLatin1String("comment")) {
            manifest.comment = xml.readElementText();
        } else if (name == QLatin1String("history")) {
            readHistory(xml, manifest);
        } else if (name == QLatin1String("hash")) {
            ManifestEntry e;
            if (readEntry(xml, e)) manifest.entries.append(e);
            else qWarning() << "[MediaHashList] Skipping incomplete entry in" << manifestPath;
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        if (errorOut) *errorOut = QStringLiteral("%1 (line %2)").arg(xml.errorString()).arg(xml.lineNumber());
        return false;
    }
    return true;
}

void MediaHashList::checkEntry(const ManifestEntry& entry, const QString& filePath, VerificationResult& result)
{
    if (!FileUtils::fileExists(filePath)) {
        result.missingFiles << filePath;
        return;
    }
    const QString current = Checksum::fileHex(filePath, entry.algorithm);
    if (Checksum::matches(current, entry.digest)) {
        result.verifiedFiles << filePath;
    } else {
        qWarning() << "[MediaHashList] Digest mismatch for" << filePath;
        result.invalidFiles << filePath;
    }
}

void MediaHashList::finish(VerificationResult& result)
{
    result.success = result.invalidFiles.isEmpty() && !result.verifiedFiles.isEmpty();
    result.message = result.success ? QStringLiteral("All files verified successfully")
                                    : QStringLiteral("Verification failed");
}

VerificationResult MediaHashList::verifyManifest(const QString& manifestPath, const QString& basePath)
{
    VerificationResult result;
    Manifest manifest;
    QString err;
    if (!readManifest(manifestPath, manifest, &err)) {
        qWarning() << "[MediaHashList] Failed to parse" << manifestPath << ":" << err;
        result.message = QStringLiteral("Failed to parse MHL file");
        return result;
    }

    const QDir root(basePath.isEmpty() ? QFileInfo(manifestPath).absolutePath() : basePath);
    for (const ManifestEntry& e : std::as_const(manifest.entries)) {
        const QString rel = e.directory.isEmpty() ? e.fileName : e.directory + QLatin1Char('/') + e.fileName;
        checkEntry(e, QDir::cleanPath(root.filePath(rel)), result);
    }
    finish(result);
    qInfo() << "[MediaHashList] Verified" << manifestPath << "-" << result.verifiedCount() << "ok,"
            << result.missingCount() << "missing," << result.invalidCount() << "invalid";
    return result;
}

VerificationResult MediaHashList::verifyFileSet(const QString& manifestPath, const QStringList& files)
{
    VerificationResult result;
    Manifest manifest;
    QString err;
    if (!readManifest(manifestPath, manifest, &err)) {
        qWarning() << "[MediaHashList] Failed to parse" << manifestPath << ":" << err;
        result.message = QStringLiteral("Failed to parse MHL file");
        return result;
    }

    // "dir/file" -> candidate paths, consumed in order so duplicate names pair up one to one
    QHash<QString, QStringList> byKey;
    for (const QString& f : files) {
        const QFileInfo fi(f);
        byKey[fi.absoluteDir().dirName() + QLatin1Char('/') + fi.fileName()] << fi.absoluteFilePath();
    }

    for (const ManifestEntry& e : std::as_const(manifest.entries)) {
        QStringList& candidates = byKey[e.directory + QLatin1Char('/') + e.fileName];
        if (candidates.isEmpty()) {
            result.missingFiles << e.directory + QLatin1Char('/') + e.fileName;
            continue;
        }
        checkEntry(e, candidates.takeFirst(), result);
    }
    finish(result);
    return result;
}
