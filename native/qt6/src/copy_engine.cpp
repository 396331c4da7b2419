#include "copy_engine.h"
#include "access_grant.h"
#include "file_utils.h"
#include "media_filter.h"
#include "transfer_task.h"

#include <QtConcurrent>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <utility>

namespace {

constexpr int kMaxReportedErrors = 5;

bool keepGoing(TransferControl* control)
{
    return !control || control->checkpoint();
}

CopyEngine::CopyResult failure(TransferError::Code code, const QString& detail = QString())
{
    CopyEngine::CopyResult r;
    r.error = TransferError(code, detail);
    return r;
}

// Canonical form of a path that may not exist yet: the nearest existing
// ancestor is resolved and the missing components are appended to it
QString resolvedPath(const QString& path)
{
    QFileInfo fi(QDir::cleanPath(QFileInfo(path).absoluteFilePath()));
    QStringList missing;
    while (!fi.exists()) {
        const QString parent = fi.absolutePath();
        if (parent == fi.absoluteFilePath()) break;
        missing.prepend(fi.fileName());
        fi = QFileInfo(parent);
    }
    QString resolved = fi.exists() ? fi.canonicalFilePath() : fi.absoluteFilePath();
    for (const QString& part : std::as_const(missing)) resolved = QDir(resolved).filePath(part);
    return QDir::cleanPath(resolved);
}

bool isSameOrInside(const QString& path, const QString& root)
{
    if (path == root) return true;
    return path.startsWith(root.endsWith(QLatin1Char('/')) ? root : root + QLatin1Char('/'));
}

}

CopyEngine::CopyEngine(AccessGrantProvider* access, const OffloadSettings& settings)
    : m_access(access)
    , m_settings(settings.normalized())
{
    m_pool.setMaxThreadCount(m_settings.maxConcurrentTransfers);
}

CopyEngine::~CopyEngine()
{
    m_pool.waitForDone();
}

QString CopyEngine::strategyName(Strategy strategy)
{
    switch (strategy) {
        case NativeCopy: return QStringLiteral("native");
        case BufferedCopy: return QStringLiteral("buffered");
        case StreamingCopy: return QStringLiteral("streaming");
        default: break;
    }
    return QStringLiteral("unknown");
}

CopyEngine::CopyResult CopyEngine::copyFile(const QString& source, const QString& destination,
                                            const ProgressCallback& progress, TransferControl* control) const
{
    if (source.isEmpty()) return failure(TransferError::Code::SourcePathInvalid);
    if (destination.isEmpty()) return failure(TransferError::Code::DestinationPathInvalid);

    const QFileInfo srcInfo(source);
    if (!srcInfo.exists()) return failure(TransferError::Code::FileNotFound, source);
    if (!srcInfo.isFile()) return failure(TransferError::Code::SourcePathInvalid, source);
    if (FileUtils::dirExists(destination)) return failure(TransferError::Code::DestinationPathInvalid, destination);
    // Every strategy replaces the destination, which would destroy the source
    if (resolvedPath(destination) == srcInfo.canonicalFilePath()) {
        qWarning() << "[CopyEngine] Refusing to copy" << source << "onto itself";
        return failure(TransferError::Code::DestinationPathInvalid, destination);
    }

    if (!keepGoing(control)) return failure(TransferError::Code::Cancelled);

    if (!AccessGrant::ensure(m_access, source)) {
        qWarning() << "[CopyEngine] No read access to" << source;
        return failure(TransferError::Code::PermissionDenied, source);
    }

    const QString parentDir = QFileInfo(destination).absolutePath();
    if (!FileUtils::ensureDir(parentDir)) {
        qWarning() << "[CopyEngine] Cannot create destination directory" << parentDir;
        return failure(TransferError::Code::DestinationNotWritable, parentDir);
    }
    if (!AccessGrant::ensure(m_access, parentDir)) {
        qWarning() << "[CopyEngine] No write access to" << parentDir;
        return failure(TransferError::Code::DestinationNotWritable, parentDir);
    }

    const qint64 total = srcInfo.size();
    const QString label = srcInfo.fileName();
    if (progress) progress(0, total, label);

    if (m_options.strategies & NativeCopy) {
        if (nativeCopy(source, destination, total)) {
            if (progress) progress(total, total, label);
            CopyResult r;
            r.ok = true;
            r.bytesCopied = total;
            r.strategy = NativeCopy;
            return r;
        }
        qDebug() << "[CopyEngine] Native copy unavailable for" << label << "- trying buffered copy";
        if (!keepGoing(control)) return failure(TransferError::Code::Cancelled);
    }

    if ((m_options.strategies & BufferedCopy) && total <= m_settings.wholeFileBufferLimit) {
        QString err;
        if (bufferedCopy(source, destination, total, &err)) {
            if (progress) progress(total, total, label);
            CopyResult r;
            r.ok = true;
            r.bytesCopied = total;
            r.strategy = BufferedCopy;
            return r;
        }
        qDebug() << "[CopyEngine] Buffered copy failed for" << label << ":" << err << "- streaming";
        if (!keepGoing(control)) return failure(TransferError::Code::Cancelled);
    }

    if (m_options.strategies & StreamingCopy) {
        return streamingCopy(source, destination, total, progress, control);
    }
    return failure(TransferError::Code::CopyFailed, QStringLiteral("No copy strategy succeeded for %1").arg(label));
}

bool CopyEngine::nativeCopy(const QString& source, const QString& destination, qint64 expectedSize) const
{
    // QFile::copy refuses to overwrite
    if (QFileInfo::exists(destination) && !QFile::remove(destination)) return false;
    if (!QFile::copy(source, destination)) return false;
    if (QFileInfo(destination).size() != expectedSize) {
        qWarning() << "[CopyEngine] Size mismatch after native copy:" << destination;
        QFile::remove(destination);
        return false;
    }
    return true;
}

bool CopyEngine::bufferedCopy(const QString& source, const QString& destination, qint64 expectedSize, QString* errorOut) const
{
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = in.errorString();
        return false;
    }
    const QByteArray data = in.readAll();
    in.close();
    if (data.size() != expectedSize) {
        if (errorOut) *errorOut = QStringLiteral("short read");
        return false;
    }

    QFile out(destination);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorOut) *errorOut = out.errorString();
        return false;
    }
    const qint64 written = out.write(data);
    out.close();
    if (written != expectedSize || QFileInfo(destination).size() != expectedSize) {
        if (errorOut) *errorOut = QStringLiteral("size mismatch after write");
        QFile::remove(destination);
        return false;
    }
    return true;
}

CopyEngine::CopyResult CopyEngine::streamingCopy(const QString& source, const QString& destination, qint64 totalBytes,
                                                 const ProgressCallback& progress, TransferControl* control) const
{
    const ChecksumAlgorithm alg = m_settings.verificationAlgorithm;
    const QString label = QFileInfo(source).fileName();

    const QString sourceDigest = Checksum::fileHex(source, alg, control, m_settings.copyBufferSize);
    if (sourceDigest.isEmpty()) {
        if (control && control->isCancelled()) return failure(TransferError::Code::Cancelled);
        return failure(TransferError::Code::CopyFailed, QStringLiteral("Failed to read %1").arg(source));
    }

    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        return failure(TransferError::Code::CopyFailed, in.errorString());
    }
    QFile out(destination);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return failure(TransferError::Code::DestinationNotWritable, out.errorString());
    }

    QByteArray buf;
    buf.resize(int(m_settings.copyBufferSize));
    qint64 copied = 0;
    while (!in.atEnd()) {
        if (!keepGoing(control)) {
            out.close();
            out.remove();
            qInfo() << "[CopyEngine] Cancelled while streaming" << label;
            return failure(TransferError::Code::Cancelled);
        }
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) {
            const QString err = in.errorString();
            out.close();
            out.remove();
            return failure(TransferError::Code::CopyFailed, err);
        }
        if (r == 0) break;
        if (out.write(buf.constData(), r) != r) {
            const QString err = out.errorString();
            out.close();
            out.remove();
            return failure(TransferError::Code::CopyFailed, err);
        }
        copied += r;
        if (progress) progress(copied, totalBytes, label);
    }
    in.close();
    if (!out.flush()) {
        const QString err = out.errorString();
        out.close();
        out.remove();
        return failure(TransferError::Code::CopyFailed, err);
    }
    out.close();
    if (copied == 0 && progress) progress(0, totalBytes, label);

    if (m_options.beforeVerify) m_options.beforeVerify(destination);

    const QString destinationDigest = Checksum::fileHex(destination, alg, control, m_settings.copyBufferSize);
    if (control && control->isCancelled()) {
        QFile::remove(destination);
        return failure(TransferError::Code::Cancelled);
    }
    if (!Checksum::matches(sourceDigest, destinationDigest)) {
        qWarning() << "[CopyEngine] Checksum mismatch for" << destination << sourceDigest << "!=" << destinationDigest;
        QFile::remove(destination);
        return failure(TransferError::Code::ChecksumMismatch, destination);
    }

    CopyResult r;
    r.ok = true;
    r.bytesCopied = copied;
    r.strategy = StreamingCopy;
    r.sourceDigest = sourceDigest;
    return r;
}

CopyEngine::ScanResult CopyEngine::scanDirectory(const QString& source) const
{
    ScanResult result;
    const QFileInfo rootInfo(source);
    if (!rootInfo.exists()) {
        result.error = TransferError(TransferError::Code::FileNotFound, source);
        return result;
    }
    if (!rootInfo.isDir()) {
        result.error = TransferError(TransferError::Code::SourcePathInvalid, source);
        return result;
    }
    if (!rootInfo.isReadable() || !rootInfo.isExecutable()) {
        result.error = TransferError(TransferError::Code::PermissionDenied, source);
        return result;
    }

    const bool skipHidden = m_settings.skipHiddenFiles;
    QStringList pending{ rootInfo.absoluteFilePath() };
    while (!pending.isEmpty()) {
        const QString dirPath = pending.takeFirst();
        const QFileInfo dirInfo(dirPath);
        if (!dirInfo.isReadable() || !dirInfo.isExecutable()) {
            qWarning() << "[CopyEngine] Skipping unreadable directory" << dirPath;
            result.skippedItems << dirPath;
            continue;
        }
        const QFileInfoList entries = QDir(dirPath).entryInfoList(
            QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);
        for (const QFileInfo& e : entries) {
            if (e.isDir()) {
                if (MediaFilter::acceptDirectory(e.fileName(), skipHidden)) pending << e.absoluteFilePath();
                else result.skippedItems << e.absoluteFilePath();
            } else if (MediaFilter::acceptFile(e.fileName(), skipHidden)) {
                result.files << e.absoluteFilePath();
                result.totalBytes += e.size();
            } else {
                result.skippedItems << e.absoluteFilePath();
            }
        }
    }
    result.files.sort();

    if (result.files.isEmpty()) {
        result.error = TransferError(TransferError::Code::FileNotFound,
                                     QStringLiteral("No media files found in %1").arg(source));
        return result;
    }
    result.ok = true;
    return result;
}

CopyEngine::DirectoryCopyResult CopyEngine::copyDirectory(const QString& source, const QString& destination,
                                                          const ProgressCallback& progress, TransferControl* control)
{
    DirectoryCopyResult result;
    if (source.isEmpty()) {
        result.error = TransferError(TransferError::Code::SourcePathInvalid);
        return result;
    }
    if (destination.isEmpty() || FileUtils::fileExists(destination)) {
        result.error = TransferError(TransferError::Code::DestinationPathInvalid, destination);
        return result;
    }
    const QString sourceRoot = QFileInfo(source).canonicalFilePath();
    if (!sourceRoot.isEmpty() && isSameOrInside(resolvedPath(destination), sourceRoot)) {
        qWarning() << "[CopyEngine] Destination" << destination << "lies inside source" << source;
        result.error = TransferError(TransferError::Code::DestinationPathInvalid, destination);
        return result;
    }
    if (!AccessGrant::ensure(m_access, source)) {
        result.error = TransferError(TransferError::Code::PermissionDenied, source);
        return result;
    }

    ScanResult scan = scanDirectory(source);
    result.skippedItems = scan.skippedItems;
    if (!scan.ok) {
        result.error = scan.error;
        return result;
    }
    result.totalFiles = scan.files.size();
    result.totalBytes = scan.totalBytes;
    qInfo() << "[CopyEngine] Found" << result.totalFiles << "media files," << result.totalBytes << "bytes in" << source;

    if (!FileUtils::ensureDir(destination) || !AccessGrant::ensure(m_access, destination)) {
        result.error = TransferError(TransferError::Code::DestinationNotWritable, destination);
        return result;
    }

    // With nothing but empty files the start report would already read 0 == 0
    if (progress && result.totalBytes > 0) {
        progress(0, result.totalBytes, QStringLiteral("Preparing to copy %1 files").arg(result.totalFiles));
    }

    const QDir srcRoot(QFileInfo(source).absoluteFilePath());
    const QDir dstRoot(QFileInfo(destination).absoluteFilePath());

    // Shared aggregate; every mutation and report happens under the mutex
    QMutex mutex;
    QHash<QString, qint64> inFlight;
    qint64 inFlightBytes = 0;
    QStringList errors;
    bool cancelled = false;
    int finished = 0;
    bool finalReported = false;

    // bytesSoFar == totalBytes is reported once, when the last file is done
    auto report = [&](const QString& label) {
        if (!progress) return;
        const qint64 soFar = result.copiedBytes + inFlightBytes;
        if (soFar == result.totalBytes) {
            if (finalReported || finished < result.totalFiles) return;
            finalReported = true;
        }
        progress(soFar, result.totalBytes, label);
    };

    QList<QFuture<void>> futures;
    futures.reserve(scan.files.size());
    for (const QString& file : std::as_const(scan.files)) {
        const QString target = dstRoot.filePath(srcRoot.relativeFilePath(file));
        futures << QtConcurrent::run(&m_pool, [&, file, target]() {
            if (!keepGoing(control)) {
                QMutexLocker lk(&mutex);
                cancelled = true;
                finished++;
                return;
            }

            // Partial file progress; the file's final bytes are reported on completion
            auto fileProgress = [&](qint64 done, qint64 total, const QString& label) {
                if (done >= total) return;
                QMutexLocker lk(&mutex);
                const qint64 delta = done - inFlight.value(file, 0);
                inFlight[file] = done;
                inFlightBytes += delta;
                report(QStringLiteral("Copying %1 - %2/%3 files").arg(label).arg(result.completedFiles).arg(result.totalFiles));
            };

            const CopyResult r = copyFile(file, target, fileProgress, control);

            QMutexLocker lk(&mutex);
            inFlightBytes -= inFlight.take(file);
            finished++;
            if (r.ok) {
                result.completedFiles++;
                result.copiedBytes += r.bytesCopied;
                result.copiedFiles << target;
                report(QStringLiteral("Copied %1 - %2/%3 files").arg(QFileInfo(file).fileName())
                           .arg(result.completedFiles).arg(result.totalFiles));
                return;
            }
            if (r.error.code() == TransferError::Code::Cancelled) {
                cancelled = true;
                return;
            }
            qWarning() << "[CopyEngine] Failed to copy" << file << ":" << r.error.toString();
            result.failedFiles << file;
            const auto code = r.error.code();
            if (code == TransferError::Code::PermissionDenied || code == TransferError::Code::FileNotFound) {
                result.skippedItems << file;
            }
            if (errors.size() < kMaxReportedErrors) {
                errors << QStringLiteral("%1: %2").arg(QFileInfo(file).fileName(), r.error.toString());
            }
        });
    }
    for (QFuture<void>& f : futures) f.waitForFinished();

    if (progress && !finalReported && !cancelled && result.copiedBytes == result.totalBytes) {
        progress(result.copiedBytes, result.totalBytes, QStringLiteral("Copied %1 files").arg(result.completedFiles));
    }

    if (cancelled || (control && control->isCancelled())) {
        qInfo() << "[CopyEngine] Directory copy cancelled after" << result.completedFiles << "files";
        result.error = TransferError(TransferError::Code::Cancelled);
        return result;
    }
    if (result.completedFiles > 0) {
        result.ok = true;
        if (!result.failedFiles.isEmpty()) {
            qWarning() << "[CopyEngine] Partial transfer:" << result.failedFiles.size() << "of" << result.totalFiles << "files failed";
        }
        return result;
    }
    result.error = TransferError::copyFailed(errors.join(QStringLiteral("; ")));
    return result;
}
