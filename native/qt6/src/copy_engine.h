#pragma once
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <functional>

#include "checksum.h"
#include "offload_settings.h"
#include "transfer_error.h"

class AccessGrantProvider;
class TransferControl;

/**
 * CopyEngine - verified single-file and directory copies.
 *
 * copyFile() tries three strategies in order and returns on the first success:
 *  1. QFile::copy, accepted when the destination size equals the source size
 *  2. whole-file read into memory and write-out, same size check
 *     (only for files up to OffloadSettings::wholeFileBufferLimit)
 *  3. chunked streaming copy; the source digest is taken first, the
 *     destination digest after, and a mismatch deletes the destination
 *
 * copyDirectory() scans the tree first (filtered by MediaFilter), then copies
 * the files on a bounded thread pool and joins before returning. A failing
 * file does not stop the others. Only an unreadable source root is fatal.
 *
 * Both calls block; run them on a worker thread. Cancellation and pause go
 * through the TransferControl passed in; a cancelled copy never leaves a
 * partial destination file behind.
 */
class CopyEngine {
public:
    // (bytesSoFar, totalBytes, currentItemLabel)
    using ProgressCallback = std::function<void(qint64, qint64, const QString&)>;

    enum Strategy {
        NativeCopy = 0x1,
        BufferedCopy = 0x2,
        StreamingCopy = 0x4,
        AllStrategies = NativeCopy | BufferedCopy | StreamingCopy
    };

    struct Options {
        int strategies = AllStrategies;
        // Runs after a streaming copy is written and before the destination is hashed
        std::function<void(const QString& destination)> beforeVerify;
    };

    struct CopyResult {
        bool ok = false;
        TransferError error;
        qint64 bytesCopied = 0;
        Strategy strategy = NativeCopy;  // the strategy that succeeded
        QString sourceDigest;            // only set by the streaming strategy
    };

    struct DirectoryCopyResult {
        bool ok = false;
        TransferError error;
        int totalFiles = 0;
        int completedFiles = 0;
        qint64 totalBytes = 0;
        qint64 copiedBytes = 0;
        QStringList copiedFiles;   // destination paths, in completion order
        QStringList failedFiles;   // source paths
        QStringList skippedItems;  // filtered entries, unreadable directories and inaccessible files
    };

    struct ScanResult {
        bool ok = false;
        TransferError error;
        QStringList files;        // absolute source paths, sorted
        qint64 totalBytes = 0;
        QStringList skippedItems;
    };

    explicit CopyEngine(AccessGrantProvider* access = nullptr, const OffloadSettings& settings = OffloadSettings());
    ~CopyEngine();
    Q_DISABLE_COPY(CopyEngine)

    CopyResult copyFile(const QString& source, const QString& destination,
                        const ProgressCallback& progress = ProgressCallback(),
                        TransferControl* control = nullptr) const;

    DirectoryCopyResult copyDirectory(const QString& source, const QString& destination,
                                      const ProgressCallback& progress = ProgressCallback(),
                                      TransferControl* control = nullptr);

    // Filtered recursive listing used by copyDirectory()
    ScanResult scanDirectory(const QString& source) const;

    const OffloadSettings& settings() const { return m_settings; }
    void setOptions(const Options& options) { m_options = options; }
    const Options& options() const { return m_options; }

    static QString strategyName(Strategy strategy);

private:
    bool nativeCopy(const QString& source, const QString& destination, qint64 expectedSize) const;
    bool bufferedCopy(const QString& source, const QString& destination, qint64 expectedSize, QString* errorOut) const;
    CopyResult streamingCopy(const QString& source, const QString& destination, qint64 totalBytes,
                             const ProgressCallback& progress, TransferControl* control) const;

    AccessGrantProvider* m_access = nullptr;
    OffloadSettings m_settings;
    Options m_options;
    QThreadPool m_pool;
};
