#pragma once
#include <QFutureWatcher>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

#include "copy_engine.h"
#include "offload_settings.h"
#include "transfer_task.h"

class AccessGrantProvider;

/**
 * TransferQueue runs offload tasks one after another on a background thread.
 *
 * Each task goes Preparing (access check, scan) -> Copying -> Verifying
 * (MHL written to <destination>/MHL and checked against the copied files)
 * -> Completed, or Failed with a TransferError. Finished tasks stay listed
 * until clearFinished().
 *
 * Signals are emitted from the worker thread; connect with the default
 * connection type to receive them on the receiver's thread.
 */
class TransferQueue : public QObject {
    Q_OBJECT
public:
    explicit TransferQueue(AccessGrantProvider* access = nullptr,
                           const OffloadSettings& settings = OffloadSettings(),
                           QObject* parent = nullptr);
    ~TransferQueue() override;

    // Returns the task id, or 0 if either path is empty
    int enqueue(const QString& source, const QString& destination);

    bool pause(int id);
    bool resume(int id);
    bool cancel(int id);

    QList<TransferTask::Snapshot> tasks() const; // snapshot copy
    TransferTask::Snapshot task(int id) const;
    bool isBusy() const;
    void clearFinished();

    void setCopyOptions(const CopyEngine::Options& options);

signals:
    void queueChanged();
    void taskStarted(int id);
    void progressChanged(int id, qint64 bytesTransferred, qint64 totalBytes, const QString& currentItem);
    void taskFinished(int id, bool success, const TransferError& error);

public slots:
    void cancelAll();

private:
    Q_DISABLE_COPY(TransferQueue)

    void startNext();
    // Worker body; runs on the thread pool
    void runTask(TransferTask* task);
    // Returns false and fills error when the manifest cannot be written or verified
    bool writeAndVerifyManifest(TransferTask* task, const QString& destinationRoot, const QStringList& copiedFiles,
                                TransferError& error);
    TransferTask* findLocked(int id) const;

    AccessGrantProvider* m_access = nullptr;
    const OffloadSettings m_settings;

    mutable QMutex m_mutex;
    std::vector<std::unique_ptr<TransferTask>> m_tasks;
    CopyEngine::Options m_copyOptions;
    int m_nextId = 1;
    bool m_running = false;
    int m_runningId = 0; // kept by clearFinished() until the worker has returned
    QFutureWatcher<void> m_watcher;
};
