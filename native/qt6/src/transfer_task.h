#pragma once
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QWaitCondition>
#include <atomic>

#include "transfer_error.h"

/**
 * TransferControl carries the cooperative cancel and pause flags of one transfer.
 *
 * Workers call checkpoint() at file and chunk boundaries: it blocks while the
 * transfer is paused and returns false once cancellation has been requested.
 * All methods are thread-safe.
 */
class TransferControl {
public:
    TransferControl() = default;
    Q_DISABLE_COPY(TransferControl)

    void cancel();
    bool isCancelled() const { return m_cancel.load(); }

    void pause();
    void resume();
    bool isPaused() const { return m_paused.load(); }

    // Blocks while paused. Returns false if the transfer was cancelled.
    bool checkpoint();

private:
    std::atomic_bool m_cancel{false};
    std::atomic_bool m_paused{false};
    QMutex m_mutex;
    QWaitCondition m_wake;
};

/**
 * TransferTask - one file or directory transfer and its lifecycle.
 *
 * NotStarted -> Preparing -> Copying -> Verifying -> Completed
 * Copying/Verifying <-> Paused, and Failed from any non-terminal state.
 * Completed and Failed are terminal.
 *
 * The task is owned by whoever runs it (TransferQueue or a direct caller);
 * observers read it through snapshot(). Mutators are thread-safe.
 */
class TransferTask {
public:
    enum class Status { NotStarted, Preparing, Copying, Verifying, Paused, Completed, Failed };

    struct Snapshot {
        int id = 0;
        QString sourcePath;
        QString destinationPath;
        Status status = Status::NotStarted;
        qint64 bytesTransferred = 0;
        qint64 totalBytesToTransfer = 0;
        int completedFiles = 0;
        int totalFiles = 0;
        int failedFiles = 0;
        QString currentItem;
        QDateTime startTime;
        QDateTime endTime;
        TransferError lastError;
        QString manifestPath;

        double progress() const { return totalBytesToTransfer > 0 ? double(bytesTransferred) / double(totalBytesToTransfer) : 0.0; }
        double transferRate() const;        // bytes per second since startTime
        qint64 estimatedSecondsRemaining() const; // -1 while unknown
        bool isTerminal() const { return status == Status::Completed || status == Status::Failed; }
    };

    TransferTask(int id, const QString& sourcePath, const QString& destinationPath);
    Q_DISABLE_COPY(TransferTask)

    int id() const { return m_id; }
    QString sourcePath() const { return m_source; }
    QString destinationPath() const { return m_destination; }

    Status status() const;
    Snapshot snapshot() const;
    TransferControl& control() { return m_control; }

    // Moves to the next lifecycle state; returns false for an illegal transition.
    // Progressing while paused updates the state resumed into.
    bool transitionTo(Status next);
    bool pause();
    bool resume();
    void complete();
    void fail(const TransferError& error);
    // Requests cancellation; a task that never started fails immediately.
    void cancel();

    void setTotals(qint64 totalBytes, int totalFiles);
    void updateProgress(qint64 bytesTransferred, const QString& currentItem);
    void setFileCounts(int completedFiles, int failedFiles);
    void setManifestPath(const QString& path);

    static bool isValidTransition(Status from, Status to);
    static bool isTerminal(Status status) { return status == Status::Completed || status == Status::Failed; }
    static QString statusName(Status status);

private:
    bool transitionLocked(Status next);

    const int m_id;
    const QString m_source;
    const QString m_destination;

    mutable QMutex m_mutex;
    Status m_status = Status::NotStarted;
    Status m_resumeStatus = Status::Copying;
    qint64 m_bytesTransferred = 0;
    qint64 m_totalBytes = 0;
    int m_completedFiles = 0;
    int m_totalFiles = 0;
    int m_failedFiles = 0;
    QString m_currentItem;
    QDateTime m_startTime;
    QDateTime m_endTime;
    TransferError m_lastError;
    QString m_manifestPath;

    TransferControl m_control;
};
