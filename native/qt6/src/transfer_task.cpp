#include "transfer_task.h"

#include <QDebug>
#include <QMutexLocker>

void TransferControl::cancel()
{
    QMutexLocker lk(&m_mutex);
    m_cancel.store(true);
    m_wake.wakeAll();
}

void TransferControl::pause()
{
    QMutexLocker lk(&m_mutex);
    m_paused.store(true);
}

void TransferControl::resume()
{
    QMutexLocker lk(&m_mutex);
    m_paused.store(false);
    m_wake.wakeAll();
}

bool TransferControl::checkpoint()
{
    if (m_cancel.load()) return false;
    if (!m_paused.load()) return true;
    QMutexLocker lk(&m_mutex);
    while (m_paused.load() && !m_cancel.load()) {
        m_wake.wait(&m_mutex);
    }
    return !m_cancel.load();
}

double TransferTask::Snapshot::transferRate() const
{
    if (!startTime.isValid()) return 0.0;
    const QDateTime end = endTime.isValid() ? endTime : QDateTime::currentDateTimeUtc();
    const qint64 ms = startTime.msecsTo(end);
    if (ms <= 0) return 0.0;
    return double(bytesTransferred) * 1000.0 / double(ms);
}

qint64 TransferTask::Snapshot::estimatedSecondsRemaining() const
{
    const double rate = transferRate();
    if (rate <= 0.0 || totalBytesToTransfer <= 0) return -1;
    return qint64(double(totalBytesToTransfer - bytesTransferred) / rate);
}

TransferTask::TransferTask(int id, const QString& sourcePath, const QString& destinationPath)
    : m_id(id), m_source(sourcePath), m_destination(destinationPath)
{
}

TransferTask::Status TransferTask::status() const
{
    QMutexLocker lk(&m_mutex);
    return m_status;
}

TransferTask::Snapshot TransferTask::snapshot() const
{
    QMutexLocker lk(&m_mutex);
    Snapshot s;
    s.id = m_id;
    s.sourcePath = m_source;
    s.destinationPath = m_destination;
    s.status = m_status;
    s.bytesTransferred = m_bytesTransferred;
    s.totalBytesToTransfer = m_totalBytes;
    s.completedFiles = m_completedFiles;
    s.totalFiles = m_totalFiles;
    s.failedFiles = m_failedFiles;
    s.currentItem = m_currentItem;
    s.startTime = m_startTime;
    s.endTime = m_endTime;
    s.lastError = m_lastError;
    s.manifestPath = m_manifestPath;
    return s;
}

bool TransferTask::isValidTransition(Status from, Status to)
{
    if (isTerminal(from)) return false;
    if (to == Status::Failed) return true;
    switch (from) {
        case Status::NotStarted: return to == Status::Preparing;
        case Status::Preparing: return to == Status::Copying;
        case Status::Copying: return to == Status::Verifying || to == Status::Completed || to == Status::Paused;
        case Status::Verifying: return to == Status::Completed || to == Status::Paused;
        case Status::Paused: return to == Status::Copying || to == Status::Verifying;
        default: return false;
    }
}

bool TransferTask::transitionLocked(Status next)
{
    if (m_status == Status::Paused && next != Status::Failed && next != m_resumeStatus) {
        // The worker moved on while the task is paused
        if (next == Status::Paused || !isValidTransition(m_resumeStatus, next)) return false;
        if (!isTerminal(next)) {
            m_resumeStatus = next;
            return true;
        }
        m_control.resume();
    } else if (!isValidTransition(m_status, next)) {
        qWarning() << "[TransferTask]" << m_id << "illegal transition" << statusName(m_status) << "->" << statusName(next);
        return false;
    }
    if (next == Status::Paused) m_resumeStatus = m_status;
    if (m_status == Status::NotStarted) m_startTime = QDateTime::currentDateTimeUtc();
    if (isTerminal(next)) m_endTime = QDateTime::currentDateTimeUtc();
    m_status = next;
    return true;
}

bool TransferTask::transitionTo(Status next)
{
    QMutexLocker lk(&m_mutex);
    return transitionLocked(next);
}

bool TransferTask::pause()
{
    QMutexLocker lk(&m_mutex);
    if (m_status != Status::Copying && m_status != Status::Verifying) return false;
    transitionLocked(Status::Paused);
    m_control.pause();
    return true;
}

bool TransferTask::resume()
{
    QMutexLocker lk(&m_mutex);
    if (m_status != Status::Paused) return false;
    transitionLocked(m_resumeStatus);
    m_control.resume();
    return true;
}

void TransferTask::complete()
{
    QMutexLocker lk(&m_mutex);
    if (transitionLocked(Status::Completed)) {
        m_bytesTransferred = m_totalBytes;
    }
}

void TransferTask::fail(const TransferError& error)
{
    QMutexLocker lk(&m_mutex);
    if (transitionLocked(Status::Failed)) {
        m_lastError = error;
        qWarning() << "[TransferTask]" << m_id << "failed:" << error.toString();
    }
}

void TransferTask::cancel()
{
    m_control.cancel();
    QMutexLocker lk(&m_mutex);
    if (m_status == Status::NotStarted) {
        transitionLocked(Status::Failed);
        m_lastError = TransferError(TransferError::Code::Cancelled);
    }
}

void TransferTask::setTotals(qint64 totalBytes, int totalFiles)
{
    QMutexLocker lk(&m_mutex);
    m_totalBytes = totalBytes;
    m_totalFiles = totalFiles;
}

void TransferTask::updateProgress(qint64 bytesTransferred, const QString& currentItem)
{
    QMutexLocker lk(&m_mutex);
    m_bytesTransferred = bytesTransferred;
    if (!currentItem.isEmpty()) m_currentItem = currentItem;
}

void TransferTask::setFileCounts(int completedFiles, int failedFiles)
{
    QMutexLocker lk(&m_mutex);
    m_completedFiles = completedFiles;
    m_failedFiles = failedFiles;
}

void TransferTask::setManifestPath(const QString& path)
{
    QMutexLocker lk(&m_mutex);
    m_manifestPath = path;
}

QString TransferTask::statusName(Status status)
{
    switch (status) {
        case Status::NotStarted: return QStringLiteral("Not Started");
        case Status::Preparing: return QStringLiteral("Preparing");
        case Status::Copying: return QStringLiteral("Copying");
        case Status::Verifying: return QStringLiteral("Verifying");
        case Status::Paused: return QStringLiteral("Paused");
        case Status::Completed: return QStringLiteral("Completed");
        case Status::Failed: return QStringLiteral("Failed");
    }
    return QString();
}
