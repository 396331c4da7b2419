#include "transfer_queue.h"
#include "access_grant.h"
#include "file_utils.h"
#include "media_hash_list.h"

#include <QtConcurrent>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <algorithm>

TransferQueue::TransferQueue(AccessGrantProvider* access, const OffloadSettings& settings, QObject* parent)
    : QObject(parent)
    , m_access(access)
    , m_settings(settings.normalized())
{
    qRegisterMetaType<TransferError>("TransferError");
    connect(&m_watcher, &QFutureWatcher<void>::finished, this, [this] {
        {
            QMutexLocker lk(&m_mutex);
            m_running = false;
            m_runningId = 0;
        }
        emit queueChanged();
        startNext();
    });
}

TransferQueue::~TransferQueue()
{
    cancelAll();
    m_watcher.waitForFinished();
}

int TransferQueue::enqueue(const QString& source, const QString& destination)
{
    if (source.isEmpty() || destination.isEmpty()) return 0;
    int id = 0;
    {
        QMutexLocker lk(&m_mutex);
        id = m_nextId++;
        m_tasks.push_back(std::make_unique<TransferTask>(id, source, destination));
    }
    qInfo() << "[TransferQueue] Queued" << id << source << "->" << destination;
    emit queueChanged();
    startNext();
    return id;
}

TransferTask* TransferQueue::findLocked(int id) const
{
    auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [id](const std::unique_ptr<TransferTask>& t) { return t->id() == id; });
    return it == m_tasks.end() ? nullptr : it->get();
}

bool TransferQueue::pause(int id)
{
    bool ok = false;
    {
        QMutexLocker lk(&m_mutex);
        if (TransferTask* t = findLocked(id)) ok = t->pause();
    }
    if (ok) emit queueChanged();
    return ok;
}

bool TransferQueue::resume(int id)
{
    bool ok = false;
    {
        QMutexLocker lk(&m_mutex);
        if (TransferTask* t = findLocked(id)) ok = t->resume();
    }
    if (ok) emit queueChanged();
    return ok;
}

bool TransferQueue::cancel(int id)
{
    bool found = false;
    bool finishedNow = false;
    {
        QMutexLocker lk(&m_mutex);
        TransferTask* t = findLocked(id);
        if (t && !t->isTerminal(t->status())) {
            found = true;
            t->cancel();
            finishedNow = t->status() == TransferTask::Status::Failed;
        }
    }
    if (finishedNow) emit taskFinished(id, false, TransferError(TransferError::Code::Cancelled));
    if (found) emit queueChanged();
    return found;
}

void TransferQueue::cancelAll()
{
    QList<int> ids;
    {
        QMutexLocker lk(&m_mutex);
        for (const auto& t : m_tasks) {
            if (!TransferTask::isTerminal(t->status())) ids << t->id();
        }
    }
    for (int id : ids) cancel(id);
}

QList<TransferTask::Snapshot> TransferQueue::tasks() const
{
    QMutexLocker lk(&m_mutex);
    QList<TransferTask::Snapshot> out;
    for (const auto& t : m_tasks) out << t->snapshot();
    return out;
}

TransferTask::Snapshot TransferQueue::task(int id) const
{
    QMutexLocker lk(&m_mutex);
    if (TransferTask* t = findLocked(id)) return t->snapshot();
    return TransferTask::Snapshot();
}

bool TransferQueue::isBusy() const
{
    QMutexLocker lk(&m_mutex);
    return m_running;
}

void TransferQueue::clearFinished()
{
    {
        QMutexLocker lk(&m_mutex);
        m_tasks.erase(std::remove_if(m_tasks.begin(), m_tasks.end(),
                                     [this](const std::unique_ptr<TransferTask>& t) {
                                         return t->id() != m_runningId && TransferTask::isTerminal(t->status());
                                     }),
                      m_tasks.end());
    }
    emit queueChanged();
}

void TransferQueue::setCopyOptions(const CopyEngine::Options& options)
{
    QMutexLocker lk(&m_mutex);
    m_copyOptions = options;
}

void TransferQueue::startNext()
{
    QMutexLocker lk(&m_mutex);
    if (m_running) return;
    TransferTask* next = nullptr;
    for (const auto& t : m_tasks) {
        if (t->status() == TransferTask::Status::NotStarted) { next = t.get(); break; }
    }
    if (!next) return;
    m_running = true;
    // The worker may still touch the task after it turns terminal
    m_runningId = next->id();
    m_watcher.setFuture(QtConcurrent::run([this, next]() { runTask(next); }));
}

void TransferQueue::runTask(TransferTask* task)
{
    const int id = task->id();
    if (!task->transitionTo(TransferTask::Status::Preparing)) return; // cancelled before start
    emit taskStarted(id);
    emit queueChanged();

    auto finishFailed = [&](const TransferError& error) {
        task->fail(error);
        emit taskFinished(id, false, error);
        emit queueChanged();
    };

    const QString source = task->sourcePath();
    const QFileInfo srcInfo(source);
    if (!srcInfo.exists()) return finishFailed(TransferError(TransferError::Code::FileNotFound, source));
    if (!AccessGrant::ensure(m_access, source)) return finishFailed(TransferError(TransferError::Code::PermissionDenied, source));

    CopyEngine::Options options;
    {
        QMutexLocker lk(&m_mutex);
        options = m_copyOptions;
    }
    CopyEngine engine(m_access, m_settings);
    engine.setOptions(options);

    const bool directory = srcInfo.isDir();
    QString destinationRoot = task->destinationPath();
    QString target;
    if (directory) {
        const CopyEngine::ScanResult scan = engine.scanDirectory(source);
        if (!scan.ok) return finishFailed(scan.error);
        task->setTotals(scan.totalBytes, scan.files.size());
    } else {
        // An existing directory receives the file under its own name
        target = FileUtils::dirExists(destinationRoot) ? QDir(destinationRoot).filePath(srcInfo.fileName()) : destinationRoot;
        destinationRoot = QFileInfo(target).absolutePath();
        task->setTotals(srcInfo.size(), 1);
    }

    if (!task->transitionTo(TransferTask::Status::Copying)) {
        return finishFailed(TransferError(TransferError::Code::Cancelled));
    }

    auto onProgress = [this, task, id](qint64 bytes, qint64 total, const QString& label) {
        task->updateProgress(bytes, label);
        emit progressChanged(id, bytes, total, label);
    };

    QStringList copiedFiles;
    if (directory) {
        const CopyEngine::DirectoryCopyResult r = engine.copyDirectory(source, destinationRoot, onProgress, &task->control());
        task->setFileCounts(r.completedFiles, r.failedFiles.size());
        if (!r.ok) return finishFailed(r.error);
        copiedFiles = r.copiedFiles;
    } else {
        const CopyEngine::CopyResult r = engine.copyFile(source, target, onProgress, &task->control());
        if (!r.ok) {
            task->setFileCounts(0, 1);
            return finishFailed(r.error);
        }
        task->setFileCounts(1, 0);
        copiedFiles << target;
    }

    if (m_settings.generateManifest) {
        if (!task->transitionTo(TransferTask::Status::Verifying)) {
            return finishFailed(TransferError(TransferError::Code::Cancelled));
        }
        TransferError manifestError;
        if (!writeAndVerifyManifest(task, destinationRoot, copiedFiles, manifestError)) {
            return finishFailed(manifestError);
        }
    }

    task->complete();
    qInfo() << "[TransferQueue] Task" << id << "completed," << copiedFiles.size() << "files";
    emit taskFinished(id, true, TransferError());
    emit queueChanged();
}

bool TransferQueue::writeAndVerifyManifest(TransferTask* task, const QString& destinationRoot, const QStringList& copiedFiles,
                                           TransferError& error)
{
    const QString mhlDir = QDir(destinationRoot).filePath(QStringLiteral("MHL"));
    QStringList priors;
    const QFileInfoList existing = QDir(mhlDir).entryInfoList({ QStringLiteral("*.mhl") }, QDir::Files, QDir::Name);
    for (const QFileInfo& fi : existing) priors << fi.absoluteFilePath();

    const QString mhlPath = FileUtils::uniqueNameInDir(mhlDir, MediaHashList::defaultManifestName(task->sourcePath()));
    const QString comment = QStringLiteral("Transfer from %1 to %2")
                                .arg(QFileInfo(task->sourcePath()).fileName(), QFileInfo(destinationRoot).fileName());

    const ManifestWriteResult written = MediaHashList::generateManifest(copiedFiles, mhlPath, m_settings.manifestAlgorithm,
                                                                        comment, priors, &task->control());
    if (!written.ok) {
        // Copied files are kept
        const auto code = task->control().isCancelled() ? TransferError::Code::Cancelled : TransferError::Code::CopyFailed;
        error = TransferError(code, QStringLiteral("Manifest generation failed: %1").arg(written.error));
        return false;
    }
    task->setManifestPath(mhlPath);

    if (!m_settings.verifyAfterTransfer) return true;
    if (!task->control().checkpoint()) {
        error = TransferError(TransferError::Code::Cancelled);
        return false;
    }
    const VerificationResult verified = MediaHashList::verifyFileSet(mhlPath, copiedFiles);
    if (!verified.success) {
        error = TransferError(TransferError::Code::ChecksumMismatch, verified.invalidFiles.join(QStringLiteral(", ")));
        return false;
    }
    return true;
}
