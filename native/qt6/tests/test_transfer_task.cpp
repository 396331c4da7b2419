#include <QtTest>
#include <QtConcurrent>
#include "../src/transfer_task.h"

using Status = TransferTask::Status;

class TestTransferTask : public QObject {
    Q_OBJECT
private slots:
    void testHappyPath();
    void testIllegalTransitions();
    void testPauseResume();
    void testProgressWhilePaused();
    void testCancelBeforeStart();
    void testFailKeepsError();
    void testCheckpointBlocksWhilePaused();
    void testCancelReleasesPausedWorker();
    void testErrorDescriptions();
};

void TestTransferTask::testHappyPath()
{
    TransferTask task(1, "/src", "/dst");
    QCOMPARE(task.status(), Status::NotStarted);
    QVERIFY(task.transitionTo(Status::Preparing));
    task.setTotals(1000, 4);
    QVERIFY(task.transitionTo(Status::Copying));
    task.updateProgress(250, "A001.mov");
    task.setFileCounts(1, 0);

    TransferTask::Snapshot s = task.snapshot();
    QCOMPARE(s.bytesTransferred, qint64(250));
    QCOMPARE(s.currentItem, QString("A001.mov"));
    QCOMPARE(s.progress(), 0.25);
    QVERIFY(s.startTime.isValid());
    QVERIFY(!s.endTime.isValid());

    QVERIFY(task.transitionTo(Status::Verifying));
    task.complete();
    s = task.snapshot();
    QCOMPARE(s.status, Status::Completed);
    QCOMPARE(s.bytesTransferred, qint64(1000));
    QVERIFY(s.isTerminal());
    QVERIFY(s.endTime.isValid());
    QVERIFY(!s.lastError.isError());
}

void TestTransferTask::testIllegalTransitions()
{
    QVERIFY(!TransferTask::isValidTransition(Status::NotStarted, Status::Copying));
    QVERIFY(!TransferTask::isValidTransition(Status::Preparing, Status::Paused));
    QVERIFY(!TransferTask::isValidTransition(Status::Completed, Status::Failed));
    QVERIFY(!TransferTask::isValidTransition(Status::Failed, Status::Preparing));
    QVERIFY(TransferTask::isValidTransition(Status::Preparing, Status::Failed));
    QVERIFY(TransferTask::isValidTransition(Status::Paused, Status::Verifying));

    TransferTask task(2, "/src", "/dst");
    QVERIFY(!task.transitionTo(Status::Completed));
    QCOMPARE(task.status(), Status::NotStarted);
    QVERIFY(!task.pause());
}

void TestTransferTask::testPauseResume()
{
    TransferTask task(3, "/src", "/dst");
    QVERIFY(task.transitionTo(Status::Preparing));
    QVERIFY(task.transitionTo(Status::Copying));
    QVERIFY(task.pause());
    QCOMPARE(task.status(), Status::Paused);
    QVERIFY(task.control().isPaused());
    QVERIFY(!task.pause());
    QVERIFY(task.resume());
    QCOMPARE(task.status(), Status::Copying);
    QVERIFY(!task.control().isPaused());
    QVERIFY(!task.resume());
}

void TestTransferTask::testProgressWhilePaused()
{
    TransferTask task(4, "/src", "/dst");
    QVERIFY(task.transitionTo(Status::Preparing));
    QVERIFY(task.transitionTo(Status::Copying));
    QVERIFY(task.pause());

    // The worker reaches the verification phase while the user has paused
    QVERIFY(task.transitionTo(Status::Verifying));
    QCOMPARE(task.status(), Status::Paused);
    QVERIFY(task.resume());
    QCOMPARE(task.status(), Status::Verifying);

    QVERIFY(task.pause());
    task.complete();
    QCOMPARE(task.status(), Status::Completed);
    QVERIFY(!task.control().isPaused());
}

void TestTransferTask::testCancelBeforeStart()
{
    TransferTask task(5, "/src", "/dst");
    task.cancel();
    const TransferTask::Snapshot s = task.snapshot();
    QCOMPARE(s.status, Status::Failed);
    QCOMPARE(s.lastError.code(), TransferError::Code::Cancelled);
    QVERIFY(task.control().isCancelled());
    QVERIFY(!task.transitionTo(Status::Preparing));
}

void TestTransferTask::testFailKeepsError()
{
    TransferTask task(6, "/src", "/dst");
    QVERIFY(task.transitionTo(Status::Preparing));
    task.fail(TransferError(TransferError::Code::PermissionDenied, "/src"));
    task.fail(TransferError(TransferError::Code::CopyFailed, "later"));
    const TransferTask::Snapshot s = task.snapshot();
    QCOMPARE(s.status, Status::Failed);
    QCOMPARE(s.lastError.code(), TransferError::Code::PermissionDenied);
    QCOMPARE(s.lastError.detail(), QString("/src"));
}

void TestTransferTask::testCheckpointBlocksWhilePaused()
{
    TransferControl control;
    QVERIFY(control.checkpoint());
    control.pause();

    std::atomic_bool passed{false};
    QFuture<bool> f = QtConcurrent::run([&]() {
        const bool ok = control.checkpoint();
        passed.store(true);
        return ok;
    });
    QTest::qWait(100);
    QVERIFY(!passed.load());

    control.resume();
    f.waitForFinished();
    QVERIFY(passed.load());
    QVERIFY(f.result());
}

void TestTransferTask::testCancelReleasesPausedWorker()
{
    TransferControl control;
    control.pause();
    QFuture<bool> f = QtConcurrent::run([&]() { return control.checkpoint(); });
    QTest::qWait(50);
    control.cancel();
    f.waitForFinished();
    QVERIFY(!f.result());
    QVERIFY(!control.checkpoint());
}

void TestTransferTask::testErrorDescriptions()
{
    QCOMPARE(TransferError(TransferError::Code::FileNotFound).description(), QString("File not found"));
    QCOMPARE(TransferError(TransferError::Code::ChecksumMismatch).description(), QString("Checksum verification failed"));
    const TransferError e = TransferError::copyFailed("disk full");
    QVERIFY(e.isError());
    QVERIFY(e.toString().contains("disk full"));
    QVERIFY(!e.failureReason().isEmpty());
    QVERIFY(e == TransferError(TransferError::Code::CopyFailed, "other"));
    QVERIFY(!TransferError().isError());
    QCOMPARE(TransferTask::statusName(Status::Verifying).isEmpty(), false);
}

QTEST_MAIN(TestTransferTask)
#include "test_transfer_task.moc"
