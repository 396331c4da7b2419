#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QSignalSpy>
#include "../src/volume_registry.h"
#include "../src/disk_utility.h"

namespace {

Volume makeVolume(const QString& mountPath, const QString& device, const QString& fs = "exfat")
{
    Volume v;
    v.name = QFileInfo(mountPath).fileName();
    v.mountPath = mountPath;
    v.devicePath = device;
    v.fileSystemType = fs;
    v.id = VolumeRegistry::volumeIdFor(device, mountPath);
    v.totalSpace = 1000;
    v.freeSpace = 400;
    return v;
}

// Discovery replaced by a list the test controls
class FakeVolumeRegistry : public VolumeRegistry {
public:
    using VolumeRegistry::VolumeRegistry;

    void setMounted(const QList<Volume>& volumes)
    {
        QMutexLocker lk(&m_lock);
        m_mounted = volumes;
    }
    int discoverCalls() const { return m_calls.loadAcquire(); }

protected:
    QList<Volume> discover(const QSet<QString>& alreadyProbed) const override
    {
        Q_UNUSED(alreadyProbed);
        m_calls.fetchAndAddOrdered(1);
        QMutexLocker lk(&m_lock);
        QList<Volume> out = m_mounted;
        for (Volume& v : out) v.accessGranted = true;
        return out;
    }

private:
    mutable QMutex m_lock;
    QList<Volume> m_mounted;
    mutable QAtomicInt m_calls;
};

}

class TestVolumeRegistry : public QObject {
    Q_OBJECT
private slots:
    void testPseudoVolumes();
    void testClassify();
    void testCameraCardLayout();
    void testVolumeIds();
    void testMergeSources();
    void testDiff();
    void testDecodeMountField();
    void testDiskToolParsing();
    void testBaselineScanIsSilent();
    void testAttachDetachCallbacks();
    void testUnsubscribe();
    void testLabelsAndAccessSurviveRescan();
    void testVolumeForPath();
    void testRequestRescan();
    void testRealDiscovery();
};

void TestVolumeRegistry::testPseudoVolumes()
{
    QVERIFY(VolumeRegistry::isPseudoVolume("proc", "proc"));
    QVERIFY(VolumeRegistry::isPseudoVolume("run", "TMPFS"));
    QVERIFY(VolumeRegistry::isPseudoVolume("GUID_partition_scheme", "hfs"));
    QVERIFY(VolumeRegistry::isPseudoVolume("7C3457EF-0000-11AA-AA11-00306543ECAC", "apfs"));
    QVERIFY(!VolumeRegistry::isPseudoVolume("A001", "exfat"));
    QVERIFY(!VolumeRegistry::isPseudoVolume("root", "ext4"));
}

void TestVolumeRegistry::testClassify()
{
    QCOMPARE(VolumeRegistry::classify("/mnt/share", "nfs4", false, false), VolumeKind::Network);
    QCOMPARE(VolumeRegistry::classify("/media/user/A001", "exfat", true, true), VolumeKind::CameraCard);
    QCOMPARE(VolumeRegistry::classify("/media/user/DISC", "udf", true, false), VolumeKind::Removable);
    QCOMPARE(VolumeRegistry::classify("/media/user/SSD", "exfat", true, false), VolumeKind::External);
    QCOMPARE(VolumeRegistry::classify("/run/media/user/RAID", "ext4", false, false), VolumeKind::External);
    QCOMPARE(VolumeRegistry::classify("/", "ext4", false, false), VolumeKind::Internal);
    QCOMPARE(VolumeRegistry::classify("/home", "btrfs", false, false), VolumeKind::Internal);
    QCOMPARE(VolumeRegistry::classify(QString(), "ext4", false, false), VolumeKind::Unknown);
    QCOMPARE(volumeKindName(VolumeKind::CameraCard), QString("camera-card"));
}

void TestVolumeRegistry::testCameraCardLayout()
{
    QTemporaryDir card;
    QVERIFY(card.isValid());
    QVERIFY(!VolumeRegistry::looksLikeCameraCard(card.path()));
    QVERIFY(QDir(card.path()).mkpath("PRIVATE/M4ROOT/CLIP"));
    QVERIFY(VolumeRegistry::looksLikeCameraCard(card.path()));

    QTemporaryDir stills;
    QVERIFY(QDir(stills.path()).mkpath("DCIM/100MSDCF"));
    QVERIFY(VolumeRegistry::looksLikeCameraCard(stills.path()));
    QVERIFY(!VolumeRegistry::looksLikeCameraCard("/"));
}

void TestVolumeRegistry::testVolumeIds()
{
    const QString a = VolumeRegistry::volumeIdFor("/dev/sdb1", "/media/user/A001");
    QCOMPARE(a, VolumeRegistry::volumeIdFor("/dev/sdb1", "/media/user/RENAMED"));
    QVERIFY(a != VolumeRegistry::volumeIdFor("/dev/sdc1", "/media/user/A001"));
    QVERIFY(!a.isEmpty());
    QVERIFY(!a.startsWith('{'));

    // Without a real device the mount path decides
    const QString m = VolumeRegistry::volumeIdFor("/dev/unknown", "/mnt/share/");
    QCOMPARE(m, VolumeRegistry::volumeIdFor(QString(), "/mnt/share"));
    QVERIFY(m != VolumeRegistry::volumeIdFor(QString(), "/mnt/other"));
}

void TestVolumeRegistry::testMergeSources()
{
    QList<Volume> primary = { makeVolume("/media/user/A001/", "/dev/sdb1"), makeVolume("/proc", "proc", "proc") };
    primary[0].name = "from-primary";
    QList<Volume> secondary = { makeVolume("/media/user/A001", "/dev/sdb1"), makeVolume("/media/user/B002", "/dev/sdc1") };

    const QList<Volume> merged = VolumeRegistry::mergeSources(primary, secondary);
    QCOMPARE(merged.size(), 2);
    QCOMPARE(merged.at(0).mountPath, QString("/media/user/A001"));
    QCOMPARE(merged.at(0).name, QString("from-primary"));
    QCOMPARE(merged.at(1).mountPath, QString("/media/user/B002"));
}

void TestVolumeRegistry::testDiff()
{
    const Volume a = makeVolume("/media/user/A001", "/dev/sdb1");
    const Volume b = makeVolume("/media/user/B002", "/dev/sdc1");
    const Volume c = makeVolume("/media/user/C003", "/dev/sdd1");

    QList<Volume> attached, detached;
    VolumeRegistry::diff({a, b}, {b, c}, attached, detached);
    QCOMPARE(attached.size(), 1);
    QCOMPARE(attached.first().id, c.id);
    QCOMPARE(detached.size(), 1);
    QCOMPARE(detached.first().id, a.id);

    attached.clear();
    detached.clear();
    VolumeRegistry::diff({a, b}, {b, a}, attached, detached);
    QVERIFY(attached.isEmpty());
    QVERIFY(detached.isEmpty());
}

void TestVolumeRegistry::testDecodeMountField()
{
    QCOMPARE(VolumeRegistry::decodeMountField("/media/user/NO\\040NAME"), QString("/media/user/NO NAME"));
    QCOMPARE(VolumeRegistry::decodeMountField("/mnt/tab\\011x"), QString("/mnt/tab\tx"));
    QCOMPARE(VolumeRegistry::decodeMountField("/mnt/back\\134slash"), QString("/mnt/back\\slash"));
    QCOMPARE(VolumeRegistry::decodeMountField("/mnt/plain"), QString("/mnt/plain"));
}

void TestVolumeRegistry::testDiskToolParsing()
{
    QCOMPARE(DiskUtility::parseField("   Device Identifier:        disk4s1\n   Device Node:              /dev/disk4s1\n", "Device Node:"),
             QString("/dev/disk4s1"));
    QCOMPARE(DiskUtility::parseField("SOURCE=\"/dev/sdb1\"\n", "SOURCE="), QString("/dev/sdb1"));
    QVERIFY(DiskUtility::parseField("nothing here", "SOURCE=").isEmpty());

    const DiskUtility::Command lookup = DiskUtility::deviceLookupCommand("/media/user/A001");
    QVERIFY(!lookup.program.isEmpty());
    QVERIFY(lookup.arguments.contains("/media/user/A001"));
    QVERIFY(!lookup.fieldPrefix.isEmpty());

    const DiskUtility::Command eject = DiskUtility::ejectCommand("/media/user/A001", "/dev/sdb1");
    QVERIFY(!eject.program.isEmpty());
    QVERIFY(eject.arguments.contains("/dev/sdb1") || eject.arguments.contains("/media/user/A001"));
}

void TestVolumeRegistry::testBaselineScanIsSilent()
{
    FakeVolumeRegistry registry;
    registry.setMounted({ makeVolume("/", "/dev/sda1", "ext4"), makeVolume("/media/user/A001", "/dev/sdb1") });

    int events = 0;
    registry.subscribe([&events](const Volume&, bool) { ++events; });
    QSignalSpy changed(&registry, &VolumeRegistry::volumesChanged);

    QCOMPARE(registry.listVolumes().size(), 2);
    QTest::qWait(50);
    QCOMPARE(events, 0);
    QCOMPARE(changed.count(), 0);

    QCOMPARE(registry.listVolumes().size(), 2);
    QTest::qWait(50);
    QCOMPARE(events, 0);
}

void TestVolumeRegistry::testAttachDetachCallbacks()
{
    FakeVolumeRegistry registry;
    const Volume root = makeVolume("/", "/dev/sda1", "ext4");
    const Volume card = makeVolume("/media/user/A001", "/dev/sdb1");
    registry.setMounted({ root });
    registry.listVolumes();

    QList<QPair<QString, bool>> events;
    registry.subscribe([&events](const Volume& v, bool attached) { events.append({ v.id, attached }); });
    QSignalSpy attachedSpy(&registry, &VolumeRegistry::volumeAttached);
    QSignalSpy detachedSpy(&registry, &VolumeRegistry::volumeDetached);

    registry.setMounted({ root, card });
    registry.listVolumes();
    // Delivery is queued to the owning thread
    QCOMPARE(events.size(), 0);
    QTRY_COMPARE(events.size(), 1);
    QCOMPARE(events.at(0).first, card.id);
    QVERIFY(events.at(0).second);
    QCOMPARE(attachedSpy.count(), 1);
    QCOMPARE(attachedSpy.at(0).at(0).value<Volume>().mountPath, card.mountPath);

    registry.setMounted({ root });
    registry.listVolumes();
    QTRY_COMPARE(events.size(), 2);
    QCOMPARE(events.at(1).first, card.id);
    QVERIFY(!events.at(1).second);
    QCOMPARE(detachedSpy.count(), 1);
}

void TestVolumeRegistry::testUnsubscribe()
{
    FakeVolumeRegistry registry;
    registry.listVolumes();

    int first = 0, second = 0;
    const int t1 = registry.subscribe([&first](const Volume&, bool) { ++first; });
    registry.subscribe([&second](const Volume&, bool) { ++second; });
    QVERIFY(t1 > 0);
    registry.unsubscribe(t1);
    registry.unsubscribe(9999);

    registry.setMounted({ makeVolume("/media/user/A001", "/dev/sdb1") });
    registry.listVolumes();
    QTRY_COMPARE(second, 1);
    QCOMPARE(first, 0);
}

void TestVolumeRegistry::testLabelsAndAccessSurviveRescan()
{
    FakeVolumeRegistry registry;
    Volume card = makeVolume("/media/user/A001", "/dev/sdb1");
    registry.setMounted({ card });
    QList<Volume> vols = registry.listVolumes();
    QCOMPARE(vols.size(), 1);
    QVERIFY(vols.first().accessGranted);

    registry.setLabel(card.id, "Day 1 A-cam");
    QCOMPARE(registry.label(card.id), QString("Day 1 A-cam"));
    QCOMPARE(registry.knownVolumes().first().label, QString("Day 1 A-cam"));
    QCOMPARE(registry.knownVolumes().first().displayName(), QString("A001 (Day 1 A-cam)"));

    // Same device remounted at a new path keeps its id and label
    card.mountPath = "/media/user/A001_1";
    registry.setMounted({ card });
    vols = registry.listVolumes();
    QCOMPARE(vols.size(), 1);
    QCOMPARE(vols.first().id, card.id);
    QCOMPARE(vols.first().label, QString("Day 1 A-cam"));
    QVERIFY(vols.first().accessGranted);

    registry.setLabel(card.id, QString());
    QVERIFY(registry.label(card.id).isEmpty());
}

void TestVolumeRegistry::testVolumeForPath()
{
    FakeVolumeRegistry registry;
    registry.setMounted({ makeVolume("/", "/dev/sda1", "ext4"),
                          makeVolume("/media/user/A001", "/dev/sdb1"),
                          makeVolume("/media/user/A0012", "/dev/sdc1") });
    registry.listVolumes();

    QCOMPARE(registry.volumeForPath("/media/user/A001/DCIM/C0001.MP4").devicePath, QString("/dev/sdb1"));
    QCOMPARE(registry.volumeForPath("/media/user/A001").devicePath, QString("/dev/sdb1"));
    QCOMPARE(registry.volumeForPath("/media/user/A0012/x").devicePath, QString("/dev/sdc1"));
    QCOMPARE(registry.volumeForPath("/home/user").devicePath, QString("/dev/sda1"));

    FakeVolumeRegistry empty;
    empty.listVolumes();
    QVERIFY(!empty.volumeForPath("/anything").isValid());
}

void TestVolumeRegistry::testRequestRescan()
{
    FakeVolumeRegistry registry;
    registry.setMounted({ makeVolume("/", "/dev/sda1", "ext4") });
    registry.listVolumes();
    const int before = registry.discoverCalls();

    QSignalSpy changed(&registry, &VolumeRegistry::volumesChanged);
    registry.setMounted({ makeVolume("/", "/dev/sda1", "ext4"), makeVolume("/media/user/B002", "/dev/sdc1") });
    registry.requestRescan();
    registry.requestRescan();
    QTRY_COMPARE(registry.knownVolumes().size(), 2);
    QTRY_VERIFY(changed.count() >= 1);
    QVERIFY(registry.discoverCalls() > before);
}

void TestVolumeRegistry::testRealDiscovery()
{
    VolumeRegistry registry;
    const QList<Volume> vols = registry.listVolumes();
    QSet<QString> mounts, ids;
    for (const Volume& v : vols) {
        QVERIFY(v.isValid());
        QVERIFY(!v.id.isEmpty());
        QVERIFY(!mounts.contains(v.mountPath));
        QVERIFY(!ids.contains(v.id));
        QVERIFY(v.freeSpace <= v.totalSpace);
        QVERIFY(!VolumeRegistry::isPseudoVolume(v.name, v.fileSystemType));
        // No access provider means nothing is granted
        QVERIFY(!v.accessGranted);
        mounts.insert(v.mountPath);
        ids.insert(v.id);
    }
}

QTEST_MAIN(TestVolumeRegistry)
#include "test_volume_registry.moc"
