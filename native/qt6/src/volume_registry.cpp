#include "volume_registry.h"
#include "access_grant.h"
#include "disk_utility.h"

#include <QtConcurrent>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QMutexLocker>
#include <QStorageInfo>
#include <QTextStream>
#include <QTimer>
#include <QUuid>

namespace {

const QUuid kVolumeNamespace("{5c1b7d0e-2f6a-4c8e-9a4d-0b7e3f6a1c52}");

const QSet<QString>& pseudoFileSystems()
{
    static const QSet<QString> types = {
        "proc", "sysfs", "tmpfs", "devtmpfs", "devpts", "cgroup", "cgroup2", "overlay", "squashfs",
        "securityfs", "pstore", "debugfs", "tracefs", "configfs", "fusectl", "mqueue", "hugetlbfs",
        "autofs", "binfmt_misc", "bpf", "ramfs", "nsfs", "efivarfs", "rpc_pipefs", "selinuxfs",
        "fuse.gvfsd-fuse", "fuse.portal", "fuse.lxcfs", "devfs", "nullfs"
    };
    return types;
}

const QSet<QString>& networkFileSystems()
{
    static const QSet<QString> types = {
        "nfs", "nfs4", "cifs", "smbfs", "smb3", "afpfs", "webdav", "davfs", "fuse.sshfs", "9p"
    };
    return types;
}

QString cleanMountPath(const QString& path)
{
    if (path.isEmpty()) return path;
    return QDir::cleanPath(path);
}

QString readSysFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return QString();
    return QString::fromLatin1(f.readAll()).trimmed();
}

}

QString volumeKindName(VolumeKind kind)
{
    switch (kind) {
    case VolumeKind::Internal: return QStringLiteral("internal");
    case VolumeKind::External: return QStringLiteral("external");
    case VolumeKind::CameraCard: return QStringLiteral("camera-card");
    case VolumeKind::Network: return QStringLiteral("network");
    case VolumeKind::Removable: return QStringLiteral("removable");
    case VolumeKind::Unknown: break;
    }
    return QStringLiteral("unknown");
}

VolumeRegistry::VolumeRegistry(AccessGrantProvider* access, QObject* parent)
    : QObject(parent)
    , m_access(access)
{
    qRegisterMetaType<Volume>("Volume");
    connect(&m_scanWatcher, &QFutureWatcher<QList<Volume>>::finished, this, [this]() {
        applyScan(m_scanWatcher.result());
        m_scanRunning = false;
        if (m_rescanQueued) {
            m_rescanQueued = false;
            requestRescan();
        }
    });
}

VolumeRegistry::~VolumeRegistry()
{
    stopMonitoring();
    m_scanWatcher.waitForFinished();
}

QList<Volume> VolumeRegistry::discover(const QSet<QString>& alreadyProbed) const
{
    const QHash<QString, bool> removable = removableDevices();
    QList<Volume> merged = mergeSources(scanStorageInfo(), scanBlockDevices());

    QSet<QString> seenIds;
    for (Volume& v : merged) {
        if (v.devicePath.isEmpty()) {
            v.devicePath = DiskUtility::deviceNodeForMount(v.mountPath);
            if (v.devicePath.isEmpty()) v.devicePath = QStringLiteral("/dev/unknown");
        }
        v.isRemovable = v.isRemovable || removable.value(v.devicePath, false);
        v.kind = classify(v.mountPath, v.fileSystemType, v.isRemovable, looksLikeCameraCard(v.mountPath));

        v.id = volumeIdFor(v.devicePath, v.mountPath);
        if (seenIds.contains(v.id)) {
            // Same device mounted twice (bind mounts); fall back to the mount path
            v.id = volumeIdFor(QString(), v.mountPath);
        }
        seenIds.insert(v.id);

        if (!alreadyProbed.contains(v.id)) {
            v.accessGranted = !v.isReadOnly && m_access && m_access->hasAccess(v.mountPath);
        }
    }
    return merged;
}

QList<Volume> VolumeRegistry::scanStorageInfo() const
{
    QList<Volume> out;
    const QList<QStorageInfo> mounted = QStorageInfo::mountedVolumes();
    for (const QStorageInfo& si : mounted) {
        if (!si.isValid() || !si.isReady()) continue;
        const QString fsType = QString::fromLatin1(si.fileSystemType());
        QString name = si.name();
        if (name.isEmpty()) name = si.displayName();
        if (isPseudoVolume(name, fsType)) continue;

        Volume v;
        v.name = name;
        v.mountPath = cleanMountPath(si.rootPath());
        const QString device = QString::fromLocal8Bit(si.device());
        v.devicePath = device.startsWith('/') ? device : QString();
        v.fileSystemType = fsType;
        v.isReadOnly = si.isReadOnly();
        v.totalSpace = qMax<qint64>(0, si.bytesTotal());
        v.freeSpace = qBound<qint64>(0, si.bytesAvailable(), v.totalSpace);
        out.append(v);
    }
    return out;
}

QList<Volume> VolumeRegistry::scanBlockDevices() const
{
    QList<Volume> out;
#ifdef Q_OS_LINUX
    QFile mounts(QStringLiteral("/proc/self/mounts"));
    if (!mounts.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qDebug() << "[VolumeRegistry] /proc/self/mounts unavailable:" << mounts.errorString();
        return out;
    }
    QTextStream ts(&mounts);
    QString line;
    while (ts.readLineInto(&line)) {
        const QStringList fields = line.split(' ', Qt::SkipEmptyParts);
        if (fields.size() < 4) continue;
        const QString device = decodeMountField(fields.at(0));
        if (!device.startsWith(QStringLiteral("/dev/")) || device.startsWith(QStringLiteral("/dev/loop"))) continue;
        const QString mountPath = cleanMountPath(decodeMountField(fields.at(1)));
        const QString fsType = fields.at(2);

        QStorageInfo si(mountPath);
        if (!si.isValid() || !si.isReady()) continue;
        QString name = si.name();
        if (name.isEmpty()) name = QFileInfo(mountPath).fileName();
        if (name.isEmpty()) name = mountPath;
        if (isPseudoVolume(name, fsType)) continue;

        Volume v;
        v.name = name;
        v.mountPath = mountPath;
        v.devicePath = device;
        v.fileSystemType = fsType;
        v.isReadOnly = fields.at(3).split(',').contains(QStringLiteral("ro"));
        v.totalSpace = qMax<qint64>(0, si.bytesTotal());
        v.freeSpace = qBound<qint64>(0, si.bytesAvailable(), v.totalSpace);
        out.append(v);
    }
#endif
    return out;
}

QHash<QString, bool> VolumeRegistry::removableDevices() const
{
    QHash<QString, bool> out;
#ifdef Q_OS_LINUX
    QDir sysBlock(QStringLiteral("/sys/block"));
    if (!sysBlock.exists()) return out;
    const QStringList disks = sysBlock.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& disk : disks) {
        const QString diskDir = sysBlock.filePath(disk);
        const bool usb = QFileInfo(diskDir).canonicalFilePath().contains(QStringLiteral("/usb"));
        const bool removable = usb || readSysFile(diskDir + "/removable") == QLatin1String("1");
        out.insert("/dev/" + disk, removable);

        const QStringList children = QDir(diskDir).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
        for (const QString& child : children) {
            if (QFileInfo::exists(diskDir + "/" + child + "/partition")) {
                out.insert("/dev/" + child, removable);
            }
        }
    }
#endif
    return out;
}

QList<Volume> VolumeRegistry::mergeSources(const QList<Volume>& primary, const QList<Volume>& secondary)
{
    QList<Volume> out;
    QSet<QString> mountPaths;
    auto take = [&](const QList<Volume>& list) {
        for (Volume v : list) {
            v.mountPath = cleanMountPath(v.mountPath);
            if (v.mountPath.isEmpty()) continue;
            if (isPseudoVolume(v.name, v.fileSystemType)) continue;
            if (mountPaths.contains(v.mountPath)) continue;
            mountPaths.insert(v.mountPath);
            out.append(v);
        }
    };
    take(primary);
    take(secondary);
    return out;
}

bool VolumeRegistry::isPseudoVolume(const QString& name, const QString& fileSystemType)
{
    if (name == QLatin1String("GUID_partition_scheme") || name == QLatin1String("FDisk_partition_scheme")) return true;
    if (name.endsWith(QLatin1String("-0000-11AA-AA11-00306543ECAC"), Qt::CaseInsensitive)) return true;
    return pseudoFileSystems().contains(fileSystemType.toLower());
}

VolumeKind VolumeRegistry::classify(const QString& mountPath, const QString& fileSystemType, bool removable, bool cameraLayout)
{
    if (mountPath.isEmpty()) return VolumeKind::Unknown;
    const QString fs = fileSystemType.toLower();
    if (networkFileSystems().contains(fs)) return VolumeKind::Network;
    if (cameraLayout) return VolumeKind::CameraCard;
    if (removable) {
        if (fs == QLatin1String("iso9660") || fs == QLatin1String("udf")) return VolumeKind::Removable;
        return VolumeKind::External;
    }
    static const QStringList externalRoots = { "/media/", "/run/media/", "/Volumes/", "/mnt/" };
    for (const QString& root : externalRoots) {
        if (mountPath.startsWith(root)) return VolumeKind::External;
    }
    return VolumeKind::Internal;
}

bool VolumeRegistry::looksLikeCameraCard(const QString& mountPath)
{
    if (mountPath.isEmpty() || mountPath == QLatin1String("/")) return false;
    const QDir root(mountPath);
    static const QStringList markers = { "DCIM", "PRIVATE/M4ROOT", "PRIVATE/AVCHD", "CONTENTS/CLIPS001", "XDROOT" };
    for (const QString& marker : markers) {
        if (root.exists(marker)) return true;
    }
    return false;
}

QString VolumeRegistry::volumeIdFor(const QString& devicePath, const QString& mountPath)
{
    const bool knownDevice = devicePath.startsWith(QLatin1String("/dev/")) && devicePath != QLatin1String("/dev/unknown");
    const QString key = knownDevice ? QStringLiteral("dev:") + devicePath : QStringLiteral("mnt:") + cleanMountPath(mountPath);
    return QUuid::createUuidV5(kVolumeNamespace, key).toString(QUuid::WithoutBraces);
}

QString VolumeRegistry::decodeMountField(const QString& field)
{
    // /proc/mounts escapes space, tab, newline and backslash as \ooo
    QString out;
    out.reserve(field.size());
    for (int i = 0; i < field.size(); ++i) {
        if (field.at(i) == '\\' && i + 3 < field.size()) {
            bool ok = false;
            const int code = field.mid(i + 1, 3).toInt(&ok, 8);
            if (ok) {
                out.append(QChar(code));
                i += 3;
                continue;
            }
        }
        out.append(field.at(i));
    }
    return out;
}

void VolumeRegistry::diff(const QList<Volume>& before, const QList<Volume>& after, QList<Volume>& attached, QList<Volume>& detached)
{
    QSet<QString> beforeIds, afterIds;
    for (const Volume& v : before) beforeIds.insert(v.id);
    for (const Volume& v : after) afterIds.insert(v.id);
    for (const Volume& v : after) {
        if (!beforeIds.contains(v.id)) attached.append(v);
    }
    for (const Volume& v : before) {
        if (!afterIds.contains(v.id)) detached.append(v);
    }
}

QSet<QString> VolumeRegistry::probedIds() const
{
    QMutexLocker lk(&m_mutex);
    QSet<QString> ids;
    for (const Volume& v : m_known) ids.insert(v.id);
    return ids;
}

void VolumeRegistry::applyScan(const QList<Volume>& scanned)
{
    QList<Volume> attached, detached;
    bool baseline = false;
    {
        QMutexLocker lk(&m_mutex);
        QHash<QString, bool> previousAccess;
        for (const Volume& v : m_known) previousAccess.insert(v.id, v.accessGranted);

        QList<Volume> next = scanned;
        for (Volume& v : next) {
            if (previousAccess.contains(v.id)) v.accessGranted = previousAccess.value(v.id);
            v.label = m_labels.value(v.id);
        }
        baseline = !m_hasBaseline;
        m_hasBaseline = true;
        if (!baseline) diff(m_known, next, attached, detached);
        m_known = next;
    }
    if (!attached.isEmpty() || !detached.isEmpty()) {
        qInfo() << "[VolumeRegistry]" << attached.size() << "attached," << detached.size() << "detached";
        deliver(attached, detached);
    }
}

void VolumeRegistry::deliver(const QList<Volume>& attached, const QList<Volume>& detached)
{
    QMetaObject::invokeMethod(this, [this, attached, detached]() {
        QList<ChangeCallback> callbacks;
        {
            QMutexLocker lk(&m_subscriberMutex);
            callbacks = m_subscribers.values();
        }
        for (const Volume& v : attached) {
            emit volumeAttached(v);
            for (const auto& cb : callbacks) cb(v, true);
        }
        for (const Volume& v : detached) {
            emit volumeDetached(v);
            for (const auto& cb : callbacks) cb(v, false);
        }
        emit volumesChanged();
    }, Qt::QueuedConnection);
}

QList<Volume> VolumeRegistry::listVolumes()
{
    applyScan(discover(probedIds()));
    return knownVolumes();
}

QList<Volume> VolumeRegistry::knownVolumes() const
{
    QMutexLocker lk(&m_mutex);
    return m_known;
}

Volume VolumeRegistry::volumeForPath(const QString& path) const
{
    const QString target = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QMutexLocker lk(&m_mutex);
    Volume best;
    for (const Volume& v : m_known) {
        const bool under = target == v.mountPath || v.mountPath == QLatin1String("/")
                           || target.startsWith(v.mountPath + '/');
        if (under && v.mountPath.size() > best.mountPath.size()) best = v;
    }
    return best;
}

int VolumeRegistry::subscribe(ChangeCallback callback)
{
    QMutexLocker lk(&m_subscriberMutex);
    const int token = m_nextToken++;
    m_subscribers.insert(token, std::move(callback));
    return token;
}

void VolumeRegistry::unsubscribe(int token)
{
    QMutexLocker lk(&m_subscriberMutex);
    m_subscribers.remove(token);
}

void VolumeRegistry::setLabel(const QString& volumeId, const QString& label)
{
    QMutexLocker lk(&m_mutex);
    if (label.isEmpty()) m_labels.remove(volumeId);
    else m_labels.insert(volumeId, label);
    for (Volume& v : m_known) {
        if (v.id == volumeId) v.label = label;
    }
}

QString VolumeRegistry::label(const QString& volumeId) const
{
    QMutexLocker lk(&m_mutex);
    return m_labels.value(volumeId);
}

VolumeRegistry::EjectResult VolumeRegistry::ejectVolume(const Volume& volume)
{
    EjectResult result;
    if (!volume.isValid()) {
        result.detail = QStringLiteral("Unknown volume");
        return result;
    }
    const DiskUtility::Outcome out = DiskUtility::eject(volume.mountPath, volume.devicePath);
    result.ok = out.ok;
    if (!out.ok) result.detail = out.output.trimmed();
    else requestRescan();
    return result;
}

void VolumeRegistry::startMonitoring(int pollIntervalMs)
{
    if (m_monitoring) return;
    m_monitoring = true;

    m_debounceTimer = new QTimer(this);
    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(500);
    connect(m_debounceTimer, &QTimer::timeout, this, &VolumeRegistry::requestRescan);

    m_watcher = new QFileSystemWatcher(this);
    const QString user = qEnvironmentVariable("USER");
    QStringList roots = { "/media", "/mnt", "/Volumes" };
    if (!user.isEmpty()) {
        roots << "/media/" + user << "/run/media/" + user;
    }
    for (const QString& root : roots) {
        if (QFileInfo(root).isDir() && m_watcher->addPath(root)) {
            qDebug() << "[VolumeRegistry] Watching mount root" << root;
        }
    }
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, m_debounceTimer, qOverload<>(&QTimer::start));

    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(qMax(250, pollIntervalMs));
    connect(m_pollTimer, &QTimer::timeout, this, &VolumeRegistry::requestRescan);
    m_pollTimer->start();

    requestRescan();
}

void VolumeRegistry::stopMonitoring()
{
    if (!m_monitoring) return;
    m_monitoring = false;
    delete m_pollTimer;
    m_pollTimer = nullptr;
    delete m_debounceTimer;
    m_debounceTimer = nullptr;
    delete m_watcher;
    m_watcher = nullptr;
}

void VolumeRegistry::requestRescan()
{
    QMetaObject::invokeMethod(this, [this]() {
        if (m_scanRunning) {
            m_rescanQueued = true;
            return;
        }
        m_scanRunning = true;
        const QSet<QString> probed = probedIds();
        m_scanWatcher.setFuture(QtConcurrent::run([this, probed]() { return discover(probed); }));
    }, Qt::QueuedConnection);
}
