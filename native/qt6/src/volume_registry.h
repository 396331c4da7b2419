#pragma once

#include <QFutureWatcher>
#include <QHash>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QString>
#include <functional>

#include "volume.h"

class AccessGrantProvider;
class QFileSystemWatcher;
class QTimer;

/**
 * VolumeRegistry enumerates mounted volumes and reports attach/detach events.
 *
 * Discovery merges two sources: QStorageInfo's mounted filesystem list and a
 * walk of the kernel block-device tables (/proc/self/mounts + /sys/block).
 * Results are de-duplicated by mount path and pseudo volumes are dropped.
 * Enumeration never fails: a source that cannot be read contributes nothing.
 *
 * Volume ids are derived from the device path, so a device keeps its id and
 * its user label across scans. New volumes get their accessGranted flag from
 * the injected AccessGrantProvider, whose probe may write into the volume root.
 *
 * **Thread Safety:**
 * - listVolumes() blocks on filesystem queries; call it off the UI thread
 * - subscribe()/unsubscribe()/setLabel() may be called from any thread
 * - Change callbacks run on the thread that owns the registry, after a
 *   background rescan; ordering between callbacks is not guaranteed
 */
class VolumeRegistry : public QObject {
    Q_OBJECT
public:
    using ChangeCallback = std::function<void(const Volume& volume, bool attached)>;

    explicit VolumeRegistry(AccessGrantProvider* access = nullptr, QObject* parent = nullptr);
    ~VolumeRegistry() override;

    // Scans now and updates the known set. Change callbacks fire for differences.
    QList<Volume> listVolumes();
    QList<Volume> knownVolumes() const;
    // Volume whose mount path is the longest prefix of path; invalid if none
    Volume volumeForPath(const QString& path) const;

    int subscribe(ChangeCallback callback);
    void unsubscribe(int token);

    void setLabel(const QString& volumeId, const QString& label);
    QString label(const QString& volumeId) const;

    struct EjectResult {
        bool ok = false;
        QString detail; // tool output when it fails
    };
    // Runs the platform eject tool; blocks until it exits
    EjectResult ejectVolume(const Volume& volume);

    void startMonitoring(int pollIntervalMs = 2000);
    void stopMonitoring();
    bool isMonitoring() const { return m_monitoring; }
    // Queue a background rescan; used by the watchers and available to callers
    void requestRescan();

    // Discovery building blocks, exposed for tests
    static bool isPseudoVolume(const QString& name, const QString& fileSystemType);
    static VolumeKind classify(const QString& mountPath, const QString& fileSystemType, bool removable, bool cameraLayout);
    static bool looksLikeCameraCard(const QString& mountPath);
    static QString volumeIdFor(const QString& devicePath, const QString& mountPath);
    static QList<Volume> mergeSources(const QList<Volume>& primary, const QList<Volume>& secondary);
    static void diff(const QList<Volume>& before, const QList<Volume>& after, QList<Volume>& attached, QList<Volume>& detached);
    static QString decodeMountField(const QString& field);

signals:
    void volumeAttached(const Volume& volume);
    void volumeDetached(const Volume& volume);
    void volumesChanged();

protected:
    // Full discovery pass; runs on a worker thread during monitoring.
    // Volumes whose id is in alreadyProbed keep their previous accessGranted.
    virtual QList<Volume> discover(const QSet<QString>& alreadyProbed) const;

private:
    QList<Volume> scanStorageInfo() const;
    QList<Volume> scanBlockDevices() const;
    QHash<QString, bool> removableDevices() const;
    void applyScan(const QList<Volume>& scanned);
    void deliver(const QList<Volume>& attached, const QList<Volume>& detached);
    QSet<QString> probedIds() const;

    AccessGrantProvider* m_access = nullptr;

    mutable QMutex m_mutex;
    QList<Volume> m_known;
    QHash<QString, QString> m_labels;

    mutable QMutex m_subscriberMutex;
    QMap<int, ChangeCallback> m_subscribers;
    int m_nextToken = 1;

    QFileSystemWatcher* m_watcher = nullptr;
    QTimer* m_pollTimer = nullptr;
    QTimer* m_debounceTimer = nullptr;
    QFutureWatcher<QList<Volume>> m_scanWatcher;
    bool m_scanRunning = false;
    bool m_rescanQueued = false;
    bool m_monitoring = false;
    bool m_hasBaseline = false;
};
