#pragma once
#include <QMetaType>
#include <QString>
#include <QtGlobal>

enum class VolumeKind { Internal, External, CameraCard, Network, Removable, Unknown };

// Represents a mounted storage volume as seen by one discovery scan
struct Volume {
    QString id;              // stable across scans: derived from device path, else mount path
    QString name;
    QString mountPath;       // unique among concurrently known volumes
    QString devicePath;      // e.g. /dev/sdb1, "/dev/unknown" if unresolved
    QString fileSystemType;
    VolumeKind kind = VolumeKind::Unknown;
    bool isRemovable = false;
    bool isReadOnly = false;
    bool accessGranted = false;
    qint64 totalSpace = 0;
    qint64 freeSpace = 0;    // never above totalSpace
    QString label;           // user assigned

    qint64 usedSpace() const { return totalSpace - freeSpace; }
    double freeSpaceFraction() const { return totalSpace > 0 ? double(freeSpace) / double(totalSpace) : 0.0; }
    QString displayName() const { return label.isEmpty() ? name : QStringLiteral("%1 (%2)").arg(name, label); }
    bool isValid() const { return !mountPath.isEmpty(); }
};

Q_DECLARE_METATYPE(Volume)

QString volumeKindName(VolumeKind kind);
