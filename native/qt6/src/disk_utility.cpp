#include "disk_utility.h"

#include <QDebug>
#include <QProcess>

DiskUtility::Command DiskUtility::deviceLookupCommand(const QString& mountPath)
{
#ifdef Q_OS_MACOS
    return { QStringLiteral("/usr/sbin/diskutil"), { QStringLiteral("info"), mountPath }, QStringLiteral("Device Node:") };
#else
    return { QStringLiteral("findmnt"), { QStringLiteral("-P"), QStringLiteral("-o"), QStringLiteral("SOURCE"), QStringLiteral("--target"), mountPath },
             QStringLiteral("SOURCE=") };
#endif
}

DiskUtility::Command DiskUtility::ejectCommand(const QString& mountPath, const QString& devicePath)
{
#ifdef Q_OS_MACOS
    Q_UNUSED(devicePath);
    return { QStringLiteral("/usr/sbin/diskutil"), { QStringLiteral("eject"), mountPath }, QString() };
#else
    const QString target = devicePath.startsWith("/dev/") && devicePath != "/dev/unknown" ? devicePath : QString();
    if (target.isEmpty()) {
        return { QStringLiteral("umount"), { mountPath }, QString() };
    }
    return { QStringLiteral("udisksctl"), { QStringLiteral("unmount"), QStringLiteral("-b"), target }, QString() };
#endif
}

DiskUtility::Outcome DiskUtility::run(const Command& command, int timeoutMs)
{
    Outcome out;
    QProcess p;
    p.start(command.program, command.arguments);
    if (!p.waitForStarted(timeoutMs)) {
        out.output = QStringLiteral("Failed to start %1: %2").arg(command.program, p.errorString());
        qWarning() << "[DiskUtility]" << out.output;
        return out;
    }
    if (!p.waitForFinished(timeoutMs)) {
        p.kill();
        p.waitForFinished(1000);
        out.output = QStringLiteral("%1 did not finish").arg(command.program);
        qWarning() << "[DiskUtility]" << out.output;
        return out;
    }
    out.output = QString::fromUtf8(p.readAllStandardOutput()) + QString::fromUtf8(p.readAllStandardError());
    out.exitCode = p.exitCode();
    out.ok = p.exitStatus() == QProcess::NormalExit && p.exitCode() == 0;
    return out;
}

QString DiskUtility::parseField(const QString& output, const QString& prefix)
{
    const QStringList lines = output.split('\n');
    for (const QString& raw : lines) {
        const QString line = raw.trimmed();
        if (!line.startsWith(prefix)) continue;
        QString value = line.mid(prefix.size()).trimmed();
        if (value.size() >= 2 && value.startsWith('"') && value.endsWith('"')) {
            value = value.mid(1, value.size() - 2);
        }
        return value;
    }
    return QString();
}

QString DiskUtility::deviceNodeForMount(const QString& mountPath)
{
    const Command cmd = deviceLookupCommand(mountPath);
    const Outcome res = run(cmd, 5000);
    if (!res.ok) {
        qDebug() << "[DiskUtility] Device lookup failed for" << mountPath << res.output.trimmed();
        return QString();
    }
    return parseField(res.output, cmd.fieldPrefix);
}

DiskUtility::Outcome DiskUtility::eject(const QString& mountPath, const QString& devicePath)
{
    const Command cmd = ejectCommand(mountPath, devicePath);
    qInfo() << "[DiskUtility] Ejecting" << mountPath << "via" << cmd.program << cmd.arguments;
    Outcome res = run(cmd);
    if (!res.ok) {
        qWarning() << "[DiskUtility] Eject failed for" << mountPath << "exit" << res.exitCode << res.output.trimmed();
    }
    return res;
}
