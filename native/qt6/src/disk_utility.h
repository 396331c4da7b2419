#pragma once
#include <QString>
#include <QStringList>

/**
 * DiskUtility - thin wrapper over the platform disk tool.
 *
 * macOS: /usr/sbin/diskutil ("info", "eject").
 * Linux: findmnt for device lookup, udisksctl for unmounting.
 * Every call blocks until the tool exits; run it off the coordination thread.
 */
class DiskUtility {
public:
    struct Command {
        QString program;
        QStringList arguments;
        QString fieldPrefix; // line prefix holding the answer, for lookups
    };

    struct Outcome {
        bool ok = false;
        int exitCode = -1;
        QString output;      // stdout followed by stderr
    };

    static Command deviceLookupCommand(const QString& mountPath);
    static Command ejectCommand(const QString& mountPath, const QString& devicePath);

    // Device node for a mount point, empty if the tool is missing or fails
    static QString deviceNodeForMount(const QString& mountPath);
    static Outcome eject(const QString& mountPath, const QString& devicePath);

    static Outcome run(const Command& command, int timeoutMs = 30000);

    // Value of the first line starting with prefix (after leading whitespace);
    // surrounding quotes are removed. Empty if no line matches.
    static QString parseField(const QString& output, const QString& prefix);
};
