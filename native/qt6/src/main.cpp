#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QTextStream>

#include "access_grant.h"
#include "checksum.h"
#include "log_manager.h"
#include "media_hash_list.h"
#include "offload_settings.h"
#include "transfer_queue.h"
#include "volume_registry.h"

namespace {

enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitUsage = 2 };

QTextStream& out()
{
    static QTextStream ts(stdout);
    return ts;
}

QTextStream& err()
{
    static QTextStream ts(stderr);
    return ts;
}

QString humanReadableSize(qint64 bytes)
{
    if (bytes < 1024)
        return QString::number(bytes) + " B";
    if (bytes < 1024 * 1024)
        return QString::number(bytes / 1024.0, 'f', 1) + " KB";
    if (bytes < 1024ll * 1024ll * 1024ll)
        return QString::number(bytes / (1024.0 * 1024.0), 'f', 1) + " MB";
    return QString::number(bytes / (1024.0 * 1024.0 * 1024.0), 'f', 2) + " GB";
}

int usage(const QCommandLineParser& parser, const QString& message)
{
    if (!message.isEmpty()) err() << message << "\n\n";
    err() << parser.helpText();
    err().flush();
    return ExitUsage;
}

bool algorithmOption(const QCommandLineParser& parser, ChecksumAlgorithm& algorithm)
{
    if (!parser.isSet("algorithm")) return true;
    return Checksum::fromName(parser.value("algorithm"), algorithm);
}

int listVolumes(AccessGrantProvider* access)
{
    VolumeRegistry registry(access);
    const QList<Volume> volumes = registry.listVolumes();
    for (const Volume& v : volumes) {
        out() << v.displayName() << "\n"
              << "    mount:  " << v.mountPath << "\n"
              << "    device: " << v.devicePath << " (" << v.fileSystemType << ")\n"
              << "    kind:   " << volumeKindName(v.kind) << (v.isRemovable ? ", removable" : "")
              << (v.isReadOnly ? ", read-only" : "") << "\n"
              << "    space:  " << humanReadableSize(v.freeSpace) << " free of " << humanReadableSize(v.totalSpace) << "\n"
              << "    access: " << (v.accessGranted ? "granted" : "denied") << "\n"
              << "    id:     " << v.id << "\n";
    }
    out() << volumes.size() << " volume(s)\n";
    out().flush();
    return ExitOk;
}

int copyPaths(QCoreApplication& app, AccessGrantProvider* access, OffloadSettings settings,
              const QString& source, const QString& destination)
{
    TransferQueue queue(access, settings);
    int exitCode = ExitFailure;
    QElapsedTimer throttle;
    throttle.start();

    QObject::connect(&queue, &TransferQueue::progressChanged, &app,
                     [&throttle](int, qint64 bytes, qint64 total, const QString& label) {
        if (bytes != total && throttle.elapsed() < 500) return;
        throttle.restart();
        const int pct = total > 0 ? int(bytes * 100 / total) : 100;
        out() << QString("[%1%] %2 / %3  %4").arg(pct, 3).arg(humanReadableSize(bytes), humanReadableSize(total), label) << "\n";
        out().flush();
    });
    QObject::connect(&queue, &TransferQueue::taskFinished, &app,
                     [&](int id, bool success, const TransferError& error) {
        const TransferTask::Snapshot s = queue.task(id);
        if (success) {
            out() << "Copied " << s.completedFiles << " of " << s.totalFiles << " files";
            if (s.failedFiles > 0) out() << " (" << s.failedFiles << " failed)";
            out() << "\n";
            if (!s.manifestPath.isEmpty()) out() << "Manifest: " << s.manifestPath << "\n";
            exitCode = ExitOk;
        } else {
            err() << "Transfer failed: " << error.toString() << "\n";
            err().flush();
        }
        out().flush();
        app.quit();
    });

    if (queue.enqueue(source, destination) == 0) return ExitUsage;
    app.exec();
    return exitCode;
}

int verify(const QString& manifest, const QString& base)
{
    const VerificationResult r = MediaHashList::verifyManifest(manifest, base);
    for (const QString& f : r.invalidFiles) out() << "INVALID  " << f << "\n";
    for (const QString& f : r.missingFiles) out() << "MISSING  " << f << "\n";
    out() << r.message << ": " << r.verifiedCount() << " verified, " << r.missingCount() << " missing, "
          << r.invalidCount() << " invalid\n";
    out().flush();
    return r.success ? ExitOk : ExitFailure;
}

int hashFile(const QString& path, ChecksumAlgorithm algorithm)
{
    const QString hex = Checksum::fileHex(path, algorithm);
    if (hex.isEmpty()) {
        err() << "Cannot read " << path << "\n";
        err().flush();
        return ExitFailure;
    }
    out() << hex << "  " << path << "\n";
    out().flush();
    return ExitOk;
}

int eject(AccessGrantProvider* access, const QString& mountPath)
{
    VolumeRegistry registry(access);
    registry.listVolumes();
    Volume v = registry.volumeForPath(mountPath);
    if (!v.isValid() || v.mountPath != QDir::cleanPath(QFileInfo(mountPath).absoluteFilePath())) {
        err() << "No mounted volume at " << mountPath << "\n";
        err().flush();
        return ExitFailure;
    }
    const VolumeRegistry::EjectResult r = registry.ejectVolume(v);
    if (!r.ok) {
        err() << "Eject failed: " << r.detail << "\n";
        err().flush();
        return ExitFailure;
    }
    out() << "Ejected " << v.displayName() << "\n";
    out().flush();
    return ExitOk;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("AugmentCode");
    QCoreApplication::setApplicationName("KOffload");
    QCoreApplication::setApplicationVersion("1.0.0");

    // First use installs the message handler that logs to app.log
    LogManager::instance().setStderrThreshold(QtWarningMsg);

    QCommandLineParser parser;
    parser.setApplicationDescription("Verified media offload: copy camera media, write and check MHL manifests.\n\n"
                                     "Commands:\n"
                                     "  volumes                       list mounted volumes\n"
                                     "  copy <source> <destination>   copy a file or a media directory\n"
                                     "  verify <manifest.mhl>         check files against a manifest\n"
                                     "  hash <file>                   print a file digest\n"
                                     "  eject <mount>                 unmount a volume");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "volumes | copy | verify | hash | eject");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");
    parser.addOption({ "mhl", "copy: write an MHL manifest into <destination>/MHL and verify it" });
    parser.addOption({ "algorithm", "Digest algorithm: md5, sha1 or xxh64", "name" });
    parser.addOption({ "jobs", "copy: concurrent file copies (1-8)", "n" });
    parser.addOption({ "base", "verify: directory the manifest entries are relative to", "dir" });
    parser.addOption({ "log-file", "Write the log to this file instead of app.log", "path" });
    parser.addOption({ { "v", "verbose" }, "Echo debug and info log lines to stderr" });

    if (!parser.parse(QCoreApplication::arguments())) return usage(parser, parser.errorText());
    if (parser.isSet("help")) {
        out() << parser.helpText();
        out().flush();
        return ExitOk;
    }
    if (parser.isSet("version")) {
        out() << QCoreApplication::applicationName() << " " << QCoreApplication::applicationVersion() << "\n";
        out().flush();
        return ExitOk;
    }
    if (parser.isSet("verbose")) LogManager::instance().setStderrThreshold(QtDebugMsg);
    if (parser.isSet("log-file") && !LogManager::instance().setLogFilePath(parser.value("log-file"))) {
        return usage(parser, QString("Cannot open log file %1").arg(parser.value("log-file")));
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) return usage(parser, "Missing command");
    const QString command = args.first();
    const QStringList rest = args.mid(1);

    OffloadSettings settings = OffloadSettings::load();
    ProbeAccessGrantProvider access;

    int rc = ExitUsage;
    if (command == "volumes") {
        rc = rest.isEmpty() ? listVolumes(&access) : usage(parser, "volumes takes no arguments");
    } else if (command == "copy") {
        if (rest.size() != 2) return usage(parser, "copy needs <source> <destination>");
        if (!algorithmOption(parser, settings.manifestAlgorithm)) return usage(parser, "Unknown algorithm " + parser.value("algorithm"));
        if (parser.isSet("jobs")) {
            bool ok = false;
            settings.maxConcurrentTransfers = parser.value("jobs").toInt(&ok);
            if (!ok) return usage(parser, "--jobs needs a number");
        }
        settings.generateManifest = parser.isSet("mhl");
        rc = copyPaths(app, &access, settings.normalized(), rest.at(0), rest.at(1));
    } else if (command == "verify") {
        if (rest.size() != 1) return usage(parser, "verify needs <manifest.mhl>");
        rc = verify(rest.at(0), parser.value("base"));
    } else if (command == "hash") {
        if (rest.size() != 1) return usage(parser, "hash needs <file>");
        ChecksumAlgorithm alg = ChecksumAlgorithm::XxHash64;
        if (!algorithmOption(parser, alg)) return usage(parser, "Unknown algorithm " + parser.value("algorithm"));
        rc = hashFile(rest.at(0), alg);
    } else if (command == "eject") {
        if (rest.size() != 1) return usage(parser, "eject needs <mount>");
        rc = eject(&access, rest.at(0));
    } else {
        return usage(parser, "Unknown command " + command);
    }

    // Deliver queued log lines before LogManager flushes on exit
    QCoreApplication::processEvents();
    return rc;
}
