#include "offload_settings.h"
#include <QDebug>

namespace {
const char* kGroup = "Offload";

ChecksumAlgorithm algorithmValue(const QSettings& s, const QString& key, ChecksumAlgorithm fallback)
{
    ChecksumAlgorithm alg = fallback;
    const QString name = s.value(key, Checksum::tagName(fallback)).toString();
    if (!Checksum::fromName(name, alg)) {
        qWarning() << "[OffloadSettings] Unknown checksum algorithm" << name << "for" << key;
        return fallback;
    }
    return alg;
}
}

OffloadSettings OffloadSettings::load()
{
    QSettings s("AugmentCode", "KOffload");
    return load(s);
}

OffloadSettings OffloadSettings::load(QSettings& s)
{
    OffloadSettings out;
    s.beginGroup(kGroup);
    out.maxConcurrentTransfers = s.value("MaxConcurrentTransfers", out.maxConcurrentTransfers).toInt();
    out.copyBufferSize = s.value("CopyBufferSize", out.copyBufferSize).toLongLong();
    out.wholeFileBufferLimit = s.value("WholeFileBufferLimit", out.wholeFileBufferLimit).toLongLong();
    out.verificationAlgorithm = algorithmValue(s, "VerificationAlgorithm", out.verificationAlgorithm);
    out.manifestAlgorithm = algorithmValue(s, "ManifestAlgorithm", out.manifestAlgorithm);
    out.generateManifest = s.value("GenerateManifest", out.generateManifest).toBool();
    out.verifyAfterTransfer = s.value("VerifyAfterTransfer", out.verifyAfterTransfer).toBool();
    out.skipHiddenFiles = s.value("SkipHiddenFiles", out.skipHiddenFiles).toBool();
    out.volumePollIntervalMs = s.value("VolumePollIntervalMs", out.volumePollIntervalMs).toInt();
    s.endGroup();
    return out.normalized();
}

void OffloadSettings::save() const
{
    QSettings s("AugmentCode", "KOffload");
    save(s);
}

void OffloadSettings::save(QSettings& s) const
{
    const OffloadSettings v = normalized();
    s.beginGroup(kGroup);
    s.setValue("MaxConcurrentTransfers", v.maxConcurrentTransfers);
    s.setValue("CopyBufferSize", v.copyBufferSize);
    s.setValue("WholeFileBufferLimit", v.wholeFileBufferLimit);
    s.setValue("VerificationAlgorithm", Checksum::tagName(v.verificationAlgorithm));
    s.setValue("ManifestAlgorithm", Checksum::tagName(v.manifestAlgorithm));
    s.setValue("GenerateManifest", v.generateManifest);
    s.setValue("VerifyAfterTransfer", v.verifyAfterTransfer);
    s.setValue("SkipHiddenFiles", v.skipHiddenFiles);
    s.setValue("VolumePollIntervalMs", v.volumePollIntervalMs);
    s.endGroup();
    s.sync();
    qDebug() << "[OffloadSettings] Saved settings to" << s.fileName();
}

OffloadSettings OffloadSettings::normalized() const
{
    OffloadSettings v = *this;
    v.maxConcurrentTransfers = qBound(kMinConcurrentTransfers, v.maxConcurrentTransfers, kMaxConcurrentTransfers);
    v.copyBufferSize = qBound(kMinBufferSize, v.copyBufferSize, kMaxBufferSize);
    if (v.wholeFileBufferLimit < 0) v.wholeFileBufferLimit = 0;
    if (v.volumePollIntervalMs < 250) v.volumePollIntervalMs = 250;
    return v;
}
