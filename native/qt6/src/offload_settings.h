#pragma once

#include <QSettings>
#include <QString>

#include "checksum.h"

/**
 * @brief OffloadSettings - engine configuration persisted with QSettings
 *
 * Values live under the "Offload/" group of the application's settings store:
 * "Offload/MaxConcurrentTransfers", "Offload/CopyBufferSize", ...
 * Out-of-range values read from disk are clamped, never rejected.
 */
struct OffloadSettings {
    static constexpr int kMinConcurrentTransfers = 1;
    static constexpr int kMaxConcurrentTransfers = 8;
    static constexpr qint64 kMinBufferSize = 64 * 1024;
    static constexpr qint64 kMaxBufferSize = 64 * 1024 * 1024;

    int maxConcurrentTransfers = 3;
    qint64 copyBufferSize = 1024 * 1024;
    qint64 wholeFileBufferLimit = 256LL * 1024 * 1024; // larger files skip the in-memory strategy
    ChecksumAlgorithm verificationAlgorithm = ChecksumAlgorithm::Md5;
    ChecksumAlgorithm manifestAlgorithm = ChecksumAlgorithm::XxHash64;
    bool generateManifest = true;
    bool verifyAfterTransfer = true;
    bool skipHiddenFiles = true;
    int volumePollIntervalMs = 2000;

    static OffloadSettings load();
    static OffloadSettings load(QSettings& settings);
    void save() const;
    void save(QSettings& settings) const;

    // Applies the clamping rules to values set in code
    OffloadSettings normalized() const;
};
