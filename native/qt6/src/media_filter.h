#pragma once
#include <QString>

/**
 * MediaFilter - decides which directory entries take part in an offload.
 *
 * Hidden entries (leading '.') and the macOS ".Trashes" folder are skipped,
 * as are the housekeeping files camera firmware writes next to the media
 * (SONYCARD.IND, MEDIAPRO.XML, ...). Files must carry an image, raw or video
 * container extension to be copied.
 */
namespace MediaFilter {

bool isMediaFile(const QString& path);
bool isCameraHousekeepingFile(const QString& fileName);
bool isHiddenEntry(const QString& fileName);

// Directory entries worth descending into
bool acceptDirectory(const QString& dirName, bool skipHidden = true);
// Files to copy: not hidden, not housekeeping, media extension
bool acceptFile(const QString& fileName, bool skipHidden = true);

} // namespace MediaFilter
