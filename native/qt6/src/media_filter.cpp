#include "media_filter.h"

#include <QFileInfo>
#include <QSet>

namespace MediaFilter {

bool isMediaFile(const QString& path)
{
    static const QSet<QString> exts = {
        // Video containers
        "mp4", "mov", "mxf", "avi", "mkv", "m4v", "mpg", "mpeg", "mts", "m2ts", "3gp", "braw", "r3d", "crm", "insv",
        // Images
        "jpg", "jpeg", "png", "tif", "tiff", "heic", "heif",
        // Camera raw
        "dng", "cr2", "cr3", "nef", "arw", "raf", "raw", "orf", "rw2", "pef", "srw",
        // Audio recorded alongside video
        "wav"
    };
    return exts.contains(QFileInfo(path).suffix().toLower());
}

bool isCameraHousekeepingFile(const QString& fileName)
{
    static const QSet<QString> names = {
        "SONYCARD.IND", "DATABASE.BIN", "MEDIAPRO.XML", "AVIN0001.INP", "AVIN0001.BNP", "AVIN0001.INT"
    };
    return names.contains(fileName.toUpper());
}

bool isHiddenEntry(const QString& fileName)
{
    return fileName.startsWith('.') || fileName == QLatin1String("Trashes");
}

bool acceptDirectory(const QString& dirName, bool skipHidden)
{
    if (dirName == QLatin1String(".Trashes") || dirName == QLatin1String("Trashes")) return false;
    return !(skipHidden && dirName.startsWith('.'));
}

bool acceptFile(const QString& fileName, bool skipHidden)
{
    if (skipHidden && isHiddenEntry(fileName)) return false;
    if (isCameraHousekeepingFile(fileName)) return false;
    return isMediaFile(fileName);
}

} // namespace MediaFilter
