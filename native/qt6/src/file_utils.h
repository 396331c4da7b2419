#pragma once

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

/**
 * FileUtils - small path helpers shared by the copy and manifest code.
 *
 * Existence checks go through QFileInfo everywhere so that symlinks and
 * missing paths are treated the same way in every module.
 */
namespace FileUtils {

// True for an existing regular file
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

// True for an existing directory
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

// Creates dirPath and any missing parents. False if it cannot exist as a directory.
inline bool ensureDir(const QString& dirPath)
{
    if (dirExists(dirPath)) return true;
    if (QFileInfo::exists(dirPath)) return false;
    return QDir().mkpath(dirPath);
}

// First free "name (n).ext" in dir, starting with baseName itself
inline QString uniqueNameInDir(const QString& dir, const QString& baseName)
{
    QString path = QDir(dir).filePath(baseName);
    const QString stem = QFileInfo(baseName).completeBaseName();
    const QString ext = QFileInfo(baseName).suffix();
    int i = 2;
    while (QFileInfo::exists(path)) {
        const QString name = ext.isEmpty() ? QString("%1 (%2)").arg(stem).arg(i++)
                                           : QString("%1 (%2).%3").arg(stem).arg(i++).arg(ext);
        path = QDir(dir).filePath(name);
    }
    return path;
}

} // namespace FileUtils
