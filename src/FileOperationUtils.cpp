/************************************************************************\

    MediaMerge - Photo and video collection merger
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "FileOperationUtils.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>

#include "Logging.h"

#include <algorithm>

namespace FileOperationUtils {

/**
 * @brief Copies modification and birth times from a source file to a target.
 * @param sourceInfo Source file information.
 * @param targetPath Target file to update.
 * @return True if the modification time was applied, false otherwise.
 */
bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath)
{
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::ReadWrite)) {
        return false;
    }
    const bool ok = targetFile.setFileTime(sourceInfo.lastModified(), QFileDevice::FileModificationTime);
    const QDateTime birthTime = sourceInfo.birthTime();
    if (birthTime.isValid() && !targetFile.setFileTime(birthTime, QFileDevice::FileBirthTime)) {
        qCDebug(lcMerge) << "Birth time not supported for" << targetPath;
    }
    targetFile.close();
    return ok;
}

/**
 * @brief Copies one file, creating missing parent folders.
 *
 * An existing target is never overwritten. The copy keeps the source
 * modification time when the file system allows it.
 *
 * @param sourcePath File to copy.
 * @param targetPath Destination path.
 * @param error Optional output error message.
 * @return True if the file was copied, false otherwise.
 */
bool copyFilePreservingTimes(const QString &sourcePath, const QString &targetPath, QString *error)
{
    const QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.exists()) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Source not found: %1").arg(sourcePath);
        }
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Target already exists: %1").arg(targetPath);
        }
        return false;
    }
    const QString parentPath = QFileInfo(targetPath).absolutePath();
    if (!QDir().mkpath(parentPath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Cannot create target folder: %1").arg(parentPath);
        }
        return false;
    }
    QFile source(sourcePath);
    if (!source.copy(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Copy failed: %1 (%2)")
                .arg(targetPath, source.errorString());
        }
        return false;
    }
    if (!applyFileTimes(sourceInfo, targetPath)) {
        qCWarning(lcMerge) << "Cannot preserve modification time of" << targetPath;
    }
    return true;
}

/**
 * @brief Moves one file, creating missing parent folders.
 *
 * An existing target is never overwritten. When a plain rename is refused
 * (another file system), the file is copied with its times and the source
 * removed afterwards.
 *
 * @param sourcePath File to move.
 * @param targetPath Destination path.
 * @param error Optional output error message.
 * @return True if the file now lives at targetPath, false otherwise.
 */
bool moveFile(const QString &sourcePath, const QString &targetPath, QString *error)
{
    if (sourcePath == targetPath) {
        return true;
    }
    if (!QFileInfo::exists(sourcePath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Source not found: %1").arg(sourcePath);
        }
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Target already exists: %1").arg(targetPath);
        }
        return false;
    }
    const QString parentPath = QFileInfo(targetPath).absolutePath();
    if (!QDir().mkpath(parentPath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Cannot create target folder: %1").arg(parentPath);
        }
        return false;
    }

    QFile source(sourcePath);
    if (source.rename(targetPath)) {
        return true;
    }
    qCDebug(lcMerge) << "Rename refused, copying" << sourcePath << ":" << source.errorString();
    if (!copyFilePreservingTimes(sourcePath, targetPath, error)) {
        return false;
    }
    if (!QFile::remove(sourcePath)) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Moved but cannot remove source: %1")
                .arg(sourcePath);
        }
        return false;
    }
    return true;
}

/**
 * @brief Removes empty folders below a root, deepest first.
 *
 * The root itself and hidden folders are kept. A folder emptied by the
 * removal of its children is removed as well. In a dry run only folders
 * that are empty right now are listed.
 *
 * @param rootPath Root folder to clean.
 * @param dryRun True to list folders without removing them.
 * @return Removed (or removable) folders.
 */
QStringList removeEmptyFolders(const QString &rootPath, bool dryRun)
{
    QStringList folders;
    QDirIterator it(rootPath, QDir::Dirs | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        folders.append(it.next());
    }
    std::sort(folders.begin(), folders.end(), [](const QString &left, const QString &right) {
        return left.size() > right.size();
    });

    QStringList removed;
    for (const QString &folder : folders) {
        const QDir dir(folder);
        if (!dir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System)) {
            continue;
        }
        if (!dryRun && !QDir().rmdir(folder)) {
            qCWarning(lcMerge) << "Cannot remove empty folder" << folder;
            continue;
        }
        removed.append(folder);
    }
    return removed;
}

} // namespace FileOperationUtils
