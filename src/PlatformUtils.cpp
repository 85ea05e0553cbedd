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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace PlatformUtils {

namespace {

bool removeFileInternal(const QString &path, bool allowTrash, const QString &failureMessage, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is empty");
        }
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    if (info.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Not a file: %1").arg(path);
        }
        return false;
    }
    if (allowTrash && QFile::moveToTrash(path)) {
        return true;
    }
    const bool ok = QFile::remove(path);
    if (!ok && error) {
        *error = failureMessage.arg(path);
    }
    return ok;
}

} // namespace

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward separators.
 */
QString normalizePath(const QString &path)
{
    QString normalized = QDir::fromNativeSeparators(path.trimmed());
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Checks whether a path is inside the given root path.
 * @param rootPath Root folder path.
 * @param path Path to test.
 * @return True when the path is the root or below it, false otherwise.
 */
bool isPathInRoot(const QString &rootPath, const QString &path)
{
    if (rootPath.isEmpty() || path.isEmpty()) {
        return false;
    }
    const QString relative = QDir(normalizePath(rootPath)).relativeFilePath(normalizePath(path));
    return relative != QLatin1String("..") && !relative.startsWith(QLatin1String("../"));
}

/**
 * @brief Moves a file to trash when supported, otherwise deletes it.
 * @param path File path to remove.
 * @param error Optional output error message.
 * @return True if removal succeeds, false otherwise.
 */
bool moveToTrashOrDelete(const QString &path, QString *error)
{
    const QString failureMessage = QCoreApplication::translate("PlatformUtils", "Failed to move to trash: %1");
    return removeFileInternal(path, true, failureMessage, error);
}

bool deletePermanently(const QString &path, QString *error)
{
    const QString failureMessage = QCoreApplication::translate("PlatformUtils", "Failed to delete: %1");
    return removeFileInternal(path, false, failureMessage, error);
}

bool removeFile(const QString &path, RemovalMode mode, QString *error)
{
    switch (mode) {
    case RemovalMode::MoveToTrash:
        return moveToTrashOrDelete(path, error);
    case RemovalMode::DeletePermanently:
        break;
    }
    return deletePermanently(path, error);
}

} // namespace PlatformUtils
