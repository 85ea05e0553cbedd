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

#include "DirectoryWalker.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#include "Logging.h"

/**
 * @brief Creates a walker over the regular files below a root folder.
 * @param rootPath Root folder to enumerate.
 * @param excludedNames File names that are never yielded.
 */
DirectoryWalker::DirectoryWalker(const QString &rootPath, const QStringList &excludedNames)
    : m_rootPath(QDir::cleanPath(QDir(rootPath).absolutePath()))
    , m_excludedNames(excludedNames.begin(), excludedNames.end())
{
    reset();
}

bool DirectoryWalker::isValid() const
{
    const QFileInfo info(m_rootPath);
    return info.isDir() && info.isReadable();
}

QString DirectoryWalker::rootPath() const
{
    return m_rootPath;
}

/**
 * @brief Restarts the enumeration from the root folder.
 */
void DirectoryWalker::reset()
{
    m_directoryStack.clear();
    m_pendingFiles.clear();
    if (isValid()) {
        m_directoryStack.append(m_rootPath);
    }
}

/**
 * @brief Lists folders from the stack until some files are pending.
 *
 * Files of a folder are yielded before its subfolders, and subfolders are
 * visited in name order. The explicit stack keeps the call depth flat on
 * deeply nested trees.
 *
 * @return True when at least one file is pending, false when the walk is over.
 */
bool DirectoryWalker::fillPending()
{
    while (m_pendingFiles.isEmpty() && !m_directoryStack.isEmpty()) {
        const QString dirPath = m_directoryStack.takeLast();
        const QDir dir(dirPath);

        const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::NoSymLinks, QDir::Name);
        for (const QFileInfo &file : files) {
            if (m_excludedNames.contains(file.fileName())) {
                continue;
            }
            m_pendingFiles.append(file.absoluteFilePath());
        }

        const QFileInfoList subdirs = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                                                        QDir::Name | QDir::Reversed);
        for (const QFileInfo &subdir : subdirs) {
            m_directoryStack.append(subdir.absoluteFilePath());
        }
    }
    return !m_pendingFiles.isEmpty();
}

bool DirectoryWalker::hasNext()
{
    return fillPending();
}

/**
 * @brief Returns the next regular file path.
 * @return Absolute file path, or an empty string when the walk is over.
 */
QString DirectoryWalker::next()
{
    if (!fillPending()) {
        return QString();
    }
    return m_pendingFiles.takeFirst();
}

/**
 * @brief Collects every regular file below a root folder.
 * @param rootPath Root folder to enumerate.
 * @param excludedNames File names that are never returned.
 * @param files Output list of absolute file paths in walk order.
 * @param error Optional output error message.
 * @return True if the root folder could be read, false otherwise.
 */
bool DirectoryWalker::collectFiles(const QString &rootPath,
                                   const QStringList &excludedNames,
                                   QStringList *files,
                                   QString *error)
{
    DirectoryWalker walker(rootPath, excludedNames);
    if (!walker.isValid()) {
        if (error) {
            *error = QCoreApplication::translate("DirectoryWalker", "Folder not readable: %1").arg(rootPath);
        }
        return false;
    }
    if (!files) {
        return true;
    }
    files->clear();
    while (walker.hasNext()) {
        files->append(walker.next());
    }
    qCDebug(lcScan) << "Found" << files->size() << "files in" << walker.rootPath();
    return true;
}
