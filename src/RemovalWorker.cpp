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

#include "RemovalWorker.h"

#include <QCoreApplication>
#include <QFileInfo>

#include "Logging.h"

namespace {
struct RemovalWorkerConstants {
    static constexpr int emptyCount = 0;
    static constexpr int singleStep = 1;
};
} // namespace

RemovalWorker::RemovalWorker(const QStringList &paths, PlatformUtils::RemovalMode mode, QObject *parent)
    : QObject(parent)
    , m_paths(paths)
    , m_mode(mode)
{
}

void RemovalWorker::tick(int &completed, int total)
{
    completed += RemovalWorkerConstants::singleStep;
    emit progress(completed, total);
}

/**
 * @brief Removes every duplicate loser, continuing past failures.
 * @return Removal counters and per-file errors.
 */
RemovalResult RemovalWorker::run()
{
    RemovalResult result;
    const int total = m_paths.size();
    int completed = RemovalWorkerConstants::emptyCount;
    emit progress(completed, total);

    for (const QString &path : m_paths) {
        if (!QFileInfo::exists(path)) {
            result.failed += RemovalWorkerConstants::singleStep;
            result.errors.append(QCoreApplication::translate("RemovalWorker", "Source not found: %1").arg(path));
            tick(completed, total);
            continue;
        }

        QString error;
        if (!PlatformUtils::removeFile(path, m_mode, &error)) {
            result.failed += RemovalWorkerConstants::singleStep;
            result.errors.append(error);
            qCWarning(lcDedup) << "Cannot remove duplicate:" << error;
            tick(completed, total);
            continue;
        }

        result.removedPaths.append(path);
        result.removed += RemovalWorkerConstants::singleStep;
        qCDebug(lcDedup) << "Removed duplicate" << path;
        tick(completed, total);
    }
    return result;
}
