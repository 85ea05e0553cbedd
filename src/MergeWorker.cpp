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

#include "MergeWorker.h"

#include <QFileInfo>

#include "FileOperationUtils.h"
#include "Logging.h"

/**
 * @brief Creates a worker applying the copy actions of a merge plan.
 * @param actions Planned actions; only copies are applied.
 * @param parent Parent QObject for ownership.
 */
MergeWorker::MergeWorker(const QVector<MergeAction> &actions, QObject *parent)
    : QObject(parent)
    , m_actions(actions)
{
}

void MergeWorker::tick(int &completed, int total)
{
    completed += 1;
    emit progress(completed, total);
}

/**
 * @brief Copies one planned file to its destination.
 * @param action Copy or renamed-copy action.
 * @param result Result to update with the copy or the failure.
 */
void MergeWorker::applyAction(const MergeAction &action, MergeApplyResult &result)
{
    const QString destination = action.destinationPath();
    QString error;
    if (!FileOperationUtils::copyFilePreservingTimes(action.sourcePath, destination, &error)) {
        result.failed += 1;
        result.errors.append(error);
        qCWarning(lcMerge) << "Copy failed:" << error;
        return;
    }

    CacheEntry entry;
    entry.fingerprint = action.fingerprint;
    entry.modTimeMillis = FingerprintCache::modTimeMillis(QFileInfo(destination));
    result.copiedEntries.insert(destination, entry);
    result.copiedPaths.append(destination);
    if (action.kind == MergeAction::Kind::CopyRenamed) {
        result.renamed += 1;
    } else {
        result.copied += 1;
    }
    qCDebug(lcMerge) << "Copied" << action.sourcePath << "->" << destination;
}

/**
 * @brief Applies every copy action in plan order.
 *
 * Actions run one after another so that no two copies race for the same
 * destination. A failing copy is counted and the remaining actions still run.
 *
 * @return Copy counters, failures and cache entries of the new files.
 */
MergeApplyResult MergeWorker::run()
{
    MergeApplyResult result;

    int total = 0;
    for (const MergeAction &action : m_actions) {
        if (action.isCopy()) {
            total += 1;
        }
    }

    int completed = 0;
    emit progress(completed, total);
    for (const MergeAction &action : m_actions) {
        if (!action.isCopy()) {
            continue;
        }
        applyAction(action, result);
        tick(completed, total);
    }
    return result;
}
