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

#include "MergePlanner.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "Logging.h"

namespace MergePlanner {

/**
 * @brief Maps a source file to the same relative location under the target.
 * @param sourceRoot Root folder of the source tree.
 * @param sourcePath Absolute path of the source file.
 * @param targetRoot Root folder of the target tree.
 * @return Absolute intended target path.
 */
QString mirroredTargetPath(const QString &sourceRoot, const QString &sourcePath, const QString &targetRoot)
{
    const QString relative = QDir(sourceRoot).relativeFilePath(sourcePath);
    return QDir::cleanPath(QDir(targetRoot).filePath(relative));
}

QVector<MergeAction> plan(const MergePlanInput &input)
{
    return plan(input, [](const QString &path) {
        return QFileInfo::exists(path);
    });
}

/**
 * @brief Decides what to do with every source file of a merge.
 *
 * Files are considered in the given order. A fingerprint already present in
 * the target, or claimed by an earlier copy of this plan, is skipped. Paths
 * claimed by earlier copies count as taken when resolving name collisions.
 * Nothing is written to disk.
 *
 * @param input Source files with fingerprints and the target index.
 * @param existsOnDisk Predicate telling whether a target path exists.
 * @return One action per source file, in source order.
 */
QVector<MergeAction> plan(const MergePlanInput &input, const UniqueNameUtils::PathTaken &existsOnDisk)
{
    QVector<MergeAction> actions;
    actions.reserve(input.sourceFiles.size());

    QSet<QString> presentFingerprints;
    presentFingerprints.reserve(input.targetIndex.size() + input.sourceFiles.size());
    for (auto it = input.targetIndex.constBegin(); it != input.targetIndex.constEnd(); ++it) {
        presentFingerprints.insert(it.key());
    }
    QSet<QString> claimedPaths;

    const auto isTaken = [&claimedPaths, &existsOnDisk](const QString &path) {
        return claimedPaths.contains(path) || existsOnDisk(path);
    };

    for (const QString &sourcePath : input.sourceFiles) {
        MergeAction action;
        action.sourcePath = sourcePath;

        const auto fingerprintIt = input.sourceFingerprints.constFind(sourcePath);
        if (fingerprintIt == input.sourceFingerprints.constEnd() || fingerprintIt->isEmpty()) {
            action.kind = MergeAction::Kind::Skip;
            action.reason = MergeAction::SkipReason::Unfingerprintable;
            actions.append(action);
            continue;
        }
        action.fingerprint = *fingerprintIt;

        if (presentFingerprints.contains(action.fingerprint)) {
            action.kind = MergeAction::Kind::Skip;
            action.reason = MergeAction::SkipReason::Duplicate;
            qCDebug(lcMerge) << "Duplicate:" << sourcePath;
            actions.append(action);
            continue;
        }

        action.targetPath = mirroredTargetPath(input.sourceRoot, sourcePath, input.targetRoot);
        if (!isTaken(action.targetPath)) {
            action.kind = MergeAction::Kind::Copy;
        } else {
            const UniqueNameUtils::UniqueNameResult unique =
                UniqueNameUtils::resolve(action.targetPath, isTaken, input.collisionCeiling);
            if (!unique.ok) {
                action.kind = MergeAction::Kind::Failed;
                action.error = unique.error;
                qCWarning(lcMerge) << unique.error;
                actions.append(action);
                continue;
            }
            action.kind = MergeAction::Kind::CopyRenamed;
            action.finalPath = unique.path;
            qCDebug(lcMerge) << "Name collision:" << action.targetPath << "->" << action.finalPath;
        }

        presentFingerprints.insert(action.fingerprint);
        claimedPaths.insert(action.destinationPath());
        actions.append(action);
    }
    return actions;
}

} // namespace MergePlanner
