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

#include "DuplicateResolver.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QSet>

#include "FingerprintCache.h"
#include "Logging.h"

namespace {

/**
 * @brief Orders members oldest first, path breaking ties.
 */
bool isOlder(const DuplicateResolver::DuplicateMember &left, const DuplicateResolver::DuplicateMember &right)
{
    if (left.modTimeMillis != right.modTimeMillis) {
        return left.modTimeMillis < right.modTimeMillis;
    }
    return left.path < right.path;
}

QVector<DuplicateResolver::DuplicateGroup> collectGroups(const QStringList &keyOrder,
                                                        const QHash<QString, QVector<DuplicateResolver::DuplicateMember>> &byKey)
{
    QVector<DuplicateResolver::DuplicateGroup> groups;
    for (const QString &key : keyOrder) {
        const QVector<DuplicateResolver::DuplicateMember> members = byKey.value(key);
        if (members.size() < 2) {
            continue;
        }
        DuplicateResolver::DuplicateGroup group;
        group.key = key;
        group.members = members;
        groups.append(group);
    }
    return groups;
}

QStringList survivorsOf(const QStringList &paths, const QSet<QString> &removed)
{
    QStringList survivors;
    survivors.reserve(paths.size() - removed.size());
    for (const QString &path : paths) {
        if (!removed.contains(path)) {
            survivors.append(path);
        }
    }
    return survivors;
}

} // namespace

namespace DuplicateResolver {

DuplicateMember memberFor(const QString &path)
{
    DuplicateMember member;
    member.path = path;
    member.modTimeMillis = FingerprintCache::modTimeMillis(QFileInfo(path));
    return member;
}

bool hasPreferredSuffix(const QString &path, const QString &preferredSuffix)
{
    if (preferredSuffix.isEmpty()) {
        return false;
    }
    return QFileInfo(path).completeBaseName().endsWith(preferredSuffix);
}

/**
 * @brief Builds the filename grouping key of a file.
 *
 * The key is the base name with the preferred suffix removed, followed by
 * the lowercase extension, so "IMG_1.jpg" and "IMG_1-edited.JPG" share a key
 * while "IMG_1.mp4" does not.
 *
 * @param path File path.
 * @param preferredSuffix Edit marker stripped from the base name.
 * @return Grouping key.
 */
QString filenameKey(const QString &path, const QString &preferredSuffix)
{
    const QFileInfo info(path);
    QString baseName = info.completeBaseName();
    if (!preferredSuffix.isEmpty() && baseName.endsWith(preferredSuffix)) {
        baseName.chop(preferredSuffix.size());
    }
    const QString suffix = info.suffix().toLower();
    return suffix.isEmpty() ? baseName : baseName + QLatin1Char('.') + suffix;
}

/**
 * @brief Picks the single survivor of a duplicate group.
 *
 * When some members carry the preferred suffix, the oldest of those wins.
 * Otherwise the oldest member overall wins.
 *
 * @param group Members sharing one grouping key.
 * @param preferredSuffix Edit marker, or an empty string to disable it.
 * @return Survivor and the members to remove.
 */
Resolution resolve(const QVector<DuplicateMember> &group, const QString &preferredSuffix)
{
    Resolution resolution;
    if (group.isEmpty()) {
        return resolution;
    }

    const DuplicateMember *keep = nullptr;
    for (const DuplicateMember &member : group) {
        if (!hasPreferredSuffix(member.path, preferredSuffix)) {
            continue;
        }
        if (!keep || isOlder(member, *keep)) {
            keep = &member;
        }
    }
    if (!keep) {
        for (const DuplicateMember &member : group) {
            if (!keep || isOlder(member, *keep)) {
                keep = &member;
            }
        }
    }

    resolution.keep = keep->path;
    for (const DuplicateMember &member : group) {
        if (&member != keep) {
            resolution.remove.append(member.path);
        }
    }
    return resolution;
}

QVector<DuplicateGroup> groupByFilename(const QStringList &paths, const QString &preferredSuffix)
{
    QStringList keyOrder;
    QHash<QString, QVector<DuplicateMember>> byKey;
    for (const QString &path : paths) {
        const QString key = filenameKey(path, preferredSuffix);
        auto it = byKey.find(key);
        if (it == byKey.end()) {
            keyOrder.append(key);
            it = byKey.insert(key, {});
        }
        it->append(memberFor(path));
    }
    return collectGroups(keyOrder, byKey);
}

/**
 * @brief Groups files sharing a content fingerprint.
 * @param paths Files to group; files without fingerprint are ignored.
 * @param fingerprints Fingerprint of each file keyed by path.
 * @return Groups of two or more members, in order of first appearance.
 */
QVector<DuplicateGroup> groupByFingerprint(const QStringList &paths, const QHash<QString, QString> &fingerprints)
{
    QStringList keyOrder;
    QHash<QString, QVector<DuplicateMember>> byKey;
    for (const QString &path : paths) {
        const QString fingerprint = fingerprints.value(path);
        if (fingerprint.isEmpty()) {
            continue;
        }
        auto it = byKey.find(fingerprint);
        if (it == byKey.end()) {
            keyOrder.append(fingerprint);
            it = byKey.insert(fingerprint, {});
        }
        it->append(memberFor(path));
    }
    return collectGroups(keyOrder, byKey);
}

/**
 * @brief Resolves every group and splits the files into survivors and losers.
 * @param paths All files of the scan, in scan order.
 * @param groups Duplicate groups built from those files.
 * @param preferredSuffix Edit marker used by the tie-break.
 * @return Surviving files in scan order and files marked for removal.
 */
PassResult resolveGroups(const QStringList &paths,
                         const QVector<DuplicateGroup> &groups,
                         const QString &preferredSuffix)
{
    PassResult result;
    result.groupCount = groups.size();

    QSet<QString> removed;
    for (const DuplicateGroup &group : groups) {
        const Resolution resolution = resolve(group.members, preferredSuffix);
        qCDebug(lcDedup) << "Keeping" << resolution.keep << "over" << resolution.remove.size() << "duplicates";
        for (const QString &path : resolution.remove) {
            removed.insert(path);
            result.removed.append(path);
        }
    }

    result.survivors = survivorsOf(paths, removed);
    return result;
}

/**
 * @brief Resolves filename groups, removing only confirmed duplicates.
 *
 * Equal names alone do not prove equal content: two cameras both write
 * "IMG_0001.jpg". A loser is removed when the survivor carries the preferred
 * suffix (an edit replacing its original) or when both files share a
 * fingerprint. Other losers are kept and reported in warnings. Only groups
 * that removed a file are counted.
 *
 * @param paths All files of the scan, in scan order.
 * @param groups Groups built by groupByFilename.
 * @param fingerprints Fingerprint of each file keyed by path.
 * @param preferredSuffix Edit marker used by the tie-break.
 * @param warnings Optional output list of kept files.
 * @return Surviving files in scan order and files marked for removal.
 */
PassResult resolveFilenameGroups(const QStringList &paths,
                                 const QVector<DuplicateGroup> &groups,
                                 const QHash<QString, QString> &fingerprints,
                                 const QString &preferredSuffix,
                                 QStringList *warnings)
{
    PassResult result;

    QSet<QString> removed;
    for (const DuplicateGroup &group : groups) {
        const Resolution resolution = resolve(group.members, preferredSuffix);
        const bool editedSurvivor = hasPreferredSuffix(resolution.keep, preferredSuffix);
        const QString keptFingerprint = fingerprints.value(resolution.keep);

        int groupRemovals = 0;
        for (const QString &path : resolution.remove) {
            const QString fingerprint = fingerprints.value(path);
            const bool sameContent = !fingerprint.isEmpty() && fingerprint == keptFingerprint;
            if (!editedSurvivor && !sameContent) {
                const QString message =
                    QCoreApplication::translate("DuplicateResolver", "Same name as %1 but different content, kept: %2")
                        .arg(resolution.keep, path);
                qCWarning(lcDedup) << message;
                if (warnings) {
                    warnings->append(message);
                }
                continue;
            }
            removed.insert(path);
            result.removed.append(path);
            ++groupRemovals;
        }
        if (groupRemovals > 0) {
            result.groupCount += 1;
        }
    }

    result.survivors = survivorsOf(paths, removed);
    return result;
}

} // namespace DuplicateResolver
