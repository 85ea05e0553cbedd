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

#include "MergeEngine.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "DateResolver.h"
#include "DirectoryWalker.h"
#include "FileOperationUtils.h"
#include "FingerprintCache.h"
#include "HashDatabaseBuilder.h"
#include "Logging.h"
#include "MediaTypeUtils.h"
#include "MergeWorker.h"
#include "PlatformUtils.h"
#include "RemovalWorker.h"
#include "UniqueNameUtils.h"

namespace {

bool isReadableFolder(const QString &path)
{
    const QFileInfo info(path);
    return info.isDir() && info.isReadable();
}

bool isSidecar(const QString &path)
{
    return QFileInfo(path).suffix().compare(QLatin1String("json"), Qt::CaseInsensitive) == 0;
}

QString datedFolder(const QString &rootPath, const QDate &day)
{
    return QDir::cleanPath(QDir(rootPath).filePath(day.toString(QStringLiteral("yyyy/MM"))));
}

/**
 * @brief Tells whether a file already sits at a dated name of its own day.
 */
bool isOrganized(const QFileInfo &info, const QString &folder, const QDate &day)
{
    if (QDir::cleanPath(info.absolutePath()) != folder) {
        return false;
    }
    const UniqueNameUtils::DatedName dated = UniqueNameUtils::parseDatedName(info.fileName());
    return dated.valid && dated.date == day.toString(Qt::ISODate);
}

} // namespace

MergeEngine::MergeEngine(const MergeOptions &options, QObject *parent)
    : QObject(parent)
    , m_options(options)
{
}

const MergeOptions &MergeEngine::options() const
{
    return m_options;
}

void MergeEngine::recordDatabase(const HashDatabase &database, MergeReport &report)
{
    report.fingerprinted += database.fingerprints.size();
    report.unfingerprintable += database.unfingerprintable.size();
    report.reusedFromCache += database.reusedCount;
    report.rehashed += database.hashedCount;
    report.warnings += database.warnings;
}

/**
 * @brief Runs the filename pass, then the content pass on its survivors.
 *
 * Every file is fingerprinted first so the filename pass can tell real
 * duplicates from unrelated files sharing a name.
 *
 * @param rootPath Root folder the files belong to.
 * @param files Files of the scan in walk order.
 * @param builder Builder used to fingerprint the files.
 * @param cache Cache of the tree, or nullptr for a source tree.
 * @param report Report receiving fingerprinting counters.
 * @return Survivors, losers of both passes and the fingerprint of every file.
 */
MergeEngine::DuplicatePassOutcome MergeEngine::runDuplicatePasses(const QString &rootPath,
                                                                  const QStringList &files,
                                                                  HashDatabaseBuilder &builder,
                                                                  FingerprintCache *cache,
                                                                  MergeReport &report)
{
    DuplicatePassOutcome outcome;
    QStringList candidates = files;

    emit stageChanged(tr("Fingerprinting"));
    const HashDatabase database = builder.buildForFiles(rootPath, files, cache);
    recordDatabase(database, report);

    if (m_options.filenamePass) {
        emit stageChanged(tr("Grouping by file name"));
        const QVector<DuplicateResolver::DuplicateGroup> groups =
            DuplicateResolver::groupByFilename(files, m_options.preferredSuffix);
        const DuplicateResolver::PassResult pass = DuplicateResolver::resolveFilenameGroups(
            files, groups, database.fingerprints, m_options.preferredSuffix, &report.warnings);
        outcome.losers += pass.removed;
        outcome.groups += pass.groupCount;
        candidates = pass.survivors;
        qCInfo(lcDedup) << "File name pass:" << pass.groupCount << "groups," << pass.removed.size() << "duplicates";
    }

    const QVector<DuplicateResolver::DuplicateGroup> contentGroups =
        DuplicateResolver::groupByFingerprint(candidates, database.fingerprints);
    const DuplicateResolver::PassResult contentPass =
        DuplicateResolver::resolveGroups(candidates, contentGroups, m_options.preferredSuffix);
    qCInfo(lcDedup) << "Content pass:" << contentPass.groupCount << "groups," << contentPass.removed.size() << "duplicates";

    outcome.losers += contentPass.removed;
    outcome.groups += contentPass.groupCount;
    outcome.survivors = contentPass.survivors;
    outcome.fingerprints = database.fingerprints;
    return outcome;
}

/**
 * @brief Removes duplicate losers, or only lists them in a dry run.
 * @param losers Files marked for removal.
 * @param report Report receiving removal counters and failures.
 */
void MergeEngine::removeLosers(const QStringList &losers, MergeReport &report)
{
    if (losers.isEmpty()) {
        return;
    }
    if (m_options.dryRun) {
        report.duplicatesRemoved += losers.size();
        report.removedPaths += losers;
        return;
    }

    emit stageChanged(tr("Removing duplicates"));
    RemovalWorker worker(losers, m_options.removalMode);
    connect(&worker, &RemovalWorker::progress, this, &MergeEngine::progress);
    const RemovalResult removal = worker.run();
    report.duplicatesRemoved += removal.removed;
    report.removedPaths += removal.removedPaths;
    report.errors += removal.failed;
    report.failures += removal.errors;
}

/**
 * @brief Merges a source tree into a target tree without duplicating content.
 *
 * Stages run one after another: source fingerprinting (with the optional
 * duplicate passes), target indexing through its cache, planning, copying
 * and the final cache update. Per-file failures are counted in the report;
 * only unusable root folders make the whole run fail.
 *
 * @param sourceRoot Folder holding the new batch of files.
 * @param targetRoot Folder accumulating merged files.
 * @return Report of the run.
 */
MergeReport MergeEngine::merge(const QString &sourceRoot, const QString &targetRoot)
{
    MergeReport report;
    const QString source = PlatformUtils::normalizePath(sourceRoot);
    const QString target = PlatformUtils::normalizePath(targetRoot);

    if (!isReadableFolder(source)) {
        report.error = tr("Source folder not readable: %1").arg(sourceRoot);
        qCWarning(lcMerge) << report.error;
        return report;
    }
    if (PlatformUtils::isPathInRoot(source, target) || PlatformUtils::isPathInRoot(target, source)) {
        report.error = tr("Source and target folders overlap");
        qCWarning(lcMerge) << report.error;
        return report;
    }
    const QFileInfo targetInfo(target);
    if (targetInfo.exists() && !targetInfo.isDir()) {
        report.error = tr("Target is not a folder: %1").arg(targetRoot);
        qCWarning(lcMerge) << report.error;
        return report;
    }
    if (!targetInfo.exists() && !m_options.dryRun && !QDir().mkpath(target)) {
        report.error = tr("Cannot create target folder: %1").arg(targetRoot);
        qCWarning(lcMerge) << report.error;
        return report;
    }

    HashDatabaseBuilder builder(m_options.workers);
    builder.setCacheWritable(!m_options.dryRun);
    connect(&builder, &HashDatabaseBuilder::progress, this, &MergeEngine::progress);

    emit stageChanged(tr("Scanning source"));
    QStringList sourceFiles;
    QString error;
    if (!DirectoryWalker::collectFiles(source, HashDatabaseBuilder::excludedNames(), &sourceFiles, &error)) {
        report.error = error;
        qCWarning(lcMerge) << report.error;
        return report;
    }
    report.sourceFiles = sourceFiles.size();

    QStringList mergeFiles = sourceFiles;
    QHash<QString, QString> sourceFingerprints;
    if (m_options.resolveSourceDuplicates) {
        const DuplicatePassOutcome outcome = runDuplicatePasses(source, sourceFiles, builder, nullptr, report);
        report.duplicateGroups += outcome.groups;
        removeLosers(outcome.losers, report);
        mergeFiles = outcome.survivors;
        sourceFingerprints = outcome.fingerprints;
    } else {
        emit stageChanged(tr("Fingerprinting source"));
        const HashDatabase sourceDatabase = builder.buildForFiles(source, sourceFiles, nullptr);
        recordDatabase(sourceDatabase, report);
        sourceFingerprints = sourceDatabase.fingerprints;
    }

    emit stageChanged(tr("Indexing target"));
    FingerprintCache cache(target);
    HashDatabase targetDatabase;
    if (isReadableFolder(target)) {
        targetDatabase = builder.build(target, &cache);
        if (!targetDatabase.ok) {
            report.error = targetDatabase.error;
            qCWarning(lcMerge) << report.error;
            return report;
        }
        recordDatabase(targetDatabase, report);
    } else if (QFileInfo::exists(target)) {
        report.error = tr("Target folder not readable: %1").arg(targetRoot);
        qCWarning(lcMerge) << report.error;
        return report;
    }
    report.targetFiles = targetDatabase.files.size();

    emit stageChanged(tr("Planning"));
    MergePlanInput input;
    input.sourceRoot = source;
    input.sourceFiles = mergeFiles;
    input.sourceFingerprints = sourceFingerprints;
    input.targetRoot = target;
    input.targetIndex = targetDatabase.index;
    input.collisionCeiling = m_options.collisionCeiling;
    report.actions = MergePlanner::plan(input);

    for (const MergeAction &action : report.actions) {
        switch (action.kind) {
        case MergeAction::Kind::Skip:
            if (action.reason == MergeAction::SkipReason::Duplicate) {
                report.skippedDuplicates += 1;
            } else {
                report.skippedUnfingerprintable += 1;
            }
            break;
        case MergeAction::Kind::Failed:
            report.errors += 1;
            report.failures.append(action.error);
            break;
        case MergeAction::Kind::Copy:
            if (m_options.dryRun) {
                report.copied += 1;
            }
            break;
        case MergeAction::Kind::CopyRenamed:
            if (m_options.dryRun) {
                report.renamed += 1;
            }
            break;
        }
    }

    if (m_options.dryRun) {
        report.ok = true;
        qCInfo(lcMerge) << "Dry run:" << report.copied << "copies," << report.renamed << "renamed copies planned";
        return report;
    }

    emit stageChanged(tr("Copying"));
    MergeWorker worker(report.actions);
    connect(&worker, &MergeWorker::progress, this, &MergeEngine::progress);
    const MergeApplyResult applied = worker.run();
    report.copied = applied.copied;
    report.renamed = applied.renamed;
    report.errors += applied.failed;
    report.failures += applied.errors;

    emit stageChanged(tr("Updating cache"));
    QString cacheError;
    report.cacheSaved = cache.mergeAndPersist(applied.copiedEntries,
                                              targetDatabase.files + applied.copiedPaths,
                                              &cacheError);
    if (!report.cacheSaved) {
        qCWarning(lcCache) << cacheError;
        report.warnings.append(cacheError);
    }

    report.ok = true;
    qCInfo(lcMerge) << "Merged" << source << "into" << target << ":" << report.copied << "copied,"
                    << report.renamed << "renamed," << report.skippedDuplicates << "duplicates skipped,"
                    << report.errors << "errors";
    return report;
}

/**
 * @brief Removes duplicates inside one tree.
 *
 * The filename pass runs first, then survivors are fingerprinted through
 * the tree's cache and grouped by content. Losers of both passes are removed
 * and the cache forgets them.
 *
 * @param rootPath Tree to clean up.
 * @return Report of the run.
 */
MergeReport MergeEngine::deduplicate(const QString &rootPath)
{
    MergeReport report;
    const QString root = PlatformUtils::normalizePath(rootPath);
    if (!isReadableFolder(root)) {
        report.error = tr("Folder not readable: %1").arg(rootPath);
        qCWarning(lcDedup) << report.error;
        return report;
    }

    HashDatabaseBuilder builder(m_options.workers);
    builder.setCacheWritable(!m_options.dryRun);
    connect(&builder, &HashDatabaseBuilder::progress, this, &MergeEngine::progress);

    emit stageChanged(tr("Scanning"));
    QStringList files;
    QString error;
    if (!DirectoryWalker::collectFiles(root, HashDatabaseBuilder::excludedNames(), &files, &error)) {
        report.error = error;
        qCWarning(lcDedup) << report.error;
        return report;
    }
    report.targetFiles = files.size();

    FingerprintCache cache(root);
    const DuplicatePassOutcome outcome = runDuplicatePasses(root, files, builder, &cache, report);
    report.duplicateGroups = outcome.groups;
    removeLosers(outcome.losers, report);

    if (!m_options.dryRun) {
        const QSet<QString> removed(report.removedPaths.begin(), report.removedPaths.end());
        QStringList remaining;
        remaining.reserve(files.size());
        for (const QString &path : files) {
            if (!removed.contains(path)) {
                remaining.append(path);
            }
        }
        QString cacheError;
        report.cacheSaved = cache.mergeAndPersist({}, remaining, &cacheError);
        if (!report.cacheSaved) {
            qCWarning(lcCache) << cacheError;
            report.warnings.append(cacheError);
        }
    }

    report.ok = true;
    qCInfo(lcDedup) << "Deduplicated" << root << ":" << report.duplicatesRemoved << "removed in"
                    << report.duplicateGroups << "groups," << report.errors << "errors";
    return report;
}

/**
 * @brief Removes metadata sidecars, or only lists them in a dry run.
 * @param sidecars JSON files found in the tree.
 * @param report Report receiving removal counters and failures.
 */
void MergeEngine::removeSidecars(const QStringList &sidecars, MergeReport &report)
{
    if (sidecars.isEmpty()) {
        return;
    }
    if (m_options.dryRun) {
        report.sidecarsRemoved += sidecars.size();
        report.removedPaths += sidecars;
        return;
    }

    emit stageChanged(tr("Removing sidecars"));
    RemovalWorker worker(sidecars, m_options.removalMode);
    connect(&worker, &RemovalWorker::progress, this, &MergeEngine::progress);
    const RemovalResult removal = worker.run();
    report.sidecarsRemoved += removal.removed;
    report.removedPaths += removal.removedPaths;
    report.errors += removal.failed;
    report.failures += removal.errors;
}

/**
 * @brief Moves cache entries of relocated files to their new names.
 *
 * A tree without a usable snapshot is left alone; the next indexing run
 * builds one.
 *
 * @param rootPath Organized tree.
 * @param files Files of the scan, before relocation.
 * @param report Report holding relocations and removed paths.
 */
void MergeEngine::relocateCacheEntries(const QString &rootPath, const QStringList &files, MergeReport &report)
{
    FingerprintCache cache(rootPath);
    if (!cache.load()) {
        return;
    }

    const QDir root(rootPath);
    QSet<QString> gone(report.removedPaths.begin(), report.removedPaths.end());
    CacheEntries moved;
    for (const RelocatedFile &relocation : report.relocations) {
        gone.insert(relocation.sourcePath);
        const auto it = cache.entries().constFind(QDir::cleanPath(root.relativeFilePath(relocation.sourcePath)));
        if (it != cache.entries().constEnd()) {
            moved.insert(relocation.targetPath, *it);
        }
    }

    QStringList current;
    current.reserve(files.size());
    for (const QString &path : files) {
        if (!gone.contains(path)) {
            current.append(path);
        }
    }
    for (const RelocatedFile &relocation : report.relocations) {
        current.append(relocation.targetPath);
    }

    QString cacheError;
    report.cacheSaved = cache.mergeAndPersist(moved, current, &cacheError);
    if (!report.cacheSaved) {
        qCWarning(lcCache) << cacheError;
        report.warnings.append(cacheError);
    }
}

/**
 * @brief Files every media file of a tree under YYYY/MM/YYYY-MM-DD_NNN.ext.
 *
 * The date comes from the date resolver: EXIF capture date for photos,
 * filename date for videos and GIF files, modification time otherwise.
 * Counters start at _001 in each folder. Files already at a dated name of
 * their own day stay in place. JSON sidecars are removed, then folders left
 * empty. Unrecognized files are not touched.
 *
 * @param rootPath Tree to organize.
 * @return Report of the run.
 */
MergeReport MergeEngine::organize(const QString &rootPath)
{
    MergeReport report;
    const QString root = PlatformUtils::normalizePath(rootPath);
    if (!isReadableFolder(root)) {
        report.error = tr("Folder not readable: %1").arg(rootPath);
        qCWarning(lcOrganize) << report.error;
        return report;
    }

    emit stageChanged(tr("Scanning"));
    QStringList files;
    QString error;
    if (!DirectoryWalker::collectFiles(root, HashDatabaseBuilder::excludedNames(), &files, &error)) {
        report.error = error;
        qCWarning(lcOrganize) << report.error;
        return report;
    }
    report.targetFiles = files.size();

    emit stageChanged(tr("Organizing"));
    QStringList sidecars;
    QSet<QString> claimed;
    const UniqueNameUtils::PathTaken isTaken = [&claimed](const QString &path) {
        return claimed.contains(path) || QFileInfo::exists(path);
    };

    int completed = 0;
    for (const QString &path : files) {
        emit progress(++completed, files.size());
        if (isSidecar(path)) {
            sidecars.append(path);
            continue;
        }
        const QFileInfo info(path);
        if (MediaTypeUtils::classify(info) == MediaKind::Unrecognized) {
            continue;
        }

        const std::optional<QDateTime> created = DateResolver::resolve(path);
        if (!created) {
            report.errors += 1;
            report.failures.append(tr("Cannot date %1").arg(path));
            continue;
        }
        const QDate day = created->date();
        const QString folder = datedFolder(root, day);
        if (isOrganized(info, folder, day)) {
            report.alreadyOrganized += 1;
            continue;
        }

        const QString extension = info.suffix().isEmpty() ? QString() : QLatin1Char('.') + info.suffix();
        const UniqueNameUtils::UniqueNameResult name =
            UniqueNameUtils::firstFreeDatedName(folder, day, extension, isTaken, m_options.collisionCeiling);
        if (!name.ok) {
            report.errors += 1;
            report.failures.append(name.error);
            qCWarning(lcOrganize) << name.error;
            continue;
        }
        claimed.insert(name.path);

        if (!m_options.dryRun) {
            QString moveError;
            if (!FileOperationUtils::moveFile(path, name.path, &moveError)) {
                report.errors += 1;
                report.failures.append(moveError);
                qCWarning(lcOrganize) << moveError;
                continue;
            }
        }
        qCDebug(lcOrganize) << "Moved" << path << "to" << name.path;
        RelocatedFile relocation;
        relocation.sourcePath = path;
        relocation.targetPath = name.path;
        report.relocations.append(relocation);
        report.organized += 1;
    }

    removeSidecars(sidecars, report);

    const QStringList emptied = FileOperationUtils::removeEmptyFolders(root, m_options.dryRun);
    report.emptyFoldersRemoved = emptied.size();

    if (!m_options.dryRun) {
        relocateCacheEntries(root, files, report);
    }

    report.ok = true;
    qCInfo(lcOrganize) << "Organized" << root << ":" << report.organized << "moved,"
                       << report.alreadyOrganized << "in place," << report.sidecarsRemoved << "sidecars removed,"
                       << report.emptyFoldersRemoved << "empty folders removed," << report.errors << "errors";
    return report;
}

/**
 * @brief Deletes the fingerprint cache of a target, forcing a full rebuild.
 * @param targetRoot Target folder.
 * @param error Optional output error message.
 * @return True if no cache remains, false otherwise.
 */
bool MergeEngine::clearCache(const QString &targetRoot, QString *error)
{
    return FingerprintCache::invalidate(PlatformUtils::normalizePath(targetRoot), error);
}
