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

#include "HashDatabaseBuilder.h"

#include <QDir>
#include <QFileInfo>
#include <QFuture>
#include <QThread>
#include <QtConcurrent>

#include "DirectoryWalker.h"
#include "FingerprintCache.h"
#include "Logging.h"
#include "MediaFingerprint.h"

#include <utility>

namespace {

struct HashJob {
    FingerprintResult result;
    qint64 modTimeMillis = 0;
};

/**
 * @brief Fingerprints one file on a worker thread.
 *
 * The modification time is sampled before reading so that a file changed
 * while being hashed shows up as stale on the next run.
 */
HashJob runHashJob(const QString &path)
{
    HashJob job;
    job.modTimeMillis = FingerprintCache::modTimeMillis(QFileInfo(path));
    job.result = MediaFingerprint::compute(path);
    return job;
}

} // namespace

/**
 * @brief Creates a builder hashing files on a bounded worker pool.
 * @param maxWorkers Maximum number of hashing threads, or 0 for the ideal count.
 * @param parent Parent QObject for ownership.
 */
HashDatabaseBuilder::HashDatabaseBuilder(int maxWorkers, QObject *parent)
    : QObject(parent)
{
    m_pool.setMaxThreadCount(maxWorkers > 0 ? maxWorkers : QThread::idealThreadCount());
}

/**
 * @brief Controls whether build results are merged back into the cache.
 * @param writable False to only read the cache, as in a dry run.
 */
void HashDatabaseBuilder::setCacheWritable(bool writable)
{
    m_cacheWritable = writable;
}

bool HashDatabaseBuilder::isCacheWritable() const
{
    return m_cacheWritable;
}

QStringList HashDatabaseBuilder::excludedNames()
{
    return {QString::fromLatin1(FingerprintCache::snapshotFileName)};
}

/**
 * @brief Walks a tree and builds its fingerprint index.
 * @param rootPath Root folder of the tree.
 * @param cache Cache of the tree for a target, or nullptr for a source tree.
 * @return Fingerprints of the tree; ok is false only when the root is unreadable.
 */
HashDatabase HashDatabaseBuilder::build(const QString &rootPath, FingerprintCache *cache)
{
    QStringList files;
    QString error;
    if (!DirectoryWalker::collectFiles(rootPath, excludedNames(), &files, &error)) {
        HashDatabase database;
        database.rootPath = rootPath;
        database.error = error;
        return database;
    }
    return buildForFiles(rootPath, files, cache);
}

/**
 * @brief Builds the fingerprint index of an explicit list of files.
 *
 * With a cache, only files whose entry is stale are hashed and the fresh
 * results are merged back into the cache. Hashing runs in parallel while
 * this thread is the only writer of the resulting index.
 *
 * @param rootPath Root folder the files belong to.
 * @param files Absolute file paths in walk order.
 * @param cache Cache of the tree, or nullptr to hash every file.
 * @return Fingerprints of the files.
 */
HashDatabase HashDatabaseBuilder::buildForFiles(const QString &rootPath, const QStringList &files, FingerprintCache *cache)
{
    HashDatabase database;
    database.rootPath = QDir::cleanPath(QDir(rootPath).absolutePath());
    database.files = files;

    const int total = files.size();
    QStringList toHash;
    CacheEntries reused;
    if (cache) {
        if (!cache->isLoaded()) {
            cache->load();
        }
        CacheReconcileResult reconciled = cache->reconcile(files);
        reused = std::move(reconciled.valid);
        toHash = std::move(reconciled.stale);
    } else {
        toHash = files;
    }
    database.reusedCount = reused.size();
    emit progress(database.reusedCount, total);

    QHash<QString, HashJob> hashed;
    hashed.reserve(toHash.size());
    if (!toHash.isEmpty()) {
        QFuture<HashJob> future = QtConcurrent::mapped(&m_pool, toHash, runHashJob);
        for (int i = 0; i < toHash.size(); ++i) {
            hashed.insert(toHash.at(i), future.resultAt(i));
            emit progress(database.reusedCount + i + 1, total);
        }
        future.waitForFinished();
    }
    database.hashedCount = toHash.size();

    CacheEntries freshEntries;
    database.fingerprints.reserve(total);
    for (const QString &path : files) {
        QString fingerprint;
        const auto reusedIt = reused.constFind(path);
        if (reusedIt != reused.constEnd()) {
            fingerprint = reusedIt->fingerprint;
        } else {
            const HashJob job = hashed.value(path);
            if (!job.result.isValid()) {
                const QString warning = QStringLiteral("%1: %2").arg(path, job.result.reason);
                qCWarning(lcScan) << "Not fingerprinted" << MediaTypeUtils::kindName(job.result.kind) << ":" << warning;
                database.unfingerprintable.append(path);
                database.warnings.append(warning);
                continue;
            }
            fingerprint = job.result.fingerprint;
            CacheEntry entry;
            entry.fingerprint = fingerprint;
            entry.modTimeMillis = job.modTimeMillis;
            freshEntries.insert(path, entry);
        }

        database.fingerprints.insert(path, fingerprint);
        if (!database.index.contains(fingerprint)) {
            database.index.insert(fingerprint, path);
        }
    }

    if (cache && m_cacheWritable) {
        QString cacheError;
        if (!cache->mergeAndPersist(freshEntries, files, &cacheError)) {
            qCWarning(lcCache) << cacheError;
            database.warnings.append(cacheError);
        }
    }

    qCInfo(lcScan) << "Indexed" << database.rootPath << ":" << total << "files,"
                   << database.reusedCount << "from cache," << database.hashedCount << "hashed,"
                   << database.unfingerprintable.size() << "unfingerprintable";
    database.ok = true;
    return database;
}
