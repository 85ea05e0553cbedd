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

#include "FingerprintCache.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QSet>

#include <algorithm>

#include "Logging.h"

namespace {
constexpr char versionKey[] = "version";
constexpr char lastUpdatedKey[] = "lastUpdated";
constexpr char entriesKey[] = "entries";
constexpr char pathKey[] = "path";
constexpr char fingerprintKey[] = "fingerprint";
constexpr char modTimeKey[] = "modTimeMillis";
}

const char FingerprintCache::snapshotFileName[] = ".mediamerge-cache.json";
const char FingerprintCache::snapshotVersion[] = "1";

/**
 * @brief Creates an empty cache bound to a target folder.
 * @param rootPath Target folder the cache describes.
 */
FingerprintCache::FingerprintCache(const QString &rootPath)
    : m_rootPath(QDir::cleanPath(QDir(rootPath).absolutePath()))
{
}

QString FingerprintCache::rootPath() const
{
    return m_rootPath;
}

QString FingerprintCache::snapshotPath() const
{
    return QDir(m_rootPath).filePath(QLatin1String(snapshotFileName));
}

/**
 * @brief Returns the loaded entries keyed by path relative to the root.
 */
const CacheEntries &FingerprintCache::entries() const
{
    return m_entries;
}

bool FingerprintCache::isLoaded() const
{
    return m_loaded;
}

qint64 FingerprintCache::modTimeMillis(const QFileInfo &info)
{
    return info.lastModified().toMSecsSinceEpoch();
}

QString FingerprintCache::relativeKey(const QString &path) const
{
    const QString relative = QDir(m_rootPath).relativeFilePath(path);
    if (relative.startsWith(QLatin1String(".."))) {
        return QString();
    }
    return QDir::cleanPath(relative);
}

QString FingerprintCache::absolutePath(const QString &key) const
{
    return QDir::cleanPath(QDir(m_rootPath).filePath(key));
}

/**
 * @brief Reads the snapshot of the target folder.
 *
 * A missing, unreadable, corrupt or unknown-version snapshot leaves the cache
 * empty so that the next build re-hashes everything.
 *
 * @return True when a snapshot was loaded, false on cold start.
 */
bool FingerprintCache::load()
{
    m_entries.clear();
    m_loaded = false;

    QFile file(snapshotPath());
    if (!file.exists()) {
        qCDebug(lcCache) << "No cache snapshot in" << m_rootPath;
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcCache) << "Cannot open cache snapshot" << file.fileName() << ":" << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcCache) << "Ignoring corrupt cache snapshot" << file.fileName() << ":" << parseError.errorString();
        return false;
    }

    const QJsonObject root = doc.object();
    const QString version = root.value(QLatin1String(versionKey)).toString();
    if (version != QLatin1String(snapshotVersion)) {
        qCInfo(lcCache) << "Ignoring cache snapshot with version" << version << "- rebuilding";
        return false;
    }

    const QJsonArray entries = root.value(QLatin1String(entriesKey)).toArray();
    m_entries.reserve(entries.size());
    for (const QJsonValue &value : entries) {
        const QJsonObject object = value.toObject();
        const QString path = object.value(QLatin1String(pathKey)).toString();
        const QString fingerprint = object.value(QLatin1String(fingerprintKey)).toString();
        const QJsonValue modTime = object.value(QLatin1String(modTimeKey));
        if (path.isEmpty() || fingerprint.isEmpty() || !modTime.isDouble()) {
            continue;
        }
        CacheEntry entry;
        entry.fingerprint = fingerprint;
        entry.modTimeMillis = modTime.toInteger();
        m_entries.insert(QDir::cleanPath(path), entry);
    }

    m_loaded = true;
    qCDebug(lcCache) << "Loaded" << m_entries.size() << "cache entries for" << m_rootPath;
    return true;
}

/**
 * @brief Splits the current files into cache hits and files to re-hash.
 *
 * An entry is valid only while its stored modification time equals the live
 * one; anything else, including a file without entry, is stale.
 *
 * @param currentFiles Absolute paths of the files currently in the tree.
 * @return Valid entries keyed by absolute path, and the stale paths in input order.
 */
CacheReconcileResult FingerprintCache::reconcile(const QStringList &currentFiles) const
{
    CacheReconcileResult result;
    result.valid.reserve(currentFiles.size());
    for (const QString &path : currentFiles) {
        const QString key = relativeKey(path);
        const auto it = key.isEmpty() ? m_entries.constEnd() : m_entries.constFind(key);
        if (it == m_entries.constEnd()) {
            result.stale.append(path);
            continue;
        }
        const QFileInfo info(path);
        if (!info.exists() || modTimeMillis(info) != it->modTimeMillis) {
            result.stale.append(path);
            continue;
        }
        result.valid.insert(path, *it);
    }
    return result;
}

/**
 * @brief Adds fresh entries and drops entries of files that no longer exist.
 * @param newEntries Entries keyed by absolute path to add or replace.
 * @param currentFiles Absolute paths of every file still in the tree.
 */
void FingerprintCache::merge(const CacheEntries &newEntries, const QStringList &currentFiles)
{
    QSet<QString> currentKeys;
    currentKeys.reserve(currentFiles.size());
    for (const QString &path : currentFiles) {
        const QString key = relativeKey(path);
        if (!key.isEmpty()) {
            currentKeys.insert(key);
        }
    }

    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (!currentKeys.contains(it.key())) {
            it = m_entries.erase(it);
            removed += 1;
        } else {
            ++it;
        }
    }

    for (auto it = newEntries.constBegin(); it != newEntries.constEnd(); ++it) {
        const QString key = relativeKey(it.key());
        if (key.isEmpty()) {
            continue;
        }
        m_entries.insert(key, it.value());
    }
    qCDebug(lcCache) << "Cache merge:" << newEntries.size() << "updated," << removed << "removed";
}

/**
 * @brief Writes the snapshot atomically next to the files it describes.
 * @param error Optional output error message.
 * @return True if the snapshot was committed, false otherwise.
 */
bool FingerprintCache::persist(QString *error)
{
    QStringList keys = m_entries.keys();
    std::sort(keys.begin(), keys.end());

    QJsonArray entries;
    for (const QString &key : keys) {
        const CacheEntry &entry = m_entries[key];
        QJsonObject object;
        object.insert(QLatin1String(pathKey), key);
        object.insert(QLatin1String(fingerprintKey), entry.fingerprint);
        object.insert(QLatin1String(modTimeKey), entry.modTimeMillis);
        entries.append(object);
    }

    QJsonObject root;
    root.insert(QLatin1String(versionKey), QLatin1String(snapshotVersion));
    root.insert(QLatin1String(lastUpdatedKey), QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    root.insert(QLatin1String(entriesKey), entries);

    QSaveFile file(snapshotPath());
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QCoreApplication::translate("FingerprintCache", "Cannot write cache: %1").arg(file.errorString());
        }
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        if (error) {
            *error = QCoreApplication::translate("FingerprintCache", "Cannot write cache: %1").arg(file.errorString());
        }
        return false;
    }
    if (!file.commit()) {
        if (error) {
            *error = QCoreApplication::translate("FingerprintCache", "Cannot commit cache: %1").arg(file.errorString());
        }
        return false;
    }
    m_loaded = true;
    qCDebug(lcCache) << "Saved" << m_entries.size() << "cache entries to" << snapshotPath();
    return true;
}

bool FingerprintCache::mergeAndPersist(const CacheEntries &newEntries, const QStringList &currentFiles, QString *error)
{
    merge(newEntries, currentFiles);
    return persist(error);
}

/**
 * @brief Deletes the snapshot and forgets every loaded entry.
 * @param error Optional output error message.
 * @return True if no snapshot remains on disk, false otherwise.
 */
bool FingerprintCache::invalidate(QString *error)
{
    m_entries.clear();
    m_loaded = false;
    return invalidate(m_rootPath, error);
}

bool FingerprintCache::invalidate(const QString &rootPath, QString *error)
{
    const QString path = QDir(rootPath).filePath(QLatin1String(snapshotFileName));
    if (!QFileInfo::exists(path)) {
        return true;
    }
    if (!QFile::remove(path)) {
        if (error) {
            *error = QCoreApplication::translate("FingerprintCache", "Cannot delete cache: %1").arg(path);
        }
        return false;
    }
    qCInfo(lcCache) << "Cache cleared for" << rootPath;
    return true;
}
