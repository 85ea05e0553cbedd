#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

class QFileInfo;

struct CacheEntry {
    QString fingerprint;
    qint64 modTimeMillis = 0;
};

using CacheEntries = QHash<QString, CacheEntry>;

struct CacheReconcileResult {
    CacheEntries valid;
    QStringList stale;
};

class FingerprintCache
{
public:
    static const char snapshotFileName[];
    static const char snapshotVersion[];

    explicit FingerprintCache(const QString &rootPath);

    QString rootPath() const;
    QString snapshotPath() const;
    const CacheEntries &entries() const;
    bool isLoaded() const;

    bool load();
    CacheReconcileResult reconcile(const QStringList &currentFiles) const;
    void merge(const CacheEntries &newEntries, const QStringList &currentFiles);
    bool persist(QString *error);
    bool mergeAndPersist(const CacheEntries &newEntries, const QStringList &currentFiles, QString *error);
    bool invalidate(QString *error);

    static qint64 modTimeMillis(const QFileInfo &info);
    static bool invalidate(const QString &rootPath, QString *error);

private:
    QString relativeKey(const QString &path) const;
    QString absolutePath(const QString &key) const;

    QString m_rootPath;
    CacheEntries m_entries;
    bool m_loaded = false;
};
