#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>

class FingerprintCache;

// Fingerprint to representative path, first seen wins.
using FingerprintIndex = QHash<QString, QString>;

struct HashDatabase {
    bool ok = false;
    QString error;
    QString rootPath;
    QStringList files;
    QHash<QString, QString> fingerprints;
    FingerprintIndex index;
    QStringList unfingerprintable;
    QStringList warnings;
    int reusedCount = 0;
    int hashedCount = 0;
};

class HashDatabaseBuilder : public QObject
{
    Q_OBJECT

public:
    explicit HashDatabaseBuilder(int maxWorkers = 0, QObject *parent = nullptr);

    HashDatabase build(const QString &rootPath, FingerprintCache *cache = nullptr);
    HashDatabase buildForFiles(const QString &rootPath, const QStringList &files, FingerprintCache *cache = nullptr);

    void setCacheWritable(bool writable);
    bool isCacheWritable() const;

    static QStringList excludedNames();

signals:
    void progress(int completed, int total);

private:
    QThreadPool m_pool;
    bool m_cacheWritable = true;
};
