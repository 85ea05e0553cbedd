#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "DuplicateResolver.h"
#include "MergePlanner.h"
#include "MergeSettings.h"

class HashDatabaseBuilder;

struct RelocatedFile {
    QString sourcePath;
    QString targetPath;
};

struct MergeReport {
    bool ok = false;
    QString error;

    int sourceFiles = 0;
    int targetFiles = 0;
    int fingerprinted = 0;
    int unfingerprintable = 0;
    int reusedFromCache = 0;
    int rehashed = 0;

    int copied = 0;
    int renamed = 0;
    int skippedDuplicates = 0;
    int skippedUnfingerprintable = 0;
    int duplicateGroups = 0;
    int duplicatesRemoved = 0;
    int errors = 0;

    int organized = 0;
    int alreadyOrganized = 0;
    int sidecarsRemoved = 0;
    int emptyFoldersRemoved = 0;

    bool cacheSaved = false;
    QVector<MergeAction> actions;
    QVector<RelocatedFile> relocations;
    QStringList removedPaths;
    QStringList failures;
    QStringList warnings;
};

class MergeEngine : public QObject
{
    Q_OBJECT

public:
    explicit MergeEngine(const MergeOptions &options, QObject *parent = nullptr);

    const MergeOptions &options() const;

    MergeReport merge(const QString &sourceRoot, const QString &targetRoot);
    MergeReport deduplicate(const QString &rootPath);
    MergeReport organize(const QString &rootPath);

    static bool clearCache(const QString &targetRoot, QString *error);

signals:
    void stageChanged(const QString &stage);
    void progress(int completed, int total);

private:
    struct DuplicatePassOutcome {
        QStringList survivors;
        QStringList losers;
        QHash<QString, QString> fingerprints;
        int groups = 0;
    };

    DuplicatePassOutcome runDuplicatePasses(const QString &rootPath,
                                            const QStringList &files,
                                            HashDatabaseBuilder &builder,
                                            FingerprintCache *cache,
                                            MergeReport &report);
    void removeLosers(const QStringList &losers, MergeReport &report);
    void removeSidecars(const QStringList &sidecars, MergeReport &report);
    void relocateCacheEntries(const QString &rootPath, const QStringList &files, MergeReport &report);
    void recordDatabase(const HashDatabase &database, MergeReport &report);

    MergeOptions m_options;
};
