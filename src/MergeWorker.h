#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "FingerprintCache.h"
#include "MergePlanner.h"

struct MergeApplyResult {
    int copied = 0;
    int renamed = 0;
    int failed = 0;
    QStringList copiedPaths;
    CacheEntries copiedEntries;
    QStringList errors;
};

class MergeWorker : public QObject
{
    Q_OBJECT

public:
    explicit MergeWorker(const QVector<MergeAction> &actions, QObject *parent = nullptr);

    MergeApplyResult run();

signals:
    void progress(int completed, int total);

private:
    void applyAction(const MergeAction &action, MergeApplyResult &result);
    void tick(int &completed, int total);

    QVector<MergeAction> m_actions;
};
