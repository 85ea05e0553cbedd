#pragma once

#include <QObject>
#include <QStringList>

#include "PlatformUtils.h"

struct RemovalResult {
    int removed = 0;
    int failed = 0;
    QStringList removedPaths;
    QStringList errors;
};

class RemovalWorker : public QObject
{
    Q_OBJECT

public:
    explicit RemovalWorker(const QStringList &paths,
                           PlatformUtils::RemovalMode mode,
                           QObject *parent = nullptr);

    RemovalResult run();

signals:
    void progress(int completed, int total);

private:
    void tick(int &completed, int total);

    QStringList m_paths;
    PlatformUtils::RemovalMode m_mode = PlatformUtils::RemovalMode::MoveToTrash;
};
