#pragma once

#include <QString>

#include <memory>

#include "PlatformUtils.h"
#include "UniqueNameUtils.h"

class QSettings;

struct MergeOptions {
    bool dryRun = false;
    bool resolveSourceDuplicates = false;
    bool filenamePass = true;
    QString preferredSuffix = QStringLiteral("-edited");
    int workers = 0;
    int collisionCeiling = UniqueNameUtils::defaultCollisionCeiling;
    PlatformUtils::RemovalMode removalMode = PlatformUtils::RemovalMode::MoveToTrash;
};

class MergeSettings
{
public:
    MergeSettings();
    explicit MergeSettings(const QString &iniPath);

    MergeOptions load() const;
    void save(const MergeOptions &options) const;

private:
    std::unique_ptr<QSettings> openSettings() const;

    QString m_iniPath;
};
