#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "HashDatabaseBuilder.h"
#include "UniqueNameUtils.h"

struct MergeAction {
    enum class Kind {
        Skip,
        Copy,
        CopyRenamed,
        Failed
    };

    enum class SkipReason {
        None,
        Duplicate,
        Unfingerprintable
    };

    Kind kind = Kind::Skip;
    SkipReason reason = SkipReason::None;
    QString sourcePath;
    QString targetPath;
    QString finalPath;
    QString fingerprint;
    QString error;

    bool isCopy() const { return kind == Kind::Copy || kind == Kind::CopyRenamed; }
    QString destinationPath() const { return kind == Kind::CopyRenamed ? finalPath : targetPath; }
};

struct MergePlanInput {
    QString sourceRoot;
    QStringList sourceFiles;
    QHash<QString, QString> sourceFingerprints;
    QString targetRoot;
    FingerprintIndex targetIndex;
    int collisionCeiling = UniqueNameUtils::defaultCollisionCeiling;
};

namespace MergePlanner {

QVector<MergeAction> plan(const MergePlanInput &input);
QVector<MergeAction> plan(const MergePlanInput &input, const UniqueNameUtils::PathTaken &existsOnDisk);
QString mirroredTargetPath(const QString &sourceRoot, const QString &sourcePath, const QString &targetRoot);

} // namespace MergePlanner
