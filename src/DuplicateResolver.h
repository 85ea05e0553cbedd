#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

namespace DuplicateResolver {

struct DuplicateMember {
    QString path;
    qint64 modTimeMillis = 0;
};

struct DuplicateGroup {
    QString key;
    QVector<DuplicateMember> members;
};

struct Resolution {
    QString keep;
    QStringList remove;
};

struct PassResult {
    QStringList survivors;
    QStringList removed;
    int groupCount = 0;
};

DuplicateMember memberFor(const QString &path);
bool hasPreferredSuffix(const QString &path, const QString &preferredSuffix);
QString filenameKey(const QString &path, const QString &preferredSuffix);

Resolution resolve(const QVector<DuplicateMember> &group, const QString &preferredSuffix);

QVector<DuplicateGroup> groupByFilename(const QStringList &paths, const QString &preferredSuffix);
QVector<DuplicateGroup> groupByFingerprint(const QStringList &paths, const QHash<QString, QString> &fingerprints);
PassResult resolveGroups(const QStringList &paths,
                         const QVector<DuplicateGroup> &groups,
                         const QString &preferredSuffix);
PassResult resolveFilenameGroups(const QStringList &paths,
                                 const QVector<DuplicateGroup> &groups,
                                 const QHash<QString, QString> &fingerprints,
                                 const QString &preferredSuffix,
                                 QStringList *warnings = nullptr);

} // namespace DuplicateResolver
