#pragma once

#include <QDate>
#include <QString>

#include <functional>

namespace UniqueNameUtils {

constexpr int defaultCollisionCeiling = 9999;

struct UniqueNameResult {
    bool ok = false;
    QString path;
    int attempts = 0;
    QString error;
};

struct DatedName {
    bool valid = false;
    QString date;
    int counter = 0;
    QString extension;
};

using PathTaken = std::function<bool(const QString &)>;

DatedName parseDatedName(const QString &fileName);
QString formatDatedName(const QString &date, int counter, const QString &extension);
UniqueNameResult resolve(const QString &collidingPath,
                         const PathTaken &isTaken,
                         int ceiling = defaultCollisionCeiling);
UniqueNameResult firstFreeDatedName(const QString &folder,
                                    const QDate &date,
                                    const QString &extension,
                                    const PathTaken &isTaken,
                                    int ceiling = defaultCollisionCeiling);

} // namespace UniqueNameUtils
