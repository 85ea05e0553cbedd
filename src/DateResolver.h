#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

#include <optional>

namespace DateResolver {

struct DateRange {
    static constexpr int firstYear = 2009;
    static constexpr int lastYear = 2099;
};

std::optional<QDate> dateFromFilename(const QString &path);
std::optional<QDateTime> resolve(const QString &path);

} // namespace DateResolver
