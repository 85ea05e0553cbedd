/************************************************************************\

    MediaMerge - Photo and video collection merger
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "UniqueNameUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

namespace {

struct CounterConstants {
    static constexpr int width = 3;
    static constexpr int firstSuffix = 1;
    static constexpr int maxCeiling = 999999;
};

const QRegularExpression &datedNamePattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^(\\d{4}-\\d{2}-\\d{2})_(\\d{3,4})(\\.[^.]*)?$"));
    return pattern;
}

QString paddedCounter(int counter)
{
    return QStringLiteral("%1").arg(counter, CounterConstants::width, 10, QLatin1Char('0'));
}

} // namespace

namespace UniqueNameUtils {

/**
 * @brief Splits a "YYYY-MM-DD_NNN.ext" file name into its parts.
 *
 * Counters longer than four digits are not treated as dated names, so a
 * bumped counter always stays far from the int range.
 * @param fileName File name without folder.
 * @return Parsed parts, with valid set to false when the name does not match.
 */
DatedName parseDatedName(const QString &fileName)
{
    DatedName result;
    const QRegularExpressionMatch match = datedNamePattern().match(fileName);
    if (!match.hasMatch()) {
        return result;
    }
    bool ok = false;
    const int counter = match.captured(2).toInt(&ok);
    if (!ok) {
        return result;
    }
    result.valid = true;
    result.date = match.captured(1);
    result.counter = counter;
    result.extension = match.captured(3);
    return result;
}

QString formatDatedName(const QString &date, int counter, const QString &extension)
{
    return date + QLatin1Char('_') + paddedCounter(counter) + extension;
}

/**
 * @brief Finds a free name for a file whose intended path is taken.
 *
 * Dated names ("2023-01-15_007.jpg") keep their date and bump the counter.
 * Any other name gets "_001", "_002", ... inserted before its extension.
 * Each candidate is checked with isTaken; the search gives up after ceiling
 * attempts. The ceiling itself is clamped to a million candidates.
 *
 * @param collidingPath Intended path that is already taken.
 * @param isTaken Predicate telling whether a candidate path is taken.
 * @param ceiling Maximum number of candidates to try.
 * @return Free path, or an error when the ceiling was reached.
 */
UniqueNameResult resolve(const QString &collidingPath, const PathTaken &isTaken, int ceiling)
{
    UniqueNameResult result;
    const QFileInfo info(collidingPath);
    const QDir dir = info.dir();
    const DatedName dated = parseDatedName(info.fileName());

    const QString baseName = info.completeBaseName();
    const QString suffix = info.suffix();
    const QString extension = suffix.isEmpty() ? QString() : QLatin1Char('.') + suffix;

    const int limit = qBound(0, ceiling, CounterConstants::maxCeiling);
    for (int attempt = 1; attempt <= limit; ++attempt) {
        QString candidateName;
        if (dated.valid) {
            candidateName = formatDatedName(dated.date, dated.counter + attempt, dated.extension);
        } else {
            candidateName = baseName + QLatin1Char('_')
                + paddedCounter(CounterConstants::firstSuffix + attempt - 1) + extension;
        }
        const QString candidate = dir.filePath(candidateName);
        result.attempts = attempt;
        if (!isTaken(candidate)) {
            result.ok = true;
            result.path = candidate;
            return result;
        }
    }

    result.error = QCoreApplication::translate("UniqueNameUtils", "Too many conflicts for %1")
        .arg(info.fileName());
    return result;
}

/**
 * @brief Returns the first free "YYYY-MM-DD_NNN.ext" path in a folder.
 *
 * Counting starts at _001. Used when a file is relocated into its dated
 * folder, where no name is intended beforehand.
 *
 * @param folder Folder receiving the file.
 * @param date Calendar day naming the file.
 * @param extension Extension with its leading dot, case kept.
 * @param isTaken Predicate telling whether a candidate path is taken.
 * @param ceiling Maximum number of candidates to try.
 * @return Free path, or an error when the ceiling was reached.
 */
UniqueNameResult firstFreeDatedName(const QString &folder,
                                    const QDate &date,
                                    const QString &extension,
                                    const PathTaken &isTaken,
                                    int ceiling)
{
    UniqueNameResult result;
    const QDir dir(folder);
    const QString day = date.toString(Qt::ISODate);
    const int limit = qBound(0, ceiling, CounterConstants::maxCeiling);

    for (int attempt = 1; attempt <= limit; ++attempt) {
        const QString candidate =
            dir.filePath(formatDatedName(day, CounterConstants::firstSuffix + attempt - 1, extension));
        result.attempts = attempt;
        if (!isTaken(candidate)) {
            result.ok = true;
            result.path = candidate;
            return result;
        }
    }

    result.error = QCoreApplication::translate("UniqueNameUtils", "Too many conflicts for %1")
        .arg(formatDatedName(day, CounterConstants::firstSuffix, extension));
    return result;
}

} // namespace UniqueNameUtils
