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

#include "DateResolver.h"

#include <QFileInfo>
#include <QRegularExpression>

#include "ImageMetadataUtils.h"
#include "Logging.h"
#include "MediaTypeUtils.h"

namespace {

/**
 * @brief Returns the pattern matching an embedded YYYYMMDD or YYYY-MM-DD date.
 *
 * Both separators must agree. Years are limited to 2009-2099 so that
 * arbitrary 8-digit counters in camera filenames are not mistaken for dates.
 */
const QRegularExpression &filenameDatePattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("(20(?:09|[1-9][0-9]))(-?)(0[1-9]|1[0-2])\\2(0[1-9]|[12][0-9]|3[01])"));
    return pattern;
}

struct DateCaptures {
    static constexpr int year = 1;
    static constexpr int month = 3;
    static constexpr int day = 4;
};

} // namespace

namespace DateResolver {

/**
 * @brief Extracts a calendar date embedded in a filename.
 *
 * Every YYYYMMDD or YYYY-MM-DD candidate in the base name is tried in order; the first one
 * forming a real calendar day (leap years included) wins.
 *
 * @param path File path or name to inspect.
 * @return The embedded date, or std::nullopt when none is valid.
 */
std::optional<QDate> dateFromFilename(const QString &path)
{
    const QString baseName = QFileInfo(path).completeBaseName();
    QRegularExpressionMatchIterator it = filenameDatePattern().globalMatch(baseName);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const int year = match.captured(DateCaptures::year).toInt();
        const int month = match.captured(DateCaptures::month).toInt();
        const int day = match.captured(DateCaptures::day).toInt();
        if (year < DateRange::firstYear || year > DateRange::lastYear) {
            continue;
        }
        const QDate date(year, month, day);
        if (date.isValid()) {
            return date;
        }
    }
    return std::nullopt;
}

/**
 * @brief Resolves the creation date of a media file.
 *
 * Still images use their EXIF capture date, videos and GIF files use the
 * date embedded in their name. The file modification time is the fallback
 * for every kind.
 *
 * @param path File path to resolve.
 * @return Creation date, or std::nullopt when the file cannot be stat'ed.
 */
std::optional<QDateTime> resolve(const QString &path)
{
    const QFileInfo info(path);
    const MediaKind kind = MediaTypeUtils::classify(info);

    if (MediaTypeUtils::usesFilenameDate(path)) {
        const std::optional<QDate> date = dateFromFilename(path);
        if (date) {
            return QDateTime(*date, QTime(0, 0));
        }
    } else if (kind == MediaKind::Image) {
        const ImageMetadataUtils::CaptureDateResult capture = ImageMetadataUtils::readCaptureDate(path);
        if (capture.valid) {
            qCDebug(lcFingerprint) << "Using" << capture.key << "for" << info.fileName();
            return capture.dateTime;
        }
    }

    if (!info.exists()) {
        return std::nullopt;
    }
    qCDebug(lcFingerprint) << "No embedded date for" << info.fileName() << "- using modification time";
    return info.lastModified();
}

} // namespace DateResolver
