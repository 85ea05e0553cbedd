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

#include "MediaTypeUtils.h"

#include <QFileInfo>
#include <QSet>

namespace {

/**
 * @brief Returns the set of lowercase extensions handled as still images.
 * @return Set of image extensions without the leading dot.
 */
const QSet<QString> &imageExtensions()
{
    static const QSet<QString> extensions = {
        QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("png"),
        QStringLiteral("tiff"), QStringLiteral("tif"), QStringLiteral("bmp"),
        QStringLiteral("webp"), QStringLiteral("heic"), QStringLiteral("heif"),
        QStringLiteral("raw"), QStringLiteral("cr2"), QStringLiteral("nef"),
        QStringLiteral("arw"), QStringLiteral("dng"), QStringLiteral("gif")
    };
    return extensions;
}

/**
 * @brief Returns the set of lowercase extensions handled as videos.
 * @return Set of video extensions without the leading dot.
 */
const QSet<QString> &videoExtensions()
{
    static const QSet<QString> extensions = {
        QStringLiteral("mp4"), QStringLiteral("avi"), QStringLiteral("mov"),
        QStringLiteral("mkv"), QStringLiteral("wmv"), QStringLiteral("flv"),
        QStringLiteral("webm"), QStringLiteral("m4v")
    };
    return extensions;
}

MediaKind classifySuffix(const QString &suffix)
{
    const QString lower = suffix.toLower();
    if (imageExtensions().contains(lower)) {
        return MediaKind::Image;
    }
    if (videoExtensions().contains(lower)) {
        return MediaKind::Video;
    }
    return MediaKind::Unrecognized;
}

} // namespace

namespace MediaTypeUtils {

/**
 * @brief Resolves the media kind of a file from its extension.
 * @param path File path to classify.
 * @return Media kind of the file.
 */
MediaKind classify(const QString &path)
{
    return classifySuffix(QFileInfo(path).suffix());
}

MediaKind classify(const QFileInfo &info)
{
    return classifySuffix(info.suffix());
}

/**
 * @brief Reports whether the capture date of a file comes from its name.
 *
 * Videos and GIF animations carry no reliable capture time in their
 * container, so their date is read from the filename instead of EXIF.
 *
 * @param path File path to inspect.
 * @return True for videos and GIF files, false otherwise.
 */
bool usesFilenameDate(const QString &path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    return suffix == QLatin1String("gif") || videoExtensions().contains(suffix);
}

QString kindName(MediaKind kind)
{
    switch (kind) {
    case MediaKind::Image:
        return QStringLiteral("image");
    case MediaKind::Video:
        return QStringLiteral("video");
    case MediaKind::Unrecognized:
        break;
    }
    return QStringLiteral("unrecognized");
}

} // namespace MediaTypeUtils
