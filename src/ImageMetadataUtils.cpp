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

#include "ImageMetadataUtils.h"

#include <QFile>

#include <exiv2/exiv2.hpp>

#include <exception>
#include <string>

#include "Logging.h"

namespace {

struct MetadataField {
    const char *name;
    const char *exifKey;
};

// Order is part of the fingerprint format.
constexpr MetadataField captureFields[] = {
    {"Make", "Exif.Image.Make"},
    {"Model", "Exif.Image.Model"},
    {"DateTimeOriginal", "Exif.Photo.DateTimeOriginal"},
    {"Orientation", "Exif.Image.Orientation"},
    {"ExposureTime", "Exif.Photo.ExposureTime"},
    {"FNumber", "Exif.Photo.FNumber"},
    {"ISO", "Exif.Photo.ISOSpeedRatings"},
    {"FocalLength", "Exif.Photo.FocalLength"},
    {"Flash", "Exif.Photo.Flash"},
    {"WhiteBalance", "Exif.Photo.WhiteBalance"}
};

constexpr const char *captureDateKeys[] = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Image.DateTime"
};

struct MetadataConstants {
    static constexpr const char *widthName = "PixelWidth";
    static constexpr const char *heightName = "PixelHeight";
    static constexpr const char *widthKey = "Exif.Photo.PixelXDimension";
    static constexpr const char *heightKey = "Exif.Photo.PixelYDimension";
};

/**
 * @brief Prepares exiv2 for use from several worker threads.
 */
void ensureExiv2Initialized()
{
    static const bool initialized = []() {
        Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
        Exiv2::XmpParser::initialize();
        return true;
    }();
    Q_UNUSED(initialized);
}

std::string localPath(const QString &path)
{
    return QFile::encodeName(path).toStdString();
}

QString exifValue(const Exiv2::ExifData &exif, const char *key)
{
    const auto it = exif.findKey(Exiv2::ExifKey(key));
    if (it == exif.end()) {
        return QString();
    }
    return QString::fromStdString(it->toString()).trimmed();
}

} // namespace

namespace ImageMetadataUtils {

/**
 * @brief Reads the capture attributes used to identify an image.
 *
 * The file is parsed once. Absent attributes are omitted. The result is
 * invalid when the file cannot be parsed or carries no EXIF block at all.
 *
 * @param path Image file path to read.
 * @return Ordered capture attributes with validity flag.
 */
CaptureMetadataResult readCaptureMetadata(const QString &path)
{
    CaptureMetadataResult result;
    ensureExiv2Initialized();
    try {
        auto image = Exiv2::ImageFactory::open(localPath(path));
        if (!image.get()) {
            return result;
        }
        image->readMetadata();
        const Exiv2::ExifData &exif = image->exifData();
        if (exif.empty()) {
            return result;
        }

        for (const MetadataField &field : captureFields) {
            const QString value = exifValue(exif, field.exifKey);
            if (!value.isEmpty()) {
                result.fields.append(qMakePair(QString::fromLatin1(field.name), value));
            }
        }

        QString width = exifValue(exif, MetadataConstants::widthKey);
        QString height = exifValue(exif, MetadataConstants::heightKey);
        if (width.isEmpty() && image->pixelWidth() > 0) {
            width = QString::number(image->pixelWidth());
        }
        if (height.isEmpty() && image->pixelHeight() > 0) {
            height = QString::number(image->pixelHeight());
        }
        if (!width.isEmpty()) {
            result.fields.append(qMakePair(QString::fromLatin1(MetadataConstants::widthName), width));
        }
        if (!height.isEmpty()) {
            result.fields.append(qMakePair(QString::fromLatin1(MetadataConstants::heightName), height));
        }
        result.valid = true;
    } catch (const Exiv2::Error &e) {
        qCDebug(lcFingerprint) << "No readable metadata in" << path << ":" << e.what();
        result.fields.clear();
    } catch (const std::exception &e) {
        qCDebug(lcFingerprint) << "Metadata parser failed on" << path << ":" << e.what();
        result.fields.clear();
    }
    return result;
}

/**
 * @brief Serializes capture attributes into the text that gets hashed.
 * @param metadata Attributes returned by readCaptureMetadata().
 * @return One "Name=Value" line per present attribute, in field order.
 */
QString normalizedMetadata(const CaptureMetadataResult &metadata)
{
    QString text;
    for (const auto &field : metadata.fields) {
        text += field.first;
        text += QLatin1Char('=');
        text += field.second;
        text += QLatin1Char('\n');
    }
    return text;
}

/**
 * @brief Reads the capture date of an image from its EXIF fields.
 * @param path Image file path to read.
 * @return First valid date among the original, digitized and image date fields.
 */
CaptureDateResult readCaptureDate(const QString &path)
{
    CaptureDateResult result;
    ensureExiv2Initialized();
    try {
        auto image = Exiv2::ImageFactory::open(localPath(path));
        if (!image.get()) {
            return result;
        }
        image->readMetadata();
        const Exiv2::ExifData &exif = image->exifData();
        for (const char *key : captureDateKeys) {
            const QDateTime dateTime = parseExifDateTime(exifValue(exif, key));
            if (dateTime.isValid()) {
                result.valid = true;
                result.dateTime = dateTime;
                result.key = QString::fromLatin1(key);
                return result;
            }
        }
    } catch (const Exiv2::Error &e) {
        qCDebug(lcFingerprint) << "No EXIF date in" << path << ":" << e.what();
    } catch (const std::exception &e) {
        qCDebug(lcFingerprint) << "EXIF date lookup failed on" << path << ":" << e.what();
    }
    return result;
}

QDateTime parseExifDateTime(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.size() < 19) {
        return QDateTime();
    }
    return QDateTime::fromString(trimmed.left(19), QStringLiteral("yyyy:MM:dd HH:mm:ss"));
}

} // namespace ImageMetadataUtils
