#pragma once

/**
 * @file TestUtils.h
 * @brief File fixtures shared by the MediaMerge unit tests
 */

#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include <exiv2/exiv2.hpp>

#include <string>

namespace TestUtils {

/**
 * @brief Capture attributes written into a JPEG fixture.
 */
struct ExifFields {
    std::string make = "Canon";
    std::string model = "EOS 80D";
    std::string dateTimeOriginal = "2023:01:15 10:30:00";
};

/**
 * @brief Writes raw bytes to a file, creating parent folders.
 * @return Absolute path of the written file, or an empty string on failure.
 */
inline QString writeFile(const QString &path, const QByteArray &bytes)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return QString();
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size()) {
        return QString();
    }
    file.close();
    return info.absoluteFilePath();
}

/**
 * @brief Writes a file that no metadata parser recognizes.
 *
 * The first byte is the seed so that equal sizes with different seeds give
 * different bytes.
 */
inline QString writeOpaqueFile(const QString &path, int size, char seed = 'x')
{
    QByteArray bytes(size, seed);
    return writeFile(path, bytes);
}

inline bool setModificationTime(const QString &path, const QDateTime &time)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadWrite)) {
        return false;
    }
    return file.setFileTime(time, QFileDevice::FileModificationTime);
}

inline qint64 modificationMillis(const QString &path)
{
    return QFileInfo(path).lastModified().toMSecsSinceEpoch();
}

/**
 * @brief Creates a small JPEG carrying an EXIF block.
 * @return Absolute path of the image, or an empty string on failure.
 */
inline QString writeExifJpeg(const QString &path, const ExifFields &fields = ExifFields())
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return QString();
    }
    const std::string localPath = QFile::encodeName(info.absoluteFilePath()).toStdString();
    try {
        auto image = Exiv2::ImageFactory::create(Exiv2::ImageType::jpeg, localPath);
        Exiv2::ExifData exif;
        exif["Exif.Image.Make"] = fields.make;
        exif["Exif.Image.Model"] = fields.model;
        if (!fields.dateTimeOriginal.empty()) {
            exif["Exif.Photo.DateTimeOriginal"] = fields.dateTimeOriginal;
        }
        image->setExifData(exif);
        image->writeMetadata();
    } catch (const Exiv2::Error &) {
        return QString();
    }
    return info.absoluteFilePath();
}

} // namespace TestUtils
