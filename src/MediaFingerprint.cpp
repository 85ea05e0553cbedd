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

#include "MediaFingerprint.h"

#include <QCoreApplication>
#include <QCryptographicHash>
#include <QFileInfo>

#include "DateResolver.h"
#include "ImageMetadataUtils.h"

namespace {

FingerprintResult unfingerprintable(MediaKind kind, const QString &reason)
{
    FingerprintResult result;
    result.status = FingerprintResult::Status::Unfingerprintable;
    result.kind = kind;
    result.reason = reason;
    return result;
}

FingerprintResult fingerprinted(MediaKind kind, const QString &fingerprint)
{
    FingerprintResult result;
    result.status = FingerprintResult::Status::Fingerprinted;
    result.kind = kind;
    result.fingerprint = fingerprint;
    return result;
}

FingerprintResult fingerprintImage(const QString &path, qint64 size)
{
    const ImageMetadataUtils::CaptureMetadataResult metadata = ImageMetadataUtils::readCaptureMetadata(path);
    if (!metadata.valid) {
        return fingerprinted(MediaKind::Image,
                             MediaFingerprint::imageFingerprint(size, QLatin1String(MediaFingerprint::noExifSentinel)));
    }
    const QByteArray normalized = ImageMetadataUtils::normalizedMetadata(metadata).toUtf8();
    const QString hash = QString::fromLatin1(QCryptographicHash::hash(normalized, QCryptographicHash::Md5).toHex());
    return fingerprinted(MediaKind::Image, MediaFingerprint::imageFingerprint(size, hash));
}

FingerprintResult fingerprintVideo(const QString &path, qint64 size)
{
    const std::optional<QDate> date = DateResolver::dateFromFilename(path);
    if (!date) {
        return unfingerprintable(MediaKind::Video,
                                 QCoreApplication::translate("MediaFingerprint", "No date in video filename"));
    }
    return fingerprinted(MediaKind::Video,
                         MediaFingerprint::videoFingerprint(size, date->toString(Qt::ISODate)));
}

} // namespace

namespace MediaFingerprint {

const char noExifSentinel[] = "no-exif";

/**
 * @brief Computes the content identity of a media file.
 *
 * Images are identified by their byte size and a hash of their capture
 * metadata. Videos are identified by their byte size and the date in their
 * filename. Metadata failures fall back to the "no-exif" sentinel and never
 * escape this function.
 *
 * @param path Media file to fingerprint.
 * @return Fingerprint, or an unfingerprintable outcome with a reason.
 */
FingerprintResult compute(const QString &path)
{
    const QFileInfo info(path);
    const MediaKind kind = MediaTypeUtils::classify(info);
    if (!info.exists() || !info.isFile()) {
        return unfingerprintable(kind, QCoreApplication::translate("MediaFingerprint", "File not found"));
    }

    const qint64 size = info.size();
    switch (kind) {
    case MediaKind::Image:
        return fingerprintImage(path, size);
    case MediaKind::Video:
        return fingerprintVideo(path, size);
    case MediaKind::Unrecognized:
        break;
    }
    return unfingerprintable(kind, QCoreApplication::translate("MediaFingerprint", "Unsupported file type"));
}

QString imageFingerprint(qint64 size, const QString &metadataHash)
{
    return QStringLiteral("%1-%2").arg(size).arg(metadataHash);
}

QString videoFingerprint(qint64 size, const QString &isoDate)
{
    return QStringLiteral("%1-video-%2").arg(size).arg(isoDate);
}

} // namespace MediaFingerprint
