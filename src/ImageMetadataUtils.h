#pragma once

#include <QDateTime>
#include <QPair>
#include <QString>
#include <QVector>

namespace ImageMetadataUtils {

struct CaptureMetadataResult {
    bool valid = false;
    QVector<QPair<QString, QString>> fields;
};

struct CaptureDateResult {
    bool valid = false;
    QDateTime dateTime;
    QString key;
};

CaptureMetadataResult readCaptureMetadata(const QString &path);
QString normalizedMetadata(const CaptureMetadataResult &metadata);
CaptureDateResult readCaptureDate(const QString &path);
QDateTime parseExifDateTime(const QString &text);

} // namespace ImageMetadataUtils
