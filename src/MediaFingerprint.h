#pragma once

#include <QString>

#include "MediaTypeUtils.h"

struct FingerprintResult {
    enum class Status {
        Fingerprinted,
        Unfingerprintable
    };

    Status status = Status::Unfingerprintable;
    MediaKind kind = MediaKind::Unrecognized;
    QString fingerprint;
    QString reason;

    bool isValid() const { return status == Status::Fingerprinted; }
};

namespace MediaFingerprint {

extern const char noExifSentinel[];

FingerprintResult compute(const QString &path);
QString imageFingerprint(qint64 size, const QString &metadataHash);
QString videoFingerprint(qint64 size, const QString &isoDate);

} // namespace MediaFingerprint
