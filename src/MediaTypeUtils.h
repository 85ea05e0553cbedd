#pragma once

#include <QString>

class QFileInfo;

enum class MediaKind {
    Image,
    Video,
    Unrecognized
};

namespace MediaTypeUtils {

MediaKind classify(const QString &path);
MediaKind classify(const QFileInfo &info);
bool usesFilenameDate(const QString &path);
QString kindName(MediaKind kind);

} // namespace MediaTypeUtils
