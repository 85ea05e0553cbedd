#pragma once

#include <QString>

namespace PlatformUtils {

enum class RemovalMode {
    MoveToTrash,
    DeletePermanently
};

QString normalizePath(const QString &path);
bool isPathInRoot(const QString &rootPath, const QString &path);
bool moveToTrashOrDelete(const QString &path, QString *error);
bool deletePermanently(const QString &path, QString *error);
bool removeFile(const QString &path, RemovalMode mode, QString *error);

} // namespace PlatformUtils
