#pragma once

#include <QString>
#include <QStringList>

class QFileInfo;

namespace FileOperationUtils {

bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath);
bool copyFilePreservingTimes(const QString &sourcePath, const QString &targetPath, QString *error);
bool moveFile(const QString &sourcePath, const QString &targetPath, QString *error);
QStringList removeEmptyFolders(const QString &rootPath, bool dryRun);

} // namespace FileOperationUtils
