#pragma once

#include <QSet>
#include <QString>
#include <QStringList>

class DirectoryWalker
{
public:
    explicit DirectoryWalker(const QString &rootPath, const QStringList &excludedNames = {});

    bool isValid() const;
    QString rootPath() const;
    void reset();
    bool hasNext();
    QString next();

    static bool collectFiles(const QString &rootPath,
                             const QStringList &excludedNames,
                             QStringList *files,
                             QString *error);

private:
    bool fillPending();

    QString m_rootPath;
    QSet<QString> m_excludedNames;
    QStringList m_directoryStack;
    QStringList m_pendingFiles;
};
