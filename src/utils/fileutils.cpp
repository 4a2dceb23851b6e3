#include "fileutils.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QStringList>

#include <algorithm>

namespace FileUtils {

QString formatFileSize(qint64 bytes)
{
    constexpr qint64 KB = 1024;
    constexpr qint64 MB = KB * 1024;
    constexpr qint64 GB = MB * 1024;

    if (bytes < 0) {
        bytes = 0;
    }
    if (bytes < KB) {
        return QString("%1 B").arg(bytes);
    }
    if (bytes < MB) {
        return QString("%1 KB").arg(static_cast<double>(bytes) / static_cast<double>(KB), 0, 'f', 1);
    }
    if (bytes < GB) {
        return QString("%1 MB").arg(static_cast<double>(bytes) / static_cast<double>(MB), 0, 'f', 1);
    }
    return QString("%1 GB").arg(static_cast<double>(bytes) / static_cast<double>(GB), 0, 'f', 2);
}

QString stripExtension(const QString &fileName)
{
    int dot = fileName.lastIndexOf('.');
    if (dot <= 0) {
        return fileName;
    }
    return fileName.left(dot);
}

QString generateUniqueFilename(const QString &filePath)
{
    QFileInfo info(filePath);
    QString fileName = info.fileName();
    QString name = stripExtension(fileName);
    QString ext = fileName.mid(name.length());

    for (int counter = 1;; ++counter) {
        QString candidate = info.dir().filePath(QString("%1 (%2)%3").arg(name, QString::number(counter), ext));
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}

QString generateUniqueDirname(const QString &dirPath)
{
    QFileInfo info(QDir::cleanPath(dirPath));
    QString dirName = info.fileName();

    for (int counter = 1;; ++counter) {
        QString candidate = info.dir().filePath(QString("%1 (%2)").arg(dirName, QString::number(counter)));
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}

int removeEmptyDirectories(const QString &root)
{
    QStringList dirs;
    QDirIterator it(root, QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        dirs.append(it.next());
    }

    // Deepest paths first so parents become empty before they are checked
    std::sort(dirs.begin(), dirs.end(), [](const QString &a, const QString &b) {
        return a.count('/') > b.count('/');
    });

    int removed = 0;
    for (const QString &path : dirs) {
        QDir dir(path);
        if (dir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System)
            && QDir().rmdir(path)) {
            ++removed;
        }
    }
    return removed;
}

void removeEmptyParents(const QString &path, const QString &stopAt)
{
    QString stop = QDir::cleanPath(QFileInfo(stopAt).absoluteFilePath());
    QString current = QFileInfo(QDir::cleanPath(QFileInfo(path).absoluteFilePath())).path();

    while (current.startsWith(stop + '/') && current != stop) {
        QDir dir(current);
        if (!dir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System)) {
            break;
        }
        if (!QDir().rmdir(current)) {
            break;
        }
        current = QFileInfo(current).path();
    }
}

} // namespace FileUtils
