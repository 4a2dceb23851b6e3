#include "archiveextractor.h"
#include "conflictresolver.h"
#include "../utils/fileutils.h"
#include "../utils/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSet>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace {

struct EntryInfo {
    QString rawPath;
    QString path;        // Sanitized; empty if unsafe
    qint64 size = 0;
    bool isDirectory = false;
};

/// Owns one libarchive read handle
class ZipReader
{
public:
    ZipReader()
        : archive_(archive_read_new())
    {
        archive_read_support_filter_all(archive_);
        archive_read_support_format_zip(archive_);
    }

    ~ZipReader()
    {
        archive_read_close(archive_);
        archive_read_free(archive_);
    }

    ZipReader(const ZipReader &) = delete;
    ZipReader &operator=(const ZipReader &) = delete;

    bool open(const QString &path)
    {
        return archive_read_open_filename(archive_, QFile::encodeName(path).constData(), 10240) == ARCHIVE_OK;
    }

    [[nodiscard]] QString errorString() const
    {
        const char *message = archive_error_string(archive_);
        return message ? QString::fromUtf8(message) : QStringLiteral("unknown archive error");
    }

    struct archive *handle() const { return archive_; }

private:
    struct archive *archive_;
};

} // namespace

ArchiveExtractor::ArchiveExtractor(std::shared_ptr<ConflictResolver> resolver, QObject *parent)
    : QObject(parent)
    , resolver_(std::move(resolver))
{
}

void ArchiveExtractor::pause()
{
    QMutexLocker locker(&mutex_);
    pauseRequested_ = true;
}

void ArchiveExtractor::stop()
{
    QMutexLocker locker(&mutex_);
    stopRequested_ = true;
}

bool ArchiveExtractor::isPaused() const
{
    QMutexLocker locker(&mutex_);
    return pauseRequested_;
}

bool ArchiveExtractor::isStopped() const
{
    QMutexLocker locker(&mutex_);
    return stopRequested_;
}

ArchiveExtractor::Interrupt ArchiveExtractor::pendingInterrupt() const
{
    QMutexLocker locker(&mutex_);
    if (stopRequested_) {
        return Interrupt::Stop;
    }
    return pauseRequested_ ? Interrupt::Pause : Interrupt::None;
}

QString ArchiveExtractor::sanitizeEntryPath(const QString &entryPath)
{
    QString path = entryPath;
    path.replace('\\', '/');

    if (path.startsWith('/') || (path.size() > 1 && path.at(1) == ':')) {
        return QString();
    }

    QStringList parts;
    const QStringList components = path.split('/', Qt::SkipEmptyParts);
    for (const QString &component : components) {
        if (component == QLatin1String(".")) {
            continue;
        }
        if (component == QLatin1String("..")) {
            return QString();
        }
        parts.append(component);
    }
    return parts.join('/');
}

bool ArchiveExtractor::shouldPreserveStructure(const QStringList &entryPaths)
{
    QSet<QString> topLevel;
    bool nested = false;

    for (const QString &raw : entryPaths) {
        QString path = sanitizeEntryPath(raw);
        if (path.isEmpty()) {
            continue;
        }
        int slash = path.indexOf('/');
        topLevel.insert(slash < 0 ? path : path.left(slash));
        if (slash >= 0) {
            nested = true;
        }
    }

    return topLevel.size() == 1 && nested;
}

void ArchiveExtractor::reportProgress(qint64 doneBytes, qint64 totalBytes, int doneFiles, int totalFiles)
{
    double byteFraction = totalBytes > 0 ? static_cast<double>(doneBytes) / static_cast<double>(totalBytes) : 0.0;
    double fileFraction = totalFiles > 0 ? static_cast<double>(doneFiles) / static_cast<double>(totalFiles) : 0.0;
    int percent = qBound(0, static_cast<int>(std::max(byteFraction, fileFraction) * 100.0), 100);

    if (percent != lastPercent_) {
        lastPercent_ = percent;
        emit progressChanged(percent);
    }
}

void ArchiveExtractor::removePartialFiles(const QString &outputDir)
{
    for (const QString &path : std::as_const(partialFiles_)) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            qWarning() << "Could not remove partial file" << path;
            continue;
        }
        LOG_VERBOSE() << "Removed partial file" << path;
        FileUtils::removeEmptyParents(path, outputDir);
    }
    partialFiles_.clear();
}

ExtractResult ArchiveExtractor::extract(const QString &archivePath, const QString &outputDir)
{
    ExtractResult result;
    partialFiles_.clear();
    lastPercent_ = -1;

    // First pass: list entries to choose the layout and compute totals
    std::vector<EntryInfo> entries;
    {
        ZipReader reader;
        if (!reader.open(archivePath)) {
            result.error = ErrorCategory::Filesystem;
            result.errorMessage = tr("Cannot open archive %1: %2").arg(archivePath, reader.errorString());
            return result;
        }

        struct archive_entry *entry = nullptr;
        int rc = ARCHIVE_OK;
        while ((rc = archive_read_next_header(reader.handle(), &entry)) == ARCHIVE_OK
               || rc == ARCHIVE_WARN) {
            EntryInfo info;
            info.rawPath = QString::fromUtf8(archive_entry_pathname(entry));
            info.path = sanitizeEntryPath(info.rawPath);
            info.isDirectory = archive_entry_filetype(entry) == AE_IFDIR || info.rawPath.endsWith('/');
            info.size = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;
            entries.push_back(info);
            archive_read_data_skip(reader.handle());
        }
        if (rc != ARCHIVE_EOF) {
            result.error = ErrorCategory::Filesystem;
            result.errorMessage = tr("Cannot read archive %1: %2").arg(archivePath, reader.errorString());
            return result;
        }
    }

    QStringList allPaths;
    qint64 totalBytes = 0;
    int totalFiles = 0;
    for (const EntryInfo &info : entries) {
        allPaths.append(info.rawPath);
        if (!info.isDirectory) {
            totalBytes += info.size;
            ++totalFiles;
        }
    }

    result.preservedStructure = shouldPreserveStructure(allPaths);
    LOG_VERBOSE() << QFileInfo(archivePath).fileName() << ":" << totalFiles << "files,"
                  << (result.preservedStructure ? "preserving folders" : "flattening");

    if (!QDir().mkpath(outputDir)) {
        result.error = ErrorCategory::Filesystem;
        result.errorMessage = tr("Cannot create directory %1").arg(outputDir);
        return result;
    }

    ZipReader reader;
    if (!reader.open(archivePath)) {
        result.error = ErrorCategory::Filesystem;
        result.errorMessage = tr("Cannot open archive %1: %2").arg(archivePath, reader.errorString());
        return result;
    }

    QDir output(outputDir);
    std::vector<char> buffer(static_cast<size_t>(BlockSize));
    qint64 doneBytes = 0;
    int doneFiles = 0;
    reportProgress(0, totalBytes, 0, totalFiles);

    auto interrupted = [this, &result, &outputDir](Interrupt interrupt) {
        removePartialFiles(outputDir);
        if (interrupt == Interrupt::Pause) {
            result.status = ExtractResult::Status::Paused;
            emit paused();
        } else {
            result.status = ExtractResult::Status::Stopped;
        }
        return result;
    };

    struct archive_entry *entry = nullptr;
    for (const EntryInfo &info : entries) {
        Interrupt interrupt = pendingInterrupt();
        if (interrupt != Interrupt::None) {
            return interrupted(interrupt);
        }

        int rc = archive_read_next_header(reader.handle(), &entry);
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
            result.error = ErrorCategory::ArchiveEntryCorrupt;
            result.errorMessage = tr("Archive ended early at %1: %2").arg(info.rawPath, reader.errorString());
            removePartialFiles(outputDir);
            return result;
        }

        if (info.path.isEmpty()) {
            if (!info.rawPath.isEmpty() && info.rawPath != QLatin1String("./")) {
                qWarning() << "Skipping unsafe archive entry" << info.rawPath;
                result.skippedEntries.append(info.rawPath);
            }
            archive_read_data_skip(reader.handle());
            continue;
        }

        if (info.isDirectory) {
            if (result.preservedStructure) {
                output.mkpath(info.path);
            }
            archive_read_data_skip(reader.handle());
            continue;
        }

        QString destination = result.preservedStructure
            ? output.filePath(info.path)
            : output.filePath(QFileInfo(info.path).fileName());

        QFileInfo existing(destination);
        if (existing.exists()) {
            if (existing.isFile() && existing.size() == info.size) {
                LOG_VERBOSE() << "Already extracted:" << destination;
                result.extractedPaths.append(destination);
                archive_read_data_skip(reader.handle());
                doneBytes += info.size;
                ++doneFiles;
                reportProgress(doneBytes, totalBytes, doneFiles, totalFiles);
                continue;
            }

            ConflictDecision decision = ConflictDecision::Overwrite;
            if (resolver_) {
                Conflict conflict{destination, existing.size(), info.size};
                decision = resolver_->resolve(conflict, ConflictContext::Extraction).decision;
            }

            if (decision == ConflictDecision::Cancel) {
                removePartialFiles(outputDir);
                result.error = ErrorCategory::ConflictCancelled;
                result.errorMessage = tr("Extraction cancelled at %1").arg(destination);
                return result;
            }
            if (decision == ConflictDecision::Skip) {
                result.extractedPaths.append(destination);
                archive_read_data_skip(reader.handle());
                doneBytes += info.size;
                ++doneFiles;
                reportProgress(doneBytes, totalBytes, doneFiles, totalFiles);
                continue;
            }
            if (decision == ConflictDecision::Rename) {
                destination = FileUtils::generateUniqueFilename(destination);
            }
        }

        emit entryStarted(destination);

        if (!QDir().mkpath(QFileInfo(destination).absolutePath())) {
            qWarning() << "Cannot create directory for" << destination;
            result.skippedEntries.append(info.rawPath);
            archive_read_data_skip(reader.handle());
            continue;
        }

        QFile file(destination);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qWarning() << "Cannot write" << destination << file.errorString();
            result.skippedEntries.append(info.rawPath);
            archive_read_data_skip(reader.handle());
            continue;
        }
        partialFiles_.append(destination);

        bool large = info.size > LargeEntryThreshold;
        qint64 entryBytes = 0;
        QString entryError;
        bool fatal = false;

        while (true) {
            la_ssize_t n = archive_read_data(reader.handle(), buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (n < 0) {
                entryError = reader.errorString();
                fatal = n == ARCHIVE_FATAL;
                break;
            }
            if (file.write(buffer.data(), n) != n) {
                entryError = file.errorString();
                break;
            }
            entryBytes += n;

            if (large) {
                reportProgress(doneBytes + entryBytes, totalBytes, doneFiles, totalFiles);
            }

            interrupt = pendingInterrupt();
            if (interrupt != Interrupt::None) {
                file.close();
                return interrupted(interrupt);
            }
        }
        file.close();

        if (!entryError.isEmpty()) {
            // One bad entry must not sink the rest of the archive
            qWarning().noquote() << "Skipping corrupt entry" << info.rawPath << ":" << entryError;
            partialFiles_.removeAll(destination);
            QFile::remove(destination);
            FileUtils::removeEmptyParents(destination, outputDir);
            result.skippedEntries.append(info.rawPath);
            doneBytes += info.size;
            ++doneFiles;
            reportProgress(doneBytes, totalBytes, doneFiles, totalFiles);

            if (fatal) {
                result.error = ErrorCategory::ArchiveEntryCorrupt;
                result.errorMessage = tr("Archive unreadable after %1: %2").arg(info.rawPath, entryError);
                removePartialFiles(outputDir);
                return result;
            }
            continue;
        }

        partialFiles_.removeAll(destination);
        result.extractedPaths.append(destination);
        doneBytes += info.size;
        ++doneFiles;
        emit entryExtracted(destination);
        reportProgress(doneBytes, totalBytes, doneFiles, totalFiles);
    }

    if (!result.skippedEntries.isEmpty()) {
        result.error = ErrorCategory::ArchiveEntryCorrupt;
        result.errorMessage = tr("%n entries skipped", nullptr, result.skippedEntries.size());
    }
    result.status = ExtractResult::Status::Completed;
    return result;
}
