/**
 * @file archiveextractor.h
 * @brief Streaming, resumable zip extraction built on libarchive.
 */

#ifndef ARCHIVEEXTRACTOR_H
#define ARCHIVEEXTRACTOR_H

#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>

#include "errorhandler.h"

class ConflictResolver;

/**
 * @brief Outcome of one ArchiveExtractor::extract() call.
 */
struct ExtractResult {
    enum class Status {
        Completed,  ///< Every entry is on disk (or was skipped as corrupt)
        Paused,     ///< pause() took effect; partial files removed
        Stopped,    ///< stop() took effect; partial files removed
        Failed      ///< Archive unreadable, or a conflict was cancelled
    };

    Status status = Status::Failed;
    QStringList extractedPaths;   ///< Destination paths now present on disk
    QStringList skippedEntries;   ///< Entries that could not be extracted
    bool preservedStructure = false;
    ErrorCategory error = ErrorCategory::None;
    QString errorMessage;

    [[nodiscard]] bool isSuccess() const { return status == Status::Completed; }
};

/**
 * @brief Extracts a zip container to a directory, one entry at a time.
 *
 * The folder layout is decided once per archive: a single wrapping
 * top-level folder is preserved, anything else is flattened into the
 * output directory. Entries already present with their declared size are
 * skipped, which makes a repeated call resume an interrupted extraction.
 *
 * pause() and stop() take effect between entries and between 8 MiB
 * blocks; partially written files are deleted before returning, together
 * with any directories that became empty.
 *
 * Destinations that exist with a different size are routed through the
 * ConflictResolver in the Extraction context. Without a resolver they are
 * overwritten.
 */
class ArchiveExtractor : public QObject
{
    Q_OBJECT

public:
    static constexpr qint64 BlockSize = 8 * 1024 * 1024;
    static constexpr qint64 LargeEntryThreshold = 50 * 1000 * 1000;

    explicit ArchiveExtractor(std::shared_ptr<ConflictResolver> resolver = nullptr,
                              QObject *parent = nullptr);
    ~ArchiveExtractor() override = default;

    /**
     * @brief Extracts @p archivePath into @p outputDir.
     * @return Structured result listing every destination path written
     *         or found complete.
     */
    ExtractResult extract(const QString &archivePath, const QString &outputDir);

    void pause();
    void stop();
    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] bool isStopped() const;

    /**
     * @brief Decides whether the archive's folder structure is kept.
     * @param entryPaths All entry paths as stored in the archive.
     * @return True when every entry lives under one shared top-level
     *         folder; false when entries should be flattened.
     */
    [[nodiscard]] static bool shouldPreserveStructure(const QStringList &entryPaths);

    /**
     * @brief Normalizes an entry path ("./a//b/" -> "a/b").
     * @return The normalized path, or an empty string for paths that would
     *         escape the output directory.
     */
    [[nodiscard]] static QString sanitizeEntryPath(const QString &entryPath);

signals:
    /**
     * @brief Overall progress, max(bytes fraction, files fraction) x 100.
     */
    void progressChanged(int percent);

    /**
     * @brief Emitted before an entry is written.
     */
    void entryStarted(const QString &destinationPath);

    /**
     * @brief Emitted after an entry is complete on disk.
     */
    void entryExtracted(const QString &destinationPath);

    /**
     * @brief Emitted when the extraction returns because of pause().
     */
    void paused();

private:
    enum class Interrupt { None, Pause, Stop };

    [[nodiscard]] Interrupt pendingInterrupt() const;
    void removePartialFiles(const QString &outputDir);
    void reportProgress(qint64 doneBytes, qint64 totalBytes, int doneFiles, int totalFiles);

    std::shared_ptr<ConflictResolver> resolver_;

    mutable QMutex mutex_;
    bool pauseRequested_ = false;
    bool stopRequested_ = false;

    QStringList partialFiles_;
    int lastPercent_ = -1;
};

#endif // ARCHIVEEXTRACTOR_H
