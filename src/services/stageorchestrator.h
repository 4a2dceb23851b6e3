/**
 * @file stageorchestrator.h
 * @brief Drives queued items through download, unzip, decrypt, extract,
 *        split and relocation.
 */

#ifndef STAGEORCHESTRATOR_H
#define STAGEORCHESTRATOR_H

#include <QDeadlineTimer>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include <exception>
#include <functional>
#include <memory>

#include "appsettings.h"
#include "errorhandler.h"
#include "pausestatestore.h"
#include "pipelinecontext.h"
#include "../models/platformprofile.h"
#include "../models/queueitem.h"
#include "../utils/stagetask.h"

class ArchiveExtractor;
class ChunkedFetcher;
class SplitWriter;

/**
 * @brief How processing of one item ended.
 */
struct ItemOutcome {
    enum class Status {
        Completed,  ///< Artifacts relocated, item removed from the queue
        Skipped,    ///< Final output already present and kept
        Failed,     ///< Item stays queued in its position
        Paused,     ///< Pause record written; item re-enters at stage
        Stopped     ///< Stop requested; pause record written
    };

    Status status = Status::Failed;
    ItemStage stage = ItemStage::Queued;  ///< Stage reached when processing ended
    ErrorCategory error = ErrorCategory::None;
    QString errorMessage;
    QStringList outputs;  ///< Final paths in the output layout

    [[nodiscard]] bool isFinished() const
    {
        return status == Status::Completed || status == Status::Skipped;
    }
};

/**
 * @brief Per-item state machine over the processing stages.
 *
 * Exactly one item is active at a time. Each stage runs on its own worker
 * thread while the calling thread waits on the stage's future, so
 * runQueue() must be called from a thread that may block (DownloadService
 * owns one for this).
 *
 * @par Pausing
 * pause() writes the pause record immediately. A transfer in progress
 * blocks in place and continues after resume(). Any other stage finishes
 * (or the extractor stops at its next block boundary), after which
 * runQueue() returns Paused. A later run given the record re-enters the
 * item at the recorded stage.
 *
 * @par Stopping
 * stop() writes the same record and cancels the active stage. A stage
 * that does not return within StopWaitMs is abandoned.
 *
 * pause(), resume(), stop() and the accessors may be called from any
 * thread.
 */
class StageOrchestrator : public QObject
{
    Q_OBJECT

public:
    enum class RunStatus { Completed, Paused, Stopped };
    Q_ENUM(RunStatus)

    static constexpr int StopWaitMs = 5000;
    static constexpr int PollIntervalMs = 50;
    static constexpr int MirrorCheckTimeoutMs = 2000;

    explicit StageOrchestrator(PipelineContext context, QObject *parent = nullptr);
    ~StageOrchestrator() override;

    /// @name Running
    /// @{

    /**
     * @brief Processes queued items in order until none is left to try.
     * @param resumePoint Optional pause record; its item is processed
     *        first, starting at the recorded stage.
     * @return Completed when every item was attempted, otherwise Paused or
     *         Stopped.
     */
    RunStatus runQueue(const PauseState *resumePoint = nullptr);

    /**
     * @brief Runs one item from @p startStage to completion.
     *
     * Used by runQueue(); does not touch the queue or the pause record.
     */
    ItemOutcome processItem(const QueueItem &item, ItemStage startStage = ItemStage::Downloading);
    /// @}

    /// @name Flow Control
    /// @{
    void pause();
    void resume();
    void stop();

    [[nodiscard]] bool isPauseRequested() const;
    [[nodiscard]] bool isStopRequested() const;
    [[nodiscard]] bool isRunning() const;
    /// @}

    /// @name Current Activity
    /// @{
    [[nodiscard]] QString currentItem() const;
    [[nodiscard]] ItemStage currentStage() const;
    [[nodiscard]] QString currentFilePath() const;
    /// @}

    /// @name Tuning
    /// @{

    /**
     * @brief Overrides the split part size for subsequent runs.
     */
    void setSplitPartSize(qint64 bytes);
    void setFetchBackoffBaseMs(int baseMs);
    void setFetchReadTimeoutMs(int timeoutMs);
    /// @}

    /**
     * @brief Undoes a decrypt that was interrupted between its renames.
     *
     * Renames every "<image>.enc" without a matching "<image>" back and
     * drops a stale "<image>.dec". An image whose extracted folder exists
     * was consumed by extraction and is left alone.
     *
     * @return Number of images restored.
     */
    static int recoverInterruptedDecrypts(const QString &processingDir);

signals:
    void runStarted(int totalItems);
    void itemStarted(const QString &itemName, int position, int total);
    void stageChanged(const QString &itemName, ItemStage stage);

    /**
     * @brief Percent complete of the current unzip, split or dkey stage.
     */
    void progressChanged(int percent);

    void transferProgress(qint64 bytesReceived, qint64 totalBytes);
    void speedChanged(double bytesPerSecond);
    void etaChanged(qint64 seconds);

    /**
     * @brief Emitted after the item was removed from the persisted queue.
     * @param skipped True when the final output was already present.
     */
    void itemCompleted(const QString &itemName, bool skipped);

    void itemFailed(const QString &itemName, ItemStage stage, const QString &error);
    void itemPaused(const QString &itemName, ItemStage stage);
    void itemResumed(const QString &itemName);
    void runFinished(StageOrchestrator::RunStatus status);

private:
    enum class WorkerStatus { Finished, Abandoned, Threw };

    /// Working state for the active item
    struct ItemWork {
        QueueItem item;
        PlatformProfile profile;
        PipelineOptions options;
        QString fileName;
        QString baseName;
        QString processingDir;
        QString outputDir;       ///< Platform root, or the title folder
        QString downloadPath;
        bool overwriteApproved = false;
        QStringList artifacts;   ///< Top-level paths in processingDir to relocate
        QStringList pendingDeletes;  ///< Removed once relocation succeeded
    };

    bool runDownload(ItemWork &work, ItemStage startStage, ItemOutcome *outcome);
    bool runUnzip(ItemWork &work, ItemOutcome *outcome);
    bool runDecrypt(ItemWork &work, ItemOutcome *outcome);
    bool runExtract(ItemWork &work, ItemOutcome *outcome);
    bool runSplit(ItemWork &work, ItemOutcome *outcome);
    bool runRelocate(ItemWork &work, ItemOutcome *outcome);

    bool fetchFile(const QUrl &url, const QString &localPath, int maxRetries, ItemOutcome *outcome);
    bool fetchDkey(ItemWork &work, const QString &dkeyPath, ItemOutcome *outcome);
    bool unzipInto(const QString &zipPath, const QString &outputDir,
                   QStringList *extracted, ItemOutcome *outcome);

    [[nodiscard]] QStringList existingFinalOutputs(const ItemWork &work) const;

    /**
     * @brief Rebuilds the artifact list from the processing directory when
     *        an item re-enters after its unzip stage.
     *
     * Key files, encrypted images and leftovers of finished stages before
     * @p startStage are queued for deletion unless the options keep them.
     */
    void collectArtifacts(ItemWork &work, ItemStage startStage) const;
    QUrl selectMirror(const QUrl &url);

    /**
     * @brief Announces @p stage and checks for a pending pause or stop.
     * @return False with @p outcome filled if the item must not proceed.
     */
    bool enterStage(ItemWork &work, ItemStage stage, ItemOutcome *outcome);

    void fail(ItemOutcome *outcome, ItemStage stage, ErrorCategory category, const QString &message);
    void setCurrentFilePath(const QString &path);

    void writePauseRecordLocked();
    void finishItem(const QString &itemName, const ItemOutcome &outcome);

    /**
     * @brief Runs @p fn on a fresh worker thread and waits for it.
     *
     * Returns Abandoned when a stop was requested and the worker did not
     * return within StopWaitMs, and Threw when the worker raised.
     */
    template <typename Result>
    WorkerStatus runOnWorker(std::function<Result()> fn, Result *result, QString *error)
    {
        StageTask<Result> task(std::move(fn));
        QDeadlineTimer stopDeadline(QDeadlineTimer::Forever);
        while (!task.waitFor(PollIntervalMs)) {
            if (!isStopRequested()) {
                continue;
            }
            if (stopDeadline.isForever()) {
                stopDeadline.setRemainingTime(StopWaitMs);
            } else if (stopDeadline.hasExpired()) {
                qWarning() << "Stage did not stop within" << StopWaitMs << "ms; abandoning it";
                task.abandon();
                return WorkerStatus::Abandoned;
            }
        }
        try {
            *result = task.take();
        } catch (const std::exception &e) {
            *error = QString::fromLocal8Bit(e.what());
            return WorkerStatus::Threw;
        }
        return WorkerStatus::Finished;
    }

    PipelineContext context_;

    mutable QMutex mutex_;
    bool running_ = false;
    bool pauseRequested_ = false;
    bool stopRequested_ = false;
    QString currentItem_;
    ItemStage currentStage_ = ItemStage::Queued;
    QString currentBaseName_;
    QString currentFilePath_;
    int processedCount_ = 0;
    int totalCount_ = 0;

    std::shared_ptr<ChunkedFetcher> activeFetcher_;
    std::shared_ptr<ArchiveExtractor> activeExtractor_;
    std::shared_ptr<SplitWriter> activeSplitter_;

    qint64 splitPartSizeOverride_ = 0;
    int fetchBackoffBaseMs_ = 0;
    int fetchReadTimeoutMs_ = 0;
};

#endif // STAGEORCHESTRATOR_H
