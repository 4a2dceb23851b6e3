/**
 * @file downloadservice.h
 * @brief Facade over the queue, the pause record and the pipeline thread.
 */

#ifndef DOWNLOADSERVICE_H
#define DOWNLOADSERVICE_H

#include <QList>
#include <QObject>
#include <QString>
#include <QThread>

#include <memory>

#include "pausestatestore.h"
#include "pipelinecontext.h"
#include "stageorchestrator.h"
#include "../models/queueitem.h"

class BlockingDecisionChannel;

/**
 * @brief Manages queued downloads and the thread that processes them.
 *
 * DownloadService owns the StageOrchestrator and runs StageOrchestrator::
 * runQueue() on a dedicated thread. It restores an interrupted session at
 * startup, so a later start() re-enters the paused item at its recorded
 * stage.
 *
 * All public methods are meant to be called from the thread that owns the
 * service (normally the main thread).
 *
 * @par Example usage:
 * @code
 * DownloadService service(context);
 * service.restoreSession();
 * service.enqueue("ps2", "Game (USA).zip", "1.2 GiB");
 * connect(&service, &DownloadService::runFinished, &app, &QCoreApplication::quit);
 * service.start();
 * @endcode
 */
class DownloadService : public QObject
{
    Q_OBJECT

public:
    static constexpr int ShutdownWaitMs = 2 * StageOrchestrator::StopWaitMs;

    explicit DownloadService(PipelineContext context, QObject *parent = nullptr);
    ~DownloadService() override;

    /// @name Queue Management
    /// @{

    /**
     * @brief Appends a remote file to the queue.
     * @return False for duplicates and empty names.
     */
    bool enqueue(const QString &platformId, const QString &fileName,
                 const QString &sizeLabel = QString());

    /**
     * @brief Removes a queued or paused item.
     *
     * The item being processed cannot be removed. If @p deletePartial is
     * set, the partial download in the processing directory is deleted as
     * well. A pause record for the item is cleared.
     */
    bool removeItem(const QString &displayName, bool deletePartial = false);

    bool moveItem(int from, int to);

    /**
     * @brief Empties the queue. Refused while a run is active.
     */
    bool clearQueue();

    [[nodiscard]] QList<QueueItem> items() const;
    /// @}

    /// @name Session
    /// @{

    /**
     * @brief Loads the persisted queue and any pause record.
     *
     * If the loaded queue lacks the paused item (a missing or damaged
     * queue file), the queue is rebuilt from the record's remaining items,
     * followed by any loaded items the record does not name.
     *
     * @return True if an interrupted item will be resumed by start().
     */
    bool restoreSession();

    [[nodiscard]] bool hasPendingResume() const { return hasPendingResume_; }
    [[nodiscard]] PauseState pendingResume() const { return pendingResume_; }
    /// @}

    /// @name Run Control
    /// @{
    bool start();
    void pause();
    void resume();

    /**
     * @brief Stops the run, writing the pause record, and waits for the
     *        pipeline thread for at most ShutdownWaitMs.
     *
     * A thread still running after that is released: it deletes itself
     * once it finishes and is never reused.
     */
    void stop();

    /**
     * @brief Like stop(), but also releases a pending conflict prompt.
     */
    void shutdown();

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] bool isPaused() const { return paused_; }
    /// @}

    /**
     * @brief Channel to abort on shutdown, when conflicts are answered on
     *        the owning thread.
     */
    void setDecisionChannel(std::shared_ptr<BlockingDecisionChannel> channel);

    [[nodiscard]] StageOrchestrator *orchestrator() const { return orchestrator_.get(); }

signals:
    void runningChanged(bool running);
    void pausedChanged(bool paused);
    void statusMessage(const QString &message, int timeout);
    void runFinished(StageOrchestrator::RunStatus status);

private slots:
    void onRunThreadFinished();

private:
    void setPaused(bool paused);
    void reapRunThread();
    void releaseRunThread();
    bool rebuildQueueFrom(const PauseState &state);

    PipelineContext context_;
    // Shared with the pipeline thread, which may outlive the service
    std::shared_ptr<StageOrchestrator> orchestrator_;
    std::unique_ptr<QThread> runThread_;
    std::shared_ptr<StageOrchestrator::RunStatus> runStatus_;
    std::shared_ptr<BlockingDecisionChannel> decisionChannel_;

    bool hasPendingResume_ = false;
    PauseState pendingResume_;

    bool paused_ = false;
    bool resumeAfterRun_ = false;
};

#endif // DOWNLOADSERVICE_H
