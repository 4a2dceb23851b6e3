#include "downloadservice.h"
#include "appsettings.h"
#include "conflictresolver.h"
#include "queuestore.h"
#include "../utils/logging.h"

#include <QDir>
#include <QFile>

#include <utility>

DownloadService::DownloadService(PipelineContext context, QObject *parent)
    : QObject(parent)
    , context_(std::move(context))
    , orchestrator_(std::make_shared<StageOrchestrator>(context_))
{
}

DownloadService::~DownloadService()
{
    shutdown();
}

// ---------------------------------------------------------------------------
// Queue management
// ---------------------------------------------------------------------------

bool DownloadService::enqueue(const QString &platformId, const QString &fileName,
                              const QString &sizeLabel)
{
    QString id = platformId.trimmed().toLower();
    QString name = fileName.trimmed();
    if (id.isEmpty() || name.isEmpty()) {
        return false;
    }

    QueueItem item;
    item.platformId = id;
    item.displayName = QueueItem::makeDisplayName(id, name);
    item.sizeLabel = sizeLabel;

    if (!context_.queue->enqueue(item)) {
        if (context_.queue->contains(item.displayName)) {
            emit statusMessage(tr("%1 is already queued").arg(item.displayName), 3000);
        }
        return false;
    }
    LOG_VERBOSE() << "Queued" << item.displayName;
    return true;
}

bool DownloadService::removeItem(const QString &displayName, bool deletePartial)
{
    if (isRunning() && orchestrator_->currentItem() == displayName) {
        emit statusMessage(tr("Cannot remove %1 while it is being processed").arg(displayName), 5000);
        return false;
    }

    QueueItem item = context_.queue->item(displayName);
    if (item.displayName.isEmpty()) {
        return false;
    }
    if (!context_.queue->remove(displayName)) {
        return false;
    }

    if (deletePartial) {
        QString partial = QDir(context_.settings->processingDir()).filePath(item.fileName());
        if (QFile::exists(partial)) {
            if (QFile::remove(partial)) {
                qInfo() << "Deleted partial download" << partial;
            } else {
                qWarning() << "Could not delete" << partial;
            }
        }
    }

    PauseState state;
    bool recordRefersToItem = (hasPendingResume_ && pendingResume_.currentItem == displayName)
                              || (context_.pauseStore->load(&state) && state.currentItem == displayName);
    if (recordRefersToItem) {
        context_.pauseStore->clear();
        hasPendingResume_ = false;
        pendingResume_ = PauseState();
    }
    return true;
}

bool DownloadService::moveItem(int from, int to)
{
    return context_.queue->move(from, to);
}

bool DownloadService::clearQueue()
{
    if (isRunning()) {
        emit statusMessage(tr("Cannot clear the queue while processing"), 5000);
        return false;
    }
    context_.pauseStore->clear();
    hasPendingResume_ = false;
    return context_.queue->clear();
}

QList<QueueItem> DownloadService::items() const
{
    return context_.queue->items();
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

bool DownloadService::restoreSession()
{
    if (!context_.queue->load()) {
        emit statusMessage(tr("Queue could not be loaded: %1").arg(context_.queue->lastError()), 0);
    }

    hasPendingResume_ = false;
    PauseState state;
    if (!context_.pauseStore->load(&state)) {
        return false;
    }
    if (!context_.queue->contains(state.currentItem) && !rebuildQueueFrom(state)) {
        qWarning() << "Pause record refers to" << state.currentItem << "which cannot be queued";
        context_.pauseStore->clear();
        return false;
    }

    pendingResume_ = state;
    hasPendingResume_ = true;
    context_.queue->setItemStage(state.currentItem, ItemStage::Paused);
    qInfo().noquote() << tr("Interrupted session: %1 at %2 (%3)")
                             .arg(state.currentItem, state.operation, state.queuePosition);
    return true;
}

bool DownloadService::rebuildQueueFrom(const PauseState &state)
{
    QList<QueueItem> rebuilt;
    QStringList names;
    names.append(state.currentItem);
    names.append(state.remainingQueue);

    // Duplicates are dropped by replaceAll()
    for (const QString &name : std::as_const(names)) {
        QueueItem item = QueueItem::fromDisplayName(name);
        if (item.platformId.isEmpty()) {
            qWarning() << "Dropping unrecognised queue entry" << name;
            continue;
        }
        rebuilt.append(item);
    }
    if (rebuilt.isEmpty() || rebuilt.first().displayName != state.currentItem) {
        return false;
    }

    const QList<QueueItem> loaded = context_.queue->items();
    for (const QueueItem &item : loaded) {
        if (!names.contains(item.displayName)) {
            rebuilt.append(item);
        }
    }

    if (!context_.queue->replaceAll(rebuilt)) {
        qWarning() << "Could not rebuild the queue:" << context_.queue->lastError();
        return false;
    }
    qInfo() << "Rebuilt the queue from the pause record with" << context_.queue->count() << "items";
    return true;
}

// ---------------------------------------------------------------------------
// Run control
// ---------------------------------------------------------------------------

bool DownloadService::isRunning() const
{
    return runThread_ && runThread_->isRunning();
}

bool DownloadService::start()
{
    // A released thread may still be winding down the previous run
    if (runThread_ || orchestrator_->isRunning()) {
        return false;
    }
    if (context_.queue->isEmpty()) {
        emit statusMessage(tr("Queue is empty"), 3000);
        return false;
    }

    bool resume = hasPendingResume_;
    PauseState resumeState = pendingResume_;
    hasPendingResume_ = false;
    resumeAfterRun_ = false;
    setPaused(false);

    std::shared_ptr<StageOrchestrator> orchestrator = orchestrator_;
    auto runStatus = std::make_shared<StageOrchestrator::RunStatus>(StageOrchestrator::RunStatus::Completed);
    runStatus_ = runStatus;
    runThread_.reset(QThread::create([orchestrator, runStatus, resume, resumeState]() {
        // Read only after the thread has been joined
        *runStatus = orchestrator->runQueue(resume ? &resumeState : nullptr);
    }));
    runThread_->setObjectName("PipelineThread");
    connect(runThread_.get(), &QThread::finished,
            this, &DownloadService::onRunThreadFinished, Qt::QueuedConnection);
    runThread_->start();

    emit runningChanged(true);
    return true;
}

void DownloadService::pause()
{
    if (!isRunning() || paused_) {
        return;
    }
    resumeAfterRun_ = false;
    orchestrator_->pause();
    setPaused(true);
    emit statusMessage(tr("Paused"), 3000);
}

void DownloadService::resume()
{
    if (!paused_ && !hasPendingResume_) {
        return;
    }

    if (isRunning()) {
        // A transfer resumes in place; any other stage returns Paused and
        // is restarted from the record once the run ends
        orchestrator_->resume();
        resumeAfterRun_ = true;
        setPaused(false);
        return;
    }

    PauseState state;
    if (context_.pauseStore->load(&state)) {
        pendingResume_ = state;
        hasPendingResume_ = true;
    }
    setPaused(false);
    start();
}

void DownloadService::stop()
{
    if (!runThread_) {
        return;
    }
    resumeAfterRun_ = false;
    orchestrator_->stop();
    if (!runThread_->wait(ShutdownWaitMs)) {
        qWarning() << "Pipeline thread did not finish within" << ShutdownWaitMs << "ms";
        releaseRunThread();
        return;
    }
    reapRunThread();
}

void DownloadService::releaseRunThread()
{
    QThread *thread = runThread_.release();
    disconnect(thread, nullptr, this, nullptr);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    // Finished between the wait and the connect
    if (thread->isFinished()) {
        thread->deleteLater();
    }
    runStatus_.reset();
    emit runningChanged(false);
    emit runFinished(StageOrchestrator::RunStatus::Stopped);
}

void DownloadService::shutdown()
{
    if (decisionChannel_) {
        decisionChannel_->abort();
    }
    stop();
}

void DownloadService::setDecisionChannel(std::shared_ptr<BlockingDecisionChannel> channel)
{
    decisionChannel_ = std::move(channel);
}

void DownloadService::setPaused(bool paused)
{
    if (paused_ == paused) {
        return;
    }
    paused_ = paused;
    emit pausedChanged(paused);
}

void DownloadService::onRunThreadFinished()
{
    reapRunThread();
}

void DownloadService::reapRunThread()
{
    if (!runThread_ || runThread_->isRunning()) {
        return;
    }
    runThread_->wait();
    runThread_.reset();

    StageOrchestrator::RunStatus status = runStatus_ ? *runStatus_ : StageOrchestrator::RunStatus::Stopped;
    runStatus_.reset();
    emit runningChanged(false);

    if (status == StageOrchestrator::RunStatus::Paused && resumeAfterRun_) {
        resumeAfterRun_ = false;
        PauseState state;
        if (context_.pauseStore->load(&state)) {
            pendingResume_ = state;
            hasPendingResume_ = true;
        }
        start();
        return;
    }

    setPaused(status == StageOrchestrator::RunStatus::Paused);
    emit runFinished(status);
}
