#include "stageorchestrator.h"
#include "archiveextractor.h"
#include "chunkedfetcher.h"
#include "conflictresolver.h"
#include "externaltools.h"
#include "queuestore.h"
#include "splitwriter.h"
#include "../utils/fileutils.h"
#include "../utils/logging.h"

#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSet>

#include <utility>

namespace {

struct RelocateJob {
    QStringList artifacts;
    QString outputDir;
    QString rapDir;
    bool overwriteApproved = false;
    bool routeLicenseFiles = false;
};

struct RelocateResult {
    bool ok = false;
    bool cancelled = false;
    QStringList outputs;
    QString errorMessage;
};

qint64 pathSize(const QFileInfo &info)
{
    if (!info.isDir()) {
        return info.size();
    }
    qint64 total = 0;
    QDirIterator it(info.absoluteFilePath(), QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        total += it.fileInfo().size();
    }
    return total;
}

bool removePath(const QString &path)
{
    QFileInfo info(path);
    if (info.isDir()) {
        return QDir(path).removeRecursively();
    }
    return !info.exists() || QFile::remove(path);
}

bool copyDirectory(const QString &source, const QString &destination)
{
    QDir sourceDir(source);
    if (!QDir().mkpath(destination)) {
        return false;
    }
    QDirIterator it(source, QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        QString target = QDir(destination).filePath(sourceDir.relativeFilePath(it.filePath()));
        if (it.fileInfo().isDir()) {
            if (!QDir().mkpath(target)) {
                return false;
            }
        } else if (!QFile::copy(it.filePath(), target)) {
            return false;
        }
    }
    return true;
}

// Rename when source and destination share a filesystem, copy otherwise
bool movePath(const QString &source, const QString &destination, QString *error)
{
    QDir().mkpath(QFileInfo(destination).absolutePath());
    if (QDir().rename(source, destination)) {
        return true;
    }

    QFileInfo info(source);
    bool copied = info.isDir() ? copyDirectory(source, destination)
                               : QFile::copy(source, destination);
    if (!copied) {
        removePath(destination);
        *error = QString("Cannot move %1 to %2").arg(source, destination);
        return false;
    }
    if (!removePath(source)) {
        qWarning() << "Moved but could not remove" << source;
    }
    return true;
}

RelocateResult relocateArtifacts(const RelocateJob &job, const std::shared_ptr<ConflictResolver> &resolver)
{
    RelocateResult result;

    for (const QString &source : job.artifacts) {
        QFileInfo sourceInfo(source);
        if (!sourceInfo.exists()) {
            continue;
        }

        QString targetDir = job.outputDir;
        if (job.routeLicenseFiles && sourceInfo.suffix().compare("rap", Qt::CaseInsensitive) == 0) {
            targetDir = job.rapDir;
        }
        if (!QDir().mkpath(targetDir)) {
            result.errorMessage = QString("Cannot create %1").arg(targetDir);
            return result;
        }

        QString destination = QDir(targetDir).filePath(sourceInfo.fileName());
        QFileInfo destinationInfo(destination);

        if (destinationInfo.exists()) {
            ConflictDecision decision = ConflictDecision::Overwrite;
            if (!job.overwriteApproved) {
                Conflict conflict{destination, pathSize(destinationInfo), pathSize(sourceInfo)};
                decision = resolver ? resolver->resolve(conflict, ConflictContext::Processing).decision
                                    : ConflictDecision::Cancel;
            }

            switch (decision) {
            case ConflictDecision::Overwrite:
                if (!removePath(destination)) {
                    result.errorMessage = QString("Cannot replace %1").arg(destination);
                    return result;
                }
                break;
            case ConflictDecision::Skip:
                removePath(source);
                result.outputs.append(destination);
                continue;
            case ConflictDecision::Rename:
                destination = sourceInfo.isDir() ? FileUtils::generateUniqueDirname(destination)
                                                 : FileUtils::generateUniqueFilename(destination);
                break;
            case ConflictDecision::Cancel:
                result.cancelled = true;
                result.errorMessage = QString("Relocation of %1 cancelled").arg(sourceInfo.fileName());
                return result;
            }
        }

        QString error;
        if (!movePath(source, destination, &error)) {
            result.errorMessage = error;
            return result;
        }
        LOG_VERBOSE() << "Relocated" << source << "->" << destination;
        result.outputs.append(destination);
    }

    result.ok = true;
    return result;
}

bool hasExtension(const QString &path, const QStringList &extensions)
{
    for (const QString &ext : extensions) {
        if (path.endsWith(ext, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

QStringList filesWithExtension(const QStringList &paths, const QString &ext)
{
    QStringList result;
    for (const QString &path : paths) {
        if (path.endsWith(ext, Qt::CaseInsensitive) && QFileInfo(path).isFile()) {
            result.append(path);
        }
    }
    return result;
}

} // namespace

StageOrchestrator::StageOrchestrator(PipelineContext context, QObject *parent)
    : QObject(parent)
    , context_(std::move(context))
{
    qRegisterMetaType<ItemStage>("ItemStage");
    qRegisterMetaType<StageOrchestrator::RunStatus>("StageOrchestrator::RunStatus");
}

StageOrchestrator::~StageOrchestrator() = default;

// ---------------------------------------------------------------------------
// Flow control
// ---------------------------------------------------------------------------

void StageOrchestrator::pause()
{
    std::shared_ptr<ChunkedFetcher> fetcher;
    std::shared_ptr<ArchiveExtractor> extractor;
    {
        QMutexLocker locker(&mutex_);
        if (!running_ || pauseRequested_ || stopRequested_) {
            return;
        }
        pauseRequested_ = true;
        fetcher = activeFetcher_;
        extractor = activeExtractor_;
        writePauseRecordLocked();
    }

    qInfo() << "Pause requested";
    if (fetcher) {
        fetcher->pause();
    }
    if (extractor) {
        extractor->pause();
    }
}

void StageOrchestrator::resume()
{
    std::shared_ptr<ChunkedFetcher> fetcher;
    {
        QMutexLocker locker(&mutex_);
        if (!pauseRequested_) {
            return;
        }
        pauseRequested_ = false;
        fetcher = activeFetcher_;
    }

    qInfo() << "Resume requested";
    if (fetcher) {
        fetcher->resume();
    }
}

void StageOrchestrator::stop()
{
    std::shared_ptr<ChunkedFetcher> fetcher;
    std::shared_ptr<ArchiveExtractor> extractor;
    std::shared_ptr<SplitWriter> splitter;
    {
        QMutexLocker locker(&mutex_);
        if (!running_ || stopRequested_) {
            return;
        }
        stopRequested_ = true;
        fetcher = activeFetcher_;
        extractor = activeExtractor_;
        splitter = activeSplitter_;
        writePauseRecordLocked();
    }

    qInfo() << "Stop requested";
    if (fetcher) {
        fetcher->cancel();
    }
    if (extractor) {
        extractor->stop();
    }
    if (splitter) {
        splitter->stop();
    }
}

bool StageOrchestrator::isPauseRequested() const
{
    QMutexLocker locker(&mutex_);
    return pauseRequested_;
}

bool StageOrchestrator::isStopRequested() const
{
    QMutexLocker locker(&mutex_);
    return stopRequested_;
}

bool StageOrchestrator::isRunning() const
{
    QMutexLocker locker(&mutex_);
    return running_;
}

QString StageOrchestrator::currentItem() const
{
    QMutexLocker locker(&mutex_);
    return currentItem_;
}

ItemStage StageOrchestrator::currentStage() const
{
    QMutexLocker locker(&mutex_);
    return currentStage_;
}

QString StageOrchestrator::currentFilePath() const
{
    QMutexLocker locker(&mutex_);
    return currentFilePath_;
}

void StageOrchestrator::setCurrentFilePath(const QString &path)
{
    QMutexLocker locker(&mutex_);
    currentFilePath_ = path;
}

void StageOrchestrator::setSplitPartSize(qint64 bytes)
{
    splitPartSizeOverride_ = bytes;
}

void StageOrchestrator::setFetchBackoffBaseMs(int baseMs)
{
    fetchBackoffBaseMs_ = baseMs;
}

void StageOrchestrator::setFetchReadTimeoutMs(int timeoutMs)
{
    fetchReadTimeoutMs_ = timeoutMs;
}

// ---------------------------------------------------------------------------
// Queue loop
// ---------------------------------------------------------------------------

StageOrchestrator::RunStatus StageOrchestrator::runQueue(const PauseState *resumePoint)
{
    QString resumeItem;
    ItemStage resumeStage = ItemStage::Downloading;
    int processedBefore = 0;

    if (resumePoint) {
        if (context_.queue->contains(resumePoint->currentItem)) {
            resumeItem = resumePoint->currentItem;
            resumeStage = resumePoint->stage();
            processedBefore = resumePoint->processedCount;
        } else {
            qWarning() << "Paused item" << resumePoint->currentItem << "is no longer queued";
            context_.pauseStore->clear();
        }
    }
    if (static_cast<int>(resumeStage) < static_cast<int>(ItemStage::Downloading)) {
        resumeStage = ItemStage::Downloading;
    }

    const int initialCount = context_.queue->count();
    {
        QMutexLocker locker(&mutex_);
        running_ = true;
        pauseRequested_ = false;
        stopRequested_ = false;
        processedCount_ = processedBefore;
        totalCount_ = processedBefore + initialCount;
    }

    context_.resolver->reset();
    int recovered = recoverInterruptedDecrypts(context_.settings->processingDir());
    if (recovered > 0) {
        qInfo() << "Restored" << recovered << "images from an interrupted decrypt";
    }

    qInfo() << "Processing" << initialCount << "queued items";
    emit runStarted(initialCount);

    QSet<QString> attempted;
    RunStatus status = RunStatus::Completed;

    while (true) {
        if (isStopRequested()) {
            status = RunStatus::Stopped;
            break;
        }
        if (isPauseRequested()) {
            status = RunStatus::Paused;
            break;
        }

        QueueItem next;
        ItemStage startStage = ItemStage::Downloading;
        int remaining = 0;
        const QList<QueueItem> queued = context_.queue->items();
        for (const QueueItem &candidate : queued) {
            if (attempted.contains(candidate.displayName)) {
                continue;
            }
            ++remaining;
            if (next.displayName.isEmpty()) {
                next = candidate;
            }
        }

        if (!resumeItem.isEmpty()) {
            QueueItem resumed = context_.queue->item(resumeItem);
            if (!resumed.displayName.isEmpty()) {
                next = resumed;
                startStage = resumeStage;
                qInfo() << "Resuming" << resumeItem << "at" << itemStageToString(resumeStage);
            }
            resumeItem.clear();
        }

        if (next.displayName.isEmpty()) {
            break;
        }
        attempted.insert(next.displayName);

        int position = 0;
        int total = 0;
        {
            QMutexLocker locker(&mutex_);
            currentItem_ = next.displayName;
            currentBaseName_ = next.baseName();
            currentStage_ = ItemStage::Queued;
            currentFilePath_.clear();
            totalCount_ = processedCount_ + remaining;
            position = processedCount_ + 1;
            total = totalCount_;
        }

        qInfo().noquote() << QString("[%1/%2] %3").arg(position).arg(total).arg(next.displayName);
        emit itemStarted(next.displayName, position, total);

        ItemOutcome outcome;
        try {
            outcome = processItem(next, startStage);
        } catch (const std::exception &e) {
            fail(&outcome, currentStage(), ErrorCategory::Filesystem, QString::fromLocal8Bit(e.what()));
        }
        finishItem(next.displayName, outcome);

        if (outcome.status == ItemOutcome::Status::Paused) {
            status = RunStatus::Paused;
            break;
        }
        if (outcome.status == ItemOutcome::Status::Stopped) {
            status = RunStatus::Stopped;
            break;
        }
    }

    {
        QMutexLocker locker(&mutex_);
        running_ = false;
        currentItem_.clear();
        currentBaseName_.clear();
        currentFilePath_.clear();
        currentStage_ = ItemStage::Queued;
    }

    if (status == RunStatus::Completed) {
        context_.pauseStore->clear();
        qInfo() << "Queue run finished";
    }
    emit runFinished(status);
    return status;
}

void StageOrchestrator::finishItem(const QString &itemName, const ItemOutcome &outcome)
{
    switch (outcome.status) {
    case ItemOutcome::Status::Completed:
    case ItemOutcome::Status::Skipped: {
        context_.queue->setItemStage(itemName, ItemStage::Completed);
        // Persisted before anyone hears about the completion
        if (!context_.queue->remove(itemName)) {
            qWarning() << "Could not persist removal of" << itemName << ":"
                       << context_.queue->lastError();
        }
        context_.pauseStore->clear();
        {
            QMutexLocker locker(&mutex_);
            ++processedCount_;
        }
        bool skipped = outcome.status == ItemOutcome::Status::Skipped;
        qInfo() << (skipped ? "Already present:" : "Completed:") << itemName;
        emit itemCompleted(itemName, skipped);
        break;
    }
    case ItemOutcome::Status::Failed: {
        context_.queue->setItemStage(itemName, ItemStage::Failed);
        context_.pauseStore->clear();
        {
            QMutexLocker locker(&mutex_);
            ++processedCount_;
        }
        context_.errorHandler->handleItemFailed(itemName,
                                                QString(itemStageToString(outcome.stage)).toLower(),
                                                outcome.error, outcome.errorMessage);
        emit itemFailed(itemName, outcome.stage, outcome.errorMessage);
        break;
    }
    case ItemOutcome::Status::Paused:
    case ItemOutcome::Status::Stopped: {
        context_.queue->setItemStage(itemName, ItemStage::Paused);
        {
            QMutexLocker locker(&mutex_);
            writePauseRecordLocked();
        }
        emit itemPaused(itemName, outcome.stage);
        break;
    }
    }
}

void StageOrchestrator::writePauseRecordLocked()
{
    if (currentItem_.isEmpty()) {
        return;
    }

    PauseState state;
    state.timestamp = QDateTime::currentDateTime();
    state.currentItem = currentItem_;
    state.operation = stageToOperation(currentStage_);
    if (state.operation.isEmpty()) {
        state.operation = stageToOperation(ItemStage::Downloading);
    }
    // Only paths that identify the item are recorded
    if (QFileInfo(currentFilePath_).fileName().startsWith(currentBaseName_)) {
        state.filePath = currentFilePath_;
    }
    state.processedCount = processedCount_;
    state.totalCount = qMax(totalCount_, processedCount_ + 1);
    state.queuePosition = QString("%1/%2").arg(processedCount_ + 1).arg(state.totalCount);

    state.remainingQueue.append(currentItem_);
    const QStringList names = context_.queue->names();
    for (const QString &name : names) {
        if (name != currentItem_) {
            state.remainingQueue.append(name);
        }
    }

    if (!context_.pauseStore->save(state)) {
        qWarning() << "Could not write pause state:" << context_.pauseStore->lastError();
    }
}

// ---------------------------------------------------------------------------
// Item processing
// ---------------------------------------------------------------------------

ItemOutcome StageOrchestrator::processItem(const QueueItem &item, ItemStage startStage)
{
    ItemWork work;
    work.item = item;
    work.profile = platformProfile(item.platformId);
    work.options = context_.settings->options();
    if (splitPartSizeOverride_ > 0) {
        work.options.splitPartSize = splitPartSizeOverride_;
    }
    work.fileName = item.fileName();
    work.baseName = item.baseName();
    work.processingDir = context_.settings->processingDir();

    QString platformRoot = context_.settings->platformOutputDir(item.platformId);
    work.outputDir = work.options.organizeIntoTitleFolders ? QDir(platformRoot).filePath(work.baseName)
                                                           : platformRoot;
    work.downloadPath = QDir(work.processingDir).filePath(work.fileName);

    ItemOutcome outcome;
    outcome.stage = startStage;

    if (item.platformId.isEmpty()) {
        fail(&outcome, ItemStage::Queued, ErrorCategory::Filesystem,
             QString("\"%1\" has no platform prefix").arg(item.displayName));
        return outcome;
    }
    if (!QDir().mkpath(work.processingDir)) {
        fail(&outcome, ItemStage::Queued, ErrorCategory::Filesystem,
             QString("Cannot create %1").arg(work.processingDir));
        return outcome;
    }

    const int start = static_cast<int>(startStage);
    if (start <= static_cast<int>(ItemStage::Unzipping)) {
        if (!runDownload(work, startStage, &outcome) || !runUnzip(work, &outcome)) {
            return outcome;
        }
    } else {
        collectArtifacts(work);
        if (work.artifacts.isEmpty()) {
            fail(&outcome, startStage, ErrorCategory::Filesystem,
                 QString("Nothing left in %1 to resume %2").arg(work.processingDir, work.baseName));
            return outcome;
        }
    }

    if (start <= static_cast<int>(ItemStage::Decrypting) && !runDecrypt(work, &outcome)) {
        return outcome;
    }
    if (start <= static_cast<int>(ItemStage::Extracting) && !runExtract(work, &outcome)) {
        return outcome;
    }
    if (start <= static_cast<int>(ItemStage::Splitting) && !runSplit(work, &outcome)) {
        return outcome;
    }
    if (!runRelocate(work, &outcome)) {
        return outcome;
    }

    outcome.status = ItemOutcome::Status::Completed;
    outcome.stage = ItemStage::Completed;
    return outcome;
}

bool StageOrchestrator::enterStage(ItemWork &work, ItemStage stage, ItemOutcome *outcome)
{
    {
        QMutexLocker locker(&mutex_);
        currentStage_ = stage;
    }
    context_.queue->setItemStage(work.item.displayName, stage);
    emit stageChanged(work.item.displayName, stage);
    LOG_VERBOSE() << work.item.displayName << "->" << itemStageToString(stage);

    outcome->stage = stage;
    if (isStopRequested()) {
        outcome->status = ItemOutcome::Status::Stopped;
        return false;
    }
    if (isPauseRequested()) {
        outcome->status = ItemOutcome::Status::Paused;
        return false;
    }
    return true;
}

void StageOrchestrator::fail(ItemOutcome *outcome, ItemStage stage, ErrorCategory category,
                             const QString &message)
{
    outcome->status = ItemOutcome::Status::Failed;
    outcome->stage = stage;
    outcome->error = category;
    outcome->errorMessage = message;
}

// ---------------------------------------------------------------------------
// Download
// ---------------------------------------------------------------------------

QStringList StageOrchestrator::existingFinalOutputs(const ItemWork &work) const
{
    QStringList found;
    QDir dir(work.outputDir);
    if (!dir.exists()) {
        return found;
    }

    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QFileInfo &entry : entries) {
        QString name = entry.fileName();
        if (entry.isDir()) {
            if (name == work.baseName && work.profile.supportsImageExtract) {
                found.append(entry.absoluteFilePath());
            }
            continue;
        }
        if (!name.startsWith(work.baseName + '.')) {
            continue;
        }
        // ".iso", ".iso.0" and ".pkg.66600" all count as the final output
        QString rest = name.mid(work.baseName.size());
        bool matches = work.profile.primaryExtensions.isEmpty();
        for (const QString &ext : work.profile.primaryExtensions) {
            if (rest.startsWith(ext, Qt::CaseInsensitive)) {
                matches = true;
                break;
            }
        }
        if (matches) {
            found.append(entry.absoluteFilePath());
        }
    }
    return found;
}

QUrl StageOrchestrator::selectMirror(const QUrl &url)
{
    const QStringList hosts = context_.settings->mirrorHosts();
    if (hosts.isEmpty()) {
        return url;
    }

    HttpResponseHead head = context_.http->head(url, ChunkedFetcher::browserHeaders(url),
                                                MirrorCheckTimeoutMs);
    if (head.statusCode == 200) {
        return url;
    }

    for (const QString &host : hosts) {
        QUrl candidate(url);
        candidate.setHost(host);
        head = context_.http->head(candidate, ChunkedFetcher::browserHeaders(candidate),
                                   MirrorCheckTimeoutMs);
        if (head.statusCode == 200) {
            qInfo() << "Using mirror" << host;
            return candidate;
        }
    }
    LOG_VERBOSE() << "No mirror answered; keeping" << url.host();
    return url;
}

bool StageOrchestrator::runDownload(ItemWork &work, ItemStage startStage, ItemOutcome *outcome)
{
    if (!enterStage(work, ItemStage::Downloading, outcome)) {
        return false;
    }
    setCurrentFilePath(work.downloadPath);

    if (startStage == ItemStage::Unzipping) {
        if (!QFile::exists(work.downloadPath)) {
            // The archive was already unpacked and deleted
            collectArtifacts(work, startStage);
            if (!work.artifacts.isEmpty()) {
                return true;
            }
        }
    } else {
        const QStringList existing = existingFinalOutputs(work);
        if (!existing.isEmpty()) {
            QList<Conflict> conflicts;
            for (const QString &path : existing) {
                conflicts.append(Conflict{path, pathSize(QFileInfo(path)), -1});
            }

            // The decision source may block on the user, so it must stay abandonable
            auto resolver = context_.resolver;
            ConflictResponse response;
            QString error;
            WorkerStatus status = runOnWorker<ConflictResponse>([resolver, conflicts]() {
                return resolver->resolve(conflicts, ConflictContext::Downloading);
            }, &response, &error);
            if (status == WorkerStatus::Abandoned) {
                outcome->status = ItemOutcome::Status::Stopped;
                return false;
            }
            if (status == WorkerStatus::Threw) {
                fail(outcome, ItemStage::Downloading, ErrorCategory::Filesystem, error);
                return false;
            }

            switch (response.decision) {
            case ConflictDecision::Skip:
                outcome->status = ItemOutcome::Status::Skipped;
                outcome->outputs = existing;
                return false;
            case ConflictDecision::Overwrite:
                work.overwriteApproved = true;
                break;
            case ConflictDecision::Rename:
            case ConflictDecision::Cancel:
                fail(outcome, ItemStage::Downloading, ErrorCategory::ConflictCancelled,
                     QString("%1 already exists").arg(QFileInfo(existing.first()).fileName()));
                return false;
            }
        }
    }

    QString baseUrl = context_.settings->platformUrl(work.item.platformId);
    if (baseUrl.isEmpty()) {
        fail(outcome, ItemStage::Downloading, ErrorCategory::Network,
             QString("No download URL configured for %1").arg(work.item.platformId));
        return false;
    }

    QUrl url = selectMirror(AppSettings::buildDownloadUrl(baseUrl, work.fileName));
    return fetchFile(url, work.downloadPath, work.options.maxRetries, outcome);
}

bool StageOrchestrator::fetchFile(const QUrl &url, const QString &localPath, int maxRetries,
                                  ItemOutcome *outcome)
{
    auto fetcher = std::make_shared<ChunkedFetcher>(context_.http);
    if (fetchBackoffBaseMs_ > 0) {
        fetcher->setBackoffBaseMs(fetchBackoffBaseMs_);
    }
    if (fetchReadTimeoutMs_ > 0) {
        fetcher->setReadTimeoutMs(fetchReadTimeoutMs_);
    }

    connect(fetcher.get(), &ChunkedFetcher::progressChanged,
            this, &StageOrchestrator::transferProgress, Qt::DirectConnection);
    connect(fetcher.get(), &ChunkedFetcher::speedChanged,
            this, &StageOrchestrator::speedChanged, Qt::DirectConnection);
    connect(fetcher.get(), &ChunkedFetcher::etaChanged,
            this, &StageOrchestrator::etaChanged, Qt::DirectConnection);
    connect(fetcher.get(), &ChunkedFetcher::pausedChanged, this, [this](bool paused) {
        QString name = currentItem();
        if (paused) {
            emit itemPaused(name, ItemStage::Downloading);
        } else {
            emit itemResumed(name);
        }
    }, Qt::DirectConnection);

    {
        QMutexLocker locker(&mutex_);
        activeFetcher_ = fetcher;
        if (stopRequested_) {
            fetcher->cancel();
        } else if (pauseRequested_) {
            fetcher->pause();
        }
    }

    FetchResult result;
    QString error;
    WorkerStatus status = runOnWorker<FetchResult>([fetcher, url, localPath, maxRetries]() {
        return fetcher->fetch(url, localPath, maxRetries);
    }, &result, &error);

    {
        QMutexLocker locker(&mutex_);
        activeFetcher_.reset();
    }

    if (status == WorkerStatus::Abandoned) {
        outcome->status = ItemOutcome::Status::Stopped;
        return false;
    }
    if (status == WorkerStatus::Threw) {
        fail(outcome, currentStage(), ErrorCategory::Filesystem, error);
        return false;
    }

    switch (result.status) {
    case FetchResult::Status::Completed:
        if (result.skipped) {
            LOG_VERBOSE() << localPath << "already complete";
        }
        if (result.sizeUnknown) {
            context_.errorHandler->handleError(ErrorCategory::RemoteSizeUnknown, ErrorSeverity::Info,
                                               QString("Size of %1 was not reported").arg(url.fileName()),
                                               url.toString());
        }
        return true;
    case FetchResult::Status::Cancelled:
        outcome->status = ItemOutcome::Status::Stopped;
        return false;
    case FetchResult::Status::Failed:
        fail(outcome, currentStage(), result.error, result.errorMessage);
        return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Unzip
// ---------------------------------------------------------------------------

bool StageOrchestrator::unzipInto(const QString &zipPath, const QString &outputDir,
                                  QStringList *extracted, ItemOutcome *outcome)
{
    while (true) {
        auto extractor = std::make_shared<ArchiveExtractor>(context_.resolver);
        connect(extractor.get(), &ArchiveExtractor::progressChanged,
                this, &StageOrchestrator::progressChanged, Qt::DirectConnection);

        {
            QMutexLocker locker(&mutex_);
            activeExtractor_ = extractor;
            if (stopRequested_) {
                extractor->stop();
            } else if (pauseRequested_) {
                extractor->pause();
            }
        }

        ExtractResult result;
        QString error;
        WorkerStatus status = runOnWorker<ExtractResult>([extractor, zipPath, outputDir]() {
            return extractor->extract(zipPath, outputDir);
        }, &result, &error);

        {
            QMutexLocker locker(&mutex_);
            activeExtractor_.reset();
        }

        if (status == WorkerStatus::Abandoned) {
            outcome->status = ItemOutcome::Status::Stopped;
            return false;
        }
        if (status == WorkerStatus::Threw) {
            fail(outcome, currentStage(), ErrorCategory::Filesystem, error);
            return false;
        }

        switch (result.status) {
        case ExtractResult::Status::Completed:
            for (const QString &entry : std::as_const(result.skippedEntries)) {
                context_.errorHandler->handleEntrySkipped(QFileInfo(zipPath).fileName(), entry,
                                                          result.errorMessage);
            }
            *extracted = result.extractedPaths;
            return true;
        case ExtractResult::Status::Paused:
            if (!isPauseRequested() && !isStopRequested()) {
                // Resumed before the extractor noticed; pick up where it left off
                continue;
            }
            outcome->status = isStopRequested() ? ItemOutcome::Status::Stopped
                                                : ItemOutcome::Status::Paused;
            return false;
        case ExtractResult::Status::Stopped:
            outcome->status = ItemOutcome::Status::Stopped;
            return false;
        case ExtractResult::Status::Failed:
            fail(outcome, currentStage(), result.error, result.errorMessage);
            return false;
        }
        return false;
    }
}

bool StageOrchestrator::runUnzip(ItemWork &work, ItemOutcome *outcome)
{
    if (!work.artifacts.isEmpty()) {
        return true;
    }
    if (!work.downloadPath.endsWith(".zip", Qt::CaseInsensitive)) {
        work.artifacts.append(work.downloadPath);
        return true;
    }

    if (!enterStage(work, ItemStage::Unzipping, outcome)) {
        return false;
    }
    setCurrentFilePath(work.downloadPath);

    QStringList extracted;
    if (!unzipInto(work.downloadPath, work.processingDir, &extracted, outcome)) {
        return false;
    }
    if (!QFile::remove(work.downloadPath)) {
        qWarning() << "Could not remove" << work.downloadPath;
    }

    QDir processing(work.processingDir);
    for (const QString &path : std::as_const(extracted)) {
        QString topLevel = processing.relativeFilePath(path).section('/', 0, 0);
        QString artifact = processing.filePath(topLevel);
        if (!work.artifacts.contains(artifact)) {
            work.artifacts.append(artifact);
        }
    }

    if (work.artifacts.isEmpty()) {
        fail(outcome, ItemStage::Unzipping, ErrorCategory::ArchiveEntryCorrupt,
             QString("%1 contained nothing that could be extracted").arg(work.fileName));
        return false;
    }
    return true;
}

void StageOrchestrator::collectArtifacts(ItemWork &work, ItemStage startStage) const
{
    QDir dir(work.processingDir);
    // Past extraction, an image beside its extracted folder is only a leftover
    const bool extracted = static_cast<int>(startStage) > static_cast<int>(ItemStage::Extracting)
                           && work.profile.supportsImageExtract && work.options.extractIso
                           && !work.options.keepDecryptedIso;

    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot,
                                                    QDir::Name);
    for (const QFileInfo &entry : entries) {
        QString name = entry.fileName();
        if (name != work.baseName && !name.startsWith(work.baseName + '.')) {
            continue;
        }

        QString path = entry.absoluteFilePath();
        if (name.endsWith(".dkey", Qt::CaseInsensitive)) {
            (work.options.keepDkeyFile ? work.artifacts : work.pendingDeletes).append(path);
        } else if (name.endsWith(".enc", Qt::CaseInsensitive)) {
            (work.options.keepEncryptedIso ? work.artifacts : work.pendingDeletes).append(path);
        } else if (name.endsWith(".dec", Qt::CaseInsensitive)
                   || name.endsWith(".zip", Qt::CaseInsensitive)) {
            work.pendingDeletes.append(path);
        } else if (extracted && entry.isFile() && name.endsWith(".iso", Qt::CaseInsensitive)
                   && QFileInfo(dir.filePath(FileUtils::stripExtension(name))).isDir()) {
            work.pendingDeletes.append(path);
        } else {
            work.artifacts.append(path);
        }
    }
}

// ---------------------------------------------------------------------------
// Decrypt
// ---------------------------------------------------------------------------

bool StageOrchestrator::fetchDkey(ItemWork &work, const QString &dkeyPath, ItemOutcome *outcome)
{
    QString baseUrl = context_.settings->dkeyUrl(work.item.platformId);
    if (baseUrl.isEmpty()) {
        fail(outcome, ItemStage::Decrypting, ErrorCategory::Network,
             QString("No disc key URL configured for %1").arg(work.item.platformId));
        return false;
    }

    QString zipPath = dkeyPath + ".zip";
    setCurrentFilePath(zipPath);
    QUrl url = AppSettings::buildDownloadUrl(baseUrl, work.baseName + ".zip");
    if (!fetchFile(url, zipPath, work.options.maxRetries, outcome)) {
        return false;
    }

    QStringList extracted;
    if (!unzipInto(zipPath, work.processingDir, &extracted, outcome)) {
        return false;
    }
    QFile::remove(zipPath);

    QString keyFile;
    for (const QString &path : std::as_const(extracted)) {
        if (path.endsWith(".dkey", Qt::CaseInsensitive)) {
            keyFile = path;
            break;
        }
    }
    if (keyFile.isEmpty() && !extracted.isEmpty()) {
        keyFile = extracted.first();
    }
    if (keyFile.isEmpty()) {
        fail(outcome, ItemStage::Decrypting, ErrorCategory::ArchiveEntryCorrupt,
             QString("Disc key archive for %1 is empty").arg(work.baseName));
        return false;
    }
    if (keyFile != dkeyPath && !QFile::rename(keyFile, dkeyPath)) {
        fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
             QString("Cannot rename %1 to %2").arg(keyFile, dkeyPath));
        return false;
    }
    return true;
}

bool StageOrchestrator::runDecrypt(ItemWork &work, ItemOutcome *outcome)
{
    if (!work.profile.supportsDecrypt) {
        return true;
    }
    if (!work.options.decryptIso && !work.options.keepDkeyFile) {
        return true;
    }
    const QStringList images = filesWithExtension(work.artifacts, ".iso");
    if (images.isEmpty()) {
        return true;
    }
    if (!enterStage(work, ItemStage::Decrypting, outcome)) {
        return false;
    }

    QString tool;
    if (work.options.decryptIso) {
        tool = context_.tools->require(ExternalTools::Ps3Dec);
        if (tool.isEmpty()) {
            context_.errorHandler->handleToolMissing(ExternalTools::Ps3Dec);
            qWarning() << "Leaving" << work.baseName << "encrypted";
            if (!work.options.keepDkeyFile) {
                return true;
            }
        }
    }

    QString dkeyPath = QDir(work.processingDir).filePath(work.baseName + ".dkey");
    if (!QFile::exists(dkeyPath) && !fetchDkey(work, dkeyPath, outcome)) {
        return false;
    }
    if (tool.isEmpty()) {
        // Only the key is wanted
        if (!work.artifacts.contains(dkeyPath)) {
            work.artifacts.append(dkeyPath);
        }
        return true;
    }

    QFile dkey(dkeyPath);
    if (!dkey.open(QIODevice::ReadOnly)) {
        fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
             QString("Cannot read %1: %2").arg(dkeyPath, dkey.errorString()));
        return false;
    }
    QString key = QString::fromLatin1(dkey.readAll()).trimmed().left(32);
    dkey.close();
    if (key.size() != 32) {
        fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
             QString("%1 does not contain a disc key").arg(QFileInfo(dkeyPath).fileName()));
        return false;
    }

    QStringList &encryptedTarget = work.options.keepEncryptedIso ? work.artifacts : work.pendingDeletes;

    for (const QString &image : images) {
        QString encrypted = image + ".enc";
        QString decrypted = image + ".dec";
        if (QFile::exists(encrypted)) {
            // Decrypted on an earlier run
            if (!encryptedTarget.contains(encrypted)) {
                encryptedTarget.append(encrypted);
            }
            continue;
        }

        setCurrentFilePath(image);
        auto tools = context_.tools;
        ToolResult toolResult;
        QString error;
        WorkerStatus status = runOnWorker<ToolResult>([this, tools, tool, key, image]() {
            return tools->run(tool, {"d", "key", key, image}, [this]() { return isStopRequested(); });
        }, &toolResult, &error);

        if (status == WorkerStatus::Abandoned || toolResult.cancelled) {
            QFile::remove(decrypted);
            outcome->status = ItemOutcome::Status::Stopped;
            return false;
        }
        if (status == WorkerStatus::Threw || !toolResult.isSuccess()) {
            QFile::remove(decrypted);
            fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
                 status == WorkerStatus::Threw ? error : toolResult.errorMessage);
            return false;
        }

        // Swap only once the decrypted image is verified complete
        QFileInfo decryptedInfo(decrypted);
        if (!decryptedInfo.exists() || decryptedInfo.size() != QFileInfo(image).size()) {
            QFile::remove(decrypted);
            fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
                 QString("Decrypted image %1 is incomplete").arg(decryptedInfo.fileName()));
            return false;
        }
        if (!QFile::rename(image, encrypted)) {
            fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
                 QString("Cannot rename %1").arg(image));
            return false;
        }
        if (!QFile::rename(decrypted, image)) {
            QFile::rename(encrypted, image);
            fail(outcome, ItemStage::Decrypting, ErrorCategory::Filesystem,
                 QString("Cannot rename %1").arg(decrypted));
            return false;
        }

        encryptedTarget.append(encrypted);
        qInfo() << "Decrypted" << QFileInfo(image).fileName();
    }

    QStringList &dkeyTarget = work.options.keepDkeyFile ? work.artifacts : work.pendingDeletes;
    if (!dkeyTarget.contains(dkeyPath)) {
        dkeyTarget.append(dkeyPath);
    }
    return true;
}

int StageOrchestrator::recoverInterruptedDecrypts(const QString &processingDir)
{
    QDir dir(processingDir);
    if (!dir.exists()) {
        return 0;
    }

    int restored = 0;
    const QStringList leftovers = dir.entryList({"*.enc"}, QDir::Files);
    for (const QString &name : leftovers) {
        QString encrypted = dir.filePath(name);
        QString original = encrypted.chopped(4);
        if (QFile::exists(original)) {
            continue;
        }
        // Extraction already consumed the decrypted image
        QString extracted = dir.filePath(FileUtils::stripExtension(QFileInfo(original).fileName()));
        if (QFileInfo(extracted).isDir()) {
            continue;
        }
        if (!QFile::rename(encrypted, original)) {
            qWarning() << "Cannot restore" << encrypted;
            continue;
        }
        QString decrypted = original + ".dec";
        if (QFile::exists(decrypted) && !QFile::remove(decrypted)) {
            qWarning() << "Could not remove" << decrypted;
        }
        ++restored;
    }
    return restored;
}

// ---------------------------------------------------------------------------
// Extract
// ---------------------------------------------------------------------------

bool StageOrchestrator::runExtract(ItemWork &work, ItemOutcome *outcome)
{
    if (!work.profile.supportsImageExtract || !work.options.extractIso) {
        return true;
    }
    const QStringList images = filesWithExtension(work.artifacts, ".iso");
    if (images.isEmpty()) {
        return true;
    }
    if (!enterStage(work, ItemStage::Extracting, outcome)) {
        return false;
    }

    QString tool = context_.tools->require(ExternalTools::ExtractPs3Iso);
    if (tool.isEmpty()) {
        context_.errorHandler->handleToolMissing(ExternalTools::ExtractPs3Iso);
        qWarning() << "Keeping" << work.baseName << "as a disc image";
        return true;
    }

    for (const QString &image : images) {
        setCurrentFilePath(image);
        QString target = QDir(work.processingDir).filePath(
            FileUtils::stripExtension(QFileInfo(image).fileName()));
        if (QFileInfo(target).isDir()) {
            // Left over from an interrupted extraction
            QDir(target).removeRecursively();
        }

        auto tools = context_.tools;
        ToolResult toolResult;
        QString error;
        WorkerStatus status = runOnWorker<ToolResult>([this, tools, tool, image, target]() {
            return tools->run(tool, {image, target}, [this]() { return isStopRequested(); });
        }, &toolResult, &error);

        if (status == WorkerStatus::Abandoned || toolResult.cancelled) {
            if (toolResult.cancelled) {
                QDir(target).removeRecursively();
            }
            outcome->status = ItemOutcome::Status::Stopped;
            return false;
        }
        if (status == WorkerStatus::Threw || !toolResult.isSuccess() || !QFileInfo(target).isDir()) {
            QDir(target).removeRecursively();
            QString message = status == WorkerStatus::Threw ? error : toolResult.errorMessage;
            if (message.isEmpty()) {
                message = QString("Extraction of %1 produced no folder").arg(QFileInfo(image).fileName());
            }
            fail(outcome, ItemStage::Extracting, ErrorCategory::Filesystem, message);
            return false;
        }

        work.artifacts.removeAll(image);
        work.artifacts.append(target);
        if (work.options.keepDecryptedIso) {
            work.artifacts.append(image);
        } else if (!QFile::remove(image)) {
            qWarning() << "Could not remove" << image;
        }
        qInfo() << "Extracted" << QFileInfo(image).fileName();
    }
    return true;
}

// ---------------------------------------------------------------------------
// Split
// ---------------------------------------------------------------------------

bool StageOrchestrator::runSplit(ItemWork &work, ItemOutcome *outcome)
{
    if (!work.profile.supportsSplit) {
        return true;
    }
    bool enabled = work.profile.kind == PlatformKind::Psn ? work.options.splitPkg
                                                          : work.options.splitLargeFiles;
    if (!enabled) {
        return true;
    }

    QStringList oversized;
    for (const QString &path : std::as_const(work.artifacts)) {
        QFileInfo info(path);
        if (info.isFile() && hasExtension(path, work.profile.primaryExtensions)
            && info.size() >= work.options.splitPartSize) {
            oversized.append(path);
        }
    }
    if (oversized.isEmpty()) {
        return true;
    }
    if (!enterStage(work, ItemStage::Splitting, outcome)) {
        return false;
    }

    for (const QString &path : std::as_const(oversized)) {
        setCurrentFilePath(path);
        auto splitter = std::make_shared<SplitWriter>(work.options.splitPartSize);
        connect(splitter.get(), &SplitWriter::progressChanged,
                this, &StageOrchestrator::progressChanged, Qt::DirectConnection);
        {
            QMutexLocker locker(&mutex_);
            activeSplitter_ = splitter;
            if (stopRequested_) {
                splitter->stop();
            }
        }

        SplitNaming naming = work.profile.splitNaming;
        bool keepOriginal = work.options.keepUnsplitFile;
        SplitResult result;
        QString error;
        WorkerStatus status = runOnWorker<SplitResult>([splitter, path, naming, keepOriginal]() {
            return splitter->split(path, naming, keepOriginal);
        }, &result, &error);

        {
            QMutexLocker locker(&mutex_);
            activeSplitter_.reset();
        }

        if (status == WorkerStatus::Abandoned) {
            outcome->status = ItemOutcome::Status::Stopped;
            return false;
        }
        if (status == WorkerStatus::Threw) {
            fail(outcome, ItemStage::Splitting, ErrorCategory::Filesystem, error);
            return false;
        }

        switch (result.status) {
        case SplitResult::Status::Split: {
            int index = work.artifacts.indexOf(path);
            if (!result.originalRemoved) {
                ++index;
            } else {
                work.artifacts.removeAt(index);
            }
            for (const QString &part : std::as_const(result.parts)) {
                if (!work.artifacts.contains(part)) {
                    work.artifacts.insert(index++, part);
                }
            }
            qInfo() << "Split" << QFileInfo(path).fileName() << "into" << result.parts.size() << "parts";
            break;
        }
        case SplitResult::Status::NotNeeded:
            break;
        case SplitResult::Status::Stopped:
            outcome->status = ItemOutcome::Status::Stopped;
            return false;
        case SplitResult::Status::Failed:
            fail(outcome, ItemStage::Splitting, result.error, result.errorMessage);
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Relocate
// ---------------------------------------------------------------------------

bool StageOrchestrator::runRelocate(ItemWork &work, ItemOutcome *outcome)
{
    if (!enterStage(work, ItemStage::Relocating, outcome)) {
        return false;
    }
    if (work.artifacts.isEmpty()) {
        fail(outcome, ItemStage::Relocating, ErrorCategory::Filesystem,
             QString("No output was produced for %1").arg(work.baseName));
        return false;
    }
    setCurrentFilePath(work.artifacts.first());

    RelocateJob job;
    job.artifacts = work.artifacts;
    job.outputDir = work.outputDir;
    job.rapDir = context_.settings->rapDir();
    job.overwriteApproved = work.overwriteApproved;
    job.routeLicenseFiles = work.profile.hasLicenseFiles;

    auto resolver = context_.resolver;
    RelocateResult result;
    QString error;
    WorkerStatus status = runOnWorker<RelocateResult>([job, resolver]() {
        return relocateArtifacts(job, resolver);
    }, &result, &error);

    if (status == WorkerStatus::Abandoned) {
        outcome->status = ItemOutcome::Status::Stopped;
        return false;
    }
    if (status == WorkerStatus::Threw) {
        fail(outcome, ItemStage::Relocating, ErrorCategory::Filesystem, error);
        return false;
    }
    if (!result.ok) {
        fail(outcome, ItemStage::Relocating,
             result.cancelled ? ErrorCategory::ConflictCancelled : ErrorCategory::Filesystem,
             result.errorMessage);
        return false;
    }

    for (const QString &path : std::as_const(work.pendingDeletes)) {
        if (!removePath(path)) {
            qWarning() << "Could not remove" << path;
        }
    }
    int pruned = FileUtils::removeEmptyDirectories(work.processingDir);
    if (pruned > 0) {
        LOG_VERBOSE() << "Pruned" << pruned << "empty directories from" << work.processingDir;
    }

    outcome->outputs = result.outputs;
    return true;
}
