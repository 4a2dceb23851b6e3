#include "chunkedfetcher.h"
#include "../utils/logging.h"

#include <QDeadlineTimer>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QRandomGenerator>

namespace {

const QByteArray BrowserUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";

} // namespace

ChunkedFetcher::ChunkedFetcher(std::shared_ptr<IHttpClient> http, QObject *parent)
    : QObject(parent)
    , http_(std::move(http))
{
}

HttpHeaders ChunkedFetcher::browserHeaders(const QUrl &url)
{
    QByteArray referer = url.adjusted(QUrl::RemovePath | QUrl::RemoveQuery
                                      | QUrl::RemoveFragment | QUrl::RemoveUserInfo)
                             .toEncoded() + '/';

    return {
        {"User-Agent", BrowserUserAgent},
        {"Accept", "*/*"},
        {"Accept-Encoding", "gzip, deflate, br"},
        {"Connection", "keep-alive"},
        {"Referer", referer},
    };
}

qint64 ChunkedFetcher::parseContentRangeTotal(const QByteArray &contentRange)
{
    int slash = contentRange.lastIndexOf('/');
    if (slash < 0) {
        return -1;
    }
    QByteArray total = contentRange.mid(slash + 1).trimmed();
    bool ok = false;
    qint64 value = total.toLongLong(&ok);
    return ok && value >= 0 ? value : -1;
}

qint64 ChunkedFetcher::backoffDelayMs(int attempt, int baseMs)
{
    // 2^attempt units, capped so large attempt numbers cannot overflow
    int exponent = qBound(0, attempt, 20);
    qint64 delay = static_cast<qint64>(baseMs) << exponent;
    return qMin(delay, MaxBackoffMs);
}

bool ChunkedFetcher::isTransientStatus(int status)
{
    return status == 408 || status == 425 || status == 429 || status >= 500;
}

void ChunkedFetcher::pause()
{
    QMutexLocker locker(&mutex_);
    paused_ = true;
}

void ChunkedFetcher::resume()
{
    QMutexLocker locker(&mutex_);
    paused_ = false;
    wakeCondition_.wakeAll();
}

void ChunkedFetcher::cancel()
{
    QMutexLocker locker(&mutex_);
    running_ = false;
    wakeCondition_.wakeAll();
}

bool ChunkedFetcher::isPaused() const
{
    QMutexLocker locker(&mutex_);
    return paused_;
}

bool ChunkedFetcher::isRunning() const
{
    QMutexLocker locker(&mutex_);
    return running_;
}

qint64 ChunkedFetcher::queryRemoteSize(const QUrl &url)
{
    HttpHeaders headers = browserHeaders(url);

    HttpResponseHead head = http_->head(url, headers, readTimeoutMs_);
    if (head.statusCode == 200) {
        bool ok = false;
        qint64 length = head.header("Content-Length").toLongLong(&ok);
        if (ok && length > 0) {
            return length;
        }
    }

    // Some hosts reject HEAD; a one-byte range reveals the total instead
    headers.append(qMakePair(QByteArray("Range"), QByteArray("bytes=0-0")));
    std::unique_ptr<IHttpStream> stream = http_->get(url, headers);
    head = stream->waitForHead(readTimeoutMs_);

    if (head.statusCode == 200 || head.statusCode == 206 || head.statusCode == 416) {
        qint64 total = parseContentRangeTotal(head.header("Content-Range"));
        if (total >= 0) {
            return total;
        }
        if (head.statusCode == 200) {
            bool ok = false;
            qint64 length = head.header("Content-Length").toLongLong(&ok);
            if (ok) {
                return length;
            }
        }
    }

    LOG_VERBOSE() << "Remote size unknown for" << url.toString()
                  << "status" << head.statusCode << head.errorString;
    return -1;
}

FetchResult ChunkedFetcher::fetch(const QUrl &url, const QString &localPath, int maxRetries)
{
    FetchResult result;
    result.localPath = localPath;

    QFileInfo info(localPath);
    if (!QDir().mkpath(info.absolutePath())) {
        result.error = ErrorCategory::Filesystem;
        result.errorMessage = tr("Cannot create directory %1").arg(info.absolutePath());
        return result;
    }

    if (!isRunning()) {
        result.status = FetchResult::Status::Cancelled;
        return result;
    }

    qint64 totalBytes = -1;
    if (info.exists()) {
        totalBytes = queryRemoteSize(url);
        qint64 localSize = info.size();

        if (totalBytes >= 0 && localSize == totalBytes) {
            qInfo().noquote() << "Already downloaded:" << info.fileName();
            result.status = FetchResult::Status::Completed;
            result.skipped = true;
            result.bytesWritten = localSize;
            result.totalBytes = totalBytes;
            emit progressChanged(localSize, totalBytes);
            emit completed(localPath);
            return result;
        }

        if (totalBytes >= 0 && localSize > totalBytes) {
            // Cannot be a prefix of the remote file
            qWarning().noquote() << "Local file larger than remote, restarting:" << info.fileName();
            if (!QFile::resize(localPath, 0)) {
                result.error = ErrorCategory::Filesystem;
                result.errorMessage = tr("Cannot truncate %1").arg(localPath);
                return result;
            }
        }
    }

    sizer_ = AdaptiveChunkSizer();
    lastEta_ = -1;

    for (int attempt = 0; attempt < maxRetries; ++attempt) {
        result.attempts = attempt + 1;
        AttemptOutcome outcome = runAttempt(url, localPath, &totalBytes, &result);

        result.bytesWritten = QFileInfo(localPath).size();
        result.totalBytes = totalBytes;

        switch (outcome) {
        case AttemptOutcome::Done:
            result.status = FetchResult::Status::Completed;
            result.error = ErrorCategory::None;
            result.errorMessage.clear();
            emit completed(localPath);
            return result;
        case AttemptOutcome::Cancelled:
            result.status = FetchResult::Status::Cancelled;
            return result;
        case AttemptOutcome::Terminal:
            result.status = FetchResult::Status::Failed;
            if (result.error == ErrorCategory::None) {
                result.error = ErrorCategory::Network;
            }
            result.errorMessage = lastError_;
            return result;
        case AttemptOutcome::Transient:
            break;
        }

        sizer_.onTransientError();
        if (attempt + 1 >= maxRetries) {
            break;
        }

        qint64 delay = backoffDelayMs(attempt, backoffBaseMs_)
            + QRandomGenerator::global()->bounded(backoffBaseMs_ + 1);
        LOG_VERBOSE() << "Retrying" << url.fileName() << "in" << delay << "ms:" << lastError_;
        emit retrying(attempt + 1, delay, lastError_);

        if (!waitForBackoff(delay)) {
            result.status = FetchResult::Status::Cancelled;
            return result;
        }
    }

    result.status = FetchResult::Status::Failed;
    result.error = ErrorCategory::TransientNetwork;
    result.errorMessage = tr("Giving up after %1 attempts: %2").arg(result.attempts).arg(lastError_);
    return result;
}

ChunkedFetcher::AttemptOutcome ChunkedFetcher::runAttempt(const QUrl &url,
                                                          const QString &localPath,
                                                          qint64 *totalBytes,
                                                          FetchResult *result)
{
    if (!waitWhilePaused()) {
        return AttemptOutcome::Cancelled;
    }

    QFileInfo info(localPath);
    qint64 offset = info.exists() ? info.size() : 0;
    if (*totalBytes > 0 && offset == *totalBytes) {
        return AttemptOutcome::Done;
    }

    HttpHeaders headers = browserHeaders(url);
    if (offset > 0) {
        headers.append(qMakePair(QByteArray("Range"), QString("bytes=%1-").arg(offset).toLatin1()));
    }

    std::unique_ptr<IHttpStream> stream = http_->get(url, headers);
    HttpResponseHead head = stream->waitForHead(readTimeoutMs_);
    if (!head.hasResponse()) {
        lastError_ = head.errorString;
        return AttemptOutcome::Transient;
    }

    result->httpStatus = head.statusCode;

    if (head.statusCode == 416 && offset > 0) {
        qint64 remoteTotal = parseContentRangeTotal(head.header("Content-Range"));
        if (remoteTotal == offset || *totalBytes == offset) {
            *totalBytes = offset;
            return AttemptOutcome::Done;
        }
        // Local bytes do not line up with the remote file
        lastError_ = tr("Range not satisfiable at offset %1").arg(offset);
        if (!QFile::resize(localPath, 0)) {
            result->error = ErrorCategory::Filesystem;
            lastError_ = tr("Cannot truncate %1").arg(localPath);
            return AttemptOutcome::Terminal;
        }
        return AttemptOutcome::Transient;
    }

    if (head.statusCode != 200 && head.statusCode != 206) {
        lastError_ = tr("HTTP %1").arg(head.statusCode);
        return isTransientStatus(head.statusCode) ? AttemptOutcome::Transient : AttemptOutcome::Terminal;
    }

    QIODevice::OpenMode mode = QIODevice::WriteOnly;
    if (head.statusCode == 206 && offset > 0) {
        mode |= QIODevice::Append;
        qint64 remoteTotal = parseContentRangeTotal(head.header("Content-Range"));
        if (remoteTotal >= 0) {
            *totalBytes = remoteTotal;
        } else {
            bool ok = false;
            qint64 length = head.header("Content-Length").toLongLong(&ok);
            if (ok) {
                *totalBytes = offset + length;
            }
        }
    } else {
        if (offset > 0) {
            qInfo().noquote() << "Server ignored range request, restarting:" << info.fileName();
        }
        mode |= QIODevice::Truncate;
        offset = 0;
        bool ok = false;
        qint64 length = head.header("Content-Length").toLongLong(&ok);
        if (ok) {
            *totalBytes = length;
        } else {
            qint64 remoteTotal = parseContentRangeTotal(head.header("Content-Range"));
            if (remoteTotal >= 0) {
                *totalBytes = remoteTotal;
            }
        }
    }

    if (*totalBytes < 0) {
        LOG_VERBOSE() << "No size reported for" << url.toString();
        result->sizeUnknown = true;
    }

    QFile file(localPath);
    if (!file.open(mode)) {
        result->error = ErrorCategory::Filesystem;
        lastError_ = tr("Cannot open %1: %2").arg(localPath, file.errorString());
        return AttemptOutcome::Terminal;
    }

    qint64 bytes = offset;
    resetTiming();
    report(bytes, *totalBytes, true);

    while (true) {
        if (!waitWhilePaused()) {
            file.close();
            return AttemptOutcome::Cancelled;
        }

        QByteArray chunk;
        IHttpStream::ReadStatus status = stream->read(sizer_.chunkSize(), readTimeoutMs_, &chunk);

        if (status == IHttpStream::ReadStatus::Data) {
            if (file.write(chunk) != chunk.size()) {
                result->error = ErrorCategory::Filesystem;
                lastError_ = tr("Write failed for %1: %2").arg(localPath, file.errorString());
                return AttemptOutcome::Terminal;
            }
            bytes += chunk.size();
            if (sizer_.recordChunk(transferTimer_.elapsed(), chunk.size())) {
                LOG_VERBOSE() << "Chunk size now" << sizer_.chunkSize() << "bytes";
            }
            report(bytes, *totalBytes, false);
            continue;
        }

        if (status == IHttpStream::ReadStatus::EndOfStream) {
            break;
        }

        lastError_ = status == IHttpStream::ReadStatus::Timeout
            ? tr("Read timed out after %1 ms").arg(readTimeoutMs_)
            : stream->errorString();
        file.close();
        report(bytes, *totalBytes, true);
        return AttemptOutcome::Transient;
    }

    if (!file.flush()) {
        result->error = ErrorCategory::Filesystem;
        lastError_ = tr("Write failed for %1: %2").arg(localPath, file.errorString());
        return AttemptOutcome::Terminal;
    }
    file.close();
    report(bytes, *totalBytes, true);

    if (*totalBytes >= 0 && bytes != *totalBytes) {
        lastError_ = tr("Connection closed at %1 of %2 bytes").arg(bytes).arg(*totalBytes);
        if (bytes > *totalBytes && !QFile::resize(localPath, 0)) {
            result->error = ErrorCategory::Filesystem;
            return AttemptOutcome::Terminal;
        }
        return AttemptOutcome::Transient;
    }

    *totalBytes = bytes;
    return AttemptOutcome::Done;
}

bool ChunkedFetcher::waitWhilePaused()
{
    {
        QMutexLocker locker(&mutex_);
        if (!paused_ || !running_) {
            return running_;
        }
    }

    emit pausedChanged(true);
    {
        QMutexLocker locker(&mutex_);
        while (paused_ && running_) {
            wakeCondition_.wait(&mutex_);
        }
        if (!running_) {
            return false;
        }
    }
    emit pausedChanged(false);

    // The paused interval must not count toward speed or ETA
    resetTiming();
    return true;
}

bool ChunkedFetcher::waitForBackoff(qint64 delayMs)
{
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline(delayMs);
    while (running_ && !deadline.hasExpired()) {
        wakeCondition_.wait(&mutex_, deadline);
    }
    return running_;
}

void ChunkedFetcher::resetTiming()
{
    transferTimer_.restart();
    sizer_.resetWindow(0);
}

void ChunkedFetcher::report(qint64 bytes, qint64 total, bool force)
{
    if (!force && reportTimer_.isValid() && reportTimer_.elapsed() < ReportIntervalMs) {
        return;
    }
    reportTimer_.restart();

    double speed = sizer_.bytesPerSecond();
    emit progressChanged(bytes, total);
    emit speedChanged(speed);

    qint64 eta = -1;
    if (speed > 0.0 && total >= 0) {
        eta = static_cast<qint64>(static_cast<double>(qMax<qint64>(0, total - bytes)) / speed);
    }
    bool crossedUnknown = (eta < 0) != (lastEta_ < 0);
    if (crossedUnknown || qAbs(eta - lastEta_) > 1) {
        lastEta_ = eta;
        emit etaChanged(eta);
    }
}
