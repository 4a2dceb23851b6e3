#include "networkhttpclient.h"
#include "../utils/logging.h"

#include <QDeadlineTimer>
#include <QMutex>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QWaitCondition>

namespace {

/**
 * State shared between the network thread (producer) and the worker
 * reading the body (consumer). `reply` is only touched on the network thread.
 */
struct ReplyChannel {
    QMutex mutex;
    QWaitCondition changed;

    HttpResponseHead head;
    bool headReady = false;
    QByteArray buffer;
    bool stalled = false;     // Producer stopped reading because buffer was full
    bool replyDone = false;   // QNetworkReply::finished was emitted
    bool finished = false;    // All body bytes moved into buffer
    QString error;

    QPointer<QNetworkReply> reply;
};

void captureHead(ReplyChannel *channel, QNetworkReply *reply)
{
    QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid()) {
        return;
    }

    channel->head.statusCode = status.toInt();
    channel->head.headers.clear();
    const auto pairs = reply->rawHeaderPairs();
    for (const auto &pair : pairs) {
        channel->head.headers.append(qMakePair(pair.first, pair.second));
    }
    channel->headReady = true;
}

// Runs on the network thread
void pump(const std::shared_ptr<ReplyChannel> &channel)
{
    QNetworkReply *reply = channel->reply;
    if (!reply) {
        return;
    }

    QMutexLocker locker(&channel->mutex);

    if (!channel->headReady) {
        captureHead(channel.get(), reply);
    }

    qint64 space = NetworkHttpClient::ChannelCapacity - channel->buffer.size();
    qint64 available = reply->bytesAvailable();
    if (available > 0) {
        if (space <= 0) {
            channel->stalled = true;
        } else {
            channel->buffer.append(reply->read(qMin(space, available)));
            channel->stalled = reply->bytesAvailable() > 0;
        }
    }

    if (channel->replyDone && reply->bytesAvailable() == 0) {
        channel->finished = true;
        // HTTP error statuses are reported through the head, not as transport errors
        if (reply->error() != QNetworkReply::NoError
            && reply->error() != QNetworkReply::OperationCanceledError
            && channel->head.statusCode < 400) {
            channel->error = reply->errorString();
        }
        channel->reply = nullptr;
        reply->deleteLater();
    }

    channel->changed.wakeAll();
}

enum class Method { Head, Get };

void startRequest(QNetworkAccessManager *manager,
                  const std::shared_ptr<ReplyChannel> &channel,
                  Method method,
                  const QUrl &url,
                  const HttpHeaders &headers)
{
    QNetworkRequest request(url);
    for (const auto &header : headers) {
        request.setRawHeader(header.first, header.second);
    }
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkReply *reply = method == Method::Head ? manager->head(request) : manager->get(request);
    reply->setReadBufferSize(NetworkHttpClient::ChannelCapacity);
    channel->reply = reply;

    QObject::connect(reply, &QNetworkReply::metaDataChanged, reply, [channel, reply]() {
        int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status >= 300 && status < 400 && !reply->rawHeader("Location").isEmpty()) {
            return;  // Intermediate redirect
        }
        QMutexLocker locker(&channel->mutex);
        captureHead(channel.get(), reply);
        channel->changed.wakeAll();
    });
    QObject::connect(reply, &QNetworkReply::readyRead, reply, [channel]() {
        pump(channel);
    });
    QObject::connect(reply, &QNetworkReply::finished, reply, [channel]() {
        {
            QMutexLocker locker(&channel->mutex);
            channel->replyDone = true;
        }
        pump(channel);
    });
}

void abortRequest(QObject *context, const std::shared_ptr<ReplyChannel> &channel)
{
    if (!context) {
        return;
    }
    QMetaObject::invokeMethod(context, [channel]() {
        QNetworkReply *reply = channel->reply;
        if (reply) {
            channel->reply = nullptr;
            reply->disconnect();
            reply->abort();
            reply->deleteLater();
        }
    }, Qt::QueuedConnection);
}

class NetworkHttpStream : public IHttpStream
{
public:
    NetworkHttpStream(QNetworkAccessManager *manager, std::shared_ptr<ReplyChannel> channel)
        : manager_(manager)
        , channel_(std::move(channel))
    {
    }

    ~NetworkHttpStream() override
    {
        abortRequest(manager_, channel_);
    }

    HttpResponseHead waitForHead(int timeoutMs) override
    {
        QMutexLocker locker(&channel_->mutex);
        QDeadlineTimer deadline(timeoutMs);
        while (!channel_->headReady && !channel_->finished) {
            if (!channel_->changed.wait(&channel_->mutex, deadline)) {
                break;
            }
        }

        HttpResponseHead head = channel_->head;
        if (!channel_->headReady) {
            head.statusCode = 0;
            head.errorString = channel_->finished && !channel_->error.isEmpty()
                ? channel_->error
                : QStringLiteral("Timed out waiting for response headers");
        }
        return head;
    }

    ReadStatus read(qint64 maxBytes, int timeoutMs, QByteArray *out) override
    {
        out->clear();
        bool resumeProducer = false;
        ReadStatus status = ReadStatus::Timeout;
        {
            QMutexLocker locker(&channel_->mutex);
            QDeadlineTimer deadline(timeoutMs);
            while (channel_->buffer.isEmpty() && !channel_->finished) {
                if (!channel_->changed.wait(&channel_->mutex, deadline)) {
                    break;
                }
            }

            if (!channel_->buffer.isEmpty()) {
                *out = channel_->buffer.left(static_cast<int>(qMin<qint64>(maxBytes, channel_->buffer.size())));
                channel_->buffer.remove(0, out->size());
                resumeProducer = channel_->stalled;
                status = ReadStatus::Data;
            } else if (channel_->finished) {
                status = channel_->error.isEmpty() ? ReadStatus::EndOfStream : ReadStatus::Error;
            }
        }

        if (resumeProducer && manager_) {
            auto channel = channel_;
            QMetaObject::invokeMethod(manager_, [channel]() { pump(channel); }, Qt::QueuedConnection);
        }
        return status;
    }

    QString errorString() const override
    {
        QMutexLocker locker(&channel_->mutex);
        return channel_->error;
    }

private:
    QPointer<QNetworkAccessManager> manager_;
    std::shared_ptr<ReplyChannel> channel_;
};

} // namespace

NetworkHttpClient::NetworkHttpClient(QObject *parent)
    : QObject(parent)
    , networkManager_(new QNetworkAccessManager)
{
    networkThread_.setObjectName("rompipe-network");
    networkManager_->moveToThread(&networkThread_);
    connect(&networkThread_, &QThread::finished, networkManager_, &QObject::deleteLater);
    networkThread_.start();
}

NetworkHttpClient::~NetworkHttpClient()
{
    networkThread_.quit();
    networkThread_.wait();
}

HttpResponseHead NetworkHttpClient::head(const QUrl &url, const HttpHeaders &headers, int timeoutMs)
{
    auto channel = std::make_shared<ReplyChannel>();
    QNetworkAccessManager *manager = networkManager_;
    QMetaObject::invokeMethod(networkManager_, [manager, channel, url, headers]() {
        startRequest(manager, channel, Method::Head, url, headers);
    }, Qt::QueuedConnection);

    QMutexLocker locker(&channel->mutex);
    QDeadlineTimer deadline(timeoutMs);
    while (!channel->finished) {
        if (!channel->changed.wait(&channel->mutex, deadline)) {
            break;
        }
    }

    HttpResponseHead result = channel->head;
    if (!channel->finished) {
        locker.unlock();
        abortRequest(networkManager_, channel);
        result.statusCode = 0;
        result.errorString = QStringLiteral("HEAD request timed out");
        LOG_VERBOSE() << "HEAD timed out:" << url.toString();
        return result;
    }
    if (!channel->headReady) {
        result.statusCode = 0;
        result.errorString = channel->error.isEmpty()
            ? QStringLiteral("No response")
            : channel->error;
    }
    return result;
}

std::unique_ptr<IHttpStream> NetworkHttpClient::get(const QUrl &url, const HttpHeaders &headers)
{
    auto channel = std::make_shared<ReplyChannel>();
    QNetworkAccessManager *manager = networkManager_;
    QMetaObject::invokeMethod(networkManager_, [manager, channel, url, headers]() {
        startRequest(manager, channel, Method::Get, url, headers);
    }, Qt::QueuedConnection);

    return std::make_unique<NetworkHttpStream>(networkManager_, channel);
}
