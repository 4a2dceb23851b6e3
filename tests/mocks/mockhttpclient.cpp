#include "mockhttpclient.h"

#include <QMutexLocker>
#include <QThread>

#include <algorithm>

namespace {

class MockHttpStream : public IHttpStream
{
public:
    MockHttpStream(HttpResponseHead head, QByteArray body, qint64 failAfter,
                   qint64 maxReadSize, int readDelayMs)
        : head_(std::move(head))
        , body_(std::move(body))
        , failAfter_(failAfter)
        , maxReadSize_(maxReadSize)
        , readDelayMs_(readDelayMs)
    {
    }

    HttpResponseHead waitForHead(int) override
    {
        return head_;
    }

    ReadStatus read(qint64 maxBytes, int, QByteArray *out) override
    {
        out->clear();
        if (readDelayMs_ > 0) {
            QThread::msleep(readDelayMs_);
        }
        if (failAfter_ >= 0 && position_ >= failAfter_) {
            error_ = QStringLiteral("Connection reset by peer");
            return ReadStatus::Error;
        }
        if (position_ >= body_.size()) {
            return ReadStatus::EndOfStream;
        }

        qint64 count = std::min<qint64>(maxBytes, body_.size() - position_);
        if (maxReadSize_ > 0) {
            count = std::min(count, maxReadSize_);
        }
        if (failAfter_ >= 0) {
            count = std::min(count, failAfter_ - position_);
        }
        *out = body_.mid(position_, count);
        position_ += count;
        return ReadStatus::Data;
    }

    QString errorString() const override
    {
        return error_;
    }

private:
    HttpResponseHead head_;
    QByteArray body_;
    qint64 failAfter_;
    qint64 maxReadSize_;
    int readDelayMs_;
    qint64 position_ = 0;
    QString error_;
};

// "bytes=N-" or "bytes=N-M"
bool parseRange(const QByteArray &value, qint64 *start, qint64 *end)
{
    if (!value.startsWith("bytes=")) {
        return false;
    }
    QByteArray rangeSet = value.mid(6);
    int dash = rangeSet.indexOf('-');
    if (dash < 0) {
        return false;
    }
    bool ok = false;
    *start = rangeSet.left(dash).toLongLong(&ok);
    if (!ok) {
        return false;
    }
    QByteArray last = rangeSet.mid(dash + 1);
    *end = last.isEmpty() ? -1 : last.toLongLong(&ok);
    return ok;
}

} // namespace

QByteArray MockHttpClient::Request::header(const QByteArray &name) const
{
    for (const auto &pair : headers) {
        if (pair.first.compare(name, Qt::CaseInsensitive) == 0) {
            return pair.second;
        }
    }
    return QByteArray();
}

QString MockHttpClient::keyFor(const QUrl &url)
{
    return url.toString(QUrl::FullyEncoded);
}

bool MockHttpClient::takeStatusOverride(Resource &resource, int *status)
{
    if (resource.statusOverride == 0) {
        return false;
    }
    *status = resource.statusOverride;
    if (resource.statusOverrideCount > 0 && --resource.statusOverrideCount == 0) {
        resource.statusOverride = 0;
    }
    return true;
}

HttpResponseHead MockHttpClient::head(const QUrl &url, const HttpHeaders &headers, int)
{
    QMutexLocker locker(&mutex_);
    requests_.append(Request{"HEAD", url, headers});

    HttpResponseHead response;
    if (!headSupported_) {
        response.statusCode = 405;
        return response;
    }

    auto it = resources_.find(keyFor(url));
    if (it == resources_.end()) {
        response.statusCode = 404;
        return response;
    }
    int status = 0;
    if (takeStatusOverride(*it, &status)) {
        response.statusCode = status;
        return response;
    }

    response.statusCode = 200;
    if (!it->omitSize) {
        response.headers.append(qMakePair(QByteArray("Content-Length"),
                                          QByteArray::number(it->data.size())));
    }
    return response;
}

std::unique_ptr<IHttpStream> MockHttpClient::get(const QUrl &url, const HttpHeaders &headers)
{
    QMutexLocker locker(&mutex_);
    Request request{"GET", url, headers};
    requests_.append(request);

    HttpResponseHead response;
    QByteArray body;
    qint64 failAfter = -1;

    auto it = resources_.find(keyFor(url));
    int status = 0;
    if (it == resources_.end()) {
        response.statusCode = 404;
    } else if (takeStatusOverride(*it, &status)) {
        response.statusCode = status;
    } else {
        const QByteArray &data = it->data;
        const qint64 size = data.size();
        qint64 start = 0;
        qint64 end = -1;
        bool ranged = !it->ignoreRange && parseRange(request.header("Range"), &start, &end);

        if (!ranged) {
            response.statusCode = 200;
            body = data;
        } else if (start >= size) {
            response.statusCode = 416;
            response.headers.append(qMakePair(QByteArray("Content-Range"),
                                              "bytes */" + QByteArray::number(size)));
        } else {
            if (end < 0 || end >= size) {
                end = size - 1;
            }
            response.statusCode = 206;
            body = data.mid(start, end - start + 1);
            response.headers.append(qMakePair(
                QByteArray("Content-Range"),
                "bytes " + QByteArray::number(start) + "-" + QByteArray::number(end)
                    + "/" + (it->omitSize ? QByteArray("*") : QByteArray::number(size))));
        }

        if (response.statusCode != 416 && !it->omitSize) {
            response.headers.append(qMakePair(QByteArray("Content-Length"),
                                              QByteArray::number(body.size())));
        }
        if (it->interruptAfter >= 0) {
            failAfter = it->interruptAfter;
            it->interruptAfter = -1;
        }
    }

    return std::make_unique<MockHttpStream>(response, body, failAfter, maxReadSize_, readDelayMs_);
}

void MockHttpClient::mockSetFile(const QUrl &url, const QByteArray &data)
{
    QMutexLocker locker(&mutex_);
    resources_[keyFor(url)].data = data;
}

void MockHttpClient::mockSetIgnoreRange(const QUrl &url, bool ignore)
{
    QMutexLocker locker(&mutex_);
    resources_[keyFor(url)].ignoreRange = ignore;
}

void MockHttpClient::mockSetOmitSize(const QUrl &url, bool omit)
{
    QMutexLocker locker(&mutex_);
    resources_[keyFor(url)].omitSize = omit;
}

void MockHttpClient::mockSetHeadSupported(bool supported)
{
    QMutexLocker locker(&mutex_);
    headSupported_ = supported;
}

void MockHttpClient::mockInterruptOnce(const QUrl &url, qint64 afterBytes)
{
    QMutexLocker locker(&mutex_);
    resources_[keyFor(url)].interruptAfter = afterBytes;
}

void MockHttpClient::mockSetStatusOverride(const QUrl &url, int status, int times)
{
    QMutexLocker locker(&mutex_);
    Resource &resource = resources_[keyFor(url)];
    resource.statusOverride = status;
    resource.statusOverrideCount = times < 0 ? 0 : times;
}

void MockHttpClient::mockSetMaxReadSize(qint64 bytes)
{
    QMutexLocker locker(&mutex_);
    maxReadSize_ = bytes;
}

void MockHttpClient::mockSetReadDelayMs(int delayMs)
{
    QMutexLocker locker(&mutex_);
    readDelayMs_ = delayMs;
}

int MockHttpClient::mockGetRequestCount(const QByteArray &method, const QUrl &url) const
{
    QMutexLocker locker(&mutex_);
    int count = 0;
    for (const Request &request : requests_) {
        if (request.method == method && (url.isEmpty() || keyFor(request.url) == keyFor(url))) {
            ++count;
        }
    }
    return count;
}

QList<MockHttpClient::Request> MockHttpClient::mockGetRequests() const
{
    QMutexLocker locker(&mutex_);
    return requests_;
}

void MockHttpClient::mockClearRequests()
{
    QMutexLocker locker(&mutex_);
    requests_.clear();
}
