/**
 * @file test_chunkedfetcher.cpp
 * @brief Unit tests for ChunkedFetcher.
 *
 * Tests verify:
 * - Interrupted transfers resume with a Range request and produce the
 *   same bytes as an uninterrupted one
 * - A complete local file is not fetched again
 * - Hosts ignoring ranges, terminal statuses and exhausted retries
 * - Pause, resume and cancel from another thread
 * - Size probing and request headers
 * - A host that never reports a size still completes, flagged as unknown
 */

#include <QtTest/QtTest>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <atomic>
#include <future>
#include <memory>

#include "services/chunkedfetcher.h"
#include "mocks/mockhttpclient.h"

namespace {

QByteArray makePayload(int size)
{
    QByteArray data(size, Qt::Uninitialized);
    for (int i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 253) & 0xff);
    }
    return data;
}

bool writeFile(const QString &path, const QByteArray &data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

} // namespace

class TestChunkedFetcher : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Transfer tests
    void testFreshDownload();
    void testInterruptedTransferResumes();
    void testResumeFromExistingPartial();
    void testCompleteLocalFileNotFetchedAgain();
    void testHostIgnoringRangeRestarts();
    void testLocalFileLargerThanRemoteRestarts();
    void testCompleteFileDetectedWithoutHead();
    void testUnknownSizeStillCompletes();

    // Failure tests
    void testNotFoundIsTerminalAndKeepsPartial();
    void testTransientStatusRetried();
    void testRetriesExhausted();

    // Flow control tests
    void testCancelFromOtherThread();
    void testPauseAndResumeFromOtherThread();

    // Probing and headers
    void testSizeQueryUsesHead();
    void testSizeQueryFallsBackToRangedGet();
    void testBrowserHeadersSent();

    // Static helpers
    void testParseContentRangeTotal();
    void testBackoffDelay();

private:
    QUrl fileUrl() const { return QUrl("https://myrient.example/files/Sony/Game%20(USA).zip"); }
    QString localPath() const { return tempDir_->filePath("processing/Game (USA).zip"); }

    std::unique_ptr<QTemporaryDir> tempDir_;
    std::shared_ptr<MockHttpClient> http_;
    std::unique_ptr<ChunkedFetcher> fetcher_;
    QByteArray payload_;
};

void TestChunkedFetcher::init()
{
    tempDir_ = std::make_unique<QTemporaryDir>();
    QVERIFY(tempDir_->isValid());

    payload_ = makePayload(200000);
    http_ = std::make_shared<MockHttpClient>();
    http_->mockSetFile(fileUrl(), payload_);

    fetcher_ = std::make_unique<ChunkedFetcher>(http_);
    fetcher_->setBackoffBaseMs(1);
    fetcher_->setReadTimeoutMs(1000);
}

void TestChunkedFetcher::cleanup()
{
    fetcher_.reset();
    http_.reset();
    tempDir_.reset();
}

void TestChunkedFetcher::testFreshDownload()
{
    QSignalSpy completedSpy(fetcher_.get(), &ChunkedFetcher::completed);
    QSignalSpy progressSpy(fetcher_.get(), &ChunkedFetcher::progressChanged);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QVERIFY(!result.skipped);
    QCOMPARE(result.attempts, 1);
    QVERIFY(!result.sizeUnknown);
    QCOMPARE(result.totalBytes, qint64(payload_.size()));
    QCOMPARE(result.bytesWritten, qint64(payload_.size()));
    QCOMPARE(readFile(localPath()), payload_);

    QCOMPARE(completedSpy.count(), 1);
    QVERIFY(progressSpy.count() >= 1);
    QCOMPARE(progressSpy.last().at(0).toLongLong(), qint64(payload_.size()));

    // No local file, so no size query
    QCOMPARE(http_->mockGetRequestCount("HEAD"), 0);
    QCOMPARE(http_->mockGetRequestCount("GET"), 1);
}

void TestChunkedFetcher::testInterruptedTransferResumes()
{
    http_->mockInterruptOnce(fileUrl(), 1000);
    QSignalSpy retrySpy(fetcher_.get(), &ChunkedFetcher::retrying);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QCOMPARE(result.attempts, 2);
    QCOMPARE(retrySpy.count(), 1);
    QCOMPARE(readFile(localPath()), payload_);

    QList<MockHttpClient::Request> requests = http_->mockGetRequests();
    QCOMPARE(requests.size(), 2);
    QVERIFY(requests.at(0).header("Range").isEmpty());
    QCOMPARE(requests.at(1).header("Range"), QByteArray("bytes=1000-"));
}

void TestChunkedFetcher::testResumeFromExistingPartial()
{
    QVERIFY(QDir().mkpath(QFileInfo(localPath()).absolutePath()));
    QVERIFY(writeFile(localPath(), payload_.left(3000)));

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QCOMPARE(readFile(localPath()), payload_);
    QCOMPARE(http_->mockGetRequestCount("HEAD"), 1);
    QCOMPARE(http_->mockGetRequestCount("GET"), 1);
    QCOMPARE(http_->mockGetRequests().last().header("Range"), QByteArray("bytes=3000-"));
}

void TestChunkedFetcher::testCompleteLocalFileNotFetchedAgain()
{
    QVERIFY(QDir().mkpath(QFileInfo(localPath()).absolutePath()));
    QVERIFY(writeFile(localPath(), payload_));
    QSignalSpy completedSpy(fetcher_.get(), &ChunkedFetcher::completed);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QVERIFY(result.skipped);
    QCOMPARE(result.attempts, 0);
    QCOMPARE(completedSpy.count(), 1);
    QCOMPARE(http_->mockGetRequestCount("GET"), 0);
    QCOMPARE(readFile(localPath()), payload_);
}

void TestChunkedFetcher::testHostIgnoringRangeRestarts()
{
    QVERIFY(QDir().mkpath(QFileInfo(localPath()).absolutePath()));
    QVERIFY(writeFile(localPath(), payload_.left(5000)));
    http_->mockSetIgnoreRange(fileUrl(), true);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QCOMPARE(result.httpStatus, 200);
    QCOMPARE(readFile(localPath()), payload_);
}

void TestChunkedFetcher::testLocalFileLargerThanRemoteRestarts()
{
    QVERIFY(QDir().mkpath(QFileInfo(localPath()).absolutePath()));
    QVERIFY(writeFile(localPath(), payload_ + payload_.left(10)));

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QCOMPARE(readFile(localPath()), payload_);
    QVERIFY(http_->mockGetRequests().last().header("Range").isEmpty());
}

void TestChunkedFetcher::testCompleteFileDetectedWithoutHead()
{
    // HEAD unavailable: the size query's ranged GET reports the size, so the
    // complete file is recognized without a body transfer
    QVERIFY(QDir().mkpath(QFileInfo(localPath()).absolutePath()));
    QVERIFY(writeFile(localPath(), payload_));
    http_->mockSetHeadSupported(false);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QVERIFY(result.skipped);
    QCOMPARE(http_->mockGetRequestCount("GET"), 1);
    QCOMPARE(http_->mockGetRequests().last().header("Range"), QByteArray("bytes=0-0"));
}

void TestChunkedFetcher::testUnknownSizeStillCompletes()
{
    http_->mockSetOmitSize(fileUrl(), true);
    QSignalSpy progressSpy(fetcher_.get(), &ChunkedFetcher::progressChanged);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath());

    QVERIFY(result.isSuccess());
    QVERIFY(result.sizeUnknown);
    QCOMPARE(result.error, ErrorCategory::None);
    QCOMPARE(result.bytesWritten, qint64(payload_.size()));
    QCOMPARE(readFile(localPath()), payload_);
    QVERIFY(progressSpy.count() >= 1);
    QCOMPARE(progressSpy.first().at(1).toLongLong(), qint64(-1));

    QCOMPARE(fetcher_->queryRemoteSize(fileUrl()), qint64(-1));
}

void TestChunkedFetcher::testNotFoundIsTerminalAndKeepsPartial()
{
    QUrl missing("https://myrient.example/files/Sony/Missing.zip");
    QString path = tempDir_->filePath("processing/Missing.zip");
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    QVERIFY(writeFile(path, QByteArray(100, 'x')));
    QSignalSpy completedSpy(fetcher_.get(), &ChunkedFetcher::completed);

    FetchResult result = fetcher_->fetch(missing, path);

    QCOMPARE(result.status, FetchResult::Status::Failed);
    QCOMPARE(result.error, ErrorCategory::Network);
    QCOMPARE(result.httpStatus, 404);
    QCOMPARE(result.attempts, 1);
    QVERIFY(result.errorMessage.contains("404"));
    QCOMPARE(completedSpy.count(), 0);

    // Partial data is never deleted
    QCOMPARE(QFileInfo(path).size(), qint64(100));
}

void TestChunkedFetcher::testTransientStatusRetried()
{
    http_->mockSetStatusOverride(fileUrl(), 503, 2);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath(), 5);

    QVERIFY(result.isSuccess());
    QCOMPARE(result.attempts, 3);
    QCOMPARE(readFile(localPath()), payload_);
}

void TestChunkedFetcher::testRetriesExhausted()
{
    http_->mockSetStatusOverride(fileUrl(), 503);
    QSignalSpy retrySpy(fetcher_.get(), &ChunkedFetcher::retrying);

    FetchResult result = fetcher_->fetch(fileUrl(), localPath(), 3);

    QCOMPARE(result.status, FetchResult::Status::Failed);
    QCOMPARE(result.error, ErrorCategory::TransientNetwork);
    QCOMPARE(result.attempts, 3);
    QVERIFY(result.errorMessage.contains("3 attempts"));
    QCOMPARE(retrySpy.count(), 2);
    QCOMPARE(http_->mockGetRequestCount("GET"), 3);
}

void TestChunkedFetcher::testCancelFromOtherThread()
{
    http_->mockSetMaxReadSize(1024);
    http_->mockSetReadDelayMs(5);

    std::atomic<qint64> received(0);
    connect(fetcher_.get(), &ChunkedFetcher::progressChanged, this,
            [&received](qint64 bytes, qint64) { received = bytes; }, Qt::DirectConnection);

    ChunkedFetcher *fetcher = fetcher_.get();
    const QUrl url = fileUrl();
    const QString path = localPath();
    std::future<FetchResult> future = std::async(std::launch::async, [fetcher, url, path]() {
        return fetcher->fetch(url, path);
    });

    QTRY_VERIFY_WITH_TIMEOUT(received > 0, 5000);
    fetcher_->cancel();

    QVERIFY(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    FetchResult result = future.get();

    QCOMPARE(result.status, FetchResult::Status::Cancelled);
    QVERIFY(!fetcher_->isRunning());
    QVERIFY(QFileInfo::exists(path));
    QVERIFY(QFileInfo(path).size() < payload_.size());
}

void TestChunkedFetcher::testPauseAndResumeFromOtherThread()
{
    http_->mockSetMaxReadSize(4096);
    http_->mockSetReadDelayMs(2);

    std::atomic<qint64> received(0);
    std::atomic<bool> blocked(false);
    std::atomic<int> unblocked(0);
    connect(fetcher_.get(), &ChunkedFetcher::progressChanged, this,
            [&received](qint64 bytes, qint64) { received = bytes; }, Qt::DirectConnection);
    connect(fetcher_.get(), &ChunkedFetcher::pausedChanged, this,
            [&blocked, &unblocked](bool paused) {
        if (paused) {
            blocked = true;
        } else {
            ++unblocked;
        }
    }, Qt::DirectConnection);

    ChunkedFetcher *fetcher = fetcher_.get();
    const QUrl url = fileUrl();
    const QString path = localPath();
    std::future<FetchResult> future = std::async(std::launch::async, [fetcher, url, path]() {
        return fetcher->fetch(url, path);
    });

    QTRY_VERIFY_WITH_TIMEOUT(received > 0, 5000);
    fetcher_->pause();
    QTRY_VERIFY_WITH_TIMEOUT(blocked.load(), 5000);
    QVERIFY(fetcher_->isPaused());

    // Nothing moves while paused
    int requestsWhilePaused = http_->mockGetRequestCount("GET");
    qint64 receivedWhilePaused = received;
    QTest::qWait(200);
    QCOMPARE(received.load(), receivedWhilePaused);
    QCOMPARE(http_->mockGetRequestCount("GET"), requestsWhilePaused);
    QVERIFY(future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready);

    fetcher_->resume();
    QVERIFY(future.wait_for(std::chrono::seconds(30)) == std::future_status::ready);
    FetchResult result = future.get();

    QVERIFY(result.isSuccess());
    QCOMPARE(unblocked.load(), 1);
    QCOMPARE(readFile(path), payload_);
}

void TestChunkedFetcher::testSizeQueryUsesHead()
{
    QCOMPARE(fetcher_->queryRemoteSize(fileUrl()), qint64(payload_.size()));
    QCOMPARE(http_->mockGetRequestCount("HEAD"), 1);
    QCOMPARE(http_->mockGetRequestCount("GET"), 0);
}

void TestChunkedFetcher::testSizeQueryFallsBackToRangedGet()
{
    http_->mockSetHeadSupported(false);

    QCOMPARE(fetcher_->queryRemoteSize(fileUrl()), qint64(payload_.size()));
    QCOMPARE(http_->mockGetRequestCount("GET"), 1);
    QCOMPARE(http_->mockGetRequests().last().header("Range"), QByteArray("bytes=0-0"));

    QCOMPARE(fetcher_->queryRemoteSize(QUrl("https://myrient.example/none.zip")), qint64(-1));
}

void TestChunkedFetcher::testBrowserHeadersSent()
{
    FetchResult result = fetcher_->fetch(fileUrl(), localPath());
    QVERIFY(result.isSuccess());

    MockHttpClient::Request request = http_->mockGetRequests().first();
    QVERIFY(request.header("User-Agent").startsWith("Mozilla/5.0"));
    QCOMPARE(request.header("Referer"), QByteArray("https://myrient.example/"));
    QCOMPARE(request.header("Accept"), QByteArray("*/*"));
}

void TestChunkedFetcher::testParseContentRangeTotal()
{
    QCOMPARE(ChunkedFetcher::parseContentRangeTotal("bytes 0-0/12345"), qint64(12345));
    QCOMPARE(ChunkedFetcher::parseContentRangeTotal("bytes 100-199/200"), qint64(200));
    QCOMPARE(ChunkedFetcher::parseContentRangeTotal("bytes */5000"), qint64(5000));
    QCOMPARE(ChunkedFetcher::parseContentRangeTotal("bytes 0-99/*"), qint64(-1));
    QCOMPARE(ChunkedFetcher::parseContentRangeTotal(""), qint64(-1));
}

void TestChunkedFetcher::testBackoffDelay()
{
    QCOMPARE(ChunkedFetcher::backoffDelayMs(0, 1000), qint64(1000));
    QCOMPARE(ChunkedFetcher::backoffDelayMs(1, 1000), qint64(2000));
    QCOMPARE(ChunkedFetcher::backoffDelayMs(4, 1000), qint64(16000));
    QCOMPARE(ChunkedFetcher::backoffDelayMs(9, 1000), ChunkedFetcher::MaxBackoffMs);
    QCOMPARE(ChunkedFetcher::backoffDelayMs(200, 1000), ChunkedFetcher::MaxBackoffMs);
}

QTEST_MAIN(TestChunkedFetcher)
#include "test_chunkedfetcher.moc"
