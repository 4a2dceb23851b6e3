/**
 * @file chunkedfetcher.h
 * @brief Resumable single-file HTTP download with adaptive chunk sizing.
 */

#ifndef CHUNKEDFETCHER_H
#define CHUNKEDFETCHER_H

#include <QElapsedTimer>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QUrl>
#include <QWaitCondition>

#include <memory>

#include "adaptivechunksizer.h"
#include "errorhandler.h"
#include "ihttpclient.h"

/**
 * @brief Outcome of one ChunkedFetcher::fetch() call.
 */
struct FetchResult {
    enum class Status {
        Completed,  ///< Local file is complete
        Cancelled,  ///< cancel() was called; partial file left in place
        Failed      ///< Terminal error; partial file left in place
    };

    Status status = Status::Failed;
    QString localPath;
    qint64 bytesWritten = 0;   ///< Local file size when the call returned
    qint64 totalBytes = -1;    ///< Remote size, -1 if never reported
    bool skipped = false;      ///< Local file already matched the remote size
    bool sizeUnknown = false;  ///< The host never reported a size; progress had no total
    int attempts = 0;          ///< Number of GET attempts made
    int httpStatus = 0;        ///< Last HTTP status seen
    ErrorCategory error = ErrorCategory::None;
    QString errorMessage;

    [[nodiscard]] bool isSuccess() const { return status == Status::Completed; }
};

/**
 * @brief Performs one resumable HTTP download of one remote file.
 *
 * ChunkedFetcher owns the session state of a single transfer: byte offset,
 * remote size, current read size and a rolling throughput window. A fetch
 * blocks the calling thread; pause(), resume() and cancel() may be called
 * from any other thread and take effect at the next read iteration.
 *
 * - An existing local file is resumed with a "Range: bytes=N-" request.
 * - If the local size already equals the remote size, nothing is fetched.
 * - Transient failures are retried with exponential backoff; written
 *   bytes are kept and the next attempt resumes after them.
 * - Partial files are never deleted, whatever the outcome.
 *
 * @par Example usage:
 * @code
 * auto fetcher = std::make_shared<ChunkedFetcher>(http);
 * connect(fetcher.get(), &ChunkedFetcher::progressChanged,
 *         this, &Monitor::onProgress, Qt::QueuedConnection);
 *
 * FetchResult result = fetcher->fetch(url, "processing/Game.zip");
 * if (!result.isSuccess()) {
 *     qWarning() << result.errorMessage;
 * }
 * @endcode
 */
class ChunkedFetcher : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultMaxRetries = 50;
    static constexpr int DefaultReadTimeoutMs = 30000;
    static constexpr int DefaultBackoffBaseMs = 1000;
    static constexpr qint64 MaxBackoffMs = 300000;
    static constexpr int ReportIntervalMs = 100;  ///< At most 10 reports per second

    /**
     * @brief Constructs a fetcher using @p http as transport.
     * @param http The HTTP transport (shared with other stages).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ChunkedFetcher(std::shared_ptr<IHttpClient> http, QObject *parent = nullptr);
    ~ChunkedFetcher() override = default;

    /// @name Transfer
    /// @{

    /**
     * @brief Downloads @p url to @p localPath, resuming if it exists.
     * @param url Remote file URL.
     * @param localPath Destination path. Parent directories are created.
     * @param maxRetries Maximum number of attempts on transient errors.
     * @return Structured result; the completed() signal is emitted only
     *         on success.
     */
    FetchResult fetch(const QUrl &url, const QString &localPath, int maxRetries = DefaultMaxRetries);

    /**
     * @brief Determines the remote size without transferring the body.
     *
     * Sends HEAD first and falls back to a one-byte ranged GET. Responses
     * 200, 206 and 416 are accepted.
     *
     * @return Size in bytes, or -1 if the size could not be determined.
     */
    qint64 queryRemoteSize(const QUrl &url);
    /// @}

    /// @name Flow Control
    /// @{

    /**
     * @brief Requests a pause; the transfer blocks at the next read.
     */
    void pause();

    /**
     * @brief Clears a pause request and wakes the transfer.
     */
    void resume();

    /**
     * @brief Stops the transfer at the next read or backoff wait.
     *
     * fetch() then returns FetchResult::Status::Cancelled without emitting
     * completed().
     */
    void cancel();

    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] bool isRunning() const;
    /// @}

    /// @name Tuning
    /// @{
    void setReadTimeoutMs(int timeoutMs) { readTimeoutMs_ = timeoutMs; }
    void setBackoffBaseMs(int baseMs) { backoffBaseMs_ = baseMs; }
    [[nodiscard]] qint64 currentChunkSize() const { return sizer_.chunkSize(); }
    /// @}

    /**
     * @brief Request headers expected by the remote host.
     *
     * The host throttles bare default user agents, so requests carry a
     * browser User-Agent and a Referer pointing at the host's own origin.
     */
    [[nodiscard]] static HttpHeaders browserHeaders(const QUrl &url);

    /**
     * @brief Extracts TOTAL from "bytes X-Y/TOTAL" or "bytes *\/TOTAL".
     * @return The total, or -1 if absent or "*".
     */
    [[nodiscard]] static qint64 parseContentRangeTotal(const QByteArray &contentRange);

    /**
     * @brief Backoff before retry number @p attempt (0-based), without jitter.
     */
    [[nodiscard]] static qint64 backoffDelayMs(int attempt, int baseMs);

signals:
    /**
     * @brief Emitted at most every ReportIntervalMs while data arrives.
     * @param bytesReceived Bytes present in the local file.
     * @param totalBytes Remote size, or -1 if unknown.
     */
    void progressChanged(qint64 bytesReceived, qint64 totalBytes);

    /**
     * @brief Emitted alongside progressChanged().
     * @param bytesPerSecond Throughput over the recent chunk window.
     */
    void speedChanged(double bytesPerSecond);

    /**
     * @brief Emitted when the estimate moves by more than one second.
     * @param seconds Remaining seconds, or -1 when unknown.
     */
    void etaChanged(qint64 seconds);

    /**
     * @brief Emitted when the transfer blocks on, or leaves, a pause.
     */
    void pausedChanged(bool paused);

    /**
     * @brief Emitted before sleeping ahead of a retry.
     */
    void retrying(int attempt, qint64 delayMs, const QString &reason);

    /**
     * @brief Emitted when the local file is complete.
     */
    void completed(const QString &localPath);

private:
    enum class AttemptOutcome { Done, Transient, Terminal, Cancelled };

    AttemptOutcome runAttempt(const QUrl &url, const QString &localPath,
                              qint64 *totalBytes, FetchResult *result);

    /**
     * @brief Blocks while paused.
     * @return False if the transfer was cancelled.
     */
    bool waitWhilePaused();

    /**
     * @brief Sleeps @p delayMs unless cancelled first.
     * @return False if the transfer was cancelled.
     */
    bool waitForBackoff(qint64 delayMs);

    void resetTiming();
    void report(qint64 bytes, qint64 total, bool force);

    [[nodiscard]] static bool isTransientStatus(int status);

    std::shared_ptr<IHttpClient> http_;

    mutable QMutex mutex_;
    QWaitCondition wakeCondition_;
    bool paused_ = false;
    bool running_ = true;

    AdaptiveChunkSizer sizer_;
    QElapsedTimer transferTimer_;
    QElapsedTimer reportTimer_;
    qint64 lastEta_ = -1;
    QString lastError_;

    int readTimeoutMs_ = DefaultReadTimeoutMs;
    int backoffBaseMs_ = DefaultBackoffBaseMs;
};

#endif // CHUNKEDFETCHER_H
