/**
 * @file ihttpclient.h
 * @brief Interface for blocking HTTP transports used by pipeline workers.
 *
 * This interface allows dependency injection of the HTTP transport, so the
 * download engine can run against QNetworkAccessManager in production and
 * against an in-memory server in tests.
 */

#ifndef IHTTPCLIENT_H
#define IHTTPCLIENT_H

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

#include <memory>

/// Request headers in send order
using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;

/**
 * @brief Status line and headers of a completed HEAD or a started GET.
 */
struct HttpResponseHead {
    int statusCode = 0;           ///< HTTP status, 0 if no response arrived
    QList<QPair<QByteArray, QByteArray>> headers;
    QString errorString;          ///< Transport error, empty on success

    /**
     * @brief Case-insensitive header lookup.
     * @return The header value, or an empty array if absent.
     */
    [[nodiscard]] QByteArray header(const QByteArray &name) const
    {
        for (const auto &pair : headers) {
            if (pair.first.compare(name, Qt::CaseInsensitive) == 0) {
                return pair.second;
            }
        }
        return QByteArray();
    }

    [[nodiscard]] bool hasResponse() const { return statusCode > 0; }
};

/**
 * @brief A streaming response body.
 *
 * All calls block the calling thread. Streams are single-use and are
 * aborted on destruction if still running.
 */
class IHttpStream
{
public:
    enum class ReadStatus {
        Data,         ///< Bytes were appended to the output buffer
        EndOfStream,  ///< Body completely received
        Timeout,      ///< No data within the timeout
        Error         ///< Transport error; see errorString()
    };

    virtual ~IHttpStream() = default;

    /**
     * @brief Waits for the status line and headers.
     * @param timeoutMs Maximum time to wait.
     * @return The response head. statusCode is 0 on timeout or error.
     */
    virtual HttpResponseHead waitForHead(int timeoutMs) = 0;

    /**
     * @brief Reads up to @p maxBytes of body data.
     * @param maxBytes Upper bound for the bytes returned in @p out.
     * @param timeoutMs Maximum time to wait for at least one byte.
     * @param out Receives the data (replaced, not appended).
     */
    virtual ReadStatus read(qint64 maxBytes, int timeoutMs, QByteArray *out) = 0;

    [[nodiscard]] virtual QString errorString() const = 0;
};

/**
 * @brief Abstract blocking HTTP transport.
 *
 * Implementations must be callable from any worker thread.
 *
 * @par Example usage:
 * @code
 * std::shared_ptr<IHttpClient> http = std::make_shared<NetworkHttpClient>();
 * auto stream = http->get(url, {{"Range", "bytes=1024-"}});
 * HttpResponseHead head = stream->waitForHead(30000);
 * @endcode
 */
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Performs a HEAD request and waits for the response.
     */
    virtual HttpResponseHead head(const QUrl &url, const HttpHeaders &headers, int timeoutMs) = 0;

    /**
     * @brief Starts a GET request.
     * @return The response stream; never null.
     */
    virtual std::unique_ptr<IHttpStream> get(const QUrl &url, const HttpHeaders &headers) = 0;
};

#endif // IHTTPCLIENT_H
