/**
 * @file networkhttpclient.h
 * @brief QNetworkAccessManager-backed implementation of IHttpClient.
 */

#ifndef NETWORKHTTPCLIENT_H
#define NETWORKHTTPCLIENT_H

#include <QObject>
#include <QThread>

#include "ihttpclient.h"

class QNetworkAccessManager;

/**
 * @brief Blocking HTTP transport running QNetworkAccessManager on a
 *        private network thread.
 *
 * Requests are posted to the network thread. Response bodies are handed
 * to the calling worker through a bounded byte channel: when the channel
 * is full the network side stops reading, which throttles the socket
 * through the reply's read buffer. Workers wait on a condition variable;
 * no event loop is spun on the calling thread.
 *
 * @par Example usage:
 * @code
 * auto http = std::make_shared<NetworkHttpClient>();
 * HttpResponseHead head = http->head(url, headers, 30000);
 * qint64 size = head.header("Content-Length").toLongLong();
 * @endcode
 */
class NetworkHttpClient : public QObject, public IHttpClient
{
    Q_OBJECT

public:
    /// Upper bound of body bytes buffered per response
    static constexpr qint64 ChannelCapacity = 8 * 1024 * 1024;

    /**
     * @brief Constructs the client and starts its network thread.
     * @param parent Optional parent QObject for memory management.
     */
    explicit NetworkHttpClient(QObject *parent = nullptr);

    /**
     * @brief Stops the network thread. Outstanding replies are aborted.
     */
    ~NetworkHttpClient() override;

    HttpResponseHead head(const QUrl &url, const HttpHeaders &headers, int timeoutMs) override;
    std::unique_ptr<IHttpStream> get(const QUrl &url, const HttpHeaders &headers) override;

private:
    QThread networkThread_;
    QNetworkAccessManager *networkManager_ = nullptr;  // Lives in networkThread_
};

#endif // NETWORKHTTPCLIENT_H
