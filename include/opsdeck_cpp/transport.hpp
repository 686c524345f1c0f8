/**
 * @file transport.hpp
 * @brief Message transport for stream clients, and URL helpers
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace opsdeck {

// =============================================================================
// URLs
// =============================================================================

struct Url {
    std::string scheme;   // ws, wss, http, https
    std::string host;
    std::string port;     // defaulted from the scheme when absent
    std::string target;   // path and query, at least "/"
};

/**
 * @brief Split an absolute URL into its parts
 * @return InvalidArgument for missing scheme or host, or an unknown scheme
 */
Result<Url> parse_url(const std::string& url);

/**
 * @brief Server base URL as a WebSocket base (http->ws, https->wss)
 *
 * A trailing slash is removed. ws/wss URLs pass through.
 */
std::string to_websocket_url(const std::string& base_url);

/// "<ws-base>/ws/sessions/<id>"
std::string session_stream_url(const std::string& base_url, const std::string& session_id);

/// "<ws-base>/ws/jobs/<id>"
std::string job_stream_url(const std::string& base_url, const std::string& job_id);

/// "<ws-base>/ws/events"
std::string events_stream_url(const std::string& base_url);

// =============================================================================
// StreamTransport
// =============================================================================

/**
 * @brief One bidirectional text-frame connection at a time
 *
 * open() is asynchronous; exactly one of on_open or on_close follows, and
 * after on_open, frames arrive via on_frame until on_close. on_close receives
 * OK for a clean close by the peer and an error otherwise. After close()
 * returns, no handler of that connection is invoked. open() may be called
 * again after close().
 */
class StreamTransport {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_frame;
        std::function<void(const Status&)> on_close;
    };

    virtual ~StreamTransport() = default;

    virtual void open(const std::string& url, Handlers handlers) = 0;

    /**
     * @brief Queue one text frame
     * @return FailedPrecondition when no connection is open
     */
    virtual Status send(const std::string& text) = 0;

    virtual void close() = 0;
};

/**
 * @brief StreamTransport over WebSocket (plain TCP) using Boost.Beast
 *
 * Connect and handshake are bounded by connect_timeout; expiry is reported
 * as a TIMEOUT error. wss:// URLs are rejected with CONNECTION_FAILED.
 * All calls must happen on the thread running the io_context.
 */
class WebSocketTransport : public StreamTransport {
public:
    WebSocketTransport(boost::asio::io_context& io, std::chrono::milliseconds connect_timeout);
    ~WebSocketTransport() override;

    void open(const std::string& url, Handlers handlers) override;
    Status send(const std::string& text) override;
    void close() override;

private:
    class Connection;

    boost::asio::io_context& io_;
    std::chrono::milliseconds connect_timeout_;
    std::shared_ptr<Connection> connection_;
};

}  // namespace opsdeck
