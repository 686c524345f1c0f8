/**
 * @file websocket_transport.cpp
 * @brief Boost.Beast WebSocket implementation of StreamTransport
 */

#include <opsdeck_cpp/transport.hpp>

#include <absl/strings/str_cat.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <glog/logging.h>

#include <deque>

namespace opsdeck {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief State of one open() call
 *
 * Owned jointly by the transport and by every pending async operation, so it
 * outlives the transport while completions drain. Once shut down it never
 * invokes a handler again.
 */
class WebSocketTransport::Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(net::io_context& io, std::string url, Handlers handlers,
               std::chrono::milliseconds connect_timeout)
        : io_(io)
        , resolver_(io)
        , ws_(io)
        , url_text_(std::move(url))
        , handlers_(std::move(handlers))
        , connect_timeout_(connect_timeout) {}

    void start() {
        auto parsed = parse_url(url_text_);
        if (!parsed.ok()) {
            post_failure(SyncError::ConnectionFailed(url_text_, std::string(parsed.status().message())));
            return;
        }
        if (parsed->scheme != "ws") {
            post_failure(SyncError::ConnectionFailed(
                url_text_, absl::StrCat("scheme '", parsed->scheme, "' not supported")));
            return;
        }
        url_ = *parsed;

        resolver_.async_resolve(url_.host, url_.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

    Status send(const std::string& text) {
        if (closed_ || !opened_) {
            return absl::FailedPreconditionError(
                absl::StrCat("No open connection to ", url_text_));
        }
        outbox_.push_back(text);
        if (outbox_.size() == 1) {
            write_next();
        }
        return absl::OkStatus();
    }

    void shutdown() {
        if (closed_) {
            return;
        }
        closed_ = true;
        handlers_ = Handlers{};
        resolver_.cancel();

        if (opened_ && ws_.is_open()) {
            ws_.async_close(websocket::close_code::normal,
                [self = shared_from_this()](beast::error_code ec) {
                    VLOG(1) << "WebSocket close for " << self->url_text_ << ": " << ec.message();
                });
        } else {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        }
    }

private:
    void on_resolve(beast::error_code ec, const tcp::resolver::results_type& results) {
        if (closed_) {
            return;
        }
        if (ec) {
            fail(ec, "resolve");
            return;
        }

        beast::get_lowest_layer(ws_).expires_after(connect_timeout_);
        beast::get_lowest_layer(ws_).async_connect(results,
            [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (closed_) {
            return;
        }
        if (ec) {
            fail(ec, "connect");
            return;
        }

        // The websocket stream applies its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = connect_timeout_;
        ws_.set_option(timeouts);
        ws_.text(true);

        ws_.async_handshake(absl::StrCat(url_.host, ":", url_.port), url_.target,
            [self = shared_from_this()](beast::error_code ec) {
                self->on_handshake(ec);
            });
    }

    void on_handshake(beast::error_code ec) {
        if (closed_) {
            return;
        }
        if (ec) {
            fail(ec, "handshake");
            return;
        }

        opened_ = true;
        auto on_open = handlers_.on_open;
        if (on_open) {
            on_open();
        }
        if (!closed_) {
            read();
        }
    }

    void read() {
        ws_.async_read(buffer_,
            [self = shared_from_this()](beast::error_code ec, size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (closed_) {
            return;
        }
        if (ec == websocket::error::closed) {
            finish(absl::OkStatus());
            return;
        }
        if (ec) {
            fail(ec, "read");
            return;
        }

        std::string frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        auto on_frame = handlers_.on_frame;
        if (on_frame) {
            on_frame(frame);
        }
        if (!closed_) {
            read();
        }
    }

    void write_next() {
        ws_.async_write(net::buffer(outbox_.front()),
            [self = shared_from_this()](beast::error_code ec, size_t) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec) {
        if (closed_) {
            return;
        }
        if (ec) {
            fail(ec, "write");
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            write_next();
        }
    }

    void fail(beast::error_code ec, const char* operation) {
        Status status;
        if (ec == beast::error::timeout) {
            status = SyncError::Timeout(absl::StrCat(operation, " ", url_text_));
        } else if (!opened_) {
            status = SyncError::ConnectionFailed(url_text_, absl::StrCat(operation, ": ", ec.message()));
        } else {
            status = SyncError::ConnectionLost(url_text_, absl::StrCat(operation, ": ", ec.message()));
        }
        finish(status);
    }

    void post_failure(Status status) {
        net::post(io_, [self = shared_from_this(), status]() {
            self->finish(status);
        });
    }

    void finish(const Status& status) {
        if (closed_) {
            return;
        }
        closed_ = true;
        auto on_close = std::move(handlers_.on_close);
        handlers_ = Handlers{};

        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);

        if (on_close) {
            on_close(status);
        }
    }

    net::io_context& io_;
    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;

    std::string url_text_;
    Url url_;
    Handlers handlers_;
    std::chrono::milliseconds connect_timeout_;

    bool opened_ = false;
    bool closed_ = false;
};

WebSocketTransport::WebSocketTransport(net::io_context& io,
                                       std::chrono::milliseconds connect_timeout)
    : io_(io)
    , connect_timeout_(connect_timeout) {}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::open(const std::string& url, Handlers handlers) {
    close();
    connection_ = std::make_shared<Connection>(io_, url, std::move(handlers), connect_timeout_);
    connection_->start();
}

Status WebSocketTransport::send(const std::string& text) {
    if (!connection_) {
        return absl::FailedPreconditionError("WebSocket transport not open");
    }
    return connection_->send(text);
}

void WebSocketTransport::close() {
    if (connection_) {
        connection_->shutdown();
        connection_.reset();
    }
}

}  // namespace opsdeck
