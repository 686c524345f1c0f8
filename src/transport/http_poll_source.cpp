/**
 * @file http_poll_source.cpp
 * @brief Boost.Beast HTTP client for the status endpoints
 */

#include <opsdeck_cpp/poll_source.hpp>
#include <opsdeck_cpp/job_codec.hpp>
#include <opsdeck_cpp/transport.hpp>

#include <absl/strings/str_cat.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <glog/logging.h>

namespace opsdeck {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

Status status_for_response(unsigned code, const std::string& target, const std::string& body) {
    auto detail = absl::StrCat("GET ", target, " -> HTTP ", code);
    if (code >= 500) {
        return SyncError::ServerError(absl::StrCat(detail, ": ", body.substr(0, 200)));
    }
    switch (code) {
        case 401: return absl::UnauthenticatedError(detail);
        case 403: return absl::PermissionDeniedError(detail);
        case 404: return absl::NotFoundError(detail);
        case 409: return absl::AlreadyExistsError(detail);
        default:  return absl::InvalidArgumentError(detail);
    }
}

bool is_retryable(const Status& status) {
    switch (error_kind(status)) {
        case ErrorKind::CONNECTION_FAILED:
        case ErrorKind::CONNECTION_LOST:
        case ErrorKind::TIMEOUT:
        case ErrorKind::SERVER_ERROR:
            return true;
        default:
            return false;
    }
}

/**
 * @brief One GET request: resolve, connect, write, read
 */
class HttpRequest : public std::enable_shared_from_this<HttpRequest> {
public:
    using Callback = std::function<void(Result<std::string>)>;

    HttpRequest(net::io_context& io, Url url, std::chrono::milliseconds timeout, Callback done)
        : resolver_(io)
        , stream_(io)
        , url_(std::move(url))
        , timeout_(timeout)
        , done_(std::move(done)) {}

    void start() {
        request_.version(11);
        request_.method(http::verb::get);
        request_.target(url_.target);
        request_.set(http::field::host, url_.host);
        request_.set(http::field::accept, "application/json");
        request_.set(http::field::user_agent, "opsdeck-sync");

        // One deadline for the whole exchange
        stream_.expires_after(timeout_);
        resolver_.async_resolve(url_.host, url_.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    self->fail(ec, "resolve");
                    return;
                }
                self->stream_.async_connect(results,
                    [self](beast::error_code ec, const tcp::endpoint&) {
                        self->on_connect(ec);
                    });
            });
    }

private:
    void on_connect(beast::error_code ec) {
        if (ec) {
            fail(ec, "connect");
            return;
        }
        http::async_write(stream_, request_,
            [self = shared_from_this()](beast::error_code ec, size_t) {
                if (ec) {
                    self->fail(ec, "write");
                    return;
                }
                http::async_read(self->stream_, self->buffer_, self->response_,
                    [self](beast::error_code ec, size_t) {
                        self->on_read(ec);
                    });
            });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            fail(ec, "read");
            return;
        }

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

        unsigned code = response_.result_int();
        if (code < 200 || code >= 300) {
            done_(status_for_response(code, url_.target, response_.body()));
            return;
        }
        done_(std::move(response_.body()));
    }

    void fail(beast::error_code ec, const char* operation) {
        auto what = absl::StrCat("GET ", url_.host, ":", url_.port, url_.target);
        if (ec == beast::error::timeout) {
            done_(SyncError::Timeout(what));
        } else {
            done_(SyncError::ConnectionFailed(what, absl::StrCat(operation, ": ", ec.message())));
        }
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
    Url url_;
    std::chrono::milliseconds timeout_;
    Callback done_;
};

}  // namespace

HttpPollSource::HttpPollSource(net::io_context& io, Scheduler& scheduler,
                               std::string base_url, HttpPollOptions options)
    : io_(io)
    , scheduler_(scheduler)
    , base_url_(std::move(base_url))
    , options_(options)
    , alive_(std::make_shared<bool>(true)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpPollSource::~HttpPollSource() {
    cancel();
}

void HttpPollSource::cancel() {
    *alive_ = false;
    alive_ = std::make_shared<bool>(true);
}

void HttpPollSource::fetch_jobs(JobsCallback done) {
    get("/api/status", [done = std::move(done)](Result<std::string> body) {
        if (!body.ok()) {
            done(body.status());
            return;
        }
        done(parse_status_body(*body));
    });
}

void HttpPollSource::fetch_workflow_state(const std::string& repo, int issue_num,
                                          WorkflowCallback done) {
    get(absl::StrCat("/issues/", repo, "/", issue_num, "/workflow"),
        [done = std::move(done)](Result<std::string> body) {
            if (!body.ok()) {
                done(body.status());
                return;
            }
            done(parse_workflow_state(*body));
        });
}

void HttpPollSource::get(const std::string& target, BodyCallback done) {
    attempt(target, 0, std::move(done));
}

void HttpPollSource::attempt(const std::string& target, int attempt_number, BodyCallback done) {
    auto url = parse_url(base_url_ + target);
    if (!url.ok()) {
        net::post(io_, [done, status = url.status()]() { done(status); });
        return;
    }
    if (url->scheme != "http") {
        auto status = SyncError::ConnectionFailed(base_url_, "only http:// is supported");
        net::post(io_, [done, status]() { done(status); });
        return;
    }

    auto alive = alive_;
    auto request = std::make_shared<HttpRequest>(io_, *url, options_.request_timeout,
        [this, alive, target, attempt_number, done](Result<std::string> result) {
            if (!*alive) {
                return;
            }
            if (!result.ok() && is_retryable(result.status()) &&
                attempt_number < options_.max_retries) {
                auto delay = options_.retry_delay * (attempt_number + 1);
                LOG(WARNING) << "[HttpPollSource] GET " << target << " failed ("
                             << result.status() << "), retry in " << delay.count() << "ms";
                scheduler_.schedule(delay, [this, alive, target, attempt_number, done]() {
                    if (*alive) {
                        attempt(target, attempt_number + 1, done);
                    }
                });
                return;
            }
            done(std::move(result));
        });
    request->start();
}

}  // namespace opsdeck
