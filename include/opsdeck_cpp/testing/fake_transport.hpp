/**
 * @file fake_transport.hpp
 * @brief Scripted StreamTransport for unit tests
 */

#pragma once

#include <opsdeck_cpp/transport.hpp>
#include <string>
#include <vector>

namespace opsdeck {
namespace testing {

/**
 * @brief StreamTransport whose events are produced by the test
 *
 * open() only records the request; the test decides the outcome with
 * accept(), fail() or close_from_server(). Handlers dropped by close() are
 * never invoked again.
 *
 * Usage:
 * @code
 *   auto transport = std::make_unique<FakeTransport>();
 *   auto* fake = transport.get();
 *   StreamClient client("test", url_builder, scheduler, std::move(transport));
 *   client.connect("abc");
 *   fake->accept();
 *   fake->deliver(R"({"type":"assistant_text","content":"hi"})");
 * @endcode
 */
class FakeTransport : public StreamTransport {
public:
    void open(const std::string& url, Handlers handlers) override;
    Status send(const std::string& text) override;
    void close() override;

    // ========================================================================
    // Scripting
    // ========================================================================

    /// Complete the pending open
    void accept();

    /// Push one inbound frame
    void deliver(const std::string& frame);

    /// Fail the pending open or drop the live connection
    void fail(const Status& error);

    /// Server closed the connection cleanly
    void close_from_server();

    /// Make subsequent send() calls return this status
    void set_send_status(Status status) { send_status_ = std::move(status); }

    // ========================================================================
    // Inspection
    // ========================================================================

    /// An open was requested and not yet closed or failed
    bool is_active() const { return active_; }
    bool is_connected() const { return connected_; }

    int open_count() const { return static_cast<int>(urls_.size()); }
    int close_count() const { return close_count_; }
    const std::vector<std::string>& urls() const { return urls_; }
    std::string last_url() const { return urls_.empty() ? std::string() : urls_.back(); }
    const std::vector<std::string>& sent() const { return sent_; }

private:
    Handlers handlers_;
    bool active_ = false;
    bool connected_ = false;
    int close_count_ = 0;
    Status send_status_;
    std::vector<std::string> urls_;
    std::vector<std::string> sent_;
};

} // namespace testing
} // namespace opsdeck
