/**
 * @file stream_client.hpp
 * @brief Resilient, multi-subscriber event stream connection
 *
 * A StreamClient owns one logical connection to one resource (a session, a
 * job, or the process-wide event feed). It reconnects with exponential
 * backoff, sends heartbeats while connected, and fans decoded messages,
 * connection states and errors out to any number of subscribers.
 *
 * Example usage:
 * @code
 * asio::io_context io;
 * AsioScheduler scheduler(io);
 * StreamClient client("session",
 *     [base](const std::string& id) { return session_stream_url(base, id); },
 *     scheduler,
 *     std::make_unique<WebSocketTransport>(io, std::chrono::seconds(10)));
 *
 * client.messages().subscribe([](const StreamMessage& m) {
 *     LOG(INFO) << message_kind_name(m.kind());
 * });
 * client.errors().subscribe([](const Status& error) {
 *     show_banner(user_message(error));
 * });
 *
 * client.connect("abc123");
 * io.run();
 * @endcode
 *
 * Threading model: every method must be called on the event loop thread,
 * and all callbacks are delivered on it.
 */

#pragma once

#include <opsdeck_cpp/broadcaster.hpp>
#include <opsdeck_cpp/connection_state_machine.hpp>
#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/message_codec.hpp>
#include <opsdeck_cpp/scheduler.hpp>
#include <opsdeck_cpp/transport.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace opsdeck {

/**
 * @brief Reconnect and heartbeat timing
 *
 * The delay before reconnect attempt n (counting from 0) is
 * min(initial_delay * 2^n, max_delay).
 */
struct ReconnectPolicy {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    int max_attempts = 5;
    std::chrono::milliseconds heartbeat_interval{30000};

    /// Per-resource streams: 1s initial, 30s cap, 5 attempts
    static ReconnectPolicy per_resource();

    /// Process-wide event stream: 1s initial, 60s cap, 10 attempts
    static ReconnectPolicy process_wide();

    std::chrono::milliseconds delay_for_attempt(int attempt) const;
};

struct StreamOptions {
    ReconnectPolicy policy = ReconnectPolicy::per_resource();

    /// Deliver "connected" frames to message subscribers
    bool forward_connected_frames = true;
};

class StreamClient {
public:
    /// Maps a resource id to the URL to open
    using UrlBuilder = std::function<std::string(const std::string& resource_id)>;

    /**
     * @param name Name used in logs
     * @param url_builder Resource id to URL
     * @param scheduler Timer source for reconnect and heartbeat
     * @param transport Connection implementation, owned by the client
     * @param options Reconnect policy and frame filtering
     */
    StreamClient(std::string name,
                 UrlBuilder url_builder,
                 Scheduler& scheduler,
                 std::unique_ptr<StreamTransport> transport,
                 StreamOptions options = {});

    ~StreamClient();

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    /**
     * @brief Connect to a resource
     *
     * Any previous resource is fully detached first: its pending timers are
     * cancelled and its transport closed. Connecting to the resource already
     * connected or connecting is a no-op.
     *
     * @return InvalidArgument for an empty resource id
     */
    Status connect(const std::string& resource_id);

    /**
     * @brief Send a raw text frame
     * @return FailedPrecondition unless CONNECTED
     */
    Status send(const std::string& payload);

    /// Send {"type":"user_input","content":...}
    Status send_user_input(const std::string& content);

    /**
     * @brief Close the connection and stop reconnecting
     *
     * Pending reconnect and heartbeat timers are cancelled before this
     * returns. Safe to call repeatedly.
     */
    void disconnect();

    /**
     * @brief Clear the attempt counter and reconnect immediately
     *
     * Also re-enables automatic reconnection after the attempt budget ran out.
     *
     * @return FailedPrecondition if no resource was ever connected
     */
    Status reset_and_reconnect();

    ConnectionState state() const { return state_machine_.current_state(); }

    /**
     * @brief OK when connected, otherwise why not
     */
    Status status() const { return state_machine_.status(); }

    /// Reconnect attempts since the last successful connect
    int reconnect_attempts() const { return attempts_; }

    /// Delay used for the most recently scheduled reconnect
    std::chrono::milliseconds last_reconnect_delay() const { return last_delay_; }

    bool reconnect_pending() const { return reconnect_timer_ != Scheduler::kNoTimer; }
    bool heartbeat_pending() const { return heartbeat_timer_ != Scheduler::kNoTimer; }

    const std::string& resource_id() const { return resource_id_; }

    bool is_connected_to(const std::string& resource_id) const {
        return resource_id_ == resource_id && state() == ConnectionState::CONNECTED;
    }

    const std::string& name() const { return name_; }

    // ========================================================================
    // Subscription channels
    // ========================================================================

    /// Decoded messages, in arrival order (pong and unknown frames excluded)
    Broadcaster<StreamMessage>& messages() { return messages_; }

    /// Every connection state change
    Broadcaster<ConnectionState>& states() { return states_; }

    /// Transport failures and the terminal reconnect error
    Broadcaster<Status>& errors() { return errors_; }

private:
    void open_transport(bool is_retry);
    void teardown();
    void on_open();
    void on_frame(const std::string& frame);
    void on_close(const Status& status);
    void schedule_reconnect();
    void start_heartbeat();
    void stop_heartbeat();
    void publish_state();

    std::string name_;
    UrlBuilder url_builder_;
    Scheduler& scheduler_;
    std::unique_ptr<StreamTransport> transport_;
    StreamOptions options_;

    StreamConnectionStateMachine state_machine_;

    std::string resource_id_;
    int attempts_ = 0;
    bool auto_reconnect_ = false;
    std::chrono::milliseconds last_delay_{0};
    uint64_t generation_ = 0;

    Scheduler::TimerId reconnect_timer_ = Scheduler::kNoTimer;
    Scheduler::TimerId heartbeat_timer_ = Scheduler::kNoTimer;

    Broadcaster<StreamMessage> messages_;
    Broadcaster<ConnectionState> states_;
    Broadcaster<Status> errors_;
};

}  // namespace opsdeck
