/**
 * @file connection_state_machine.hpp
 * @brief Connection lifecycle state machine for stream clients
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/state_machine/state_machine.hpp>
#include <absl/status/status.h>
#include <memory>
#include <mutex>
#include <string>
#include <glog/logging.h>

namespace opsdeck {

/**
 * @brief Connection states of a stream client
 */
enum class ConnectionState {
    DISCONNECTED,    // Not started, stopped, or closed cleanly by the server
    CONNECTING,      // Transport open in progress
    CONNECTED,       // Transport open, frames flowing
    ERROR            // Connect failed or connection lost (reconnect may be pending)
};

/**
 * @brief Convert connection state to string
 */
inline std::string connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::ERROR:        return "ERROR";
        default:                            return "UNKNOWN";
    }
}

/**
 * @brief Connection state machine for one logical stream
 *
 * State flow:
 *   DISCONNECTED --[connect]--> CONNECTING
 *   ERROR --[connect]--> CONNECTING
 *   CONNECTING --[transport_open]--> CONNECTED
 *   CONNECTING --[connect_failed]--> ERROR
 *   CONNECTED --[connection_lost]--> ERROR
 *   CONNECTED --[closed]--> DISCONNECTED
 *   DISCONNECTED/ERROR --[retry]--> CONNECTING
 *   DISCONNECTED --[exhausted]--> ERROR
 *   * --[stop]--> DISCONNECTED
 *
 * Every trigger returns whether a transition happened, so the owner can
 * publish state changes exactly once.
 */
class StreamConnectionStateMachine {
public:
    /// @param client_name Prefix of log lines, e.g. "StreamClient:session/abc"
    explicit StreamConnectionStateMachine(std::string client_name)
        : client_name_(std::move(client_name))
        , last_error_(absl::OkStatus())
    {
        init_state_machine();
    }

    ConnectionState current_state() const {
        return state_machine_->current_state();
    }

    /**
     * @brief Readiness of the stream as a Status
     *
     * OK only while CONNECTED. In ERROR the recorded failure is returned so
     * callers see the ErrorKind of the last connect attempt or loss.
     */
    Status status() const {
        switch (state_machine_->current_state()) {
            case ConnectionState::CONNECTED:
                return absl::OkStatus();
            case ConnectionState::CONNECTING:
                return absl::UnavailableError(client_name_ + " connecting");
            case ConnectionState::ERROR:
                return last_error();
            case ConnectionState::DISCONNECTED:
                break;
        }
        return absl::FailedPreconditionError(client_name_ + " not connected");
    }

    bool is_connected() const {
        return state_machine_->current_state() == ConnectionState::CONNECTED;
    }

    Status last_error() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return last_error_;
    }

    // ========================================================================
    // State transition triggers (called from the stream client)
    // ========================================================================

    bool trigger_connect() {
        return state_machine_->trigger("connect");
    }

    bool trigger_transport_open() {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = absl::OkStatus();
        }
        return state_machine_->trigger("transport_open");
    }

    bool trigger_connect_failed(const Status& error) {
        record_error(error);
        return state_machine_->trigger("connect_failed");
    }

    bool trigger_connection_lost(const Status& error) {
        record_error(error);
        return state_machine_->trigger("connection_lost");
    }

    bool trigger_closed() {
        return state_machine_->trigger("closed");
    }

    bool trigger_retry() {
        return state_machine_->trigger("retry");
    }

    /// Reconnect budget used up; parks the machine in ERROR
    bool trigger_exhausted(const Status& error) {
        record_error(error);
        if (state_machine_->current_state() == ConnectionState::ERROR) {
            return false;
        }
        return state_machine_->trigger("exhausted");
    }

    bool trigger_stop() {
        return state_machine_->trigger("stop");
    }

private:
    void init_state_machine() {
        state_machine_ = std::make_unique<StateMachine<ConnectionState>>(
            client_name_, ConnectionState::DISCONNECTED
        );

        state_machine_->set_state_name_function(connection_state_name);

        state_machine_->define_state(ConnectionState::CONNECTING)
            .on_entry([this]() {
                VLOG(1) << "[" << client_name_ << "] Opening transport";
            });

        state_machine_->define_state(ConnectionState::CONNECTED)
            .on_entry([this]() {
                LOG(INFO) << "[" << client_name_ << "] Connected";
            });

        state_machine_->define_state(ConnectionState::ERROR)
            .on_entry([this]() {
                std::lock_guard<std::mutex> lock(error_mutex_);
                LOG(WARNING) << "[" << client_name_ << "] Failed: " << last_error_;
            });

        struct Edge {
            ConnectionState from;
            ConnectionState to;
            const char* trigger;
        };
        static const Edge kEdges[] = {
            {ConnectionState::DISCONNECTED, ConnectionState::CONNECTING,   "connect"},
            {ConnectionState::ERROR,        ConnectionState::CONNECTING,   "connect"},
            {ConnectionState::CONNECTING,   ConnectionState::CONNECTED,    "transport_open"},
            {ConnectionState::CONNECTING,   ConnectionState::ERROR,        "connect_failed"},
            {ConnectionState::CONNECTED,    ConnectionState::ERROR,        "connection_lost"},
            {ConnectionState::CONNECTED,    ConnectionState::DISCONNECTED, "closed"},
            {ConnectionState::DISCONNECTED, ConnectionState::CONNECTING,   "retry"},
            {ConnectionState::ERROR,        ConnectionState::CONNECTING,   "retry"},
            {ConnectionState::DISCONNECTED, ConnectionState::ERROR,        "exhausted"},
            {ConnectionState::CONNECTING,   ConnectionState::DISCONNECTED, "stop"},
            {ConnectionState::CONNECTED,    ConnectionState::DISCONNECTED, "stop"},
            {ConnectionState::ERROR,        ConnectionState::DISCONNECTED, "stop"},
        };
        for (const auto& edge : kEdges) {
            state_machine_->add_transition(edge.from, edge.to, edge.trigger);
        }
    }

    void record_error(const Status& error) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = error;
    }

    std::string client_name_;

    std::unique_ptr<StateMachine<ConnectionState>> state_machine_;

    mutable std::mutex error_mutex_;
    Status last_error_;
};

} // namespace opsdeck
