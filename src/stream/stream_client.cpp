/**
 * @file stream_client.cpp
 * @brief StreamClient reconnect, heartbeat and fan-out
 */

#include <opsdeck_cpp/stream_client.hpp>
#include <absl/strings/str_format.h>
#include <glog/logging.h>
#include <algorithm>

namespace opsdeck {

// ============================================================================
// ReconnectPolicy
// ============================================================================

ReconnectPolicy ReconnectPolicy::per_resource() {
    ReconnectPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(1000);
    policy.max_delay = std::chrono::milliseconds(30000);
    policy.max_attempts = 5;
    return policy;
}

ReconnectPolicy ReconnectPolicy::process_wide() {
    ReconnectPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(1000);
    policy.max_delay = std::chrono::milliseconds(60000);
    policy.max_attempts = 10;
    return policy;
}

std::chrono::milliseconds ReconnectPolicy::delay_for_attempt(int attempt) const {
    auto delay = initial_delay;
    for (int i = 0; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

// ============================================================================
// StreamClient
// ============================================================================

StreamClient::StreamClient(std::string name,
                           UrlBuilder url_builder,
                           Scheduler& scheduler,
                           std::unique_ptr<StreamTransport> transport,
                           StreamOptions options)
    : name_("Stream:" + name)
    , url_builder_(std::move(url_builder))
    , scheduler_(scheduler)
    , transport_(std::move(transport))
    , options_(std::move(options))
    , state_machine_(name_)
    , messages_(name_ + "/messages")
    , states_(name_ + "/states")
    , errors_(name_ + "/errors") {
}

StreamClient::~StreamClient() {
    auto_reconnect_ = false;
    teardown();
}

Status StreamClient::connect(const std::string& resource_id) {
    if (resource_id.empty()) {
        return absl::InvalidArgumentError("Resource id must not be empty");
    }

    auto current = state();
    if (resource_id == resource_id_ &&
        (current == ConnectionState::CONNECTED || current == ConnectionState::CONNECTING)) {
        VLOG(1) << "[" << name_ << "] Already attached to " << resource_id;
        return absl::OkStatus();
    }

    if (!resource_id_.empty() && resource_id_ != resource_id) {
        LOG(INFO) << "[" << name_ << "] Switching " << resource_id_ << " -> " << resource_id;
    }

    teardown();
    if (state_machine_.trigger_stop()) {
        publish_state();
    }

    resource_id_ = resource_id;
    attempts_ = 0;
    auto_reconnect_ = true;
    open_transport(false);
    return absl::OkStatus();
}

Status StreamClient::send(const std::string& payload) {
    if (!state_machine_.is_connected()) {
        return absl::FailedPreconditionError(
            absl::StrFormat("[%s] Not connected", name_));
    }
    return transport_->send(payload);
}

Status StreamClient::send_user_input(const std::string& content) {
    return send(encode_user_input(content));
}

void StreamClient::disconnect() {
    auto_reconnect_ = false;
    teardown();
    attempts_ = 0;
    if (state_machine_.trigger_stop()) {
        LOG(INFO) << "[" << name_ << "] Disconnected from " << resource_id_;
        publish_state();
    }
    resource_id_.clear();
}

Status StreamClient::reset_and_reconnect() {
    if (resource_id_.empty()) {
        return absl::FailedPreconditionError(
            absl::StrFormat("[%s] No resource to reconnect to", name_));
    }

    LOG(INFO) << "[" << name_ << "] Manual reconnect to " << resource_id_;
    teardown();
    attempts_ = 0;
    auto_reconnect_ = true;

    auto current = state();
    if (current == ConnectionState::CONNECTED || current == ConnectionState::CONNECTING) {
        if (state_machine_.trigger_stop()) {
            publish_state();
        }
    }
    open_transport(true);
    return absl::OkStatus();
}

// ============================================================================
// Connection lifecycle
// ============================================================================

void StreamClient::open_transport(bool is_retry) {
    uint64_t generation = ++generation_;

    bool changed = is_retry ? state_machine_.trigger_retry() : state_machine_.trigger_connect();
    if (changed) {
        publish_state();
    }

    std::string url = url_builder_(resource_id_);
    VLOG(1) << "[" << name_ << "] Opening " << url;

    StreamTransport::Handlers handlers;
    handlers.on_open = [this, generation]() {
        if (generation == generation_) on_open();
    };
    handlers.on_frame = [this, generation](const std::string& frame) {
        if (generation == generation_) on_frame(frame);
    };
    handlers.on_close = [this, generation](const Status& status) {
        if (generation == generation_) on_close(status);
    };
    transport_->open(url, std::move(handlers));
}

void StreamClient::teardown() {
    ++generation_;
    if (reconnect_timer_ != Scheduler::kNoTimer) {
        scheduler_.cancel(reconnect_timer_);
        reconnect_timer_ = Scheduler::kNoTimer;
    }
    stop_heartbeat();
    transport_->close();
}

void StreamClient::on_open() {
    attempts_ = 0;
    if (state_machine_.trigger_transport_open()) {
        publish_state();
    }
    start_heartbeat();
}

void StreamClient::on_frame(const std::string& frame) {
    auto decoded = decode_frame(frame);
    if (!decoded.ok()) {
        LOG(WARNING) << "[" << name_ << "] Dropping frame: " << decoded.status();
        return;
    }

    switch (decoded->kind()) {
        case MessageKind::PONG:
            return;
        case MessageKind::UNKNOWN:
            VLOG(1) << "[" << name_ << "] Ignoring frame of type '"
                    << decoded->get_if<UnknownMessage>()->type << "'";
            return;
        case MessageKind::CONNECTED:
            if (!options_.forward_connected_frames) {
                return;
            }
            break;
        default:
            break;
    }

    messages_.publish(*decoded);
}

void StreamClient::on_close(const Status& status) {
    stop_heartbeat();

    auto current = state();
    if (current == ConnectionState::CONNECTING) {
        Status error = status.ok()
            ? SyncError::ConnectionFailed(resource_id_, "closed before open")
            : status;
        if (state_machine_.trigger_connect_failed(error)) {
            publish_state();
        }
        errors_.publish(error);
    } else if (current == ConnectionState::CONNECTED) {
        if (status.ok()) {
            LOG(INFO) << "[" << name_ << "] Closed by server";
            if (state_machine_.trigger_closed()) {
                publish_state();
            }
        } else {
            Status error = error_kind(status) == ErrorKind::CONNECTION_FAILED
                ? SyncError::ConnectionLost(resource_id_, std::string(status.message()))
                : status;
            if (state_machine_.trigger_connection_lost(error)) {
                publish_state();
            }
            errors_.publish(error);
        }
    }

    schedule_reconnect();
}

void StreamClient::schedule_reconnect() {
    if (!auto_reconnect_) {
        return;
    }

    const auto& policy = options_.policy;
    if (attempts_ >= policy.max_attempts) {
        auto_reconnect_ = false;
        Status error = SyncError::ConnectionFailed(
            resource_id_,
            absl::StrFormat("Failed to reconnect after %d attempts", attempts_));
        LOG(ERROR) << "[" << name_ << "] Giving up: " << error;
        if (state_machine_.trigger_exhausted(error)) {
            publish_state();
        }
        errors_.publish(error);
        return;
    }

    last_delay_ = policy.delay_for_attempt(attempts_);
    ++attempts_;
    LOG(INFO) << "[" << name_ << "] Reconnecting in " << last_delay_.count()
              << "ms (attempt " << attempts_ << "/" << policy.max_attempts << ")";

    uint64_t generation = generation_;
    reconnect_timer_ = scheduler_.schedule(last_delay_, [this, generation]() {
        reconnect_timer_ = Scheduler::kNoTimer;
        if (generation != generation_ || !auto_reconnect_) {
            return;
        }
        open_transport(true);
    });
}

// ============================================================================
// Heartbeat
// ============================================================================

void StreamClient::start_heartbeat() {
    stop_heartbeat();
    auto interval = options_.policy.heartbeat_interval;
    if (interval.count() <= 0) {
        return;
    }

    uint64_t generation = generation_;
    heartbeat_timer_ = scheduler_.schedule(interval, [this, generation]() {
        heartbeat_timer_ = Scheduler::kNoTimer;
        if (generation != generation_ || !state_machine_.is_connected()) {
            return;
        }
        auto status = transport_->send(encode_ping());
        if (!status.ok()) {
            LOG(WARNING) << "[" << name_ << "] Heartbeat failed: " << status;
        }
        start_heartbeat();
    });
}

void StreamClient::stop_heartbeat() {
    if (heartbeat_timer_ != Scheduler::kNoTimer) {
        scheduler_.cancel(heartbeat_timer_);
        heartbeat_timer_ = Scheduler::kNoTimer;
    }
}

void StreamClient::publish_state() {
    states_.publish(state_machine_.current_state());
}

}  // namespace opsdeck
