/**
 * @file config.cpp
 * @brief YAML loading for SyncConfig
 */

#include <opsdeck_cpp/config.hpp>
#include <opsdeck_cpp/transport.hpp>
#include <absl/strings/str_format.h>
#include <yaml-cpp/yaml.h>
#include <glog/logging.h>

namespace opsdeck {

namespace {

template<typename T>
void read_scalar(const YAML::Node& section, const char* key, T& out) {
    if (section && section[key]) {
        out = section[key].template as<T>();
    }
}

template<typename Duration>
void read_duration(const YAML::Node& section, const char* key, Duration& out) {
    if (section && section[key]) {
        out = Duration(section[key].template as<int64_t>());
    }
}

void read_policy(const YAML::Node& node, ReconnectPolicy& policy) {
    if (!node) {
        return;
    }
    read_duration(node, "initial_delay_ms", policy.initial_delay);
    read_duration(node, "max_delay_ms", policy.max_delay);
    read_scalar(node, "max_attempts", policy.max_attempts);
}

Status validate(const SyncConfig& config) {
    auto url = parse_url(config.server.base_url);
    if (!url.ok()) {
        return absl::InvalidArgumentError(
            absl::StrFormat("server.base_url: %s", url.status().message()));
    }
    for (const auto* policy : {&config.stream.session, &config.stream.events}) {
        if (policy->max_attempts < 0 || policy->initial_delay.count() <= 0 ||
            policy->max_delay < policy->initial_delay) {
            return absl::InvalidArgumentError("stream: invalid reconnect policy");
        }
    }
    if (config.poll.interval.count() <= 0 || config.poll.interval_with_push.count() <= 0) {
        return absl::InvalidArgumentError("poll: intervals must be positive");
    }
    if (config.cache.eviction.session_max_per_repo < 0 ||
        config.cache.eviction.job_max_per_repo < 0) {
        return absl::InvalidArgumentError("cache: per-repo caps must not be negative");
    }
    return absl::OkStatus();
}

Result<SyncConfig> from_node(const YAML::Node& root) {
    SyncConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return absl::InvalidArgumentError("Configuration root must be a mapping");
    }

    auto server = root["server"];
    read_scalar(server, "base_url", config.server.base_url);
    read_duration(server, "request_timeout_ms", config.server.request_timeout);
    read_duration(server, "connect_timeout_ms", config.server.connect_timeout);

    auto poll = root["poll"];
    read_duration(poll, "interval_seconds", config.poll.interval);
    read_duration(poll, "interval_with_push_seconds", config.poll.interval_with_push);
    read_scalar(poll, "max_retries", config.poll.max_retries);
    read_duration(poll, "retry_delay_ms", config.poll.retry_delay);

    auto push = root["push"];
    read_scalar(push, "enabled", config.push.enabled);

    auto stream = root["stream"];
    read_duration(stream, "heartbeat_seconds", config.stream.heartbeat);
    if (stream) {
        read_policy(stream["session"], config.stream.session);
        read_policy(stream["events"], config.stream.events);
    }
    config.stream.session.heartbeat_interval = config.stream.heartbeat;
    config.stream.events.heartbeat_interval = config.stream.heartbeat;

    auto cache = root["cache"];
    read_scalar(cache, "path", config.cache.path);
    read_duration(cache, "session_max_age_hours", config.cache.eviction.session_max_age);
    read_scalar(cache, "session_max_per_repo", config.cache.eviction.session_max_per_repo);
    if (cache && cache["job_max_age_days"]) {
        config.cache.eviction.job_max_age =
            std::chrono::hours(24 * cache["job_max_age_days"].as<int64_t>());
    }
    read_scalar(cache, "job_max_per_repo", config.cache.eviction.job_max_per_repo);

    auto status = validate(config);
    if (!status.ok()) {
        return status;
    }
    return config;
}

}  // namespace

// ============================================================================
// SyncConfig
// ============================================================================

HttpPollOptions SyncConfig::poll_options() const {
    HttpPollOptions options;
    options.request_timeout = server.request_timeout;
    options.max_retries = poll.max_retries;
    options.retry_delay = poll.retry_delay;
    return options;
}

StreamOptions SyncConfig::session_stream_options() const {
    StreamOptions options;
    options.policy = stream.session;
    options.forward_connected_frames = true;
    return options;
}

StreamOptions SyncConfig::events_stream_options() const {
    StreamOptions options;
    options.policy = stream.events;
    options.forward_connected_frames = false;
    return options;
}

// ============================================================================
// Loading
// ============================================================================

Result<SyncConfig> parse_config(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(absl::StrFormat("Invalid configuration: %s", e.what()));
    }
}

Result<SyncConfig> load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        return absl::NotFoundError(absl::StrFormat("Cannot read config file %s", path));
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid configuration in %s: %s", path, e.what()));
    }

    try {
        auto config = from_node(root);
        if (config.ok()) {
            LOG(INFO) << "[Config] Loaded " << path;
        }
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Invalid configuration in %s: %s", path, e.what()));
    }
}

}  // namespace opsdeck
