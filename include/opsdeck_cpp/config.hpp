/**
 * @file config.hpp
 * @brief Sync configuration loaded from YAML
 *
 * Every field has a default, so an empty document is a valid configuration.
 *
 * @code
 * server:
 *   base_url: http://buildbox.local:8080
 *   request_timeout_ms: 30000
 * poll:
 *   interval_seconds: 5
 *   interval_with_push_seconds: 60
 * push:
 *   enabled: true
 * stream:
 *   heartbeat_seconds: 30
 *   session: { initial_delay_ms: 1000, max_delay_ms: 30000, max_attempts: 5 }
 *   events:  { initial_delay_ms: 1000, max_delay_ms: 60000, max_attempts: 10 }
 * cache:
 *   path: /var/lib/opsdeck/cache.db
 *   session_max_age_hours: 24
 *   session_max_per_repo: 10
 *   job_max_age_days: 30
 * @endcode
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/local_cache.hpp>
#include <opsdeck_cpp/poll_source.hpp>
#include <opsdeck_cpp/stream_client.hpp>
#include <chrono>
#include <string>

namespace opsdeck {

struct ServerConfig {
    std::string base_url = "http://localhost:8080";
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
};

struct PollConfig {
    std::chrono::seconds interval{5};              // without push
    std::chrono::seconds interval_with_push{60};
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{500};
};

struct PushConfig {
    bool enabled = true;
};

struct StreamConfig {
    std::chrono::seconds heartbeat{30};
    ReconnectPolicy session = ReconnectPolicy::per_resource();
    ReconnectPolicy events = ReconnectPolicy::process_wide();
};

struct CacheConfig {
    std::string path = "opsdeck_cache.db";
    EvictionPolicy eviction;
};

struct SyncConfig {
    ServerConfig server;
    PollConfig poll;
    PushConfig push;
    StreamConfig stream;
    CacheConfig cache;

    HttpPollOptions poll_options() const;

    /// Per-session streams: connected frames forwarded
    StreamOptions session_stream_options() const;

    /// Process-wide events stream: connected frames dropped
    StreamOptions events_stream_options() const;
};

/**
 * @brief Parse a YAML document
 * @return InvalidArgument on malformed YAML or a value of the wrong type
 */
Result<SyncConfig> parse_config(const std::string& yaml_text);

/**
 * @brief Load and parse a YAML file
 * @return NotFound if the file cannot be read
 */
Result<SyncConfig> load_config(const std::string& path);

}  // namespace opsdeck
