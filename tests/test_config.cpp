/**
 * @file test_config.cpp
 * @brief Unit tests for YAML configuration loading
 */

#include <gtest/gtest.h>
#include <glog/logging.h>
#include <opsdeck_cpp/config.hpp>
#include <cstdio>
#include <fstream>

using namespace opsdeck;
using std::chrono::hours;
using std::chrono::milliseconds;
using std::chrono::seconds;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!google::IsGoogleLoggingInitialized()) {
            google::InitGoogleLogging("test");
            FLAGS_logtostderr = 1;
        }
    }
};

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto config = parse_config("");
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->server.base_url, "http://localhost:8080");
    EXPECT_EQ(config->server.request_timeout, seconds(30));
    EXPECT_EQ(config->poll.interval, seconds(5));
    EXPECT_EQ(config->poll.interval_with_push, seconds(60));
    EXPECT_EQ(config->poll.max_retries, 2);
    EXPECT_TRUE(config->push.enabled);

    EXPECT_EQ(config->stream.session.max_attempts, 5);
    EXPECT_EQ(config->stream.session.max_delay, seconds(30));
    EXPECT_EQ(config->stream.events.max_attempts, 10);
    EXPECT_EQ(config->stream.events.max_delay, seconds(60));
    EXPECT_EQ(config->stream.events.heartbeat_interval, seconds(30));

    EXPECT_EQ(config->cache.eviction.session_max_age, hours(24));
    EXPECT_EQ(config->cache.eviction.session_max_per_repo, 10);
}

TEST_F(ConfigTest, OverridesAreApplied) {
    auto config = parse_config(R"(
server:
  base_url: https://ops.example.com/
  request_timeout_ms: 5000
poll:
  interval_seconds: 10
  interval_with_push_seconds: 120
  max_retries: 0
push:
  enabled: false
stream:
  heartbeat_seconds: 15
  session:
    max_attempts: 3
  events:
    initial_delay_ms: 250
    max_delay_ms: 8000
cache:
  path: /tmp/board.db
  session_max_per_repo: 4
  job_max_age_days: 7
  job_max_per_repo: 50
)");
    ASSERT_TRUE(config.ok()) << config.status();

    EXPECT_EQ(config->server.base_url, "https://ops.example.com/");
    EXPECT_EQ(config->server.request_timeout, milliseconds(5000));
    EXPECT_EQ(config->poll.interval, seconds(10));
    EXPECT_EQ(config->poll.interval_with_push, seconds(120));
    EXPECT_EQ(config->poll.max_retries, 0);
    EXPECT_FALSE(config->push.enabled);

    EXPECT_EQ(config->stream.session.max_attempts, 3);
    EXPECT_EQ(config->stream.session.initial_delay, seconds(1));
    EXPECT_EQ(config->stream.events.initial_delay, milliseconds(250));
    EXPECT_EQ(config->stream.events.max_delay, milliseconds(8000));
    EXPECT_EQ(config->stream.events.max_attempts, 10);
    EXPECT_EQ(config->stream.session.heartbeat_interval, seconds(15));
    EXPECT_EQ(config->stream.events.heartbeat_interval, seconds(15));

    EXPECT_EQ(config->cache.path, "/tmp/board.db");
    EXPECT_EQ(config->cache.eviction.session_max_per_repo, 4);
    EXPECT_EQ(config->cache.eviction.job_max_age, hours(24 * 7));
    EXPECT_EQ(config->cache.eviction.job_max_per_repo, 50);
}

TEST_F(ConfigTest, DerivedOptions) {
    auto config = parse_config("poll:\n  max_retries: 4\n  retry_delay_ms: 100\n");
    ASSERT_TRUE(config.ok()) << config.status();

    auto poll = config->poll_options();
    EXPECT_EQ(poll.max_retries, 4);
    EXPECT_EQ(poll.retry_delay, milliseconds(100));
    EXPECT_EQ(poll.request_timeout, seconds(30));

    EXPECT_TRUE(config->session_stream_options().forward_connected_frames);
    EXPECT_FALSE(config->events_stream_options().forward_connected_frames);
    EXPECT_EQ(config->events_stream_options().policy.max_attempts, 10);
}

TEST_F(ConfigTest, WrongTypeIsInvalidArgument) {
    auto config = parse_config("poll:\n  max_retries: lots\n");
    EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ConfigTest, NonMappingRootIsInvalidArgument) {
    auto config = parse_config("- just\n- a list\n");
    EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ConfigTest, MalformedYamlIsInvalidArgument) {
    auto config = parse_config("server: [unclosed\n");
    EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    const char* bad[] = {
        "server:\n  base_url: localhost:8080\n",
        "server:\n  base_url: ftp://host\n",
        "poll:\n  interval_seconds: 0\n",
        "stream:\n  session:\n    max_attempts: -1\n",
        "stream:\n  events:\n    initial_delay_ms: 5000\n    max_delay_ms: 1000\n",
        "cache:\n  job_max_per_repo: -3\n",
    };
    for (const char* text : bad) {
        auto config = parse_config(text);
        EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument) << text;
    }
}

TEST_F(ConfigTest, MissingFileIsNotFound) {
    auto config = load_config(::testing::TempDir() + "opsdeck_no_such_config.yaml");
    EXPECT_EQ(config.status().code(), absl::StatusCode::kNotFound);
}

TEST_F(ConfigTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "opsdeck_config_test.yaml";
    {
        std::ofstream out(path);
        out << "server:\n  base_url: http://10.0.0.5:9000\npush:\n  enabled: false\n";
    }

    auto config = load_config(path);
    std::remove(path.c_str());

    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->server.base_url, "http://10.0.0.5:9000");
    EXPECT_FALSE(config->push.enabled);
}
