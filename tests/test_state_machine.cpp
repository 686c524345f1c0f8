/**
 * @file test_state_machine.cpp
 * @brief Unit tests for the state machine and the stream connection lifecycle
 */

#include <gtest/gtest.h>
#include <glog/logging.h>
#include <opsdeck_cpp/connection_state_machine.hpp>
#include <opsdeck_cpp/state_machine/state_machine.hpp>
#include <algorithm>
#include <atomic>
#include <thread>

using opsdeck::ConnectionState;
using opsdeck::StreamConnectionStateMachine;

// Test state enum
enum class PhaseState {
    Queued,
    Running,
    Finished,
    Failed
};

class StateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize glog for tests
        if (!google::IsGoogleLoggingInitialized()) {
            google::InitGoogleLogging("test");
            FLAGS_logtostderr = 1;
        }
    }
};

TEST_F(StateMachineTest, InitialState) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);
    EXPECT_EQ(sm.current_state(), PhaseState::Queued);
    EXPECT_EQ(sm.transition_count(), 0u);
}

TEST_F(StateMachineTest, SimpleTransition) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);
    sm.add_transition(PhaseState::Queued, PhaseState::Running, "start");

    EXPECT_TRUE(sm.trigger("start"));
    EXPECT_EQ(sm.current_state(), PhaseState::Running);
    EXPECT_EQ(sm.transition_count(), 1u);
}

TEST_F(StateMachineTest, TransitionWithCondition) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);

    bool approved = false;
    sm.add_transition(
        PhaseState::Queued,
        PhaseState::Running,
        "start",
        [&approved](const opsdeck::Context&) { return approved; }
    );

    // Blocked until the guard allows it
    EXPECT_FALSE(sm.trigger("start"));
    EXPECT_EQ(sm.current_state(), PhaseState::Queued);

    approved = true;
    EXPECT_TRUE(sm.trigger("start"));
    EXPECT_EQ(sm.current_state(), PhaseState::Running);
}

TEST_F(StateMachineTest, EntryAndExitActionsRunInOrder) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);

    std::vector<std::string> calls;
    sm.define_state(PhaseState::Queued)
        .on_exit([&calls]() { calls.push_back("exit:queued"); });
    sm.define_state(PhaseState::Running)
        .on_entry([&calls]() { calls.push_back("enter:running"); })
        .on_exit([&calls]() { calls.push_back("exit:running"); });
    sm.define_state(PhaseState::Failed)
        .on_entry([&calls]() { calls.push_back("enter:failed"); });

    sm.add_transition(PhaseState::Queued, PhaseState::Running, "start",
                      {}, [&calls](const opsdeck::Context&) { calls.push_back("action"); });
    sm.add_transition(PhaseState::Running, PhaseState::Failed, "fail");

    sm.trigger("start");
    sm.trigger("fail");

    std::vector<std::string> expected{"exit:queued", "action", "enter:running",
                                      "exit:running", "enter:failed"};
    EXPECT_EQ(calls, expected);
}

TEST_F(StateMachineTest, UnknownTriggerIsIgnored) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);
    sm.add_transition(PhaseState::Queued, PhaseState::Running, "start");

    EXPECT_FALSE(sm.trigger("finish"));
    EXPECT_EQ(sm.current_state(), PhaseState::Queued);
    EXPECT_EQ(sm.transition_count(), 0u);
}

TEST_F(StateMachineTest, AvailableTriggers) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);
    sm.add_transition(PhaseState::Queued, PhaseState::Running, "start");
    sm.add_transition(PhaseState::Queued, PhaseState::Failed, "reject");
    sm.add_transition(PhaseState::Running, PhaseState::Finished, "finish");

    auto triggers = sm.available_triggers();
    EXPECT_EQ(triggers.size(), 2u);
    EXPECT_TRUE(std::find(triggers.begin(), triggers.end(), "start") != triggers.end());
    EXPECT_TRUE(std::find(triggers.begin(), triggers.end(), "reject") != triggers.end());

    sm.trigger("start");
    triggers = sm.available_triggers();
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0], "finish");
}

TEST_F(StateMachineTest, ContextPassing) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Running);

    std::string reason;
    sm.add_transition(
        PhaseState::Running,
        PhaseState::Failed,
        "fail",
        [](const opsdeck::Context& ctx) { return ctx.find("reason") != ctx.end(); },
        [&reason](const opsdeck::Context& ctx) {
            reason = std::any_cast<std::string>(ctx.at("reason"));
        }
    );

    EXPECT_FALSE(sm.trigger("fail"));

    opsdeck::Context ctx{{"reason", std::any(std::string("tests failed"))}};
    EXPECT_TRUE(sm.trigger("fail", ctx));
    EXPECT_EQ(reason, "tests failed");
}

TEST_F(StateMachineTest, ThreadSafety) {
    opsdeck::StateMachine<PhaseState> sm("Job", PhaseState::Queued);
    sm.add_transition(PhaseState::Queued, PhaseState::Running, "next");
    sm.add_transition(PhaseState::Running, PhaseState::Finished, "next");
    sm.add_transition(PhaseState::Finished, PhaseState::Queued, "reset");

    std::atomic<int> success_count{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&sm, &success_count]() {
            for (int j = 0; j < 100; ++j) {
                if (sm.trigger("next")) success_count++;
                if (sm.trigger("reset")) success_count++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_GT(success_count, 0);
    EXPECT_EQ(sm.transition_count(), static_cast<uint64_t>(success_count.load()));
}

// ============================================================================
// Connection lifecycle
// ============================================================================

TEST_F(StateMachineTest, ConnectionHappyPath) {
    StreamConnectionStateMachine sm("session");
    EXPECT_EQ(sm.current_state(), ConnectionState::DISCONNECTED);
    EXPECT_FALSE(sm.status().ok());

    EXPECT_TRUE(sm.trigger_connect());
    EXPECT_EQ(sm.current_state(), ConnectionState::CONNECTING);
    EXPECT_TRUE(sm.trigger_transport_open());
    EXPECT_TRUE(sm.is_connected());
    EXPECT_TRUE(sm.status().ok());

    EXPECT_TRUE(sm.trigger_stop());
    EXPECT_EQ(sm.current_state(), ConnectionState::DISCONNECTED);
}

TEST_F(StateMachineTest, ConnectionLossKeepsError) {
    StreamConnectionStateMachine sm("session");
    sm.trigger_connect();
    sm.trigger_transport_open();

    auto lost = opsdeck::SyncError::ConnectionLost("abc", "reset by peer");
    EXPECT_TRUE(sm.trigger_connection_lost(lost));
    EXPECT_EQ(sm.current_state(), ConnectionState::ERROR);
    EXPECT_EQ(sm.last_error(), lost);
    EXPECT_EQ(sm.status(), lost);

    // Retry from ERROR, and a successful open clears the error
    EXPECT_TRUE(sm.trigger_retry());
    EXPECT_TRUE(sm.trigger_transport_open());
    EXPECT_TRUE(sm.last_error().ok());
}

TEST_F(StateMachineTest, ConnectionRejectsOutOfOrderTriggers) {
    StreamConnectionStateMachine sm("session");

    EXPECT_FALSE(sm.trigger_transport_open());
    EXPECT_FALSE(sm.trigger_closed());
    EXPECT_FALSE(sm.trigger_stop());
    EXPECT_EQ(sm.current_state(), ConnectionState::DISCONNECTED);
}

TEST_F(StateMachineTest, ExhaustedParksInError) {
    StreamConnectionStateMachine sm("events");
    sm.trigger_connect();
    sm.trigger_connect_failed(opsdeck::SyncError::ConnectionFailed("events"));
    ASSERT_EQ(sm.current_state(), ConnectionState::ERROR);

    auto terminal = opsdeck::SyncError::ConnectionFailed("events", "Failed to reconnect after 10 attempts");
    // Already in ERROR: no transition, but the terminal error is recorded
    EXPECT_FALSE(sm.trigger_exhausted(terminal));
    EXPECT_EQ(sm.current_state(), ConnectionState::ERROR);
    EXPECT_EQ(sm.last_error(), terminal);
}
