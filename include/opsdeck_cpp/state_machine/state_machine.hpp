/**
 * @file state_machine.hpp
 * @brief Table-driven state machine with structured transition logs
 */

#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <glog/logging.h>

#ifdef OPSDECK_WITH_PROMETHEUS
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <memory>
#endif

namespace opsdeck {

/// Named values handed to guards and actions by trigger()
using Context = std::map<std::string, std::any>;

using Guard = std::function<bool(const Context&)>;
using TransitionAction = std::function<void(const Context&)>;

/**
 * @brief Entry and exit hooks of one state, set through define_state()
 */
class StateHooks {
public:
    StateHooks& on_entry(std::function<void()> hook) {
        entry_ = std::move(hook);
        return *this;
    }

    StateHooks& on_exit(std::function<void()> hook) {
        exit_ = std::move(hook);
        return *this;
    }

private:
    template<typename> friend class StateMachine;

    std::function<void()> entry_;
    std::function<void()> exit_;
};

/**
 * @brief Synchronous, thread-safe state machine over an enum
 *
 * A trigger is looked up by (current state, trigger name). Candidate edges
 * are tried in the order they were added; the first whose guard passes is
 * taken. Running an edge calls, in order: the exit hook of the old state,
 * the edge action (without the lock held), the entry hook of the new state.
 *
 * Log lines:
 * - [SM:name] TRANSITION: from -> to | trigger=event
 * - [SM:name] STATE: current=state (VLOG 1)
 * - [SM:name] IGNORED / BLOCKED (VLOG 1)
 *
 * Hooks run while the machine is locked and must not trigger it again.
 *
 * With OPSDECK_WITH_PROMETHEUS defined, the machine keeps a registry with a
 * current-state gauge, a time-in-state histogram and a transition counter.
 */
template<typename StateT>
class StateMachine {
    static_assert(std::is_enum_v<StateT>, "StateT must be an enum type");

public:
    using NameFunction = std::function<std::string(StateT)>;

    StateMachine(std::string name, StateT initial)
        : name_(std::move(name))
        , state_(initial)
        , entered_at_(std::chrono::steady_clock::now()) {
#ifdef OPSDECK_WITH_PROMETHEUS
        register_metrics();
#endif
    }

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    /// Names used in log lines; defaults to "State_<n>"
    void set_state_name_function(NameFunction names) {
        std::lock_guard<std::mutex> lock(mutex_);
        names_ = std::move(names);
        VLOG(1) << "[SM:" << name_ << "] INIT: state=" << name_of(state_.load());
    }

    void add_transition(StateT from, StateT to, std::string trigger,
                        Guard guard = {}, TransitionAction action = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        edges_[{from, std::move(trigger)}].push_back(Edge{to, std::move(guard), std::move(action)});
    }

    StateHooks& define_state(StateT state) {
        std::lock_guard<std::mutex> lock(mutex_);
        return hooks_[state];
    }

    /**
     * @return true if a transition was taken
     */
    bool trigger(const std::string& event, const Context& context = {}) {
        std::unique_lock<std::mutex> lock(mutex_);

        const StateT from = state_.load();
        auto it = edges_.find({from, event});
        if (it == edges_.end()) {
            VLOG(1) << "[SM:" << name_ << "] IGNORED: trigger='" << event
                    << "' state=" << name_of(from);
            return false;
        }

        for (const auto& edge : it->second) {
            if (edge.guard && !edge.guard(context)) {
                VLOG(1) << "[SM:" << name_ << "] BLOCKED: trigger='" << event << "' from="
                        << name_of(from) << " to=" << name_of(edge.to);
                continue;
            }

            LOG(INFO) << "[SM:" << name_ << "] TRANSITION: " << name_of(from) << " -> "
                      << name_of(edge.to) << " | trigger=" << event;

            leave(from);
            if (edge.action) {
                auto action = edge.action;
                lock.unlock();
                action(context);
                lock.lock();
            }
            enter(edge.to);

            VLOG(1) << "[SM:" << name_ << "] STATE: current=" << name_of(edge.to);
            return true;
        }
        return false;
    }

    StateT current_state() const { return state_.load(); }

    std::string current_state_name() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return name_of(state_.load());
    }

    /// Trigger names with at least one edge out of the current state
    std::vector<std::string> available_triggers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const StateT now = state_.load();

        std::set<std::string> names;
        for (const auto& [key, edges] : edges_) {
            if (key.first == now) {
                names.insert(key.second);
            }
        }
        return std::vector<std::string>(names.begin(), names.end());
    }

    uint64_t transition_count() const { return transitions_.load(); }

    std::chrono::steady_clock::duration time_in_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::steady_clock::now() - entered_at_;
    }

#ifdef OPSDECK_WITH_PROMETHEUS
    prometheus::Registry& metrics_registry() { return *registry_; }
#endif

private:
    struct Edge {
        StateT to;
        Guard guard;
        TransitionAction action;
    };

    std::string name_of(StateT state) const {
        return names_ ? names_(state) : "State_" + std::to_string(static_cast<int>(state));
    }

    void leave(StateT state) {
#ifdef OPSDECK_WITH_PROMETHEUS
        dwell_->Observe(std::chrono::duration<double>(
            std::chrono::steady_clock::now() - entered_at_).count());
#endif
        auto it = hooks_.find(state);
        if (it != hooks_.end() && it->second.exit_) {
            it->second.exit_();
        }
    }

    void enter(StateT state) {
        state_ = state;
        entered_at_ = std::chrono::steady_clock::now();
        ++transitions_;
#ifdef OPSDECK_WITH_PROMETHEUS
        state_gauge_->Set(static_cast<double>(state));
        transition_counter_->Increment();
#endif
        auto it = hooks_.find(state);
        if (it != hooks_.end() && it->second.entry_) {
            it->second.entry_();
        }
    }

#ifdef OPSDECK_WITH_PROMETHEUS
    void register_metrics() {
        std::string prefix;
        for (unsigned char c : name_) {
            prefix += std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
        }
        registry_ = std::make_shared<prometheus::Registry>();
        state_gauge_ = &prometheus::BuildGauge()
            .Name(prefix + "_state")
            .Help("Current state of " + name_)
            .Register(*registry_)
            .Add({});
        dwell_ = &prometheus::BuildHistogram()
            .Name(prefix + "_state_duration_seconds")
            .Help("Time spent in a state before leaving it")
            .Register(*registry_)
            .Add({}, prometheus::Histogram::BucketBoundaries{0.1, 1, 5, 30, 60, 300, 1800});
        transition_counter_ = &prometheus::BuildCounter()
            .Name(prefix + "_transitions_total")
            .Help("Transitions taken")
            .Register(*registry_)
            .Add({});
    }

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Gauge* state_gauge_ = nullptr;
    prometheus::Histogram* dwell_ = nullptr;
    prometheus::Counter* transition_counter_ = nullptr;
#endif

    std::string name_;
    mutable std::mutex mutex_;
    std::atomic<StateT> state_;
    std::atomic<uint64_t> transitions_{0};
    NameFunction names_;
    std::map<StateT, StateHooks> hooks_;
    std::map<std::pair<StateT, std::string>, std::vector<Edge>> edges_;
    std::chrono::steady_clock::time_point entered_at_;
};

} // namespace opsdeck
