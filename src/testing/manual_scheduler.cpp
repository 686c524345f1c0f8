/**
 * @file manual_scheduler.cpp
 * @brief Virtual-time Scheduler implementation
 */

#include <opsdeck_cpp/testing/manual_scheduler.hpp>

namespace opsdeck {
namespace testing {

ManualScheduler::ManualScheduler()
    : now_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)) {
}

Scheduler::TimerId ManualScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = next_id_++;
    timers_.emplace(id, Entry{now_ + delay, std::move(task)});
    history_.push_back(delay);
    return id;
}

bool ManualScheduler::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

std::map<Scheduler::TimerId, ManualScheduler::Entry>::iterator ManualScheduler::earliest() {
    // Ids grow with scheduling order, so the first minimum is the oldest tie
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (best == timers_.end() || it->second.deadline < best->second.deadline) {
            best = it;
        }
    }
    return best;
}

size_t ManualScheduler::advance(std::chrono::milliseconds duration) {
    auto target = now_ + duration;
    size_t ran = 0;

    while (true) {
        auto it = earliest();
        if (it == timers_.end() || it->second.deadline > target) {
            break;
        }
        now_ = it->second.deadline;
        Task task = std::move(it->second.task);
        timers_.erase(it);
        task();
        ++ran;
    }

    now_ = target;
    return ran;
}

bool ManualScheduler::run_next() {
    auto it = earliest();
    if (it == timers_.end()) {
        return false;
    }
    if (it->second.deadline > now_) {
        now_ = it->second.deadline;
    }
    Task task = std::move(it->second.task);
    timers_.erase(it);
    task();
    return true;
}

std::optional<std::chrono::milliseconds> ManualScheduler::next_delay() const {
    std::optional<std::chrono::milliseconds> best;
    for (const auto& [id, entry] : timers_) {
        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(entry.deadline - now_);
        if (!best || delay < *best) {
            best = delay;
        }
    }
    return best;
}

} // namespace testing
} // namespace opsdeck
