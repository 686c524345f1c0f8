/**
 * @file asio_scheduler.cpp
 * @brief Scheduler implementation on boost::asio
 */

#include <opsdeck_cpp/scheduler.hpp>


namespace opsdeck {

AsioScheduler::AsioScheduler(boost::asio::io_context& io) : io_(io) {}

AsioScheduler::~AsioScheduler() {
    for (auto& [id, timer] : timers_) {
        timer->cancel();
    }
    timers_.clear();
}

Scheduler::TimerId AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    auto id = next_id_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    timers_.emplace(id, timer);

    timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        // A completion already queued when cancel() ran still arrives here
        // with success, so the map is the source of truth.
        auto it = timers_.find(id);
        if (it == timers_.end() || it->second != timer) {
            return;
        }
        timers_.erase(it);
        task();
    });
    return id;
}

bool AsioScheduler::cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    it->second->cancel();
    timers_.erase(it);
    return true;
}

std::chrono::steady_clock::time_point AsioScheduler::now() const {
    return std::chrono::steady_clock::now();
}

}  // namespace opsdeck
