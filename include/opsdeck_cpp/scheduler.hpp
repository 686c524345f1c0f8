/**
 * @file scheduler.hpp
 * @brief One-shot timers on the event loop
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace opsdeck {

/**
 * @brief Source of one-shot timers
 *
 * cancel() is synchronous: once it returns, the task will not run, even if
 * its deadline has already passed.
 */
class Scheduler {
public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    static constexpr TimerId kNoTimer = 0;

    virtual ~Scheduler() = default;

    /**
     * @brief Run task once after delay
     * @return Id for cancel(), never kNoTimer
     */
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

    /**
     * @return true if the timer was pending and is now cancelled
     */
    virtual bool cancel(TimerId id) = 0;

    virtual std::chrono::steady_clock::time_point now() const = 0;
};

/**
 * @brief Scheduler backed by boost::asio steady timers
 *
 * Tasks run on the thread running the io_context. schedule() and cancel()
 * must be called from that thread as well.
 */
class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& io);
    ~AsioScheduler() override;

    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;
    std::chrono::steady_clock::time_point now() const override;

    size_t pending() const { return timers_.size(); }

private:
    boost::asio::io_context& io_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    TimerId next_id_ = 1;
};

}  // namespace opsdeck
