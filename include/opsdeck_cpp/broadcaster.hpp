/**
 * @file broadcaster.hpp
 * @brief Multi-subscriber callback channel
 */

#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <glog/logging.h>

namespace opsdeck {

using SubscriptionId = uint64_t;

/**
 * @brief Delivers every published value to every current subscriber
 *
 * Subscribers are called synchronously, in subscription order, on the thread
 * that publishes. A subscriber added during a publish receives values from the
 * next publish on. Once unsubscribe() has returned, the callback is not called
 * again, even by a publish already in progress. A subscriber that throws is
 * logged and skipped; the others still receive the value.
 *
 * @code
 * Broadcaster<StreamMessage> messages("messages");
 * auto id = messages.subscribe([](const StreamMessage& m) { render(m); });
 * messages.publish(message);
 * messages.unsubscribe(id);
 * @endcode
 */
template<typename T>
class Broadcaster {
public:
    using Callback = std::function<void(const T&)>;

    explicit Broadcaster(std::string name = "broadcaster") : name_(std::move(name)) {}

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    SubscriptionId subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        subscribers_.emplace(id, std::move(callback));
        return id;
    }

    /**
     * @return true if the subscription existed
     */
    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.erase(id) > 0;
    }

    void publish(const T& value) {
        std::vector<std::pair<SubscriptionId, Callback>> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks.assign(subscribers_.begin(), subscribers_.end());
        }

        for (const auto& [id, callback] : callbacks) {
            if (!subscribed(id)) {
                continue;
            }
            try {
                callback(value);
            } catch (const std::exception& e) {
                LOG(ERROR) << "[" << name_ << "] Subscriber threw: " << e.what();
            }
        }
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.clear();
    }

private:
    bool subscribed(SubscriptionId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.count(id) > 0;
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Callback> subscribers_;
    SubscriptionId next_id_ = 1;
};

}  // namespace opsdeck
