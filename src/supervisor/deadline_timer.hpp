/**
 * @file deadline_timer.hpp
 * @brief One-shot deadline on a dedicated thread.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace execution_engine {

/**
 * @brief Invokes a callback once `timeout` elapses unless cancelled first.
 *
 * The callback runs on the timer thread. Destruction cancels and joins.
 */
class DeadlineTimer {
public:
    DeadlineTimer(Duration timeout, std::function<void()> on_expiry);
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    void cancel();
    [[nodiscard]] bool fired() const noexcept { return fired_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::atomic<bool> fired_{false};
    std::jthread thread_;
};

}  // namespace execution_engine
