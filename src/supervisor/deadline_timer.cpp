/**
 * @file deadline_timer.cpp
 * @brief DeadlineTimer implementation.
 */

#include "supervisor/deadline_timer.hpp"

namespace execution_engine {

DeadlineTimer::DeadlineTimer(Duration timeout, std::function<void()> on_expiry) {
    thread_ = std::jthread([this, timeout, cb = std::move(on_expiry)](std::stop_token stop) {
        {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, stop, timeout, [] { return false; });
        }
        if (stop.stop_requested()) return;
        fired_.store(true);
        cb();
    });
}

DeadlineTimer::~DeadlineTimer() {
    cancel();
}

void DeadlineTimer::cancel() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

}  // namespace execution_engine
