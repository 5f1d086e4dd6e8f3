/**
 * @file telemetry_collector.cpp
 * @brief TelemetryCollector implementation.
 */

#include "telemetry/telemetry_collector.hpp"

#include <algorithm>

namespace execution_engine {

TelemetryCollector::TelemetryCollector(ITelemetryPipeline& pipeline, size_t capacity,
                                       Logger logger)
    : pipeline_(pipeline)
    , capacity_(std::max<size_t>(capacity, 1))
    , logger_(std::move(logger)) {}

TelemetryCollector::~TelemetryCollector() {
    stop();
}

void TelemetryCollector::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token stop) { worker_loop(stop); });
}

void TelemetryCollector::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    cv_.notify_all();
    worker_.join();
    pipeline_.flush();
}

void TelemetryCollector::record(ExecutionMetrics metrics) {
    recorded_.fetch_add(1);
    {
        std::lock_guard lock(mutex_);
        if (buffer_.size() >= capacity_) {
            buffer_.pop_front();
            dropped_.fetch_add(1);
        }
        buffer_.push_back(std::move(metrics));
    }
    cv_.notify_all();
}

bool TelemetryCollector::flush(std::chrono::milliseconds timeout) {
    bool drained;
    {
        std::unique_lock lock(mutex_);
        drained = cv_.wait_for(lock, timeout, [this] { return buffer_.empty() && !in_flight_; });
    }
    pipeline_.flush();
    return drained;
}

size_t TelemetryCollector::buffered() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

void TelemetryCollector::worker_loop(std::stop_token stop) {
    while (true) {
        ExecutionMetrics next;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this] { return !buffer_.empty(); });
            if (buffer_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }
            next = std::move(buffer_.front());
            buffer_.pop_front();
            in_flight_ = true;
        }

        auto pushed = pipeline_.push(next);
        if (pushed) {
            delivered_.fetch_add(1);
        } else {
            failed_.fetch_add(1);
            logger_.warn("telemetry push for " + next.request_id + " failed: "
                         + pushed.error().message);
        }

        {
            std::lock_guard lock(mutex_);
            in_flight_ = false;
        }
        cv_.notify_all();
    }
}

}  // namespace execution_engine
