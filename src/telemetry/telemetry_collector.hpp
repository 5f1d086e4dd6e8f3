/**
 * @file telemetry_collector.hpp
 * @brief Fire-and-forget handoff of metrics records to the export pipeline.
 *
 * record() never blocks on the pipeline: records go into a bounded buffer
 * drained by a worker thread. When the buffer is full the oldest record is
 * dropped and counted.
 */

#pragma once

#include "core/logger.hpp"
#include "request/execution_result.hpp"
#include "telemetry/telemetry_pipeline.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace execution_engine {

class TelemetryCollector {
public:
    /// The pipeline must outlive the collector.
    TelemetryCollector(ITelemetryPipeline& pipeline, size_t capacity, Logger logger);
    ~TelemetryCollector();

    TelemetryCollector(const TelemetryCollector&) = delete;
    TelemetryCollector& operator=(const TelemetryCollector&) = delete;

    void start();

    /// Deliver what is buffered, then stop the worker.
    void stop();

    void record(ExecutionMetrics metrics);

    /// Block until the buffer is empty (or the timeout passes) and flush the pipeline.
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    [[nodiscard]] uint64_t recorded() const noexcept { return recorded_.load(); }
    [[nodiscard]] uint64_t delivered() const noexcept { return delivered_.load(); }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_.load(); }
    [[nodiscard]] uint64_t failed() const noexcept { return failed_.load(); }
    [[nodiscard]] size_t buffered() const;

private:
    void worker_loop(std::stop_token stop);

    ITelemetryPipeline& pipeline_;
    size_t capacity_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<ExecutionMetrics> buffer_;
    bool in_flight_ = false;

    std::atomic<uint64_t> recorded_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failed_{0};

    std::jthread worker_;
};

}  // namespace execution_engine
