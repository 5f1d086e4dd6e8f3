/**
 * @file telemetry_pipeline.hpp
 * @brief Export seam for execution metrics records.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "request/execution_result.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace execution_engine {

/// One NDJSON object for a metrics record.
[[nodiscard]] std::string to_json(const ExecutionMetrics& metrics);

/**
 * @brief Abstract telemetry export pipeline.
 *
 * push() is called from the collector's worker thread only.
 */
class ITelemetryPipeline {
public:
    virtual ~ITelemetryPipeline() = default;

    virtual Result<void> push(const ExecutionMetrics& metrics) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes each record as one NDJSON line through a log sink.
 */
class NdjsonTelemetryPipeline final : public ITelemetryPipeline {
public:
    explicit NdjsonTelemetryPipeline(std::unique_ptr<ILogSink> sink);

    Result<void> push(const ExecutionMetrics& metrics) override;
    void flush() override;

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
};

}  // namespace execution_engine
