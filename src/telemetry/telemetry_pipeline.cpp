/**
 * @file telemetry_pipeline.cpp
 * @brief Metrics serialization and NdjsonTelemetryPipeline.
 */

#include "telemetry/telemetry_pipeline.hpp"

#include <chrono>
#include <sstream>

namespace execution_engine {

namespace {

void write_snapshot(std::ostringstream& oss, const ResourceSnapshot& snap) {
    oss << R"({"cpu_pct":)" << snap.cpu_usage_percent
        << R"(,"load_1m":)" << snap.load_average_1m
        << R"(,"mem_avail_mb":)" << (snap.memory_available_bytes / (1024 * 1024))
        << "}";
}

}  // anonymous namespace

std::string to_json(const ExecutionMetrics& m) {
    auto recorded_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        m.recorded_at.time_since_epoch()).count();

    std::ostringstream oss;
    oss << R"({"event":"execution")"
        << R"(,"request":")" << json_escape(m.request_id) << "\""
        << R"(,"tenant":")" << json_escape(m.tenant_id) << "\""
        << R"(,"node":")" << json_escape(m.node_id) << "\""
        << R"(,"unit":")" << json_escape(m.unit_id) << "\""
        << R"(,"runtime":")" << json_escape(m.runtime) << "\""
        << R"(,"outcome":")" << json_escape(m.outcome) << "\""
        << R"(,"warm":)" << (m.served_warm ? "true" : "false")
        << R"(,"attempts":)" << m.scheduling_attempts
        << R"(,"recorded_ms":)" << recorded_ms;

    const auto& p = m.phases;
    oss << R"(,"phases_us":{"queue":)" << p.queue.count()
        << R"(,"acquisition":)" << p.acquisition.count()
        << R"(,"setup":)" << p.setup.count()
        << R"(,"run":)" << p.run.count()
        << R"(,"cleanup":)" << p.cleanup.count()
        << R"(,"total":)" << p.total().count() << "}";

    const auto& u = m.usage;
    oss << R"(,"usage":{"cpu_user_ms":)" << u.cpu_user_ms
        << R"(,"cpu_system_ms":)" << u.cpu_system_ms
        << R"(,"peak_memory_bytes":)" << u.peak_memory_bytes
        << R"(,"disk_bytes_written":)" << u.disk_bytes_written
        << R"(,"net_rx_bytes":)" << u.network_rx_bytes
        << R"(,"net_tx_bytes":)" << u.network_tx_bytes << "}";

    const auto& c = m.counters;
    oss << R"(,"counters":{"syscalls":)";
    if (c.syscalls) {
        oss << *c.syscalls;
    } else {
        oss << "null";
    }
    oss << R"(,"voluntary_ctx":)" << c.voluntary_context_switches
        << R"(,"involuntary_ctx":)" << c.involuntary_context_switches
        << R"(,"minor_faults":)" << c.minor_page_faults
        << R"(,"major_faults":)" << c.major_page_faults << "}";

    oss << R"(,"host_before":)";
    write_snapshot(oss, m.host_before);
    oss << R"(,"host_after":)";
    write_snapshot(oss, m.host_after);
    oss << "}";
    return oss.str();
}

NdjsonTelemetryPipeline::NdjsonTelemetryPipeline(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

Result<void> NdjsonTelemetryPipeline::push(const ExecutionMetrics& metrics) {
    if (!sink_) {
        return Error{ErrorCode::Internal, "telemetry pipeline has no sink"};
    }
    auto line = to_json(metrics);
    std::lock_guard lock(write_mutex_);
    sink_->write(line);
    return {};
}

void NdjsonTelemetryPipeline::flush() {
    std::lock_guard lock(write_mutex_);
    if (sink_) sink_->flush();
}

}  // namespace execution_engine
