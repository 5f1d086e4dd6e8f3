/**
 * @file monitor.hpp
 * @brief Host resource monitors feeding the node registry.
 *
 * LinuxMonitor samples procfs on its own thread; MockMonitor serves
 * scripted snapshots. Both satisfy ResourceMonitorLike.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

namespace execution_engine {

namespace procfs {

/// Jiffies from the aggregate "cpu" line of stat.
struct CpuTimes {
    uint64_t busy{0};
    uint64_t total{0};
};

struct MemInfo {
    uint64_t total_bytes{0};
    uint64_t available_bytes{0};
};

/// nullopt unless @p line is the aggregate "cpu " line with at least four counters.
std::optional<CpuTimes> parse_cpu_times(std::string_view line);

/// Busy share of the jiffies elapsed between two readings, in [0, 100].
float cpu_busy_percent(const CpuTimes& prev, const CpuTimes& curr) noexcept;

/// Reads MemTotal and MemAvailable (kB). nullopt when MemTotal is missing.
std::optional<MemInfo> parse_meminfo(std::istream& in);

/// First field of loadavg.
std::optional<float> parse_loadavg(std::string_view content);

}  // namespace procfs

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Samples CPU, memory and load of the host from procfs.
 *
 * start() takes the first sample synchronously so the scheduler sees
 * memory figures immediately; CPU usage needs two samples and reads 0
 * until the second one. A failed sample keeps the previous snapshot
 * published and is counted in failed_samples().
 */
class LinuxMonitor {
public:
    explicit LinuxMonitor(NodeId node_id, uint32_t sampling_interval_ms = 500,
                          std::filesystem::path proc_root = "/proc");
    ~LinuxMonitor();

    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    uint64_t memory_available();
    void start();
    void stop();

    /// Read procfs now and publish the result. Called by the sampling thread.
    Result<ResourceSnapshot> sample();

    [[nodiscard]] uint64_t failed_samples() const noexcept { return failed_samples_.load(); }

private:
    void sampling_loop(std::stop_token stop);

    NodeId node_id_;
    std::chrono::milliseconds interval_;
    std::filesystem::path proc_root_;

    std::mutex sample_mutex_;            ///< Serializes sample() and guards prev_cpu_
    std::optional<procfs::CpuTimes> prev_cpu_;
    std::atomic<std::shared_ptr<const ResourceSnapshot>> latest_;
    std::atomic<uint64_t> failed_samples_{0};

    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    std::jthread sampling_thread_;
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock resource monitor for testing and simulation.
 *
 * Returns predetermined snapshot sequences or a static snapshot.
 * Satisfies ResourceMonitorLike. Setters are safe to call while the
 * engine is reading.
 */
class MockMonitor {
public:
    explicit MockMonitor(NodeId node_id, uint32_t sampling_interval_ms = 0);

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    uint64_t memory_available();
    void start();
    void stop();

    // Test helpers
    void push_snapshot(ResourceSnapshot snapshot);
    void set_static_snapshot(ResourceSnapshot snapshot);
    void set_cpu(float percent);
    void set_memory(uint64_t available, uint64_t total);
    void set_load_average(float load);

private:
    mutable std::mutex mutex_;
    NodeId node_id_;
    std::vector<ResourceSnapshot> sequence_;
    size_t index_{0};
    ResourceSnapshot static_snapshot_;
    bool use_static_{true};
};

static_assert(ResourceMonitorLike<LinuxMonitor>);
static_assert(ResourceMonitorLike<MockMonitor>);

}  // namespace execution_engine
