/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace execution_engine {

/**
 * @brief One execution node: capacity, pool ceiling and isolation substrate.
 */
struct NodeConfig {
    std::string id = "node-01";
    uint32_t cpu_millicores = 8000;
    uint64_t memory_mb = 16384;
    uint32_t max_units = 16;
    std::string substrate = "process";     ///< "process" or "simulated"
    std::vector<std::string> labels;
};

/// Platform-enforced maxima; requests above any of them are rejected.
struct LimitsConfig {
    uint32_t max_timeout_ms = 300000;
    uint64_t max_memory_mb = 8192;
    uint32_t max_cpu_millicores = 4000;
    uint64_t max_disk_mb = 51200;
    uint32_t max_processes = 1024;
    uint64_t max_file_size_mb = 1024;
};

/// Default resource profile for one workspace type.
struct TierProfile {
    std::string name;
    uint32_t timeout_ms = 30000;
    uint64_t memory_mb = 512;
    uint32_t cpu_millicores = 1000;
    uint64_t disk_mb = 1024;
    uint32_t max_processes = 64;
    uint64_t max_file_size_mb = 64;
};

/**
 * @brief Language/runtime image a pool unit is provisioned for.
 *
 * `command` may contain "{entry}", replaced by the request entry point.
 * Request arguments are appended after the command.
 */
struct RuntimeProfile {
    RuntimeId id;
    std::string image;
    std::vector<std::string> command;
    std::string source_file = "main";          ///< File name for inline code
    std::vector<std::string> extra_syscalls;   ///< Allowed on top of the base filter
    std::vector<std::string> read_only_paths;  ///< Added to isolation.read_only_paths
    uint32_t min_warm = 0;
};

struct PoolConfig {
    uint32_t idle_ttl_ms = 300000;
    uint32_t max_unit_age_ms = 3600000;
    uint32_t max_unit_reuses = 0;              ///< 0 = unlimited
    float safety_factor = 1.5f;
    uint32_t prewarm_interval_ms = 5000;
    float ewma_alpha = 0.3f;
    uint32_t creation_workers = 2;
};

struct SchedulerWeights {
    float warm = 0.4f;
    float headroom = 0.3f;
    float reliability = 0.2f;
    float affinity = 0.1f;
};

struct SchedulerConfig {
    std::string policy = "weighted";           ///< "weighted", "least_loaded"
    SchedulerWeights weights;
    float tie_epsilon = 1e-3f;
    uint32_t warm_saturation = 4;              ///< Warm units counted as "fully warm"
    uint32_t scheduling_timeout_ms = 5000;
    uint32_t max_reschedules = 1;
    uint32_t timeout_retries = 0;              ///< Internal retries of SchedulingTimeout
    uint32_t retry_backoff_ms = 100;           ///< Doubled on every retry
    uint32_t failure_window = 20;
    uint32_t degraded_after_failures = 3;      ///< Consecutive sandbox setup failures
};

struct IsolationConfig {
    std::filesystem::path scratch_root = "/tmp/execution_engine";
    std::vector<std::string> read_only_paths = {"/usr", "/bin", "/lib", "/lib64", "/etc"};
    bool syscall_filter = true;
    bool use_namespaces = false;
};

struct SupervisorConfig {
    uint64_t output_limit_bytes = 1048576;
    uint64_t artifact_limit_bytes = 4194304;
    uint32_t poll_interval_ms = 10;
};

struct MonitorConfig {
    uint32_t sampling_interval_ms = 500;
    bool mock = false;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;                 ///< 0 = hardware_concurrency
    uint32_t queue_capacity = 1024;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string metrics_prefix = "execution_metrics";
    uint32_t buffer_capacity = 1024;
};

/**
 * @brief The four workspace tiers with increasing ceilings.
 */
std::vector<TierProfile> default_tiers();

/**
 * @brief Built-in runtime catalog (shell, python3, node).
 */
std::vector<RuntimeProfile> default_runtimes();

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    std::vector<NodeConfig> nodes = {NodeConfig{}};
    LimitsConfig limits;
    std::vector<TierProfile> tiers = default_tiers();
    std::vector<RuntimeProfile> runtimes = default_runtimes();
    PoolConfig pool;
    SchedulerConfig scheduler;
    IsolationConfig isolation;
    SupervisorConfig supervisor;
    MonitorConfig monitor;
    ExecutorConfig executor;
    TelemetryConfig telemetry;

    [[nodiscard]] const TierProfile* find_tier(std::string_view name) const noexcept;
    [[nodiscard]] const RuntimeProfile* find_runtime(std::string_view id) const noexcept;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace execution_engine
