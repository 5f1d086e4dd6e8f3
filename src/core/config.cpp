/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <string_view>
#include <unordered_set>

namespace execution_engine {

namespace {

std::vector<std::string> string_list(toml::node_view<toml::node> node,
                                     std::vector<std::string> fallback) {
    auto* arr = node.as_array();
    if (!arr) return fallback;
    std::vector<std::string> out;
    for (const auto& el : *arr) {
        if (auto s = el.value<std::string>()) out.push_back(*s);
    }
    return out;
}

/// Integer keys must be non-negative and fit their field. The first offending
/// key is remembered in `bad_key` and the fallback is kept.
template <typename T>
T read_count(toml::node_view<toml::node> node, T fallback, std::string_view key,
             std::string& bad_key) {
    auto value = node.value<int64_t>();
    if (!value) return fallback;
    if (*value < 0 || static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
        if (bad_key.empty()) bad_key = key;
        return fallback;
    }
    return static_cast<T>(*value);
}

TierProfile parse_tier(toml::node_view<toml::node> tier, TierProfile base, std::string& bad_key) {
    base.timeout_ms = read_count<uint32_t>(
        tier["timeout_ms"], base.timeout_ms, "tiers.timeout_ms", bad_key);
    base.memory_mb = read_count<uint64_t>(
        tier["memory_mb"], base.memory_mb, "tiers.memory_mb", bad_key);
    base.cpu_millicores = read_count<uint32_t>(
        tier["cpu_millicores"], base.cpu_millicores, "tiers.cpu_millicores", bad_key);
    base.disk_mb = read_count<uint64_t>(tier["disk_mb"], base.disk_mb, "tiers.disk_mb", bad_key);
    base.max_processes = read_count<uint32_t>(
        tier["max_processes"], base.max_processes, "tiers.max_processes", bad_key);
    base.max_file_size_mb = read_count<uint64_t>(
        tier["max_file_size_mb"], base.max_file_size_mb, "tiers.max_file_size_mb", bad_key);
    return base;
}

Result<void> validate(const Config& config) {
    if (config.nodes.empty()) {
        return Error{ErrorCode::InvalidArgument, "at least one [[nodes]] entry is required"};
    }
    std::unordered_set<std::string> ids;
    for (const auto& node : config.nodes) {
        if (node.id.empty()) {
            return Error{ErrorCode::InvalidArgument, "node id must not be empty"};
        }
        if (!ids.insert(node.id).second) {
            return Error{ErrorCode::InvalidArgument, "duplicate node id: " + node.id};
        }
        if (node.max_units == 0) {
            return Error{ErrorCode::InvalidArgument, "node " + node.id + ": max_units must be > 0"};
        }
        if (node.substrate != "process" && node.substrate != "simulated") {
            return Error{ErrorCode::InvalidArgument,
                         "node " + node.id + ": unknown substrate '" + node.substrate + "'"};
        }
    }
    for (const auto& runtime : config.runtimes) {
        if (runtime.id.empty() || runtime.command.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "runtime '" + runtime.id + "' needs an id and a command"};
        }
    }
    const auto& limits = config.limits;
    for (const auto& tier : config.tiers) {
        auto check = [&tier](std::string_view field, uint64_t value, uint64_t max) -> Result<void> {
            if (value == 0 || value > max) {
                return Error{ErrorCode::InvalidArgument,
                             "tier " + tier.name + ": " + std::string(field) + " must be in [1, "
                             + std::to_string(max) + "]"};
            }
            return {};
        };
        for (auto result : {check("timeout_ms", tier.timeout_ms, limits.max_timeout_ms),
                            check("memory_mb", tier.memory_mb, limits.max_memory_mb),
                            check("cpu_millicores", tier.cpu_millicores, limits.max_cpu_millicores),
                            check("disk_mb", tier.disk_mb, limits.max_disk_mb),
                            check("max_processes", tier.max_processes, limits.max_processes),
                            check("max_file_size_mb", tier.max_file_size_mb,
                                  limits.max_file_size_mb)}) {
            if (!result) return result;
        }
    }
    if (config.pool.safety_factor < 1.0f) {
        return Error{ErrorCode::InvalidArgument, "pool.safety_factor must be >= 1.0"};
    }
    if (config.pool.ewma_alpha <= 0.0f || config.pool.ewma_alpha > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "pool.ewma_alpha must be in (0, 1]"};
    }
    if (config.scheduler.policy != "weighted" && config.scheduler.policy != "least_loaded") {
        return Error{ErrorCode::InvalidArgument,
                     "unknown scheduler policy '" + config.scheduler.policy + "'"};
    }
    return {};
}

}  // anonymous namespace

const TierProfile* Config::find_tier(std::string_view name) const noexcept {
    for (const auto& tier : tiers) {
        if (tier.name == name) return &tier;
    }
    return nullptr;
}

const RuntimeProfile* Config::find_runtime(std::string_view id) const noexcept {
    for (const auto& runtime : runtimes) {
        if (runtime.id == id) return &runtime;
    }
    return nullptr;
}

std::vector<TierProfile> default_tiers() {
    return {
        TierProfile{.name = "ephemeral", .timeout_ms = 30000, .memory_mb = 512,
                    .cpu_millicores = 1000, .disk_mb = 1024, .max_processes = 64,
                    .max_file_size_mb = 64},
        TierProfile{.name = "session", .timeout_ms = 60000, .memory_mb = 2048,
                    .cpu_millicores = 2000, .disk_mb = 4096, .max_processes = 128,
                    .max_file_size_mb = 256},
        TierProfile{.name = "persistent", .timeout_ms = 120000, .memory_mb = 4096,
                    .cpu_millicores = 3000, .disk_mb = 10240, .max_processes = 256,
                    .max_file_size_mb = 512},
        TierProfile{.name = "collaborative", .timeout_ms = 300000, .memory_mb = 8192,
                    .cpu_millicores = 4000, .disk_mb = 20480, .max_processes = 512,
                    .max_file_size_mb = 1024},
    };
}

std::vector<RuntimeProfile> default_runtimes() {
    return {
        RuntimeProfile{.id = "shell", .image = "base", .command = {"/bin/sh", "{entry}"},
                       .source_file = "main.sh"},
        RuntimeProfile{.id = "python3", .image = "python", .command = {"python3", "{entry}"},
                       .source_file = "main.py"},
        RuntimeProfile{.id = "node", .image = "node", .command = {"node", "{entry}"},
                       .source_file = "main.js"},
    };
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        std::string bad_key;

        // [[nodes]]
        if (auto* nodes = tbl["nodes"].as_array()) {
            config.nodes.clear();
            for (auto& el : *nodes) {
                auto* t = el.as_table();
                if (!t) continue;
                auto& view = *t;
                NodeConfig node;
                node.id = view["id"].value_or(node.id);
                node.cpu_millicores = read_count<uint32_t>(
                    view["cpu_millicores"], node.cpu_millicores, "nodes.cpu_millicores", bad_key);
                node.memory_mb = read_count<uint64_t>(
                    view["memory_mb"], node.memory_mb, "nodes.memory_mb", bad_key);
                node.max_units = read_count<uint32_t>(
                    view["max_units"], node.max_units, "nodes.max_units", bad_key);
                node.substrate = view["substrate"].value_or(node.substrate);
                node.labels = string_list(view["labels"], {});
                config.nodes.push_back(std::move(node));
            }
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto& l = config.limits;
            l.max_timeout_ms = read_count<uint32_t>(
                limits["max_timeout_ms"], l.max_timeout_ms, "limits.max_timeout_ms", bad_key);
            l.max_memory_mb = read_count<uint64_t>(
                limits["max_memory_mb"], l.max_memory_mb, "limits.max_memory_mb", bad_key);
            l.max_cpu_millicores = read_count<uint32_t>(
                limits["max_cpu_millicores"], l.max_cpu_millicores,
                "limits.max_cpu_millicores", bad_key);
            l.max_disk_mb = read_count<uint64_t>(
                limits["max_disk_mb"], l.max_disk_mb, "limits.max_disk_mb", bad_key);
            l.max_processes = read_count<uint32_t>(
                limits["max_processes"], l.max_processes, "limits.max_processes", bad_key);
            l.max_file_size_mb = read_count<uint64_t>(
                limits["max_file_size_mb"], l.max_file_size_mb, "limits.max_file_size_mb", bad_key);
        }

        // [tiers.<name>]
        if (auto tiers = tbl["tiers"]; tiers.is_table()) {
            for (auto& tier : config.tiers) {
                if (auto t = tiers[tier.name]; t.is_table()) {
                    tier = parse_tier(t, tier, bad_key);
                }
            }
        }

        // [[runtimes]] replaces the built-in catalog when present
        if (auto* runtimes = tbl["runtimes"].as_array()) {
            config.runtimes.clear();
            for (auto& el : *runtimes) {
                auto* t = el.as_table();
                if (!t) continue;
                auto& view = *t;
                RuntimeProfile runtime;
                runtime.id = view["id"].value_or(std::string{});
                runtime.image = view["image"].value_or(runtime.id);
                runtime.command = string_list(view["command"], {});
                runtime.source_file = view["source_file"].value_or(runtime.source_file);
                runtime.extra_syscalls = string_list(view["extra_syscalls"], {});
                runtime.read_only_paths = string_list(view["read_only_paths"], {});
                runtime.min_warm = read_count<uint32_t>(
                    view["min_warm"], 0, "runtimes.min_warm", bad_key);
                config.runtimes.push_back(std::move(runtime));
            }
        }

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            auto& p = config.pool;
            p.idle_ttl_ms = read_count<uint32_t>(
                pool["idle_ttl_ms"], p.idle_ttl_ms, "pool.idle_ttl_ms", bad_key);
            p.max_unit_age_ms = read_count<uint32_t>(
                pool["max_unit_age_ms"], p.max_unit_age_ms, "pool.max_unit_age_ms", bad_key);
            p.max_unit_reuses = read_count<uint32_t>(
                pool["max_unit_reuses"], p.max_unit_reuses, "pool.max_unit_reuses", bad_key);
            p.safety_factor = static_cast<float>(pool["safety_factor"].value_or(1.5));
            p.prewarm_interval_ms = read_count<uint32_t>(
                pool["prewarm_interval_ms"], p.prewarm_interval_ms,
                "pool.prewarm_interval_ms", bad_key);
            p.ewma_alpha = static_cast<float>(pool["ewma_alpha"].value_or(0.3));
            p.creation_workers = read_count<uint32_t>(
                pool["creation_workers"], p.creation_workers, "pool.creation_workers", bad_key);
        }

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& s = config.scheduler;
            s.policy = scheduler["policy"].value_or(std::string{"weighted"});
            s.tie_epsilon = static_cast<float>(scheduler["tie_epsilon"].value_or(1e-3));
            s.warm_saturation = read_count<uint32_t>(
                scheduler["warm_saturation"], s.warm_saturation,
                "scheduler.warm_saturation", bad_key);
            s.scheduling_timeout_ms = read_count<uint32_t>(
                scheduler["scheduling_timeout_ms"], s.scheduling_timeout_ms,
                "scheduler.scheduling_timeout_ms", bad_key);
            s.max_reschedules = read_count<uint32_t>(
                scheduler["max_reschedules"], s.max_reschedules,
                "scheduler.max_reschedules", bad_key);
            s.timeout_retries = read_count<uint32_t>(
                scheduler["timeout_retries"], s.timeout_retries,
                "scheduler.timeout_retries", bad_key);
            s.retry_backoff_ms = read_count<uint32_t>(
                scheduler["retry_backoff_ms"], s.retry_backoff_ms,
                "scheduler.retry_backoff_ms", bad_key);
            s.failure_window = read_count<uint32_t>(
                scheduler["failure_window"], s.failure_window, "scheduler.failure_window", bad_key);
            s.degraded_after_failures = read_count<uint32_t>(
                scheduler["degraded_after_failures"], s.degraded_after_failures,
                "scheduler.degraded_after_failures", bad_key);

            // [scheduler.weights]
            if (auto weights = scheduler["weights"]; weights.is_table()) {
                s.weights.warm = static_cast<float>(weights["warm"].value_or(0.4));
                s.weights.headroom = static_cast<float>(weights["headroom"].value_or(0.3));
                s.weights.reliability = static_cast<float>(weights["reliability"].value_or(0.2));
                s.weights.affinity = static_cast<float>(weights["affinity"].value_or(0.1));
            }
        }

        // [isolation]
        if (auto isolation = tbl["isolation"]; isolation.is_table()) {
            auto& i = config.isolation;
            i.scratch_root = isolation["scratch_root"].value_or(i.scratch_root.string());
            i.read_only_paths = string_list(isolation["read_only_paths"], i.read_only_paths);
            i.syscall_filter = isolation["syscall_filter"].value_or(i.syscall_filter);
            i.use_namespaces = isolation["use_namespaces"].value_or(i.use_namespaces);
        }

        // [supervisor]
        if (auto supervisor = tbl["supervisor"]; supervisor.is_table()) {
            auto& s = config.supervisor;
            s.output_limit_bytes = read_count<uint64_t>(
                supervisor["output_limit_bytes"], s.output_limit_bytes,
                "supervisor.output_limit_bytes", bad_key);
            s.artifact_limit_bytes = read_count<uint64_t>(
                supervisor["artifact_limit_bytes"], s.artifact_limit_bytes,
                "supervisor.artifact_limit_bytes", bad_key);
            s.poll_interval_ms = read_count<uint32_t>(
                supervisor["poll_interval_ms"], s.poll_interval_ms,
                "supervisor.poll_interval_ms", bad_key);
        }

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            config.monitor.sampling_interval_ms = read_count<uint32_t>(
                monitor["sampling_interval_ms"], 500, "monitor.sampling_interval_ms", bad_key);
            config.monitor.mock = monitor["mock"].value_or(false);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = read_count<uint32_t>(
                executor["thread_count"], 0, "executor.thread_count", bad_key);
            config.executor.queue_capacity = read_count<uint32_t>(
                executor["queue_capacity"], 1024, "executor.queue_capacity", bad_key);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            t.max_file_size_mb = read_count<uint32_t>(
                telemetry["max_file_size_mb"], 50, "telemetry.max_file_size_mb", bad_key);
            t.rotate_count = read_count<uint32_t>(
                telemetry["rotate_count"], 5, "telemetry.rotate_count", bad_key);
            t.log_level = telemetry["log_level"].value_or(std::string{"info"});
            t.metrics_prefix = telemetry["metrics_prefix"].value_or(t.metrics_prefix);
            t.buffer_capacity = read_count<uint32_t>(
                telemetry["buffer_capacity"], 1024, "telemetry.buffer_capacity", bad_key);
        }

        if (!bad_key.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         bad_key + " must be a non-negative integer within range"};
        }
        auto valid = validate(config);
        if (!valid) return valid.error();
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace execution_engine
