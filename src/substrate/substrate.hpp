/**
 * @file substrate.hpp
 * @brief Node isolation substrate interface.
 *
 * A substrate provisions execution units, applies per-execution sandbox
 * policies to them and spawns guest processes inside them. Selected per node
 * from configuration, so this is a virtual interface rather than a concept.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "request/execution_result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

/**
 * @brief What a substrate is able to enforce.
 */
struct SubstrateCapabilities {
    bool resource_limits = false;
    bool syscall_filter = false;
    bool network_deny = false;
    bool network_allow_list = false;
    bool filesystem_isolation = false;
    bool syscall_counting = false;
};

/**
 * @brief A provisioned unit as seen by the substrate.
 */
struct UnitInstance {
    UnitId id;
    RuntimeId runtime;
    std::filesystem::path root;      ///< Unit-private directory on the host
};

/**
 * @brief Fully resolved per-execution policy handed to the substrate.
 */
struct SandboxPolicy {
    std::filesystem::path scratch_dir;
    std::vector<std::filesystem::path> read_only_paths;

    uint64_t memory_bytes = 0;
    uint32_t cpu_millicores = 0;
    uint32_t cpu_time_limit_s = 0;   ///< Backstop; the supervisor deadline fires first
    uint64_t disk_bytes = 0;
    uint32_t max_processes = 0;
    uint64_t max_file_size_bytes = 0;

    bool network_enabled = false;
    std::vector<NetworkEndpoint> network_allow_list;

    bool syscall_filter = true;
    std::vector<std::string> extra_syscalls;
    bool use_namespaces = false;
};

struct GuestCommand {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    std::vector<std::string> env;    ///< "KEY=VALUE"
    std::string stdin_data;
    uint64_t output_limit_bytes = 1048576;
};

struct GuestExit {
    std::optional<int> exit_code;
    std::optional<int> signal;
};

struct GuestOutput {
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

// ─────────────────────────────────────────────
// IGuestProcess
// ─────────────────────────────────────────────

/**
 * @brief A running guest. Destroying it kills and reaps anything left.
 *
 * kill_tree() may be called from any thread, concurrently with wait_for().
 */
class IGuestProcess {
public:
    virtual ~IGuestProcess() = default;

    /// Pump I/O for up to `timeout`. Returns the exit once the guest is reaped.
    virtual std::optional<GuestExit> wait_for(std::chrono::milliseconds timeout) = 0;

    /// Forcibly kill the guest and every process it spawned.
    virtual void kill_tree() = 0;

    virtual GuestOutput take_output() = 0;
    [[nodiscard]] virtual ResourceUsage usage() const = 0;
    [[nodiscard]] virtual ProcessCounters counters() const = 0;

    /// Violations the substrate observed directly (beyond the exit status).
    [[nodiscard]] virtual std::vector<PolicyViolation> violations() const = 0;
};

// ─────────────────────────────────────────────
// IIsolationSubstrate
// ─────────────────────────────────────────────

class IIsolationSubstrate {
public:
    virtual ~IIsolationSubstrate() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual SubstrateCapabilities capabilities() const noexcept = 0;

    /// Provision a unit for a runtime. May block (cold start).
    virtual Result<UnitInstance> create(const RuntimeProfile& runtime, const UnitId& id) = 0;
    virtual Result<void> destroy(const UnitInstance& unit) = 0;

    virtual Result<void> apply_policy(const UnitInstance& unit, const SandboxPolicy& policy) = 0;
    virtual Result<std::unique_ptr<IGuestProcess>> exec(const UnitInstance& unit,
                                                        const GuestCommand& command) = 0;
    virtual Result<void> release_policy(const UnitInstance& unit) = 0;

    /// Health check used to clear a degraded node.
    virtual Result<void> probe() = 0;
};

}  // namespace execution_engine
