/**
 * @file execution_result.hpp
 * @brief Outbound model: execution result and the telemetry record.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

// ─────────────────────────────────────────────
// Execution Metrics
// ─────────────────────────────────────────────

struct PhaseTimings {
    Duration queue{0};           ///< Accepted → placement started
    Duration acquisition{0};     ///< Placement started → unit acquired
    Duration setup{0};           ///< Sandbox preparation
    Duration run{0};             ///< Guest spawn → guest exit/kill
    Duration cleanup{0};         ///< Artifact read-back, teardown, release

    [[nodiscard]] Duration total() const noexcept {
        return queue + acquisition + setup + run + cleanup;
    }
};

struct ResourceUsage {
    uint64_t cpu_user_ms = 0;
    uint64_t cpu_system_ms = 0;
    uint64_t peak_memory_bytes = 0;
    uint64_t disk_bytes_written = 0;
    uint64_t network_rx_bytes = 0;
    uint64_t network_tx_bytes = 0;
};

/**
 * @brief Process-level counters. `syscalls` is empty when the substrate
 *        cannot count them.
 */
struct ProcessCounters {
    std::optional<uint64_t> syscalls;
    uint64_t voluntary_context_switches = 0;
    uint64_t involuntary_context_switches = 0;
    uint64_t minor_page_faults = 0;
    uint64_t major_page_faults = 0;
};

/**
 * @brief One telemetry record, emitted exactly once per accepted request.
 */
struct ExecutionMetrics {
    RequestId request_id;
    std::string tenant_id;
    NodeId node_id;
    UnitId unit_id;
    RuntimeId runtime;
    std::string outcome;            ///< Execution state or error code name
    bool served_warm = false;
    uint32_t scheduling_attempts = 0;
    PhaseTimings phases;
    ResourceUsage usage;
    ProcessCounters counters;
    ResourceSnapshot host_before;
    ResourceSnapshot host_after;
    Timestamp recorded_at;
};

// ─────────────────────────────────────────────
// Execution Result
// ─────────────────────────────────────────────

enum class ViolationKind : uint8_t {
    Syscall,
    Filesystem,
    Network,
    Resource
};

[[nodiscard]] constexpr std::string_view to_string(ViolationKind kind) noexcept {
    switch (kind) {
        case ViolationKind::Syscall:    return "syscall";
        case ViolationKind::Filesystem: return "filesystem";
        case ViolationKind::Network:    return "network";
        case ViolationKind::Resource:   return "resource";
    }
    return "unknown";
}

struct PolicyViolation {
    ViolationKind kind;
    std::string detail;
};

struct Artifact {
    std::string path;
    std::string content;
    bool truncated = false;
};

struct TestCaseResult {
    std::string name;
    bool passed = false;
    std::string detail;              ///< Empty when passed
};

struct ExecutionResult {
    RequestId request_id;
    NodeId node_id;
    UnitId unit_id;
    ExecutionState state = ExecutionState::Pending;

    std::optional<int> exit_code;
    std::optional<int> signal;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    std::vector<Artifact> artifacts;
    std::vector<std::string> missing_artifacts;
    std::vector<TestCaseResult> test_results;
    std::vector<PolicyViolation> violations;

    ExecutionMetrics metrics;

    [[nodiscard]] bool all_tests_passed() const noexcept {
        for (const auto& t : test_results) {
            if (!t.passed) return false;
        }
        return true;
    }
};

}  // namespace execution_engine
