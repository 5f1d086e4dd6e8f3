/**
 * @file types.hpp
 * @brief Fundamental types used throughout the execution engine.
 *
 * Defines identity aliases, clocks, the host ResourceSnapshot and the
 * enumerations shared by the pool, supervisor and telemetry layers.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace execution_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using UnitId = std::string;
using RequestId = std::string;
using RuntimeId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

[[nodiscard]] inline int64_t to_millis(Duration d) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

// ─────────────────────────────────────────────
// Resource Snapshot
// ─────────────────────────────────────────────

/**
 * @brief A point-in-time snapshot of a host's resources.
 *
 * Read from Linux pseudo-filesystems by LinuxMonitor, or scripted by
 * MockMonitor. Immutable once published.
 */
struct ResourceSnapshot {
    NodeId node_id;
    Timestamp timestamp;

    float cpu_usage_percent{0.0f};                    ///< Aggregate CPU [0.0, 100.0]
    float load_average_1m{0.0f};

    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    [[nodiscard]] constexpr float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }

    [[nodiscard]] constexpr float cpu_headroom_percent() const noexcept {
        return 100.0f - cpu_usage_percent;
    }
};

// ─────────────────────────────────────────────
// Pool Unit State
// ─────────────────────────────────────────────

enum class UnitState : uint8_t {
    Cold,          ///< Being provisioned by the substrate
    Warm,          ///< Idle, ready for immediate acquisition
    Acquired,      ///< Lent to exactly one execution
    Dirty,         ///< Returned unclean, awaiting destruction
    Destroying     ///< Substrate resources being released
};

[[nodiscard]] constexpr std::string_view to_string(UnitState state) noexcept {
    switch (state) {
        case UnitState::Cold:       return "cold";
        case UnitState::Warm:       return "warm";
        case UnitState::Acquired:   return "acquired";
        case UnitState::Dirty:      return "dirty";
        case UnitState::Destroying: return "destroying";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Execution State
// ─────────────────────────────────────────────

enum class ExecutionState : uint8_t {
    Pending,       ///< Sandbox prepared, guest not yet spawned
    Running,       ///< Guest process alive
    Completed,     ///< Guest exited on its own
    TimedOut,      ///< Deadline timer fired
    Killed,        ///< Cancelled externally
    Crashed        ///< Abnormal termination (signal)
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionState state) noexcept {
    switch (state) {
        case ExecutionState::Pending:   return "pending";
        case ExecutionState::Running:   return "running";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::TimedOut:  return "timed_out";
        case ExecutionState::Killed:    return "killed";
        case ExecutionState::Crashed:   return "crashed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(ExecutionState state) noexcept {
    return state != ExecutionState::Pending && state != ExecutionState::Running;
}

}  // namespace execution_engine
