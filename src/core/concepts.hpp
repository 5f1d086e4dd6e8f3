/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for hot-path engine interfaces.
 *
 * The host monitor is read on every scheduling decision, so the Engine is
 * parameterized on it statically instead of going through a vtable.
 * Substrates and policies are selected at runtime from configuration and
 * use virtual interfaces instead (see substrate.hpp, scheduler.hpp).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <span>
#include <string_view>
#include <vector>

namespace execution_engine {

// Forward declarations
struct NodeView;
struct PlacementQuery;
struct RankedNode;

// ─────────────────────────────────────────────
// ResourceMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceMonitorLike
 * @brief Constrains types that can provide host resource snapshots.
 */
template <typename T>
concept ResourceMonitorLike = requires(T monitor) {
    { monitor.read() } -> std::same_as<Result<ResourceSnapshot>>;
    { monitor.cpu_usage() } -> std::convertible_to<float>;
    { monitor.memory_available() } -> std::convertible_to<uint64_t>;
    { monitor.start() } -> std::same_as<void>;
    { monitor.stop() } -> std::same_as<void>;
};

// ─────────────────────────────────────────────
// SchedulingPolicyLike
// ─────────────────────────────────────────────

/**
 * @concept SchedulingPolicyLike
 * @brief Constrains types that can rank candidate nodes for a placement.
 */
template <typename T>
concept SchedulingPolicyLike = requires(
    T policy,
    const PlacementQuery& query,
    std::span<const NodeView> nodes
) {
    { policy.rank(query, nodes) } -> std::same_as<std::vector<RankedNode>>;
    { policy.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace execution_engine
