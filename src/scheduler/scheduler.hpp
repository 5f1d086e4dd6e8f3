/**
 * @file scheduler.hpp
 * @brief Scheduler types: node views, placement queries and the policy interface.
 */

#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

// ─────────────────────────────────────────────
// Node View (per-placement snapshot of one node)
// ─────────────────────────────────────────────

struct NodeView {
    NodeId node_id;
    ResourceSnapshot host;

    uint32_t cpu_capacity_millicores = 0;
    uint64_t memory_capacity_bytes = 0;
    uint32_t cpu_committed_millicores = 0;
    uint64_t memory_committed_bytes = 0;

    size_t warm_units = 0;              ///< Warm units for the queried runtime
    float failure_rate = 0.0f;          ///< Over the recent outcome window [0, 1]
    bool degraded = false;
    bool served_workspace = false;      ///< Last node to run the queried workspace
    std::vector<std::string> labels;

    /// Free cpu fraction, the tighter of committed share and host usage.
    [[nodiscard]] float cpu_headroom() const noexcept {
        float committed = cpu_capacity_millicores == 0 ? 1.0f
            : static_cast<float>(cpu_committed_millicores) / static_cast<float>(cpu_capacity_millicores);
        return std::clamp(std::min(1.0f - committed, host.cpu_headroom_percent() / 100.0f), 0.0f, 1.0f);
    }

    [[nodiscard]] float memory_headroom() const noexcept {
        float committed = memory_capacity_bytes == 0 ? 1.0f
            : static_cast<float>(memory_committed_bytes) / static_cast<float>(memory_capacity_bytes);
        float host_free = 1.0f - host.memory_usage_percent() / 100.0f;
        return std::clamp(std::min(1.0f - committed, host_free), 0.0f, 1.0f);
    }

    /// Current load in [0, 1], used to break score ties.
    [[nodiscard]] float load() const noexcept {
        return 1.0f - (cpu_headroom() + memory_headroom()) / 2.0f;
    }
};

struct PlacementQuery {
    RuntimeId runtime;
    uint32_t cpu_millicores = 0;
    uint64_t memory_bytes = 0;
    std::vector<NodeId> affinity;       ///< Explicitly preferred nodes
    std::string workspace_id;
    std::vector<NodeId> excluded;       ///< Nodes already tried for this request
};

struct RankedNode {
    NodeId node_id;
    float score = 0.0f;
    float load = 0.0f;
    bool warm = false;
};

/// Not degraded, not excluded, and with uncommitted capacity for the query.
[[nodiscard]] bool is_eligible(const NodeView& node, const PlacementQuery& query) noexcept;

/**
 * @brief Sort best-first: score descending, scores within `epsilon` of the
 *        group leader ordered by lowest load, then by node id.
 */
void order_ranking(std::vector<RankedNode>& ranked, float epsilon);

// ─────────────────────────────────────────────
// ISchedulingPolicy
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for placement policies (runtime polymorphism).
 *
 * Complements the SchedulingPolicyLike concept; the policy is chosen from
 * configuration. rank() returns eligible nodes only, best first.
 */
class ISchedulingPolicy {
public:
    virtual ~ISchedulingPolicy() = default;
    virtual std::vector<RankedNode> rank(const PlacementQuery& query,
                                         std::span<const NodeView> nodes) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace execution_engine
