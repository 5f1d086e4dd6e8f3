/**
 * @file weighted_policy.cpp
 * @brief WeightedPolicy: ranks nodes by a weighted sum of four signals.
 *
 * Algorithm:
 *   warm(node)        = min(warm_units, saturation) / saturation
 *   headroom(node)    = (cpu_headroom + memory_headroom) / 2
 *   reliability(node) = 1 - failure_rate
 *   affinity(node)    = 1 if explicitly preferred or last served the workspace
 *
 *   score = w_warm·warm + w_headroom·headroom + w_rel·reliability + w_aff·affinity
 *
 * Ties within epsilon go to the least loaded node.
 * Complexity: O(N log N) where N = nodes.
 */

#include "scheduler/weighted_policy.hpp"

#include "core/concepts.hpp"

#include <algorithm>

namespace execution_engine {

static_assert(SchedulingPolicyLike<WeightedPolicy>);

WeightedPolicy::WeightedPolicy(SchedulerConfig config)
    : config_(std::move(config)) {}

float WeightedPolicy::score(const NodeView& node, const PlacementQuery& query) const noexcept {
    const auto& w = config_.weights;
    const auto saturation = static_cast<float>(std::max<uint32_t>(config_.warm_saturation, 1));

    float warm = std::min(static_cast<float>(node.warm_units), saturation) / saturation;
    float headroom = (node.cpu_headroom() + node.memory_headroom()) / 2.0f;
    float reliability = 1.0f - std::clamp(node.failure_rate, 0.0f, 1.0f);

    bool preferred = std::find(query.affinity.begin(), query.affinity.end(), node.node_id)
                     != query.affinity.end();
    float affinity = (preferred || node.served_workspace) ? 1.0f : 0.0f;

    return w.warm * warm + w.headroom * headroom + w.reliability * reliability
         + w.affinity * affinity;
}

std::vector<RankedNode> WeightedPolicy::rank(const PlacementQuery& query,
                                             std::span<const NodeView> nodes) {
    std::vector<RankedNode> ranked;
    ranked.reserve(nodes.size());

    for (const auto& node : nodes) {
        if (!is_eligible(node, query)) continue;
        ranked.push_back(RankedNode{
            .node_id = node.node_id,
            .score = score(node, query),
            .load = node.load(),
            .warm = node.warm_units > 0,
        });
    }

    order_ranking(ranked, config_.tie_epsilon);
    return ranked;
}

}  // namespace execution_engine
