/**
 * @file least_loaded_policy.cpp
 * @brief LeastLoadedPolicy implementation.
 */

#include "scheduler/least_loaded_policy.hpp"

#include "core/concepts.hpp"

namespace execution_engine {

static_assert(SchedulingPolicyLike<LeastLoadedPolicy>);

std::vector<RankedNode> LeastLoadedPolicy::rank(const PlacementQuery& query,
                                                std::span<const NodeView> nodes) {
    std::vector<RankedNode> ranked;
    ranked.reserve(nodes.size());

    for (const auto& node : nodes) {
        if (!is_eligible(node, query)) continue;
        float load = node.load();
        ranked.push_back(RankedNode{
            .node_id = node.node_id,
            .score = 1.0f - load,
            .load = load,
            .warm = node.warm_units > 0,
        });
    }

    order_ranking(ranked, 0.0f);
    return ranked;
}

}  // namespace execution_engine
