/**
 * @file ranking.cpp
 * @brief Eligibility and ordering helpers shared by the placement policies.
 */

#include "scheduler/scheduler.hpp"

#include <cmath>

namespace execution_engine {

bool is_eligible(const NodeView& node, const PlacementQuery& query) noexcept {
    if (node.degraded) return false;
    if (std::find(query.excluded.begin(), query.excluded.end(), node.node_id)
        != query.excluded.end()) {
        return false;
    }
    if (node.cpu_committed_millicores + query.cpu_millicores > node.cpu_capacity_millicores) {
        return false;
    }
    return node.memory_committed_bytes + query.memory_bytes <= node.memory_capacity_bytes;
}

void order_ranking(std::vector<RankedNode>& ranked, float epsilon) {
    std::sort(ranked.begin(), ranked.end(), [](const RankedNode& a, const RankedNode& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.node_id < b.node_id;
    });

    // Within a group of near-equal scores, prefer the least loaded node
    auto group_begin = ranked.begin();
    while (group_begin != ranked.end()) {
        auto group_end = std::find_if(group_begin, ranked.end(), [&](const RankedNode& n) {
            return std::fabs(group_begin->score - n.score) > epsilon;
        });
        std::stable_sort(group_begin, group_end, [](const RankedNode& a, const RankedNode& b) {
            return a.load < b.load;
        });
        group_begin = group_end;
    }
}

}  // namespace execution_engine
