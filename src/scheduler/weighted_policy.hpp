/**
 * @file weighted_policy.hpp
 * @brief Weighted placement policy: warm units, headroom, reliability, affinity.
 */

#pragma once

#include "core/config.hpp"
#include "scheduler/scheduler.hpp"

namespace execution_engine {

class WeightedPolicy : public ISchedulingPolicy {
public:
    explicit WeightedPolicy(SchedulerConfig config);

    std::vector<RankedNode> rank(const PlacementQuery& query,
                                 std::span<const NodeView> nodes) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "weighted"; }

    /// Score of a single eligible node.
    [[nodiscard]] float score(const NodeView& node, const PlacementQuery& query) const noexcept;

private:
    SchedulerConfig config_;
};

}  // namespace execution_engine
