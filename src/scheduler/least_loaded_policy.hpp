/**
 * @file least_loaded_policy.hpp
 * @brief Least-loaded placement policy: ignores warm state and affinity.
 */

#pragma once

#include "scheduler/scheduler.hpp"

namespace execution_engine {

class LeastLoadedPolicy : public ISchedulingPolicy {
public:
    std::vector<RankedNode> rank(const PlacementQuery& query,
                                 std::span<const NodeView> nodes) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "least_loaded"; }
};

}  // namespace execution_engine
