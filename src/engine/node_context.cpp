/**
 * @file node_context.cpp
 * @brief Substrate factory and unit reuse rule.
 */

#include "engine/node_context.hpp"

#include "substrate/process_substrate.hpp"
#include "substrate/simulated_substrate.hpp"

namespace execution_engine {

Result<std::unique_ptr<IIsolationSubstrate>> make_substrate(const NodeConfig& node,
                                                            const IsolationConfig& isolation,
                                                            Logger logger) {
    auto root = isolation.scratch_root / node.id;
    if (node.substrate == "process") {
        return std::unique_ptr<IIsolationSubstrate>(
            std::make_unique<ProcessSubstrate>(root, isolation.use_namespaces, std::move(logger)));
    }
    if (node.substrate == "simulated") {
        return std::unique_ptr<IIsolationSubstrate>(
            std::make_unique<SimulatedSubstrate>(SimulatedSubstrate::Options{.units_root = root}));
    }
    return Error{ErrorCode::InvalidArgument,
                 "node " + node.id + ": unknown substrate '" + node.substrate + "'"};
}

bool unit_reusable(const ExecutionResult& result, bool teardown_ok) noexcept {
    return teardown_ok && result.state == ExecutionState::Completed && result.violations.empty();
}

}  // namespace execution_engine
