/**
 * @file execution_supervisor.hpp
 * @brief Runs one guest inside a prepared sandbox.
 *
 * State machine: Pending → Running → {Completed | TimedOut | Killed | Crashed}.
 * The first terminal transition wins; a deadline that fires after the guest
 * already exited does not change the outcome, and vice versa.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "isolation/sandbox.hpp"
#include "request/execution_request.hpp"
#include "request/execution_result.hpp"
#include "substrate/substrate.hpp"

#include <stop_token>

namespace execution_engine {

class ExecutionSupervisor {
public:
    ExecutionSupervisor(SupervisorConfig config, Logger logger);

    /**
     * @brief Spawn the guest and supervise it until it reaches a terminal state.
     *
     * Artifacts and test cases are collected before returning, while the
     * scratch area still exists. The caller owns sandbox teardown.
     *
     * @param stop External cancellation; a stop request kills the guest.
     * @return The result, or SandboxSetupFailed when the guest could not be spawned.
     */
    Result<ExecutionResult> run(IIsolationSubstrate& substrate,
                                Sandbox& sandbox,
                                const RuntimeProfile& runtime,
                                const ExecutionRequest& request,
                                const ResourceGrant& grant,
                                std::stop_token stop);

    /// Command line and environment for a request.
    [[nodiscard]] GuestCommand build_command(const RuntimeProfile& runtime,
                                             const ExecutionRequest& request,
                                             const Sandbox& sandbox) const;

private:
    void collect_artifacts(const Sandbox& sandbox, const ExecutionRequest& request,
                           ExecutionResult& result) const;

    SupervisorConfig config_;
    Logger logger_;
};

}  // namespace execution_engine
