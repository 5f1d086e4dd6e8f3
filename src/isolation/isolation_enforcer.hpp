/**
 * @file isolation_enforcer.hpp
 * @brief Builds and applies the per-execution sandbox on an acquired unit.
 *
 * Layers: scratch area (size-capped), read-only runtime/system paths,
 * memory/cpu/process/file-size ceilings, network policy and the default-deny
 * syscall filter. If any layer cannot be applied the caller gets
 * SandboxSetupFailed and must mark the unit dirty.
 */

#pragma once

#include "allocator/resource_allocator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "isolation/sandbox.hpp"
#include "request/execution_request.hpp"
#include "substrate/substrate.hpp"
#include "workspace/workspace_service.hpp"

#include <memory>

namespace execution_engine {

class IsolationEnforcer {
public:
    /// @param workspace May be null; snapshots and source references are then unavailable.
    IsolationEnforcer(IsolationConfig config, IWorkspaceService* workspace, Logger logger);

    /**
     * @brief Materialize the request into a fresh scratch area and apply the policy.
     *
     * @return The sandbox, SandboxSetupFailed when a layer cannot be applied,
     *         or the workspace service's error when sources cannot be fetched.
     */
    Result<std::unique_ptr<Sandbox>> prepare(IIsolationSubstrate& substrate,
                                             const UnitInstance& unit,
                                             const RuntimeProfile& runtime,
                                             const ResourceGrant& grant,
                                             const ExecutionRequest& request);

    /// Policy for a grant, without touching the filesystem or the substrate.
    [[nodiscard]] SandboxPolicy build_policy(const RuntimeProfile& runtime,
                                             const ResourceGrant& grant,
                                             const std::filesystem::path& scratch_dir) const;

    /// Entry file for a request (explicit entry point or the runtime's source file).
    [[nodiscard]] static std::string entry_file(const RuntimeProfile& runtime,
                                                const ExecutionRequest& request);

private:
    Result<void> check_capabilities(const IIsolationSubstrate& substrate,
                                    const ResourceGrant& grant) const;
    Result<uint64_t> materialize(const std::filesystem::path& scratch,
                                 const RuntimeProfile& runtime,
                                 const ExecutionRequest& request);

    IsolationConfig config_;
    IWorkspaceService* workspace_;
    Logger logger_;
};

}  // namespace execution_engine
