/**
 * @file sandbox.hpp
 * @brief Per-execution sandbox overlay on a pool unit (RAII).
 *
 * Created by the IsolationEnforcer once the substrate accepted the policy.
 * Teardown releases the policy and removes the scratch area; it runs on
 * destruction if not called explicitly. A sandbox never outlives the
 * request it was prepared for.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "substrate/substrate.hpp"

#include <filesystem>

namespace execution_engine {

class Sandbox {
public:
    Sandbox(IIsolationSubstrate& substrate, UnitInstance unit, SandboxPolicy policy,
            uint64_t initial_disk_bytes, Logger logger);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    [[nodiscard]] const UnitInstance& unit() const noexcept { return unit_; }
    [[nodiscard]] const SandboxPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] const std::filesystem::path& scratch_dir() const noexcept {
        return policy_.scratch_dir;
    }

    /// Bytes materialized into the scratch area before the guest ran.
    [[nodiscard]] uint64_t initial_disk_bytes() const noexcept { return initial_disk_bytes_; }

    /**
     * @brief Release the policy and delete the scratch area. Idempotent.
     * @return Error when either step failed; the unit must then be treated as dirty.
     */
    Result<void> teardown();

    [[nodiscard]] bool torn_down() const noexcept { return torn_down_; }

private:
    IIsolationSubstrate& substrate_;
    UnitInstance unit_;
    SandboxPolicy policy_;
    uint64_t initial_disk_bytes_;
    Logger logger_;
    bool torn_down_{false};
};

/// Total size of regular files below `root`.
[[nodiscard]] uint64_t directory_size(const std::filesystem::path& root);

}  // namespace execution_engine
