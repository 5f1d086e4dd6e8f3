/**
 * @file process_substrate.hpp
 * @brief Linux process substrate: units are host directories, guests are
 *        child process groups confined by rlimits and seccomp-BPF.
 *
 * With `use_namespaces` the guest also gets private user and mount
 * namespaces (read-only bind remounts of the runtime paths) and, when
 * network is denied, an empty network namespace.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "substrate/substrate.hpp"
#include "substrate/syscall_filter.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace execution_engine {

/// Resolve a command name against PATH. Names containing '/' are checked as-is.
[[nodiscard]] std::optional<std::filesystem::path> resolve_executable(const std::string& name);

class ProcessSubstrate final : public IIsolationSubstrate {
public:
    ProcessSubstrate(std::filesystem::path units_root, bool use_namespaces, Logger logger);

    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }
    [[nodiscard]] SubstrateCapabilities capabilities() const noexcept override;

    Result<UnitInstance> create(const RuntimeProfile& runtime, const UnitId& id) override;
    Result<void> destroy(const UnitInstance& unit) override;

    Result<void> apply_policy(const UnitInstance& unit, const SandboxPolicy& policy) override;
    Result<std::unique_ptr<IGuestProcess>> exec(const UnitInstance& unit,
                                                const GuestCommand& command) override;
    Result<void> release_policy(const UnitInstance& unit) override;

    Result<void> probe() override;

private:
    struct UnitRecord {
        std::optional<SandboxPolicy> policy;
        std::shared_ptr<const SyscallFilter> filter;  ///< Shared with in-flight spawns
    };

    std::filesystem::path units_root_;
    bool use_namespaces_;
    Logger logger_;

    std::mutex mutex_;
    std::unordered_map<UnitId, UnitRecord> units_;
};

}  // namespace execution_engine
