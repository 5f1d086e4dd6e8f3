/**
 * @file simulated_substrate.hpp
 * @brief In-memory substrate with scripted guests, for tests and demos.
 *
 * Guests do not run any code. A GuestScript maps each command to a
 * GuestBehavior (run time, exit, output, files, network and syscall
 * attempts) which is then played back against the applied SandboxPolicy.
 * Scratch directories are still real so artifacts and disk checks work.
 */

#pragma once

#include "substrate/substrate.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace execution_engine {

struct GuestBehavior {
    std::chrono::milliseconds run_time{0};
    int exit_code = 0;
    std::optional<int> signal;                      ///< Terminate abnormally
    std::string stdout_data;
    std::string stderr_data;
    std::map<std::string, std::string> files;       ///< Written to scratch on clean exit
    std::optional<std::string> network_target;      ///< "host[:port]" the guest connects to
    std::optional<std::string> forbidden_syscall;   ///< Trapped when the filter is on
    uint64_t peak_memory_bytes = 16ULL * 1024 * 1024;
    uint64_t syscalls = 128;
};

using GuestScript = std::function<GuestBehavior(const GuestCommand&)>;

class SimulatedSubstrate final : public IIsolationSubstrate {
public:
    struct Options {
        std::filesystem::path units_root;
        std::chrono::milliseconds create_latency{0};
        SubstrateCapabilities capabilities{true, true, true, true, true, true};
    };

    explicit SimulatedSubstrate(Options options);

    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }
    [[nodiscard]] SubstrateCapabilities capabilities() const noexcept override;

    Result<UnitInstance> create(const RuntimeProfile& runtime, const UnitId& id) override;
    Result<void> destroy(const UnitInstance& unit) override;

    Result<void> apply_policy(const UnitInstance& unit, const SandboxPolicy& policy) override;
    Result<std::unique_ptr<IGuestProcess>> exec(const UnitInstance& unit,
                                                const GuestCommand& command) override;
    Result<void> release_policy(const UnitInstance& unit) override;

    Result<void> probe() override;

    // ── Scripting and fault injection ────────
    void set_script(GuestScript script);
    void set_create_latency(std::chrono::milliseconds latency);
    void fail_next_creates(uint32_t count);
    void fail_next_policies(uint32_t count);
    void set_healthy(bool healthy);

    // ── Observers ────────────────────────────
    [[nodiscard]] uint32_t units_created() const noexcept { return created_.load(); }
    [[nodiscard]] uint32_t units_destroyed() const noexcept { return destroyed_.load(); }
    [[nodiscard]] uint32_t policies_applied() const noexcept { return applied_.load(); }
    [[nodiscard]] uint32_t execs() const noexcept { return execs_.load(); }
    [[nodiscard]] size_t live_units() const;

private:
    Options options_;

    mutable std::mutex mutex_;
    GuestScript script_;
    std::unordered_map<UnitId, std::optional<SandboxPolicy>> units_;
    uint32_t failing_creates_{0};
    uint32_t failing_policies_{0};
    bool healthy_{true};

    std::atomic<uint32_t> created_{0};
    std::atomic<uint32_t> destroyed_{0};
    std::atomic<uint32_t> applied_{0};
    std::atomic<uint32_t> execs_{0};
};

}  // namespace execution_engine
