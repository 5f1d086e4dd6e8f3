/**
 * @file simulated_substrate.cpp
 * @brief SimulatedSubstrate: scripted guest playback.
 */

#include "substrate/simulated_substrate.hpp"

#include <condition_variable>
#include <csignal>
#include <fstream>
#include <thread>

namespace execution_engine {

namespace {

bool endpoint_matches(const NetworkEndpoint& allowed, const NetworkEndpoint& target) {
    if (allowed.port && allowed.port != target.port) return false;
    if (allowed.host.starts_with("*.")) {
        auto suffix = allowed.host.substr(1);
        return target.host.size() > suffix.size() && target.host.ends_with(suffix);
    }
    return allowed.host == target.host;
}

// ─────────────────────────────────────────────
// SimulatedGuest
// ─────────────────────────────────────────────

class SimulatedGuest final : public IGuestProcess {
public:
    SimulatedGuest(GuestBehavior behavior, SandboxPolicy policy, uint64_t output_limit)
        : policy_(std::move(policy)), started_(SteadyClock::now()) {
        resolve(std::move(behavior), output_limit);
        finish_at_ = started_ + run_time_;
    }

    std::optional<GuestExit> wait_for(std::chrono::milliseconds timeout) override {
        std::unique_lock lock(mutex_);
        if (exit_) return exit_;

        auto wake = std::min(SteadyClock::now() + timeout, finish_at_);
        cv_.wait_until(lock, wake, [&] { return killed_ || SteadyClock::now() >= finish_at_; });

        if (killed_) {
            exit_ = GuestExit{std::nullopt, SIGKILL};
            return exit_;
        }
        if (SteadyClock::now() < finish_at_) return std::nullopt;

        exit_ = planned_exit_;
        if (!planned_exit_.signal) write_files();
        return exit_;
    }

    void kill_tree() override {
        {
            std::lock_guard lock(mutex_);
            if (exit_ || SteadyClock::now() >= finish_at_) return;
            killed_ = true;
        }
        cv_.notify_all();
    }

    GuestOutput take_output() override {
        std::lock_guard lock(mutex_);
        return std::move(output_);
    }

    [[nodiscard]] ResourceUsage usage() const override {
        std::lock_guard lock(mutex_);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::min(SteadyClock::now(), finish_at_) - started_);
        ResourceUsage usage;
        usage.cpu_user_ms = static_cast<uint64_t>(elapsed.count()) * 8 / 10;
        usage.cpu_system_ms = static_cast<uint64_t>(elapsed.count()) / 10;
        usage.peak_memory_bytes = peak_memory_;
        return usage;
    }

    [[nodiscard]] ProcessCounters counters() const override {
        ProcessCounters counters;
        counters.syscalls = syscalls_;
        counters.voluntary_context_switches = syscalls_ / 4;
        counters.minor_page_faults = peak_memory_ / 4096;
        return counters;
    }

    [[nodiscard]] std::vector<PolicyViolation> violations() const override {
        std::lock_guard lock(mutex_);
        return violations_;
    }

private:
    /// Play the behaviour against the policy up front.
    void resolve(GuestBehavior behavior, uint64_t output_limit) {
        run_time_ = behavior.run_time;
        peak_memory_ = behavior.peak_memory_bytes;
        syscalls_ = behavior.syscalls;
        files_ = std::move(behavior.files);
        output_.stdout_data = std::move(behavior.stdout_data);
        output_.stderr_data = std::move(behavior.stderr_data);
        planned_exit_.exit_code = behavior.exit_code;
        if (behavior.signal) {
            planned_exit_ = GuestExit{std::nullopt, behavior.signal};
        }

        if (behavior.forbidden_syscall && policy_.syscall_filter) {
            planned_exit_ = GuestExit{std::nullopt, SIGSYS};
            run_time_ = std::min(run_time_, std::chrono::milliseconds(1));
        }

        if (behavior.network_target && !planned_exit_.signal) {
            auto target = parse_endpoint(*behavior.network_target);
            if (!policy_.network_enabled) {
                // socket() fails with EACCES; the guest reports it and exits non-zero
                output_.stderr_data += "socket: Permission denied\n";
                planned_exit_ = GuestExit{1, std::nullopt};
            } else if (!policy_.network_allow_list.empty()) {
                bool allowed = false;
                for (const auto& entry : policy_.network_allow_list) {
                    if (target && endpoint_matches(entry, *target)) allowed = true;
                }
                if (!allowed) {
                    output_.stderr_data += "connect: Permission denied\n";
                    planned_exit_ = GuestExit{1, std::nullopt};
                    violations_.push_back({ViolationKind::Network,
                                           "egress to " + *behavior.network_target + " blocked"});
                }
            }
        }

        if (policy_.memory_bytes > 0 && peak_memory_ > policy_.memory_bytes
            && planned_exit_.signal != SIGSYS) {
            planned_exit_ = GuestExit{std::nullopt, SIGKILL};
            peak_memory_ = policy_.memory_bytes;
            violations_.push_back({ViolationKind::Resource, "memory limit exceeded"});
        }

        if (output_.stdout_data.size() > output_limit) {
            output_.stdout_data.resize(output_limit);
            output_.stdout_truncated = true;
        }
        if (output_.stderr_data.size() > output_limit) {
            output_.stderr_data.resize(output_limit);
            output_.stderr_truncated = true;
        }
    }

    void write_files() {
        for (const auto& [path, content] : files_) {
            auto full = policy_.scratch_dir / path;
            std::error_code ec;
            std::filesystem::create_directories(full.parent_path(), ec);
            std::ofstream out(full, std::ios::binary | std::ios::trunc);
            out << content;
        }
    }

    SandboxPolicy policy_;
    SteadyTime started_;
    SteadyTime finish_at_;
    std::chrono::milliseconds run_time_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool killed_{false};
    std::optional<GuestExit> exit_;
    GuestExit planned_exit_;

    GuestOutput output_;
    std::map<std::string, std::string> files_;
    std::vector<PolicyViolation> violations_;
    uint64_t peak_memory_{0};
    uint64_t syscalls_{0};
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// SimulatedSubstrate
// ─────────────────────────────────────────────

SimulatedSubstrate::SimulatedSubstrate(Options options)
    : options_(std::move(options))
    , script_([](const GuestCommand& command) {
          GuestBehavior behavior;
          behavior.stdout_data = command.stdin_data;
          return behavior;
      }) {}

SubstrateCapabilities SimulatedSubstrate::capabilities() const noexcept {
    return options_.capabilities;
}

Result<UnitInstance> SimulatedSubstrate::create(const RuntimeProfile& runtime, const UnitId& id) {
    std::chrono::milliseconds latency;
    {
        std::lock_guard lock(mutex_);
        latency = options_.create_latency;
        if (failing_creates_ > 0) {
            --failing_creates_;
            return Error{ErrorCode::Internal, "injected create failure for " + id};
        }
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }

    UnitInstance unit{id, runtime.id, options_.units_root / id};
    std::error_code ec;
    std::filesystem::create_directories(unit.root, ec);
    if (ec) {
        return Error{ErrorCode::Internal, "cannot create unit directory: " + ec.message()};
    }

    std::lock_guard lock(mutex_);
    units_[id] = std::nullopt;
    created_.fetch_add(1);
    return unit;
}

Result<void> SimulatedSubstrate::destroy(const UnitInstance& unit) {
    {
        std::lock_guard lock(mutex_);
        if (units_.erase(unit.id) == 0) {
            return Error{ErrorCode::NotFound, "unknown unit " + unit.id};
        }
    }
    std::error_code ec;
    std::filesystem::remove_all(unit.root, ec);
    destroyed_.fetch_add(1);
    return {};
}

Result<void> SimulatedSubstrate::apply_policy(const UnitInstance& unit, const SandboxPolicy& policy) {
    std::lock_guard lock(mutex_);
    auto it = units_.find(unit.id);
    if (it == units_.end()) {
        return Error{ErrorCode::NotFound, "unknown unit " + unit.id};
    }
    if (failing_policies_ > 0) {
        --failing_policies_;
        return Error{ErrorCode::SandboxSetupFailed, "injected policy failure on " + unit.id};
    }
    if (it->second) {
        return Error{ErrorCode::SandboxSetupFailed, "unit " + unit.id + " already has a policy"};
    }
    const auto& caps = options_.capabilities;
    if (policy.syscall_filter && !caps.syscall_filter) {
        return Error{ErrorCode::SandboxSetupFailed, "syscall filtering unavailable"};
    }
    if (policy.network_enabled && !policy.network_allow_list.empty() && !caps.network_allow_list) {
        return Error{ErrorCode::SandboxSetupFailed, "egress allow-lists unavailable"};
    }
    if (!policy.network_enabled && !caps.network_deny) {
        return Error{ErrorCode::SandboxSetupFailed, "network deny unavailable"};
    }
    it->second = policy;
    applied_.fetch_add(1);
    return {};
}

Result<std::unique_ptr<IGuestProcess>> SimulatedSubstrate::exec(const UnitInstance& unit,
                                                                const GuestCommand& command) {
    SandboxPolicy policy;
    GuestScript script;
    {
        std::lock_guard lock(mutex_);
        auto it = units_.find(unit.id);
        if (it == units_.end() || !it->second) {
            return Error{ErrorCode::SandboxSetupFailed, "no policy applied to unit " + unit.id};
        }
        policy = *it->second;
        script = script_;
    }
    execs_.fetch_add(1);
    return std::unique_ptr<IGuestProcess>(std::make_unique<SimulatedGuest>(
        script(command), std::move(policy), command.output_limit_bytes));
}

Result<void> SimulatedSubstrate::release_policy(const UnitInstance& unit) {
    std::lock_guard lock(mutex_);
    auto it = units_.find(unit.id);
    if (it == units_.end()) {
        return Error{ErrorCode::NotFound, "unknown unit " + unit.id};
    }
    it->second.reset();
    return {};
}

Result<void> SimulatedSubstrate::probe() {
    std::lock_guard lock(mutex_);
    if (!healthy_) {
        return Error{ErrorCode::Internal, "simulated substrate unhealthy"};
    }
    return {};
}

void SimulatedSubstrate::set_script(GuestScript script) {
    std::lock_guard lock(mutex_);
    script_ = std::move(script);
}

void SimulatedSubstrate::set_create_latency(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    options_.create_latency = latency;
}

void SimulatedSubstrate::fail_next_creates(uint32_t count) {
    std::lock_guard lock(mutex_);
    failing_creates_ = count;
}

void SimulatedSubstrate::fail_next_policies(uint32_t count) {
    std::lock_guard lock(mutex_);
    failing_policies_ = count;
}

void SimulatedSubstrate::set_healthy(bool healthy) {
    std::lock_guard lock(mutex_);
    healthy_ = healthy;
}

size_t SimulatedSubstrate::live_units() const {
    std::lock_guard lock(mutex_);
    return units_.size();
}

}  // namespace execution_engine
