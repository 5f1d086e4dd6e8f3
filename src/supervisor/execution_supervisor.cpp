/**
 * @file execution_supervisor.cpp
 * @brief ExecutionSupervisor implementation.
 */

#include "supervisor/execution_supervisor.hpp"

#include "isolation/isolation_enforcer.hpp"
#include "supervisor/deadline_timer.hpp"
#include "supervisor/test_evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstring>
#include <fstream>

namespace execution_engine {

namespace {

constexpr std::string_view kEntryPlaceholder = "{entry}";

std::string substitute_entry(std::string arg, const std::string& entry) {
    auto pos = arg.find(kEntryPlaceholder);
    while (pos != std::string::npos) {
        arg.replace(pos, kEntryPlaceholder.size(), entry);
        pos = arg.find(kEntryPlaceholder, pos + entry.size());
    }
    return arg;
}

/// Move `state` from Running to `target`. Returns false if already terminal.
bool transition(std::atomic<ExecutionState>& state, ExecutionState target) {
    auto expected = ExecutionState::Running;
    return state.compare_exchange_strong(expected, target);
}

std::string signal_name(int sig) {
    const char* name = ::strsignal(sig);
    return name ? std::string(name) : "signal " + std::to_string(sig);
}

/// Resolved path of `relative` when it stays inside `root`.
std::optional<std::filesystem::path> contained_path(const std::filesystem::path& root,
                                                    const std::string& relative) {
    if (!is_safe_relative_path(relative)) return std::nullopt;
    std::error_code ec;
    auto base = std::filesystem::weakly_canonical(root, ec);
    if (ec) return std::nullopt;
    auto full = std::filesystem::weakly_canonical(root / relative, ec);
    if (ec) return std::nullopt;
    auto rel = full.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") return std::nullopt;
    return full;
}

}  // namespace

ExecutionSupervisor::ExecutionSupervisor(SupervisorConfig config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {}

GuestCommand ExecutionSupervisor::build_command(const RuntimeProfile& runtime,
                                                const ExecutionRequest& request,
                                                const Sandbox& sandbox) const {
    GuestCommand command;
    auto entry = IsolationEnforcer::entry_file(runtime, request);
    for (const auto& arg : runtime.command) {
        command.argv.push_back(substitute_entry(arg, entry));
    }
    command.argv.insert(command.argv.end(), request.args.begin(), request.args.end());

    const auto scratch = sandbox.scratch_dir().string();
    command.working_dir = sandbox.scratch_dir();
    command.env = {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + scratch,
        "TMPDIR=" + scratch,
        "LANG=C.UTF-8",
        "EXECUTION_REQUEST_ID=" + request.request_id,
    };
    command.stdin_data = request.stdin_data;
    command.output_limit_bytes = config_.output_limit_bytes;
    return command;
}

Result<ExecutionResult> ExecutionSupervisor::run(IIsolationSubstrate& substrate,
                                                 Sandbox& sandbox,
                                                 const RuntimeProfile& runtime,
                                                 const ExecutionRequest& request,
                                                 const ResourceGrant& grant,
                                                 std::stop_token stop) {
    ExecutionResult result;
    result.request_id = request.request_id;
    result.unit_id = sandbox.unit().id;

    auto command = build_command(runtime, request, sandbox);
    const auto spawned_at = SteadyClock::now();

    auto spawn = substrate.exec(sandbox.unit(), command);
    if (!spawn) {
        auto code = spawn.error().code == ErrorCode::Cancelled ? ErrorCode::Cancelled
                                                               : ErrorCode::SandboxSetupFailed;
        return Error{code, "guest spawn failed: " + spawn.error().message};
    }
    auto guest = std::move(*spawn);

    std::atomic<ExecutionState> state{ExecutionState::Running};
    logger_.debug("guest running for " + request.request_id);

    {
        DeadlineTimer deadline(std::chrono::milliseconds(grant.timeout_ms), [&] {
            if (transition(state, ExecutionState::TimedOut)) guest->kill_tree();
        });
        std::stop_callback on_cancel(stop, [&] {
            if (transition(state, ExecutionState::Killed)) guest->kill_tree();
        });

        const std::chrono::milliseconds poll(std::max<uint32_t>(config_.poll_interval_ms, 1));
        std::optional<GuestExit> exit;
        while (!(exit = guest->wait_for(poll))) {
        }
        deadline.cancel();

        result.exit_code = exit->exit_code;
        result.signal = exit->signal;
        if (exit->signal) {
            transition(state, ExecutionState::Crashed);
        } else {
            transition(state, ExecutionState::Completed);
        }
    }
    result.state = state.load();
    result.metrics.phases.run =
        std::chrono::duration_cast<Duration>(SteadyClock::now() - spawned_at);

    auto output = guest->take_output();
    result.stdout_data = std::move(output.stdout_data);
    result.stderr_data = std::move(output.stderr_data);
    result.stdout_truncated = output.stdout_truncated;
    result.stderr_truncated = output.stderr_truncated;

    result.metrics.usage = guest->usage();
    result.metrics.counters = guest->counters();
    result.violations = guest->violations();

    if (result.state == ExecutionState::Crashed && result.signal) {
        const int sig = *result.signal;
        if (sig == SIGSYS && sandbox.policy().syscall_filter) {
            result.violations.push_back({ViolationKind::Syscall,
                                         "guest issued a syscall outside the allow-list"});
        } else if (sig == SIGXCPU) {
            result.violations.push_back({ViolationKind::Resource, "cpu time limit exceeded"});
        } else if (sig == SIGXFSZ) {
            result.violations.push_back({ViolationKind::Resource, "file size limit exceeded"});
        }
        logger_.info("guest for " + request.request_id + " terminated by " + signal_name(sig));
    }

    const auto disk_after = directory_size(sandbox.scratch_dir());
    const auto disk_before = sandbox.initial_disk_bytes();
    result.metrics.usage.disk_bytes_written = disk_after > disk_before ? disk_after - disk_before : 0;
    if (grant.disk_bytes() > 0 && disk_after > grant.disk_bytes()) {
        result.violations.push_back({ViolationKind::Resource,
                                     "scratch usage " + std::to_string(disk_after)
                                     + " bytes exceeds the disk ceiling"});
    }

    collect_artifacts(sandbox, request, result);

    if (result.state == ExecutionState::Completed && !request.test_cases.empty()) {
        result.test_results = evaluate_tests(request.test_cases, result.stdout_data,
                                             result.exit_code, sandbox.scratch_dir());
    }

    logger_.info("execution " + request.request_id + " finished: "
                 + std::string(to_string(result.state)));
    return result;
}

void ExecutionSupervisor::collect_artifacts(const Sandbox& sandbox,
                                            const ExecutionRequest& request,
                                            ExecutionResult& result) const {
    for (const auto& relative : request.outputs) {
        auto path = contained_path(sandbox.scratch_dir(), relative);
        std::error_code ec;
        if (!path || !std::filesystem::is_regular_file(*path, ec)) {
            result.missing_artifacts.push_back(relative);
            continue;
        }

        std::ifstream in(*path, std::ios::binary);
        if (!in.is_open()) {
            result.missing_artifacts.push_back(relative);
            continue;
        }

        Artifact artifact{relative, {}, false};
        const auto limit = config_.artifact_limit_bytes;
        artifact.content.resize(limit);
        in.read(artifact.content.data(), static_cast<std::streamsize>(limit));
        artifact.content.resize(static_cast<size_t>(in.gcount()));
        if (artifact.content.size() == limit && in.peek() != std::char_traits<char>::eof()) {
            artifact.truncated = true;
        }
        result.artifacts.push_back(std::move(artifact));
    }
}

}  // namespace execution_engine
