/**
 * @file process_substrate.cpp
 * @brief ProcessSubstrate: fork/exec guests under rlimits, process groups
 *        and seccomp-BPF.
 *
 * Spawn protocol: the child reports any setup failure through a CLOEXEC
 * status pipe as a {step, errno} pair and exits with 127. EOF on the pipe
 * means exec succeeded. Everything that allocates is prepared before fork().
 */

#include "substrate/process_substrate.hpp"

#include "resource_monitor/process_sampler.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace execution_engine {

namespace {

// ─────────────────────────────────────────────
// Child-side setup
// ─────────────────────────────────────────────

enum class SpawnStep : int {
    ProcessGroup,
    Redirect,
    Namespaces,
    IdMapping,
    ReadOnlyMount,
    WorkingDir,
    Limits,
    SyscallFilter,
    Exec
};

const char* to_cstring(SpawnStep step) {
    switch (step) {
        case SpawnStep::ProcessGroup:  return "setpgid";
        case SpawnStep::Redirect:      return "redirect stdio";
        case SpawnStep::Namespaces:    return "unshare";
        case SpawnStep::IdMapping:     return "write id map";
        case SpawnStep::ReadOnlyMount: return "read-only bind mount";
        case SpawnStep::WorkingDir:    return "chdir";
        case SpawnStep::Limits:        return "setrlimit";
        case SpawnStep::SyscallFilter: return "seccomp";
        case SpawnStep::Exec:          return "execve";
    }
    return "unknown";
}

struct SpawnFailure {
    int step;
    int error;
};

struct ReadOnlyMount {
    std::string path;
    unsigned long locked_flags;
};

/// Everything the child needs, prepared before fork().
struct SpawnPlan {
    std::string executable;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
    std::string working_dir;

    std::vector<std::pair<int, rlim_t>> limits;
    const SyscallFilter* filter = nullptr;

    bool namespaces = false;
    bool private_network = false;
    std::string uid_map;
    std::string gid_map;
    std::vector<ReadOnlyMount> read_only;
};

[[noreturn]] void child_fail(int status_fd, SpawnStep step) noexcept {
    SpawnFailure failure{static_cast<int>(step), errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

bool write_proc_file(const char* path, const std::string& contents) noexcept {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    auto written = ::write(fd, contents.data(), contents.size());
    ::close(fd);
    return written == static_cast<ssize_t>(contents.size());
}

[[noreturn]] void run_child(const SpawnPlan& plan, int stdin_fd, int stdout_fd,
                            int stderr_fd, int status_fd) noexcept {
    if (::setpgid(0, 0) != 0) child_fail(status_fd, SpawnStep::ProcessGroup);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    ::sigaction(SIGPIPE, &sa, nullptr);

    if (::dup2(stdin_fd, STDIN_FILENO) < 0 || ::dup2(stdout_fd, STDOUT_FILENO) < 0
        || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
        child_fail(status_fd, SpawnStep::Redirect);
    }
    if (status_fd != 3) {
        if (::dup3(status_fd, 3, O_CLOEXEC) < 0) child_fail(status_fd, SpawnStep::Redirect);
        status_fd = 3;
    }
#ifdef SYS_close_range
    ::syscall(SYS_close_range, 4U, ~0U, 0U);
#else
    for (int fd = 4; fd < 1024; ++fd) ::close(fd);
#endif

    if (plan.namespaces) {
        int flags = CLONE_NEWUSER | CLONE_NEWNS | (plan.private_network ? CLONE_NEWNET : 0);
        if (::unshare(flags) != 0) child_fail(status_fd, SpawnStep::Namespaces);
        if (!write_proc_file("/proc/self/setgroups", "deny")
            || !write_proc_file("/proc/self/uid_map", plan.uid_map)
            || !write_proc_file("/proc/self/gid_map", plan.gid_map)) {
            child_fail(status_fd, SpawnStep::IdMapping);
        }
        if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
            child_fail(status_fd, SpawnStep::ReadOnlyMount);
        }
        for (const auto& ro : plan.read_only) {
            const char* path = ro.path.c_str();
            if (::mount(path, path, nullptr, MS_BIND | MS_REC, nullptr) != 0
                || ::mount(nullptr, path, nullptr,
                           MS_BIND | MS_REMOUNT | MS_RDONLY | ro.locked_flags, nullptr) != 0) {
                child_fail(status_fd, SpawnStep::ReadOnlyMount);
            }
        }
    }

    if (::chdir(plan.working_dir.c_str()) != 0) child_fail(status_fd, SpawnStep::WorkingDir);

    for (const auto& [resource, value] : plan.limits) {
        struct rlimit limit{value, value};
        if (::setrlimit(resource, &limit) != 0) child_fail(status_fd, SpawnStep::Limits);
    }

    if (plan.filter) {
        int err = plan.filter->install();
        if (err != 0) {
            errno = err;
            child_fail(status_fd, SpawnStep::SyscallFilter);
        }
    }

    ::execve(plan.executable.c_str(), plan.argv.data(), plan.envp.data());
    child_fail(status_fd, SpawnStep::Exec);
}

unsigned long locked_mount_flags(const std::string& path) {
    struct statvfs info {};
    if (::statvfs(path.c_str(), &info) != 0) return 0;
    unsigned long flags = 0;
    if (info.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (info.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    return flags;
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// ─────────────────────────────────────────────
// ProcessGuest
// ─────────────────────────────────────────────

class ProcessGuest final : public IGuestProcess {
public:
    ProcessGuest(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                 std::string stdin_data, uint64_t output_limit)
        : pid_(pid)
        , stdin_fd_(stdin_fd)
        , stdout_fd_(stdout_fd)
        , stderr_fd_(stderr_fd)
        , pending_stdin_(std::move(stdin_data))
        , output_limit_(output_limit) {
        set_nonblocking(stdout_fd_);
        set_nonblocking(stderr_fd_);
        set_nonblocking(stdin_fd_);
        if (pending_stdin_.empty()) close_fd(stdin_fd_);
    }

    ~ProcessGuest() override {
        if (!reaped_.load()) {
            kill_tree();
            int status = 0;
            struct rusage ru {};
            while (::wait4(pid_, &status, 0, &ru) < 0 && errno == EINTR) {}
        }
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
    }

    ProcessGuest(const ProcessGuest&) = delete;
    ProcessGuest& operator=(const ProcessGuest&) = delete;

    std::optional<GuestExit> wait_for(std::chrono::milliseconds timeout) override {
        if (exit_) return exit_;

        auto deadline = SteadyClock::now() + timeout;
        while (true) {
            pump_io(std::chrono::milliseconds(10));
            sample();

            if (try_reap()) {
                drain();
                return exit_;
            }
            if (SteadyClock::now() >= deadline) return std::nullopt;
        }
    }

    void kill_tree() override {
        std::lock_guard lock(reap_mutex_);
        if (!reaped_.load()) {
            ::kill(-pid_, SIGKILL);
        }
    }

    GuestOutput take_output() override {
        return std::move(output_);
    }

    [[nodiscard]] ResourceUsage usage() const override { return usage_; }
    [[nodiscard]] ProcessCounters counters() const override { return counters_; }
    [[nodiscard]] std::vector<PolicyViolation> violations() const override { return {}; }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void append(int& fd, std::string& buffer, bool& truncated) {
        char chunk[16384];
        while (true) {
            auto n = ::read(fd, chunk, sizeof(chunk));
            if (n > 0) {
                auto room = output_limit_ > buffer.size() ? output_limit_ - buffer.size() : 0;
                auto take = std::min<uint64_t>(room, static_cast<uint64_t>(n));
                buffer.append(chunk, static_cast<size_t>(take));
                if (take < static_cast<uint64_t>(n)) truncated = true;
                continue;
            }
            if (n == 0) {
                close_fd(fd);
            } else if (errno == EINTR) {
                continue;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                close_fd(fd);
            }
            return;
        }
    }

    void feed_stdin() {
        while (stdin_offset_ < pending_stdin_.size()) {
            auto n = ::write(stdin_fd_, pending_stdin_.data() + stdin_offset_,
                             pending_stdin_.size() - stdin_offset_);
            if (n > 0) {
                stdin_offset_ += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            break;  // EPIPE: guest closed its stdin
        }
        close_fd(stdin_fd_);
    }

    void pump_io(std::chrono::milliseconds slice) {
        pollfd fds[3];
        nfds_t count = 0;
        if (stdout_fd_ >= 0) fds[count++] = {stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) fds[count++] = {stderr_fd_, POLLIN, 0};
        if (stdin_fd_ >= 0) fds[count++] = {stdin_fd_, POLLOUT, 0};

        if (count == 0) {
            std::this_thread::sleep_for(slice);
            return;
        }
        int ready = ::poll(fds, count, static_cast<int>(slice.count()));
        if (ready <= 0) return;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == stdout_fd_) {
                append(stdout_fd_, output_.stdout_data, output_.stdout_truncated);
            } else if (fds[i].fd == stderr_fd_) {
                append(stderr_fd_, output_.stderr_data, output_.stderr_truncated);
            } else if (fds[i].fd == stdin_fd_) {
                feed_stdin();
            }
        }
    }

    void drain() {
        close_fd(stdin_fd_);
        // The group was killed; remaining data is bounded by the pipe buffers
        for (int i = 0; i < 4 && (stdout_fd_ >= 0 || stderr_fd_ >= 0); ++i) {
            pump_io(std::chrono::milliseconds(5));
        }
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
    }

    void sample() {
        auto now = SteadyClock::now();
        if (now - last_sample_ < std::chrono::milliseconds(50)) return;
        last_sample_ = now;
        if (auto s = sample_process(pid_)) {
            peak_rss_ = std::max(peak_rss_, s->peak_rss_bytes);
        }
    }

    bool try_reap() {
        std::lock_guard lock(reap_mutex_);
        if (reaped_.load()) return true;

        // Peek first so stragglers in the group are killed while the pgid is still ours
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0
            || info.si_pid == 0) {
            return false;
        }
        ::kill(-pid_, SIGKILL);

        int status = 0;
        struct rusage ru {};
        pid_t ret;
        do {
            ret = ::wait4(pid_, &status, 0, &ru);
        } while (ret < 0 && errno == EINTR);
        reaped_.store(true);

        GuestExit result;
        if (ret == pid_ && WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (ret == pid_ && WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }
        exit_ = result;

        usage_.cpu_user_ms = static_cast<uint64_t>(ru.ru_utime.tv_sec) * 1000
                           + static_cast<uint64_t>(ru.ru_utime.tv_usec) / 1000;
        usage_.cpu_system_ms = static_cast<uint64_t>(ru.ru_stime.tv_sec) * 1000
                             + static_cast<uint64_t>(ru.ru_stime.tv_usec) / 1000;
        usage_.peak_memory_bytes = std::max(peak_rss_, static_cast<uint64_t>(ru.ru_maxrss) * 1024);
        counters_ = counters_from_rusage(ru);
        return true;
    }

    const pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    std::string pending_stdin_;
    size_t stdin_offset_{0};
    uint64_t output_limit_;
    GuestOutput output_;

    std::mutex reap_mutex_;
    std::atomic<bool> reaped_{false};
    std::optional<GuestExit> exit_;

    SteadyTime last_sample_{};
    uint64_t peak_rss_{0};
    ResourceUsage usage_;
    ProcessCounters counters_;
};

struct PipePair {
    int read = -1;
    int write = -1;

    void close_both() {
        if (read >= 0) ::close(read);
        if (write >= 0) ::close(write);
        read = write = -1;
    }
};

Result<PipePair> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::SandboxSetupFailed, "pipe2 failed: " + std::string(strerror(errno))};
    }
    return PipePair{fds[0], fds[1]};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// resolve_executable
// ─────────────────────────────────────────────

std::optional<std::filesystem::path> resolve_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return std::filesystem::path{name};
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    std::string search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= search.size()) {
        auto end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        auto dir = search.substr(start, end - start);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path{dir} / name;
            if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// ProcessSubstrate
// ─────────────────────────────────────────────

ProcessSubstrate::ProcessSubstrate(std::filesystem::path units_root, bool use_namespaces,
                                   Logger logger)
    : units_root_(std::move(units_root))
    , use_namespaces_(use_namespaces)
    , logger_(std::move(logger)) {
    // Guests closing their stdin must not take the engine down with them
    std::signal(SIGPIPE, SIG_IGN);
}

SubstrateCapabilities ProcessSubstrate::capabilities() const noexcept {
    SubstrateCapabilities caps;
    caps.resource_limits = true;
    caps.syscall_filter = SyscallFilter::supported();
    caps.network_deny = caps.syscall_filter || use_namespaces_;
    caps.network_allow_list = false;
    caps.filesystem_isolation = use_namespaces_;
    caps.syscall_counting = false;
    return caps;
}

Result<UnitInstance> ProcessSubstrate::create(const RuntimeProfile& runtime, const UnitId& id) {
    if (runtime.command.empty()) {
        return Error{ErrorCode::InvalidArgument, "runtime '" + runtime.id + "' has no command"};
    }
    if (!resolve_executable(runtime.command.front())) {
        return Error{ErrorCode::NotFound,
                     "runtime '" + runtime.id + "': '" + runtime.command.front() + "' not found"};
    }

    UnitInstance unit{id, runtime.id, units_root_ / id};
    std::error_code ec;
    std::filesystem::create_directories(unit.root, ec);
    if (ec) {
        return Error{ErrorCode::Internal,
                     "cannot create unit directory " + unit.root.string() + ": " + ec.message()};
    }

    std::lock_guard lock(mutex_);
    units_[id] = UnitRecord{};
    return unit;
}

Result<void> ProcessSubstrate::destroy(const UnitInstance& unit) {
    {
        std::lock_guard lock(mutex_);
        units_.erase(unit.id);
    }
    std::error_code ec;
    std::filesystem::remove_all(unit.root, ec);
    if (ec) {
        return Error{ErrorCode::Internal,
                     "cannot remove unit directory " + unit.root.string() + ": " + ec.message()};
    }
    return {};
}

Result<void> ProcessSubstrate::apply_policy(const UnitInstance& unit, const SandboxPolicy& policy) {
    std::lock_guard lock(mutex_);
    auto it = units_.find(unit.id);
    if (it == units_.end()) {
        return Error{ErrorCode::NotFound, "unknown unit " + unit.id};
    }
    if (it->second.policy) {
        return Error{ErrorCode::SandboxSetupFailed, "unit " + unit.id + " already has a policy"};
    }
    if (policy.network_enabled && !policy.network_allow_list.empty()) {
        return Error{ErrorCode::SandboxSetupFailed,
                     "egress allow-lists are not supported by the process substrate"};
    }
    if (policy.use_namespaces && !use_namespaces_) {
        return Error{ErrorCode::SandboxSetupFailed, "namespaces are disabled on this node"};
    }
    if (!policy.network_enabled && !policy.syscall_filter && !policy.use_namespaces) {
        return Error{ErrorCode::SandboxSetupFailed,
                     "network deny needs the syscall filter or namespaces"};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(policy.scratch_dir, ec)) {
        return Error{ErrorCode::SandboxSetupFailed,
                     "scratch directory missing: " + policy.scratch_dir.string()};
    }

    std::shared_ptr<const SyscallFilter> filter;
    if (policy.syscall_filter) {
        auto built = SyscallFilter::build(policy.extra_syscalls, !policy.network_enabled);
        if (!built) {
            return Error{ErrorCode::SandboxSetupFailed, built.error().message};
        }
        filter = std::make_shared<const SyscallFilter>(std::move(*built));
    }

    it->second.policy = policy;
    it->second.filter = std::move(filter);
    return {};
}

Result<void> ProcessSubstrate::release_policy(const UnitInstance& unit) {
    std::lock_guard lock(mutex_);
    auto it = units_.find(unit.id);
    if (it == units_.end()) {
        return Error{ErrorCode::NotFound, "unknown unit " + unit.id};
    }
    it->second.policy.reset();
    it->second.filter.reset();
    return {};
}

Result<std::unique_ptr<IGuestProcess>> ProcessSubstrate::exec(const UnitInstance& unit,
                                                              const GuestCommand& command) {
    if (command.argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty guest command"};
    }

    SandboxPolicy policy;
    std::shared_ptr<const SyscallFilter> filter;
    {
        std::lock_guard lock(mutex_);
        auto it = units_.find(unit.id);
        if (it == units_.end() || !it->second.policy) {
            return Error{ErrorCode::SandboxSetupFailed, "no policy applied to unit " + unit.id};
        }
        policy = *it->second.policy;
        filter = it->second.filter;
    }

    auto executable = resolve_executable(command.argv.front());
    if (!executable) {
        return Error{ErrorCode::SandboxSetupFailed, "executable not found: " + command.argv.front()};
    }

    SpawnPlan plan;
    plan.executable = executable->string();
    plan.argv_storage = command.argv;
    plan.env_storage = command.env;
    for (auto& arg : plan.argv_storage) plan.argv.push_back(arg.data());
    plan.argv.push_back(nullptr);
    for (auto& env : plan.env_storage) plan.envp.push_back(env.data());
    plan.envp.push_back(nullptr);
    plan.working_dir = command.working_dir.empty() ? policy.scratch_dir.string()
                                                   : command.working_dir.string();

    if (policy.memory_bytes > 0) plan.limits.emplace_back(RLIMIT_AS, policy.memory_bytes);
    if (policy.max_processes > 0) plan.limits.emplace_back(RLIMIT_NPROC, policy.max_processes);
    if (policy.max_file_size_bytes > 0) {
        plan.limits.emplace_back(RLIMIT_FSIZE, policy.max_file_size_bytes);
    }
    if (policy.cpu_time_limit_s > 0) plan.limits.emplace_back(RLIMIT_CPU, policy.cpu_time_limit_s);
    plan.limits.emplace_back(RLIMIT_CORE, 0);
    plan.filter = filter.get();

    if (policy.use_namespaces) {
        plan.namespaces = true;
        plan.private_network = !policy.network_enabled;
        plan.uid_map = "0 " + std::to_string(::geteuid()) + " 1";
        plan.gid_map = "0 " + std::to_string(::getegid()) + " 1";
        for (const auto& path : policy.read_only_paths) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            auto canonical = std::filesystem::canonical(path, ec);
            if (ec) continue;
            plan.read_only.push_back({canonical.string(), locked_mount_flags(canonical.string())});
        }
    }

    auto in_pipe = make_pipe();
    if (!in_pipe) return in_pipe.error();
    auto out_pipe = make_pipe();
    if (!out_pipe) { in_pipe->close_both(); return out_pipe.error(); }
    auto err_pipe = make_pipe();
    if (!err_pipe) { in_pipe->close_both(); out_pipe->close_both(); return err_pipe.error(); }
    auto status_pipe = make_pipe();
    if (!status_pipe) {
        in_pipe->close_both(); out_pipe->close_both(); err_pipe->close_both();
        return status_pipe.error();
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        in_pipe->close_both(); out_pipe->close_both();
        err_pipe->close_both(); status_pipe->close_both();
        return Error{ErrorCode::SandboxSetupFailed, "fork failed: " + std::string(strerror(err))};
    }
    if (pid == 0) {
        run_child(plan, in_pipe->read, out_pipe->write, err_pipe->write, status_pipe->write);
    }

    ::close(in_pipe->read);
    ::close(out_pipe->write);
    ::close(err_pipe->write);
    ::close(status_pipe->write);

    SpawnFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe->read, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe->read);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ::close(in_pipe->write);
        ::close(out_pipe->read);
        ::close(err_pipe->read);
        auto step = static_cast<SpawnStep>(failure.step);
        return Error{ErrorCode::SandboxSetupFailed,
                     std::string("guest setup failed at ") + to_cstring(step) + ": "
                     + strerror(failure.error)};
    }

    logger_.debug("spawned guest pid=" + std::to_string(pid) + " unit=" + unit.id);
    return std::unique_ptr<IGuestProcess>(std::make_unique<ProcessGuest>(
        pid, in_pipe->write, out_pipe->read, err_pipe->read,
        command.stdin_data, command.output_limit_bytes));
}

Result<void> ProcessSubstrate::probe() {
    std::error_code ec;
    auto probe_dir = units_root_ / ".probe";
    std::filesystem::create_directories(probe_dir, ec);
    if (ec) {
        return Error{ErrorCode::Internal, "substrate probe failed: " + ec.message()};
    }
    std::filesystem::remove_all(probe_dir, ec);
    if (ec) {
        return Error{ErrorCode::Internal, "substrate probe failed: " + ec.message()};
    }
    return {};
}

}  // namespace execution_engine
