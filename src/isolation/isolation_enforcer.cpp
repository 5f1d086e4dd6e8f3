/**
 * @file isolation_enforcer.cpp
 * @brief IsolationEnforcer implementation.
 */

#include "isolation/isolation_enforcer.hpp"

#include <cctype>
#include <fstream>

namespace execution_engine {

namespace {

Result<void> write_file(const std::filesystem::path& scratch, const SourceFile& file) {
    namespace fs = std::filesystem;
    if (!is_safe_relative_path(file.path)) {
        return Error{ErrorCode::InvalidArgument, "unsafe source path: " + file.path};
    }
    auto target = scratch / file.path;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::SandboxSetupFailed,
                     "cannot create " + target.parent_path().string() + ": " + ec.message()};
    }
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
        if (!out) {
            return Error{ErrorCode::SandboxSetupFailed, "cannot write " + target.string()};
        }
    }
    if (file.executable) {
        fs::permissions(target, fs::perms::owner_exec | fs::perms::group_exec,
                        fs::perm_options::add, ec);
    }
    return {};
}

std::string scratch_name(const RequestId& id) {
    std::string name = "exec-";
    for (char c : id) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        name += safe ? c : '_';
    }
    return name;
}

}  // namespace

IsolationEnforcer::IsolationEnforcer(IsolationConfig config, IWorkspaceService* workspace,
                                     Logger logger)
    : config_(std::move(config)), workspace_(workspace), logger_(std::move(logger)) {}

std::string IsolationEnforcer::entry_file(const RuntimeProfile& runtime,
                                          const ExecutionRequest& request) {
    return request.entry_point.empty() ? runtime.source_file : request.entry_point;
}

SandboxPolicy IsolationEnforcer::build_policy(const RuntimeProfile& runtime,
                                              const ResourceGrant& grant,
                                              const std::filesystem::path& scratch_dir) const {
    SandboxPolicy policy;
    policy.scratch_dir = scratch_dir;
    for (const auto& path : config_.read_only_paths) policy.read_only_paths.emplace_back(path);
    for (const auto& path : runtime.read_only_paths) policy.read_only_paths.emplace_back(path);

    policy.memory_bytes = grant.memory_bytes();
    policy.cpu_millicores = grant.cpu_millicores;
    // CPU seconds the share allows over the whole deadline, plus one second of slack
    uint64_t cpu_ms = static_cast<uint64_t>(grant.timeout_ms) * grant.cpu_millicores / 1000;
    policy.cpu_time_limit_s = static_cast<uint32_t>((cpu_ms + 999) / 1000 + 1);
    policy.disk_bytes = grant.disk_bytes();
    policy.max_processes = grant.max_processes;
    policy.max_file_size_bytes = grant.max_file_size_bytes();

    policy.network_enabled = grant.network_enabled;
    policy.network_allow_list = grant.network_allow_list;

    policy.syscall_filter = config_.syscall_filter;
    policy.extra_syscalls = runtime.extra_syscalls;
    policy.use_namespaces = config_.use_namespaces;
    return policy;
}

Result<void> IsolationEnforcer::check_capabilities(const IIsolationSubstrate& substrate,
                                                   const ResourceGrant& grant) const {
    auto caps = substrate.capabilities();
    if (!caps.resource_limits) {
        return Error{ErrorCode::SandboxSetupFailed,
                     std::string{substrate.name()} + " cannot enforce resource limits"};
    }
    if (config_.syscall_filter && !caps.syscall_filter) {
        return Error{ErrorCode::SandboxSetupFailed,
                     std::string{substrate.name()} + " cannot filter syscalls"};
    }
    if (!grant.network_enabled && !caps.network_deny) {
        return Error{ErrorCode::SandboxSetupFailed,
                     std::string{substrate.name()} + " cannot deny network access"};
    }
    if (grant.network_enabled && !grant.network_allow_list.empty() && !caps.network_allow_list) {
        return Error{ErrorCode::SandboxSetupFailed,
                     std::string{substrate.name()} + " cannot enforce an egress allow-list"};
    }
    if (config_.use_namespaces && !caps.filesystem_isolation) {
        return Error{ErrorCode::SandboxSetupFailed,
                     std::string{substrate.name()} + " cannot isolate the filesystem"};
    }
    return {};
}

Result<uint64_t> IsolationEnforcer::materialize(const std::filesystem::path& scratch,
                                                const RuntimeProfile& runtime,
                                                const ExecutionRequest& request) {
    if (workspace_ && !request.workspace_id.empty()) {
        auto snap = workspace_->snapshot(request.workspace_id);
        if (!snap) return snap.error();
        for (const auto& file : snap->files) {
            auto written = write_file(scratch, file);
            if (!written) return written.error();
        }
    }

    const auto& source = request.source;
    switch (source.kind) {
        case SourceKind::InlineCode: {
            auto written = write_file(scratch, SourceFile{entry_file(runtime, request),
                                                          source.inline_code, true});
            if (!written) return written.error();
            break;
        }
        case SourceKind::FileSet:
            for (const auto& file : source.files) {
                auto written = write_file(scratch, file);
                if (!written) return written.error();
            }
            break;
        case SourceKind::RepositoryRef:
        case SourceKind::ArchiveRef: {
            if (!workspace_) {
                return Error{ErrorCode::NotFound,
                             "no workspace service to resolve " + source.reference};
            }
            auto files = workspace_->fetch_source(source);
            if (!files) return files.error();
            for (const auto& file : *files) {
                auto written = write_file(scratch, file);
                if (!written) return written.error();
            }
            break;
        }
    }
    return directory_size(scratch);
}

Result<std::unique_ptr<Sandbox>> IsolationEnforcer::prepare(IIsolationSubstrate& substrate,
                                                            const UnitInstance& unit,
                                                            const RuntimeProfile& runtime,
                                                            const ResourceGrant& grant,
                                                            const ExecutionRequest& request) {
    namespace fs = std::filesystem;

    auto capable = check_capabilities(substrate, grant);
    if (!capable) return capable.error();

    auto scratch = unit.root / scratch_name(request.request_id);
    std::error_code ec;
    fs::remove_all(scratch, ec);
    fs::create_directories(scratch, ec);
    if (ec) {
        return Error{ErrorCode::SandboxSetupFailed,
                     "cannot create scratch area " + scratch.string() + ": " + ec.message()};
    }

    auto cleanup = [&scratch] {
        std::error_code ignored;
        fs::remove_all(scratch, ignored);
    };

    auto initial = materialize(scratch, runtime, request);
    if (!initial) {
        cleanup();
        return initial.error();
    }
    if (*initial > grant.disk_bytes()) {
        cleanup();
        return Error{ErrorCode::InvalidArgument,
                     "sources (" + std::to_string(*initial) + " bytes) exceed the disk ceiling"};
    }

    auto policy = build_policy(runtime, grant, scratch);
    auto applied = substrate.apply_policy(unit, policy);
    if (!applied) {
        cleanup();
        if (applied.error().code == ErrorCode::SandboxSetupFailed) return applied.error();
        return Error{ErrorCode::SandboxSetupFailed, applied.error().message};
    }

    logger_.debug("sandbox ready: unit=" + unit.id + " request=" + request.request_id
                  + " scratch=" + scratch.string());
    return std::make_unique<Sandbox>(substrate, unit, std::move(policy), *initial,
                                     logger_.for_component("sandbox"));
}

}  // namespace execution_engine
