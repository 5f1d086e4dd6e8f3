/**
 * @file workspace_service.cpp
 * @brief StaticWorkspaceService implementation.
 */

#include "workspace/workspace_service.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace execution_engine {

StaticWorkspaceService::StaticWorkspaceService(std::vector<TierProfile> tiers,
                                               uint64_t max_local_bytes)
    : tiers_(std::move(tiers)), max_local_bytes_(max_local_bytes) {}

std::optional<TierProfile> StaticWorkspaceService::tier_defaults(std::string_view workspace_type) {
    for (const auto& tier : tiers_) {
        if (tier.name == workspace_type) return tier;
    }
    return std::nullopt;
}

Result<WorkspaceSnapshot> StaticWorkspaceService::snapshot(const std::string& workspace_id) {
    std::lock_guard lock(mutex_);
    auto it = snapshots_.find(workspace_id);
    if (it == snapshots_.end()) {
        return WorkspaceSnapshot{workspace_id, {}};
    }
    return it->second;
}

Result<std::vector<SourceFile>> StaticWorkspaceService::fetch_source(const SourcePayload& source) {
    if (source.kind != SourceKind::RepositoryRef && source.kind != SourceKind::ArchiveRef) {
        return Error{ErrorCode::InvalidArgument,
                     "fetch_source called for " + std::string{to_string(source.kind)} + " source"};
    }
    {
        std::lock_guard lock(mutex_);
        auto it = sources_.find(source.reference);
        if (it != sources_.end()) return it->second;
    }

    std::string_view ref = source.reference;
    if (ref.starts_with("file://")) ref.remove_prefix(7);
    if (!ref.empty() && ref.front() == '/') {
        return read_local_directory(std::string{ref});
    }
    return Error{ErrorCode::NotFound, "cannot resolve source reference '" + source.reference + "'"};
}

void StaticWorkspaceService::add_snapshot(WorkspaceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    auto id = snapshot.workspace_id;
    snapshots_[id] = std::move(snapshot);
}

void StaticWorkspaceService::add_source(std::string reference, std::vector<SourceFile> files) {
    std::lock_guard lock(mutex_);
    sources_[std::move(reference)] = std::move(files);
}

Result<std::vector<SourceFile>> StaticWorkspaceService::read_local_directory(
    const std::string& path) const {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return Error{ErrorCode::NotFound, "source directory not found: " + path};
    }

    std::vector<SourceFile> files;
    uint64_t total = 0;
    for (auto it = fs::recursive_directory_iterator(path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        total += it->file_size(ec);
        if (total > max_local_bytes_) {
            return Error{ErrorCode::InvalidArgument, "source directory too large: " + path};
        }

        std::ifstream in(it->path(), std::ios::binary);
        std::ostringstream content;
        content << in.rdbuf();

        auto perms = it->status(ec).permissions();
        files.push_back(SourceFile{
            fs::relative(it->path(), path, ec).generic_string(),
            content.str(),
            (perms & fs::perms::owner_exec) != fs::perms::none});
    }
    if (ec) {
        return Error{ErrorCode::Internal, "cannot read " + path + ": " + ec.message()};
    }
    return files;
}

}  // namespace execution_engine
