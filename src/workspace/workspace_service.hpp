/**
 * @file workspace_service.hpp
 * @brief Narrow interface to the external workspace service.
 *
 * The engine asks it for tier defaults, for a workspace's file snapshot
 * and for the contents of repository/archive source references.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "request/execution_request.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execution_engine {

struct WorkspaceSnapshot {
    std::string workspace_id;
    std::vector<SourceFile> files;
};

class IWorkspaceService {
public:
    virtual ~IWorkspaceService() = default;

    /// Defaults for a workspace type, or nullopt to fall back to configuration.
    virtual std::optional<TierProfile> tier_defaults(std::string_view workspace_type) = 0;

    /// Files to seed the scratch area with. Unknown workspaces yield an empty snapshot.
    virtual Result<WorkspaceSnapshot> snapshot(const std::string& workspace_id) = 0;

    /// Resolve a repository or archive reference into files.
    virtual Result<std::vector<SourceFile>> fetch_source(const SourcePayload& source) = 0;
};

/**
 * @brief Default service: configured tiers, registered snapshots and sources,
 *        plus local directories ("file://" or absolute path) as references.
 */
class StaticWorkspaceService final : public IWorkspaceService {
public:
    explicit StaticWorkspaceService(std::vector<TierProfile> tiers,
                                    uint64_t max_local_bytes = 64ULL * 1024 * 1024);

    std::optional<TierProfile> tier_defaults(std::string_view workspace_type) override;
    Result<WorkspaceSnapshot> snapshot(const std::string& workspace_id) override;
    Result<std::vector<SourceFile>> fetch_source(const SourcePayload& source) override;

    void add_snapshot(WorkspaceSnapshot snapshot);
    void add_source(std::string reference, std::vector<SourceFile> files);

private:
    Result<std::vector<SourceFile>> read_local_directory(const std::string& path) const;

    std::vector<TierProfile> tiers_;
    uint64_t max_local_bytes_;

    std::mutex mutex_;
    std::map<std::string, WorkspaceSnapshot> snapshots_;
    std::map<std::string, std::vector<SourceFile>> sources_;
};

}  // namespace execution_engine
