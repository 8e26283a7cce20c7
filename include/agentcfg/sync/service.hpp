#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/paths/resolver.hpp"
#include "agentcfg/sync/apply.hpp"
#include "agentcfg/sync/drift_detector.hpp"
#include "agentcfg/sync/filesystem.hpp"
#include "agentcfg/sync/types.hpp"

#include <filesystem>
#include <vector>

namespace agentcfg::sync {

/**
 * @brief The two entry points the command layer needs
 *
 * sync_configs resolves mappings, walks them in order through the conflict
 * engine and the apply engine, then merges fresh records into the snapshot
 * under the source root. Nothing is written in a dry run. get_status reports
 * drift for every recorded target.
 */
class SyncService {
public:
    SyncService(paths::PathContext context,
                ConflictPrompt prompt = {},
                ApplyEngine::SymlinkCreator create_symlink = {});

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;
    SyncService(SyncService&&) = delete;
    SyncService& operator=(SyncService&&) = delete;

    Result<SyncResult> sync_configs(const SyncOptions& options);

    Result<std::vector<StatusEntry>> get_status(const std::filesystem::path& state_root) const;

    /// Auto becomes Link when a scratch symlink can be made, Copy otherwise.
    SyncMode resolve_sync_mode(SyncMode requested) const;

    const paths::PathContext& context() const noexcept { return context_; }

private:
    paths::PathContext context_;
    ConflictPrompt prompt_;
    FilesystemProbe probe_;
    ApplyEngine apply_engine_;
    DriftDetector drift_detector_;
};

} // namespace agentcfg::sync
