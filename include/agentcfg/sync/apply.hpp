#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/sync/filesystem.hpp"
#include "agentcfg/sync/types.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace agentcfg::sync {

/**
 * @brief Performs the filesystem mutation for one mapping
 *
 * Link mode replaces whatever sits at the target with a symlink to the
 * source, or leaves an existing link that already points there alone. If the
 * link cannot be created the mapping is copied instead and a warning is
 * recorded. A non-empty directory at the target is only ever removed when
 * allow_non_empty_dir is set; otherwise apply fails with a Filesystem error.
 */
class ApplyEngine {
public:
    using SymlinkCreator = std::function<std::error_code(const std::filesystem::path& source,
                                                         const std::filesystem::path& target,
                                                         bool directory)>;

    explicit ApplyEngine(const FilesystemProbe& probe, SymlinkCreator create_symlink = {});

    Result<void> apply(const ResolvedMapping& mapping,
                       bool allow_non_empty_dir,
                       std::vector<std::string>& warnings) const;

    /**
     * @brief Copy @p target to `<source_root>/backup/<stamp>/<target without leading separators>`
     *
     * An existing backup at that path is kept as is.
     *
     * @param stamp ISO timestamp with ':' and '.' already replaced by '-'
     */
    Result<std::filesystem::path> backup_target(const std::filesystem::path& target,
                                                const std::filesystem::path& source_root,
                                                const std::string& stamp) const;

    /// Recursive copy; nested symlinks are recreated, not followed, and special files are left out.
    Result<void> copy_tree(const std::filesystem::path& source,
                           const std::filesystem::path& target) const;

    /// Build the persisted record for a target that was just applied.
    Result<SyncRecord> snapshot(const ResolvedMapping& mapping) const;

private:
    Result<void> apply_link(const ResolvedMapping& mapping,
                            bool allow_non_empty_dir,
                            std::vector<std::string>& warnings) const;

    Result<void> apply_copy(const ResolvedMapping& mapping, bool allow_non_empty_dir) const;

    Result<void> clear_target(const std::filesystem::path& target, bool allow_non_empty_dir) const;

    Result<void> ensure_parent(const std::filesystem::path& target,
                               std::vector<std::string>* warnings) const;

    const FilesystemProbe& probe_;
    SymlinkCreator create_symlink_;
};

} // namespace agentcfg::sync
