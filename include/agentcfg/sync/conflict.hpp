#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/sync/filesystem.hpp"
#include "agentcfg/sync/types.hpp"

#include <optional>
#include <string>

namespace agentcfg::sync {

enum class TargetClass {
    Absent,
    Managed,
    Unmanaged
};

/**
 * @brief What the run should do with one mapping
 */
struct ConflictResolution {
    enum class Action {
        Apply,
        Skip
    };

    Action action = Action::Apply;
    TargetClass target_class = TargetClass::Absent;
    bool backup_first = false;
    bool allow_non_empty_dir = false; ///< Directory at target may be removed recursively
    std::string warning;              ///< Set when action == Skip
};

/**
 * @brief Per-run conflict state machine
 *
 * The policy starts unset unless supplied (force counts as overwrite). The
 * first unmanaged conflict in a run that cannot prompt fixes the policy to
 * skip for the rest of the run; an interactive "apply to all" fixes it to the
 * chosen action. Cancel is reported as a Conflict error and nothing already
 * applied is undone.
 */
class ConflictEngine {
public:
    ConflictEngine(const FilesystemProbe& probe,
                   const std::optional<SyncState>& previous,
                   std::optional<ConflictPolicy> policy,
                   bool force,
                   bool strict,
                   ConflictPrompt prompt = {});

    TargetClass classify(const ResolvedMapping& mapping) const;

    Result<ConflictResolution> resolve(const ResolvedMapping& mapping);

    /// Policy in force for the remaining conflicts, if one has been fixed.
    std::optional<ConflictPolicy> policy() const noexcept { return policy_; }

private:
    ConflictPolicy decide(const std::filesystem::path& target);

    bool policy_allows_overwrite() const noexcept;

    const FilesystemProbe& probe_;
    const std::optional<SyncState>& previous_;
    std::optional<ConflictPolicy> policy_;
    bool force_ = false;
    bool strict_ = false;
    bool can_ask_ = true;
    ConflictPrompt prompt_;
};

} // namespace agentcfg::sync
