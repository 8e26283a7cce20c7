#include "agentcfg/sync/conflict.hpp"

namespace agentcfg::sync {

ConflictEngine::ConflictEngine(const FilesystemProbe& probe,
                               const std::optional<SyncState>& previous,
                               std::optional<ConflictPolicy> policy,
                               bool force,
                               bool strict,
                               ConflictPrompt prompt)
    : probe_(probe),
      previous_(previous),
      policy_(policy),
      force_(force),
      strict_(strict),
      prompt_(std::move(prompt)) {
    if (force_ && !policy_) {
        policy_ = ConflictPolicy::Overwrite;
    }
}

TargetClass ConflictEngine::classify(const ResolvedMapping& mapping) const {
    if (previous_ && previous_->manages(mapping.target)) {
        return TargetClass::Managed;
    }
    return probe_.exists(mapping.target) ? TargetClass::Unmanaged : TargetClass::Absent;
}

Result<ConflictResolution> ConflictEngine::resolve(const ResolvedMapping& mapping) {
    ConflictResolution resolution;
    resolution.target_class = classify(mapping);
    resolution.allow_non_empty_dir =
        force_ || policy_allows_overwrite() || resolution.target_class == TargetClass::Managed;

    if (!probe_.exists(mapping.source)) {
        if (strict_) {
            return Err<ConflictResolution>(ErrorKind::Validation, "Missing source: " + mapping.source.string());
        }
        resolution.action = ConflictResolution::Action::Skip;
        resolution.warning = "Skipping missing source: " + mapping.source.string();
        return Ok(std::move(resolution));
    }

    if (resolution.target_class != TargetClass::Unmanaged || force_) {
        return Ok(std::move(resolution));
    }

    switch (decide(mapping.target)) {
        case ConflictPolicy::Cancel:
            return Err<ConflictResolution>(ErrorKind::Conflict, "Sync cancelled");
        case ConflictPolicy::Skip:
            resolution.action = ConflictResolution::Action::Skip;
            resolution.warning = "Skipping unmanaged target: " + mapping.target.string();
            break;
        case ConflictPolicy::Backup:
            resolution.backup_first = true;
            resolution.allow_non_empty_dir = true;
            break;
        case ConflictPolicy::Overwrite:
            resolution.allow_non_empty_dir = true;
            break;
    }
    return Ok(std::move(resolution));
}

ConflictPolicy ConflictEngine::decide(const std::filesystem::path& target) {
    if (policy_) {
        return *policy_;
    }

    if (!can_ask_ || !prompt_) {
        policy_ = ConflictPolicy::Skip;
        return *policy_;
    }

    const auto choice = prompt_(target);
    if (choice.apply_to_all) {
        policy_ = choice.action;
        can_ask_ = false;
    }
    return choice.action;
}

bool ConflictEngine::policy_allows_overwrite() const noexcept {
    return policy_ == ConflictPolicy::Overwrite || policy_ == ConflictPolicy::Backup;
}

} // namespace agentcfg::sync
