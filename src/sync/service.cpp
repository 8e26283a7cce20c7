#include "agentcfg/sync/service.hpp"
#include "agentcfg/sync/conflict.hpp"
#include "agentcfg/sync/mapping_resolver.hpp"
#include "agentcfg/sync/state_store.hpp"

#include <chrono>
#include <optional>
#include <set>

namespace agentcfg::sync {
namespace fs = std::filesystem;

SyncService::SyncService(paths::PathContext context,
                         ConflictPrompt prompt,
                         ApplyEngine::SymlinkCreator create_symlink)
    : context_(std::move(context)),
      prompt_(std::move(prompt)),
      apply_engine_(probe_, std::move(create_symlink)),
      drift_detector_(probe_) {}

SyncMode SyncService::resolve_sync_mode(SyncMode requested) const {
    if (requested != SyncMode::Auto) {
        return requested;
    }
    return probe_.can_create_symlinks(context_.temp_dir) ? SyncMode::Link : SyncMode::Copy;
}

Result<SyncResult> SyncService::sync_configs(const SyncOptions& options) {
    if (options.config == nullptr) {
        return Err<SyncResult>(ErrorKind::Validation, "No configuration supplied");
    }

    const auto started_at = std::chrono::system_clock::now();
    const auto mode = resolve_sync_mode(options.link_mode);

    MappingRequest request;
    request.config = options.config;
    request.source_root = options.source_root;
    request.scope = options.scope;
    request.project_root = options.project_root;
    request.mode = mode;
    request.agent_filter = options.agent_filter;
    request.profile = options.profile;

    MappingResolver resolver(context_);
    auto planned = resolver.resolve(request);
    if (planned.is_error()) {
        return Err<SyncResult>(planned.error());
    }

    StateStore store(options.source_root);
    auto previous = store.load();
    if (previous.is_error()) {
        return Err<SyncResult>(previous.error());
    }

    SyncResult result;
    result.planned = std::move(planned.value());

    ConflictEngine conflicts(probe_, previous.value(), options.conflict_policy,
                             options.force, options.strict, prompt_);
    const auto stamp = backup_stamp(started_at);
    // Several mappings may share one target; only the first sees the operator's bytes.
    std::set<std::string> backed_up;

    for (const auto& mapping : result.planned) {
        auto resolution = conflicts.resolve(mapping);
        if (resolution.is_error()) {
            return Err<SyncResult>(resolution.error());
        }
        const auto& decision = resolution.value();

        if (decision.action == ConflictResolution::Action::Skip) {
            result.warnings.push_back(decision.warning);
            result.skipped.push_back(mapping);
            continue;
        }

        if (options.dry_run) {
            continue;
        }

        if (decision.backup_first && backed_up.insert(mapping.target.string()).second) {
            auto backup = apply_engine_.backup_target(mapping.target, options.source_root, stamp);
            if (backup.is_error()) {
                return Err<SyncResult>(backup.error());
            }
        }

        auto applied = apply_engine_.apply(mapping, decision.allow_non_empty_dir, result.warnings);
        if (applied.is_error()) {
            return Err<SyncResult>(applied.error());
        }
        result.updated.push_back(mapping);
    }

    if (options.dry_run) {
        return Ok(std::move(result));
    }

    SyncState fresh;
    fresh.version = 1;
    fresh.updated_at = iso_timestamp(std::chrono::system_clock::now());
    fresh.mode = options.scope;
    if (options.project_root) {
        fresh.project_root = options.project_root->string();
    }
    for (const auto& mapping : result.updated) {
        auto record = apply_engine_.snapshot(mapping);
        if (record.is_error()) {
            return Err<SyncResult>(record.error());
        }
        auto key = record.value().path;
        fresh.files.insert_or_assign(std::move(key), std::move(record.value()));
    }

    if (auto saved = store.save(StateStore::merge(previous.value(), std::move(fresh))); saved.is_error()) {
        return Err<SyncResult>(saved.error());
    }
    return Ok(std::move(result));
}

Result<std::vector<StatusEntry>> SyncService::get_status(const fs::path& state_root) const {
    return drift_detector_.get_status(state_root);
}

} // namespace agentcfg::sync
