#include "agentcfg/sync/drift_detector.hpp"
#include "agentcfg/sync/state_store.hpp"

namespace agentcfg::sync {
namespace {

StatusEntry make_entry(const SyncRecord& record, TargetStatus status, const char* reason = nullptr) {
    StatusEntry entry;
    entry.path = record.path;
    entry.status = status;
    if (reason != nullptr) {
        entry.reason = reason;
    }
    return entry;
}

} // namespace

Result<std::vector<StatusEntry>> DriftDetector::get_status(const std::filesystem::path& state_root) const {
    StateStore store(state_root);
    auto loaded = store.load();
    if (loaded.is_error()) {
        return Err<std::vector<StatusEntry>>(loaded.error());
    }

    std::vector<StatusEntry> results;
    if (!loaded.value()) {
        return Ok(std::move(results));
    }

    const auto& state = *loaded.value();
    results.reserve(state.files.size());
    for (const auto& [path, record] : state.files) {
        results.push_back(check(record));
    }
    return Ok(std::move(results));
}

StatusEntry DriftDetector::check(const SyncRecord& record) const {
    const auto info = probe_.inspect(record.path);
    if (info.kind == NodeKind::Absent) {
        return make_entry(record, TargetStatus::Missing, "target missing");
    }

    // Records written while mode was still "auto" are judged by what is there now.
    auto mode = record.mode;
    if (mode == SyncMode::Auto) {
        mode = info.kind == NodeKind::Symlink ? SyncMode::Link : SyncMode::Copy;
    }

    if (mode == SyncMode::Link) {
        if (info.kind != NodeKind::Symlink || !record.link_target || info.link_target != record.link_target) {
            return make_entry(record, TargetStatus::Drifted, "link target changed");
        }
        return make_entry(record, TargetStatus::Ok);
    }

    if (!record.hash) {
        return make_entry(record, TargetStatus::Drifted, "content changed");
    }
    const auto current = probe_.content_hash(record.path);
    if (current.is_error() || current.value() != *record.hash) {
        return make_entry(record, TargetStatus::Drifted, "content changed");
    }
    return make_entry(record, TargetStatus::Ok);
}

} // namespace agentcfg::sync
