#include "agentcfg/sync/types.hpp"

namespace agentcfg::sync {

const char* to_string(ConflictPolicy policy) noexcept {
    switch (policy) {
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Backup: return "backup";
        case ConflictPolicy::Cancel: return "cancel";
        default: return "skip";
    }
}

std::optional<ConflictPolicy> parse_conflict_policy(const std::string& text) {
    if (text == "overwrite") return ConflictPolicy::Overwrite;
    if (text == "backup") return ConflictPolicy::Backup;
    if (text == "skip") return ConflictPolicy::Skip;
    if (text == "cancel") return ConflictPolicy::Cancel;
    return std::nullopt;
}

const char* to_string(TargetStatus status) noexcept {
    switch (status) {
        case TargetStatus::Drifted: return "drifted";
        case TargetStatus::Missing: return "missing";
        default: return "ok";
    }
}

} // namespace agentcfg::sync
