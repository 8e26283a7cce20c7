#pragma once

#include "agentcfg/config/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg::sync {

using config::AgentConfigFile;
using config::Scope;
using config::SyncMode;

/**
 * @brief One concrete source -> target operation for a single run
 *
 * mode is always Link or Copy here; Auto is resolved before mappings are built.
 */
struct ResolvedMapping {
    std::string agent;
    std::filesystem::path source;
    std::filesystem::path target;
    SyncMode mode = SyncMode::Link;
};

/**
 * @brief Persisted record of a target this tool wrote
 *
 * Exactly one of hash / link_target is meaningful: hash for Copy, link_target
 * for Link. Auto only appears in records written by older versions.
 */
struct SyncRecord {
    std::string path;
    std::string source;
    std::string agent;
    SyncMode mode = SyncMode::Copy;
    std::uint64_t size = 0;
    double mtime_ms = 0;
    std::optional<std::string> hash;
    std::optional<std::string> link_target;
};

/**
 * @brief Snapshot stored under the source root, keyed by absolute target path
 */
struct SyncState {
    int version = 1;
    std::string updated_at;
    Scope mode = Scope::Global;
    std::optional<std::string> project_root;
    std::map<std::string, SyncRecord> files;

    bool manages(const std::filesystem::path& target) const {
        return files.find(target.string()) != files.end();
    }
};

enum class ConflictPolicy {
    Overwrite,
    Backup,
    Skip,
    Cancel
};

const char* to_string(ConflictPolicy policy) noexcept;
std::optional<ConflictPolicy> parse_conflict_policy(const std::string& text);

/**
 * @brief Operator answer for one unmanaged target
 */
struct ConflictChoice {
    ConflictPolicy action = ConflictPolicy::Skip;
    bool apply_to_all = false;
};

/// Synchronous decision source; an empty function means "cannot ask".
using ConflictPrompt = std::function<ConflictChoice(const std::filesystem::path& target)>;

struct SyncOptions {
    const AgentConfigFile* config = nullptr;
    std::filesystem::path source_root;
    Scope scope = Scope::Global;
    std::optional<std::filesystem::path> project_root;
    SyncMode link_mode = SyncMode::Auto;
    bool dry_run = false;
    bool force = false;
    std::optional<ConflictPolicy> conflict_policy;
    std::optional<std::string> agent_filter;
    std::optional<std::string> profile; ///< Overrides defaults.profile when set
    bool strict = false;
};

struct SyncResult {
    std::vector<ResolvedMapping> planned;
    std::vector<ResolvedMapping> updated;
    std::vector<ResolvedMapping> skipped;
    std::vector<std::string> warnings;
};

enum class TargetStatus {
    Ok,
    Drifted,
    Missing
};

const char* to_string(TargetStatus status) noexcept;

struct StatusEntry {
    std::string path;
    TargetStatus status = TargetStatus::Ok;
    std::optional<std::string> reason;
};

} // namespace agentcfg::sync
