#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/sync/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace agentcfg::sync {

inline constexpr const char* kStateFileName = ".sync-state.json";

/**
 * @brief Owns `<root>/.sync-state.json`
 *
 * The snapshot is JSON with the field names `version, updatedAt, mode,
 * projectRoot, files`; each record carries `path, source, agent, mode, size,
 * mtimeMs, hash, linkTarget` with null for the unused identity field.
 */
class StateStore {
public:
    explicit StateStore(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return root_; }
    std::filesystem::path state_path() const;

    /// No file yields std::nullopt; unreadable JSON or a wrong shape is a Validation error.
    Result<std::optional<SyncState>> load() const;

    Result<void> save(const SyncState& state) const;

    static Result<SyncState> parse(const std::string& text, const std::string& origin);
    static std::string serialize(const SyncState& state);

    /**
     * @brief Union of @p previous and @p fresh; fresh records replace same-key ones
     *
     * Records are never dropped, even for mappings no longer configured.
     */
    static SyncState merge(const std::optional<SyncState>& previous, SyncState fresh);

private:
    std::filesystem::path root_;
};

/// UTC ISO-8601 with milliseconds, e.g. 2026-01-02T03:04:05.678Z.
std::string iso_timestamp(std::chrono::system_clock::time_point when);

/// iso_timestamp with ':' and '.' replaced by '-', used as a backup directory name.
std::string backup_stamp(std::chrono::system_clock::time_point when);

} // namespace agentcfg::sync
