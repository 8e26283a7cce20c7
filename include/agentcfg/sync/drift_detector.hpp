#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/sync/filesystem.hpp"
#include "agentcfg/sync/types.hpp"

#include <filesystem>
#include <vector>

namespace agentcfg::sync {

/**
 * @brief Compares recorded targets against what is on disk now
 *
 * Reads only the persisted snapshot and the filesystem; the configuration is
 * not consulted, so records for mappings removed from the config are still
 * reported.
 */
class DriftDetector {
public:
    explicit DriftDetector(const FilesystemProbe& probe) : probe_(probe) {}

    /// Status of every record under @p state_root, ordered by target path.
    Result<std::vector<StatusEntry>> get_status(const std::filesystem::path& state_root) const;

    StatusEntry check(const SyncRecord& record) const;

private:
    const FilesystemProbe& probe_;
};

} // namespace agentcfg::sync
