#pragma once

#include "agentcfg/config/types.hpp"
#include "agentcfg/core/result.hpp"
#include "agentcfg/sync/types.hpp"

#include <filesystem>
#include <optional>

namespace agentcfg::config {

struct InitOptions {
    std::optional<AgentConfigFile> config; ///< Defaults to default_config()
    std::optional<sync::ConflictPolicy> conflict_policy;
    bool force = false;
};

struct InitResult {
    enum class Action {
        Created,
        Overwritten,
        Skipped
    };

    Action action = Action::Created;
    std::filesystem::path config_path;
};

const char* to_string(InitResult::Action action) noexcept;

/**
 * @brief Write agentconfig.yml and lay out the source tree it refers to
 *
 * An existing file is only replaced under an overwrite or backup policy
 * (force counts as overwrite); no policy, or cancel, is a Conflict error.
 */
Result<InitResult> init_config(const std::filesystem::path& source_root, const InitOptions& options = {});

/// Create every directory-mapping source and the parent of every file-mapping source.
Result<void> ensure_source_directories(const AgentConfigFile& config, const std::filesystem::path& source_root);

} // namespace agentcfg::config
