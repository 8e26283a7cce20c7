#pragma once

#include "agentcfg/config/types.hpp"
#include "agentcfg/core/result.hpp"

#include <filesystem>
#include <string>

namespace agentcfg::config {

inline constexpr const char* kConfigFileName = "agentconfig.yml";

std::filesystem::path config_path(const std::filesystem::path& source_root);

/**
 * @brief Parse and validate YAML text in one step
 *
 * Either a fully typed configuration or a Validation error naming @p origin
 * and, for syntax errors, the line and column.
 */
Result<AgentConfigFile> parse_config(const std::string& text, const std::string& origin);

std::string serialize_config(const AgentConfigFile& config);

/// Load `<source_root>/agentconfig.yml`; a missing file is a Validation error.
Result<AgentConfigFile> read_config(const std::filesystem::path& source_root);

Result<void> write_config(const std::filesystem::path& source_root, const AgentConfigFile& config);

} // namespace agentcfg::config
