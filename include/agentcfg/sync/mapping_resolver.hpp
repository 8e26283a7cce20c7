#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/paths/resolver.hpp"
#include "agentcfg/sync/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg::sync {

inline constexpr const char* kProjectRootPlaceholder = "<project-root>";

struct MappingRequest {
    const AgentConfigFile* config = nullptr;
    std::filesystem::path source_root;
    Scope scope = Scope::Global;
    std::optional<std::filesystem::path> project_root;
    SyncMode mode = SyncMode::Link; ///< Must already be Link or Copy
    std::optional<std::string> agent_filter;
    std::optional<std::string> profile; ///< Falls back to defaults.profile
};

/**
 * @brief Flatten agents x scope x profile into concrete mappings
 *
 * Agents are visited in declaration order and agents without the requested
 * scope are skipped. Every agent gets its scope files followed by the active
 * profile's files. Sources resolve against source_root, targets against the
 * expanded scope root.
 */
class MappingResolver {
public:
    explicit MappingResolver(const paths::PathContext& context) : context_(context) {}

    Result<std::vector<ResolvedMapping>> resolve(const MappingRequest& request) const;

    /// Scope root after `<project-root>` substitution and placeholder expansion.
    Result<std::filesystem::path> resolve_root(const config::ScopeConfig& scope_config,
                                               Scope scope,
                                               const std::optional<std::filesystem::path>& project_root) const;

    static const std::vector<config::MappingEntry>& profile_files(const AgentConfigFile& config,
                                                                  const std::string& profile);

private:
    const paths::PathContext& context_;
};

} // namespace agentcfg::sync
