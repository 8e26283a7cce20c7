#include "agentcfg/sync/mapping_resolver.hpp"

namespace agentcfg::sync {
namespace fs = std::filesystem;

namespace {

std::string replace_all(std::string text, const std::string& needle, const std::string& replacement) {
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
    return text;
}

} // namespace

Result<std::vector<ResolvedMapping>> MappingResolver::resolve(const MappingRequest& request) const {
    if (request.config == nullptr) {
        return Err<std::vector<ResolvedMapping>>(ErrorKind::Validation, "No configuration supplied");
    }
    if (request.mode == SyncMode::Auto) {
        return Err<std::vector<ResolvedMapping>>(ErrorKind::Validation,
                                                 "Sync mode must be resolved to link or copy before mapping");
    }
    if (request.scope == Scope::Project && !request.project_root) {
        return Err<std::vector<ResolvedMapping>>(ErrorKind::Validation,
                                                 "Project root is required for project mode");
    }

    const auto& config = *request.config;
    const auto& extra = profile_files(config, request.profile.value_or(config.defaults.profile));

    std::vector<ResolvedMapping> mappings;
    for (const auto& item : config.agents) {
        const auto& agent_id = item.first;
        const auto& agent = item.second;
        if (request.agent_filter && *request.agent_filter != agent_id) {
            continue;
        }
        const auto& scope_config = agent.scope(request.scope);
        if (!scope_config) {
            continue;
        }

        auto root = resolve_root(*scope_config, request.scope, request.project_root);
        if (root.is_error()) {
            return Err<std::vector<ResolvedMapping>>(root.error());
        }

        auto append = [&](const config::MappingEntry& entry) {
            mappings.push_back(ResolvedMapping{
                agent_id,
                paths::resolve_from_root(request.source_root, entry.source),
                paths::resolve_from_root(root.value(), entry.target),
                request.mode,
            });
        };
        for (const auto& entry : scope_config->files) {
            append(entry);
        }
        for (const auto& entry : extra) {
            append(entry);
        }
    }

    return Ok(std::move(mappings));
}

Result<fs::path> MappingResolver::resolve_root(const config::ScopeConfig& scope_config,
                                               Scope scope,
                                               const std::optional<fs::path>& project_root) const {
    std::string root = scope_config.root;
    if (scope == Scope::Project) {
        if (!project_root) {
            return Err<fs::path>(ErrorKind::Validation, "Project root is required for project mode");
        }
        root = replace_all(root, kProjectRootPlaceholder, project_root->string());
    }
    return Ok(paths::resolve_absolute(root, context_));
}

const std::vector<config::MappingEntry>& MappingResolver::profile_files(const AgentConfigFile& config,
                                                                        const std::string& profile) {
    static const std::vector<config::MappingEntry> kNone;
    const auto* selected = config.find_profile(profile);
    if (selected == nullptr || !selected->files) {
        return kNone;
    }
    return *selected->files;
}

} // namespace agentcfg::sync
