#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentcfg::config {

enum class SyncMode {
    Auto,
    Link,
    Copy
};

enum class Scope {
    Global,
    Project
};

const char* to_string(SyncMode mode) noexcept;
const char* to_string(Scope scope) noexcept;
std::optional<SyncMode> parse_sync_mode(const std::string& text);
std::optional<Scope> parse_scope(const std::string& text);

/**
 * @brief One declared source -> target pairing
 *
 * A trailing separator on source marks a directory mapping.
 */
struct MappingEntry {
    std::string source;
    std::string target;
};

/**
 * @brief Target root of one agent in one scope
 *
 * root may contain `<project-root>`, `~` and `${VAR}` / `${VAR:-default}`.
 */
struct ScopeConfig {
    std::string root;
    std::vector<MappingEntry> files;
};

struct AgentConfig {
    std::string display_name;
    std::optional<ScopeConfig> global;
    std::optional<ScopeConfig> project;

    const std::optional<ScopeConfig>& scope(Scope which) const noexcept {
        return which == Scope::Global ? global : project;
    }
};

struct ProfileConfig {
    std::optional<std::vector<MappingEntry>> files;
};

struct Defaults {
    SyncMode mode = SyncMode::Auto;
    std::string profile = "default";
    std::string source_root;
};

/**
 * @brief Validated contents of agentconfig.yml
 *
 * Agents and profiles keep their declaration order; sync runs walk agents in
 * that order.
 */
struct AgentConfigFile {
    int version = 1;
    Defaults defaults;
    std::vector<std::pair<std::string, AgentConfig>> agents;
    std::optional<std::vector<std::pair<std::string, ProfileConfig>>> profiles;

    const AgentConfig* find_agent(const std::string& id) const;
    AgentConfig* find_agent(const std::string& id);
    const ProfileConfig* find_profile(const std::string& name) const;
};

} // namespace agentcfg::config
