#include "agentcfg/config/types.hpp"

namespace agentcfg::config {

const char* to_string(SyncMode mode) noexcept {
    switch (mode) {
        case SyncMode::Link: return "link";
        case SyncMode::Copy: return "copy";
        default: return "auto";
    }
}

const char* to_string(Scope scope) noexcept {
    return scope == Scope::Project ? "project" : "global";
}

std::optional<SyncMode> parse_sync_mode(const std::string& text) {
    if (text == "auto") return SyncMode::Auto;
    if (text == "link") return SyncMode::Link;
    if (text == "copy") return SyncMode::Copy;
    return std::nullopt;
}

std::optional<Scope> parse_scope(const std::string& text) {
    if (text == "global") return Scope::Global;
    if (text == "project") return Scope::Project;
    return std::nullopt;
}

const AgentConfig* AgentConfigFile::find_agent(const std::string& id) const {
    for (const auto& [agent_id, agent] : agents) {
        if (agent_id == id) {
            return &agent;
        }
    }
    return nullptr;
}

AgentConfig* AgentConfigFile::find_agent(const std::string& id) {
    for (auto& [agent_id, agent] : agents) {
        if (agent_id == id) {
            return &agent;
        }
    }
    return nullptr;
}

const ProfileConfig* AgentConfigFile::find_profile(const std::string& name) const {
    if (!profiles) {
        return nullptr;
    }
    for (const auto& [profile_name, profile] : *profiles) {
        if (profile_name == name) {
            return &profile;
        }
    }
    return nullptr;
}

} // namespace agentcfg::config
