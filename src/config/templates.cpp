#include "agentcfg/config/templates.hpp"

namespace agentcfg::config {
namespace {

ScopeConfig scope(std::string root, std::vector<MappingEntry> files) {
    return ScopeConfig{std::move(root), std::move(files)};
}

} // namespace

AgentConfigFile default_config() {
    AgentConfigFile config;
    config.version = 1;
    config.defaults.mode = SyncMode::Auto;
    config.defaults.profile = "default";
    config.defaults.source_root = "${AGENTCONFIG_HOME:-~/.agentconfig}";

    AgentConfig claude;
    claude.display_name = "Claude Code";
    claude.global = scope("~/.claude", {
        {"agent.md", "CLAUDE.md"},
        {"claude/settings.json", "settings.json"},
        {"claude/agents/", "agents/"},
        {"claude/commands/", "commands/"},
        {"skills/", "skills/"},
    });
    claude.project = scope("<project-root>", {
        {"agent.md", "CLAUDE.md"},
        {"claude/settings.json", ".claude/settings.json"},
        {"claude/agents/", ".claude/agents/"},
        {"claude/commands/", ".claude/commands/"},
        {"rules/", ".claude/rules/"},
        {"skills/", ".claude/skills/"},
    });

    AgentConfig codex;
    codex.display_name = "Codex CLI";
    codex.global = scope("${CODEX_HOME:-~/.codex}", {
        {"agent.md", "AGENTS.md"},
        {"skills/", "../.agents/skills/"},
    });
    codex.project = scope("<project-root>", {
        {"agent.md", "AGENTS.md"},
        {"skills/", ".agents/skills/"},
    });

    AgentConfig cursor;
    cursor.display_name = "Cursor";
    cursor.global = scope("~/.cursor", {
        {"cursor/hooks.json", "hooks.json"},
        {"cursor/hooks/", "hooks/"},
        {"skills/", "skills/"},
    });
    cursor.project = scope("<project-root>", {
        {"agent.md", "AGENTS.md"},
        {"cursor/hooks.json", ".cursor/hooks.json"},
        {"cursor/hooks/", ".cursor/hooks/"},
        {"rules/", ".cursor/rules/"},
        {"skills/", ".cursor/skills/"},
    });

    AgentConfig opencode;
    opencode.display_name = "OpenCode";
    opencode.global = scope("~/.config/opencode", {
        {"agent.md", "AGENTS.md"},
        {"agents/", "agents/"},
        {"commands/", "commands/"},
        {"rules/", "rules/"},
        {"skills/", "skills/"},
    });
    opencode.project = scope("<project-root>", {
        {"agent.md", "AGENTS.md"},
        {"agents/", ".opencode/agents/"},
        {"commands/", ".opencode/commands/"},
        {"rules/", ".opencode/rules/"},
        {"skills/", ".opencode/skills/"},
    });

    config.agents.emplace_back("claude", std::move(claude));
    config.agents.emplace_back("codex", std::move(codex));
    config.agents.emplace_back("cursor", std::move(cursor));
    config.agents.emplace_back("opencode", std::move(opencode));

    config.profiles.emplace();
    config.profiles->emplace_back("default", ProfileConfig{std::vector<MappingEntry>{}});

    return config;
}

} // namespace agentcfg::config
