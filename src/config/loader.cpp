#include "agentcfg/config/loader.hpp"
#include "agentcfg/config/config_yaml.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace agentcfg::config {
namespace fs = std::filesystem;

namespace {

bool is_string(const YAML::Node& node) {
    return node && node.IsScalar();
}

Result<std::vector<MappingEntry>> parse_files(const YAML::Node& node, const std::string& where) {
    if (!node || !node.IsSequence()) {
        return Err<std::vector<MappingEntry>>(ErrorKind::Validation, where + ".files must be a list");
    }
    std::vector<MappingEntry> files;
    files.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        MappingEntry entry;
        if (!YAML::convert<MappingEntry>::decode(node[i], entry)) {
            return Err<std::vector<MappingEntry>>(
                ErrorKind::Validation,
                where + ".files[" + std::to_string(i) + "] needs string source and target");
        }
        files.push_back(std::move(entry));
    }
    return Ok(std::move(files));
}

Result<ScopeConfig> parse_scope_config(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return Err<ScopeConfig>(ErrorKind::Validation, where + " must be a mapping");
    }
    if (!is_string(node["root"])) {
        return Err<ScopeConfig>(ErrorKind::Validation, where + ".root must be a string");
    }
    auto files = parse_files(node["files"], where);
    if (files.is_error()) {
        return Err<ScopeConfig>(files.error());
    }
    return Ok(ScopeConfig{node["root"].as<std::string>(), std::move(files.value())});
}

Result<AgentConfig> parse_agent(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return Err<AgentConfig>(ErrorKind::Validation, where + " must be a mapping");
    }
    if (!is_string(node["displayName"])) {
        return Err<AgentConfig>(ErrorKind::Validation, where + ".displayName must be a string");
    }

    AgentConfig agent;
    agent.display_name = node["displayName"].as<std::string>();

    for (const auto scope : {Scope::Global, Scope::Project}) {
        const auto key = to_string(scope);
        const auto scope_node = node[key];
        if (!scope_node || scope_node.IsNull()) {
            continue;
        }
        auto parsed = parse_scope_config(scope_node, where + "." + key);
        if (parsed.is_error()) {
            return Err<AgentConfig>(parsed.error());
        }
        (scope == Scope::Global ? agent.global : agent.project) = std::move(parsed.value());
    }
    return Ok(std::move(agent));
}

Result<Defaults> parse_defaults(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return Err<Defaults>(ErrorKind::Validation, "defaults must be a mapping");
    }
    Defaults defaults;
    const auto mode = is_string(node["mode"]) ? parse_sync_mode(node["mode"].as<std::string>()) : std::nullopt;
    if (!mode) {
        return Err<Defaults>(ErrorKind::Validation, "defaults.mode must be one of auto, link, copy");
    }
    defaults.mode = *mode;
    if (!is_string(node["profile"])) {
        return Err<Defaults>(ErrorKind::Validation, "defaults.profile must be a string");
    }
    defaults.profile = node["profile"].as<std::string>();
    if (!is_string(node["sourceRoot"])) {
        return Err<Defaults>(ErrorKind::Validation, "defaults.sourceRoot must be a string");
    }
    defaults.source_root = node["sourceRoot"].as<std::string>();
    return Ok(std::move(defaults));
}

Result<AgentConfigFile> parse_document(const YAML::Node& root) {
    if (!root.IsMap()) {
        return Err<AgentConfigFile>(ErrorKind::Validation, "top level must be a mapping");
    }

    AgentConfigFile config;

    int version = 0;
    if (!is_string(root["version"]) || !YAML::convert<int>::decode(root["version"], version)) {
        return Err<AgentConfigFile>(ErrorKind::Validation, "version must be a number");
    }
    config.version = version;

    auto defaults = parse_defaults(root["defaults"]);
    if (defaults.is_error()) {
        return Err<AgentConfigFile>(defaults.error());
    }
    config.defaults = std::move(defaults.value());

    const auto agents = root["agents"];
    if (!agents || !agents.IsMap()) {
        return Err<AgentConfigFile>(ErrorKind::Validation, "agents must be a mapping");
    }
    for (const auto& item : agents) {
        const auto id = item.first.as<std::string>();
        auto agent = parse_agent(item.second, "agents." + id);
        if (agent.is_error()) {
            return Err<AgentConfigFile>(agent.error());
        }
        config.agents.emplace_back(id, std::move(agent.value()));
    }

    const auto profiles = root["profiles"];
    if (profiles && !profiles.IsNull()) {
        if (!profiles.IsMap()) {
            return Err<AgentConfigFile>(ErrorKind::Validation, "profiles must be a mapping");
        }
        config.profiles.emplace();
        for (const auto& item : profiles) {
            const auto name = item.first.as<std::string>();
            const std::string where = "profiles." + name;
            if (!item.second.IsMap()) {
                return Err<AgentConfigFile>(ErrorKind::Validation, where + " must be a mapping");
            }
            ProfileConfig profile;
            const auto files = item.second["files"];
            if (files && !files.IsNull()) {
                auto parsed = parse_files(files, where);
                if (parsed.is_error()) {
                    return Err<AgentConfigFile>(parsed.error());
                }
                profile.files = std::move(parsed.value());
            }
            config.profiles->emplace_back(name, std::move(profile));
        }
    }

    return Ok(std::move(config));
}

} // namespace

fs::path config_path(const fs::path& source_root) {
    return source_root / kConfigFileName;
}

Result<AgentConfigFile> parse_config(const std::string& text, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        std::ostringstream message;
        message << "Invalid YAML in " << origin << " (line " << e.mark.line + 1
                << ", col " << e.mark.column + 1 << "): " << e.msg;
        return Err<AgentConfigFile>(ErrorKind::Validation, message.str());
    }

    Result<AgentConfigFile> parsed = Err<AgentConfigFile>(ErrorKind::Validation, "");
    try {
        parsed = parse_document(root);
    } catch (const YAML::Exception& e) {
        return Err<AgentConfigFile>(ErrorKind::Validation,
                                    "Invalid config format in " + origin + ": " + e.what());
    }
    if (parsed.is_error()) {
        return Err<AgentConfigFile>(ErrorKind::Validation,
                                    "Invalid config format in " + origin + ": " + parsed.error().message);
    }
    return parsed;
}

std::string serialize_config(const AgentConfigFile& config) {
    YAML::Node root;
    root["version"] = config.version;

    YAML::Node defaults;
    defaults["mode"] = to_string(config.defaults.mode);
    defaults["profile"] = config.defaults.profile;
    defaults["sourceRoot"] = config.defaults.source_root;
    root["defaults"] = defaults;

    YAML::Node agents(YAML::NodeType::Map);
    for (const auto& [id, agent] : config.agents) {
        agents[id] = agent;
    }
    root["agents"] = agents;

    if (config.profiles) {
        YAML::Node profiles(YAML::NodeType::Map);
        for (const auto& [name, profile] : *config.profiles) {
            profiles[name] = profile;
        }
        root["profiles"] = profiles;
    }

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

Result<AgentConfigFile> read_config(const fs::path& source_root) {
    const auto path = config_path(source_root);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Err<AgentConfigFile>(ErrorKind::Validation, "Missing config: " + path.string());
        }
        return Err<AgentConfigFile>(ErrorKind::Filesystem, "Failed to read config: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    spdlog::debug("Loaded {} ({} bytes)", path.string(), buffer.str().size());
    return parse_config(buffer.str(), path.string());
}

Result<void> write_config(const fs::path& source_root, const AgentConfigFile& config) {
    std::error_code ec;
    fs::create_directories(source_root, ec);
    if (ec) {
        return Err<void>(ErrorKind::Filesystem,
                         "Failed to create " + source_root.string() + ": " + ec.message());
    }

    const auto path = config_path(source_root);
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorKind::Filesystem, "Failed to open config for writing: " + path.string());
    }
    output << serialize_config(config);
    if (!output) {
        return Err<void>(ErrorKind::Filesystem, "Failed to write config: " + path.string());
    }
    spdlog::debug("Wrote {}", path.string());
    return Ok();
}

} // namespace agentcfg::config
