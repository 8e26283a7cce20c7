#pragma once

#include "agentcfg/config/types.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace agentcfg::config;

// MappingEntry

template<>
struct convert<MappingEntry> {
    static Node encode(const MappingEntry& rhs) {
        Node node;
        node["source"] = rhs.source;
        node["target"] = rhs.target;
        return node;
    }

    static bool decode(const Node& node, MappingEntry& rhs) {
        if (!node.IsMap()) return false;
        const auto source = node["source"];
        const auto target = node["target"];
        if (!source || !source.IsScalar() || !target || !target.IsScalar()) return false;
        rhs.source = source.as<std::string>();
        rhs.target = target.as<std::string>();
        return true;
    }
};

// ScopeConfig

template<>
struct convert<ScopeConfig> {
    static Node encode(const ScopeConfig& rhs) {
        Node node;
        node["root"] = rhs.root;
        Node files(NodeType::Sequence);
        for (const auto& entry : rhs.files) files.push_back(entry);
        node["files"] = files;
        return node;
    }
};

// AgentConfig

template<>
struct convert<AgentConfig> {
    static Node encode(const AgentConfig& rhs) {
        Node node;
        node["displayName"] = rhs.display_name;
        if (rhs.global) node["global"] = *rhs.global;
        if (rhs.project) node["project"] = *rhs.project;
        return node;
    }
};

// ProfileConfig

template<>
struct convert<ProfileConfig> {
    static Node encode(const ProfileConfig& rhs) {
        Node node(NodeType::Map);
        if (rhs.files) {
            Node files(NodeType::Sequence);
            for (const auto& entry : *rhs.files) files.push_back(entry);
            node["files"] = files;
        }
        return node;
    }
};

} // namespace YAML
