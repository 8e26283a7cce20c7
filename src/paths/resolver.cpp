#include "agentcfg/paths/resolver.hpp"
#include "agentcfg/core/platform.hpp"

#include <regex>
#include <system_error>

#ifndef AGENTCFG_PLATFORM_WINDOWS
extern char** environ;
#endif

namespace agentcfg::paths {
namespace fs = std::filesystem;

namespace {

Environment capture_environment() {
    Environment env;
#ifdef AGENTCFG_PLATFORM_WINDOWS
    char** entries = _environ;
#else
    char** entries = environ;
#endif
    if (entries == nullptr) {
        return env;
    }
    for (char** entry = entries; *entry != nullptr; ++entry) {
        const std::string pair(*entry);
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    return env;
}

std::string lookup(const Environment& env, const std::string& name) {
    const auto it = env.find(name);
    return it == env.end() ? std::string{} : it->second;
}

const std::regex& variable_pattern() {
    static const std::regex pattern(R"(\$\{([A-Za-z0-9_]+)(:-([^}]*))?\})");
    return pattern;
}

std::string expand_env(const std::string& input, const Environment& env) {
    const auto& pattern = variable_pattern();

    std::string output;
    auto cursor = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
        const auto& match = *it;
        output.append(cursor, match[0].first);
        const auto value = lookup(env, match[1].str());
        if (!value.empty()) {
            output += value;
        } else if (match[2].matched) {
            output += match[3].str();
        }
        cursor = match[0].second;
    }
    output.append(cursor, input.cend());
    return output;
}

std::string expand_home(const std::string& input, const fs::path& home) {
    if (input == "~") {
        return home.string();
    }
    if (input.size() >= 2 && input[0] == '~' && (input[1] == '/' || input[1] == '\\')) {
        return (home / input.substr(2)).string();
    }
    return input;
}

} // namespace

PathContext PathContext::from_process() {
    PathContext context;
    context.env = capture_environment();

    std::error_code ec;
    context.cwd = fs::current_path(ec);
    context.temp_dir = fs::temp_directory_path(ec);
    if (ec) {
        context.temp_dir = context.cwd;
    }
    context.home = lookup(context.env, home_variable());
    return context;
}

std::string expand_placeholders(const std::string& path, const PathContext& context) {
    return expand_home(expand_env(path, context.env), context.home);
}

std::vector<std::string> unset_variables(const std::string& path, const PathContext& context) {
    std::vector<std::string> names;
    const auto& pattern = variable_pattern();
    for (std::sregex_iterator it(path.begin(), path.end(), pattern), end; it != end; ++it) {
        const auto& match = *it;
        if (!match[2].matched && lookup(context.env, match[1].str()).empty()) {
            names.push_back(match[1].str());
        }
    }
    return names;
}

fs::path resolve_absolute(const std::string& path, const PathContext& context) {
    const fs::path expanded(expand_placeholders(path, context));
    if (expanded.is_absolute()) {
        return normalize(expanded);
    }
    return normalize(context.cwd / expanded);
}

fs::path resolve_from_root(const fs::path& root, const std::string& relative) {
    const fs::path candidate(relative);
    if (candidate.is_absolute()) {
        return normalize(candidate);
    }
    return normalize(root / candidate);
}

fs::path normalize(const fs::path& path) {
    auto normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool is_directory_mapping(const std::string& source) {
    return !source.empty() && (source.back() == '/' || source.back() == '\\');
}

} // namespace agentcfg::paths
