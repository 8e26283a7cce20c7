#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentcfg::paths {

using Environment = std::unordered_map<std::string, std::string>;

/**
 * @brief Process facts the resolver needs, captured once at the boundary
 *
 * Nothing below the CLI reads the process environment or working directory
 * directly; tests build a PathContext by hand instead.
 */
struct PathContext {
    Environment env;
    std::filesystem::path cwd;
    std::filesystem::path home;
    std::filesystem::path temp_dir;

    static PathContext from_process();
};

/**
 * @brief Expand `${NAME}` / `${NAME:-fallback}` tokens, then a leading `~`
 *
 * A variable that is unset or empty takes its fallback, or the empty string
 * when there is none. Only `~` on its own or `~/...` is treated as home.
 */
std::string expand_placeholders(const std::string& path, const PathContext& context);

/// Names of `${NAME}` tokens without a fallback whose variable is unset or empty.
std::vector<std::string> unset_variables(const std::string& path, const PathContext& context);

/// Placeholder expansion followed by resolution of relative paths against context.cwd.
std::filesystem::path resolve_absolute(const std::string& path, const PathContext& context);

/**
 * @brief Join @p relative onto @p root and normalise
 *
 * An absolute @p relative is returned (normalised) as is, so a mapping entry
 * may point outside its nominal root.
 */
std::filesystem::path resolve_from_root(const std::filesystem::path& root, const std::string& relative);

/// Lexical normalisation without a trailing separator.
std::filesystem::path normalize(const std::filesystem::path& path);

/// True when the mapping source names a directory (trailing separator).
bool is_directory_mapping(const std::string& source);

} // namespace agentcfg::paths
