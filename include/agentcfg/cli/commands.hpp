#pragma once

#include "agentcfg/core/result.hpp"
#include "agentcfg/paths/resolver.hpp"
#include "agentcfg/sync/types.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace agentcfg::cli {

struct CliArgs {
    std::optional<std::string> command;
    std::optional<std::string> project;
    std::optional<sync::SyncMode> mode;
    std::optional<sync::ConflictPolicy> conflict_policy;
    std::optional<std::string> agent;
    bool dry_run = false;
    bool force = false;
    bool strict = false;
    bool verbose = false;
    bool help = false;
};

Result<CliArgs> parse_args(const std::vector<std::string>& args);

void print_help(std::ostream& out);

/// AGENTCONFIG_HOME when set, otherwise ~/.agentconfig.
std::filesystem::path source_root(const paths::PathContext& context);

/**
 * @brief Interactive answer for one conflicting target
 *
 * Reads the action number, then the apply-to-all answer; anything
 * unrecognised means skip.
 */
sync::ConflictChoice prompt_conflict(std::istream& in, std::ostream& out, const std::filesystem::path& target);

/**
 * @brief Execute one command and return the process exit code
 *
 * @param prompt Decision source for conflicts; empty when the terminal is not interactive
 */
int run(const CliArgs& args,
        const paths::PathContext& context,
        std::ostream& out,
        sync::ConflictPrompt prompt = {});

} // namespace agentcfg::cli
