#include "agentcfg/cli/commands.hpp"
#include "agentcfg/core/platform.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = agentcfg::cli::parse_args(args);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().message);
        agentcfg::cli::print_help(std::cerr);
        return agentcfg::exit_code(parsed.error().kind);
    }
    if (parsed.value().verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    const auto context = agentcfg::paths::PathContext::from_process();

    agentcfg::sync::ConflictPrompt prompt;
    if (agentcfg::is_interactive_terminal()) {
        prompt = [](const std::filesystem::path& target) {
            return agentcfg::cli::prompt_conflict(std::cin, std::cout, target);
        };
    }

    return agentcfg::cli::run(parsed.value(), context, std::cout, std::move(prompt));
}
