#include "agentcfg/cli/commands.hpp"
#include "agentcfg/config/initializer.hpp"
#include "agentcfg/config/loader.hpp"
#include "agentcfg/sync/mapping_resolver.hpp"
#include "agentcfg/sync/service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <set>
#include <system_error>

namespace agentcfg::cli {
namespace fs = std::filesystem;

namespace {

constexpr const char* kCommands[] = {"init", "sync", "status", "doctor", "list-agents"};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int report(const Error& error) {
    spdlog::error("{}", error.message);
    return exit_code(error.kind);
}

int run_init(const fs::path& root, const CliArgs& args, std::ostream& out) {
    config::InitOptions options;
    options.conflict_policy = args.conflict_policy;
    options.force = args.force;

    auto result = config::init_config(root, options);
    if (result.is_error()) {
        return report(result.error());
    }
    const auto& init = result.value();
    if (init.action == config::InitResult::Action::Skipped) {
        out << "Kept existing " << init.config_path.string() << "\n";
    } else {
        out << (init.action == config::InitResult::Action::Created ? "Created " : "Overwrote ")
            << init.config_path.string() << "\n";
    }
    return exit_codes::kSuccess;
}

int run_sync(const fs::path& root,
             const CliArgs& args,
             const paths::PathContext& context,
             std::ostream& out,
             sync::ConflictPrompt prompt) {
    auto loaded = config::read_config(root);
    if (loaded.is_error()) {
        return report(loaded.error());
    }
    const auto& config = loaded.value();

    sync::SyncOptions options;
    options.config = &config;
    options.source_root = root;
    options.scope = args.project ? sync::Scope::Project : sync::Scope::Global;
    if (args.project) {
        options.project_root = paths::resolve_absolute(*args.project, context);
    }
    options.link_mode = args.mode.value_or(config.defaults.mode);
    options.dry_run = args.dry_run;
    options.force = args.force;
    options.conflict_policy = args.conflict_policy;
    options.agent_filter = args.agent;
    options.strict = args.strict;

    if (args.agent && config.find_agent(*args.agent) == nullptr) {
        spdlog::warn("Unknown agent: {}", *args.agent);
    }

    sync::SyncService service(context, std::move(prompt));
    auto result = service.sync_configs(options);
    if (result.is_error()) {
        return report(result.error());
    }

    for (const auto& warning : result.value().warnings) {
        spdlog::warn("{}", warning);
    }
    if (args.dry_run) {
        for (const auto& mapping : result.value().planned) {
            out << "[dry-run] " << mapping.agent << ": " << mapping.source.string()
                << " -> " << mapping.target.string() << " (" << config::to_string(mapping.mode) << ")\n";
        }
    }
    out << "Planned: " << result.value().planned.size() << "\n";
    out << "Updated: " << result.value().updated.size() << "\n";
    out << "Skipped: " << result.value().skipped.size() << "\n";
    return exit_codes::kSuccess;
}

int run_status(const fs::path& root, const paths::PathContext& context, std::ostream& out) {
    sync::SyncService service(context);
    auto entries = service.get_status(root);
    if (entries.is_error()) {
        return report(entries.error());
    }
    if (entries.value().empty()) {
        out << "No sync state found.\n";
        return exit_codes::kSuccess;
    }

    bool drifted = false;
    for (const auto& entry : entries.value()) {
        out << sync::to_string(entry.status) << ": " << entry.path;
        if (entry.reason) {
            out << " (" << *entry.reason << ")";
        }
        out << "\n";
        drifted = drifted || entry.status != sync::TargetStatus::Ok;
    }
    return drifted ? exit_codes::kValidation : exit_codes::kSuccess;
}

int run_doctor(const fs::path& root, const CliArgs& args, const paths::PathContext& context, std::ostream& out) {
    auto loaded = config::read_config(root);
    if (loaded.is_error()) {
        return report(loaded.error());
    }
    const auto& config = loaded.value();
    if (config.agents.empty()) {
        return report(validation_error("Config defines no agents"));
    }
    if (config.find_profile(config.defaults.profile) == nullptr) {
        spdlog::warn("Default profile '{}' is not defined", config.defaults.profile);
    }

    const auto project_root = args.project ? paths::resolve_absolute(*args.project, context) : context.cwd;
    const auto& profile_files = sync::MappingResolver::profile_files(config, config.defaults.profile);
    sync::MappingResolver resolver(context);
    std::size_t broken_roots = 0;

    for (const auto& item : config.agents) {
        const auto& id = item.first;
        const auto& agent = item.second;
        for (const auto scope : {sync::Scope::Global, sync::Scope::Project}) {
            const auto& scope_config = agent.scope(scope);
            if (!scope_config) {
                continue;
            }
            const std::string where = id + " " + config::to_string(scope) + " root";

            const auto unset = paths::unset_variables(scope_config->root, context);
            for (const auto& name : unset) {
                out << "problem: " << where << " uses unset variable ${" << name << "}\n";
            }
            const bool empty_root = paths::expand_placeholders(scope_config->root, context).empty();
            if (empty_root) {
                out << "problem: " << where << " is empty\n";
            }
            auto resolved = resolver.resolve_root(*scope_config, scope, project_root);
            if (resolved.is_error()) {
                out << "problem: " << where << ": " << resolved.error().message << "\n";
            } else {
                spdlog::debug("{}: {}", where, resolved.value().string());
            }
            if (!unset.empty() || empty_root || resolved.is_error()) {
                ++broken_roots;
            }

            std::set<std::string> reported;
            auto check_source = [&](const config::MappingEntry& entry) {
                const auto source = paths::resolve_from_root(root, entry.source);
                std::error_code ec;
                if (!fs::exists(fs::symlink_status(source, ec)) && reported.insert(source.string()).second) {
                    out << "warning: " << id << " " << config::to_string(scope)
                        << " source missing: " << source.string() << "\n";
                }
            };
            for (const auto& entry : scope_config->files) {
                check_source(entry);
            }
            for (const auto& entry : profile_files) {
                check_source(entry);
            }
        }
    }

    if (broken_roots > 0) {
        return report(validation_error(std::to_string(broken_roots) + " agent root(s) do not resolve"));
    }
    out << "Config OK\n";
    return exit_codes::kSuccess;
}

int run_list_agents(const fs::path& root, std::ostream& out) {
    auto loaded = config::read_config(root);
    if (loaded.is_error()) {
        return report(loaded.error());
    }
    for (const auto& [id, agent] : loaded.value().agents) {
        out << id << ": " << agent.display_name << "\n";
    }
    return exit_codes::kSuccess;
}

} // namespace

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs parsed;

    auto next_value = [&](std::size_t& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= args.size()) {
            return Err<std::string>(ErrorKind::Usage, flag + " requires a value");
        }
        return Ok(args[++i]);
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (!parsed.command && !arg.empty() && arg[0] != '-') {
            parsed.command = arg;
        } else if (arg == "--project" || arg == "--agent" || arg == "--conflict") {
            auto value = next_value(i, arg);
            if (value.is_error()) {
                return Err<CliArgs>(value.error());
            }
            if (arg == "--project") {
                parsed.project = value.value();
            } else if (arg == "--agent") {
                parsed.agent = value.value();
            } else {
                parsed.conflict_policy = sync::parse_conflict_policy(value.value());
                if (!parsed.conflict_policy) {
                    return Err<CliArgs>(ErrorKind::Usage, "Unknown conflict policy: " + value.value());
                }
            }
        } else if (arg == "--dry-run") {
            parsed.dry_run = true;
        } else if (arg == "--link") {
            parsed.mode = sync::SyncMode::Link;
        } else if (arg == "--copy") {
            parsed.mode = sync::SyncMode::Copy;
        } else if (arg == "--force") {
            parsed.force = true;
        } else if (arg == "--strict") {
            parsed.strict = true;
        } else if (arg == "--verbose" || arg == "-v") {
            parsed.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            parsed.help = true;
        } else {
            return Err<CliArgs>(ErrorKind::Usage, "Unknown argument: " + arg);
        }
    }

    if (parsed.command
        && std::find(std::begin(kCommands), std::end(kCommands), *parsed.command) == std::end(kCommands)) {
        return Err<CliArgs>(ErrorKind::Usage, "Unknown command: " + *parsed.command);
    }
    return Ok(std::move(parsed));
}

void print_help(std::ostream& out) {
    out << "agentcfg <command> [options]\n"
           "\n"
           "Commands:\n"
           "  init        Create agentconfig.yml in source root\n"
           "  sync        Sync configs to agents\n"
           "  status      Show drift status\n"
           "  doctor      Validate config and paths\n"
           "  list-agents List configured agents\n"
           "\n"
           "Options:\n"
           "  --project <path>     Use project mode and root\n"
           "  --dry-run            Show actions without writing\n"
           "  --link               Force symlink mode\n"
           "  --copy               Force copy mode\n"
           "  --force              Overwrite unmanaged targets\n"
           "  --conflict <policy>  overwrite, backup, skip or cancel\n"
           "  --agent <name>       Filter to one agent\n"
           "  --strict             Fail on missing sources\n"
           "  -v, --verbose        Debug logging\n"
           "  -h, --help           Show help\n";
}

fs::path source_root(const paths::PathContext& context) {
    const auto it = context.env.find("AGENTCONFIG_HOME");
    if (it != context.env.end() && !it->second.empty()) {
        return paths::resolve_absolute(it->second, context);
    }
    return paths::resolve_absolute("~/.agentconfig", context);
}

sync::ConflictChoice prompt_conflict(std::istream& in, std::ostream& out, const fs::path& target) {
    out << "Config already exists at " << target.string() << ". Choose action:\n"
        << "1) Overwrite\n"
        << "2) Backup then overwrite\n"
        << "3) Skip\n"
        << "4) Cancel\n"
        << "> " << std::flush;

    std::string choice;
    std::getline(in, choice);
    out << "Apply to all conflicts? (y/N) " << std::flush;
    std::string apply_all;
    std::getline(in, apply_all);

    sync::ConflictChoice result;
    const auto answer = lowercase(trim(apply_all));
    result.apply_to_all = answer == "y" || answer == "yes";

    const auto selection = trim(choice);
    if (selection == "1") {
        result.action = sync::ConflictPolicy::Overwrite;
    } else if (selection == "2") {
        result.action = sync::ConflictPolicy::Backup;
    } else if (selection == "4") {
        result.action = sync::ConflictPolicy::Cancel;
    } else {
        result.action = sync::ConflictPolicy::Skip;
    }
    return result;
}

int run(const CliArgs& args, const paths::PathContext& context, std::ostream& out, sync::ConflictPrompt prompt) {
    if (args.help || !args.command) {
        print_help(out);
        return exit_codes::kSuccess;
    }

    const auto root = source_root(context);
    spdlog::debug("Source root: {}", root.string());

    const auto& command = *args.command;
    if (command == "init") {
        return run_init(root, args, out);
    }
    if (command == "sync") {
        return run_sync(root, args, context, out, std::move(prompt));
    }
    if (command == "status") {
        return run_status(root, context, out);
    }
    if (command == "doctor") {
        return run_doctor(root, args, context, out);
    }
    if (command == "list-agents") {
        return run_list_agents(root, out);
    }
    return report(Error{ErrorKind::Usage, "Unknown command: " + command});
}

} // namespace agentcfg::cli
