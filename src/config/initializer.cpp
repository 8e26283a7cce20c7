#include "agentcfg/config/initializer.hpp"
#include "agentcfg/config/loader.hpp"
#include "agentcfg/config/templates.hpp"
#include "agentcfg/paths/resolver.hpp"
#include "agentcfg/sync/state_store.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <system_error>

namespace agentcfg::config {
namespace fs = std::filesystem;

namespace {

std::set<std::string> collect_sources(const AgentConfigFile& config) {
    std::set<std::string> sources;
    for (const auto& [id, agent] : config.agents) {
        for (const auto* scope : {&agent.global, &agent.project}) {
            if (!*scope) {
                continue;
            }
            for (const auto& entry : (*scope)->files) {
                sources.insert(entry.source);
            }
        }
    }
    if (config.profiles) {
        for (const auto& [name, profile] : *config.profiles) {
            if (!profile.files) {
                continue;
            }
            for (const auto& entry : *profile.files) {
                sources.insert(entry.source);
            }
        }
    }
    return sources;
}

Result<void> backup_config(const fs::path& path, const fs::path& source_root) {
    const auto stamp = sync::backup_stamp(std::chrono::system_clock::now());
    const auto destination = source_root / "backup" / stamp / path.filename();
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (!ec) {
        fs::copy_file(path, destination, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return Err<void>(ErrorKind::Filesystem, "Failed to back up " + path.string() + ": " + ec.message());
    }
    spdlog::info("Backed up {} to {}", path.string(), destination.string());
    return Ok();
}

} // namespace

const char* to_string(InitResult::Action action) noexcept {
    switch (action) {
        case InitResult::Action::Overwritten: return "overwritten";
        case InitResult::Action::Skipped: return "skipped";
        default: return "created";
    }
}

Result<InitResult> init_config(const fs::path& source_root, const InitOptions& options) {
    InitResult result;
    result.config_path = config_path(source_root);

    std::error_code ec;
    const bool exists = fs::exists(result.config_path, ec);
    auto policy = options.conflict_policy;
    if (!policy && options.force) {
        policy = sync::ConflictPolicy::Overwrite;
    }

    if (exists) {
        if (!policy) {
            return Err<InitResult>(ErrorKind::Conflict, "Config already exists: " + result.config_path.string());
        }
        switch (*policy) {
            case sync::ConflictPolicy::Skip:
                result.action = InitResult::Action::Skipped;
                return Ok(std::move(result));
            case sync::ConflictPolicy::Cancel:
                return Err<InitResult>(ErrorKind::Conflict, "Init cancelled");
            case sync::ConflictPolicy::Backup:
                if (auto res = backup_config(result.config_path, source_root); res.is_error()) {
                    return Err<InitResult>(res.error());
                }
                break;
            case sync::ConflictPolicy::Overwrite:
                break;
        }
    }

    const auto config = options.config.value_or(default_config());
    if (auto res = write_config(source_root, config); res.is_error()) {
        return Err<InitResult>(res.error());
    }
    if (auto res = ensure_source_directories(config, source_root); res.is_error()) {
        return Err<InitResult>(res.error());
    }

    result.action = exists ? InitResult::Action::Overwritten : InitResult::Action::Created;
    return Ok(std::move(result));
}

Result<void> ensure_source_directories(const AgentConfigFile& config, const fs::path& source_root) {
    for (const auto& source : collect_sources(config)) {
        const auto resolved = paths::resolve_from_root(source_root, source);
        const auto directory = paths::is_directory_mapping(source) ? resolved : resolved.parent_path();

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return Err<void>(ErrorKind::Filesystem,
                             "Failed to create " + directory.string() + ": " + ec.message());
        }
        spdlog::debug("Ensured source directory {}", directory.string());
    }
    return Ok();
}

} // namespace agentcfg::config
