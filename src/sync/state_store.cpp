#include "agentcfg/sync/state_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace agentcfg::sync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> read_optional_string(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json record_to_json(const SyncRecord& record) {
    return json{
        {"path", record.path},
        {"source", record.source},
        {"agent", record.agent},
        {"mode", config::to_string(record.mode)},
        {"size", record.size},
        {"mtimeMs", record.mtime_ms},
        {"hash", optional_string(record.hash)},
        {"linkTarget", optional_string(record.link_target)},
    };
}

SyncRecord record_from_json(const json& object, const std::string& key) {
    if (!object.is_object()) {
        throw std::invalid_argument("files[" + key + "] must be an object");
    }
    SyncRecord record;
    record.path = object.value("path", key);
    record.source = object.at("source").get<std::string>();
    record.agent = object.value("agent", std::string{});

    const auto mode = config::parse_sync_mode(object.at("mode").get<std::string>());
    if (!mode) {
        throw std::invalid_argument("files[" + key + "].mode is not auto, link or copy");
    }
    record.mode = *mode;
    record.size = object.value("size", std::uint64_t{0});
    record.mtime_ms = object.value("mtimeMs", 0.0);
    record.hash = read_optional_string(object, "hash");
    record.link_target = read_optional_string(object, "linkTarget");
    return record;
}

} // namespace

StateStore::StateStore(fs::path root) : root_(std::move(root)) {}

fs::path StateStore::state_path() const {
    return root_ / kStateFileName;
}

Result<std::optional<SyncState>> StateStore::load() const {
    const auto path = state_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(std::optional<SyncState>{});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::optional<SyncState>>(ErrorKind::Filesystem, "Failed to read " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parse(buffer.str(), path.string());
    if (parsed.is_error()) {
        return Err<std::optional<SyncState>>(parsed.error());
    }
    return Ok(std::optional<SyncState>(std::move(parsed.value())));
}

Result<void> StateStore::save(const SyncState& state) const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return Err<void>(ErrorKind::Filesystem, "Failed to create " + root_.string() + ": " + ec.message());
    }

    const auto path = state_path();
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorKind::Filesystem, "Failed to open " + path.string() + " for writing");
    }
    output << serialize(state);
    if (!output) {
        return Err<void>(ErrorKind::Filesystem, "Failed to write " + path.string());
    }
    return Ok();
}

Result<SyncState> StateStore::parse(const std::string& text, const std::string& origin) {
    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<SyncState>(ErrorKind::Validation, "Invalid JSON in " + origin);
    }
    if (!document.is_object()) {
        return Err<SyncState>(ErrorKind::Validation, "Invalid sync state in " + origin + ": not an object");
    }

    try {
        SyncState state;
        state.version = document.value("version", 1);
        state.updated_at = document.value("updatedAt", std::string{});

        const auto scope = config::parse_scope(document.value("mode", std::string{"global"}));
        if (!scope) {
            return Err<SyncState>(ErrorKind::Validation,
                                  "Invalid sync state in " + origin + ": mode must be global or project");
        }
        state.mode = *scope;
        state.project_root = read_optional_string(document, "projectRoot");

        const auto files = document.find("files");
        if (files != document.end() && !files->is_null()) {
            if (!files->is_object()) {
                return Err<SyncState>(ErrorKind::Validation,
                                      "Invalid sync state in " + origin + ": files must be an object");
            }
            for (const auto& item : files->items()) {
                state.files.emplace(item.key(), record_from_json(item.value(), item.key()));
            }
        }
        return Ok(std::move(state));
    } catch (const json::exception& e) {
        return Err<SyncState>(ErrorKind::Validation, "Invalid sync state in " + origin + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return Err<SyncState>(ErrorKind::Validation, "Invalid sync state in " + origin + ": " + e.what());
    }
}

std::string StateStore::serialize(const SyncState& state) {
    json files = json::object();
    for (const auto& [key, record] : state.files) {
        files[key] = record_to_json(record);
    }

    const json document{
        {"version", state.version},
        {"updatedAt", state.updated_at},
        {"mode", config::to_string(state.mode)},
        {"projectRoot", optional_string(state.project_root)},
        {"files", files},
    };
    return document.dump(2);
}

SyncState StateStore::merge(const std::optional<SyncState>& previous, SyncState fresh) {
    if (!previous) {
        return fresh;
    }
    for (const auto& [key, record] : previous->files) {
        fresh.files.emplace(key, record);
    }
    return fresh;
}

std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    using namespace std::chrono;
    const auto millis = duration_cast<milliseconds>(when.time_since_epoch()).count() % 1000;
    const std::time_t seconds = system_clock::to_time_t(when);

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::string backup_stamp(std::chrono::system_clock::time_point when) {
    auto stamp = iso_timestamp(when);
    std::replace(stamp.begin(), stamp.end(), ':', '-');
    std::replace(stamp.begin(), stamp.end(), '.', '-');
    return stamp;
}

} // namespace agentcfg::sync
