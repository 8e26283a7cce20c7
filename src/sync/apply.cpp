#include "agentcfg/sync/apply.hpp"

#include <algorithm>

namespace agentcfg::sync {
namespace fs = std::filesystem;

namespace {

std::error_code default_create_symlink(const fs::path& source, const fs::path& target, bool directory) {
    std::error_code ec;
    if (directory) {
        fs::create_directory_symlink(source, target, ec);
    } else {
        fs::create_symlink(source, target, ec);
    }
    return ec;
}

Result<void> io_error(const std::string& action, const fs::path& path, const std::error_code& ec) {
    return Err<void>(ErrorKind::Filesystem, "Failed to " + action + " " + path.string() + ": " + ec.message());
}

std::string strip_leading_separators(const std::string& text) {
    const auto first = text.find_first_not_of("/\\");
    return first == std::string::npos ? std::string{} : text.substr(first);
}

} // namespace

ApplyEngine::ApplyEngine(const FilesystemProbe& probe, SymlinkCreator create_symlink)
    : probe_(probe),
      create_symlink_(create_symlink ? std::move(create_symlink) : SymlinkCreator(default_create_symlink)) {}

Result<void> ApplyEngine::apply(const ResolvedMapping& mapping,
                                bool allow_non_empty_dir,
                                std::vector<std::string>& warnings) const {
    if (mapping.mode == SyncMode::Copy) {
        return apply_copy(mapping, allow_non_empty_dir);
    }
    return apply_link(mapping, allow_non_empty_dir, warnings);
}

Result<void> ApplyEngine::apply_link(const ResolvedMapping& mapping,
                                     bool allow_non_empty_dir,
                                     std::vector<std::string>& warnings) const {
    if (auto res = ensure_parent(mapping.target, &warnings); res.is_error()) {
        return res;
    }

    const auto existing = probe_.inspect(mapping.target);
    if (existing.kind == NodeKind::Symlink && existing.link_target == mapping.source.string()) {
        return Ok();
    }
    if (auto res = clear_target(mapping.target, allow_non_empty_dir); res.is_error()) {
        return res;
    }

    std::error_code dir_ec;
    const bool directory = fs::is_directory(mapping.source, dir_ec);
    const auto ec = create_symlink_(mapping.source, mapping.target, directory);
    if (!ec) {
        return Ok();
    }

    warnings.push_back("Symlink failed for " + mapping.target.string() + " (" + ec.message()
                       + "); falling back to copy");
    return apply_copy(mapping, allow_non_empty_dir);
}

Result<void> ApplyEngine::apply_copy(const ResolvedMapping& mapping, bool allow_non_empty_dir) const {
    if (auto res = clear_target(mapping.target, allow_non_empty_dir); res.is_error()) {
        return res;
    }
    if (auto res = ensure_parent(mapping.target, nullptr); res.is_error()) {
        return res;
    }

    std::error_code ec;
    if (fs::is_directory(mapping.source, ec)) {
        return copy_tree(mapping.source, mapping.target);
    }
    fs::copy_file(mapping.source, mapping.target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return io_error("copy " + mapping.source.string() + " to", mapping.target, ec);
    }
    return Ok();
}

Result<void> ApplyEngine::clear_target(const fs::path& target, bool allow_non_empty_dir) const {
    std::error_code ec;
    switch (probe_.kind_of(target)) {
        case NodeKind::Absent:
            return Ok();
        case NodeKind::Directory:
            if (allow_non_empty_dir) {
                fs::remove_all(target, ec);
                return ec ? io_error("remove", target, ec) : Ok();
            }
            if (!probe_.is_empty_directory(target)) {
                return Err<void>(ErrorKind::Filesystem, "Refusing to replace non-empty directory: " + target.string());
            }
            fs::remove(target, ec);
            return ec ? io_error("remove", target, ec) : Ok();
        default:
            fs::remove(target, ec);
            return ec ? io_error("remove", target, ec) : Ok();
    }
}

Result<void> ApplyEngine::ensure_parent(const fs::path& target, std::vector<std::string>* warnings) const {
    const auto parent = target.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    const bool existed = probe_.exists(parent);
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return io_error("create directory", parent, ec);
    }
    if (!existed && warnings != nullptr) {
        warnings->push_back("Created target parent directory: " + parent.string() + " (for " + target.string() + ")");
    }
    return Ok();
}

Result<void> ApplyEngine::copy_tree(const fs::path& source, const fs::path& target) const {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return io_error("create directory", target, ec);
    }

    std::vector<fs::path> entries;
    for (fs::directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return io_error("list", source, ec);
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        const auto destination = target / entry.filename();
        switch (probe_.kind_of(entry)) {
            case NodeKind::Directory:
                if (auto res = copy_tree(entry, destination); res.is_error()) {
                    return res;
                }
                break;
            case NodeKind::Symlink:
                fs::copy_symlink(entry, destination, ec);
                if (ec) {
                    return io_error("copy link", destination, ec);
                }
                break;
            case NodeKind::Absent:
            case NodeKind::Other:
                break;
            default:
                fs::copy_file(entry, destination, fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    return io_error("copy " + entry.string() + " to", destination, ec);
                }
                break;
        }
    }
    return Ok();
}

Result<fs::path> ApplyEngine::backup_target(const fs::path& target,
                                            const fs::path& source_root,
                                            const std::string& stamp) const {
    const auto relative = strip_leading_separators(target.relative_path().string());
    const auto destination = source_root / "backup" / stamp / relative;
    if (probe_.exists(destination)) {
        return Ok(destination);
    }

    if (auto res = ensure_parent(destination, nullptr); res.is_error()) {
        return Err<fs::path>(res.error());
    }

    std::error_code ec;
    switch (probe_.kind_of(target)) {
        case NodeKind::Directory:
            if (auto res = copy_tree(target, destination); res.is_error()) {
                return Err<fs::path>(res.error());
            }
            break;
        case NodeKind::Symlink:
            fs::copy_symlink(target, destination, ec);
            break;
        case NodeKind::Absent:
            return Err<fs::path>(ErrorKind::Filesystem, "Nothing to back up at " + target.string());
        default:
            fs::copy_file(target, destination, fs::copy_options::overwrite_existing, ec);
            break;
    }
    if (ec) {
        return Err<fs::path>(ErrorKind::Filesystem,
                             "Failed to back up " + target.string() + ": " + ec.message());
    }
    return Ok(destination);
}

Result<SyncRecord> ApplyEngine::snapshot(const ResolvedMapping& mapping) const {
    const auto info = probe_.inspect(mapping.target);
    if (info.kind == NodeKind::Absent) {
        return Err<SyncRecord>(ErrorKind::Filesystem, "Applied target vanished: " + mapping.target.string());
    }

    SyncRecord record;
    record.path = mapping.target.string();
    record.source = mapping.source.string();
    record.agent = mapping.agent;
    record.mode = info.kind == NodeKind::Symlink ? SyncMode::Link : SyncMode::Copy;
    record.size = info.size;
    record.mtime_ms = info.mtime_ms;

    if (record.mode == SyncMode::Link) {
        record.link_target = info.link_target;
    } else {
        auto hash = probe_.content_hash(mapping.target);
        if (hash.is_error()) {
            return Err<SyncRecord>(hash.error());
        }
        record.hash = std::move(hash.value());
    }
    return Ok(std::move(record));
}

} // namespace agentcfg::sync
