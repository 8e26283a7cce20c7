#pragma once

#include "agentcfg/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace agentcfg::sync {

enum class NodeKind {
    Absent,
    File,
    Directory,
    Symlink,
    Other
};

/**
 * @brief lstat-level view of a path; symlinks are never followed
 */
struct NodeInfo {
    NodeKind kind = NodeKind::Absent;
    std::optional<std::string> link_target; ///< Literal link text, only for Symlink
    std::uint64_t size = 0;
    double mtime_ms = 0;
};

/**
 * @brief Read-only queries against the filesystem
 *
 * Hashes are lowercase hex SHA-256. A directory hash is built from its
 * entries in byte-wise name order, each tagged as dir/file/link, so two trees
 * with the same structure and bytes hash equal regardless of readdir order.
 * Symlinks below the top level are hashed by their link text and never
 * followed. FIFOs, sockets and devices contribute only their name and are
 * never opened.
 */
class FilesystemProbe {
public:
    /// True for anything lstat can see, dangling symlinks included.
    bool exists(const std::filesystem::path& path) const;

    NodeKind kind_of(const std::filesystem::path& path) const;

    NodeInfo inspect(const std::filesystem::path& path) const;

    std::optional<std::string> read_link(const std::filesystem::path& path) const;

    /// True when @p path is a directory with no entries.
    bool is_empty_directory(const std::filesystem::path& path) const;

    Result<std::string> content_hash(const std::filesystem::path& path) const;

    /**
     * @brief Try creating a symlink inside a scratch directory under @p scratch_root
     *
     * The scratch directory is removed again whatever the outcome.
     */
    bool can_create_symlinks(const std::filesystem::path& scratch_root) const;

private:
    Result<std::string> hash_file(const std::filesystem::path& path) const;
    Result<std::string> hash_directory(const std::filesystem::path& path) const;
};

} // namespace agentcfg::sync
