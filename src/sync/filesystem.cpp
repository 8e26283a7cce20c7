#include "agentcfg/sync/filesystem.hpp"
#include "agentcfg/core/platform.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>
#include <vector>

#ifndef AGENTCFG_PLATFORM_WINDOWS
    #include <sys/stat.h>
#endif

namespace agentcfg::sync {
namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
    }

    void update(const void* data, std::size_t size) {
        if (ok_ && size > 0) {
            ok_ = EVP_DigestUpdate(ctx_.get(), data, size) == 1;
        }
    }

    void update(const std::string& text) { update(text.data(), text.size()); }

    std::optional<std::string> hex_digest() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            return std::nullopt;
        }
        std::ostringstream oss;
        for (unsigned int i = 0; i < length; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
        }
        return oss.str();
    }

private:
    DigestContext ctx_;
    bool ok_ = false;
};

NodeKind classify(const fs::file_status& status) {
    switch (status.type()) {
        case fs::file_type::not_found:
        case fs::file_type::none:
            return NodeKind::Absent;
        case fs::file_type::symlink: return NodeKind::Symlink;
        case fs::file_type::directory: return NodeKind::Directory;
        case fs::file_type::regular: return NodeKind::File;
        default: return NodeKind::Other;
    }
}

fs::path make_scratch_dir(const fs::path& scratch_root) {
    static std::atomic<std::uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return scratch_root / ("agentcfg-" + std::to_string(stamp) + "-" + std::to_string(counter.fetch_add(1)));
}

} // namespace

bool FilesystemProbe::exists(const fs::path& path) const {
    return kind_of(path) != NodeKind::Absent;
}

NodeKind FilesystemProbe::kind_of(const fs::path& path) const {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec) {
        return NodeKind::Absent;
    }
    return classify(status);
}

NodeInfo FilesystemProbe::inspect(const fs::path& path) const {
    NodeInfo info;
    info.kind = kind_of(path);
    if (info.kind == NodeKind::Absent) {
        return info;
    }
    if (info.kind == NodeKind::Symlink) {
        info.link_target = read_link(path);
    }

#ifndef AGENTCFG_PLATFORM_WINDOWS
    struct stat st {};
    if (::lstat(path.c_str(), &st) == 0) {
        info.size = static_cast<std::uint64_t>(st.st_size);
        info.mtime_ms = static_cast<double>(st.st_mtim.tv_sec) * 1000.0
                      + static_cast<double>(st.st_mtim.tv_nsec) / 1.0e6;
    }
#else
    std::error_code ec;
    if (info.kind == NodeKind::File) {
        info.size = fs::file_size(path, ec);
    } else if (info.link_target) {
        info.size = info.link_target->size();
    }
    if (info.kind != NodeKind::Symlink) {
        const auto write_time = fs::last_write_time(path, ec);
        if (!ec) {
            using namespace std::chrono;
            const auto system_time = time_point_cast<system_clock::duration>(
                write_time - fs::file_time_type::clock::now() + system_clock::now());
            info.mtime_ms = static_cast<double>(
                duration_cast<milliseconds>(system_time.time_since_epoch()).count());
        }
    }
#endif
    return info;
}

std::optional<std::string> FilesystemProbe::read_link(const fs::path& path) const {
    std::error_code ec;
    const auto target = fs::read_symlink(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return target.string();
}

bool FilesystemProbe::is_empty_directory(const fs::path& path) const {
    if (kind_of(path) != NodeKind::Directory) {
        return false;
    }
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    return !ec && it == fs::directory_iterator();
}

Result<std::string> FilesystemProbe::content_hash(const fs::path& path) const {
    std::error_code ec;
    // The top-level node is followed once; everything below is taken as is.
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Err<std::string>(ErrorKind::Filesystem, "Cannot hash missing path: " + path.string());
    }
    if (fs::is_directory(status)) {
        return hash_directory(path);
    }
    if (!fs::is_regular_file(status)) {
        Sha256 sha;
        sha.update(std::string{"other:"});
        auto digest = sha.hex_digest();
        if (!digest) {
            return Err<std::string>(ErrorKind::Failure, "SHA-256 digest failed for " + path.string());
        }
        return Ok(std::move(*digest));
    }
    return hash_file(path);
}

bool FilesystemProbe::can_create_symlinks(const fs::path& scratch_root) const {
    const auto scratch = make_scratch_dir(scratch_root);
    std::error_code ec;
    fs::create_directories(scratch, ec);
    if (ec) {
        return false;
    }

    {
        std::ofstream probe(scratch / "source", std::ios::binary | std::ios::trunc);
        probe << "test";
    }
    fs::create_symlink(scratch / "source", scratch / "target", ec);
    const bool created = !ec;

    fs::remove_all(scratch, ec);
    return created;
}

Result<std::string> FilesystemProbe::hash_file(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Filesystem, "Failed to open for hashing: " + path.string());
    }

    Sha256 sha;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        sha.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Filesystem, "Failed to read for hashing: " + path.string());
    }

    auto digest = sha.hex_digest();
    if (!digest) {
        return Err<std::string>(ErrorKind::Failure, "SHA-256 digest failed for " + path.string());
    }
    return Ok(std::move(*digest));
}

Result<std::string> FilesystemProbe::hash_directory(const fs::path& path) const {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return Err<std::string>(ErrorKind::Filesystem,
                                "Failed to list " + path.string() + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());

    Sha256 sha;
    for (const auto& name : names) {
        const auto child = path / name;
        switch (kind_of(child)) {
            case NodeKind::Symlink:
                sha.update("link:" + name + ":");
                sha.update(read_link(child).value_or(std::string{}));
                break;
            case NodeKind::Directory: {
                auto nested = hash_directory(child);
                if (nested.is_error()) {
                    return nested;
                }
                sha.update("dir:" + name + ":");
                sha.update(nested.value());
                break;
            }
            case NodeKind::Other:
                // FIFOs, sockets and devices are never opened.
                sha.update("other:" + name + ":");
                break;
            case NodeKind::Absent:
                break;
            default: {
                auto file_hash = hash_file(child);
                if (file_hash.is_error()) {
                    return file_hash;
                }
                sha.update("file:" + name + ":");
                sha.update(file_hash.value());
                break;
            }
        }
    }

    auto digest = sha.hex_digest();
    if (!digest) {
        return Err<std::string>(ErrorKind::Failure, "SHA-256 digest failed for " + path.string());
    }
    return Ok(std::move(*digest));
}

} // namespace agentcfg::sync
