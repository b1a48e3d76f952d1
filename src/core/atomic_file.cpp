/*
 * safedl/src/core/atomic_file.cpp
 *
 * Durable file primitives shared by the partial-file writer and the state store:
 * - errno classification (permission / disk full / generic I/O)
 * - fsync of files and directories
 * - temp-file + rename atomic replacement
 * - rename with EXDEV fallback (copy + fsync + remove)
 */

#include <safedl/core/atomic_file.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace safedl::core {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_tempCounter{0};

fs::path makeTempSibling(const fs::path& target) {
    auto name = "." + target.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
                std::to_string(g_tempCounter.fetch_add(1));
    return target.parent_path() / name;
}

Result<void> writeAll(int fd, std::string_view data, const fs::path& path) {
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return makeErrnoError(errno, "write failed", path);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return Result<void>();
}

} // namespace

ErrorCode errnoToErrorCode(int err) noexcept {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return ErrorCode::StorageFull;
        case ENOENT:
            return ErrorCode::NotFound;
        default:
            return ErrorCode::IoError;
    }
}

Error makeErrnoError(int err, std::string_view what, const fs::path& path) {
    std::string msg(what);
    msg += ": ";
    msg += path.string();
    msg += ": ";
    msg += std::strerror(err);
    return Error{errnoToErrorCode(err), std::move(msg)};
}

Result<void> fsyncFile(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return makeErrnoError(errno, "open() failed for fsync", path);
    }
#if defined(__APPLE__)
    // F_FULLFSYNC is stricter than fsync on macOS; do both, tolerating failures.
    (void)::fsync(fd);
    (void)::fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return makeErrnoError(err, "fsync() failed", path);
    }
#endif
    ::close(fd);
    return Result<void>();
}

Result<void> fsyncDirectory(const fs::path& dir) {
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return makeErrnoError(errno, "open(O_DIRECTORY) failed", target);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        // Some filesystems reject fsync on directories; treat EINVAL as best-effort.
        if (err == EINVAL)
            return Result<void>();
        return makeErrnoError(err, "fsync(dir) failed", target);
    }
    ::close(fd);
    return Result<void>();
}

Result<void> atomicWriteFile(const fs::path& path, std::string_view contents) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{errnoToErrorCode(ec.value()),
                         "Failed to create directory " + path.parent_path().string() + ": " +
                             ec.message()};
        }
    }

    const auto tempPath = makeTempSibling(path);
    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return makeErrnoError(errno, "Failed to create temp file", tempPath);
    }

    auto wr = writeAll(fd, contents, tempPath);
    if (wr && ::fsync(fd) != 0) {
        wr = makeErrnoError(errno, "fsync() failed", tempPath);
    }
    ::close(fd);
    if (!wr) {
        fs::remove(tempPath, ec);
        return wr;
    }

    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        int err = errno;
        fs::remove(tempPath, ec);
        return makeErrnoError(err, "rename() failed", path);
    }

    auto dr = fsyncDirectory(path.parent_path());
    if (!dr) {
        spdlog::debug("fsync on directory failed (continuing): {}", dr.error().message);
    }
    return Result<void>();
}

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (!fs::exists(path))
            return Error{ErrorCode::NotFound, "File not found: " + path.string()};
        return Error{ErrorCode::IoError, "Failed to open for read: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed: " + path.string()};
    }
    return ss.str();
}

Result<void> renameOrCopy(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        auto dr = fsyncDirectory(to.parent_path());
        if (!dr) {
            spdlog::debug("fsync on directory failed (continuing): {}", dr.error().message);
        }
        return Result<void>();
    }
    if (ec != std::errc::cross_device_link) {
        return Error{errnoToErrorCode(ec.value()), "rename() failed (" + ec.message() +
                                                       ") from " + from.string() + " to " +
                                                       to.string()};
    }

    spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                 to.string());
    const auto tempPath = makeTempSibling(to);
    fs::copy_file(from, tempPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Error{errnoToErrorCode(ec.value()), "copy failed to " + tempPath.string()};
    }
    if (auto r = fsyncFile(tempPath); !r) {
        fs::remove(tempPath, ec);
        return r;
    }
    fs::rename(tempPath, to, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return Error{errnoToErrorCode(ec.value()), "rename() failed for " + to.string()};
    }
    if (auto dr = fsyncDirectory(to.parent_path()); !dr) {
        spdlog::debug("fsync on directory failed (continuing): {}", dr.error().message);
    }
    fs::remove(from, ec);
    return Result<void>();
}

} // namespace safedl::core
