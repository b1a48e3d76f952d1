/*
 * safedl/src/downloader/disk_writer.cpp
 *
 * Partial-file handling:
 * - "<output>.part" sibling holds in-progress bytes
 * - Append (resume) or truncate (fresh start / server ignored Range)
 * - errno classification so permission and disk-full failures stay distinguishable
 * - Finalize: fsync, then atomic rename onto the output (EXDEV falls back to copy)
 */

#include <safedl/core/atomic_file.h>
#include <safedl/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace safedl::downloader {

namespace fs = std::filesystem;

PartialFile::~PartialFile() {
    close();
}

PartialFile::PartialFile(PartialFile&& other) noexcept
    : fd_(other.fd_), size_(other.size_), path_(std::move(other.path_)) {
    other.fd_ = -1;
    other.size_ = 0;
}

PartialFile& PartialFile::operator=(PartialFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        size_ = other.size_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

Result<PartialFile> PartialFile::open(const fs::path& path, Mode mode) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return core::makeErrnoError(ec.value(), "Failed to create directory",
                                        path.parent_path());
        }
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == Mode::Truncate) ? O_TRUNC : O_APPEND;
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return core::makeErrnoError(errno, "Failed to open partial file", path);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return core::makeErrnoError(err, "fstat() failed", path);
    }

    PartialFile file;
    file.fd_ = fd;
    file.size_ = static_cast<std::uint64_t>(st.st_size);
    file.path_ = path;
    return file;
}

Result<void> PartialFile::write(ByteSpan data) {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Partial file is not open"};
    }
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return core::makeErrnoError(errno, "write failed", path_);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
        size_ += static_cast<std::uint64_t>(n);
    }
    return Result<void>();
}

Result<void> PartialFile::sync() {
    if (fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Partial file is not open"};
    }
    if (::fsync(fd_) != 0) {
        return core::makeErrnoError(errno, "fsync() failed", path_);
    }
    return Result<void>();
}

void PartialFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

fs::path partialPathFor(const fs::path& outputPath) {
    fs::path p = outputPath;
    p += ".part";
    return p;
}

std::uint64_t partialSize(const fs::path& partialPath) {
    std::error_code ec;
    auto sz = fs::file_size(partialPath, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

Result<void> finalizePartial(const fs::path& partialPath, const fs::path& outputPath) {
    if (auto r = core::fsyncFile(partialPath); !r) {
        return r;
    }
    if (auto r = core::renameOrCopy(partialPath, outputPath); !r) {
        return r;
    }
    spdlog::debug("Finalized {} -> {}", partialPath.string(), outputPath.string());
    return Result<void>();
}

Result<void> removePartial(const fs::path& partialPath) {
    if (::unlink(partialPath.c_str()) != 0 && errno != ENOENT) {
        return core::makeErrnoError(errno, "Failed to delete partial file", partialPath);
    }
    return Result<void>();
}

} // namespace safedl::downloader
