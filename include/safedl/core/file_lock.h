#pragma once

#include <safedl/core/types.h>

#include <chrono>
#include <filesystem>

namespace safedl::core {

/**
 * Advisory cross-process exclusive lock backed by flock(2) on a lock file.
 *
 * The lock is released on destruction. Locks taken by the same process through different
 * file descriptors still exclude each other, so two engines in one process are serialized
 * the same way as two processes.
 */
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    // Poll for the lock until @p timeout elapses (ResourceExhausted on timeout).
    [[nodiscard]] static Result<FileLock> acquire(const std::filesystem::path& lockPath,
                                                  std::chrono::milliseconds timeout);

    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }
    void release() noexcept;

private:
    explicit FileLock(int fd) : fd_(fd) {}

    int fd_{-1};
};

} // namespace safedl::core
