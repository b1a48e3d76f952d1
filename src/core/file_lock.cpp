#include <safedl/core/atomic_file.h>
#include <safedl/core/file_lock.h>

#include <spdlog/spdlog.h>

#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace safedl::core {

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<FileLock> FileLock::acquire(const std::filesystem::path& lockPath,
                                   std::chrono::milliseconds timeout) {
    int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return makeErrnoError(errno, "Failed to open lock file", lockPath);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return FileLock(fd);
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int err = errno;
            ::close(fd);
            return makeErrnoError(err, "flock() failed", lockPath);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            return Error{ErrorCode::ResourceExhausted,
                         "Timed out waiting for state lock: " + lockPath.string()};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        (void)::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace safedl::core
