#pragma once

#include <safedl/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace safedl::downloader {

/**
 * @brief How a fetch related to the bytes already on disk.
 */
enum class ResumeOutcome {
    Fresh,          // no partial data, full 200 response
    Appended,       // 206 continued the partial file
    Restarted,      // server ignored Range (200); partial truncated and rewritten
    AlreadyComplete // 416 at offset: the partial file already holds the whole resource
};

/**
 * @brief Validators identifying the version of the resource held in a partial file.
 */
struct ResumeValidator {
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    [[nodiscard]] bool empty() const noexcept { return !etag && !lastModified; }
};

struct FetchResult {
    ResumeOutcome outcome{ResumeOutcome::Fresh};
    std::uint64_t bytesOnDisk{0};
    std::optional<std::uint64_t> totalBytes;
    ResumeValidator validator;
};

struct ProgressUpdate {
    std::uint64_t bytesOnDisk{0};
    std::optional<std::uint64_t> totalBytes;
    // Validators of the response currently being written
    ResumeValidator validator;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

/**
 * @brief Continues a transfer from the bytes already present in a partial file.
 *
 * The resume offset is the current size of the partial file. A non-zero offset sends
 * "Range: bytes=<offset>-", plus "If-Range" when a validator of the partial is known
 * (a strong ETag, else Last-Modified). Outcomes:
 * - 206 with a Content-Range starting at the offset appends; any other start is a
 *   ProtocolError. A 206 carrying an ETag different from the stored one means the resource
 *   changed: the partial file is deleted and a retryable NetworkError is returned.
 * - A 206 that stops short of the resource's last byte is a retryable NetworkError once its
 *   range has been written; the next attempt continues from the new size.
 * - 200 to a ranged request truncates the partial file and restarts from zero.
 * - 416 at a non-zero offset means the file is already complete, unless the server
 *   reports a different total size in its Content-Range, which is a ProtocolError.
 * - Any other 4xx/5xx is a (retryable) ServerError.
 *
 * The body flows through the rate limiter into the partial file. A short body is a
 * retryable NetworkError; a body longer than announced is a ProtocolError. The partial
 * file is left on disk on every failure. One attempt per call; retries belong to the caller.
 */
class ResumeClient {
public:
    ResumeClient(std::shared_ptr<IHttpAdapter> http, NetworkConfig network,
                 std::chrono::milliseconds progressInterval = std::chrono::milliseconds(500));

    Result<FetchResult> fetch(const std::string& url, const std::filesystem::path& partialPath,
                              IRateLimiter* limiter, const ShouldCancel& shouldCancel,
                              const ProgressCallback& onProgress,
                              const ResumeValidator& validator = {}) const;

private:
    std::shared_ptr<IHttpAdapter> http_;
    NetworkConfig network_;
    std::chrono::milliseconds progressInterval_;
};

} // namespace safedl::downloader
