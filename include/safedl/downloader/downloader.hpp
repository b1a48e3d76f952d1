#pragma once

/*
 * safedl downloader - public types and component interfaces (C++20)
 *
 * Leaf components used by the download engine:
 * - HTTP adapter (libcurl) with Range support and streaming body sink
 * - Integrity verifier (OpenSSL EVP streaming digests)
 * - Token-bucket rate limiter (global and per-item scopes)
 * - Partial file writer (append/truncate, errno classification, atomic finalize)
 */

#include <safedl/core/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace safedl::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Digest algorithms supported for integrity verification.
 * Sha1 and Md5 are accepted for backward compatibility only; see isWeakAlgorithm().
 */
enum class HashAlgo { Sha256, Sha512, Sha1, Md5 };

[[nodiscard]] constexpr const char* hashAlgoName(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256: return "sha256";
        case HashAlgo::Sha512: return "sha512";
        case HashAlgo::Sha1: return "sha1";
        case HashAlgo::Md5: return "md5";
    }
    return "sha256";
}

// Expected length of the hex digest for an algorithm.
[[nodiscard]] constexpr std::size_t digestHexLength(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256: return 64;
        case HashAlgo::Sha512: return 128;
        case HashAlgo::Sha1: return 40;
        case HashAlgo::Md5: return 32;
    }
    return 64;
}

// Legacy digests are accepted but must not be treated as equivalent to strong ones.
[[nodiscard]] constexpr bool isWeakAlgorithm(HashAlgo algo) {
    return algo == HashAlgo::Md5 || algo == HashAlgo::Sha1;
}

// Case-insensitive; accepts "sha256", "sha-256", "SHA512", "md5", "sha1".
[[nodiscard]] std::optional<HashAlgo> parseHashAlgo(std::string_view name);

// ===================
// Small data objects
// ===================

struct Header {
    std::string name;
    std::string value;
};

/**
 * Computed digest (algorithm + lower-case hex).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/**
 * Expected digest attached to a download item. 'verified' is set once the final file matched.
 */
struct ChecksumSpec {
    HashAlgo algo{HashAlgo::Sha256};
    std::string expectedHex; // lower-case
    bool verified{false};
};

/**
 * Parse "<algo>:<hex>" (e.g. "sha256:ab12..."). The hex length must match the algorithm.
 */
[[nodiscard]] Result<ChecksumSpec> parseChecksum(std::string_view text);

// "<algo>:<hex>"
[[nodiscard]] std::string formatChecksum(const ChecksumSpec& spec);

/**
 * Retry/backoff policy for transient failures.
 * Delay before retry n (1-based) = initialBackoff * multiplier^(n-1), capped at maxBackoff.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{30000};

    [[nodiscard]] std::chrono::milliseconds backoffFor(int retryNumber) const;
};

/**
 * Rate limit configuration (0 = unlimited). burstBytes = 0 means "equal to the rate".
 */
struct RateLimit {
    std::uint64_t globalBps{0};
    std::uint64_t perItemBps{0};
    std::uint64_t burstBytes{0};
};

struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

struct NetworkConfig {
    std::chrono::milliseconds connectTimeout{30000};
    // Abort when the transfer stays below 1 byte/s for this long (0 = disabled)
    std::chrono::milliseconds lowSpeedTimeout{60000};
    bool followRedirects{true};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"safedl/1.0"};
};

// ===================
// HTTP adapter types
// ===================

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    // When set, the adapter sends "Range: bytes=<rangeStart>-"
    std::optional<std::uint64_t> rangeStart;
};

/**
 * Parsed "Content-Range" header.
 * "bytes 100-199/1000" -> {100, 199, 1000}. The 416 form with a '*' range yields
 * unsatisfied = true and only the total.
 */
struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total;
    bool unsatisfied{false};
};

[[nodiscard]] std::optional<ContentRange> parseContentRange(std::string_view value);

// "<scheme>://<host>..." with an RFC 3986 scheme and a non-empty authority.
[[nodiscard]] bool isAbsoluteUrl(std::string_view url);

// Lower-cased scheme of an absolute URL ("" when not absolute).
[[nodiscard]] std::string urlScheme(std::string_view url);

/**
 * Status line and headers of the final (post-redirect) response.
 */
struct HttpResponseInfo {
    long status{0};
    std::optional<std::uint64_t> contentLength;
    std::optional<std::string> contentRange;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    bool acceptRangesBytes{false};
};

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
// Called once when the final response headers are known, before any body byte is delivered.
// Returning an error aborts the transfer with that error.
using ResponseHandler = std::function<Result<void>(const HttpResponseInfo&)>;
using BodySink = std::function<Result<void>(ByteSpan)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl implementation in http_adapter_curl.cpp).
 * One GET per call; the body is streamed to the sink on the calling thread.
 *
 * Errors: NetworkError/Timeout for transport failures, OperationCancelled when
 * shouldCancel() fired, or whatever the response handler / sink returned.
 * HTTP status codes are not turned into errors here; the response handler decides.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Result<HttpResponseInfo> get(const HttpRequest& request, const NetworkConfig& net,
                                         const ResponseHandler& onResponse, const BodySink& sink,
                                         const ShouldCancel& shouldCancel) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual Result<void> reset(HashAlgo algo) = 0;
    virtual void update(ByteSpan data) = 0;
    virtual Result<Checksum> finalize() = 0;
};

/**
 * Outcome of comparing a file against an expected digest. A mismatch is a normal outcome.
 */
struct VerificationResult {
    bool matched{false};
    HashAlgo algo{HashAlgo::Sha256};
    std::string actualHex;
    bool weakAlgorithm{false};
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks until 'bytes' tokens are available, then debits them.
     * Returns false if shouldCancel() fired before the tokens were granted.
     */
    virtual bool acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) = 0;

    /**
     * Change the rate at runtime (0 = unlimited). burst = 0 uses the rate as capacity.
     */
    virtual void setRate(std::uint64_t bytesPerSecond, std::uint64_t burst = 0) = 0;

    [[nodiscard]] virtual std::uint64_t rate() const = 0;
};

/**
 * Single token bucket: capacity = burst, refill = rate bytes/second.
 * Thread-safe; one instance can be shared by all transfers to enforce an aggregate ceiling.
 */
class TokenBucketLimiter final : public IRateLimiter {
public:
    explicit TokenBucketLimiter(std::uint64_t bytesPerSecond = 0, std::uint64_t burst = 0);

    bool acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override;
    void setRate(std::uint64_t bytesPerSecond, std::uint64_t burst = 0) override;
    [[nodiscard]] std::uint64_t rate() const override;
    [[nodiscard]] std::uint64_t capacity() const;

private:
    using clock_t = std::chrono::steady_clock;

    void refillLocked(clock_t::time_point now);

    mutable std::mutex mutex_;
    double rateBps_{0.0};
    double capacity_{0.0};
    double tokens_{0.0};
    clock_t::time_point lastRefill_{clock_t::now()};
};

/**
 * Applies several limiters in sequence (e.g. global bucket + per-item bucket).
 */
class CompositeRateLimiter final : public IRateLimiter {
public:
    explicit CompositeRateLimiter(std::vector<std::shared_ptr<IRateLimiter>> limiters);

    bool acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override;
    // Applies to every chained limiter.
    void setRate(std::uint64_t bytesPerSecond, std::uint64_t burst = 0) override;
    // Lowest non-zero rate of the chain (0 if all unlimited).
    [[nodiscard]] std::uint64_t rate() const override;

private:
    std::vector<std::shared_ptr<IRateLimiter>> limiters_;
};

// ======================
// Partial file handling
// ======================

/**
 * Open handle on a ".part" artifact. Writes are classified via errno so that permission and
 * disk-full failures are distinguishable from generic I/O errors.
 */
class PartialFile {
public:
    enum class Mode { Append, Truncate };

    PartialFile() = default;
    ~PartialFile();
    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;
    PartialFile(PartialFile&& other) noexcept;
    PartialFile& operator=(PartialFile&& other) noexcept;

    [[nodiscard]] static Result<PartialFile> open(const std::filesystem::path& path, Mode mode);

    Result<void> write(ByteSpan data);
    Result<void> sync();
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t size_{0};
    std::filesystem::path path_;
};

// Deterministic sibling path holding in-progress bytes: "<output>.part".
[[nodiscard]] std::filesystem::path partialPathFor(const std::filesystem::path& outputPath);

// Size of an existing partial file, 0 when absent.
[[nodiscard]] std::uint64_t partialSize(const std::filesystem::path& partialPath);

// fsync + atomic rename of the partial onto the final output (EXDEV falls back to copy).
Result<void> finalizePartial(const std::filesystem::path& partialPath,
                             const std::filesystem::path& outputPath);

// Delete a partial artifact; a missing file is not an error.
Result<void> removePartial(const std::filesystem::path& partialPath);

// =========
// Factories
// =========

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();

/**
 * Stream a file (constant memory) through the given digest.
 */
Result<Checksum> computeFileDigest(const std::filesystem::path& path, HashAlgo algo);

/**
 * Compare the digest of a file with expectedHex (case-insensitive).
 * Only I/O problems are errors; a mismatch is returned as matched == false.
 */
Result<VerificationResult> verifyFile(const std::filesystem::path& path, HashAlgo algo,
                                      std::string_view expectedHex);

inline Result<VerificationResult> verifyFile(const std::filesystem::path& path,
                                             const ChecksumSpec& spec) {
    return verifyFile(path, spec.algo, spec.expectedHex);
}

} // namespace safedl::downloader
