#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace safedl {

// Type aliases
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using ItemId = std::uint64_t;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NotFound,
    InvalidState,
    NetworkError,
    Timeout,
    ServerError,
    ProtocolError,
    ChecksumMismatch,
    PermissionDenied,
    StorageFull,
    IoError,
    CorruptedData,
    UpgradeRequired,
    ResourceExhausted,
    OperationCancelled,
    NotSupported,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::StorageFull: return "Storage full";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::UpgradeRequired: return "Upgrade required";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

// ============================
// Failure taxonomy and results
// ============================

/**
 * @brief Coarse failure class recorded on a download item.
 *
 * Only Network failures are retried automatically; everything else is terminal until an
 * explicit retry/resume command.
 */
enum class ErrorKind { None, Network, Protocol, Verification, Filesystem, Cancelled, Unknown };

/**
 * @brief Exit-code style result surfaced to the presentation layer.
 */
enum class ResultCode : int {
    Success = 0,
    GeneralFailure = 1,
    NetworkFailure = 2,
    VerificationFailure = 3,
    FilesystemFailure = 4,
    ProtocolFailure = 5
};

constexpr ErrorKind classifyError(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorKind::None;
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
            return ErrorKind::Network;
        case ErrorCode::ProtocolError:
            return ErrorKind::Protocol;
        case ErrorCode::ChecksumMismatch:
            return ErrorKind::Verification;
        case ErrorCode::PermissionDenied:
        case ErrorCode::StorageFull:
        case ErrorCode::IoError:
            return ErrorKind::Filesystem;
        case ErrorCode::OperationCancelled:
            return ErrorKind::Cancelled;
        default:
            return ErrorKind::Unknown;
    }
}

// Transient failures are the only ones retried automatically.
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout ||
           code == ErrorCode::ServerError;
}

constexpr ResultCode resultCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return ResultCode::Success;
        case ErrorKind::Network:
            return ResultCode::NetworkFailure;
        case ErrorKind::Verification:
            return ResultCode::VerificationFailure;
        case ErrorKind::Filesystem:
            return ResultCode::FilesystemFailure;
        case ErrorKind::Protocol:
            return ResultCode::ProtocolFailure;
        case ErrorKind::Cancelled:
        case ErrorKind::Unknown:
            return ResultCode::GeneralFailure;
    }
    return ResultCode::GeneralFailure;
}

constexpr const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Network: return "network";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Verification: return "verification";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace safedl

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<safedl::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(safedl::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", safedl::errorToString(error));
    }
};
