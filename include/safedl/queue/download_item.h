#pragma once

#include <safedl/core/types.h>
#include <safedl/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safedl::queue {

using downloader::ChecksumSpec;

// Schema version written by this build
inline constexpr const char* kCurrentSchemaVersion = "1.1.0";

enum class TransferStatus { Queued, Downloading, Paused, Completed, Failed, Verifying };

constexpr const char* statusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Verifying: return "verifying";
    }
    return "queued";
}

std::optional<TransferStatus> parseStatus(std::string_view text);
std::optional<ErrorKind> parseErrorKind(std::string_view text);

/**
 * @brief One requested transfer and everything needed to continue it after a restart.
 */
struct DownloadItem {
    ItemId id{0};
    std::string url;
    std::filesystem::path outputPath;
    TransferStatus status{TransferStatus::Queued};
    std::int64_t bytesTransferred{0};
    std::int64_t totalBytes{-1}; // -1 until known
    std::optional<ChecksumSpec> checksum;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<std::string> lastError;
    ErrorKind errorKind{ErrorKind::None};
    int retryCount{0}; // manual retries consumed
    // Validators of the response that produced the partial file, for If-Range
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    // "<outputPath>.part"
    [[nodiscard]] std::filesystem::path partialPath() const;

    // Counted against maxParallel
    [[nodiscard]] bool inFlight() const noexcept {
        return status == TransferStatus::Downloading || status == TransferStatus::Verifying;
    }

    [[nodiscard]] bool terminal() const noexcept {
        return status == TransferStatus::Completed || status == TransferStatus::Failed;
    }

    // Success for completed items, the failure class otherwise
    [[nodiscard]] ResultCode resultCode() const noexcept;

    void setError(const Error& error);
    void clearError();
};

struct QueueState {
    std::string schemaVersion{kCurrentSchemaVersion};
    std::vector<DownloadItem> items; // insertion (id) order
    ItemId lastAssignedId{0};

    [[nodiscard]] DownloadItem* find(ItemId id);
    [[nodiscard]] const DownloadItem* find(ItemId id) const;
};

// ISO-8601 UTC with second precision: "2026-10-18T09:00:00Z"
std::string formatTimestamp(TimePoint tp);
// Accepts the format above, optional fractional seconds and a "+00:00" suffix
std::optional<TimePoint> parseTimestamp(std::string_view text);

nlohmann::json toJson(const DownloadItem& item);
nlohmann::json toJson(const QueueState& state);

/**
 * @brief Strict decoding of a current-version document.
 *
 * Any type mismatch, unknown status, malformed checksum or duplicate id is CorruptedData.
 */
Result<DownloadItem> itemFromJson(const nlohmann::json& j);
Result<QueueState> queueStateFromJson(const nlohmann::json& j);

// Canonical text form: sorted keys, two-space indent, trailing newline
std::string serialize(const QueueState& state);

} // namespace safedl::queue
