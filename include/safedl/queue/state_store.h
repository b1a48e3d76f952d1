#pragma once

#include <safedl/core/types.h>
#include <safedl/queue/download_item.h>
#include <safedl/queue/state_migration.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace safedl::queue {

/**
 * @brief What happened while the persisted queue was opened.
 */
struct LoadReport {
    bool createdNew{false};
    bool recoveredFromCorruption{false};
    std::filesystem::path corruptPath; // where the unreadable document was moved
    std::string corruptReason;
    std::vector<std::string> migrationsApplied;
    std::vector<std::filesystem::path> backups;
    std::vector<ItemId> interruptedRecovered; // downloading/verifying items put back in queue
};

/**
 * @brief Durable owner of the QueueState.
 *
 * Every mutation is a serialized read-modify-write: an in-process mutex plus an advisory
 * flock on "<state>.lock". When another process rewrote the document since our last write,
 * it is re-read before the mutation is applied. Writes go through temp file + fsync +
 * rename, so a crash leaves either the previous or the new document.
 *
 * Progress is special: recordProgress() only touches memory and flushIfDue() persists it at
 * a bounded rate. Status changes are persisted by update() immediately.
 */
class StateStore {
public:
    using Mutation = std::function<Result<void>(QueueState&)>;

    ~StateStore();
    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /**
     * @brief Load (and migrate or recover) the document at @p statePath.
     *
     * Errors: UpgradeRequired when the document was written by a newer version (the file
     * is left untouched), ResourceExhausted when the lock could not be taken in time,
     * filesystem errors for an unusable state directory.
     */
    static Result<std::unique_ptr<StateStore>> open(const std::filesystem::path& statePath,
                                                     std::chrono::milliseconds lockTimeout);

    const LoadReport& loadReport() const noexcept { return report_; }
    const std::filesystem::path& path() const noexcept { return statePath_; }

    QueueState snapshot() const;
    std::optional<DownloadItem> get(ItemId id) const;

    /**
     * @brief Apply @p mutate under the store lock and persist the result.
     *
     * When @p mutate returns an error nothing changes, in memory or on disk.
     */
    Result<void> update(const Mutation& mutate);

    // Memory-only progress; returns false when the item no longer exists.
    bool recordProgress(ItemId id, std::int64_t bytesTransferred, std::int64_t totalBytes);

    // Persist recorded progress if any is pending and @p interval elapsed since the last write.
    Result<void> flushIfDue(std::chrono::milliseconds interval);
    Result<void> flush();

    /**
     * @brief Delete the document and start over with an empty queue.
     *
     * lastAssignedId is kept so ids handed out by this process are never reused.
     */
    Result<void> destroy();

private:
    struct Fingerprint {
        bool exists{false};
        std::uintmax_t size{0};
        std::int64_t mtimeNs{0};
        std::uint64_t inode{0};
        bool operator==(const Fingerprint&) const = default;
    };

    StateStore(std::filesystem::path statePath, std::chrono::milliseconds lockTimeout);

    Result<void> loadLocked();
    Result<void> reloadIfChangedLocked();
    Result<void> writeLocked(const QueueState& state);
    Result<void> moveAsideCorrupt(const std::string& reason);
    void removeStaleTempFiles() const;
    Fingerprint fingerprint() const;
    std::filesystem::path lockPath() const;

    std::filesystem::path statePath_;
    std::chrono::milliseconds lockTimeout_;
    StateMigrator migrator_;

    mutable std::mutex mutex_;
    QueueState state_;
    Fingerprint lastWritten_{};
    std::map<ItemId, std::pair<std::int64_t, std::int64_t>> pendingProgress_;
    std::chrono::steady_clock::time_point lastFlush_{std::chrono::steady_clock::now()};
    LoadReport report_;
};

} // namespace safedl::queue
