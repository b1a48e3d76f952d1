#pragma once

#include <safedl/downloader/downloader.hpp>
#include <safedl/downloader/resume_client.h>
#include <safedl/queue/download_item.h>
#include <safedl/queue/state_store.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>

namespace safedl::queue {

/**
 * @brief Allowed status edges.
 *
 * queued->downloading is taken by the scheduler only. downloading->queued is reserved for
 * engine shutdown and interrupted-transfer recovery.
 */
bool canTransition(TransferStatus from, TransferStatus to) noexcept;

// Move @p item to @p to (InvalidState for an illegal edge) and stamp updatedAt.
Result<void> applyTransition(DownloadItem& item, TransferStatus to, TimePoint now);

// Why a running transfer was asked to stop
enum class StopReason : int { None, Pause, Cancel, Remove, Shutdown };

// How TransferTask::run() left the item
enum class TransferEnd {
    Completed,
    Failed,
    Paused,
    Requeued,   // engine shutdown: back to queued, partial kept
    HandedBack, // cancel/remove: the engine finishes the job
    Vanished    // item removed or changed underneath the worker
};

struct TransferDeps {
    StateStore& store;
    const downloader::ResumeClient& client;
    downloader::RetryPolicy retry;
    std::chrono::milliseconds persistInterval{1000};
    std::shared_ptr<downloader::IRateLimiter> limiter; // may be null (unlimited)
};

/**
 * @brief Executes one admitted item to a terminal or resumable state.
 *
 * Resume offset comes from the partial file. Transient failures are retried with
 * exponential backoff (the wait is interrupted by the stop token). After the body is
 * complete the item enters verifying when it carries a checksum; a mismatch fails the item
 * and keeps the partial file for inspection. A verified (or unchecked) file is renamed
 * atomically onto the output path.
 */
class TransferTask {
public:
    TransferTask(ItemId id, TransferDeps deps, std::stop_token stopToken,
                 const std::atomic<StopReason>& stopReason);

    TransferEnd run();

private:
    TransferEnd onStop();
    TransferEnd fail(const Error& error, TransferStatus from);
    TransferEnd verifyAndFinalize(const DownloadItem& item,
                                  const downloader::FetchResult& fetched);
    bool stopRequested() const { return stopToken_.stop_requested(); }

    ItemId id_;
    TransferDeps deps_;
    std::stop_token stopToken_;
    const std::atomic<StopReason>& stopReason_;
};

} // namespace safedl::queue
