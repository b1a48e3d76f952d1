/*
 * safedl/src/queue/transfer.cpp
 *
 * Transfer state machine: status edges and the per-item worker routine.
 */

#include <safedl/queue/transfer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace safedl::queue {

using downloader::FetchResult;
using downloader::ProgressUpdate;
using downloader::ResumeValidator;

bool canTransition(TransferStatus from, TransferStatus to) noexcept {
    using S = TransferStatus;
    switch (from) {
        case S::Queued:
            return to == S::Downloading || to == S::Paused;
        case S::Downloading:
            return to == S::Verifying || to == S::Completed || to == S::Failed ||
                   to == S::Paused || to == S::Queued;
        case S::Verifying:
            return to == S::Completed || to == S::Failed;
        case S::Paused:
            return to == S::Queued;
        case S::Failed:
            return to == S::Queued;
        case S::Completed:
            return false;
    }
    return false;
}

Result<void> applyTransition(DownloadItem& item, TransferStatus to, TimePoint now) {
    if (!canTransition(item.status, to)) {
        return Error{ErrorCode::InvalidState, std::string("Item ") + std::to_string(item.id) +
                                                  ": cannot go from " +
                                                  statusToString(item.status) + " to " +
                                                  statusToString(to)};
    }
    item.status = to;
    item.updatedAt = now;
    return Result<void>();
}

namespace {

// Store mutation moving one item along an edge, only if it is still in @p from.
template <typename Extra>
StateStore::Mutation transition(ItemId id, TransferStatus from, TransferStatus to, Extra extra) {
    return [=](QueueState& state) -> Result<void> {
        auto* item = state.find(id);
        if (!item) {
            return Error{ErrorCode::NotFound, "Item " + std::to_string(id) + " no longer exists"};
        }
        if (item->status != from) {
            return Error{ErrorCode::InvalidState, "Item " + std::to_string(id) + " is " +
                                                      statusToString(item->status) +
                                                      ", expected " + statusToString(from)};
        }
        if (auto r = applyTransition(*item, to, std::chrono::system_clock::now()); !r) {
            return r;
        }
        extra(*item);
        return Result<void>();
    };
}

std::int64_t toSigned(std::optional<std::uint64_t> v) {
    return v ? static_cast<std::int64_t>(*v) : std::int64_t{-1};
}

bool sameValidator(const ResumeValidator& a, const ResumeValidator& b) {
    return a.etag == b.etag && a.lastModified == b.lastModified;
}

} // namespace

TransferTask::TransferTask(ItemId id, TransferDeps deps, std::stop_token stopToken,
                           const std::atomic<StopReason>& stopReason)
    : id_(id), deps_(std::move(deps)), stopToken_(std::move(stopToken)), stopReason_(stopReason) {}

TransferEnd TransferTask::run() {
    auto snapshot = deps_.store.get(id_);
    if (!snapshot || snapshot->status != TransferStatus::Downloading) {
        return TransferEnd::Vanished;
    }
    const DownloadItem item = *snapshot;
    const auto partial = item.partialPath();
    const downloader::ShouldCancel shouldCancel = [this] { return stopRequested(); };
    ResumeValidator validator{item.etag, item.lastModified};

    auto onProgress = [this, &validator](const ProgressUpdate& p) {
        // The partial now holds bytes of this response: remember which version it is
        if (!p.validator.empty() && !sameValidator(p.validator, validator)) {
            validator = p.validator;
            auto saved = deps_.store.update([this, v = validator](QueueState& state) {
                if (auto* it = state.find(id_)) {
                    it->etag = v.etag;
                    it->lastModified = v.lastModified;
                }
                return Result<void>();
            });
            if (!saved) {
                spdlog::warn("Item {}: could not persist validators: {}", id_,
                             saved.error().message);
            }
        }
        deps_.store.recordProgress(id_, static_cast<std::int64_t>(p.bytesOnDisk),
                                   toSigned(p.totalBytes));
        if (auto r = deps_.store.flushIfDue(deps_.persistInterval); !r) {
            spdlog::warn("Item {}: could not persist progress: {}", id_, r.error().message);
        }
    };

    const int maxAttempts = std::max(1, deps_.retry.maxAttempts);
    for (int attempt = 1;; ++attempt) {
        if (stopRequested()) {
            return onStop();
        }

        // onProgress may replace the stored validator mid-fetch
        const ResumeValidator sent = validator;
        auto fetched = deps_.client.fetch(item.url, partial, deps_.limiter.get(), shouldCancel,
                                          onProgress, sent);
        if (fetched) {
            return verifyAndFinalize(item, fetched.value());
        }
        if (stopRequested()) {
            return onStop();
        }

        const Error& err = fetched.error();
        if (!isRetryable(err.code) || attempt >= maxAttempts) {
            return fail(err, TransferStatus::Downloading);
        }

        const auto delay = deps_.retry.backoffFor(attempt);
        spdlog::warn("Item {}: attempt {}/{} failed ({}); retrying in {} ms", id_, attempt,
                     maxAttempts, err.message, delay.count());
        deps_.store.recordProgress(
            id_, static_cast<std::int64_t>(downloader::partialSize(partial)), item.totalBytes);

        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lk(m);
        // Returns early only when a stop is requested
        (void)cv.wait_for(lk, stopToken_, delay, [] { return false; });
    }
}

TransferEnd TransferTask::verifyAndFinalize(const DownloadItem& item, const FetchResult& fetched) {
    const auto partial = item.partialPath();
    const auto bytes = static_cast<std::int64_t>(fetched.bytesOnDisk);
    const auto total = fetched.totalBytes ? static_cast<std::int64_t>(*fetched.totalBytes) : bytes;
    TransferStatus current = TransferStatus::Downloading;

    if (item.checksum) {
        auto entered = deps_.store.update(transition(
            id_, TransferStatus::Downloading, TransferStatus::Verifying,
            [bytes, total](DownloadItem& it) {
                it.bytesTransferred = bytes;
                it.totalBytes = total;
            }));
        if (!entered) {
            if (entered.error().code == ErrorCode::NotFound ||
                entered.error().code == ErrorCode::InvalidState) {
                return TransferEnd::Vanished;
            }
            return fail(entered.error(), TransferStatus::Downloading);
        }
        current = TransferStatus::Verifying;

        auto verified = downloader::verifyFile(partial, *item.checksum);
        if (!verified) {
            return fail(verified.error(), current);
        }
        if (!verified.value().matched) {
            return fail(Error{ErrorCode::ChecksumMismatch,
                              "checksum mismatch: expected " +
                                  downloader::formatChecksum(*item.checksum) + ", got " +
                                  verified.value().actualHex},
                        current);
        }
    } else if (stopRequested()) {
        // Nothing irreversible happened yet; honour the stop before the rename
        return onStop();
    }

    if (auto fin = downloader::finalizePartial(partial, item.outputPath); !fin) {
        return fail(fin.error(), current);
    }

    const bool hasChecksum = item.checksum.has_value();
    const auto fetchedValidator = fetched.validator;
    auto done = deps_.store.update(transition(
        id_, current, TransferStatus::Completed,
        [bytes, total, hasChecksum, fetchedValidator](DownloadItem& it) {
            it.bytesTransferred = bytes;
            it.totalBytes = total;
            if (!fetchedValidator.empty()) {
                it.etag = fetchedValidator.etag;
                it.lastModified = fetchedValidator.lastModified;
            }
            if (hasChecksum && it.checksum) {
                it.checksum->verified = true;
            }
            it.clearError();
        }));
    if (!done) {
        spdlog::error("Item {}: completed on disk but state update failed: {}", id_,
                      done.error().message);
        return TransferEnd::Vanished;
    }
    spdlog::info("Item {} completed: {} ({} bytes)", id_, item.outputPath.string(), bytes);
    return TransferEnd::Completed;
}

TransferEnd TransferTask::onStop() {
    const auto reason = stopReason_.load();
    if (reason == StopReason::Cancel || reason == StopReason::Remove) {
        return TransferEnd::HandedBack;
    }

    const auto target =
        reason == StopReason::Shutdown ? TransferStatus::Queued : TransferStatus::Paused;
    auto snapshot = deps_.store.get(id_);
    const auto bytes = snapshot ? static_cast<std::int64_t>(
                                      downloader::partialSize(snapshot->partialPath()))
                                : std::int64_t{0};
    auto r = deps_.store.update(transition(id_, TransferStatus::Downloading, target,
                                           [bytes](DownloadItem& it) {
                                               it.bytesTransferred = bytes;
                                           }));
    if (!r) {
        spdlog::warn("Item {}: could not record stop: {}", id_, r.error().message);
        return TransferEnd::Vanished;
    }
    spdlog::info("Item {} {} at {} bytes", id_,
                 target == TransferStatus::Paused ? "paused" : "re-queued", bytes);
    return target == TransferStatus::Paused ? TransferEnd::Paused : TransferEnd::Requeued;
}

TransferEnd TransferTask::fail(const Error& error, TransferStatus from) {
    spdlog::error("Item {} failed ({}): {}", id_, errorKindToString(classifyError(error.code)),
                  error.message);
    auto snapshot = deps_.store.get(id_);
    const auto bytes = snapshot ? static_cast<std::int64_t>(
                                      downloader::partialSize(snapshot->partialPath()))
                                : std::int64_t{0};
    auto r = deps_.store.update(transition(id_, from, TransferStatus::Failed,
                                           [error, bytes](DownloadItem& it) {
                                               it.setError(error);
                                               it.bytesTransferred = bytes;
                                           }));
    if (!r) {
        spdlog::warn("Item {}: could not record failure: {}", id_, r.error().message);
        return TransferEnd::Vanished;
    }
    return TransferEnd::Failed;
}

} // namespace safedl::queue
