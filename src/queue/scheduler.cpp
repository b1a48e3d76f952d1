#include <safedl/queue/scheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace safedl::queue {

Scheduler::Scheduler(StateStore& store, std::size_t maxParallel)
    : store_(store), maxParallel_(std::max<std::size_t>(1, maxParallel)) {}

std::size_t Scheduler::countInFlight(const QueueState& state) {
    return static_cast<std::size_t>(std::count_if(
        state.items.begin(), state.items.end(), [](const DownloadItem& i) { return i.inFlight(); }));
}

Result<void> Scheduler::setMaxParallel(std::size_t maxParallel) {
    if (maxParallel == 0) {
        return Error{ErrorCode::InvalidArgument, "maxParallel must be at least 1"};
    }
    maxParallel_.store(maxParallel);
    return Result<void>();
}

Result<std::vector<ItemId>> Scheduler::admit(const std::set<ItemId>& busy) {
    const std::size_t limit = maxParallel_.load();

    // Cheap pre-check so an idle queue does not rewrite the document
    {
        auto snapshot = store_.snapshot();
        const bool anyQueued =
            std::any_of(snapshot.items.begin(), snapshot.items.end(), [&](const DownloadItem& i) {
                return i.status == TransferStatus::Queued && !busy.count(i.id);
            });
        if (!anyQueued || countInFlight(snapshot) >= limit) {
            return std::vector<ItemId>{};
        }
    }

    std::vector<ItemId> admitted;
    bool nothingToAdmit = false;
    auto r = store_.update([&](QueueState& state) -> Result<void> {
        admitted.clear();
        nothingToAdmit = false;
        std::size_t inFlight = countInFlight(state);
        std::vector<DownloadItem*> candidates;
        for (auto& item : state.items) {
            if (item.status == TransferStatus::Queued && !busy.count(item.id)) {
                candidates.push_back(&item);
            }
        }
        std::sort(candidates.begin(), candidates.end(),
                  [](const DownloadItem* a, const DownloadItem* b) { return a->id < b->id; });

        const auto now = std::chrono::system_clock::now();
        for (auto* item : candidates) {
            if (inFlight >= limit)
                break;
            item->status = TransferStatus::Downloading;
            item->updatedAt = now;
            item->bytesTransferred =
                static_cast<std::int64_t>(downloader::partialSize(item->partialPath()));
            admitted.push_back(item->id);
            ++inFlight;
        }
        if (admitted.empty()) {
            // Abort the update: nothing changed, nothing to write
            nothingToAdmit = true;
            return Error{ErrorCode::InvalidState, "nothing to admit"};
        }
        return Result<void>();
    });

    if (!r) {
        if (nothingToAdmit) {
            return std::vector<ItemId>{};
        }
        return r.error();
    }
    for (auto id : admitted) {
        spdlog::debug("Admitted item {} ({} max in flight)", id, limit);
    }
    return admitted;
}

} // namespace safedl::queue
