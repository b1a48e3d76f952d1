/*
 * safedl/src/queue/engine.cpp
 *
 * Engine facade: command handling, admission pump and worker lifecycle.
 *
 * Locking order is engine mutex -> store mutex. Workers never take the engine mutex while
 * inside a store call, and every admission happens under the engine mutex, so a command
 * always sees a stable set of running workers.
 */

#include <safedl/core/logging.h>
#include <safedl/queue/engine.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace safedl::queue {

namespace fs = std::filesystem;
using downloader::CompositeRateLimiter;
using downloader::IRateLimiter;
using downloader::TokenBucketLimiter;

namespace {

Error notFound(ItemId id) {
    return Error{ErrorCode::NotFound, "No item with id " + std::to_string(id)};
}

Error wrongState(const DownloadItem& item, std::string_view command) {
    return Error{ErrorCode::InvalidState, std::string("Cannot ") + std::string(command) +
                                              " item " + std::to_string(item.id) + " while " +
                                              statusToString(item.status)};
}

// Mutation applying @p fn to one item; NotFound if it disappeared.
template <typename Fn> StateStore::Mutation onItem(ItemId id, Fn fn) {
    return [=](QueueState& state) -> Result<void> {
        auto* item = state.find(id);
        if (!item) {
            return notFound(id);
        }
        return fn(*item);
    };
}

} // namespace

Engine::Engine(config::EngineConfig config, std::unique_ptr<StateStore> store,
               std::shared_ptr<downloader::IHttpAdapter> http)
    : config_(std::move(config)),
      store_(std::move(store)),
      scheduler_(*store_, config_.maxParallel),
      http_(std::move(http)),
      client_(http_, config_.network, config_.progressInterval),
      globalLimiter_(std::make_shared<TokenBucketLimiter>(config_.rateLimit.globalBps,
                                                          config_.rateLimit.burstBytes)),
      rateLimit_(config_.rateLimit) {}

Engine::~Engine() {
    shutdown();
}

Result<std::unique_ptr<Engine>> Engine::open(config::EngineConfig config,
                                             EngineDependencies deps) {
    if (auto v = config::validate(config); !v) {
        return v.error();
    }
    logging::configure(config.logging);
    const auto statePath = config.statePath();
    auto store = StateStore::open(statePath, config.lockTimeout);
    if (!store) {
        return store.error();
    }

    const auto& report = store.value()->loadReport();
    if (report.recoveredFromCorruption) {
        spdlog::error("Started with an empty queue; previous state kept at {}",
                      report.corruptPath.string());
    }
    for (const auto& step : report.migrationsApplied) {
        spdlog::info("Queue state migrated: {}", step);
    }

    auto http = deps.http ? deps.http
                          : std::shared_ptr<downloader::IHttpAdapter>(
                                downloader::makeCurlHttpAdapter());
    std::unique_ptr<Engine> engine(
        new Engine(std::move(config), std::move(store).value(), std::move(http)));
    spdlog::debug("Engine opened with state {} ({} items)", statePath.string(),
                  engine->store_->snapshot().items.size());
    return engine;
}

void Engine::start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (started_) {
        return;
    }
    started_ = true;
    stopping_ = false;
    ensurePoolCapacityLocked(scheduler_.maxParallel());
    pumpLocked();
}

void Engine::shutdown() {
    std::vector<std::unique_ptr<boost::asio::thread_pool>> pools;
    {
        std::unique_lock<std::mutex> lk(mutex_);
        stopping_ = true;
        for (auto& [id, worker] : active_) {
            worker->reason.store(StopReason::Shutdown);
            worker->stop.request_stop();
        }
        activeCv_.wait(lk, [this] { return active_.empty(); });
        started_ = false;
        if (pool_) {
            pools.push_back(std::move(pool_));
        }
        for (auto& p : retiredPools_) {
            pools.push_back(std::move(p));
        }
        retiredPools_.clear();
        poolThreads_ = 0;
    }
    for (auto& p : pools) {
        p->join();
    }
    if (auto r = store_->flush(); !r) {
        spdlog::warn("Failed to flush queue state on shutdown: {}", r.error().message);
    }
}

void Engine::ensurePoolCapacityLocked(std::size_t threads) {
    if (pool_ && poolThreads_ >= threads) {
        return;
    }
    if (pool_) {
        // Running transfers finish on the old pool; it is joined at shutdown
        retiredPools_.push_back(std::move(pool_));
    }
    pool_ = std::make_unique<boost::asio::thread_pool>(threads);
    poolThreads_ = threads;
    spdlog::debug("Transfer pool sized to {} threads", threads);
}

void Engine::pumpLocked() {
    if (!started_ || stopping_ || !pool_) {
        return;
    }
    std::set<ItemId> busy;
    for (const auto& [id, worker] : active_) {
        busy.insert(id);
    }
    auto admitted = scheduler_.admit(busy);
    if (!admitted) {
        spdlog::error("Admission failed: {}", admitted.error().message);
        return;
    }
    for (auto id : admitted.value()) {
        auto worker = std::make_shared<Worker>();
        worker->itemLimiter =
            std::make_shared<TokenBucketLimiter>(rateLimit_.perItemBps, rateLimit_.burstBytes);
        active_[id] = worker;
        boost::asio::post(*pool_, [this, id, worker] { runWorker(id, worker); });
    }
}

void Engine::runWorker(ItemId id, std::shared_ptr<Worker> worker) {
    auto limiter = std::make_shared<CompositeRateLimiter>(
        std::vector<std::shared_ptr<IRateLimiter>>{globalLimiter_, worker->itemLimiter});
    TransferDeps deps{*store_, client_, config_.retry, config_.persistInterval, limiter};
    TransferTask task(id, deps, worker->stop.get_token(), worker->reason);

    try {
        const auto end = task.run();
        spdlog::debug("Worker for item {} finished ({})", id, static_cast<int>(end));
    } catch (const std::exception& e) {
        spdlog::error("Worker for item {} aborted: {}", id, e.what());
        auto r = store_->update(onItem(id, [msg = std::string(e.what())](DownloadItem& item) {
            if (!item.inFlight())
                return Result<void>();
            item.status = TransferStatus::Failed;
            item.updatedAt = std::chrono::system_clock::now();
            item.setError(Error{ErrorCode::Unknown, msg});
            return Result<void>();
        }));
        if (!r) {
            spdlog::error("Could not record aborted worker for item {}: {}", id,
                          r.error().message);
        }
    }

    std::lock_guard<std::mutex> lk(mutex_);
    active_.erase(id);
    activeCv_.notify_all();
    pumpLocked();
}

void Engine::stopAndWaitLocked(std::unique_lock<std::mutex>& lk, ItemId id, StopReason reason) {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }
    it->second->reason.store(reason);
    it->second->stop.request_stop();
    activeCv_.wait(lk, [&] { return active_.find(id) == active_.end(); });
}

Result<EnqueueReceipt> Engine::enqueue(const std::string& url, const fs::path& outputPath,
                                       std::optional<ChecksumSpec> checksum) {
    if (!downloader::isAbsoluteUrl(url)) {
        return Error{ErrorCode::InvalidArgument, "URL must be absolute: '" + url + "'"};
    }
    if (outputPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "Output path must not be empty"};
    }
    std::error_code ec;
    const fs::path output = fs::absolute(outputPath, ec).lexically_normal();
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "Cannot resolve output path " + outputPath.string() + ": " + ec.message()};
    }

    EnqueueReceipt receipt;
    if (checksum) {
        checksum->verified = false;
        if (downloader::isWeakAlgorithm(checksum->algo)) {
            std::string warning = std::string(downloader::hashAlgoName(checksum->algo)) +
                                  " is a weak digest; prefer sha256 or sha512";
            spdlog::warn("{} ({})", warning, url);
            receipt.warnings.push_back(std::move(warning));
        }
    }

    std::unique_lock<std::mutex> lk(mutex_);
    ItemId assigned = 0;
    auto r = store_->update([&](QueueState& state) -> Result<void> {
        for (const auto& existing : state.items) {
            if (existing.status != TransferStatus::Completed &&
                existing.outputPath.lexically_normal() == output) {
                return Error{ErrorCode::InvalidArgument,
                             "Output path " + output.string() + " is already used by item " +
                                 std::to_string(existing.id)};
            }
        }
        DownloadItem item;
        item.id = ++state.lastAssignedId;
        item.url = url;
        item.outputPath = output;
        item.status = TransferStatus::Queued;
        item.checksum = checksum;
        item.createdAt = item.updatedAt = std::chrono::system_clock::now();
        assigned = item.id;
        state.items.push_back(std::move(item));
        return Result<void>();
    });
    if (!r) {
        return r.error();
    }
    receipt.id = assigned;
    spdlog::info("Queued item {}: {} -> {}", assigned, url, output.string());
    pumpLocked();
    return receipt;
}

std::vector<DownloadItem> Engine::list(const ListFilter& filter) const {
    auto state = store_->snapshot();
    std::vector<DownloadItem> out;
    out.reserve(state.items.size());
    for (auto& item : state.items) {
        if (!filter.statuses.empty() &&
            std::find(filter.statuses.begin(), filter.statuses.end(), item.status) ==
                filter.statuses.end()) {
            continue;
        }
        if (!filter.ids.empty() &&
            std::find(filter.ids.begin(), filter.ids.end(), item.id) == filter.ids.end()) {
            continue;
        }
        out.push_back(std::move(item));
    }
    return out;
}

Result<DownloadItem> Engine::get(ItemId id) const {
    auto item = store_->get(id);
    if (!item) {
        return notFound(id);
    }
    return *item;
}

Result<void> Engine::pause(ItemId id) {
    std::unique_lock<std::mutex> lk(mutex_);
    auto item = store_->get(id);
    if (!item) {
        return notFound(id);
    }

    switch (item->status) {
        case TransferStatus::Paused:
            return Result<void>();
        case TransferStatus::Queued:
            return store_->update(onItem(id, [](DownloadItem& it) -> Result<void> {
                return applyTransition(it, TransferStatus::Paused,
                                       std::chrono::system_clock::now());
            }));
        case TransferStatus::Downloading:
            if (!active_.count(id)) {
                return Error{ErrorCode::InvalidState,
                             "Item " + std::to_string(id) + " is running in another process"};
            }
            stopAndWaitLocked(lk, id, StopReason::Pause);
            return Result<void>();
        default:
            return wrongState(*item, "pause");
    }
}

Result<void> Engine::resume(ItemId id) {
    std::unique_lock<std::mutex> lk(mutex_);
    auto item = store_->get(id);
    if (!item) {
        return notFound(id);
    }

    switch (item->status) {
        case TransferStatus::Paused: {
            auto r = store_->update(onItem(id, [](DownloadItem& it) -> Result<void> {
                if (auto t = applyTransition(it, TransferStatus::Queued,
                                             std::chrono::system_clock::now());
                    !t) {
                    return t;
                }
                it.clearError();
                return Result<void>();
            }));
            if (!r) {
                return r;
            }
            pumpLocked();
            return Result<void>();
        }
        case TransferStatus::Failed:
            lk.unlock();
            return retry(id);
        case TransferStatus::Queued:
        case TransferStatus::Downloading:
        case TransferStatus::Verifying:
            return Result<void>();
        default:
            return wrongState(*item, "resume");
    }
}

Result<void> Engine::cancel(ItemId id) {
    std::unique_lock<std::mutex> lk(mutex_);
    auto item = store_->get(id);
    if (!item) {
        return notFound(id);
    }

    if (item->status == TransferStatus::Downloading) {
        if (!active_.count(id)) {
            return Error{ErrorCode::InvalidState,
                         "Item " + std::to_string(id) + " is running in another process"};
        }
        stopAndWaitLocked(lk, id, StopReason::Cancel);
        item = store_->get(id);
        if (!item) {
            return notFound(id);
        }
    }

    const auto status = item->status;
    if (status != TransferStatus::Queued && status != TransferStatus::Paused &&
        status != TransferStatus::Downloading) {
        return wrongState(*item, "cancel");
    }

    // Deleting the partial is its own step; the state change below is recorded either way
    auto removed = downloader::removePartial(item->partialPath());
    const auto remaining = static_cast<std::int64_t>(downloader::partialSize(item->partialPath()));

    auto r = store_->update(onItem(id, [remaining](DownloadItem& it) -> Result<void> {
        if (it.status != TransferStatus::Paused) {
            if (auto t = applyTransition(it, TransferStatus::Paused,
                                         std::chrono::system_clock::now());
                !t) {
                return t;
            }
        } else {
            it.updatedAt = std::chrono::system_clock::now();
        }
        it.bytesTransferred = remaining;
        it.lastError = "cancelled by user";
        it.errorKind = ErrorKind::Cancelled;
        return Result<void>();
    }));
    if (!r) {
        return r;
    }
    if (!removed) {
        spdlog::warn("Item {} cancelled but its partial file remains: {}", id,
                     removed.error().message);
        return removed;
    }
    spdlog::info("Item {} cancelled", id);
    return Result<void>();
}

Result<void> Engine::retry(ItemId id) {
    std::unique_lock<std::mutex> lk(mutex_);
    auto item = store_->get(id);
    if (!item) {
        return notFound(id);
    }
    if (item->status != TransferStatus::Failed) {
        return wrongState(*item, "retry");
    }
    if (item->retryCount >= config_.maxManualRetries) {
        return Error{ErrorCode::ResourceExhausted,
                     "Item " + std::to_string(id) + " exhausted its " +
                         std::to_string(config_.maxManualRetries) + " retries"};
    }

    if (item->errorKind == ErrorKind::Verification) {
        // The preserved bytes failed verification; start over
        if (auto r = downloader::removePartial(item->partialPath()); !r) {
            return r;
        }
    }
    const auto onDisk = static_cast<std::int64_t>(downloader::partialSize(item->partialPath()));

    auto r = store_->update(onItem(id, [onDisk](DownloadItem& it) -> Result<void> {
        if (auto t = applyTransition(it, TransferStatus::Queued, std::chrono::system_clock::now());
            !t) {
            return t;
        }
        ++it.retryCount;
        it.bytesTransferred = onDisk;
        it.clearError();
        return Result<void>();
    }));
    if (!r) {
        return r;
    }
    spdlog::info("Item {} re-queued (retry {}/{})", id, item->retryCount + 1,
                 config_.maxManualRetries);
    pumpLocked();
    return Result<void>();
}

Result<void> Engine::remove(ItemId id) {
    std::unique_lock<std::mutex> lk(mutex_);
    auto item = store_->get(id);
    if (!item) {
        return notFound(id);
    }

    if (item->inFlight()) {
        if (!active_.count(id)) {
            return Error{ErrorCode::InvalidState,
                         "Item " + std::to_string(id) + " is running in another process"};
        }
        stopAndWaitLocked(lk, id, StopReason::Remove);
        item = store_->get(id);
        if (!item) {
            return Result<void>();
        }
    }

    // A completed item has no partial; its output is never touched
    if (item->status != TransferStatus::Completed) {
        if (auto r = downloader::removePartial(item->partialPath()); !r) {
            return r;
        }
    }

    auto r = store_->update([id](QueueState& state) -> Result<void> {
        auto it = std::find_if(state.items.begin(), state.items.end(),
                               [id](const DownloadItem& i) { return i.id == id; });
        if (it == state.items.end()) {
            return notFound(id);
        }
        state.items.erase(it);
        return Result<void>();
    });
    if (!r) {
        return r;
    }
    spdlog::info("Item {} removed", id);
    pumpLocked();
    return Result<void>();
}

Result<void> Engine::purge() {
    std::unique_lock<std::mutex> lk(mutex_);
    const bool wasStopping = stopping_;
    stopping_ = true;
    for (auto& [id, worker] : active_) {
        worker->reason.store(StopReason::Remove);
        worker->stop.request_stop();
    }
    activeCv_.wait(lk, [this] { return active_.empty(); });

    Result<void> firstError;
    for (const auto& item : store_->snapshot().items) {
        if (item.status == TransferStatus::Completed) {
            continue;
        }
        if (auto r = downloader::removePartial(item.partialPath()); !r) {
            spdlog::warn("Purge: {}", r.error().message);
            if (firstError) {
                firstError = r;
            }
        }
    }

    auto destroyed = store_->destroy();
    stopping_ = wasStopping;
    if (!destroyed) {
        return destroyed;
    }
    return firstError;
}

void Engine::setRateLimit(const downloader::RateLimit& limit) {
    std::lock_guard<std::mutex> lk(mutex_);
    rateLimit_ = limit;
    globalLimiter_->setRate(limit.globalBps, limit.burstBytes);
    for (auto& [id, worker] : active_) {
        worker->itemLimiter->setRate(limit.perItemBps, limit.burstBytes);
    }
    spdlog::info("Rate limit set: global {} B/s, per item {} B/s", limit.globalBps,
                 limit.perItemBps);
}

downloader::RateLimit Engine::rateLimit() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return rateLimit_;
}

Result<void> Engine::setMaxParallel(std::size_t maxParallel) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (auto r = scheduler_.setMaxParallel(maxParallel); !r) {
        return r;
    }
    config_.maxParallel = maxParallel;
    if (started_ && !stopping_) {
        ensurePoolCapacityLocked(maxParallel);
    }
    pumpLocked();
    return Result<void>();
}

bool Engine::waitForIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lk(mutex_);
    while (true) {
        if (active_.empty()) {
            const auto state = store_->snapshot();
            const bool waiting =
                std::any_of(state.items.begin(), state.items.end(), [](const DownloadItem& i) {
                    return i.status == TransferStatus::Queued;
                });
            if (!waiting || !started_) {
                return !waiting;
            }
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        (void)activeCv_.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(20)));
    }
}

} // namespace safedl::queue
