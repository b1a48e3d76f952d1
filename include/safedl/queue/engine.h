#pragma once

#include <safedl/config/engine_config.h>
#include <safedl/downloader/downloader.hpp>
#include <safedl/downloader/resume_client.h>
#include <safedl/queue/download_item.h>
#include <safedl/queue/scheduler.h>
#include <safedl/queue/state_store.h>
#include <safedl/queue/transfer.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace safedl::queue {

/**
 * @brief Collaborators that can be swapped out (tests inject a fake HTTP adapter).
 */
struct EngineDependencies {
    std::shared_ptr<downloader::IHttpAdapter> http; // null = libcurl adapter
};

struct EnqueueReceipt {
    ItemId id{0};
    std::vector<std::string> warnings;
};

// Empty vectors match everything
struct ListFilter {
    std::vector<TransferStatus> statuses;
    std::vector<ItemId> ids;
};

/**
 * @brief Single entry point for the presentation layer.
 *
 * Owns the state store, the scheduler and the worker pool. All commands are synchronous:
 * when pause/cancel/remove return, the affected worker has exited and its outcome is
 * persisted.
 */
class Engine {
public:
    ~Engine();
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Open the state store and prepare the engine (no transfers start until start()).
     *
     * Fails with UpgradeRequired when the state document was written by a newer version.
     */
    static Result<std::unique_ptr<Engine>> open(config::EngineConfig config,
                                                EngineDependencies deps = {});

    // Begin admitting queued items.
    void start();

    // Stop all transfers (they return to queued with their partial data) and flush state.
    void shutdown();

    Result<EnqueueReceipt> enqueue(const std::string& url,
                                   const std::filesystem::path& outputPath,
                                   std::optional<ChecksumSpec> checksum = std::nullopt);

    std::vector<DownloadItem> list(const ListFilter& filter = {}) const;
    Result<DownloadItem> get(ItemId id) const;

    Result<void> pause(ItemId id);
    Result<void> resume(ItemId id);
    Result<void> cancel(ItemId id);
    Result<void> retry(ItemId id);
    Result<void> remove(ItemId id);

    // Stop everything, delete every partial artifact and the state document.
    Result<void> purge();

    void setRateLimit(const downloader::RateLimit& limit);
    downloader::RateLimit rateLimit() const;
    Result<void> setMaxParallel(std::size_t maxParallel);

    const LoadReport& loadReport() const noexcept { return store_->loadReport(); }
    const config::EngineConfig& config() const noexcept { return config_; }

    // True once nothing is running and nothing is waiting for admission.
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    struct Worker {
        std::stop_source stop;
        std::atomic<StopReason> reason{StopReason::None};
        std::shared_ptr<downloader::IRateLimiter> itemLimiter;
    };

    Engine(config::EngineConfig config, std::unique_ptr<StateStore> store,
           std::shared_ptr<downloader::IHttpAdapter> http);

    void pumpLocked();
    void runWorker(ItemId id, std::shared_ptr<Worker> worker);
    void stopAndWaitLocked(std::unique_lock<std::mutex>& lk, ItemId id, StopReason reason);
    void ensurePoolCapacityLocked(std::size_t threads);

    config::EngineConfig config_;
    std::unique_ptr<StateStore> store_;
    Scheduler scheduler_;
    std::shared_ptr<downloader::IHttpAdapter> http_;
    downloader::ResumeClient client_;
    std::shared_ptr<downloader::TokenBucketLimiter> globalLimiter_;
    downloader::RateLimit rateLimit_;

    mutable std::mutex mutex_;
    std::condition_variable activeCv_;
    std::map<ItemId, std::shared_ptr<Worker>> active_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::vector<std::unique_ptr<boost::asio::thread_pool>> retiredPools_;
    std::size_t poolThreads_{0};
    bool started_{false};
    bool stopping_{false};
};

} // namespace safedl::queue
