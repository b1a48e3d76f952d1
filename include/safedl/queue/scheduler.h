#pragma once

#include <safedl/queue/download_item.h>
#include <safedl/queue/state_store.h>

#include <atomic>
#include <cstddef>
#include <set>
#include <vector>

namespace safedl::queue {

/**
 * @brief Admits queued items while fewer than maxParallel are in flight.
 *
 * In-flight means downloading or verifying. Counting and admission run inside a single
 * StateStore update, so concurrent admit() calls (or another process sharing the state
 * file) can never push the in-flight count above the limit.
 */
class Scheduler {
public:
    Scheduler(StateStore& store, std::size_t maxParallel);

    /**
     * @brief Move queued items (lowest id first) to downloading.
     * @param busy ids whose previous worker has not exited yet; never admitted
     * @return the admitted ids, in admission order
     */
    Result<std::vector<ItemId>> admit(const std::set<ItemId>& busy = {});

    // Never preempts: lowering the limit only stops further admissions.
    Result<void> setMaxParallel(std::size_t maxParallel);
    std::size_t maxParallel() const noexcept { return maxParallel_.load(); }

    static std::size_t countInFlight(const QueueState& state);

private:
    StateStore& store_;
    std::atomic<std::size_t> maxParallel_;
};

} // namespace safedl::queue
