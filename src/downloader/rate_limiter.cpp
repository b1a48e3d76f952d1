/*
 * safedl/src/downloader/rate_limiter.cpp
 *
 * Token-bucket rate limiting
 * - TokenBucketLimiter: capacity = burst (defaults to one second of allowance), refill = rate
 * - Requests larger than the capacity are granted in capacity-sized slices
 * - setRate() adjusts a live bucket; waiters pick up the new rate on their next slice
 * - CompositeRateLimiter chains buckets (global + per-item)
 *
 * Notes:
 * - Tokens are doubles to allow partial-byte accumulation between sleeps.
 * - Waits are sliced (<= 50ms) so cancellation is observed promptly.
 */

#include <safedl/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace safedl::downloader {

namespace {

constexpr auto kMaxSleepSlice = std::chrono::milliseconds(50);

} // namespace

TokenBucketLimiter::TokenBucketLimiter(std::uint64_t bytesPerSecond, std::uint64_t burst) {
    setRate(bytesPerSecond, burst);
}

void TokenBucketLimiter::setRate(std::uint64_t bytesPerSecond, std::uint64_t burst) {
    std::lock_guard<std::mutex> lk(mutex_);
    const auto now = clock_t::now();
    const bool wasUnlimited = rateBps_ <= 0.0;

    refillLocked(now);
    rateBps_ = static_cast<double>(bytesPerSecond);
    if (rateBps_ > 0.0) {
        capacity_ = burst > 0 ? static_cast<double>(burst) : rateBps_;
        // A fresh bucket starts full; a live one keeps its balance up to the new capacity
        tokens_ = wasUnlimited ? capacity_ : std::min(tokens_, capacity_);
    } else {
        capacity_ = 0.0;
        tokens_ = 0.0;
    }
    lastRefill_ = now;
}

std::uint64_t TokenBucketLimiter::rate() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<std::uint64_t>(rateBps_);
}

std::uint64_t TokenBucketLimiter::capacity() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<std::uint64_t>(capacity_);
}

void TokenBucketLimiter::refillLocked(clock_t::time_point now) {
    if (rateBps_ <= 0.0) {
        lastRefill_ = now;
        return;
    }
    const auto dt = std::chrono::duration<double>(now - lastRefill_).count();
    if (dt <= 0.0)
        return;
    tokens_ = std::min(capacity_, tokens_ + rateBps_ * dt);
    lastRefill_ = now;
}

bool TokenBucketLimiter::acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) {
    std::uint64_t remaining = bytes;

    while (remaining > 0) {
        if (shouldCancel && shouldCancel()) {
            return false;
        }

        double waitSeconds = 0.0;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (rateBps_ <= 0.0) {
                return true; // unlimited
            }
            refillLocked(clock_t::now());

            const double slice = std::min(static_cast<double>(remaining), capacity_);
            if (tokens_ >= slice) {
                tokens_ -= slice;
                remaining -= static_cast<std::uint64_t>(slice);
                continue;
            }
            waitSeconds = (slice - tokens_) / rateBps_;
        }

        auto sleepFor = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(waitSeconds));
        if (sleepFor.count() <= 0) {
            std::this_thread::yield();
        } else {
            std::this_thread::sleep_for(std::min(sleepFor, kMaxSleepSlice));
        }
    }
    return true;
}

CompositeRateLimiter::CompositeRateLimiter(std::vector<std::shared_ptr<IRateLimiter>> limiters)
    : limiters_(std::move(limiters)) {
    limiters_.erase(std::remove(limiters_.begin(), limiters_.end(), nullptr), limiters_.end());
}

bool CompositeRateLimiter::acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) {
    for (const auto& limiter : limiters_) {
        if (!limiter->acquire(bytes, shouldCancel)) {
            return false;
        }
    }
    return true;
}

void CompositeRateLimiter::setRate(std::uint64_t bytesPerSecond, std::uint64_t burst) {
    for (const auto& limiter : limiters_) {
        limiter->setRate(bytesPerSecond, burst);
    }
}

std::uint64_t CompositeRateLimiter::rate() const {
    std::uint64_t lowest = 0;
    for (const auto& limiter : limiters_) {
        const auto r = limiter->rate();
        if (r > 0 && (lowest == 0 || r < lowest)) {
            lowest = r;
        }
    }
    return lowest;
}

} // namespace safedl::downloader
