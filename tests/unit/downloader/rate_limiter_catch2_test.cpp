#include <catch2/catch_test_macros.hpp>

#include <safedl/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace safedl::downloader;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST_CASE("unlimited limiter never blocks", "[downloader][rate_limiter]") {
    TokenBucketLimiter limiter;
    CHECK(limiter.rate() == 0);
    const auto start = Clock::now();
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(limiter.acquire(1 << 20, nullptr));
    }
    CHECK(Clock::now() - start < 200ms);
}

TEST_CASE("token bucket paces transfers to the configured rate", "[downloader][rate_limiter]") {
    TokenBucketLimiter limiter(10'000);
    CHECK(limiter.capacity() == 10'000);

    // The initial burst is free; the next 5000 bytes take about half a second
    REQUIRE(limiter.acquire(10'000, nullptr));
    const auto start = Clock::now();
    REQUIRE(limiter.acquire(5'000, nullptr));
    const auto elapsed = Clock::now() - start;
    CHECK(elapsed >= 400ms);
    CHECK(elapsed < 2s);
}

TEST_CASE("requests larger than the burst are served in slices", "[downloader][rate_limiter]") {
    TokenBucketLimiter limiter(20'000, 1'000);
    CHECK(limiter.capacity() == 1'000);
    const auto start = Clock::now();
    REQUIRE(limiter.acquire(5'000, nullptr));
    CHECK(Clock::now() - start >= 150ms);
}

TEST_CASE("a waiting acquire gives up when cancelled", "[downloader][rate_limiter]") {
    TokenBucketLimiter limiter(100);
    REQUIRE(limiter.acquire(100, nullptr));

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        cancel = true;
    });
    const auto start = Clock::now();
    const bool granted = limiter.acquire(10'000, [&] { return cancel.load(); });
    canceller.join();
    CHECK_FALSE(granted);
    CHECK(Clock::now() - start < 2s);
}

TEST_CASE("rate can be changed at runtime", "[downloader][rate_limiter]") {
    TokenBucketLimiter limiter(100);
    limiter.setRate(0);
    CHECK(limiter.rate() == 0);
    const auto start = Clock::now();
    REQUIRE(limiter.acquire(1'000'000, nullptr));
    CHECK(Clock::now() - start < 100ms);

    limiter.setRate(5'000, 2'000);
    CHECK(limiter.rate() == 5'000);
    CHECK(limiter.capacity() == 2'000);
}

TEST_CASE("composite limiter reports the tightest rate", "[downloader][rate_limiter]") {
    auto global = std::make_shared<TokenBucketLimiter>(50'000);
    auto item = std::make_shared<TokenBucketLimiter>(10'000);
    CompositeRateLimiter chain({global, item, nullptr});
    CHECK(chain.rate() == 10'000);

    item->setRate(0);
    CHECK(chain.rate() == 50'000);

    // Both buckets are debited
    REQUIRE(chain.acquire(50'000, nullptr));
    const auto start = Clock::now();
    REQUIRE(chain.acquire(10'000, nullptr));
    CHECK(Clock::now() - start >= 150ms);
}
