#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <safedl/downloader/resume_client.h>

#include "common/fake_http_adapter.h"
#include "common/test_helpers_catch2.h"

#include <chrono>
#include <memory>
#include <vector>

using namespace safedl;
using namespace safedl::downloader;
using safedl::test::FakeHttpAdapter;
using safedl::test::TempDir;
using namespace std::chrono_literals;

namespace {

const std::string kUrl = "https://example.com/file.bin";

struct Fixture {
    TempDir dir;
    std::shared_ptr<FakeHttpAdapter> http = std::make_shared<FakeHttpAdapter>();
    ResumeClient client{http, NetworkConfig{}, 0ms};
    std::filesystem::path partial = dir / "file.bin.part";

    Result<FetchResult> fetch(IRateLimiter* limiter = nullptr,
                              std::vector<ProgressUpdate>* progress = nullptr,
                              const ResumeValidator& validator = {}) {
        return client.fetch(
            kUrl, partial, limiter, [] { return false; },
            [progress](const ProgressUpdate& p) {
                if (progress)
                    progress->push_back(p);
            },
            validator);
    }
};

} // namespace

TEST_CASE("fresh fetch writes the whole body", "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(200'000);
    f.http->serve(kUrl, payload);

    std::vector<ProgressUpdate> progress;
    auto r = f.fetch(nullptr, &progress);
    REQUIRE(r);
    CHECK(r.value().outcome == ResumeOutcome::Fresh);
    CHECK(r.value().bytesOnDisk == payload.size());
    REQUIRE(r.value().totalBytes);
    CHECK(*r.value().totalBytes == payload.size());
    CHECK(safedl::test::read_file(f.partial) == payload);

    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back().bytesOnDisk == payload.size());
    CHECK(f.http->rangeStarts().front() == std::nullopt);
}

TEST_CASE("existing partial bytes are continued with a Range request", "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(100'000);
    f.http->serve(kUrl, payload);
    safedl::test::write_file(f.partial, payload.substr(0, 40'000));

    auto r = f.fetch();
    REQUIRE(r);
    CHECK(r.value().outcome == ResumeOutcome::Appended);
    CHECK(r.value().bytesOnDisk == payload.size());
    CHECK(safedl::test::read_file(f.partial) == payload);
    REQUIRE(f.http->rangeStarts().size() == 1);
    CHECK(f.http->rangeStarts().front() == std::optional<std::uint64_t>(40'000));
}

TEST_CASE("a server ignoring Range restarts the file from zero", "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(50'000);
    f.http->serve(kUrl, payload, /*honorRange=*/false);
    safedl::test::write_file(f.partial, std::string(10'000, 'x'));

    auto r = f.fetch();
    REQUIRE(r);
    CHECK(r.value().outcome == ResumeOutcome::Restarted);
    CHECK(safedl::test::read_file(f.partial) == payload);
}

TEST_CASE("416 at the end of the resource means the partial is complete",
          "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(4'096);
    f.http->serve(kUrl, payload);
    safedl::test::write_file(f.partial, payload);

    auto r = f.fetch();
    REQUIRE(r);
    CHECK(r.value().outcome == ResumeOutcome::AlreadyComplete);
    CHECK(r.value().bytesOnDisk == payload.size());
    CHECK(safedl::test::read_file(f.partial) == payload);
}

TEST_CASE("416 with a different resource size is a protocol error", "[downloader][resume]") {
    Fixture f;
    f.http->serve(kUrl, safedl::test::make_payload(1'000));
    safedl::test::write_file(f.partial, std::string(2'000, 'x'));

    auto r = f.fetch();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ProtocolError);
    CHECK(safedl::test::read_file(f.partial).size() == 2'000);
}

TEST_CASE("a dropped connection keeps the received bytes", "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(100'000);
    f.http->serve(kUrl, payload);
    f.http->setChunk(10'000, 0ms);
    f.http->dropConnections(1, 30'000);

    auto first = f.fetch();
    REQUIRE_FALSE(first);
    CHECK(first.error().code == ErrorCode::NetworkError);
    CHECK(isRetryable(first.error().code));
    CHECK(partialSize(f.partial) == 30'000);

    auto second = f.fetch();
    REQUIRE(second);
    CHECK(second.value().outcome == ResumeOutcome::Appended);
    CHECK(safedl::test::read_file(f.partial) == payload);
}

TEST_CASE("a range ending before the resource does is not a finished fetch",
          "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(1'000);
    f.http->serve(kUrl, payload);
    f.http->capRanges(kUrl, 100);
    safedl::test::write_file(f.partial, payload.substr(0, 100));

    auto first = f.fetch();
    REQUIRE_FALSE(first);
    CHECK(first.error().code == ErrorCode::NetworkError);
    CHECK(isRetryable(first.error().code));
    CHECK(partialSize(f.partial) == 200);

    // Each further attempt continues where the previous range stopped
    Result<FetchResult> r = Error{ErrorCode::Unknown};
    for (int i = 0; i < 20 && !r; ++i) {
        r = f.fetch();
    }
    REQUIRE(r);
    CHECK(r.value().bytesOnDisk == payload.size());
    CHECK(safedl::test::read_file(f.partial) == payload);
}

TEST_CASE("a Content-Range starting elsewhere is a protocol error", "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(10'000);
    f.http->serve(kUrl, payload);
    f.http->skewRangeStart(kUrl, -500);
    safedl::test::write_file(f.partial, payload.substr(0, 4'000));

    auto r = f.fetch();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ProtocolError);
    CHECK_FALSE(isRetryable(r.error().code));
    CHECK(safedl::test::read_file(f.partial) == payload.substr(0, 4'000));
}

TEST_CASE("the response validators are reported", "[downloader][resume]") {
    Fixture f;
    f.http->publish(kUrl, safedl::test::make_payload(5'000), "\"v1\"");

    std::vector<ProgressUpdate> progress;
    auto r = f.fetch(nullptr, &progress);
    REQUIRE(r);
    CHECK(r.value().validator.etag == "\"v1\"");
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.front().validator.etag == "\"v1\"");
    // No partial yet: nothing to make conditional
    CHECK(f.http->ifRangeHeaders().front() == std::nullopt);
}

TEST_CASE("resuming sends If-Range with the stored validator", "[downloader][resume]") {
    Fixture f;
    const auto payload = safedl::test::make_payload(20'000);
    f.http->publish(kUrl, payload, "\"v1\"");
    safedl::test::write_file(f.partial, payload.substr(0, 5'000));

    SECTION("unchanged resource continues the partial") {
        auto r = f.fetch(nullptr, nullptr, ResumeValidator{"\"v1\"", std::nullopt});
        REQUIRE(r);
        CHECK(r.value().outcome == ResumeOutcome::Appended);
        CHECK(f.http->ifRangeHeaders().front() == std::optional<std::string>("\"v1\""));
        CHECK(safedl::test::read_file(f.partial) == payload);
    }
    SECTION("a changed resource is fetched again in full") {
        const auto updated = safedl::test::make_payload(20'000, 7);
        f.http->publish(kUrl, updated, "\"v2\"");
        auto r = f.fetch(nullptr, nullptr, ResumeValidator{"\"v1\"", std::nullopt});
        REQUIRE(r);
        CHECK(r.value().outcome == ResumeOutcome::Restarted);
        CHECK(r.value().validator.etag == "\"v2\"");
        CHECK(safedl::test::read_file(f.partial) == updated);
    }
    SECTION("a weak ETag falls back to Last-Modified") {
        auto r = f.fetch(nullptr, nullptr,
                         ResumeValidator{"W/\"v1\"", "Sun, 18 Oct 2026 09:00:00 GMT"});
        REQUIRE(r);
        CHECK(f.http->ifRangeHeaders().front() ==
              std::optional<std::string>("Sun, 18 Oct 2026 09:00:00 GMT"));
    }
}

TEST_CASE("a 206 from a changed resource discards the partial", "[downloader][resume]") {
    Fixture f;
    const auto original = safedl::test::make_payload(20'000);
    const auto updated = safedl::test::make_payload(20'000, 9);
    f.http->publish(kUrl, updated, "\"v2\"");
    f.http->setHonorIfRange(kUrl, false);
    safedl::test::write_file(f.partial, original.substr(0, 5'000));

    auto r = f.fetch(nullptr, nullptr, ResumeValidator{"\"v1\"", std::nullopt});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NetworkError);
    CHECK_FALSE(std::filesystem::exists(f.partial));

    auto again = f.fetch(nullptr, nullptr, ResumeValidator{"\"v1\"", std::nullopt});
    REQUIRE(again);
    CHECK(again.value().outcome == ResumeOutcome::Fresh);
    CHECK(safedl::test::read_file(f.partial) == updated);
}

TEST_CASE("HTTP error statuses are server errors", "[downloader][resume]") {
    Fixture f;
    f.http->serve(kUrl, "body");
    f.http->forceStatus(kUrl, 503);

    auto r = f.fetch();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ServerError);
    CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("503"));
}

TEST_CASE("cancellation stops the transfer", "[downloader][resume]") {
    Fixture f;
    f.http->serve(kUrl, safedl::test::make_payload(100'000));
    f.http->setChunk(1'000, 0ms);
    int chunks = 0;
    auto r = f.client.fetch(
        kUrl, f.partial, nullptr, [&] { return ++chunks > 5; }, nullptr);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::OperationCancelled);
    CHECK(partialSize(f.partial) < 100'000);
}

TEST_CASE("retry backoff grows geometrically and is capped", "[downloader][resume]") {
    RetryPolicy policy;
    policy.initialBackoff = 100ms;
    policy.multiplier = 2.0;
    policy.maxBackoff = 500ms;
    CHECK(policy.backoffFor(1) == 100ms);
    CHECK(policy.backoffFor(2) == 200ms);
    CHECK(policy.backoffFor(3) == 400ms);
    CHECK(policy.backoffFor(4) == 500ms);
    CHECK(policy.backoffFor(0) == 100ms);
}
