// In-memory HTTP server for transfer tests

#pragma once

#include <safedl/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace safedl::test {

/**
 * @brief Serves fixed payloads by URL.
 *
 * Knobs: whether Range is honoured, a forced status, a per-chunk delay (to keep transfers
 * in flight), and a number of upcoming calls that drop the connection after some bytes.
 * Ranged responses can be capped in length or misreport their start, and a resource can
 * carry an ETag that If-Range is checked against.
 */
class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    struct Resource {
        std::string body;
        bool honorRange{true};
        std::optional<long> forcedStatus;
        std::optional<std::string> etag;
        bool honorIfRange{true};
        std::optional<std::uint64_t> maxRangeBytes;
        std::int64_t rangeStartSkew{0};
    };

    void serve(const std::string& url, std::string body, bool honorRange = true) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& r = resources_[url];
        r.body = std::move(body);
        r.honorRange = honorRange;
    }

    void setHonorRange(const std::string& url, bool honor) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[url].honorRange = honor;
    }

    // Replaces the body and its ETag, as a new version of the resource would
    void publish(const std::string& url, std::string body, std::optional<std::string> etag) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& r = resources_[url];
        r.body = std::move(body);
        r.etag = std::move(etag);
    }

    void setHonorIfRange(const std::string& url, bool honor) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[url].honorIfRange = honor;
    }

    // 206 responses carry at most @p bytes body bytes
    void capRanges(const std::string& url, std::optional<std::uint64_t> bytes) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[url].maxRangeBytes = bytes;
    }

    // Content-Range of 206 responses reports a start shifted by @p skew
    void skewRangeStart(const std::string& url, std::int64_t skew) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[url].rangeStartSkew = skew;
    }

    void forceStatus(const std::string& url, std::optional<long> status) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[url].forcedStatus = status;
    }

    // The next @p calls requests are cut after @p bytes body bytes.
    void dropConnections(int calls, std::size_t bytes) {
        std::lock_guard<std::mutex> lk(mutex_);
        dropCalls_ = calls;
        dropAfter_ = bytes;
    }

    void setChunk(std::size_t chunkSize, std::chrono::milliseconds delay) {
        chunkSize_.store(chunkSize);
        chunkDelayMs_.store(delay.count());
    }

    int calls() const { return calls_.load(); }
    int peakConcurrency() const { return peak_.load(); }

    std::vector<std::optional<std::uint64_t>> rangeStarts() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return rangeStarts_;
    }

    std::vector<std::optional<std::string>> ifRangeHeaders() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return ifRanges_;
    }

    Result<downloader::HttpResponseInfo>
    get(const downloader::HttpRequest& request, const downloader::NetworkConfig&,
        const downloader::ResponseHandler& onResponse, const downloader::BodySink& sink,
        const downloader::ShouldCancel& shouldCancel) override {
        ++calls_;
        const int now = ++active_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
        }
        struct Leave {
            std::atomic<int>& a;
            ~Leave() { --a; }
        } leave{active_};

        Resource res;
        std::optional<std::size_t> cutAfter;
        bool staleIfRange = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            rangeStarts_.push_back(request.rangeStart);
            std::optional<std::string> ifRange;
            for (const auto& h : request.headers) {
                if (h.name == "If-Range")
                    ifRange = h.value;
            }
            ifRanges_.push_back(ifRange);
            staleIfRange = ifRange.has_value();
            auto it = resources_.find(request.url);
            if (it == resources_.end()) {
                res.forcedStatus = 404;
            } else {
                res = it->second;
            }
            if (staleIfRange) {
                staleIfRange = res.honorIfRange && ifRanges_.back() != res.etag;
            }
            if (dropCalls_ > 0) {
                --dropCalls_;
                cutAfter = dropAfter_;
            }
        }

        downloader::HttpResponseInfo info;
        info.etag = res.etag;
        const std::uint64_t size = res.body.size();
        std::uint64_t from = 0;
        std::uint64_t limit = size;

        if (res.forcedStatus) {
            info.status = *res.forcedStatus;
            info.contentLength = 0;
        } else if (request.rangeStart && res.honorRange && !staleIfRange) {
            const auto start = *request.rangeStart;
            if (start >= size) {
                info.status = 416;
                info.contentRange = "bytes */" + std::to_string(size);
            } else {
                info.status = 206;
                from = start;
                if (res.maxRangeBytes) {
                    limit = std::min(size, start + *res.maxRangeBytes);
                }
                info.contentLength = limit - start;
                const auto reported = static_cast<std::uint64_t>(
                    static_cast<std::int64_t>(start) + res.rangeStartSkew);
                info.contentRange = "bytes " + std::to_string(reported) + "-" +
                                    std::to_string(reported + (limit - start) - 1) + "/" +
                                    std::to_string(size);
            }
            info.acceptRangesBytes = true;
        } else {
            info.status = 200;
            info.contentLength = size;
            info.acceptRangesBytes = res.honorRange;
        }

        if (auto r = onResponse(info); !r) {
            return r.error();
        }
        if (info.status != 200 && info.status != 206) {
            return info;
        }

        const std::size_t chunk = std::max<std::size_t>(1, chunkSize_.load());
        const auto delay = std::chrono::milliseconds(chunkDelayMs_.load());
        std::size_t sent = 0;
        for (std::uint64_t pos = from; pos < limit;) {
            if (shouldCancel && shouldCancel()) {
                return Error{ErrorCode::OperationCancelled, "cancelled"};
            }
            std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(chunk, limit - pos));
            if (cutAfter) {
                if (sent >= *cutAfter) {
                    return Error{ErrorCode::NetworkError, "connection reset by peer"};
                }
                n = std::min(n, *cutAfter - sent);
            }
            auto bytes = std::as_bytes(std::span<const char>(res.body.data() + pos, n));
            if (auto r = sink(bytes); !r) {
                return r.error();
            }
            pos += n;
            sent += n;
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
        if (cutAfter && sent >= *cutAfter && from + sent < limit) {
            return Error{ErrorCode::NetworkError, "connection reset by peer"};
        }
        return info;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::vector<std::optional<std::uint64_t>> rangeStarts_;
    std::vector<std::optional<std::string>> ifRanges_;
    int dropCalls_{0};
    std::size_t dropAfter_{0};
    std::atomic<std::size_t> chunkSize_{64 * 1024};
    std::atomic<long long> chunkDelayMs_{0};
    std::atomic<int> calls_{0};
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

} // namespace safedl::test
