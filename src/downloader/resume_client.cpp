/*
 * safedl/src/downloader/resume_client.cpp
 *
 * Range-based resumption of a single transfer attempt, plus the retry backoff schedule.
 */

#include <safedl/downloader/resume_client.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace safedl::downloader {

std::chrono::milliseconds RetryPolicy::backoffFor(int retryNumber) const {
    if (retryNumber < 1)
        retryNumber = 1;
    const double base = static_cast<double>(initialBackoff.count());
    const double scaled = base * std::pow(multiplier, static_cast<double>(retryNumber - 1));
    const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, capped)));
}

ResumeClient::ResumeClient(std::shared_ptr<IHttpAdapter> http, NetworkConfig network,
                           std::chrono::milliseconds progressInterval)
    : http_(std::move(http)), network_(std::move(network)), progressInterval_(progressInterval) {}

namespace {

enum class BodyMode { Pending, Write, Discard };

struct AttemptState {
    BodyMode mode{BodyMode::Pending};
    ResumeOutcome outcome{ResumeOutcome::Fresh};
    PartialFile file;
    std::uint64_t received{0};
    std::optional<std::uint64_t> expectedBody;
    std::optional<std::uint64_t> total;
    ResumeValidator validator;
    std::chrono::steady_clock::time_point lastProgress{};
};

// Weak ETags ("W/...") cannot be used with If-Range
bool isStrongEtag(const std::string& etag) {
    return !etag.empty() && etag.rfind("W/", 0) != 0;
}

} // namespace

Result<FetchResult> ResumeClient::fetch(const std::string& url,
                                        const std::filesystem::path& partialPath,
                                        IRateLimiter* limiter, const ShouldCancel& shouldCancel,
                                        const ProgressCallback& onProgress,
                                        const ResumeValidator& validator) const {
    if (!http_) {
        return Error{ErrorCode::InvalidState, "No HTTP adapter configured"};
    }

    const std::uint64_t offset = partialSize(partialPath);
    AttemptState st;

    HttpRequest request;
    request.url = url;
    if (offset > 0) {
        request.rangeStart = offset;
        if (validator.etag && isStrongEtag(*validator.etag)) {
            request.headers.push_back({"If-Range", *validator.etag});
        } else if (validator.lastModified) {
            request.headers.push_back({"If-Range", *validator.lastModified});
        }
    }

    auto openPartial = [&](PartialFile::Mode mode) -> Result<void> {
        auto f = PartialFile::open(partialPath, mode);
        if (!f) {
            return f.error();
        }
        st.file = std::move(f).value();
        st.mode = BodyMode::Write;
        return Result<void>();
    };

    auto onResponse = [&](const HttpResponseInfo& info) -> Result<void> {
        st.validator = ResumeValidator{info.etag, info.lastModified};
        const long status = info.status;

        if (status == 206) {
            if (offset == 0) {
                return Error{ErrorCode::ProtocolError,
                             "Server sent 206 Partial Content to an unranged request"};
            }
            auto cr = info.contentRange ? parseContentRange(*info.contentRange) : std::nullopt;
            if (!cr || cr->unsatisfied) {
                return Error{ErrorCode::ProtocolError, "206 response without a valid Content-Range"};
            }
            if (cr->start != offset) {
                return Error{ErrorCode::ProtocolError,
                             "Content-Range starts at " + std::to_string(cr->start) +
                                 ", expected " + std::to_string(offset)};
            }
            if (cr->end < cr->start || (cr->total && cr->end >= *cr->total)) {
                return Error{ErrorCode::ProtocolError,
                             "Malformed Content-Range: " + *info.contentRange};
            }
            if (validator.etag && info.etag && *validator.etag != *info.etag) {
                spdlog::info("{} changed since the partial was written (ETag {} -> {}); "
                             "discarding {} bytes",
                             url, *validator.etag, *info.etag, offset);
                if (auto rm = removePartial(partialPath); !rm) {
                    return rm;
                }
                return Error{ErrorCode::NetworkError,
                             "Resource changed on the server; restarting from 0"};
            }
            st.outcome = ResumeOutcome::Appended;
            st.total = cr->total;
            st.expectedBody = cr->end - cr->start + 1;
            return openPartial(PartialFile::Mode::Append);
        }

        if (status == 200) {
            if (offset > 0) {
                spdlog::info("Server ignored Range for {}; restarting from 0 ({} bytes discarded)",
                             url, offset);
                st.outcome = ResumeOutcome::Restarted;
            } else {
                st.outcome = ResumeOutcome::Fresh;
            }
            st.total = info.contentLength;
            st.expectedBody = info.contentLength;
            return openPartial(PartialFile::Mode::Truncate);
        }

        if (status == 416 && offset > 0) {
            auto cr = info.contentRange ? parseContentRange(*info.contentRange) : std::nullopt;
            if (cr && cr->total && *cr->total != offset) {
                return Error{ErrorCode::ProtocolError,
                             "416 with resource size " + std::to_string(*cr->total) +
                                 " but " + std::to_string(offset) + " bytes on disk"};
            }
            st.outcome = ResumeOutcome::AlreadyComplete;
            st.total = offset;
            st.mode = BodyMode::Discard;
            return Result<void>();
        }

        if (status >= 400) {
            return Error{ErrorCode::ServerError, "HTTP " + std::to_string(status) + " for " + url};
        }
        return Error{ErrorCode::ProtocolError,
                     "Unexpected HTTP status " + std::to_string(status) + " for " + url};
    };

    auto emitProgress = [&](bool force) {
        if (!onProgress)
            return;
        const auto now = std::chrono::steady_clock::now();
        if (!force && now - st.lastProgress < progressInterval_)
            return;
        st.lastProgress = now;
        onProgress(ProgressUpdate{st.file.size(), st.total, st.validator});
    };

    auto sink = [&](ByteSpan bytes) -> Result<void> {
        if (st.mode == BodyMode::Discard) {
            return Result<void>();
        }
        if (st.mode != BodyMode::Write) {
            return Error{ErrorCode::InvalidState, "Body received before response headers"};
        }
        if (st.expectedBody && st.received + bytes.size() > *st.expectedBody) {
            return Error{ErrorCode::ProtocolError,
                         "Response body longer than announced (" +
                             std::to_string(*st.expectedBody) + " bytes)"};
        }
        if (limiter && !limiter->acquire(bytes.size(), shouldCancel)) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (auto w = st.file.write(bytes); !w) {
            return w;
        }
        st.received += bytes.size();
        emitProgress(false);
        return Result<void>();
    };

    auto res = http_->get(request, network_, onResponse, sink, shouldCancel);
    if (!res) {
        // Whatever reached the partial file stays there for the next attempt
        st.file.close();
        return res.error();
    }

    if (st.outcome == ResumeOutcome::AlreadyComplete) {
        return FetchResult{st.outcome, offset, st.total, st.validator};
    }
    if (st.mode != BodyMode::Write) {
        return Error{ErrorCode::ProtocolError, "Response was never delivered for " + url};
    }
    if (st.expectedBody && st.received < *st.expectedBody) {
        st.file.close();
        return Error{ErrorCode::NetworkError,
                     "Connection closed after " + std::to_string(st.received) + " of " +
                         std::to_string(*st.expectedBody) + " bytes"};
    }

    if (auto s = st.file.sync(); !s) {
        return s.error();
    }
    emitProgress(true);

    if (st.total && st.file.size() < *st.total) {
        // Bounded 206: the server sent less than the rest of the resource
        const auto onDisk = st.file.size();
        st.file.close();
        return Error{ErrorCode::NetworkError, "Server stopped at byte " + std::to_string(onDisk) +
                                                  " of " + std::to_string(*st.total) + " for " +
                                                  url};
    }

    FetchResult out;
    out.outcome = st.outcome;
    out.bytesOnDisk = st.file.size();
    out.totalBytes = st.total ? st.total : std::optional<std::uint64_t>(out.bytesOnDisk);
    out.validator = st.validator;
    st.file.close();
    return out;
}

} // namespace safedl::downloader
