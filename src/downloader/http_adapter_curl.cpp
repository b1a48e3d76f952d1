/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - IHttpAdapter::get() on the libcurl easy API: one GET, optional open-ended Range.
 * - Honors connect/low-speed timeouts, TLS verify/CA, proxy, headers and redirects.
 * - Headers are collected per response; a redirect hop resets them so the handler only
 *   sees the final response.
 * - The response handler runs before the first body byte is handed to the sink (or after
 *   perform when the response has no body).
 * - Cooperative cancellation from both the write and the xferinfo callbacks, so a stalled
 *   connection is also interruptible.
 */

#include <safedl/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace safedl::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

static std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v{0};
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

std::optional<ContentRange> parseContentRange(std::string_view value) {
    auto v = trim(value);
    std::string_view sv(v);
    if (sv.size() < 6 || to_lower(sv.substr(0, 5)) != "bytes")
        return std::nullopt;
    sv.remove_prefix(5);
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '='))
        sv.remove_prefix(1);

    auto slash = sv.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto rangePart = sv.substr(0, slash);
    auto totalPart = sv.substr(slash + 1);

    ContentRange out;
    if (totalPart != "*") {
        auto total = parse_u64(totalPart);
        if (!total)
            return std::nullopt;
        out.total = *total;
    }
    if (rangePart == "*") {
        out.unsatisfied = true;
        return out;
    }
    auto dash = rangePart.find('-');
    if (dash == std::string_view::npos)
        return std::nullopt;
    auto start = parse_u64(rangePart.substr(0, dash));
    auto end = parse_u64(rangePart.substr(dash + 1));
    if (!start || !end || *end < *start)
        return std::nullopt;
    out.start = *start;
    out.end = *end;
    return out;
}

std::string urlScheme(std::string_view url) {
    auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0)
        return {};
    auto scheme = url.substr(0, sep);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front())))
        return {};
    for (unsigned char c : scheme) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return {};
    }
    return to_lower(scheme);
}

bool isAbsoluteUrl(std::string_view url) {
    if (urlScheme(url).empty())
        return false;
    auto rest = url.substr(url.find("://") + 3);
    auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (authority.empty())
        return false;
    return std::none_of(url.begin(), url.end(),
                        [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorCode::ProtocolError;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

// Shared per-transfer state for the curl callbacks
struct TransferContext {
    CURL* curl{nullptr};
    const ResponseHandler* onResponse{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};

    HttpResponseInfo info{};
    bool responseDelivered{false};
    bool cancelRequested{false};
    std::optional<Error> abortError;

    bool cancelled() {
        if (*shouldCancel && (*shouldCancel)()) {
            cancelRequested = true;
        }
        return cancelRequested;
    }

    // Returns false when the handler rejected the response.
    bool deliverResponse() {
        if (responseDelivered)
            return !abortError.has_value();
        responseDelivered = true;
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        info.status = status;
        if (*onResponse) {
            auto r = (*onResponse)(info);
            if (!r) {
                abortError = r.error();
                return false;
            }
        }
        return true;
    }
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line starts a new response (redirect hop or 100-continue)
    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        ctx->info = HttpResponseInfo{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes") {
            ctx->info.acceptRangesBytes = true;
        }
    } else if (key == "content-length") {
        ctx->info.contentLength = parse_u64(val);
    } else if (key == "content-range") {
        ctx->info.contentRange = val;
    } else if (key == "etag") {
        // Strip surrounding quotes if present
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        ctx->info.etag = std::move(val);
    } else if (key == "last-modified") {
        ctx->info.lastModified = std::move(val);
    }

    return total;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->cancelled()) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    if (!ctx->deliverResponse()) {
        return 0;
    }

    ByteSpan bytes{reinterpret_cast<const std::byte*>(ptr), total};
    if (*ctx->sink) {
        auto r = (*ctx->sink)(bytes);
        if (!r) {
            ctx->abortError = r.error();
            return 0;
        }
    }
    return total;
}

// CURL progress callback: only used to observe cancellation while no data flows
static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->cancelled()) ? 1 : 0;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const NetworkConfig& net) {
    // Timeouts (no overall timeout: large files legitimately take long)
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(net.connectTimeout.count()));
    if (net.lowSpeedTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(
            curl, CURLOPT_LOW_SPEED_TIME,
            static_cast<long>(std::max<long long>(1, net.lowSpeedTimeout.count() / 1000)));
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, net.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, net.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, net.tls.insecure ? 0L : 2L);
    if (!net.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, net.tls.caPath.c_str());
    }

    // Proxy
    if (net.proxy && !net.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, net.proxy->c_str());
    }

    if (!net.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, net.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    // Transfer the body verbatim; byte offsets must match the server's representation
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_global_init(); }
    ~CurlHttpAdapter() override = default;

    Result<HttpResponseInfo> get(const HttpRequest& request, const NetworkConfig& net,
                                 const ResponseHandler& onResponse, const BodySink& sink,
                                 const ShouldCancel& shouldCancel) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(request.headers);
        if (request.rangeStart) {
            const std::string rangeHeader = "Range: bytes=" + std::to_string(*request.rangeStart) + "-";
            list = curl_slist_append(list, rangeHeader.c_str());
        }

        TransferContext ctx;
        ctx.curl = curl;
        ctx.onResponse = &onResponse;
        ctx.sink = &sink;
        ctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        configure_common(curl, net);

        CURLcode rc = curl_easy_perform(curl);

        // Responses without a body never reached write_cb
        if (rc == CURLE_OK && !ctx.responseDelivered) {
            (void)ctx.deliverResponse();
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (ctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (ctx.abortError) {
            return *ctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + request.url);
        }

        if (ctx.info.etag) {
            spdlog::debug("HTTP fetch captured ETag: {}", *ctx.info.etag);
        }
        return ctx.info;
    }
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace safedl::downloader
