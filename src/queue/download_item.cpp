#include <safedl/queue/download_item.h>

#include <fmt/format.h>

#include <chrono>
#include <charconv>
#include <limits>
#include <set>

namespace safedl::queue {

using nlohmann::json;

namespace {

Error corrupt(const std::string& what) {
    return Error{ErrorCode::CorruptedData, what};
}

template <typename T> bool readInt(std::string_view s, T& out) {
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

} // namespace

std::optional<TransferStatus> parseStatus(std::string_view text) {
    for (auto s : {TransferStatus::Queued, TransferStatus::Downloading, TransferStatus::Paused,
                   TransferStatus::Completed, TransferStatus::Failed, TransferStatus::Verifying}) {
        if (text == statusToString(s))
            return s;
    }
    return std::nullopt;
}

std::optional<ErrorKind> parseErrorKind(std::string_view text) {
    for (auto k : {ErrorKind::None, ErrorKind::Network, ErrorKind::Protocol,
                   ErrorKind::Verification, ErrorKind::Filesystem, ErrorKind::Cancelled,
                   ErrorKind::Unknown}) {
        if (text == errorKindToString(k))
            return k;
    }
    return std::nullopt;
}

std::filesystem::path DownloadItem::partialPath() const {
    return downloader::partialPathFor(outputPath);
}

ResultCode DownloadItem::resultCode() const noexcept {
    if (status == TransferStatus::Completed)
        return ResultCode::Success;
    return resultCodeFor(errorKind);
}

void DownloadItem::setError(const Error& error) {
    lastError = error.message;
    errorKind = classifyError(error.code);
}

void DownloadItem::clearError() {
    lastError.reset();
    errorKind = ErrorKind::None;
}

DownloadItem* QueueState::find(ItemId id) {
    for (auto& item : items) {
        if (item.id == id)
            return &item;
    }
    return nullptr;
}

const DownloadItem* QueueState::find(ItemId id) const {
    for (const auto& item : items) {
        if (item.id == id)
            return &item;
    }
    return nullptr;
}

std::string formatTimestamp(TimePoint tp) {
    using namespace std::chrono;
    const auto secs = floor<seconds>(tp);
    const auto dp = floor<days>(secs);
    const year_month_day ymd{dp};
    const hh_mm_ss hms{secs - dp};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count());
}

std::optional<TimePoint> parseTimestamp(std::string_view text) {
    using namespace std::chrono;
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    int y = 0;
    unsigned mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readInt(text.substr(0, 4), y) || !readInt(text.substr(5, 2), mo) ||
        !readInt(text.substr(8, 2), d) || !readInt(text.substr(11, 2), h) ||
        !readInt(text.substr(14, 2), mi) || !readInt(text.substr(17, 2), s)) {
        return std::nullopt;
    }

    auto rest = text.substr(19);
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        while (!rest.empty() && rest.front() >= '0' && rest.front() <= '9')
            rest.remove_prefix(1);
    }
    if (!(rest.empty() || rest == "Z" || rest == "+00:00")) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{mo}, day{d}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }
    return TimePoint{sys_days{ymd} + hours{h} + minutes{mi} + seconds{s}};
}

json toJson(const DownloadItem& item) {
    json j;
    j["id"] = item.id;
    j["url"] = item.url;
    j["outputPath"] = item.outputPath.string();
    j["status"] = statusToString(item.status);
    j["bytesTransferred"] = item.bytesTransferred;
    j["totalBytes"] = item.totalBytes;
    if (item.checksum) {
        j["checksum"] = {{"algorithm", downloader::hashAlgoName(item.checksum->algo)},
                         {"expectedHex", item.checksum->expectedHex},
                         {"verified", item.checksum->verified}};
    } else {
        j["checksum"] = nullptr;
    }
    j["createdAt"] = formatTimestamp(item.createdAt);
    j["updatedAt"] = formatTimestamp(item.updatedAt);
    j["lastError"] = item.lastError ? json(*item.lastError) : json(nullptr);
    j["errorKind"] = errorKindToString(item.errorKind);
    j["retryCount"] = item.retryCount;
    if (item.etag)
        j["etag"] = *item.etag;
    if (item.lastModified)
        j["lastModified"] = *item.lastModified;
    return j;
}

json toJson(const QueueState& state) {
    json items = json::array();
    for (const auto& item : state.items) {
        items.push_back(toJson(item));
    }
    json j;
    j["schemaVersion"] = state.schemaVersion;
    j["lastAssignedId"] = state.lastAssignedId;
    j["items"] = std::move(items);
    return j;
}

Result<DownloadItem> itemFromJson(const json& j) {
    if (!j.is_object())
        return corrupt("item is not an object");

    auto need = [&](const char* key) -> const json* {
        auto it = j.find(key);
        return it == j.end() ? nullptr : &*it;
    };

    DownloadItem item;
    const json* v = need("id");
    if (!v || !v->is_number_unsigned() || v->get<ItemId>() == 0)
        return corrupt("item.id must be a positive integer");
    item.id = v->get<ItemId>();
    const std::string where = "item " + std::to_string(item.id);

    v = need("url");
    if (!v || !v->is_string() || v->get<std::string>().empty())
        return corrupt(where + ": url must be a non-empty string");
    item.url = v->get<std::string>();

    v = need("outputPath");
    if (!v || !v->is_string() || v->get<std::string>().empty())
        return corrupt(where + ": outputPath must be a non-empty string");
    item.outputPath = v->get<std::string>();

    v = need("status");
    std::optional<TransferStatus> status;
    if (v && v->is_string())
        status = parseStatus(v->get<std::string>());
    if (!status)
        return corrupt(where + ": invalid status");
    item.status = *status;

    v = need("bytesTransferred");
    if (!v || !v->is_number_integer() || v->get<std::int64_t>() < 0)
        return corrupt(where + ": bytesTransferred must be a non-negative integer");
    item.bytesTransferred = v->get<std::int64_t>();

    v = need("totalBytes");
    if (!v || !v->is_number_integer() || v->get<std::int64_t>() < -1)
        return corrupt(where + ": totalBytes must be an integer >= -1");
    item.totalBytes = v->get<std::int64_t>();

    v = need("checksum");
    if (!v)
        return corrupt(where + ": checksum missing");
    if (!v->is_null()) {
        if (!v->is_object())
            return corrupt(where + ": checksum must be an object or null");
        auto algoIt = v->find("algorithm");
        auto hexIt = v->find("expectedHex");
        auto verIt = v->find("verified");
        if (algoIt == v->end() || !algoIt->is_string() || hexIt == v->end() ||
            !hexIt->is_string() || verIt == v->end() || !verIt->is_boolean()) {
            return corrupt(where + ": malformed checksum");
        }
        auto spec = downloader::parseChecksum(algoIt->get<std::string>() + ":" +
                                              hexIt->get<std::string>());
        if (!spec)
            return corrupt(where + ": " + spec.error().message);
        item.checksum = spec.value();
        item.checksum->verified = verIt->get<bool>();
    }

    for (auto [key, target] : {std::pair<const char*, TimePoint*>{"createdAt", &item.createdAt},
                               std::pair<const char*, TimePoint*>{"updatedAt", &item.updatedAt}}) {
        v = need(key);
        std::optional<TimePoint> tp;
        if (v && v->is_string())
            tp = parseTimestamp(v->get<std::string>());
        if (!tp)
            return corrupt(where + ": invalid " + key);
        *target = *tp;
    }

    v = need("lastError");
    if (!v || !(v->is_null() || v->is_string()))
        return corrupt(where + ": lastError must be a string or null");
    if (v->is_string())
        item.lastError = v->get<std::string>();

    v = need("errorKind");
    std::optional<ErrorKind> kind;
    if (v && v->is_string())
        kind = parseErrorKind(v->get<std::string>());
    if (!kind)
        return corrupt(where + ": invalid errorKind");
    item.errorKind = *kind;

    v = need("retryCount");
    if (!v || !v->is_number_integer() || v->get<std::int64_t>() < 0 ||
        v->get<std::int64_t>() > std::numeric_limits<int>::max())
        return corrupt(where + ": retryCount must be a non-negative integer");
    item.retryCount = static_cast<int>(v->get<std::int64_t>());

    // Optional validators
    for (auto [key, target] :
         {std::pair<const char*, std::optional<std::string>*>{"etag", &item.etag},
          std::pair<const char*, std::optional<std::string>*>{"lastModified",
                                                               &item.lastModified}}) {
        v = need(key);
        if (!v || v->is_null())
            continue;
        if (!v->is_string())
            return corrupt(where + ": " + key + " must be a string or null");
        *target = v->get<std::string>();
    }

    return item;
}

Result<QueueState> queueStateFromJson(const json& j) {
    if (!j.is_object())
        return corrupt("state document is not an object");

    QueueState state;
    auto sv = j.find("schemaVersion");
    if (sv == j.end() || !sv->is_string())
        return corrupt("schemaVersion missing");
    state.schemaVersion = sv->get<std::string>();
    if (state.schemaVersion != kCurrentSchemaVersion)
        return corrupt("unexpected schemaVersion " + state.schemaVersion);

    auto last = j.find("lastAssignedId");
    if (last == j.end() || !last->is_number_unsigned())
        return corrupt("lastAssignedId must be a non-negative integer");
    state.lastAssignedId = last->get<ItemId>();

    auto items = j.find("items");
    if (items == j.end() || !items->is_array())
        return corrupt("items must be an array");

    std::set<ItemId> seen;
    for (const auto& entry : *items) {
        auto item = itemFromJson(entry);
        if (!item)
            return item.error();
        if (!seen.insert(item.value().id).second)
            return corrupt("duplicate item id " + std::to_string(item.value().id));
        if (item.value().id > state.lastAssignedId)
            return corrupt("item id " + std::to_string(item.value().id) +
                           " exceeds lastAssignedId");
        state.items.push_back(std::move(item).value());
    }
    return state;
}

std::string serialize(const QueueState& state) {
    return toJson(state).dump(2) + "\n";
}

} // namespace safedl::queue
