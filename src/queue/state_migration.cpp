/*
 * safedl/src/queue/state_migration.cpp
 *
 * Queue document migration chain
 * - 0.0.0 (legacy, no schemaVersion) -> 1.0.0 -> 1.1.0
 * - Steps are pure functions on nlohmann::json; the migrator writes a backup before each
 */

#include <safedl/core/atomic_file.h>
#include <safedl/queue/download_item.h>
#include <safedl/queue/state_migration.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>

namespace safedl::queue {

using nlohmann::json;

namespace {

Error corrupt(const std::string& what) {
    return Error{ErrorCode::CorruptedData, what};
}

std::optional<std::string> legacyStatus(const std::string& s) {
    if (s == "queued" || s == "pending")
        return "queued";
    if (s == "downloading" || s == "in_progress")
        return "downloading";
    if (s == "paused")
        return "paused";
    if (s == "completed" || s == "done")
        return "completed";
    if (s == "failed" || s == "error")
        return "failed";
    if (s == "verifying")
        return "verifying";
    return std::nullopt;
}

// Legacy timestamps are ISO strings or epoch seconds; anything missing becomes the epoch.
std::optional<std::string> legacyTimestamp(const json& v) {
    if (v.is_null())
        return formatTimestamp(TimePoint{});
    if (v.is_number_integer()) {
        return formatTimestamp(TimePoint{std::chrono::seconds(v.get<std::int64_t>())});
    }
    if (v.is_string()) {
        auto tp = parseTimestamp(v.get<std::string>());
        if (tp)
            return formatTimestamp(*tp);
    }
    return std::nullopt;
}

const json& field(const json& obj, const char* key) {
    static const json kNull = nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? kNull : *it;
}

} // namespace

std::optional<SchemaVersion> SchemaVersion::parse(std::string_view text) {
    SchemaVersion v;
    int* parts[] = {&v.major, &v.minor, &v.patch};
    std::size_t idx = 0;
    const char* p = text.data();
    const char* end = text.data() + text.size();
    while (idx < 3) {
        auto res = std::from_chars(p, end, *parts[idx]);
        if (res.ec != std::errc() || *parts[idx] < 0)
            return std::nullopt;
        p = res.ptr;
        ++idx;
        if (idx < 3) {
            if (p == end || *p != '.')
                return std::nullopt;
            ++p;
        }
    }
    if (p != end)
        return std::nullopt;
    return v;
}

Result<SchemaVersion> detectSchemaVersion(const json& doc) {
    if (!doc.is_object()) {
        return corrupt("state document is not a JSON object");
    }
    auto it = doc.find("schemaVersion");
    if (it == doc.end()) {
        if (doc.contains("downloads")) {
            return SchemaVersion{0, 0, 0};
        }
        return corrupt("state document has neither schemaVersion nor legacy downloads");
    }
    if (!it->is_string()) {
        return corrupt("schemaVersion is not a string");
    }
    auto v = SchemaVersion::parse(it->get<std::string>());
    if (!v) {
        return corrupt("unparsable schemaVersion '" + it->get<std::string>() + "'");
    }
    return *v;
}

Result<json> migrateLegacyTo_1_0_0(const json& doc) {
    const json& downloads = field(doc, "downloads");
    if (!downloads.is_array()) {
        return corrupt("legacy document: downloads is not an array");
    }

    json items = json::array();
    ItemId maxId = 0;
    for (const auto& d : downloads) {
        if (!d.is_object())
            return corrupt("legacy document: download entry is not an object");

        const json& id = field(d, "id");
        if (!id.is_number_unsigned() || id.get<ItemId>() == 0)
            return corrupt("legacy document: download without a positive id");
        const ItemId itemId = id.get<ItemId>();
        maxId = std::max(maxId, itemId);

        const json& url = field(d, "url");
        const json& output = field(d, "output");
        if (!url.is_string() || !output.is_string())
            return corrupt("legacy download " + std::to_string(itemId) + ": url/output missing");

        const json& rawStatus = field(d, "status");
        auto status = rawStatus.is_string() ? legacyStatus(rawStatus.get<std::string>())
                                            : std::optional<std::string>("queued");
        if (!status)
            return corrupt("legacy download " + std::to_string(itemId) + ": unknown status");

        const json& bytes = field(d, "bytes_downloaded");
        const json& total = field(d, "total_size");
        const json& checksum = field(d, "checksum");
        const json& error = field(d, "error");

        auto created = legacyTimestamp(field(d, "created"));
        auto updated = legacyTimestamp(field(d, "updated"));
        if (!created || !updated)
            return corrupt("legacy download " + std::to_string(itemId) + ": bad timestamp");

        json item;
        item["id"] = itemId;
        item["url"] = url;
        item["outputPath"] = output;
        item["status"] = *status;
        item["bytesTransferred"] =
            bytes.is_number_integer() ? std::max<std::int64_t>(0, bytes.get<std::int64_t>()) : 0;
        item["totalBytes"] = (total.is_number_integer() && total.get<std::int64_t>() > 0)
                                 ? total.get<std::int64_t>()
                                 : std::int64_t{-1};
        item["checksum"] =
            (checksum.is_string() && !checksum.get<std::string>().empty()) ? checksum : json(nullptr);
        item["createdAt"] = *created;
        item["updatedAt"] = *updated;
        item["lastError"] =
            (error.is_string() && !error.get<std::string>().empty()) ? error : json(nullptr);
        items.push_back(std::move(item));
    }

    ItemId lastAssigned = maxId;
    const json& nextId = field(doc, "next_id");
    if (nextId.is_number_unsigned() && nextId.get<ItemId>() > 0) {
        lastAssigned = std::max(lastAssigned, nextId.get<ItemId>() - 1);
    }

    json out;
    out["schemaVersion"] = "1.0.0";
    out["lastAssignedId"] = lastAssigned;
    out["items"] = std::move(items);
    return out;
}

Result<json> migrate_1_0_0_to_1_1_0(const json& doc) {
    const json& items = field(doc, "items");
    if (!items.is_array()) {
        return corrupt("1.0.0 document: items is not an array");
    }

    json out = doc;
    for (auto& item : out["items"]) {
        if (!item.is_object())
            return corrupt("1.0.0 document: item is not an object");

        const json checksum = field(item, "checksum");
        if (checksum.is_string() && !checksum.get<std::string>().empty()) {
            const auto text = checksum.get<std::string>();
            auto colon = text.find(':');
            if (colon == std::string::npos)
                return corrupt("1.0.0 document: malformed checksum '" + text + "'");
            const json& status = field(item, "status");
            item["checksum"] = {{"algorithm", text.substr(0, colon)},
                                {"expectedHex", text.substr(colon + 1)},
                                {"verified", status.is_string() && status == "completed"}};
        } else {
            item["checksum"] = nullptr;
        }

        item["retryCount"] = 0;
        const json& lastError = field(item, "lastError");
        item["errorKind"] = lastError.is_string() ? "unknown" : "none";
    }
    out["schemaVersion"] = "1.1.0";
    return out;
}

StateMigrator::StateMigrator()
    : StateMigrator({
          MigrationStep{{0, 0, 0}, {1, 0, 0}, "legacy downloads[] layout to items[]",
                        &migrateLegacyTo_1_0_0},
          MigrationStep{{1, 0, 0}, {1, 1, 0}, "structured checksum, retryCount, errorKind",
                        &migrate_1_0_0_to_1_1_0},
      }) {}

StateMigrator::StateMigrator(std::vector<MigrationStep> steps) : steps_(std::move(steps)) {}

SchemaVersion StateMigrator::currentVersion() {
    return SchemaVersion{1, 1, 0};
}

Result<std::filesystem::path> StateMigrator::createBackup(const json& doc,
                                                          const std::filesystem::path& statePath,
                                                          const SchemaVersion& from) const {
    auto backupPath = statePath;
    backupPath += ".v" + from.toString() + ".bak";
    if (auto r = core::atomicWriteFile(backupPath, doc.dump(2) + "\n"); !r) {
        return r.error();
    }
    return backupPath;
}

Result<MigrationOutcome> StateMigrator::migrate(json& doc,
                                                const std::filesystem::path& statePath) const {
    auto detected = detectSchemaVersion(doc);
    if (!detected) {
        return detected.error();
    }

    MigrationOutcome outcome;
    outcome.initial = detected.value();
    SchemaVersion version = detected.value();
    const SchemaVersion target = currentVersion();

    if (version > target) {
        return Error{ErrorCode::UpgradeRequired,
                     "State schema " + version.toString() + " is newer than supported " +
                         target.toString() + "; upgrade safedl"};
    }

    while (version < target) {
        auto step = std::find_if(steps_.begin(), steps_.end(),
                                 [&](const MigrationStep& s) { return s.from == version; });
        if (step == steps_.end()) {
            return corrupt("No migration path from schema " + version.toString());
        }

        if (!statePath.empty()) {
            auto backup = createBackup(doc, statePath, version);
            if (!backup) {
                return backup.error();
            }
            spdlog::info("Backed up queue state ({}) to {}", version.toString(),
                         backup.value().string());
            outcome.backups.push_back(backup.value());
        }

        auto migrated = step->apply(doc);
        if (!migrated) {
            return Error{migrated.error().code, "Migration " + version.toString() + " -> " +
                                                    step->to.toString() + " failed: " +
                                                    migrated.error().message};
        }
        doc = std::move(migrated).value();
        spdlog::info("Migrated queue state {} -> {} ({})", version.toString(),
                     step->to.toString(), step->description);
        outcome.applied.push_back(version.toString() + " -> " + step->to.toString());
        version = step->to;
    }
    return outcome;
}

} // namespace safedl::queue
