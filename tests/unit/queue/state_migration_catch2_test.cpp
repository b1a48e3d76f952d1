#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <safedl/queue/download_item.h>
#include <safedl/queue/state_migration.h>

#include "common/test_helpers_catch2.h"

#include <nlohmann/json.hpp>

#include <filesystem>

using namespace safedl;
using namespace safedl::queue;
using nlohmann::json;
using safedl::test::TempDir;

namespace {

json loadFixture(const std::string& name) {
    const auto path = std::filesystem::path(SAFEDL_TEST_DATA_DIR) / "state" / name;
    return json::parse(safedl::test::read_file(path));
}

} // namespace

TEST_CASE("schema versions parse and order", "[queue][migration]") {
    auto v = SchemaVersion::parse("1.10.2");
    REQUIRE(v);
    CHECK(v->toString() == "1.10.2");
    CHECK(SchemaVersion{1, 2, 0} < SchemaVersion{1, 10, 0});
    CHECK_FALSE(SchemaVersion::parse("1.2"));
    CHECK_FALSE(SchemaVersion::parse("1.2.x"));

    auto legacy = detectSchemaVersion(loadFixture("legacy.json"));
    REQUIRE(legacy);
    CHECK(legacy.value() == SchemaVersion{0, 0, 0});

    auto unknown = detectSchemaVersion(json{{"foo", 1}});
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == ErrorCode::CorruptedData);
}

TEST_CASE("legacy documents migrate through every step with backups", "[queue][migration]") {
    TempDir dir;
    const auto statePath = dir / "state.json";
    json doc = loadFixture("legacy.json");

    StateMigrator migrator;
    auto outcome = migrator.migrate(doc, statePath);
    REQUIRE(outcome);
    CHECK(outcome.value().initial == SchemaVersion{0, 0, 0});
    REQUIRE(outcome.value().applied.size() == 2);
    CHECK(outcome.value().applied[0] == "0.0.0 -> 1.0.0");
    CHECK(outcome.value().applied[1] == "1.0.0 -> 1.1.0");

    REQUIRE(outcome.value().backups.size() == 2);
    CHECK(std::filesystem::exists(dir / "state.json.v0.0.0.bak"));
    CHECK(std::filesystem::exists(dir / "state.json.v1.0.0.bak"));
    auto legacyBackup = json::parse(safedl::test::read_file(dir / "state.json.v0.0.0.bak"));
    CHECK(legacyBackup.contains("downloads"));

    auto state = queueStateFromJson(doc);
    REQUIRE(state);
    const auto& s = state.value();
    CHECK(s.schemaVersion == kCurrentSchemaVersion);
    CHECK(s.lastAssignedId == 6);
    REQUIRE(s.items.size() == 3);

    const auto* done = s.find(1);
    REQUIRE(done);
    CHECK(done->status == TransferStatus::Completed);
    REQUIRE(done->checksum);
    CHECK(done->checksum->verified);
    CHECK(formatTimestamp(done->createdAt) == "2025-01-02T03:04:05Z");
    CHECK(formatTimestamp(done->updatedAt) == "2025-01-02T03:04:05Z");

    const auto* running = s.find(3);
    REQUIRE(running);
    CHECK(running->status == TransferStatus::Downloading);
    CHECK(running->totalBytes == -1);
    CHECK(running->errorKind == ErrorKind::Unknown);
    CHECK(running->lastError == std::optional<std::string>("connection reset"));
    CHECK(running->createdAt == TimePoint{});

    const auto* pending = s.find(4);
    REQUIRE(pending);
    CHECK(pending->status == TransferStatus::Queued);
    CHECK_FALSE(pending->checksum);
    CHECK(pending->retryCount == 0);
}

TEST_CASE("1.0.0 documents gain structured checksums", "[queue][migration]") {
    json doc = loadFixture("v1_0_0.json");
    StateMigrator migrator;
    auto outcome = migrator.migrate(doc, {});
    REQUIRE(outcome);
    CHECK(outcome.value().backups.empty());

    auto state = queueStateFromJson(doc);
    REQUIRE(state);
    const auto* item = state.value().find(2);
    REQUIRE(item);
    REQUIRE(item->checksum);
    CHECK(item->checksum->algo == downloader::HashAlgo::Md5);
    CHECK_FALSE(item->checksum->verified);
    CHECK(item->errorKind == ErrorKind::Unknown);
}

TEST_CASE("current documents are left alone", "[queue][migration]") {
    QueueState state;
    json doc = toJson(state);
    const json before = doc;
    auto outcome = StateMigrator{}.migrate(doc, {});
    REQUIRE(outcome);
    CHECK(outcome.value().applied.empty());
    CHECK(doc == before);
}

TEST_CASE("newer documents require an upgrade", "[queue][migration]") {
    TempDir dir;
    json doc = loadFixture("future.json");
    auto outcome = StateMigrator{}.migrate(doc, dir / "state.json");
    REQUIRE_FALSE(outcome);
    CHECK(outcome.error().code == ErrorCode::UpgradeRequired);
    CHECK(std::filesystem::is_empty(dir.path()));
}

TEST_CASE("a gap in the migration chain is reported", "[queue][migration]") {
    StateMigrator onlyLegacy({MigrationStep{
        {0, 0, 0}, {1, 0, 0}, "legacy", &migrateLegacyTo_1_0_0}});
    json doc = loadFixture("legacy.json");
    auto outcome = onlyLegacy.migrate(doc, {});
    REQUIRE_FALSE(outcome);
    CHECK(outcome.error().code == ErrorCode::CorruptedData);
    CHECK_THAT(outcome.error().message, Catch::Matchers::ContainsSubstring("1.0.0"));
}
