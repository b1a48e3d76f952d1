#pragma once

#include <safedl/core/types.h>

#include <nlohmann/json.hpp>

#include <compare>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safedl::queue {

/**
 * @brief Semantic version of the persisted queue document
 */
struct SchemaVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    std::string toString() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    static std::optional<SchemaVersion> parse(std::string_view text);

    auto operator<=>(const SchemaVersion&) const = default;
};

/**
 * @brief Version of a raw document; a document without "schemaVersion" is legacy 0.0.0.
 */
Result<SchemaVersion> detectSchemaVersion(const nlohmann::json& doc);

/**
 * @brief One step of the migration chain. Pure: input document in, migrated document out.
 */
struct MigrationStep {
    SchemaVersion from;
    SchemaVersion to;
    std::string description;
    std::function<Result<nlohmann::json>(const nlohmann::json&)> apply;
};

struct MigrationOutcome {
    SchemaVersion initial;
    std::vector<std::string> applied; // "0.0.0 -> 1.0.0", ...
    std::vector<std::filesystem::path> backups;
};

/**
 * @brief Legacy layout ("downloads", "next_id", snake_case fields) to 1.0.0
 */
Result<nlohmann::json> migrateLegacyTo_1_0_0(const nlohmann::json& doc);

/**
 * @brief 1.0.0 to 1.1.0: structured checksum with "verified", adds retryCount and errorKind
 */
Result<nlohmann::json> migrate_1_0_0_to_1_1_0(const nlohmann::json& doc);

/**
 * @brief Upgrades queue documents to the current schema one step at a time.
 *
 * Before each step the document as it was before that step is written next to the state
 * file as "<name>.v<from>.bak".
 */
class StateMigrator {
public:
    StateMigrator();
    explicit StateMigrator(std::vector<MigrationStep> steps);

    static SchemaVersion currentVersion();
    const std::vector<MigrationStep>& steps() const { return steps_; }

    /**
     * @brief Migrate @p doc in place.
     *
     * A version newer than currentVersion() is UpgradeRequired (nothing written). A version
     * with no step leading out of it, or a failing step, is CorruptedData.
     * @param statePath canonical state file; backups are written beside it. Empty = no backups.
     */
    Result<MigrationOutcome> migrate(nlohmann::json& doc, const std::filesystem::path& statePath) const;

private:
    Result<std::filesystem::path> createBackup(const nlohmann::json& doc,
                                               const std::filesystem::path& statePath,
                                               const SchemaVersion& from) const;

    std::vector<MigrationStep> steps_;
};

} // namespace safedl::queue
