#pragma once

#include <filesystem>
#include <string>

namespace safedl::logging {

struct LoggingConfig {
    std::string level = "info"; // trace|debug|info|warn|error|off
    std::filesystem::path file;  // empty = colour stderr sink
};

/**
 * @brief Install the default "safedl" spdlog logger.
 *
 * A non-empty file path uses a rotating file sink (10MB x 5). SAFEDL_LOG_LEVEL overrides
 * the configured level.
 */
void configure(const LoggingConfig& config);

// Apply a level string to the default logger; unknown strings leave the level unchanged.
bool applyLevel(const std::string& level);

} // namespace safedl::logging
