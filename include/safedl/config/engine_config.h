#pragma once

#include <safedl/core/logging.h>
#include <safedl/core/types.h>
#include <safedl/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace safedl::config {

/**
 * @brief Runtime settings of a download engine.
 *
 * Defaults are usable as-is; loadEngineConfig() overlays a TOML file and
 * applyEnvironmentOverrides() overlays SAFEDOWNLOAD_STATE_DIR / SAFEDL_* variables.
 */
struct EngineConfig {
    std::filesystem::path stateDir;           // empty = get_state_dir()
    std::string stateFileName{"state.json"};

    std::size_t maxParallel{3};
    downloader::RetryPolicy retry{};
    int maxManualRetries{5};
    downloader::RateLimit rateLimit{};

    std::chrono::milliseconds progressInterval{500};
    std::chrono::milliseconds persistInterval{1000};
    std::chrono::milliseconds lockTimeout{5000};

    downloader::NetworkConfig network{};
    safedl::logging::LoggingConfig logging{};

    [[nodiscard]] std::filesystem::path resolvedStateDir() const;
    [[nodiscard]] std::filesystem::path statePath() const {
        return resolvedStateDir() / stateFileName;
    }
};

/**
 * @brief Reject values the engine cannot run with (maxParallel == 0, negative retries...).
 */
Result<void> validate(const EngineConfig& config);

/**
 * @brief Overlay a TOML file onto @p base.
 *
 * Sections: [engine] state_dir, state_file, max_parallel, max_manual_retries,
 * progress_interval_ms, persist_interval_ms, lock_timeout_ms; [retry] max_attempts,
 * initial_backoff_ms, multiplier, max_backoff_ms; [rate_limit] global_bps, per_item_bps,
 * burst_bytes; [network] connect_timeout_ms, low_speed_timeout_ms, follow_redirects,
 * insecure, ca_path, proxy, user_agent; [logging] level, file.
 * Unknown keys are ignored. Malformed numbers are InvalidArgument naming the key.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path,
                                      EngineConfig base = EngineConfig{});

// SAFEDOWNLOAD_STATE_DIR, SAFEDL_MAX_PARALLEL, SAFEDL_RATE_LIMIT_BPS, SAFEDL_LOG_LEVEL
Result<void> applyEnvironmentOverrides(EngineConfig& config);

} // namespace safedl::config
