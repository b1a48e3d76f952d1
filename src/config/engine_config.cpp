#include <safedl/config/config_helpers.h>
#include <safedl/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <limits>

namespace safedl::config {

namespace {

Error badValue(const std::string& section, const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + section + "." + key + ": '" + value + "'"};
}

Result<std::uint64_t> toUnsigned(const std::string& section, const std::string& key,
                                 const std::string& value) {
    std::uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        return badValue(section, key, value);
    }
    return out;
}

Result<double> toDouble(const std::string& section, const std::string& key,
                        const std::string& value) {
    try {
        std::size_t used = 0;
        double d = std::stod(value, &used);
        if (used != value.size()) {
            return badValue(section, key, value);
        }
        return d;
    } catch (const std::exception&) {
        return badValue(section, key, value);
    }
}

Result<bool> toBool(const std::string& section, const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes")
        return true;
    if (value == "false" || value == "0" || value == "no")
        return false;
    return badValue(section, key, value);
}

// Applies one key; returns an error for malformed values, ignores unknown keys.
Result<void> applyKey(EngineConfig& cfg, const std::string& section, const std::string& key,
                      const std::string& value) {
    auto ms = [&](std::chrono::milliseconds& target) -> Result<void> {
        auto v = toUnsigned(section, key, value);
        if (!v)
            return v.error();
        target = std::chrono::milliseconds(static_cast<std::int64_t>(v.value()));
        return Result<void>();
    };
    auto u64 = [&](std::uint64_t& target) -> Result<void> {
        auto v = toUnsigned(section, key, value);
        if (!v)
            return v.error();
        target = v.value();
        return Result<void>();
    };
    auto flag = [&](bool& target) -> Result<void> {
        auto v = toBool(section, key, value);
        if (!v)
            return v.error();
        target = v.value();
        return Result<void>();
    };

    if (section == "engine") {
        if (key == "state_dir") {
            cfg.stateDir = expand_tilde(value);
        } else if (key == "state_file") {
            cfg.stateFileName = value;
        } else if (key == "max_parallel") {
            auto v = toUnsigned(section, key, value);
            if (!v)
                return v.error();
            cfg.maxParallel = static_cast<std::size_t>(v.value());
        } else if (key == "max_manual_retries") {
            auto v = toUnsigned(section, key, value);
            if (!v || v.value() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                return badValue(section, key, value);
            cfg.maxManualRetries = static_cast<int>(v.value());
        } else if (key == "progress_interval_ms") {
            return ms(cfg.progressInterval);
        } else if (key == "persist_interval_ms") {
            return ms(cfg.persistInterval);
        } else if (key == "lock_timeout_ms") {
            return ms(cfg.lockTimeout);
        }
    } else if (section == "retry") {
        if (key == "max_attempts") {
            auto v = toUnsigned(section, key, value);
            if (!v || v.value() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                return badValue(section, key, value);
            cfg.retry.maxAttempts = static_cast<int>(v.value());
        } else if (key == "initial_backoff_ms") {
            return ms(cfg.retry.initialBackoff);
        } else if (key == "max_backoff_ms") {
            return ms(cfg.retry.maxBackoff);
        } else if (key == "multiplier") {
            auto v = toDouble(section, key, value);
            if (!v)
                return v.error();
            cfg.retry.multiplier = v.value();
        }
    } else if (section == "rate_limit") {
        if (key == "global_bps") {
            return u64(cfg.rateLimit.globalBps);
        } else if (key == "per_item_bps") {
            return u64(cfg.rateLimit.perItemBps);
        } else if (key == "burst_bytes") {
            return u64(cfg.rateLimit.burstBytes);
        }
    } else if (section == "network") {
        if (key == "connect_timeout_ms") {
            return ms(cfg.network.connectTimeout);
        } else if (key == "low_speed_timeout_ms") {
            return ms(cfg.network.lowSpeedTimeout);
        } else if (key == "follow_redirects") {
            return flag(cfg.network.followRedirects);
        } else if (key == "insecure") {
            return flag(cfg.network.tls.insecure);
        } else if (key == "ca_path") {
            cfg.network.tls.caPath = expand_tilde(value).string();
        } else if (key == "proxy") {
            if (value.empty())
                cfg.network.proxy.reset();
            else
                cfg.network.proxy = value;
        } else if (key == "user_agent") {
            cfg.network.userAgent = value;
        }
    } else if (section == "logging") {
        if (key == "level") {
            cfg.logging.level = value;
        } else if (key == "file") {
            cfg.logging.file = expand_tilde(value);
        }
    }
    return Result<void>();
}

} // namespace

std::filesystem::path EngineConfig::resolvedStateDir() const {
    return stateDir.empty() ? get_state_dir() : stateDir;
}

Result<void> validate(const EngineConfig& config) {
    if (config.maxParallel == 0) {
        return Error{ErrorCode::InvalidArgument, "maxParallel must be at least 1"};
    }
    if (config.stateFileName.empty()) {
        return Error{ErrorCode::InvalidArgument, "stateFileName must not be empty"};
    }
    if (config.retry.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "retry.maxAttempts must be at least 1"};
    }
    if (config.retry.multiplier < 1.0) {
        return Error{ErrorCode::InvalidArgument, "retry.multiplier must be >= 1.0"};
    }
    if (config.maxManualRetries < 0) {
        return Error{ErrorCode::InvalidArgument, "maxManualRetries must not be negative"};
    }
    return Result<void>();
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path, EngineConfig base) {
    auto table = parse_config_file(path);
    if (!table) {
        return table.error();
    }
    for (const auto& [section, entries] : table.value()) {
        for (const auto& [key, value] : entries) {
            if (auto r = applyKey(base, section, key, value); !r) {
                return r.error();
            }
        }
    }
    if (auto v = validate(base); !v) {
        return v.error();
    }
    spdlog::debug("Loaded engine config from {}", path.string());
    return base;
}

Result<void> applyEnvironmentOverrides(EngineConfig& config) {
    if (const char* env = std::getenv("SAFEDOWNLOAD_STATE_DIR"); env && *env) {
        config.stateDir = expand_tilde(env);
    }
    if (const char* env = std::getenv("SAFEDL_MAX_PARALLEL"); env && *env) {
        if (auto r = applyKey(config, "engine", "max_parallel", env); !r)
            return r;
    }
    if (const char* env = std::getenv("SAFEDL_RATE_LIMIT_BPS"); env && *env) {
        if (auto r = applyKey(config, "rate_limit", "global_bps", env); !r)
            return r;
    }
    if (const char* env = std::getenv("SAFEDL_LOG_LEVEL"); env && *env) {
        config.logging.level = env;
    }
    return validate(config);
}

} // namespace safedl::config
