#include <safedl/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace safedl::logging {

bool applyLevel(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        return false;
    }
    return true;
}

void configure(const LoggingConfig& config) {
    try {
        std::shared_ptr<spdlog::logger> logger;
        if (!config.file.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(config.file.parent_path(), ec);
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), max_size, max_files);
            logger = std::make_shared<spdlog::logger>("safedl", sink);
        } else {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            logger = std::make_shared<spdlog::logger>("safedl", sink);
        }
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);
    } catch (const std::exception& ex) {
        // Keep the existing default logger
        std::cerr << "safedl: failed to configure logging: " << ex.what() << std::endl;
    }

    std::string level = config.level;
    if (const char* env = std::getenv("SAFEDL_LOG_LEVEL"); env && *env) {
        level = env;
    }
    if (!applyLevel(level)) {
        spdlog::warn("Unknown log level '{}', keeping current level", level);
    }
}

} // namespace safedl::logging
