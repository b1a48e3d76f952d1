#include <catch2/catch_test_macros.hpp>

#include <safedl/core/logging.h>

#include "common/test_helpers_catch2.h"

#include <spdlog/spdlog.h>

#include <filesystem>

using namespace safedl;
using safedl::test::ScopedEnvVar;
using safedl::test::TempDir;

TEST_CASE("log levels are applied by name", "[core][logging]") {
    CHECK(logging::applyLevel("debug"));
    CHECK(spdlog::get_level() == spdlog::level::debug);
    CHECK(logging::applyLevel("error"));
    CHECK(spdlog::get_level() == spdlog::level::err);

    CHECK_FALSE(logging::applyLevel("loud"));
    CHECK(spdlog::get_level() == spdlog::level::err);
    REQUIRE(logging::applyLevel("info"));
}

TEST_CASE("a log file gets a rotating sink", "[core][logging]") {
    TempDir dir;
    ScopedEnvVar level("SAFEDL_LOG_LEVEL", std::nullopt);
    const auto file = dir / "logs" / "safedl.log";

    logging::configure(logging::LoggingConfig{"warn", file});
    CHECK(spdlog::default_logger()->name() == "safedl");
    CHECK(spdlog::get_level() == spdlog::level::warn);

    spdlog::warn("rotating sink check");
    spdlog::default_logger()->flush();
    CHECK(std::filesystem::exists(file));
    CHECK(safedl::test::read_file(file).find("rotating sink check") != std::string::npos);

    logging::configure(logging::LoggingConfig{});
}

TEST_CASE("SAFEDL_LOG_LEVEL overrides the configured level", "[core][logging]") {
    ScopedEnvVar level("SAFEDL_LOG_LEVEL", std::string("trace"));
    logging::configure(logging::LoggingConfig{"error", {}});
    CHECK(spdlog::get_level() == spdlog::level::trace);
    REQUIRE(logging::applyLevel("info"));
}
