#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <safedl/core/atomic_file.h>
#include <safedl/core/file_lock.h>

#include "common/test_helpers_catch2.h"

#include <cerrno>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using namespace safedl;
using namespace safedl::core;
using safedl::test::TempDir;

TEST_CASE("errno values map to filesystem error codes", "[core][atomic_file]") {
    CHECK(errnoToErrorCode(EACCES) == ErrorCode::PermissionDenied);
    CHECK(errnoToErrorCode(EROFS) == ErrorCode::PermissionDenied);
    CHECK(errnoToErrorCode(ENOSPC) == ErrorCode::StorageFull);
    CHECK(errnoToErrorCode(ENOENT) == ErrorCode::NotFound);
    CHECK(errnoToErrorCode(EIO) == ErrorCode::IoError);

    auto err = makeErrnoError(ENOSPC, "write failed", "/tmp/x.part");
    CHECK(err.code == ErrorCode::StorageFull);
    CHECK_THAT(err.message, Catch::Matchers::ContainsSubstring("/tmp/x.part"));
    CHECK(classifyError(err.code) == ErrorKind::Filesystem);
}

TEST_CASE("atomicWriteFile replaces contents and leaves no temp files", "[core][atomic_file]") {
    TempDir dir;
    const auto target = dir / "state.json";

    REQUIRE(atomicWriteFile(target, "first"));
    REQUIRE(atomicWriteFile(target, "second version"));

    auto text = readFile(target);
    REQUIRE(text);
    CHECK(text.value() == "second version");

    std::size_t entries = 0;
    for (const auto& e : fs::directory_iterator(dir.path())) {
        (void)e;
        ++entries;
    }
    CHECK(entries == 1);
}

TEST_CASE("atomicWriteFile creates missing parent directories", "[core][atomic_file]") {
    TempDir dir;
    const auto target = dir / "nested" / "deeper" / "state.json";
    REQUIRE(atomicWriteFile(target, "x"));
    CHECK(safedl::test::read_file(target) == "x");
}

TEST_CASE("readFile reports a missing file as NotFound", "[core][atomic_file]") {
    TempDir dir;
    auto r = readFile(dir / "nope");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NotFound);
}

TEST_CASE("renameOrCopy moves a file over an existing target", "[core][atomic_file]") {
    TempDir dir;
    safedl::test::write_file(dir / "a.part", "payload");
    safedl::test::write_file(dir / "a", "old");

    REQUIRE(renameOrCopy(dir / "a.part", dir / "a"));
    CHECK_FALSE(fs::exists(dir / "a.part"));
    CHECK(safedl::test::read_file(dir / "a") == "payload");
}

TEST_CASE("FileLock excludes a second holder until released", "[core][file_lock]") {
    TempDir dir;
    const auto lockPath = dir / "state.json.lock";

    auto first = FileLock::acquire(lockPath, std::chrono::milliseconds(100));
    REQUIRE(first);
    CHECK(first.value().held());

    const auto started = std::chrono::steady_clock::now();
    auto second = FileLock::acquire(lockPath, std::chrono::milliseconds(150));
    REQUIRE_FALSE(second);
    CHECK(second.error().code == ErrorCode::ResourceExhausted);
    CHECK(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(100));

    first.value().release();
    auto third = FileLock::acquire(lockPath, std::chrono::milliseconds(100));
    REQUIRE(third);
    CHECK(third.value().held());
}
