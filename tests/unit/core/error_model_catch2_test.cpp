#include <catch2/catch_test_macros.hpp>

#include <safedl/core/types.h>

#include <fmt/format.h>

#include <stdexcept>
#include <string>

using namespace safedl;

TEST_CASE("Result carries a value or an error", "[core][result]") {
    Result<int> ok(42);
    REQUIRE(ok);
    CHECK(ok.value() == 42);
    CHECK_THROWS_AS(ok.error(), std::runtime_error);

    Result<int> bad(Error{ErrorCode::NotFound, "missing"});
    REQUIRE_FALSE(bad);
    CHECK(bad.error() == ErrorCode::NotFound);
    CHECK(bad.error().message == "missing");
    CHECK_THROWS_AS(bad.value(), std::runtime_error);

    Result<void> done;
    CHECK(done);
    Result<void> failed(ErrorCode::Timeout);
    REQUIRE_FALSE(failed);
    CHECK(failed.error().message == "Operation timed out");
}

TEST_CASE("error codes classify into failure kinds", "[core][result]") {
    CHECK(classifyError(ErrorCode::NetworkError) == ErrorKind::Network);
    CHECK(classifyError(ErrorCode::Timeout) == ErrorKind::Network);
    CHECK(classifyError(ErrorCode::ServerError) == ErrorKind::Network);
    CHECK(classifyError(ErrorCode::ProtocolError) == ErrorKind::Protocol);
    CHECK(classifyError(ErrorCode::ChecksumMismatch) == ErrorKind::Verification);
    CHECK(classifyError(ErrorCode::StorageFull) == ErrorKind::Filesystem);
    CHECK(classifyError(ErrorCode::PermissionDenied) == ErrorKind::Filesystem);
    CHECK(classifyError(ErrorCode::OperationCancelled) == ErrorKind::Cancelled);
    CHECK(classifyError(ErrorCode::CorruptedData) == ErrorKind::Unknown);
}

TEST_CASE("only transient failures are retryable", "[core][result]") {
    CHECK(isRetryable(ErrorCode::NetworkError));
    CHECK(isRetryable(ErrorCode::Timeout));
    CHECK(isRetryable(ErrorCode::ServerError));
    CHECK_FALSE(isRetryable(ErrorCode::ProtocolError));
    CHECK_FALSE(isRetryable(ErrorCode::ChecksumMismatch));
    CHECK_FALSE(isRetryable(ErrorCode::StorageFull));
}

TEST_CASE("failure kinds map to distinct result codes", "[core][result]") {
    CHECK(resultCodeFor(ErrorKind::None) == ResultCode::Success);
    CHECK(resultCodeFor(ErrorKind::Network) == ResultCode::NetworkFailure);
    CHECK(resultCodeFor(ErrorKind::Verification) == ResultCode::VerificationFailure);
    CHECK(resultCodeFor(ErrorKind::Filesystem) == ResultCode::FilesystemFailure);
    CHECK(resultCodeFor(ErrorKind::Protocol) == ResultCode::ProtocolFailure);
    CHECK(resultCodeFor(ErrorKind::Unknown) == ResultCode::GeneralFailure);
}

TEST_CASE("ErrorCode is formattable", "[core][result]") {
    CHECK(fmt::format("{}", ErrorCode::ChecksumMismatch) == "Checksum mismatch");
    CHECK(std::string(errorKindToString(ErrorKind::Verification)) == "verification");
}
