#pragma once

#include <safedl/core/types.h>

#include <cerrno>
#include <filesystem>
#include <string>
#include <string_view>

namespace safedl::core {

/**
 * @brief Map an errno value from a filesystem call to an ErrorCode.
 *
 * EACCES/EPERM/EROFS map to PermissionDenied, ENOSPC/EDQUOT to StorageFull, anything else
 * to IoError.
 */
ErrorCode errnoToErrorCode(int err) noexcept;

/**
 * @brief Build an Error from errno with a "<what>: <path>: <strerror>" message.
 */
Error makeErrnoError(int err, std::string_view what, const std::filesystem::path& path);

// fsync a regular file by path.
Result<void> fsyncFile(const std::filesystem::path& path);

// fsync a directory so that renames/creates inside it are durable.
Result<void> fsyncDirectory(const std::filesystem::path& dir);

/**
 * @brief Atomically replace @p path with @p contents.
 *
 * Writes a temporary sibling file in the same directory, fsyncs it, renames it over the
 * target and fsyncs the directory. A reader only ever observes the old or the new file.
 * The temporary file is removed on any failure.
 */
Result<void> atomicWriteFile(const std::filesystem::path& path, std::string_view contents);

// Read a whole file into a string.
Result<std::string> readFile(const std::filesystem::path& path);

/**
 * @brief Move @p from over @p to, falling back to copy+fsync+remove on EXDEV.
 */
Result<void> renameOrCopy(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace safedl::core
