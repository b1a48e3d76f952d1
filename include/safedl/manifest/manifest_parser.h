#pragma once

#include <safedl/core/types.h>
#include <safedl/downloader/downloader.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safedl::manifest {

/**
 * @brief One download request read from a batch manifest.
 */
struct ManifestEntry {
    std::string url;
    std::filesystem::path outputPath;
    std::optional<downloader::ChecksumSpec> checksum;
    std::size_t line{0};
};

/**
 * @brief Parse a batch manifest.
 *
 * One entry per line: `URL [algo:hex] [output-path]`. Blank lines and lines starting with
 * '#' are skipped. A relative output path is resolved against @p defaultDir; a missing one
 * is derived from the URL. Errors are InvalidArgument and name the offending line.
 */
Result<std::vector<ManifestEntry>> parseManifest(std::string_view text,
                                                 const std::filesystem::path& defaultDir);

Result<std::vector<ManifestEntry>> parseManifestFile(const std::filesystem::path& path,
                                                     const std::filesystem::path& defaultDir);

// Last path segment of the URL without query or fragment; "download" when there is none.
std::string fileNameFromUrl(std::string_view url);

} // namespace safedl::manifest
