#include <safedl/config/config_helpers.h>
#include <safedl/core/atomic_file.h>
#include <safedl/manifest/manifest_parser.h>

#include <spdlog/spdlog.h>

#include <sstream>

namespace safedl::manifest {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line);
    std::string tok;
    while (in >> tok) {
        tokens.push_back(std::move(tok));
    }
    return tokens;
}

// "algo:..." with a known algorithm name
bool looksLikeChecksum(std::string_view token) {
    auto colon = token.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    return downloader::parseHashAlgo(token.substr(0, colon)).has_value();
}

Error lineError(std::size_t lineNo, const std::string& what) {
    return Error{ErrorCode::InvalidArgument,
                 "manifest line " + std::to_string(lineNo) + ": " + what};
}

} // namespace

std::string fileNameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url = url.substr(scheme + 3);
        // Drop the authority; a bare host has no file name
        auto slash = url.find('/');
        if (slash == std::string_view::npos) {
            return "download";
        }
        url = url.substr(slash);
    }
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    auto last = url.rfind('/');
    std::string name(last == std::string_view::npos ? url : url.substr(last + 1));
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

Result<std::vector<ManifestEntry>> parseManifest(std::string_view text,
                                                 const fs::path& defaultDir) {
    std::vector<ManifestEntry> entries;
    std::istringstream in{std::string(text)};
    std::string line;
    std::size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        config::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto tokens = splitWhitespace(line);
        if (tokens.size() > 3) {
            return lineError(lineNo, "expected 'URL [algo:hex] [output]', got " +
                                         std::to_string(tokens.size()) + " fields");
        }

        ManifestEntry entry;
        entry.line = lineNo;
        entry.url = tokens[0];
        if (!downloader::isAbsoluteUrl(entry.url)) {
            return lineError(lineNo, "not an absolute URL: '" + entry.url + "'");
        }

        std::size_t next = 1;
        if (next < tokens.size() && looksLikeChecksum(tokens[next])) {
            auto cs = downloader::parseChecksum(tokens[next]);
            if (!cs) {
                return lineError(lineNo, cs.error().message);
            }
            entry.checksum = cs.value();
            ++next;
        }

        fs::path output;
        if (next < tokens.size()) {
            output = config::expand_tilde(tokens[next]);
            ++next;
        } else {
            output = fileNameFromUrl(entry.url);
        }
        if (next < tokens.size()) {
            return lineError(lineNo, "unexpected field '" + tokens[next] + "'");
        }
        entry.outputPath = output.is_absolute() ? output : defaultDir / output;
        entries.push_back(std::move(entry));
    }

    spdlog::debug("Parsed {} manifest entries", entries.size());
    return entries;
}

Result<std::vector<ManifestEntry>> parseManifestFile(const fs::path& path,
                                                     const fs::path& defaultDir) {
    auto text = core::readFile(path);
    if (!text) {
        return text.error();
    }
    return parseManifest(text.value(), defaultDir);
}

} // namespace safedl::manifest
