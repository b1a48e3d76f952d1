#pragma once

#include <safedl/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace safedl::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/..." only)
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value. Keys outside any section live under "".
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

/**
 * @brief Parse a minimal TOML document: [section] headers, key = value pairs, # comments.
 *
 * Dotted keys ("engine.max_parallel") outside a section are split on the first dot.
 * A missing file is NotFound; a line that is neither a header nor key = value is
 * InvalidArgument naming the line number.
 */
Result<ConfigTable> parse_config_text(std::string_view text);
Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path: override, $SAFEDL_CONFIG, $XDG_CONFIG_HOME/safedownload/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the directory holding the queue state document
/// $SAFEDOWNLOAD_STATE_DIR, else $XDG_STATE_HOME/safedownload, else ~/.safedownload
std::filesystem::path get_state_dir();

} // namespace safedl::config
