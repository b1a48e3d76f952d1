#include <safedl/config/config_helpers.h>

#include <fstream>
#include <sstream>

namespace safedl::config {

namespace {

void strip_inline_comment(std::string& v) {
    // A '#' inside a quoted string is part of the value
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

Result<ConfigTable> parse_config_text(std::string_view text) {
    ConfigTable table;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string currentSection;
    std::size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             "config line " + std::to_string(lineNo) + ": unterminated section"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument,
                         "config line " + std::to_string(lineNo) + ": expected key = value"};
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);
        if (k.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "config line " + std::to_string(lineNo) + ": empty key"};
        }

        std::string section = currentSection;
        // Support both "engine.max_parallel" and "[engine] max_parallel"
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        table[section][k] = unquote(v);
    }
    return table;
}

Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        if (!std::filesystem::exists(config_path)) {
            return Error{ErrorCode::NotFound, "Config file not found: " + config_path.string()};
        }
        return Error{ErrorCode::IoError, "Cannot open config file: " + config_path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_config_text(ss.str());
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto table = parse_config_file(config_path);
    if (!table) {
        return "";
    }
    const auto& t = table.value();
    auto sit = t.find(section);
    if (sit == t.end()) {
        return "";
    }
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? std::string{} : kit->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SAFEDL_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "safedownload" / "config.toml";
    }

    return configHome / "safedownload" / "config.toml";
}

std::filesystem::path get_state_dir() {
    if (const char* env = std::getenv("SAFEDOWNLOAD_STATE_DIR"); env && *env) {
        return expand_tilde(env);
    }
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "safedownload";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".safedownload";
    }
    return std::filesystem::current_path() / ".safedownload";
}

} // namespace safedl::config
