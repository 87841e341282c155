#pragma once

#include <mcpbridge/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Integer parsing; nullopt unless the whole string is a number
std::optional<long long> parse_int(std::string_view s);

// Time parsing
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

std::optional<bool> parse_bool(std::string_view s);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"]; quotes around items are removed.
std::vector<std::string> parse_string_list(const std::string& raw);

// section name -> (key -> raw unquoted value), in file order per key
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

/**
 * @brief Read a TOML-style file of [section] headers and key = value lines.
 *
 * '#' starts a comment outside of quotes. Keys appearing before any section
 * header land in the "" section. FileNotFound when the file cannot be opened,
 * InvalidArgument (with the line number) for lines that are neither.
 */
Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path);

// Get standard config path ($XDG_CONFIG_HOME/mcpbridge/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace mcpbridge::config
