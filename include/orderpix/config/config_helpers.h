#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace orderpix::config {

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

// Tilde expansion ("~/x" -> "$HOME/x")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Replace anything that could drive a terminal (escape sequences, other control bytes).
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if ((c >= 0x20 && c != 0x7F) || c == '\t') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

// Read every "key = value" of an INI/TOML-style file. Keys are returned as "section.key"
// (or plain "key" before the first section header); values are unquoted and stripped of
// trailing "# comments". A missing or unreadable file yields an empty map.
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a config file; empty when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list. Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/orderpix or ~/.config/orderpix
/// Windows: %APPDATA%\orderpix
std::filesystem::path get_config_dir();

// Config file path: override when given, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace orderpix::config
