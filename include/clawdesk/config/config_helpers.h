#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clawdesk::config {

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

/// Returns the user's home directory (HOME, or USERPROFILE on Windows); empty if unset.
std::filesystem::path get_home_dir();

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        auto home = get_home_dir();
        if (!home.empty()) {
            if (path.size() <= 2) {
                return home;
            }
            return home / path.substr(2);
        }
    }
    return path;
}

inline std::chrono::milliseconds parse_ms(std::string_view s) {
    try {
        return std::chrono::milliseconds(std::stol(std::string(s)));
    } catch (const std::exception&) {
        return std::chrono::milliseconds(0);
    }
}

inline bool parse_bool(std::string s, bool fallback) {
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on")
        return true;
    if (s == "0" || s == "false" || s == "no" || s == "off")
        return false;
    return fallback;
}

// Parse a value from TOML config file. Returns "" when the file, section or key is missing.
// Accepts both "[section] key = v" and "section.key = v" forms.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& raw);

// Get standard config path (CLAWDESK_CONFIG > override > platform config dir)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Windows: %APPDATA%\clawdesk
/// Unix: $XDG_CONFIG_HOME/clawdesk or ~/.config/clawdesk
std::filesystem::path get_config_dir();

/// Returns the user data directory (logs, state)
/// Windows: %LOCALAPPDATA%\clawdesk
/// Unix: $XDG_DATA_HOME/clawdesk or ~/.local/share/clawdesk
std::filesystem::path get_data_dir();

} // namespace clawdesk::config
