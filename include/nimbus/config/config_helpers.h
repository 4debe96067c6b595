#pragma once

#include <nimbus/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::config {

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
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / (path.size() > 2 ? path.substr(2) : "");
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

// Reads every `key = value` pair of a TOML-style file, grouped by [section].
// Keys before the first section header land in section "". Also accepts
// dotted keys ("monitor.heartbeat_interval_ms = 5000") outside any section.
Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path);

// Parses a comma- or TOML-array-separated list: "a,b" or ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& raw);

std::optional<bool> parse_bool(std::string_view s);
std::optional<std::int64_t> parse_int(std::string_view s);
std::optional<double> parse_double(std::string_view s);

/// Returns the config file path: override, then NIMBUS_CONFIG, then
/// $XDG_CONFIG_HOME/nimbus/config.toml or ~/.config/nimbus/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace nimbus::config
