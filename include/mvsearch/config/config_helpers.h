#pragma once

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

namespace mvsearch::config {

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
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

inline bool env_truthy(const char* value) {
    if (!value || !*value) {
        return false;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

// Typed parsing; nullopt when the text is not a valid value of the type
std::optional<bool> parse_bool(std::string_view s);
std::optional<long long> parse_int(std::string_view s);
std::optional<double> parse_double(std::string_view s);
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Parse a comma- or TOML-array-separated list: "a,b" or ["a", "b"]
std::vector<std::string> parse_string_list(const std::string& raw);

// Flatten a simple TOML file into "section.key" -> value. Nested tables keep their dotted name.
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

// Parse a single value from a TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the config file path
/// MVSEARCH_CONFIG, then $XDG_CONFIG_HOME/mvsearch/config.toml, then ~/.config/mvsearch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace mvsearch::config
