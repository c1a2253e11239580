#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sitecache::config {

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

inline std::string trimmed(std::string_view in) {
    std::string s(in);
    trim(s);
    return s;
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

inline std::string to_lower(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Parse a simple TOML file into flattened "section.key" -> value pairs.
// Values are unquoted; inline comments after an unquoted value are stripped.
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

// Parse a single value from a TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Boolean parsing for config values ("true"/"false", "yes"/"no", "1"/"0", "on"/"off")
std::optional<bool> parse_bool(std::string_view value);

// Resolve the host config path: explicit override > SITECACHE_CONFIG > /etc/sitecache/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace sitecache::config
