#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fetchkit::config {

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

// Tilde expansion ("~" and "~/..."; "~user" is left alone)
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~')
        return path;
    if (path.size() > 1 && path[1] != '/')
        return path;
    const char* home = std::getenv("HOME");
    if (!home)
        return path;
    if (path.size() <= 2)
        return std::filesystem::path(home);
    return std::filesystem::path(home) / path.substr(2);
}

// Boolean parsing: true/false, yes/no, on/off, 1/0
inline std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

// Unsigned integer parsing; the whole string must be consumed
inline std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t out = 0;
    const auto* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, out);
    if (ec != std::errc{} || ptr != end || s.empty())
        return std::nullopt;
    return out;
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/fetchkit or ~/.config/fetchkit
std::filesystem::path get_config_dir();

/// Config file actually in effect: explicit override, then FETCHKIT_CONFIG, then
/// get_config_path()
std::filesystem::path resolve_config_path(const std::string& override_path = "");

} // namespace fetchkit::config
