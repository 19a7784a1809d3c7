#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sift::config {

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

inline std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// Quote handling. Double-quoted values honour \n, \t, \\ and \" escapes.
std::string unquote(std::string val);

// Terminal sanitization for values echoed into logs
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
        } else if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(' ');
        } else if (c >= 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

// Parse every key of a TOML-style file into "section.key" -> raw (unquoted) value
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& raw);

// Resolve the settings file: explicit override, then SIFT_CONFIG, then
// $XDG_CONFIG_HOME/sift/config.toml or ~/.config/sift/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace sift::config
