#include <sift/config/config_helpers.h>

#include <fstream>

namespace sift::config {

namespace {

// Drop a trailing '#' comment that is not inside quotes
std::string stripInlineComment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == '\\' && quote == '"' && i + 1 < v.size()) {
                ++i;
                continue;
            }
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && val.front() == '\'' && val.back() == '\'') {
        return val.substr(1, val.size() - 2);
    }
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        std::string out;
        out.reserve(val.size());
        for (size_t i = 1; i + 1 < val.size(); ++i) {
            char c = val[i];
            if (c == '\\' && i + 2 < val.size()) {
                char n = val[++i];
                switch (n) {
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    default:
                        out.push_back(n);
                        break;
                }
                continue;
            }
            out.push_back(c);
        }
        return out;
    }
    return val;
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = stripInlineComment(line.substr(eq + 1));
        trim(k);
        trim(v);

        // Arrays keep their brackets so parse_string_list can split them
        if (!v.empty() && v.front() == '[') {
            values[currentSection.empty() ? k : currentSection + "." + k] = v;
        } else {
            values[currentSection.empty() ? k : currentSection + "." + k] = unquote(v);
        }
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    // Split on commas outside quotes
    std::string current;
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            current.push_back(c);
            if (c == '\\' && quote == '"' && i + 1 < s.size()) {
                current.push_back(s[++i]);
                continue;
            }
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            current.push_back(c);
        } else if (c == ',') {
            auto item = unquote(current);
            if (!trimmed(current).empty())
                out.push_back(std::move(item));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!trimmed(current).empty()) {
        out.push_back(unquote(current));
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    if (const char* env = std::getenv("SIFT_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "sift" / "config.toml";
    }

    return configHome / "sift" / "config.toml";
}

} // namespace sift::config
