#include <cstdlib>
#include <fstream>
#include <sitecache/config/config_helpers.h>

namespace sitecache::config {

namespace {

// Strip a trailing "# comment" unless the '#' sits inside a quoted value
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            std::string out = v.substr(0, i);
            trim(out);
            return out;
        }
    }
    return v;
}

} // namespace

std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
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
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);
        v = unquote(strip_inline_comment(v));

        // Support both "[ports] range_start" and a dotted "ports.range_start"
        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        values[fullKey] = v;
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_simple_toml(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it != values.end() ? it->second : "";
}

std::optional<bool> parse_bool(std::string_view value) {
    auto v = to_lower(value);
    if (v == "true" || v == "yes" || v == "1" || v == "on")
        return true;
    if (v == "false" || v == "no" || v == "0" || v == "off")
        return false;
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("SITECACHE_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }
    return std::filesystem::path("/etc/sitecache/config.toml");
}

} // namespace sitecache::config
