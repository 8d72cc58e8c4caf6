#include <charconv>
#include <fstream>
#include <mvsearch/config/config_helpers.h>

namespace mvsearch::config {

namespace {

std::string stripInlineComment(const std::string& line) {
    bool inQuote = false;
    char quoteChar = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuote) {
            if (c == quoteChar)
                inQuote = false;
        } else if (c == '"' || c == '\'') {
            inQuote = true;
            quoteChar = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

} // namespace

std::optional<bool> parse_bool(std::string_view s) {
    std::string v = unquote(std::string(s));
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<long long> parse_int(std::string_view s) {
    std::string v = unquote(std::string(s));
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || ptr != v.data() + v.size() || v.empty()) {
        return std::nullopt;
    }
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v = unquote(std::string(s));
    if (v.empty())
        return std::nullopt;
    try {
        size_t consumed = 0;
        double out = std::stod(v, &consumed);
        if (consumed != v.size())
            return std::nullopt;
        return out;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto value = parse_int(s);
    if (!value || *value < 0)
        return std::nullopt;
    return std::chrono::milliseconds(*value);
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string token =
            (comma == std::string::npos) ? s.substr(start) : s.substr(start, comma - start);
        token = unquote(token);
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        line = stripInlineComment(line);
        trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = line.substr(1, line.size() - 2);
            trim(currentSection);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        // Arrays keep their brackets so parse_string_list can split them
        if (value.empty() || value.front() != '[') {
            value = unquote(value);
        }
        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto flat = parse_simple_toml_flat(config_path);
    auto it = flat.find(section.empty() ? key : section + "." + key);
    if (it == flat.end()) {
        return "";
    }
    return it->second;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* explicitPath = std::getenv("MVSEARCH_CONFIG"); explicitPath && *explicitPath) {
        return expand_tilde(explicitPath);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "mvsearch" / "config.toml";
    }

    return configHome / "mvsearch" / "config.toml";
}

} // namespace mvsearch::config
