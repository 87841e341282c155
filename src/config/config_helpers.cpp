#include <mcpbridge/config/config_helpers.h>

#include <fstream>

namespace mcpbridge::config {

namespace {

// Strip a trailing '#' comment that is not inside quotes
std::string strip_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
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

std::optional<long long> parse_int(std::string_view s) {
    std::string str(s);
    trim(str);
    if (str.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long v = std::stoll(str, &pos);
        if (pos != str.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto v = parse_int(s);
    if (!v || *v < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(*v);
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    std::string current;
    char quote = 0;
    bool sawItem = false;
    for (char c : s) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            sawItem = true;
        } else if (c == ',') {
            trim(current);
            if (!current.empty() || sawItem)
                out.push_back(current);
            current.clear();
            sawItem = false;
        } else {
            current.push_back(c);
        }
    }
    trim(current);
    if (!current.empty() || sawItem)
        out.push_back(current);
    return out;
}

Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigSections sections;
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument, config_path.string() + ":" +
                                                             std::to_string(lineNo) +
                                                             ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            sections[currentSection];
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument, config_path.string() + ":" +
                                                         std::to_string(lineNo) +
                                                         ": expected key = value"};
        }
        std::string k = line.substr(0, eq);
        std::string v = strip_comment(line.substr(eq + 1));
        trim(k);
        trim(v);
        k = unquote(k);
        // Arrays keep their quotes for parse_string_list
        if (v.empty() || v.front() != '[') {
            v = unquote(v);
        }
        sections[currentSection][k] = v;
    }

    return sections;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("MCPBRIDGE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("mcpbridge") / "config.toml";
    }

    return configHome / "mcpbridge" / "config.toml";
}

} // namespace mcpbridge::config
