#include <notegraph/config/config_helpers.h>

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <sstream>

namespace notegraph::config {

namespace {

// Drop a trailing `# comment` that is not inside a quoted string.
std::string stripComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (quote == '"' && c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

// Net bracket depth of a value fragment, ignoring brackets inside quotes.
int bracketDelta(const std::string& text) {
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (quote == '"' && c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        }
    }
    return depth;
}

std::vector<std::string> splitOutsideQuotes(const std::string& text, char sep) {
    std::vector<std::string> out;
    std::string current;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            current.push_back(c);
            if (quote == '"' && c == '\\' && i + 1 < text.size()) {
                current.push_back(text[++i]);
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            current.push_back(c);
        } else if (c == sep) {
            out.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    out.push_back(current);
    return out;
}

} // namespace

std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && val.front() == '\'' && val.back() == '\'') {
        return val.substr(1, val.size() - 2);
    }
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        std::string out;
        out.reserve(val.size() - 2);
        for (size_t i = 1; i + 1 < val.size(); ++i) {
            char c = val[i];
            if (c == '\\' && i + 2 < val.size()) {
                char next = val[++i];
                switch (next) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    default:
                        out.push_back('\\');
                        out.push_back(next);
                        break;
                }
            } else {
                out.push_back(c);
            }
        }
        return out;
    }
    return val;
}

std::optional<std::string> ConfigFile::find(const std::string& section,
                                            const std::string& key) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) {
        return std::nullopt;
    }
    // Last assignment wins
    for (auto e = it->second.rbegin(); e != it->second.rend(); ++e) {
        if (e->first == key) {
            return unquote(e->second);
        }
    }
    return std::nullopt;
}

const ConfigFile::Entries& ConfigFile::entries(const std::string& section) const {
    static const Entries kEmpty;
    auto it = sections_.find(section);
    return it == sections_.end() ? kEmpty : it->second;
}

bool ConfigFile::hasSection(const std::string& section) const {
    return sections_.count(section) > 0;
}

void ConfigFile::set(const std::string& section, std::string key, std::string rawValue) {
    sections_[section].emplace_back(std::move(key), std::move(rawValue));
}

Result<ConfigFile> parse_config_text(std::string_view text) {
    ConfigFile out;
    std::istringstream stream{std::string(text)};
    std::string line;
    std::string currentSection;
    std::string pendingKey;
    std::string pendingValue;
    int pendingDepth = 0;
    size_t lineNo = 0;

    while (std::getline(stream, line)) {
        ++lineNo;
        line = stripComment(line);
        trim(line);

        if (pendingDepth > 0) {
            pendingValue += " " + line;
            pendingDepth += bracketDelta(line);
            if (pendingDepth <= 0) {
                out.set(currentSection, pendingKey, pendingValue);
                pendingKey.clear();
                pendingValue.clear();
                pendingDepth = 0;
            }
            continue;
        }

        if (line.empty()) {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("config line {}: unterminated section header", lineNo)};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        auto parts = splitOutsideQuotes(line, '=');
        if (parts.size() < 2) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("config line {}: expected key = value", lineNo)};
        }
        std::string key = unquote(parts[0]);
        std::string value = line.substr(parts[0].size() + 1);
        trim(value);
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("config line {}: empty key", lineNo)};
        }

        int depth = bracketDelta(value);
        if (!value.empty() && value.front() == '[' && depth > 0) {
            pendingKey = std::move(key);
            pendingValue = std::move(value);
            pendingDepth = depth;
            continue;
        }
        out.set(currentSection, std::move(key), std::move(value));
    }

    if (pendingDepth > 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("config: unterminated array for key '{}'", pendingKey)};
    }
    return out;
}

Result<ConfigFile> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Config file not found: {}", config_path.string())};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config_text(buffer.str());
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_config_file(config_path);
    if (!parsed) {
        return "";
    }
    return parsed.value().find(section, key).value_or("");
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    for (auto& token : splitOutsideQuotes(s, ',')) {
        trim(token);
        if (token.empty()) {
            continue;
        }
        out.push_back(unquote(token));
    }
    return out;
}

Result<std::size_t> parse_size(const std::string& raw) {
    std::string s = unquote(raw);
    std::string digits;
    for (char c : s) {
        if (c == '_') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Error{ErrorCode::InvalidArgument, fmt::format("not a number: '{}'", raw)};
        }
        digits.push_back(c);
    }
    if (digits.empty()) {
        return Error{ErrorCode::InvalidArgument, fmt::format("not a number: '{}'", raw)};
    }
    try {
        return static_cast<std::size_t>(std::stoull(digits));
    } catch (const std::out_of_range&) {
        return Error{ErrorCode::InvalidArgument, fmt::format("number out of range: '{}'", raw)};
    }
}

Result<bool> parse_bool(const std::string& raw) {
    std::string s = unquote(raw);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, fmt::format("not a boolean: '{}'", raw)};
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "notegraph";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "notegraph";
    }
    return std::filesystem::path("~/.config") / "notegraph";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("NOTEGRAPH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace notegraph::config
