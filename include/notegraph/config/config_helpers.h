#pragma once

#include <notegraph/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace notegraph::config {

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

// Quote handling. Double-quoted values get the basic TOML escapes (\" \\ \n \t),
// single-quoted values are literal.
std::string unquote(std::string val);

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / (path.size() > 1 ? path.substr(2) : "");
        }
    }
    return path;
}

/**
 * Parsed TOML-subset document: `[section]` headers, `key = value` lines, `#` comments
 * outside of quotes, and arrays that may span several lines. Key order within a section
 * is preserved.
 */
class ConfigFile {
public:
    using Entries = std::vector<std::pair<std::string, std::string>>;

    std::optional<std::string> find(const std::string& section, const std::string& key) const;
    const Entries& entries(const std::string& section) const;
    bool hasSection(const std::string& section) const;

    void set(const std::string& section, std::string key, std::string rawValue);

private:
    std::map<std::string, Entries> sections_;
};

// Parse a config document held in memory
Result<ConfigFile> parse_config_text(std::string_view text);

// Parse a config file from disk
Result<ConfigFile> parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a config file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings: "a,b" or ["a", 'b']
std::vector<std::string> parse_string_list(const std::string& raw);

// Strict numeric and boolean parsing for config values
Result<std::size_t> parse_size(const std::string& raw);
Result<bool> parse_bool(const std::string& raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/notegraph or ~/.config/notegraph
std::filesystem::path get_config_dir();

/// Config file location: explicit override, then $NOTEGRAPH_CONFIG, then
/// get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace notegraph::config
