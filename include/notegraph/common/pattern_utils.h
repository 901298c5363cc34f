#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace notegraph::common {

/**
 * Glob match over a root-relative generic path. '?' is one character, '*' any run of
 * characters including '/', so ".obsidian/*" excludes the whole subtree.
 *
 * Greedy with a single backtrack point: on a mismatch the most recent '*' takes one
 * more character, which keeps the match linear in practice.
 */
[[nodiscard]] inline constexpr bool wildcard_match(std::string_view text,
                                                   std::string_view glob) noexcept {
    size_t ti = 0;
    size_t gi = 0;
    size_t star = std::string_view::npos;
    size_t resume = 0;

    while (ti < text.size()) {
        const bool haveGlob = gi < glob.size();
        if (haveGlob && glob[gi] == '*') {
            star = gi++;
            resume = ti;
            continue;
        }
        if (haveGlob && (glob[gi] == '?' || glob[gi] == text[ti])) {
            ++ti;
            ++gi;
            continue;
        }
        if (star == std::string_view::npos) {
            return false;
        }
        gi = star + 1;
        ti = ++resume;
    }
    while (gi < glob.size() && glob[gi] == '*') {
        ++gi;
    }
    return gi == glob.size();
}

[[nodiscard]] inline bool matches_any(std::string_view text,
                                      const std::vector<std::string>& globs) noexcept {
    for (const auto& g : globs) {
        if (wildcard_match(text, g)) {
            return true;
        }
    }
    return false;
}

// ASCII whitespace only; targets are matched byte-wise
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

/**
 * True when `path` ends with `suffix` on a path-segment boundary, i.e. `path == suffix`
 * or `path` ends with "/" + suffix.
 */
[[nodiscard]] inline constexpr bool ends_with_segment(std::string_view path,
                                                      std::string_view suffix) noexcept {
    if (suffix.empty() || !path.ends_with(suffix)) {
        return false;
    }
    const auto cut = path.size() - suffix.size();
    return cut == 0 || path[cut - 1] == '/';
}

} // namespace notegraph::common
