#include <notegraph/common/pattern_utils.h>
#include <notegraph/resolve/path_resolver.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

namespace notegraph::resolve {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

void replaceAll(std::string& text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

void stripLeadingSeparators(std::string& s) {
    for (;;) {
        if (s.rfind("./", 0) == 0) {
            s.erase(0, 2);
        } else if (!s.empty() && s.front() == '/') {
            s.erase(0, 1);
        } else {
            return;
        }
    }
}

// Lexically normalized, generic, without trailing slash. "." for the root itself.
std::string lexicalNormal(std::string_view path) {
    auto normal = std::filesystem::path(std::string(path)).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal.empty() ? std::string(".") : normal;
}

std::string lowerCopy(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool escapesRoot(const std::string& normal) {
    return normal == ".." || normal.rfind("../", 0) == 0 || (!normal.empty() && normal[0] == '/');
}

} // namespace

PathResolver::PathResolver(const FileCatalog& catalog, AttachmentSearchConfig config)
    : catalog_(catalog), config_(std::move(config)) {}

std::string PathResolver::urlDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string PathResolver::normalizeTarget(std::string_view raw) {
    std::string s(common::trim(raw));

    // Heading and block anchors
    if (auto hash = s.find('#'); hash != std::string::npos) {
        s.erase(hash);
    }

    s = urlDecode(s);
    std::replace(s.begin(), s.end(), '\\', '/');
    s = std::string(common::trim(s));
    stripLeadingSeparators(s);

    std::string collapsed;
    collapsed.reserve(s.size());
    for (char c : s) {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/') {
            continue;
        }
        collapsed.push_back(c);
    }
    return std::string(common::trim(collapsed));
}

std::optional<std::string> PathResolver::joinWithinRoot(std::string_view base,
                                                        std::string_view relative) {
    std::string joined = base.empty() ? std::string(relative)
                                      : std::string(base) + "/" + std::string(relative);
    auto normal = lexicalNormal(joined);
    if (normal == "." || escapesRoot(normal)) {
        return std::nullopt;
    }
    return normal;
}

const ResolutionStrategy& PathResolver::strategyFor(ReferenceKind kind) const {
    static const ResolutionStrategy kFallback = AttachmentTarget{};
    auto it = config_.strategies.find(kind);
    return it == config_.strategies.end() ? kFallback : it->second;
}

std::vector<std::string> PathResolver::expandSearchRoots(std::string_view sourcePath) const {
    std::filesystem::path source{std::string(sourcePath)};
    const std::string noteDir = source.parent_path().generic_string();
    const std::string noteStem = source.stem().string();

    std::vector<std::string> roots;
    for (const auto& tmpl : config_.searchRoots) {
        std::string expanded = tmpl;
        replaceAll(expanded, "{note_dir}", noteDir);
        replaceAll(expanded, "{note_stem}", noteStem);
        std::replace(expanded.begin(), expanded.end(), '\\', '/');
        stripLeadingSeparators(expanded);

        auto normal = lexicalNormal(expanded);
        if (escapesRoot(normal)) {
            spdlog::debug("Search root '{}' escapes the notes root for {}, skipped", tmpl,
                          sourcePath);
            continue;
        }
        if (normal == ".") {
            normal.clear();
        }
        if (std::find(roots.begin(), roots.end(), normal) == roots.end()) {
            roots.push_back(std::move(normal));
        }
    }
    return roots;
}

std::vector<std::string> PathResolver::targetVariants(const std::string& normalized,
                                                      const ResolutionStrategy& strategy) const {
    std::vector<std::string> variants{normalized};
    std::visit(
        [&](const auto& s) {
            using S = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<S, NoteTarget>) {
                if (!catalog_.hasNoteExtension(normalized)) {
                    for (const auto& ext : catalog_.options().noteExtensions) {
                        variants.push_back(normalized + ext);
                    }
                }
            } else {
                for (const auto& suffix : s.alternateSuffixes) {
                    if (normalized.size() < suffix.size() ||
                        normalized.compare(normalized.size() - suffix.size(), suffix.size(),
                                           suffix) != 0) {
                        variants.push_back(normalized + suffix);
                    }
                }
            }
        },
        strategy);
    return variants;
}

std::vector<std::string> PathResolver::findAttachmentByStem(std::string_view target) const {
    const auto wanted = lowerCopy(target);
    std::vector<std::string> matches;
    for (const auto& file : catalog_.files()) {
        if (catalog_.isNote(file)) {
            continue;
        }
        auto lowered = lowerCopy(file);
        auto slash = lowered.rfind('/');
        auto dot = lowered.rfind('.');
        if (dot != std::string::npos && (slash == std::string::npos || dot > slash + 1)) {
            lowered.erase(dot);
        }
        if (common::ends_with_segment(lowered, wanted)) {
            matches.push_back(file);
        }
    }
    return matches;
}

Result<std::string, ResolutionError> PathResolver::resolve(std::string_view rawTarget,
                                                           std::string_view sourcePath,
                                                           ReferenceKind kind) const {
    ResolutionError error;
    error.rawTarget = std::string(rawTarget);
    error.normalizedTarget = normalizeTarget(rawTarget);

    if (error.normalizedTarget.empty()) {
        error.message = fmt::format("Empty reference target '{}' in {}", rawTarget, sourcePath);
        return error;
    }

    const auto& strategy = strategyFor(kind);
    const auto variants = targetVariants(error.normalizedTarget, strategy);
    const std::string sourceDir =
        std::filesystem::path(std::string(sourcePath)).parent_path().generic_string();

    // 1. Exact: root-relative, then relative to the source note
    std::vector<std::string> bases{std::string{}};
    if (!sourceDir.empty()) {
        bases.push_back(sourceDir);
    }
    for (const auto& base : bases) {
        for (const auto& v : variants) {
            auto candidate = joinWithinRoot(base, v);
            if (!candidate) {
                continue;
            }
            error.searched.push_back(*candidate);
            if (catalog_.contains(*candidate)) {
                return *candidate;
            }
        }
    }

    // 2. Recursive suffix search
    std::set<std::string> candidates;
    auto searchRoots = [&](const std::vector<std::string>& targets) {
        for (const auto& root : expandSearchRoots(sourcePath)) {
            error.searched.push_back((root.empty() ? std::string(".") : root) + "/**");
            for (const auto& v : targets) {
                for (auto& match : catalog_.findBySuffix(v, root)) {
                    candidates.insert(std::move(match));
                }
            }
        }
    };

    if (std::holds_alternative<NoteTarget>(strategy)) {
        error.searched.push_back("notes/**");
        for (const auto& v : variants) {
            for (auto& match : catalog_.findBySuffix(v, {}, true)) {
                candidates.insert(std::move(match));
            }
        }
        if (candidates.empty()) {
            // A wikilink may point at a non-note file (pdf, image, drawing)
            auto targets = variants;
            for (auto& v : targetVariants(error.normalizedTarget,
                                          strategyFor(ReferenceKind::DiagramEmbed))) {
                if (std::find(targets.begin(), targets.end(), v) == targets.end()) {
                    targets.push_back(std::move(v));
                }
            }
            searchRoots(targets);
        }
        if (candidates.empty()) {
            error.searched.push_back("**/" + error.normalizedTarget + ".*");
            for (auto& match : findAttachmentByStem(error.normalizedTarget)) {
                candidates.insert(std::move(match));
            }
        }
    } else {
        searchRoots(variants);
    }

    if (candidates.size() == 1) {
        return *candidates.begin();
    }

    if (candidates.empty()) {
        error.failure = ResolutionFailure::Broken;
        error.message = fmt::format("Broken reference '{}' in {}: no match in {} location(s)",
                                    rawTarget, sourcePath, error.searched.size());
    } else {
        error.failure = ResolutionFailure::Ambiguous;
        error.candidates.assign(candidates.begin(), candidates.end());
        error.message = fmt::format("Ambiguous reference '{}' in {}: {} candidates", rawTarget,
                                    sourcePath, error.candidates.size());
    }
    return error;
}

} // namespace notegraph::resolve
