#include <notegraph/common/pattern_utils.h>
#include <notegraph/extraction/reference_parser.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace notegraph::extraction {

namespace {

constexpr auto kRegexFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

struct RawMatch {
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t order = 0;
    std::string target;
};

} // namespace

const std::vector<ReferencePattern>& PatternTable::defaultPatterns() {
    // Repetitions are bounded and stop at newlines so an unterminated "[[" cannot drag a
    // match across the rest of the note.
    static const std::vector<ReferencePattern> kDefaults = {
        {ReferenceKind::DiagramEmbed, "excalidraw",
         R"re(!\[\[([^\]|#\n]{1,256}\.excalidraw(?:\.md)?)(?:[|#][^\]\n]{0,256})?\]\])re", 1},
        {ReferenceKind::ImageEmbed, "embed",
         R"re(!\[\[([^\]|#\n]{1,256}\.(?:png|jpe?g|gif|svg|webp|bmp|tiff?))(?:\|[^\]\n]{0,256})?\]\])re",
         1},
        {ReferenceKind::ImageEmbed, "markdown",
         R"re(!\[[^\]\n]{0,256}\]\([ \t]*<?(?!https?://|data:)((?:[^()"<>\n]|\([^()\n]{0,64}\)){1,256}?)>?(?:[ \t]+"[^"\n]{0,256}")?[ \t]*\))re",
         1},
        {ReferenceKind::ImageEmbed, "html",
         R"re(<img\s[^>\n]{0,256}?src\s*=\s*["'](?!https?://|data:)([^"'\n]{1,256})["'][^>\n]{0,256}>)re",
         1},
        {ReferenceKind::Wikilink, "wikilink",
         R"re(\[\[([^\]|#\n]{1,256})(?:[|#][^\]\n]{0,256})?\]\])re", 1},
    };
    return kDefaults;
}

Result<PatternTable> PatternTable::compile(const std::vector<ReferencePattern>& patterns) {
    PatternTable table;
    table.entries_.reserve(patterns.size());
    for (const auto& def : patterns) {
        if (def.regex.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Empty regex for reference pattern '" + def.name + "'"};
        }
        try {
            std::regex re(def.regex, kRegexFlags);
            if (re.mark_count() < def.captureGroup) {
                return Error{ErrorCode::InvalidArgument,
                             "Reference pattern '" + def.name + "' has no capture group " +
                                 std::to_string(def.captureGroup)};
            }
            table.entries_.push_back(Entry{def, std::move(re)});
        } catch (const std::regex_error& e) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid regex for reference pattern '" + def.name + "': " + e.what()};
        }
    }
    return table;
}

PatternTable PatternTable::defaults() {
    auto compiled = compile(defaultPatterns());
    if (!compiled) {
        throw std::logic_error("Built-in reference patterns failed to compile: " +
                               compiled.error().message);
    }
    return std::move(compiled).value();
}

ReferenceParser::ReferenceParser(PatternTable table) : table_(std::move(table)) {}

std::vector<Reference> ReferenceParser::parse(std::string_view text,
                                              const NoteId& sourceNoteId) const {
    std::vector<RawMatch> matches;
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    for (std::size_t i = 0; i < table_.entries_.size(); ++i) {
        const auto& entry = table_.entries_[i];
        try {
            for (std::cregex_iterator it(begin, end, entry.re), last; it != last; ++it) {
                const auto& m = *it;
                const auto group = entry.def.captureGroup;
                if (m.size() <= group || !m[group].matched) {
                    continue;
                }
                std::string target = m[group].str();
                if (common::trim(target).empty()) {
                    continue;
                }
                auto start = static_cast<std::size_t>(m.position(0));
                matches.push_back(
                    RawMatch{start, start + static_cast<std::size_t>(m.length(0)), i, std::move(target)});
            }
        } catch (const std::regex_error& e) {
            // Complexity/stack limits on pathological input: keep what other patterns found.
            spdlog::warn("Reference pattern '{}' aborted on note {}: {}", entry.def.name,
                         sourceNoteId.empty() ? "<anonymous>" : sourceNoteId, e.what());
        }
    }

    std::sort(matches.begin(), matches.end(), [](const RawMatch& a, const RawMatch& b) {
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return a.order < b.order;
    });

    std::vector<Reference> out;
    out.reserve(matches.size());
    std::size_t acceptedEnd = 0;
    bool any = false;
    for (auto& m : matches) {
        if (any && m.start < acceptedEnd) {
            continue;
        }
        const auto& def = table_.entries_[m.order].def;
        Reference ref;
        ref.kind = def.kind;
        ref.pattern = def.name;
        ref.rawTarget = std::move(m.target);
        ref.sourceNoteId = sourceNoteId;
        ref.position = m.start;
        ref.length = m.end - m.start;
        out.push_back(std::move(ref));
        acceptedEnd = std::max(acceptedEnd, m.end);
        any = true;
    }
    return out;
}

} // namespace notegraph::extraction
