#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace notegraph::extraction {

/**
 * One row of the reference pattern table. Every reference kind is recognized through
 * one or more of these; a new kind or syntax is a new row, not new parsing code.
 */
struct ReferencePattern {
    ReferenceKind kind = ReferenceKind::Wikilink;
    std::string name;              // e.g. "markdown", "wikilink"
    std::string regex;             // ECMAScript syntax
    std::size_t captureGroup = 1;  // Group holding the target
};

/**
 * Compiled, validated pattern table. Table order is the tie-break when two matches
 * start at the same offset.
 */
class PatternTable {
public:
    static Result<PatternTable> compile(const std::vector<ReferencePattern>& patterns);
    static const std::vector<ReferencePattern>& defaultPatterns();
    static PatternTable defaults();

    std::size_t size() const { return entries_.size(); }
    const ReferencePattern& pattern(std::size_t i) const { return entries_[i].def; }

private:
    friend class ReferenceParser;

    struct Entry {
        ReferencePattern def;
        std::regex re;
    };
    std::vector<Entry> entries_;
};

/**
 * Extracts typed references from raw note text. Pure: no I/O, no normalization of the
 * captured target. Overlapping matches are resolved by taking the earliest start
 * (then table order) and dropping any later match that overlaps an accepted one.
 * Partial or malformed syntax simply produces no reference.
 */
class ReferenceParser {
public:
    explicit ReferenceParser(PatternTable table = PatternTable::defaults());

    std::vector<Reference> parse(std::string_view text, const NoteId& sourceNoteId = {}) const;

    const PatternTable& table() const { return table_; }

private:
    PatternTable table_;
};

} // namespace notegraph::extraction
