#pragma once

#include <notegraph/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notegraph {

/**
 * Reference kinds recognized inside note content.
 */
enum class ReferenceKind { Wikilink, ImageEmbed, DiagramEmbed };

constexpr const char* referenceKindToString(ReferenceKind kind) {
    switch (kind) {
        case ReferenceKind::Wikilink: return "wikilink";
        case ReferenceKind::ImageEmbed: return "image";
        case ReferenceKind::DiagramEmbed: return "diagram";
    }
    return "wikilink";
}

std::optional<ReferenceKind> referenceKindFromString(std::string_view name);

enum class ResolutionStatus { Resolved, Ambiguous, Broken };

constexpr const char* resolutionStatusToString(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Resolved: return "resolved";
        case ResolutionStatus::Ambiguous: return "ambiguous";
        case ResolutionStatus::Broken: return "broken";
    }
    return "broken";
}

std::optional<ResolutionStatus> resolutionStatusFromString(std::string_view name);

/**
 * A parsed mention inside a note. Produced by the reference parser and never
 * mutated afterwards.
 */
struct Reference {
    ReferenceKind kind = ReferenceKind::Wikilink;
    std::string pattern;    // Name of the pattern entry that matched
    std::string rawTarget;  // Captured target text, verbatim
    NoteId sourceNoteId;    // Filled in by the pipeline; empty for bare parses
    std::size_t position = 0; // Byte offset of the match in the note content
    std::size_t length = 0;   // Byte length of the whole match
};

/**
 * A reference bound to its resolution outcome. Exactly one of targetNoteId and
 * targetImageId is set when status is Resolved; neither is set otherwise.
 */
struct ResolvedReference {
    Reference reference;
    ResolutionStatus status = ResolutionStatus::Broken;
    std::optional<NoteId> targetNoteId;
    std::optional<ImageId> targetImageId;
    std::string canonicalTarget;         // Resolved notes-root-relative path
    std::string normalizedTarget;        // Target after decoding/anchor removal
    std::vector<std::string> candidates; // Sorted, populated when Ambiguous
    std::vector<std::string> searched;   // Locations tried
    std::string context;                 // Surrounding text of the mention
    double strength = 0.0;               // Relationship weight in [0, 1]

    bool isResolved() const { return status == ResolutionStatus::Resolved; }

    // Key of the inverse-index bucket: the resolved target id, or the raw target.
    const std::string& targetKey() const {
        if (targetNoteId) {
            return *targetNoteId;
        }
        if (targetImageId) {
            return *targetImageId;
        }
        return reference.rawTarget;
    }
};

/**
 * A contiguous span of a note's content. Offsets are byte offsets into the raw
 * content and text is always content.substr(startOffset, endOffset - startOffset).
 */
struct NoteChunk {
    std::string chunkId;
    NoteId noteId;
    std::size_t chunkIndex = 0;
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;
    std::string text;
};

struct Note {
    NoteId noteId;
    std::string canonicalPath;
    std::string title;
    std::string folderPath;
    std::string rawContent;
    std::vector<NoteChunk> chunks;
};

/**
 * A binary attachment referenced from a note. Identity is per referencing note:
 * the same physical file referenced from two notes yields two images.
 */
struct ImageRecord {
    ImageId imageId;
    NoteId noteId;
    std::string relativePath;
    std::string canonicalPath;
    std::string resolvedAbsolutePath;
    std::string mimeType;
    Hash contentHash;
};

} // namespace notegraph
