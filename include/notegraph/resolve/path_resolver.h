#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>
#include <notegraph/resolve/file_catalog.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notegraph::resolve {

enum class ResolutionFailure { Broken, Ambiguous };

/**
 * Why a reference target did not resolve to exactly one file. Carries everything
 * needed to diagnose the miss: what was looked for, where, and what came close.
 */
struct ResolutionError {
    ResolutionFailure failure = ResolutionFailure::Broken;
    std::string rawTarget;
    std::string normalizedTarget;
    std::vector<std::string> candidates; // Sorted; two or more when Ambiguous
    std::vector<std::string> searched;
    std::string message;

    ResolutionStatus status() const {
        return failure == ResolutionFailure::Ambiguous ? ResolutionStatus::Ambiguous
                                                       : ResolutionStatus::Broken;
    }
};

// Wikilinks: notes first, with the note extension implied
struct NoteTarget {};

// Image and diagram embeds: attachment search roots, optionally with extra suffixes
struct AttachmentTarget {
    std::vector<std::string> alternateSuffixes;
};

using ResolutionStrategy = std::variant<NoteTarget, AttachmentTarget>;

struct AttachmentSearchConfig {
    // Ordered; "{note_dir}" and "{note_stem}" expand per source note, "" is the notes root
    std::vector<std::string> searchRoots = {"{note_dir}", "{note_dir}/{note_stem}.assets",
                                            "attachments", "Z - Attachements"};
    std::map<ReferenceKind, ResolutionStrategy> strategies = {
        {ReferenceKind::Wikilink, NoteTarget{}},
        {ReferenceKind::ImageEmbed, AttachmentTarget{}},
        {ReferenceKind::DiagramEmbed, AttachmentTarget{{".md"}}},
    };
};

/**
 * Maps raw reference targets to canonical notes-root-relative paths over a FileCatalog.
 *
 * Policy: exact path (root, then the source note's directory), then a recursive
 * suffix search of the configured roots (or of every note, for wikilinks). A wikilink
 * that names no note falls back to attachments: a suffix search with the diagram
 * suffixes, then a case-insensitive stem match over every non-note file. Exactly one
 * distinct candidate resolves; more is Ambiguous, none is Broken.
 */
class PathResolver {
public:
    explicit PathResolver(const FileCatalog& catalog, AttachmentSearchConfig config = {});

    Result<std::string, ResolutionError> resolve(std::string_view rawTarget,
                                                 std::string_view sourcePath,
                                                 ReferenceKind kind) const;

    const ResolutionStrategy& strategyFor(ReferenceKind kind) const;

    // Search roots after placeholder expansion for one source note, root-relative
    std::vector<std::string> expandSearchRoots(std::string_view sourcePath) const;

    static std::string normalizeTarget(std::string_view raw);
    static std::string urlDecode(std::string_view text);

    // Lexically join `base` and `relative`; nullopt when the result escapes the root
    static std::optional<std::string> joinWithinRoot(std::string_view base,
                                                     std::string_view relative);

    const FileCatalog& catalog() const { return catalog_; }

private:
    std::vector<std::string> targetVariants(const std::string& normalized,
                                            const ResolutionStrategy& strategy) const;

    // Non-note files whose path without its last extension ends with `target`, ignoring case
    std::vector<std::string> findAttachmentByStem(std::string_view target) const;

    const FileCatalog& catalog_;
    AttachmentSearchConfig config_;
};

} // namespace notegraph::resolve
