#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notegraph::ingest {

enum class IssueKind {
    NoteSkipped,
    BrokenReference,
    AmbiguousReference,
    EmbeddingFailed,
    AttachmentUnreadable
};

const char* issueKindToString(IssueKind kind);
std::optional<IssueKind> issueKindFromString(std::string_view name);

struct RunIssue {
    IssueKind kind = IssueKind::NoteSkipped;
    std::string notePath;
    std::string detail;
};

enum class RunStatus { Ok, Partial, Failed };

const char* runStatusToString(RunStatus status);

/**
 * Outcome of one ingestion run. Counts are totals; issues are in canonical note order.
 */
struct RunSummary {
    size_t notesScanned = 0;
    size_t notesIndexed = 0;
    size_t notesSkipped = 0;
    size_t referencesResolved = 0;
    size_t referencesAmbiguous = 0;
    size_t referencesBroken = 0;
    size_t chunksEmbedded = 0;
    size_t chunksFailed = 0;
    size_t imagesIndexed = 0;
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    std::vector<RunIssue> issues;

    void addIssue(IssueKind kind, std::string notePath, std::string detail);
    size_t issueCount(IssueKind kind) const;

    // Failed: nothing usable was produced. Partial: notes skipped or chunks not embedded.
    RunStatus status() const;

    // Status word plus counts; never carries exception or provider text
    std::string sanitizedStatus() const;
};

} // namespace notegraph::ingest
