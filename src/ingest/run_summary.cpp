#include <notegraph/ingest/run_summary.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace notegraph::ingest {

const char* issueKindToString(IssueKind kind) {
    switch (kind) {
        case IssueKind::NoteSkipped: return "note_skipped";
        case IssueKind::BrokenReference: return "broken_reference";
        case IssueKind::AmbiguousReference: return "ambiguous_reference";
        case IssueKind::EmbeddingFailed: return "embedding_failed";
        case IssueKind::AttachmentUnreadable: return "attachment_unreadable";
    }
    return "note_skipped";
}

std::optional<IssueKind> issueKindFromString(std::string_view name) {
    for (auto kind : {IssueKind::NoteSkipped, IssueKind::BrokenReference,
                      IssueKind::AmbiguousReference, IssueKind::EmbeddingFailed,
                      IssueKind::AttachmentUnreadable}) {
        if (name == issueKindToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const char* runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Ok: return "ok";
        case RunStatus::Partial: return "partial";
        case RunStatus::Failed: return "failed";
    }
    return "failed";
}

void RunSummary::addIssue(IssueKind kind, std::string notePath, std::string detail) {
    issues.push_back(RunIssue{kind, std::move(notePath), std::move(detail)});
}

size_t RunSummary::issueCount(IssueKind kind) const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                             [kind](const RunIssue& i) { return i.kind == kind; }));
}

RunStatus RunSummary::status() const {
    if (notesScanned > 0 && notesIndexed == 0) {
        return RunStatus::Failed;
    }
    if (chunksFailed > 0 && chunksEmbedded == 0) {
        return RunStatus::Failed;
    }
    if (notesSkipped > 0 || chunksFailed > 0) {
        return RunStatus::Partial;
    }
    return RunStatus::Ok;
}

std::string RunSummary::sanitizedStatus() const {
    return fmt::format("{}: {}/{} notes indexed, {} skipped; references {} resolved, {} "
                       "ambiguous, {} broken; chunks {} embedded, {} failed; {} images",
                       runStatusToString(status()), notesIndexed, notesScanned, notesSkipped,
                       referencesResolved, referencesAmbiguous, referencesBroken, chunksEmbedded,
                       chunksFailed, imagesIndexed);
}

} // namespace notegraph::ingest
