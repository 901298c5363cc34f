#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>
#include <notegraph/graph/note_graph.h>
#include <notegraph/ingest/run_summary.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notegraph::vector {

enum class EmbeddingStatus { Embedded, Failed };

struct EmbeddingRecord {
    std::string chunkId; // "<note_id>_<chunk_index>"
    NoteId noteId;
    size_t chunkIndex = 0;
    size_t startOffset = 0;
    size_t endOffset = 0;
    std::string text;
    std::vector<float> vector; // Empty when Failed
    EmbeddingStatus status = EmbeddingStatus::Embedded;
    std::string error;
};

/**
 * Per-note metadata carried by the artifact. Raw content is not duplicated; the chunks
 * hold the text.
 */
struct NoteSummary {
    NoteId noteId;
    std::string canonicalPath;
    std::string title;
    std::string folderPath;
    size_t contentLength = 0;
    size_t chunkCount = 0;
};

/**
 * The persisted index. Rebuilt wholesale by each ingestion run and read-only once
 * loaded. Records are ordered by note canonical path, then chunk index.
 */
class VectorDatabase {
public:
    static constexpr int kFormatVersion = 2;

    std::vector<EmbeddingRecord> records;
    std::vector<NoteSummary> notes;   // Sorted by canonical path
    std::vector<ImageRecord> images;  // Sorted by (note path, relative path)
    graph::NoteGraph graph;
    std::string providerName;
    size_t dimension = 0;
    ingest::RunSummary summary;

    // Rebuild lookup tables after the public members change
    void reindex();

    const NoteSummary* findNote(const NoteId& noteId) const;
    const NoteSummary* findNoteByPath(const std::string& canonicalPath) const;
    const ImageRecord* findImage(const ImageId& imageId) const;
    std::optional<ImageId> imageIdByPath(const NoteId& noteId,
                                         const std::string& relativePath) const;
    std::vector<const EmbeddingRecord*> recordsForNote(const NoteId& noteId) const;

    size_t embeddedCount() const;

    // Serialization
    std::string toJson() const;
    static Result<VectorDatabase> fromJson(const std::string& text);

    // Atomic write: temp file beside the target, then rename
    Result<void> save(const std::filesystem::path& path) const;
    static Result<VectorDatabase> load(const std::filesystem::path& path);

    static double computeCosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

private:
    std::map<NoteId, size_t> noteIndex_;
    std::map<std::string, size_t> pathIndex_;
    std::map<ImageId, size_t> imageIndex_;
    std::map<std::pair<NoteId, std::string>, ImageId> compositeIndex_;
    std::map<NoteId, std::vector<size_t>> recordIndex_;
};

} // namespace notegraph::vector
