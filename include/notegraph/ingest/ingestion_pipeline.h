#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>
#include <notegraph/extraction/reference_parser.h>
#include <notegraph/identity/composite_index.h>
#include <notegraph/ingest/run_summary.h>
#include <notegraph/ml/provider.h>
#include <notegraph/resolve/file_catalog.h>
#include <notegraph/resolve/path_resolver.h>
#include <notegraph/vector/document_chunker.h>
#include <notegraph/vector/embedding_service.h>
#include <notegraph/vector/vector_database.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace notegraph::ingest {

/**
 * @brief Everything one ingestion run needs besides the embedding provider
 */
struct IngestionConfig {
    std::filesystem::path notesRoot;
    resolve::CatalogOptions catalog;
    resolve::AttachmentSearchConfig attachments;
    std::vector<extraction::ReferencePattern> patterns =
        extraction::PatternTable::defaultPatterns();
    vector::ChunkingConfig chunking;
    vector::EmbeddingServiceConfig embedding;
    size_t maxWorkers = 0; // 0 = hardware concurrency
    bool failFast = false;
    size_t contextChars = 100;
    std::filesystem::path outputPath = "data/vector.json";
};

/**
 * @brief Scan, parse, resolve, index, chunk, embed and persist a notes folder
 *
 * Per-note work runs on a bounded worker pool; the graph is merged and the database
 * assembled on the calling thread, always in canonical path order, so the artifact does
 * not depend on scheduling.
 */
class IngestionPipeline {
public:
    using ProgressCallback = std::function<void(size_t notesDone, size_t notesTotal)>;

    IngestionPipeline(IngestionConfig config, std::shared_ptr<ml::IEmbeddingProvider> provider);

    /**
     * @brief Build the vector database without writing it
     * @return Database, or the first fatal error (bad root, bad patterns, fail-fast note failure)
     */
    Result<vector::VectorDatabase> run();

    /**
     * @brief run() followed by writeArtifact() to the configured output path
     */
    Result<vector::VectorDatabase> ingest();

    Result<void> writeArtifact(const vector::VectorDatabase& db) const;

    /**
     * @brief Called once per processed note from worker threads
     *
     * Calls are serialized and notesDone increases by one per call, so the callback
     * needs no locking of its own. It must not block for long: workers wait on it.
     */
    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    const IngestionConfig& config() const { return config_; }
    const identity::CompositeIndex& compositeIndex() const { return compositeIndex_; }

private:
    struct NoteOutcome {
        bool ok = false;
        Error error;
        Note note;
        std::vector<ResolvedReference> references;
        std::vector<ImageRecord> images;
        std::vector<RunIssue> issues;
    };

    NoteOutcome processNote(const std::string& canonicalPath,
                            const extraction::ReferenceParser& parser,
                            const resolve::PathResolver& resolver,
                            const resolve::FileCatalog& catalog);

    ResolvedReference resolveReference(const Reference& ref, const Note& note,
                                       const resolve::PathResolver& resolver,
                                       const resolve::FileCatalog& catalog,
                                       NoteOutcome& outcome);

    IngestionConfig config_;
    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    identity::CompositeIndex compositeIndex_;
    ProgressCallback progress_;
};

} // namespace notegraph::ingest
