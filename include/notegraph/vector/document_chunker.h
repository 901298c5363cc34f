#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notegraph::vector {

/**
 * Chunking strategies for note segmentation
 */
enum class ChunkingStrategy {
    FIXED_SIZE,    // Sliding byte window snapped to word boundaries
    MARKDOWN_AWARE // Headers, then paragraphs, then sentences
};

const char* chunkingStrategyToString(ChunkingStrategy strategy);
std::optional<ChunkingStrategy> chunkingStrategyFromString(std::string_view name);

/**
 * Configuration for note chunking. Sizes are in bytes.
 */
struct ChunkingConfig {
    ChunkingStrategy strategy = ChunkingStrategy::MARKDOWN_AWARE;
    size_t chunk_size = 1000;  // Upper bound for a span before overlap is prepended
    size_t overlap_size = 100; // Trailing bytes of the previous span prepended to each chunk
    bool preserve_words = true;
};

/**
 * Statistics for chunking operations
 */
struct ChunkingStats {
    size_t total_documents = 0;
    size_t total_chunks = 0;
    double avg_chunk_size = 0.0;
    size_t min_chunk_size = 0;
    size_t max_chunk_size = 0;
    std::chrono::milliseconds total_time{0};

    void update(const std::vector<NoteChunk>& chunks, std::chrono::milliseconds time);
};

/**
 * Base class for chunking strategies. Derived classes produce byte spans; the base
 * class prepends overlap and materializes chunks, so every chunk's text is exactly
 * content.substr(startOffset, endOffset - startOffset).
 */
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkingConfig& config = {});
    virtual ~DocumentChunker() = default;

    DocumentChunker(const DocumentChunker&) = delete;
    DocumentChunker& operator=(const DocumentChunker&) = delete;

    // Empty or whitespace-only content yields no chunks
    Result<std::vector<NoteChunk>> chunkNote(const std::string& content, const NoteId& noteId);

    const ChunkingConfig& getConfig() const { return config_; }

    bool validateChunks(const std::string& content, const std::vector<NoteChunk>& chunks) const;

    ChunkingStats getStats() const;
    void resetStats();

protected:
    struct Span {
        size_t start = 0;
        size_t end = 0;
    };

    // Ordered, non-overlapping spans of content
    virtual std::vector<Span> doChunking(const std::string& content) = 0;

    // Largest position <= pos (>= floor) that does not split a UTF-8 sequence
    static size_t alignBackward(const std::string& content, size_t pos, size_t floor = 0);
    // Hard split of [start, end) into pieces of at most maxSize, preferring whitespace
    std::vector<Span> splitWindow(const std::string& content, size_t start, size_t end,
                                  size_t maxSize) const;

    ChunkingConfig config_;

private:
    std::vector<NoteChunk> materialize(const std::string& content, const NoteId& noteId,
                                       const std::vector<Span>& spans) const;

    mutable std::mutex statsMutex_;
    ChunkingStats stats_;
};

/**
 * Fixed-size chunking: consecutive windows of chunk_size - overlap bytes, so each chunk
 * including its overlap spans roughly chunk_size bytes.
 */
class FixedSizeChunker : public DocumentChunker {
public:
    explicit FixedSizeChunker(const ChunkingConfig& config = {});

protected:
    std::vector<Span> doChunking(const std::string& content) override;
};

/**
 * Markdown-aware chunking strategy
 */
class MarkdownChunker : public DocumentChunker {
public:
    explicit MarkdownChunker(const ChunkingConfig& config = {});

protected:
    std::vector<Span> doChunking(const std::string& content) override;

private:
    std::vector<Span> parseSections(const std::string& text) const;
    void splitRange(const std::string& text, size_t start, size_t end, int level,
                    std::vector<Span>& units) const;
    std::vector<Span> pack(const std::string& text, const std::vector<Span>& units) const;
};

/**
 * Factory function for creating chunkers based on strategy
 */
std::unique_ptr<DocumentChunker> createChunker(const ChunkingConfig& config = {});

} // namespace notegraph::vector
