#include <notegraph/identity/identity.h>
#include <notegraph/vector/document_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace notegraph::vector {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool allSpace(const std::string& text, size_t start, size_t end) {
    for (size_t i = start; i < end; ++i) {
        if (!isSpace(text[i])) {
            return false;
        }
    }
    return true;
}

// Position after up to three leading spaces of a line
size_t lineIndent(const std::string& text, size_t lineStart, size_t lineEnd) {
    size_t i = lineStart;
    while (i < lineEnd && i - lineStart < 3 && text[i] == ' ') {
        ++i;
    }
    return i;
}

bool isHeaderLine(const std::string& text, size_t lineStart, size_t lineEnd) {
    size_t i = lineIndent(text, lineStart, lineEnd);
    size_t hashes = 0;
    while (i < lineEnd && text[i] == '#') {
        ++hashes;
        ++i;
    }
    return hashes >= 1 && hashes <= 6 && (i == lineEnd || text[i] == ' ' || text[i] == '\t');
}

bool isFenceLine(const std::string& text, size_t lineStart, size_t lineEnd) {
    size_t i = lineIndent(text, lineStart, lineEnd);
    return lineEnd - i >= 3 &&
           (text.compare(i, 3, "```") == 0 || text.compare(i, 3, "~~~") == 0);
}

} // namespace

const char* chunkingStrategyToString(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::FIXED_SIZE: return "fixed";
        case ChunkingStrategy::MARKDOWN_AWARE: return "markdown";
    }
    return "markdown";
}

std::optional<ChunkingStrategy> chunkingStrategyFromString(std::string_view name) {
    if (name == "fixed") {
        return ChunkingStrategy::FIXED_SIZE;
    }
    if (name == "markdown") {
        return ChunkingStrategy::MARKDOWN_AWARE;
    }
    return std::nullopt;
}

void ChunkingStats::update(const std::vector<NoteChunk>& chunks, std::chrono::milliseconds time) {
    total_documents++;
    total_time += time;
    if (chunks.empty()) {
        return;
    }

    size_t total_size = 0;
    for (const auto& chunk : chunks) {
        size_t size = chunk.endOffset - chunk.startOffset;
        total_size += size;
        min_chunk_size = (total_chunks == 0) ? size : std::min(min_chunk_size, size);
        max_chunk_size = std::max(max_chunk_size, size);
    }
    avg_chunk_size = (avg_chunk_size * static_cast<double>(total_chunks) +
                      static_cast<double>(total_size)) /
                     static_cast<double>(total_chunks + chunks.size());
    total_chunks += chunks.size();
}

// =============================================================================
// DocumentChunker Base Class Implementation
// =============================================================================

DocumentChunker::DocumentChunker(const ChunkingConfig& config) : config_(config) {
    if (config_.chunk_size == 0) {
        config_.chunk_size = 1;
    }
    if (config_.overlap_size >= config_.chunk_size) {
        spdlog::warn("Chunk overlap {} >= chunk size {}, clamping to {}", config_.overlap_size,
                     config_.chunk_size, config_.chunk_size / 2);
        config_.overlap_size = config_.chunk_size / 2;
    }
}

Result<std::vector<NoteChunk>> DocumentChunker::chunkNote(const std::string& content,
                                                          const NoteId& noteId) {
    if (allSpace(content, 0, content.size())) {
        return std::vector<NoteChunk>{};
    }

    auto start = std::chrono::steady_clock::now();
    try {
        auto chunks = materialize(content, noteId, doChunking(content));

        if (!validateChunks(content, chunks)) {
            return Error{ErrorCode::InternalError, "Chunk validation failed for note " + noteId};
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.update(chunks, duration);
        }
        return chunks;
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Chunking failed: ") + e.what()};
    }
}

std::vector<NoteChunk> DocumentChunker::materialize(const std::string& content,
                                                    const NoteId& noteId,
                                                    const std::vector<Span>& spans) const {
    std::vector<NoteChunk> chunks;
    chunks.reserve(spans.size());
    const Span* previous = nullptr;

    for (const auto& span : spans) {
        if (span.end <= span.start || allSpace(content, span.start, span.end)) {
            continue;
        }

        size_t start = span.start;
        if (previous && config_.overlap_size > 0) {
            size_t wanted = span.start > config_.overlap_size ? span.start - config_.overlap_size : 0;
            start = std::max(wanted, previous->start);
            while (start < span.start && isContinuation(content[start])) {
                ++start;
            }
        }

        NoteChunk chunk;
        chunk.chunkIndex = chunks.size();
        chunk.chunkId = identity::chunkId(noteId, chunk.chunkIndex);
        chunk.noteId = noteId;
        chunk.startOffset = start;
        chunk.endOffset = span.end;
        chunk.text = content.substr(start, span.end - start);
        chunks.push_back(std::move(chunk));
        previous = &span;
    }
    return chunks;
}

bool DocumentChunker::validateChunks(const std::string& content,
                                     const std::vector<NoteChunk>& chunks) const {
    size_t lastStart = 0;
    size_t lastEnd = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        if (c.chunkIndex != i || c.startOffset >= c.endOffset || c.endOffset > content.size()) {
            return false;
        }
        if (i > 0 && (c.startOffset < lastStart || c.endOffset <= lastEnd)) {
            return false;
        }
        if (content.compare(c.startOffset, c.endOffset - c.startOffset, c.text) != 0) {
            return false;
        }
        lastStart = c.startOffset;
        lastEnd = c.endOffset;
    }
    return true;
}

ChunkingStats DocumentChunker::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void DocumentChunker::resetStats() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = ChunkingStats{};
}

size_t DocumentChunker::alignBackward(const std::string& content, size_t pos, size_t floor) {
    while (pos > floor && pos < content.size() && isContinuation(content[pos])) {
        --pos;
    }
    return pos;
}

std::vector<DocumentChunker::Span> DocumentChunker::splitWindow(const std::string& content,
                                                                size_t start, size_t end,
                                                                size_t maxSize) const {
    std::vector<Span> out;
    maxSize = std::max<size_t>(maxSize, 1);
    size_t pos = start;
    while (end - pos > maxSize) {
        size_t cut = pos + maxSize;
        if (config_.preserve_words) {
            // Back up to whitespace, but never past half the window
            size_t limit = pos + maxSize / 2;
            size_t back = cut;
            while (back > limit && !isSpace(content[back - 1])) {
                --back;
            }
            if (back > limit) {
                cut = back;
            }
        }
        cut = alignBackward(content, cut, pos + 1);
        // Window narrower than the character at pos: take the whole character
        while (cut < end && isContinuation(content[cut])) {
            ++cut;
        }
        out.push_back({pos, cut});
        pos = cut;
    }
    if (pos < end) {
        out.push_back({pos, end});
    }
    return out;
}

// =============================================================================
// FixedSizeChunker Implementation
// =============================================================================

FixedSizeChunker::FixedSizeChunker(const ChunkingConfig& config) : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::FIXED_SIZE;
}

std::vector<DocumentChunker::Span> FixedSizeChunker::doChunking(const std::string& content) {
    size_t stride = std::max<size_t>(1, config_.chunk_size - config_.overlap_size);
    return splitWindow(content, 0, content.size(), stride);
}

// =============================================================================
// MarkdownChunker Implementation
// =============================================================================

MarkdownChunker::MarkdownChunker(const ChunkingConfig& config) : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::MARKDOWN_AWARE;
}

std::vector<DocumentChunker::Span> MarkdownChunker::doChunking(const std::string& content) {
    std::vector<Span> spans;
    for (const auto& section : parseSections(content)) {
        std::vector<Span> units;
        splitRange(content, section.start, section.end, 0, units);
        auto packed = pack(content, units);
        spans.insert(spans.end(), packed.begin(), packed.end());
    }
    return spans;
}

std::vector<DocumentChunker::Span> MarkdownChunker::parseSections(const std::string& text) const {
    std::vector<Span> sections;
    size_t sectionStart = 0;
    size_t lineStart = 0;
    bool inFence = false;

    while (lineStart < text.size()) {
        size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = text.size();
        }
        if (isFenceLine(text, lineStart, lineEnd)) {
            inFence = !inFence;
        } else if (!inFence && lineStart > sectionStart && isHeaderLine(text, lineStart, lineEnd)) {
            sections.push_back({sectionStart, lineStart});
            sectionStart = lineStart;
        }
        lineStart = lineEnd + 1;
    }
    if (sectionStart < text.size()) {
        sections.push_back({sectionStart, text.size()});
    }
    return sections;
}

void MarkdownChunker::splitRange(const std::string& text, size_t start, size_t end, int level,
                                 std::vector<Span>& units) const {
    if (end - start <= config_.chunk_size) {
        units.push_back({start, end});
        return;
    }
    if (level >= 2) {
        auto pieces = splitWindow(text, start, end, config_.chunk_size);
        units.insert(units.end(), pieces.begin(), pieces.end());
        return;
    }

    // Level 0 cuts after blank lines (paragraphs), level 1 after sentence ends
    std::vector<size_t> cuts;
    for (size_t i = start; i + 1 < end; ++i) {
        if (level == 0) {
            if (text[i] == '\n' && text[i + 1] == '\n') {
                size_t cut = i + 2;
                while (cut < end && text[cut] == '\n') {
                    ++cut;
                }
                if (cut < end) {
                    cuts.push_back(cut);
                }
                i = cut - 1;
            }
        } else if (text[i] == '\n' ||
                   ((text[i] == '.' || text[i] == '!' || text[i] == '?') && isSpace(text[i + 1]))) {
            cuts.push_back(i + 1);
        }
    }

    if (cuts.empty()) {
        splitRange(text, start, end, level + 1, units);
        return;
    }

    size_t prev = start;
    cuts.push_back(end);
    for (size_t cut : cuts) {
        if (cut > prev) {
            splitRange(text, prev, cut, level + 1, units);
            prev = cut;
        }
    }
}

std::vector<DocumentChunker::Span> MarkdownChunker::pack(const std::string& text,
                                                         const std::vector<Span>& units) const {
    std::vector<Span> out;
    auto flush = [&](Span span) {
        while (span.start < span.end && isSpace(text[span.start])) {
            ++span.start;
        }
        while (span.end > span.start && isSpace(text[span.end - 1])) {
            --span.end;
        }
        if (span.end > span.start) {
            out.push_back(span);
        }
    };

    if (units.empty()) {
        return out;
    }
    Span current = units.front();
    for (size_t i = 1; i < units.size(); ++i) {
        if (units[i].end - current.start <= config_.chunk_size) {
            current.end = units[i].end;
        } else {
            flush(current);
            current = units[i];
        }
    }
    flush(current);
    return out;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<DocumentChunker> createChunker(const ChunkingConfig& config) {
    switch (config.strategy) {
        case ChunkingStrategy::FIXED_SIZE:
            return std::make_unique<FixedSizeChunker>(config);
        case ChunkingStrategy::MARKDOWN_AWARE:
            return std::make_unique<MarkdownChunker>(config);
    }
    return std::make_unique<MarkdownChunker>(config);
}

} // namespace notegraph::vector
