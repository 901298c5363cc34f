#include <notegraph/crypto/hasher.h>
#include <notegraph/extraction/text_utils.h>
#include <notegraph/graph/note_graph.h>
#include <notegraph/identity/identity.h>
#include <notegraph/ingest/ingestion_pipeline.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace notegraph::ingest {

IngestionPipeline::IngestionPipeline(IngestionConfig config,
                                     std::shared_ptr<ml::IEmbeddingProvider> provider)
    : config_(std::move(config)), provider_(std::move(provider)) {}

ResolvedReference IngestionPipeline::resolveReference(const Reference& ref, const Note& note,
                                                      const resolve::PathResolver& resolver,
                                                      const resolve::FileCatalog& catalog,
                                                      NoteOutcome& outcome) {
    ResolvedReference r;
    r.reference = ref;
    r.normalizedTarget = resolve::PathResolver::normalizeTarget(ref.rawTarget);
    r.context = extraction::util::contextAround(note.rawContent, ref.position, ref.length,
                                                config_.contextChars);
    // Encoded targets only occur verbatim in their raw form
    r.strength =
        std::max(extraction::util::relationshipStrength(note.rawContent, r.normalizedTarget),
                 extraction::util::relationshipStrength(note.rawContent, ref.rawTarget));

    auto resolved = resolver.resolve(ref.rawTarget, note.canonicalPath, ref.kind);
    if (!resolved) {
        const auto& err = resolved.error();
        r.status = err.status();
        r.candidates = err.candidates;
        r.searched = err.searched;
        outcome.issues.push_back(RunIssue{r.status == ResolutionStatus::Ambiguous
                                              ? IssueKind::AmbiguousReference
                                              : IssueKind::BrokenReference,
                                          note.canonicalPath, err.message});
        spdlog::warn("{}", err.message);
        return r;
    }

    r.status = ResolutionStatus::Resolved;
    r.canonicalTarget = resolved.value();

    if (ref.kind == ReferenceKind::Wikilink && catalog.isNote(r.canonicalTarget)) {
        r.targetNoteId = identity::noteId(r.canonicalTarget);
        spdlog::debug("{}: [[{}]] -> {}", note.canonicalPath, ref.rawTarget, r.canonicalTarget);
        return r;
    }

    auto imageId = compositeIndex_.lookup(note.noteId, r.normalizedTarget);
    r.targetImageId = imageId;
    spdlog::debug("{}: {} '{}' -> {}", note.canonicalPath, referenceKindToString(ref.kind),
                  ref.rawTarget, r.canonicalTarget);

    bool known = std::any_of(outcome.images.begin(), outcome.images.end(),
                             [&](const ImageRecord& img) { return img.imageId == imageId; });
    if (!known) {
        ImageRecord img;
        img.imageId = imageId;
        img.noteId = note.noteId;
        img.relativePath = r.normalizedTarget;
        img.canonicalPath = r.canonicalTarget;
        img.resolvedAbsolutePath = catalog.absolutePath(r.canonicalTarget).generic_string();
        img.mimeType = extraction::util::mimeTypeForPath(r.canonicalTarget);

        crypto::SHA256Hasher hasher;
        auto hash = hasher.hashFile(catalog.absolutePath(r.canonicalTarget));
        if (hash) {
            img.contentHash = hash.value();
        } else {
            outcome.issues.push_back(RunIssue{IssueKind::AttachmentUnreadable, note.canonicalPath,
                                              hash.error().message});
        }
        outcome.images.push_back(std::move(img));
    }
    return r;
}

IngestionPipeline::NoteOutcome
IngestionPipeline::processNote(const std::string& canonicalPath,
                               const extraction::ReferenceParser& parser,
                               const resolve::PathResolver& resolver,
                               const resolve::FileCatalog& catalog) {
    NoteOutcome out;
    auto& note = out.note;
    note.canonicalPath = canonicalPath;
    note.noteId = identity::noteId(canonicalPath);
    note.folderPath = std::filesystem::path(canonicalPath).parent_path().generic_string();

    std::ifstream in(catalog.absolutePath(canonicalPath), std::ios::binary);
    if (!in) {
        out.error = Error{ErrorCode::FileNotFound, "Cannot open note"};
        return out;
    }
    note.rawContent.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        out.error = Error{ErrorCode::CorruptedData, "Failed reading note"};
        return out;
    }
    if (!extraction::util::isValidUtf8(note.rawContent)) {
        out.error = Error{ErrorCode::InvalidData, "Note is not valid UTF-8 text"};
        return out;
    }

    note.title = extraction::util::extractTitle(note.rawContent, canonicalPath);

    for (const auto& ref : parser.parse(note.rawContent, note.noteId)) {
        out.references.push_back(resolveReference(ref, note, resolver, catalog, out));
    }

    auto chunker = vector::createChunker(config_.chunking);
    auto chunks = chunker->chunkNote(note.rawContent, note.noteId);
    if (!chunks) {
        out.error = chunks.error();
        return out;
    }
    note.chunks = std::move(chunks).value();

    std::sort(out.images.begin(), out.images.end(),
              [](const ImageRecord& a, const ImageRecord& b) { return a.relativePath < b.relativePath; });
    out.ok = true;
    return out;
}

Result<vector::VectorDatabase> IngestionPipeline::run() {
    auto started = std::chrono::steady_clock::now();

    if (!provider_) {
        return Error{ErrorCode::InvalidArgument, "No embedding provider configured"};
    }

    auto table = extraction::PatternTable::compile(config_.patterns);
    if (!table) {
        return table.error();
    }

    auto scanned = resolve::FileCatalog::scan(config_.notesRoot, config_.catalog);
    if (!scanned) {
        return scanned.error();
    }
    const auto& catalog = scanned.value();
    const auto& notePaths = catalog.notes();

    // Paths that are not UTF-8 cannot be stored in the artifact
    std::vector<RunIssue> rejectedIssues;
    size_t rejectedNotes = 0;
    for (const auto& path : catalog.rejected()) {
        auto printable = extraction::util::sanitizeUtf8(path);
        if (catalog.isNote(path)) {
            if (config_.failFast) {
                spdlog::error("Aborting ingestion: {}: path is not valid UTF-8", printable);
                return Error{ErrorCode::InvalidData, printable + ": path is not valid UTF-8"};
            }
            ++rejectedNotes;
            rejectedIssues.push_back(
                RunIssue{IssueKind::NoteSkipped, printable, "path is not valid UTF-8"});
        } else {
            rejectedIssues.push_back(
                RunIssue{IssueKind::AttachmentUnreadable, printable, "path is not valid UTF-8"});
        }
    }

    extraction::ReferenceParser parser(std::move(table).value());
    resolve::PathResolver resolver(catalog, config_.attachments);
    compositeIndex_.clear();

    size_t workers = config_.maxWorkers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::max<size_t>(1, std::min(workers, notePaths.size()));
    spdlog::info("Ingesting {} notes from {} with {} worker threads", notePaths.size(),
                 catalog.root().string(), workers);

    // One slot per note; each task writes only its own slot
    std::vector<NoteOutcome> outcomes(notePaths.size());
    std::atomic<bool> aborted{false};
    size_t reported = 0; // Guarded by progressMutex
    std::mutex progressMutex;
    {
        boost::asio::thread_pool pool(workers);
        for (size_t i = 0; i < notePaths.size(); ++i) {
            boost::asio::post(pool, [&, i]() {
                if (aborted.load(std::memory_order_relaxed)) {
                    return;
                }
                try {
                    outcomes[i] = processNote(notePaths[i], parser, resolver, catalog);
                } catch (const std::exception& e) {
                    outcomes[i] = NoteOutcome{};
                    outcomes[i].note.canonicalPath = notePaths[i];
                    outcomes[i].error = Error{ErrorCode::InternalError, e.what()};
                }
                if (!outcomes[i].ok && config_.failFast) {
                    aborted.store(true, std::memory_order_relaxed);
                }
                if (progress_) {
                    std::lock_guard<std::mutex> lock(progressMutex);
                    progress_(++reported, notePaths.size());
                }
            });
        }
        pool.join();
    }

    if (config_.failFast && aborted.load()) {
        for (size_t i = 0; i < outcomes.size(); ++i) {
            const auto& o = outcomes[i];
            if (!o.ok && o.error.code != ErrorCode::Success) {
                spdlog::error("Aborting ingestion: {}: {}", notePaths[i], o.error.message);
                return Error{o.error.code, notePaths[i] + ": " + o.error.message};
            }
        }
    }

    RunSummary summary;
    summary.notesScanned = notePaths.size() + rejectedNotes;
    summary.notesSkipped = rejectedNotes;
    summary.issues = std::move(rejectedIssues);
    graph::NoteGraphBuilder builder;
    vector::VectorDatabase db;
    std::vector<const NoteChunk*> chunks;
    std::unordered_map<NoteId, std::string> notePathById;

    for (size_t i = 0; i < outcomes.size(); ++i) {
        auto& o = outcomes[i];
        if (!o.ok) {
            ++summary.notesSkipped;
            summary.addIssue(IssueKind::NoteSkipped, notePaths[i],
                             extraction::util::sanitizeUtf8(o.error.message));
            spdlog::warn("Skipped note {}: {}", notePaths[i], o.error.message);
            continue;
        }
        ++summary.notesIndexed;
        notePathById[o.note.noteId] = o.note.canonicalPath;
        for (const auto& r : o.references) {
            switch (r.status) {
                case ResolutionStatus::Resolved: ++summary.referencesResolved; break;
                case ResolutionStatus::Ambiguous: ++summary.referencesAmbiguous; break;
                case ResolutionStatus::Broken: ++summary.referencesBroken; break;
            }
        }
        for (auto& issue : o.issues) {
            summary.issues.push_back(std::move(issue));
        }
        summary.imagesIndexed += o.images.size();
        for (auto& img : o.images) {
            db.images.push_back(std::move(img));
        }

        vector::NoteSummary meta;
        meta.noteId = o.note.noteId;
        meta.canonicalPath = o.note.canonicalPath;
        meta.title = o.note.title;
        meta.folderPath = o.note.folderPath;
        meta.contentLength = o.note.rawContent.size();
        meta.chunkCount = o.note.chunks.size();
        db.notes.push_back(std::move(meta));

        for (const auto& c : o.note.chunks) {
            chunks.push_back(&c);
        }
        builder.add(graph::makeDelta(o.note, std::move(o.references)));
    }

    db.graph = builder.build();
    if (auto check = db.graph.verifyTranspose(); !check) {
        return Error{ErrorCode::InternalError, "Graph merge broke the transpose invariant: " +
                                                   check.error().message};
    }

    // Embedding
    try {
        if (auto init = provider_->initialize(); !init) {
            return Error{init.error().code,
                         "Embedding provider initialization failed: " + init.error().message};
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::NotInitialized,
                     std::string("Embedding provider initialization failed: ") + e.what()};
    }

    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto* c : chunks) {
        texts.push_back(c->text);
    }
    vector::EmbeddingService embedder(provider_, config_.embedding);
    auto embedded = embedder.embedAll(texts);
    provider_->shutdown();

    db.records.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = *chunks[i];
        vector::EmbeddingRecord rec;
        rec.chunkId = c.chunkId;
        rec.noteId = c.noteId;
        rec.chunkIndex = c.chunkIndex;
        rec.startOffset = c.startOffset;
        rec.endOffset = c.endOffset;
        rec.text = c.text;
        if (embedded[i].ok) {
            rec.vector = std::move(embedded[i].vector);
            rec.status = vector::EmbeddingStatus::Embedded;
            ++summary.chunksEmbedded;
        } else {
            rec.status = vector::EmbeddingStatus::Failed;
            rec.error = extraction::util::sanitizeUtf8(embedded[i].error);
            ++summary.chunksFailed;
            summary.addIssue(IssueKind::EmbeddingFailed, notePathById[c.noteId],
                             "chunk " + std::to_string(c.chunkIndex) + ": " + rec.error);
        }
        db.records.push_back(std::move(rec));
    }

    db.providerName = provider_->getProviderName();
    db.dimension = provider_->getEmbeddingDimension();
    summary.cacheHits = compositeIndex_.hits();
    summary.cacheMisses = compositeIndex_.misses();
    db.summary = std::move(summary);
    db.reindex();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Ingestion finished in {} ms: {}", elapsed.count(), db.summary.sanitizedStatus());
    return db;
}

Result<void> IngestionPipeline::writeArtifact(const vector::VectorDatabase& db) const {
    auto written = db.save(config_.outputPath);
    if (!written) {
        spdlog::error("Failed to write index: {}", written.error().message);
    }
    return written;
}

Result<vector::VectorDatabase> IngestionPipeline::ingest() {
    auto db = run();
    if (!db) {
        return db;
    }
    if (auto written = writeArtifact(db.value()); !written) {
        return written.error();
    }
    return db;
}

} // namespace notegraph::ingest
