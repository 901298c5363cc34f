#include <notegraph/vector/vector_database.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace notegraph::vector {

using nlohmann::json;

namespace {

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

json referenceToJson(const ResolvedReference& r) {
    json j;
    j["kind"] = referenceKindToString(r.reference.kind);
    j["pattern"] = r.reference.pattern;
    j["raw_target"] = r.reference.rawTarget;
    j["source_note_id"] = r.reference.sourceNoteId;
    j["position"] = r.reference.position;
    j["length"] = r.reference.length;
    j["status"] = resolutionStatusToString(r.status);
    if (r.targetNoteId) {
        j["target_note_id"] = *r.targetNoteId;
    }
    if (r.targetImageId) {
        j["target_image_id"] = *r.targetImageId;
    }
    j["canonical_target"] = r.canonicalTarget;
    j["normalized_target"] = r.normalizedTarget;
    j["candidates"] = r.candidates;
    j["searched"] = r.searched;
    j["context"] = r.context;
    j["strength"] = r.strength;
    return j;
}

json edgesToJson(const std::map<std::string, std::vector<graph::InboundEdge>>& buckets) {
    json out = json::object();
    for (const auto& [target, edges] : buckets) {
        json list = json::array();
        for (const auto& e : edges) {
            list.push_back({{"source_note_id", e.sourceNoteId},
                            {"position", e.reference.reference.position}});
        }
        out[target] = std::move(list);
    }
    return out;
}

json summaryToJson(const ingest::RunSummary& s) {
    json j;
    j["status"] = ingest::runStatusToString(s.status());
    j["notes_scanned"] = s.notesScanned;
    j["notes_indexed"] = s.notesIndexed;
    j["notes_skipped"] = s.notesSkipped;
    j["references_resolved"] = s.referencesResolved;
    j["references_ambiguous"] = s.referencesAmbiguous;
    j["references_broken"] = s.referencesBroken;
    j["chunks_embedded"] = s.chunksEmbedded;
    j["chunks_failed"] = s.chunksFailed;
    j["images_indexed"] = s.imagesIndexed;
    j["cache_hits"] = s.cacheHits;
    j["cache_misses"] = s.cacheMisses;
    json issues = json::array();
    for (const auto& i : s.issues) {
        issues.push_back({{"kind", ingest::issueKindToString(i.kind)},
                          {"note_path", i.notePath},
                          {"detail", i.detail}});
    }
    j["issues"] = std::move(issues);
    return j;
}

// ---------------------------------------------------------------------------
// Decoding (throws json::exception or std::invalid_argument on malformed input)
// ---------------------------------------------------------------------------

ResolvedReference referenceFromJson(const json& j) {
    ResolvedReference r;
    auto kind = referenceKindFromString(j.at("kind").get<std::string>());
    auto status = resolutionStatusFromString(j.at("status").get<std::string>());
    if (!kind || !status) {
        throw std::invalid_argument("unknown reference kind or status");
    }
    r.reference.kind = *kind;
    r.reference.pattern = j.at("pattern").get<std::string>();
    r.reference.rawTarget = j.at("raw_target").get<std::string>();
    r.reference.sourceNoteId = j.at("source_note_id").get<std::string>();
    r.reference.position = j.at("position").get<size_t>();
    r.reference.length = j.at("length").get<size_t>();
    r.status = *status;
    if (j.contains("target_note_id")) {
        r.targetNoteId = j.at("target_note_id").get<std::string>();
    }
    if (j.contains("target_image_id")) {
        r.targetImageId = j.at("target_image_id").get<std::string>();
    }
    r.canonicalTarget = j.at("canonical_target").get<std::string>();
    r.normalizedTarget = j.at("normalized_target").get<std::string>();
    r.candidates = j.at("candidates").get<std::vector<std::string>>();
    r.searched = j.at("searched").get<std::vector<std::string>>();
    r.context = j.at("context").get<std::string>();
    r.strength = j.at("strength").get<double>();
    return r;
}

std::map<std::string, std::vector<graph::InboundEdge>>
edgesFromJson(const json& j, const std::map<std::pair<NoteId, size_t>, const ResolvedReference*>& refs) {
    std::map<std::string, std::vector<graph::InboundEdge>> out;
    for (const auto& [target, list] : j.items()) {
        auto& bucket = out[target];
        for (const auto& e : list) {
            auto source = e.at("source_note_id").get<std::string>();
            auto position = e.at("position").get<size_t>();
            auto it = refs.find({source, position});
            if (it == refs.end()) {
                throw std::invalid_argument(
                    fmt::format("inverse edge {}@{} has no outbound reference", source, position));
            }
            bucket.push_back(graph::InboundEdge{source, *it->second});
        }
    }
    return out;
}

ingest::RunSummary summaryFromJson(const json& j) {
    ingest::RunSummary s;
    s.notesScanned = j.at("notes_scanned").get<size_t>();
    s.notesIndexed = j.at("notes_indexed").get<size_t>();
    s.notesSkipped = j.at("notes_skipped").get<size_t>();
    s.referencesResolved = j.at("references_resolved").get<size_t>();
    s.referencesAmbiguous = j.at("references_ambiguous").get<size_t>();
    s.referencesBroken = j.at("references_broken").get<size_t>();
    s.chunksEmbedded = j.at("chunks_embedded").get<size_t>();
    s.chunksFailed = j.at("chunks_failed").get<size_t>();
    s.imagesIndexed = j.at("images_indexed").get<size_t>();
    s.cacheHits = j.at("cache_hits").get<uint64_t>();
    s.cacheMisses = j.at("cache_misses").get<uint64_t>();
    for (const auto& i : j.at("issues")) {
        auto kind = ingest::issueKindFromString(i.at("kind").get<std::string>());
        if (!kind) {
            throw std::invalid_argument("unknown issue kind");
        }
        s.addIssue(*kind, i.at("note_path").get<std::string>(), i.at("detail").get<std::string>());
    }
    return s;
}

} // namespace

void VectorDatabase::reindex() {
    noteIndex_.clear();
    pathIndex_.clear();
    imageIndex_.clear();
    compositeIndex_.clear();
    recordIndex_.clear();

    for (size_t i = 0; i < notes.size(); ++i) {
        noteIndex_[notes[i].noteId] = i;
        pathIndex_[notes[i].canonicalPath] = i;
    }
    for (size_t i = 0; i < images.size(); ++i) {
        imageIndex_[images[i].imageId] = i;
        compositeIndex_[{images[i].noteId, images[i].relativePath}] = images[i].imageId;
    }
    for (size_t i = 0; i < records.size(); ++i) {
        recordIndex_[records[i].noteId].push_back(i);
    }
}

const NoteSummary* VectorDatabase::findNote(const NoteId& noteId) const {
    auto it = noteIndex_.find(noteId);
    return it == noteIndex_.end() ? nullptr : &notes[it->second];
}

const NoteSummary* VectorDatabase::findNoteByPath(const std::string& canonicalPath) const {
    auto it = pathIndex_.find(canonicalPath);
    return it == pathIndex_.end() ? nullptr : &notes[it->second];
}

const ImageRecord* VectorDatabase::findImage(const ImageId& imageId) const {
    auto it = imageIndex_.find(imageId);
    return it == imageIndex_.end() ? nullptr : &images[it->second];
}

std::optional<ImageId> VectorDatabase::imageIdByPath(const NoteId& noteId,
                                                     const std::string& relativePath) const {
    auto it = compositeIndex_.find({noteId, relativePath});
    if (it == compositeIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<const EmbeddingRecord*> VectorDatabase::recordsForNote(const NoteId& noteId) const {
    std::vector<const EmbeddingRecord*> out;
    if (auto it = recordIndex_.find(noteId); it != recordIndex_.end()) {
        for (size_t i : it->second) {
            out.push_back(&records[i]);
        }
    }
    return out;
}

size_t VectorDatabase::embeddedCount() const {
    size_t n = 0;
    for (const auto& r : records) {
        if (r.status == EmbeddingStatus::Embedded) {
            ++n;
        }
    }
    return n;
}

double VectorDatabase::computeCosineSimilarity(const std::vector<float>& a,
                                               const std::vector<float>& b) {
    if (a.size() != b.size()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot_product / (norm_a * norm_b);
}

std::string VectorDatabase::toJson() const {
    json j;
    j["version"] = kFormatVersion;
    j["provider"] = {{"name", providerName}, {"dimension", dimension}};

    json notesJson = json::array();
    for (const auto& n : notes) {
        notesJson.push_back({{"note_id", n.noteId},
                             {"canonical_path", n.canonicalPath},
                             {"title", n.title},
                             {"folder_path", n.folderPath},
                             {"content_length", n.contentLength},
                             {"chunk_count", n.chunkCount}});
    }
    j["notes"] = std::move(notesJson);

    json recordsJson = json::array();
    for (const auto& r : records) {
        json rec = {{"chunk_id", r.chunkId},
                    {"note_id", r.noteId},
                    {"chunk_index", r.chunkIndex},
                    {"start_offset", r.startOffset},
                    {"end_offset", r.endOffset},
                    {"text", r.text},
                    {"status", r.status == EmbeddingStatus::Embedded ? "embedded" : "failed"},
                    {"vector", r.vector}};
        if (!r.error.empty()) {
            rec["error"] = r.error;
        }
        recordsJson.push_back(std::move(rec));
    }
    j["records"] = std::move(recordsJson);

    json imagesJson = json::array();
    for (const auto& img : images) {
        imagesJson.push_back({{"image_id", img.imageId},
                              {"note_id", img.noteId},
                              {"relative_path", img.relativePath},
                              {"canonical_path", img.canonicalPath},
                              {"resolved_absolute_path", img.resolvedAbsolutePath},
                              {"mime_type", img.mimeType},
                              {"content_hash", img.contentHash}});
    }
    j["images"] = std::move(imagesJson);

    json outbound = json::object();
    for (const auto& [noteId, refs] : graph.outbound) {
        json list = json::array();
        for (const auto& r : refs) {
            list.push_back(referenceToJson(r));
        }
        outbound[noteId] = std::move(list);
    }
    j["graph"] = {{"outbound", std::move(outbound)},
                  {"inbound", edgesToJson(graph.inbound)},
                  {"unresolved", edgesToJson(graph.unresolved)},
                  {"clusters", graph.clusters}};

    j["summary"] = summaryToJson(summary);
    return j.dump(2);
}

Result<VectorDatabase> VectorDatabase::fromJson(const std::string& text) {
    VectorDatabase db;
    try {
        auto j = json::parse(text);

        auto version = j.at("version").get<int>();
        if (version != kFormatVersion) {
            return Error{ErrorCode::NotSupported,
                         fmt::format("Unsupported index format version {}", version)};
        }

        db.providerName = j.at("provider").at("name").get<std::string>();
        db.dimension = j.at("provider").at("dimension").get<size_t>();

        for (const auto& n : j.at("notes")) {
            NoteSummary s;
            s.noteId = n.at("note_id").get<std::string>();
            s.canonicalPath = n.at("canonical_path").get<std::string>();
            s.title = n.at("title").get<std::string>();
            s.folderPath = n.at("folder_path").get<std::string>();
            s.contentLength = n.at("content_length").get<size_t>();
            s.chunkCount = n.at("chunk_count").get<size_t>();
            db.notes.push_back(std::move(s));
        }

        for (const auto& r : j.at("records")) {
            EmbeddingRecord rec;
            rec.chunkId = r.at("chunk_id").get<std::string>();
            rec.noteId = r.at("note_id").get<std::string>();
            rec.chunkIndex = r.at("chunk_index").get<size_t>();
            rec.startOffset = r.at("start_offset").get<size_t>();
            rec.endOffset = r.at("end_offset").get<size_t>();
            rec.text = r.at("text").get<std::string>();
            rec.status = r.at("status").get<std::string>() == "embedded" ? EmbeddingStatus::Embedded
                                                                          : EmbeddingStatus::Failed;
            rec.vector = r.at("vector").get<std::vector<float>>();
            rec.error = r.value("error", std::string{});
            db.records.push_back(std::move(rec));
        }

        for (const auto& i : j.at("images")) {
            ImageRecord img;
            img.imageId = i.at("image_id").get<std::string>();
            img.noteId = i.at("note_id").get<std::string>();
            img.relativePath = i.at("relative_path").get<std::string>();
            img.canonicalPath = i.at("canonical_path").get<std::string>();
            img.resolvedAbsolutePath = i.at("resolved_absolute_path").get<std::string>();
            img.mimeType = i.at("mime_type").get<std::string>();
            img.contentHash = i.at("content_hash").get<std::string>();
            db.images.push_back(std::move(img));
        }

        const auto& g = j.at("graph");
        for (const auto& [noteId, list] : g.at("outbound").items()) {
            auto& refs = db.graph.outbound[noteId];
            for (const auto& r : list) {
                refs.push_back(referenceFromJson(r));
            }
        }
        std::map<std::pair<NoteId, size_t>, const ResolvedReference*> bySite;
        for (const auto& [noteId, refs] : db.graph.outbound) {
            for (const auto& r : refs) {
                bySite[{noteId, r.reference.position}] = &r;
            }
        }
        db.graph.inbound = edgesFromJson(g.at("inbound"), bySite);
        db.graph.unresolved = edgesFromJson(g.at("unresolved"), bySite);
        db.graph.clusters = g.at("clusters").get<std::map<std::string, std::vector<NoteId>>>();

        db.summary = summaryFromJson(j.at("summary"));
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData, fmt::format("Malformed index: {}", e.what())};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorCode::CorruptedData, fmt::format("Malformed index: {}", e.what())};
    }

    if (auto check = db.graph.verifyTranspose(); !check) {
        return Error{ErrorCode::CorruptedData, check.error().message};
    }
    db.reindex();
    return db;
}

Result<void> VectorDatabase::save(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         fmt::format("Cannot create directory {}: {}",
                                     path.parent_path().string(), ec.message())};
        }
    }

    auto tempPath = path;
    tempPath += ".tmp";

    // Serialize first so a rejected document never leaves a partial file behind
    std::string document;
    try {
        document = toJson();
    } catch (const json::exception& e) {
        std::filesystem::remove(tempPath, ec);
        return Error{ErrorCode::WriteError,
                     fmt::format("Cannot serialize index for {}: {}", path.string(), e.what())};
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return Error{ErrorCode::WriteError,
                         fmt::format("Cannot open {} for writing", tempPath.string())};
        }
        ofs << document;
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, fmt::format("Failed writing {}", tempPath.string())};
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        return Error{ErrorCode::WriteError,
                     fmt::format("Cannot move index into place at {}: {}", path.string(),
                                 ec.message())};
    }
    spdlog::info("Wrote index with {} records to {}", records.size(), path.string());
    return Result<void>();
}

Result<VectorDatabase> VectorDatabase::load(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return Error{ErrorCode::FileNotFound, fmt::format("Index not found: {}", path.string())};
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return fromJson(buffer.str());
}

} // namespace notegraph::vector
