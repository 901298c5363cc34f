#include <notegraph/search/retrieval_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <unordered_set>

namespace notegraph::search {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Lowercase, underscores and hyphens as spaces, runs of spaces collapsed
std::string looseTitle(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        char ch = (c == '_' || c == '-' || std::isspace(c)) ? ' '
                                                             : static_cast<char>(std::tolower(c));
        if (ch == ' ' && (out.empty() || out.back() == ' ')) {
            continue;
        }
        out.push_back(ch);
    }
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

} // namespace

const char* edgeDirectionToString(EdgeDirection direction) {
    return direction == EdgeDirection::Inbound ? "inbound" : "outbound";
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<const vector::VectorDatabase> db)
    : db_(std::move(db)) {
    if (!db_) {
        db_ = std::make_shared<const vector::VectorDatabase>();
    }
}

std::vector<RetrievalResult> RetrievalEngine::query(const std::vector<float>& queryVector,
                                                    size_t k, size_t expandHops) const {
    std::vector<RetrievalResult> results;
    if (k == 0 || queryVector.empty()) {
        return results;
    }
    if (db_->dimension != 0 && queryVector.size() != db_->dimension) {
        spdlog::warn("Query vector dimension {} does not match index dimension {}",
                     queryVector.size(), db_->dimension);
        return results;
    }

    std::vector<std::pair<size_t, double>> scored;
    scored.reserve(db_->records.size());
    for (size_t i = 0; i < db_->records.size(); ++i) {
        const auto& record = db_->records[i];
        if (record.status != vector::EmbeddingStatus::Embedded ||
            record.vector.size() != queryVector.size()) {
            continue;
        }
        scored.emplace_back(i, vector::VectorDatabase::computeCosineSimilarity(queryVector,
                                                                               record.vector));
    }

    // Stable: equal scores keep record order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (scored.size() > k) {
        scored.resize(k);
    }

    results.reserve(scored.size());
    for (const auto& [index, score] : scored) {
        const auto& record = db_->records[index];
        RetrievalResult result;
        result.chunk = &record;
        result.score = score;
        result.provenance = buildProvenance(record.noteId, expandHops);
        results.push_back(std::move(result));
    }
    return results;
}

Provenance RetrievalEngine::buildProvenance(const NoteId& noteId, size_t expandHops) const {
    Provenance provenance;
    provenance.noteId = noteId;
    if (const auto* note = db_->findNote(noteId)) {
        provenance.canonicalPath = note->canonicalPath;
        provenance.title = note->title;
    }

    std::unordered_set<std::string> seen{noteId};
    std::deque<std::pair<NoteId, size_t>> frontier{{noteId, 0}};

    auto addNote = [&](const NoteId& id, const std::string& fallbackPath, size_t hops,
                       EdgeDirection direction) {
        if (!seen.insert(id).second) {
            return;
        }
        spdlog::trace("Provenance of {}: note {} reached {} at {} hop(s)", noteId, id,
                      edgeDirectionToString(direction), hops);
        RelatedEntity entity;
        entity.type = RelatedEntity::Type::Note;
        entity.id = id;
        entity.hops = hops;
        entity.direction = direction;
        if (const auto* note = db_->findNote(id)) {
            entity.canonicalPath = note->canonicalPath;
            entity.title = note->title;
        } else {
            entity.canonicalPath = fallbackPath;
        }
        provenance.related.push_back(std::move(entity));
        if (hops < expandHops) {
            frontier.emplace_back(id, hops);
        }
    };

    while (!frontier.empty()) {
        auto [current, depth] = frontier.front();
        frontier.pop_front();
        const size_t hops = depth + 1;
        if (hops > expandHops) {
            continue;
        }

        if (auto it = db_->graph.outbound.find(current); it != db_->graph.outbound.end()) {
            for (const auto& ref : it->second) {
                if (ref.targetNoteId) {
                    addNote(*ref.targetNoteId, ref.canonicalTarget, hops, EdgeDirection::Outbound);
                } else if (ref.targetImageId && seen.insert(*ref.targetImageId).second) {
                    RelatedEntity entity;
                    entity.type = RelatedEntity::Type::Image;
                    entity.id = *ref.targetImageId;
                    entity.hops = hops;
                    entity.direction = EdgeDirection::Outbound;
                    const auto* image = db_->findImage(entity.id);
                    entity.canonicalPath = image ? image->canonicalPath : ref.canonicalTarget;
                    provenance.related.push_back(std::move(entity));
                }
            }
        }

        if (auto it = db_->graph.inbound.find(current); it != db_->graph.inbound.end()) {
            for (const auto& edge : it->second) {
                const auto* source = db_->findNote(edge.sourceNoteId);
                addNote(edge.sourceNoteId, source ? source->canonicalPath : std::string{}, hops,
                        EdgeDirection::Inbound);
            }
        }
    }
    return provenance;
}

std::vector<graph::InboundEdge> RetrievalEngine::inboundLinks(const std::string& targetId) const {
    auto it = db_->graph.inbound.find(targetId);
    if (it == db_->graph.inbound.end()) {
        return {};
    }
    return it->second;
}

std::vector<ResolvedReference> RetrievalEngine::outboundLinks(const NoteId& noteId) const {
    auto it = db_->graph.outbound.find(noteId);
    if (it == db_->graph.outbound.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::pair<NoteId, size_t>> RetrievalEngine::relatedNotes(const NoteId& noteId,
                                                                     size_t maxDepth) const {
    return db_->graph.reachable(noteId, maxDepth);
}

std::vector<NoteId> RetrievalEngine::noteCluster(const NoteId& noteId) const {
    const auto* note = db_->findNote(noteId);
    if (!note) {
        return {};
    }
    auto it = db_->graph.clusters.find(note->folderPath);
    if (it == db_->graph.clusters.end()) {
        return {};
    }
    std::vector<NoteId> out;
    for (const auto& id : it->second) {
        if (id != noteId) {
            out.push_back(id);
        }
    }
    return out;
}

std::vector<NoteId> RetrievalEngine::findPath(const NoteId& from, const NoteId& to) const {
    return db_->graph.shortestPath(from, to);
}

std::optional<RelationshipContext>
RetrievalEngine::relationshipContext(const NoteId& source, const std::string& targetId) const {
    auto it = db_->graph.outbound.find(source);
    if (it == db_->graph.outbound.end()) {
        return std::nullopt;
    }

    RelationshipContext out;
    out.sourceNoteId = source;
    out.targetId = targetId;
    for (const auto& ref : it->second) {
        if (!ref.isResolved() || ref.targetKey() != targetId) {
            continue;
        }
        ++out.mentions;
        out.strength = std::max(out.strength, ref.strength);
        if (out.targetPath.empty()) {
            out.targetPath = ref.canonicalTarget;
        }
        const auto& contexts = out.contexts;
        if (!ref.context.empty() &&
            std::find(contexts.begin(), contexts.end(), ref.context) == contexts.end()) {
            out.contexts.push_back(ref.context);
        }
    }
    if (out.mentions == 0) {
        return std::nullopt;
    }
    return out;
}

std::optional<NoteId> RetrievalEngine::findNoteByTitle(const std::string& title) const {
    if (title.empty()) {
        return std::nullopt;
    }
    const auto& notes = db_->notes;
    auto firstWhere = [&](auto&& pred) -> std::optional<NoteId> {
        auto it = std::find_if(notes.begin(), notes.end(), pred);
        if (it == notes.end()) {
            return std::nullopt;
        }
        return it->noteId;
    };

    if (auto hit = firstWhere([&](const auto& n) { return n.title == title; })) {
        return hit;
    }
    const auto lower = toLower(title);
    if (auto hit = firstWhere([&](const auto& n) { return toLower(n.title) == lower; })) {
        return hit;
    }
    const auto loose = looseTitle(title);
    if (auto hit = firstWhere([&](const auto& n) { return looseTitle(n.title) == loose; })) {
        return hit;
    }
    if (auto hit = firstWhere([&](const auto& n) {
            auto stem = std::filesystem::path(n.canonicalPath).stem().string();
            return looseTitle(stem) == loose;
        })) {
        return hit;
    }
    return firstWhere(
        [&](const auto& n) { return toLower(n.title).find(lower) != std::string::npos; });
}

std::vector<ReferenceDiagnostic>
RetrievalEngine::diagnostics(std::optional<ResolutionStatus> status) const {
    std::vector<ReferenceDiagnostic> out;
    for (const auto& note : db_->notes) {
        auto it = db_->graph.outbound.find(note.noteId);
        if (it == db_->graph.outbound.end()) {
            continue;
        }
        for (const auto& ref : it->second) {
            if (ref.isResolved() || (status && ref.status != *status)) {
                continue;
            }
            out.push_back(ReferenceDiagnostic{note.noteId, note.canonicalPath, ref});
        }
    }
    return out;
}

const vector::NoteSummary* RetrievalEngine::getNote(const NoteId& noteId) const {
    return db_->findNote(noteId);
}

const ImageRecord* RetrievalEngine::getImage(const ImageId& imageId) const {
    return db_->findImage(imageId);
}

std::optional<ImageId> RetrievalEngine::imageIdByPath(const NoteId& noteId,
                                                      const std::string& relativePath) const {
    return db_->imageIdByPath(noteId, relativePath);
}

} // namespace notegraph::search
