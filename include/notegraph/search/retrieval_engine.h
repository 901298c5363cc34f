#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>
#include <notegraph/graph/note_graph.h>
#include <notegraph/vector/vector_database.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace notegraph::search {

enum class EdgeDirection { Outbound, Inbound };

const char* edgeDirectionToString(EdgeDirection direction);

/**
 * A note or image reached from a result's source note through the graph
 */
struct RelatedEntity {
    enum class Type { Note, Image };

    Type type = Type::Note;
    std::string id;
    std::string canonicalPath;
    std::string title; // Notes only
    size_t hops = 1;
    EdgeDirection direction = EdgeDirection::Outbound; // Of the edge that first reached it
};

struct Provenance {
    NoteId noteId;
    std::string canonicalPath;
    std::string title;
    std::vector<RelatedEntity> related;
};

struct RetrievalResult {
    const vector::EmbeddingRecord* chunk = nullptr; // Owned by the database
    double score = 0.0;
    Provenance provenance;
};

/**
 * How one note relates to one resolved target: the strongest weight among its
 * mentions and the distinct text around each mention, in parse order.
 */
struct RelationshipContext {
    NoteId sourceNoteId;
    std::string targetId;
    std::string targetPath;
    double strength = 0.0;
    size_t mentions = 0;
    std::vector<std::string> contexts;
};

struct ReferenceDiagnostic {
    NoteId sourceNoteId;
    std::string sourcePath;
    ResolvedReference reference;
};

/**
 * Read-only queries over a loaded VectorDatabase: K-nearest chunks with graph-expanded
 * provenance, plus link, cluster, path, title and diagnostic lookups.
 */
class RetrievalEngine {
public:
    explicit RetrievalEngine(std::shared_ptr<const vector::VectorDatabase> db);

    /**
     * Top-k chunks by cosine similarity. Ties keep record order. Failed records are never
     * returned. A query of the wrong dimension yields no results.
     */
    std::vector<RetrievalResult> query(const std::vector<float>& queryVector, size_t k,
                                       size_t expandHops = 1) const;

    std::vector<graph::InboundEdge> inboundLinks(const std::string& targetId) const;
    std::vector<ResolvedReference> outboundLinks(const NoteId& noteId) const;

    // Notes within maxDepth undirected note edges, nearest first
    std::vector<std::pair<NoteId, size_t>> relatedNotes(const NoteId& noteId,
                                                        size_t maxDepth = 2) const;

    // Other notes in the same folder
    std::vector<NoteId> noteCluster(const NoteId& noteId) const;

    std::vector<NoteId> findPath(const NoteId& from, const NoteId& to) const;

    // nullopt when `source` has no resolved reference to the note or image `targetId`
    std::optional<RelationshipContext> relationshipContext(const NoteId& source,
                                                           const std::string& targetId) const;

    // Exact, then case-insensitive, then space/underscore-insensitive title, then file
    // stem, then title substring. First match in canonical path order.
    std::optional<NoteId> findNoteByTitle(const std::string& title) const;

    // Broken and ambiguous references; nullopt returns both kinds
    std::vector<ReferenceDiagnostic>
    diagnostics(std::optional<ResolutionStatus> status = std::nullopt) const;

    const vector::NoteSummary* getNote(const NoteId& noteId) const;
    const ImageRecord* getImage(const ImageId& imageId) const;
    std::optional<ImageId> imageIdByPath(const NoteId& noteId,
                                         const std::string& relativePath) const;

    const vector::VectorDatabase& database() const { return *db_; }

private:
    Provenance buildProvenance(const NoteId& noteId, size_t expandHops) const;

    std::shared_ptr<const vector::VectorDatabase> db_;
};

} // namespace notegraph::search
