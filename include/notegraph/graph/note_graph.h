#pragma once

#include <notegraph/core/model.h>
#include <notegraph/core/types.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace notegraph::graph {

struct InboundEdge {
    NoteId sourceNoteId;
    ResolvedReference reference;
};

/**
 * Directed note/image relationship graph and its inverse.
 *
 * outbound holds every reference a note makes, in parse order, including broken and
 * ambiguous ones. Each outbound reference appears exactly once on the other side:
 * in inbound under its resolved target id, or in unresolved under its raw target.
 */
struct NoteGraph {
    std::map<NoteId, std::vector<ResolvedReference>> outbound;
    std::map<std::string, std::vector<InboundEdge>> inbound;
    std::map<std::string, std::vector<InboundEdge>> unresolved;
    std::map<std::string, std::vector<NoteId>> clusters; // folder -> sorted note ids

    // Fails with ValidationError when inbound + unresolved is not the transpose of outbound
    Result<void> verifyTranspose() const;

    bool hasNote(const NoteId& noteId) const { return outbound.count(noteId) > 0; }
    size_t edgeCount() const;

    // Traversal helpers. Results are deduplicated and keep first-occurrence order.
    std::vector<NoteId> linkedNotes(const NoteId& noteId) const;
    std::vector<ImageId> linkedImages(const NoteId& noteId) const;
    std::vector<NoteId> backlinks(const std::string& targetId) const;
    std::vector<NoteId> neighbours(const NoteId& noteId) const;

    // Notes reachable within maxDepth undirected hops, with their hop distance
    std::vector<std::pair<NoteId, size_t>> reachable(const NoteId& origin, size_t maxDepth) const;

    // Shortest undirected note path, endpoints included; empty when disconnected
    std::vector<NoteId> shortestPath(const NoteId& from, const NoteId& to) const;
};

/**
 * Everything one note contributes to the graph. Built on a worker, consumed by the
 * single-threaded merge.
 */
struct GraphDelta {
    NoteId noteId;
    std::string canonicalPath;
    std::string folderPath;
    std::vector<ResolvedReference> references;
};

GraphDelta makeDelta(const Note& note, std::vector<ResolvedReference> references);

class NoteGraphBuilder {
public:
    void add(GraphDelta delta);

    // Folds all collected deltas in canonical path order
    NoteGraph build();

    size_t pending() const { return deltas_.size(); }

private:
    static void insert(NoteGraph& graph, const NoteId& source, ResolvedReference ref);

    std::vector<GraphDelta> deltas_;
};

NoteGraph buildGraph(std::vector<GraphDelta> deltas);

} // namespace notegraph::graph
