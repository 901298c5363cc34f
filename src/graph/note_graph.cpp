#include <notegraph/graph/note_graph.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace notegraph::graph {

namespace {

// (bucket, key, source, position, kind)
using EdgeKey = std::tuple<int, std::string, NoteId, size_t, int>;

EdgeKey edgeKey(bool resolved, const std::string& key, const NoteId& source,
                const ResolvedReference& ref) {
    return {resolved ? 0 : 1, key, source, ref.reference.position,
            static_cast<int>(ref.reference.kind)};
}

void appendUnique(std::vector<std::string>& out, std::unordered_set<std::string>& seen,
                  const std::string& id) {
    if (seen.insert(id).second) {
        out.push_back(id);
    }
}

} // namespace

size_t NoteGraph::edgeCount() const {
    size_t n = 0;
    for (const auto& [_, refs] : outbound) {
        n += refs.size();
    }
    return n;
}

Result<void> NoteGraph::verifyTranspose() const {
    std::map<EdgeKey, long> balance;
    for (const auto& [source, refs] : outbound) {
        for (const auto& ref : refs) {
            ++balance[edgeKey(ref.isResolved(), ref.targetKey(), source, ref)];
        }
    }
    for (const auto& [key, edges] : inbound) {
        for (const auto& e : edges) {
            --balance[edgeKey(true, key, e.sourceNoteId, e.reference)];
        }
    }
    for (const auto& [key, edges] : unresolved) {
        for (const auto& e : edges) {
            --balance[edgeKey(false, key, e.sourceNoteId, e.reference)];
        }
    }

    for (const auto& [key, count] : balance) {
        if (count != 0) {
            const auto& [bucket, target, source, position, kind] = key;
            return Error{ErrorCode::ValidationError,
                         fmt::format("{} edge {} -> {} at offset {} has {} {} inverse entries",
                                     bucket == 0 ? "Resolved" : "Unresolved", source, target,
                                     position, count > 0 ? "missing" : "extra",
                                     count > 0 ? count : -count)};
        }
    }
    return Result<void>();
}

std::vector<NoteId> NoteGraph::linkedNotes(const NoteId& noteId) const {
    std::vector<NoteId> out;
    std::unordered_set<std::string> seen;
    if (auto it = outbound.find(noteId); it != outbound.end()) {
        for (const auto& ref : it->second) {
            if (ref.isResolved() && ref.targetNoteId) {
                appendUnique(out, seen, *ref.targetNoteId);
            }
        }
    }
    return out;
}

std::vector<ImageId> NoteGraph::linkedImages(const NoteId& noteId) const {
    std::vector<ImageId> out;
    std::unordered_set<std::string> seen;
    if (auto it = outbound.find(noteId); it != outbound.end()) {
        for (const auto& ref : it->second) {
            if (ref.isResolved() && ref.targetImageId) {
                appendUnique(out, seen, *ref.targetImageId);
            }
        }
    }
    return out;
}

std::vector<NoteId> NoteGraph::backlinks(const std::string& targetId) const {
    std::vector<NoteId> out;
    std::unordered_set<std::string> seen;
    if (auto it = inbound.find(targetId); it != inbound.end()) {
        for (const auto& e : it->second) {
            appendUnique(out, seen, e.sourceNoteId);
        }
    }
    return out;
}

std::vector<NoteId> NoteGraph::neighbours(const NoteId& noteId) const {
    std::vector<NoteId> out;
    std::unordered_set<std::string> seen;
    for (const auto& id : linkedNotes(noteId)) {
        appendUnique(out, seen, id);
    }
    for (const auto& id : backlinks(noteId)) {
        appendUnique(out, seen, id);
    }
    return out;
}

std::vector<std::pair<NoteId, size_t>> NoteGraph::reachable(const NoteId& origin,
                                                            size_t maxDepth) const {
    std::vector<std::pair<NoteId, size_t>> out;
    if (!hasNote(origin)) {
        return out;
    }
    std::unordered_set<std::string> visited{origin};
    std::deque<std::pair<NoteId, size_t>> queue{{origin, 0}};
    while (!queue.empty()) {
        auto [current, depth] = queue.front();
        queue.pop_front();
        if (depth >= maxDepth) {
            continue;
        }
        for (const auto& next : neighbours(current)) {
            if (visited.insert(next).second) {
                out.emplace_back(next, depth + 1);
                queue.emplace_back(next, depth + 1);
            }
        }
    }
    return out;
}

std::vector<NoteId> NoteGraph::shortestPath(const NoteId& from, const NoteId& to) const {
    if (!hasNote(from) || !hasNote(to)) {
        return {};
    }
    if (from == to) {
        return {from};
    }
    std::unordered_map<std::string, std::string> parent{{from, from}};
    std::deque<NoteId> queue{from};
    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        for (const auto& next : neighbours(current)) {
            if (!parent.emplace(next, current).second) {
                continue;
            }
            if (next == to) {
                std::vector<NoteId> path{to};
                for (auto at = current; at != from; at = parent[at]) {
                    path.push_back(at);
                }
                path.push_back(from);
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push_back(next);
        }
    }
    return {};
}

GraphDelta makeDelta(const Note& note, std::vector<ResolvedReference> references) {
    GraphDelta delta;
    delta.noteId = note.noteId;
    delta.canonicalPath = note.canonicalPath;
    delta.folderPath = note.folderPath;
    delta.references = std::move(references);
    return delta;
}

void NoteGraphBuilder::add(GraphDelta delta) {
    deltas_.push_back(std::move(delta));
}

void NoteGraphBuilder::insert(NoteGraph& graph, const NoteId& source, ResolvedReference ref) {
    // Forward and inverse edge are written together so the transpose never drifts
    InboundEdge inverse{source, ref};
    if (ref.isResolved()) {
        graph.inbound[ref.targetKey()].push_back(std::move(inverse));
    } else {
        graph.unresolved[ref.reference.rawTarget].push_back(std::move(inverse));
    }
    graph.outbound[source].push_back(std::move(ref));
}

NoteGraph NoteGraphBuilder::build() {
    std::stable_sort(deltas_.begin(), deltas_.end(), [](const GraphDelta& a, const GraphDelta& b) {
        return a.canonicalPath < b.canonicalPath;
    });

    NoteGraph graph;
    for (auto& delta : deltas_) {
        auto [slot, fresh] = graph.outbound.try_emplace(delta.noteId);
        if (!fresh) {
            spdlog::warn("Duplicate graph delta for {} ignored", delta.canonicalPath);
            continue;
        }
        graph.clusters[delta.folderPath].push_back(delta.noteId);
        for (auto& ref : delta.references) {
            insert(graph, delta.noteId, std::move(ref));
        }
    }
    for (auto& [_, members] : graph.clusters) {
        std::sort(members.begin(), members.end());
    }

    spdlog::debug("Note graph: {} notes, {} edges, {} inbound targets, {} unresolved targets",
                  graph.outbound.size(), graph.edgeCount(), graph.inbound.size(),
                  graph.unresolved.size());
    deltas_.clear();
    return graph;
}

NoteGraph buildGraph(std::vector<GraphDelta> deltas) {
    NoteGraphBuilder builder;
    for (auto& d : deltas) {
        builder.add(std::move(d));
    }
    return builder.build();
}

} // namespace notegraph::graph
