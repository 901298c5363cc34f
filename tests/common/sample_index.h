// Small hand-built index shared by the vector database and retrieval tests
#pragma once
#include <notegraph/graph/note_graph.h>
#include <notegraph/identity/identity.h>
#include <notegraph/vector/vector_database.h>

#include <string>
#include <vector>

namespace notegraph::tests {

/**
 * Four notes:
 *   a.md      -> b.md, img/x.png          vector (1,0,0)
 *   b.md      -> c.md                     vector (1,0,0)
 *   c.md      -> "dup" (ambiguous)        vector (0,1,0)
 *   sub/d.md  -> "ghost" (broken)         embedding failed
 */
struct SampleIndex {
    NoteId a = identity::noteId("a.md");
    NoteId b = identity::noteId("b.md");
    NoteId c = identity::noteId("c.md");
    NoteId d = identity::noteId("sub/d.md");
    ImageId image = identity::imageId(identity::noteId("a.md"), "img/x.png");

    static ResolvedReference link(const NoteId& source, ReferenceKind kind, const std::string& raw,
                                  size_t position) {
        ResolvedReference r;
        r.reference.kind = kind;
        r.reference.pattern = kind == ReferenceKind::Wikilink ? "wikilink" : "embed";
        r.reference.rawTarget = raw;
        r.reference.sourceNoteId = source;
        r.reference.position = position;
        r.reference.length = raw.size() + 4;
        r.normalizedTarget = raw;
        r.context = "[[" + raw + "]]";
        r.strength = 0.3;
        return r;
    }

    ResolvedReference toNote(const NoteId& source, const std::string& raw, size_t position) const {
        auto r = link(source, ReferenceKind::Wikilink, raw, position);
        r.status = ResolutionStatus::Resolved;
        r.canonicalTarget = raw + ".md";
        r.targetNoteId = identity::noteId(r.canonicalTarget);
        return r;
    }

    static vector::NoteSummary summary(const NoteId& id, const std::string& path,
                                       const std::string& title, const std::string& folder) {
        vector::NoteSummary s;
        s.noteId = id;
        s.canonicalPath = path;
        s.title = title;
        s.folderPath = folder;
        s.contentLength = 42;
        s.chunkCount = 1;
        return s;
    }

    static vector::EmbeddingRecord record(const NoteId& id, std::vector<float> v,
                                          const std::string& text) {
        vector::EmbeddingRecord r;
        r.chunkId = identity::chunkId(id, 0);
        r.noteId = id;
        r.text = text;
        r.endOffset = text.size();
        if (v.empty()) {
            r.status = vector::EmbeddingStatus::Failed;
            r.error = "provider unavailable";
        } else {
            r.vector = std::move(v);
        }
        return r;
    }

    vector::VectorDatabase build() const {
        vector::VectorDatabase db;
        db.providerName = "mock";
        db.dimension = 3;

        db.notes = {summary(a, "a.md", "Alpha Note", ""), summary(b, "b.md", "beta_note", ""),
                    summary(c, "c.md", "Gamma", ""), summary(d, "sub/d.md", "Delta Plan", "sub")};

        db.records = {record(a, {1, 0, 0}, "alpha text"), record(b, {1, 0, 0}, "beta text"),
                      record(c, {0, 1, 0}, "gamma text"), record(d, {}, "delta text")};

        ImageRecord img;
        img.imageId = image;
        img.noteId = a;
        img.relativePath = "img/x.png";
        img.canonicalPath = "img/x.png";
        img.resolvedAbsolutePath = "/vault/img/x.png";
        img.mimeType = "image/png";
        img.contentHash = std::string(64, 'f');
        db.images = {img};

        auto toImage = link(a, ReferenceKind::ImageEmbed, "img/x.png", 20);
        toImage.status = ResolutionStatus::Resolved;
        toImage.canonicalTarget = "img/x.png";
        toImage.targetImageId = image;

        auto ambiguous = link(c, ReferenceKind::Wikilink, "dup", 0);
        ambiguous.status = ResolutionStatus::Ambiguous;
        ambiguous.candidates = {"x/dup.md", "y/dup.md"};

        auto broken = link(d, ReferenceKind::Wikilink, "ghost", 5);
        broken.status = ResolutionStatus::Broken;
        broken.searched = {"ghost", "ghost.md"};

        auto delta = [](const NoteId& id, const std::string& path, const std::string& folder,
                        std::vector<ResolvedReference> refs) {
            graph::GraphDelta g;
            g.noteId = id;
            g.canonicalPath = path;
            g.folderPath = folder;
            g.references = std::move(refs);
            return g;
        };
        db.graph = graph::buildGraph({
            delta(a, "a.md", "", {toNote(a, "b", 0), toImage}),
            delta(b, "b.md", "", {toNote(b, "c", 0)}),
            delta(c, "c.md", "", {ambiguous}),
            delta(d, "sub/d.md", "sub", {broken}),
        });

        db.summary.notesScanned = 4;
        db.summary.notesIndexed = 4;
        db.summary.referencesResolved = 3;
        db.summary.referencesAmbiguous = 1;
        db.summary.referencesBroken = 1;
        db.summary.chunksEmbedded = 3;
        db.summary.chunksFailed = 1;
        db.summary.imagesIndexed = 1;
        db.summary.addIssue(ingest::IssueKind::BrokenReference, "sub/d.md", "ghost");
        db.reindex();
        return db;
    }
};

} // namespace notegraph::tests
