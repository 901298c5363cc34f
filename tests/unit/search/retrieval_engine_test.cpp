#include "../../common/sample_index.h"

#include <gtest/gtest.h>
#include <notegraph/search/retrieval_engine.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace notegraph;
using namespace notegraph::search;

class RetrievalEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<RetrievalEngine>(
            std::make_shared<const vector::VectorDatabase>(sample_.build()));
    }

    static std::vector<std::string> relatedIds(const RetrievalResult& r) {
        std::vector<std::string> ids;
        for (const auto& e : r.provenance.related) {
            ids.push_back(e.id);
        }
        return ids;
    }

    tests::SampleIndex sample_;
    std::unique_ptr<RetrievalEngine> engine_;
};

TEST_F(RetrievalEngineTest, TiesKeepRecordOrder) {
    auto results = engine_->query({1, 0, 0}, 2, 0);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].chunk->noteId, sample_.a);
    EXPECT_EQ(results[1].chunk->noteId, sample_.b);
    EXPECT_NEAR(results[0].score, 1.0, 1e-9);
    EXPECT_NEAR(results[1].score, 1.0, 1e-9);
    EXPECT_TRUE(results[0].provenance.related.empty());
}

TEST_F(RetrievalEngineTest, FailedRecordsAreNeverReturned) {
    auto results = engine_->query({0, 0, 1}, 10, 0);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) {
        EXPECT_NE(r.chunk->noteId, sample_.d);
        EXPECT_EQ(r.chunk->status, vector::EmbeddingStatus::Embedded);
    }
}

TEST_F(RetrievalEngineTest, ResultsAreOrderedByScore) {
    auto results = engine_->query({0, 1, 0}, 3, 0);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].chunk->noteId, sample_.c);
    EXPECT_GE(results[0].score, results[1].score);
    EXPECT_GE(results[1].score, results[2].score);
    EXPECT_EQ(results[0].provenance.canonicalPath, "c.md");
    EXPECT_EQ(results[0].provenance.title, "Gamma");
}

TEST_F(RetrievalEngineTest, DimensionMismatchYieldsNothing) {
    EXPECT_TRUE(engine_->query({1, 0}, 5).empty());
    EXPECT_TRUE(engine_->query({}, 5).empty());
    EXPECT_TRUE(engine_->query({1, 0, 0}, 0).empty());
}

TEST_F(RetrievalEngineTest, OneHopProvenance) {
    auto results = engine_->query({1, 0, 0}, 2, 1);
    ASSERT_EQ(results.size(), 2u);

    const auto& fromA = results[0].provenance;
    ASSERT_EQ(fromA.related.size(), 2u);
    EXPECT_EQ(fromA.related[0].id, sample_.b);
    EXPECT_EQ(fromA.related[0].type, RelatedEntity::Type::Note);
    EXPECT_EQ(fromA.related[0].direction, EdgeDirection::Outbound);
    EXPECT_EQ(fromA.related[0].hops, 1u);
    EXPECT_EQ(fromA.related[0].title, "beta_note");
    EXPECT_EQ(fromA.related[1].id, sample_.image);
    EXPECT_EQ(fromA.related[1].type, RelatedEntity::Type::Image);
    EXPECT_EQ(fromA.related[1].canonicalPath, "img/x.png");

    const auto& fromB = results[1].provenance;
    ASSERT_EQ(fromB.related.size(), 2u);
    EXPECT_EQ(fromB.related[0].id, sample_.c);
    EXPECT_EQ(fromB.related[0].direction, EdgeDirection::Outbound);
    EXPECT_EQ(fromB.related[1].id, sample_.a);
    EXPECT_EQ(fromB.related[1].direction, EdgeDirection::Inbound);
}

TEST_F(RetrievalEngineTest, TwoHopProvenanceExcludesOriginAndDeduplicates) {
    auto results = engine_->query({1, 0, 0}, 1, 2);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(relatedIds(results[0]),
              (std::vector<std::string>{sample_.b, sample_.image, sample_.c}));
    EXPECT_EQ(results[0].provenance.related[2].hops, 2u);

    auto fromC = engine_->query({0, 1, 0}, 1, 2);
    ASSERT_EQ(fromC.size(), 1u);
    ASSERT_EQ(fromC[0].chunk->noteId, sample_.c);
    EXPECT_EQ(relatedIds(fromC[0]), (std::vector<std::string>{sample_.b, sample_.a}));
    EXPECT_EQ(fromC[0].provenance.related[0].direction, EdgeDirection::Inbound);
    EXPECT_EQ(fromC[0].provenance.related[1].hops, 2u);
}

TEST_F(RetrievalEngineTest, UnresolvedReferencesAreNotTraversed) {
    auto results = engine_->query({0, 1, 0}, 1, 1);
    ASSERT_EQ(results.size(), 1u);
    for (const auto& e : results[0].provenance.related) {
        EXPECT_NE(e.id, "dup");
    }
    EXPECT_EQ(results[0].provenance.related.size(), 1u);
}

TEST_F(RetrievalEngineTest, LinkQueries) {
    auto inbound = engine_->inboundLinks(sample_.b);
    ASSERT_EQ(inbound.size(), 1u);
    EXPECT_EQ(inbound[0].sourceNoteId, sample_.a);
    EXPECT_EQ(engine_->inboundLinks(sample_.image).size(), 1u);
    EXPECT_TRUE(engine_->inboundLinks(sample_.a).empty());

    auto outbound = engine_->outboundLinks(sample_.a);
    ASSERT_EQ(outbound.size(), 2u);
    EXPECT_EQ(outbound[0].targetNoteId, sample_.b);
    EXPECT_EQ(outbound[1].targetImageId, sample_.image);
    EXPECT_TRUE(engine_->outboundLinks("unknown").empty());
}

TEST_F(RetrievalEngineTest, RelationshipContextAggregatesMentions) {
    auto first = tests::SampleIndex::link(sample_.a, ReferenceKind::Wikilink, "b", 0);
    first.status = ResolutionStatus::Resolved;
    first.canonicalTarget = "b.md";
    first.targetNoteId = sample_.b;
    first.strength = 0.3;
    first.context = "intro [[b]]";
    auto second = first;
    second.reference.position = 40;
    second.strength = 0.8;
    second.context = "# About [[b]]";
    auto repeat = first;
    repeat.reference.position = 90;
    auto toOther = sample_.toNote(sample_.a, "c", 60);

    graph::GraphDelta delta;
    delta.noteId = sample_.a;
    delta.canonicalPath = "a.md";
    delta.references = {first, second, toOther, repeat};
    auto db = std::make_shared<vector::VectorDatabase>();
    db->notes = {tests::SampleIndex::summary(sample_.a, "a.md", "Alpha Note", ""),
                 tests::SampleIndex::summary(sample_.b, "b.md", "beta_note", "")};
    db->graph = graph::buildGraph({delta});
    db->reindex();
    RetrievalEngine engine(db);

    auto rel = engine.relationshipContext(sample_.a, sample_.b);
    ASSERT_TRUE(rel.has_value());
    EXPECT_EQ(rel->sourceNoteId, sample_.a);
    EXPECT_EQ(rel->targetPath, "b.md");
    EXPECT_EQ(rel->mentions, 3u);
    EXPECT_DOUBLE_EQ(rel->strength, 0.8);
    EXPECT_EQ(rel->contexts, (std::vector<std::string>{"intro [[b]]", "# About [[b]]"}));

    EXPECT_FALSE(engine.relationshipContext(sample_.b, sample_.a).has_value());
    EXPECT_FALSE(engine.relationshipContext(sample_.a, "unknown").has_value());
}

TEST_F(RetrievalEngineTest, RelationshipContextForImagesAndUnresolvedTargets) {
    auto image = engine_->relationshipContext(sample_.a, sample_.image);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->targetPath, "img/x.png");
    EXPECT_EQ(image->mentions, 1u);
    EXPECT_DOUBLE_EQ(image->strength, 0.3);

    // Broken and ambiguous references are keyed by raw target but never relationships
    EXPECT_FALSE(engine_->relationshipContext(sample_.d, "ghost").has_value());
    EXPECT_FALSE(engine_->relationshipContext(sample_.c, "dup").has_value());
}

TEST(EdgeDirectionTest, Names) {
    EXPECT_STREQ(edgeDirectionToString(EdgeDirection::Outbound), "outbound");
    EXPECT_STREQ(edgeDirectionToString(EdgeDirection::Inbound), "inbound");
}

TEST_F(RetrievalEngineTest, RelatedNotesAndPaths) {
    auto related = engine_->relatedNotes(sample_.a, 2);
    EXPECT_EQ(related, (std::vector<std::pair<NoteId, size_t>>{{sample_.b, 1}, {sample_.c, 2}}));

    EXPECT_EQ(engine_->findPath(sample_.a, sample_.c),
              (std::vector<NoteId>{sample_.a, sample_.b, sample_.c}));
    EXPECT_TRUE(engine_->findPath(sample_.a, sample_.d).empty());
}

TEST_F(RetrievalEngineTest, ClusterIsSameFolderWithoutSelf) {
    std::vector<NoteId> expected{sample_.b, sample_.c};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(engine_->noteCluster(sample_.a), expected);
    EXPECT_TRUE(engine_->noteCluster(sample_.d).empty());
    EXPECT_TRUE(engine_->noteCluster("unknown").empty());
}

TEST_F(RetrievalEngineTest, FindNoteByTitle) {
    EXPECT_EQ(engine_->findNoteByTitle("Alpha Note"), sample_.a);
    EXPECT_EQ(engine_->findNoteByTitle("gamma"), sample_.c);
    EXPECT_EQ(engine_->findNoteByTitle("Beta Note"), sample_.b);
    EXPECT_EQ(engine_->findNoteByTitle("d"), sample_.d);
    EXPECT_EQ(engine_->findNoteByTitle("plan"), sample_.d);
    EXPECT_FALSE(engine_->findNoteByTitle("zzz").has_value());
    EXPECT_FALSE(engine_->findNoteByTitle("").has_value());
}

TEST_F(RetrievalEngineTest, Diagnostics) {
    auto all = engine_->diagnostics();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].sourcePath, "c.md");
    EXPECT_EQ(all[0].reference.status, ResolutionStatus::Ambiguous);
    EXPECT_EQ(all[1].sourcePath, "sub/d.md");

    auto broken = engine_->diagnostics(ResolutionStatus::Broken);
    ASSERT_EQ(broken.size(), 1u);
    EXPECT_EQ(broken[0].sourceNoteId, sample_.d);
    EXPECT_EQ(broken[0].reference.reference.rawTarget, "ghost");

    auto ambiguous = engine_->diagnostics(ResolutionStatus::Ambiguous);
    ASSERT_EQ(ambiguous.size(), 1u);
    EXPECT_EQ(ambiguous[0].reference.candidates.size(), 2u);
}

TEST_F(RetrievalEngineTest, EntityLookups) {
    ASSERT_NE(engine_->getNote(sample_.c), nullptr);
    EXPECT_EQ(engine_->getNote(sample_.c)->canonicalPath, "c.md");
    ASSERT_NE(engine_->getImage(sample_.image), nullptr);
    EXPECT_EQ(engine_->getImage(sample_.image)->mimeType, "image/png");
    EXPECT_EQ(engine_->imageIdByPath(sample_.a, "img/x.png"), sample_.image);
    EXPECT_EQ(engine_->getNote("missing"), nullptr);
}

TEST(RetrievalEngineEmptyTest, NullDatabaseBehavesAsEmpty) {
    RetrievalEngine engine(nullptr);
    EXPECT_TRUE(engine.query({1, 0}, 3).empty());
    EXPECT_TRUE(engine.diagnostics().empty());
    EXPECT_FALSE(engine.findNoteByTitle("x").has_value());
}
