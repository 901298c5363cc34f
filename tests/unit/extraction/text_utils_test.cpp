#include <gtest/gtest.h>
#include <notegraph/extraction/text_utils.h>

#include <string>

using namespace notegraph::extraction::util;

TEST(TextUtilsTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
    EXPECT_FALSE(isValidUtf8("\xC3"));             // Truncated
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));         // Overlong
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));     // Surrogate
    EXPECT_FALSE(isValidUtf8("\xFF\xFE binary"));
}

TEST(TextUtilsTest, SanitizeReplacesOnlyMalformedBytes) {
    EXPECT_EQ(sanitizeUtf8("caf\xC3\xA9.md"), "caf\xC3\xA9.md");
    EXPECT_EQ(sanitizeUtf8("caf\xE9.md"), "caf\xEF\xBF\xBD.md");
    EXPECT_EQ(sanitizeUtf8("\xFF\xFE"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(sanitizeUtf8("ok\xC3"), "ok\xEF\xBF\xBD");
    EXPECT_TRUE(isValidUtf8(sanitizeUtf8("\xC0\xAF \xED\xA0\x80")));
    EXPECT_EQ(sanitizeUtf8(""), "");
}

TEST(TextUtilsTest, CollapseWhitespace) {
    EXPECT_EQ(collapseWhitespace("  a \n\t b  c\n"), "a b c");
    EXPECT_EQ(collapseWhitespace(" \n "), "");
}

TEST(TextUtilsTest, TitleFromFirstHeading) {
    EXPECT_EQ(extractTitle("\n\n# Project Plan \nbody", "work/plan.md"), "Project Plan");
}

TEST(TextUtilsTest, TitleFallsBackToStem) {
    EXPECT_EQ(extractTitle("intro line\n# Later heading", "work/plan.md"), "plan");
    EXPECT_EQ(extractTitle("## Second level", "daily/2024-01-01.md"), "2024-01-01");
    EXPECT_EQ(extractTitle("", "empty.md"), "empty");
}

TEST(TextUtilsTest, ContextAroundMention) {
    std::string content = "alpha beta\n\n[[gamma]] delta epsilon";
    auto pos = content.find("[[gamma]]");
    EXPECT_EQ(contextAround(content, pos, 9, 6), "beta [[gamma]] delta");
    EXPECT_EQ(contextAround(content, pos, 9, 1000), "alpha beta [[gamma]] delta epsilon");
    EXPECT_EQ(contextAround(content, content.size() + 1, 1, 5), "");
}

TEST(TextUtilsTest, ContextNeverSplitsMultibyteCharacters) {
    std::string content = "\xC3\xA9\xC3\xA9[[x]]\xC3\xA9\xC3\xA9";
    auto pos = content.find("[[x]]");
    auto ctx = contextAround(content, pos, 5, 1);
    EXPECT_TRUE(isValidUtf8(ctx));
    EXPECT_EQ(ctx, "\xC3\xA9[[x]]\xC3\xA9");
}

TEST(TextUtilsTest, RelationshipStrengthCountsMentionsAndHeadings) {
    EXPECT_NEAR(relationshipStrength("See [[Plan]] and plan again.\n", "plan"), 0.6, 1e-9);
    EXPECT_NEAR(relationshipStrength("# The Plan\n\nbody [[plan]]\n", "plan"), 0.8, 1e-9);
    EXPECT_NEAR(relationshipStrength("#plan is a tag, not a heading\n", "plan"), 0.3, 1e-9);
    EXPECT_NEAR(relationshipStrength("####### plan\n", "plan"), 0.3, 1e-9);
    EXPECT_NEAR(relationshipStrength("x x x x", "x"), 1.0, 1e-9);
    EXPECT_NEAR(relationshipStrength("## x\n### x\n", "x"), 1.0, 1e-9);
    EXPECT_EQ(relationshipStrength("unrelated text", "plan"), 0.0);
    EXPECT_EQ(relationshipStrength("anything", ""), 0.0);
}

TEST(TextUtilsTest, MimeTypes) {
    EXPECT_EQ(mimeTypeForPath("img/a.PNG"), "image/png");
    EXPECT_EQ(mimeTypeForPath("draw.excalidraw"), "application/vnd.excalidraw+json");
    EXPECT_EQ(mimeTypeForPath("diagram.excalidraw.md"), "text/markdown");
    EXPECT_EQ(mimeTypeForPath("blob.xyz"), "application/octet-stream");
}
