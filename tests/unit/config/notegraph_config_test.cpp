#include "../../common/test_helpers.h"

#include <gtest/gtest.h>
#include <notegraph/config/config_helpers.h>
#include <notegraph/config/notegraph_config.h>

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

using namespace notegraph;
using namespace notegraph::config;
using namespace std::chrono_literals;

namespace {

Result<NotegraphConfig> parseText(const std::string& text) {
    auto file = parse_config_text(text);
    if (!file) {
        return file.error();
    }
    return parseConfig(file.value());
}

} // namespace

TEST(ConfigHelpersTest, SectionsKeysAndComments) {
    auto file = parse_config_text(R"(
# top comment
[notes]
root = "~/vault"   # trailing comment
extensions = [".md", '.markdown']

[chunking]
chunk_size = 512
chunk_size = 640
)");
    ASSERT_TRUE(file) << file.error().message;
    const auto& f = file.value();
    EXPECT_TRUE(f.hasSection("notes"));
    EXPECT_FALSE(f.hasSection("output"));
    EXPECT_EQ(f.find("notes", "root"), "~/vault");
    EXPECT_EQ(f.find("chunking", "chunk_size"), "640"); // Last assignment wins
    EXPECT_FALSE(f.find("notes", "missing").has_value());
    EXPECT_EQ(parse_string_list(*f.find("notes", "extensions")),
              (std::vector<std::string>{".md", ".markdown"}));
}

TEST(ConfigHelpersTest, MultiLineArrays) {
    auto file = parse_config_text("[attachments]\n"
                                  "search_roots = [\n"
                                  "  \"{note_dir}\",  # beside the note\n"
                                  "  \"assets\",\n"
                                  "]\n");
    ASSERT_TRUE(file) << file.error().message;
    auto raw = file.value().entries("attachments").at(0).second;
    EXPECT_EQ(parse_string_list(raw), (std::vector<std::string>{"{note_dir}", "assets"}));
}

TEST(ConfigHelpersTest, MalformedDocuments) {
    EXPECT_FALSE(parse_config_text("[notes\nroot = x\n"));
    EXPECT_FALSE(parse_config_text("[notes]\njust a line\n"));
    EXPECT_FALSE(parse_config_text("[notes]\nexclude = [\"a\",\n"));
}

TEST(ConfigHelpersTest, ScalarParsing) {
    EXPECT_EQ(parse_size("1_000").value(), 1000u);
    EXPECT_EQ(parse_size("\"42\"").value(), 42u);
    EXPECT_FALSE(parse_size("-1"));
    EXPECT_FALSE(parse_size("12abc"));
    EXPECT_FALSE(parse_size(""));
    EXPECT_TRUE(parse_bool("true").value());
    EXPECT_FALSE(parse_bool("Off").value());
    EXPECT_FALSE(parse_bool("maybe"));
    EXPECT_EQ(unquote("'C:\\literal'"), "C:\\literal");
    EXPECT_EQ(unquote("\"a\\tb\""), "a\tb");
}

TEST(NotegraphConfigTest, EmptyFileGivesDefaults) {
    auto cfg = parseText("");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.providerName, "mock");
    EXPECT_EQ(c.provider.dimension, 384u);
    EXPECT_EQ(c.topK, 10u);
    EXPECT_EQ(c.expandHops, 1u);
    EXPECT_EQ(c.ingest.chunking.chunk_size, 1000u);
    EXPECT_EQ(c.ingest.chunking.overlap_size, 100u);
    EXPECT_EQ(c.ingest.embedding.batch_size, 16u);
    EXPECT_EQ(c.ingest.outputPath, std::filesystem::path("data/vector.json"));
    EXPECT_EQ(c.ingest.attachments.searchRoots.size(), 4u);
    EXPECT_EQ(c.ingest.patterns.size(), extraction::PatternTable::defaultPatterns().size());
}

TEST(NotegraphConfigTest, FullDocument) {
    auto cfg = parseText(R"(
[notes]
root = "/srv/vault"
exclude = [".obsidian/*", "templates/*"]

[attachments]
search_roots = ["{note_dir}", "media"]

[chunking]
strategy = "fixed"
chunk_size = 400
chunk_overlap = 40

[embedding]
provider = "mock"
dimension = 64
batch_size = 8
max_concurrency = 2
max_retries = 5
initial_backoff_ms = 50
max_backoff_ms = 800

[ingest]
max_workers = 3
fail_fast = true
context_chars = 60

[output]
path = "/tmp/out/vector.json"

[retrieval]
top_k = 5
expand_hops = 2

[logging]
level = "debug"

[unknown_section]
whatever = 1
)");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.ingest.notesRoot, std::filesystem::path("/srv/vault"));
    EXPECT_EQ(c.ingest.catalog.excludePatterns,
              (std::vector<std::string>{".obsidian/*", "templates/*"}));
    EXPECT_EQ(c.ingest.attachments.searchRoots,
              (std::vector<std::string>{"{note_dir}", "media"}));
    EXPECT_EQ(c.ingest.chunking.strategy, vector::ChunkingStrategy::FIXED_SIZE);
    EXPECT_EQ(c.ingest.chunking.chunk_size, 400u);
    EXPECT_EQ(c.ingest.chunking.overlap_size, 40u);
    EXPECT_EQ(c.provider.dimension, 64u);
    EXPECT_EQ(c.ingest.embedding.batch_size, 8u);
    EXPECT_EQ(c.ingest.embedding.max_concurrency, 2u);
    EXPECT_EQ(c.ingest.embedding.max_retries, 5u);
    EXPECT_EQ(c.ingest.embedding.initial_backoff, 50ms);
    EXPECT_EQ(c.ingest.embedding.max_backoff, 800ms);
    EXPECT_EQ(c.ingest.maxWorkers, 3u);
    EXPECT_TRUE(c.ingest.failFast);
    EXPECT_EQ(c.ingest.contextChars, 60u);
    EXPECT_EQ(c.ingest.outputPath, std::filesystem::path("/tmp/out/vector.json"));
    EXPECT_EQ(c.topK, 5u);
    EXPECT_EQ(c.expandHops, 2u);
    EXPECT_EQ(c.logLevel, "debug");
}

TEST(NotegraphConfigTest, PatternTableReplacement) {
    auto cfg = parseText(R"(
[patterns]
wikilink_pattern = '\[\[([^\]|]+)\]\]'
image.embed = '!\[\[([^\]]+\.png)\]\]'
)");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& patterns = cfg.value().ingest.patterns;
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0].kind, ReferenceKind::Wikilink);
    EXPECT_EQ(patterns[0].name, "wikilink");
    EXPECT_EQ(patterns[0].regex, "\\[\\[([^\\]|]+)\\]\\]");
    EXPECT_EQ(patterns[1].kind, ReferenceKind::ImageEmbed);
    EXPECT_EQ(patterns[1].name, "embed");
}

TEST(NotegraphConfigTest, InvalidValuesAreRejected) {
    auto badNumber = parseText("[chunking]\nchunk_size = lots\n");
    ASSERT_FALSE(badNumber);
    EXPECT_EQ(badNumber.error().code, ErrorCode::InvalidArgument);

    EXPECT_FALSE(parseText("[chunking]\nchunk_size = 0\n"));
    EXPECT_FALSE(parseText("[chunking]\nchunk_size = 100\nchunk_overlap = 100\n"));
    EXPECT_FALSE(parseText("[chunking]\nstrategy = \"semantic\"\n"));
    EXPECT_FALSE(parseText("[embedding]\nbatch_size = 0\n"));
    EXPECT_FALSE(parseText("[ingest]\nfail_fast = perhaps\n"));
    EXPECT_FALSE(parseText("[patterns]\nvideo = '(x)'\n"));
    EXPECT_FALSE(parseText("[patterns]\nwikilink = '[[('\n"));
}

TEST(NotegraphConfigTest, LoadFromDisk) {
    tests::TempDir dir;
    auto path = dir.write("config.toml", "[retrieval]\ntop_k = 3\n");
    auto cfg = loadConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().topK, 3u);

    auto viaOverride = loadDefaultConfig(path.string());
    ASSERT_TRUE(viaOverride);
    EXPECT_EQ(viaOverride.value().topK, 3u);

    auto missing = loadDefaultConfig((dir.path() / "absent.toml").string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}

TEST(NotegraphConfigTest, LogLevels) {
    EXPECT_TRUE(applyLogLevel("debug"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(applyLogLevel("WARNING"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_FALSE(applyLogLevel("loud"));
    EXPECT_TRUE(applyLogLevel("info"));
}
