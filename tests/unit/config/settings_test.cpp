#include <filesystem>
#include <gtest/gtest.h>
#include <sift/config/config_helpers.h>
#include <sift/config/settings.h>

#include "../../common/test_helpers.h"

using namespace sift;
using namespace sift::config;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = tests::make_temp_dir("sift_settings_"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(SettingsTest, DefaultsMatchDocumentedValues) {
    Settings s;
    EXPECT_EQ(s.chunking.strategy, "Semantic");
    EXPECT_EQ(s.chunking.maxChunkSize, 512);
    EXPECT_EQ(s.chunking.overlap, 50);
    EXPECT_EQ(s.chunking.minChunkSize, 100);
    EXPECT_DOUBLE_EQ(s.chunking.semanticThreshold, 0.5);
    EXPECT_EQ(s.embedding.provider, "Ollama");
    EXPECT_EQ(s.embedding.dimensions, 768);
    EXPECT_EQ(s.embedding.batchSize, 32);
    EXPECT_EQ(s.search.mode, SearchMode::Hybrid);
    EXPECT_EQ(s.search.topK, 10);
    EXPECT_EQ(s.search.reranker, "RRF");
    EXPECT_EQ(s.search.rrfK, 60);
    EXPECT_DOUBLE_EQ(s.search.minimumScore, 0.5);
    EXPECT_EQ(s.ingestion.parallelWorkers, 4);
    EXPECT_EQ(s.ingestion.queueCapacity, 1000u);
    EXPECT_EQ(s.ingestion.maxFileSizeMb, 100);
}

TEST_F(SettingsTest, FileOverridesPerKey) {
    auto path = tests::write_file(dir_ / "config.toml", R"(# sift settings
[chunking]
strategy = "FixedSize"
max_chunk_size = 256

[search]
mode = keyword
reranker = "None"

[ingestion]
allowed_extensions = [".txt", ".md"]
)");

    auto loaded = loadSettings(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    const auto& s = loaded.value();
    EXPECT_EQ(s.chunking.strategy, "FixedSize");
    EXPECT_EQ(s.chunking.maxChunkSize, 256);
    EXPECT_EQ(s.chunking.overlap, 50);
    EXPECT_EQ(s.search.mode, SearchMode::Keyword);
    EXPECT_EQ(s.search.reranker, "None");
    ASSERT_EQ(s.ingestion.allowedExtensions.size(), 2u);
    EXPECT_EQ(s.ingestion.allowedExtensions[1], ".md");
}

TEST_F(SettingsTest, MalformedNumberKeepsDefault) {
    auto path = tests::write_file(dir_ / "config.toml", "[chunking]\n"
                                                        "max_chunk_size = lots\n"
                                                        "overlap = 12\n"
                                                        "[search]\n"
                                                        "minimum_score = 0.3x\n");
    auto loaded = loadSettings(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().chunking.maxChunkSize, 512);
    EXPECT_EQ(loaded.value().chunking.overlap, 12);
    EXPECT_DOUBLE_EQ(loaded.value().search.minimumScore, 0.5);
}

TEST_F(SettingsTest, MissingFileIsNotFound) {
    auto loaded = loadSettings(dir_ / "absent.toml");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);
}

TEST_F(SettingsTest, SnapshotIsUnaffectedByLaterUpdate) {
    SettingsProvider provider;
    auto before = provider.snapshot();

    Settings next;
    next.chunking.maxChunkSize = 64;
    provider.update(next);

    EXPECT_EQ(before->chunking.maxChunkSize, 512);
    EXPECT_EQ(provider.snapshot()->chunking.maxChunkSize, 64);
}

TEST_F(SettingsTest, ReloadFailureKeepsCurrentSettings) {
    Settings initial;
    initial.search.topK = 3;
    SettingsProvider provider(initial);

    auto r = provider.reload(dir_ / "absent.toml");
    EXPECT_FALSE(r);
    EXPECT_EQ(provider.snapshot()->search.topK, 3);
}

TEST(SearchModeTest, ParsesCaseInsensitively) {
    auto mode = parseSearchMode("SEMANTIC");
    ASSERT_TRUE(mode);
    EXPECT_EQ(mode.value(), SearchMode::Semantic);
    EXPECT_STREQ(searchModeToString(SearchMode::Hybrid), "Hybrid");
    EXPECT_FALSE(parseSearchMode("fuzzy"));
}

TEST(ConfigHelpersTest, StringListHandlesQuotesAndCommas) {
    auto list = parse_string_list(R"(["a, b", 'c', d])");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "a, b");
    EXPECT_EQ(list[1], "c");
    EXPECT_EQ(list[2], "d");
}

TEST(ConfigHelpersTest, SanitizeStripsControlCharacters) {
    auto cleaned = sanitize_for_terminal("name\x1b[31m\n.txt");
    EXPECT_EQ(cleaned.find('\x1b'), std::string::npos);
    EXPECT_EQ(cleaned.find('\n'), std::string::npos);
}
