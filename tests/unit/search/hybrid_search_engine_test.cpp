#include <gtest/gtest.h>
#include <sift/ingest/ingestion_pipeline.h>
#include <sift/metadata/path_utils.h>
#include <sift/search/hybrid_search_engine.h>

#include "../../common/test_helpers.h"

using namespace sift;
using namespace sift::search;

namespace {

constexpr size_t kDims = 256;

config::Settings searchSettings() {
    config::Settings s;
    s.chunking.strategy = "FixedSize";
    s.chunking.maxChunkSize = 100;
    s.chunking.overlap = 10;
    s.chunking.minChunkSize = 1;
    s.embedding.provider = "Fake";
    s.embedding.model = "fake-embed";
    s.embedding.dimensions = static_cast<int>(kDims);
    s.search.minimumScore = 0.0;
    s.search.topK = 5;
    s.search.reranker = "RRF";
    return s;
}

} // namespace

class HybridSearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<tests::TestDatabase>("sift_search_");
        ASSERT_TRUE(db_->initialized);
        settings_ = std::make_unique<config::SettingsProvider>(searchSettings());
        vectors_ = std::make_shared<vector::SqliteVectorIndex>(*db_->pool, kDims);
        keywords_ = std::make_shared<SqliteKeywordIndex>(*db_->pool);
        embedder_ = std::make_shared<tests::FakeEmbeddingProvider>(kDims);
        source_ = std::make_shared<tests::MemoryContentSource>();
        pipeline_ = std::make_unique<ingest::IngestionPipeline>(*db_->repository, *vectors_,
                                                                embedder_, source_, *settings_);
        engine_ = std::make_unique<HybridSearchEngine>(vectors_, keywords_, embedder_, *settings_,
                                                       RerankerRegistry::createDefault(nullptr));
    }

    void TearDown() override {
        engine_.reset();
        pipeline_.reset();
        keywords_.reset();
        vectors_.reset();
        db_.reset();
    }

    void ingest(const std::string& id, const std::string& path, const std::string& content,
                const std::string& scope = "scope-a") {
        source_->put(path, content);
        metadata::Document doc;
        doc.id = id;
        doc.scopeId = scope;
        doc.path = metadata::normalizeLogicalPath(path);
        doc.fileName = metadata::fileNameFromPath(doc.path);
        ASSERT_TRUE(db_->repository->upsert(doc));

        ingest::IngestionJob job;
        job.jobId = "job-" + id;
        job.documentId = id;
        job.path = doc.path;
        job.options.scopeId = scope;
        auto r = pipeline_->process(job);
        ASSERT_TRUE(r) << r.error().message;
    }

    void ingestCorpus() {
        ingest("revenue", "/reports/q3.txt",
               "Quarterly revenue growth exceeded expectations in every region.");
        ingest("menu", "/notes/menu.txt",
               "The cafeteria menu changes every Tuesday with new soups and salads.");
    }

    SearchOptions query(const std::string& text) {
        SearchOptions o;
        o.query = text;
        o.scopeId = "scope-a";
        return o;
    }

    std::unique_ptr<tests::TestDatabase> db_;
    std::unique_ptr<config::SettingsProvider> settings_;
    std::shared_ptr<vector::SqliteVectorIndex> vectors_;
    std::shared_ptr<SqliteKeywordIndex> keywords_;
    std::shared_ptr<tests::FakeEmbeddingProvider> embedder_;
    std::shared_ptr<tests::MemoryContentSource> source_;
    std::unique_ptr<ingest::IngestionPipeline> pipeline_;
    std::unique_ptr<HybridSearchEngine> engine_;
};

TEST_F(HybridSearchEngineTest, HybridQueryFusesBothBranches) {
    ingestCorpus();

    auto r = engine_->search(query("revenue growth"));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_FALSE(r.value().hits.empty());
    const auto& top = r.value().hits.front();
    EXPECT_EQ(top.documentId, "revenue");
    EXPECT_DOUBLE_EQ(top.score, 1.0);
    EXPECT_EQ(top.metadata.at(hit_keys::kReranker), "RRF");
    EXPECT_EQ(top.metadata.at(hit_keys::kPath), "/reports/q3.txt");
    EXPECT_LE(r.value().hits.size(), 5u);
    EXPECT_GE(r.value().totalCount, r.value().hits.size());
}

TEST_F(HybridSearchEngineTest, SingleDocumentGetsKeywordContribution) {
    ingest("only", "/reports/q3.txt", "quarterly revenue growth");

    auto r = engine_->search(query("revenue growth"));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().hits.size(), 1u);
    const auto& top = r.value().hits.front();
    EXPECT_EQ(top.documentId, "only");
    EXPECT_EQ(top.metadata.at(hit_keys::kReranker), "RRF");
    // Rank 1 in both branches; a single branch alone would give 1/61
    EXPECT_EQ(top.metadata.at(hit_keys::kRrfScore), fmt::format("{:.6f}", 2.0 / 61.0));
    EXPECT_GT(std::stod(top.metadata.at(hit_keys::kRrfScore)), 1.0 / 61.0);
    EXPECT_DOUBLE_EQ(top.score, 1.0);
}

TEST_F(HybridSearchEngineTest, KeywordModeReportsRawRank) {
    ingestCorpus();

    auto o = query("revenue growth");
    o.mode = config::SearchMode::Keyword;
    auto r = engine_->search(o);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().hits.size(), 1u);
    const auto& hit = r.value().hits.front();
    EXPECT_EQ(hit.documentId, "revenue");
    EXPECT_EQ(hit.metadata.at(hit_keys::kSource), hit_sources::kKeyword);
    EXPECT_TRUE(hit.metadata.count(hit_keys::kRawRank));
    EXPECT_DOUBLE_EQ(hit.score, 1.0);
}

TEST_F(HybridSearchEngineTest, SemanticModeRanksClosestFirst) {
    ingestCorpus();

    auto o = query("quarterly revenue growth exceeded expectations");
    o.mode = config::SearchMode::Semantic;
    auto r = engine_->search(o);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().hits.size(), 2u);
    EXPECT_EQ(r.value().hits[0].documentId, "revenue");
    EXPECT_GT(r.value().hits[0].score, r.value().hits[1].score);
    EXPECT_EQ(r.value().hits[0].metadata.at(hit_keys::kSource), hit_sources::kVector);
}

TEST_F(HybridSearchEngineTest, DeletedDocumentIsNotFound) {
    ingestCorpus();
    auto deleted = db_->repository->deleteById("revenue");
    ASSERT_TRUE(deleted);
    ASSERT_TRUE(deleted.value());

    auto r = engine_->search(query("revenue growth"));
    ASSERT_TRUE(r);
    for (const auto& hit : r.value().hits) {
        EXPECT_NE(hit.documentId, "revenue");
    }
}

TEST_F(HybridSearchEngineTest, ScopeAndPathPrefixFilter) {
    ingestCorpus();
    ingest("other", "/reports/q4.txt", "Revenue growth slowed in the fourth quarter.",
           "scope-b");

    auto scoped = engine_->search(query("revenue growth"));
    ASSERT_TRUE(scoped);
    for (const auto& hit : scoped.value().hits) {
        EXPECT_NE(hit.documentId, "other");
    }

    auto o = query("revenue growth");
    o.pathPrefix = "/notes";
    auto prefixed = engine_->search(o);
    ASSERT_TRUE(prefixed);
    for (const auto& hit : prefixed.value().hits) {
        EXPECT_EQ(hit.documentId, "menu");
    }
}

TEST_F(HybridSearchEngineTest, BlankQueryReturnsEmpty) {
    ingestCorpus();
    auto r = engine_->search(query("   "));
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().hits.empty());
    EXPECT_EQ(r.value().totalCount, 0u);
}

TEST_F(HybridSearchEngineTest, MissingScopeIsRejected) {
    SearchOptions o;
    o.query = "revenue";
    auto r = engine_->search(o);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(HybridSearchEngineTest, FailingVectorBranchKeepsKeywordHits) {
    ingestCorpus();
    embedder_->failAll = true;

    auto r = engine_->search(query("revenue growth"));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().hits.size(), 1u);
    EXPECT_EQ(r.value().hits.front().documentId, "revenue");
    EXPECT_EQ(r.value().hits.front().metadata.at(hit_keys::kSource), hit_sources::kKeyword);

    auto o = query("revenue growth");
    o.mode = config::SearchMode::Semantic;
    auto semantic = engine_->search(o);
    ASSERT_FALSE(semantic);
    EXPECT_EQ(semantic.error().code, ErrorCode::NetworkError);
}

TEST_F(HybridSearchEngineTest, TopKAndMinScoreAreApplied) {
    ingestCorpus();
    ingest("revenue2", "/reports/q2.txt", "Revenue growth was modest in the second quarter.");

    auto o = query("revenue growth");
    o.topK = 1;
    auto r = engine_->search(o);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().hits.size(), 1u);
    EXPECT_GE(r.value().totalCount, 2u);

    auto strict = query("revenue growth");
    strict.minScore = 1.01;
    auto none = engine_->search(strict);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().hits.empty());
}

TEST_F(HybridSearchEngineTest, UnknownOrDisabledRerankerKeepsHits) {
    ingestCorpus();

    auto o = query("revenue growth");
    o.reranker = "Bogus";
    auto unknown = engine_->search(o);
    ASSERT_TRUE(unknown);
    ASSERT_FALSE(unknown.value().hits.empty());
    EXPECT_EQ(unknown.value().hits.front().metadata.count(hit_keys::kReranker), 0u);

    o.reranker = "None";
    auto none = engine_->search(o);
    ASSERT_TRUE(none);
    EXPECT_FALSE(none.value().hits.empty());
}

TEST_F(HybridSearchEngineTest, StopRequestCancelsSearch) {
    ingestCorpus();
    std::stop_source stop;
    stop.request_stop();
    auto r = engine_->search(query("revenue growth"), stop.get_token());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST(HybridSearchScores, NormalizeScores) {
    auto n = HybridSearchEngine::normalizeScores({2.0, 4.0, 3.0});
    ASSERT_EQ(n.size(), 3u);
    EXPECT_DOUBLE_EQ(n[0], 0.0);
    EXPECT_DOUBLE_EQ(n[1], 1.0);
    EXPECT_DOUBLE_EQ(n[2], 0.5);

    auto same = HybridSearchEngine::normalizeScores({7.0, 7.0});
    EXPECT_DOUBLE_EQ(same[0], 1.0);
    EXPECT_DOUBLE_EQ(same[1], 1.0);
    EXPECT_TRUE(HybridSearchEngine::normalizeScores({}).empty());
}
