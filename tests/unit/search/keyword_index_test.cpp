#include <gtest/gtest.h>
#include <sift/metadata/document_repository.h>
#include <sift/search/keyword_index.h>

#include "../../common/test_helpers.h"

using namespace sift;
using namespace sift::search;

class KeywordIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<tests::TestDatabase>("sift_fts_");
        ASSERT_TRUE(db_->initialized);
        index_ = std::make_unique<SqliteKeywordIndex>(*db_->pool);
    }

    void TearDown() override {
        index_.reset();
        db_.reset();
    }

    void seed(const std::string& docId, const std::string& scope, const std::string& path,
              const std::vector<std::string>& texts) {
        metadata::Document doc;
        doc.id = docId;
        doc.scopeId = scope;
        doc.path = path;
        ASSERT_TRUE(db_->repository->insert(doc));

        std::vector<metadata::ChunkRecord> chunks;
        for (size_t i = 0; i < texts.size(); ++i) {
            metadata::ChunkRecord c;
            c.id = docId + "#" + std::to_string(i);
            c.documentId = docId;
            c.scopeId = scope;
            c.path = path;
            c.content = texts[i];
            c.chunkIndex = static_cast<int>(i);
            chunks.push_back(std::move(c));
        }
        ASSERT_TRUE(db_->pool->withConnection([&](metadata::Database& db) {
            return metadata::DocumentRepository::insertChunks(db, chunks);
        }));
    }

    vector::SearchFilter scope(const std::string& id) {
        vector::SearchFilter f;
        f.scopeId = id;
        return f;
    }

    std::unique_ptr<tests::TestDatabase> db_;
    std::unique_ptr<SqliteKeywordIndex> index_;
};

TEST(KeywordMatchExpressionTest, QuotesAndAndsTerms) {
    EXPECT_EQ(SqliteKeywordIndex::buildMatchExpression("revenue growth"),
              "\"revenue\" AND \"growth\"");
    EXPECT_EQ(SqliteKeywordIndex::buildMatchExpression("  \"drop\" OR (table);  "),
              "\"drop\" AND \"OR\" AND \"table\"");
    EXPECT_EQ(SqliteKeywordIndex::buildMatchExpression("year-over-year q_1"),
              "\"year-over-year\" AND \"q_1\"");
    EXPECT_EQ(SqliteKeywordIndex::buildMatchExpression("*:^()"), "");
}

TEST_F(KeywordIndexTest, FindsChunksContainingAllTerms) {
    seed("d1", "s", "/finance.txt",
         {"Quarterly revenue growth exceeded expectations.", "Headcount stayed flat.",
          "Revenue was discussed but not its trend."});

    auto r = index_->search("revenue growth", 10, scope("s"));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].chunkId, "d1#0");
    EXPECT_GT(r.value()[0].rawScore, 0.0);
    EXPECT_EQ(r.value()[0].path, "/finance.txt");
}

TEST_F(KeywordIndexTest, MoreRelevantChunkRanksFirst) {
    seed("d1", "s", "/a.txt",
         {"revenue", "revenue revenue revenue growth of revenue",
          "some unrelated words and then revenue appears once among many other tokens here"});
    auto r = index_->search("revenue", 10, scope("s"));
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_GE(r.value()[0].rawScore, r.value()[1].rawScore);
    EXPECT_GE(r.value()[1].rawScore, r.value()[2].rawScore);
}

TEST_F(KeywordIndexTest, ScopeAndPathAreRespected) {
    seed("d1", "s", "/reports/a.txt", {"budget forecast"});
    seed("d2", "s", "/notes/b.txt", {"budget forecast"});
    seed("d3", "t", "/reports/c.txt", {"budget forecast"});

    auto inScope = index_->search("budget", 10, scope("s"));
    ASSERT_TRUE(inScope);
    EXPECT_EQ(inScope.value().size(), 2u);

    auto filter = scope("s");
    filter.pathPrefix = "reports";
    auto reports = index_->search("budget", 10, filter);
    ASSERT_TRUE(reports);
    ASSERT_EQ(reports.value().size(), 1u);
    EXPECT_EQ(reports.value()[0].documentId, "d1");
}

TEST_F(KeywordIndexTest, DeletedChunksDisappearFromIndex) {
    seed("d1", "s", "/a.txt", {"alpha beta"});
    ASSERT_TRUE(db_->repository->deleteChunks("d1"));
    auto r = index_->search("alpha", 10, scope("s"));
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}

TEST_F(KeywordIndexTest, PunctuationOnlyQueryReturnsNothing) {
    seed("d1", "s", "/a.txt", {"alpha beta"});
    auto r = index_->search("?!*", 10, scope("s"));
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
}
