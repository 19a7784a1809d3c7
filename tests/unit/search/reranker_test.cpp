#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sift/search/reranker.h>

#include <unordered_map>

using namespace sift;
using namespace sift::search;

namespace {

SearchHit hit(const std::string& id, double score, const std::string& source) {
    SearchHit h;
    h.chunkId = id;
    h.documentId = "doc-" + id;
    h.content = "content of " + id;
    h.score = score;
    h.metadata[hit_keys::kSource] = source;
    return h;
}

const SearchHit* findHit(const std::vector<SearchHit>& hits, const std::string& id) {
    for (const auto& h : hits) {
        if (h.chunkId == id)
            return &h;
    }
    return nullptr;
}

class ScriptedScorer : public IRelevanceScorer {
public:
    Result<double> score(const std::string& /*model*/, const std::string& /*query*/,
                         const std::string& passage, std::stop_token /*stop*/) override {
        ++calls;
        auto it = scores.find(passage);
        if (it == scores.end())
            return Error{ErrorCode::NetworkError, "scorer unavailable"};
        return it->second;
    }

    std::unordered_map<std::string, double> scores;
    int calls = 0;
};

} // namespace

TEST(RrfRerankerTest, ChunkInBothListsOutranksSingleListChunk) {
    std::vector<SearchHit> hits = {
        hit("a", 0.9, hit_sources::kVector),  hit("b", 0.8, hit_sources::kVector),
        hit("c", 5.0, hit_sources::kKeyword), hit("b", 4.0, hit_sources::kKeyword),
    };
    auto out = RrfReranker::fuse(hits, 60);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].chunkId, "b");
    EXPECT_DOUBLE_EQ(out[0].score, 1.0);
    // a and c both sit at rank 1 in a single list, so they tie and order by id
    EXPECT_EQ(out[1].chunkId, "a");
    EXPECT_EQ(out[2].chunkId, "c");
    // Min-max: the lowest fused score lands on 0
    EXPECT_DOUBLE_EQ(out[1].score, 0.0);
    EXPECT_DOUBLE_EQ(out[2].score, 0.0);

    EXPECT_EQ(out[0].metadata.at(hit_keys::kReranker), "RRF");
    EXPECT_EQ(out[0].metadata.at(hit_keys::kRrfScore), fmt::format("{:.6f}", 2.0 / 62.0));
}

TEST(RrfRerankerTest, ScoresAreMinMaxNormalized) {
    std::vector<SearchHit> hits = {
        hit("a", 0.9, hit_sources::kVector), hit("b", 0.8, hit_sources::kVector),
        hit("d", 0.7, hit_sources::kVector), hit("b", 2.0, hit_sources::kKeyword),
    };
    auto out = RrfReranker::fuse(hits, 60);
    ASSERT_EQ(out.size(), 3u);

    const double a = 1.0 / 61.0;
    const double b = 1.0 / 62.0 + 1.0 / 61.0;
    const double d = 1.0 / 63.0;
    EXPECT_EQ(out[0].chunkId, "b");
    EXPECT_DOUBLE_EQ(out[0].score, 1.0);
    EXPECT_EQ(out[1].chunkId, "a");
    EXPECT_NEAR(out[1].score, (a - d) / (b - d), 1e-12);
    EXPECT_EQ(out[2].chunkId, "d");
    EXPECT_DOUBLE_EQ(out[2].score, 0.0);
}

TEST(RrfRerankerTest, EqualFusedScoresNormalizeToOne) {
    std::vector<SearchHit> hits = {hit("a", 0.9, hit_sources::kVector),
                                   hit("b", 3.0, hit_sources::kKeyword)};
    auto out = RrfReranker::fuse(hits, 60);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].score, 1.0);
    EXPECT_DOUBLE_EQ(out[1].score, 1.0);
}

TEST(RrfRerankerTest, SingleSourcePassesThrough) {
    std::vector<SearchHit> hits = {hit("a", 0.4, hit_sources::kVector),
                                   hit("b", 0.9, hit_sources::kVector)};
    auto out = RrfReranker::fuse(hits, 60);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].chunkId, "a");
    EXPECT_DOUBLE_EQ(out[0].score, 0.4);
    EXPECT_EQ(out[0].metadata.count(hit_keys::kReranker), 0u);
}

TEST(RrfRerankerTest, DuplicateWithinSourceKeepsBestRank) {
    std::vector<SearchHit> hits = {
        hit("a", 0.9, hit_sources::kVector),  hit("a", 0.1, hit_sources::kVector),
        hit("b", 0.5, hit_sources::kVector),  hit("b", 3.0, hit_sources::kKeyword),
    };
    auto out = RrfReranker::fuse(hits, 60);
    auto* a = findHit(out, "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->metadata.at(hit_keys::kRrfScore), fmt::format("{:.6f}", 1.0 / 61.0));
}

TEST(RrfRerankerTest, RerankUsesConfiguredKAndHonoursStop) {
    RrfReranker rrf;
    config::SearchSettings settings;
    settings.rrfK = 0;
    std::vector<SearchHit> hits = {hit("a", 1.0, hit_sources::kVector),
                                   hit("b", 1.0, hit_sources::kKeyword)};
    auto r = rrf.rerank("q", hits, settings, {});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value()[0].metadata.at(hit_keys::kRrfScore), fmt::format("{:.6f}", 1.0 / 61.0));

    std::stop_source stop;
    stop.request_stop();
    auto cancelled = rrf.rerank("q", hits, settings, stop.get_token());
    ASSERT_FALSE(cancelled);
    EXPECT_EQ(cancelled.error().code, ErrorCode::OperationCancelled);
}

TEST(CrossEncoderRerankerTest, NoModelKeepsOrder) {
    auto scorer = std::make_shared<ScriptedScorer>();
    CrossEncoderReranker reranker(scorer);
    config::SearchSettings settings;
    std::vector<SearchHit> hits = {hit("a", 0.2, hit_sources::kVector),
                                   hit("b", 0.9, hit_sources::kVector)};
    auto r = reranker.rerank("q", hits, settings, {});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value()[0].chunkId, "a");
    EXPECT_EQ(scorer->calls, 0);
}

TEST(CrossEncoderRerankerTest, ScoresReorderAndFailuresFallBack) {
    auto scorer = std::make_shared<ScriptedScorer>();
    scorer->scores["content of a"] = 9.0;
    scorer->scores["content of b"] = 2.0;
    CrossEncoderReranker reranker(scorer);
    config::SearchSettings settings;
    settings.crossEncoderModel = "judge";

    std::vector<SearchHit> hits = {hit("b", 0.9, hit_sources::kVector),
                                   hit("c", 0.5, hit_sources::kVector),
                                   hit("a", 0.1, hit_sources::kVector)};
    auto r = reranker.rerank("q", hits, settings, {});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_EQ(r.value()[0].chunkId, "a");
    EXPECT_DOUBLE_EQ(r.value()[0].score, 0.9);
    EXPECT_EQ(r.value()[0].metadata.at(hit_keys::kCrossEncoderScore), "9.00");
    EXPECT_EQ(r.value()[1].chunkId, "c");
    EXPECT_DOUBLE_EQ(r.value()[1].score, 0.5);
    EXPECT_EQ(r.value()[1].metadata.at(hit_keys::kCrossEncoderScore), "5.00");
    EXPECT_EQ(r.value()[2].chunkId, "b");
    EXPECT_EQ(r.value()[2].metadata.at(hit_keys::kReranker), "CrossEncoder");
    EXPECT_EQ(scorer->calls, 3);
}

TEST(OllamaRelevanceScorerTest, ParseScore) {
    EXPECT_DOUBLE_EQ(OllamaRelevanceScorer::parseScore("8"), 8.0);
    EXPECT_DOUBLE_EQ(OllamaRelevanceScorer::parseScore("Score: 7.5/10"), 7.5);
    EXPECT_DOUBLE_EQ(OllamaRelevanceScorer::parseScore("15"), 10.0);
    EXPECT_DOUBLE_EQ(OllamaRelevanceScorer::parseScore("-3"), 0.0);
    EXPECT_DOUBLE_EQ(OllamaRelevanceScorer::parseScore("no idea"), 5.0);
    EXPECT_DOUBLE_EQ(OllamaRelevanceScorer::parseScore(""), 5.0);
}

TEST(OllamaRelevanceScorerTest, BuildRequest) {
    auto body = nlohmann::json::parse(
        OllamaRelevanceScorer::buildRequest("judge", "revenue", "Revenue grew."));
    EXPECT_EQ(body["model"], "judge");
    EXPECT_FALSE(body["stream"].get<bool>());
    EXPECT_DOUBLE_EQ(body["options"]["temperature"].get<double>(), 0.1);
    EXPECT_EQ(body["options"]["num_predict"].get<int>(), 10);
    auto prompt = body["prompt"].get<std::string>();
    EXPECT_NE(prompt.find("revenue"), std::string::npos);
    EXPECT_NE(prompt.find("Revenue grew."), std::string::npos);
}

TEST(RerankerRegistryTest, DefaultRegistryLookupIsCaseInsensitive) {
    auto registry = RerankerRegistry::createDefault(nullptr);
    ASSERT_NE(registry.find("rrf"), nullptr);
    EXPECT_EQ(registry.find("RRF")->name(), "RRF");
    ASSERT_NE(registry.find("crossencoder"), nullptr);
    EXPECT_EQ(registry.find("Bogus"), nullptr);
    EXPECT_EQ(registry.names().size(), 2u);
}
