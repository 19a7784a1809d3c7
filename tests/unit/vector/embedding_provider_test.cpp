#include <cmath>
#include <gtest/gtest.h>
#include <sift/vector/embedding_provider.h>

#include <nlohmann/json.hpp>

using namespace sift;
using namespace sift::vector;

TEST(VectorUtilsTest, CosineSimilarityBasics) {
    std::vector<float> a{1.0f, 0.0f};
    std::vector<float> b{0.0f, 1.0f};
    std::vector<float> c{2.0f, 0.0f};
    EXPECT_NEAR(computeCosineSimilarity(a, c), 1.0f, 1e-6);
    EXPECT_NEAR(computeCosineSimilarity(a, b), 0.0f, 1e-6);
    std::vector<float> shorter{1.0f};
    EXPECT_EQ(computeCosineSimilarity(a, shorter), 0.0f);
    std::vector<float> zero{0.0f, 0.0f};
    EXPECT_EQ(computeCosineSimilarity(a, zero), 0.0f);
}

TEST(VectorUtilsTest, ValidEmbeddingRequiresDimensionAndFiniteValues) {
    std::vector<float> ok{0.1f, 0.2f, 0.3f};
    EXPECT_TRUE(isValidEmbedding(ok, 3));
    EXPECT_FALSE(isValidEmbedding(ok, 4));
    std::vector<float> bad{0.1f, std::nanf(""), 0.3f};
    EXPECT_FALSE(isValidEmbedding(bad, 3));
}

TEST(HashEmbeddingProviderTest, DeterministicAndNormalized) {
    HashEmbeddingProvider provider(128);
    auto a = provider.embed("Quarterly revenue growth");
    auto b = provider.embed("quarterly REVENUE growth!");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a.value().size(), 128u);
    EXPECT_EQ(a.value(), b.value());

    double norm = 0.0;
    for (float v : a.value())
        norm += static_cast<double>(v) * v;
    EXPECT_NEAR(norm, 1.0, 1e-5);
}

TEST(HashEmbeddingProviderTest, SharedWordsScoreHigherThanDisjointText) {
    HashEmbeddingProvider provider(256);
    auto query = provider.embed("revenue growth").value();
    auto related = provider.embed("quarterly revenue growth was strong").value();
    auto unrelated = provider.embed("the cat sat on the mat").value();
    EXPECT_GT(computeCosineSimilarity(query, related), computeCosineSimilarity(query, unrelated));
}

TEST(HashEmbeddingProviderTest, StopRequestCancels) {
    HashEmbeddingProvider provider;
    std::stop_source source;
    source.request_stop();
    auto r = provider.embed("text", source.get_token());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST(OllamaEmbeddingProviderTest, BuildsEmbedRequest) {
    std::vector<std::string> texts{"one", "two"};
    auto body = nlohmann::json::parse(OllamaEmbeddingProvider::buildRequest("nomic", texts));
    EXPECT_EQ(body["model"], "nomic");
    ASSERT_TRUE(body["input"].is_array());
    EXPECT_EQ(body["input"].size(), 2u);
    EXPECT_EQ(body["input"][1], "two");
}

TEST(OllamaEmbeddingProviderTest, ParsesEmbeddingsArray) {
    auto r = OllamaEmbeddingProvider::parseResponse(
        R"({"model":"nomic","embeddings":[[0.1,0.2],[0.3,0.4]]})", 2);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_FLOAT_EQ(r.value()[1][0], 0.3f);
}

TEST(OllamaEmbeddingProviderTest, RejectsMalformedResponses) {
    EXPECT_FALSE(OllamaEmbeddingProvider::parseResponse("not json", 1));
    EXPECT_FALSE(OllamaEmbeddingProvider::parseResponse(R"({"embeddings":[[]]})", 1));
    EXPECT_FALSE(OllamaEmbeddingProvider::parseResponse(R"({"embeddings":[[0.1]]})", 2));

    auto err = OllamaEmbeddingProvider::parseResponse(R"({"error":"model not found"})", 1);
    ASSERT_FALSE(err);
    EXPECT_NE(err.error().message.find("model not found"), std::string::npos);
}

TEST(OllamaEmbeddingProviderTest, EmptyTextIsInvalidArgument) {
    config::EmbeddingSettings settings;
    settings.baseUrl = "http://127.0.0.1:9";
    OllamaEmbeddingProvider provider(settings);
    auto r = provider.embed("   ");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(EmbeddingProviderFactoryTest, SelectsByName) {
    config::EmbeddingSettings settings;
    settings.provider = "hash";
    settings.dimensions = 32;
    auto hash = createEmbeddingProvider(settings);
    ASSERT_TRUE(hash);
    EXPECT_EQ(hash.value()->providerName(), "Hash");
    EXPECT_EQ(hash.value()->dimensions(), 32u);

    settings.provider = "Ollama";
    auto ollama = createEmbeddingProvider(settings);
    ASSERT_TRUE(ollama);
    EXPECT_EQ(ollama.value()->modelId(), settings.model);

    settings.provider = "OpenAI";
    auto unknown = createEmbeddingProvider(settings);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotSupported);
}
