#pragma once

#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <vector>
#include <sift/config/settings.h>
#include <sift/core/types.h>

namespace sift::vector {

using Embedding = std::vector<float>;

/**
 * @brief Text to fixed-length vector, batchable
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<Embedding> embed(const std::string& text, std::stop_token stop = {}) = 0;

    /**
     * @brief Embed many texts; output order matches input order
     */
    virtual Result<std::vector<Embedding>> embedBatch(std::span<const std::string> texts,
                                                      std::stop_token stop = {}) = 0;

    virtual size_t dimensions() const = 0;
    virtual std::string modelId() const = 0;
    virtual std::string providerName() const = 0;
};

/**
 * @brief Deterministic bag-of-words hashing embedder.
 *
 * Tokens are lowercased alphanumeric runs hashed into buckets and the result is
 * L2-normalized. Texts sharing words get positive cosine similarity. Needs no
 * network, used offline and in tests.
 */
class HashEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashEmbeddingProvider(size_t dimensions = 384, std::string modelId = "hash-bow");

    Result<Embedding> embed(const std::string& text, std::stop_token stop = {}) override;
    Result<std::vector<Embedding>> embedBatch(std::span<const std::string> texts,
                                              std::stop_token stop = {}) override;

    size_t dimensions() const override { return dimensions_; }
    std::string modelId() const override { return modelId_; }
    std::string providerName() const override { return "Hash"; }

private:
    size_t dimensions_;
    std::string modelId_;
};

/**
 * @brief Embeddings from an Ollama server via POST /api/embed.
 *
 * Texts are split into batchSize groups which are requested concurrently.
 */
class OllamaEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit OllamaEmbeddingProvider(config::EmbeddingSettings settings);

    Result<Embedding> embed(const std::string& text, std::stop_token stop = {}) override;
    Result<std::vector<Embedding>> embedBatch(std::span<const std::string> texts,
                                              std::stop_token stop = {}) override;

    size_t dimensions() const override { return static_cast<size_t>(settings_.dimensions); }
    std::string modelId() const override { return settings_.model; }
    std::string providerName() const override { return "Ollama"; }

    /**
     * @brief Request body for one batch
     */
    static std::string buildRequest(const std::string& model,
                                    std::span<const std::string> texts);

    /**
     * @brief Parse the "embeddings" array of an /api/embed response
     */
    static Result<std::vector<Embedding>> parseResponse(const std::string& body,
                                                        size_t expectedCount);

private:
    Result<std::vector<Embedding>> requestBatch(std::span<const std::string> texts,
                                                std::stop_token stop);

    config::EmbeddingSettings settings_;
};

/**
 * @brief Build a provider from settings: "Ollama" or "Hash"
 */
Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const config::EmbeddingSettings& settings);

// Vector utilities
float computeCosineSimilarity(std::span<const float> a, std::span<const float> b);
bool isValidEmbedding(std::span<const float> embedding, size_t expectedDim);
void normalizeEmbedding(Embedding& embedding);

} // namespace sift::vector
