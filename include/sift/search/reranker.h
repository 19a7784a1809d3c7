#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>
#include <sift/config/settings.h>
#include <sift/core/types.h>
#include <sift/search/search_types.h>

namespace sift::search {

/**
 * @brief Reorders a candidate list produced by one or more retrieval sources.
 *
 * Input hits may repeat a chunk id when several sources returned it; the
 * "source" metadata key tells them apart.
 */
class ISearchReranker {
public:
    virtual ~ISearchReranker() = default;

    virtual std::string name() const = 0;

    virtual Result<std::vector<SearchHit>> rerank(const std::string& query,
                                                  std::vector<SearchHit> hits,
                                                  const config::SearchSettings& settings,
                                                  std::stop_token stop) = 0;
};

/**
 * @brief Reciprocal rank fusion: score = sum over sources of 1 / (k + rank).
 *
 * Ranks are 1-based per source, ordered by score then chunk id. Fused scores are
 * divided by the maximum so the best hit scores 1.0. Fewer than two sources
 * passes the hits through untouched.
 */
class RrfReranker : public ISearchReranker {
public:
    std::string name() const override { return "RRF"; }

    Result<std::vector<SearchHit>> rerank(const std::string& query, std::vector<SearchHit> hits,
                                          const config::SearchSettings& settings,
                                          std::stop_token stop) override;

    static std::vector<SearchHit> fuse(std::vector<SearchHit> hits, int k);
};

/**
 * @brief Scores a (query, passage) pair on a 0-10 scale
 */
class IRelevanceScorer {
public:
    virtual ~IRelevanceScorer() = default;

    virtual Result<double> score(const std::string& model, const std::string& query,
                                 const std::string& passage, std::stop_token stop) = 0;
};

/**
 * @brief Relevance scoring through an Ollama /api/generate prompt
 */
class OllamaRelevanceScorer : public IRelevanceScorer {
public:
    OllamaRelevanceScorer(std::string baseUrl, std::chrono::seconds timeout);

    Result<double> score(const std::string& model, const std::string& query,
                         const std::string& passage, std::stop_token stop) override;

    static std::string buildRequest(const std::string& model, const std::string& query,
                                    const std::string& passage);

    /**
     * @brief First number in the reply, clamped to [0, 10]; 5 when none is found
     */
    static double parseScore(const std::string& reply);

private:
    std::string baseUrl_;
    std::chrono::seconds timeout_;
};

/**
 * @brief Per-pair scoring with fallback to the pre-rerank score on failure.
 *
 * Passes hits through when no scorer or no model is configured.
 */
class CrossEncoderReranker : public ISearchReranker {
public:
    explicit CrossEncoderReranker(std::shared_ptr<IRelevanceScorer> scorer);

    std::string name() const override { return "CrossEncoder"; }

    Result<std::vector<SearchHit>> rerank(const std::string& query, std::vector<SearchHit> hits,
                                          const config::SearchSettings& settings,
                                          std::stop_token stop) override;

private:
    std::shared_ptr<IRelevanceScorer> scorer_;
};

/**
 * @brief Case-insensitive name lookup of rerankers
 */
class RerankerRegistry {
public:
    void registerReranker(std::shared_ptr<ISearchReranker> reranker);

    std::shared_ptr<ISearchReranker> find(const std::string& name) const;

    std::vector<std::string> names() const;

    /**
     * @brief RRF plus a cross-encoder backed by the given scorer
     */
    static RerankerRegistry createDefault(std::shared_ptr<IRelevanceScorer> scorer);

private:
    std::map<std::string, std::shared_ptr<ISearchReranker>> rerankers_;
};

} // namespace sift::search
