#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <vector>
#include <sift/config/settings.h>
#include <sift/core/types.h>
#include <sift/search/keyword_index.h>
#include <sift/search/reranker.h>
#include <sift/search/search_types.h>
#include <sift/vector/embedding_provider.h>
#include <sift/vector/vector_index.h>

#include <boost/asio/thread_pool.hpp>

namespace sift::search {

/**
 * @brief Semantic, keyword or fused retrieval over the chunk store.
 *
 * In Hybrid mode the vector and keyword branches run concurrently on a private
 * thread pool. Each branch goes through its index, and both indexes take their
 * own pooled connection per call, so the branches never share a SQLite session.
 * A failing branch is logged and contributes nothing; the other branch's hits are
 * still fused and returned.
 */
class HybridSearchEngine {
public:
    HybridSearchEngine(std::shared_ptr<vector::IVectorIndex> vectorIndex,
                       std::shared_ptr<IKeywordIndex> keywordIndex,
                       std::shared_ptr<vector::IEmbeddingProvider> embedder,
                       const config::SettingsProvider& settings, RerankerRegistry rerankers,
                       size_t branchThreads = 2);
    ~HybridSearchEngine();

    HybridSearchEngine(const HybridSearchEngine&) = delete;
    HybridSearchEngine& operator=(const HybridSearchEngine&) = delete;

    /**
     * @brief Run a query against one scope.
     *
     * An empty or blank query yields an empty response. scopeId is required.
     */
    Result<SearchResponse> search(const SearchOptions& options, std::stop_token stop = {});

    /**
     * @brief Nearest chunks with similarity = 1 - cosine distance, below minScore dropped
     */
    Result<std::vector<SearchHit>> semanticSearch(const std::string& query,
                                                  const vector::SearchFilter& filter,
                                                  size_t limit, double minScore,
                                                  std::stop_token stop = {});

    /**
     * @brief Full-text hits with min-max normalized scores, below minScore dropped
     */
    Result<std::vector<SearchHit>> keywordSearch(const std::string& query,
                                                 const vector::SearchFilter& filter, size_t limit,
                                                 double minScore);

    /**
     * @brief Rescale raw keyword scores into [0, 1]; identical raw scores all become 1.0
     */
    static std::vector<double> normalizeScores(const std::vector<double>& raw);

    const RerankerRegistry& rerankers() const { return rerankers_; }

private:
    std::vector<SearchHit> runHybrid(const std::string& query, const vector::SearchFilter& filter,
                                     size_t limit, double minScore, std::stop_token stop);

    std::shared_ptr<vector::IVectorIndex> vectorIndex_;
    std::shared_ptr<IKeywordIndex> keywordIndex_;
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    const config::SettingsProvider& settings_;
    RerankerRegistry rerankers_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace sift::search
