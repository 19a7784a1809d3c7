#include <sift/config/config_helpers.h>
#include <sift/search/hybrid_search_engine.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <iterator>
#include <type_traits>

namespace sift::search {

namespace {

// Run f on the pool; the packaged_task is move-only so it rides in a shared_ptr
template <typename F, typename R = std::invoke_result_t<F&>>
std::future<R> submitTo(boost::asio::thread_pool& pool, F&& f) {
    auto pt = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    auto fut = pt->get_future();
    boost::asio::post(pool, [pt]() { (*pt)(); });
    return fut;
}

std::vector<SearchHit> collectBranch(std::future<Result<std::vector<SearchHit>>>& fut,
                                     const char* branch) {
    try {
        auto result = fut.get();
        if (!result) {
            spdlog::warn("[HybridSearch] {} branch failed: {}", branch, result.error().message);
            return {};
        }
        return std::move(result).value();
    } catch (const std::exception& e) {
        spdlog::warn("[HybridSearch] {} branch threw: {}", branch, e.what());
        return {};
    }
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

void sortHits(std::vector<SearchHit>& hits) {
    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.chunkId < b.chunkId;
    });
}

} // namespace

HybridSearchEngine::HybridSearchEngine(std::shared_ptr<vector::IVectorIndex> vectorIndex,
                                       std::shared_ptr<IKeywordIndex> keywordIndex,
                                       std::shared_ptr<vector::IEmbeddingProvider> embedder,
                                       const config::SettingsProvider& settings,
                                       RerankerRegistry rerankers, size_t branchThreads)
    : vectorIndex_(std::move(vectorIndex)), keywordIndex_(std::move(keywordIndex)),
      embedder_(std::move(embedder)), settings_(settings), rerankers_(std::move(rerankers)),
      pool_(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(branchThreads, 1))) {}

HybridSearchEngine::~HybridSearchEngine() {
    if (pool_) {
        pool_->join();
    }
}

std::vector<double> HybridSearchEngine::normalizeScores(const std::vector<double>& raw) {
    if (raw.empty())
        return {};
    auto [minIt, maxIt] = std::minmax_element(raw.begin(), raw.end());
    double lo = *minIt;
    double range = *maxIt - lo;
    std::vector<double> out;
    out.reserve(raw.size());
    for (double v : raw) {
        out.push_back(range > 0.0 ? (v - lo) / range : 1.0);
    }
    return out;
}

Result<std::vector<SearchHit>> HybridSearchEngine::semanticSearch(
    const std::string& query, const vector::SearchFilter& filter, size_t limit, double minScore,
    std::stop_token stop) {
    if (!vectorIndex_ || !embedder_) {
        return Error{ErrorCode::InvalidState, "Vector search is not configured"};
    }
    auto embedding = embedder_->embed(query, stop);
    if (!embedding)
        return embedding.error();

    auto matches = vectorIndex_->search(embedding.value(), limit, filter);
    if (!matches)
        return matches.error();

    std::vector<SearchHit> hits;
    hits.reserve(matches.value().size());
    for (auto& m : matches.value()) {
        double similarity = std::clamp(1.0 - static_cast<double>(m.distance), 0.0, 1.0);
        if (similarity < minScore)
            continue;
        SearchHit hit;
        hit.chunkId = std::move(m.chunkId);
        hit.documentId = std::move(m.documentId);
        hit.content = std::move(m.content);
        hit.score = similarity;
        hit.metadata[hit_keys::kPath] = std::move(m.path);
        hit.metadata[hit_keys::kSource] = hit_sources::kVector;
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<std::vector<SearchHit>> HybridSearchEngine::keywordSearch(const std::string& query,
                                                                 const vector::SearchFilter& filter,
                                                                 size_t limit, double minScore) {
    if (!keywordIndex_) {
        return Error{ErrorCode::InvalidState, "Keyword search is not configured"};
    }
    auto matches = keywordIndex_->search(query, limit, filter);
    if (!matches)
        return matches.error();

    std::vector<double> raw;
    raw.reserve(matches.value().size());
    for (const auto& m : matches.value()) {
        raw.push_back(m.rawScore);
    }
    auto normalized = normalizeScores(raw);

    std::vector<SearchHit> hits;
    hits.reserve(matches.value().size());
    for (size_t i = 0; i < matches.value().size(); ++i) {
        if (normalized[i] < minScore)
            continue;
        auto& m = matches.value()[i];
        SearchHit hit;
        hit.chunkId = std::move(m.chunkId);
        hit.documentId = std::move(m.documentId);
        hit.content = std::move(m.content);
        hit.score = normalized[i];
        hit.metadata[hit_keys::kPath] = std::move(m.path);
        hit.metadata[hit_keys::kSource] = hit_sources::kKeyword;
        hit.metadata[hit_keys::kRawRank] = fmt::format("{:.6f}", m.rawScore);
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::vector<SearchHit> HybridSearchEngine::runHybrid(const std::string& query,
                                                     const vector::SearchFilter& filter,
                                                     size_t limit, double minScore,
                                                     std::stop_token stop) {
    auto vectorFut = submitTo(*pool_, [this, &query, &filter, limit, minScore, stop]() {
        return semanticSearch(query, filter, limit, minScore, stop);
    });
    auto keywordFut = submitTo(*pool_, [this, &query, &filter, limit, minScore]() {
        return keywordSearch(query, filter, limit, minScore);
    });

    auto vectorHits = collectBranch(vectorFut, "vector");
    auto keywordHits = collectBranch(keywordFut, "keyword");
    spdlog::debug("[HybridSearch] vector={} keyword={} candidates", vectorHits.size(),
                  keywordHits.size());

    std::vector<SearchHit> combined;
    combined.reserve(vectorHits.size() + keywordHits.size());
    std::move(vectorHits.begin(), vectorHits.end(), std::back_inserter(combined));
    std::move(keywordHits.begin(), keywordHits.end(), std::back_inserter(combined));
    return combined;
}

Result<SearchResponse> HybridSearchEngine::search(const SearchOptions& options,
                                                  std::stop_token stop) {
    auto started = std::chrono::steady_clock::now();
    SearchResponse response;

    if (isBlank(options.query)) {
        return response;
    }
    if (options.scopeId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Search requires a scope id"};
    }

    auto snapshot = settings_.snapshot();
    const auto& cfg = snapshot->search;
    size_t topK = options.topK.value_or(static_cast<size_t>(std::max(cfg.topK, 0)));
    double minScore = options.minScore.value_or(cfg.minimumScore);
    auto mode = options.mode.value_or(cfg.mode);
    if (topK == 0) {
        return response;
    }

    vector::SearchFilter filter;
    filter.scopeId = options.scopeId;
    filter.pathPrefix = options.pathPrefix;
    size_t limit = topK * 2;

    std::vector<SearchHit> hits;
    switch (mode) {
        case config::SearchMode::Semantic: {
            auto r = semanticSearch(options.query, filter, limit, minScore, stop);
            if (!r)
                return r.error();
            hits = std::move(r).value();
            break;
        }
        case config::SearchMode::Keyword: {
            auto r = keywordSearch(options.query, filter, limit, minScore);
            if (!r)
                return r.error();
            hits = std::move(r).value();
            break;
        }
        case config::SearchMode::Hybrid:
            hits = runHybrid(options.query, filter, limit, minScore, stop);
            break;
    }

    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Search cancelled"};
    }

    const std::string rerankerName = options.reranker.value_or(cfg.reranker);
    if (!hits.empty() && !config::iequals(rerankerName, "None") && !rerankerName.empty()) {
        auto reranker = rerankers_.find(rerankerName);
        if (!reranker) {
            spdlog::warn("[HybridSearch] Unknown reranker '{}', keeping retrieval order",
                         rerankerName);
        } else {
            auto reranked = reranker->rerank(options.query, hits, cfg, stop);
            if (reranked) {
                hits = std::move(reranked).value();
            } else if (reranked.error().code == ErrorCode::OperationCancelled) {
                return reranked.error();
            } else {
                spdlog::warn("[HybridSearch] Reranker '{}' failed: {}", reranker->name(),
                             reranked.error().message);
            }
        }
    }

    hits.erase(std::remove_if(hits.begin(), hits.end(),
                              [minScore](const SearchHit& h) { return h.score < minScore; }),
               hits.end());
    sortHits(hits);

    response.totalCount = hits.size();
    if (hits.size() > topK) {
        hits.resize(topK);
    }
    response.hits = std::move(hits);
    response.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::debug("[HybridSearch] '{}' mode={} returned {} of {} hits in {}ms", options.query,
                  config::searchModeToString(mode), response.hits.size(), response.totalCount,
                  response.duration.count());
    return response;
}

} // namespace sift::search
