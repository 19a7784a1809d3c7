#include <sift/config/config_helpers.h>
#include <sift/search/reranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace sift::search {

namespace {

std::string sourceOf(const SearchHit& hit) {
    auto it = hit.metadata.find(hit_keys::kSource);
    return it != hit.metadata.end() ? it->second : std::string{};
}

bool byScoreThenId(const SearchHit& a, const SearchHit& b) {
    if (a.score != b.score)
        return a.score > b.score;
    return a.chunkId < b.chunkId;
}

} // namespace

std::vector<SearchHit> RrfReranker::fuse(std::vector<SearchHit> hits, int k) {
    std::map<std::string, std::vector<size_t>> bySource;
    for (size_t i = 0; i < hits.size(); ++i) {
        bySource[sourceOf(hits[i])].push_back(i);
    }
    if (bySource.size() < 2) {
        return hits;
    }

    struct Fused {
        size_t firstSeen;
        double score = 0.0;
    };
    std::unordered_map<std::string, Fused> fused;
    std::vector<std::string> order;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (fused.emplace(hits[i].chunkId, Fused{i}).second)
            order.push_back(hits[i].chunkId);
    }

    for (auto& [source, indices] : bySource) {
        std::sort(indices.begin(), indices.end(),
                  [&](size_t a, size_t b) { return byScoreThenId(hits[a], hits[b]); });
        std::unordered_map<std::string, bool> ranked;
        int rank = 0;
        for (size_t idx : indices) {
            const auto& id = hits[idx].chunkId;
            // A repeated chunk within one source keeps its best rank
            if (!ranked.emplace(id, true).second)
                continue;
            ++rank;
            fused[id].score += 1.0 / static_cast<double>(k + rank);
        }
    }

    // Min-max onto [0,1]; a zero range maps everything to 1.0
    double minScore = std::numeric_limits<double>::max();
    double maxScore = std::numeric_limits<double>::lowest();
    for (const auto& [id, f] : fused) {
        minScore = std::min(minScore, f.score);
        maxScore = std::max(maxScore, f.score);
    }
    const double range = maxScore - minScore;

    std::vector<SearchHit> out;
    out.reserve(order.size());
    for (const auto& id : order) {
        const auto& f = fused[id];
        SearchHit hit = std::move(hits[f.firstSeen]);
        hit.metadata[hit_keys::kRrfScore] = fmt::format("{:.6f}", f.score);
        hit.metadata[hit_keys::kReranker] = "RRF";
        hit.score = range > 0.0 ? (f.score - minScore) / range : 1.0;
        out.push_back(std::move(hit));
    }
    std::sort(out.begin(), out.end(), byScoreThenId);
    return out;
}

Result<std::vector<SearchHit>> RrfReranker::rerank(const std::string& /*query*/,
                                                   std::vector<SearchHit> hits,
                                                   const config::SearchSettings& settings,
                                                   std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Search cancelled"};
    }
    int k = settings.rrfK > 0 ? settings.rrfK : 60;
    return fuse(std::move(hits), k);
}

void RerankerRegistry::registerReranker(std::shared_ptr<ISearchReranker> reranker) {
    if (!reranker)
        return;
    rerankers_[config::to_lower(reranker->name())] = std::move(reranker);
}

std::shared_ptr<ISearchReranker> RerankerRegistry::find(const std::string& name) const {
    auto it = rerankers_.find(config::to_lower(name));
    return it != rerankers_.end() ? it->second : nullptr;
}

std::vector<std::string> RerankerRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(rerankers_.size());
    for (const auto& [key, reranker] : rerankers_) {
        out.push_back(reranker->name());
    }
    return out;
}

RerankerRegistry RerankerRegistry::createDefault(std::shared_ptr<IRelevanceScorer> scorer) {
    RerankerRegistry registry;
    registry.registerReranker(std::make_shared<RrfReranker>());
    registry.registerReranker(std::make_shared<CrossEncoderReranker>(std::move(scorer)));
    spdlog::debug("[RerankerRegistry] Registered {} rerankers", registry.rerankers_.size());
    return registry;
}

} // namespace sift::search
