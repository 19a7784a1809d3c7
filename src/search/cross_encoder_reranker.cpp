#include <sift/net/http_client.h>
#include <sift/search/reranker.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace sift::search {

using json = nlohmann::json;

namespace {

constexpr double kNeutralScore = 5.0;
constexpr double kMaxScore = 10.0;

bool startsNumber(const std::string& s, size_t i) {
    auto digitAt = [&](size_t p) {
        return p < s.size() && std::isdigit(static_cast<unsigned char>(s[p]));
    };
    if (digitAt(i))
        return true;
    if (s[i] == '.' && digitAt(i + 1))
        return true;
    if (s[i] == '-' && (digitAt(i + 1) || (i + 1 < s.size() && s[i + 1] == '.' && digitAt(i + 2))))
        return true;
    return false;
}

} // namespace

OllamaRelevanceScorer::OllamaRelevanceScorer(std::string baseUrl, std::chrono::seconds timeout)
    : baseUrl_(std::move(baseUrl)), timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

std::string OllamaRelevanceScorer::buildRequest(const std::string& model, const std::string& query,
                                                const std::string& passage) {
    json req;
    req["model"] = model;
    req["prompt"] = fmt::format(
        "Rate how relevant the passage is to the query on a scale from 0 to 10, where 0 is "
        "unrelated and 10 is a perfect answer. Reply with the number only.\n\n"
        "Query: {}\n\nPassage: {}\n\nScore:",
        query, passage);
    req["stream"] = false;
    req["options"] = {{"temperature", 0.1}, {"num_predict", 10}};
    return req.dump();
}

double OllamaRelevanceScorer::parseScore(const std::string& reply) {
    for (size_t i = 0; i < reply.size(); ++i) {
        if (!startsNumber(reply, i))
            continue;
        char* end = nullptr;
        double value = std::strtod(reply.c_str() + i, &end);
        if (end == reply.c_str() + i)
            break;
        return std::clamp(value, 0.0, kMaxScore);
    }
    return kNeutralScore;
}

Result<double> OllamaRelevanceScorer::score(const std::string& model, const std::string& query,
                                            const std::string& passage, std::stop_token stop) {
    auto response =
        net::postJson(baseUrl_ + "/api/generate", buildRequest(model, query, passage), timeout_, stop);
    if (!response)
        return response.error();

    auto j = json::parse(response.value().body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("response") ||
        !j["response"].is_string()) {
        return Error{ErrorCode::InvalidData, "Relevance response has no 'response' text"};
    }
    return parseScore(j["response"].get<std::string>());
}

CrossEncoderReranker::CrossEncoderReranker(std::shared_ptr<IRelevanceScorer> scorer)
    : scorer_(std::move(scorer)) {}

Result<std::vector<SearchHit>> CrossEncoderReranker::rerank(const std::string& query,
                                                            std::vector<SearchHit> hits,
                                                            const config::SearchSettings& settings,
                                                            std::stop_token stop) {
    if (!scorer_ || settings.crossEncoderModel.empty()) {
        spdlog::debug("[CrossEncoder] No scorer or model configured; keeping original order");
        return hits;
    }

    size_t failures = 0;
    for (auto& hit : hits) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Search cancelled"};
        }
        double raw = hit.score * kMaxScore;
        auto scored = scorer_->score(settings.crossEncoderModel, query, hit.content, stop);
        if (scored) {
            raw = std::clamp(scored.value(), 0.0, kMaxScore);
        } else if (scored.error().code == ErrorCode::OperationCancelled) {
            return scored.error();
        } else {
            ++failures;
            spdlog::debug("[CrossEncoder] Scoring {} failed, keeping prior score: {}",
                          hit.chunkId, scored.error().message);
        }
        hit.score = raw / kMaxScore;
        hit.metadata[hit_keys::kCrossEncoderScore] = fmt::format("{:.2f}", raw);
        hit.metadata[hit_keys::kReranker] = "CrossEncoder";
    }
    if (failures > 0) {
        spdlog::warn("[CrossEncoder] {} of {} candidates fell back to their original score",
                     failures, hits.size());
    }

    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.chunkId < b.chunkId;
    });
    return hits;
}

} // namespace sift::search
