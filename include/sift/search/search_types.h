#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <sift/config/settings.h>
#include <sift/core/types.h>

namespace sift::search {

// Metadata keys attached to hits
namespace hit_keys {
inline constexpr const char* kSource = "source";
inline constexpr const char* kRawRank = "rawRank";
inline constexpr const char* kPath = "path";
inline constexpr const char* kReranker = "reranker";
inline constexpr const char* kRrfScore = "rrfScore";
inline constexpr const char* kCrossEncoderScore = "crossEncoderScore";
} // namespace hit_keys

namespace hit_sources {
inline constexpr const char* kVector = "vector";
inline constexpr const char* kKeyword = "keyword";
} // namespace hit_sources

struct SearchHit {
    std::string chunkId;
    std::string documentId;
    std::string content;
    double score = 0.0; ///< [0, 1], higher is better
    Metadata metadata;
};

/**
 * @brief Per-request options; unset fields fall back to the settings snapshot
 */
struct SearchOptions {
    std::string query;
    std::string scopeId;
    std::optional<std::string> pathPrefix;
    std::optional<size_t> topK;
    std::optional<double> minScore;
    std::optional<config::SearchMode> mode;
    std::optional<std::string> reranker;
};

struct SearchResponse {
    std::vector<SearchHit> hits;
    size_t totalCount = 0; ///< Candidates seen before truncation to topK
    std::chrono::milliseconds duration{0};
};

} // namespace sift::search
