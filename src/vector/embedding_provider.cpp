#include <sift/config/config_helpers.h>
#include <sift/net/http_client.h>
#include <sift/vector/embedding_provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <optional>

namespace sift::vector {

using json = nlohmann::json;

namespace {

// FNV-1a, stable across runs and platforms
uint64_t fnv1a(std::string_view s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace

float computeCosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(normA) * std::sqrt(normB)));
}

bool isValidEmbedding(std::span<const float> embedding, size_t expectedDim) {
    if (embedding.size() != expectedDim || embedding.empty()) {
        return false;
    }
    return std::all_of(embedding.begin(), embedding.end(),
                       [](float v) { return std::isfinite(v); });
}

void normalizeEmbedding(Embedding& embedding) {
    double norm = 0.0;
    for (float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    if (norm <= 0.0) {
        return;
    }
    const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& v : embedding) {
        v *= inv;
    }
}

// HashEmbeddingProvider

HashEmbeddingProvider::HashEmbeddingProvider(size_t dimensions, std::string modelId)
    : dimensions_(dimensions == 0 ? 1 : dimensions), modelId_(std::move(modelId)) {}

Result<Embedding> HashEmbeddingProvider::embed(const std::string& text, std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Embedding cancelled"};
    }

    Embedding out(dimensions_, 0.0f);
    std::string token;
    auto flush = [&] {
        if (token.empty())
            return;
        auto h = fnv1a(token);
        float sign = ((h >> 63) & 1u) ? -1.0f : 1.0f;
        out[h % dimensions_] += sign;
        token.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    normalizeEmbedding(out);
    return out;
}

Result<std::vector<Embedding>> HashEmbeddingProvider::embedBatch(std::span<const std::string> texts,
                                                                 std::stop_token stop) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto r = embed(text, stop);
        if (!r)
            return r.error();
        out.push_back(std::move(r).value());
    }
    return out;
}

// OllamaEmbeddingProvider

OllamaEmbeddingProvider::OllamaEmbeddingProvider(config::EmbeddingSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.batchSize <= 0) {
        settings_.batchSize = 1;
    }
    while (!settings_.baseUrl.empty() && settings_.baseUrl.back() == '/') {
        settings_.baseUrl.pop_back();
    }
}

std::string OllamaEmbeddingProvider::buildRequest(const std::string& model,
                                                  std::span<const std::string> texts) {
    json req;
    req["model"] = model;
    req["input"] = json::array();
    for (const auto& t : texts) {
        req["input"].push_back(t);
    }
    return req.dump();
}

Result<std::vector<Embedding>> OllamaEmbeddingProvider::parseResponse(const std::string& body,
                                                                      size_t expectedCount) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::InvalidData, "Embedding response is not a JSON object"};
    }
    if (j.contains("error") && j["error"].is_string()) {
        return Error{ErrorCode::NetworkError, "Ollama error: " + j["error"].get<std::string>()};
    }
    if (!j.contains("embeddings") || !j["embeddings"].is_array()) {
        return Error{ErrorCode::InvalidData, "Embedding response has no 'embeddings' array"};
    }

    std::vector<Embedding> out;
    for (const auto& row : j["embeddings"]) {
        if (!row.is_array() || row.empty()) {
            return Error{ErrorCode::InvalidData, "Ollama returned empty embedding"};
        }
        Embedding e;
        e.reserve(row.size());
        for (const auto& v : row) {
            if (!v.is_number()) {
                return Error{ErrorCode::InvalidData, "Non-numeric value in embedding"};
            }
            e.push_back(v.get<float>());
        }
        out.push_back(std::move(e));
    }
    if (out.size() != expectedCount) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Expected {} embeddings, got {}", expectedCount, out.size())};
    }
    return out;
}

Result<std::vector<Embedding>>
OllamaEmbeddingProvider::requestBatch(std::span<const std::string> texts, std::stop_token stop) {
    auto response = net::postJson(settings_.baseUrl + "/api/embed",
                                  buildRequest(settings_.model, texts),
                                  std::chrono::seconds(settings_.timeoutSeconds), stop);
    if (!response) {
        if (response.error().code == ErrorCode::OperationCancelled) {
            return response.error();
        }
        return Error{response.error().code,
                     fmt::format("Failed to reach Ollama embedding service at {} (model '{}'): {}",
                                 settings_.baseUrl, settings_.model, response.error().message)};
    }

    auto parsed = parseResponse(response.value().body, texts.size());
    if (!parsed)
        return parsed.error();

    const auto& rows = parsed.value();
    if (!rows.empty() && rows.front().size() != dimensions()) {
        spdlog::warn("Embedding dimension mismatch: expected {}, got {}. Consider updating settings.",
                     dimensions(), rows.front().size());
    }
    return parsed;
}

Result<Embedding> OllamaEmbeddingProvider::embed(const std::string& text, std::stop_token stop) {
    if (config::trimmed(text).empty()) {
        return Error{ErrorCode::InvalidArgument, "Text cannot be empty"};
    }
    std::string one[] = {text};
    auto r = requestBatch(one, stop);
    if (!r)
        return r.error();
    return std::move(r).value().front();
}

Result<std::vector<Embedding>>
OllamaEmbeddingProvider::embedBatch(std::span<const std::string> texts, std::stop_token stop) {
    std::vector<Embedding> out;
    if (texts.empty()) {
        return out;
    }

    const size_t batchSize = static_cast<size_t>(settings_.batchSize);
    const size_t totalBatches = (texts.size() + batchSize - 1) / batchSize;

    std::vector<std::future<Result<std::vector<Embedding>>>> futures;
    futures.reserve(totalBatches);
    for (size_t start = 0; start < texts.size(); start += batchSize) {
        auto slice = texts.subspan(start, std::min(batchSize, texts.size() - start));
        futures.push_back(std::async(std::launch::async, [this, slice, stop] {
            return requestBatch(slice, stop);
        }));
    }

    out.reserve(texts.size());
    std::optional<Error> firstError;
    for (size_t i = 0; i < futures.size(); ++i) {
        auto r = futures[i].get();
        if (!r) {
            if (!firstError)
                firstError = r.error();
            continue;
        }
        auto rows = std::move(r).value();
        spdlog::debug("Embedded batch {}/{} ({} texts)", i + 1, totalBatches, rows.size());
        for (auto& row : rows) {
            out.push_back(std::move(row));
        }
    }
    if (firstError) {
        return *firstError;
    }
    return out;
}

Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const config::EmbeddingSettings& settings) {
    if (config::iequals(settings.provider, "Ollama")) {
        return std::unique_ptr<IEmbeddingProvider>(
            std::make_unique<OllamaEmbeddingProvider>(settings));
    }
    if (config::iequals(settings.provider, "Hash")) {
        return std::unique_ptr<IEmbeddingProvider>(std::make_unique<HashEmbeddingProvider>(
            static_cast<size_t>(std::max(1, settings.dimensions)), settings.model));
    }
    return Error{ErrorCode::NotSupported, "Unknown embedding provider: " + settings.provider};
}

} // namespace sift::vector
