#include <sift/config/config_helpers.h>
#include <sift/config/settings.h>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <type_traits>

namespace sift::config {

namespace {

using ValueMap = std::map<std::string, std::string>;

template <typename T> void readNumber(const ValueMap& values, const std::string& key, T& out) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty())
        return;
    try {
        if constexpr (std::is_floating_point_v<T>) {
            size_t pos = 0;
            double v = std::stod(it->second, &pos);
            if (pos != it->second.size())
                throw std::invalid_argument("trailing characters");
            out = static_cast<T>(v);
        } else {
            size_t pos = 0;
            long long v = std::stoll(it->second, &pos);
            if (pos != it->second.size() || v < 0)
                throw std::invalid_argument("not a non-negative integer");
            out = static_cast<T>(v);
        }
    } catch (const std::exception&) {
        spdlog::warn("Ignoring invalid value for {}: '{}'", key,
                     sanitize_for_terminal(it->second));
    }
}

void readString(const ValueMap& values, const std::string& key, std::string& out) {
    auto it = values.find(key);
    if (it != values.end() && !it->second.empty())
        out = it->second;
}

void readList(const ValueMap& values, const std::string& key, std::vector<std::string>& out) {
    auto it = values.find(key);
    if (it == values.end())
        return;
    auto list = parse_string_list(it->second);
    if (!list.empty())
        out = std::move(list);
}

} // namespace

const char* searchModeToString(SearchMode mode) {
    switch (mode) {
        case SearchMode::Semantic:
            return "Semantic";
        case SearchMode::Keyword:
            return "Keyword";
        case SearchMode::Hybrid:
            return "Hybrid";
    }
    return "Hybrid";
}

Result<SearchMode> parseSearchMode(std::string_view text) {
    if (iequals(text, "semantic"))
        return SearchMode::Semantic;
    if (iequals(text, "keyword"))
        return SearchMode::Keyword;
    if (iequals(text, "hybrid"))
        return SearchMode::Hybrid;
    return Error{ErrorCode::InvalidArgument, "Unknown search mode: " + std::string(text)};
}

Result<Settings> loadSettings(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "Settings file not found: " + path.string()};
    }

    auto values = parse_config_file(path);
    Settings s;

    readString(values, "chunking.strategy", s.chunking.strategy);
    readNumber(values, "chunking.max_chunk_size", s.chunking.maxChunkSize);
    readNumber(values, "chunking.overlap", s.chunking.overlap);
    readNumber(values, "chunking.min_chunk_size", s.chunking.minChunkSize);
    readNumber(values, "chunking.semantic_threshold", s.chunking.semanticThreshold);
    readList(values, "chunking.separators", s.chunking.recursiveSeparators);

    readString(values, "embedding.provider", s.embedding.provider);
    readString(values, "embedding.model", s.embedding.model);
    readNumber(values, "embedding.dimensions", s.embedding.dimensions);
    readNumber(values, "embedding.batch_size", s.embedding.batchSize);
    readNumber(values, "embedding.timeout_seconds", s.embedding.timeoutSeconds);
    readString(values, "embedding.base_url", s.embedding.baseUrl);

    if (auto it = values.find("search.mode"); it != values.end() && !it->second.empty()) {
        auto mode = parseSearchMode(it->second);
        if (mode) {
            s.search.mode = mode.value();
        } else {
            spdlog::warn("Ignoring invalid value for search.mode: '{}'",
                         sanitize_for_terminal(it->second));
        }
    }
    readNumber(values, "search.top_k", s.search.topK);
    readString(values, "search.reranker", s.search.reranker);
    readNumber(values, "search.rrf_k", s.search.rrfK);
    readNumber(values, "search.minimum_score", s.search.minimumScore);
    readString(values, "search.cross_encoder_model", s.search.crossEncoderModel);
    readString(values, "search.llm_base_url", s.search.llmBaseUrl);

    readNumber(values, "ingestion.parallel_workers", s.ingestion.parallelWorkers);
    readNumber(values, "ingestion.queue_capacity", s.ingestion.queueCapacity);
    readNumber(values, "ingestion.max_file_size_mb", s.ingestion.maxFileSizeMb);
    readList(values, "ingestion.allowed_extensions", s.ingestion.allowedExtensions);

    if (s.chunking.maxChunkSize <= 0) {
        spdlog::warn("chunking.max_chunk_size must be positive, using 512");
        s.chunking.maxChunkSize = 512;
    }
    if (s.ingestion.parallelWorkers <= 0) {
        s.ingestion.parallelWorkers = 1;
    }

    spdlog::debug("Loaded settings from {} ({} keys)", path.string(), values.size());
    return s;
}

SettingsProvider::SettingsProvider() : current_(std::make_shared<const Settings>()) {}

SettingsProvider::SettingsProvider(Settings initial)
    : current_(std::make_shared<const Settings>(std::move(initial))) {}

SettingsSnapshot SettingsProvider::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void SettingsProvider::update(Settings next) {
    auto fresh = std::make_shared<const Settings>(std::move(next));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(fresh);
}

Result<void> SettingsProvider::reload(const std::filesystem::path& path) {
    auto loaded = loadSettings(path);
    if (!loaded) {
        return loaded.error();
    }
    update(std::move(loaded).value());
    spdlog::info("Settings reloaded from {}", path.string());
    return {};
}

} // namespace sift::config
