#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sift/core/types.h>

namespace sift::config {

/**
 * @brief Chunking configuration
 */
struct ChunkingSettings {
    std::string strategy = "Semantic"; ///< FixedSize, Recursive or Semantic
    int maxChunkSize = 512;            ///< Max tokens per chunk
    int overlap = 50;                  ///< Overlap in tokens
    int minChunkSize = 100;            ///< Min tokens per chunk
    double semanticThreshold = 0.5;    ///< Similarity below this opens a boundary
    std::vector<std::string> recursiveSeparators{"\n\n", "\n", ". ", " "};
};

/**
 * @brief Embedding provider configuration
 */
struct EmbeddingSettings {
    std::string provider = "Ollama";
    std::string model = "nomic-embed-text";
    int dimensions = 768;
    int batchSize = 32;
    int timeoutSeconds = 30;
    std::string baseUrl = "http://localhost:11434";
};

enum class SearchMode { Semantic, Keyword, Hybrid };

const char* searchModeToString(SearchMode mode);
Result<SearchMode> parseSearchMode(std::string_view text);

/**
 * @brief Search configuration
 */
struct SearchSettings {
    SearchMode mode = SearchMode::Hybrid;
    int topK = 10;
    std::string reranker = "RRF"; ///< RRF, CrossEncoder or None
    int rrfK = 60;
    double minimumScore = 0.5;
    std::string crossEncoderModel;
    std::string llmBaseUrl = "http://localhost:11434";
};

/**
 * @brief Background ingestion configuration
 */
struct IngestionSettings {
    int parallelWorkers = 4;
    size_t queueCapacity = 1000;
    int maxFileSizeMb = 100;
    std::vector<std::string> allowedExtensions{".txt", ".text", ".log", ".md", ".markdown", ".csv"};
};

struct Settings {
    ChunkingSettings chunking;
    EmbeddingSettings embedding;
    SearchSettings search;
    IngestionSettings ingestion;
};

using SettingsSnapshot = std::shared_ptr<const Settings>;

/**
 * @brief Load settings from a TOML-style file; keys absent from the file keep defaults.
 *
 * A missing file is NotFound. Malformed values are logged and ignored.
 */
Result<Settings> loadSettings(const std::filesystem::path& path);

/**
 * @brief Holds the live settings and hands out immutable snapshots
 */
class SettingsProvider {
public:
    SettingsProvider();
    explicit SettingsProvider(Settings initial);

    /**
     * @brief Settings as of now. Operations call this once at start.
     */
    [[nodiscard]] SettingsSnapshot snapshot() const;

    /**
     * @brief Replace the live settings. In-flight operations keep their snapshot.
     */
    void update(Settings next);

    /**
     * @brief Reload from file and swap in on success
     */
    Result<void> reload(const std::filesystem::path& path);

private:
    mutable std::mutex mutex_;
    SettingsSnapshot current_;
};

} // namespace sift::config
