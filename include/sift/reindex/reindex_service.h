#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <sift/config/settings.h>
#include <sift/ingest/ingestion_service.h>
#include <sift/metadata/document_repository.h>
#include <sift/storage/content_source.h>

namespace sift::reindex {

enum class ReindexReason {
    Unchanged,
    ContentChanged,
    ChunkingSettingsChanged,
    EmbeddingSettingsChanged,
    Forced,
    FileNotFound,
    NeverIndexed,
    Error
};

enum class ReindexAction { Enqueued, Skipped, Failed };

const char* reindexReasonToString(ReindexReason reason);
const char* reindexActionToString(ReindexAction action);

struct ReindexOptions {
    std::optional<std::string> scopeId;   ///< Limit to one scope; all scopes when unset
    std::vector<std::string> documentIds; ///< Explicit documents; empty means all in scope
    bool force = false;
    bool detectSettingsChanges = true;
    /// Chunking strategy for the queued jobs; otherwise a document keeps the strategy
    /// its last job chose, falling back to the settings
    std::optional<std::string> strategy;
};

struct ReindexDocumentResult {
    std::string documentId;
    std::string fileName;
    ReindexAction action = ReindexAction::Skipped;
    ReindexReason reason = ReindexReason::Unchanged;
    std::optional<std::string> jobId;
    std::string errorMessage;
};

struct ReindexResult {
    std::string batchId;
    size_t totalDocuments = 0;
    size_t enqueuedCount = 0;
    size_t skippedCount = 0;
    size_t failedCount = 0;
    std::map<ReindexReason, size_t> reasonCounts;
    std::vector<ReindexDocumentResult> documents;
};

struct ReindexCheck {
    std::string documentId;
    bool needsReindex = false;
    ReindexReason reason = ReindexReason::Unchanged;
    std::string currentHash;
    std::string storedHash;
    std::string currentChunkingKey;
    std::string storedChunkingKey;
    std::string currentEmbeddingKey;
    std::string storedEmbeddingKey;
    std::string errorMessage;
};

/**
 * @brief Decides which documents need re-processing and queues them.
 *
 * Compares the current content hash against the stored one and, optionally, the live
 * chunking and embedding settings against the provenance recorded at last index.
 */
class ReindexService {
public:
    ReindexService(metadata::DocumentRepository& repository,
                   std::shared_ptr<storage::IContentSource> contentSource,
                   ingest::IngestionService& ingestion, const config::SettingsProvider& settings);

    Result<ReindexResult> reindex(const ReindexOptions& options, std::stop_token stop = {});

    /**
     * @brief Decision for one document without queueing anything
     */
    Result<ReindexCheck> checkDocument(const std::string& documentId);

private:
    ReindexCheck evaluate(const metadata::Document& doc, const config::Settings& settings,
                          bool force, bool detectSettingsChanges,
                          const std::optional<std::string>& strategy);
    ReindexDocumentResult enqueue(const metadata::Document& doc, const ReindexOptions& options,
                                  const std::string& batchId, ReindexReason reason);
    Result<std::vector<metadata::Document>> selectDocuments(const ReindexOptions& options);

    metadata::DocumentRepository& repository_;
    std::shared_ptr<storage::IContentSource> contentSource_;
    ingest::IngestionService& ingestion_;
    const config::SettingsProvider& settings_;
};

/**
 * @brief "strategy:maxSize:overlap" for live settings
 */
std::string chunkingSettingsKey(const config::ChunkingSettings& settings);

/**
 * @brief "provider:model" for live settings
 */
std::string embeddingSettingsKey(const config::EmbeddingSettings& settings);

} // namespace sift::reindex
