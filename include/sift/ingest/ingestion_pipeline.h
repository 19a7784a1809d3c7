#pragma once

#include <array>
#include <istream>
#include <memory>
#include <mutex>
#include <stop_token>
#include <sift/chunking/document_chunker.h>
#include <sift/config/settings.h>
#include <sift/ingest/ingestion_types.h>
#include <sift/metadata/document_repository.h>
#include <sift/storage/content_source.h>
#include <sift/vector/embedding_provider.h>
#include <sift/vector/vector_index.h>

namespace sift::ingest {

/**
 * @brief Parse, chunk, embed and store a single document.
 *
 * Instances are shared by all workers. Each run reads one settings snapshot at start.
 * Failures are recorded on the document row (Failed plus message) and returned as an
 * error; cancellation returns OperationCancelled and puts the document back to Pending
 * if this run left it Processing. A stopped run never overwrites a newer run's status.
 * The final write (old chunks and vectors out, new ones in, document Ready) is one
 * transaction, so when two runs for one document overlap the last to commit wins.
 */
class IngestionPipeline {
public:
    IngestionPipeline(metadata::DocumentRepository& repository,
                      vector::SqliteVectorIndex& vectorIndex,
                      std::shared_ptr<vector::IEmbeddingProvider> embedder,
                      std::shared_ptr<storage::IContentSource> contentSource,
                      const config::SettingsProvider& settings);

    /**
     * @brief Run a job, reading bytes from the content source
     */
    Result<IngestionResult> process(const IngestionJob& job, std::stop_token stop = {},
                                    const ProgressCallback& progress = {});

    /**
     * @brief Run a job over a caller-supplied stream
     */
    Result<IngestionResult> process(const IngestionJob& job, std::istream& content,
                                    std::stop_token stop = {},
                                    const ProgressCallback& progress = {});

    /**
     * @brief Delete a document and its chunks, serialized with this pipeline's writes
     * @return false if no such document
     */
    Result<bool> deleteDocument(const std::string& documentId);

    [[nodiscard]] const chunking::ChunkerRegistry& chunkers() const { return chunkers_; }

private:
    Result<IngestionResult> run(const IngestionJob& job, std::istream& content,
                                const config::SettingsSnapshot& settings,
                                std::stop_token stop, const ProgressCallback& progress);

    Error settle(const IngestionJob& job, const Error& error, std::stop_token stop);
    void recordFailure(const IngestionJob& job, const Error& error);
    std::mutex& documentLock(const std::string& documentId);

    metadata::DocumentRepository& repository_;
    vector::SqliteVectorIndex& vectorIndex_;
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    std::shared_ptr<storage::IContentSource> contentSource_;
    const config::SettingsProvider& settings_;
    chunking::ChunkerRegistry chunkers_;

    std::array<std::mutex, 32> documentLocks_;
};

/**
 * @brief Content type guess from a file extension
 */
std::string contentTypeForExtension(const std::string& extension);

} // namespace sift::ingest
