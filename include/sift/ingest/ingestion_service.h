#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sift/config/settings.h>
#include <sift/ingest/ingestion_pipeline.h>
#include <sift/ingest/ingestion_queue.h>
#include <sift/ingest/worker_pool.h>
#include <sift/metadata/document_repository.h>

namespace sift::ingest {

struct SubmitOptions {
    std::optional<std::string> batchId;
    bool cancelExisting = true;                      ///< Cancel the document's current job first
    std::chrono::milliseconds enqueueTimeout{0};     ///< 0 fails fast with QueueFull
};

/**
 * @brief Entry point for callers: register documents, queue work, query and cancel
 */
class IngestionService {
public:
    IngestionService(metadata::DocumentRepository& repository, IngestionPipeline& pipeline,
                     const config::SettingsProvider& settings,
                     std::shared_ptr<IProgressObserver> observer = nullptr);
    ~IngestionService();

    void start();

    /**
     * @brief Stop workers; queued jobs stay queued and submit() fails with SystemShutdown
     */
    void stop();

    /**
     * @brief Create (or reset) a Pending document row for a logical path
     * @param documentId existing id to reuse; a new UUID when empty
     * @return InvalidArgument without a scope or for an extension outside the allowed list
     */
    Result<metadata::Document> registerDocument(const std::string& path,
                                                const IngestionOptions& options,
                                                const std::string& documentId = {});

    /**
     * @brief Queue a job for a registered document
     * @return the job id, QueueFull, or SystemShutdown after stop()
     */
    Result<std::string> submit(const std::string& documentId, const std::string& path,
                               const IngestionOptions& options,
                               const SubmitOptions& submitOptions = {});

    std::optional<IngestionJobStatus> status(const std::string& jobId) const;
    std::vector<IngestionJobStatus> batchStatuses(const std::string& batchId) const;

    /**
     * @return false when nothing was tracked for the document
     */
    bool cancelForDocument(const std::string& documentId);

    size_t queueDepth() const;

    /**
     * @brief Cancel any job, then delete the document with its chunks and vectors
     */
    Result<bool> deleteDocument(const std::string& documentId);

    IngestionQueue& queue() { return queue_; }
    const chunking::ChunkerRegistry& chunkers() const { return pipeline_.chunkers(); }
    metadata::DocumentRepository& repository() { return repository_; }

private:
    metadata::DocumentRepository& repository_;
    IngestionPipeline& pipeline_;
    const config::SettingsProvider& settings_;
    IngestionQueue queue_;
    IngestionWorkerPool workers_;
    std::atomic<bool> stopped_{false};
};

} // namespace sift::ingest
