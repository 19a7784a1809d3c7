#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include <sift/core/types.h>
#include <sift/ingest/ingestion_types.h>

namespace sift::ingest {

/**
 * @brief A dequeued job together with its own cancellation scope
 */
struct QueuedJob {
    IngestionJob job;
    std::stop_source stop;
};

/**
 * @brief Bounded FIFO of ingestion jobs with job status and per-document cancellation.
 *
 * Every accepted job gets a stop_source at enqueue time. The document map points at
 * the most recently accepted job for each document, so cancelling a document reaches
 * that job whether it is still queued or already running.
 */
class IngestionQueue {
public:
    explicit IngestionQueue(size_t capacity = 1000);

    IngestionQueue(const IngestionQueue&) = delete;
    IngestionQueue& operator=(const IngestionQueue&) = delete;

    /**
     * @brief Accept a job or fail immediately with QueueFull
     */
    Result<void> tryEnqueue(IngestionJob job);

    /**
     * @brief Wait up to timeout for space, then fail with QueueFull
     */
    Result<void> enqueue(IngestionJob job, std::chrono::milliseconds timeout);

    /**
     * @brief Block until a job is available or stop is requested
     */
    std::optional<QueuedJob> dequeue(std::stop_token stop);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }

    // Status tracking. Each mutator returns the updated status, or nullopt when the
    // job is unknown or already terminal.
    std::optional<IngestionJobStatus> markProcessing(const std::string& jobId);
    std::optional<IngestionJobStatus> updateProgress(const std::string& jobId,
                                                     IngestionPhase phase, int percent);
    std::optional<IngestionJobStatus> markCompleted(const std::string& jobId);
    std::optional<IngestionJobStatus> markFailed(const std::string& jobId,
                                                 const std::string& message);
    std::optional<IngestionJobStatus> markCancelled(const std::string& jobId,
                                                    const std::string& message = "Cancelled");

    std::optional<IngestionJobStatus> status(const std::string& jobId) const;
    std::vector<IngestionJobStatus> allStatuses() const;
    std::vector<IngestionJobStatus> batchStatuses(const std::string& batchId) const;

    /**
     * @brief Drop terminal statuses completed more than maxAge ago
     * @return number removed
     */
    size_t cleanupOldStatuses(std::chrono::milliseconds maxAge);

    /**
     * @brief Request stop for the current job of a document
     * @return false when no job is tracked for the document
     */
    bool cancelForDocument(const std::string& documentId);

    /**
     * @brief Current job id for a document, if any
     */
    std::optional<std::string> activeJobFor(const std::string& documentId) const;

    /**
     * @brief Forget the document mapping if it still points at jobId
     */
    void releaseDocument(const std::string& documentId, const std::string& jobId);

private:
    template <typename Fn>
    std::optional<IngestionJobStatus> mutateStatus(const std::string& jobId, Fn&& fn);

    Result<void> pushLocked(IngestionJob job);

    const size_t capacity_;

    mutable std::mutex queueMutex_;
    std::condition_variable_any notEmpty_;
    std::condition_variable_any notFull_;
    std::deque<QueuedJob> queue_;

    mutable std::mutex statusMutex_;
    std::unordered_map<std::string, IngestionJobStatus> statuses_;

    struct ActiveJob {
        std::string jobId;
        std::stop_source stop;
    };
    mutable std::mutex activeMutex_;
    std::unordered_map<std::string, ActiveJob> activeByDocument_;
};

} // namespace sift::ingest
