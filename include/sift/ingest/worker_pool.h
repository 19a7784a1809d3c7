#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>
#include <sift/ingest/ingestion_pipeline.h>
#include <sift/ingest/ingestion_queue.h>

namespace sift::ingest {

/**
 * @brief Fixed set of threads draining an IngestionQueue through an IngestionPipeline.
 *
 * Each job runs under its own stop_source, chained to the pool's shutdown source.
 * stop() cancels in-flight jobs and leaves queued ones in the queue.
 *
 * Status snapshots reach the observer from a separate notifier thread. Workers only
 * append to a bounded backlog; when it is full the oldest snapshot is dropped.
 */
class IngestionWorkerPool {
public:
    static constexpr size_t kDefaultNotificationBacklog = 256;

    IngestionWorkerPool(IngestionQueue& queue, IngestionPipeline& pipeline, size_t workerCount,
                        std::shared_ptr<IProgressObserver> observer = nullptr,
                        size_t notificationBacklog = kDefaultNotificationBacklog);
    ~IngestionWorkerPool();

    IngestionWorkerPool(const IngestionWorkerPool&) = delete;
    IngestionWorkerPool& operator=(const IngestionWorkerPool&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t workerCount() const { return workerCount_; }
    [[nodiscard]] size_t activeJobs() const { return activeJobs_.load(); }
    [[nodiscard]] size_t droppedNotifications() const { return droppedNotifications_.load(); }

private:
    void workerLoop(std::stop_token shutdown);
    void runJob(QueuedJob& queued);
    void notify(const std::optional<IngestionJobStatus>& status);
    void notifierLoop(std::stop_token stop);

    IngestionQueue& queue_;
    IngestionPipeline& pipeline_;
    size_t workerCount_;
    std::shared_ptr<IProgressObserver> observer_;

    std::stop_source shutdown_;
    std::vector<std::jthread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> activeJobs_{0};

    const size_t notificationBacklog_;
    std::mutex notifyMutex_;
    std::condition_variable_any notifyCv_;
    std::deque<IngestionJobStatus> pending_;
    std::atomic<size_t> droppedNotifications_{0};
    std::jthread notifier_;
};

} // namespace sift::ingest
