#include <sift/ingest/worker_pool.h>

#include <spdlog/spdlog.h>

namespace sift::ingest {

IngestionWorkerPool::IngestionWorkerPool(IngestionQueue& queue, IngestionPipeline& pipeline,
                                         size_t workerCount,
                                         std::shared_ptr<IProgressObserver> observer,
                                         size_t notificationBacklog)
    : queue_(queue), pipeline_(pipeline), workerCount_(workerCount == 0 ? 1 : workerCount),
      observer_(std::move(observer)),
      notificationBacklog_(notificationBacklog == 0 ? 1 : notificationBacklog) {}

IngestionWorkerPool::~IngestionWorkerPool() {
    stop();
}

void IngestionWorkerPool::start() {
    if (running_.exchange(true)) {
        return;
    }
    shutdown_ = std::stop_source{};
    if (observer_) {
        notifier_ = std::jthread([this](std::stop_token stop) { notifierLoop(stop); });
    }
    workers_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this, token = shutdown_.get_token()] { workerLoop(token); });
    }
    spdlog::info("Ingestion worker pool started with {} workers", workerCount_);
}

void IngestionWorkerPool::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    shutdown_.request_stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    // Waits for an observer call already in progress; undelivered snapshots are dropped
    if (notifier_.joinable()) {
        notifier_.request_stop();
        notifier_.join();
    }
    {
        std::lock_guard<std::mutex> lock(notifyMutex_);
        pending_.clear();
    }
    spdlog::info("Ingestion worker pool stopped ({} jobs left in queue)", queue_.size());
}

void IngestionWorkerPool::notify(const std::optional<IngestionJobStatus>& status) {
    if (!observer_ || !status) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(notifyMutex_);
        if (pending_.size() >= notificationBacklog_) {
            pending_.pop_front();
            ++droppedNotifications_;
        }
        pending_.push_back(*status);
    }
    notifyCv_.notify_one();
}

void IngestionWorkerPool::notifierLoop(std::stop_token stop) {
    for (;;) {
        IngestionJobStatus status;
        {
            std::unique_lock<std::mutex> lock(notifyMutex_);
            if (!notifyCv_.wait(lock, stop, [this] { return !pending_.empty(); })) {
                return;
            }
            status = std::move(pending_.front());
            pending_.pop_front();
        }
        try {
            observer_->onProgress(status);
        } catch (const std::exception& e) {
            spdlog::debug("Progress observer failed for job {}: {}", status.jobId, e.what());
        }
    }
}

void IngestionWorkerPool::workerLoop(std::stop_token shutdown) {
    while (!shutdown.stop_requested()) {
        auto next = queue_.dequeue(shutdown);
        if (!next) {
            continue;
        }
        // Shutdown reaches the job through its own scope
        std::stop_callback chain(shutdown, [&stop = next->stop] { stop.request_stop(); });
        ++activeJobs_;
        runJob(*next);
        --activeJobs_;
        queue_.releaseDocument(next->job.documentId, next->job.jobId);
    }
}

void IngestionWorkerPool::runJob(QueuedJob& queued) {
    const auto& job = queued.job;

    if (queued.stop.stop_requested()) {
        spdlog::debug("Job {} cancelled before start", job.jobId);
        notify(queue_.markCancelled(job.jobId, "Cancelled before processing"));
        return;
    }

    notify(queue_.markProcessing(job.jobId));
    spdlog::debug("Processing job {} for document {}", job.jobId, job.documentId);

    auto progress = [&](IngestionPhase phase, int percent) {
        notify(queue_.updateProgress(job.jobId, phase, percent));
    };

    Result<IngestionResult> result = Error{ErrorCode::Unknown};
    try {
        result = pipeline_.process(job, queued.stop.get_token(), progress);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (result) {
        notify(queue_.markCompleted(job.jobId));
        spdlog::debug("Job {} completed ({} chunks)", job.jobId, result.value().chunkCount);
    } else if (result.error().code == ErrorCode::OperationCancelled) {
        notify(queue_.markCancelled(job.jobId, result.error().message));
        spdlog::debug("Job {} cancelled", job.jobId);
    } else {
        notify(queue_.markFailed(job.jobId, result.error().message));
        spdlog::debug("Job {} failed: {}", job.jobId, result.error().message);
    }
}

} // namespace sift::ingest
