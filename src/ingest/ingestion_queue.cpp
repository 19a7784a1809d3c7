#include <sift/core/uuid.h>
#include <sift/ingest/ingestion_queue.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sift::ingest {

IngestionQueue::IngestionQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

Result<void> IngestionQueue::pushLocked(IngestionJob job) {
    if (job.jobId.empty()) {
        job.jobId = core::generateUUID();
    }
    if (job.enqueuedAt == TimePoint{}) {
        job.enqueuedAt = std::chrono::system_clock::now();
    }

    QueuedJob entry{std::move(job), std::stop_source{}};

    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        IngestionJobStatus st;
        st.jobId = entry.job.jobId;
        st.documentId = entry.job.documentId;
        st.batchId = entry.job.batchId;
        st.state = JobState::Queued;
        statuses_[st.jobId] = std::move(st);
    }
    {
        std::lock_guard<std::mutex> lock(activeMutex_);
        activeByDocument_[entry.job.documentId] = ActiveJob{entry.job.jobId, entry.stop};
    }

    spdlog::debug("Queued document for ingestion: {} (Job ID: {})", entry.job.documentId,
                  entry.job.jobId);
    queue_.push_back(std::move(entry));
    return {};
}

Result<void> IngestionQueue::tryEnqueue(IngestionJob job) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (queue_.size() >= capacity_) {
            return Error{ErrorCode::QueueFull,
                         fmt::format("Ingestion queue is full ({} jobs)", capacity_)};
        }
        auto r = pushLocked(std::move(job));
        if (!r)
            return r;
    }
    notEmpty_.notify_one();
    return {};
}

Result<void> IngestionQueue::enqueue(IngestionJob job, std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!notFull_.wait_for(lock, timeout, [&] { return queue_.size() < capacity_; })) {
            return Error{ErrorCode::QueueFull,
                         fmt::format("Ingestion queue is full ({} jobs)", capacity_)};
        }
        auto r = pushLocked(std::move(job));
        if (!r)
            return r;
    }
    notEmpty_.notify_one();
    return {};
}

std::optional<QueuedJob> IngestionQueue::dequeue(std::stop_token stop) {
    std::optional<QueuedJob> out;
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!notEmpty_.wait(lock, stop, [&] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        out.emplace(std::move(queue_.front()));
        queue_.pop_front();
    }
    notFull_.notify_one();
    return out;
}

size_t IngestionQueue::size() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

template <typename Fn>
std::optional<IngestionJobStatus> IngestionQueue::mutateStatus(const std::string& jobId,
                                                               Fn&& fn) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    auto it = statuses_.find(jobId);
    if (it == statuses_.end() || isTerminal(it->second.state)) {
        return std::nullopt;
    }
    fn(it->second);
    return it->second;
}

std::optional<IngestionJobStatus> IngestionQueue::markProcessing(const std::string& jobId) {
    return mutateStatus(jobId, [](IngestionJobStatus& st) {
        st.state = JobState::Processing;
        st.phase = IngestionPhase::Parsing;
        st.percentComplete = 0;
        st.startedAt = std::chrono::system_clock::now();
    });
}

std::optional<IngestionJobStatus> IngestionQueue::updateProgress(const std::string& jobId,
                                                                 IngestionPhase phase,
                                                                 int percent) {
    return mutateStatus(jobId, [&](IngestionJobStatus& st) {
        st.phase = phase;
        st.percentComplete = std::clamp(percent, 0, 100);
    });
}

std::optional<IngestionJobStatus> IngestionQueue::markCompleted(const std::string& jobId) {
    return mutateStatus(jobId, [](IngestionJobStatus& st) {
        st.state = JobState::Completed;
        st.phase = IngestionPhase::Complete;
        st.percentComplete = 100;
        st.completedAt = std::chrono::system_clock::now();
    });
}

std::optional<IngestionJobStatus> IngestionQueue::markFailed(const std::string& jobId,
                                                             const std::string& message) {
    return mutateStatus(jobId, [&](IngestionJobStatus& st) {
        st.state = JobState::Failed;
        st.errorMessage = message;
        st.completedAt = std::chrono::system_clock::now();
    });
}

std::optional<IngestionJobStatus> IngestionQueue::markCancelled(const std::string& jobId,
                                                                const std::string& message) {
    return mutateStatus(jobId, [&](IngestionJobStatus& st) {
        st.state = JobState::Cancelled;
        st.errorMessage = message;
        st.completedAt = std::chrono::system_clock::now();
    });
}

std::optional<IngestionJobStatus> IngestionQueue::status(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    auto it = statuses_.find(jobId);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<IngestionJobStatus> IngestionQueue::allStatuses() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    std::vector<IngestionJobStatus> out;
    out.reserve(statuses_.size());
    for (const auto& [_, st] : statuses_) {
        out.push_back(st);
    }
    return out;
}

std::vector<IngestionJobStatus> IngestionQueue::batchStatuses(const std::string& batchId) const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    std::vector<IngestionJobStatus> out;
    for (const auto& [_, st] : statuses_) {
        if (st.batchId && *st.batchId == batchId) {
            out.push_back(st);
        }
    }
    return out;
}

size_t IngestionQueue::cleanupOldStatuses(std::chrono::milliseconds maxAge) {
    const auto cutoff = std::chrono::system_clock::now() - maxAge;
    std::lock_guard<std::mutex> lock(statusMutex_);
    size_t removed = 0;
    for (auto it = statuses_.begin(); it != statuses_.end();) {
        const auto& st = it->second;
        if (isTerminal(st.state) && st.completedAt && *st.completedAt < cutoff) {
            it = statuses_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Removed {} old ingestion statuses", removed);
    }
    return removed;
}

bool IngestionQueue::cancelForDocument(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(activeMutex_);
    auto it = activeByDocument_.find(documentId);
    if (it == activeByDocument_.end()) {
        return false;
    }
    // The job may finish concurrently; a stop request on a finished job is inert
    it->second.stop.request_stop();
    spdlog::debug("Cancellation requested for document {} (Job ID: {})", documentId,
                  it->second.jobId);
    return true;
}

std::optional<std::string> IngestionQueue::activeJobFor(const std::string& documentId) const {
    std::lock_guard<std::mutex> lock(activeMutex_);
    auto it = activeByDocument_.find(documentId);
    if (it == activeByDocument_.end()) {
        return std::nullopt;
    }
    return it->second.jobId;
}

void IngestionQueue::releaseDocument(const std::string& documentId, const std::string& jobId) {
    std::lock_guard<std::mutex> lock(activeMutex_);
    auto it = activeByDocument_.find(documentId);
    if (it != activeByDocument_.end() && it->second.jobId == jobId) {
        activeByDocument_.erase(it);
    }
}

} // namespace sift::ingest
