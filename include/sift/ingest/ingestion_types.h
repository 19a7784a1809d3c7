#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <sift/core/types.h>

namespace sift::ingest {

enum class JobState { Queued, Processing, Completed, Failed, Cancelled };

enum class IngestionPhase { Parsing, Chunking, Embedding, Storing, Complete };

const char* jobStateToString(JobState state);
const char* ingestionPhaseToString(IngestionPhase phase);

inline bool isTerminal(JobState state) {
    return state == JobState::Completed || state == JobState::Failed ||
           state == JobState::Cancelled;
}

/**
 * @brief Per-job options captured at submit time
 */
struct IngestionOptions {
    std::string scopeId;
    std::optional<std::string> chunkingStrategy; ///< Overrides the configured strategy
    Metadata metadata;                           ///< Merged into document metadata
};

struct IngestionJob {
    std::string jobId;
    std::string documentId;
    std::string path; ///< Logical path the content source resolves
    IngestionOptions options;
    std::optional<std::string> batchId;
    TimePoint enqueuedAt{};
};

struct IngestionJobStatus {
    std::string jobId;
    std::string documentId;
    std::optional<std::string> batchId;
    JobState state = JobState::Queued;
    IngestionPhase phase = IngestionPhase::Parsing;
    int percentComplete = 0;
    std::string errorMessage;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
};

struct IngestionResult {
    std::string documentId;
    size_t chunkCount = 0;
    std::chrono::milliseconds duration{0};
    std::vector<std::string> warnings;
};

using ProgressCallback = std::function<void(IngestionPhase phase, int percent)>;

/**
 * @brief Fire-and-forget sink for job progress.
 *
 * Called outside all locks. Exceptions are logged and dropped.
 */
class IProgressObserver {
public:
    virtual ~IProgressObserver() = default;
    virtual void onProgress(const IngestionJobStatus& status) = 0;
};

} // namespace sift::ingest
