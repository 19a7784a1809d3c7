#include <sift/config/config_helpers.h>
#include <sift/core/uuid.h>
#include <sift/ingest/ingestion_service.h>
#include <sift/metadata/path_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sift::ingest {

IngestionService::IngestionService(metadata::DocumentRepository& repository,
                                   IngestionPipeline& pipeline,
                                   const config::SettingsProvider& settings,
                                   std::shared_ptr<IProgressObserver> observer)
    : repository_(repository), pipeline_(pipeline), settings_(settings),
      queue_(settings.snapshot()->ingestion.queueCapacity),
      workers_(queue_, pipeline,
               static_cast<size_t>(std::max(1, settings.snapshot()->ingestion.parallelWorkers)),
               std::move(observer)) {}

IngestionService::~IngestionService() {
    stop();
}

void IngestionService::start() {
    stopped_ = false;
    workers_.start();
}

void IngestionService::stop() {
    stopped_ = true;
    workers_.stop();
}

Result<metadata::Document> IngestionService::registerDocument(const std::string& path,
                                                              const IngestionOptions& options,
                                                              const std::string& documentId) {
    if (options.scopeId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Scope id is required"};
    }

    auto normalized = metadata::normalizeLogicalPath(path);
    auto ext = metadata::fileExtension(metadata::fileNameFromPath(normalized));
    const auto& allowed = settings_.snapshot()->ingestion.allowedExtensions;
    if (!allowed.empty() &&
        std::none_of(allowed.begin(), allowed.end(),
                     [&](const std::string& a) { return config::iequals(a, ext); })) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("File type '{}' is not allowed", ext.empty() ? "(none)" : ext)};
    }

    metadata::Document doc;
    if (!documentId.empty()) {
        auto existing = repository_.findById(documentId);
        if (!existing)
            return existing.error();
        if (existing.value()) {
            doc = *existing.value();
        }
    }
    if (doc.id.empty()) {
        doc.id = documentId.empty() ? core::generateUUID() : documentId;
        doc.createdAt = std::chrono::system_clock::now();
    }

    doc.scopeId = options.scopeId;
    doc.path = normalized;
    doc.fileName = metadata::fileNameFromPath(doc.path);
    doc.contentType = contentTypeForExtension(metadata::fileExtension(doc.fileName));
    doc.status = metadata::DocumentStatus::Pending;
    doc.errorMessage.clear();
    for (const auto& [k, v] : options.metadata) {
        doc.metadata[k] = v;
    }

    auto r = repository_.upsert(doc);
    if (!r)
        return r.error();
    spdlog::debug("Registered document {} at {}", doc.id, config::sanitize_for_terminal(doc.path));
    return doc;
}

Result<std::string> IngestionService::submit(const std::string& documentId,
                                             const std::string& path,
                                             const IngestionOptions& options,
                                             const SubmitOptions& submitOptions) {
    if (documentId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Document id is required"};
    }
    if (stopped_) {
        return Error{ErrorCode::SystemShutdown, "Ingestion service is stopped"};
    }

    if (submitOptions.cancelExisting && queue_.cancelForDocument(documentId)) {
        spdlog::info("Cancelled in-flight ingestion for document {}", documentId);
    }

    IngestionJob job;
    job.jobId = core::generateUUID();
    job.documentId = documentId;
    job.path = metadata::normalizeLogicalPath(path);
    job.options = options;
    job.batchId = submitOptions.batchId;

    auto jobId = job.jobId;
    auto r = submitOptions.enqueueTimeout.count() > 0
                 ? queue_.enqueue(std::move(job), submitOptions.enqueueTimeout)
                 : queue_.tryEnqueue(std::move(job));
    if (!r) {
        spdlog::warn("Could not queue document {}: {}", documentId, r.error().message);
        return r.error();
    }
    return jobId;
}

std::optional<IngestionJobStatus> IngestionService::status(const std::string& jobId) const {
    return queue_.status(jobId);
}

std::vector<IngestionJobStatus>
IngestionService::batchStatuses(const std::string& batchId) const {
    return queue_.batchStatuses(batchId);
}

bool IngestionService::cancelForDocument(const std::string& documentId) {
    return queue_.cancelForDocument(documentId);
}

size_t IngestionService::queueDepth() const {
    return queue_.size();
}

Result<bool> IngestionService::deleteDocument(const std::string& documentId) {
    queue_.cancelForDocument(documentId);
    return pipeline_.deleteDocument(documentId);
}

} // namespace sift::ingest
