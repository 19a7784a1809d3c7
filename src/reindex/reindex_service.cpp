#include <sift/config/config_helpers.h>
#include <sift/core/uuid.h>
#include <sift/crypto/hasher.h>
#include <sift/reindex/reindex_service.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sift::reindex {

namespace {

std::string lookup(const Metadata& metadata, const char* key) {
    auto it = metadata.find(key);
    return it == metadata.end() ? std::string{} : it->second;
}

// Explicit request, then the document's own override, then the settings
std::string requestedStrategy(const metadata::Document& doc,
                              const config::ChunkingSettings& chunking,
                              const std::optional<std::string>& strategy) {
    if (strategy && !strategy->empty())
        return *strategy;
    auto stored = lookup(doc.metadata, metadata::provenance::kChunkingStrategyOverride);
    return stored.empty() ? chunking.strategy : stored;
}

std::string shortHash(const std::string& hash) {
    return hash.substr(0, std::min<size_t>(8, hash.size()));
}

} // namespace

const char* reindexReasonToString(ReindexReason reason) {
    switch (reason) {
        case ReindexReason::Unchanged:
            return "Unchanged";
        case ReindexReason::ContentChanged:
            return "ContentChanged";
        case ReindexReason::ChunkingSettingsChanged:
            return "ChunkingSettingsChanged";
        case ReindexReason::EmbeddingSettingsChanged:
            return "EmbeddingSettingsChanged";
        case ReindexReason::Forced:
            return "Forced";
        case ReindexReason::FileNotFound:
            return "FileNotFound";
        case ReindexReason::NeverIndexed:
            return "NeverIndexed";
        case ReindexReason::Error:
            return "Error";
    }
    return "Error";
}

const char* reindexActionToString(ReindexAction action) {
    switch (action) {
        case ReindexAction::Enqueued:
            return "Enqueued";
        case ReindexAction::Skipped:
            return "Skipped";
        case ReindexAction::Failed:
            return "Failed";
    }
    return "Failed";
}

std::string chunkingSettingsKey(const config::ChunkingSettings& settings) {
    return fmt::format("{}:{}:{}", settings.strategy, settings.maxChunkSize, settings.overlap);
}

std::string embeddingSettingsKey(const config::EmbeddingSettings& settings) {
    return fmt::format("{}:{}", settings.provider, settings.model);
}

ReindexService::ReindexService(metadata::DocumentRepository& repository,
                               std::shared_ptr<storage::IContentSource> contentSource,
                               ingest::IngestionService& ingestion,
                               const config::SettingsProvider& settings)
    : repository_(repository), contentSource_(std::move(contentSource)), ingestion_(ingestion),
      settings_(settings) {}

ReindexCheck ReindexService::evaluate(const metadata::Document& doc,
                                      const config::Settings& settings, bool force,
                                      bool detectSettingsChanges,
                                      const std::optional<std::string>& strategy) {
    ReindexCheck check;
    check.documentId = doc.id;
    check.storedHash = doc.contentHash;

    if (force) {
        check.needsReindex = true;
        check.reason = ReindexReason::Forced;
        return check;
    }

    auto exists = contentSource_->exists(doc.path);
    if (!exists) {
        check.reason = ReindexReason::Error;
        check.errorMessage = exists.error().message;
        return check;
    }
    if (!exists.value()) {
        check.reason = ReindexReason::FileNotFound;
        return check;
    }

    auto stream = contentSource_->open(doc.path);
    if (!stream) {
        check.reason = stream.error().code == ErrorCode::FileNotFound ? ReindexReason::FileNotFound
                                                                      : ReindexReason::Error;
        check.errorMessage = stream.error().message;
        return check;
    }
    auto bytes = storage::bufferStream(*stream.value());
    if (!bytes) {
        check.reason = ReindexReason::Error;
        check.errorMessage = "Hash computation failed: " + bytes.error().message;
        return check;
    }
    check.currentHash = crypto::SHA256Hasher::hash(std::span<const std::byte>(bytes.value()));

    if (doc.contentHash.empty()) {
        check.needsReindex = true;
        check.reason = ReindexReason::NeverIndexed;
        return check;
    }
    if (!config::iequals(check.currentHash, doc.contentHash)) {
        check.needsReindex = true;
        check.reason = ReindexReason::ContentChanged;
        return check;
    }

    if (detectSettingsChanges) {
        auto storedModel = lookup(doc.metadata, metadata::provenance::kEmbeddingModel);
        if (!storedModel.empty()) {
            check.storedEmbeddingKey = fmt::format(
                "{}:{}", lookup(doc.metadata, metadata::provenance::kEmbeddingProvider),
                storedModel);
            check.currentEmbeddingKey = embeddingSettingsKey(settings.embedding);
            if (!config::iequals(check.storedEmbeddingKey, check.currentEmbeddingKey)) {
                check.needsReindex = true;
                check.reason = ReindexReason::EmbeddingSettingsChanged;
                return check;
            }
        }

        auto storedStrategy = lookup(doc.metadata, metadata::provenance::kChunkingStrategy);
        if (!storedStrategy.empty()) {
            check.storedChunkingKey = fmt::format(
                "{}:{}:{}", storedStrategy,
                lookup(doc.metadata, metadata::provenance::kChunkingMaxSize),
                lookup(doc.metadata, metadata::provenance::kChunkingOverlap));
            auto live = settings.chunking;
            live.strategy = ingestion_.chunkers().resolvedName(
                requestedStrategy(doc, settings.chunking, strategy));
            check.currentChunkingKey = chunkingSettingsKey(live);
            if (!config::iequals(check.storedChunkingKey, check.currentChunkingKey)) {
                check.needsReindex = true;
                check.reason = ReindexReason::ChunkingSettingsChanged;
                return check;
            }
        }
    }

    if (!doc.lastIndexedAt || doc.status != metadata::DocumentStatus::Ready) {
        check.needsReindex = true;
        check.reason = ReindexReason::NeverIndexed;
        return check;
    }

    check.reason = ReindexReason::Unchanged;
    return check;
}

Result<ReindexCheck> ReindexService::checkDocument(const std::string& documentId) {
    auto found = repository_.findById(documentId);
    if (!found)
        return found.error();
    if (!found.value()) {
        return Error{ErrorCode::NotFound, "Document not found: " + documentId};
    }
    auto settings = settings_.snapshot();
    return evaluate(*found.value(), *settings, false, true, std::nullopt);
}

Result<std::vector<metadata::Document>>
ReindexService::selectDocuments(const ReindexOptions& options) {
    if (options.documentIds.empty()) {
        metadata::DocumentQuery query;
        query.scopeId = options.scopeId;
        return repository_.list(query);
    }

    std::vector<metadata::Document> docs;
    for (const auto& id : options.documentIds) {
        auto found = repository_.findById(id);
        if (!found)
            return found.error();
        if (!found.value()) {
            spdlog::warn("Reindex requested for unknown document {}", id);
            continue;
        }
        if (options.scopeId && found.value()->scopeId != *options.scopeId) {
            continue;
        }
        docs.push_back(*found.value());
    }
    return docs;
}

ReindexDocumentResult ReindexService::enqueue(const metadata::Document& doc,
                                              const ReindexOptions& options,
                                              const std::string& batchId, ReindexReason reason) {
    ReindexDocumentResult out;
    out.documentId = doc.id;
    out.fileName = doc.fileName;
    out.reason = reason;

    auto cleared = repository_.deleteChunks(doc.id);
    if (cleared) {
        cleared = repository_.updateStatus(doc.id, metadata::DocumentStatus::Pending);
    }
    if (!cleared) {
        out.action = ReindexAction::Failed;
        out.reason = ReindexReason::Error;
        out.errorMessage = cleared.error().message;
        return out;
    }

    ingest::IngestionOptions ingestOptions;
    ingestOptions.scopeId = doc.scopeId;
    if (options.strategy && !options.strategy->empty()) {
        ingestOptions.chunkingStrategy = options.strategy;
    } else if (auto kept = lookup(doc.metadata, metadata::provenance::kChunkingStrategyOverride);
               !kept.empty()) {
        ingestOptions.chunkingStrategy = kept;
    }

    ingest::SubmitOptions submitOptions;
    submitOptions.batchId = batchId;

    auto jobId = ingestion_.submit(doc.id, doc.path, ingestOptions, submitOptions);
    if (!jobId) {
        out.action = ReindexAction::Failed;
        out.reason = ReindexReason::Error;
        out.errorMessage = jobId.error().message;
        return out;
    }

    spdlog::info("Enqueued document {} ({}) for reindex, reason: {}", doc.id,
                 config::sanitize_for_terminal(doc.fileName), reindexReasonToString(reason));
    out.action = ReindexAction::Enqueued;
    out.jobId = jobId.value();
    return out;
}

Result<ReindexResult> ReindexService::reindex(const ReindexOptions& options,
                                              std::stop_token stop) {
    spdlog::info("Starting reindex: scope={}, force={}, detectSettingsChanges={}",
                 options.scopeId.value_or("*"), options.force, options.detectSettingsChanges);

    auto settings = settings_.snapshot();
    ReindexResult result;
    result.batchId = core::generateUUID();

    auto docs = selectDocuments(options);
    if (!docs)
        return docs.error();

    for (const auto& doc : docs.value()) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Reindex cancelled"};
        }

        ReindexDocumentResult entry;
        try {
            auto check = evaluate(doc, *settings, options.force, options.detectSettingsChanges,
                                  options.strategy);
            if (check.needsReindex) {
                if (check.reason == ReindexReason::ContentChanged) {
                    spdlog::info("Document {} content hash changed (stored={}, current={})",
                                 doc.id, shortHash(check.storedHash),
                                 shortHash(check.currentHash));
                }
                entry = enqueue(doc, options, result.batchId, check.reason);
            } else {
                entry.documentId = doc.id;
                entry.fileName = doc.fileName;
                entry.reason = check.reason;
                entry.errorMessage = check.errorMessage;
                entry.action = check.reason == ReindexReason::Error ? ReindexAction::Failed
                                                                    : ReindexAction::Skipped;
                if (check.reason == ReindexReason::FileNotFound) {
                    spdlog::warn("Document {} file not found at {}", doc.id,
                                 config::sanitize_for_terminal(doc.path));
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("Error evaluating document {} for reindex: {}", doc.id, e.what());
            entry.documentId = doc.id;
            entry.fileName = doc.fileName;
            entry.action = ReindexAction::Failed;
            entry.reason = ReindexReason::Error;
            entry.errorMessage = e.what();
        }

        switch (entry.action) {
            case ReindexAction::Enqueued:
                ++result.enqueuedCount;
                break;
            case ReindexAction::Skipped:
                ++result.skippedCount;
                break;
            case ReindexAction::Failed:
                ++result.failedCount;
                break;
        }
        ++result.reasonCounts[entry.reason];
        result.documents.push_back(std::move(entry));
    }
    result.totalDocuments = result.documents.size();

    spdlog::info("Reindex completed: total={}, enqueued={}, skipped={}, failed={}",
                 result.totalDocuments, result.enqueuedCount, result.skippedCount,
                 result.failedCount);
    return result;
}

} // namespace sift::reindex
