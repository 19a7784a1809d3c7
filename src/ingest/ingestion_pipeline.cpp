#include <sift/config/config_helpers.h>
#include <sift/crypto/hasher.h>
#include <sift/extraction/document_parser.h>
#include <sift/ingest/ingestion_pipeline.h>
#include <sift/metadata/path_utils.h>

#include <spdlog/spdlog.h>

#include <functional>
#include <map>

namespace sift::ingest {

namespace {

constexpr uint64_t kBytesPerMb = 1024ull * 1024ull;

Error cancelled() {
    return Error{ErrorCode::OperationCancelled, "Ingestion cancelled"};
}

void report(const ProgressCallback& progress, IngestionPhase phase, int percent) {
    if (progress) {
        progress(phase, percent);
    }
}

} // namespace

const char* jobStateToString(JobState state) {
    switch (state) {
        case JobState::Queued:
            return "Queued";
        case JobState::Processing:
            return "Processing";
        case JobState::Completed:
            return "Completed";
        case JobState::Failed:
            return "Failed";
        case JobState::Cancelled:
            return "Cancelled";
    }
    return "Queued";
}

const char* ingestionPhaseToString(IngestionPhase phase) {
    switch (phase) {
        case IngestionPhase::Parsing:
            return "Parsing";
        case IngestionPhase::Chunking:
            return "Chunking";
        case IngestionPhase::Embedding:
            return "Embedding";
        case IngestionPhase::Storing:
            return "Storing";
        case IngestionPhase::Complete:
            return "Complete";
    }
    return "Parsing";
}

std::string contentTypeForExtension(const std::string& extension) {
    static const std::map<std::string, std::string> kTypes = {
        {".txt", "text/plain"},       {".text", "text/plain"},
        {".log", "text/plain"},       {".md", "text/markdown"},
        {".markdown", "text/markdown"}, {".csv", "text/csv"},
        {".json", "application/json"}, {".xml", "application/xml"},
        {".yaml", "application/yaml"}, {".yml", "application/yaml"},
        {".pdf", "application/pdf"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".pptx",
         "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    };
    auto it = kTypes.find(config::to_lower(extension));
    return it == kTypes.end() ? "application/octet-stream" : it->second;
}

IngestionPipeline::IngestionPipeline(metadata::DocumentRepository& repository,
                                     vector::SqliteVectorIndex& vectorIndex,
                                     std::shared_ptr<vector::IEmbeddingProvider> embedder,
                                     std::shared_ptr<storage::IContentSource> contentSource,
                                     const config::SettingsProvider& settings)
    : repository_(repository), vectorIndex_(vectorIndex), embedder_(std::move(embedder)),
      contentSource_(std::move(contentSource)), settings_(settings), chunkers_(embedder_) {}

std::mutex& IngestionPipeline::documentLock(const std::string& documentId) {
    return documentLocks_[std::hash<std::string>{}(documentId) % documentLocks_.size()];
}

Result<IngestionResult> IngestionPipeline::process(const IngestionJob& job, std::stop_token stop,
                                                   const ProgressCallback& progress) {
    if (!contentSource_) {
        return settle(job, Error{ErrorCode::NotInitialized, "No content source configured"},
                      stop);
    }

    auto stream = contentSource_->open(job.path);
    if (!stream)
        return settle(job, stream.error(), stop);
    return process(job, *stream.value(), stop, progress);
}

Result<IngestionResult> IngestionPipeline::process(const IngestionJob& job, std::istream& content,
                                                   std::stop_token stop,
                                                   const ProgressCallback& progress) {
    auto settings = settings_.snapshot();
    auto started = std::chrono::steady_clock::now();

    Result<IngestionResult> result = Error{ErrorCode::Unknown};
    try {
        result = run(job, content, settings, stop, progress);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (!result)
        return settle(job, result.error(), stop);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto out = std::move(result).value();
    out.duration = elapsed;
    spdlog::info("Ingested {} ({} chunks) in {}ms",
                 config::sanitize_for_terminal(job.path), out.chunkCount, elapsed.count());
    return out;
}

Error IngestionPipeline::settle(const IngestionJob& job, const Error& error,
                               std::stop_token stop) {
    // Once stopped, the job has been cancelled or superseded and any error is a cancellation
    if (error.code != ErrorCode::OperationCancelled && !stop.stop_requested()) {
        recordFailure(job, error);
        return error;
    }

    spdlog::debug("Ingestion of {} cancelled ({})", job.documentId, error.message);
    // Only this run's Processing mark is undone; a newer run's outcome stays
    auto r = repository_.transitionStatus(job.documentId, metadata::DocumentStatus::Processing,
                                          metadata::DocumentStatus::Pending);
    if (!r) {
        spdlog::warn("Failed to reset {} to Pending: {}", job.documentId, r.error().message);
    }
    if (error.code == ErrorCode::OperationCancelled)
        return error;
    return Error{ErrorCode::OperationCancelled, "Ingestion cancelled: " + error.message};
}

Result<bool> IngestionPipeline::deleteDocument(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(documentLock(documentId));
    return repository_.deleteById(documentId);
}

void IngestionPipeline::recordFailure(const IngestionJob& job, const Error& error) {
    spdlog::error("Ingestion failed for {} ({}): {}", config::sanitize_for_terminal(job.path),
                  job.documentId, error.message);
    auto r = repository_.updateStatus(job.documentId, metadata::DocumentStatus::Failed,
                                      error.message);
    if (!r) {
        spdlog::warn("Could not record failure for {}: {}", job.documentId, r.error().message);
    }
}

Result<IngestionResult> IngestionPipeline::run(const IngestionJob& job, std::istream& content,
                                               const config::SettingsSnapshot& settings,
                                               std::stop_token stop,
                                               const ProgressCallback& progress) {
    if (stop.stop_requested())
        return cancelled();

    // Hashing and parsing both need the full byte range
    const uint64_t maxBytes =
        static_cast<uint64_t>(std::max(0, settings->ingestion.maxFileSizeMb)) * kBytesPerMb;
    auto buffered = storage::bufferStream(content, maxBytes);
    if (!buffered) {
        if (buffered.error().code == ErrorCode::ResourceExhausted) {
            return Error{ErrorCode::ResourceExhausted,
                         fmt::format("File exceeds maximum size of {} MB",
                                     settings->ingestion.maxFileSizeMb)};
        }
        return buffered.error();
    }
    const ByteVector bytes = std::move(buffered).value();
    const std::string contentHash = crypto::SHA256Hasher::hash(std::span<const std::byte>(bytes));

    const std::string path = metadata::normalizeLogicalPath(job.path);
    const std::string fileName = metadata::fileNameFromPath(path);

    auto existing = repository_.findById(job.documentId);
    if (!existing)
        return existing.error();

    metadata::Document doc;
    if (existing.value()) {
        doc = *existing.value();
    } else {
        doc.id = job.documentId;
        doc.createdAt = std::chrono::system_clock::now();
    }
    if (!job.options.scopeId.empty()) {
        doc.scopeId = job.options.scopeId;
    }
    doc.path = path;
    doc.fileName = fileName;
    doc.contentType = contentTypeForExtension(metadata::fileExtension(fileName));
    doc.contentHash = contentHash;
    doc.sizeBytes = static_cast<int64_t>(bytes.size());
    doc.status = metadata::DocumentStatus::Processing;
    doc.errorMessage.clear();
    for (const auto& [k, v] : job.options.metadata) {
        doc.metadata[k] = v;
    }

    {
        // Writes for a document are serialized with deleteDocument
        std::lock_guard<std::mutex> lock(documentLock(doc.id));
        if (stop.stop_requested())
            return cancelled();
        auto processing = repository_.upsert(doc);
        if (!processing)
            return processing.error();
    }

    // Parsing
    if (stop.stop_requested())
        return cancelled();
    report(progress, IngestionPhase::Parsing, 10);
    auto parsed = extraction::parseDocument(bytes, fileName, stop);
    if (!parsed)
        return parsed.error();
    auto parseResult = std::move(parsed).value();
    for (const auto& w : parseResult.warnings) {
        spdlog::warn("{}: {}", config::sanitize_for_terminal(fileName), w);
    }

    // Chunking
    if (stop.stop_requested())
        return cancelled();
    report(progress, IngestionPhase::Chunking, 30);
    config::ChunkingSettings chunking = settings->chunking;
    if (job.options.chunkingStrategy && !job.options.chunkingStrategy->empty()) {
        chunking.strategy = *job.options.chunkingStrategy;
    }
    auto& strategy = chunkers_.resolve(chunking.strategy);
    auto chunked = strategy.chunk(parseResult, chunking, stop);
    if (!chunked)
        return chunked.error();
    auto chunks = std::move(chunked).value();
    if (chunks.empty()) {
        std::string message = "No extractable content";
        if (!parseResult.warnings.empty()) {
            message += ": " + parseResult.warnings.front();
        }
        return Error{ErrorCode::InvalidData, message};
    }

    // Embedding
    if (!embedder_) {
        return Error{ErrorCode::NotInitialized, "No embedding provider configured"};
    }
    report(progress, IngestionPhase::Embedding, 40);
    const size_t batchSize = static_cast<size_t>(std::max(1, settings->embedding.batchSize));
    std::vector<vector::Embedding> embeddings;
    embeddings.reserve(chunks.size());
    for (size_t start = 0; start < chunks.size(); start += batchSize) {
        if (stop.stop_requested())
            return cancelled();
        size_t end = std::min(chunks.size(), start + batchSize);
        std::vector<std::string> texts;
        texts.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            texts.push_back(chunks[i].content);
        }
        auto batch = embedder_->embedBatch(texts, stop);
        if (!batch)
            return batch.error();
        if (batch.value().size() != texts.size()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Embedding provider returned {} vectors for {} chunks",
                                     batch.value().size(), texts.size())};
        }
        for (auto& e : std::move(batch).value()) {
            embeddings.push_back(std::move(e));
        }
        report(progress, IngestionPhase::Embedding,
               40 + static_cast<int>(40 * end / chunks.size()));
    }

    // Storing
    if (stop.stop_requested())
        return cancelled();
    report(progress, IngestionPhase::Storing, 90);

    const std::string modelId = embedder_->modelId();
    std::vector<metadata::ChunkRecord> records;
    std::vector<vector::VectorRecord> vectors;
    records.reserve(chunks.size());
    vectors.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        auto& c = chunks[i];
        metadata::ChunkRecord rec;
        rec.id = fmt::format("{}#{}", doc.id, c.index);
        rec.documentId = doc.id;
        rec.scopeId = doc.scopeId;
        rec.path = doc.path;
        rec.content = c.content;
        rec.chunkIndex = c.index;
        rec.tokenCount = c.tokenCount;
        rec.startOffset = static_cast<int64_t>(c.startOffset);
        rec.endOffset = static_cast<int64_t>(c.endOffset);
        rec.metadata = std::move(c.metadata);
        rec.metadata["documentId"] = doc.id;
        rec.metadata["scopeId"] = doc.scopeId;
        rec.metadata["modelId"] = modelId;

        vector::VectorRecord vec;
        vec.chunkId = rec.id;
        vec.documentId = doc.id;
        vec.scopeId = doc.scopeId;
        vec.path = doc.path;
        vec.modelId = modelId;
        vec.embedding = std::move(embeddings[i]);

        records.push_back(std::move(rec));
        vectors.push_back(std::move(vec));
    }

    doc.status = metadata::DocumentStatus::Ready;
    doc.errorMessage.clear();
    doc.lastIndexedAt = std::chrono::system_clock::now();
    doc.metadata[metadata::provenance::kChunkingStrategy] = strategy.name();
    if (job.options.chunkingStrategy && !job.options.chunkingStrategy->empty()) {
        doc.metadata[metadata::provenance::kChunkingStrategyOverride] = strategy.name();
    } else {
        doc.metadata.erase(metadata::provenance::kChunkingStrategyOverride);
    }
    doc.metadata[metadata::provenance::kChunkingMaxSize] = std::to_string(chunking.maxChunkSize);
    doc.metadata[metadata::provenance::kChunkingOverlap] = std::to_string(chunking.overlap);
    doc.metadata[metadata::provenance::kEmbeddingProvider] = settings->embedding.provider;
    doc.metadata[metadata::provenance::kEmbeddingModel] = settings->embedding.model;
    doc.metadata[metadata::provenance::kEmbeddingDimensions] =
        std::to_string(settings->embedding.dimensions);

    {
        std::lock_guard<std::mutex> lock(documentLock(doc.id));
        if (stop.stop_requested())
            return cancelled();
        auto stored = repository_.pool().withConnection([&](metadata::Database& db) {
            return db.transaction([&]() -> Result<void> {
                auto r = metadata::DocumentRepository::deleteChunks(db, doc.id);
                if (!r)
                    return r;
                r = metadata::DocumentRepository::insertChunks(db, records);
                if (!r)
                    return r;
                r = vectorIndex_.upsert(db, vectors);
                if (!r)
                    return r;
                auto upserted = metadata::DocumentRepository::upsert(db, doc);
                if (!upserted)
                    return upserted.error();
                return {};
            });
        });
        if (!stored)
            return stored.error();
    }

    report(progress, IngestionPhase::Complete, 100);

    IngestionResult result;
    result.documentId = doc.id;
    result.chunkCount = records.size();
    result.warnings = std::move(parseResult.warnings);
    return result;
}

} // namespace sift::ingest
