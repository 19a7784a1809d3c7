#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sift/core/types.h>

namespace sift::metadata {

enum class DocumentStatus { Pending, Processing, Ready, Failed };

const char* documentStatusToString(DocumentStatus status);
Result<DocumentStatus> parseDocumentStatus(std::string_view text);

/**
 * @brief Stored document row. One document owns many chunks.
 */
struct Document {
    std::string id;
    std::string scopeId;
    std::string path; ///< Normalized logical path
    std::string fileName;
    std::string contentType;
    std::string contentHash; ///< SHA-256 hex, empty until first hashed
    int64_t sizeBytes = 0;
    DocumentStatus status = DocumentStatus::Pending;
    std::string errorMessage;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> lastIndexedAt;
    Metadata metadata; ///< Includes IndexedWith:* provenance keys
};

/**
 * @brief Stored chunk row
 */
struct ChunkRecord {
    std::string id;
    std::string documentId;
    std::string scopeId;
    std::string path;
    std::string content;
    int chunkIndex = 0;
    int tokenCount = 0;
    int64_t startOffset = 0;
    int64_t endOffset = 0;
    Metadata metadata;
};

// Document metadata keys recording the settings a document was indexed with
namespace provenance {
inline constexpr const char* kChunkingStrategy = "IndexedWith:ChunkingStrategy";
inline constexpr const char* kChunkingMaxSize = "IndexedWith:ChunkingMaxSize";
inline constexpr const char* kChunkingOverlap = "IndexedWith:ChunkingOverlap";
// Present only when the job chose the strategy instead of the settings
inline constexpr const char* kChunkingStrategyOverride = "IndexedWith:ChunkingStrategyOverride";
inline constexpr const char* kEmbeddingProvider = "IndexedWith:EmbeddingProvider";
inline constexpr const char* kEmbeddingModel = "IndexedWith:EmbeddingModel";
inline constexpr const char* kEmbeddingDimensions = "IndexedWith:EmbeddingDimensions";
} // namespace provenance

// Metadata codec for the TEXT metadata columns
std::string encodeMetadata(const Metadata& metadata);
Metadata decodeMetadata(const std::string& json);

} // namespace sift::metadata
