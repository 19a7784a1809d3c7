#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sift/core/types.h>
#include <sift/metadata/connection_pool.h>

namespace sift::vector {

/**
 * @brief Filters shared by vector and keyword retrieval
 */
struct SearchFilter {
    std::string scopeId;
    std::optional<std::string> pathPrefix; ///< Folder prefix over logical paths
    std::optional<std::string> documentId;
};

struct VectorRecord {
    std::string chunkId;
    std::string documentId;
    std::string scopeId;
    std::string path;
    std::string modelId;
    std::vector<float> embedding;
};

struct VectorMatch {
    std::string chunkId;
    std::string documentId;
    std::string content;
    std::string path;
    float distance = 0.0f; ///< Cosine distance, 0 means identical direction
};

/**
 * @brief Similarity index over chunk embeddings
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    virtual Result<void> upsert(const std::vector<VectorRecord>& records) = 0;

    /**
     * @brief Nearest chunks by cosine distance, ascending
     */
    virtual Result<std::vector<VectorMatch>> search(const std::vector<float>& query, size_t topK,
                                                    const SearchFilter& filter) = 0;

    virtual Result<void> deleteByDocument(const std::string& documentId) = 0;

    virtual size_t dimensions() const = 0;
};

/**
 * @brief Exact cosine search over float32 BLOBs in the chunk_vectors table.
 *
 * Every call takes its own pooled connection. The Database& overload of upsert lets
 * the ingestion pipeline write vectors inside its storing transaction.
 */
class SqliteVectorIndex : public IVectorIndex {
public:
    SqliteVectorIndex(metadata::ConnectionPool& pool, size_t expectedDimensions);

    Result<void> upsert(const std::vector<VectorRecord>& records) override;
    Result<void> upsert(metadata::Database& db, const std::vector<VectorRecord>& records);

    Result<std::vector<VectorMatch>> search(const std::vector<float>& query, size_t topK,
                                            const SearchFilter& filter) override;

    Result<void> deleteByDocument(const std::string& documentId) override;
    Result<void> deleteByDocument(metadata::Database& db, const std::string& documentId);

    size_t dimensions() const override { return expectedDimensions_; }

private:
    metadata::ConnectionPool& pool_;
    size_t expectedDimensions_;
};

} // namespace sift::vector
