#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sift/metadata/connection_pool.h>
#include <sift/metadata/document.h>

namespace sift::metadata {

/**
 * @brief Filter for listing documents
 */
struct DocumentQuery {
    std::optional<std::string> scopeId;
    std::optional<std::string> pathPrefix; ///< Folder prefix, normalized with trailing '/'
    std::optional<DocumentStatus> status;
};

/**
 * @brief SQLite-backed store for documents and their chunks.
 *
 * Methods taking a Database& run on the caller's connection so several writes can
 * share one transaction; the others acquire a pooled connection.
 */
class DocumentRepository {
public:
    explicit DocumentRepository(ConnectionPool& pool);

    /**
     * @brief Apply schema migrations
     */
    Result<void> initialize();

    Result<std::optional<Document>> findById(const std::string& id);
    Result<std::vector<Document>> list(const DocumentQuery& query = {});

    Result<void> insert(const Document& doc);
    Result<void> update(const Document& doc);

    /**
     * @brief Update by id when present, otherwise insert.
     * @return true when a new row was inserted
     */
    Result<bool> upsert(const Document& doc);

    Result<void> updateStatus(const std::string& id, DocumentStatus status,
                              const std::string& errorMessage = {});

    /**
     * @brief Move a document to status only while it is still in expected
     * @return false when the row is missing or has already left expected
     */
    Result<bool> transitionStatus(const std::string& id, DocumentStatus expected,
                                  DocumentStatus status, const std::string& errorMessage = {});

    /**
     * @brief Delete a document; chunks and vectors cascade
     * @return false if no such document
     */
    Result<bool> deleteById(const std::string& id);

    Result<void> deleteChunks(const std::string& documentId);
    Result<std::vector<ChunkRecord>> chunksForDocument(const std::string& documentId);
    Result<int64_t> chunkCount(const std::string& documentId);

    // Connection-scoped variants
    static Result<std::optional<Document>> findById(Database& db, const std::string& id);
    static Result<bool> upsert(Database& db, const Document& doc);
    static Result<void> deleteChunks(Database& db, const std::string& documentId);
    static Result<void> insertChunks(Database& db, const std::vector<ChunkRecord>& chunks);

    [[nodiscard]] ConnectionPool& pool() { return pool_; }

private:
    ConnectionPool& pool_;

    static Result<void> insert(Database& db, const Document& doc);
    static Result<void> update(Database& db, const Document& doc);
};

} // namespace sift::metadata
