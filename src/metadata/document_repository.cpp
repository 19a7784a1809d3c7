#include <sift/core/uuid.h>
#include <sift/metadata/document_repository.h>
#include <sift/metadata/migration.h>
#include <sift/metadata/path_utils.h>

#include <spdlog/spdlog.h>

namespace sift::metadata {

namespace {

constexpr const char* kDocumentColumns =
    "id, scope_id, path, file_name, content_type, content_hash, size_bytes, status, "
    "error_message, created_at, updated_at, last_indexed_at, metadata";

int64_t nowMillis() {
    return core::toEpochMillis(std::chrono::system_clock::now());
}

Document readDocument(const Statement& stmt) {
    Document doc;
    doc.id = stmt.getString(0);
    doc.scopeId = stmt.getString(1);
    doc.path = stmt.getString(2);
    doc.fileName = stmt.getString(3);
    doc.contentType = stmt.getString(4);
    doc.contentHash = stmt.getString(5);
    doc.sizeBytes = stmt.getInt64(6);
    auto status = parseDocumentStatus(stmt.getString(7));
    doc.status = status ? status.value() : DocumentStatus::Pending;
    doc.errorMessage = stmt.getString(8);
    doc.createdAt = core::fromEpochMillis(stmt.getInt64(9));
    doc.updatedAt = core::fromEpochMillis(stmt.getInt64(10));
    if (!stmt.isNull(11)) {
        doc.lastIndexedAt = core::fromEpochMillis(stmt.getInt64(11));
    }
    doc.metadata = decodeMetadata(stmt.getString(12));
    return doc;
}

Result<void> bindLastIndexed(Statement& stmt, int index, const Document& doc) {
    if (doc.lastIndexedAt) {
        return stmt.bind(index, core::toEpochMillis(*doc.lastIndexedAt));
    }
    return stmt.bind(index, nullptr);
}

} // namespace

DocumentRepository::DocumentRepository(ConnectionPool& pool) : pool_(pool) {}

Result<void> DocumentRepository::initialize() {
    return pool_.withConnection([](Database& db) { return migrateToLatest(db); });
}

Result<std::optional<Document>> DocumentRepository::findById(const std::string& id) {
    return pool_.withConnection([&](Database& db) { return findById(db, id); });
}

Result<std::optional<Document>> DocumentRepository::findById(Database& db, const std::string& id) {
    auto stmtResult =
        db.prepare(std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (!stepResult.value()) {
        return std::optional<Document>{};
    }
    return std::optional<Document>{readDocument(stmt)};
}

Result<std::vector<Document>> DocumentRepository::list(const DocumentQuery& query) {
    return pool_.withConnection([&](Database& db) -> Result<std::vector<Document>> {
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE 1=1";
        if (query.scopeId)
            sql += " AND scope_id = ?";
        if (query.pathPrefix)
            sql += " AND path LIKE ? ESCAPE '\\'";
        if (query.status)
            sql += " AND status = ?";
        sql += " ORDER BY path, id";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        int index = 1;
        if (query.scopeId) {
            auto r = stmt.bind(index++, *query.scopeId);
            if (!r)
                return r.error();
        }
        if (query.pathPrefix) {
            auto r = stmt.bind(index++, escapeLikePattern(normalizeFolderPrefix(*query.pathPrefix)) + "%");
            if (!r)
                return r.error();
        }
        if (query.status) {
            auto r = stmt.bind(index++, documentStatusToString(*query.status));
            if (!r)
                return r.error();
        }

        std::vector<Document> docs;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            docs.push_back(readDocument(stmt));
        }
        return docs;
    });
}

Result<void> DocumentRepository::insert(const Document& doc) {
    return pool_.withConnection([&](Database& db) { return insert(db, doc); });
}

Result<void> DocumentRepository::insert(Database& db, const Document& doc) {
    auto stmtResult = db.prepare(std::string("INSERT INTO documents (") + kDocumentColumns +
                                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    auto now = nowMillis();
    auto created = doc.createdAt == TimePoint{} ? now : core::toEpochMillis(doc.createdAt);
    auto bindResult =
        stmt.bindAll(doc.id, doc.scopeId, normalizeLogicalPath(doc.path), doc.fileName,
                     doc.contentType, doc.contentHash, doc.sizeBytes,
                     documentStatusToString(doc.status), doc.errorMessage, created, now);
    if (!bindResult)
        return bindResult;
    bindResult = bindLastIndexed(stmt, 12, doc);
    if (!bindResult)
        return bindResult;
    bindResult = stmt.bind(13, encodeMetadata(doc.metadata));
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<void> DocumentRepository::update(const Document& doc) {
    return pool_.withConnection([&](Database& db) { return update(db, doc); });
}

Result<void> DocumentRepository::update(Database& db, const Document& doc) {
    auto stmtResult =
        db.prepare("UPDATE documents SET scope_id = ?, path = ?, file_name = ?, content_type = ?, "
                   "content_hash = ?, size_bytes = ?, status = ?, error_message = ?, "
                   "updated_at = ?, last_indexed_at = ?, metadata = ? WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    auto bindResult = stmt.bindAll(doc.scopeId, normalizeLogicalPath(doc.path), doc.fileName,
                                   doc.contentType, doc.contentHash, doc.sizeBytes,
                                   documentStatusToString(doc.status), doc.errorMessage,
                                   nowMillis());
    if (!bindResult)
        return bindResult;
    bindResult = bindLastIndexed(stmt, 10, doc);
    if (!bindResult)
        return bindResult;
    bindResult = stmt.bind(11, encodeMetadata(doc.metadata));
    if (!bindResult)
        return bindResult;
    bindResult = stmt.bind(12, doc.id);
    if (!bindResult)
        return bindResult;

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;
    if (db.changes() == 0) {
        return Error{ErrorCode::NotFound, "Document not found: " + doc.id};
    }
    return {};
}

Result<bool> DocumentRepository::upsert(const Document& doc) {
    return pool_.withConnection([&](Database& db) { return upsert(db, doc); });
}

Result<bool> DocumentRepository::upsert(Database& db, const Document& doc) {
    auto existing = findById(db, doc.id);
    if (!existing)
        return existing.error();

    if (existing.value()) {
        auto r = update(db, doc);
        if (!r)
            return r.error();
        return false;
    }

    auto r = insert(db, doc);
    if (!r)
        return r.error();
    return true;
}

Result<void> DocumentRepository::updateStatus(const std::string& id, DocumentStatus status,
                                              const std::string& errorMessage) {
    return pool_.withConnection([&](Database& db) -> Result<void> {
        auto stmtResult = db.prepare(
            "UPDATE documents SET status = ?, error_message = ?, updated_at = ? WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bindResult =
            stmt.bindAll(documentStatusToString(status), errorMessage, nowMillis(), id);
        if (!bindResult)
            return bindResult;
        auto execResult = stmt.execute();
        if (!execResult)
            return execResult;
        if (db.changes() == 0)
            return Error{ErrorCode::NotFound, "Document not found: " + id};
        return {};
    });
}

Result<bool> DocumentRepository::transitionStatus(const std::string& id, DocumentStatus expected,
                                                  DocumentStatus status,
                                                  const std::string& errorMessage) {
    return pool_.withConnection([&](Database& db) -> Result<bool> {
        auto stmtResult = db.prepare("UPDATE documents SET status = ?, error_message = ?, "
                                     "updated_at = ? WHERE id = ? AND status = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(documentStatusToString(status), errorMessage, nowMillis(),
                                       id, documentStatusToString(expected));
        if (!bindResult)
            return bindResult.error();
        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();
        return db.changes() > 0;
    });
}

Result<bool> DocumentRepository::deleteById(const std::string& id) {
    return pool_.withConnection([&](Database& db) -> Result<bool> {
        bool removed = false;
        auto txResult = db.transaction([&]() -> Result<void> {
            // Explicit chunk delete keeps the FTS triggers in play
            auto chunksResult = deleteChunks(db, id);
            if (!chunksResult)
                return chunksResult;

            auto stmtResult = db.prepare("DELETE FROM documents WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            auto bindResult = stmt.bind(1, id);
            if (!bindResult)
                return bindResult;
            auto execResult = stmt.execute();
            if (!execResult)
                return execResult;
            removed = db.changes() > 0;
            return {};
        });
        if (!txResult)
            return txResult.error();
        if (removed) {
            spdlog::debug("Deleted document {}", id);
        }
        return removed;
    });
}

Result<void> DocumentRepository::deleteChunks(const std::string& documentId) {
    return pool_.withConnection([&](Database& db) { return deleteChunks(db, documentId); });
}

Result<void> DocumentRepository::deleteChunks(Database& db, const std::string& documentId) {
    auto vecStmt = db.prepare("DELETE FROM chunk_vectors WHERE document_id = ?");
    if (!vecStmt)
        return vecStmt.error();
    Statement vstmt = std::move(vecStmt).value();
    auto r = vstmt.bind(1, documentId);
    if (!r)
        return r;
    r = vstmt.execute();
    if (!r)
        return r;

    auto stmtResult = db.prepare("DELETE FROM chunks WHERE document_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    r = stmt.bind(1, documentId);
    if (!r)
        return r;
    return stmt.execute();
}

Result<void> DocumentRepository::insertChunks(Database& db, const std::vector<ChunkRecord>& chunks) {
    auto stmtResult = db.prepare(
        "INSERT INTO chunks (id, document_id, scope_id, path, content, chunk_index, token_count, "
        "start_offset, end_offset, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    for (const auto& chunk : chunks) {
        auto r = stmt.reset();
        if (!r)
            return r;
        r = stmt.clearBindings();
        if (!r)
            return r;
        r = stmt.bindAll(chunk.id, chunk.documentId, chunk.scopeId,
                         normalizeLogicalPath(chunk.path), chunk.content, chunk.chunkIndex,
                         chunk.tokenCount, chunk.startOffset, chunk.endOffset,
                         encodeMetadata(chunk.metadata));
        if (!r)
            return r;
        r = stmt.execute();
        if (!r)
            return r;
    }
    return {};
}

Result<std::vector<ChunkRecord>>
DocumentRepository::chunksForDocument(const std::string& documentId) {
    return pool_.withConnection([&](Database& db) -> Result<std::vector<ChunkRecord>> {
        auto stmtResult =
            db.prepare("SELECT id, document_id, scope_id, path, content, chunk_index, token_count, "
                       "start_offset, end_offset, metadata FROM chunks WHERE document_id = ? "
                       "ORDER BY chunk_index");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, documentId);
        if (!bindResult)
            return bindResult.error();

        std::vector<ChunkRecord> chunks;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            ChunkRecord c;
            c.id = stmt.getString(0);
            c.documentId = stmt.getString(1);
            c.scopeId = stmt.getString(2);
            c.path = stmt.getString(3);
            c.content = stmt.getString(4);
            c.chunkIndex = stmt.getInt(5);
            c.tokenCount = stmt.getInt(6);
            c.startOffset = stmt.getInt64(7);
            c.endOffset = stmt.getInt64(8);
            c.metadata = decodeMetadata(stmt.getString(9));
            chunks.push_back(std::move(c));
        }
        return chunks;
    });
}

Result<int64_t> DocumentRepository::chunkCount(const std::string& documentId) {
    return pool_.withConnection([&](Database& db) -> Result<int64_t> {
        auto stmtResult = db.prepare("SELECT COUNT(*) FROM chunks WHERE document_id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, documentId);
        if (!bindResult)
            return bindResult.error();
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        return stmt.getInt64(0);
    });
}

} // namespace sift::metadata
