#include <sift/metadata/path_utils.h>
#include <sift/vector/embedding_provider.h>
#include <sift/vector/vector_index.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace sift::vector {

namespace {

std::vector<std::byte> toBlob(const std::vector<float>& embedding) {
    std::vector<std::byte> blob(embedding.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), embedding.data(), blob.size());
    }
    return blob;
}

std::vector<float> fromBlob(const std::vector<std::byte>& blob) {
    std::vector<float> out(blob.size() / sizeof(float));
    if (!out.empty()) {
        std::memcpy(out.data(), blob.data(), out.size() * sizeof(float));
    }
    return out;
}

} // namespace

SqliteVectorIndex::SqliteVectorIndex(metadata::ConnectionPool& pool, size_t expectedDimensions)
    : pool_(pool), expectedDimensions_(expectedDimensions) {}

Result<void> SqliteVectorIndex::upsert(const std::vector<VectorRecord>& records) {
    return pool_.withConnection([&](metadata::Database& db) {
        return db.transaction([&]() { return upsert(db, records); });
    });
}

Result<void> SqliteVectorIndex::upsert(metadata::Database& db,
                                       const std::vector<VectorRecord>& records) {
    for (const auto& rec : records) {
        if (!isValidEmbedding(rec.embedding, expectedDimensions_)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Embedding for chunk {} has dimension {}, expected {}",
                                     rec.chunkId, rec.embedding.size(), expectedDimensions_)};
        }
    }

    auto stmtResult = db.prepare(
        "INSERT INTO chunk_vectors (chunk_id, document_id, scope_id, path, model_id, dimensions, "
        "embedding) VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(chunk_id) DO UPDATE SET document_id = excluded.document_id, "
        "scope_id = excluded.scope_id, path = excluded.path, model_id = excluded.model_id, "
        "dimensions = excluded.dimensions, embedding = excluded.embedding");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    for (const auto& rec : records) {
        auto r = stmt.reset();
        if (!r)
            return r;
        auto blob = toBlob(rec.embedding);
        r = stmt.bindAll(rec.chunkId, rec.documentId, rec.scopeId,
                         metadata::normalizeLogicalPath(rec.path), rec.modelId,
                         static_cast<int64_t>(rec.embedding.size()),
                         std::span<const std::byte>(blob));
        if (!r)
            return r;
        r = stmt.execute();
        if (!r)
            return r;
    }
    return {};
}

Result<std::vector<VectorMatch>> SqliteVectorIndex::search(const std::vector<float>& query,
                                                           size_t topK,
                                                           const SearchFilter& filter) {
    if (!isValidEmbedding(query, expectedDimensions_)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Query embedding has dimension {}, expected {}", query.size(),
                                 expectedDimensions_)};
    }
    if (topK == 0) {
        return std::vector<VectorMatch>{};
    }

    return pool_.withConnection([&](metadata::Database& db) -> Result<std::vector<VectorMatch>> {
        std::string sql = "SELECT v.chunk_id, v.document_id, c.content, v.path, v.embedding "
                          "FROM chunk_vectors v JOIN chunks c ON c.id = v.chunk_id "
                          "WHERE v.scope_id = ?";
        if (filter.pathPrefix)
            sql += " AND v.path LIKE ? ESCAPE '\\'";
        if (filter.documentId)
            sql += " AND v.document_id = ?";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();

        int index = 1;
        auto r = stmt.bind(index++, filter.scopeId);
        if (!r)
            return r.error();
        if (filter.pathPrefix) {
            r = stmt.bind(index++, metadata::escapeLikePattern(
                                       metadata::normalizeFolderPrefix(*filter.pathPrefix)) +
                                       "%");
            if (!r)
                return r.error();
        }
        if (filter.documentId) {
            r = stmt.bind(index++, *filter.documentId);
            if (!r)
                return r.error();
        }

        std::vector<VectorMatch> matches;
        size_t skipped = 0;
        while (true) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;

            auto embedding = fromBlob(stmt.getBlob(4));
            if (embedding.size() != expectedDimensions_) {
                ++skipped;
                continue;
            }
            VectorMatch m;
            m.chunkId = stmt.getString(0);
            m.documentId = stmt.getString(1);
            m.content = stmt.getString(2);
            m.path = stmt.getString(3);
            m.distance = 1.0f - computeCosineSimilarity(query, embedding);
            matches.push_back(std::move(m));
        }
        if (skipped > 0) {
            spdlog::warn("Skipped {} stored vectors with mismatched dimensions", skipped);
        }

        auto byDistance = [](const VectorMatch& a, const VectorMatch& b) {
            if (a.distance != b.distance)
                return a.distance < b.distance;
            return a.chunkId < b.chunkId;
        };
        if (matches.size() > topK) {
            std::partial_sort(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(topK),
                              matches.end(), byDistance);
            matches.resize(topK);
        } else {
            std::sort(matches.begin(), matches.end(), byDistance);
        }
        return matches;
    });
}

Result<void> SqliteVectorIndex::deleteByDocument(const std::string& documentId) {
    return pool_.withConnection(
        [&](metadata::Database& db) { return deleteByDocument(db, documentId); });
}

Result<void> SqliteVectorIndex::deleteByDocument(metadata::Database& db,
                                                 const std::string& documentId) {
    auto stmtResult = db.prepare("DELETE FROM chunk_vectors WHERE document_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    auto r = stmt.bind(1, documentId);
    if (!r)
        return r;
    return stmt.execute();
}

} // namespace sift::vector
