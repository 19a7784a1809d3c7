#include <sift/metadata/path_utils.h>
#include <sift/search/keyword_index.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace sift::search {

SqliteKeywordIndex::SqliteKeywordIndex(metadata::ConnectionPool& pool) : pool_(pool) {}

std::string SqliteKeywordIndex::buildMatchExpression(const std::string& query) {
    std::string cleaned;
    cleaned.reserve(query.size());
    for (unsigned char c : query) {
        // Bytes >= 0x80 are kept so UTF-8 words survive
        if (std::isalnum(c) || c == '-' || c == '_' || c >= 0x80) {
            cleaned.push_back(static_cast<char>(c));
        } else {
            cleaned.push_back(' ');
        }
    }

    std::istringstream in(cleaned);
    std::string term;
    std::string expr;
    while (in >> term) {
        if (!expr.empty())
            expr += " AND ";
        expr += '"';
        expr += term;
        expr += '"';
    }
    return expr;
}

Result<std::vector<KeywordMatch>> SqliteKeywordIndex::search(const std::string& query,
                                                             size_t limit,
                                                             const vector::SearchFilter& filter) {
    auto match = buildMatchExpression(query);
    if (match.empty() || limit == 0) {
        return std::vector<KeywordMatch>{};
    }

    return pool_.withConnection([&](metadata::Database& db) -> Result<std::vector<KeywordMatch>> {
        std::string sql = "SELECT chunk_id, document_id, content, path, bm25(chunks_fts) AS rank "
                          "FROM chunks_fts WHERE chunks_fts MATCH ? AND scope_id = ?";
        if (filter.pathPrefix)
            sql += " AND path LIKE ? ESCAPE '\\'";
        if (filter.documentId)
            sql += " AND document_id = ?";
        sql += " ORDER BY rank, chunk_id LIMIT ?";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();

        auto r = stmt.bindAll(match, filter.scopeId);
        if (!r)
            return r.error();
        int index = 3;
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
        r = stmt.bind(index, static_cast<int64_t>(limit));
        if (!r)
            return r.error();

        std::vector<KeywordMatch> matches;
        while (true) {
            auto step = stmt.step();
            if (!step) {
                spdlog::debug("FTS5 query failed for '{}': {}", match, step.error().message);
                return step.error();
            }
            if (!step.value())
                break;
            KeywordMatch m;
            m.chunkId = stmt.getString(0);
            m.documentId = stmt.getString(1);
            m.content = stmt.getString(2);
            m.path = stmt.getString(3);
            m.rawScore = -stmt.getDouble(4);
            matches.push_back(std::move(m));
        }
        return matches;
    });
}

Result<void> SqliteKeywordIndex::deleteByDocument(const std::string& documentId) {
    return pool_.withConnection([&](metadata::Database& db) -> Result<void> {
        auto stmtResult = db.prepare("DELETE FROM chunks_fts WHERE document_id = ?");
        if (!stmtResult)
            return stmtResult.error();
        auto stmt = std::move(stmtResult).value();
        auto r = stmt.bind(1, documentId);
        if (!r)
            return r;
        return stmt.execute();
    });
}

} // namespace sift::search
