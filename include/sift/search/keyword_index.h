#pragma once

#include <string>
#include <vector>
#include <sift/core/types.h>
#include <sift/metadata/connection_pool.h>
#include <sift/vector/vector_index.h>

namespace sift::search {

struct KeywordMatch {
    std::string chunkId;
    std::string documentId;
    std::string content;
    std::string path;
    double rawScore = 0.0; ///< Higher is more relevant
};

/**
 * @brief Lexical ranked search over chunk text
 */
class IKeywordIndex {
public:
    virtual ~IKeywordIndex() = default;

    virtual Result<std::vector<KeywordMatch>> search(const std::string& query, size_t limit,
                                                     const vector::SearchFilter& filter) = 0;

    virtual Result<void> deleteByDocument(const std::string& documentId) = 0;
};

/**
 * @brief FTS5 index kept in sync with the chunks table by triggers.
 *
 * Raw score is the negated bm25() rank.
 */
class SqliteKeywordIndex : public IKeywordIndex {
public:
    explicit SqliteKeywordIndex(metadata::ConnectionPool& pool);

    Result<std::vector<KeywordMatch>> search(const std::string& query, size_t limit,
                                             const vector::SearchFilter& filter) override;

    Result<void> deleteByDocument(const std::string& documentId) override;

    /**
     * @brief Reduce free text to an FTS5 MATCH expression of quoted ANDed terms.
     *
     * Keeps letters, digits, whitespace, '-' and '_'. Empty when nothing remains.
     */
    static std::string buildMatchExpression(const std::string& query);

private:
    metadata::ConnectionPool& pool_;
};

} // namespace sift::search
