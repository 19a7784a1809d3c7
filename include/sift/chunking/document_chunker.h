#pragma once

#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include <sift/config/settings.h>
#include <sift/core/types.h>
#include <sift/extraction/document_parser.h>
#include <sift/vector/embedding_provider.h>

namespace sift::chunking {

/**
 * One chunk of a parsed document. Offsets are byte offsets into the parsed content.
 */
struct DocumentChunk {
    std::string content; // Trimmed chunk text
    int index = 0;
    int tokenCount = 0;
    size_t startOffset = 0;
    size_t endOffset = 0;
    Metadata metadata; // Parser metadata plus ChunkingStrategy and ChunkIndex
};

/**
 * Heuristic token estimation: about four characters per token
 */
namespace token_counter {

int estimateTokens(std::string_view text);

/**
 * Characters covering the given token budget, capped at text length
 */
size_t charsForTokens(std::string_view text, int tokens);

} // namespace token_counter

/**
 * Splits parsed text into ordered chunks
 */
class IChunkingStrategy {
public:
    virtual ~IChunkingStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * @return chunks in document order, or OperationCancelled
     */
    virtual Result<std::vector<DocumentChunk>> chunk(const extraction::ParseResult& document,
                                                     const config::ChunkingSettings& settings,
                                                     std::stop_token stop = {}) = 0;
};

/**
 * Token windows with overlap, each end snapped back to a natural break
 */
class FixedSizeChunker : public IChunkingStrategy {
public:
    std::string name() const override { return "FixedSize"; }

    Result<std::vector<DocumentChunk>> chunk(const extraction::ParseResult& document,
                                             const config::ChunkingSettings& settings,
                                             std::stop_token stop = {}) override;

    /**
     * Nearest break at or before target: "\n\n", then "\n", then after ". ", then
     * whitespace, searched within min(100, (target - start) / 4) characters. A target
     * at or past the end returns content length.
     */
    static size_t findNaturalBreak(std::string_view content, size_t start, size_t target);
};

/**
 * Hierarchical splitting over an ordered separator list
 */
class RecursiveChunker : public IChunkingStrategy {
public:
    std::string name() const override { return "Recursive"; }

    Result<std::vector<DocumentChunk>> chunk(const extraction::ParseResult& document,
                                             const config::ChunkingSettings& settings,
                                             std::stop_token stop = {}) override;

    /**
     * Split text into pieces of at most maxTokens, seeding each piece after the first
     * with the tail of its predecessor.
     */
    static std::vector<std::string> splitRecursive(std::string_view text,
                                                   const std::vector<std::string>& separators,
                                                   int maxTokens, int overlapTokens);
};

/**
 * Sentence grouping by embedding similarity between neighbours
 */
class SemanticChunker : public IChunkingStrategy {
public:
    explicit SemanticChunker(std::shared_ptr<vector::IEmbeddingProvider> embedder);

    std::string name() const override { return "Semantic"; }

    Result<std::vector<DocumentChunk>> chunk(const extraction::ParseResult& document,
                                             const config::ChunkingSettings& settings,
                                             std::stop_token stop = {}) override;

    struct SentenceSpan {
        size_t start = 0;
        size_t end = 0;
    };

    /**
     * Sentences end after '.', '!' or '?' followed by a space or newline. Spans are
     * trimmed and empty ones dropped.
     */
    static std::vector<SentenceSpan> splitSentences(std::string_view text);

private:
    std::shared_ptr<vector::IEmbeddingProvider> embedder_;
    RecursiveChunker fallback_;
};

/**
 * Name-keyed strategies. Unknown names resolve to FixedSize with a warning.
 */
class ChunkerRegistry {
public:
    explicit ChunkerRegistry(std::shared_ptr<vector::IEmbeddingProvider> embedder);

    void registerStrategy(std::unique_ptr<IChunkingStrategy> strategy);

    IChunkingStrategy* find(const std::string& name) const;
    IChunkingStrategy& resolve(const std::string& name) const;

    /**
     * @brief Name of the strategy resolve(name) would return, without logging
     */
    std::string resolvedName(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, std::unique_ptr<IChunkingStrategy>> strategies_;
};

namespace detail {

// Helpers shared by the strategies
std::string_view trimView(std::string_view text);
size_t utf8Boundary(std::string_view text, size_t pos, size_t floor);
DocumentChunk makeChunk(const extraction::ParseResult& document, std::string_view strategy,
                        std::string_view text, int index, size_t start, size_t end);

} // namespace detail

} // namespace sift::chunking
