#include <sift/chunking/document_chunker.h>
#include <sift/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sift::chunking {

namespace token_counter {

int estimateTokens(std::string_view text) {
    bool blank = std::all_of(text.begin(), text.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return 0;
    }
    return static_cast<int>((text.size() + 3) / 4);
}

size_t charsForTokens(std::string_view text, int tokens) {
    if (tokens <= 0) {
        return 0;
    }
    return std::min(static_cast<size_t>(tokens) * 4, text.size());
}

} // namespace token_counter

namespace detail {

std::string_view trimView(std::string_view text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1])))
        --e;
    return text.substr(b, e - b);
}

size_t utf8Boundary(std::string_view text, size_t pos, size_t floor) {
    if (pos >= text.size()) {
        return text.size();
    }
    while (pos > floor && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

DocumentChunk makeChunk(const extraction::ParseResult& document, std::string_view strategy,
                        std::string_view text, int index, size_t start, size_t end) {
    DocumentChunk chunk;
    chunk.content = std::string(trimView(text));
    chunk.index = index;
    chunk.tokenCount = token_counter::estimateTokens(text);
    chunk.startOffset = start;
    chunk.endOffset = end;
    chunk.metadata = document.metadata;
    chunk.metadata["ChunkingStrategy"] = std::string(strategy);
    chunk.metadata["ChunkIndex"] = std::to_string(index);
    return chunk;
}

} // namespace detail

ChunkerRegistry::ChunkerRegistry(std::shared_ptr<vector::IEmbeddingProvider> embedder) {
    registerStrategy(std::make_unique<FixedSizeChunker>());
    registerStrategy(std::make_unique<RecursiveChunker>());
    if (embedder) {
        registerStrategy(std::make_unique<SemanticChunker>(std::move(embedder)));
    }
}

void ChunkerRegistry::registerStrategy(std::unique_ptr<IChunkingStrategy> strategy) {
    auto key = config::to_lower(strategy->name());
    strategies_[key] = std::move(strategy);
}

IChunkingStrategy* ChunkerRegistry::find(const std::string& name) const {
    auto it = strategies_.find(config::to_lower(name));
    return it == strategies_.end() ? nullptr : it->second.get();
}

IChunkingStrategy& ChunkerRegistry::resolve(const std::string& name) const {
    if (auto* s = find(name)) {
        return *s;
    }
    spdlog::warn("Unknown chunking strategy '{}', using FixedSize",
                 config::sanitize_for_terminal(name));
    return *strategies_.at("fixedsize");
}

std::string ChunkerRegistry::resolvedName(const std::string& name) const {
    if (auto* s = find(name)) {
        return s->name();
    }
    return strategies_.at("fixedsize")->name();
}

std::vector<std::string> ChunkerRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [_, s] : strategies_) {
        out.push_back(s->name());
    }
    return out;
}

} // namespace sift::chunking
