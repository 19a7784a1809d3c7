#include <sift/chunking/document_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sift::chunking {

namespace {

struct Group {
    size_t start = 0;
    size_t end = 0;
};

} // namespace

SemanticChunker::SemanticChunker(std::shared_ptr<vector::IEmbeddingProvider> embedder)
    : embedder_(std::move(embedder)) {}

std::vector<SemanticChunker::SentenceSpan> SemanticChunker::splitSentences(std::string_view text) {
    std::vector<SentenceSpan> spans;
    auto push = [&](size_t from, size_t to) {
        while (from < to && std::isspace(static_cast<unsigned char>(text[from])))
            ++from;
        while (to > from && std::isspace(static_cast<unsigned char>(text[to - 1])))
            --to;
        if (to > from)
            spans.push_back({from, to});
    };

    size_t begin = 0;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        char next = text[i + 1];
        if ((c == '.' || c == '!' || c == '?') && (next == ' ' || next == '\n')) {
            push(begin, i + 1);
            begin = i + 1;
        }
    }
    push(begin, text.size());
    return spans;
}

Result<std::vector<DocumentChunk>>
SemanticChunker::chunk(const extraction::ParseResult& document,
                       const config::ChunkingSettings& settings, std::stop_token stop) {
    std::vector<DocumentChunk> chunks;
    std::string_view content = document.content;
    if (detail::trimView(content).empty()) {
        return chunks;
    }

    auto sentences = splitSentences(content);
    if (sentences.empty()) {
        return chunks;
    }
    if (sentences.size() == 1) {
        const auto& s = sentences.front();
        chunks.push_back(detail::makeChunk(document, name(), content.substr(s.start, s.end - s.start),
                                           0, s.start, s.end));
        return chunks;
    }

    std::vector<std::string> texts;
    texts.reserve(sentences.size());
    for (const auto& s : sentences) {
        texts.emplace_back(content.substr(s.start, s.end - s.start));
    }

    auto embedded = embedder_ ? embedder_->embedBatch(texts, stop)
                              : Result<std::vector<vector::Embedding>>(
                                    Error{ErrorCode::NotInitialized, "No embedding provider"});
    if (!embedded || embedded.value().size() != texts.size()) {
        if (!embedded && embedded.error().code == ErrorCode::OperationCancelled) {
            return embedded.error();
        }
        spdlog::warn("Semantic chunking unavailable ({}), falling back to Recursive",
                     embedded ? std::string("embedding count mismatch") : embedded.error().message);
        return fallback_.chunk(document, settings, stop);
    }
    const auto& embeddings = embedded.value();

    const int maxTokens = std::max(1, settings.maxChunkSize);

    // Boundaries where neighbour similarity drops, or where the group would outgrow max size
    std::vector<Group> groups;
    Group current{sentences.front().start, sentences.front().end};
    for (size_t i = 1; i < sentences.size(); ++i) {
        float similarity = vector::computeCosineSimilarity(embeddings[i - 1], embeddings[i]);
        size_t extendedEnd = sentences[i].end;
        bool tooLarge = token_counter::estimateTokens(
                            content.substr(current.start, extendedEnd - current.start)) > maxTokens;
        if (similarity < settings.semanticThreshold || tooLarge) {
            groups.push_back(current);
            current = {sentences[i].start, sentences[i].end};
        } else {
            current.end = extendedEnd;
        }
    }
    groups.push_back(current);

    // Oversize groups (a single long sentence) become max-size slices
    std::vector<Group> bounded;
    for (const auto& g : groups) {
        auto text = content.substr(g.start, g.end - g.start);
        if (token_counter::estimateTokens(text) <= maxTokens) {
            bounded.push_back(g);
            continue;
        }
        size_t sliceChars = std::max<size_t>(1, token_counter::charsForTokens(text, maxTokens));
        size_t pos = g.start;
        while (pos < g.end) {
            size_t end = detail::utf8Boundary(content, std::min(g.end, pos + sliceChars), pos + 1);
            bounded.push_back({pos, end});
            pos = end;
        }
    }

    // Undersized groups merge into their predecessor
    std::vector<Group> merged;
    for (const auto& g : bounded) {
        auto tokens = token_counter::estimateTokens(content.substr(g.start, g.end - g.start));
        if (!merged.empty() && tokens < settings.minChunkSize) {
            merged.back().end = g.end;
        } else {
            merged.push_back(g);
        }
    }
    // A short leading group is folded forward
    if (merged.size() > 1 &&
        token_counter::estimateTokens(content.substr(merged[0].start,
                                                     merged[0].end - merged[0].start)) <
            settings.minChunkSize) {
        merged[1].start = merged[0].start;
        merged.erase(merged.begin());
    }

    int index = 0;
    for (const auto& g : merged) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
        }
        chunks.push_back(detail::makeChunk(document, name(),
                                           content.substr(g.start, g.end - g.start), index,
                                           g.start, g.end));
        ++index;
    }
    return chunks;
}

} // namespace sift::chunking
