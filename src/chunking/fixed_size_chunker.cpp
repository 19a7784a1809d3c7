#include <sift/chunking/document_chunker.h>

#include <algorithm>
#include <cctype>

namespace sift::chunking {

size_t FixedSizeChunker::findNaturalBreak(std::string_view content, size_t start,
                                          size_t target) {
    const size_t len = content.size();
    if (target >= len) {
        return len;
    }
    if (target <= start) {
        return target;
    }

    const size_t window = std::min<size_t>(100, (target - start) / 4);
    const size_t floor = target > window ? target - window : 0;
    auto inWindow = [&](size_t i) { return i > floor && i > start && i < len; };

    for (size_t i = target; inWindow(i); --i) {
        if (content[i] == '\n' && content[i - 1] == '\n')
            return i;
    }
    for (size_t i = target; inWindow(i); --i) {
        if (content[i] == '\n')
            return i;
    }
    for (size_t i = target; inWindow(i); --i) {
        if (content[i] == '.' && i + 1 < len &&
            std::isspace(static_cast<unsigned char>(content[i + 1])))
            return i + 1;
    }
    for (size_t i = target; inWindow(i); --i) {
        if (std::isspace(static_cast<unsigned char>(content[i])))
            return i;
    }
    return detail::utf8Boundary(content, target, start + 1);
}

Result<std::vector<DocumentChunk>>
FixedSizeChunker::chunk(const extraction::ParseResult& document,
                        const config::ChunkingSettings& settings, std::stop_token stop) {
    std::vector<DocumentChunk> chunks;
    std::string_view content = document.content;
    if (detail::trimView(content).empty()) {
        return chunks;
    }

    const int maxTokens = std::max(1, settings.maxChunkSize);
    int overlap = std::max(0, settings.overlap);
    if (overlap >= maxTokens) {
        overlap = maxTokens / 4;
    }

    size_t position = 0;
    int index = 0;
    while (position < content.size()) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
        }

        size_t targetChars = token_counter::charsForTokens(content.substr(position), maxTokens);
        size_t end = findNaturalBreak(content, position, position + targetChars);
        if (end <= position) {
            end = std::min(content.size(), position + std::max<size_t>(targetChars, 1));
        }

        auto text = content.substr(position, end - position);
        const bool last = end >= content.size();
        if (token_counter::estimateTokens(text) >= settings.minChunkSize || last) {
            if (!detail::trimView(text).empty()) {
                chunks.push_back(detail::makeChunk(document, name(), text, index, position, end));
                ++index;
            }
        }

        if (last) {
            break;
        }

        size_t overlapChars = token_counter::charsForTokens(text, overlap);
        size_t next = detail::utf8Boundary(content, end - overlapChars, 0);
        position = next <= position ? end : next;
    }
    return chunks;
}

} // namespace sift::chunking
