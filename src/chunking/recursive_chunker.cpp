#include <sift/chunking/document_chunker.h>

#include <algorithm>

namespace sift::chunking {

namespace {

std::vector<std::string_view> splitOn(std::string_view text, std::string_view separator) {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (true) {
        auto hit = text.find(separator, pos);
        if (hit == std::string_view::npos) {
            parts.push_back(text.substr(pos));
            break;
        }
        parts.push_back(text.substr(pos, hit - pos));
        pos = hit + separator.size();
    }
    return parts;
}

std::string overlapTail(const std::string& text, int overlapTokens) {
    if (text.empty() || overlapTokens <= 0) {
        return {};
    }
    size_t chars = token_counter::charsForTokens(text, overlapTokens);
    if (chars >= text.size()) {
        return text;
    }
    size_t from = detail::utf8Boundary(text, text.size() - chars, 0);
    return text.substr(from);
}

void sliceByCharacters(std::string_view text, int maxTokens, std::vector<std::string>& out) {
    size_t size = std::max<size_t>(1, token_counter::charsForTokens(text, maxTokens));
    size_t i = 0;
    while (i < text.size()) {
        size_t end = detail::utf8Boundary(text, std::min(text.size(), i + size), i + 1);
        out.emplace_back(text.substr(i, end - i));
        i = end;
    }
}

} // namespace

std::vector<std::string> RecursiveChunker::splitRecursive(
    std::string_view text, const std::vector<std::string>& separators, int maxTokens,
    int overlapTokens) {
    std::vector<std::string> result;
    if (token_counter::estimateTokens(text) <= maxTokens) {
        result.emplace_back(text);
        return result;
    }

    for (size_t s = 0; s < separators.size(); ++s) {
        const auto& separator = separators[s];
        if (separator.empty() || text.find(separator) == std::string_view::npos) {
            continue;
        }

        std::vector<std::string> remaining(separators.begin() + static_cast<std::ptrdiff_t>(s) + 1,
                                           separators.end());
        std::string current;
        for (auto piece : splitOn(text, separator)) {
            std::string candidate =
                current.empty() ? std::string(piece) : current + separator + std::string(piece);
            if (token_counter::estimateTokens(candidate) <= maxTokens) {
                current = std::move(candidate);
                continue;
            }

            std::string seed;
            if (!current.empty()) {
                result.push_back(current);
                seed = overlapTail(current, overlapTokens);
                current.clear();
            }

            if (token_counter::estimateTokens(piece) > maxTokens) {
                auto sub = splitRecursive(piece, remaining, maxTokens, overlapTokens);
                result.insert(result.end(), std::make_move_iterator(sub.begin()),
                              std::make_move_iterator(sub.end()));
                continue;
            }

            if (!seed.empty() && !detail::trimView(piece).empty()) {
                std::string seeded = seed + separator + std::string(piece);
                current = token_counter::estimateTokens(seeded) <= maxTokens ? std::move(seeded)
                                                                             : std::string(piece);
            } else {
                current = std::string(piece);
            }
        }
        if (!current.empty()) {
            result.push_back(std::move(current));
        }
        return result;
    }

    sliceByCharacters(text, maxTokens, result);
    return result;
}

Result<std::vector<DocumentChunk>>
RecursiveChunker::chunk(const extraction::ParseResult& document,
                        const config::ChunkingSettings& settings, std::stop_token stop) {
    std::vector<DocumentChunk> chunks;
    const std::string& content = document.content;
    if (detail::trimView(content).empty()) {
        return chunks;
    }

    auto separators = settings.recursiveSeparators;
    if (separators.empty()) {
        separators = {"\n\n", "\n", ". ", " "};
    }
    const int maxTokens = std::max(1, settings.maxChunkSize);
    int overlap = std::max(0, settings.overlap);
    if (overlap >= maxTokens) {
        overlap = maxTokens / 4;
    }

    auto pieces = splitRecursive(content, separators, maxTokens, overlap);
    // A document that fits in one piece is kept even below the minimum size
    const bool single = pieces.size() == 1;

    int index = 0;
    size_t searchFrom = 0;
    size_t lastEnd = 0;
    for (const auto& piece : pieces) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
        }
        if (detail::trimView(piece).empty()) {
            continue;
        }
        if (!single && token_counter::estimateTokens(piece) < settings.minChunkSize) {
            continue;
        }

        searchFrom = std::min(searchFrom, content.size());
        size_t start = content.find(piece, searchFrom);
        if (start == std::string::npos) {
            start = std::min(lastEnd, content.size());
        }
        size_t end = std::min(start + piece.size(), content.size());

        chunks.push_back(detail::makeChunk(document, name(), piece, index, start, end));
        ++index;
        lastEnd = end;
        // Overlapped pieces begin before the previous end, so search from just past its start
        searchFrom = start + 1;
    }
    return chunks;
}

} // namespace sift::chunking
