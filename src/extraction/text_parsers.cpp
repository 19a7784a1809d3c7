#include <sift/config/config_helpers.h>
#include <sift/extraction/text_parsers.h>
#include <sift/metadata/path_utils.h>

#include <algorithm>
#include <sstream>

namespace sift::extraction {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at i, or 0 if invalid
size_t validSequenceLength(const unsigned char* p, size_t n, size_t i) {
    unsigned char c = p[i];
    if (c < 0x80)
        return 1;

    size_t len = 0;
    uint32_t cp = 0;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
        cp = c & 0x1F;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        cp = c & 0x0F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        cp = c & 0x07;
    } else {
        return 0;
    }
    if (i + len > n)
        return 0;
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = p[i + k];
        if ((cc & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points
    if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

const char* fileTypeFor(const std::string& ext) {
    if (ext == ".md" || ext == ".markdown")
        return "Markdown";
    if (ext == ".csv")
        return "CSV";
    if (ext == ".json")
        return "JSON";
    if (ext == ".xml")
        return "XML";
    if (ext == ".yaml" || ext == ".yml")
        return "YAML";
    if (ext == ".log")
        return "Log";
    return "PlainText";
}

ParseResult parseText(ByteSpan data, const std::string& fileName) {
    ParseResult result;
    result.content = decodeText(data, result.warnings);
    result.metadata["FileType"] = fileTypeFor(metadata::fileExtension(fileName));

    if (config::trimmed(result.content).empty()) {
        result.warnings.push_back("Document contains no readable text content");
        result.content.clear();
    }

    auto lines = result.content.empty()
                     ? 0
                     : std::count(result.content.begin(), result.content.end(), '\n') + 1;
    result.metadata["lineCount"] = std::to_string(lines);
    result.metadata["charCount"] = std::to_string(result.content.size());
    return result;
}

} // namespace

std::string decodeText(ByteSpan data, std::vector<std::string>& warnings) {
    const auto* p = reinterpret_cast<const unsigned char*>(data.data());
    size_t n = data.size();
    size_t i = 0;
    if (n >= 3 && p[0] == 0xEF && p[1] == 0xBB && p[2] == 0xBF) {
        i = 3;
    }

    std::string out;
    out.reserve(n - i);
    size_t invalid = 0;
    while (i < n) {
        if (p[i] == '\r' && i + 1 < n && p[i + 1] == '\n') {
            ++i;
            continue;
        }
        size_t len = validSequenceLength(p, n, i);
        if (len == 0) {
            out.append(kReplacementChar);
            ++invalid;
            ++i;
            continue;
        }
        out.append(reinterpret_cast<const char*>(p + i), len);
        i += len;
    }

    if (invalid > 0) {
        warnings.push_back("Replaced " + std::to_string(invalid) + " invalid UTF-8 byte(s)");
    }
    return out;
}

// PlainTextParser

std::vector<std::string> PlainTextParser::supportedExtensions() const {
    return {".txt", ".text", ".log", ".json", ".xml", ".yaml", ".yml"};
}

Result<ParseResult> PlainTextParser::parse(ByteSpan data, const std::string& fileName,
                                           std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Parsing cancelled"};
    }
    return parseText(data, fileName);
}

// MarkdownParser

Result<ParseResult> MarkdownParser::parse(ByteSpan data, const std::string& fileName,
                                          std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Parsing cancelled"};
    }
    auto result = parseText(data, fileName);

    std::istringstream in(result.content);
    std::string line;
    int headings = 0;
    bool inFence = false;
    while (std::getline(in, line)) {
        auto t = config::trimmed(line);
        if (t.rfind("```", 0) == 0) {
            inFence = !inFence;
            continue;
        }
        if (inFence || t.empty() || t.front() != '#')
            continue;
        auto hashes = t.find_first_not_of('#');
        if (hashes == std::string::npos || hashes > 6 || t[hashes] != ' ')
            continue;
        ++headings;
        if (hashes == 1 && result.metadata.count("title") == 0) {
            result.metadata["title"] = config::trimmed(t.substr(2));
        }
    }
    result.metadata["headingCount"] = std::to_string(headings);
    return result;
}

} // namespace sift::extraction
