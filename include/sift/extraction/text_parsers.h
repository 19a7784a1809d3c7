#pragma once

#include <sift/extraction/document_parser.h>

namespace sift::extraction {

/**
 * @brief UTF-8 text, logs and text-like formats
 *
 * Reports FileType, lineCount and charCount.
 */
class PlainTextParser : public IDocumentParser {
public:
    Result<ParseResult> parse(ByteSpan data, const std::string& fileName,
                              std::stop_token stop = {}) override;
    std::vector<std::string> supportedExtensions() const override;
    std::string name() const override { return "PlainText"; }
};

/**
 * @brief Markdown kept as text; adds title (first "# " heading) and headingCount
 */
class MarkdownParser : public IDocumentParser {
public:
    Result<ParseResult> parse(ByteSpan data, const std::string& fileName,
                              std::stop_token stop = {}) override;
    std::vector<std::string> supportedExtensions() const override { return {".md", ".markdown"}; }
    std::string name() const override { return "Markdown"; }
};

/**
 * @brief CSV rendered one row per line as "header: value" pairs joined by ", "
 *
 * The delimiter (comma, tab or semicolon) is detected from the header line. Double
 * quoted fields may contain delimiters, escaped quotes and newlines.
 */
class CsvParser : public IDocumentParser {
public:
    Result<ParseResult> parse(ByteSpan data, const std::string& fileName,
                              std::stop_token stop = {}) override;
    std::vector<std::string> supportedExtensions() const override { return {".csv"}; }
    std::string name() const override { return "CSV"; }

    static char detectDelimiter(std::string_view headerLine);
    static std::vector<std::vector<std::string>> parseRecords(std::string_view text,
                                                              char delimiter);
};

/**
 * @brief Decode bytes as UTF-8 text.
 *
 * Strips a leading BOM, replaces invalid sequences with U+FFFD (adding one warning),
 * and normalizes CRLF to LF.
 */
std::string decodeText(ByteSpan data, std::vector<std::string>& warnings);

} // namespace sift::extraction
