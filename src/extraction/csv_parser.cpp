#include <sift/config/config_helpers.h>
#include <sift/extraction/text_parsers.h>

#include <algorithm>

namespace sift::extraction {

char CsvParser::detectDelimiter(std::string_view headerLine) {
    auto commas = std::count(headerLine.begin(), headerLine.end(), ',');
    auto tabs = std::count(headerLine.begin(), headerLine.end(), '\t');
    auto semicolons = std::count(headerLine.begin(), headerLine.end(), ';');
    if (commas >= tabs && commas >= semicolons)
        return ',';
    if (tabs > commas && tabs >= semicolons)
        return '\t';
    return ';';
}

std::vector<std::vector<std::string>> CsvParser::parseRecords(std::string_view text,
                                                              char delimiter) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasData = false;

    auto endField = [&] {
        row.push_back(std::move(field));
        field.clear();
    };
    auto endRow = [&] {
        endField();
        if (rowHasData || row.size() > 1 || !row.front().empty()) {
            records.push_back(std::move(row));
        }
        row.clear();
        rowHasData = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"') {
            inQuotes = true;
            rowHasData = true;
        } else if (c == delimiter) {
            endField();
            rowHasData = true;
        } else if (c == '\n') {
            endRow();
        } else {
            field.push_back(c);
        }
    }
    if (!field.empty() || !row.empty() || rowHasData) {
        endRow();
    }
    return records;
}

Result<ParseResult> CsvParser::parse(ByteSpan data, const std::string& fileName,
                                     std::stop_token stop) {
    (void)fileName;
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Parsing cancelled"};
    }

    ParseResult result;
    result.metadata["FileType"] = "CSV";
    auto text = decodeText(data, result.warnings);

    auto firstNewline = text.find('\n');
    char delimiter = detectDelimiter(std::string_view(text).substr(0, firstNewline));
    result.metadata["CsvDelimiter"] = delimiter == '\t' ? "\\t" : std::string(1, delimiter);

    auto records = parseRecords(text, delimiter);
    if (records.empty()) {
        result.warnings.push_back("Document contains no readable text content");
        result.metadata["rowCount"] = "0";
        result.metadata["columnCount"] = "0";
        return result;
    }

    std::vector<std::string> headers;
    for (size_t i = 0; i < records.front().size(); ++i) {
        auto h = config::trimmed(records.front()[i]);
        headers.push_back(h.empty() ? "Column" + std::to_string(i + 1) : h);
    }

    size_t raggedRows = 0;
    std::string content;
    for (size_t r = 1; r < records.size(); ++r) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Parsing cancelled"};
        }
        const auto& rec = records[r];
        if (rec.size() != headers.size())
            ++raggedRows;

        std::string line;
        for (size_t c = 0; c < rec.size(); ++c) {
            auto value = config::trimmed(rec[c]);
            if (value.empty())
                continue;
            if (!line.empty())
                line += ", ";
            line += c < headers.size() ? headers[c] : "Column" + std::to_string(c + 1);
            line += ": ";
            line += value;
        }
        if (line.empty())
            continue;
        if (!content.empty())
            content += '\n';
        content += line;
    }

    if (raggedRows > 0) {
        result.warnings.push_back(std::to_string(raggedRows) +
                                  " row(s) have a different column count than the header");
    }
    if (content.empty()) {
        result.warnings.push_back("Document contains no readable text content");
    }

    result.content = std::move(content);
    result.metadata["rowCount"] = std::to_string(records.size() - 1);
    result.metadata["columnCount"] = std::to_string(headers.size());
    return result;
}

} // namespace sift::extraction
