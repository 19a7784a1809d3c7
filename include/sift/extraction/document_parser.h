#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include <sift/core/types.h>

namespace sift::extraction {

/**
 * @brief Parsed text plus whatever the parser learned about the file
 */
struct ParseResult {
    std::string content;
    Metadata metadata;
    std::vector<std::string> warnings;
};

/**
 * @brief Turns raw file bytes into text.
 *
 * Recoverable problems come back as warnings with empty content. The only error a
 * parser returns is OperationCancelled.
 */
class IDocumentParser {
public:
    virtual ~IDocumentParser() = default;

    virtual Result<ParseResult> parse(ByteSpan data, const std::string& fileName,
                                      std::stop_token stop = {}) = 0;

    /**
     * @brief Lowercase extensions with leading dot
     */
    virtual std::vector<std::string> supportedExtensions() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Extension-keyed parser lookup
 */
class DocumentParserRegistry {
public:
    using ParserCreator = std::function<std::unique_ptr<IDocumentParser>()>;

    static DocumentParserRegistry& instance();

    /**
     * @brief Parser for an extension (".md"), or nullptr if none is registered
     */
    std::unique_ptr<IDocumentParser> create(const std::string& extension) const;

    std::unique_ptr<IDocumentParser> createForFile(const std::string& fileName) const;

    void registerParser(const std::vector<std::string>& extensions, ParserCreator creator);

    std::vector<std::string> supportedExtensions() const;
    bool isSupported(const std::string& extension) const;

private:
    DocumentParserRegistry();

    std::unordered_map<std::string, ParserCreator> parsers_;
    mutable std::mutex mutex_;
};

class ParserRegistrar {
public:
    ParserRegistrar(const std::vector<std::string>& extensions,
                    DocumentParserRegistry::ParserCreator creator) {
        DocumentParserRegistry::instance().registerParser(extensions, std::move(creator));
    }
};

#define SIFT_REGISTER_PARSER(ParserClass, ...)                                                     \
    static ::sift::extraction::ParserRegistrar _sift_parser_reg_##ParserClass(                     \
        {__VA_ARGS__}, []() { return std::make_unique<ParserClass>(); })

/**
 * @brief Parse with the parser registered for the file's extension.
 *
 * An unsupported extension yields empty content and an "Unsupported file type"
 * warning. Exceptions thrown by a parser become warnings. Cancellation is returned
 * as OperationCancelled.
 */
Result<ParseResult> parseDocument(ByteSpan data, const std::string& fileName,
                                  std::stop_token stop = {});

} // namespace sift::extraction
