#include <sift/config/config_helpers.h>
#include <sift/extraction/document_parser.h>
#include <sift/extraction/text_parsers.h>
#include <sift/metadata/path_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sift::extraction {

// Built-in parsers; SIFT_REGISTER_PARSER adds others at static initialization
DocumentParserRegistry::DocumentParserRegistry() {
    auto registerBuiltin = [this](auto factory) {
        auto probe = factory();
        registerParser(probe->supportedExtensions(), factory);
    };
    registerBuiltin([]() -> std::unique_ptr<IDocumentParser> {
        return std::make_unique<PlainTextParser>();
    });
    registerBuiltin([]() -> std::unique_ptr<IDocumentParser> {
        return std::make_unique<MarkdownParser>();
    });
    registerBuiltin(
        []() -> std::unique_ptr<IDocumentParser> { return std::make_unique<CsvParser>(); });

    spdlog::debug("DocumentParserRegistry initialized with {} extensions", parsers_.size());
}

DocumentParserRegistry& DocumentParserRegistry::instance() {
    static DocumentParserRegistry instance;
    return instance;
}

std::unique_ptr<IDocumentParser>
DocumentParserRegistry::create(const std::string& extension) const {
    auto ext = config::to_lower(extension);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = parsers_.find(ext);
    if (it != parsers_.end()) {
        return it->second();
    }
    return nullptr;
}

std::unique_ptr<IDocumentParser>
DocumentParserRegistry::createForFile(const std::string& fileName) const {
    return create(metadata::fileExtension(fileName));
}

void DocumentParserRegistry::registerParser(const std::vector<std::string>& extensions,
                                            ParserCreator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& ext : extensions) {
        parsers_[config::to_lower(ext)] = creator;
    }
}

std::vector<std::string> DocumentParserRegistry::supportedExtensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> extensions;
    extensions.reserve(parsers_.size());
    for (const auto& [ext, _] : parsers_) {
        extensions.push_back(ext);
    }
    std::sort(extensions.begin(), extensions.end());
    return extensions;
}

bool DocumentParserRegistry::isSupported(const std::string& extension) const {
    auto ext = config::to_lower(extension);
    std::lock_guard<std::mutex> lock(mutex_);
    return parsers_.count(ext) > 0;
}

Result<ParseResult> parseDocument(ByteSpan data, const std::string& fileName,
                                  std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Parsing cancelled"};
    }

    auto ext = metadata::fileExtension(fileName);
    auto parser = DocumentParserRegistry::instance().create(ext);
    if (!parser) {
        ParseResult unsupported;
        unsupported.warnings.push_back("Unsupported file type: " + (ext.empty() ? fileName : ext));
        return unsupported;
    }

    try {
        return parser->parse(data, fileName, stop);
    } catch (const std::exception& e) {
        spdlog::warn("{} parser failed on {}: {}", parser->name(),
                     config::sanitize_for_terminal(fileName), e.what());
        ParseResult failed;
        failed.warnings.push_back(std::string("Error reading file: ") + e.what());
        return failed;
    }
}

} // namespace sift::extraction
