#include <sift/metadata/document.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sift::metadata {

using json = nlohmann::json;

const char* documentStatusToString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending:
            return "Pending";
        case DocumentStatus::Processing:
            return "Processing";
        case DocumentStatus::Ready:
            return "Ready";
        case DocumentStatus::Failed:
            return "Failed";
    }
    return "Pending";
}

Result<DocumentStatus> parseDocumentStatus(std::string_view text) {
    if (text == "Pending")
        return DocumentStatus::Pending;
    if (text == "Processing")
        return DocumentStatus::Processing;
    if (text == "Ready")
        return DocumentStatus::Ready;
    if (text == "Failed")
        return DocumentStatus::Failed;
    return Error{ErrorCode::InvalidData, "Unknown document status: " + std::string(text)};
}

std::string encodeMetadata(const Metadata& metadata) {
    json j = json::object();
    for (const auto& [k, v] : metadata) {
        j[k] = v;
    }
    return j.dump();
}

Metadata decodeMetadata(const std::string& text) {
    Metadata out;
    if (text.empty())
        return out;
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Discarding malformed metadata column");
        return out;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) {
            out[it.key()] = it.value().get<std::string>();
        } else {
            out[it.key()] = it.value().dump();
        }
    }
    return out;
}

} // namespace sift::metadata
