#include <sift/metadata/path_utils.h>
#include <sift/storage/content_source.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace sift::storage {

namespace fs = std::filesystem;

LocalContentSource::LocalContentSource(fs::path root) : root_(std::move(root)) {}

Result<fs::path> LocalContentSource::resolve(const std::string& logicalPath) const {
    auto normalized = metadata::normalizeLogicalPath(logicalPath);
    fs::path relative = fs::path(normalized.substr(1)).lexically_normal();
    for (const auto& part : relative) {
        if (part == "..") {
            return Error{ErrorCode::InvalidArgument, "Path escapes content root: " + logicalPath};
        }
    }
    return root_ / relative;
}

Result<std::unique_ptr<std::istream>> LocalContentSource::open(const std::string& logicalPath) {
    auto resolved = resolve(logicalPath);
    if (!resolved)
        return resolved.error();

    std::error_code ec;
    const auto& p = resolved.value();
    if (!fs::is_regular_file(p, ec)) {
        return Error{ErrorCode::FileNotFound, "Content not found: " + logicalPath};
    }

    auto stream = std::make_unique<std::ifstream>(p, std::ios::binary);
    if (!stream->is_open()) {
        return Error{ErrorCode::PermissionDenied, "Cannot open: " + p.string()};
    }
    return std::unique_ptr<std::istream>(std::move(stream));
}

Result<bool> LocalContentSource::exists(const std::string& logicalPath) {
    auto resolved = resolve(logicalPath);
    if (!resolved)
        return resolved.error();
    std::error_code ec;
    bool present = fs::is_regular_file(resolved.value(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::PermissionDenied, ec.message()};
    }
    return present;
}

Result<ByteVector> bufferStream(std::istream& in, uint64_t maxBytes) {
    ByteVector data;

    auto start = in.tellg();
    if (start != std::streampos(-1)) {
        in.seekg(0, std::ios::end);
        auto end = in.tellg();
        in.seekg(0, std::ios::beg);
        if (end != std::streampos(-1) && in.good()) {
            auto size = static_cast<uint64_t>(end);
            if (maxBytes > 0 && size > maxBytes) {
                return Error{ErrorCode::ResourceExhausted,
                             fmt::format("Content size {} exceeds limit {}", size, maxBytes)};
            }
            data.reserve(static_cast<size_t>(size));
        } else {
            in.clear();
        }
    }

    std::vector<char> block(DEFAULT_BUFFER_SIZE);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        auto got = in.gcount();
        if (got <= 0)
            break;
        const auto* first = reinterpret_cast<const std::byte*>(block.data());
        data.insert(data.end(), first, first + got);
        if (maxBytes > 0 && data.size() > maxBytes) {
            return Error{ErrorCode::ResourceExhausted,
                         fmt::format("Content exceeds limit {}", maxBytes)};
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::CorruptedData, "Stream read failed"};
    }
    return data;
}

} // namespace sift::storage
