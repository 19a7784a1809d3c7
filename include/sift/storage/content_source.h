#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <sift/core/types.h>

namespace sift::storage {

/**
 * @brief Fetches original file bytes by logical path. Streams may be non-seekable.
 */
class IContentSource {
public:
    virtual ~IContentSource() = default;

    /**
     * @brief Open a stream for the logical path; FileNotFound when absent
     */
    virtual Result<std::unique_ptr<std::istream>> open(const std::string& logicalPath) = 0;

    virtual Result<bool> exists(const std::string& logicalPath) = 0;
};

/**
 * @brief Serves logical paths from a directory on the local filesystem
 */
class LocalContentSource : public IContentSource {
public:
    explicit LocalContentSource(std::filesystem::path root);

    Result<std::unique_ptr<std::istream>> open(const std::string& logicalPath) override;
    Result<bool> exists(const std::string& logicalPath) override;

    /**
     * @brief Filesystem location for a logical path; rejects paths escaping the root
     */
    Result<std::filesystem::path> resolve(const std::string& logicalPath) const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

/**
 * @brief Read a whole stream into memory.
 *
 * Seekable streams are read from the beginning with a single allocation; others are
 * drained in DEFAULT_BUFFER_SIZE blocks. Fails with ResourceExhausted past maxBytes
 * when maxBytes is nonzero.
 */
Result<ByteVector> bufferStream(std::istream& in, uint64_t maxBytes = 0);

} // namespace sift::storage
