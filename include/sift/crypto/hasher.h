#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <sift/core/types.h>

namespace sift::crypto {

// SHA-256 content hasher backed by OpenSSL EVP
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);

    // Returns lowercase hex digest and resets the context for reuse
    std::string finalize();

    Result<std::string> hashFile(const std::filesystem::path& path);

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace sift::crypto
