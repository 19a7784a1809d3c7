#include <sift/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <vector>

namespace sift::crypto {

struct SHA256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

SHA256Hasher::SHA256Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

SHA256Hasher::~SHA256Hasher() = default;

SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
}

void SHA256Hasher::update(std::span<const std::byte> data) {
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    std::string result;
    result.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        result += fmt::format("{:02x}", digest[i]);
    }

    init();
    return result;
}

Result<std::string> SHA256Hasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, fmt::format("Failed to open file: {}", path.string())};
    }

    try {
        init();
        std::vector<std::byte> buffer(DEFAULT_BUFFER_SIZE);
        while (file) {
            file.read(reinterpret_cast<char*>(buffer.data()),
                      static_cast<std::streamsize>(buffer.size()));
            auto bytesRead = file.gcount();
            if (bytesRead > 0) {
                update(std::span{buffer.data(), static_cast<size_t>(bytesRead)});
            }
        }
        return finalize();
    } catch (const std::exception& e) {
        spdlog::error("Failed to hash file {}: {}", path.string(), e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
}

std::string SHA256Hasher::hash(std::span<const std::byte> data) {
    SHA256Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string SHA256Hasher::hash(std::string_view text) {
    return hash(std::as_bytes(std::span{text.data(), text.size()}));
}

} // namespace sift::crypto
