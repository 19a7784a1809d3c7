// Shared fixtures for sift unit tests
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <vector>

#include <sift/metadata/connection_pool.h>
#include <sift/metadata/document_repository.h>
#include <sift/storage/content_source.h>
#include <sift/vector/embedding_provider.h>

namespace sift::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "sift_test_") {
    auto base = std::filesystem::temp_directory_path();
    auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(ts) + "_" +
                         std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

/**
 * @brief Temp-dir SQLite database with schema applied
 */
struct TestDatabase {
    std::filesystem::path dir;
    std::unique_ptr<metadata::ConnectionPool> pool;
    std::unique_ptr<metadata::DocumentRepository> repository;

    explicit TestDatabase(const std::string& prefix = "sift_db_") : dir(make_temp_dir(prefix)) {
        metadata::ConnectionPoolConfig config;
        config.minConnections = 1;
        config.maxConnections = 4;
        pool = std::make_unique<metadata::ConnectionPool>((dir / "sift.db").string(), config);
        initialized = pool->initialize().has_value();
        repository = std::make_unique<metadata::DocumentRepository>(*pool);
        if (initialized)
            initialized = repository->initialize().has_value();
    }

    ~TestDatabase() {
        repository.reset();
        if (pool)
            pool->shutdown();
        pool.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    bool initialized = false;
};

/**
 * @brief Content source backed by a map; paths are used as given
 */
class MemoryContentSource : public storage::IContentSource {
public:
    void put(const std::string& path, std::string content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = std::move(content);
    }

    void remove(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.erase(path);
    }

    Result<std::unique_ptr<std::istream>> open(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end())
            return Error{ErrorCode::FileNotFound, "No such file: " + path};
        return std::unique_ptr<std::istream>(std::make_unique<std::istringstream>(it->second));
    }

    Result<bool> exists(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.count(path) > 0;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::string> files_;
};

/**
 * @brief Deterministic embedder with switches for failure and blocking.
 *
 * Vectors come from HashEmbeddingProvider. With blockUntilStopped set, batch calls
 * spin until their stop token fires and then report cancellation. The next holdNext
 * batch calls wait for released and then carry on.
 */
class FakeEmbeddingProvider : public vector::IEmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(size_t dims = 64) : inner_(dims, "fake-embed") {}

    Result<vector::Embedding> embed(const std::string& text, std::stop_token stop = {}) override {
        ++calls;
        if (failAll.load())
            return Error{ErrorCode::NetworkError, "embedding service unavailable"};
        return inner_.embed(text, stop);
    }

    Result<std::vector<vector::Embedding>> embedBatch(std::span<const std::string> texts,
                                                      std::stop_token stop = {}) override {
        ++calls;
        if (beforeBatch)
            beforeBatch();
        if (holdNext.load() > 0 && holdNext.fetch_sub(1) > 0) {
            // Ignores stop, like a request already on the wire
            holding = true;
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!released.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            holding = false;
        }
        if (blockUntilStopped.load()) {
            blocked = true;
            while (!stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return Error{ErrorCode::OperationCancelled, "Embedding cancelled"};
        }
        if (failAll.load())
            return Error{ErrorCode::NetworkError, "embedding service unavailable"};
        return inner_.embedBatch(texts, stop);
    }

    size_t dimensions() const override { return inner_.dimensions(); }
    std::string modelId() const override { return inner_.modelId(); }
    std::string providerName() const override { return "Fake"; }

    std::atomic<bool> failAll{false};
    std::atomic<bool> blockUntilStopped{false};
    std::atomic<bool> blocked{false};
    std::atomic<int> calls{0};
    std::atomic<int> holdNext{0}; ///< Batch calls still to hold until released
    std::atomic<bool> holding{false};
    std::atomic<bool> released{false};
    std::function<void()> beforeBatch;

private:
    vector::HashEmbeddingProvider inner_;
};

/**
 * @brief Poll until pred() holds or the timeout passes
 */
template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace sift::tests
