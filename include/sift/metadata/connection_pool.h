#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>
#include <sift/metadata/database.h>

namespace sift::metadata {

struct ConnectionPoolConfig {
    size_t minConnections = 2; ///< Opened eagerly by initialize()
    size_t maxConnections = 8;
    std::chrono::milliseconds acquireTimeout{30000};
    SessionOptions session;
};

class ConnectionPool;

/**
 * @brief Leased connection; goes back to the pool when destroyed
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db, ConnectionPool* pool)
        : db_(std::move(db)), pool_(pool) {}
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept
        : db_(std::move(other.db_)), pool_(other.pool_) {}
    PooledConnection& operator=(PooledConnection&&) = delete;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database& operator*() { return *db_; }
    Database* operator->() { return db_.get(); }

private:
    std::unique_ptr<Database> db_;
    ConnectionPool* pool_;
};

/**
 * @brief Bounded set of independent SQLite connections.
 *
 * A connection serves one unit of work at a time. Concurrent readers and writers
 * (ingestion workers, the two hybrid search branches) each lease their own.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::string dbPath, ConnectionPoolConfig config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> initialize();

    /**
     * @brief Close idle connections and fail later acquires. Leased connections close on return.
     */
    void shutdown();

    /**
     * @brief Lease a connection, opening a new one while under maxConnections
     * @return Timeout when none frees up in time, InvalidState after shutdown
     */
    Result<PooledConnection> acquire();

    /**
     * @brief Run func with a leased connection; exceptions become DatabaseError
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto lease = acquire();
        if (!lease) {
            return Error{lease.error().code,
                         "Failed to acquire database connection: " + lease.error().message};
        }
        auto conn = std::move(lease).value();
        try {
            return func(*conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    friend class PooledConnection;

    Result<std::unique_ptr<Database>> open() const;
    void release(std::unique_ptr<Database> db);

    std::string dbPath_;
    ConnectionPoolConfig config_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Database>> idle_;
    size_t open_ = 0; ///< Idle plus leased
    bool shutdown_ = false;
};

} // namespace sift::metadata
