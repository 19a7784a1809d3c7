#include <sift/metadata/connection_pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sift::metadata {

PooledConnection::~PooledConnection() {
    if (db_ && pool_) {
        pool_->release(std::move(db_));
    }
}

ConnectionPool::ConnectionPool(std::string dbPath, ConnectionPoolConfig config)
    : dbPath_(std::move(dbPath)), config_(std::move(config)) {
    if (config_.maxConnections == 0)
        config_.maxConnections = 1;
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<std::unique_ptr<Database>> ConnectionPool::open() const {
    auto db = std::make_unique<Database>();
    auto r = db->open(dbPath_, config_.session);
    if (!r)
        return r.error();
    return db;
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_)
        return Error{ErrorCode::InvalidState, "Connection pool is shut down"};

    size_t target = std::min(config_.minConnections, config_.maxConnections);
    while (open_ < target) {
        auto db = open();
        if (!db) {
            spdlog::error("Could not open {}: {}", dbPath_, db.error().message);
            return db.error();
        }
        idle_.push_back(std::move(db).value());
        ++open_;
    }
    spdlog::debug("Connection pool for {} ready with {} connections", dbPath_, open_);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_)
        return;
    shutdown_ = true;
    open_ -= idle_.size();
    idle_.clear();
    cv_.notify_all();
}

Result<PooledConnection> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

    for (;;) {
        if (shutdown_)
            return Error{ErrorCode::InvalidState, "Connection pool is shut down"};

        if (!idle_.empty()) {
            auto db = std::move(idle_.back());
            idle_.pop_back();
            return PooledConnection(std::move(db), this);
        }

        if (open_ < config_.maxConnections) {
            ++open_;
            lock.unlock();
            auto db = open();
            if (!db) {
                lock.lock();
                --open_;
                cv_.notify_one();
                return db.error();
            }
            return PooledConnection(std::move(db).value(), this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty() &&
            !shutdown_) {
            return Error{ErrorCode::Timeout,
                         fmt::format("No connection free after {}ms",
                                     config_.acquireTimeout.count())};
        }
    }
}

void ConnectionPool::release(std::unique_ptr<Database> db) {
    // Never hand out a connection with an open transaction
    if (db->inTransaction()) {
        if (auto rb = db->rollback(); !rb) {
            spdlog::warn("Discarding connection after failed rollback: {}", rb.error().message);
            db.reset();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || !db) {
        --open_;
    } else {
        idle_.push_back(std::move(db));
    }
    cv_.notify_one();
}

} // namespace sift::metadata
