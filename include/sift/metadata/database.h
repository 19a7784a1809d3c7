#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <sift/core/types.h>

namespace sift::metadata {

/**
 * @brief Per-connection pragmas applied right after open
 */
struct SessionOptions {
    std::chrono::milliseconds busyTimeout{5000};
    bool wal = true;         ///< journal_mode=WAL; a failure is logged, not fatal
    bool foreignKeys = true; ///< Needed for chunk and vector cascades
};

/**
 * @brief Prepared statement owning its sqlite3_stmt.
 *
 * The constructor throws std::runtime_error when preparation fails;
 * Database::prepare turns that into a Result.
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, std::span<const std::byte> blob);

    /**
     * @brief Bind arguments to parameters 1..N in order
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> result;
        // Stops at the first failed bind
        ((result = bind(++index, std::forward<Args>(args)), static_cast<bool>(result)) && ...);
        return result;
    }

    /**
     * @brief Run to completion; for statements that return no rows
     */
    Result<void> execute();

    /**
     * @return true while a row is available
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    Result<void> reset();
    Result<void> clearBindings();

private:
    // sqlite3_step with bounded backoff on BUSY/LOCKED
    int stepWithRetry();
    Error stepError(int rc, const char* action) const;

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One SQLite connection. Not thread-safe; the pool hands it to one user at a time.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open (creating if missing) and apply session pragmas
     */
    Result<void> open(const std::string& path, const SessionOptions& options = {});
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief BEGIN IMMEDIATE, run func, COMMIT; rolls back on an error result or exception
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto begun = beginTransaction();
        if (!begun)
            return begun;

        try {
            auto result = func();
            if (!result) {
                (void)rollback();
                return result;
            }
            return commit();
        } catch (const std::exception&) {
            (void)rollback();
            throw;
        }
    }

    /**
     * @brief Rows touched by the last INSERT, UPDATE or DELETE
     */
    int changes() const;

    Result<bool> hasFTS5();

private:
    sqlite3* db_ = nullptr;
    bool inTransaction_ = false;
};

} // namespace sift::metadata
