#include <sift/metadata/database.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>

namespace sift::metadata {

namespace {

constexpr int kMaxStepAttempts = 5;
constexpr std::chrono::milliseconds kFirstBackoff{10};
constexpr size_t kSqlSnippetLength = 100;

Result<void> checkBind(int rc, const char* kind) {
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to bind {}: {}", kind, sqlite3_errstr(rc))};
    }
    return {};
}

Error notOpen() {
    return Error{ErrorCode::InvalidState, "Database not open"};
}

} // namespace

Statement::Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(fmt::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), "null");
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), "int64");
}

Result<void> Statement::bind(int index, double value) {
    return checkBind(sqlite3_bind_double(stmt_, index, value), "double");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT),
                     "text");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return checkBind(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                       SQLITE_TRANSIENT),
                     "blob");
}

int Statement::stepWithRetry() {
    auto backoff = kFirstBackoff;
    int rc = SQLITE_ERROR;
    for (int attempt = 1; attempt <= kMaxStepAttempts; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED)
            return rc;
        if (attempt == kMaxStepAttempts)
            break;
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
    return rc;
}

Error Statement::stepError(int rc, const char* action) const {
    std::string message = fmt::format("Failed to {} statement: {}", action, sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            std::string_view text(sql);
            message += fmt::format(" [SQL: {}{}]", text.substr(0, kSqlSnippetLength),
                                   text.size() > kSqlSnippetLength ? "..." : "");
        }
    }
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

Result<void> Statement::execute() {
    int rc = stepWithRetry();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW)
        return {};
    return stepError(rc, "execute");
}

Result<bool> Statement::step() {
    int rc = stepWithRetry();
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return stepError(rc, "step");
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};
    std::vector<std::byte> out(static_cast<size_t>(size));
    std::memcpy(out.data(), blob, out.size());
    return out;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    // sqlite3_reset echoes the last step error, which the caller already saw
    sqlite3_reset(stmt_);
    return {};
}

Result<void> Statement::clearBindings() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "Statement is not prepared"};
    if (sqlite3_clear_bindings(stmt_) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "Failed to clear bindings"};
    return {};
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, const SessionOptions& options) {
    close();
    // NOMUTEX: a connection is only ever used by the thread that leased it
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        close();
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to open database {}: {}", path, reason)};
    }

    sqlite3_busy_timeout(db_, static_cast<int>(options.busyTimeout.count()));

    if (options.wal) {
        if (auto wal = execute("PRAGMA journal_mode=WAL"); !wal) {
            spdlog::warn("WAL not enabled for {}: {}", path, wal.error().message);
        }
        if (auto sync = execute("PRAGMA synchronous=NORMAL"); !sync) {
            spdlog::debug("PRAGMA synchronous failed: {}", sync.error().message);
        }
    }
    if (options.foreignKeys) {
        auto fk = execute("PRAGMA foreign_keys=ON");
        if (!fk) {
            close();
            return fk.error();
        }
    }
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_)
        return notOpen();
    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return notOpen();

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string reason = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", reason, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + reason};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_)
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    // IMMEDIATE takes the write lock up front so concurrent writers wait on busy_timeout
    auto r = execute("BEGIN IMMEDIATE");
    if (r)
        inTransaction_ = true;
    return r;
}

Result<void> Database::commit() {
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    auto r = execute("COMMIT");
    if (r)
        inTransaction_ = false;
    return r;
}

Result<void> Database::rollback() {
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    inTransaction_ = false;
    return execute("ROLLBACK");
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::hasFTS5() {
    if (!db_)
        return notOpen();
    // Probe with a temp table; compile options miss FTS5 loaded as an extension
    int rc = sqlite3_exec(db_, "CREATE VIRTUAL TABLE temp.sift_fts5_probe USING fts5(x)", nullptr,
                          nullptr, nullptr);
    if (rc != SQLITE_OK)
        return false;
    sqlite3_exec(db_, "DROP TABLE temp.sift_fts5_probe", nullptr, nullptr, nullptr);
    return true;
}

} // namespace sift::metadata
