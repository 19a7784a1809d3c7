#include <sift/metadata/migration.h>

#include <spdlog/spdlog.h>

#include <chrono>

namespace sift::metadata {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL
        );
    )");
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        migrations_[migration.version] = std::move(migration);
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }
    return 0;
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion)
            continue;
        auto result = applyMigration(migration);
        if (!result) {
            spdlog::error("Migration {} ({}) failed: {}", version, migration.name,
                          result.error().message);
            return result;
        }
    }
    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    auto start = std::chrono::steady_clock::now();

    auto result = db_.transaction([&]() -> Result<void> {
        if (!migration.upSQL.empty()) {
            auto r = db_.execute(migration.upSQL);
            if (!r)
                return r;
        }
        if (migration.upFunc) {
            auto r = migration.upFunc(db_);
            if (!r)
                return r;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();
        auto stmtResult = db_.prepare("INSERT INTO migration_history (version, name, applied_at, "
                                      "duration_ms) VALUES (?, ?, ?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
        auto bindResult = stmt.bindAll(migration.version, migration.name, static_cast<int64_t>(now),
                                       static_cast<int64_t>(elapsed));
        if (!bindResult)
            return bindResult;
        return stmt.execute();
    });

    if (result) {
        spdlog::debug("Applied migration {}: {}", migration.version, migration.name);
    }
    return result;
}

std::vector<Migration> SiftMigrations::getAllMigrations() {
    return {createInitialSchema(), createVectorTables(), createKeywordIndex()};
}

Migration SiftMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create documents and chunks";
    m.upSQL = R"(
        CREATE TABLE documents (
            id TEXT PRIMARY KEY,
            scope_id TEXT NOT NULL,
            path TEXT NOT NULL,
            file_name TEXT NOT NULL,
            content_type TEXT,
            content_hash TEXT,
            size_bytes INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL DEFAULT 'Pending',
            error_message TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            last_indexed_at INTEGER,
            metadata TEXT NOT NULL DEFAULT '{}'
        );

        CREATE TABLE chunks (
            id TEXT PRIMARY KEY,
            document_id TEXT NOT NULL,
            scope_id TEXT NOT NULL,
            path TEXT NOT NULL,
            content TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            token_count INTEGER NOT NULL,
            start_offset INTEGER NOT NULL,
            end_offset INTEGER NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}',
            FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
        );

        CREATE INDEX idx_documents_scope_path ON documents(scope_id, path);
        CREATE INDEX idx_documents_status ON documents(status);
        CREATE INDEX idx_chunks_document ON chunks(document_id, chunk_index);
        CREATE INDEX idx_chunks_scope_path ON chunks(scope_id, path);
    )";
    return m;
}

Migration SiftMigrations::createVectorTables() {
    Migration m;
    m.version = 2;
    m.name = "Create chunk vectors";
    m.upSQL = R"(
        CREATE TABLE chunk_vectors (
            chunk_id TEXT PRIMARY KEY,
            document_id TEXT NOT NULL,
            scope_id TEXT NOT NULL,
            path TEXT NOT NULL,
            model_id TEXT NOT NULL,
            dimensions INTEGER NOT NULL,
            embedding BLOB NOT NULL,
            FOREIGN KEY (chunk_id) REFERENCES chunks(id) ON DELETE CASCADE,
            FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
        );

        CREATE INDEX idx_chunk_vectors_scope ON chunk_vectors(scope_id, path);
        CREATE INDEX idx_chunk_vectors_document ON chunk_vectors(document_id);
    )";
    return m;
}

Migration SiftMigrations::createKeywordIndex() {
    Migration m;
    m.version = 3;
    m.name = "Create FTS5 keyword index";
    m.upFunc = [](Database& db) -> Result<void> {
        auto fts5Result = db.hasFTS5();
        if (!fts5Result)
            return fts5Result.error();

        if (!fts5Result.value()) {
            return Error{ErrorCode::NotSupported, "SQLite build lacks FTS5"};
        }

        return db.execute(R"(
            CREATE VIRTUAL TABLE chunks_fts USING fts5(
                content,
                chunk_id UNINDEXED,
                document_id UNINDEXED,
                scope_id UNINDEXED,
                path UNINDEXED,
                tokenize='porter unicode61'
            );

            CREATE TRIGGER chunks_fts_insert AFTER INSERT ON chunks BEGIN
                INSERT INTO chunks_fts (content, chunk_id, document_id, scope_id, path)
                VALUES (new.content, new.id, new.document_id, new.scope_id, new.path);
            END;

            CREATE TRIGGER chunks_fts_delete AFTER DELETE ON chunks BEGIN
                DELETE FROM chunks_fts WHERE chunk_id = old.id;
            END;
        )");
    };
    return m;
}

Result<void> migrateToLatest(Database& db) {
    MigrationManager manager(db);
    auto init = manager.initialize();
    if (!init)
        return init;
    manager.registerMigrations(SiftMigrations::getAllMigrations());
    return manager.migrate();
}

} // namespace sift::metadata
