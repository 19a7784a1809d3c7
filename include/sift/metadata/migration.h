#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <sift/metadata/database.h>

namespace sift::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version = 0;   ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for migrations that need runtime checks)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Applies pending migrations in version order, each in its own transaction
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    Result<void> initialize();
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    [[nodiscard]] int getLatestVersion() const;

    Result<void> migrate();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
};

/**
 * @brief Schema for documents, chunks, vectors and the keyword index
 */
class SiftMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    static Migration createInitialSchema();
    static Migration createVectorTables();
    static Migration createKeywordIndex();
};

/**
 * @brief Convenience: initialize history and migrate to latest
 */
Result<void> migrateToLatest(Database& db);

} // namespace sift::metadata
