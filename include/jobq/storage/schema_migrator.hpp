/**
 * @file schema_migrator.hpp
 * @brief Versioned schema migrations for the SQLite job store
 */

#pragma once

#include <jobq/core/result.hpp>

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace jobq::storage {

/**
 * @brief Function type for migration implementations
 *
 * Each migration receives the open database handle and executes the SQL
 * that upgrades the schema to its target version.
 */
using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Applies pending schema migrations in version order
 *
 * The current version is tracked in a schema_version table. Every
 * migration runs inside its own transaction and is rolled back on failure,
 * so a database is always at a well-defined version.
 *
 * Thread Safety: This class is NOT thread-safe. External synchronization
 * is required for concurrent access to the same database.
 */
class schema_migrator {
public:
    schema_migrator();
    ~schema_migrator() = default;

    schema_migrator(const schema_migrator&) = delete;
    auto operator=(const schema_migrator&) -> schema_migrator& = delete;
    schema_migrator(schema_migrator&&) = delete;
    auto operator=(schema_migrator&&) -> schema_migrator& = delete;

    /**
     * @brief Run every migration newer than the current version
     *
     * @param db The SQLite database handle
     * @return error_codes::store_migration_error if a migration fails
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Current schema version, 0 for a fresh database
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description) -> VoidResult;
    [[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql) -> VoidResult;

    // Migration implementations
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;

    /// Latest schema version (increment when adding migrations)
    static constexpr int LATEST_VERSION = 1;

    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace jobq::storage
