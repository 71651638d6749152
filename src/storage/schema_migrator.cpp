/**
 * @file schema_migrator.cpp
 * @brief Implementation of the job store schema migrations
 */

#include <jobq/storage/schema_migrator.hpp>

#include <jobq/compat/format.hpp>

#include <sqlite3.h>

#include <string>

namespace jobq::storage {

// ============================================================================
// Construction
// ============================================================================

schema_migrator::schema_migrator() {
    migrations_.emplace_back(1, [this](sqlite3* db) { return migrate_v1(db); });
}

// ============================================================================
// Migration Operations
// ============================================================================

auto schema_migrator::run_migrations(sqlite3* db) -> VoidResult {
    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    for (const auto& [version, migrate] : migrations_) {
        if (version <= current_version) {
            continue;
        }

        auto begin_result = execute_sql(db, "BEGIN IMMEDIATE TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = migrate(db);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return jobq_void_error(
                error_codes::store_migration_error,
                jobq::compat::format("Migration to version {} failed: {}",
                                     version, migration_result.error().message));
        }

        auto record_result = record_migration(
            db, version, jobq::compat::format("queue schema v{}", version));
        if (record_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return record_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto schema_migrator::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return 0;
    }

    rc = sqlite3_prepare_v2(db, "SELECT MAX(version) FROM schema_version;", -1,
                            &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // NULL (empty table) reads as 0
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto schema_migrator::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto schema_migrator::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    return execute_sql(db, R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )");
}

auto schema_migrator::record_migration(sqlite3* db, int version,
                                       std::string_view description) -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_void_error(
            error_codes::store_migration_error,
            jobq::compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)));
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return jobq_void_error(
            error_codes::store_migration_error,
            jobq::compat::format("Failed to record migration: {}", sqlite3_errmsg(db)));
    }

    return ok();
}

auto schema_migrator::execute_sql(sqlite3* db, std::string_view sql) -> VoidResult {
    char* error_msg = nullptr;
    auto rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return jobq_void_error(
            error_codes::store_migration_error,
            jobq::compat::format("SQL execution failed: {}", error));
    }
    return ok();
}

// ============================================================================
// Migrations
// ============================================================================

auto schema_migrator::migrate_v1(sqlite3* db) -> VoidResult {
    return execute_sql(db, R"(
        CREATE TABLE IF NOT EXISTS queue_jobs (
            job_id          TEXT PRIMARY KEY,
            type_tag        TEXT NOT NULL,
            payload         BLOB NOT NULL,
            priority        INTEGER NOT NULL DEFAULT 1
                            CHECK (priority BETWEEN 0 AND 2),
            status          TEXT NOT NULL DEFAULT 'queued'
                            CHECK (status IN ('queued', 'running', 'completed',
                                              'failed', 'cancelled')),
            created_at      INTEGER NOT NULL,
            updated_at      INTEGER NOT NULL,
            attempt_count   INTEGER NOT NULL DEFAULT 0,
            has_result      INTEGER NOT NULL DEFAULT 0,
            result_output   TEXT,
            result_error    TEXT,
            current_step    INTEGER NOT NULL DEFAULT 0,
            total_steps     INTEGER NOT NULL DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_queue_jobs_dispatch
            ON queue_jobs(status, priority DESC, created_at ASC);
        CREATE INDEX IF NOT EXISTS idx_queue_jobs_updated
            ON queue_jobs(status, updated_at);
    )");
}

}  // namespace jobq::storage
