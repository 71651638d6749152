/**
 * @file schema_migrator_test.cpp
 * @brief Unit tests for schema_migrator
 */

#include <catch2/catch_test_macros.hpp>

#include <jobq/storage/schema_migrator.hpp>

#include <sqlite3.h>

#include <stdexcept>

using namespace jobq::storage;

namespace {

/// RAII wrapper for SQLite database
class test_database {
public:
    test_database() {
        auto rc = sqlite3_open(":memory:", &db_);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto object_exists(const char* type, const char* name) const -> bool {
        const char* sql = "SELECT name FROM sqlite_master WHERE type=? AND name=?;";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        auto rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

private:
    sqlite3* db_{nullptr};
};

}  // namespace

TEST_CASE("schema_migrator fresh database", "[storage][migration]") {
    test_database db;
    schema_migrator migrator;

    CHECK(migrator.get_current_version(db.get()) == 0);
    REQUIRE(migrator.run_migrations(db.get()).is_ok());

    CHECK(migrator.get_current_version(db.get()) == migrator.get_latest_version());
    CHECK(db.object_exists("table", "queue_jobs"));
    CHECK(db.object_exists("table", "schema_version"));
    CHECK(db.object_exists("index", "idx_queue_jobs_dispatch"));
}

TEST_CASE("schema_migrator is idempotent", "[storage][migration]") {
    test_database db;
    schema_migrator migrator;

    REQUIRE(migrator.run_migrations(db.get()).is_ok());
    REQUIRE(migrator.run_migrations(db.get()).is_ok());
    CHECK(migrator.get_current_version(db.get()) == 1);
}

TEST_CASE("schema rejects unknown status values", "[storage][migration]") {
    test_database db;
    schema_migrator migrator;
    REQUIRE(migrator.run_migrations(db.get()).is_ok());

    const char* bad_insert = R"(
        INSERT INTO queue_jobs (job_id, type_tag, payload, status, created_at, updated_at)
        VALUES ('x', 't', X'00', 'paused', 0, 0);
    )";
    CHECK(sqlite3_exec(db.get(), bad_insert, nullptr, nullptr, nullptr) == SQLITE_CONSTRAINT);
}
