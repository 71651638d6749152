/**
 * @file sqlite_job_store.hpp
 * @brief Durable job_store backed by a SQLite database file
 *
 * Records live in the queue_jobs table. The database runs in WAL mode with
 * synchronous=FULL, and every status transition is a single UPDATE
 * statement, so after an abrupt termination a transition has either fully
 * landed or is absent.
 */

#pragma once

#include <jobq/di/ilogger.hpp>
#include <jobq/storage/job_store.hpp>
#include <jobq/storage/schema_migrator.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

// Forward declarations of SQLite handles
struct sqlite3;
struct sqlite3_stmt;

namespace jobq::storage {

/**
 * @brief Configuration for the SQLite job store
 */
struct sqlite_store_config {
    /// Milliseconds a statement waits for a competing writer
    int busy_timeout_ms{5000};

    /// Use write-ahead logging (ignored for in-memory databases)
    bool wal_mode{true};
};

/**
 * @brief SQLite implementation of job_store
 *
 * Thread Safety: All methods are thread-safe. The connection is opened in
 * serialized mode and each operation additionally holds an internal mutex
 * across prepare/step/finalize.
 *
 * @code
 * auto store = sqlite_job_store::open("/var/lib/worker/queue.db");
 * if (store.is_err()) {
 *     return store.error();
 * }
 * auto queued = store.value()->scan_by_status(queue::job_status::queued);
 * @endcode
 */
class sqlite_job_store final : public job_store {
public:
    /**
     * @brief Open (or create) a job database
     *
     * Applies connection pragmas and runs pending schema migrations.
     * Pass ":memory:" for a private in-memory database.
     *
     * @param db_path Path to the database file
     * @param config Connection options
     * @param logger Logger for diagnostics
     * @return The opened store, or error_codes::store_open_error /
     *         error_codes::store_migration_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& db_path,
                                   const sqlite_store_config& config = {},
                                   std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<sqlite_job_store>>;

    ~sqlite_job_store() override;

    [[nodiscard]] auto insert(const queue::job_record& record) -> VoidResult override;

    [[nodiscard]] auto update_status(std::string_view job_id,
                                     queue::job_status status,
                                     const std::optional<queue::job_result>& result,
                                     queue::job_clock::time_point at)
        -> VoidResult override;

    [[nodiscard]] auto update_priority(std::string_view job_id,
                                       queue::job_priority priority)
        -> VoidResult override;

    [[nodiscard]] auto update_progress(std::string_view job_id,
                                       const queue::job_progress& progress)
        -> VoidResult override;

    [[nodiscard]] auto delete_older_than(const std::vector<queue::job_status>& statuses,
                                         queue::job_clock::time_point cutoff)
        -> Result<std::size_t> override;

    [[nodiscard]] auto get(std::string_view job_id)
        -> Result<std::optional<queue::job_record>> override;

    [[nodiscard]] auto scan_by_status(queue::job_status status)
        -> Result<std::vector<queue::job_record>> override;

    [[nodiscard]] auto scan_all() -> Result<std::vector<queue::job_record>> override;

    [[nodiscard]] auto count_by_status(queue::job_status status)
        -> Result<std::size_t> override;

    [[nodiscard]] auto latest_created_at()
        -> Result<std::optional<queue::job_clock::time_point>> override;

    [[nodiscard]] auto is_durable() const noexcept -> bool override;

    /**
     * @brief Path the store was opened with
     */
    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    /**
     * @brief Schema version currently applied to the database
     */
    [[nodiscard]] auto schema_version() const -> int;

private:
    sqlite_job_store(sqlite3* db, std::string path,
                     std::shared_ptr<di::ILogger> logger);

    [[nodiscard]] auto run_select(std::string_view sql, std::string_view bind_text)
        -> Result<std::vector<queue::job_record>>;

    [[nodiscard]] auto execute_update(std::string_view job_id, sqlite3_stmt* stmt,
                                      std::string_view operation) -> VoidResult;

    [[nodiscard]] static auto parse_row(sqlite3_stmt* stmt) -> queue::job_record;

    sqlite3* db_{nullptr};
    std::string path_;
    std::shared_ptr<di::ILogger> logger_;
    schema_migrator migrator_;
    mutable std::mutex mutex_;
};

}  // namespace jobq::storage
