/**
 * @file sqlite_job_store.cpp
 * @brief Implementation of the SQLite job store
 */

#include <jobq/storage/sqlite_job_store.hpp>

#include <jobq/compat/format.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>

namespace jobq::storage {

using queue::job_clock;
using queue::job_record;
using queue::job_status;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

constexpr const char* select_columns = R"(
    SELECT job_id, type_tag, payload, priority, status, created_at, updated_at,
           attempt_count, has_result, result_output, result_error,
           current_step, total_steps
    FROM queue_jobs
)";

constexpr const char* listing_order = R"(
    ORDER BY CASE status
                 WHEN 'running' THEN 0
                 WHEN 'queued' THEN 1
                 WHEN 'completed' THEN 2
                 WHEN 'failed' THEN 3
                 ELSE 4
             END,
             priority DESC, created_at ASC, job_id ASC
)";

/// Timestamps are stored as microseconds since the epoch
[[nodiscard]] int64_t to_micros(job_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               tp.time_since_epoch())
        .count();
}

[[nodiscard]] job_clock::time_point from_micros(int64_t micros) {
    return job_clock::time_point{
        std::chrono::duration_cast<job_clock::duration>(
            std::chrono::microseconds{micros})};
}

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Get blob column as a byte string (NUL bytes preserved)
[[nodiscard]] std::string get_blob_column(sqlite3_stmt* stmt, int col) {
    auto data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
    auto size = sqlite3_column_bytes(stmt, col);
    if (!data || size <= 0) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(size));
}

/// Get int64 column with default
[[nodiscard]] int64_t get_int64_column(sqlite3_stmt* stmt, int col, int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

/// Get optional string column
[[nodiscard]] std::optional<std::string> get_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return get_text_column(stmt, col);
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

/// Bind optional string
void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
    if (value.has_value()) {
        bind_text(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

[[nodiscard]] bool is_memory_path(const std::string& path) {
    return path.empty() || path == ":memory:";
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

auto sqlite_job_store::open(const std::filesystem::path& db_path,
                            const sqlite_store_config& config,
                            std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<sqlite_job_store>> {
    using result_type = std::unique_ptr<sqlite_job_store>;

    if (!logger) {
        logger = di::null_logger();
    }

    auto path = db_path.string();
    if (path.empty()) {
        path = ":memory:";
    }

    sqlite3* db = nullptr;
    auto rc = sqlite3_open_v2(path.c_str(), &db,
                              SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                  SQLITE_OPEN_FULLMUTEX,
                              nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return jobq_error<result_type>(
            error_codes::store_open_error,
            jobq::compat::format("Failed to open job database {}: {}", path, error_msg));
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    if (config.wal_mode && !is_memory_path(path)) {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            std::string error_msg = sqlite3_errmsg(db);
            sqlite3_close(db);
            return jobq_error<result_type>(
                error_codes::store_open_error,
                jobq::compat::format("Failed to enable WAL mode: {}", error_msg));
        }
    }

    // Every committed transition must survive power loss
    rc = sqlite3_exec(db, "PRAGMA synchronous = FULL;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg = sqlite3_errmsg(db);
        sqlite3_close(db);
        return jobq_error<result_type>(
            error_codes::store_open_error,
            jobq::compat::format("Failed to set synchronous mode: {}", error_msg));
    }

    auto instance = std::unique_ptr<sqlite_job_store>(
        new sqlite_job_store(db, path, std::move(logger)));

    auto migration_result = instance->migrator_.run_migrations(db);
    if (migration_result.is_err()) {
        return jobq_error<result_type>(
            error_codes::store_migration_error,
            jobq::compat::format("Migration failed: {}",
                                 migration_result.error().message));
    }

    instance->logger_->info_fmt("Opened job store {} (schema v{})", path,
                                instance->migrator_.get_current_version(db));
    return instance;
}

sqlite_job_store::sqlite_job_store(sqlite3* db, std::string path,
                                   std::shared_ptr<di::ILogger> logger)
    : db_(db), path_(std::move(path)), logger_(std::move(logger)) {}

sqlite_job_store::~sqlite_job_store() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_job_store::is_durable() const noexcept -> bool {
    return !is_memory_path(path_);
}

auto sqlite_job_store::schema_version() const -> int {
    std::lock_guard lock(mutex_);
    return migrator_.get_current_version(db_);
}

// =============================================================================
// Writes
// =============================================================================

auto sqlite_job_store::insert(const job_record& record) -> VoidResult {
    static constexpr const char* sql = R"(
        INSERT INTO queue_jobs (
            job_id, type_tag, payload, priority, status, created_at, updated_at,
            attempt_count, has_result, result_output, result_error,
            current_step, total_steps
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_void_error(
            error_codes::store_write_error,
            jobq::compat::format("Failed to prepare insert: {}", sqlite3_errmsg(db_)));
    }

    int idx = 1;
    bind_text(stmt, idx++, record.job_id);
    bind_text(stmt, idx++, record.payload.type_tag);
    sqlite3_bind_blob(stmt, idx++, record.payload.data.data(),
                      static_cast<int>(record.payload.data.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, idx++, static_cast<int>(record.priority));
    bind_text(stmt, idx++, queue::to_string(record.status));
    sqlite3_bind_int64(stmt, idx++, to_micros(record.created_at));
    sqlite3_bind_int64(stmt, idx++, to_micros(record.updated_at));
    sqlite3_bind_int(stmt, idx++, record.attempt_count);
    sqlite3_bind_int(stmt, idx++, record.result.has_value() ? 1 : 0);
    if (record.result.has_value()) {
        bind_optional_text(stmt, idx++, record.result->output);
        bind_text(stmt, idx++, record.result->error_message);
    } else {
        sqlite3_bind_null(stmt, idx++);
        sqlite3_bind_null(stmt, idx++);
    }
    sqlite3_bind_int64(stmt, idx++, static_cast<int64_t>(record.progress.current_step));
    sqlite3_bind_int64(stmt, idx++, static_cast<int64_t>(record.progress.total_steps));

    rc = sqlite3_step(stmt);
    auto extended = sqlite3_extended_errcode(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        if (extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
            return jobq_void_error(
                error_codes::duplicate_job,
                jobq::compat::format("Job already exists: {}", record.job_id));
        }
        return jobq_void_error(
            error_codes::store_write_error,
            jobq::compat::format("Failed to insert job {}: {}", record.job_id,
                                 sqlite3_errmsg(db_)));
    }

    return ok();
}

auto sqlite_job_store::update_status(std::string_view job_id,
                                     job_status status,
                                     const std::optional<queue::job_result>& result,
                                     job_clock::time_point at) -> VoidResult {
    static constexpr const char* sql = R"(
        UPDATE queue_jobs
        SET status = ?,
            updated_at = ?,
            attempt_count = attempt_count + ?,
            has_result = ?,
            result_output = ?,
            result_error = ?
        WHERE job_id = ?
    )";

    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_void_error(
            error_codes::store_write_error,
            jobq::compat::format("Failed to prepare status update: {}",
                                 sqlite3_errmsg(db_)));
    }

    bind_text(stmt, 1, queue::to_string(status));
    sqlite3_bind_int64(stmt, 2, to_micros(at));
    sqlite3_bind_int(stmt, 3, status == job_status::running ? 1 : 0);
    sqlite3_bind_int(stmt, 4, result.has_value() ? 1 : 0);
    if (result.has_value()) {
        bind_optional_text(stmt, 5, result->output);
        bind_text(stmt, 6, result->error_message);
    } else {
        sqlite3_bind_null(stmt, 5);
        sqlite3_bind_null(stmt, 6);
    }
    bind_text(stmt, 7, job_id);

    return execute_update(job_id, stmt, "status update");
}

auto sqlite_job_store::update_priority(std::string_view job_id,
                                       queue::job_priority priority) -> VoidResult {
    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_, "UPDATE queue_jobs SET priority = ? WHERE job_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_void_error(
            error_codes::store_write_error,
            jobq::compat::format("Failed to prepare priority update: {}",
                                 sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(priority));
    bind_text(stmt, 2, job_id);

    return execute_update(job_id, stmt, "priority update");
}

auto sqlite_job_store::update_progress(std::string_view job_id,
                                       const queue::job_progress& progress) -> VoidResult {
    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_, "UPDATE queue_jobs SET current_step = ?, total_steps = ? WHERE job_id = ?",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_void_error(
            error_codes::store_write_error,
            jobq::compat::format("Failed to prepare progress update: {}",
                                 sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, static_cast<int64_t>(progress.current_step));
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(progress.total_steps));
    bind_text(stmt, 3, job_id);

    return execute_update(job_id, stmt, "progress update");
}

auto sqlite_job_store::delete_older_than(const std::vector<job_status>& statuses,
                                         job_clock::time_point cutoff)
    -> Result<std::size_t> {
    if (statuses.empty()) {
        return ok(std::size_t{0});
    }

    std::string placeholders;
    for (std::size_t i = 0; i < statuses.size(); ++i) {
        placeholders += (i == 0) ? "?" : ", ?";
    }
    auto sql = jobq::compat::format(
        "DELETE FROM queue_jobs WHERE status IN ({}) AND updated_at < ?", placeholders);

    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_error<std::size_t>(
            error_codes::store_write_error,
            jobq::compat::format("Failed to prepare delete: {}", sqlite3_errmsg(db_)));
    }

    int idx = 1;
    for (auto status : statuses) {
        bind_text(stmt, idx++, queue::to_string(status));
    }
    sqlite3_bind_int64(stmt, idx, to_micros(cutoff));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return jobq_error<std::size_t>(
            error_codes::store_write_error,
            jobq::compat::format("Failed to delete old jobs: {}", sqlite3_errmsg(db_)));
    }

    return ok(static_cast<std::size_t>(sqlite3_changes(db_)));
}

// =============================================================================
// Reads
// =============================================================================

auto sqlite_job_store::get(std::string_view job_id)
    -> Result<std::optional<job_record>> {
    auto sql = std::string(select_columns) + " WHERE job_id = ?";
    auto rows = run_select(sql, job_id);
    if (rows.is_err()) {
        return jobq_error<std::optional<job_record>>(rows.error().code,
                                                     rows.error().message);
    }

    auto& records = rows.value();
    if (records.empty()) {
        return ok(std::optional<job_record>(std::nullopt));
    }
    return ok(std::optional<job_record>(std::move(records.front())));
}

auto sqlite_job_store::scan_by_status(job_status status)
    -> Result<std::vector<job_record>> {
    auto sql = std::string(select_columns) + " WHERE status = ?" + listing_order;
    return run_select(sql, queue::to_string(status));
}

auto sqlite_job_store::scan_all() -> Result<std::vector<job_record>> {
    auto sql = std::string(select_columns) + listing_order;
    return run_select(sql, {});
}

auto sqlite_job_store::count_by_status(job_status status) -> Result<std::size_t> {
    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_, "SELECT COUNT(*) FROM queue_jobs WHERE status = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_error<std::size_t>(
            error_codes::store_query_error,
            jobq::compat::format("Failed to prepare count: {}", sqlite3_errmsg(db_)));
    }

    bind_text(stmt, 1, queue::to_string(status));

    std::size_t count = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return jobq_error<std::size_t>(
            error_codes::store_query_error,
            jobq::compat::format("Failed to count jobs: {}", sqlite3_errmsg(db_)));
    }
    return ok(count);
}

auto sqlite_job_store::latest_created_at()
    -> Result<std::optional<job_clock::time_point>> {
    using result_type = std::optional<job_clock::time_point>;

    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, "SELECT MAX(created_at) FROM queue_jobs", -1,
                                 &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_error<result_type>(
            error_codes::store_query_error,
            jobq::compat::format("Failed to prepare query: {}", sqlite3_errmsg(db_)));
    }

    result_type latest;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        latest = from_micros(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return jobq_error<result_type>(
            error_codes::store_query_error,
            jobq::compat::format("Failed to query latest job: {}", sqlite3_errmsg(db_)));
    }
    return ok(latest);
}

// =============================================================================
// Private Helpers
// =============================================================================

auto sqlite_job_store::run_select(std::string_view sql, std::string_view bind_value)
    -> Result<std::vector<job_record>> {
    std::lock_guard lock(mutex_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, std::string(sql).c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return jobq_error<std::vector<job_record>>(
            error_codes::store_query_error,
            jobq::compat::format("Failed to prepare query: {}", sqlite3_errmsg(db_)));
    }

    if (sqlite3_bind_parameter_count(stmt) > 0) {
        bind_text(stmt, 1, bind_value);
    }

    std::vector<job_record> records;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(parse_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return jobq_error<std::vector<job_record>>(
            error_codes::store_query_error,
            jobq::compat::format("Failed to read jobs: {}", sqlite3_errmsg(db_)));
    }

    return ok(std::move(records));
}

auto sqlite_job_store::execute_update(std::string_view job_id, sqlite3_stmt* stmt,
                                      std::string_view operation) -> VoidResult {
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        logger_->error_fmt("Job {} {} failed: {}", job_id, operation, sqlite3_errmsg(db_));
        return jobq_void_error(
            error_codes::store_write_error,
            jobq::compat::format("Failed {} for job {}: {}", operation, job_id,
                                 sqlite3_errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 0) {
        return jobq_void_error(error_codes::job_not_found,
                               jobq::compat::format("Job not found: {}", job_id));
    }

    return ok();
}

auto sqlite_job_store::parse_row(sqlite3_stmt* stmt) -> job_record {
    job_record record;

    int col = 0;
    record.job_id = get_text_column(stmt, col++);
    record.payload.type_tag = get_text_column(stmt, col++);
    record.payload.data = get_blob_column(stmt, col++);
    record.priority = queue::job_priority_from_int(
        static_cast<int>(get_int64_column(stmt, col++, 1)));
    record.status = queue::job_status_from_string(get_text_column(stmt, col++))
                        .value_or(job_status::queued);
    record.created_at = from_micros(get_int64_column(stmt, col++));
    record.updated_at = from_micros(get_int64_column(stmt, col++));
    record.attempt_count = static_cast<int>(get_int64_column(stmt, col++));

    bool has_result = get_int64_column(stmt, col++) != 0;
    auto output = get_optional_text(stmt, col++);
    auto error = get_text_column(stmt, col++);
    if (has_result) {
        record.result = queue::job_result{std::move(output), std::move(error)};
    }

    record.progress.current_step = static_cast<std::uint64_t>(get_int64_column(stmt, col++));
    record.progress.total_steps = static_cast<std::uint64_t>(get_int64_column(stmt, col++));

    return record;
}

}  // namespace jobq::storage
