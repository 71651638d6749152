/**
 * @file job_store.hpp
 * @brief Abstract durable table of job records
 *
 * This file defines the job_store interface shared by the in-memory and the
 * SQLite implementations. The queue manager talks to persistence only
 * through this interface.
 *
 * @see memory_job_store.hpp, sqlite_job_store.hpp
 */

#pragma once

#include <jobq/core/result.hpp>
#include <jobq/queue/job_types.hpp>

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobq::storage {

/**
 * @brief Abstract base class for job persistence
 *
 * Ordering contract for every list operation: status group (running,
 * queued, completed, failed, cancelled), then priority descending, then
 * created_at ascending.
 *
 * Thread Safety:
 * - Implementations must be internally synchronized. Each operation is
 *   atomic with respect to concurrent readers; multi-step read-then-write
 *   sequences still need external locking.
 */
class job_store {
public:
    virtual ~job_store() = default;

    job_store(const job_store&) = delete;
    auto operator=(const job_store&) -> job_store& = delete;
    job_store(job_store&&) = delete;
    auto operator=(job_store&&) -> job_store& = delete;

    // =========================================================================
    // Writes
    // =========================================================================

    /**
     * @brief Insert a new record
     *
     * @param record Record to insert
     * @return error_codes::duplicate_job if the id already exists
     */
    [[nodiscard]] virtual auto insert(const queue::job_record& record)
        -> VoidResult = 0;

    /**
     * @brief Atomically move a record to a new status
     *
     * Sets updated_at to @p at. A transition into running also increments
     * attempt_count in the same write. The stored result is replaced by
     * @p result (cleared when std::nullopt).
     *
     * @param job_id Record to update
     * @param status New status
     * @param result Terminal outcome, if any
     * @param at Transition timestamp
     * @return error_codes::job_not_found if the id does not exist
     */
    [[nodiscard]] virtual auto update_status(
        std::string_view job_id,
        queue::job_status status,
        const std::optional<queue::job_result>& result,
        queue::job_clock::time_point at) -> VoidResult = 0;

    /**
     * @brief Change the priority of a record; created_at is untouched
     */
    [[nodiscard]] virtual auto update_priority(std::string_view job_id,
                                               queue::job_priority priority)
        -> VoidResult = 0;

    /**
     * @brief Record the last progress reported for a job
     */
    [[nodiscard]] virtual auto update_progress(std::string_view job_id,
                                               const queue::job_progress& progress)
        -> VoidResult = 0;

    /**
     * @brief Delete records whose status is in @p statuses and whose
     *        updated_at is older than @p cutoff
     *
     * @return Number of deleted records
     */
    [[nodiscard]] virtual auto delete_older_than(
        const std::vector<queue::job_status>& statuses,
        queue::job_clock::time_point cutoff) -> Result<std::size_t> = 0;

    // =========================================================================
    // Reads
    // =========================================================================

    /**
     * @brief Fetch a single record
     * @return std::nullopt when the id is unknown
     */
    [[nodiscard]] virtual auto get(std::string_view job_id)
        -> Result<std::optional<queue::job_record>> = 0;

    [[nodiscard]] virtual auto scan_by_status(queue::job_status status)
        -> Result<std::vector<queue::job_record>> = 0;

    [[nodiscard]] virtual auto scan_all()
        -> Result<std::vector<queue::job_record>> = 0;

    [[nodiscard]] virtual auto count_by_status(queue::job_status status)
        -> Result<std::size_t> = 0;

    /**
     * @brief Newest created_at across all records, if any
     *
     * Used at startup to keep created_at strictly increasing across
     * restarts.
     */
    [[nodiscard]] virtual auto latest_created_at()
        -> Result<std::optional<queue::job_clock::time_point>> = 0;

    /**
     * @brief Whether records survive process restarts
     */
    [[nodiscard]] virtual auto is_durable() const noexcept -> bool = 0;

protected:
    job_store() = default;
};

/**
 * @brief Sort records into the store ordering contract
 *
 * Shared by implementations that cannot push ordering into a query.
 */
void sort_records(std::vector<queue::job_record>& records);

}  // namespace jobq::storage
