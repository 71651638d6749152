/**
 * @file memory_job_store.hpp
 * @brief Non-durable job_store kept in process memory
 */

#pragma once

#include <jobq/storage/job_store.hpp>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace jobq::storage {

/**
 * @brief In-memory job_store
 *
 * Same contract as sqlite_job_store, but every record is lost when the
 * store is destroyed. Intended for tests and for applications that do not
 * need crash recovery.
 *
 * Thread Safety: All methods are thread-safe (std::shared_mutex).
 */
class memory_job_store final : public job_store {
public:
    memory_job_store() = default;
    ~memory_job_store() override = default;

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

    [[nodiscard]] auto is_durable() const noexcept -> bool override { return false; }

private:
    [[nodiscard]] auto find_locked(std::string_view job_id) -> queue::job_record*;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, queue::job_record> records_;
};

}  // namespace jobq::storage
