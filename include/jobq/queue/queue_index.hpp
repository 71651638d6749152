/**
 * @file queue_index.hpp
 * @brief In-memory priority/FIFO view of queued jobs
 *
 * The index holds only the ordering keys of queued records. It is never
 * persisted and is rebuilt from the store at startup or whenever the store
 * and the index may have diverged.
 */

#pragma once

#include <jobq/queue/job_types.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jobq::queue {

/**
 * @brief Ordering key of a queued job
 */
struct queue_entry {
    std::string job_id;
    job_priority priority{job_priority::normal};
    job_clock::time_point created_at;

    // Earlier creation first (FIFO within a priority level)
    bool operator<(const queue_entry& other) const {
        if (created_at != other.created_at) {
            return created_at < other.created_at;
        }
        return job_id < other.job_id;
    }
};

/**
 * @brief Three FIFO sequences, one per priority level
 *
 * peek_next() returns the oldest entry of the highest non-empty level.
 *
 * Thread Safety: NOT thread-safe. The queue manager guards it with its
 * own mutex.
 */
class queue_index {
public:
    queue_index() = default;

    /**
     * @brief Add a queued record
     * @return false if the id is already indexed
     */
    auto insert(const job_record& record) -> bool;

    /**
     * @brief Remove a job
     * @return false if the id was not indexed
     */
    auto remove(std::string_view job_id) -> bool;

    /**
     * @brief Oldest entry of the highest non-empty level, if any
     */
    [[nodiscard]] auto peek_next() const -> std::optional<queue_entry>;

    /**
     * @brief Move a job to another level, keeping its created_at
     * @return false if the id is not indexed
     */
    auto reorder(std::string_view job_id, job_priority new_priority) -> bool;

    /**
     * @brief Replace the contents with the given queued records
     *
     * Records whose status is not queued are ignored.
     */
    void rebuild(const std::vector<job_record>& records);

    void clear() noexcept;

    [[nodiscard]] auto contains(std::string_view job_id) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return locator_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return locator_.empty(); }

    [[nodiscard]] auto size(job_priority priority) const noexcept -> std::size_t;

    /**
     * @brief All entries in dispatch order
     */
    [[nodiscard]] auto snapshot() const -> std::vector<queue_entry>;

private:
    [[nodiscard]] static constexpr auto level(job_priority priority) noexcept -> std::size_t {
        return static_cast<std::size_t>(priority);
    }

    std::array<std::set<queue_entry>, priority_level_count> levels_;
    std::unordered_map<std::string, queue_entry> locator_;
};

}  // namespace jobq::queue
