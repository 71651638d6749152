/**
 * @file job_types.hpp
 * @brief Job types and structures for the durable job queue
 *
 * This file provides the data structures describing a unit of background
 * work: status and priority enums, the opaque payload, the handler result,
 * progress, the persisted job record, and the queue configuration.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jobq::queue {

/// Clock used for every persisted timestamp
using job_clock = std::chrono::system_clock;

// =============================================================================
// Job Status
// =============================================================================

/**
 * @brief Current status of a job
 */
enum class job_status {
    queued,     ///< Waiting in the queue index
    running,    ///< Handed to the executor
    completed,  ///< Handler reported success
    failed,     ///< Handler reported or threw an error
    cancelled   ///< Cancelled while queued or acknowledged by the handler
};

/**
 * @brief Convert job_status to string representation
 * @param status The status to convert
 * @return String representation of the status
 */
[[nodiscard]] constexpr const char* to_string(job_status status) noexcept {
    switch (status) {
        case job_status::queued: return "queued";
        case job_status::running: return "running";
        case job_status::completed: return "completed";
        case job_status::failed: return "failed";
        case job_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Parse job_status from string
 * @param str The string to parse
 * @return Parsed status, or std::nullopt if the string is not a status name
 */
[[nodiscard]] inline std::optional<job_status> job_status_from_string(
    std::string_view str) noexcept {
    if (str == "queued") return job_status::queued;
    if (str == "running") return job_status::running;
    if (str == "completed") return job_status::completed;
    if (str == "failed") return job_status::failed;
    if (str == "cancelled") return job_status::cancelled;
    return std::nullopt;
}

/**
 * @brief Check if job status is a terminal state
 * @param status The status to check
 * @return true if the job has finished (completed, failed, or cancelled)
 */
[[nodiscard]] constexpr bool is_terminal_status(job_status status) noexcept {
    return status == job_status::completed ||
           status == job_status::failed ||
           status == job_status::cancelled;
}

/**
 * @brief Check whether a status change is an edge of the job state machine
 *
 * Allowed edges:
 * - queued -> running, queued -> cancelled
 * - running -> completed, running -> failed, running -> cancelled
 * - running -> queued (crash recovery only)
 *
 * Terminal states have no outgoing edges.
 */
[[nodiscard]] constexpr bool is_valid_transition(job_status from,
                                                 job_status to) noexcept {
    switch (from) {
        case job_status::queued:
            return to == job_status::running || to == job_status::cancelled;
        case job_status::running:
            return to == job_status::completed || to == job_status::failed ||
                   to == job_status::cancelled || to == job_status::queued;
        default:
            return false;
    }
}

// =============================================================================
// Job Priority
// =============================================================================

/**
 * @brief Priority level for job execution
 *
 * Higher priority jobs are dispatched before lower priority ones. Within a
 * level, jobs run in creation order.
 */
enum class job_priority {
    low = 0,
    normal = 1,
    high = 2
};

/// Number of distinct priority levels
inline constexpr std::size_t priority_level_count = 3;

/**
 * @brief Convert job_priority to string representation
 */
[[nodiscard]] constexpr const char* to_string(job_priority priority) noexcept {
    switch (priority) {
        case job_priority::low: return "low";
        case job_priority::normal: return "normal";
        case job_priority::high: return "high";
        default: return "unknown";
    }
}

/**
 * @brief Parse job_priority from string
 * @param str The string to parse
 * @return Parsed priority, or normal if invalid
 */
[[nodiscard]] inline job_priority job_priority_from_string(std::string_view str) noexcept {
    if (str == "low") return job_priority::low;
    if (str == "high") return job_priority::high;
    return job_priority::normal;
}

/**
 * @brief Parse job_priority from its persisted integer value
 * @param value The integer value (0-2)
 * @return Parsed priority, clamped to the valid range
 */
[[nodiscard]] inline job_priority job_priority_from_int(int value) noexcept {
    if (value <= 0) return job_priority::low;
    if (value == 1) return job_priority::normal;
    return job_priority::high;
}

// =============================================================================
// Payload / Result / Progress
// =============================================================================

/**
 * @brief Opaque job payload
 *
 * The queue never inspects @c data; @c type_tag selects the handler.
 */
struct job_payload {
    std::string type_tag;  ///< Handler registry key
    std::string data;      ///< Serialized arguments, opaque to the queue
};

/**
 * @brief Outcome stored on a job once it reaches a terminal state
 */
struct job_result {
    std::optional<std::string> output;  ///< Handler output on success
    std::string error_message;          ///< Failure or cancellation reason

    [[nodiscard]] static job_result success(std::optional<std::string> out = std::nullopt) {
        return job_result{std::move(out), {}};
    }

    [[nodiscard]] static job_result failure(std::string message) {
        return job_result{std::nullopt, std::move(message)};
    }
};

/**
 * @brief Last progress reported by a running handler
 */
struct job_progress {
    std::uint64_t current_step{0};
    std::uint64_t total_steps{0};

    /**
     * @brief Completion percentage (0-100), 0 when the total is unknown
     */
    [[nodiscard]] double percent() const noexcept {
        if (total_steps == 0) {
            return 0.0;
        }
        auto value = static_cast<double>(current_step) /
                     static_cast<double>(total_steps) * 100.0;
        return value > 100.0 ? 100.0 : value;
    }
};

// =============================================================================
// Job Record
// =============================================================================

/**
 * @brief Persisted unit of work and its state
 *
 * Records handed out by the queue manager are snapshots; mutating them has
 * no effect on the queue.
 */
struct job_record {
    std::string job_id;                           ///< Unique job identifier (UUID)
    job_payload payload;                          ///< Opaque work description
    job_priority priority{job_priority::normal};  ///< Mutable only while queued
    job_status status{job_status::queued};        ///< Current status

    job_clock::time_point created_at;  ///< FIFO key, never changes
    job_clock::time_point updated_at;  ///< Time of the last status transition

    std::optional<job_result> result;  ///< Present only in terminal states
    int attempt_count{0};              ///< Incremented on every queued -> running
    job_progress progress;             ///< Last reported progress

    [[nodiscard]] bool is_finished() const noexcept {
        return is_terminal_status(status);
    }

    [[nodiscard]] bool can_cancel() const noexcept {
        return !is_terminal_status(status);
    }

    [[nodiscard]] bool can_reorder() const noexcept {
        return status == job_status::queued;
    }
};

// =============================================================================
// Queue Configuration
// =============================================================================

/**
 * @brief Configuration for the queue manager and its scheduler loop
 */
struct queue_config {
    /// SQLite database file; std::nullopt selects the non-durable memory store
    std::optional<std::filesystem::path> db_path;

    /// Minimum idle time after each finished job
    std::chrono::milliseconds cooldown{0};

    /// Forced pause after this many back-to-back dispatches (0 = unlimited)
    std::size_t max_consecutive{0};

    /// Upper bound on the scheduler's idle wait between decisions
    std::chrono::milliseconds poll_interval{std::chrono::seconds{3}};

    /// Start the scheduler thread from queue_manager::create()
    bool auto_start{true};
};

}  // namespace jobq::queue
