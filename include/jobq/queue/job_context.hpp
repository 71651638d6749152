/**
 * @file job_context.hpp
 * @brief Per-invocation context handed to a job handler
 */

#pragma once

#include <jobq/queue/job_types.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace jobq::queue {

/// Cooperative cancellation flag shared between the manager and one job
using cancel_flag = std::shared_ptr<std::atomic<bool>>;

/**
 * @brief Cancellation and progress channel for one running job
 *
 * Cancellation is cooperative: the manager only raises the flag. A handler
 * that wants to honour it polls is_cancelled() and returns
 * job_outcome::cancelled().
 *
 * Thread Safety: is_cancelled() may be called from any thread.
 * report_progress() is meant to be called from the handler's thread.
 */
class job_context {
public:
    using progress_sink = std::function<void(const job_progress& progress)>;

    job_context(std::string job_id, int attempt, cancel_flag cancelled,
                progress_sink sink = nullptr);

    [[nodiscard]] auto job_id() const noexcept -> const std::string& { return job_id_; }

    /**
     * @brief 1-based attempt number of this execution
     */
    [[nodiscard]] auto attempt() const noexcept -> int { return attempt_; }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Report progress; @p current is clamped to @p total when total is known
     */
    void report_progress(std::uint64_t current, std::uint64_t total);

    [[nodiscard]] auto last_progress() const noexcept -> const job_progress& {
        return progress_;
    }

private:
    std::string job_id_;
    int attempt_;
    cancel_flag cancelled_;
    progress_sink sink_;
    job_progress progress_;
};

}  // namespace jobq::queue
