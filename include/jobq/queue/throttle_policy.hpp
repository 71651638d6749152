/**
 * @file throttle_policy.hpp
 * @brief Cooldown and consecutive-dispatch bookkeeping for the scheduler
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace jobq::queue {

/**
 * @brief Decides when the scheduler may dispatch again
 *
 * Two rules are tracked:
 * - after every finished job, dispatch is blocked for @c cooldown;
 * - once @c max_consecutive jobs were dispatched back to back, the next
 *   dispatch additionally waits @c forced_pause, after which the
 *   consecutive counter starts over.
 *
 * The policy never reads a clock itself; callers pass the current time so
 * the rules are deterministic under test.
 *
 * Thread Safety: NOT thread-safe. Owned by the scheduler loop.
 */
class throttle_policy {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @param cooldown Idle time after every finished job
     * @param max_consecutive Dispatches before a forced pause (0 = unlimited)
     * @param forced_pause Length of the forced pause
     */
    throttle_policy(std::chrono::milliseconds cooldown,
                    std::size_t max_consecutive,
                    std::chrono::milliseconds forced_pause);

    /**
     * @brief Record that a job was handed to the executor
     */
    void on_dispatch() noexcept;

    /**
     * @brief Record that the running job reached a terminal state
     *
     * Starts the cooldown and, if the consecutive limit has been reached,
     * the forced pause.
     */
    void on_finished(clock::time_point now) noexcept;

    /**
     * @brief Time until which dispatch is blocked, or std::nullopt if a job
     *        may be dispatched at @p now
     *
     * When an elapsed forced pause is observed, the consecutive counter is
     * reset.
     */
    [[nodiscard]] auto blocked_until(clock::time_point now) noexcept
        -> std::optional<clock::time_point>;

    /**
     * @brief Forget the consecutive streak (queue paused or found empty)
     */
    void reset_consecutive() noexcept;

    [[nodiscard]] auto consecutive() const noexcept -> std::size_t { return consecutive_; }

    [[nodiscard]] auto in_forced_pause() const noexcept -> bool { return forced_pending_; }

    [[nodiscard]] auto cooldown() const noexcept -> std::chrono::milliseconds {
        return cooldown_;
    }

private:
    std::chrono::milliseconds cooldown_;
    std::size_t max_consecutive_;
    std::chrono::milliseconds forced_pause_;

    std::size_t consecutive_{0};
    bool forced_pending_{false};
    std::optional<clock::time_point> resume_at_;
};

}  // namespace jobq::queue
