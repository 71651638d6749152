/**
 * @file throttle_policy.cpp
 * @brief Implementation of the scheduler throttle policy
 */

#include <jobq/queue/throttle_policy.hpp>

namespace jobq::queue {

throttle_policy::throttle_policy(std::chrono::milliseconds cooldown,
                                 std::size_t max_consecutive,
                                 std::chrono::milliseconds forced_pause)
    : cooldown_(cooldown),
      max_consecutive_(max_consecutive),
      forced_pause_(forced_pause) {}

void throttle_policy::on_dispatch() noexcept {
    ++consecutive_;
}

void throttle_policy::on_finished(clock::time_point now) noexcept {
    auto resume = now + cooldown_;
    if (max_consecutive_ > 0 && consecutive_ >= max_consecutive_) {
        forced_pending_ = true;
        resume += forced_pause_;
    }
    if (resume > now) {
        resume_at_ = resume;
    }
}

auto throttle_policy::blocked_until(clock::time_point now) noexcept
    -> std::optional<clock::time_point> {
    if (resume_at_ && now < *resume_at_) {
        return resume_at_;
    }

    resume_at_.reset();
    if (forced_pending_) {
        forced_pending_ = false;
        consecutive_ = 0;
    }
    return std::nullopt;
}

void throttle_policy::reset_consecutive() noexcept {
    consecutive_ = 0;
}

}  // namespace jobq::queue
