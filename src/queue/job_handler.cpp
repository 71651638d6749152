/**
 * @file job_handler.cpp
 * @brief Implementation of job_context and handler_registry
 */

#include <jobq/queue/job_handler.hpp>

#include <jobq/compat/format.hpp>

#include <algorithm>
#include <mutex>

namespace jobq::queue {

// =============================================================================
// Job Context
// =============================================================================

job_context::job_context(std::string job_id, int attempt, cancel_flag cancelled,
                         progress_sink sink)
    : job_id_(std::move(job_id)),
      attempt_(attempt),
      cancelled_(cancelled ? std::move(cancelled)
                           : std::make_shared<std::atomic<bool>>(false)),
      sink_(std::move(sink)) {}

auto job_context::is_cancelled() const noexcept -> bool {
    return cancelled_->load(std::memory_order_acquire);
}

void job_context::report_progress(std::uint64_t current, std::uint64_t total) {
    progress_.total_steps = total;
    progress_.current_step = (total > 0) ? std::min(current, total) : current;
    if (sink_) {
        sink_(progress_);
    }
}

// =============================================================================
// Handler Registry
// =============================================================================

auto handler_registry::register_handler(std::string type_tag,
                                        std::shared_ptr<job_handler> handler)
    -> VoidResult {
    if (type_tag.empty()) {
        return jobq_void_error(error_codes::invalid_argument,
                               "Handler type tag must not be empty");
    }
    if (!handler) {
        return jobq_void_error(
            error_codes::invalid_argument,
            jobq::compat::format("Null handler for type tag {}", type_tag));
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = handlers_.try_emplace(type_tag, std::move(handler));
    if (!inserted) {
        return jobq_void_error(
            error_codes::invalid_argument,
            jobq::compat::format("Handler already registered for type tag {}", type_tag));
    }
    return ok();
}

auto handler_registry::register_handler(std::string type_tag,
                                        function_job_handler::function_type fn)
    -> VoidResult {
    if (!fn) {
        return jobq_void_error(
            error_codes::invalid_argument,
            jobq::compat::format("Empty handler function for type tag {}", type_tag));
    }
    return register_handler(std::move(type_tag),
                            std::make_shared<function_job_handler>(std::move(fn)));
}

auto handler_registry::unregister_handler(std::string_view type_tag) -> bool {
    std::unique_lock lock(mutex_);
    return handlers_.erase(std::string(type_tag)) > 0;
}

auto handler_registry::find(std::string_view type_tag) const
    -> std::shared_ptr<job_handler> {
    std::shared_lock lock(mutex_);
    auto it = handlers_.find(std::string(type_tag));
    return it == handlers_.end() ? nullptr : it->second;
}

auto handler_registry::contains(std::string_view type_tag) const -> bool {
    std::shared_lock lock(mutex_);
    return handlers_.find(std::string(type_tag)) != handlers_.end();
}

auto handler_registry::type_tags() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> tags;
    tags.reserve(handlers_.size());
    for (const auto& [tag, handler] : handlers_) {
        tags.push_back(tag);
    }
    std::sort(tags.begin(), tags.end());
    return tags;
}

}  // namespace jobq::queue
