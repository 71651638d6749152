/**
 * @file job_handler.hpp
 * @brief Job handler capability and type-tag dispatch registry
 */

#pragma once

#include <jobq/core/result.hpp>
#include <jobq/queue/job_context.hpp>
#include <jobq/queue/job_types.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jobq::queue {

// =============================================================================
// Job Outcome
// =============================================================================

/**
 * @brief What a handler reports when it returns
 */
struct job_outcome {
    enum class kind { success, failure, cancelled };

    kind type{kind::success};
    std::optional<std::string> output;
    std::string error_message;

    [[nodiscard]] static job_outcome success(std::optional<std::string> out = std::nullopt) {
        return job_outcome{kind::success, std::move(out), {}};
    }

    [[nodiscard]] static job_outcome failure(std::string message) {
        return job_outcome{kind::failure, std::nullopt, std::move(message)};
    }

    [[nodiscard]] static job_outcome cancelled() {
        return job_outcome{kind::cancelled, std::nullopt, "cancelled"};
    }
};

// =============================================================================
// Job Handler
// =============================================================================

/**
 * @brief Executes the domain work of one payload type
 *
 * Handlers run on the scheduler thread, one at a time. A handler may throw;
 * the executor converts the exception into a failed job.
 */
class job_handler {
public:
    virtual ~job_handler() = default;

    [[nodiscard]] virtual auto execute(const job_payload& payload, job_context& context)
        -> job_outcome = 0;
};

/**
 * @brief Adapts a callable to the job_handler interface
 */
class function_job_handler final : public job_handler {
public:
    using function_type = std::function<job_outcome(const job_payload&, job_context&)>;

    explicit function_job_handler(function_type fn) : fn_(std::move(fn)) {}

    [[nodiscard]] auto execute(const job_payload& payload, job_context& context)
        -> job_outcome override {
        return fn_(payload, context);
    }

private:
    function_type fn_;
};

// =============================================================================
// Handler Registry
// =============================================================================

/**
 * @brief Maps payload type tags to handlers
 *
 * Thread Safety: All methods are thread-safe. Handlers may be registered
 * while the scheduler is running.
 */
class handler_registry {
public:
    /**
     * @brief Register a handler for a type tag
     * @return error_codes::invalid_argument for an empty tag, a null handler
     *         or an already registered tag
     */
    [[nodiscard]] auto register_handler(std::string type_tag,
                                        std::shared_ptr<job_handler> handler) -> VoidResult;

    /**
     * @brief Convenience overload wrapping a callable
     */
    [[nodiscard]] auto register_handler(std::string type_tag,
                                        function_job_handler::function_type fn)
        -> VoidResult;

    /**
     * @brief Remove the handler for a tag
     * @return true if a handler was removed
     */
    auto unregister_handler(std::string_view type_tag) -> bool;

    /**
     * @brief Handler for a tag, or nullptr
     */
    [[nodiscard]] auto find(std::string_view type_tag) const -> std::shared_ptr<job_handler>;

    [[nodiscard]] auto contains(std::string_view type_tag) const -> bool;

    [[nodiscard]] auto type_tags() const -> std::vector<std::string>;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<job_handler>> handlers_;
};

}  // namespace jobq::queue
