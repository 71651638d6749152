/**
 * @file job_executor.hpp
 * @brief Runs one job handler invocation and maps its outcome to a status
 */

#pragma once

#include <jobq/di/ilogger.hpp>
#include <jobq/queue/job_context.hpp>
#include <jobq/queue/job_handler.hpp>
#include <jobq/queue/job_types.hpp>

#include <chrono>
#include <memory>

namespace jobq::queue {

/**
 * @brief Terminal transition produced by one execution
 */
struct execution_result {
    job_status status{job_status::failed};  ///< completed, failed or cancelled
    job_result result;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Executes a job through the handler registered for its type tag
 *
 * The executor does not touch the store or the emitter; the queue manager
 * persists the returned transition and then notifies observers.
 *
 * Outcome mapping:
 * - job_outcome::success  -> completed
 * - job_outcome::failure  -> failed
 * - job_outcome::cancelled -> cancelled
 * - exception thrown by the handler -> failed with the exception text
 * - no handler for the type tag -> failed
 */
class job_executor {
public:
    explicit job_executor(std::shared_ptr<handler_registry> registry,
                          std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto execute(const job_record& record, job_context& context)
        -> execution_result;

    [[nodiscard]] auto registry() const noexcept -> const std::shared_ptr<handler_registry>& {
        return registry_;
    }

private:
    std::shared_ptr<handler_registry> registry_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace jobq::queue
