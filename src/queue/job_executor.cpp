/**
 * @file job_executor.cpp
 * @brief Implementation of the job executor
 */

#include <jobq/queue/job_executor.hpp>

#include <jobq/compat/format.hpp>

#include <exception>

namespace jobq::queue {

job_executor::job_executor(std::shared_ptr<handler_registry> registry,
                           std::shared_ptr<di::ILogger> logger)
    : registry_(registry ? std::move(registry) : std::make_shared<handler_registry>()),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto job_executor::execute(const job_record& record, job_context& context)
    -> execution_result {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [started] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    };

    auto handler = registry_->find(record.payload.type_tag);
    if (!handler) {
        auto message = jobq::compat::format("No handler registered for type tag '{}'",
                                            record.payload.type_tag);
        logger_->error_fmt("Job {}: {}", record.job_id, message);
        return execution_result{job_status::failed, job_result::failure(message), elapsed()};
    }

    logger_->debug_fmt("Executing job {} (type={}, attempt={})", record.job_id,
                       record.payload.type_tag, context.attempt());

    job_outcome outcome;
    try {
        outcome = handler->execute(record.payload, context);
    } catch (const std::exception& e) {
        logger_->error_fmt("Job {} handler threw: {}", record.job_id, e.what());
        return execution_result{job_status::failed, job_result::failure(e.what()), elapsed()};
    } catch (...) {
        logger_->error_fmt("Job {} handler threw a non-standard exception", record.job_id);
        return execution_result{job_status::failed,
                                job_result::failure("handler threw a non-standard exception"),
                                elapsed()};
    }

    switch (outcome.type) {
        case job_outcome::kind::success:
            return execution_result{job_status::completed,
                                    job_result::success(std::move(outcome.output)),
                                    elapsed()};
        case job_outcome::kind::cancelled:
            if (!context.is_cancelled()) {
                // Only a cancel() request may end a job as cancelled
                logger_->warn_fmt("Job {} reported cancellation that was never requested",
                                  record.job_id);
                return execution_result{
                    job_status::failed,
                    job_result::failure("handler cancelled without a cancel request"),
                    elapsed()};
            }
            return execution_result{job_status::cancelled,
                                    job_result::failure(outcome.error_message.empty()
                                                            ? std::string("cancelled")
                                                            : outcome.error_message),
                                    elapsed()};
        case job_outcome::kind::failure:
        default:
            return execution_result{job_status::failed,
                                    job_result::failure(outcome.error_message),
                                    elapsed()};
    }
}

}  // namespace jobq::queue
