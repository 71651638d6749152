/**
 * @file event_emitter.cpp
 * @brief Implementation of the logging event emitter
 */

#include <jobq/queue/event_emitter.hpp>

namespace jobq::queue {

logging_event_emitter::logging_event_emitter(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

void logging_event_emitter::on_job_started(const std::string& job_id) {
    logger_->info_fmt("job-started id={}", job_id);
}

void logging_event_emitter::on_job_progress(const std::string& job_id,
                                            std::uint64_t current,
                                            std::uint64_t total) {
    logger_->debug_fmt("job-progress id={} {}/{}", job_id, current, total);
}

void logging_event_emitter::on_job_completed(const std::string& job_id,
                                             const std::optional<std::string>& output) {
    logger_->info_fmt("job-completed id={} output_bytes={}", job_id,
                      output ? output->size() : std::size_t{0});
}

void logging_event_emitter::on_job_failed(const std::string& job_id,
                                          const std::string& error) {
    logger_->warn_fmt("job-failed id={} error={}", job_id, error);
}

void logging_event_emitter::on_job_cancelled(const std::string& job_id) {
    logger_->info_fmt("job-cancelled id={}", job_id);
}

}  // namespace jobq::queue
