/**
 * @file event_emitter.hpp
 * @brief Observer contract for job lifecycle notifications
 */

#pragma once

#include <jobq/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace jobq::queue {

/**
 * @brief Receives job lifecycle notifications
 *
 * The queue manager calls these methods only after the matching status
 * has been written to the store, so an observer that reads the store from
 * inside a callback sees the new state. Progress is the exception: it is
 * forwarded as soon as the handler reports it.
 *
 * Callbacks run on the scheduler thread and must not block for long.
 * Exceptions thrown from a callback are caught and logged by the manager.
 */
class event_emitter {
public:
    virtual ~event_emitter() = default;

    virtual void on_job_started(const std::string& job_id) = 0;

    virtual void on_job_progress(const std::string& job_id,
                                 std::uint64_t current,
                                 std::uint64_t total) = 0;

    virtual void on_job_completed(const std::string& job_id,
                                  const std::optional<std::string>& output) = 0;

    virtual void on_job_failed(const std::string& job_id, const std::string& error) = 0;

    virtual void on_job_cancelled(const std::string& job_id) = 0;
};

/**
 * @brief Emitter that discards every notification
 */
class null_event_emitter final : public event_emitter {
public:
    void on_job_started(const std::string& /*job_id*/) override {}
    void on_job_progress(const std::string& /*job_id*/, std::uint64_t /*current*/,
                         std::uint64_t /*total*/) override {}
    void on_job_completed(const std::string& /*job_id*/,
                          const std::optional<std::string>& /*output*/) override {}
    void on_job_failed(const std::string& /*job_id*/, const std::string& /*error*/) override {}
    void on_job_cancelled(const std::string& /*job_id*/) override {}
};

/**
 * @brief Emitter that writes every notification to an ILogger
 *
 * Progress is logged at debug level, the other events at info (failures
 * at warn).
 */
class logging_event_emitter final : public event_emitter {
public:
    explicit logging_event_emitter(std::shared_ptr<di::ILogger> logger = nullptr);

    void on_job_started(const std::string& job_id) override;
    void on_job_progress(const std::string& job_id, std::uint64_t current,
                         std::uint64_t total) override;
    void on_job_completed(const std::string& job_id,
                          const std::optional<std::string>& output) override;
    void on_job_failed(const std::string& job_id, const std::string& error) override;
    void on_job_cancelled(const std::string& job_id) override;

private:
    std::shared_ptr<di::ILogger> logger_;
};

/**
 * @brief Shared no-op emitter used when none is supplied
 */
[[nodiscard]] inline std::shared_ptr<event_emitter> null_emitter() {
    static auto instance = std::make_shared<null_event_emitter>();
    return instance;
}

}  // namespace jobq::queue
