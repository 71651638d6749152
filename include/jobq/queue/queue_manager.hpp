/**
 * @file queue_manager.hpp
 * @brief Facade over the job store, queue index and scheduler loop
 *
 * The queue manager is the only public entry point for callers: it accepts
 * new jobs, cancels and reorders them, pauses and resumes dispatch, and
 * lists or prunes records. It owns a single scheduler thread that hands
 * one job at a time to the executor.
 */

#pragma once

#include <jobq/core/result.hpp>
#include <jobq/di/ilogger.hpp>
#include <jobq/queue/event_emitter.hpp>
#include <jobq/queue/job_handler.hpp>
#include <jobq/queue/job_types.hpp>
#include <jobq/storage/job_store.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobq::queue {

/**
 * @brief Per-enqueue options
 */
struct enqueue_options {
    /// Caller-chosen id; a UUID v4 is generated when empty
    std::optional<std::string> job_id;
};

// =============================================================================
// Queue Manager
// =============================================================================

/**
 * @brief Durable, priority-ordered background job scheduler
 *
 * Guarantees:
 * - at most one job is running at any instant;
 * - every status transition is written to the store before the event
 *   emitter hears about it;
 * - jobs left running by a crash are re-queued (without an extra attempt)
 *   when the manager is created.
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 * - Event emitter callbacks are invoked from the scheduler thread (from the
 *   calling thread when cancel() removes a queued job), never while
 *   internal locks are held.
 *
 * @example
 * @code
 * auto registry = std::make_shared<handler_registry>();
 * (void)registry->register_handler("render",
 *     [](const job_payload& payload, job_context& ctx) {
 *         for (std::uint64_t step = 1; step <= 10; ++step) {
 *             if (ctx.is_cancelled()) {
 *                 return job_outcome::cancelled();
 *             }
 *             ctx.report_progress(step, 10);
 *         }
 *         return job_outcome::success();
 *     });
 *
 * queue_config config;
 * config.db_path = "/var/lib/worker/queue.db";
 * config.cooldown = std::chrono::seconds{2};
 *
 * auto manager = queue_manager::create(config, registry);
 * if (manager.is_ok()) {
 *     auto id = manager.value()->enqueue({"render", "{\"scene\":1}"}, job_priority::high);
 * }
 * @endcode
 */
class queue_manager {
public:
    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    /**
     * @brief Create a manager over the store selected by @p config
     *
     * Opens the SQLite store at config.db_path (or a memory store when it is
     * empty), re-queues jobs left running by a previous process, rebuilds
     * the queue index and, if config.auto_start is set, starts the
     * scheduler thread.
     *
     * @param config Queue configuration
     * @param registry Handlers by type tag (required)
     * @param emitter Lifecycle observer (optional, defaults to a no-op)
     * @param logger Logger instance (optional, defaults to NullLogger)
     */
    [[nodiscard]] static auto create(const queue_config& config,
                                     std::shared_ptr<handler_registry> registry,
                                     std::shared_ptr<event_emitter> emitter = nullptr,
                                     std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<queue_manager>>;

    /**
     * @brief Create a manager over a caller-supplied store
     *
     * config.db_path is ignored.
     */
    [[nodiscard]] static auto create(const queue_config& config,
                                     std::shared_ptr<storage::job_store> store,
                                     std::shared_ptr<handler_registry> registry,
                                     std::shared_ptr<event_emitter> emitter = nullptr,
                                     std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<queue_manager>>;

    /**
     * @brief Destructor - stops the scheduler, waiting for the running job
     */
    ~queue_manager();

    // Non-copyable, non-movable (owns the scheduler thread)
    queue_manager(const queue_manager&) = delete;
    auto operator=(const queue_manager&) -> queue_manager& = delete;
    queue_manager(queue_manager&&) = delete;
    auto operator=(queue_manager&&) -> queue_manager& = delete;

    // =========================================================================
    // Job Operations
    // =========================================================================

    /**
     * @brief Persist a new queued job and wake the scheduler
     *
     * @param payload Handler type tag and opaque data
     * @param priority Dispatch priority
     * @param options Optional caller-chosen id
     * @return The job id, or a store error (error_codes::duplicate_job for a
     *         reused id)
     */
    [[nodiscard]] auto enqueue(job_payload payload,
                               job_priority priority = job_priority::normal,
                               const enqueue_options& options = {})
        -> Result<std::string>;

    /**
     * @brief Cancel a job
     *
     * A queued job becomes cancelled immediately. For the running job the
     * cooperative cancellation flag is raised; the job is cancelled only
     * if its handler returns job_outcome::cancelled(). Cancelling a job
     * that already finished is a no-op.
     *
     * @return error_codes::job_not_found for an unknown id
     */
    [[nodiscard]] auto cancel(std::string_view job_id) -> VoidResult;

    /**
     * @brief Change the priority of a queued job, keeping its created_at
     *
     * @return error_codes::invalid_state unless the job is queued
     */
    [[nodiscard]] auto reorder(std::string_view job_id, job_priority new_priority)
        -> VoidResult;

    /**
     * @brief Delete finished jobs last updated more than @p age ago
     *
     * Queued and running jobs are never deleted.
     *
     * @return Number of deleted records
     */
    [[nodiscard]] auto prune(std::chrono::milliseconds age) -> Result<std::size_t>;

    // =========================================================================
    // Dispatch Control
    // =========================================================================

    /**
     * @brief Stop dispatching new jobs; the running job is not interrupted
     */
    void pause();

    /**
     * @brief Re-enable dispatch and wake the scheduler
     */
    void resume();

    [[nodiscard]] auto is_paused() const noexcept -> bool;

    /**
     * @brief Start the scheduler thread (no-op if already running)
     */
    void start();

    /**
     * @brief Stop the scheduler thread, waiting for the running job
     */
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * @brief Snapshot of every record, in store listing order
     */
    [[nodiscard]] auto list() const -> Result<std::vector<job_record>>;

    [[nodiscard]] auto get(std::string_view job_id) const
        -> Result<std::optional<job_record>>;

    /**
     * @brief Future fulfilled with the final record once the job finishes
     *
     * Resolves immediately for a job that already finished. The future is
     * abandoned (std::future_error on get) if the manager is destroyed
     * first.
     *
     * @return error_codes::job_not_found for an unknown id
     */
    [[nodiscard]] auto wait_for_completion(std::string_view job_id)
        -> Result<std::future<job_record>>;

    // =========================================================================
    // Statistics
    // =========================================================================

    /**
     * @brief Number of jobs waiting in the queue index
     */
    [[nodiscard]] auto queued_count() const -> std::size_t;

    [[nodiscard]] auto has_running_job() const -> bool;

    [[nodiscard]] auto running_job_id() const -> std::optional<std::string>;

    /**
     * @brief Jobs re-queued by crash recovery when the manager was created
     */
    [[nodiscard]] auto recovered_count() const noexcept -> std::size_t;

    [[nodiscard]] auto config() const noexcept -> const queue_config&;

    [[nodiscard]] auto store() const noexcept -> const std::shared_ptr<storage::job_store>&;

private:
    struct impl;

    explicit queue_manager(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace jobq::queue
