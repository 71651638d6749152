/**
 * @file queue_manager.cpp
 * @brief Implementation of the queue manager and its scheduler loop
 */

#include <jobq/queue/queue_manager.hpp>

#include <jobq/compat/format.hpp>
#include <jobq/queue/job_executor.hpp>
#include <jobq/queue/queue_index.hpp>
#include <jobq/queue/throttle_policy.hpp>
#include <jobq/storage/memory_job_store.hpp>
#include <jobq/storage/sqlite_job_store.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace jobq::queue {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * @brief Generate a UUID v4 string
 */
std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab = dis(gen);
    uint64_t cd = dis(gen);

    // Set version (4) and variant (8, 9, A, or B)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (ab >> 32);
    oss << '-';
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (ab & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (cd >> 48);
    oss << '-';
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

/// Current time at the resolution the stores persist
job_clock::time_point now_micros() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(job_clock::now());
}

const std::vector<job_status>& terminal_statuses() {
    static const std::vector<job_status> statuses{
        job_status::completed, job_status::failed, job_status::cancelled};
    return statuses;
}

}  // namespace

// =============================================================================
// Implementation Structure
// =============================================================================

struct queue_manager::impl {
    /// Terminal notification waiting to be delivered outside the lock
    struct pending_notification {
        job_record record;
        std::vector<std::promise<job_record>> waiters;
    };

    /// Terminal write that failed and must land before the next dispatch
    struct unfinished_write {
        job_status status;
        job_result result;
        job_record record;
    };

    // Configuration
    queue_config config;

    // Dependencies
    std::shared_ptr<storage::job_store> store;
    std::shared_ptr<event_emitter> emitter;
    std::shared_ptr<di::ILogger> logger;
    job_executor executor;

    // Guards every read-then-write of the store and all state below
    mutable std::mutex mutex;
    std::condition_variable wake_cv;

    queue_index index;
    bool index_stale{false};
    throttle_policy throttle;
    job_clock::time_point last_created_at{};

    std::optional<std::string> running_id;
    cancel_flag running_cancel;
    std::unordered_map<std::string, unfinished_write> unfinished;

    std::unordered_map<std::string, std::vector<std::promise<job_record>>> waiters;
    std::vector<pending_notification> notifications;

    // Scheduler thread
    std::mutex lifecycle_mutex;
    std::thread scheduler;
    std::atomic<bool> running{false};
    std::atomic<bool> paused{false};
    bool stopping{false};
    bool wake_requested{false};

    std::size_t recovered{0};

    impl(const queue_config& cfg,
         std::shared_ptr<storage::job_store> job_store,
         std::shared_ptr<handler_registry> registry,
         std::shared_ptr<event_emitter> event_sink,
         std::shared_ptr<di::ILogger> log)
        : config(cfg),
          store(std::move(job_store)),
          emitter(event_sink ? std::move(event_sink) : null_emitter()),
          logger(log ? std::move(log) : di::null_logger()),
          executor(std::move(registry), logger),
          throttle(cfg.cooldown, cfg.max_consecutive,
                   cfg.cooldown.count() > 0 ? cfg.cooldown : cfg.poll_interval) {}

    // =========================================================================
    // Helpers (mutex held)
    // =========================================================================

    job_clock::time_point next_created_at_locked() {
        auto now = now_micros();
        if (now <= last_created_at) {
            now = last_created_at + std::chrono::microseconds{1};
        }
        last_created_at = now;
        return now;
    }

    void request_wake_locked() {
        wake_requested = true;
        wake_cv.notify_all();
    }

    /**
     * @brief Persist a status transition after checking the state machine
     */
    VoidResult write_status_locked(const job_record& record, job_status to,
                                   const std::optional<job_result>& result,
                                   job_clock::time_point at) {
        if (!is_valid_transition(record.status, to)) {
            return jobq_void_error(
                error_codes::invalid_state,
                jobq::compat::format("Job {} cannot move from {} to {}", record.job_id,
                                     to_string(record.status), to_string(to)));
        }
        return store->update_status(record.job_id, to, result, at);
    }

    void queue_notification_locked(job_record record) {
        pending_notification note;
        auto it = waiters.find(record.job_id);
        if (it != waiters.end()) {
            note.waiters = std::move(it->second);
            waiters.erase(it);
        }
        note.record = std::move(record);
        notifications.push_back(std::move(note));
    }

    /**
     * @brief Re-read the store after a failed write
     *
     * Retries terminal writes that did not land, then rebuilds the queue
     * index from the queued records.
     *
     * @return false if the store is still unavailable
     */
    bool reconcile_locked() {
        for (auto it = unfinished.begin(); it != unfinished.end();) {
            auto& pending = it->second;
            auto at = now_micros();
            auto write =
                write_status_locked(pending.record, pending.status, pending.result, at);
            if (write.is_err()) {
                logger->error_fmt("Retrying final status of job {} failed: {}",
                                  it->first, write.error().message);
                return false;
            }
            pending.record.status = pending.status;
            pending.record.result = pending.result;
            pending.record.updated_at = at;
            queue_notification_locked(std::move(pending.record));
            it = unfinished.erase(it);
        }

        auto queued = store->scan_by_status(job_status::queued);
        if (queued.is_err()) {
            logger->error_fmt("Cannot rebuild queue index: {}", queued.error().message);
            return false;
        }

        index.rebuild(queued.value());
        index_stale = false;
        logger->info_fmt("Queue index rebuilt from store ({} queued)", index.size());
        return true;
    }

    /**
     * @brief Move the next queued job to running
     *
     * @param entry Head of the queue index
     * @param store_failed Set when the store could not be read or written
     * @return The running record, or std::nullopt if nothing was dispatched
     */
    std::optional<job_record> begin_dispatch_locked(const queue_entry& entry,
                                                    bool& store_failed) {
        store_failed = false;
        auto fetched = store->get(entry.job_id);
        if (fetched.is_err()) {
            logger->error_fmt("Cannot load job {}: {}", entry.job_id,
                              fetched.error().message);
            index_stale = true;
            store_failed = true;
            return std::nullopt;
        }

        auto& record = fetched.value();
        if (!record || record->status != job_status::queued) {
            // Index disagrees with the store; the store wins
            logger->warn_fmt("Queue index entry {} is out of date", entry.job_id);
            index_stale = true;
            return std::nullopt;
        }

        auto at = now_micros();
        auto write = write_status_locked(*record, job_status::running, std::nullopt, at);
        if (write.is_err()) {
            logger->error_fmt("Cannot mark job {} running: {}", record->job_id,
                              write.error().message);
            index_stale = true;
            store_failed = true;
            return std::nullopt;
        }

        index.remove(record->job_id);
        record->status = job_status::running;
        record->updated_at = at;
        record->result.reset();
        ++record->attempt_count;

        running_id = record->job_id;
        running_cancel = std::make_shared<std::atomic<bool>>(false);
        throttle.on_dispatch();

        logger->info_fmt("Dispatching job {} (priority={}, attempt={}, streak={})",
                         record->job_id, to_string(record->priority),
                         record->attempt_count, throttle.consecutive());
        return std::move(*record);
    }

    // =========================================================================
    // Event Delivery (mutex NOT held)
    // =========================================================================

    template <typename Fn>
    void emit(const std::string& job_id, const char* event, Fn&& fn) {
        try {
            fn(*emitter);
        } catch (const std::exception& e) {
            logger->error_fmt("Event emitter threw on {} for job {}: {}", event, job_id,
                              e.what());
        }
    }

    void deliver(pending_notification& note) {
        const auto& record = note.record;
        switch (record.status) {
            case job_status::completed:
                emit(record.job_id, "job-completed", [&](event_emitter& e) {
                    e.on_job_completed(record.job_id,
                                       record.result ? record.result->output : std::nullopt);
                });
                break;
            case job_status::failed:
                emit(record.job_id, "job-failed", [&](event_emitter& e) {
                    e.on_job_failed(record.job_id,
                                    record.result ? record.result->error_message
                                                  : std::string{});
                });
                break;
            case job_status::cancelled:
                emit(record.job_id, "job-cancelled",
                     [&](event_emitter& e) { e.on_job_cancelled(record.job_id); });
                break;
            default:
                break;
        }

        for (auto& waiter : note.waiters) {
            waiter.set_value(record);
        }
    }

    void flush_notifications(std::unique_lock<std::mutex>& lock) {
        if (notifications.empty()) {
            return;
        }
        auto batch = std::move(notifications);
        notifications.clear();

        lock.unlock();
        for (auto& note : batch) {
            deliver(note);
        }
        lock.lock();
    }

    // =========================================================================
    // Job Execution (mutex NOT held)
    // =========================================================================

    void report_progress(const std::string& job_id, const job_progress& progress) {
        auto write = store->update_progress(job_id, progress);
        if (write.is_err()) {
            logger->warn_fmt("Cannot persist progress of job {}: {}", job_id,
                             write.error().message);
        }
        emit(job_id, "job-progress", [&](event_emitter& e) {
            e.on_job_progress(job_id, progress.current_step, progress.total_steps);
        });
    }

    void run_job(job_record record, cancel_flag cancelled) {
        emit(record.job_id, "job-started",
             [&](event_emitter& e) { e.on_job_started(record.job_id); });

        job_context context(record.job_id, record.attempt_count, std::move(cancelled),
                            [this, id = record.job_id](const job_progress& progress) {
                                report_progress(id, progress);
                            });

        auto outcome = executor.execute(record, context);
        record.progress = context.last_progress();

        logger->info_fmt("Job {} finished as {} in {} ms", record.job_id,
                         to_string(outcome.status), outcome.duration.count());

        std::lock_guard lock(mutex);
        auto at = now_micros();
        auto write = write_status_locked(record, outcome.status, outcome.result, at);

        running_id.reset();
        running_cancel.reset();
        throttle.on_finished(throttle_policy::clock::now());

        if (write.is_err()) {
            logger->error_fmt("Cannot persist final status of job {}: {}", record.job_id,
                              write.error().message);
            unfinished[record.job_id] =
                unfinished_write{outcome.status, outcome.result, std::move(record)};
            index_stale = true;
            return;
        }

        record.status = outcome.status;
        record.result = std::move(outcome.result);
        record.updated_at = at;
        queue_notification_locked(std::move(record));
    }

    // =========================================================================
    // Scheduler Loop
    // =========================================================================

    void scheduler_loop() {
        std::unique_lock lock(mutex);
        logger->info("Scheduler loop started");

        while (!stopping) {
            flush_notifications(lock);
            if (stopping) {
                break;
            }

            auto deadline = std::chrono::steady_clock::now() + config.poll_interval;
            bool ready = !index_stale || reconcile_locked();

            if (ready && !paused.load() && !running_id) {
                if (auto until = throttle.blocked_until(throttle_policy::clock::now())) {
                    deadline = *until;
                    logger->debug_fmt("Dispatch throttled (streak={}, forced={})",
                                      throttle.consecutive(), throttle.in_forced_pause());
                } else if (auto entry = index.peek_next()) {
                    bool store_failed = false;
                    auto record = begin_dispatch_locked(*entry, store_failed);
                    if (record) {
                        auto cancelled = running_cancel;
                        lock.unlock();
                        run_job(std::move(*record), std::move(cancelled));
                        lock.lock();
                        continue;
                    }
                    if (!store_failed) {
                        // Only the index was out of date; rebuild and retry now
                        continue;
                    }
                } else {
                    throttle.reset_consecutive();
                }
            }

            wake_cv.wait_until(lock, deadline, [this] { return stopping || wake_requested; });
            wake_requested = false;
        }

        logger->info("Scheduler loop stopped");
    }

    // =========================================================================
    // Crash Recovery
    // =========================================================================

    VoidResult recover() {
        std::lock_guard lock(mutex);

        auto interrupted = store->scan_by_status(job_status::running);
        if (interrupted.is_err()) {
            return VoidResult(interrupted.error());
        }

        auto at = now_micros();
        for (const auto& record : interrupted.value()) {
            // running -> queued never counts as a new attempt
            auto write = write_status_locked(record, job_status::queued, std::nullopt, at);
            if (write.is_err()) {
                return write;
            }
            ++recovered;
            logger->warn_fmt("Recovered interrupted job {} (attempt {})", record.job_id,
                             record.attempt_count);
        }

        auto latest = store->latest_created_at();
        if (latest.is_err()) {
            return VoidResult(latest.error());
        }
        if (latest.value()) {
            last_created_at = *latest.value();
        }

        auto queued = store->scan_by_status(job_status::queued);
        if (queued.is_err()) {
            return VoidResult(queued.error());
        }
        index.rebuild(queued.value());

        logger->info_fmt("Queue recovered: {} queued, {} re-queued after interruption",
                         index.size(), recovered);
        return ok();
    }
};

// =============================================================================
// Construction / Destruction
// =============================================================================

auto queue_manager::create(const queue_config& config,
                           std::shared_ptr<handler_registry> registry,
                           std::shared_ptr<event_emitter> emitter,
                           std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<queue_manager>> {
    std::shared_ptr<storage::job_store> store;
    if (config.db_path) {
        auto opened = storage::sqlite_job_store::open(*config.db_path, {}, logger);
        if (opened.is_err()) {
            return Result<std::unique_ptr<queue_manager>>(opened.error());
        }
        store = std::shared_ptr<storage::job_store>(std::move(opened.value()));
    } else {
        store = std::make_shared<storage::memory_job_store>();
    }

    return create(config, std::move(store), std::move(registry), std::move(emitter),
                  std::move(logger));
}

auto queue_manager::create(const queue_config& config,
                           std::shared_ptr<storage::job_store> store,
                           std::shared_ptr<handler_registry> registry,
                           std::shared_ptr<event_emitter> emitter,
                           std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<queue_manager>> {
    using result_type = std::unique_ptr<queue_manager>;

    if (!store) {
        return jobq_error<result_type>(error_codes::invalid_argument,
                                       "Queue manager requires a job store");
    }
    if (!registry) {
        return jobq_error<result_type>(error_codes::invalid_argument,
                                       "Queue manager requires a handler registry");
    }
    if (config.poll_interval.count() <= 0) {
        return jobq_error<result_type>(error_codes::invalid_argument,
                                       "Poll interval must be positive");
    }
    if (config.cooldown.count() < 0) {
        return jobq_error<result_type>(error_codes::invalid_argument,
                                       "Cooldown must not be negative");
    }

    auto state = std::make_unique<impl>(config, std::move(store), std::move(registry),
                                        std::move(emitter), std::move(logger));

    auto recovered = state->recover();
    if (recovered.is_err()) {
        return Result<result_type>(recovered.error());
    }

    auto manager = std::unique_ptr<queue_manager>(new queue_manager(std::move(state)));
    if (config.auto_start) {
        manager->start();
    }
    return manager;
}

queue_manager::queue_manager(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

queue_manager::~queue_manager() {
    stop();
}

// =============================================================================
// Job Operations
// =============================================================================

auto queue_manager::enqueue(job_payload payload, job_priority priority,
                            const enqueue_options& options) -> Result<std::string> {
    if (payload.type_tag.empty()) {
        return jobq_error<std::string>(error_codes::invalid_argument,
                                       "Job payload requires a type tag");
    }
    if (options.job_id && options.job_id->empty()) {
        return jobq_error<std::string>(error_codes::invalid_argument,
                                       "Custom job id must not be empty");
    }

    std::lock_guard lock(impl_->mutex);

    job_record record;
    record.job_id = options.job_id ? *options.job_id : generate_uuid();
    record.payload = std::move(payload);
    record.priority = priority;
    record.status = job_status::queued;
    record.created_at = impl_->next_created_at_locked();
    record.updated_at = record.created_at;

    auto inserted = impl_->store->insert(record);
    if (inserted.is_err()) {
        impl_->logger->warn_fmt("Enqueue of job {} rejected: {}", record.job_id,
                                inserted.error().message);
        return Result<std::string>(inserted.error());
    }

    if (!impl_->index_stale) {
        impl_->index.insert(record);
    }
    impl_->request_wake_locked();

    if (!impl_->executor.registry()->contains(record.payload.type_tag)) {
        impl_->logger->warn_fmt("Job {} queued with unregistered type tag '{}'",
                                record.job_id, record.payload.type_tag);
    }
    impl_->logger->info_fmt("Queued job {} (type={}, priority={})", record.job_id,
                            record.payload.type_tag, to_string(priority));
    return ok(std::move(record.job_id));
}

auto queue_manager::cancel(std::string_view job_id) -> VoidResult {
    impl::pending_notification note;
    {
        std::lock_guard lock(impl_->mutex);

        auto fetched = impl_->store->get(job_id);
        if (fetched.is_err()) {
            return VoidResult(fetched.error());
        }
        if (!fetched.value()) {
            return jobq_void_error(error_codes::job_not_found,
                                   jobq::compat::format("Job not found: {}", job_id));
        }

        auto record = std::move(*fetched.value());
        if (record.is_finished()) {
            return ok();
        }

        if (record.status == job_status::running) {
            if (impl_->running_id == record.job_id && impl_->running_cancel) {
                impl_->running_cancel->store(true, std::memory_order_release);
                impl_->logger->info_fmt("Cancellation requested for running job {}",
                                        record.job_id);
            }
            return ok();
        }

        auto at = now_micros();
        auto result = job_result::failure("cancelled");
        auto write = impl_->write_status_locked(record, job_status::cancelled, result, at);
        if (write.is_err()) {
            impl_->index_stale = true;
            return write;
        }

        impl_->index.remove(record.job_id);
        impl_->logger->info_fmt("Cancelled queued job {}", record.job_id);

        record.status = job_status::cancelled;
        record.result = std::move(result);
        record.updated_at = at;

        auto it = impl_->waiters.find(record.job_id);
        if (it != impl_->waiters.end()) {
            note.waiters = std::move(it->second);
            impl_->waiters.erase(it);
        }
        note.record = std::move(record);
    }

    impl_->deliver(note);
    return ok();
}

auto queue_manager::reorder(std::string_view job_id, job_priority new_priority)
    -> VoidResult {
    std::lock_guard lock(impl_->mutex);

    auto fetched = impl_->store->get(job_id);
    if (fetched.is_err()) {
        return VoidResult(fetched.error());
    }
    if (!fetched.value()) {
        return jobq_void_error(error_codes::job_not_found,
                               jobq::compat::format("Job not found: {}", job_id));
    }

    const auto& record = *fetched.value();
    if (!record.can_reorder()) {
        return jobq_void_error(
            error_codes::invalid_state,
            jobq::compat::format("Job {} is {}, only queued jobs can be reordered",
                                 job_id, to_string(record.status)));
    }
    if (record.priority == new_priority) {
        return ok();
    }

    auto write = impl_->store->update_priority(job_id, new_priority);
    if (write.is_err()) {
        impl_->index_stale = true;
        return write;
    }

    if (!impl_->index.reorder(job_id, new_priority)) {
        impl_->index_stale = true;
    }
    impl_->request_wake_locked();

    impl_->logger->info_fmt("Reordered job {}: {} -> {}", job_id,
                            to_string(record.priority), to_string(new_priority));
    return ok();
}

auto queue_manager::prune(std::chrono::milliseconds age) -> Result<std::size_t> {
    if (age.count() < 0) {
        return jobq_error<std::size_t>(error_codes::invalid_argument,
                                       "Prune age must not be negative");
    }

    std::lock_guard lock(impl_->mutex);
    auto now = now_micros();
    // Ages reaching back past the epoch keep every record
    auto since_epoch =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    auto cutoff = age >= since_epoch ? job_clock::time_point{} : now - age;
    auto removed = impl_->store->delete_older_than(terminal_statuses(), cutoff);
    if (removed.is_ok()) {
        impl_->logger->info_fmt("Pruned {} finished jobs older than {} ms",
                                removed.value(), age.count());
    }
    return removed;
}

// =============================================================================
// Dispatch Control
// =============================================================================

void queue_manager::pause() {
    std::lock_guard lock(impl_->mutex);
    impl_->paused.store(true);
    impl_->throttle.reset_consecutive();
    impl_->logger->info("Queue paused");
}

void queue_manager::resume() {
    std::lock_guard lock(impl_->mutex);
    impl_->paused.store(false);
    impl_->request_wake_locked();
    impl_->logger->info("Queue resumed");
}

auto queue_manager::is_paused() const noexcept -> bool {
    return impl_->paused.load();
}

void queue_manager::start() {
    std::lock_guard lifecycle(impl_->lifecycle_mutex);
    std::lock_guard lock(impl_->mutex);
    if (impl_->running.load()) {
        return;
    }

    impl_->stopping = false;
    impl_->running.store(true);
    impl_->scheduler = std::thread([this] { impl_->scheduler_loop(); });
}

void queue_manager::stop() {
    std::lock_guard lifecycle(impl_->lifecycle_mutex);
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->running.load()) {
            return;
        }
        impl_->stopping = true;
        impl_->wake_cv.notify_all();
    }

    if (impl_->scheduler.joinable()) {
        impl_->scheduler.join();
    }
    impl_->running.store(false);

    // Terminal transitions written after the loop's last flush
    std::unique_lock lock(impl_->mutex);
    impl_->flush_notifications(lock);
}

auto queue_manager::is_running() const noexcept -> bool {
    return impl_->running.load();
}

// =============================================================================
// Queries
// =============================================================================

auto queue_manager::list() const -> Result<std::vector<job_record>> {
    return impl_->store->scan_all();
}

auto queue_manager::get(std::string_view job_id) const
    -> Result<std::optional<job_record>> {
    return impl_->store->get(job_id);
}

auto queue_manager::wait_for_completion(std::string_view job_id)
    -> Result<std::future<job_record>> {
    using result_type = std::future<job_record>;

    std::lock_guard lock(impl_->mutex);

    auto fetched = impl_->store->get(job_id);
    if (fetched.is_err()) {
        return Result<result_type>(fetched.error());
    }
    if (!fetched.value()) {
        return jobq_error<result_type>(error_codes::job_not_found,
                                       jobq::compat::format("Job not found: {}", job_id));
    }

    std::promise<job_record> promise;
    auto future = promise.get_future();

    if (fetched.value()->is_finished()) {
        promise.set_value(*fetched.value());
        return ok(std::move(future));
    }

    impl_->waiters[std::string(job_id)].push_back(std::move(promise));
    return ok(std::move(future));
}

// =============================================================================
// Statistics
// =============================================================================

auto queue_manager::queued_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->index.size();
}

auto queue_manager::has_running_job() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->running_id.has_value();
}

auto queue_manager::running_job_id() const -> std::optional<std::string> {
    std::lock_guard lock(impl_->mutex);
    return impl_->running_id;
}

auto queue_manager::recovered_count() const noexcept -> std::size_t {
    return impl_->recovered;
}

auto queue_manager::config() const noexcept -> const queue_config& {
    return impl_->config;
}

auto queue_manager::store() const noexcept -> const std::shared_ptr<storage::job_store>& {
    return impl_->store;
}

}  // namespace jobq::queue
