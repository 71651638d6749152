/**
 * @file memory_job_store.cpp
 * @brief Implementation of the in-memory job store
 */

#include <jobq/storage/memory_job_store.hpp>

#include <jobq/compat/format.hpp>

#include <algorithm>
#include <mutex>

namespace jobq::storage {

auto memory_job_store::find_locked(std::string_view job_id) -> queue::job_record* {
    auto it = records_.find(std::string(job_id));
    return it == records_.end() ? nullptr : &it->second;
}

// =============================================================================
// Writes
// =============================================================================

auto memory_job_store::insert(const queue::job_record& record) -> VoidResult {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = records_.try_emplace(record.job_id, record);
    if (!inserted) {
        return jobq_void_error(
            error_codes::duplicate_job,
            jobq::compat::format("Job already exists: {}", record.job_id));
    }
    return ok();
}

auto memory_job_store::update_status(std::string_view job_id,
                                     queue::job_status status,
                                     const std::optional<queue::job_result>& result,
                                     queue::job_clock::time_point at) -> VoidResult {
    std::unique_lock lock(mutex_);
    auto* record = find_locked(job_id);
    if (!record) {
        return jobq_void_error(error_codes::job_not_found,
                               jobq::compat::format("Job not found: {}", job_id));
    }

    record->status = status;
    record->updated_at = at;
    record->result = result;
    if (status == queue::job_status::running) {
        ++record->attempt_count;
    }
    return ok();
}

auto memory_job_store::update_priority(std::string_view job_id,
                                       queue::job_priority priority) -> VoidResult {
    std::unique_lock lock(mutex_);
    auto* record = find_locked(job_id);
    if (!record) {
        return jobq_void_error(error_codes::job_not_found,
                               jobq::compat::format("Job not found: {}", job_id));
    }
    record->priority = priority;
    return ok();
}

auto memory_job_store::update_progress(std::string_view job_id,
                                       const queue::job_progress& progress) -> VoidResult {
    std::unique_lock lock(mutex_);
    auto* record = find_locked(job_id);
    if (!record) {
        return jobq_void_error(error_codes::job_not_found,
                               jobq::compat::format("Job not found: {}", job_id));
    }
    record->progress = progress;
    return ok();
}

auto memory_job_store::delete_older_than(const std::vector<queue::job_status>& statuses,
                                         queue::job_clock::time_point cutoff)
    -> Result<std::size_t> {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& record = it->second;
        bool status_match = std::find(statuses.begin(), statuses.end(),
                                      record.status) != statuses.end();
        if (status_match && record.updated_at < cutoff) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return ok(removed);
}

// =============================================================================
// Reads
// =============================================================================

auto memory_job_store::get(std::string_view job_id)
    -> Result<std::optional<queue::job_record>> {
    std::shared_lock lock(mutex_);
    auto it = records_.find(std::string(job_id));
    if (it == records_.end()) {
        return ok(std::optional<queue::job_record>(std::nullopt));
    }
    return ok(std::optional<queue::job_record>(it->second));
}

auto memory_job_store::scan_by_status(queue::job_status status)
    -> Result<std::vector<queue::job_record>> {
    std::vector<queue::job_record> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, record] : records_) {
            if (record.status == status) {
                out.push_back(record);
            }
        }
    }
    sort_records(out);
    return ok(std::move(out));
}

auto memory_job_store::scan_all() -> Result<std::vector<queue::job_record>> {
    std::vector<queue::job_record> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            out.push_back(record);
        }
    }
    sort_records(out);
    return ok(std::move(out));
}

auto memory_job_store::count_by_status(queue::job_status status) -> Result<std::size_t> {
    std::shared_lock lock(mutex_);
    return ok(static_cast<std::size_t>(
        std::count_if(records_.begin(), records_.end(),
                      [status](const auto& entry) { return entry.second.status == status; })));
}

auto memory_job_store::latest_created_at()
    -> Result<std::optional<queue::job_clock::time_point>> {
    std::shared_lock lock(mutex_);
    std::optional<queue::job_clock::time_point> latest;
    for (const auto& [id, record] : records_) {
        if (!latest || record.created_at > *latest) {
            latest = record.created_at;
        }
    }
    return ok(latest);
}

}  // namespace jobq::storage
