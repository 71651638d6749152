/**
 * @file job_store.cpp
 * @brief Shared helpers for job_store implementations
 */

#include <jobq/storage/job_store.hpp>

#include <algorithm>

namespace jobq::storage {

namespace {

/// Rank of a status in the listing order
[[nodiscard]] constexpr int status_rank(queue::job_status status) noexcept {
    switch (status) {
        case queue::job_status::running: return 0;
        case queue::job_status::queued: return 1;
        case queue::job_status::completed: return 2;
        case queue::job_status::failed: return 3;
        case queue::job_status::cancelled: return 4;
        default: return 5;
    }
}

}  // namespace

void sort_records(std::vector<queue::job_record>& records) {
    std::sort(records.begin(), records.end(),
              [](const queue::job_record& a, const queue::job_record& b) {
                  auto ra = status_rank(a.status);
                  auto rb = status_rank(b.status);
                  if (ra != rb) {
                      return ra < rb;
                  }
                  if (a.priority != b.priority) {
                      return static_cast<int>(a.priority) > static_cast<int>(b.priority);
                  }
                  if (a.created_at != b.created_at) {
                      return a.created_at < b.created_at;
                  }
                  return a.job_id < b.job_id;
              });
}

}  // namespace jobq::storage
