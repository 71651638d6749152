/**
 * @file queue_index.cpp
 * @brief Implementation of the priority/FIFO queue index
 */

#include <jobq/queue/queue_index.hpp>

namespace jobq::queue {

auto queue_index::insert(const job_record& record) -> bool {
    queue_entry entry{record.job_id, record.priority, record.created_at};
    auto [it, inserted] = locator_.emplace(record.job_id, entry);
    if (!inserted) {
        return false;
    }
    levels_[level(entry.priority)].insert(std::move(entry));
    return true;
}

auto queue_index::remove(std::string_view job_id) -> bool {
    auto it = locator_.find(std::string(job_id));
    if (it == locator_.end()) {
        return false;
    }
    levels_[level(it->second.priority)].erase(it->second);
    locator_.erase(it);
    return true;
}

auto queue_index::peek_next() const -> std::optional<queue_entry> {
    for (auto lvl = levels_.size(); lvl-- > 0;) {
        if (!levels_[lvl].empty()) {
            return *levels_[lvl].begin();
        }
    }
    return std::nullopt;
}

auto queue_index::reorder(std::string_view job_id, job_priority new_priority) -> bool {
    auto it = locator_.find(std::string(job_id));
    if (it == locator_.end()) {
        return false;
    }

    auto& entry = it->second;
    if (entry.priority == new_priority) {
        return true;
    }

    levels_[level(entry.priority)].erase(entry);
    entry.priority = new_priority;
    levels_[level(new_priority)].insert(entry);
    return true;
}

void queue_index::rebuild(const std::vector<job_record>& records) {
    clear();
    for (const auto& record : records) {
        if (record.status == job_status::queued) {
            insert(record);
        }
    }
}

void queue_index::clear() noexcept {
    for (auto& lvl : levels_) {
        lvl.clear();
    }
    locator_.clear();
}

auto queue_index::contains(std::string_view job_id) const -> bool {
    return locator_.find(std::string(job_id)) != locator_.end();
}

auto queue_index::size(job_priority priority) const noexcept -> std::size_t {
    return levels_[level(priority)].size();
}

auto queue_index::snapshot() const -> std::vector<queue_entry> {
    std::vector<queue_entry> out;
    out.reserve(locator_.size());
    for (auto lvl = levels_.size(); lvl-- > 0;) {
        out.insert(out.end(), levels_[lvl].begin(), levels_[lvl].end());
    }
    return out;
}

}  // namespace jobq::queue
