#include "message/TaskQueue.hpp"

#include <algorithm>
#include <utility>

/**
 * \file message/TaskQueue.cpp
 * \brief Implements the two-tier ordered task queue.
 * \ingroup message_module
 */

// Entries are kept sorted; insertion uses upper_bound so equal keys keep
// arrival order. Queues are short-lived between ticks, so linear insertion
// into the deque is fine.

namespace TaskRelay {

bool TaskQueue::before(const QueueEntry& a, const QueueEntry& b) {
    if (a.front != b.front) return a.front;

    const int wa = priority_weight(a.priority);
    const int wb = priority_weight(b.priority);
    if (wa != wb) return wa > wb;

    if (a.front) return a.front_seq < b.front_seq;

    if (a.deadline.has_value() != b.deadline.has_value()) return a.deadline.has_value();
    if (a.deadline && b.deadline && *a.deadline != *b.deadline) return *a.deadline < *b.deadline;
    return a.seq < b.seq;
}

void TaskQueue::insert_locked(QueueEntry entry) {
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), entry, &TaskQueue::before);
    entries_.insert(pos, std::move(entry));
}

void TaskQueue::push(const std::string& task_id, TaskPriority priority, std::optional<TimePoint> deadline) {
    std::lock_guard lock(mutex_);
    QueueEntry e;
    e.task_id = task_id;
    e.priority = priority;
    e.deadline = deadline;
    e.seq = next_seq_++;
    insert_locked(std::move(e));
}

void TaskQueue::push_front(const std::string& task_id, TaskPriority priority, std::optional<TimePoint> deadline) {
    std::lock_guard lock(mutex_);
    QueueEntry e;
    e.task_id = task_id;
    e.priority = priority;
    e.deadline = deadline;
    e.seq = next_seq_++;
    e.front = true;
    e.front_seq = next_front_seq_++;
    insert_locked(std::move(e));
}

std::vector<QueueEntry> TaskQueue::drain() {
    std::lock_guard lock(mutex_);
    std::vector<QueueEntry> out(std::make_move_iterator(entries_.begin()),
                                std::make_move_iterator(entries_.end()));
    entries_.clear();
    return out;
}

void TaskQueue::restore(std::vector<QueueEntry> entries) {
    std::lock_guard lock(mutex_);
    for (auto& e : entries) {
        insert_locked(std::move(e));
    }
}

bool TaskQueue::remove(const std::string& task_id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const QueueEntry& e) { return e.task_id == task_id; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

size_t TaskQueue::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard lock(mutex_);
    return entries_.empty();
}

std::vector<std::string> TaskQueue::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& e : entries_) ids.push_back(e.task_id);
    return ids;
}

} // namespace TaskRelay
