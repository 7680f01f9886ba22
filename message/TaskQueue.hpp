// TaskQueue.hpp - Thread-safe two-tier priority queue of pending task ids
#pragma once

#include "message/TaskRecord.hpp"
#include "message/Timestamp.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * \file message/TaskQueue.hpp
 * \brief Ordered queue consumed by the assignment loop.
 * \ingroup message_module
 */

namespace TaskRelay {

/** \brief Ordering keys of one queued task. */
struct QueueEntry {
    std::string task_id;
    TaskPriority priority{TaskPriority::Medium};
    std::optional<TimePoint> deadline;
    uint64_t seq{0};        ///< Submission order
    bool front{false};      ///< Requeued / retried tier
    uint64_t front_seq{0};  ///< Order within the front tier
};

/**
 * \brief Thread-safe ordered queue of pending tasks.
 * \ingroup message_module
 *
 * Two tiers. The front tier holds requeued and retried tasks and always
 * precedes the normal tier; inside it higher priority comes first, then
 * requeue order. The normal tier orders by priority weight, then earliest
 * deadline (entries with a deadline before entries without), then
 * submission order.
 *
 * The assignment loop drains the queue, walks the entries in order and
 * restores the ones it could not assign with their original keys, so an
 * unassignable task keeps its position without blocking the ones behind it.
 */
class TaskQueue {
public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /// Enqueue a newly submitted task in the normal tier.
    void push(const std::string& task_id, TaskPriority priority, std::optional<TimePoint> deadline);

    /// Enqueue a requeued or retried task in the front tier.
    void push_front(const std::string& task_id, TaskPriority priority, std::optional<TimePoint> deadline);

    /// Remove and return every entry in queue order.
    std::vector<QueueEntry> drain();

    /// Put back entries returned by drain(); their ordering keys are kept.
    void restore(std::vector<QueueEntry> entries);

    /// Remove the entry for \p task_id. \return true if it was queued.
    bool remove(const std::string& task_id);

    size_t size() const;
    bool empty() const;

    /// Task ids in queue order.
    std::vector<std::string> snapshot() const;

    /// True if \p a is dequeued before \p b.
    static bool before(const QueueEntry& a, const QueueEntry& b);

private:
    void insert_locked(QueueEntry entry);

    mutable std::mutex mutex_;
    std::deque<QueueEntry> entries_;
    uint64_t next_seq_{0};
    uint64_t next_front_seq_{0};
};

} // namespace TaskRelay
