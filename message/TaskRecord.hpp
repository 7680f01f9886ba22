// TaskRecord.hpp - Lifecycle record of one submitted task
#pragma once

#include "agents/AgentTypes.hpp"
#include "message/HandoffEvent.hpp"
#include "message/TaskContext.hpp"
#include "message/Timestamp.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * \file message/TaskRecord.hpp
 * \brief Task status machine, priorities and the record the scheduler keeps per task.
 * \ingroup message_module
 */

namespace TaskRelay {

/// pending -> assigned -> in_progress -> {completed | failed}; failed -> pending on retry.
enum class TaskStatus { Pending, Assigned, InProgress, Completed, Failed };

enum class TaskPriority { Low, Medium, High, Critical };

std::string to_string(TaskStatus status);
std::string to_string(TaskPriority priority);
std::optional<TaskPriority> parse_task_priority(const std::string& name);

/// Ordering weight: critical 4 > high 3 > medium 2 > low 1.
inline int priority_weight(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::Low:      return 1;
        case TaskPriority::Medium:   return 2;
        case TaskPriority::High:     return 3;
        case TaskPriority::Critical: return 4;
    }
    return 0;
}

/**
 * \brief Snapshot-able state of one task.
 * \ingroup message_module
 *
 * Invariant: `status == InProgress` implies `assigned_agent` is set and the
 * agent is busy with this task.
 */
struct TaskRecord {
    std::string task_id;
    std::vector<std::string> required_capabilities;
    TaskPriority priority{TaskPriority::Medium};
    std::optional<TimePoint> deadline;
    std::shared_ptr<const TaskContext> context;
    std::optional<std::string> assigned_agent;
    TaskStatus status{TaskStatus::Pending};
    std::optional<AgentResult> result;
    std::vector<HandoffEvent> handoff_history;
    uint32_t attempts{0};                   ///< Number of dispatches so far
    std::optional<std::string> last_error;  ///< Error of the most recent failed attempt
    TimePoint submitted_at{};

    [[nodiscard]] bool is_terminal() const noexcept {
        return status == TaskStatus::Completed || status == TaskStatus::Failed;
    }
};

} // namespace TaskRelay
