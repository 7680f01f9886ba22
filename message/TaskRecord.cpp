#include "message/TaskRecord.hpp"

#include <algorithm>
#include <cctype>

namespace TaskRelay {

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Assigned:   return "assigned";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
    }
    return "unknown";
}

std::string to_string(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::Low:      return "low";
        case TaskPriority::Medium:   return "medium";
        case TaskPriority::High:     return "high";
        case TaskPriority::Critical: return "critical";
    }
    return "unknown";
}

std::optional<TaskPriority> parse_task_priority(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto p : {TaskPriority::Low, TaskPriority::Medium, TaskPriority::High, TaskPriority::Critical}) {
        if (to_string(p) == lower) return p;
    }
    return std::nullopt;
}

} // namespace TaskRelay
