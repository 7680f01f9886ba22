#include "coordination/Events.hpp"

#include <type_traits>

namespace TaskRelay {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

} // namespace

std::string event_name(const CoordinatorEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AgentRegistered>) return "agent-registered";
        else if constexpr (std::is_same_v<T, AgentUnregistered>) return "agent-unregistered";
        else if constexpr (std::is_same_v<T, TaskSubmitted>) return "task-submitted";
        else if constexpr (std::is_same_v<T, TaskAssigned>) return "task-assigned";
        else if constexpr (std::is_same_v<T, TaskCompleted>) return "task-completed";
        else if constexpr (std::is_same_v<T, TaskFailed>) return "task-failed";
        else if constexpr (std::is_same_v<T, TaskHandoff>) return "task-handoff";
        else if constexpr (std::is_same_v<T, AgentAvailabilityChanged>) return "agent-availability-changed";
        else if constexpr (std::is_same_v<T, AgentUnresponsive>) return "agent-unresponsive";
        else if constexpr (std::is_same_v<T, TaskRequeued>) return "task-requeued";
        else return "handoff-failed";
    }, event);
}

std::string describe(const CoordinatorEvent& event) {
    std::string detail = std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AgentRegistered>) {
            return e.agent_id + " (" + e.agent_type + ")" + (e.updated ? " updated" : "");
        } else if constexpr (std::is_same_v<T, AgentUnregistered>) {
            return e.agent_id + (e.requeued_tasks.empty() ? "" : " requeued=[" + join(e.requeued_tasks) + "]");
        } else if constexpr (std::is_same_v<T, TaskSubmitted>) {
            return e.task_id + " priority=" + to_string(e.priority);
        } else if constexpr (std::is_same_v<T, TaskAssigned>) {
            return e.task_id + " -> " + e.agent_id + " attempt=" + std::to_string(e.attempt);
        } else if constexpr (std::is_same_v<T, TaskCompleted>) {
            return e.task_id + " by " + e.agent_id;
        } else if constexpr (std::is_same_v<T, TaskFailed>) {
            return e.task_id + " by " + e.agent_id + ": " + e.error + (e.will_retry ? " (retrying)" : "");
        } else if constexpr (std::is_same_v<T, TaskHandoff>) {
            return e.task_id + " " + e.event.from_agent + " -> " + e.event.to_agent +
                   " [" + to_string(e.event.reason.type) + "] " + e.event.reason.description;
        } else if constexpr (std::is_same_v<T, AgentAvailabilityChanged>) {
            return e.agent_id + " " + to_string(e.previous) + " -> " + to_string(e.current);
        } else if constexpr (std::is_same_v<T, AgentUnresponsive>) {
            return e.agent_id + " idle " + std::to_string(e.idle_ms) + "ms";
        } else if constexpr (std::is_same_v<T, TaskRequeued>) {
            return e.task_id + " from " + e.agent_id + ": " + e.reason;
        } else {
            return e.task_id + " on " + e.from_agent + ": " + e.reason;
        }
    }, event);
    return event_name(event) + " " + detail;
}

} // namespace TaskRelay
