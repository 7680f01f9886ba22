// Events.hpp - Closed set of coordinator notifications
#pragma once

#include "agents/AgentTypes.hpp"
#include "message/HandoffEvent.hpp"
#include "message/TaskRecord.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

/**
 * \defgroup coordination_module Coordination Module
 * \brief Scheduler, selection, health monitoring and the coordinator facade.
 */

/**
 * \file coordination/Events.hpp
 * \brief Typed events published on the EventBus.
 * \ingroup coordination_module
 */

namespace TaskRelay {

struct AgentRegistered {
    std::string agent_id;
    std::string agent_type;
    bool updated{false};  ///< true when an existing registration was refreshed
};

struct AgentUnregistered {
    std::string agent_id;
    std::vector<std::string> requeued_tasks;
};

struct TaskSubmitted {
    std::string task_id;
    TaskPriority priority{TaskPriority::Medium};
};

struct TaskAssigned {
    std::string task_id;
    std::string agent_id;
    uint32_t attempt{0};
};

struct TaskCompleted {
    std::string task_id;
    std::string agent_id;
    AgentResult result;
};

struct TaskFailed {
    std::string task_id;
    std::string agent_id;
    std::string error;
    bool will_retry{false};
};

struct TaskHandoff {
    std::string task_id;
    HandoffEvent event;
};

struct AgentAvailabilityChanged {
    std::string agent_id;
    Availability previous{Availability::Available};
    Availability current{Availability::Available};
};

struct AgentUnresponsive {
    std::string agent_id;
    int64_t idle_ms{0};
    std::vector<std::string> requeued_tasks;
};

struct TaskRequeued {
    std::string task_id;
    std::string agent_id;  ///< Agent the task was taken from
    std::string reason;
};

struct HandoffFailed {
    std::string task_id;
    std::string from_agent;
    std::string reason;
};

using CoordinatorEvent = std::variant<
    AgentRegistered,
    AgentUnregistered,
    TaskSubmitted,
    TaskAssigned,
    TaskCompleted,
    TaskFailed,
    TaskHandoff,
    AgentAvailabilityChanged,
    AgentUnresponsive,
    TaskRequeued,
    HandoffFailed>;

/// Short event name ("task-assigned", ...).
std::string event_name(const CoordinatorEvent& event);

/// One-line human-readable description for logs.
std::string describe(const CoordinatorEvent& event);

} // namespace TaskRelay
