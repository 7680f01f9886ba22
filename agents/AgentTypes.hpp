// AgentTypes.hpp - Value types exchanged between agents and the coordinator
#pragma once

#include "message/HandoffEvent.hpp"
#include "message/TaskContext.hpp"
#include "message/Timestamp.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * \defgroup agents_module Agents Module
 * \brief Agent contract, listener plumbing and the registration table.
 */

/**
 * \file agents/AgentTypes.hpp
 * \brief Availability, status signals, results and handoff requests.
 * \ingroup agents_module
 */

namespace TaskRelay {

/// Coordinator-owned availability. Agents never set it directly.
enum class Availability { Available, Busy, Offline };

/// Lifecycle signal emitted by an agent; interpreted by the registry.
enum class AgentStatusSignal { Idle, Busy, Failed, Completed };

enum class HandoffUrgency { Low, Medium, High, Critical };

std::string to_string(Availability availability);
std::string to_string(AgentStatusSignal signal);
std::string to_string(HandoffUrgency urgency);
std::optional<HandoffUrgency> parse_handoff_urgency(const std::string& name);
HandoffSeverity severity_for(HandoffUrgency urgency);

struct PerformanceStats {
    double success_rate{1.0};              ///< successes / settled tasks, in [0,1]
    double average_response_time_ms{0.0};  ///< mean dispatch-to-completion time
    uint64_t tasks_completed{0};           ///< settled tasks (successful or not)
};

/**
 * \brief Outcome of one `IAgent::execute` call.
 * \ingroup agents_module
 */
struct AgentResult {
    bool success{false};
    std::string agent_id;
    TimePoint timestamp{};
    std::optional<std::string> error;
    nlohmann::json output;                               ///< Agent-defined result payload
    nlohmann::json metadata = nlohmann::json::object();  ///< Flags such as implementationComplete

    static AgentResult failure(std::string agent_id, std::string error) {
        AgentResult r;
        r.agent_id = std::move(agent_id);
        r.timestamp = Clock::now();
        r.error = std::move(error);
        return r;
    }
};

/// Snapshot of one registration table entry.
struct AgentRegistration {
    std::string agent_id;
    std::string agent_type;
    std::set<std::string> capabilities;  ///< As last reported by the agent
    Availability availability{Availability::Available};
    TimePoint last_activity{};
    PerformanceStats performance;
    std::optional<std::string> current_task;
    uint64_t registration_seq{0};        ///< Breaks selection ties (earlier wins)
};

/**
 * \brief Agent-initiated request to move its running task elsewhere.
 * \ingroup agents_module
 */
struct HandoffRequest {
    std::string task_id;
    std::string from_agent;
    HandoffReason reason;
    std::vector<std::string> required_capabilities;
    HandoffUrgency urgency{HandoffUrgency::Medium};
    std::optional<TaskContext> context;  ///< Replaces the current context when set
};

void to_json(nlohmann::json& j, const AgentResult& result);

} // namespace TaskRelay
