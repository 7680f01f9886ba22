/**
 * @file agents/IAgent.hpp
 * @brief Contract every worker agent exposes to the coordinator.
 *
 * The coordinator only depends on this interface: identity, declared
 * capabilities, asynchronous execution and the status / handoff signal
 * streams. How an agent does its work is not the coordinator's concern.
 */
#pragma once

#include "agents/AgentTypes.hpp"

#include <functional>
#include <future>
#include <memory>
#include <set>
#include <string>

namespace TaskRelay {

/**
 * @brief Interface for worker agents.
 * \ingroup agents_module
 */
class IAgent {
public:
    using StatusListener = std::function<void(const std::string& agent_id, AgentStatusSignal signal)>;
    /// Returns true if the coordinator moved the task to another agent.
    using HandoffListener = std::function<bool(const HandoffRequest& request)>;

    virtual ~IAgent() = default;

    /// Unique, stable agent identifier.
    [[nodiscard]] virtual const std::string& id() const noexcept = 0;

    /// Free-form type string matched by handoff rule patterns (e.g. "coding").
    [[nodiscard]] virtual const std::string& type() const noexcept = 0;

    /**
     * @brief Current capability list.
     * @note Called on every selection pass; may throw, in which case the agent
     *       is skipped for that pass.
     */
    [[nodiscard]] virtual std::set<std::string> list_capabilities() const = 0;

    /**
     * @brief Start executing a unit of work.
     * @param context Shared read-only context; valid for the whole execution.
     * @return Future resolved with the result. A stored exception or a broken
     *         promise is treated as a failed execution.
     */
    [[nodiscard]] virtual std::future<AgentResult> execute(std::shared_ptr<const TaskContext> context) = 0;

    /// Install (or clear with an empty function) the status signal listener.
    virtual void set_status_listener(StatusListener listener) = 0;

    /// Install (or clear with an empty function) the handoff request listener.
    virtual void set_handoff_listener(HandoffListener listener) = 0;
};

} // namespace TaskRelay
