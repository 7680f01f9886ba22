// AgentBase.hpp - Listener plumbing shared by concrete agents
#pragma once

#include "agents/IAgent.hpp"

#include <mutex>
#include <set>
#include <string>

namespace TaskRelay {

/**
 * \brief Convenience base implementing identity and listener handling.
 * \ingroup agents_module
 *
 * Subclasses implement `execute()` and call `emit_status()` /
 * `request_handoff()` from any thread. Listeners are invoked without the
 * internal lock held, so a listener may call back into the agent.
 */
class AgentBase : public IAgent {
public:
    AgentBase(std::string id, std::string type, std::set<std::string> capabilities);

    const std::string& id() const noexcept override { return id_; }
    const std::string& type() const noexcept override { return type_; }
    std::set<std::string> list_capabilities() const override;

    void set_status_listener(StatusListener listener) override;
    void set_handoff_listener(HandoffListener listener) override;

    /// Replace the declared capability set (picked up on the next selection).
    void set_capabilities(std::set<std::string> capabilities);

protected:
    void emit_status(AgentStatusSignal signal);
    /// \return true if the task was handed off; false when it was not or no listener is installed.
    bool request_handoff(const HandoffRequest& request);

private:
    const std::string id_;
    const std::string type_;
    mutable std::mutex mutex_;
    std::set<std::string> capabilities_;
    StatusListener status_listener_;
    HandoffListener handoff_listener_;
};

} // namespace TaskRelay
