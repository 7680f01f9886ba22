// AgentRegistry.hpp - Registration table with per-agent locking
#pragma once

#include "agents/AgentTypes.hpp"
#include "agents/IAgent.hpp"
#include "coordination/EventBus.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * \file agents/AgentRegistry.hpp
 * \brief Declares the agent registration table.
 * \ingroup agents_module
 */

namespace TaskRelay {

/** \brief Available agent offered to the selection algorithm. */
struct SelectionCandidate {
    AgentRegistration registration;
    std::shared_ptr<IAgent> agent;
};

/**
 * \brief Registered agents, their availability and performance.
 * \ingroup agents_module
 *
 * Responsibilities:
 * - Idempotent registration keyed by agent id.
 * - Coordinator-owned availability transitions, including the atomic
 *   available -> busy reservation used at assignment.
 * - Running performance means per agent.
 *
 * The table lock (shared_mutex) only guards membership. Each entry has its own
 * mutex, so updates for different agents never contend. Availability change
 * events are published after the entry lock is released.
 */
class AgentRegistry {
public:
    AgentRegistry(std::shared_ptr<Logger> logger, std::shared_ptr<EventBus> events);

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    /**
     * \brief Register or refresh an agent.
     * \return true if the agent was new, false if an existing entry was updated.
     * \throws std::invalid_argument if \p agent is null or has an empty id.
     */
    bool register_agent(std::shared_ptr<IAgent> agent);

    /// Remove the entry. \return the removed agent handle, or null if unknown.
    std::shared_ptr<IAgent> remove(const std::string& agent_id);

    bool contains(const std::string& agent_id) const;
    std::shared_ptr<IAgent> agent(const std::string& agent_id) const;
    size_t size() const;

    /**
     * \brief Coordinator-driven availability change.
     * \details Offline clears the current task. Available is refused while the
     *          agent is busy with a task (the task owns the reservation).
     * \return false if the agent is unknown or the change was refused.
     */
    bool set_availability(const std::string& agent_id, Availability availability);

    /// Atomically move an available agent to busy with \p task_id. \return false if not available.
    bool try_reserve(const std::string& agent_id, const std::string& task_id);

    /// Release the reservation held for \p task_id (busy -> available). \return false if not held.
    bool release(const std::string& agent_id, const std::string& task_id);

    /// Fold one settled execution into the running means.
    bool record_completion(const std::string& agent_id, bool success, double response_ms);

    /// Interpret an agent status signal; always refreshes last activity.
    bool apply_status_signal(const std::string& agent_id, AgentStatusSignal signal);

    /// Available agents not in \p exclude, in registration order.
    std::vector<SelectionCandidate> available_candidates(const std::set<std::string>& exclude = {}) const;

    /// Ids of non-offline agents idle for longer than \p threshold, in registration order.
    std::vector<std::string> stale_agents(TimePoint now, std::chrono::milliseconds threshold) const;

    std::optional<AgentRegistration> snapshot(const std::string& agent_id) const;
    std::vector<AgentRegistration> snapshot_all() const;
    std::vector<AgentRegistration> agents_by_type(const std::string& agent_type) const;

private:
    struct AgentEntry {
        mutable std::mutex mutex;
        std::shared_ptr<IAgent> agent;
        AgentRegistration reg;
    };

    std::shared_ptr<AgentEntry> find_entry(const std::string& agent_id) const;
    std::vector<std::shared_ptr<AgentEntry>> entries_in_order() const;
    void publish_change(const std::string& agent_id, Availability previous, Availability current);
    std::set<std::string> query_capabilities(const IAgent& agent) const;

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<EventBus> events_;
    mutable std::shared_mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<AgentEntry>> entries_;
    std::atomic<uint64_t> next_seq_{0};
};

} // namespace TaskRelay
