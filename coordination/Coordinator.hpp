// Coordinator.hpp - Facade wiring registry, scheduler, handoff engine and health monitor
#pragma once

#include "agents/AgentRegistry.hpp"
#include "agents/IAgent.hpp"
#include "coordination/AgentSelector.hpp"
#include "coordination/EventBus.hpp"
#include "coordination/HealthMonitor.hpp"
#include "coordination/TaskScheduler.hpp"
#include "handoff/ConditionRegistry.hpp"
#include "handoff/HandoffEngine.hpp"
#include "handoff/HandoffRule.hpp"
#include "runtime/coro/ExecutionLoop.hpp"
#include "logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * \file coordination/Coordinator.hpp
 * \brief Declares the coordinator facade.
 * \ingroup coordination_module
 */

namespace TaskRelay {

struct CoordinatorConfig {
    SchedulerConfig scheduler;
    HealthMonitorConfig health;
    SelectionWeights selection;
    size_t execution_threads{1};
    bool install_default_rules{true};
    std::vector<HandoffRule> rules;  ///< Added after the defaults
};

/**
 * \brief Single entry point for agents, tasks, handoff rules and events.
 * \ingroup coordination_module
 *
 * Explicitly constructed; several coordinators may coexist in one process.
 * Construction starts the execution loop but not the assignment loop or the
 * health monitor: call start() for background operation, or drive the
 * coordinator with tick() and sweep_health().
 *
 * Typical usage:
 * \code
 *   Coordinator coordinator(logger);
 *   coordinator.register_agent(agent);
 *   auto id = coordinator.submit_task({"coding"}, context);
 *   coordinator.start();
 * \endcode
 */
class Coordinator {
public:
    explicit Coordinator(std::shared_ptr<Logger> logger, CoordinatorConfig config = {});
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // --- Lifecycle ---
    void start();
    void stop();
    bool is_running() const;

    /// One assignment pass. \return tasks dispatched.
    size_t tick();
    /// One health sweep as of \p now. \return agents taken offline.
    std::vector<std::string> sweep_health(TimePoint now = Clock::now());

    // --- Agents ---
    /**
     * \brief Register or refresh an agent and install its listeners.
     * \return true if the agent was new.
     * \throws std::invalid_argument if \p agent is null or has an empty id.
     */
    bool register_agent(std::shared_ptr<IAgent> agent);

    /**
     * \brief Remove an agent; its in-flight tasks go back to the front of the queue.
     * \return false if the agent was unknown.
     */
    bool unregister_agent(const std::string& agent_id);

    /**
     * \brief Coordinator-side availability override.
     * \details Offline requeues the agent's in-flight tasks. Available is
     *          refused while the agent holds a task.
     */
    bool update_agent_availability(const std::string& agent_id, Availability availability);

    std::optional<AgentRegistration> get_agent_status(const std::string& agent_id) const;
    std::vector<AgentRegistration> get_all_agents() const;
    std::vector<AgentRegistration> get_agents_by_type(const std::string& agent_type) const;

    // --- Tasks ---
    std::string submit_task(std::vector<std::string> required_capabilities,
                            TaskContext context,
                            TaskPriority priority = TaskPriority::Medium,
                            std::optional<TimePoint> deadline = std::nullopt);
    std::optional<TaskRecord> get_task_status(const std::string& task_id) const;
    std::vector<TaskRecord> get_all_tasks() const;
    QueueStatus get_queue_status() const;
    bool release_task(const std::string& task_id);

    // --- Handoff ---
    void add_handoff_rule(const HandoffRule& rule);
    bool remove_handoff_rule(const std::string& rule_id);
    std::vector<HandoffRule> handoff_rules() const;
    HandoffStats handoff_stats() const;
    ConditionRegistry& conditions() { return *conditions_; }

    // --- Events ---
    EventBus::SubscriptionId subscribe(EventBus::Handler handler);
    bool unsubscribe(EventBus::SubscriptionId id);

    const runtime::ExecutionLoop& execution_loop() const { return *loop_; }
    /// Agent executions still awaiting their result.
    size_t active_executions() const { return scheduler_->active_executions(); }

private:
    std::shared_ptr<Logger> logger_;
    CoordinatorConfig config_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<AgentRegistry> registry_;
    std::shared_ptr<AgentSelector> selector_;
    std::shared_ptr<runtime::ExecutionLoop> loop_;
    std::shared_ptr<TaskScheduler> scheduler_;
    std::shared_ptr<ConditionRegistry> conditions_;
    std::shared_ptr<HandoffEngine> engine_;
    std::unique_ptr<HealthMonitor> health_;
};

} // namespace TaskRelay
