// HandoffEngine.hpp - Rule evaluation and agent-requested handoffs
#pragma once

#include "agents/AgentRegistry.hpp"
#include "coordination/AgentSelector.hpp"
#include "coordination/EventBus.hpp"
#include "coordination/IHandoffAdvisor.hpp"
#include "coordination/TaskScheduler.hpp"
#include "handoff/ConditionRegistry.hpp"
#include "handoff/HandoffRule.hpp"
#include "logger.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * \file handoff/HandoffEngine.hpp
 * \brief Declares the handoff engine.
 * \ingroup handoff_module
 */

namespace TaskRelay {

/** \brief Aggregate over the handoff histories of all retained tasks. */
struct HandoffStats {
    size_t total{0};
    size_t settled{0};
    size_t successful{0};
    double success_rate{0.0};         ///< successful / settled
    double average_duration_ms{0.0};  ///< over settled handoffs
    std::map<std::string, size_t> by_reason;
};

/**
 * \brief Decides and performs transfers of tasks between agents.
 * \ingroup handoff_module
 *
 * As the scheduler's advisor it is consulted when a task is assigned
 * (explicit directives in the context first, then rules) and when an agent
 * completes successfully (rules only, with the result as partial result).
 * Agent-initiated requests arrive through handle_request().
 *
 * Holds the scheduler weakly; the scheduler owns the engine as its advisor.
 */
class HandoffEngine : public IHandoffAdvisor {
public:
    HandoffEngine(std::shared_ptr<Logger> logger,
                  std::shared_ptr<AgentRegistry> registry,
                  std::shared_ptr<AgentSelector> selector,
                  std::shared_ptr<EventBus> events,
                  std::shared_ptr<ConditionRegistry> conditions,
                  std::weak_ptr<TaskScheduler> scheduler);

    // --- Rules ---
    /**
     * \brief Add or replace (same id) a rule.
     * \throws std::invalid_argument on an empty id, an invalid pattern, an
     *         empty trigger list or an unknown condition name.
     */
    void add_rule(const HandoffRule& rule);
    bool remove_rule(const std::string& rule_id);
    /// Rules in evaluation order.
    std::vector<HandoffRule> rules() const;

    /// strategic->coding (1), coding->testing (2), any->tool execution (3), any->planning (4).
    static std::vector<HandoffRule> default_rules();
    void install_default_rules();

    // --- Evaluation ---
    std::optional<HandoffPlan> advise(const TaskRecord& task,
                                      const AgentRegistration& current,
                                      AdviceStage stage,
                                      const std::optional<AgentResult>& partial_result) override;

    /**
     * \brief Handle an agent's request to give up its running task.
     * \return true if the task was transferred.
     */
    bool handle_request(const HandoffRequest& request);

    HandoffStats stats() const;

private:
    struct CompiledRule {
        HandoffRule rule;
        std::regex from_re;
        std::regex to_re;
        uint64_t seq{0};
    };

    struct FiredTrigger {
        std::string condition;
        double value{0.0};
        ConditionSpec spec;
        const HandoffTrigger* trigger{nullptr};
    };

    std::optional<HandoffPlan> explicit_directive(const TaskRecord& task, const AgentRegistration& current);
    std::optional<FiredTrigger> first_trigger(const CompiledRule& rule, const ConditionInput& input) const;
    std::optional<std::string> pick_target(const TaskRecord& task, const AgentRegistration& current,
                                           const std::function<bool(const AgentRegistration&)>& accept) const;
    void report_failure(const std::string& task_id, const std::string& from_agent, const std::string& why);

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AgentRegistry> registry_;
    std::shared_ptr<AgentSelector> selector_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<ConditionRegistry> conditions_;
    std::weak_ptr<TaskScheduler> scheduler_;

    mutable std::shared_mutex rules_mutex_;
    std::vector<CompiledRule> rules_;  ///< Sorted by (priority, seq)
    uint64_t next_rule_seq_{0};
};

} // namespace TaskRelay
