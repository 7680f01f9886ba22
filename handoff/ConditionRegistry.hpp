/**
 * @file handoff/ConditionRegistry.hpp
 * @brief Named trigger predicates used by handoff rules.
 *
 * Conditions are narrow, replaceable heuristics. Each returns a number that a
 * rule trigger compares against its threshold (builtins return 0 or 1).
 */
#pragma once

#include "agents/AgentTypes.hpp"
#include "message/HandoffEvent.hpp"
#include "message/TaskContext.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace TaskRelay {

/** @brief Everything a condition may inspect. */
struct ConditionInput {
    const TaskContext& context;
    const std::vector<std::string>& required_capabilities;
    const std::set<std::string>& agent_capabilities;     ///< Current agent's declared capabilities
    const std::optional<AgentResult>& partial_result;    ///< Set when evaluated after a completion
};

/** @brief A registered condition and the handoff reason it implies. */
struct ConditionSpec {
    std::function<double(const ConditionInput&)> evaluate;
    HandoffReasonType reason_type{HandoffReasonType::CapabilityMismatch};
    HandoffSeverity severity{HandoffSeverity::Moderate};
};

/**
 * @brief Thread-safe name -> condition table.
 * \ingroup handoff_module
 */
class ConditionRegistry {
public:
    ConditionRegistry() = default;

    ConditionRegistry(const ConditionRegistry&) = delete;
    ConditionRegistry& operator=(const ConditionRegistry&) = delete;

    /// Register or replace \p name. Throws std::invalid_argument on an empty name or function.
    void register_condition(const std::string& name, ConditionSpec spec);
    bool unregister_condition(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::optional<ConditionSpec> get(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    /// Evaluate \p name. \return nullopt if it is not registered.
    std::optional<double> evaluate(const std::string& name, const ConditionInput& input) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ConditionSpec> conditions_;
};

/// Register implementation_complete, implementation_required, capability_required,
/// test_required, tool_required, command_execution, planning_required and project_plan.
void register_builtin_conditions(ConditionRegistry& registry);

} // namespace TaskRelay
