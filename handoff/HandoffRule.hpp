// HandoffRule.hpp - Declarative rule moving tasks between agent types
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * \defgroup handoff_module Handoff Module
 * \brief Rule-driven and agent-requested transfer of tasks between agents.
 */

namespace TaskRelay {

enum class TriggerOperator { Gt, Lt, Eq, Gte, Lte };

std::string to_string(TriggerOperator op);
std::optional<TriggerOperator> parse_trigger_operator(const std::string& name);

/// Apply \p op as `value <op> threshold`.
bool trigger_holds(TriggerOperator op, double value, double threshold);

struct HandoffTrigger {
    std::string condition;                  ///< Name registered in the ConditionRegistry
    TriggerOperator op{TriggerOperator::Eq};
    double threshold{0.0};
};

/**
 * \brief Rule: when the current agent's type matches `from_pattern` and any
 * trigger holds, move the task to an agent whose type matches `to_pattern`.
 * \ingroup handoff_module
 *
 * Patterns are ECMAScript regular expressions searched case-insensitively in
 * the agent type. Lower `priority` is evaluated first.
 */
struct HandoffRule {
    std::string id;
    std::string name;
    std::string from_pattern;
    std::string to_pattern;
    std::vector<HandoffTrigger> triggers;
    int priority{0};
    bool enabled{true};
};

// JSON shape: {"id", "name", "fromPattern", "toPattern",
//              "triggers": [{"condition", "operator", "threshold"}], "priority", "enabled"}
void to_json(nlohmann::json& j, const HandoffTrigger& trigger);
void from_json(const nlohmann::json& j, HandoffTrigger& trigger);
void to_json(nlohmann::json& j, const HandoffRule& rule);
void from_json(const nlohmann::json& j, HandoffRule& rule);

} // namespace TaskRelay
