#include "handoff/HandoffRule.hpp"

#include <stdexcept>

namespace TaskRelay {

std::string to_string(TriggerOperator op) {
    switch (op) {
        case TriggerOperator::Gt:  return "gt";
        case TriggerOperator::Lt:  return "lt";
        case TriggerOperator::Eq:  return "eq";
        case TriggerOperator::Gte: return "gte";
        case TriggerOperator::Lte: return "lte";
    }
    return "eq";
}

std::optional<TriggerOperator> parse_trigger_operator(const std::string& name) {
    for (auto op : {TriggerOperator::Gt, TriggerOperator::Lt, TriggerOperator::Eq,
                    TriggerOperator::Gte, TriggerOperator::Lte}) {
        if (to_string(op) == name) return op;
    }
    return std::nullopt;
}

bool trigger_holds(TriggerOperator op, double value, double threshold) {
    switch (op) {
        case TriggerOperator::Gt:  return value > threshold;
        case TriggerOperator::Lt:  return value < threshold;
        case TriggerOperator::Eq:  return value == threshold;
        case TriggerOperator::Gte: return value >= threshold;
        case TriggerOperator::Lte: return value <= threshold;
    }
    return false;
}

void to_json(nlohmann::json& j, const HandoffTrigger& trigger) {
    j = nlohmann::json{
        {"condition", trigger.condition},
        {"operator", to_string(trigger.op)},
        {"threshold", trigger.threshold}
    };
}

void from_json(const nlohmann::json& j, HandoffTrigger& trigger) {
    trigger.condition = j.at("condition").get<std::string>();
    const auto op_name = j.value("operator", std::string{"eq"});
    auto op = parse_trigger_operator(op_name);
    if (!op) {
        throw std::invalid_argument("unknown trigger operator '" + op_name + "'");
    }
    trigger.op = *op;
    trigger.threshold = j.value("threshold", 0.0);
}

void to_json(nlohmann::json& j, const HandoffRule& rule) {
    j = nlohmann::json{
        {"id", rule.id},
        {"name", rule.name},
        {"fromPattern", rule.from_pattern},
        {"toPattern", rule.to_pattern},
        {"triggers", rule.triggers},
        {"priority", rule.priority},
        {"enabled", rule.enabled}
    };
}

void from_json(const nlohmann::json& j, HandoffRule& rule) {
    rule.id = j.at("id").get<std::string>();
    rule.name = j.value("name", rule.id);
    rule.from_pattern = j.at("fromPattern").get<std::string>();
    rule.to_pattern = j.at("toPattern").get<std::string>();
    rule.triggers = j.at("triggers").get<std::vector<HandoffTrigger>>();
    rule.priority = j.value("priority", 0);
    rule.enabled = j.value("enabled", true);
}

} // namespace TaskRelay
