#include "handoff/HandoffEngine.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <stdexcept>

/**
 * \file handoff/HandoffEngine.cpp
 * \brief Implements rule validation, evaluation order and target resolution.
 * \ingroup handoff_module
 */

namespace TaskRelay {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "Tool-Execution", "tool_execution" and "ToolExecution" compare equal
std::string normalize_type(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

struct KeywordDirective {
    const char* phrase;
    const char* target_type;
    const char* description;
};

const KeywordDirective kKeywordDirectives[] = {
    {"hand off to coding", "coding", "Implementation required"},
    {"need testing", "testing", "Testing required"},
    {"run command", "tool-execution", "Tool execution required"},
    {"create plan", "planning", "Planning required"},
    {"strategic analysis", "strategic", "Strategic analysis required"},
};

std::regex compile_pattern(const std::string& pattern, const std::string& rule_id, const char* which) {
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("handoff rule '" + rule_id + "': invalid " + which + " pattern '" +
                                    pattern + "': " + e.what());
    }
}

} // namespace

HandoffEngine::HandoffEngine(std::shared_ptr<Logger> logger,
                             std::shared_ptr<AgentRegistry> registry,
                             std::shared_ptr<AgentSelector> selector,
                             std::shared_ptr<EventBus> events,
                             std::shared_ptr<ConditionRegistry> conditions,
                             std::weak_ptr<TaskScheduler> scheduler)
    : logger_(std::move(logger)),
      registry_(std::move(registry)),
      selector_(std::move(selector)),
      events_(std::move(events)),
      conditions_(std::move(conditions)),
      scheduler_(std::move(scheduler)) {
    if (!logger_) throw std::invalid_argument("HandoffEngine: logger cannot be null");
    if (!registry_ || !selector_ || !events_ || !conditions_) {
        throw std::invalid_argument("HandoffEngine: registry, selector, event bus and conditions are required");
    }
}

void HandoffEngine::add_rule(const HandoffRule& rule) {
    if (rule.id.empty()) {
        throw std::invalid_argument("handoff rule id cannot be empty");
    }
    if (rule.triggers.empty()) {
        throw std::invalid_argument("handoff rule '" + rule.id + "' has no triggers");
    }
    for (const auto& t : rule.triggers) {
        if (!conditions_->contains(t.condition)) {
            throw std::invalid_argument("handoff rule '" + rule.id + "' uses unknown condition '" + t.condition + "'");
        }
    }
    CompiledRule compiled{rule,
                          compile_pattern(rule.from_pattern, rule.id, "from"),
                          compile_pattern(rule.to_pattern, rule.id, "to"),
                          0};
    {
        std::unique_lock lock(rules_mutex_);
        auto it = std::find_if(rules_.begin(), rules_.end(),
                               [&](const CompiledRule& r) { return r.rule.id == rule.id; });
        if (it != rules_.end()) {
            compiled.seq = it->seq;
            rules_.erase(it);
        } else {
            compiled.seq = next_rule_seq_++;
        }
        rules_.push_back(std::move(compiled));
        std::stable_sort(rules_.begin(), rules_.end(), [](const CompiledRule& a, const CompiledRule& b) {
            if (a.rule.priority != b.rule.priority) return a.rule.priority < b.rule.priority;
            return a.seq < b.seq;
        });
    }
    logger_->info("Handoff rule added: " + rule.id + " (" + rule.name + ")");
}

bool HandoffEngine::remove_rule(const std::string& rule_id) {
    std::unique_lock lock(rules_mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&](const CompiledRule& r) { return r.rule.id == rule_id; });
    if (it == rules_.end()) return false;
    rules_.erase(it);
    lock.unlock();
    logger_->info("Handoff rule removed: " + rule_id);
    return true;
}

std::vector<HandoffRule> HandoffEngine::rules() const {
    std::shared_lock lock(rules_mutex_);
    std::vector<HandoffRule> out;
    out.reserve(rules_.size());
    for (const auto& r : rules_) out.push_back(r.rule);
    return out;
}

std::vector<HandoffRule> HandoffEngine::default_rules() {
    return {
        {"strategic-to-coding", "Strategic to Coding Handoff", ".*Strategic.*", ".*Coding.*",
         {{"implementation_required", TriggerOperator::Eq, 1.0},
          {"capability_required", TriggerOperator::Eq, 1.0}},
         1, true},
        {"coding-to-testing", "Coding to Testing Handoff", ".*Coding.*", ".*Testing.*",
         {{"implementation_complete", TriggerOperator::Eq, 1.0},
          {"test_required", TriggerOperator::Eq, 1.0}},
         2, true},
        {"any-to-tool-execution", "Any to Tool Execution Handoff", ".*", ".*Tool.?Execution.*",
         {{"tool_required", TriggerOperator::Eq, 1.0},
          {"command_execution", TriggerOperator::Eq, 1.0}},
         3, true},
        {"any-to-planning", "Any to Planning Handoff", ".*", ".*Planning.*",
         {{"planning_required", TriggerOperator::Eq, 1.0},
          {"project_plan", TriggerOperator::Eq, 1.0}},
         4, true},
    };
}

void HandoffEngine::install_default_rules() {
    for (const auto& rule : default_rules()) add_rule(rule);
}

std::optional<HandoffPlan> HandoffEngine::advise(const TaskRecord& task,
                                                 const AgentRegistration& current,
                                                 AdviceStage stage,
                                                 const std::optional<AgentResult>& partial_result) {
    if (!task.context) return std::nullopt;

    if (stage == AdviceStage::Assignment) {
        if (auto plan = explicit_directive(task, current)) return plan;
    }

    std::vector<CompiledRule> rules;
    {
        std::shared_lock lock(rules_mutex_);
        rules = rules_;
    }

    const ConditionInput input{*task.context, task.required_capabilities, current.capabilities, partial_result};
    for (const auto& r : rules) {
        if (!r.rule.enabled) continue;
        if (!std::regex_search(current.agent_type, r.from_re)) continue;
        // Already on an agent of the target kind
        if (std::regex_search(current.agent_type, r.to_re)) continue;

        auto fired = first_trigger(r, input);
        if (!fired) continue;

        const auto& to_re = r.to_re;
        auto target = pick_target(task, current, [&to_re](const AgentRegistration& reg) {
            return std::regex_search(reg.agent_type, to_re);
        });
        if (!target) {
            report_failure(task.task_id, current.agent_id,
                           "rule '" + r.rule.id + "' fired but no available agent matches '" + r.rule.to_pattern + "'");
            return std::nullopt;
        }

        HandoffReason reason;
        reason.type = fired->spec.reason_type;
        reason.severity = fired->spec.severity;
        reason.description = "Rule '" + r.rule.name + "' triggered: condition '" + fired->condition + "' met (" +
                             format_number(fired->value) + " " + to_string(fired->trigger->op) + " " +
                             format_number(fired->trigger->threshold) + ")";
        logger_->info("Task " + task.task_id + ": " + reason.description + "; target " + *target);
        return HandoffPlan{*target, reason, r.rule.id};
    }
    return std::nullopt;
}

std::optional<HandoffEngine::FiredTrigger> HandoffEngine::first_trigger(const CompiledRule& rule,
                                                                        const ConditionInput& input) const {
    for (const auto& trigger : rule.rule.triggers) {
        auto spec = conditions_->get(trigger.condition);
        if (!spec) {
            // Removed from the registry after the rule was added
            logger_->warning("Handoff rule " + rule.rule.id + ": condition '" + trigger.condition + "' is not registered");
            continue;
        }
        const double value = spec->evaluate(input);
        if (trigger_holds(trigger.op, value, trigger.threshold)) {
            return FiredTrigger{trigger.condition, value, *spec, &trigger};
        }
    }
    return std::nullopt;
}

std::optional<HandoffPlan> HandoffEngine::explicit_directive(const TaskRecord& task, const AgentRegistration& current) {
    const auto& ctx = *task.context;
    std::string target;
    HandoffReason reason;

    const auto& meta = ctx.metadata;
    auto handoff_it = meta.is_object() ? meta.find("handoff") : meta.end();
    if (handoff_it != meta.end() && handoff_it->is_object() &&
        handoff_it->contains("targetAgent") && (*handoff_it)["targetAgent"].is_string()) {
        target = (*handoff_it)["targetAgent"].get<std::string>();
        reason.type = HandoffReasonType::PlannedTransition;
        reason.description = "Explicit handoff requested";
        reason.severity = HandoffSeverity::Moderate;
        auto reason_it = handoff_it->find("reason");
        if (reason_it != handoff_it->end() && reason_it->is_object()) {
            if (auto t = parse_handoff_reason_type(reason_it->value("type", std::string{}))) reason.type = *t;
            if (auto s = parse_handoff_severity(reason_it->value("severity", std::string{}))) reason.severity = *s;
            reason.description = reason_it->value("description", reason.description);
        }
    } else {
        const auto text = lowercase(ctx.task);
        for (const auto& k : kKeywordDirectives) {
            if (text.find(k.phrase) != std::string::npos) {
                target = k.target_type;
                reason.type = HandoffReasonType::CapabilityMismatch;
                reason.description = k.description;
                reason.severity = HandoffSeverity::Moderate;
                break;
            }
        }
    }
    if (target.empty()) return std::nullopt;

    const auto wanted = normalize_type(target);
    const auto current_type = normalize_type(current.agent_type);
    if (target == current.agent_id || (!wanted.empty() && current_type.find(wanted) != std::string::npos)) {
        return std::nullopt;
    }

    // Exact agent id first, then any agent whose type names the target
    auto chosen = pick_target(task, current, [&](const AgentRegistration& reg) {
        return reg.agent_id == target;
    });
    if (!chosen && !wanted.empty()) {
        chosen = pick_target(task, current, [&](const AgentRegistration& reg) {
            const auto type = normalize_type(reg.agent_type);
            return type != current_type && type.find(wanted) != std::string::npos;
        });
    }
    if (!chosen) {
        report_failure(task.task_id, current.agent_id, "no available agent for explicit target '" + target + "'");
        return std::nullopt;
    }
    logger_->info("Task " + task.task_id + ": explicit handoff to " + *chosen + " (" + reason.description + ")");
    return HandoffPlan{*chosen, reason, {}};
}

std::optional<std::string> HandoffEngine::pick_target(const TaskRecord& task, const AgentRegistration& current,
                                                      const std::function<bool(const AgentRegistration&)>& accept) const {
    std::vector<SelectionCandidate> filtered;
    for (auto& c : registry_->available_candidates({current.agent_id})) {
        if (accept(c.registration)) filtered.push_back(std::move(c));
    }
    return selector_->select(filtered, task.required_capabilities);
}

bool HandoffEngine::handle_request(const HandoffRequest& request) {
    auto scheduler = scheduler_.lock();
    if (!scheduler) return false;

    auto task = scheduler->task(request.task_id);
    if (!task || task->status != TaskStatus::InProgress || task->assigned_agent != request.from_agent) {
        report_failure(request.task_id, request.from_agent, "task is not in progress on the requesting agent");
        return false;
    }

    const auto& required = request.required_capabilities.empty() ? task->required_capabilities
                                                                 : request.required_capabilities;
    std::vector<SelectionCandidate> filtered;
    for (auto& c : registry_->available_candidates({request.from_agent})) {
        std::set<std::string> caps;
        try {
            caps = c.agent ? c.agent->list_capabilities() : std::set<std::string>{};
        } catch (const std::exception& e) {
            logger_->warning("Skipping agent " + c.registration.agent_id + ": " + e.what());
            continue;
        }
        if (required.empty() || AgentSelector::capability_score(caps, required) > 0.0) {
            filtered.push_back(std::move(c));
        }
    }
    auto chosen = selector_->select(filtered, required);
    if (!chosen) {
        report_failure(request.task_id, request.from_agent, "no available agent offers the requested capabilities");
        return false;
    }

    HandoffReason reason = request.reason;
    reason.severity = severity_for(request.urgency);
    if (reason.description.empty()) reason.description = "Handoff requested by " + request.from_agent;

    TransferRequest transfer{request.task_id, request.from_agent, *chosen, reason, std::nullopt, request.context};
    if (!scheduler->transfer(transfer)) {
        report_failure(request.task_id, request.from_agent, "transfer to " + *chosen + " was rejected");
        return false;
    }
    return true;
}

HandoffStats HandoffEngine::stats() const {
    HandoffStats s;
    auto scheduler = scheduler_.lock();
    if (!scheduler) return s;
    double duration_sum = 0.0;
    for (const auto& task : scheduler->all_tasks()) {
        for (const auto& ev : task.handoff_history) {
            s.total++;
            s.by_reason[to_string(ev.reason.type)]++;
            if (!ev.settled) continue;
            s.settled++;
            if (ev.success) s.successful++;
            duration_sum += static_cast<double>(ev.duration_ms);
        }
    }
    if (s.settled > 0) {
        s.success_rate = static_cast<double>(s.successful) / static_cast<double>(s.settled);
        s.average_duration_ms = duration_sum / static_cast<double>(s.settled);
    }
    return s;
}

void HandoffEngine::report_failure(const std::string& task_id, const std::string& from_agent, const std::string& why) {
    logger_->warning("Handoff for task " + task_id + " not performed: " + why);
    events_->publish(HandoffFailed{task_id, from_agent, why});
}

} // namespace TaskRelay
