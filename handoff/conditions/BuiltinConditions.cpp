/**
 * @file handoff/conditions/BuiltinConditions.cpp
 * @brief Default keyword and metadata heuristics for handoff triggers.
 *
 * All builtins return 1.0 when they hold and 0.0 otherwise. Text heuristics
 * search the context's task description case-insensitively.
 */
#include "handoff/ConditionRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace TaskRelay {

namespace {

double flag(bool b) { return b ? 1.0 : 0.0; }

bool task_matches(const ConditionInput& in, const std::regex& re) {
    return std::regex_search(in.context.task, re);
}

bool metadata_flag(const TaskContext& ctx, const char* key) {
    if (!ctx.metadata.is_object()) return false;
    auto it = ctx.metadata.find(key);
    return it != ctx.metadata.end() && it->is_boolean() && it->get<bool>();
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double implementation_complete(const ConditionInput& in) {
    if (!in.partial_result) return 0.0;
    const auto& meta = in.partial_result->metadata;
    if (meta.is_object()) {
        auto it = meta.find("implementationComplete");
        if (it != meta.end() && it->is_boolean()) return flag(it->get<bool>());
    }
    return flag(in.partial_result->success);
}

double implementation_required(const ConditionInput& in) {
    static const std::regex re(R"(implement|write code|coding|refactor|bug ?fix)", std::regex::icase);
    return flag(task_matches(in, re));
}

// A required capability that the current agent does not declare
double capability_required(const ConditionInput& in) {
    for (const auto& req : in.required_capabilities) {
        const auto needle = lowercase(req);
        bool covered = std::any_of(in.agent_capabilities.begin(), in.agent_capabilities.end(),
                                   [&](const std::string& cap) {
                                       return lowercase(cap).find(needle) != std::string::npos;
                                   });
        if (!covered) return 1.0;
    }
    return 0.0;
}

double test_required(const ConditionInput& in) {
    static const std::regex re(R"(test|testing|spec|coverage)", std::regex::icase);
    return flag(task_matches(in, re));
}

double tool_required(const ConditionInput& in) {
    static const std::regex re(R"(run|execute|command|build|deploy|npm|git)", std::regex::icase);
    return flag(task_matches(in, re));
}

double command_execution(const ConditionInput& in) {
    return flag(metadata_flag(in.context, "requiresExecution"));
}

double planning_required(const ConditionInput& in) {
    static const std::regex re(R"(plan|planning|roadmap|milestone|schedule)", std::regex::icase);
    return flag(task_matches(in, re));
}

double project_plan(const ConditionInput& in) {
    static const std::regex re(R"(project plan|sprint plan|release plan)", std::regex::icase);
    return flag(task_matches(in, re));
}

} // namespace

void register_builtin_conditions(ConditionRegistry& registry) {
    registry.register_condition("implementation_complete",
        {implementation_complete, HandoffReasonType::PlannedTransition, HandoffSeverity::Minor});
    registry.register_condition("implementation_required",
        {implementation_required, HandoffReasonType::ExpertiseRequired, HandoffSeverity::Moderate});
    registry.register_condition("capability_required",
        {capability_required, HandoffReasonType::CapabilityMismatch, HandoffSeverity::Moderate});
    registry.register_condition("test_required",
        {test_required, HandoffReasonType::CapabilityMismatch, HandoffSeverity::Moderate});
    registry.register_condition("tool_required",
        {tool_required, HandoffReasonType::CapabilityMismatch, HandoffSeverity::Moderate});
    registry.register_condition("command_execution",
        {command_execution, HandoffReasonType::CapabilityMismatch, HandoffSeverity::Major});
    registry.register_condition("planning_required",
        {planning_required, HandoffReasonType::CapabilityMismatch, HandoffSeverity::Moderate});
    registry.register_condition("project_plan",
        {project_plan, HandoffReasonType::CapabilityMismatch, HandoffSeverity::Moderate});
}

} // namespace TaskRelay
