#include "WorkloadGenerator.hpp"

#include <utility>

using namespace TaskRelay;

DefaultWorkloadGenerator::DefaultWorkloadGenerator(std::vector<WorkloadTemplate> templates)
    : templates_(templates.empty() ? builtin_templates() : std::move(templates)) {}

std::vector<WorkloadTemplate> DefaultWorkloadGenerator::builtin_templates() {
    return {
        {"Implement the login form validation", {"javascript-coding"}, TaskPriority::High, nlohmann::json::object()},
        {"Outline the architecture for the billing service", {"architecture"}, TaskPriority::Medium,
         nlohmann::json::object()},
        {"Refactor the legacy report module", {"python-coding"}, TaskPriority::Medium, nlohmann::json::object()},
        {"Write unit tests for the cart service", {"unit-testing"}, TaskPriority::Medium, nlohmann::json::object()},
        {"Deploy the staging environment", {"deploy"}, TaskPriority::Critical, {{"requiresExecution", true}}},
        {"Draft the sprint plan for the next milestone", {"planning"}, TaskPriority::Low, nlohmann::json::object()},
        {"Summarize customer feedback", {}, TaskPriority::Low, nlohmann::json::object()},
    };
}

std::vector<GeneratedTask> DefaultWorkloadGenerator::make_tasks(uint32_t count) {
    std::vector<GeneratedTask> out;
    if (stopped_.load() || count == 0) {
        return out;
    }

    out.reserve(count);
    for (uint32_t i = 0; i < count && !stopped_.load(); ++i) {
        const uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed);
        const auto& tpl = templates_[n % templates_.size()];

        GeneratedTask task;
        task.required_capabilities = tpl.capabilities;
        task.priority = tpl.priority;
        task.context.session_id = "session-" + std::to_string(n + 1);
        task.context.user_id = "demo-user";
        task.context.task = tpl.task;
        task.context.metadata = tpl.metadata;
        task.context.timestamp_ms = to_epoch_ms(Clock::now());
        task.context.conversation.push_back({"user", tpl.task, task.context.timestamp_ms});
        out.push_back(std::move(task));
    }
    return out;
}

std::vector<std::string> DefaultWorkloadGenerator::submit_tasks(Coordinator& coordinator, uint32_t count) {
    std::vector<std::string> ids;
    for (auto& task : make_tasks(count)) {
        ids.push_back(coordinator.submit_task(std::move(task.required_capabilities), std::move(task.context),
                                              task.priority));
    }
    return ids;
}

void DefaultWorkloadGenerator::stop() {
    stopped_.store(true);
}
