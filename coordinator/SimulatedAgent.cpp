#include "SimulatedAgent.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

using namespace TaskRelay;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

SimulatedAgent::SimulatedAgent(SimulatedAgentSpec spec, std::shared_ptr<Logger> logger)
    : AgentBase(spec.id, spec.type, spec.capabilities),
      spec_(std::move(spec)),
      logger_(std::move(logger)),
      rng_(std::random_device{}()) {}

std::future<AgentResult> SimulatedAgent::execute(std::shared_ptr<const TaskContext> context) {
    return std::async(std::launch::async, [this, context = std::move(context)] { return run(context); });
}

bool SimulatedAgent::roll_failure() {
    if (spec_.failure_rate <= 0.0) return false;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::bernoulli_distribution dist(spec_.failure_rate);
    return dist(rng_);
}

bool SimulatedAgent::wants_handoff(const TaskContext& context) const {
    if (spec_.handoff_keyword.empty()) return false;
    // A context that already carries handoff metadata came from another agent
    if (context.metadata.is_object() && context.metadata.contains("handoff")) return false;
    return lowercase(context.task).find(lowercase(spec_.handoff_keyword)) != std::string::npos;
}

AgentResult SimulatedAgent::run(std::shared_ptr<const TaskContext> context) {
    emit_status(AgentStatusSignal::Busy);
    std::this_thread::sleep_for(std::chrono::milliseconds(spec_.latency_ms / 2));

    if (wants_handoff(*context)) {
        HandoffRequest request;
        request.task_id = context->task_id;
        request.from_agent = id();
        request.reason = {HandoffReasonType::ExpertiseRequired,
                          "'" + spec_.handoff_keyword + "' work needs a specialist", HandoffSeverity::Moderate};
        request.required_capabilities = spec_.handoff_capabilities;
        request.urgency = HandoffUrgency::Medium;
        logger_->info("[" + id() + "] requesting handoff of " + context->task_id);
        if (!request_handoff(request)) {
            logger_->info("[" + id() + "] handoff of " + context->task_id + " declined, finishing it here");
        }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(spec_.latency_ms - spec_.latency_ms / 2));

    if (roll_failure()) {
        emit_status(AgentStatusSignal::Failed);
        return AgentResult::failure(id(), "simulated failure on " + context->task_id);
    }

    AgentResult result;
    result.success = true;
    result.agent_id = id();
    result.timestamp = Clock::now();
    result.output = {{"summary", type() + " agent " + id() + " processed: " + context->task},
                     {"conversationEntries", context->conversation.size()}};
    if (lowercase(type()).find("coding") != std::string::npos) {
        result.metadata["implementationComplete"] = true;
    }
    emit_status(AgentStatusSignal::Completed);
    return result;
}
