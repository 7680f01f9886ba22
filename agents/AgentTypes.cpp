#include "agents/AgentTypes.hpp"

namespace TaskRelay {

std::string to_string(Availability availability) {
    switch (availability) {
        case Availability::Available: return "available";
        case Availability::Busy:      return "busy";
        case Availability::Offline:   return "offline";
    }
    return "unknown";
}

std::string to_string(AgentStatusSignal signal) {
    switch (signal) {
        case AgentStatusSignal::Idle:      return "idle";
        case AgentStatusSignal::Busy:      return "busy";
        case AgentStatusSignal::Failed:    return "failed";
        case AgentStatusSignal::Completed: return "completed";
    }
    return "unknown";
}

std::string to_string(HandoffUrgency urgency) {
    switch (urgency) {
        case HandoffUrgency::Low:      return "low";
        case HandoffUrgency::Medium:   return "medium";
        case HandoffUrgency::High:     return "high";
        case HandoffUrgency::Critical: return "critical";
    }
    return "unknown";
}

std::optional<HandoffUrgency> parse_handoff_urgency(const std::string& name) {
    for (auto u : {HandoffUrgency::Low, HandoffUrgency::Medium, HandoffUrgency::High, HandoffUrgency::Critical}) {
        if (to_string(u) == name) return u;
    }
    return std::nullopt;
}

HandoffSeverity severity_for(HandoffUrgency urgency) {
    switch (urgency) {
        case HandoffUrgency::Low:      return HandoffSeverity::Minor;
        case HandoffUrgency::Medium:   return HandoffSeverity::Moderate;
        case HandoffUrgency::High:     return HandoffSeverity::Major;
        case HandoffUrgency::Critical: return HandoffSeverity::Critical;
    }
    return HandoffSeverity::Moderate;
}

void to_json(nlohmann::json& j, const AgentResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"agentId", result.agent_id},
        {"timestamp", to_epoch_ms(result.timestamp)},
        {"output", result.output},
        {"metadata", result.metadata}
    };
    if (result.error) j["error"] = *result.error;
}

} // namespace TaskRelay
