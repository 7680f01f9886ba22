#include "message/HandoffEvent.hpp"

/**
 * \file message/HandoffEvent.cpp
 * \brief Name mapping and JSON encoding for handoff types.
 * \ingroup message_module
 */

namespace TaskRelay {

std::string to_string(HandoffReasonType type) {
    switch (type) {
        case HandoffReasonType::CapabilityMismatch: return "capability_mismatch";
        case HandoffReasonType::Overload:           return "overload";
        case HandoffReasonType::ExpertiseRequired:  return "expertise_required";
        case HandoffReasonType::Failure:            return "failure";
        case HandoffReasonType::Optimization:       return "optimization";
        case HandoffReasonType::PlannedTransition:  return "planned_transition";
    }
    return "unknown";
}

std::string to_string(HandoffSeverity severity) {
    switch (severity) {
        case HandoffSeverity::Minor:    return "minor";
        case HandoffSeverity::Moderate: return "moderate";
        case HandoffSeverity::Major:    return "major";
        case HandoffSeverity::Critical: return "critical";
    }
    return "unknown";
}

std::optional<HandoffReasonType> parse_handoff_reason_type(const std::string& name) {
    for (auto t : {HandoffReasonType::CapabilityMismatch, HandoffReasonType::Overload,
                   HandoffReasonType::ExpertiseRequired, HandoffReasonType::Failure,
                   HandoffReasonType::Optimization, HandoffReasonType::PlannedTransition}) {
        if (to_string(t) == name) return t;
    }
    return std::nullopt;
}

std::optional<HandoffSeverity> parse_handoff_severity(const std::string& name) {
    for (auto s : {HandoffSeverity::Minor, HandoffSeverity::Moderate,
                   HandoffSeverity::Major, HandoffSeverity::Critical}) {
        if (to_string(s) == name) return s;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const HandoffReason& reason) {
    j = nlohmann::json{
        {"type", to_string(reason.type)},
        {"description", reason.description},
        {"severity", to_string(reason.severity)}
    };
}

void to_json(nlohmann::json& j, const HandoffEvent& event) {
    j = nlohmann::json{
        {"fromAgent", event.from_agent},
        {"toAgent", event.to_agent},
        {"reason", event.reason},
        {"timestamp", to_epoch_ms(event.timestamp)},
        {"success", event.success},
        {"settled", event.settled},
        {"durationMs", event.duration_ms},
        {"contextSizeBytes", event.context_size_bytes}
    };
}

} // namespace TaskRelay
