// HandoffEvent.hpp - Handoff reasons and the per-task handoff history entry
#pragma once

#include "message/Timestamp.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

/**
 * \file message/HandoffEvent.hpp
 * \brief Types describing why and how a task moved between agents.
 * \ingroup message_module
 */

namespace TaskRelay {

enum class HandoffReasonType {
    CapabilityMismatch,
    Overload,
    ExpertiseRequired,
    Failure,
    Optimization,
    PlannedTransition
};

enum class HandoffSeverity { Minor, Moderate, Major, Critical };

struct HandoffReason {
    HandoffReasonType type{HandoffReasonType::PlannedTransition};
    std::string description;
    HandoffSeverity severity{HandoffSeverity::Moderate};
};

/**
 * \brief One transfer of a task between agents.
 * \ingroup message_module
 *
 * Appended with `success=false, settled=false` when the transfer is made;
 * settled once the receiving agent's leg completes (or the task is requeued).
 */
struct HandoffEvent {
    std::string from_agent;
    std::string to_agent;
    HandoffReason reason;
    TimePoint timestamp{};
    bool success{false};
    bool settled{false};
    int64_t duration_ms{0};          ///< Transfer to settlement
    std::size_t context_size_bytes{0}; ///< Serialized size of the transferred context
};

std::string to_string(HandoffReasonType type);
std::string to_string(HandoffSeverity severity);
std::optional<HandoffReasonType> parse_handoff_reason_type(const std::string& name);
std::optional<HandoffSeverity> parse_handoff_severity(const std::string& name);

void to_json(nlohmann::json& j, const HandoffReason& reason);
void to_json(nlohmann::json& j, const HandoffEvent& event);

} // namespace TaskRelay
