// TaskContext.hpp - Payload handed to agents with every execution
#pragma once

#include "message/HandoffEvent.hpp"
#include "message/Timestamp.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * \defgroup message_module Task Message Module
 * \brief Task records, contexts and the priority queue shared by the scheduler and handoff engine.
 */

/**
 * \file message/TaskContext.hpp
 * \brief Execution context and its handoff transfer form.
 * \ingroup message_module
 */

namespace TaskRelay {

struct ConversationEntry {
    std::string role;
    std::string content;
    int64_t timestamp_ms{0};
};

/**
 * \brief Opaque unit-of-work payload.
 * \ingroup message_module
 *
 * Owned by the task while queued and shared read-only with the executing agent
 * (`std::shared_ptr<const TaskContext>`). A handoff replaces the shared context
 * with a transfer copy instead of mutating it.
 */
struct TaskContext {
    std::string task_id;
    std::string session_id;
    std::string user_id;
    std::string task;                          ///< Free-text description of the work
    std::vector<ConversationEntry> conversation;
    nlohmann::json metadata = nlohmann::json::object();
    int64_t timestamp_ms{0};
};

/// Conversation entries carried over to the receiving agent of a handoff.
constexpr std::size_t kTransferHistoryLimit = 10;

void to_json(nlohmann::json& j, const ConversationEntry& entry);
void from_json(const nlohmann::json& j, ConversationEntry& entry);
void to_json(nlohmann::json& j, const TaskContext& context);
void from_json(const nlohmann::json& j, TaskContext& context);

/// Byte length of the JSON encoding; recorded as the handoff context size.
std::size_t serialized_size(const TaskContext& context);

/**
 * \brief Build the context passed to the receiving agent of a handoff.
 * \param base Context the sending agent was working on.
 * \param from_agent Sending agent id.
 * \param reason Why the task is moving.
 * \param partial_result Output of the sending agent, if any.
 * \param now Transfer time.
 * \param history_limit Number of most recent conversation entries to keep.
 * \return Copy of \p base with a truncated conversation and `metadata.handoff`
 *         set to {fromAgent, reason, transferTimestamp, partialResult}.
 */
TaskContext make_transfer_context(const TaskContext& base,
                                  const std::string& from_agent,
                                  const HandoffReason& reason,
                                  const std::optional<nlohmann::json>& partial_result,
                                  TimePoint now,
                                  std::size_t history_limit = kTransferHistoryLimit);

} // namespace TaskRelay
