#include "message/TaskContext.hpp"

/**
 * \file message/TaskContext.cpp
 * \brief JSON encoding and handoff transfer for task contexts.
 * \ingroup message_module
 */

namespace TaskRelay {

void to_json(nlohmann::json& j, const ConversationEntry& entry) {
    j = nlohmann::json{{"role", entry.role}, {"content", entry.content}, {"timestamp", entry.timestamp_ms}};
}

void from_json(const nlohmann::json& j, ConversationEntry& entry) {
    entry.role = j.value("role", std::string{});
    entry.content = j.value("content", std::string{});
    entry.timestamp_ms = j.value("timestamp", int64_t{0});
}

void to_json(nlohmann::json& j, const TaskContext& context) {
    j = nlohmann::json{
        {"taskId", context.task_id},
        {"sessionId", context.session_id},
        {"userId", context.user_id},
        {"task", context.task},
        {"conversation", context.conversation},
        {"metadata", context.metadata},
        {"timestamp", context.timestamp_ms}
    };
}

void from_json(const nlohmann::json& j, TaskContext& context) {
    context.task_id = j.value("taskId", std::string{});
    context.session_id = j.value("sessionId", std::string{});
    context.user_id = j.value("userId", std::string{});
    context.task = j.value("task", std::string{});
    context.conversation.clear();
    if (j.contains("conversation")) {
        context.conversation = j.at("conversation").get<std::vector<ConversationEntry>>();
    }
    context.metadata = j.value("metadata", nlohmann::json::object());
    context.timestamp_ms = j.value("timestamp", int64_t{0});
}

std::size_t serialized_size(const TaskContext& context) {
    // Payload text is opaque and need not be valid UTF-8
    return nlohmann::json(context).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size();
}

TaskContext make_transfer_context(const TaskContext& base,
                                  const std::string& from_agent,
                                  const HandoffReason& reason,
                                  const std::optional<nlohmann::json>& partial_result,
                                  TimePoint now,
                                  std::size_t history_limit) {
    TaskContext out = base;
    if (out.conversation.size() > history_limit) {
        out.conversation.erase(out.conversation.begin(),
                               out.conversation.end() - static_cast<std::ptrdiff_t>(history_limit));
    }
    if (!out.metadata.is_object()) {
        out.metadata = nlohmann::json::object();
    }

    nlohmann::json handoff = {
        {"fromAgent", from_agent},
        {"reason", reason},
        {"transferTimestamp", to_epoch_ms(now)}
    };
    if (partial_result) {
        handoff["partialResult"] = *partial_result;
    }
    out.metadata["handoff"] = std::move(handoff);
    out.timestamp_ms = to_epoch_ms(now);
    return out;
}

} // namespace TaskRelay
