#include "message/TaskContext.hpp"

#include <gtest/gtest.h>

using namespace TaskRelay;

namespace {

TaskContext make_context(size_t entries) {
    TaskContext ctx;
    ctx.task_id = "task-7";
    ctx.session_id = "session-1";
    ctx.user_id = "user-1";
    ctx.task = "Summarize the meeting notes";
    ctx.metadata = {{"origin", "unit"}};
    for (size_t i = 0; i < entries; ++i) {
        ctx.conversation.push_back({i % 2 ? "assistant" : "user", "message " + std::to_string(i),
                                    static_cast<int64_t>(i)});
    }
    return ctx;
}

} // namespace

TEST(TaskContextTest, JsonUsesCamelCaseKeys) {
    nlohmann::json j = make_context(1);
    EXPECT_EQ(j["taskId"], "task-7");
    EXPECT_EQ(j["sessionId"], "session-1");
    EXPECT_EQ(j["userId"], "user-1");
    ASSERT_EQ(j["conversation"].size(), 1u);
    EXPECT_EQ(j["conversation"][0]["role"], "user");

    auto back = j.get<TaskContext>();
    EXPECT_EQ(back.task, "Summarize the meeting notes");
    EXPECT_EQ(back.metadata["origin"], "unit");
}

TEST(TaskContextTest, TransferKeepsLastEntriesAndAddsHandoffMetadata) {
    const auto base = make_context(25);
    const auto now = Clock::now();
    HandoffReason reason{HandoffReasonType::ExpertiseRequired, "needs a specialist", HandoffSeverity::Major};

    auto out = make_transfer_context(base, "agent-a", reason, nlohmann::json{{"draft", "v1"}}, now);

    ASSERT_EQ(out.conversation.size(), kTransferHistoryLimit);
    EXPECT_EQ(out.conversation.front().content, "message 15");
    EXPECT_EQ(out.conversation.back().content, "message 24");

    const auto& handoff = out.metadata["handoff"];
    EXPECT_EQ(handoff["fromAgent"], "agent-a");
    EXPECT_EQ(handoff["reason"]["type"], "expertise_required");
    EXPECT_EQ(handoff["reason"]["severity"], "major");
    EXPECT_EQ(handoff["transferTimestamp"], to_epoch_ms(now));
    EXPECT_EQ(handoff["partialResult"]["draft"], "v1");
    // Existing metadata survives
    EXPECT_EQ(out.metadata["origin"], "unit");
    // The source is untouched
    EXPECT_EQ(base.conversation.size(), 25u);
}

TEST(TaskContextTest, ShortHistoryIsKeptWhole) {
    auto out = make_transfer_context(make_context(3), "a", HandoffReason{}, std::nullopt, Clock::now(), 10);
    EXPECT_EQ(out.conversation.size(), 3u);
    EXPECT_FALSE(out.metadata["handoff"].contains("partialResult"));
}

TEST(TaskContextTest, SerializedSizeMatchesJsonLength) {
    const auto ctx = make_context(4);
    EXPECT_EQ(serialized_size(ctx), nlohmann::json(ctx).dump().size());
    EXPECT_GT(serialized_size(make_context(8)), serialized_size(ctx));
}

TEST(TaskContextTest, SerializedSizeAcceptsInvalidUtf8) {
    auto ctx = make_context(1);
    ctx.task = "Draft notes caf\xe9";
    size_t size = 0;
    EXPECT_NO_THROW(size = serialized_size(ctx));
    // The stray byte is counted as one U+FFFD replacement character
    auto valid = ctx;
    valid.task = "Draft notes caf\xef\xbf\xbd";
    EXPECT_EQ(size, serialized_size(valid));
}
