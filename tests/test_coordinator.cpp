#include "coordination/Coordinator.hpp"
#include "support/MockAgent.hpp"
#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace TaskRelay;
using namespace TaskRelay::test_support;
using Mode = MockAgent::Mode;

namespace {

CoordinatorConfig quiet_config() {
    CoordinatorConfig config;
    config.install_default_rules = false;
    config.scheduler.assignment_interval = std::chrono::milliseconds(20);
    config.health.inactivity_threshold = std::chrono::milliseconds(1000);
    return config;
}

TaskContext context_for(const std::string& text) {
    TaskContext ctx;
    ctx.session_id = "session-1";
    ctx.user_id = "user-1";
    ctx.task = text;
    return ctx;
}

} // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override { create(quiet_config()); }

    void create(CoordinatorConfig config) {
        coordinator_.reset();
        coordinator_ = std::make_unique<Coordinator>(make_test_logger(&sink_), std::move(config));
        coordinator_->subscribe([this](const CoordinatorEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(e);
        });
    }

    std::shared_ptr<MockAgent> add_agent(const std::string& id, const std::string& type,
                                         std::set<std::string> caps, Mode mode = Mode::Manual) {
        auto agent = std::make_shared<MockAgent>(id, type, std::move(caps), mode);
        coordinator_->register_agent(agent);
        return agent;
    }

    TaskRecord status(const std::string& task_id) {
        auto rec = coordinator_->get_task_status(task_id);
        EXPECT_TRUE(rec.has_value()) << task_id;
        return rec.value_or(TaskRecord{});
    }

    bool wait_for_status(const std::string& task_id, TaskStatus expected) {
        return wait_until([&] {
            auto rec = coordinator_->get_task_status(task_id);
            return rec && rec->status == expected;
        });
    }

    Availability availability(const std::string& agent_id) {
        auto reg = coordinator_->get_agent_status(agent_id);
        EXPECT_TRUE(reg.has_value()) << agent_id;
        return reg ? reg->availability : Availability::Offline;
    }

    size_t count(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                                 [&](const CoordinatorEvent& e) { return event_name(e) == name; }));
    }

    template <typename T>
    std::vector<T> events_of() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& e : events_) {
            if (auto* p = std::get_if<T>(&e)) out.push_back(*p);
        }
        return out;
    }

    std::shared_ptr<VectorSink> sink_;
    std::unique_ptr<Coordinator> coordinator_;
    std::mutex mutex_;
    std::vector<CoordinatorEvent> events_;
};

TEST_F(CoordinatorTest, MatchingAgentReceivesAndCompletesTask) {
    auto w1 = add_agent("w1", "General", {"coding", "javascript"});
    const auto id = coordinator_->submit_task({"coding", "javascript"}, context_for("Add a login form"));

    EXPECT_EQ(coordinator_->tick(), 1u);
    auto rec = status(id);
    EXPECT_EQ(rec.status, TaskStatus::InProgress);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "w1");
    EXPECT_EQ(rec.attempts, 1u);
    EXPECT_EQ(availability("w1"), Availability::Busy);
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    EXPECT_EQ(w1->last_context()->task_id, id);

    ASSERT_TRUE(w1->succeed_next({{"summary", "done"}}));
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));

    rec = status(id);
    ASSERT_TRUE(rec.result.has_value());
    EXPECT_TRUE(rec.result->success);
    EXPECT_EQ(rec.result->agent_id, "w1");
    EXPECT_EQ(rec.result->output["summary"], "done");
    EXPECT_TRUE(wait_until([&] { return count("task-completed") == 1; }));
    EXPECT_EQ(availability("w1"), Availability::Available);
    EXPECT_EQ(coordinator_->get_agent_status("w1")->performance.tasks_completed, 1u);
}

TEST_F(CoordinatorTest, BestCapabilityMatchWins) {
    add_agent("w1", "General", {"coding"});
    add_agent("w2", "General", {"planning"});
    const auto id = coordinator_->submit_task({"planning"}, context_for("Outline the quarter"));

    coordinator_->tick();
    EXPECT_EQ(status(id).assigned_agent.value_or(""), "w2");
    EXPECT_EQ(availability("w1"), Availability::Available);
}

TEST_F(CoordinatorTest, BusyAgentLeavesTaskPending) {
    add_agent("w1", "General", {"coding"});
    ASSERT_TRUE(coordinator_->update_agent_availability("w1", Availability::Busy));
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"));

    EXPECT_EQ(coordinator_->tick(), 0u);
    auto rec = status(id);
    EXPECT_EQ(rec.status, TaskStatus::Pending);
    EXPECT_FALSE(rec.assigned_agent.has_value());
    auto queue = coordinator_->get_queue_status();
    EXPECT_EQ(queue.queued, 1u);
    EXPECT_EQ(queue.pending, 1u);
}

TEST_F(CoordinatorTest, FailedHighPriorityTaskIsRetried) {
    auto w1 = add_agent("w1", "General", {"coding"});
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"), TaskPriority::High);

    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    ASSERT_TRUE(w1->fail_next("compiler crashed"));
    ASSERT_TRUE(wait_until([&] { return coordinator_->get_queue_status().queued == 1; }));

    auto rec = status(id);
    EXPECT_EQ(rec.status, TaskStatus::Pending);
    EXPECT_FALSE(rec.assigned_agent.has_value());
    EXPECT_EQ(rec.last_error.value_or(""), "compiler crashed");
    EXPECT_EQ(coordinator_->get_queue_status().queued_task_ids.front(), id);
    auto failed = events_of<TaskFailed>();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_TRUE(failed[0].will_retry);

    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    ASSERT_TRUE(w1->succeed_next());
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));

    rec = status(id);
    EXPECT_EQ(rec.attempts, 2u);
    EXPECT_TRUE(rec.handoff_history.empty());
    EXPECT_DOUBLE_EQ(coordinator_->get_agent_status("w1")->performance.success_rate, 0.5);
}

TEST_F(CoordinatorTest, EmptyRequirementsAcceptAnyAgent) {
    add_agent("w1", "General", {"writing"});
    const auto id = coordinator_->submit_task({}, context_for("Say hello"));

    coordinator_->tick();
    EXPECT_EQ(status(id).assigned_agent.value_or(""), "w1");
}

TEST_F(CoordinatorTest, HigherPriorityTasksAreAssignedFirst) {
    const auto low = coordinator_->submit_task({"coding"}, context_for("low"), TaskPriority::Low);
    const auto medium = coordinator_->submit_task({"coding"}, context_for("medium"), TaskPriority::Medium);
    const auto critical = coordinator_->submit_task({"coding"}, context_for("critical"), TaskPriority::Critical);
    EXPECT_EQ(coordinator_->get_queue_status().queued_task_ids, (std::vector<std::string>{critical, medium, low}));

    auto w1 = add_agent("w1", "General", {"coding"});
    coordinator_->tick();
    EXPECT_EQ(status(critical).status, TaskStatus::InProgress);
    EXPECT_EQ(status(medium).status, TaskStatus::Pending);

    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    w1->succeed_next();
    ASSERT_TRUE(wait_for_status(critical, TaskStatus::Completed));
    ASSERT_TRUE(wait_until([&] { return availability("w1") == Availability::Available; }));
    coordinator_->tick();
    EXPECT_EQ(status(medium).status, TaskStatus::InProgress);
    EXPECT_EQ(status(low).status, TaskStatus::Pending);
}

TEST_F(CoordinatorTest, LowPriorityFailureIsFinal) {
    auto w1 = add_agent("w1", "General", {"coding"});
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"), TaskPriority::Low);

    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    w1->fail_next();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Failed));

    auto rec = status(id);
    ASSERT_TRUE(rec.result.has_value());
    EXPECT_FALSE(rec.result->success);
    EXPECT_EQ(rec.result->error.value_or(""), "mock failure");
    EXPECT_TRUE(coordinator_->get_queue_status().queued_task_ids.empty());
    EXPECT_TRUE(wait_until([&] { return availability("w1") == Availability::Available; }));
}

TEST_F(CoordinatorTest, MaxRetriesCapsAttempts) {
    auto config = quiet_config();
    config.scheduler.max_retries = 1;
    create(config);
    add_agent("w1", "General", {"coding"}, Mode::Fail);
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"), TaskPriority::Critical);

    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return coordinator_->get_queue_status().queued == 1; }));
    EXPECT_EQ(status(id).attempts, 1u);
    coordinator_->tick();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Failed));
    EXPECT_EQ(status(id).attempts, 2u);
}

TEST_F(CoordinatorTest, ThrowingExecuteFailsTheAttempt) {
    add_agent("w1", "General", {"coding"}, Mode::Throw);
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"), TaskPriority::Low);

    coordinator_->tick();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Failed));
    auto rec = status(id);
    EXPECT_NE(rec.result->error.value_or("").find("execute threw"), std::string::npos);
    EXPECT_EQ(availability("w1"), Availability::Available);
}

TEST_F(CoordinatorTest, BrokenPromiseFailsTheAttempt) {
    auto w1 = add_agent("w1", "General", {"coding"});
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"), TaskPriority::Low);

    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    ASSERT_TRUE(w1->break_next());
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Failed));
    EXPECT_FALSE(status(id).result->success);
}

TEST_F(CoordinatorTest, UnregisterRequeuesToFrontAndIgnoresLateResult) {
    auto w1 = add_agent("w1", "General", {"coding"});
    add_agent("w2", "General", {"coding"});
    ASSERT_TRUE(coordinator_->update_agent_availability("w2", Availability::Busy));
    const auto first = coordinator_->submit_task({"coding"}, context_for("first"));
    coordinator_->tick();
    EXPECT_EQ(status(first).assigned_agent.value_or(""), "w1");
    const auto second = coordinator_->submit_task({"coding"}, context_for("second"), TaskPriority::Critical);

    ASSERT_TRUE(coordinator_->unregister_agent("w1"));
    EXPECT_FALSE(coordinator_->unregister_agent("w1"));
    EXPECT_FALSE(coordinator_->get_agent_status("w1").has_value());

    auto rec = status(first);
    EXPECT_EQ(rec.status, TaskStatus::Pending);
    EXPECT_FALSE(rec.assigned_agent.has_value());
    // Requeued work goes ahead of everything already waiting
    EXPECT_EQ(coordinator_->get_queue_status().queued_task_ids, (std::vector<std::string>{first, second}));

    auto unregistered = events_of<AgentUnregistered>();
    ASSERT_EQ(unregistered.size(), 1u);
    EXPECT_EQ(unregistered[0].requeued_tasks, std::vector<std::string>{first});
    EXPECT_EQ(count("task-requeued"), 1u);

    ASSERT_TRUE(coordinator_->update_agent_availability("w2", Availability::Available));
    coordinator_->tick();
    EXPECT_EQ(status(first).assigned_agent.value_or(""), "w2");

    // w1 finishing its old execution must not touch the task
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    w1->succeed_next();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    rec = status(first);
    EXPECT_EQ(rec.status, TaskStatus::InProgress);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "w2");
    EXPECT_EQ(count("task-completed"), 0u);
    EXPECT_TRUE(sink_->contains("stale completion"));
}

TEST_F(CoordinatorTest, OfflineOverrideRequeuesInFlightTask) {
    add_agent("w1", "General", {"coding"});
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"));
    coordinator_->tick();

    ASSERT_TRUE(coordinator_->update_agent_availability("w1", Availability::Offline));
    EXPECT_EQ(availability("w1"), Availability::Offline);
    EXPECT_EQ(status(id).status, TaskStatus::Pending);

    EXPECT_EQ(coordinator_->tick(), 0u);
    EXPECT_FALSE(coordinator_->update_agent_availability("ghost", Availability::Offline));
}

TEST_F(CoordinatorTest, AvailableOverrideRefusedWhileHoldingTask) {
    add_agent("w1", "General", {"coding"});
    coordinator_->submit_task({"coding"}, context_for("Add a login form"));
    coordinator_->tick();

    EXPECT_FALSE(coordinator_->update_agent_availability("w1", Availability::Available));
    EXPECT_EQ(availability("w1"), Availability::Busy);
}

TEST_F(CoordinatorTest, HealthSweepTakesIdleAgentsOffline) {
    auto w1 = add_agent("w1", "General", {"coding"});
    add_agent("w2", "General", {"writing"});
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"));
    coordinator_->tick();

    EXPECT_TRUE(coordinator_->sweep_health(Clock::now()).empty());

    auto offline = coordinator_->sweep_health(Clock::now() + std::chrono::seconds(5));
    EXPECT_EQ(offline, (std::vector<std::string>{"w1", "w2"}));
    EXPECT_EQ(availability("w1"), Availability::Offline);
    EXPECT_EQ(status(id).status, TaskStatus::Pending);

    auto unresponsive = events_of<AgentUnresponsive>();
    ASSERT_EQ(unresponsive.size(), 2u);
    EXPECT_EQ(unresponsive[0].requeued_tasks, std::vector<std::string>{id});
    EXPECT_GE(unresponsive[0].idle_ms, 1000);

    // Any sign of life brings the agent back
    w1->signal(AgentStatusSignal::Idle);
    EXPECT_EQ(availability("w1"), Availability::Available);
    coordinator_->tick();
    EXPECT_EQ(status(id).assigned_agent.value_or(""), "w1");
}

TEST_F(CoordinatorTest, AgentRequestedHandoffMovesTask) {
    auto w1 = add_agent("w1", "General", {"writing"});
    auto w2 = add_agent("w2", "Review", {"review"});
    const auto id = coordinator_->submit_task({"writing"}, context_for("Draft release notes"));
    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));

    HandoffRequest request;
    request.task_id = id;
    request.from_agent = "w1";
    request.reason = {HandoffReasonType::ExpertiseRequired, "needs an editor", HandoffSeverity::Minor};
    request.required_capabilities = {"review"};
    request.urgency = HandoffUrgency::High;
    ASSERT_TRUE(w1->ask_handoff(request));

    auto rec = status(id);
    EXPECT_EQ(rec.status, TaskStatus::InProgress);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "w2");
    ASSERT_EQ(rec.handoff_history.size(), 1u);
    const auto& ev = rec.handoff_history[0];
    EXPECT_EQ(ev.from_agent, "w1");
    EXPECT_EQ(ev.to_agent, "w2");
    EXPECT_EQ(ev.reason.type, HandoffReasonType::ExpertiseRequired);
    EXPECT_EQ(ev.reason.severity, HandoffSeverity::Major);
    EXPECT_EQ(ev.reason.description, "needs an editor");
    EXPECT_FALSE(ev.settled);
    EXPECT_GT(ev.context_size_bytes, 0u);
    EXPECT_EQ(availability("w1"), Availability::Available);
    EXPECT_EQ(availability("w2"), Availability::Busy);

    ASSERT_TRUE(wait_until([&] { return w2->pending() == 1; }));
    auto received = w2->last_context();
    EXPECT_EQ(received->task_id, id);
    EXPECT_EQ(received->metadata["handoff"]["fromAgent"], "w1");

    // The first agent's abandoned execution is stale
    w1->succeed_next();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(status(id).status, TaskStatus::InProgress);

    w2->succeed_next();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));
    rec = status(id);
    EXPECT_EQ(rec.result->agent_id, "w2");
    ASSERT_TRUE(rec.handoff_history[0].settled);
    EXPECT_TRUE(rec.handoff_history[0].success);
    EXPECT_GE(rec.handoff_history[0].duration_ms, 0);

    auto stats = coordinator_->handoff_stats();
    EXPECT_EQ(stats.total, 1u);
    EXPECT_EQ(stats.settled, 1u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 1.0);
    EXPECT_EQ(stats.by_reason["expertise_required"], 1u);
    EXPECT_EQ(count("task-handoff"), 1u);
}

TEST_F(CoordinatorTest, HandoffRequestWithoutCapableAgentIsReported) {
    auto w1 = add_agent("w1", "General", {"writing"});
    const auto id = coordinator_->submit_task({"writing"}, context_for("Draft release notes"));
    coordinator_->tick();

    HandoffRequest request;
    request.task_id = id;
    request.from_agent = "w1";
    request.required_capabilities = {"review"};
    EXPECT_FALSE(w1->ask_handoff(request));

    auto rec = status(id);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "w1");
    EXPECT_TRUE(rec.handoff_history.empty());
    auto failed = events_of<HandoffFailed>();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].task_id, id);
    EXPECT_EQ(failed[0].from_agent, "w1");
}

TEST_F(CoordinatorTest, RequeueAfterHandoffSettlesItAsFailure) {
    auto w1 = add_agent("w1", "General", {"writing"});
    add_agent("w2", "Review", {"review"});
    const auto id = coordinator_->submit_task({"writing"}, context_for("Draft release notes"));
    coordinator_->tick();

    HandoffRequest request;
    request.task_id = id;
    request.from_agent = "w1";
    request.required_capabilities = {"review"};
    ASSERT_TRUE(w1->ask_handoff(request));
    ASSERT_EQ(status(id).assigned_agent.value_or(""), "w2");
    EXPECT_EQ(status(id).handoff_history[0].reason.description, "Handoff requested by w1");

    ASSERT_TRUE(coordinator_->unregister_agent("w2"));
    auto rec = status(id);
    EXPECT_EQ(rec.status, TaskStatus::Pending);
    ASSERT_EQ(rec.handoff_history.size(), 1u);
    EXPECT_TRUE(rec.handoff_history[0].settled);
    EXPECT_FALSE(rec.handoff_history[0].success);
    EXPECT_DOUBLE_EQ(coordinator_->handoff_stats().success_rate, 0.0);
}

TEST_F(CoordinatorTest, DefaultRulesRouteImplementationWorkToCoder) {
    auto config = quiet_config();
    config.install_default_rules = true;
    create(config);
    auto strategist = add_agent("strategist", "Strategic", {"analysis"});
    auto coder = add_agent("coder", "Coding", {"python-coding"});
    const auto id = coordinator_->submit_task({"analysis"}, context_for("Implement the parser"));

    coordinator_->tick();
    auto rec = status(id);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "coder");
    ASSERT_EQ(rec.handoff_history.size(), 1u);
    EXPECT_EQ(rec.handoff_history[0].from_agent, "strategist");
    EXPECT_EQ(rec.handoff_history[0].reason.type, HandoffReasonType::ExpertiseRequired);
    EXPECT_NE(rec.handoff_history[0].reason.description.find("implementation_required"), std::string::npos);
    EXPECT_EQ(strategist->execution_count(), 0u);
    EXPECT_EQ(availability("strategist"), Availability::Available);

    // Finished code would go to a tester, but there is none
    ASSERT_TRUE(wait_until([&] { return coder->pending() == 1; }));
    coder->succeed_next();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));
    EXPECT_EQ(status(id).result->agent_id, "coder");
    EXPECT_EQ(events_of<HandoffFailed>().size(), 1u);
}

TEST_F(CoordinatorTest, CompletedCodeIsHandedToTester) {
    auto config = quiet_config();
    config.install_default_rules = true;
    create(config);
    auto coder = add_agent("coder", "Coding", {"coding"});
    auto tester = add_agent("tester", "Testing", {"qa"});
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add the cart total"));

    coordinator_->tick();
    ASSERT_EQ(status(id).assigned_agent.value_or(""), "coder");
    ASSERT_TRUE(wait_until([&] { return coder->pending() == 1; }));
    coder->succeed_next({{"summary", "added"}});

    ASSERT_TRUE(wait_until([&] { return tester->pending() == 1; }));
    auto rec = status(id);
    EXPECT_EQ(rec.status, TaskStatus::InProgress);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "tester");
    ASSERT_EQ(rec.handoff_history.size(), 1u);
    EXPECT_EQ(rec.handoff_history[0].reason.type, HandoffReasonType::PlannedTransition);
    auto partial = tester->last_context()->metadata["handoff"]["partialResult"];
    EXPECT_TRUE(partial["success"].get<bool>());
    EXPECT_EQ(availability("coder"), Availability::Available);
    EXPECT_TRUE(wait_until([&] {
        return coordinator_->get_agent_status("coder")->performance.tasks_completed == 1;
    }));

    tester->succeed_next();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));
    rec = status(id);
    EXPECT_EQ(rec.result->agent_id, "tester");
    EXPECT_TRUE(rec.handoff_history[0].success);
}

TEST_F(CoordinatorTest, ExplicitTargetInMetadataIsHonored) {
    add_agent("w1", "General", {"writing"});
    add_agent("w2", "Review", {"review"});
    auto ctx = context_for("Draft release notes");
    ctx.metadata["handoff"] = {{"targetAgent", "w2"}};
    const auto id = coordinator_->submit_task({"writing"}, ctx);

    coordinator_->tick();
    auto rec = status(id);
    EXPECT_EQ(rec.assigned_agent.value_or(""), "w2");
    ASSERT_EQ(rec.handoff_history.size(), 1u);
    EXPECT_EQ(rec.handoff_history[0].reason.type, HandoffReasonType::PlannedTransition);
}

TEST_F(CoordinatorTest, ExplicitTargetWithNonUtf8TaskTextIsHandedOff) {
    auto w1 = add_agent("w1", "General", {"writing"}, Mode::Succeed);
    auto w2 = add_agent("w2", "Review", {"review"}, Mode::Succeed);
    auto ctx = context_for("Draft notes caf\xe9");
    ctx.metadata["handoff"] = {{"targetAgent", "w2"}};
    const auto id = coordinator_->submit_task({"writing"}, ctx);

    EXPECT_EQ(coordinator_->tick(), 1u);
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));
    auto rec = status(id);
    EXPECT_EQ(rec.result->agent_id, "w2");
    ASSERT_EQ(rec.handoff_history.size(), 1u);
    EXPECT_GT(rec.handoff_history[0].context_size_bytes, 0u);
    EXPECT_EQ(w1->execution_count(), 0u);
    EXPECT_EQ(w2->execution_count(), 1u);
    ASSERT_TRUE(wait_until([&] {
        return availability("w1") == Availability::Available && availability("w2") == Availability::Available;
    }));
}

TEST_F(CoordinatorTest, HandedOffExecutionIsReapedWithoutItsResult) {
    auto w1 = add_agent("w1", "General", {"writing"});
    auto w2 = add_agent("w2", "Review", {"review"});
    const auto id = coordinator_->submit_task({"writing"}, context_for("Draft release notes"));
    coordinator_->tick();
    ASSERT_TRUE(wait_until([&] { return w1->pending() == 1; }));
    EXPECT_EQ(coordinator_->active_executions(), 1u);

    HandoffRequest request;
    request.task_id = id;
    request.from_agent = "w1";
    request.required_capabilities = {"review"};
    ASSERT_TRUE(w1->ask_handoff(request));

    // w1 never resolves its future; only w2's execution stays alive
    ASSERT_TRUE(wait_until([&] {
        coordinator_->tick();
        return coordinator_->active_executions() == 1;
    }));
    ASSERT_TRUE(wait_until([&] { return coordinator_->execution_loop().pending_count() == 1; }));
    EXPECT_EQ(w1->pending(), 1u);
    EXPECT_EQ(status(id).assigned_agent.value_or(""), "w2");
    EXPECT_EQ(status(id).status, TaskStatus::InProgress);

    w2->succeed_next();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));
}

TEST_F(CoordinatorTest, HandoffRulesCanBeManagedAtRuntime) {
    HandoffRule rule;
    rule.id = "to-review";
    rule.name = "Send drafts to review";
    rule.from_pattern = ".*General.*";
    rule.to_pattern = ".*Review.*";
    rule.triggers = {{"draft_ready", TriggerOperator::Gte, 1.0}};

    // Unknown condition name
    EXPECT_THROW(coordinator_->add_handoff_rule(rule), std::invalid_argument);

    coordinator_->conditions().register_condition(
        "draft_ready", {[](const ConditionInput& in) { return in.context.task.find("draft") != std::string::npos ? 1.0 : 0.0; },
                        HandoffReasonType::Optimization, HandoffSeverity::Minor});
    coordinator_->add_handoff_rule(rule);
    ASSERT_EQ(coordinator_->handoff_rules().size(), 1u);

    add_agent("w1", "General", {"writing"});
    add_agent("w2", "Review", {"review"});
    const auto routed = coordinator_->submit_task({"writing"}, context_for("a draft of the notes"));
    coordinator_->tick();
    EXPECT_EQ(status(routed).assigned_agent.value_or(""), "w2");

    EXPECT_TRUE(coordinator_->remove_handoff_rule("to-review"));
    EXPECT_FALSE(coordinator_->remove_handoff_rule("to-review"));
    const auto direct = coordinator_->submit_task({"writing"}, context_for("a draft of the blurb"));
    coordinator_->tick();
    EXPECT_EQ(status(direct).assigned_agent.value_or(""), "w1");
}

TEST_F(CoordinatorTest, ReleaseOnlyDropsTerminalTasks) {
    add_agent("w1", "General", {"coding"}, Mode::Succeed);
    const auto id = coordinator_->submit_task({"coding"}, context_for("Add a login form"));
    EXPECT_FALSE(coordinator_->release_task(id));

    coordinator_->tick();
    ASSERT_TRUE(wait_for_status(id, TaskStatus::Completed));
    EXPECT_TRUE(coordinator_->release_task(id));
    EXPECT_FALSE(coordinator_->get_task_status(id).has_value());
    EXPECT_FALSE(coordinator_->release_task(id));
}

TEST_F(CoordinatorTest, QueriesByTypeAndRegistrationRefresh) {
    add_agent("c1", "Coding", {"coding"});
    add_agent("t1", "Testing", {"testing"});
    add_agent("c2", "Coding", {"coding"});

    auto coders = coordinator_->get_agents_by_type("Coding");
    ASSERT_EQ(coders.size(), 2u);
    EXPECT_EQ(coders[0].agent_id, "c1");
    EXPECT_EQ(coordinator_->get_all_agents().size(), 3u);

    EXPECT_FALSE(coordinator_->register_agent(std::make_shared<MockAgent>("c1", "Coding", std::set<std::string>{"coding", "rust"})));
    EXPECT_EQ(coordinator_->get_agent_status("c1")->capabilities.size(), 2u);
    EXPECT_THROW(coordinator_->register_agent(nullptr), std::invalid_argument);
}

TEST_F(CoordinatorTest, AssignedAgentIsBusyWhenEventFires) {
    std::atomic<int> violations{0};
    const auto subscription = coordinator_->subscribe([&](const CoordinatorEvent& e) {
        if (auto* assigned = std::get_if<TaskAssigned>(&e)) {
            auto reg = coordinator_->get_agent_status(assigned->agent_id);
            if (!reg || reg->availability != Availability::Busy ||
                reg->current_task.value_or("") != assigned->task_id) {
                violations++;
            }
        }
    });
    add_agent("w1", "General", {"coding"}, Mode::Succeed);
    add_agent("w2", "General", {"coding"}, Mode::Succeed);

    std::vector<std::string> ids;
    for (int i = 0; i < 6; ++i) ids.push_back(coordinator_->submit_task({"coding"}, context_for("job " + std::to_string(i))));
    ASSERT_TRUE(wait_until([&] {
        coordinator_->tick();
        return coordinator_->get_queue_status().completed == ids.size();
    }));
    EXPECT_EQ(violations.load(), 0);
    coordinator_->unsubscribe(subscription);
}

TEST_F(CoordinatorTest, BackgroundLoopDrainsWorkload) {
    add_agent("w1", "General", {"coding"}, Mode::Succeed);
    add_agent("w2", "General", {"coding", "testing"}, Mode::Succeed);
    add_agent("w3", "General", {"planning"}, Mode::Succeed);
    coordinator_->start();
    EXPECT_TRUE(coordinator_->is_running());

    for (int i = 0; i < 20; ++i) {
        coordinator_->submit_task({i % 2 ? "coding" : "planning"}, context_for("job " + std::to_string(i)),
                                  i % 3 ? TaskPriority::Medium : TaskPriority::High);
    }
    ASSERT_TRUE(wait_until([&] { return coordinator_->get_queue_status().completed == 20; }, std::chrono::seconds(10)));

    coordinator_->stop();
    EXPECT_FALSE(coordinator_->is_running());
    auto queue = coordinator_->get_queue_status();
    EXPECT_EQ(queue.queued, 0u);
    EXPECT_EQ(queue.in_progress, 0u);
    EXPECT_TRUE(wait_until([&] {
        auto agents = coordinator_->get_all_agents();
        return std::all_of(agents.begin(), agents.end(),
                           [](const AgentRegistration& r) { return r.availability == Availability::Available; });
    }));
}
