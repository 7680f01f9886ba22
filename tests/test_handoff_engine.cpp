#include "handoff/HandoffEngine.hpp"
#include "support/MockAgent.hpp"
#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

using namespace TaskRelay;
using namespace TaskRelay::test_support;

class HandoffEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = make_test_logger(&sink_);
        events_ = std::make_shared<EventBus>(logger_);
        events_->subscribe([this](const CoordinatorEvent& e) {
            if (auto* f = std::get_if<HandoffFailed>(&e)) failures_.push_back(*f);
        });
        registry_ = std::make_shared<AgentRegistry>(logger_, events_);
        selector_ = std::make_shared<AgentSelector>(logger_);
        conditions_ = std::make_shared<ConditionRegistry>();
        register_builtin_conditions(*conditions_);
        // Advice does not need a scheduler
        engine_ = std::make_shared<HandoffEngine>(logger_, registry_, selector_, events_, conditions_,
                                                  std::weak_ptr<TaskScheduler>{});
    }

    void add_agent(const std::string& id, const std::string& type, std::set<std::string> caps) {
        registry_->register_agent(std::make_shared<MockAgent>(id, type, std::move(caps)));
    }

    static TaskRecord make_task(const std::string& text, std::vector<std::string> required,
                                nlohmann::json metadata = nlohmann::json::object()) {
        TaskContext ctx;
        ctx.task_id = "task-1";
        ctx.task = text;
        ctx.metadata = std::move(metadata);
        TaskRecord rec;
        rec.task_id = "task-1";
        rec.required_capabilities = std::move(required);
        rec.context = std::make_shared<const TaskContext>(std::move(ctx));
        rec.status = TaskStatus::InProgress;
        return rec;
    }

    std::optional<HandoffPlan> advise(const TaskRecord& task, const std::string& current, AdviceStage stage,
                                      const std::optional<AgentResult>& partial = std::nullopt) {
        auto reg = registry_->snapshot(current);
        EXPECT_TRUE(reg.has_value());
        return engine_->advise(task, *reg, stage, partial);
    }

    static HandoffRule simple_rule(const std::string& id, int priority, const std::string& condition = "test_required") {
        return HandoffRule{id, id, ".*", ".*Review.*", {{condition, TriggerOperator::Eq, 1.0}}, priority, true};
    }

    std::shared_ptr<VectorSink> sink_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<AgentRegistry> registry_;
    std::shared_ptr<AgentSelector> selector_;
    std::shared_ptr<ConditionRegistry> conditions_;
    std::shared_ptr<HandoffEngine> engine_;
    std::vector<HandoffFailed> failures_;
};

TEST_F(HandoffEngineTest, RejectsInvalidRules) {
    auto bad_regex = simple_rule("bad", 1);
    bad_regex.from_pattern = "([unclosed";
    EXPECT_THROW(engine_->add_rule(bad_regex), std::invalid_argument);

    auto no_triggers = simple_rule("empty", 1);
    no_triggers.triggers.clear();
    EXPECT_THROW(engine_->add_rule(no_triggers), std::invalid_argument);

    EXPECT_THROW(engine_->add_rule(simple_rule("unknown", 1, "moon_phase")), std::invalid_argument);

    auto no_id = simple_rule("", 1);
    EXPECT_THROW(engine_->add_rule(no_id), std::invalid_argument);

    EXPECT_TRUE(engine_->rules().empty());
}

TEST_F(HandoffEngineTest, RulesAreKeptInPriorityOrderAndReplacedById) {
    engine_->add_rule(simple_rule("c", 3));
    engine_->add_rule(simple_rule("a", 1));
    engine_->add_rule(simple_rule("b", 2));

    auto rules = engine_->rules();
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0].id, "a");
    EXPECT_EQ(rules[1].id, "b");
    EXPECT_EQ(rules[2].id, "c");

    auto replacement = simple_rule("a", 5);
    replacement.name = "renamed";
    engine_->add_rule(replacement);
    rules = engine_->rules();
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules.back().id, "a");
    EXPECT_EQ(rules.back().name, "renamed");

    EXPECT_TRUE(engine_->remove_rule("b"));
    EXPECT_FALSE(engine_->remove_rule("b"));
    EXPECT_EQ(engine_->rules().size(), 2u);
}

TEST_F(HandoffEngineTest, DefaultRulesInstallInOrder) {
    engine_->install_default_rules();
    auto rules = engine_->rules();
    ASSERT_EQ(rules.size(), 4u);
    EXPECT_EQ(rules[0].id, "strategic-to-coding");
    EXPECT_EQ(rules[1].id, "coding-to-testing");
    EXPECT_EQ(rules[2].id, "any-to-tool-execution");
    EXPECT_EQ(rules[3].id, "any-to-planning");
}

TEST_F(HandoffEngineTest, StrategicAgentHandsImplementationToCoder) {
    engine_->install_default_rules();
    add_agent("strategist", "Strategic", {"analysis"});
    add_agent("coder", "Coding", {"javascript-coding"});
    add_agent("tester", "Testing", {"unit-testing"});

    auto plan = advise(make_task("Implement the login form", {"coding"}), "strategist", AdviceStage::Assignment);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->target_agent, "coder");
    EXPECT_EQ(plan->rule_id, "strategic-to-coding");
    EXPECT_EQ(plan->reason.type, HandoffReasonType::ExpertiseRequired);
    EXPECT_NE(plan->reason.description.find("Rule 'Strategic to Coding Handoff' triggered"), std::string::npos);
    EXPECT_NE(plan->reason.description.find("implementation_required"), std::string::npos);
}

TEST_F(HandoffEngineTest, NoRuleFiresWhenAlreadyOnTargetType) {
    engine_->install_default_rules();
    add_agent("coder", "Coding", {"javascript-coding"});
    add_agent("coder-2", "Coding", {"python-coding"});

    EXPECT_FALSE(advise(make_task("Implement the login form", {"coding"}), "coder", AdviceStage::Assignment));
    EXPECT_TRUE(failures_.empty());
}

TEST_F(HandoffEngineTest, FiringRuleWithoutTargetPublishesFailure) {
    engine_->install_default_rules();
    add_agent("strategist", "Strategic", {"analysis"});

    auto plan = advise(make_task("Implement the login form", {"coding"}), "strategist", AdviceStage::Assignment);

    EXPECT_FALSE(plan.has_value());
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].task_id, "task-1");
    EXPECT_EQ(failures_[0].from_agent, "strategist");
    EXPECT_TRUE(sink_->contains("strategic-to-coding"));
}

TEST_F(HandoffEngineTest, CompletedImplementationMovesToTesting) {
    engine_->install_default_rules();
    add_agent("coder", "Coding", {"javascript-coding"});
    add_agent("tester", "Testing", {"unit-testing"});

    AgentResult partial;
    partial.success = true;
    partial.agent_id = "coder";
    auto plan = advise(make_task("Add the cart total", {}), "coder", AdviceStage::Completion, partial);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->target_agent, "tester");
    EXPECT_EQ(plan->rule_id, "coding-to-testing");
    EXPECT_EQ(plan->reason.type, HandoffReasonType::PlannedTransition);
}

TEST_F(HandoffEngineTest, DisabledRulesAreSkipped) {
    add_agent("writer", "Docs", {"writing"});
    add_agent("reviewer", "Review", {"review"});
    auto rule = simple_rule("review", 1);
    rule.enabled = false;
    engine_->add_rule(rule);

    EXPECT_FALSE(advise(make_task("Add unit tests", {}), "writer", AdviceStage::Assignment));

    rule.enabled = true;
    engine_->add_rule(rule);
    auto plan = advise(make_task("Add unit tests", {}), "writer", AdviceStage::Assignment);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->target_agent, "reviewer");
}

TEST_F(HandoffEngineTest, FromPatternMustMatchCurrentType) {
    add_agent("writer", "Docs", {"writing"});
    add_agent("reviewer", "Review", {"review"});
    auto rule = simple_rule("review", 1);
    rule.from_pattern = "^Coding$";
    engine_->add_rule(rule);

    EXPECT_FALSE(advise(make_task("Add unit tests", {}), "writer", AdviceStage::Assignment));
}

TEST_F(HandoffEngineTest, ExplicitTargetAgentInMetadata) {
    add_agent("generalist", "General", {"writing"});
    add_agent("auditor", "Audit", {"compliance"});

    nlohmann::json meta = {{"handoff", {{"targetAgent", "auditor"},
                                        {"reason", {{"type", "expertise_required"},
                                                    {"description", "needs an audit"},
                                                    {"severity", "major"}}}}}};
    auto plan = advise(make_task("Check the ledger", {}, meta), "generalist", AdviceStage::Assignment);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->target_agent, "auditor");
    EXPECT_TRUE(plan->rule_id.empty());
    EXPECT_EQ(plan->reason.type, HandoffReasonType::ExpertiseRequired);
    EXPECT_EQ(plan->reason.severity, HandoffSeverity::Major);
    EXPECT_EQ(plan->reason.description, "needs an audit");

    // Directives are an assignment-time concern
    AgentResult partial;
    partial.success = true;
    EXPECT_FALSE(advise(make_task("Check the ledger", {}, meta), "generalist", AdviceStage::Completion, partial));
}

TEST_F(HandoffEngineTest, KeywordDirectiveResolvesByType) {
    add_agent("generalist", "General", {"writing"});
    add_agent("qa", "Testing", {"unit-testing"});

    auto plan = advise(make_task("We need testing on this one", {}), "generalist", AdviceStage::Assignment);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->target_agent, "qa");
    EXPECT_EQ(plan->reason.type, HandoffReasonType::CapabilityMismatch);
}

TEST_F(HandoffEngineTest, DirectiveNamingCurrentTypeIsIgnored) {
    add_agent("qa", "Testing", {"unit-testing"});
    add_agent("qa-2", "Testing", {"unit-testing"});

    EXPECT_FALSE(advise(make_task("We need testing on this one", {}), "qa", AdviceStage::Assignment));
    EXPECT_TRUE(failures_.empty());
}

TEST_F(HandoffEngineTest, UnresolvableDirectiveIsReported) {
    add_agent("generalist", "General", {"writing"});

    nlohmann::json meta = {{"handoff", {{"targetAgent", "ghost"}}}};
    EXPECT_FALSE(advise(make_task("Check the ledger", {}, meta), "generalist", AdviceStage::Assignment));
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_NE(failures_[0].reason.find("ghost"), std::string::npos);
}

TEST_F(HandoffEngineTest, CustomConditionDrivesRule) {
    conditions_->register_condition("long_task", {[](const ConditionInput& in) {
        return static_cast<double>(in.context.task.size());
    }, HandoffReasonType::Overload, HandoffSeverity::Major});
    add_agent("junior", "Junior", {"writing"});
    add_agent("senior", "Senior", {"writing"});
    engine_->add_rule(HandoffRule{"escalate", "Escalate long work", "Junior", "Senior",
                                  {{"long_task", TriggerOperator::Gt, 20.0}}, 1, true});

    EXPECT_FALSE(advise(make_task("Short one", {}), "junior", AdviceStage::Assignment));

    auto plan = advise(make_task("A considerably longer description", {}), "junior", AdviceStage::Assignment);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->target_agent, "senior");
    EXPECT_EQ(plan->reason.type, HandoffReasonType::Overload);
    EXPECT_EQ(plan->reason.severity, HandoffSeverity::Major);
}

TEST_F(HandoffEngineTest, HandleRequestWithoutSchedulerFails) {
    add_agent("a", "General", {"writing"});
    HandoffRequest req;
    req.task_id = "task-1";
    req.from_agent = "a";
    EXPECT_FALSE(engine_->handle_request(req));
    EXPECT_EQ(engine_->stats().total, 0u);
}
