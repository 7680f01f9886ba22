#include "coordination/Coordinator.hpp"

#include <stdexcept>

/**
 * \file coordination/Coordinator.cpp
 * \brief Implements component wiring and the agent/task facade.
 * \ingroup coordination_module
 */

namespace TaskRelay {

Coordinator::Coordinator(std::shared_ptr<Logger> logger, CoordinatorConfig config)
    : logger_(std::move(logger)), config_(std::move(config)) {
    if (!logger_) throw std::invalid_argument("Coordinator: logger cannot be null");
    if (config_.execution_threads == 0) {
        throw std::invalid_argument("Coordinator: execution_threads must be at least 1");
    }

    events_ = std::make_shared<EventBus>(logger_);
    registry_ = std::make_shared<AgentRegistry>(logger_, events_);
    selector_ = std::make_shared<AgentSelector>(logger_, config_.selection);

    loop_ = std::make_shared<runtime::ExecutionLoop>(logger_);
    loop_->start(config_.execution_threads);

    scheduler_ = std::make_shared<TaskScheduler>(logger_, registry_, selector_, events_, loop_, config_.scheduler);

    conditions_ = std::make_shared<ConditionRegistry>();
    register_builtin_conditions(*conditions_);

    engine_ = std::make_shared<HandoffEngine>(logger_, registry_, selector_, events_, conditions_, scheduler_);
    if (config_.install_default_rules) engine_->install_default_rules();
    for (const auto& rule : config_.rules) engine_->add_rule(rule);
    scheduler_->set_advisor(engine_);

    health_ = std::make_unique<HealthMonitor>(logger_, registry_, scheduler_, events_, config_.health);
    logger_->info("Coordinator created (" + std::to_string(engine_->rules().size()) + " handoff rules)");
}

Coordinator::~Coordinator() {
    for (const auto& reg : registry_->snapshot_all()) {
        if (auto agent = registry_->agent(reg.agent_id)) {
            agent->set_status_listener({});
            agent->set_handoff_listener({});
        }
    }
    health_->stop();
    scheduler_->stop();
    // Breaks the scheduler -> engine -> (weak) scheduler cycle before teardown
    scheduler_->set_advisor(nullptr);
}

void Coordinator::start() {
    scheduler_->start();
    health_->start();
}

void Coordinator::stop() {
    health_->stop();
    scheduler_->stop();
}

bool Coordinator::is_running() const { return scheduler_->is_running(); }

size_t Coordinator::tick() { return scheduler_->tick(); }

std::vector<std::string> Coordinator::sweep_health(TimePoint now) { return health_->sweep(now); }

bool Coordinator::register_agent(std::shared_ptr<IAgent> agent) {
    const bool created = registry_->register_agent(agent);

    std::weak_ptr<AgentRegistry> weak_registry = registry_;
    agent->set_status_listener([weak_registry](const std::string& agent_id, AgentStatusSignal signal) {
        if (auto registry = weak_registry.lock()) registry->apply_status_signal(agent_id, signal);
    });
    std::weak_ptr<HandoffEngine> weak_engine = engine_;
    agent->set_handoff_listener([weak_engine](const HandoffRequest& request) {
        auto engine = weak_engine.lock();
        return engine && engine->handle_request(request);
    });
    return created;
}

bool Coordinator::unregister_agent(const std::string& agent_id) {
    if (!registry_->contains(agent_id)) return false;

    // The agent keeps its reservation until it is offline, so none of its
    // tasks can be handed straight back to it
    auto requeued = scheduler_->requeue_agent_tasks(agent_id, "agent unregistered");
    registry_->set_availability(agent_id, Availability::Offline);
    auto agent = registry_->remove(agent_id);
    if (!agent) return false;
    agent->set_status_listener({});
    agent->set_handoff_listener({});

    logger_->info("Unregistered agent " + agent_id + " (" + std::to_string(requeued.size()) + " task(s) requeued)");
    events_->publish(AgentUnregistered{agent_id, std::move(requeued)});
    return true;
}

bool Coordinator::update_agent_availability(const std::string& agent_id, Availability availability) {
    if (!registry_->contains(agent_id)) return false;
    if (availability == Availability::Offline) {
        scheduler_->requeue_agent_tasks(agent_id, "agent set offline");
    }
    return registry_->set_availability(agent_id, availability);
}

std::optional<AgentRegistration> Coordinator::get_agent_status(const std::string& agent_id) const {
    return registry_->snapshot(agent_id);
}

std::vector<AgentRegistration> Coordinator::get_all_agents() const { return registry_->snapshot_all(); }

std::vector<AgentRegistration> Coordinator::get_agents_by_type(const std::string& agent_type) const {
    return registry_->agents_by_type(agent_type);
}

std::string Coordinator::submit_task(std::vector<std::string> required_capabilities,
                                     TaskContext context,
                                     TaskPriority priority,
                                     std::optional<TimePoint> deadline) {
    return scheduler_->submit(std::move(required_capabilities), std::move(context), priority, deadline);
}

std::optional<TaskRecord> Coordinator::get_task_status(const std::string& task_id) const {
    return scheduler_->task(task_id);
}

std::vector<TaskRecord> Coordinator::get_all_tasks() const { return scheduler_->all_tasks(); }

QueueStatus Coordinator::get_queue_status() const { return scheduler_->queue_status(); }

bool Coordinator::release_task(const std::string& task_id) { return scheduler_->release_task(task_id); }

void Coordinator::add_handoff_rule(const HandoffRule& rule) { engine_->add_rule(rule); }

bool Coordinator::remove_handoff_rule(const std::string& rule_id) { return engine_->remove_rule(rule_id); }

std::vector<HandoffRule> Coordinator::handoff_rules() const { return engine_->rules(); }

HandoffStats Coordinator::handoff_stats() const { return engine_->stats(); }

EventBus::SubscriptionId Coordinator::subscribe(EventBus::Handler handler) {
    return events_->subscribe(std::move(handler));
}

bool Coordinator::unsubscribe(EventBus::SubscriptionId id) { return events_->unsubscribe(id); }

} // namespace TaskRelay
