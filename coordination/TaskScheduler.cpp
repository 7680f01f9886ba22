#include "coordination/TaskScheduler.hpp"
#include "runtime/coro/FutureAwaitable.hpp"
#include "processUtils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

/**
 * \file coordination/TaskScheduler.cpp
 * \brief Implements assignment, dispatch, settlement, retry, requeue and transfer.
 * \ingroup coordination_module
 */

// Design overview:
// - tick() drains the queue, walks every entry in order and restores the
//   entries it could not assign, so one unassignable task never blocks others.
// - Each dispatch gets a fresh dispatch id. A completion whose id no longer
//   matches the task (requeued or handed off meanwhile) is stale and ignored.
// - Agent availability is changed only through the registry; the task moves
//   out of in_progress (or onto its new agent) before the old agent is released.

namespace TaskRelay {

TaskScheduler::TaskScheduler(std::shared_ptr<Logger> logger,
                             std::shared_ptr<AgentRegistry> registry,
                             std::shared_ptr<AgentSelector> selector,
                             std::shared_ptr<EventBus> events,
                             std::shared_ptr<runtime::ExecutionLoop> loop,
                             SchedulerConfig config)
    : logger_(std::move(logger)),
      registry_(std::move(registry)),
      selector_(std::move(selector)),
      events_(std::move(events)),
      loop_(std::move(loop)),
      config_(config) {
    if (!logger_) throw std::invalid_argument("TaskScheduler: logger cannot be null");
    if (!registry_) throw std::invalid_argument("TaskScheduler: registry cannot be null");
    if (!selector_) throw std::invalid_argument("TaskScheduler: selector cannot be null");
    if (!events_) throw std::invalid_argument("TaskScheduler: event bus cannot be null");
    if (!loop_) throw std::invalid_argument("TaskScheduler: execution loop cannot be null");
    if (config_.assignment_interval.count() <= 0) {
        throw std::invalid_argument("TaskScheduler: assignment_interval must be positive");
    }

    // An agent becoming available or registering may unblock queued tasks
    subscription_ = events_->subscribe([this](const CoordinatorEvent& event) {
        if (auto* changed = std::get_if<AgentAvailabilityChanged>(&event)) {
            if (changed->current == Availability::Available) wake();
        } else if (std::holds_alternative<AgentRegistered>(event)) {
            wake();
        }
    });
}

TaskScheduler::~TaskScheduler() {
    stop();
    events_->unsubscribe(subscription_);
    // No coroutine may be resumed once its frame is destroyed below
    loop_->stop();
    std::lock_guard lock(executions_mutex_);
    executions_.clear();
}

void TaskScheduler::set_advisor(std::shared_ptr<IHandoffAdvisor> advisor) {
    std::lock_guard lock(advisor_mutex_);
    advisor_ = std::move(advisor);
}

void TaskScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    loop_thread_ = std::thread([this] { run_loop(); });
    logger_->info("TaskScheduler started (interval " + std::to_string(config_.assignment_interval.count()) + "ms)");
}

void TaskScheduler::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard lk(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
    if (loop_thread_.joinable()) loop_thread_.join();
    logger_->info("TaskScheduler stopped");
}

void TaskScheduler::wake() {
    {
        std::lock_guard lk(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_one();
}

void TaskScheduler::run_loop() {
    ProcessUtils::set_current_thread_name("Scheduler");
    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            logger_->error("Assignment pass failed: " + std::string(e.what()));
        }
        std::unique_lock lk(wake_mutex_);
        wake_cv_.wait_for(lk, config_.assignment_interval, [this] { return wake_requested_ || !running_; });
        wake_requested_ = false;
    }
}

std::string TaskScheduler::submit(std::vector<std::string> required_capabilities,
                                  TaskContext context,
                                  TaskPriority priority,
                                  std::optional<TimePoint> deadline) {
    auto entry = std::make_shared<TaskEntry>();
    const std::string task_id = id_generator_.next_id();
    context.task_id = task_id;
    if (context.timestamp_ms == 0) context.timestamp_ms = to_epoch_ms(Clock::now());

    entry->record.task_id = task_id;
    entry->record.required_capabilities = std::move(required_capabilities);
    entry->record.priority = priority;
    entry->record.deadline = deadline;
    entry->record.context = std::make_shared<const TaskContext>(std::move(context));
    entry->record.status = TaskStatus::Pending;
    entry->record.submitted_at = Clock::now();
    {
        std::unique_lock lock(tasks_mutex_);
        tasks_.emplace(task_id, entry);
    }
    queue_.push(task_id, priority, deadline);
    logger_->info("Task submitted: " + task_id + " (priority " + to_string(priority) + ")");
    events_->publish(TaskSubmitted{task_id, priority});
    wake();
    return task_id;
}

size_t TaskScheduler::tick() {
    std::lock_guard tick_lock(tick_mutex_);
    reap_finished_executions();

    auto entries = queue_.drain();
    std::vector<QueueEntry> unassigned;
    size_t dispatched = 0;
    for (auto& qe : entries) {
        auto entry = find_task(qe.task_id);
        if (!entry) continue;
        {
            std::lock_guard lock(entry->mutex);
            if (entry->record.status != TaskStatus::Pending) continue;
        }
        bool left_queue = false;
        try {
            left_queue = try_assign(entry);
        } catch (const std::exception& e) {
            logger_->error("Assignment of task " + qe.task_id + " failed: " + e.what());
            std::lock_guard lock(entry->mutex);
            left_queue = entry->record.status != TaskStatus::Pending;
        }
        if (left_queue) {
            ++dispatched;
        } else {
            unassigned.push_back(std::move(qe));
        }
    }
    queue_.restore(std::move(unassigned));
    return dispatched;
}

bool TaskScheduler::try_assign(const std::shared_ptr<TaskEntry>& entry) {
    std::string task_id;
    std::vector<std::string> required;
    {
        std::lock_guard lock(entry->mutex);
        task_id = entry->record.task_id;
        required = entry->record.required_capabilities;
    }

    auto chosen = selector_->select(registry_->available_candidates(), required);
    if (!chosen) {
        logger_->debug("No eligible agent for task " + task_id);
        return false;
    }
    // Another pass or a status signal may have taken the agent since the snapshot
    if (!registry_->try_reserve(*chosen, task_id)) {
        return false;
    }

    TaskRecord snapshot;
    uint64_t dispatch_id = 0;
    std::shared_ptr<const TaskContext> context;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        if (rec.status != TaskStatus::Pending) {
            dispatch_id = 0;
        } else {
            rec.status = TaskStatus::Assigned;
            rec.assigned_agent = *chosen;
            rec.attempts++;
            dispatch_id = next_dispatch_id_++;
            entry->dispatch_id = dispatch_id;
            entry->dispatched_at = Clock::now();
            rec.status = TaskStatus::InProgress;
            context = rec.context;
            snapshot = rec;
        }
    }
    if (dispatch_id == 0) {
        registry_->release(*chosen, task_id);
        return true;
    }

    logger_->info("Task " + task_id + " assigned to " + *chosen + " (attempt " + std::to_string(snapshot.attempts) + ")");
    events_->publish(TaskAssigned{task_id, *chosen, snapshot.attempts});

    if (config_.evaluate_rules_on_assignment) {
        auto plan = consult_advisor(snapshot, *chosen, AdviceStage::Assignment, std::nullopt);
        if (plan && transfer(TransferRequest{task_id, *chosen, plan->target_agent, plan->reason,
                                             std::nullopt, std::nullopt, dispatch_id})) {
            return true;
        }
    }

    dispatch(task_id, *chosen, dispatch_id, std::move(context));
    return true;
}

void TaskScheduler::dispatch(const std::string& task_id, const std::string& agent_id,
                             uint64_t dispatch_id, std::shared_ptr<const TaskContext> context) {
    auto agent = registry_->agent(agent_id);
    if (!agent) {
        settle(task_id, agent_id, dispatch_id, AgentResult::failure(agent_id, "agent is no longer registered"));
        return;
    }

    // Registered before execute() so a handoff requested from inside it can abandon this leg
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard lock(executions_mutex_);
        executions_[dispatch_id].abandoned = abandoned;
    }
    auto forget = [this, dispatch_id] {
        std::lock_guard lock(executions_mutex_);
        executions_.erase(dispatch_id);
    };

    std::future<AgentResult> future;
    try {
        future = agent->execute(std::move(context));
    } catch (const std::exception& e) {
        forget();
        settle(task_id, agent_id, dispatch_id, AgentResult::failure(agent_id, std::string("execute threw: ") + e.what()));
        return;
    }
    if (!future.valid()) {
        forget();
        settle(task_id, agent_id, dispatch_id, AgentResult::failure(agent_id, "agent returned an invalid future"));
        return;
    }

    auto shared_future = std::make_shared<std::future<AgentResult>>(std::move(future));
    auto execution = std::make_unique<runtime::Task<void>>(
        run_execution(task_id, agent_id, dispatch_id, std::move(shared_future), abandoned));
    std::lock_guard lock(executions_mutex_);
    executions_[dispatch_id].task = std::move(execution);
}

void TaskScheduler::abandon_execution(uint64_t dispatch_id) {
    if (dispatch_id == 0) return;
    std::lock_guard lock(executions_mutex_);
    auto it = executions_.find(dispatch_id);
    if (it != executions_.end() && it->second.abandoned) {
        it->second.abandoned->store(true, std::memory_order_release);
    }
}

runtime::Task<void> TaskScheduler::run_execution(std::string task_id, std::string agent_id, uint64_t dispatch_id,
                                                 std::shared_ptr<std::future<AgentResult>> future,
                                                 std::shared_ptr<std::atomic<bool>> abandoned) {
    AgentResult result;
    try {
        result = co_await runtime::FutureAwaitable<AgentResult>(*loop_, future, std::move(abandoned));
    } catch (const std::exception& e) {
        result = AgentResult::failure(agent_id, e.what());
    }
    try {
        settle(task_id, agent_id, dispatch_id, std::move(result));
    } catch (const std::exception& e) {
        logger_->error("Settling task " + task_id + " failed: " + e.what());
    }
}

void TaskScheduler::settle(const std::string& task_id, const std::string& agent_id,
                           uint64_t dispatch_id, AgentResult result) {
    auto entry = find_task(task_id);
    if (!entry) return;

    if (result.agent_id.empty()) result.agent_id = agent_id;
    if (!result.success && !result.error) result.error = "execution failed";

    TaskRecord snapshot;
    TimePoint dispatched_at;
    {
        std::lock_guard lock(entry->mutex);
        if (entry->dispatch_id != dispatch_id || entry->record.status != TaskStatus::InProgress) {
            logger_->debug("Ignoring stale completion of task " + task_id + " from " + agent_id);
            return;
        }
        dispatched_at = entry->dispatched_at;
        snapshot = entry->record;
    }
    const double response_ms = static_cast<double>(elapsed_ms(dispatched_at, Clock::now()));

    if (result.success && config_.evaluate_rules_on_completion) {
        auto plan = consult_advisor(snapshot, agent_id, AdviceStage::Completion, result);
        if (plan && transfer(TransferRequest{task_id, agent_id, plan->target_agent, plan->reason,
                                             nlohmann::json(result), std::nullopt, dispatch_id})) {
            registry_->record_completion(agent_id, true, response_ms);
            return;
        }
    }

    bool will_retry = false;
    TaskPriority priority = TaskPriority::Medium;
    std::optional<TimePoint> deadline;
    const auto now = Clock::now();
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        if (entry->dispatch_id != dispatch_id || rec.status != TaskStatus::InProgress) {
            return;
        }
        settle_pending_handoff(*entry, result.success, now);
        entry->dispatch_id = 0;
        if (result.success) {
            rec.status = TaskStatus::Completed;
            rec.result = result;
        } else {
            rec.last_error = result.error;
            will_retry = retry_allowed(rec);
            if (will_retry) {
                rec.status = TaskStatus::Pending;
                rec.assigned_agent.reset();
                rec.result.reset();
            } else {
                rec.status = TaskStatus::Failed;
                rec.result = result;
            }
        }
        priority = rec.priority;
        deadline = rec.deadline;
    }

    registry_->record_completion(agent_id, result.success, response_ms);
    registry_->release(agent_id, task_id);

    if (result.success) {
        logger_->info("Task " + task_id + " completed by " + agent_id);
        events_->publish(TaskCompleted{task_id, agent_id, result});
    } else {
        logger_->warning("Task " + task_id + " failed on " + agent_id + ": " + *result.error +
                         (will_retry ? " (retrying)" : ""));
        events_->publish(TaskFailed{task_id, agent_id, *result.error, will_retry});
        if (will_retry) {
            queue_.push_front(task_id, priority, deadline);
            wake();
        }
    }
}

std::optional<HandoffPlan> TaskScheduler::consult_advisor(const TaskRecord& record, const std::string& agent_id,
                                                          AdviceStage stage, const std::optional<AgentResult>& partial) {
    std::shared_ptr<IHandoffAdvisor> advisor;
    {
        std::lock_guard lock(advisor_mutex_);
        advisor = advisor_;
    }
    if (!advisor) return std::nullopt;
    auto current = registry_->snapshot(agent_id);
    if (!current) return std::nullopt;
    try {
        return advisor->advise(record, *current, stage, partial);
    } catch (const std::exception& e) {
        logger_->error("Handoff evaluation for task " + record.task_id + " failed: " + e.what());
        return std::nullopt;
    }
}

bool TaskScheduler::retry_allowed(const TaskRecord& record) const {
    if (record.handoff_history.size() >= 3) return false;
    if (record.priority == TaskPriority::Low) return false;
    if (config_.max_retries > 0 && record.attempts > config_.max_retries) return false;
    return true;
}

void TaskScheduler::settle_pending_handoff(TaskEntry& entry, bool success, TimePoint now) {
    if (!entry.pending_handoff) return;
    const size_t idx = *entry.pending_handoff;
    entry.pending_handoff.reset();
    if (idx >= entry.record.handoff_history.size()) return;
    auto& ev = entry.record.handoff_history[idx];
    ev.success = success;
    ev.settled = true;
    ev.duration_ms = elapsed_ms(ev.timestamp, now);
}

bool TaskScheduler::transfer(const TransferRequest& request) {
    if (request.from_agent == request.to_agent) return false;
    auto entry = find_task(request.task_id);
    if (!entry) return false;

    auto transferable = [&](const TaskEntry& e) {
        const auto& rec = e.record;
        return rec.status == TaskStatus::InProgress &&
               rec.assigned_agent == request.from_agent &&
               rec.handoff_history.size() < config_.max_handoffs_per_task &&
               (request.expected_dispatch_id == 0 || e.dispatch_id == request.expected_dispatch_id);
    };

    // The transfer context is built before any agent is reserved, so a failure
    // here leaves the task on its current agent
    const auto now = Clock::now();
    uint64_t previous_dispatch = 0;
    std::shared_ptr<const TaskContext> transferred;
    size_t context_size = 0;
    try {
        TaskContext base;
        {
            std::lock_guard lock(entry->mutex);
            if (!transferable(*entry)) {
                logger_->warning("Handoff of task " + request.task_id + " from " + request.from_agent + " rejected");
                return false;
            }
            previous_dispatch = entry->dispatch_id;
            const auto& rec = entry->record;
            base = request.context ? *request.context : (rec.context ? *rec.context : TaskContext{});
            base.task_id = rec.task_id;
        }
        transferred = std::make_shared<const TaskContext>(
            make_transfer_context(base, request.from_agent, request.reason, request.partial_result,
                                  now, config_.handoff_history_limit));
        context_size = serialized_size(*transferred);
    } catch (const std::exception& e) {
        logger_->error("Handoff of task " + request.task_id + " failed: " + e.what());
        return false;
    }

    if (!registry_->try_reserve(request.to_agent, request.task_id)) {
        logger_->warning("Handoff of task " + request.task_id + ": target " + request.to_agent + " is not available");
        return false;
    }

    HandoffEvent event;
    uint64_t dispatch_id = 0;
    bool accepted = false;
    {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        // A requeue or re-dispatch in between makes the request stale
        accepted = entry->dispatch_id == previous_dispatch && transferable(*entry);
        if (accepted) {
            // Handing the task onward counts as a successful leg for the previous handoff
            settle_pending_handoff(*entry, true, now);

            event.from_agent = request.from_agent;
            event.to_agent = request.to_agent;
            event.reason = request.reason;
            event.timestamp = now;
            event.context_size_bytes = context_size;
            rec.handoff_history.push_back(event);
            entry->pending_handoff = rec.handoff_history.size() - 1;

            rec.context = transferred;
            rec.assigned_agent = request.to_agent;
            dispatch_id = next_dispatch_id_++;
            entry->dispatch_id = dispatch_id;
            entry->dispatched_at = now;
        }
    }
    if (!accepted) {
        registry_->release(request.to_agent, request.task_id);
        logger_->warning("Handoff of task " + request.task_id + " from " + request.from_agent + " rejected");
        return false;
    }

    registry_->release(request.from_agent, request.task_id);
    abandon_execution(previous_dispatch);
    logger_->info("Task " + request.task_id + " handed off " + request.from_agent + " -> " + request.to_agent +
                  " (" + to_string(request.reason.type) + ": " + request.reason.description + ")");
    events_->publish(TaskHandoff{request.task_id, event});
    dispatch(request.task_id, request.to_agent, dispatch_id, std::move(transferred));
    return true;
}

std::vector<std::string> TaskScheduler::requeue_agent_tasks(const std::string& agent_id, const std::string& reason) {
    struct Requeued {
        std::string task_id;
        TaskPriority priority;
        std::optional<TimePoint> deadline;
    };
    std::vector<Requeued> requeued;
    std::vector<uint64_t> abandoned;
    const auto now = Clock::now();
    for (const auto& entry : task_entries()) {
        std::lock_guard lock(entry->mutex);
        auto& rec = entry->record;
        const bool in_flight = rec.status == TaskStatus::InProgress || rec.status == TaskStatus::Assigned;
        if (!in_flight || rec.assigned_agent != agent_id) continue;
        settle_pending_handoff(*entry, false, now);
        rec.status = TaskStatus::Pending;
        rec.assigned_agent.reset();
        abandoned.push_back(entry->dispatch_id);
        entry->dispatch_id = 0;
        requeued.push_back({rec.task_id, rec.priority, rec.deadline});
    }
    for (auto id : abandoned) abandon_execution(id);

    std::vector<std::string> ids;
    for (const auto& r : requeued) {
        queue_.push_front(r.task_id, r.priority, r.deadline);
        logger_->info("Task " + r.task_id + " requeued from " + agent_id + ": " + reason);
        events_->publish(TaskRequeued{r.task_id, agent_id, reason});
        ids.push_back(r.task_id);
    }
    if (!ids.empty()) wake();
    return ids;
}

std::optional<TaskRecord> TaskScheduler::task(const std::string& task_id) const {
    auto entry = find_task(task_id);
    if (!entry) return std::nullopt;
    std::lock_guard lock(entry->mutex);
    return entry->record;
}

std::vector<TaskRecord> TaskScheduler::all_tasks() const {
    std::vector<TaskRecord> out;
    for (const auto& entry : task_entries()) {
        std::lock_guard lock(entry->mutex);
        out.push_back(entry->record);
    }
    std::sort(out.begin(), out.end(), [](const TaskRecord& a, const TaskRecord& b) {
        return a.submitted_at < b.submitted_at;
    });
    return out;
}

QueueStatus TaskScheduler::queue_status() const {
    QueueStatus status;
    status.queued_task_ids = queue_.snapshot();
    status.queued = status.queued_task_ids.size();
    for (const auto& entry : task_entries()) {
        std::lock_guard lock(entry->mutex);
        switch (entry->record.status) {
            case TaskStatus::Pending:    status.pending++; break;
            case TaskStatus::Assigned:   status.assigned++; break;
            case TaskStatus::InProgress: status.in_progress++; break;
            case TaskStatus::Completed:  status.completed++; break;
            case TaskStatus::Failed:     status.failed++; break;
        }
    }
    return status;
}

bool TaskScheduler::release_task(const std::string& task_id) {
    std::unique_lock lock(tasks_mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return false;
    {
        std::lock_guard elock(it->second->mutex);
        if (!it->second->record.is_terminal()) return false;
    }
    tasks_.erase(it);
    return true;
}

size_t TaskScheduler::active_executions() const {
    std::lock_guard lock(executions_mutex_);
    size_t active = 0;
    for (const auto& [id, execution] : executions_) {
        if (execution.task && !execution.task->done()) ++active;
    }
    return active;
}

void TaskScheduler::reap_finished_executions() {
    std::lock_guard lock(executions_mutex_);
    for (auto it = executions_.begin(); it != executions_.end();) {
        if (it->second.task && it->second.task->done()) {
            it = executions_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<TaskScheduler::TaskEntry> TaskScheduler::find_task(const std::string& task_id) const {
    std::shared_lock lock(tasks_mutex_);
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TaskScheduler::TaskEntry>> TaskScheduler::task_entries() const {
    std::shared_lock lock(tasks_mutex_);
    std::vector<std::shared_ptr<TaskEntry>> out;
    out.reserve(tasks_.size());
    for (const auto& [id, entry] : tasks_) out.push_back(entry);
    return out;
}

} // namespace TaskRelay
