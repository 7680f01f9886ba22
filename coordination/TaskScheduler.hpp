// TaskScheduler.hpp - Task table, assignment loop and completion handling
#pragma once

#include "agents/AgentRegistry.hpp"
#include "coordination/AgentSelector.hpp"
#include "coordination/EventBus.hpp"
#include "coordination/IHandoffAdvisor.hpp"
#include "message/TaskContext.hpp"
#include "message/TaskIdGenerator.hpp"
#include "message/TaskQueue.hpp"
#include "message/TaskRecord.hpp"
#include "runtime/coro/CoroTask.hpp"
#include "runtime/coro/ExecutionLoop.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

/**
 * \file coordination/TaskScheduler.hpp
 * \brief Declares the task scheduler.
 * \ingroup coordination_module
 */

namespace TaskRelay {

struct SchedulerConfig {
    std::chrono::milliseconds assignment_interval{1000};
    uint32_t max_retries{0};              ///< 0 = bounded only by the handoff/priority rule
    size_t max_handoffs_per_task{3};
    size_t handoff_history_limit{kTransferHistoryLimit};  ///< Conversation entries carried by a handoff
    bool evaluate_rules_on_assignment{true};
    bool evaluate_rules_on_completion{true};
};

/** \brief Counts per status plus the current queue order. */
struct QueueStatus {
    size_t queued{0};
    size_t pending{0};
    size_t assigned{0};
    size_t in_progress{0};
    size_t completed{0};
    size_t failed{0};
    std::vector<std::string> queued_task_ids;
};

/** \brief Parameters of a transfer between two agents. */
struct TransferRequest {
    std::string task_id;
    std::string from_agent;
    std::string to_agent;
    HandoffReason reason;
    std::optional<nlohmann::json> partial_result;
    std::optional<TaskContext> context;  ///< Replaces the task context before transfer when set
    uint64_t expected_dispatch_id{0};    ///< Execution the request belongs to; 0 accepts the current one
};

/**
 * \brief Owns task records and drives them through their lifecycle.
 * \ingroup coordination_module
 *
 * Responsibilities:
 * - Ordered queue of pending tasks and the periodic assignment loop.
 * - Reservation of the selected agent and fire-and-forget dispatch; each
 *   execution is a coroutine suspended on the ExecutionLoop until the agent's
 *   future is ready.
 * - Completion handling, retry policy, requeue on agent loss and handoff
 *   transfers.
 *
 * Every task has its own mutex; the table lock guards membership only.
 * Events are published after task locks are released.
 */
class TaskScheduler {
public:
    TaskScheduler(std::shared_ptr<Logger> logger,
                  std::shared_ptr<AgentRegistry> registry,
                  std::shared_ptr<AgentSelector> selector,
                  std::shared_ptr<EventBus> events,
                  std::shared_ptr<runtime::ExecutionLoop> loop,
                  SchedulerConfig config = {});
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void set_advisor(std::shared_ptr<IHandoffAdvisor> advisor);

    // --- Lifecycle ---
    /// Start the background assignment loop.
    void start();
    /// Stop the assignment loop. Running executions are not cancelled.
    void stop();
    bool is_running() const { return running_.load(); }
    /// Request an early assignment pass.
    void wake();

    /**
     * \brief Run one assignment pass over the whole queue.
     * \return Number of tasks dispatched in this pass.
     */
    size_t tick();

    // --- Tasks ---
    /**
     * \brief Create a pending task and enqueue it.
     * \return The new task id (also written to the context's task_id).
     */
    std::string submit(std::vector<std::string> required_capabilities,
                       TaskContext context,
                       TaskPriority priority = TaskPriority::Medium,
                       std::optional<TimePoint> deadline = std::nullopt);

    std::optional<TaskRecord> task(const std::string& task_id) const;
    std::vector<TaskRecord> all_tasks() const;
    QueueStatus queue_status() const;

    /// Drop a terminal task record. \return false if unknown or not terminal.
    bool release_task(const std::string& task_id);

    /**
     * \brief Return every in-flight task of \p agent_id to the front of the queue.
     * \details The agent keeps its reservation so it cannot be re-selected;
     *          callers take it offline afterwards.
     * \return Ids of the requeued tasks.
     */
    std::vector<std::string> requeue_agent_tasks(const std::string& agent_id, const std::string& reason);

    /**
     * \brief Move an in-progress task from one agent to another and re-dispatch it.
     * \return false if the target could not be reserved, the task is not in
     *         progress on `from_agent` (under `expected_dispatch_id` when set),
     *         the handoff cap is reached or the transfer context cannot be built.
     */
    bool transfer(const TransferRequest& request);

    /// Executions dispatched and not yet reaped.
    size_t active_executions() const;

    const SchedulerConfig& config() const { return config_; }

private:
    struct TaskEntry {
        mutable std::mutex mutex;
        TaskRecord record;
        uint64_t dispatch_id{0};                  ///< Identifies the current execution; 0 when none
        TimePoint dispatched_at{};
        std::optional<size_t> pending_handoff;    ///< Index of the unsettled handoff event
    };

    std::shared_ptr<TaskEntry> find_task(const std::string& task_id) const;
    std::vector<std::shared_ptr<TaskEntry>> task_entries() const;

    /// \return true if the task left the pending state (assigned or dropped).
    bool try_assign(const std::shared_ptr<TaskEntry>& entry);
    void dispatch(const std::string& task_id, const std::string& agent_id,
                  uint64_t dispatch_id, std::shared_ptr<const TaskContext> context);
    runtime::Task<void> run_execution(std::string task_id, std::string agent_id, uint64_t dispatch_id,
                                      std::shared_ptr<std::future<AgentResult>> future,
                                      std::shared_ptr<std::atomic<bool>> abandoned);
    /// Let a superseded execution finish without its agent's result so it can be reaped.
    void abandon_execution(uint64_t dispatch_id);
    void settle(const std::string& task_id, const std::string& agent_id, uint64_t dispatch_id, AgentResult result);
    std::optional<HandoffPlan> consult_advisor(const TaskRecord& record, const std::string& agent_id,
                                               AdviceStage stage, const std::optional<AgentResult>& partial);
    bool retry_allowed(const TaskRecord& record) const;
    static void settle_pending_handoff(TaskEntry& entry, bool success, TimePoint now);
    void reap_finished_executions();
    void run_loop();

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AgentRegistry> registry_;
    std::shared_ptr<AgentSelector> selector_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<runtime::ExecutionLoop> loop_;
    SchedulerConfig config_;

    mutable std::mutex advisor_mutex_;
    std::shared_ptr<IHandoffAdvisor> advisor_;

    mutable std::shared_mutex tasks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<TaskEntry>> tasks_;
    TaskQueue queue_;
    TaskIdGenerator id_generator_;
    std::atomic<uint64_t> next_dispatch_id_{1};

    struct Execution {
        std::unique_ptr<runtime::Task<void>> task;  ///< Null until the coroutine is created
        std::shared_ptr<std::atomic<bool>> abandoned;
    };
    mutable std::mutex executions_mutex_;
    std::unordered_map<uint64_t, Execution> executions_;

    std::mutex tick_mutex_;
    std::atomic<bool> running_{false};
    std::thread loop_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_requested_{false};
    EventBus::SubscriptionId subscription_{0};
};

} // namespace TaskRelay
