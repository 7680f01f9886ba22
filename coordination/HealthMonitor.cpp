#include "coordination/HealthMonitor.hpp"
#include "processUtils.hpp"

#include <stdexcept>

namespace TaskRelay {

HealthMonitor::HealthMonitor(std::shared_ptr<Logger> logger,
                             std::shared_ptr<AgentRegistry> registry,
                             std::shared_ptr<TaskScheduler> scheduler,
                             std::shared_ptr<EventBus> events,
                             HealthMonitorConfig config)
    : logger_(std::move(logger)),
      registry_(std::move(registry)),
      scheduler_(std::move(scheduler)),
      events_(std::move(events)),
      config_(config) {
    if (!logger_) throw std::invalid_argument("HealthMonitor: logger cannot be null");
    if (!registry_ || !scheduler_ || !events_) {
        throw std::invalid_argument("HealthMonitor: registry, scheduler and event bus are required");
    }
    if (config_.health_interval.count() <= 0 || config_.inactivity_threshold.count() <= 0) {
        throw std::invalid_argument("HealthMonitor: intervals must be positive");
    }
}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    thread_ = std::thread([this] { run(); });
    logger_->info("HealthMonitor started (interval " + std::to_string(config_.health_interval.count()) +
                  "ms, threshold " + std::to_string(config_.inactivity_threshold.count()) + "ms)");
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) return;
    {
        // Lock so the notification cannot fall between the predicate check and the wait
        std::lock_guard lk(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    logger_->info("HealthMonitor stopped");
}

void HealthMonitor::run() {
    ProcessUtils::set_current_thread_name("HealthMonitor");
    while (running_) {
        {
            std::unique_lock lk(wait_mutex_);
            wait_cv_.wait_for(lk, config_.health_interval, [this] { return !running_; });
        }
        if (!running_) break;
        try {
            sweep(Clock::now());
        } catch (const std::exception& e) {
            logger_->error("Health sweep failed: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> HealthMonitor::sweep(TimePoint now) {
    std::lock_guard lock(sweep_mutex_);
    std::vector<std::string> offline;
    for (const auto& agent_id : registry_->stale_agents(now, config_.inactivity_threshold)) {
        auto before = registry_->snapshot(agent_id);
        if (!before) continue;
        const int64_t idle_ms = elapsed_ms(before->last_activity, now);

        auto requeued = scheduler_->requeue_agent_tasks(agent_id, "agent unresponsive");
        registry_->set_availability(agent_id, Availability::Offline);
        logger_->warning("Agent " + agent_id + " unresponsive for " + std::to_string(idle_ms) +
                         "ms; marked offline, " + std::to_string(requeued.size()) + " task(s) requeued");
        events_->publish(AgentUnresponsive{agent_id, idle_ms, std::move(requeued)});
        offline.push_back(agent_id);
    }
    return offline;
}

} // namespace TaskRelay
