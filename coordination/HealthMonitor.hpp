// HealthMonitor.hpp - Periodic sweep for unresponsive agents
#pragma once

#include "agents/AgentRegistry.hpp"
#include "coordination/EventBus.hpp"
#include "coordination/TaskScheduler.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace TaskRelay {

struct HealthMonitorConfig {
    std::chrono::milliseconds health_interval{60000};
    std::chrono::milliseconds inactivity_threshold{300000};
};

/**
 * \brief Takes idle agents offline and requeues their in-flight work.
 * \ingroup coordination_module
 *
 * Unlike unregistration the agent stays in the table; its next status signal
 * (or a re-registration) brings it back.
 */
class HealthMonitor {
public:
    HealthMonitor(std::shared_ptr<Logger> logger,
                  std::shared_ptr<AgentRegistry> registry,
                  std::shared_ptr<TaskScheduler> scheduler,
                  std::shared_ptr<EventBus> events,
                  HealthMonitorConfig config = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    /**
     * \brief Run one sweep as of \p now.
     * \return Ids of the agents taken offline.
     */
    std::vector<std::string> sweep(TimePoint now);

    const HealthMonitorConfig& config() const { return config_; }

private:
    void run();

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AgentRegistry> registry_;
    std::shared_ptr<TaskScheduler> scheduler_;
    std::shared_ptr<EventBus> events_;
    HealthMonitorConfig config_;

    std::mutex sweep_mutex_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace TaskRelay
