/**
 * \file coordinator/CoordinatorOptions.hpp
 * \brief Option types and accessors for the task-relay process.
 */
#pragma once

#include "coordination/Coordinator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

/** \brief One simulated agent started by the demo process. */
struct SimulatedAgentSpec {
    std::string id;
    std::string type;
    std::set<std::string> capabilities;
    uint32_t latency_ms{200};
    double failure_rate{0.0};             ///< Probability in [0,1] that an execution fails
    std::string handoff_keyword;          ///< Task text that makes the agent ask for a handoff
    std::vector<std::string> handoff_capabilities;
};

/** \brief A task shape the workload generator cycles through. */
struct WorkloadTemplate {
    std::string task;
    std::vector<std::string> capabilities;
    TaskRelay::TaskPriority priority{TaskRelay::TaskPriority::Medium};
    nlohmann::json metadata = nlohmann::json::object();
};

/** \brief Demo workload pacing. */
struct WorkloadOptions {
    uint32_t interval_ms{2000};  ///< Delay between batches
    uint32_t batch_size{3};
    uint32_t max_tasks{30};      ///< 0 = unbounded
    std::vector<WorkloadTemplate> templates;  ///< Empty = built-in templates
};

namespace coordinator_opts {

/**
 * \brief Register the `coordinator` option provider.
 *
 * Safe to call more than once; only the first call registers.
 */
void register_options();

/// Coordinator configuration assembled from the JSON section and CLI overrides.
TaskRelay::CoordinatorConfig get_coordinator_config();
std::string get_log_level();
uint32_t get_stats_interval_s();
std::vector<SimulatedAgentSpec> get_agents();
WorkloadOptions get_workload();

/// Built-in agent line-up used when the config names none.
std::vector<SimulatedAgentSpec> default_agents();

} // namespace coordinator_opts
