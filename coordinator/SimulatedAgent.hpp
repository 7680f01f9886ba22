/**
 * \file coordinator/SimulatedAgent.hpp
 * \brief Demo agent with configurable latency, failure rate and handoff trigger.
 */
#pragma once

#include "agents/AgentBase.hpp"
#include "CoordinatorOptions.hpp"
#include "logger.hpp"

#include <memory>
#include <mutex>
#include <random>

/**
 * \brief Agent that sleeps for its latency and reports a synthetic result.
 *
 * When the task text contains the configured handoff keyword (and the task has
 * not been handed off before) the agent asks the coordinator to move the task
 * to an agent with its handoff capabilities.
 */
class SimulatedAgent : public TaskRelay::AgentBase {
public:
    SimulatedAgent(SimulatedAgentSpec spec, std::shared_ptr<Logger> logger);

    std::future<TaskRelay::AgentResult> execute(std::shared_ptr<const TaskRelay::TaskContext> context) override;

    const SimulatedAgentSpec& spec() const { return spec_; }

private:
    TaskRelay::AgentResult run(std::shared_ptr<const TaskRelay::TaskContext> context);
    bool roll_failure();
    bool wants_handoff(const TaskRelay::TaskContext& context) const;

    SimulatedAgentSpec spec_;
    std::shared_ptr<Logger> logger_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};
