// IHandoffAdvisor.hpp - Seam between the scheduler and the handoff rules
#pragma once

#include "agents/AgentTypes.hpp"
#include "message/HandoffEvent.hpp"
#include "message/TaskRecord.hpp"

#include <optional>
#include <string>

namespace TaskRelay {

enum class AdviceStage {
    Assignment,  ///< Agent reserved, execution not yet dispatched
    Completion   ///< Agent finished successfully; its result is the partial result
};

/** \brief Concrete transfer proposed by an advisor. */
struct HandoffPlan {
    std::string target_agent;
    HandoffReason reason;
    std::string rule_id;  ///< Empty for explicit directives
};

/**
 * \brief Decides whether a task should move to another agent.
 * \ingroup coordination_module
 *
 * Called by the scheduler without any task or agent lock held.
 */
class IHandoffAdvisor {
public:
    virtual ~IHandoffAdvisor() = default;

    virtual std::optional<HandoffPlan> advise(const TaskRecord& task,
                                              const AgentRegistration& current,
                                              AdviceStage stage,
                                              const std::optional<AgentResult>& partial_result) = 0;
};

} // namespace TaskRelay
