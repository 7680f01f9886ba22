// AgentSelector.hpp - Capability / performance scoring of available agents
#pragma once

#include "agents/AgentRegistry.hpp"
#include "logger.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TaskRelay {

/** \brief Named weights of the selection score. */
struct SelectionWeights {
    double capability_weight{0.7};
    double performance_weight{0.3};
    double success_rate_weight{0.6};
    double response_time_weight{0.4};
    double reference_response_ms{1000.0};  ///< Response time earning the full response-time score
};

struct SelectionScore {
    std::string agent_id;
    double capability_score{0.0};
    double performance_score{0.0};
    double total{0.0};
};

/**
 * \brief Picks the best available agent for a set of required capabilities.
 * \ingroup coordination_module
 *
 * capability = matched / required, where a requirement matches when some
 * capability contains it case-insensitively (empty requirements score 1.0).
 * performance = success_rate * 0.6 + min(1, 1000 / avg_ms) * 0.4.
 * total = capability * 0.7 + performance * 0.3.
 * The highest strictly positive total wins; ties go to the earliest
 * registered candidate. Stateless apart from the weights, safe to share.
 */
class AgentSelector {
public:
    AgentSelector(std::shared_ptr<Logger> logger, SelectionWeights weights = {});

    /// \return chosen agent id, or nullopt when no candidate scores above zero.
    std::optional<std::string> select(const std::vector<SelectionCandidate>& candidates,
                                      const std::vector<std::string>& required) const;

    /// Scores for every candidate whose capabilities could be listed, in candidate order.
    std::vector<SelectionScore> score_all(const std::vector<SelectionCandidate>& candidates,
                                          const std::vector<std::string>& required) const;

    static double capability_score(const std::set<std::string>& capabilities,
                                   const std::vector<std::string>& required);
    double performance_score(const PerformanceStats& performance) const;

    const SelectionWeights& weights() const { return weights_; }

private:
    std::shared_ptr<Logger> logger_;
    SelectionWeights weights_;
};

} // namespace TaskRelay
