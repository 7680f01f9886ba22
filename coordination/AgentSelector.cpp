#include "coordination/AgentSelector.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace TaskRelay {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

AgentSelector::AgentSelector(std::shared_ptr<Logger> logger, SelectionWeights weights)
    : logger_(std::move(logger)), weights_(weights) {
    if (!logger_) {
        throw std::invalid_argument("AgentSelector: logger cannot be null");
    }
    if (weights_.reference_response_ms <= 0.0) {
        throw std::invalid_argument("AgentSelector: reference_response_ms must be positive");
    }
}

double AgentSelector::capability_score(const std::set<std::string>& capabilities,
                                       const std::vector<std::string>& required) {
    if (required.empty()) return 1.0;

    std::vector<std::string> lowered;
    lowered.reserve(capabilities.size());
    for (const auto& c : capabilities) lowered.push_back(lowercase(c));

    size_t matched = 0;
    for (const auto& req : required) {
        const auto needle = lowercase(req);
        bool hit = std::any_of(lowered.begin(), lowered.end(), [&](const std::string& cap) {
            return cap.find(needle) != std::string::npos;
        });
        if (hit) ++matched;
    }
    return static_cast<double>(matched) / static_cast<double>(required.size());
}

double AgentSelector::performance_score(const PerformanceStats& performance) const {
    const double avg = performance.average_response_time_ms;
    const double speed = avg <= 0.0 ? 1.0 : (std::min)(1.0, weights_.reference_response_ms / avg);
    return performance.success_rate * weights_.success_rate_weight + speed * weights_.response_time_weight;
}

std::vector<SelectionScore> AgentSelector::score_all(const std::vector<SelectionCandidate>& candidates,
                                                     const std::vector<std::string>& required) const {
    std::vector<SelectionScore> scores;
    scores.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (!c.agent) continue;
        std::set<std::string> capabilities;
        try {
            capabilities = c.agent->list_capabilities();
        } catch (const std::exception& e) {
            logger_->warning("Skipping agent " + c.registration.agent_id +
                             ": capability listing failed: " + e.what());
            continue;
        }
        SelectionScore s;
        s.agent_id = c.registration.agent_id;
        s.capability_score = capability_score(capabilities, required);
        s.performance_score = performance_score(c.registration.performance);
        s.total = s.capability_score * weights_.capability_weight + s.performance_score * weights_.performance_weight;
        scores.push_back(std::move(s));
    }
    return scores;
}

std::optional<std::string> AgentSelector::select(const std::vector<SelectionCandidate>& candidates,
                                                 const std::vector<std::string>& required) const {
    if (candidates.empty()) return std::nullopt;

    // Candidates arrive in registration order; strict > keeps the earliest on ties
    const SelectionScore* best = nullptr;
    auto scores = score_all(candidates, required);
    for (const auto& s : scores) {
        if (s.total <= 0.0) continue;
        if (!best || s.total > best->total) best = &s;
    }
    if (!best) return std::nullopt;
    logger_->debug("Selected agent " + best->agent_id + " score=" + std::to_string(best->total));
    return best->agent_id;
}

} // namespace TaskRelay
