#include "agents/AgentRegistry.hpp"

#include <algorithm>
#include <stdexcept>

/**
 * \file agents/AgentRegistry.cpp
 * \brief Implements registration, availability transitions and performance updates.
 * \ingroup agents_module
 */

namespace TaskRelay {

AgentRegistry::AgentRegistry(std::shared_ptr<Logger> logger, std::shared_ptr<EventBus> events)
    : logger_(std::move(logger)), events_(std::move(events)) {
    if (!logger_) {
        throw std::invalid_argument("AgentRegistry: logger cannot be null");
    }
    if (!events_) {
        throw std::invalid_argument("AgentRegistry: event bus cannot be null");
    }
}

std::set<std::string> AgentRegistry::query_capabilities(const IAgent& agent) const {
    try {
        return agent.list_capabilities();
    } catch (const std::exception& e) {
        logger_->warning("Agent " + agent.id() + " failed to list capabilities: " + e.what());
        return {};
    }
}

bool AgentRegistry::register_agent(std::shared_ptr<IAgent> agent) {
    if (!agent) {
        throw std::invalid_argument("AgentRegistry: agent cannot be null");
    }
    const std::string id = agent->id();
    if (id.empty()) {
        throw std::invalid_argument("AgentRegistry: agent id cannot be empty");
    }
    auto capabilities = query_capabilities(*agent);
    const auto now = Clock::now();

    std::shared_ptr<AgentEntry> entry;
    bool created = false;
    {
        std::unique_lock lock(table_mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            entry = std::make_shared<AgentEntry>();
            entry->reg.registration_seq = next_seq_++;
            entries_.emplace(id, entry);
            created = true;
        } else {
            entry = it->second;
        }
    }

    Availability previous = Availability::Available;
    Availability current = Availability::Available;
    {
        std::lock_guard elock(entry->mutex);
        previous = entry->reg.availability;
        entry->agent = agent;
        entry->reg.agent_id = id;
        entry->reg.agent_type = agent->type();
        entry->reg.capabilities = std::move(capabilities);
        entry->reg.last_activity = now;
        if (created || !entry->reg.current_task) {
            entry->reg.availability = Availability::Available;
        }
        current = entry->reg.availability;
    }

    logger_->info(std::string(created ? "Registered" : "Updated") + " agent " + id + " (" + agent->type() + ")");
    events_->publish(AgentRegistered{id, agent->type(), !created});
    if (!created && previous != current) {
        publish_change(id, previous, current);
    }
    return created;
}

std::shared_ptr<IAgent> AgentRegistry::remove(const std::string& agent_id) {
    std::shared_ptr<AgentEntry> entry;
    {
        std::unique_lock lock(table_mutex_);
        auto it = entries_.find(agent_id);
        if (it == entries_.end()) return nullptr;
        entry = it->second;
        entries_.erase(it);
    }
    std::lock_guard elock(entry->mutex);
    return entry->agent;
}

bool AgentRegistry::contains(const std::string& agent_id) const {
    std::shared_lock lock(table_mutex_);
    return entries_.count(agent_id) > 0;
}

std::shared_ptr<IAgent> AgentRegistry::agent(const std::string& agent_id) const {
    auto entry = find_entry(agent_id);
    if (!entry) return nullptr;
    std::lock_guard elock(entry->mutex);
    return entry->agent;
}

size_t AgentRegistry::size() const {
    std::shared_lock lock(table_mutex_);
    return entries_.size();
}

bool AgentRegistry::set_availability(const std::string& agent_id, Availability availability) {
    auto entry = find_entry(agent_id);
    if (!entry) return false;
    Availability previous;
    {
        std::lock_guard elock(entry->mutex);
        previous = entry->reg.availability;
        if (availability == Availability::Available && entry->reg.current_task) {
            logger_->warning("Agent " + agent_id + " is running task " + *entry->reg.current_task +
                             "; refusing to mark it available");
            return false;
        }
        entry->reg.availability = availability;
        entry->reg.last_activity = Clock::now();
        if (availability == Availability::Offline) {
            entry->reg.current_task.reset();
        }
    }
    if (previous != availability) {
        publish_change(agent_id, previous, availability);
    }
    return true;
}

bool AgentRegistry::try_reserve(const std::string& agent_id, const std::string& task_id) {
    auto entry = find_entry(agent_id);
    if (!entry) return false;
    {
        std::lock_guard elock(entry->mutex);
        if (entry->reg.availability != Availability::Available) return false;
        entry->reg.availability = Availability::Busy;
        entry->reg.current_task = task_id;
        entry->reg.last_activity = Clock::now();
    }
    publish_change(agent_id, Availability::Available, Availability::Busy);
    return true;
}

bool AgentRegistry::release(const std::string& agent_id, const std::string& task_id) {
    auto entry = find_entry(agent_id);
    if (!entry) return false;
    Availability previous;
    {
        std::lock_guard elock(entry->mutex);
        if (!entry->reg.current_task || *entry->reg.current_task != task_id) return false;
        entry->reg.current_task.reset();
        entry->reg.last_activity = Clock::now();
        previous = entry->reg.availability;
        if (previous == Availability::Busy) {
            entry->reg.availability = Availability::Available;
        }
    }
    if (previous == Availability::Busy) {
        publish_change(agent_id, Availability::Busy, Availability::Available);
    }
    return true;
}

bool AgentRegistry::record_completion(const std::string& agent_id, bool success, double response_ms) {
    auto entry = find_entry(agent_id);
    if (!entry) return false;
    std::lock_guard elock(entry->mutex);
    auto& perf = entry->reg.performance;
    const double n = static_cast<double>(perf.tasks_completed);
    perf.success_rate = (perf.success_rate * n + (success ? 1.0 : 0.0)) / (n + 1.0);
    perf.average_response_time_ms = (perf.average_response_time_ms * n + (std::max)(0.0, response_ms)) / (n + 1.0);
    perf.tasks_completed++;
    entry->reg.last_activity = Clock::now();
    return true;
}

bool AgentRegistry::apply_status_signal(const std::string& agent_id, AgentStatusSignal signal) {
    auto entry = find_entry(agent_id);
    if (!entry) return false;
    Availability previous;
    Availability current;
    {
        std::lock_guard elock(entry->mutex);
        entry->reg.last_activity = Clock::now();
        previous = entry->reg.availability;
        const bool has_task = entry->reg.current_task.has_value();
        switch (signal) {
            case AgentStatusSignal::Idle:
                if (previous == Availability::Offline || (previous == Availability::Busy && !has_task)) {
                    entry->reg.availability = Availability::Available;
                }
                break;
            case AgentStatusSignal::Busy:
                if (previous == Availability::Available && !has_task) {
                    entry->reg.availability = Availability::Busy;
                }
                break;
            case AgentStatusSignal::Failed:
            case AgentStatusSignal::Completed:
                if (previous == Availability::Offline) {
                    entry->reg.availability = Availability::Available;
                }
                break;
        }
        current = entry->reg.availability;
    }
    logger_->debug("Agent " + agent_id + " signalled " + to_string(signal));
    if (previous != current) {
        publish_change(agent_id, previous, current);
    }
    return true;
}

std::vector<SelectionCandidate> AgentRegistry::available_candidates(const std::set<std::string>& exclude) const {
    std::vector<SelectionCandidate> out;
    for (const auto& entry : entries_in_order()) {
        std::lock_guard elock(entry->mutex);
        if (entry->reg.availability != Availability::Available) continue;
        if (exclude.count(entry->reg.agent_id)) continue;
        out.push_back(SelectionCandidate{entry->reg, entry->agent});
    }
    return out;
}

std::vector<std::string> AgentRegistry::stale_agents(TimePoint now, std::chrono::milliseconds threshold) const {
    std::vector<std::string> out;
    for (const auto& entry : entries_in_order()) {
        std::lock_guard elock(entry->mutex);
        if (entry->reg.availability == Availability::Offline) continue;
        if (now - entry->reg.last_activity > threshold) {
            out.push_back(entry->reg.agent_id);
        }
    }
    return out;
}

std::optional<AgentRegistration> AgentRegistry::snapshot(const std::string& agent_id) const {
    auto entry = find_entry(agent_id);
    if (!entry) return std::nullopt;
    std::lock_guard elock(entry->mutex);
    return entry->reg;
}

std::vector<AgentRegistration> AgentRegistry::snapshot_all() const {
    std::vector<AgentRegistration> out;
    for (const auto& entry : entries_in_order()) {
        std::lock_guard elock(entry->mutex);
        out.push_back(entry->reg);
    }
    return out;
}

std::vector<AgentRegistration> AgentRegistry::agents_by_type(const std::string& agent_type) const {
    std::vector<AgentRegistration> out;
    for (const auto& entry : entries_in_order()) {
        std::lock_guard elock(entry->mutex);
        if (entry->reg.agent_type == agent_type) out.push_back(entry->reg);
    }
    return out;
}

std::shared_ptr<AgentRegistry::AgentEntry> AgentRegistry::find_entry(const std::string& agent_id) const {
    std::shared_lock lock(table_mutex_);
    auto it = entries_.find(agent_id);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<AgentRegistry::AgentEntry>> AgentRegistry::entries_in_order() const {
    std::vector<std::pair<uint64_t, std::shared_ptr<AgentEntry>>> keyed;
    {
        std::shared_lock lock(table_mutex_);
        keyed.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            std::lock_guard elock(entry->mutex);
            keyed.emplace_back(entry->reg.registration_seq, entry);
        }
    }
    std::sort(keyed.begin(), keyed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<std::shared_ptr<AgentEntry>> out;
    out.reserve(keyed.size());
    for (auto& k : keyed) out.push_back(std::move(k.second));
    return out;
}

void AgentRegistry::publish_change(const std::string& agent_id, Availability previous, Availability current) {
    events_->publish(AgentAvailabilityChanged{agent_id, previous, current});
}

} // namespace TaskRelay
