#include "handoff/ConditionRegistry.hpp"

#include <mutex>
#include <stdexcept>

namespace TaskRelay {

void ConditionRegistry::register_condition(const std::string& name, ConditionSpec spec) {
    if (name.empty()) {
        throw std::invalid_argument("ConditionRegistry: condition name cannot be empty");
    }
    if (!spec.evaluate) {
        throw std::invalid_argument("ConditionRegistry: condition '" + name + "' has no function");
    }
    std::unique_lock lock(mutex_);
    conditions_[name] = std::move(spec);
}

bool ConditionRegistry::unregister_condition(const std::string& name) {
    std::unique_lock lock(mutex_);
    return conditions_.erase(name) > 0;
}

bool ConditionRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return conditions_.count(name) > 0;
}

std::optional<ConditionSpec> ConditionRegistry::get(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = conditions_.find(name);
    if (it == conditions_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> ConditionRegistry::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(conditions_.size());
    for (const auto& [name, spec] : conditions_) out.push_back(name);
    return out;
}

std::optional<double> ConditionRegistry::evaluate(const std::string& name, const ConditionInput& input) const {
    auto spec = get(name);
    if (!spec) return std::nullopt;
    // Called without the lock so a condition may consult the registry
    return spec->evaluate(input);
}

} // namespace TaskRelay
