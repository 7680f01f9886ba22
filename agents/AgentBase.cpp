#include "agents/AgentBase.hpp"

#include <stdexcept>

namespace TaskRelay {

AgentBase::AgentBase(std::string id, std::string type, std::set<std::string> capabilities)
    : id_(std::move(id)), type_(std::move(type)), capabilities_(std::move(capabilities)) {
    if (id_.empty()) {
        throw std::invalid_argument("AgentBase: agent id cannot be empty");
    }
}

std::set<std::string> AgentBase::list_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

void AgentBase::set_capabilities(std::set<std::string> capabilities) {
    std::lock_guard<std::mutex> lock(mutex_);
    capabilities_ = std::move(capabilities);
}

void AgentBase::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_listener_ = std::move(listener);
}

void AgentBase::set_handoff_listener(HandoffListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    handoff_listener_ = std::move(listener);
}

void AgentBase::emit_status(AgentStatusSignal signal) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = status_listener_;
    }
    if (listener) listener(id_, signal);
}

bool AgentBase::request_handoff(const HandoffRequest& request) {
    HandoffListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = handoff_listener_;
    }
    if (!listener) return false;
    return listener(request);
}

} // namespace TaskRelay
