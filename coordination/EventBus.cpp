#include "coordination/EventBus.hpp"

#include <stdexcept>
#include <vector>

namespace TaskRelay {

EventBus::EventBus(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("EventBus: logger cannot be null");
    }
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    if (!handler) {
        throw std::invalid_argument("EventBus: handler cannot be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(id) > 0;
}

void EventBus::publish(const CoordinatorEvent& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& [id, h] : handlers_) handlers.push_back(h);
    }
    logger_->debug("Event: " + describe(event));
    for (const auto& h : handlers) {
        try {
            h(event);
        } catch (const std::exception& e) {
            // One faulty subscriber must not stop delivery to the others
            logger_->error("EventBus: handler failed on " + event_name(event) + ": " + e.what());
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace TaskRelay
