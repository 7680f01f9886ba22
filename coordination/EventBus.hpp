// EventBus.hpp - Synchronous fan-out of coordinator events
#pragma once

#include "coordination/Events.hpp"
#include "logger.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace TaskRelay {

/**
 * \brief Subscriber list for CoordinatorEvent.
 * \ingroup coordination_module
 *
 * Handlers run synchronously on the publishing thread, outside the bus lock,
 * so a handler may subscribe, unsubscribe or call back into the coordinator.
 * Publishers never hold an entity lock while publishing.
 */
class EventBus {
public:
    using SubscriptionId = uint64_t;
    using Handler = std::function<void(const CoordinatorEvent&)>;

    explicit EventBus(std::shared_ptr<Logger> logger);

    /// \return Id to pass to unsubscribe().
    SubscriptionId subscribe(Handler handler);
    /// \return false if \p id was not subscribed.
    bool unsubscribe(SubscriptionId id);

    /// Deliver \p event to every handler subscribed at the time of the call.
    void publish(const CoordinatorEvent& event);

    size_t subscriber_count() const;

private:
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_{1};
};

} // namespace TaskRelay
