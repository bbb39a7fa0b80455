/**
 * @file event_bus.h
 * @brief Broadcast channel for lifecycle events
 */

#ifndef KCENON_ORCHESTRATOR_EVENTS_EVENT_BUS_H
#define KCENON_ORCHESTRATOR_EVENTS_EVENT_BUS_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "kcenon/orchestrator/events/lifecycle_event.h"

namespace kcenon::orchestrator {

using subscription_id = uint64_t;
using event_handler = std::function<void(const lifecycle_event&)>;

/**
 * @brief Multi-producer multi-consumer publish/subscribe bus
 *
 * Handlers run on the publishing thread, outside the bus lock, in
 * subscription order. A handler may subscribe or unsubscribe from inside
 * a callback; the change applies from the next publish. A handler that
 * throws is logged and the remaining handlers still receive the event.
 *
 * @code
 * event_bus bus;
 * auto id = bus.subscribe([](const lifecycle_event& e) {
 *     std::cout << to_string(e.type) << "\n";
 * }, event_filter{.owner = "alice"});
 * bus.unsubscribe(id);
 * @endcode
 */
class event_bus {
public:
    event_bus();
    ~event_bus();

    event_bus(const event_bus&) = delete;
    auto operator=(const event_bus&) -> event_bus& = delete;

    /**
     * @brief Register a handler
     * @return Id for unsubscribe(); never 0
     */
    auto subscribe(event_handler handler, event_filter filter = {}) -> subscription_id;

    /**
     * @return true if the subscription existed
     */
    auto unsubscribe(subscription_id id) -> bool;

    /**
     * @brief Deliver an event to every matching subscriber
     */
    void publish(const lifecycle_event& event);

    [[nodiscard]] auto subscriber_count() const -> std::size_t;
    [[nodiscard]] auto published_count() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_EVENTS_EVENT_BUS_H
