/**
 * @file event_bus.cpp
 * @brief Implementation of event_bus
 */

#include "kcenon/orchestrator/events/event_bus.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <vector>

#include "kcenon/orchestrator/core/logging.h"

namespace kcenon::orchestrator {

namespace {

struct subscriber {
    subscription_id id;
    event_handler handler;
    event_filter filter;
};

}  // namespace

struct event_bus::impl {
    mutable std::mutex mutex;
    std::vector<subscriber> subscribers;
    subscription_id next_id = 1;
    std::atomic<uint64_t> published{0};
};

event_bus::event_bus() : impl_(std::make_unique<impl>()) {}

event_bus::~event_bus() = default;

auto event_bus::subscribe(event_handler handler, event_filter filter) -> subscription_id {
    std::lock_guard lock(impl_->mutex);
    auto id = impl_->next_id++;
    impl_->subscribers.push_back(subscriber{id, std::move(handler), std::move(filter)});
    return id;
}

auto event_bus::unsubscribe(subscription_id id) -> bool {
    std::lock_guard lock(impl_->mutex);
    auto it = std::find_if(impl_->subscribers.begin(), impl_->subscribers.end(),
                           [id](const subscriber& s) { return s.id == id; });
    if (it == impl_->subscribers.end()) {
        return false;
    }
    impl_->subscribers.erase(it);
    return true;
}

void event_bus::publish(const lifecycle_event& event) {
    std::vector<std::pair<subscription_id, event_handler>> targets;
    {
        std::lock_guard lock(impl_->mutex);
        for (const auto& s : impl_->subscribers) {
            if (s.handler && s.filter.matches(event)) {
                targets.emplace_back(s.id, s.handler);
            }
        }
    }
    impl_->published.fetch_add(1, std::memory_order_relaxed);

    for (const auto& [id, handler] : targets) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ORCH_LOG_ERROR(log_category::events,
                "Subscriber " + std::to_string(id) + " threw on " + to_string(event.type) +
                " of task " + event.snapshot.id.to_string() + ": " + e.what());
        }
    }
}

auto event_bus::subscriber_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->subscribers.size();
}

auto event_bus::published_count() const -> uint64_t {
    return impl_->published.load(std::memory_order_relaxed);
}

}  // namespace kcenon::orchestrator
