/**
 * @file status_tracker.cpp
 * @brief Implementation of status_tracker
 */

#include "kcenon/orchestrator/status/status_tracker.h"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include "kcenon/orchestrator/core/logging.h"

namespace kcenon::orchestrator {

struct status_tracker::impl {
    explicit impl(event_bus& b) : bus(b) {}

    event_bus& bus;
    subscription_id subscription = 0;

    mutable std::shared_mutex mutex;
    std::unordered_map<task_id, status_entry> entries;
};

status_tracker::status_tracker(event_bus& bus) : impl_(std::make_unique<impl>(bus)) {
    impl_->subscription = bus.subscribe(
        [this](const lifecycle_event& event) { on_event(event); });
}

status_tracker::~status_tracker() {
    impl_->bus.unsubscribe(impl_->subscription);
}

void status_tracker::on_event(const lifecycle_event& event) {
    std::unique_lock lock(impl_->mutex);
    const auto& id = event.snapshot.id;

    if (event.type == lifecycle_event_type::evicted) {
        impl_->entries.erase(id);
        return;
    }

    auto it = impl_->entries.find(id);
    if (it != impl_->entries.end() && it->second.snapshot.is_terminal() &&
        event.type == lifecycle_event_type::progressed) {
        // Late progress after a terminal event carries no information
        ORCH_LOG_DEBUG(log_category::status,
            "Ignoring progress for terminal task " + id.to_string());
        return;
    }

    impl_->entries.insert_or_assign(id, status_entry{event.snapshot, event.type, event.timestamp});
}

auto status_tracker::list(const std::optional<std::string>& owner_id) const
    -> std::vector<status_entry> {
    std::vector<task_record> records;
    std::unordered_map<task_id, status_entry> selected;
    {
        std::shared_lock lock(impl_->mutex);
        for (const auto& [id, entry] : impl_->entries) {
            if (owner_id && entry.snapshot.owner_id != *owner_id) {
                continue;
            }
            records.push_back(entry.snapshot);
            selected.emplace(id, entry);
        }
    }

    sort_for_listing(records);

    std::vector<status_entry> ordered;
    ordered.reserve(records.size());
    for (const auto& record : records) {
        ordered.push_back(std::move(selected.at(record.id)));
    }
    return ordered;
}

auto status_tracker::detail(const task_id& id) const -> std::optional<status_entry> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->entries.find(id);
    if (it == impl_->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto status_tracker::acknowledge(const task_id& id) -> bool {
    std::unique_lock lock(impl_->mutex);
    auto it = impl_->entries.find(id);
    if (it == impl_->entries.end() || !it->second.snapshot.is_terminal()) {
        return false;
    }
    impl_->entries.erase(it);
    return true;
}

auto status_tracker::size() const -> std::size_t {
    std::shared_lock lock(impl_->mutex);
    return impl_->entries.size();
}

}  // namespace kcenon::orchestrator
