/**
 * @file concurrency_gate.cpp
 * @brief Implementation of concurrency_gate
 */

#include "kcenon/orchestrator/gate/concurrency_gate.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_map>

#include "kcenon/orchestrator/core/logging.h"

namespace kcenon::orchestrator {

namespace {

struct waiting_entry {
    task_id id;
    std::string owner;
    task_priority priority;
};

}  // namespace

struct concurrency_gate::impl {
    mutable std::mutex mutex;
    gate_limits limits;
    std::unordered_map<std::string, std::size_t> owner_limits;

    std::unordered_map<task_id, std::string> active;
    std::unordered_map<std::string, std::size_t> owner_active;

    // Elevated entries are kept ahead of normal ones; FIFO within a class
    std::deque<waiting_entry> elevated;
    std::deque<waiting_entry> normal;

    [[nodiscard]] auto limit_for(const std::string& owner) const -> std::size_t {
        auto it = owner_limits.find(owner);
        return it != owner_limits.end() ? it->second : limits.per_owner_max;
    }

    [[nodiscard]] auto active_for(const std::string& owner) const -> std::size_t {
        auto it = owner_active.find(owner);
        return it != owner_active.end() ? it->second : 0;
    }

    [[nodiscard]] auto owner_saturated(const std::string& owner) const -> bool {
        return active_for(owner) >= limit_for(owner);
    }

    [[nodiscard]] auto global_saturated() const -> bool {
        return active.size() >= limits.global_max;
    }

    [[nodiscard]] auto is_waiting(const task_id& id) const -> bool {
        auto match = [&](const waiting_entry& e) { return e.id == id; };
        return std::any_of(elevated.begin(), elevated.end(), match) ||
               std::any_of(normal.begin(), normal.end(), match);
    }

    /**
     * True if an entry of this owner waits ahead of where a new entry of
     * the given priority would be placed.
     */
    [[nodiscard]] auto owner_waits_ahead(const std::string& owner, task_priority priority) const
        -> bool {
        auto match = [&](const waiting_entry& e) { return e.owner == owner; };
        if (std::any_of(elevated.begin(), elevated.end(), match)) {
            return true;
        }
        return priority == task_priority::normal &&
               std::any_of(normal.begin(), normal.end(), match);
    }

    auto admit(const task_id& id, const std::string& owner) -> result<void> {
        if (global_saturated()) {
            ORCH_LOG_FATAL(log_category::gate,
                "Admission of task " + id.to_string() + " would exceed global limit " +
                std::to_string(limits.global_max));
            return unexpected{error{error_code::internal_error,
                "admission would exceed global limit"}};
        }
        active.emplace(id, owner);
        ++owner_active[owner];
        return {};
    }

    /**
     * Admit waiting entries in queue order until the global limit is hit.
     */
    auto drain() -> std::vector<task_id> {
        std::vector<task_id> admitted;
        for (auto* queue : {&elevated, &normal}) {
            for (auto it = queue->begin(); it != queue->end();) {
                if (global_saturated()) {
                    return admitted;
                }
                if (owner_saturated(it->owner)) {
                    ++it;
                    continue;
                }
                auto granted = admit(it->id, it->owner);
                if (!granted) {
                    return admitted;
                }
                admitted.push_back(it->id);
                it = queue->erase(it);
            }
        }
        return admitted;
    }

    [[nodiscard]] auto position_of(const task_id& id) const -> std::optional<std::size_t> {
        std::size_t pos = 1;
        for (const auto* queue : {&elevated, &normal}) {
            for (const auto& entry : *queue) {
                if (entry.id == id) {
                    return pos;
                }
                ++pos;
            }
        }
        return std::nullopt;
    }

    void log_admitted(const std::vector<task_id>& admitted, const char* reason) const {
        for (const auto& id : admitted) {
            ORCH_LOG_DEBUG(log_category::gate,
                "Admitted waiting task " + id.to_string() + " after " + reason +
                " (active " + std::to_string(active.size()) + "/" +
                std::to_string(limits.global_max) + ")");
        }
    }
};

concurrency_gate::concurrency_gate() : impl_(std::make_unique<impl>()) {}

concurrency_gate::concurrency_gate(concurrency_gate&&) noexcept = default;
auto concurrency_gate::operator=(concurrency_gate&&) noexcept -> concurrency_gate& = default;
concurrency_gate::~concurrency_gate() = default;

auto concurrency_gate::create(gate_limits limits) -> result<concurrency_gate> {
    if (!limits.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
            "concurrency limits must be at least 1"}};
    }
    concurrency_gate gate;
    gate.impl_->limits = limits;
    return gate;
}

auto concurrency_gate::try_admit(const task_id& id,
                                 const std::string& owner_id,
                                 task_priority priority) -> result<admission> {
    std::lock_guard lock(impl_->mutex);

    if (impl_->active.count(id) > 0 || impl_->is_waiting(id)) {
        ORCH_LOG_ERROR(log_category::gate,
            "Task " + id.to_string() + " is already tracked by the gate");
        return unexpected{error{error_code::internal_error,
            "task already tracked by the gate"}};
    }

    if (!impl_->global_saturated() && !impl_->owner_saturated(owner_id) &&
        !impl_->owner_waits_ahead(owner_id, priority)) {
        auto granted = impl_->admit(id, owner_id);
        if (!granted) {
            return unexpected{granted.error()};
        }
        ORCH_LOG_DEBUG(log_category::gate,
            "Admitted task " + id.to_string() + " for owner " + owner_id + " (" +
            std::to_string(impl_->active_for(owner_id)) + "/" +
            std::to_string(impl_->limit_for(owner_id)) + ")");
        return admission::admitted();
    }

    auto& queue = priority == task_priority::elevated ? impl_->elevated : impl_->normal;
    queue.push_back(waiting_entry{id, owner_id, priority});

    auto position = impl_->position_of(id).value_or(0);
    ORCH_LOG_DEBUG(log_category::gate,
        "Queued task " + id.to_string() + " for owner " + owner_id + " at position " +
        std::to_string(position));
    return admission::queued(position);
}

auto concurrency_gate::release(const task_id& id) -> std::vector<task_id> {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->active.find(id);
    if (it == impl_->active.end()) {
        ORCH_LOG_WARN(log_category::gate,
            "Release of task " + id.to_string() + " which holds no slot");
        return {};
    }

    auto owner = it->second;
    impl_->active.erase(it);
    auto owner_it = impl_->owner_active.find(owner);
    if (owner_it != impl_->owner_active.end()) {
        if (--owner_it->second == 0) {
            impl_->owner_active.erase(owner_it);
        }
    }

    auto admitted = impl_->drain();
    impl_->log_admitted(admitted, "release");
    return admitted;
}

auto concurrency_gate::remove(const task_id& id) -> bool {
    std::lock_guard lock(impl_->mutex);
    for (auto* queue : {&impl_->elevated, &impl_->normal}) {
        auto it = std::find_if(queue->begin(), queue->end(),
                               [&](const waiting_entry& e) { return e.id == id; });
        if (it != queue->end()) {
            queue->erase(it);
            return true;
        }
    }
    return false;
}

auto concurrency_gate::set_limits(gate_limits limits) -> result<std::vector<task_id>> {
    if (!limits.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
            "concurrency limits must be at least 1"}};
    }

    std::lock_guard lock(impl_->mutex);
    ORCH_LOG_INFO(log_category::gate,
        "Limits changed: global " + std::to_string(impl_->limits.global_max) + " -> " +
        std::to_string(limits.global_max) + ", per owner " +
        std::to_string(impl_->limits.per_owner_max) + " -> " +
        std::to_string(limits.per_owner_max));
    impl_->limits = limits;

    auto admitted = impl_->drain();
    impl_->log_admitted(admitted, "limit change");
    return admitted;
}

auto concurrency_gate::set_owner_limit(const std::string& owner_id,
                                       std::optional<std::size_t> limit)
    -> result<std::vector<task_id>> {
    if (limit && *limit == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "owner limit must be at least 1"}};
    }

    std::lock_guard lock(impl_->mutex);
    if (limit) {
        impl_->owner_limits[owner_id] = *limit;
    } else {
        impl_->owner_limits.erase(owner_id);
    }

    auto admitted = impl_->drain();
    impl_->log_admitted(admitted, "owner limit change");
    return admitted;
}

auto concurrency_gate::owner_limit(const std::string& owner_id) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->limit_for(owner_id);
}

auto concurrency_gate::limits() const -> gate_limits {
    std::lock_guard lock(impl_->mutex);
    return impl_->limits;
}

auto concurrency_gate::queue_position(const task_id& id) const -> std::optional<std::size_t> {
    std::lock_guard lock(impl_->mutex);
    return impl_->position_of(id);
}

auto concurrency_gate::is_active(const task_id& id) const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->active.count(id) > 0;
}

auto concurrency_gate::active_count(const std::string& owner_id) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->active_for(owner_id);
}

auto concurrency_gate::total_active() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->active.size();
}

auto concurrency_gate::waiting_count() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->elevated.size() + impl_->normal.size();
}

auto concurrency_gate::waiting_tasks() const -> std::vector<task_id> {
    std::lock_guard lock(impl_->mutex);
    std::vector<task_id> ids;
    ids.reserve(impl_->elevated.size() + impl_->normal.size());
    for (const auto* queue : {&impl_->elevated, &impl_->normal}) {
        for (const auto& entry : *queue) {
            ids.push_back(entry.id);
        }
    }
    return ids;
}

}  // namespace kcenon::orchestrator
