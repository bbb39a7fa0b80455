/**
 * @file status_tracker.h
 * @brief Aggregate view of task status built from lifecycle events
 */

#ifndef KCENON_ORCHESTRATOR_STATUS_STATUS_TRACKER_H
#define KCENON_ORCHESTRATOR_STATUS_STATUS_TRACKER_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/orchestrator/events/event_bus.h"
#include "kcenon/orchestrator/events/lifecycle_event.h"

namespace kcenon::orchestrator {

/**
 * @brief Latest known state of one task
 */
struct status_entry {
    task_record snapshot;
    lifecycle_event_type last_event = lifecycle_event_type::queued;
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Subscribes to an event_bus and keeps the latest snapshot per task
 *
 * Progress events overwrite the previous snapshot. Terminal entries stay
 * until acknowledge() or an evicted event. Queries copy under a shared
 * lock. The bus must outlive the tracker.
 *
 * @code
 * status_tracker tracker(sched.events());
 * for (const auto& entry : tracker.list("alice")) {
 *     render(entry.snapshot);
 * }
 * @endcode
 */
class status_tracker {
public:
    explicit status_tracker(event_bus& bus);
    ~status_tracker();

    status_tracker(const status_tracker&) = delete;
    auto operator=(const status_tracker&) -> status_tracker& = delete;

    /**
     * @brief Entries of one owner, or of everyone
     *
     * Active by start time, then queued by queue position, then terminal
     * by finish time.
     */
    [[nodiscard]] auto list(const std::optional<std::string>& owner_id = std::nullopt) const
        -> std::vector<status_entry>;

    [[nodiscard]] auto detail(const task_id& id) const -> std::optional<status_entry>;

    /**
     * @brief Drop a terminal entry
     * @return false if the entry is unknown or not terminal
     */
    auto acknowledge(const task_id& id) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    void on_event(const lifecycle_event& event);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_STATUS_STATUS_TRACKER_H
