/**
 * @file lifecycle_event.h
 * @brief Task lifecycle notifications published by the scheduler
 */

#ifndef KCENON_ORCHESTRATOR_EVENTS_LIFECYCLE_EVENT_H
#define KCENON_ORCHESTRATOR_EVENTS_LIFECYCLE_EVENT_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/orchestrator/core/task_types.h"

namespace kcenon::orchestrator {

enum class lifecycle_event_type {
    queued,         ///< Created, or requeued for a retry
    started,        ///< Admitted and first engine started
    stage_changed,  ///< Moved between download, post-processing and upload
    progressed,     ///< Engine progress report
    completed,
    failed,
    canceled,
    evicted         ///< Terminal record dropped from the store
};

[[nodiscard]] constexpr auto to_string(lifecycle_event_type type) noexcept -> const char* {
    switch (type) {
        case lifecycle_event_type::queued: return "queued";
        case lifecycle_event_type::started: return "started";
        case lifecycle_event_type::stage_changed: return "stage_changed";
        case lifecycle_event_type::progressed: return "progressed";
        case lifecycle_event_type::completed: return "completed";
        case lifecycle_event_type::failed: return "failed";
        case lifecycle_event_type::canceled: return "canceled";
        case lifecycle_event_type::evicted: return "evicted";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_event_type(lifecycle_event_type type) noexcept -> bool {
    return type == lifecycle_event_type::completed ||
           type == lifecycle_event_type::failed ||
           type == lifecycle_event_type::canceled;
}

/**
 * @brief One lifecycle notification
 *
 * The snapshot is the task record right after the transition.
 */
struct lifecycle_event {
    lifecycle_event_type type = lifecycle_event_type::queued;
    task_record snapshot;
    std::chrono::system_clock::time_point timestamp;
    std::optional<task_state> previous_state;
};

/**
 * @brief Subscription filter; empty members match everything
 */
struct event_filter {
    std::optional<task_id> task;
    std::optional<std::string> owner;
    std::vector<lifecycle_event_type> types;

    [[nodiscard]] auto matches(const lifecycle_event& event) const -> bool {
        if (task && *task != event.snapshot.id) {
            return false;
        }
        if (owner && *owner != event.snapshot.owner_id) {
            return false;
        }
        if (types.empty()) {
            return true;
        }
        for (auto type : types) {
            if (type == event.type) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_EVENTS_LIFECYCLE_EVENT_H
