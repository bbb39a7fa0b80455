/**
 * @file task_state.h
 * @brief Task lifecycle states and the transition function
 */

#ifndef KCENON_ORCHESTRATOR_CORE_TASK_STATE_H
#define KCENON_ORCHESTRATOR_CORE_TASK_STATE_H

#include <optional>
#include <string_view>

#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

/**
 * @brief Lifecycle state of a task
 *
 * Initial state is queued; completed, failed and canceled are terminal.
 */
enum class task_state {
    queued,
    downloading,
    post_processing,
    uploading,
    completed,
    failed,
    canceled
};

[[nodiscard]] constexpr auto to_string(task_state state) noexcept -> const char* {
    switch (state) {
        case task_state::queued: return "queued";
        case task_state::downloading: return "downloading";
        case task_state::post_processing: return "post_processing";
        case task_state::uploading: return "uploading";
        case task_state::completed: return "completed";
        case task_state::failed: return "failed";
        case task_state::canceled: return "canceled";
        default: return "unknown";
    }
}

[[nodiscard]] auto task_state_from_string(std::string_view name) -> std::optional<task_state>;

[[nodiscard]] constexpr auto is_terminal_state(task_state state) noexcept -> bool {
    return state == task_state::completed ||
           state == task_state::failed ||
           state == task_state::canceled;
}

/**
 * @brief Check if a task in this state holds a concurrency slot
 */
[[nodiscard]] constexpr auto is_active_state(task_state state) noexcept -> bool {
    return state == task_state::downloading ||
           state == task_state::post_processing ||
           state == task_state::uploading;
}

/**
 * @brief Check if an engine is bound to a task in this state
 */
[[nodiscard]] constexpr auto is_engine_bound_state(task_state state) noexcept -> bool {
    return state == task_state::downloading || state == task_state::uploading;
}

/**
 * @brief Check whether an edge exists in the lifecycle graph
 */
[[nodiscard]] auto is_valid_transition(task_state from, task_state to) noexcept -> bool;

/**
 * @brief Stimulus that drives a task from one state to the next
 */
enum class task_trigger {
    admitted,               ///< Gate granted a slot
    download_succeeded,     ///< Download engine reported success
    post_step_succeeded,    ///< Last post-processing step finished
    post_step_failed,       ///< A post-processing step failed
    upload_succeeded,       ///< Upload engine finished one destination
    transfer_failed,        ///< Bound engine reported failure (or failed to start)
    cancel_requested,       ///< Caller asked for cancellation
    cancel_confirmed,       ///< Engine acknowledged a pending cancel
    cancel_timed_out,       ///< Engine did not acknowledge within the timeout
    interrupted,            ///< Process restarted while the task was active
    manual_retry            ///< retry_now on a failed task
};

[[nodiscard]] constexpr auto to_string(task_trigger trigger) noexcept -> const char* {
    switch (trigger) {
        case task_trigger::admitted: return "admitted";
        case task_trigger::download_succeeded: return "download_succeeded";
        case task_trigger::post_step_succeeded: return "post_step_succeeded";
        case task_trigger::post_step_failed: return "post_step_failed";
        case task_trigger::upload_succeeded: return "upload_succeeded";
        case task_trigger::transfer_failed: return "transfer_failed";
        case task_trigger::cancel_requested: return "cancel_requested";
        case task_trigger::cancel_confirmed: return "cancel_confirmed";
        case task_trigger::cancel_timed_out: return "cancel_timed_out";
        case task_trigger::interrupted: return "interrupted";
        case task_trigger::manual_retry: return "manual_retry";
        default: return "unknown";
    }
}

/**
 * @brief Facts about the task that select between alternative edges
 */
struct transition_context {
    bool download_complete = false;   ///< Source already fetched (retried upload)
    bool has_post_steps = false;      ///< Post-processing steps are configured
    bool more_destinations = false;   ///< Destinations remain after the current one
    bool retryable = false;           ///< Failure is retryable
    bool budget_remaining = false;    ///< retry_count < max_retries
};

/**
 * @brief Compute the next state for a trigger
 *
 * Deterministic: one (state, trigger, context) always yields the same
 * state. Returns invalid_state_transition when the trigger is not
 * accepted in the current state. A cancel request on a task bound to an
 * engine yields the current state: the transition happens on
 * cancel_confirmed or cancel_timed_out.
 */
[[nodiscard]] auto next_state(task_state current,
                              task_trigger trigger,
                              const transition_context& context = {})
    -> result<task_state>;

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_CORE_TASK_STATE_H
