/**
 * @file task_state.cpp
 * @brief Task lifecycle transition table
 */

#include "kcenon/orchestrator/core/task_state.h"

#include <string>

namespace kcenon::orchestrator {

namespace {

auto rejected(task_state current, task_trigger trigger) -> unexpected {
    return unexpected{error{error_code::invalid_state_transition,
        std::string("trigger ") + to_string(trigger) +
        " not accepted in state " + to_string(current)}};
}

}  // namespace

auto task_state_from_string(std::string_view name) -> std::optional<task_state> {
    for (auto state : {task_state::queued, task_state::downloading,
                       task_state::post_processing, task_state::uploading,
                       task_state::completed, task_state::failed,
                       task_state::canceled}) {
        if (name == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

auto is_valid_transition(task_state from, task_state to) noexcept -> bool {
    switch (from) {
        case task_state::queued:
            return to == task_state::downloading ||
                   to == task_state::uploading ||
                   to == task_state::canceled;
        case task_state::downloading:
            return to == task_state::post_processing ||
                   to == task_state::uploading ||
                   to == task_state::queued ||
                   to == task_state::failed ||
                   to == task_state::canceled;
        case task_state::post_processing:
            return to == task_state::uploading ||
                   to == task_state::failed ||
                   to == task_state::canceled;
        case task_state::uploading:
            return to == task_state::uploading ||
                   to == task_state::completed ||
                   to == task_state::queued ||
                   to == task_state::failed ||
                   to == task_state::canceled;
        case task_state::failed:
            // Manual retry only
            return to == task_state::queued;
        case task_state::completed:
        case task_state::canceled:
        default:
            return false;
    }
}

auto next_state(task_state current,
                task_trigger trigger,
                const transition_context& context) -> result<task_state> {
    switch (trigger) {
        case task_trigger::admitted:
            if (current != task_state::queued) break;
            return context.download_complete ? task_state::uploading
                                             : task_state::downloading;

        case task_trigger::download_succeeded:
            if (current != task_state::downloading) break;
            return context.has_post_steps ? task_state::post_processing
                                          : task_state::uploading;

        case task_trigger::post_step_succeeded:
            if (current != task_state::post_processing) break;
            return task_state::uploading;

        case task_trigger::post_step_failed:
            if (current != task_state::post_processing) break;
            return task_state::failed;

        case task_trigger::upload_succeeded:
            if (current != task_state::uploading) break;
            return context.more_destinations ? task_state::uploading
                                             : task_state::completed;

        case task_trigger::transfer_failed:
            if (!is_engine_bound_state(current)) break;
            return (context.retryable && context.budget_remaining) ? task_state::queued
                                                                   : task_state::failed;

        case task_trigger::cancel_requested:
            if (current == task_state::queued || current == task_state::post_processing) {
                return task_state::canceled;
            }
            if (is_engine_bound_state(current)) {
                return current;
            }
            break;

        case task_trigger::cancel_confirmed:
            if (!is_engine_bound_state(current)) break;
            return task_state::canceled;

        case task_trigger::cancel_timed_out:
            if (!is_engine_bound_state(current)) break;
            return task_state::failed;

        case task_trigger::interrupted:
            if (!is_active_state(current)) break;
            return task_state::failed;

        case task_trigger::manual_retry:
            if (current != task_state::failed) break;
            if (!context.retryable || !context.budget_remaining) break;
            return task_state::queued;

        default:
            break;
    }
    return rejected(current, trigger);
}

}  // namespace kcenon::orchestrator
