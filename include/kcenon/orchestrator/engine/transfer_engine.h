/**
 * @file transfer_engine.h
 * @brief Capability interface implemented by download and upload backends
 *
 * An engine performs one download or one upload per start() call and
 * reports through the sink it was given:
 * - any number of progress_event
 * - exactly one terminal event: succeeded_event, failed_event or canceled_event
 *
 * Events may be emitted from any thread, including from inside start().
 * Failures are reported as error results or failed_event; an exception
 * escaping start() or cancel() must derive from std::exception.
 * The scheduler never starts a second transfer on a handle and never
 * calls cancel() after it has observed a terminal event for that handle.
 */

#ifndef KCENON_ORCHESTRATOR_ENGINE_TRANSFER_ENGINE_H
#define KCENON_ORCHESTRATOR_ENGINE_TRANSFER_ENGINE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "kcenon/orchestrator/core/error_codes.h"
#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

enum class transfer_direction {
    download,
    upload
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) noexcept -> const char* {
    switch (direction) {
        case transfer_direction::download: return "download";
        case transfer_direction::upload: return "upload";
        default: return "unknown";
    }
}

/**
 * @brief Everything an engine needs to perform one transfer
 */
struct transfer_request {
    task_id task;
    std::string owner_id;
    transfer_direction direction = transfer_direction::download;

    /// Source for downloads, one destination for uploads
    std::variant<task_source, task_destination> locator;

    /// Per-task scratch directory; downloads write here
    std::filesystem::path work_dir;

    /// File or directory to upload (uploads only)
    std::filesystem::path input_path;

    /// Position of the destination in the task's list (uploads only)
    std::size_t destination_index = 0;
};

// ============================================================================
// Engine events
// ============================================================================

struct progress_event {
    uint64_t transferred_bytes = 0;
    std::optional<uint64_t> total_bytes;
    double rate = 0.0;
    std::optional<std::chrono::milliseconds> eta;
};

/**
 * @brief Transfer finished
 *
 * For downloads the locator is the local path of the fetched content,
 * for uploads it is whatever identifies the uploaded copy (link, message id).
 */
struct succeeded_event {
    std::string result_locator;
};

struct failed_event {
    transfer_error_kind kind = transfer_error_kind::internal;
    std::string message;
    bool retryable = false;

    /**
     * @brief Failure whose retryability follows is_retryable(kind)
     */
    [[nodiscard]] static auto of(transfer_error_kind kind, std::string message) -> failed_event {
        return failed_event{kind, std::move(message), is_retryable(kind)};
    }
};

struct canceled_event {};

using engine_event = std::variant<progress_event, succeeded_event, failed_event, canceled_event>;

[[nodiscard]] inline auto is_terminal_event(const engine_event& event) -> bool {
    return !std::holds_alternative<progress_event>(event);
}

/**
 * @brief Callback an engine reports through
 *
 * Bound by the scheduler to one started transfer; never blocks on
 * scheduler state.
 */
using engine_event_sink = std::function<void(engine_event)>;

// ============================================================================
// Engine interface
// ============================================================================

class transfer_engine {
public:
    virtual ~transfer_engine() = default;

    /**
     * @brief Engine name used in logs
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Begin a transfer
     *
     * An error return means the transfer never started; no event will be
     * emitted for it and the scheduler treats it as a failed attempt.
     */
    [[nodiscard]] virtual auto start(const transfer_request& request, engine_event_sink sink)
        -> result<engine_handle> = 0;

    /**
     * @brief Ask a running transfer to stop
     *
     * Cooperative: the engine acknowledges with canceled_event (or any
     * terminal event if the transfer finished first).
     */
    [[nodiscard]] virtual auto cancel(engine_handle handle) -> result<void> = 0;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_ENGINE_TRANSFER_ENGINE_H
