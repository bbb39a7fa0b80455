/**
 * @file error_codes.h
 * @brief Failure kinds reported by transfer engines and pipeline stages
 *
 * A failed task carries one of these kinds together with a human readable
 * message. Engines decide retryability per failure; is_retryable() gives
 * the default used when an engine does not say otherwise.
 */

#ifndef KCENON_ORCHESTRATOR_CORE_ERROR_CODES_H
#define KCENON_ORCHESTRATOR_CORE_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::orchestrator {

/**
 * @brief Failure kinds (-700 to -799)
 *
 * - -700 to -709: transient transport failures
 * - -710 to -729: permanent source/destination failures
 * - -730 to -739: pipeline failures
 * - -740 to -749: orchestration failures
 */
enum class transfer_error_kind : int32_t {
    // Transient (-700 to -709)
    network_error = -700,
    timeout = -701,
    rate_limited = -702,
    engine_busy = -703,

    // Permanent (-710 to -729)
    invalid_source = -710,
    permission_denied = -711,
    quota_exceeded = -712,
    unsupported_format = -713,
    not_found = -714,
    storage_error = -715,

    // Pipeline (-730 to -739)
    post_processing_failed = -730,
    engine_unavailable = -731,

    // Orchestration (-740 to -749)
    cancel_timeout = -740,
    interrupted_by_restart = -741,
    internal = -749,
};

[[nodiscard]] constexpr auto to_string(transfer_error_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case transfer_error_kind::network_error:
            return "network_error";
        case transfer_error_kind::timeout:
            return "timeout";
        case transfer_error_kind::rate_limited:
            return "rate_limited";
        case transfer_error_kind::engine_busy:
            return "engine_busy";
        case transfer_error_kind::invalid_source:
            return "invalid_source";
        case transfer_error_kind::permission_denied:
            return "permission_denied";
        case transfer_error_kind::quota_exceeded:
            return "quota_exceeded";
        case transfer_error_kind::unsupported_format:
            return "unsupported_format";
        case transfer_error_kind::not_found:
            return "not_found";
        case transfer_error_kind::storage_error:
            return "storage_error";
        case transfer_error_kind::post_processing_failed:
            return "post_processing_failed";
        case transfer_error_kind::engine_unavailable:
            return "engine_unavailable";
        case transfer_error_kind::cancel_timeout:
            return "cancel_timeout";
        case transfer_error_kind::interrupted_by_restart:
            return "interrupted_by_restart";
        case transfer_error_kind::internal:
            return "internal";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse a failure kind from its string form
 */
[[nodiscard]] auto transfer_error_kind_from_string(std::string_view name)
    -> std::optional<transfer_error_kind>;

/**
 * @brief Check if a failure kind is retryable by default
 */
[[nodiscard]] constexpr auto is_retryable(transfer_error_kind kind) noexcept -> bool {
    switch (kind) {
        case transfer_error_kind::network_error:
        case transfer_error_kind::timeout:
        case transfer_error_kind::rate_limited:
        case transfer_error_kind::engine_busy:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check if a failure kind may be retried manually with retry_now
 *
 * Failures caused by the request itself stay failed: retrying an invalid
 * source or a missing engine cannot succeed.
 */
[[nodiscard]] constexpr auto is_manually_retryable(transfer_error_kind kind) noexcept
    -> bool {
    switch (kind) {
        case transfer_error_kind::invalid_source:
        case transfer_error_kind::unsupported_format:
        case transfer_error_kind::engine_unavailable:
        case transfer_error_kind::internal:
            return false;
        default:
            return true;
    }
}

/**
 * @brief Failure detail stored on a failed task
 */
struct task_error {
    transfer_error_kind kind = transfer_error_kind::internal;
    std::string message;

    task_error() = default;
    task_error(transfer_error_kind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    [[nodiscard]] auto operator==(const task_error& other) const -> bool = default;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_CORE_ERROR_CODES_H
