/**
 * @file types.h
 * @brief Core type definitions for transfer_orchestrator_system
 */

#ifndef KCENON_ORCHESTRATOR_CORE_TYPES_H
#define KCENON_ORCHESTRATOR_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::orchestrator {

/**
 * @brief Error codes returned by orchestrator operations
 */
enum class error_code {
    success = 0,

    // Submission errors (-100 to -119)
    invalid_source = -100,
    no_destinations = -101,
    engine_unavailable = -102,
    quota_exceeded = -103,
    permission_denied = -104,

    // Control errors (-120 to -139)
    task_not_found = -120,
    already_terminal = -121,
    not_retryable = -122,
    invalid_state_transition = -123,
    wait_timeout = -124,

    // Transfer errors (-140 to -159)
    transfer_failed = -140,
    cancel_timeout = -141,
    interrupted_by_restart = -142,

    // Configuration errors (-160 to -179)
    invalid_configuration = -160,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_running = -201,
    already_running = -202,

    // Persistence errors (-220 to -239)
    journal_io_error = -220,
    journal_corrupted = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_source:
            return "invalid source";
        case error_code::no_destinations:
            return "no destinations";
        case error_code::engine_unavailable:
            return "engine unavailable";
        case error_code::quota_exceeded:
            return "quota exceeded";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::task_not_found:
            return "task not found";
        case error_code::already_terminal:
            return "task already terminal";
        case error_code::not_retryable:
            return "task not retryable";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::wait_timeout:
            return "wait timed out";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::cancel_timeout:
            return "cancel timeout";
        case error_code::interrupted_by_restart:
            return "interrupted by restart";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_running:
            return "scheduler not running";
        case error_code::already_running:
            return "scheduler already running";
        case error_code::journal_io_error:
            return "journal I/O error";
        case error_code::journal_corrupted:
            return "journal record corrupted";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code is raised at submission time
 *
 * Structural errors are surfaced to the caller immediately and never
 * enter the wait queue.
 */
[[nodiscard]] constexpr auto is_submission_error(error_code code) -> bool {
    return static_cast<int>(code) <= -100 && static_cast<int>(code) >= -119;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, in the spirit of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier of an orchestrated task
 *
 * Zero is reserved as the invalid id.
 */
struct task_id {
    uint64_t value;

    task_id() : value(0) {}
    explicit task_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto is_valid() const noexcept -> bool { return value != 0; }
    [[nodiscard]] auto to_string() const -> std::string { return std::to_string(value); }

    [[nodiscard]] auto operator==(const task_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const task_id& other) const -> bool {
        return value < other.value;
    }
};

/**
 * @brief Identifier of one transfer started on an engine
 */
struct engine_handle {
    uint64_t value;

    engine_handle() : value(0) {}
    explicit engine_handle(uint64_t v) : value(v) {}

    [[nodiscard]] auto is_valid() const noexcept -> bool { return value != 0; }
    [[nodiscard]] auto operator==(const engine_handle& other) const -> bool = default;
};

}  // namespace kcenon::orchestrator

// Hash support for task_id
template <>
struct std::hash<kcenon::orchestrator::task_id> {
    auto operator()(const kcenon::orchestrator::task_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_ORCHESTRATOR_CORE_TYPES_H
