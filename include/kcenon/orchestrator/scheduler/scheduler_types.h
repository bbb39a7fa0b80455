/**
 * @file scheduler_types.h
 * @brief Configuration, submission and statistics types of the scheduler
 */

#ifndef KCENON_ORCHESTRATOR_SCHEDULER_SCHEDULER_TYPES_H
#define KCENON_ORCHESTRATOR_SCHEDULER_SCHEDULER_TYPES_H

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

/**
 * @brief A request to create a task
 */
struct task_submission {
    task_source source;
    std::vector<task_destination> destinations;
    std::string owner_id;
    task_priority priority = task_priority::normal;
    std::optional<uint32_t> max_retries;  ///< Defaults to scheduler_config::default_max_retries
};

/**
 * @brief Delay before a retried task re-enters the gate
 */
struct retry_policy {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before retry number @p attempt (1-based)
     */
    [[nodiscard]] auto delay_for(uint32_t attempt) const -> std::chrono::milliseconds {
        if (attempt <= 1) {
            return std::min(initial_delay, max_delay);
        }
        auto scaled = static_cast<double>(initial_delay.count()) *
                      std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
        if (scaled >= static_cast<double>(max_delay.count())) {
            return max_delay;
        }
        return std::chrono::milliseconds(static_cast<int64_t>(scaled));
    }

    [[nodiscard]] auto is_valid() const -> bool {
        return initial_delay.count() >= 0 && max_delay >= initial_delay &&
               backoff_multiplier >= 1.0;
    }
};

/**
 * @brief Scheduler configuration
 */
struct scheduler_config {
    std::size_t global_limit = 4;
    std::size_t per_owner_limit = 1;
    uint32_t default_max_retries = 2;
    retry_policy retry;

    std::chrono::milliseconds cancel_timeout{30000};
    std::chrono::milliseconds retention{std::chrono::minutes(10)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(30)};

    /// Parent of per-task work directories (`<work_root>/<task id>`)
    std::filesystem::path work_root = std::filesystem::temp_directory_path() / "orchestrator";
    bool cleanup_work_dirs = true;

    /// Empty disables the journal
    std::filesystem::path journal_dir;

    /// Workers for post-processing steps; 0 picks hardware concurrency
    std::size_t pool_workers = 2;

    [[nodiscard]] auto is_valid() const -> bool {
        return global_limit > 0 && per_owner_limit > 0 && retry.is_valid() &&
               cancel_timeout.count() > 0 && sweep_interval.count() > 0 &&
               retention.count() >= 0 && !work_root.empty();
    }
};

/**
 * @brief Counters since start()
 */
struct scheduler_statistics {
    uint64_t submitted = 0;
    uint64_t rejected = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t canceled = 0;
    uint64_t retried = 0;
    uint64_t evicted = 0;
    uint64_t restored = 0;

    std::size_t active = 0;    ///< Tasks holding a gate slot
    std::size_t waiting = 0;   ///< Tasks in the gate's wait queue
    std::size_t retained = 0;  ///< Records in the store, terminal ones included
};

/**
 * @brief Authorization callback consulted after structural validation
 *
 * Returning quota_exceeded or permission_denied rejects the submission.
 */
using admission_hook = std::function<result<void>(const task_submission&)>;

/**
 * @brief Subscription tiers that map to per-owner concurrency limits
 */
enum class subscription_plan {
    free,
    basic,
    standard,
    premium
};

[[nodiscard]] constexpr auto to_string(subscription_plan plan) noexcept -> const char* {
    switch (plan) {
        case subscription_plan::free: return "free";
        case subscription_plan::basic: return "basic";
        case subscription_plan::standard: return "standard";
        case subscription_plan::premium: return "premium";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto concurrent_task_limit(subscription_plan plan) noexcept
    -> std::size_t {
    switch (plan) {
        case subscription_plan::free: return 1;
        case subscription_plan::basic: return 3;
        case subscription_plan::standard: return 5;
        case subscription_plan::premium: return 10;
        default: return 1;
    }
}

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_SCHEDULER_SCHEDULER_TYPES_H
