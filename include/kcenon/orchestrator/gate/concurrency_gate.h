/**
 * @file concurrency_gate.h
 * @brief Global and per-owner limits on simultaneously active tasks
 */

#ifndef KCENON_ORCHESTRATOR_GATE_CONCURRENCY_GATE_H
#define KCENON_ORCHESTRATOR_GATE_CONCURRENCY_GATE_H

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"

namespace kcenon::orchestrator {

/**
 * @brief Configured maxima
 */
struct gate_limits {
    std::size_t global_max = 4;
    std::size_t per_owner_max = 1;

    [[nodiscard]] auto is_valid() const -> bool {
        return global_max > 0 && per_owner_max > 0;
    }

    [[nodiscard]] auto operator==(const gate_limits&) const -> bool = default;
};

/**
 * @brief Outcome of an admission attempt
 */
struct admission {
    bool granted = false;
    std::size_t position = 0;  ///< 1-based wait queue position when not granted

    [[nodiscard]] static auto admitted() -> admission { return {true, 0}; }
    [[nodiscard]] static auto queued(std::size_t pos) -> admission { return {false, pos}; }
};

/**
 * @brief Counting gate with a priority-ordered wait queue
 *
 * A task is admitted at once when the global count and its owner's count
 * are below their maxima and the owner has no earlier waiting entry.
 * Otherwise it waits. The queue is ordered by priority class (elevated
 * first), then by enqueue sequence. Whenever capacity appears the queue is
 * scanned in that order: entries whose owner is saturated are skipped,
 * others are admitted, and the scan stops once the global limit is reached.
 *
 * Per-owner overrides take precedence over per_owner_max; they model
 * subscription plans.
 *
 * All operations are serialized by one internal mutex.
 *
 * @code
 * auto gate = concurrency_gate::create({2, 1});
 * auto a = gate.value().try_admit(task_id{1}, "alice", task_priority::normal);
 * // a.value().granted == true
 * auto next = gate.value().release(task_id{1});
 * @endcode
 */
class concurrency_gate {
public:
    [[nodiscard]] static auto create(gate_limits limits = {}) -> result<concurrency_gate>;

    concurrency_gate(const concurrency_gate&) = delete;
    auto operator=(const concurrency_gate&) -> concurrency_gate& = delete;
    concurrency_gate(concurrency_gate&&) noexcept;
    auto operator=(concurrency_gate&&) noexcept -> concurrency_gate&;
    ~concurrency_gate();

    /**
     * @brief Admit a task or append it to the wait queue
     *
     * Fails with internal_error if the task is already active or waiting,
     * or if admitting it would exceed the global maximum.
     */
    [[nodiscard]] auto try_admit(const task_id& id,
                                 const std::string& owner_id,
                                 task_priority priority) -> result<admission>;

    /**
     * @brief Free an active slot
     * @return Waiting tasks admitted as a consequence, in admission order
     *
     * Releasing an id that holds no slot is a no-op logged as a warning.
     */
    auto release(const task_id& id) -> std::vector<task_id>;

    /**
     * @brief Drop a waiting entry
     * @return true if the task was waiting
     */
    auto remove(const task_id& id) -> bool;

    /**
     * @brief Replace the default limits and admit whatever now fits
     */
    [[nodiscard]] auto set_limits(gate_limits limits) -> result<std::vector<task_id>>;

    /**
     * @brief Set or clear (nullopt) the concurrency limit of one owner
     */
    [[nodiscard]] auto set_owner_limit(const std::string& owner_id,
                                       std::optional<std::size_t> limit)
        -> result<std::vector<task_id>>;

    [[nodiscard]] auto owner_limit(const std::string& owner_id) const -> std::size_t;
    [[nodiscard]] auto limits() const -> gate_limits;

    [[nodiscard]] auto queue_position(const task_id& id) const -> std::optional<std::size_t>;
    [[nodiscard]] auto is_active(const task_id& id) const -> bool;
    [[nodiscard]] auto active_count(const std::string& owner_id) const -> std::size_t;
    [[nodiscard]] auto total_active() const -> std::size_t;
    [[nodiscard]] auto waiting_count() const -> std::size_t;

    /**
     * @brief Waiting task ids in queue order
     */
    [[nodiscard]] auto waiting_tasks() const -> std::vector<task_id>;

private:
    concurrency_gate();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_GATE_CONCURRENCY_GATE_H
