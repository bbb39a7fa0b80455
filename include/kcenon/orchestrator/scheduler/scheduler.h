/**
 * @file scheduler.h
 * @brief Task orchestration: admission, dispatch, retries and cancellation
 */

#ifndef KCENON_ORCHESTRATOR_SCHEDULER_SCHEDULER_H
#define KCENON_ORCHESTRATOR_SCHEDULER_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/orchestrator/adapters/thread_pool_adapter.h"
#include "kcenon/orchestrator/core/task_types.h"
#include "kcenon/orchestrator/core/types.h"
#include "kcenon/orchestrator/engine/engine_registry.h"
#include "kcenon/orchestrator/engine/post_processor.h"
#include "kcenon/orchestrator/engine/transfer_engine.h"
#include "kcenon/orchestrator/events/event_bus.h"
#include "kcenon/orchestrator/scheduler/scheduler_types.h"

namespace kcenon::orchestrator {

/**
 * @brief Drives every task from submission to a terminal state
 *
 * A single dispatcher thread owns the task store. Commands, engine
 * events, post-processing results and timers are processed on it
 * strictly in arrival order, so transitions of one task never
 * interleave. Callers block until their command has been applied.
 * Status queries read a snapshot map under a shared lock and never see
 * a half-applied transition.
 *
 * Lifecycle events are published on the dispatcher once the message that
 * produced them has been fully applied. Commands issued from a handler run
 * inline and act on the task's current state, which may already be past
 * the event being delivered. wait_for() and shutdown() must not be called
 * from a handler.
 *
 * Engines, post processors, the admission hook and handlers report failure
 * through their return values. A thrown std::exception is logged and
 * treated as a failure; any other thrown type ends the process.
 *
 * @code
 * auto result = scheduler::builder()
 *     .with_global_limit(4)
 *     .with_per_owner_limit(1)
 *     .with_download_engine(source_kind::direct_link, http_engine)
 *     .with_upload_engine(destination_kind::cloud_drive, drive_engine)
 *     .build();
 *
 * auto& sched = result.value();
 * if (!sched.start()) {
 *     return;
 * }
 * auto id = sched.submit_link("https://example.com/file.zip",
 *                             {cloud_drive_destination{"folder"}}, "alice");
 * auto record = sched.wait_for(id.value(), std::chrono::minutes(5));
 * (void)sched.shutdown();
 * @endcode
 */
class scheduler {
public:
    /**
     * @brief Builder for scheduler
     */
    class builder {
    public:
        builder();

        auto with_config(scheduler_config config) -> builder&;
        auto with_global_limit(std::size_t max_active) -> builder&;
        auto with_per_owner_limit(std::size_t max_active) -> builder&;
        auto with_max_retries(uint32_t max_retries) -> builder&;
        auto with_retry_policy(retry_policy policy) -> builder&;
        auto with_cancel_timeout(std::chrono::milliseconds timeout) -> builder&;
        auto with_retention(std::chrono::milliseconds retention) -> builder&;
        auto with_sweep_interval(std::chrono::milliseconds interval) -> builder&;
        auto with_work_root(const std::filesystem::path& dir) -> builder&;
        auto with_work_dir_cleanup(bool enable) -> builder&;

        /**
         * @brief Persist task records under @p dir for recovery on start()
         */
        auto with_journal(const std::filesystem::path& dir) -> builder&;

        auto with_pool_workers(std::size_t workers) -> builder&;

        /**
         * @brief Run post-processing steps on the given pool instead of an owned one
         */
        auto with_worker_pool(std::shared_ptr<adapters::orchestrator_pool_interface> pool)
            -> builder&;

        auto with_download_engine(source_kind kind, std::shared_ptr<transfer_engine> engine)
            -> builder&;
        auto with_upload_engine(destination_kind kind, std::shared_ptr<transfer_engine> engine)
            -> builder&;
        auto with_post_processor(std::shared_ptr<post_processor> step) -> builder&;
        auto with_admission_hook(admission_hook hook) -> builder&;

        /**
         * @brief Additional host classified as a video site by submit_link()
         */
        auto with_video_host(std::string host) -> builder&;

        [[nodiscard]] auto build() -> result<scheduler>;

    private:
        scheduler_config config_;
        std::shared_ptr<adapters::orchestrator_pool_interface> pool_;
        std::vector<std::pair<source_kind, std::shared_ptr<transfer_engine>>> downloads_;
        std::vector<std::pair<destination_kind, std::shared_ptr<transfer_engine>>> uploads_;
        std::vector<std::shared_ptr<post_processor>> post_steps_;
        admission_hook hook_;
        std::vector<std::string> video_hosts_;
    };

    // Non-copyable, movable
    scheduler(const scheduler&) = delete;
    auto operator=(const scheduler&) -> scheduler& = delete;
    scheduler(scheduler&&) noexcept;
    auto operator=(scheduler&&) noexcept -> scheduler&;
    ~scheduler();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the dispatcher and recover journaled tasks
     *
     * Journaled tasks that were downloading, post-processing or uploading
     * fail with interrupted_by_restart; queued tasks re-enter the gate;
     * terminal tasks are kept for status queries.
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Cancel every unfinished task and stop the dispatcher
     *
     * Waits until each bound engine confirms its cancel or the cancel
     * timeout expires.
     */
    [[nodiscard]] auto shutdown() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    // ========================================================================
    // Submission
    // ========================================================================

    /**
     * @brief Create a task
     *
     * Checks, in order: no_destinations, invalid_source, engine_unavailable,
     * then the admission hook. A rejected submission creates no task.
     */
    [[nodiscard]] auto submit(task_submission submission) -> result<task_id>;

    /**
     * @brief Classify a raw link and submit it
     */
    [[nodiscard]] auto submit_link(std::string_view link,
                                   std::vector<task_destination> destinations,
                                   const std::string& owner_id,
                                   task_priority priority = task_priority::normal)
        -> result<task_id>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto get_status(const task_id& id) const -> result<task_record>;

    /**
     * @brief Records of one owner, or of everyone
     *
     * Active by start time, then queued by queue position, then retained
     * terminal records by finish time.
     */
    [[nodiscard]] auto list_status(const std::optional<std::string>& owner_id = std::nullopt) const
        -> std::vector<task_record>;

    /**
     * @brief Block until the task is terminal
     * @return The terminal record, task_not_found, or wait_timeout
     */
    [[nodiscard]] auto wait_for(const task_id& id, std::chrono::milliseconds timeout) const
        -> result<task_record>;

    [[nodiscard]] auto statistics() const -> scheduler_statistics;
    [[nodiscard]] auto config() const -> const scheduler_config&;

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Cancel a task
     *
     * A waiting task is canceled at once. A task bound to an engine is
     * canceled when the engine confirms; after the cancel timeout it fails
     * with cancel_timeout. Either way its slot is released.
     */
    [[nodiscard]] auto cancel(const task_id& id) -> result<void>;

    /**
     * @brief Skip a retry backoff, or requeue a failed task within budget
     */
    [[nodiscard]] auto retry_now(const task_id& id) -> result<void>;

    /**
     * @brief Evict a terminal task
     */
    [[nodiscard]] auto acknowledge(const task_id& id) -> result<void>;

    [[nodiscard]] auto set_limits(std::size_t global_max, std::size_t per_owner_max)
        -> result<void>;
    [[nodiscard]] auto set_owner_limit(const std::string& owner_id,
                                       std::optional<std::size_t> limit) -> result<void>;
    [[nodiscard]] auto set_owner_plan(const std::string& owner_id, subscription_plan plan)
        -> result<void>;

    void set_admission_hook(admission_hook hook);
    void add_post_processor(std::shared_ptr<post_processor> step);

    // ========================================================================
    // Collaborators
    // ========================================================================

    [[nodiscard]] auto events() -> event_bus&;
    [[nodiscard]] auto engines() -> engine_registry&;

private:
    struct impl;
    explicit scheduler(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::orchestrator

#endif  // KCENON_ORCHESTRATOR_SCHEDULER_SCHEDULER_H
