// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool used for post-processing steps
 *
 * Unified pool interface with two implementations:
 * - thread_system_pool_adapter wraps kcenon::thread::thread_pool
 * - standalone_worker_pool runs a fixed set of std::thread workers
 *
 * Tasks submitted to a named stage are counted per stage so the
 * scheduler can report how many post-processing jobs are pending.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "kcenon/orchestrator/config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::orchestrator::adapters {

/**
 * @brief Interface for worker pool operations
 */
class orchestrator_pool_interface {
public:
    virtual ~orchestrator_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that holds the task's exception, if any
     */
    virtual auto submit(std::function<void()> task) -> std::future<void> = 0;

    /**
     * @brief Submit a task that starts after a delay
     *
     * The delay occupies a worker; use it for short waits only.
     */
    virtual auto submit_delayed(std::function<void()> task,
                                std::chrono::milliseconds delay) -> std::future<void> = 0;

    /**
     * @brief Submit a task counted against a named stage
     */
    virtual auto submit_to_stage(std::function<void()> task,
                                 const std::string& stage_name) -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto is_running() const -> bool = 0;
    [[nodiscard]] virtual auto pending_tasks() const -> std::size_t = 0;
    [[nodiscard]] virtual auto pending_tasks(const std::string& stage_name) const
        -> std::size_t = 0;

    /**
     * @brief Stop accepting work and wait for running tasks
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over thread_system's thread_pool
 */
class thread_system_pool_adapter : public orchestrator_pool_interface {
public:
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "orchestrator_pool",
        std::size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    auto operator=(const thread_system_pool_adapter&) -> thread_system_pool_adapter& = delete;

    [[nodiscard]] static auto create_default(std::size_t worker_count = 0,
                                             const std::string& pool_name = "orchestrator_pool")
        -> std::shared_ptr<thread_system_pool_adapter>;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_delayed(std::function<void()> task,
                        std::chrono::milliseconds delay) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;
    void shutdown() override;

    [[nodiscard]] auto pool_name() const -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool of std::thread workers sharing one FIFO queue
 */
class standalone_worker_pool : public orchestrator_pool_interface {
public:
    explicit standalone_worker_pool(std::size_t worker_count = 0);
    ~standalone_worker_pool() override;

    standalone_worker_pool(const standalone_worker_pool&) = delete;
    auto operator=(const standalone_worker_pool&) -> standalone_worker_pool& = delete;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_delayed(std::function<void()> task,
                        std::chrono::milliseconds delay) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects thread_system when built with it, the standalone pool otherwise
 */
class pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t worker_count = 0,
                                     const std::string& pool_name = "orchestrator_pool")
        -> std::shared_ptr<orchestrator_pool_interface>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::orchestrator::adapters
