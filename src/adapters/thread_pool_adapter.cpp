// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations
 */

#include "kcenon/orchestrator/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "kcenon/orchestrator/core/logging.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::orchestrator::adapters {

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] auto count(const std::string& stage_name) const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> counts_;
};

auto default_worker_count(std::size_t requested) -> std::size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

/**
 * Wrap a task so that its outcome, including an exception, lands in the
 * returned future.
 */
auto package(std::function<void()> task)
    -> std::pair<std::function<void()>, std::future<void>> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto wrapped = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };
    return {std::move(wrapped), std::move(future)};
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "orchestrator_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    std::size_t worker_count{0};
    stage_tracker tracker;
    std::atomic<bool> running{true};

    void enqueue(std::function<void()> work, const std::string& name) {
        if (!running.load() || !pool) {
            ORCH_LOG_WARN(log_category::pool, "Task submitted after pool shutdown, running inline");
            work();
            return;
        }
        auto fallback = work;
        auto enqueued = pool->enqueue(std::make_unique<function_job>(std::move(work), name));
        if (enqueued.is_err()) {
            ORCH_LOG_WARN(log_category::pool,
                "thread_system rejected job '" + name + "': " + enqueued.error().message);
            fallback();
        }
    }
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    shutdown();
}

auto thread_system_pool_adapter::create_default(std::size_t worker_count,
                                                const std::string& pool_name)
    -> std::shared_ptr<thread_system_pool_adapter> {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (added.is_err()) {
            ORCH_LOG_ERROR(log_category::pool, "Failed to add worker: " + added.error().message);
        }
    }
    auto started = pool->start();
    if (started.is_err()) {
        ORCH_LOG_ERROR(log_category::pool,
            "Failed to start thread_system pool '" + pool_name + "': " +
            started.error().message);
    }

    ORCH_LOG_DEBUG(log_category::pool,
        "thread_system pool '" + pool_name + "' started with " +
        std::to_string(worker_count) + " workers");

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name,
                                                        worker_count);
}

auto thread_system_pool_adapter::submit(std::function<void()> task) -> std::future<void> {
    auto [wrapped, future] = package(std::move(task));
    pimpl_->enqueue(std::move(wrapped), "orchestrator_task");
    return std::move(future);
}

auto thread_system_pool_adapter::submit_delayed(std::function<void()> task,
                                                std::chrono::milliseconds delay)
    -> std::future<void> {
    auto [wrapped, future] = package(std::move(task));
    auto delayed = [wrapped = std::move(wrapped), delay]() {
        std::this_thread::sleep_for(delay);
        wrapped();
    };
    pimpl_->enqueue(std::move(delayed), "delayed_task");
    return std::move(future);
}

auto thread_system_pool_adapter::submit_to_stage(std::function<void()> task,
                                                 const std::string& stage_name)
    -> std::future<void> {
    pimpl_->tracker.increment(stage_name);
    auto [wrapped, future] = package(std::move(task));

    auto* tracker = &pimpl_->tracker;
    auto staged = [wrapped = std::move(wrapped), tracker, stage = stage_name]() {
        wrapped();
        tracker->decrement(stage);
    };
    pimpl_->enqueue(std::move(staged), stage_name);
    return std::move(future);
}

auto thread_system_pool_adapter::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_pool_adapter::is_running() const -> bool {
    return pimpl_->running.load() && pimpl_->pool != nullptr;
}

auto thread_system_pool_adapter::pending_tasks() const -> std::size_t {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

auto thread_system_pool_adapter::pending_tasks(const std::string& stage_name) const
    -> std::size_t {
    return pimpl_->tracker.count(stage_name);
}

void thread_system_pool_adapter::shutdown() {
    if (!pimpl_ || !pimpl_->running.exchange(false)) {
        return;
    }
    if (pimpl_->pool) {
        auto stopped = pimpl_->pool->stop(false);
        if (stopped.is_err()) {
            ORCH_LOG_WARN(log_category::pool,
                "thread_system pool stop reported: " + stopped.error().message);
        }
        pimpl_->pool.reset();
    }
}

auto thread_system_pool_adapter::pool_name() const -> std::string {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// standalone_worker_pool
// ============================================================================

struct standalone_worker_pool::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    std::vector<std::thread> workers;
    std::atomic<std::size_t> in_flight{0};
    stage_tracker tracker;
    bool stopping = false;

    void run() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                job = std::move(queue.front());
                queue.pop_front();
            }
            job();
            in_flight.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    auto enqueue(std::function<void()>& job) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                return false;
            }
            queue.push_back(std::move(job));
            in_flight.fetch_add(1, std::memory_order_relaxed);
        }
        cv.notify_one();
        return true;
    }
};

standalone_worker_pool::standalone_worker_pool(std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    auto count = default_worker_count(worker_count);
    pimpl_->workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        pimpl_->workers.emplace_back([p = pimpl_.get()] { p->run(); });
    }
}

standalone_worker_pool::~standalone_worker_pool() {
    shutdown();
}

auto standalone_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    auto [wrapped, future] = package(std::move(task));
    if (!pimpl_->enqueue(wrapped)) {
        ORCH_LOG_WARN(log_category::pool, "Task submitted after pool shutdown, running inline");
        wrapped();
    }
    return std::move(future);
}

auto standalone_worker_pool::submit_delayed(std::function<void()> task,
                                            std::chrono::milliseconds delay)
    -> std::future<void> {
    return submit([task = std::move(task), delay]() {
        std::this_thread::sleep_for(delay);
        task();
    });
}

auto standalone_worker_pool::submit_to_stage(std::function<void()> task,
                                             const std::string& stage_name)
    -> std::future<void> {
    pimpl_->tracker.increment(stage_name);
    auto* tracker = &pimpl_->tracker;
    return submit([task = std::move(task), tracker, stage = stage_name]() {
        struct stage_exit {
            stage_tracker* tracker;
            const std::string& stage;
            ~stage_exit() { tracker->decrement(stage); }
        } on_exit{tracker, stage};
        task();
    });
}

auto standalone_worker_pool::worker_count() const -> std::size_t {
    return pimpl_->workers.size();
}

auto standalone_worker_pool::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

auto standalone_worker_pool::pending_tasks() const -> std::size_t {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

auto standalone_worker_pool::pending_tasks(const std::string& stage_name) const
    -> std::size_t {
    return pimpl_->tracker.count(stage_name);
}

void standalone_worker_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ============================================================================
// pool_factory
// ============================================================================

auto pool_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<orchestrator_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    ORCH_LOG_DEBUG(log_category::pool,
        "thread_system not available, pool '" + pool_name + "' uses std::thread workers");
    return std::make_shared<standalone_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::orchestrator::adapters
