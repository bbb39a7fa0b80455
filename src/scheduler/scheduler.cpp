/**
 * @file scheduler.cpp
 * @brief Implementation of scheduler
 */

#include "kcenon/orchestrator/scheduler/scheduler.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

#include "dispatch_queue.h"
#include "kcenon/orchestrator/core/logging.h"
#include "kcenon/orchestrator/core/source_classifier.h"
#include "kcenon/orchestrator/gate/concurrency_gate.h"
#include "kcenon/orchestrator/persistence/task_journal.h"

namespace kcenon::orchestrator {

namespace {

enum class run_state {
    stopped,
    running,
    stopping
};

/**
 * Failure kind for an engine whose start() returned an error
 */
auto kind_for_start_error(error_code code) -> transfer_error_kind {
    switch (code) {
        case error_code::invalid_source: return transfer_error_kind::invalid_source;
        case error_code::engine_unavailable: return transfer_error_kind::engine_unavailable;
        case error_code::permission_denied: return transfer_error_kind::permission_denied;
        case error_code::quota_exceeded: return transfer_error_kind::quota_exceeded;
        case error_code::internal_error: return transfer_error_kind::internal;
        default: return transfer_error_kind::engine_busy;
    }
}

auto make_log_context(const task_record& record) -> task_log_context {
    task_log_context ctx;
    ctx.task_id = record.id.to_string();
    ctx.owner_id = record.owner_id;
    ctx.state = to_string(record.state);
    ctx.retry_count = record.retry_count;
    if (record.state == task_state::uploading) {
        ctx.destination_index = record.destination_index;
    }
    if (record.progress.transferred_bytes > 0) {
        ctx.bytes_transferred = record.progress.transferred_bytes;
        ctx.total_bytes = record.progress.total_bytes;
    }
    if (record.started_at && record.finished_at) {
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                *record.finished_at - *record.started_at).count());
    }
    if (record.error) {
        ctx.error_message = std::string(to_string(record.error->kind)) + ": " +
                            record.error->message;
    }
    return ctx;
}

auto to_event_type(task_state state) -> lifecycle_event_type {
    switch (state) {
        case task_state::completed: return lifecycle_event_type::completed;
        case task_state::failed: return lifecycle_event_type::failed;
        case task_state::canceled: return lifecycle_event_type::canceled;
        default: return lifecycle_event_type::stage_changed;
    }
}

/**
 * @brief Live task with the bookkeeping never exposed in snapshots
 */
struct task_entry {
    task_record record;

    std::shared_ptr<transfer_engine> engine;  ///< Bound while downloading or uploading
    engine_handle handle;
    uint64_t attempt = 0;  ///< Bumped on every engine start, post step and finish

    bool slot_held = false;
    bool cancel_requested = false;
    bool post_step_running = false;  ///< A pool job still uses the work directory
    std::optional<uint64_t> backoff_timer;
    std::optional<uint64_t> cancel_timer;

    std::vector<std::shared_ptr<post_processor>> post_steps;
    std::size_t post_step = 0;

    std::filesystem::path work_dir;
};

/**
 * @brief Transition recorded on the dispatcher, made visible by flush_events()
 */
struct pending_event {
    lifecycle_event event;
    bool erase = false;  ///< Drop the snapshot instead of replacing it
};

}  // namespace

// ============================================================================
// scheduler::impl
// ============================================================================

struct scheduler::impl {
    impl(scheduler_config cfg, concurrency_gate g)
        : config(std::move(cfg)), gate(std::move(g)) {}

    scheduler_config config;
    concurrency_gate gate;
    engine_registry registry;
    event_bus bus;
    source_classifier classifier;
    std::unique_ptr<task_journal> journal;
    std::shared_ptr<adapters::orchestrator_pool_interface> pool;
    bool owns_pool = false;

    mutable std::mutex hooks_mutex;
    admission_hook hook;
    std::vector<std::shared_ptr<post_processor>> post_steps;

    std::shared_ptr<detail::mailbox> box = std::make_shared<detail::mailbox>();
    detail::timer_queue timers;
    std::thread dispatcher;
    std::atomic<std::thread::id> dispatcher_id{};
    std::atomic<run_state> state{run_state::stopped};
    std::mutex lifecycle_mutex;
    std::optional<uint64_t> sweep_timer;

    std::atomic<uint64_t> next_id{1};

    // Owned by the dispatcher thread
    std::unordered_map<task_id, task_entry> tasks;

    mutable std::shared_mutex snapshot_mutex;
    std::unordered_map<task_id, task_record> snapshots;

    // Owned by the dispatcher thread
    std::deque<pending_event> pending;
    bool flushing = false;

    mutable std::mutex wait_mutex;
    mutable std::condition_variable wait_cv;

    mutable std::mutex stats_mutex;
    scheduler_statistics stats;

    // ========================================================================
    // Dispatcher plumbing
    // ========================================================================

    [[nodiscard]] auto on_dispatcher() const -> bool {
        return std::this_thread::get_id() == dispatcher_id.load();
    }

    /**
     * Run a command on the dispatcher and wait for its result. Runs inline
     * when already on the dispatcher, which only happens from a lifecycle
     * handler inside flush_events().
     *
     * The caller resumes after the events of the command were published.
     */
    template <typename T>
    auto execute(std::function<result<T>()> command) -> result<T> {
        if (on_dispatcher()) {
            return command();
        }

        auto promise = std::make_shared<std::promise<result<T>>>();
        auto future = promise->get_future();
        bool posted = box->post([self = this, promise, command = std::move(command)]() {
            result<T> outcome = unexpected{error{error_code::internal_error, "command not run"}};
            try {
                outcome = command();
            } catch (const std::exception& e) {
                outcome = unexpected{error{error_code::internal_error, e.what()}};
            }
            self->flush_events();
            promise->set_value(std::move(outcome));
        });
        if (!posted) {
            return unexpected{error{error_code::not_running, "scheduler is not running"}};
        }
        return future.get();
    }

    void run_message(const detail::message& msg) {
        try {
            msg();
        } catch (const std::exception& e) {
            ORCH_LOG_ERROR(log_category::scheduler,
                std::string("Dispatcher message threw: ") + e.what());
        }
        flush_events();
    }

    void run_loop() {
        dispatcher_id.store(std::this_thread::get_id());
        ORCH_LOG_DEBUG(log_category::scheduler, "Dispatcher started");

        while (true) {
            for (auto& msg : box->wait(timers.next_deadline())) {
                run_message(msg);
            }
            for (auto& msg : timers.take_due(detail::timer_queue::clock::now())) {
                run_message(msg);
            }
            if (state.load() == run_state::stopping && !has_unfinished()) {
                break;
            }
        }

        box->close();
        for (auto& msg : box->take_all()) {
            run_message(msg);
        }
        timers.clear();
        sweep_timer.reset();
        dispatcher_id.store(std::thread::id{});
        ORCH_LOG_DEBUG(log_category::scheduler, "Dispatcher stopped");
    }

    [[nodiscard]] auto has_unfinished() const -> bool {
        return std::any_of(tasks.begin(), tasks.end(),
                           [](const auto& item) { return !item.second.record.is_terminal(); });
    }

    auto make_sink(const task_id& id, uint64_t token) -> engine_event_sink {
        std::weak_ptr<detail::mailbox> weak = box;
        return [weak, self = this, id, token](engine_event event) {
            if (auto target = weak.lock()) {
                target->post([self, id, token, event = std::move(event)]() {
                    self->on_engine_event(id, token, event);
                });
            }
        };
    }

    // ========================================================================
    // Snapshots, events, journal
    // ========================================================================

    void commit(const task_entry& entry) {
        std::unique_lock lock(snapshot_mutex);
        snapshots.insert_or_assign(entry.record.id, entry.record);
    }

    /**
     * Commit snapshots and publish events recorded by the last message, in
     * order. Handlers run here, never inside a transition; commands they
     * issue append to the same queue and are drained by this loop.
     */
    void flush_events() {
        if (flushing) {
            return;
        }
        flushing = true;
        while (!pending.empty()) {
            auto next = std::move(pending.front());
            pending.pop_front();
            const auto& id = next.event.snapshot.id;
            {
                std::unique_lock lock(snapshot_mutex);
                if (next.erase) {
                    snapshots.erase(id);
                } else {
                    snapshots.insert_or_assign(id, next.event.snapshot);
                }
            }
            bus.publish(next.event);
            if (next.erase || is_terminal_event_type(next.event.type)) {
                notify_waiters();
            }
        }
        flushing = false;
    }

    void persist(const task_entry& entry) {
        if (!journal) {
            return;
        }
        auto saved = journal->save(entry.record);
        if (!saved) {
            ORCH_LOG_ERROR(log_category::scheduler,
                "Failed to journal task " + entry.record.id.to_string() + ": " +
                saved.error().message);
        }
    }

    void notify_waiters() {
        { std::lock_guard lock(wait_mutex); }
        wait_cv.notify_all();
    }

    void announce(const task_entry& entry, lifecycle_event_type type,
                  std::optional<task_state> previous) {
        if (type != lifecycle_event_type::progressed) {
            persist(entry);
        }
        pending.push_back(pending_event{
            lifecycle_event{type, entry.record, std::chrono::system_clock::now(), previous},
            false});
    }

    template <typename Fn>
    void count(Fn&& update) {
        std::lock_guard lock(stats_mutex);
        update(stats);
    }

    // ========================================================================
    // Admission
    // ========================================================================

    /**
     * Offer the task to the gate. A waiting task is announced as queued
     * with its position; @p announce_admitted also announces a task that is
     * admitted at once (new submissions).
     */
    void enqueue(task_entry& entry, task_priority priority, bool announce_admitted,
                 std::optional<task_state> previous) {
        auto decision = gate.try_admit(entry.record.id, entry.record.owner_id, priority);
        if (!decision) {
            finish(entry, task_state::failed,
                   task_error{transfer_error_kind::internal, decision.error().message});
            return;
        }

        if (decision.value().granted) {
            entry.record.queue_position.reset();
            if (announce_admitted) {
                announce(entry, lifecycle_event_type::queued, previous);
            }
            begin(entry);
            return;
        }

        entry.record.queue_position = decision.value().position;
        announce(entry, lifecycle_event_type::queued, previous);
        ORCH_LOG_DEBUG(log_category::scheduler,
            "Task " + entry.record.id.to_string() + " waiting at position " +
            std::to_string(decision.value().position));
    }

    void admit_all(const std::vector<task_id>& admitted) {
        for (const auto& id : admitted) {
            auto it = tasks.find(id);
            if (it == tasks.end() || it->second.record.state != task_state::queued ||
                it->second.slot_held) {
                ORCH_LOG_ERROR(log_category::scheduler,
                    "Gate admitted task " + id.to_string() + " which is not waiting");
                admit_all(gate.release(id));
                continue;
            }
            begin(it->second);
        }
    }

    void release_slot(task_entry& entry) {
        if (!entry.slot_held) {
            ORCH_LOG_ERROR(log_category::scheduler,
                "Second slot release for task " + entry.record.id.to_string());
            return;
        }
        entry.slot_held = false;
        admit_all(gate.release(entry.record.id));
    }

    /**
     * Gate granted a slot: start downloading, or resume uploading when the
     * download survived a failed upload.
     */
    void begin(task_entry& entry) {
        entry.slot_held = true;
        auto& record = entry.record;
        record.queue_position.reset();

        if (record.download_complete()) {
            std::error_code ec;
            if (!std::filesystem::exists(record.downloaded_path, ec)) {
                ORCH_LOG_WARN(log_category::scheduler,
                    "Downloaded content of task " + record.id.to_string() +
                    " is gone, downloading again");
                record.downloaded_path.clear();
            }
        }

        transition_context ctx;
        ctx.download_complete = record.download_complete();
        auto next = next_state(record.state, task_trigger::admitted, ctx);
        if (!next) {
            ORCH_LOG_ERROR(log_category::scheduler, next.error().message);
            finish(entry, task_state::failed,
                   task_error{transfer_error_kind::internal, next.error().message});
            return;
        }

        auto previous = record.state;
        record.state = next.value();
        record.progress = {};
        if (!record.started_at) {
            record.started_at = std::chrono::system_clock::now();
        }
        announce(entry, lifecycle_event_type::started, previous);

        auto ctx_log = make_log_context(record);
        ORCH_LOG_INFO_CTX(log_category::scheduler,
            "Task " + record.id.to_string() + " started (" + to_string(record.state) + ")",
            ctx_log);

        start_transfer(entry);
    }

    // ========================================================================
    // Engine interaction
    // ========================================================================

    void start_transfer(task_entry& entry) {
        auto& record = entry.record;
        bool download = record.state == task_state::downloading;

        transfer_request request;
        request.task = record.id;
        request.owner_id = record.owner_id;
        request.direction = download ? transfer_direction::download : transfer_direction::upload;
        request.work_dir = entry.work_dir;

        std::shared_ptr<transfer_engine> engine;
        if (download) {
            engine = registry.download_engine(kind_of(record.source));
            request.locator = record.source;
        } else {
            const auto& destination = record.destinations[record.destination_index];
            engine = registry.upload_engine(kind_of(destination));
            request.locator = destination;
            request.input_path = record.downloaded_path;
            request.destination_index = record.destination_index;
        }

        if (!engine) {
            on_failure(entry, failed_event::of(transfer_error_kind::engine_unavailable,
                std::string("no ") + to_string(request.direction) + " engine registered"));
            return;
        }

        if (download) {
            std::error_code ec;
            std::filesystem::create_directories(entry.work_dir, ec);
            if (ec) {
                on_failure(entry, failed_event::of(transfer_error_kind::storage_error,
                    "cannot create work directory " + entry.work_dir.string() + ": " +
                    ec.message()));
                return;
            }
        }

        auto token = ++entry.attempt;
        entry.engine = engine;

        result<engine_handle> started;
        try {
            started = engine->start(request, make_sink(record.id, token));
        } catch (const std::exception& e) {
            started = unexpected{error{error_code::internal_error,
                engine->name() + " threw from start: " + e.what()}};
        }

        if (!started) {
            entry.engine.reset();
            ++entry.attempt;
            ORCH_LOG_WARN(log_category::engine,
                "Engine '" + engine->name() + "' failed to start " +
                to_string(request.direction) + " of task " + record.id.to_string() + ": " +
                started.error().message);
            on_failure(entry, failed_event::of(kind_for_start_error(started.error().code),
                                               started.error().message));
            return;
        }

        entry.handle = started.value();
        ORCH_LOG_DEBUG(log_category::engine,
            "Engine '" + engine->name() + "' started " + to_string(request.direction) +
            " of task " + record.id.to_string() + " (handle " +
            std::to_string(entry.handle.value) + ")");
    }

    void on_engine_event(const task_id& id, uint64_t token, const engine_event& event) {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return;
        }
        auto& entry = it->second;
        if (!entry.engine || entry.attempt != token) {
            ORCH_LOG_TRACE(log_category::engine,
                "Dropping event for unbound transfer of task " + id.to_string());
            return;
        }

        if (const auto* progress = std::get_if<progress_event>(&event)) {
            on_progress(entry, *progress);
            return;
        }

        entry.engine.reset();
        entry.handle = engine_handle{};
        if (entry.cancel_timer) {
            timers.cancel(*entry.cancel_timer);
            entry.cancel_timer.reset();
        }

        if (entry.cancel_requested) {
            finish(entry, task_state::canceled, std::nullopt);
            return;
        }

        if (const auto* succeeded = std::get_if<succeeded_event>(&event)) {
            on_success(entry, succeeded->result_locator);
        } else if (const auto* failed = std::get_if<failed_event>(&event)) {
            on_failure(entry, *failed);
        } else {
            ORCH_LOG_WARN(log_category::engine,
                "Engine canceled task " + id.to_string() + " without a request");
            finish(entry, task_state::canceled, std::nullopt);
        }
    }

    void on_progress(task_entry& entry, const progress_event& progress) {
        auto& current = entry.record.progress;
        current.total_bytes = progress.total_bytes;
        current.transferred_bytes = progress.total_bytes
            ? std::min(progress.transferred_bytes, *progress.total_bytes)
            : progress.transferred_bytes;
        current.rate = progress.rate;
        current.eta = progress.eta;
        announce(entry, lifecycle_event_type::progressed, std::nullopt);
    }

    void on_success(task_entry& entry, const std::string& locator) {
        auto& record = entry.record;
        auto previous = record.state;

        if (previous == task_state::downloading) {
            record.downloaded_path = locator.empty() ? entry.work_dir
                                                     : std::filesystem::path(locator);
            {
                std::lock_guard lock(hooks_mutex);
                entry.post_steps = post_steps;
            }
            entry.post_step = 0;

            transition_context ctx;
            ctx.has_post_steps = !entry.post_steps.empty();
            auto next = next_state(previous, task_trigger::download_succeeded, ctx);
            if (!next) {
                finish(entry, task_state::failed,
                       task_error{transfer_error_kind::internal, next.error().message});
                return;
            }
            record.state = next.value();
            record.progress = {};
            announce(entry, lifecycle_event_type::stage_changed, previous);

            if (record.state == task_state::post_processing) {
                run_post_step(entry);
            } else {
                start_transfer(entry);
            }
            return;
        }

        record.upload_results.push_back(locator);
        ++record.destination_index;

        transition_context ctx;
        ctx.more_destinations = record.destination_index < record.destinations.size();
        auto next = next_state(previous, task_trigger::upload_succeeded, ctx);
        if (!next) {
            finish(entry, task_state::failed,
                   task_error{transfer_error_kind::internal, next.error().message});
            return;
        }

        if (next.value() == task_state::completed) {
            finish(entry, task_state::completed, std::nullopt);
            return;
        }

        record.progress = {};
        announce(entry, lifecycle_event_type::stage_changed, previous);
        start_transfer(entry);
    }

    void on_failure(task_entry& entry, const failed_event& failure) {
        auto& record = entry.record;

        transition_context ctx;
        ctx.retryable = failure.retryable;
        ctx.budget_remaining = record.retry_count < record.max_retries;
        auto next = next_state(record.state, task_trigger::transfer_failed, ctx);
        if (!next) {
            ORCH_LOG_ERROR(log_category::scheduler, next.error().message);
            finish(entry, task_state::failed, task_error{failure.kind, failure.message});
            return;
        }

        if (next.value() == task_state::queued) {
            schedule_retry(entry, failure);
        } else {
            finish(entry, task_state::failed, task_error{failure.kind, failure.message});
        }
    }

    void schedule_retry(task_entry& entry, const failed_event& failure) {
        auto& record = entry.record;
        auto previous = record.state;

        ++record.retry_count;
        record.state = task_state::queued;
        record.progress = {};
        record.error.reset();
        count([](scheduler_statistics& s) { ++s.retried; });

        auto delay = config.retry.delay_for(record.retry_count);
        auto id = record.id;
        entry.backoff_timer = timers.schedule(delay, [this, id]() { on_backoff_elapsed(id); });

        auto ctx_log = make_log_context(record);
        ctx_log.error_message = std::string(to_string(failure.kind)) + ": " + failure.message;
        ORCH_LOG_WARN_CTX(log_category::scheduler,
            "Task " + id.to_string() + " failed " + to_string(previous) + ", retry " +
            std::to_string(record.retry_count) + "/" + std::to_string(record.max_retries) +
            " in " + std::to_string(delay.count()) + "ms",
            ctx_log);

        announce(entry, lifecycle_event_type::queued, previous);
        release_slot(entry);
    }

    void on_backoff_elapsed(const task_id& id) {
        auto it = tasks.find(id);
        if (it == tasks.end() || !it->second.backoff_timer) {
            return;
        }
        auto& entry = it->second;
        entry.backoff_timer.reset();
        if (entry.record.state != task_state::queued) {
            return;
        }
        enqueue(entry, task_priority::normal, false, std::nullopt);
    }

    // ========================================================================
    // Post-processing
    // ========================================================================

    void run_post_step(task_entry& entry) {
        auto step = entry.post_steps[entry.post_step];
        auto token = ++entry.attempt;
        entry.post_step_running = true;
        auto snapshot = entry.record;
        auto input = entry.record.downloaded_path;
        std::weak_ptr<detail::mailbox> weak = box;

        ORCH_LOG_DEBUG(log_category::scheduler,
            "Running post step '" + step->name() + "' for task " + snapshot.id.to_string());

        pool->submit_to_stage([weak, self = this, step, snapshot, input, token]() {
            result<std::filesystem::path> output;
            try {
                output = step->process(snapshot, input);
            } catch (const std::exception& e) {
                output = unexpected{error{error_code::internal_error,
                    step->name() + " threw: " + e.what()}};
            }
            if (auto target = weak.lock()) {
                target->post([self, id = snapshot.id, token, name = step->name(),
                              output = std::move(output)]() {
                    self->on_post_step_done(id, token, name, output);
                });
            }
        }, "post_processing");
    }

    void on_post_step_done(const task_id& id, uint64_t token, const std::string& name,
                           const result<std::filesystem::path>& output) {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            // Evicted while the step ran; the directory was left for it
            remove_work_dir(config.work_root / id.to_string());
            return;
        }
        auto& entry = it->second;
        entry.post_step_running = false;
        if (entry.attempt != token || entry.record.state != task_state::post_processing) {
            ORCH_LOG_DEBUG(log_category::scheduler,
                "Discarding result of post step '" + name + "' for task " + id.to_string());
            if (entry.record.state == task_state::completed ||
                entry.record.state == task_state::canceled) {
                remove_work_dir(entry.work_dir);
            }
            return;
        }

        if (!output) {
            auto next = next_state(entry.record.state, task_trigger::post_step_failed);
            finish(entry, next ? next.value() : task_state::failed,
                   task_error{transfer_error_kind::post_processing_failed,
                              name + ": " + output.error().message});
            return;
        }

        entry.record.downloaded_path = output.value();
        if (++entry.post_step < entry.post_steps.size()) {
            run_post_step(entry);
            return;
        }

        auto previous = entry.record.state;
        auto next = next_state(previous, task_trigger::post_step_succeeded);
        if (!next) {
            finish(entry, task_state::failed,
                   task_error{transfer_error_kind::internal, next.error().message});
            return;
        }
        entry.record.state = next.value();
        entry.record.destination_index = 0;
        announce(entry, lifecycle_event_type::stage_changed, previous);
        start_transfer(entry);
    }

    // ========================================================================
    // Terminal states and eviction
    // ========================================================================

    void finish(task_entry& entry, task_state to, std::optional<task_error> failure) {
        auto& record = entry.record;
        auto previous = record.state;

        if (entry.backoff_timer) {
            timers.cancel(*entry.backoff_timer);
            entry.backoff_timer.reset();
        }
        if (entry.cancel_timer) {
            timers.cancel(*entry.cancel_timer);
            entry.cancel_timer.reset();
        }
        entry.engine.reset();
        entry.handle = engine_handle{};
        ++entry.attempt;

        record.state = to;
        record.finished_at = std::chrono::system_clock::now();
        record.queue_position.reset();
        record.error = to == task_state::failed ? std::move(failure) : std::nullopt;

        count([to](scheduler_statistics& s) {
            if (to == task_state::completed) ++s.completed;
            else if (to == task_state::failed) ++s.failed;
            else if (to == task_state::canceled) ++s.canceled;
        });

        // Failed tasks keep their download for retry_now until eviction; a
        // running post step keeps it until its result arrives
        if (to != task_state::failed && !entry.post_step_running) {
            remove_work_dir(entry.work_dir);
        }

        announce(entry, to_event_type(to), previous);

        auto ctx_log = make_log_context(record);
        if (to == task_state::failed) {
            ORCH_LOG_ERROR_CTX(log_category::scheduler,
                "Task " + record.id.to_string() + " failed", ctx_log);
        } else {
            ORCH_LOG_INFO_CTX(log_category::scheduler,
                "Task " + record.id.to_string() + " " + to_string(to), ctx_log);
        }

        if (entry.slot_held) {
            release_slot(entry);
        }
    }

    void remove_work_dir(const std::filesystem::path& dir) {
        if (!config.cleanup_work_dirs || dir.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            ORCH_LOG_WARN(log_category::scheduler,
                "Failed to remove work directory " + dir.string() + ": " + ec.message());
        }
    }

    void evict(const task_id& id) {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return;
        }
        auto record = it->second.record;
        if (!it->second.post_step_running) {
            remove_work_dir(it->second.work_dir);
        }
        tasks.erase(it);

        if (journal) {
            auto removed = journal->remove(id);
            if (!removed) {
                ORCH_LOG_ERROR(log_category::scheduler,
                    "Failed to drop journal record of task " + id.to_string() + ": " +
                    removed.error().message);
            }
        }
        count([](scheduler_statistics& s) { ++s.evicted; });

        auto previous = record.state;
        pending.push_back(pending_event{
            lifecycle_event{lifecycle_event_type::evicted, std::move(record),
                            std::chrono::system_clock::now(), previous},
            true});
        ORCH_LOG_DEBUG(log_category::scheduler, "Evicted task " + id.to_string());
    }

    void sweep() {
        auto cutoff = std::chrono::system_clock::now() - config.retention;
        std::vector<task_id> expired;
        for (const auto& [id, entry] : tasks) {
            if (entry.record.is_terminal() && entry.record.finished_at &&
                *entry.record.finished_at <= cutoff) {
                expired.push_back(id);
            }
        }
        for (const auto& id : expired) {
            evict(id);
        }
        if (!expired.empty()) {
            ORCH_LOG_DEBUG(log_category::scheduler,
                "Retention sweep evicted " + std::to_string(expired.size()) + " tasks");
        }
    }

    void schedule_sweep() {
        sweep_timer = timers.schedule(config.sweep_interval, [this]() {
            sweep_timer.reset();
            sweep();
            if (state.load() == run_state::running) {
                schedule_sweep();
            }
        });
    }

    // ========================================================================
    // Commands (dispatcher thread)
    // ========================================================================

    void create_task(const task_id& id, task_submission submission, uint32_t max_retries) {
        task_entry entry;
        auto& record = entry.record;
        record.id = id;
        record.owner_id = std::move(submission.owner_id);
        record.priority = submission.priority;
        record.source = std::move(submission.source);
        record.destinations = std::move(submission.destinations);
        record.max_retries = max_retries;
        record.created_at = std::chrono::system_clock::now();
        entry.work_dir = config.work_root / id.to_string();

        auto [it, inserted] = tasks.emplace(id, std::move(entry));
        count([](scheduler_statistics& s) { ++s.submitted; });

        ORCH_LOG_INFO(log_category::scheduler,
            "Task " + id.to_string() + " submitted by " + it->second.record.owner_id + ": " +
            to_string(kind_of(it->second.record.source)) + " -> " +
            std::to_string(it->second.record.destinations.size()) + " destination(s)");

        enqueue(it->second, it->second.record.priority, true, std::nullopt);
    }

    auto cancel_task(const task_id& id) -> result<void> {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return unexpected{error{error_code::task_not_found,
                "task " + id.to_string() + " not found"}};
        }
        auto& entry = it->second;
        if (entry.record.is_terminal()) {
            return unexpected{error{error_code::already_terminal,
                "task " + id.to_string() + " is " + to_string(entry.record.state)}};
        }
        if (entry.cancel_requested) {
            return {};
        }

        auto next = next_state(entry.record.state, task_trigger::cancel_requested);
        if (!next) {
            return unexpected{next.error()};
        }

        if (entry.record.state == task_state::queued) {
            if (entry.backoff_timer) {
                timers.cancel(*entry.backoff_timer);
                entry.backoff_timer.reset();
            } else if (!gate.remove(id)) {
                ORCH_LOG_WARN(log_category::scheduler,
                    "Queued task " + id.to_string() + " was not in the wait queue");
            }
            finish(entry, next.value(), std::nullopt);
            return {};
        }

        if (next.value() == task_state::canceled) {
            // Post step still running; its result is discarded
            finish(entry, next.value(), std::nullopt);
            return {};
        }

        if (!entry.engine) {
            ORCH_LOG_WARN(log_category::scheduler,
                "Task " + id.to_string() + " has no bound transfer, canceling directly");
            finish(entry, task_state::canceled, std::nullopt);
            return {};
        }

        entry.cancel_requested = true;
        result<void> asked;
        try {
            asked = entry.engine->cancel(entry.handle);
        } catch (const std::exception& e) {
            asked = unexpected{error{error_code::internal_error, e.what()}};
        }
        if (!asked) {
            ORCH_LOG_WARN(log_category::engine,
                "Engine '" + entry.engine->name() + "' rejected cancel of task " +
                id.to_string() + ": " + asked.error().message);
        }

        auto token = entry.attempt;
        entry.cancel_timer = timers.schedule(config.cancel_timeout, [this, id, token]() {
            on_cancel_timeout(id, token);
        });
        ORCH_LOG_INFO(log_category::scheduler,
            "Cancel requested for task " + id.to_string() + " (" +
            to_string(entry.record.state) + ")");
        return {};
    }

    void on_cancel_timeout(const task_id& id, uint64_t token) {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return;
        }
        auto& entry = it->second;
        if (entry.attempt != token || !entry.engine) {
            return;
        }
        entry.cancel_timer.reset();

        auto next = next_state(entry.record.state, task_trigger::cancel_timed_out);
        ORCH_LOG_WARN(log_category::engine,
            "Engine '" + entry.engine->name() + "' did not confirm cancel of task " +
            id.to_string() + " within " + std::to_string(config.cancel_timeout.count()) + "ms");
        finish(entry, next ? next.value() : task_state::failed,
               task_error{transfer_error_kind::cancel_timeout,
                          "engine did not confirm cancel within " +
                          std::to_string(config.cancel_timeout.count()) + "ms"});
    }

    auto retry_task(const task_id& id) -> result<void> {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return unexpected{error{error_code::task_not_found,
                "task " + id.to_string() + " not found"}};
        }
        auto& entry = it->second;
        auto& record = entry.record;

        if (record.state == task_state::queued && entry.backoff_timer) {
            timers.cancel(*entry.backoff_timer);
            entry.backoff_timer.reset();
            ORCH_LOG_INFO(log_category::scheduler,
                "Skipping retry backoff of task " + id.to_string());
            enqueue(entry, task_priority::normal, false, std::nullopt);
            return {};
        }

        if (record.state != task_state::failed) {
            return unexpected{error{error_code::not_retryable,
                "task " + id.to_string() + " is " + to_string(record.state)}};
        }

        transition_context ctx;
        ctx.retryable = record.error && is_manually_retryable(record.error->kind);
        ctx.budget_remaining = record.retry_count < record.max_retries;
        auto next = next_state(record.state, task_trigger::manual_retry, ctx);
        if (!next) {
            return unexpected{error{error_code::not_retryable,
                ctx.budget_remaining ? "failure is not retryable" : "retry budget exhausted"}};
        }

        auto previous = record.state;
        ++record.retry_count;
        record.state = next.value();
        record.error.reset();
        record.finished_at.reset();
        record.progress = {};
        entry.cancel_requested = false;
        count([](scheduler_statistics& s) { ++s.retried; });

        ORCH_LOG_INFO(log_category::scheduler,
            "Manual retry " + std::to_string(record.retry_count) + "/" +
            std::to_string(record.max_retries) + " of task " + id.to_string());
        enqueue(entry, task_priority::normal, true, previous);
        return {};
    }

    auto acknowledge_task(const task_id& id) -> result<void> {
        auto it = tasks.find(id);
        if (it == tasks.end()) {
            return unexpected{error{error_code::task_not_found,
                "task " + id.to_string() + " not found"}};
        }
        if (!it->second.record.is_terminal()) {
            return unexpected{error{error_code::invalid_state_transition,
                "task " + id.to_string() + " is still " + to_string(it->second.record.state)}};
        }
        evict(id);
        return {};
    }

    void restore_from_journal() {
        if (!journal) {
            return;
        }

        auto records = journal->load_all();
        std::size_t requeued = 0;
        std::size_t interrupted = 0;

        for (auto& record : records) {
            auto id = record.id;
            auto current = next_id.load();
            while (current <= id.value &&
                   !next_id.compare_exchange_weak(current, id.value + 1)) {
            }
            if (tasks.find(id) != tasks.end()) {
                continue;
            }

            task_entry entry;
            entry.record = std::move(record);
            entry.record.queue_position.reset();
            entry.work_dir = config.work_root / id.to_string();
            auto& restored = tasks.emplace(id, std::move(entry)).first->second;
            count([](scheduler_statistics& s) { ++s.restored; });

            auto state_now = restored.record.state;
            if (is_active_state(state_now)) {
                auto next = next_state(state_now, task_trigger::interrupted);
                finish(restored, next ? next.value() : task_state::failed,
                       task_error{transfer_error_kind::interrupted_by_restart,
                                  std::string("interrupted while ") + to_string(state_now)});
                ++interrupted;
            } else if (state_now == task_state::queued) {
                auto priority = restored.record.retry_count > 0 ? task_priority::normal
                                                                : restored.record.priority;
                enqueue(restored, priority, true, std::nullopt);
                ++requeued;
            } else {
                commit(restored);
            }
        }

        ORCH_LOG_INFO(log_category::scheduler,
            "Recovered " + std::to_string(records.size()) + " journaled tasks (" +
            std::to_string(requeued) + " requeued, " + std::to_string(interrupted) +
            " interrupted)");
    }

    void begin_shutdown() {
        state.store(run_state::stopping);

        std::vector<task_id> unfinished;
        for (const auto& [id, entry] : tasks) {
            if (!entry.record.is_terminal()) {
                unfinished.push_back(id);
            }
        }
        // Waiting tasks first so that releases do not start them
        std::stable_partition(unfinished.begin(), unfinished.end(), [this](const task_id& id) {
            return tasks.at(id).record.state == task_state::queued;
        });

        for (const auto& id : unfinished) {
            auto canceled = cancel_task(id);
            if (!canceled) {
                ORCH_LOG_WARN(log_category::scheduler,
                    "Shutdown could not cancel task " + id.to_string() + ": " +
                    canceled.error().message);
            }
        }
        ORCH_LOG_INFO(log_category::scheduler,
            "Shutting down, " + std::to_string(unfinished.size()) + " unfinished tasks canceled");
    }

    // ========================================================================
    // Queries (any thread)
    // ========================================================================

    void refresh_position(task_record& record) const {
        if (record.state == task_state::queued) {
            record.queue_position = gate.queue_position(record.id);
        }
    }

    auto snapshot_of(const task_id& id) const -> result<task_record> {
        task_record record;
        {
            std::shared_lock lock(snapshot_mutex);
            auto it = snapshots.find(id);
            if (it == snapshots.end()) {
                return unexpected{error{error_code::task_not_found,
                    "task " + id.to_string() + " not found"}};
            }
            record = it->second;
        }
        refresh_position(record);
        return record;
    }
};

// ============================================================================
// scheduler::builder
// ============================================================================

scheduler::builder::builder() = default;

auto scheduler::builder::with_config(scheduler_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto scheduler::builder::with_global_limit(std::size_t max_active) -> builder& {
    config_.global_limit = max_active;
    return *this;
}

auto scheduler::builder::with_per_owner_limit(std::size_t max_active) -> builder& {
    config_.per_owner_limit = max_active;
    return *this;
}

auto scheduler::builder::with_max_retries(uint32_t max_retries) -> builder& {
    config_.default_max_retries = max_retries;
    return *this;
}

auto scheduler::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto scheduler::builder::with_cancel_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.cancel_timeout = timeout;
    return *this;
}

auto scheduler::builder::with_retention(std::chrono::milliseconds retention) -> builder& {
    config_.retention = retention;
    return *this;
}

auto scheduler::builder::with_sweep_interval(std::chrono::milliseconds interval) -> builder& {
    config_.sweep_interval = interval;
    return *this;
}

auto scheduler::builder::with_work_root(const std::filesystem::path& dir) -> builder& {
    config_.work_root = dir;
    return *this;
}

auto scheduler::builder::with_work_dir_cleanup(bool enable) -> builder& {
    config_.cleanup_work_dirs = enable;
    return *this;
}

auto scheduler::builder::with_journal(const std::filesystem::path& dir) -> builder& {
    config_.journal_dir = dir;
    return *this;
}

auto scheduler::builder::with_pool_workers(std::size_t workers) -> builder& {
    config_.pool_workers = workers;
    return *this;
}

auto scheduler::builder::with_worker_pool(
    std::shared_ptr<adapters::orchestrator_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto scheduler::builder::with_download_engine(source_kind kind,
                                              std::shared_ptr<transfer_engine> engine)
    -> builder& {
    downloads_.emplace_back(kind, std::move(engine));
    return *this;
}

auto scheduler::builder::with_upload_engine(destination_kind kind,
                                            std::shared_ptr<transfer_engine> engine)
    -> builder& {
    uploads_.emplace_back(kind, std::move(engine));
    return *this;
}

auto scheduler::builder::with_post_processor(std::shared_ptr<post_processor> step) -> builder& {
    post_steps_.push_back(std::move(step));
    return *this;
}

auto scheduler::builder::with_admission_hook(admission_hook hook) -> builder& {
    hook_ = std::move(hook);
    return *this;
}

auto scheduler::builder::with_video_host(std::string host) -> builder& {
    video_hosts_.push_back(std::move(host));
    return *this;
}

auto scheduler::builder::build() -> result<scheduler> {
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
            "limits, retry policy, timeouts and work_root must be valid"}};
    }

    auto gate = concurrency_gate::create({config_.global_limit, config_.per_owner_limit});
    if (!gate) {
        return unexpected{gate.error()};
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.work_root, ec);
    if (ec) {
        return unexpected{error{error_code::invalid_configuration,
            "Failed to create work root: " + ec.message()}};
    }

    auto state = std::make_unique<impl>(config_, std::move(gate.value()));

    for (auto& [kind, engine] : downloads_) {
        auto registered = state->registry.register_download(kind, engine);
        if (!registered) {
            return unexpected{registered.error()};
        }
    }
    for (auto& [kind, engine] : uploads_) {
        auto registered = state->registry.register_upload(kind, engine);
        if (!registered) {
            return unexpected{registered.error()};
        }
    }
    for (auto& step : post_steps_) {
        if (!step) {
            return unexpected{error{error_code::invalid_configuration, "null post processor"}};
        }
        state->post_steps.push_back(step);
    }
    for (auto& host : video_hosts_) {
        state->classifier.add_video_host(host);
    }
    state->hook = hook_;
    state->pool = pool_;

    if (!config_.journal_dir.empty()) {
        state->journal = std::make_unique<task_journal>(config_.journal_dir);
    }

    return scheduler{std::move(state)};
}

// ============================================================================
// scheduler
// ============================================================================

scheduler::scheduler(std::unique_ptr<impl> state) : impl_(std::move(state)) {
    get_logger().initialize();
}

scheduler::scheduler(scheduler&&) noexcept = default;
auto scheduler::operator=(scheduler&&) noexcept -> scheduler& = default;

scheduler::~scheduler() {
    if (impl_ && impl_->state.load() != run_state::stopped) {
        auto stopped = shutdown();
        if (!stopped) {
            ORCH_LOG_ERROR(log_category::scheduler,
                "Shutdown on destruction failed: " + stopped.error().message);
        }
    }
}

auto scheduler::start() -> result<void> {
    std::lock_guard lock(impl_->lifecycle_mutex);
    if (impl_->state.load() != run_state::stopped) {
        return unexpected{error{error_code::already_running, "scheduler already running"}};
    }

    if (!impl_->pool) {
        impl_->pool = adapters::pool_factory::create(impl_->config.pool_workers,
                                                     "orchestrator_post");
        impl_->owns_pool = true;
    }

    {
        std::lock_guard stats_lock(impl_->stats_mutex);
        impl_->stats = scheduler_statistics{};
    }

    impl_->box->open();
    impl_->state.store(run_state::running);
    impl_->dispatcher = std::thread([state = impl_.get()]() { state->run_loop(); });

    auto recovered = impl_->execute<void>([state = impl_.get()]() -> result<void> {
        state->restore_from_journal();
        state->schedule_sweep();
        return {};
    });

    ORCH_LOG_INFO(log_category::scheduler,
        "Scheduler started (global limit " + std::to_string(impl_->gate.limits().global_max) +
        ", per owner " + std::to_string(impl_->gate.limits().per_owner_max) +
        (adapters::pool_factory::has_thread_system() ? ", thread_system pool)"
                                                     : ", standalone pool)"));
    return recovered;
}

auto scheduler::shutdown() -> result<void> {
    if (impl_->on_dispatcher()) {
        return unexpected{error{error_code::internal_error,
            "shutdown cannot be called from the dispatcher"}};
    }

    std::lock_guard lock(impl_->lifecycle_mutex);
    if (impl_->state.load() != run_state::running) {
        return unexpected{error{error_code::not_running, "scheduler is not running"}};
    }

    auto stopping = impl_->execute<void>([state = impl_.get()]() -> result<void> {
        state->begin_shutdown();
        return {};
    });
    if (!stopping) {
        ORCH_LOG_ERROR(log_category::scheduler,
            "Failed to begin shutdown: " + stopping.error().message);
    }

    if (impl_->dispatcher.joinable()) {
        impl_->dispatcher.join();
    }
    impl_->state.store(run_state::stopped);

    if (impl_->owns_pool && impl_->pool) {
        impl_->pool->shutdown();
        impl_->pool.reset();
        impl_->owns_pool = false;
    }
    impl_->notify_waiters();

    ORCH_LOG_INFO(log_category::scheduler, "Scheduler stopped");
    get_logger().flush();
    return {};
}

auto scheduler::is_running() const -> bool {
    return impl_->state.load() == run_state::running;
}

auto scheduler::submit(task_submission submission) -> result<task_id> {
    if (impl_->state.load() != run_state::running) {
        return unexpected{error{error_code::not_running, "scheduler is not running"}};
    }

    auto reject = [this](error err) -> result<task_id> {
        impl_->count([](scheduler_statistics& s) { ++s.rejected; });
        ORCH_LOG_WARN(log_category::scheduler, "Submission rejected: " + err.message);
        return unexpected{std::move(err)};
    };

    if (submission.destinations.empty()) {
        return reject(error{error_code::no_destinations, "at least one destination is required"});
    }

    auto valid = source_classifier::validate(submission.source);
    if (!valid) {
        return reject(valid.error());
    }

    auto available = impl_->registry.check_pipeline(submission.source, submission.destinations);
    if (!available) {
        return reject(available.error());
    }

    admission_hook hook;
    {
        std::lock_guard lock(impl_->hooks_mutex);
        hook = impl_->hook;
    }
    if (hook) {
        result<void> allowed;
        try {
            allowed = hook(submission);
        } catch (const std::exception& e) {
            allowed = unexpected{error{error_code::internal_error,
                std::string("admission hook threw: ") + e.what()}};
        }
        if (!allowed) {
            return reject(allowed.error());
        }
    }

    auto max_retries = submission.max_retries.value_or(impl_->config.default_max_retries);
    auto id = task_id{impl_->next_id.fetch_add(1)};

    return impl_->execute<task_id>(
        [state = impl_.get(), id, max_retries,
         submission = std::move(submission)]() mutable -> result<task_id> {
            if (state->state.load() != run_state::running) {
                return unexpected{error{error_code::not_running, "scheduler is not running"}};
            }
            state->create_task(id, std::move(submission), max_retries);
            return id;
        });
}

auto scheduler::submit_link(std::string_view link,
                            std::vector<task_destination> destinations,
                            const std::string& owner_id,
                            task_priority priority) -> result<task_id> {
    auto source = impl_->classifier.classify(link);
    if (!source) {
        impl_->count([](scheduler_statistics& s) { ++s.rejected; });
        return unexpected{source.error()};
    }

    task_submission submission;
    submission.source = std::move(source.value());
    submission.destinations = std::move(destinations);
    submission.owner_id = owner_id;
    submission.priority = priority;
    return submit(std::move(submission));
}

auto scheduler::get_status(const task_id& id) const -> result<task_record> {
    return impl_->snapshot_of(id);
}

auto scheduler::list_status(const std::optional<std::string>& owner_id) const
    -> std::vector<task_record> {
    std::vector<task_record> records;
    {
        std::shared_lock lock(impl_->snapshot_mutex);
        for (const auto& [id, record] : impl_->snapshots) {
            if (!owner_id || record.owner_id == *owner_id) {
                records.push_back(record);
            }
        }
    }
    for (auto& record : records) {
        impl_->refresh_position(record);
    }
    sort_for_listing(records);
    return records;
}

auto scheduler::wait_for(const task_id& id, std::chrono::milliseconds timeout) const
    -> result<task_record> {
    if (impl_->on_dispatcher()) {
        return unexpected{error{error_code::internal_error,
            "wait_for cannot block the dispatcher"}};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock lock(impl_->wait_mutex);
    while (true) {
        auto current = impl_->snapshot_of(id);
        if (!current || current.value().is_terminal()) {
            return current;
        }
        if (impl_->wait_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
            auto last = impl_->snapshot_of(id);
            if (!last || last.value().is_terminal()) {
                return last;
            }
            return unexpected{error{error_code::wait_timeout,
                "task " + id.to_string() + " still " + to_string(last.value().state)}};
        }
    }
}

auto scheduler::statistics() const -> scheduler_statistics {
    scheduler_statistics copy;
    {
        std::lock_guard lock(impl_->stats_mutex);
        copy = impl_->stats;
    }
    copy.active = impl_->gate.total_active();
    copy.waiting = impl_->gate.waiting_count();
    {
        std::shared_lock lock(impl_->snapshot_mutex);
        copy.retained = impl_->snapshots.size();
    }
    return copy;
}

auto scheduler::config() const -> const scheduler_config& {
    return impl_->config;
}

auto scheduler::cancel(const task_id& id) -> result<void> {
    return impl_->execute<void>([state = impl_.get(), id]() { return state->cancel_task(id); });
}

auto scheduler::retry_now(const task_id& id) -> result<void> {
    return impl_->execute<void>([state = impl_.get(), id]() -> result<void> {
        if (state->state.load() != run_state::running) {
            return unexpected{error{error_code::not_running, "scheduler is not running"}};
        }
        return state->retry_task(id);
    });
}

auto scheduler::acknowledge(const task_id& id) -> result<void> {
    return impl_->execute<void>([state = impl_.get(), id]() {
        return state->acknowledge_task(id);
    });
}

auto scheduler::set_limits(std::size_t global_max, std::size_t per_owner_max) -> result<void> {
    gate_limits limits{global_max, per_owner_max};
    if (!limits.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
            "concurrency limits must be at least 1"}};
    }

    std::function<result<void>()> apply = [state = impl_.get(), limits]() -> result<void> {
        auto admitted = state->gate.set_limits(limits);
        if (!admitted) {
            return unexpected{admitted.error()};
        }
        state->admit_all(admitted.value());
        return {};
    };

    if (impl_->state.load() == run_state::running) {
        return impl_->execute<void>(std::move(apply));
    }
    return apply();
}

auto scheduler::set_owner_limit(const std::string& owner_id, std::optional<std::size_t> limit)
    -> result<void> {
    std::function<result<void>()> apply = [state = impl_.get(), owner_id, limit]()
        -> result<void> {
        auto admitted = state->gate.set_owner_limit(owner_id, limit);
        if (!admitted) {
            return unexpected{admitted.error()};
        }
        state->admit_all(admitted.value());
        return {};
    };

    if (impl_->state.load() == run_state::running) {
        return impl_->execute<void>(std::move(apply));
    }
    return apply();
}

auto scheduler::set_owner_plan(const std::string& owner_id, subscription_plan plan)
    -> result<void> {
    ORCH_LOG_INFO(log_category::scheduler,
        "Owner " + owner_id + " on " + to_string(plan) + " plan (" +
        std::to_string(concurrent_task_limit(plan)) + " concurrent tasks)");
    return set_owner_limit(owner_id, concurrent_task_limit(plan));
}

void scheduler::set_admission_hook(admission_hook hook) {
    std::lock_guard lock(impl_->hooks_mutex);
    impl_->hook = std::move(hook);
}

void scheduler::add_post_processor(std::shared_ptr<post_processor> step) {
    if (!step) {
        ORCH_LOG_WARN(log_category::scheduler, "Ignoring null post processor");
        return;
    }
    std::lock_guard lock(impl_->hooks_mutex);
    impl_->post_steps.push_back(std::move(step));
}

auto scheduler::events() -> event_bus& {
    return impl_->bus;
}

auto scheduler::engines() -> engine_registry& {
    return impl_->registry;
}

}  // namespace kcenon::orchestrator
