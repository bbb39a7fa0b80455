/**
 * @file dispatch_queue.h
 * @brief Mailbox and timer queue driving the scheduler's dispatcher thread
 */

#ifndef KCENON_ORCHESTRATOR_SCHEDULER_DISPATCH_QUEUE_H
#define KCENON_ORCHESTRATOR_SCHEDULER_DISPATCH_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kcenon::orchestrator::detail {

using message = std::function<void()>;

/**
 * @brief Multi-producer, single-consumer message queue
 *
 * Posting to a closed mailbox fails; producers that outlive the consumer
 * (engine sinks, pool jobs) hold it through a weak_ptr.
 */
class mailbox {
public:
    void open();
    void close();
    [[nodiscard]] auto is_open() const -> bool;

    /**
     * @return false if the mailbox is closed
     */
    auto post(message msg) -> bool;

    /**
     * @brief Wait for messages or until @p deadline, then take them all
     */
    [[nodiscard]] auto wait(std::optional<std::chrono::steady_clock::time_point> deadline)
        -> std::deque<message>;

    [[nodiscard]] auto take_all() -> std::deque<message>;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<message> messages_;
    bool open_ = false;
};

/**
 * @brief One-shot timers owned by the dispatcher thread
 *
 * Not thread-safe. Timers with equal deadlines fire in scheduling order.
 */
class timer_queue {
public:
    using clock = std::chrono::steady_clock;

    auto schedule(clock::duration delay, message msg) -> uint64_t;
    auto cancel(uint64_t timer_id) -> bool;

    [[nodiscard]] auto next_deadline() const -> std::optional<clock::time_point>;

    /**
     * @brief Remove and return the timers due at @p now
     */
    [[nodiscard]] auto take_due(clock::time_point now) -> std::vector<message>;

    void clear();
    [[nodiscard]] auto size() const -> std::size_t { return timers_.size(); }

private:
    using key = std::pair<clock::time_point, uint64_t>;

    std::map<key, message> timers_;
    std::unordered_map<uint64_t, clock::time_point> deadlines_;
    uint64_t next_id_ = 1;
};

}  // namespace kcenon::orchestrator::detail

#endif  // KCENON_ORCHESTRATOR_SCHEDULER_DISPATCH_QUEUE_H
