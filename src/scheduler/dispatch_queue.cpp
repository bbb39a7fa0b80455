/**
 * @file dispatch_queue.cpp
 * @brief Implementation of mailbox and timer_queue
 */

#include "dispatch_queue.h"

namespace kcenon::orchestrator::detail {

// ============================================================================
// mailbox
// ============================================================================

void mailbox::open() {
    std::lock_guard lock(mutex_);
    open_ = true;
}

void mailbox::close() {
    std::lock_guard lock(mutex_);
    open_ = false;
}

auto mailbox::is_open() const -> bool {
    std::lock_guard lock(mutex_);
    return open_;
}

auto mailbox::post(message msg) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (!open_) {
            return false;
        }
        messages_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return true;
}

auto mailbox::wait(std::optional<std::chrono::steady_clock::time_point> deadline)
    -> std::deque<message> {
    std::unique_lock lock(mutex_);
    auto ready = [this] { return !messages_.empty(); };
    if (deadline) {
        cv_.wait_until(lock, *deadline, ready);
    } else {
        cv_.wait(lock, ready);
    }
    std::deque<message> batch;
    batch.swap(messages_);
    return batch;
}

auto mailbox::take_all() -> std::deque<message> {
    std::lock_guard lock(mutex_);
    std::deque<message> batch;
    batch.swap(messages_);
    return batch;
}

// ============================================================================
// timer_queue
// ============================================================================

auto timer_queue::schedule(clock::duration delay, message msg) -> uint64_t {
    auto id = next_id_++;
    auto deadline = clock::now() + delay;
    timers_.emplace(key{deadline, id}, std::move(msg));
    deadlines_.emplace(id, deadline);
    return id;
}

auto timer_queue::cancel(uint64_t timer_id) -> bool {
    auto it = deadlines_.find(timer_id);
    if (it == deadlines_.end()) {
        return false;
    }
    timers_.erase(key{it->second, timer_id});
    deadlines_.erase(it);
    return true;
}

auto timer_queue::next_deadline() const -> std::optional<clock::time_point> {
    if (timers_.empty()) {
        return std::nullopt;
    }
    return timers_.begin()->first.first;
}

auto timer_queue::take_due(clock::time_point now) -> std::vector<message> {
    std::vector<message> due;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto node = timers_.extract(timers_.begin());
        deadlines_.erase(node.key().second);
        due.push_back(std::move(node.mapped()));
    }
    return due;
}

void timer_queue::clear() {
    timers_.clear();
    deadlines_.clear();
}

}  // namespace kcenon::orchestrator::detail
