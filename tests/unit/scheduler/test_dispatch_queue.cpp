/**
 * @file test_dispatch_queue.cpp
 * @brief Unit tests for the dispatcher mailbox and timer queue
 */

#include <gtest/gtest.h>

#include "scheduler/dispatch_queue.h"

#include <thread>
#include <vector>

namespace kcenon::orchestrator::test {

using detail::mailbox;
using detail::timer_queue;
using namespace std::chrono_literals;

// =============================================================================
// mailbox Tests
// =============================================================================

class MailboxTest : public ::testing::Test {
protected:
    mailbox box_;
};

TEST_F(MailboxTest, ClosedMailboxRejectsPosts) {
    EXPECT_FALSE(box_.is_open());
    EXPECT_FALSE(box_.post([] {}));

    box_.open();
    EXPECT_TRUE(box_.post([] {}));

    box_.close();
    EXPECT_FALSE(box_.post([] {}));
    // Messages posted while open are still there
    EXPECT_EQ(box_.take_all().size(), 1u);
}

TEST_F(MailboxTest, WaitReturnsBatchInPostOrder) {
    box_.open();
    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        box_.post([&order, i] { order.push_back(i); });
    }

    auto batch = box_.wait(std::nullopt);
    ASSERT_EQ(batch.size(), 3u);
    for (auto& msg : batch) {
        msg();
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
    EXPECT_TRUE(box_.take_all().empty());
}

TEST_F(MailboxTest, WaitTimesOutAtDeadline) {
    box_.open();
    auto start = std::chrono::steady_clock::now();
    auto batch = box_.wait(start + 20ms);
    EXPECT_TRUE(batch.empty());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST_F(MailboxTest, WaitWakesOnPostFromOtherThread) {
    box_.open();
    std::thread producer([this] {
        std::this_thread::sleep_for(10ms);
        box_.post([] {});
    });

    auto batch = box_.wait(std::chrono::steady_clock::now() + 5s);
    producer.join();
    EXPECT_EQ(batch.size(), 1u);
}

// =============================================================================
// timer_queue Tests
// =============================================================================

class TimerQueueTest : public ::testing::Test {
protected:
    timer_queue timers_;
};

TEST_F(TimerQueueTest, EmptyQueueHasNoDeadline) {
    EXPECT_FALSE(timers_.next_deadline().has_value());
    EXPECT_TRUE(timers_.take_due(timer_queue::clock::now()).empty());
}

TEST_F(TimerQueueTest, TakesOnlyDueTimersInDeadlineOrder) {
    std::vector<int> fired;
    timers_.schedule(50ms, [&] { fired.push_back(2); });
    timers_.schedule(0ms, [&] { fired.push_back(1); });
    timers_.schedule(1h, [&] { fired.push_back(3); });
    EXPECT_EQ(timers_.size(), 3u);

    for (auto& msg : timers_.take_due(timer_queue::clock::now() + 100ms)) {
        msg();
    }
    EXPECT_EQ(fired, (std::vector<int>{1, 2}));
    EXPECT_EQ(timers_.size(), 1u);
    ASSERT_TRUE(timers_.next_deadline().has_value());
    EXPECT_GT(*timers_.next_deadline(), timer_queue::clock::now() + 30min);
}

TEST_F(TimerQueueTest, CancelRemovesTimer) {
    bool fired = false;
    auto id = timers_.schedule(0ms, [&] { fired = true; });

    EXPECT_TRUE(timers_.cancel(id));
    EXPECT_FALSE(timers_.cancel(id));
    EXPECT_FALSE(timers_.cancel(9999));

    EXPECT_TRUE(timers_.take_due(timer_queue::clock::now() + 1s).empty());
    EXPECT_FALSE(fired);
}

TEST_F(TimerQueueTest, FiredTimerCannotBeCanceled) {
    auto id = timers_.schedule(0ms, [] {});
    EXPECT_EQ(timers_.take_due(timer_queue::clock::now() + 1s).size(), 1u);
    EXPECT_FALSE(timers_.cancel(id));
}

TEST_F(TimerQueueTest, IdsAreUnique) {
    auto a = timers_.schedule(1s, [] {});
    auto b = timers_.schedule(1s, [] {});
    EXPECT_NE(a, b);
    EXPECT_NE(a, 0u);

    timers_.clear();
    EXPECT_EQ(timers_.size(), 0u);
    EXPECT_FALSE(timers_.cancel(a));
}

}  // namespace kcenon::orchestrator::test
