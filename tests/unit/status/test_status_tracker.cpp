/**
 * @file test_status_tracker.cpp
 * @brief Unit tests for the event-driven status view
 */

#include <gtest/gtest.h>

#include <kcenon/orchestrator/status/status_tracker.h>

namespace kcenon::orchestrator::test {

class StatusTrackerTest : public ::testing::Test {
protected:
    void publish(uint64_t id, const std::string& owner, lifecycle_event_type type,
                 task_state state, uint64_t bytes = 0) {
        lifecycle_event event;
        event.type = type;
        event.snapshot.id = task_id{id};
        event.snapshot.owner_id = owner;
        event.snapshot.state = state;
        event.snapshot.progress.transferred_bytes = bytes;
        event.snapshot.created_at = base_ + std::chrono::seconds(id);
        if (is_active_state(state) || is_terminal_state(state)) {
            event.snapshot.started_at = base_ + std::chrono::seconds(10 + id);
        }
        if (is_terminal_state(state)) {
            event.snapshot.finished_at = base_ + std::chrono::seconds(100 + id);
        }
        if (state == task_state::queued) {
            event.snapshot.queue_position = id;
        }
        event.timestamp = std::chrono::system_clock::now();
        bus_.publish(event);
    }

    const std::chrono::system_clock::time_point base_ = std::chrono::system_clock::now();
    event_bus bus_;
    status_tracker tracker_{bus_};
};

TEST_F(StatusTrackerTest, TracksLatestEvent) {
    publish(1, "alice", lifecycle_event_type::queued, task_state::queued);
    publish(1, "alice", lifecycle_event_type::started, task_state::downloading);
    publish(1, "alice", lifecycle_event_type::progressed, task_state::downloading, 4096);

    auto entry = tracker_.detail(task_id{1});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->last_event, lifecycle_event_type::progressed);
    EXPECT_EQ(entry->snapshot.state, task_state::downloading);
    EXPECT_EQ(entry->snapshot.progress.transferred_bytes, 4096u);
    EXPECT_EQ(tracker_.size(), 1u);
}

TEST_F(StatusTrackerTest, UnknownTask) {
    EXPECT_FALSE(tracker_.detail(task_id{5}).has_value());
    EXPECT_FALSE(tracker_.acknowledge(task_id{5}));
}

TEST_F(StatusTrackerTest, LateProgressAfterTerminalIgnored) {
    publish(1, "alice", lifecycle_event_type::started, task_state::uploading);
    publish(1, "alice", lifecycle_event_type::completed, task_state::completed);
    publish(1, "alice", lifecycle_event_type::progressed, task_state::uploading, 99);

    auto entry = tracker_.detail(task_id{1});
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->snapshot.state, task_state::completed);
    EXPECT_EQ(entry->last_event, lifecycle_event_type::completed);
}

TEST_F(StatusTrackerTest, AcknowledgeOnlyTerminal) {
    publish(1, "alice", lifecycle_event_type::started, task_state::downloading);
    publish(2, "alice", lifecycle_event_type::failed, task_state::failed);

    EXPECT_FALSE(tracker_.acknowledge(task_id{1}));
    EXPECT_TRUE(tracker_.acknowledge(task_id{2}));
    EXPECT_FALSE(tracker_.detail(task_id{2}).has_value());
    EXPECT_EQ(tracker_.size(), 1u);
}

TEST_F(StatusTrackerTest, EvictedEventDropsEntry) {
    publish(1, "alice", lifecycle_event_type::canceled, task_state::canceled);
    publish(1, "alice", lifecycle_event_type::evicted, task_state::canceled);

    EXPECT_FALSE(tracker_.detail(task_id{1}).has_value());
    EXPECT_EQ(tracker_.size(), 0u);
}

TEST_F(StatusTrackerTest, ListFiltersAndOrders) {
    publish(1, "alice", lifecycle_event_type::completed, task_state::completed);
    publish(2, "alice", lifecycle_event_type::queued, task_state::queued);
    publish(3, "alice", lifecycle_event_type::started, task_state::downloading);
    publish(4, "bob", lifecycle_event_type::started, task_state::uploading);

    auto alice = tracker_.list(std::string("alice"));
    ASSERT_EQ(alice.size(), 3u);
    EXPECT_EQ(alice[0].snapshot.id, task_id{3});
    EXPECT_EQ(alice[1].snapshot.id, task_id{2});
    EXPECT_EQ(alice[2].snapshot.id, task_id{1});

    auto everyone = tracker_.list();
    ASSERT_EQ(everyone.size(), 4u);
    EXPECT_EQ(everyone[0].snapshot.id, task_id{3});
    EXPECT_EQ(everyone[1].snapshot.id, task_id{4});

    EXPECT_TRUE(tracker_.list(std::string("carol")).empty());
}

TEST_F(StatusTrackerTest, DestructionUnsubscribes) {
    EXPECT_EQ(bus_.subscriber_count(), 1u);
    {
        status_tracker second(bus_);
        EXPECT_EQ(bus_.subscriber_count(), 2u);
    }
    EXPECT_EQ(bus_.subscriber_count(), 1u);
}

}  // namespace kcenon::orchestrator::test
