/**
 * @file test_task_types.cpp
 * @brief Unit tests for task sources, destinations and records
 */

#include <gtest/gtest.h>

#include <kcenon/orchestrator/core/task_types.h>

namespace kcenon::orchestrator::test {

// =============================================================================
// Source Tests
// =============================================================================

class TaskSourceTest : public ::testing::Test {};

TEST_F(TaskSourceTest, KindFollowsAlternative) {
    EXPECT_EQ(kind_of(task_source{direct_link_source{"https://a/b", {}}}),
              source_kind::direct_link);
    EXPECT_EQ(kind_of(task_source{torrent_source{"magnet:?xt=urn:btih:abc", {}}}),
              source_kind::torrent);
    EXPECT_EQ(kind_of(task_source{video_site_source{"https://video.example/v"}}),
              source_kind::video_site);
    EXPECT_EQ(kind_of(task_source{chat_file_source{"chat:42/7"}}), source_kind::chat_file);
}

TEST_F(TaskSourceTest, LocatorOfEachAlternative) {
    EXPECT_EQ(locator_of(task_source{direct_link_source{"https://a/b", "b.bin"}}), "https://a/b");
    EXPECT_EQ(locator_of(task_source{torrent_source{"magnet:?xt=1", {0, 2}}}), "magnet:?xt=1");
    EXPECT_EQ(locator_of(task_source{video_site_source{"https://v/1", "720p"}}), "https://v/1");
    EXPECT_EQ(locator_of(task_source{chat_file_source{"tg://file/9"}}), "tg://file/9");
}

TEST_F(TaskSourceTest, VideoDefaultsToBestFormat) {
    video_site_source video{"https://v/1"};
    EXPECT_EQ(video.format, "best");
}

TEST_F(TaskSourceTest, KindNames) {
    EXPECT_STREQ(to_string(source_kind::torrent), "torrent");
    EXPECT_EQ(source_kind_from_string("chat_file"), std::optional<source_kind>(source_kind::chat_file));
    EXPECT_FALSE(source_kind_from_string("ftp").has_value());
}

// =============================================================================
// Destination Tests
// =============================================================================

class TaskDestinationTest : public ::testing::Test {};

TEST_F(TaskDestinationTest, Describe) {
    EXPECT_EQ(describe(task_destination{cloud_drive_destination{"abc", false}}), "drive:abc");
    EXPECT_EQ(describe(task_destination{cloud_drive_destination{"team", true}}),
              "shared-drive:team");
    EXPECT_EQ(describe(task_destination{remote_storage_destination{"s3", "bucket/dir"}}),
              "s3:bucket/dir");
    EXPECT_EQ(describe(task_destination{chat_delivery_destination{"-100123"}}), "chat:-100123");
}

TEST_F(TaskDestinationTest, KindAndNames) {
    EXPECT_EQ(kind_of(task_destination{remote_storage_destination{"r", "p"}}),
              destination_kind::remote_storage);
    EXPECT_STREQ(to_string(destination_kind::chat_delivery), "chat_delivery");
    EXPECT_EQ(destination_kind_from_string("cloud_drive"),
              std::optional<destination_kind>(destination_kind::cloud_drive));
    EXPECT_FALSE(destination_kind_from_string("dropbox").has_value());
}

TEST_F(TaskDestinationTest, ChatDeliveryDefaultsToDocument) {
    chat_delivery_destination chat{"1"};
    EXPECT_TRUE(chat.as_document);
}

// =============================================================================
// Record Tests
// =============================================================================

class TaskRecordTest : public ::testing::Test {
protected:
    static auto make(uint64_t id, task_state state) -> task_record {
        task_record r;
        r.id = task_id{id};
        r.state = state;
        r.created_at = base_ + std::chrono::seconds(id);
        return r;
    }

    static inline const std::chrono::system_clock::time_point base_ =
        std::chrono::system_clock::time_point{} + std::chrono::hours(1000);
};

TEST_F(TaskRecordTest, CompletionPercentage) {
    transfer_progress p;
    EXPECT_FALSE(p.completion_percentage().has_value());

    p.total_bytes = 0;
    EXPECT_FALSE(p.completion_percentage().has_value());

    p.total_bytes = 200;
    p.transferred_bytes = 50;
    ASSERT_TRUE(p.completion_percentage().has_value());
    EXPECT_DOUBLE_EQ(*p.completion_percentage(), 25.0);
}

TEST_F(TaskRecordTest, TerminalAndDownloadFlags) {
    auto r = make(1, task_state::uploading);
    EXPECT_FALSE(r.is_terminal());
    EXPECT_FALSE(r.download_complete());

    r.downloaded_path = "/tmp/work/1/file.bin";
    EXPECT_TRUE(r.download_complete());

    r.state = task_state::canceled;
    EXPECT_TRUE(r.is_terminal());
}

TEST_F(TaskRecordTest, SortForListing) {
    auto done = make(1, task_state::completed);
    done.finished_at = base_ + std::chrono::seconds(50);

    auto queued_second = make(2, task_state::queued);
    queued_second.queue_position = 2;

    auto queued_first = make(3, task_state::queued);
    queued_first.queue_position = 1;

    auto backing_off = make(4, task_state::queued);

    auto active_late = make(5, task_state::uploading);
    active_late.started_at = base_ + std::chrono::seconds(30);

    auto active_early = make(6, task_state::downloading);
    active_early.started_at = base_ + std::chrono::seconds(10);

    std::vector<task_record> records{done, queued_second, queued_first,
                                     backing_off, active_late, active_early};
    sort_for_listing(records);

    std::vector<uint64_t> order;
    for (const auto& r : records) {
        order.push_back(r.id.value);
    }
    EXPECT_EQ(order, (std::vector<uint64_t>{6, 5, 3, 2, 4, 1}));
}

}  // namespace kcenon::orchestrator::test
