/**
 * @file test_error_advanced_scenarios.cpp
 * @brief Integration tests for retries, partial uploads, cancellation and
 *        throwing collaborators
 */

#include "test_fixtures.h"

#include <future>
#include <stdexcept>

namespace kcenon::orchestrator::test {

// =============================================================================
// Retry behavior
// =============================================================================

class RetryTest : public SchedulerFixture {};

TEST_F(RetryTest, RetryableFailuresExhaustBudget) {
    downloads_->script({scripted_engine::outcome::fail_retryable,
                        scripted_engine::outcome::fail_retryable,
                        scripted_engine::outcome::fail_retryable});
    auto b = base_builder();
    b.with_max_retries(2);
    start(b);
    event_recorder recorder(scheduler_->events());

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    EXPECT_EQ(done.value().retry_count, 2u);
    ASSERT_TRUE(done.value().error.has_value());
    EXPECT_EQ(done.value().error->kind, transfer_error_kind::network_error);
    EXPECT_EQ(downloads_->start_count(), 3u);
    EXPECT_EQ(recorder.count(id, lifecycle_event_type::started), 3u);
    EXPECT_EQ(recorder.count(id, lifecycle_event_type::queued), 3u);
    EXPECT_EQ(recorder.count(id, lifecycle_event_type::failed), 1u);
    EXPECT_EQ(scheduler_->statistics().retried, 2u);
}

TEST_F(RetryTest, RetryThenSucceed) {
    downloads_->script({scripted_engine::outcome::fail_retryable,
                        scripted_engine::outcome::succeed});
    uploads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto b = base_builder();
    start(b);

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::completed);
    EXPECT_EQ(done.value().retry_count, 1u);
    EXPECT_FALSE(done.value().error.has_value());
}

TEST_F(RetryTest, PermanentFailureIsNotRetried) {
    downloads_->script({scripted_engine::outcome::fail_permanent});
    auto b = base_builder();
    start(b);

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    EXPECT_EQ(done.value().retry_count, 0u);
    EXPECT_EQ(done.value().error->kind, transfer_error_kind::not_found);
    EXPECT_EQ(downloads_->start_count(), 1u);
}

TEST_F(RetryTest, StartRejectionFailsWithEngineUnavailable) {
    downloads_->script({scripted_engine::outcome::reject_start});
    auto b = base_builder();
    start(b);

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    EXPECT_EQ(done.value().error->kind, transfer_error_kind::engine_unavailable);
    EXPECT_EQ(scheduler_->statistics().active, 0u);
}

TEST_F(RetryTest, UploadRetryKeepsDownload) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    uploads_->script({scripted_engine::outcome::fail_retryable,
                      scripted_engine::outcome::succeed});
    auto b = base_builder();
    start(b);

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::completed);
    EXPECT_EQ(done.value().retry_count, 1u);
    EXPECT_EQ(downloads_->start_count(), 1u);
    EXPECT_EQ(uploads_->start_count(), 2u);
}

TEST_F(RetryTest, FailureAtDestinationStopsLaterUploads) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    uploads_->script({scripted_engine::outcome::succeed,
                      scripted_engine::outcome::fail_permanent});
    auto b = base_builder();
    start(b);

    auto id = submit("alice", 3);
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    EXPECT_EQ(done.value().destination_index, 1u);
    EXPECT_EQ(done.value().upload_results.size(), 1u);
    EXPECT_EQ(uploads_->start_count(), 2u);

    for (const auto& request : uploads_->requests()) {
        EXPECT_LT(request.destination_index, 2u);
    }
}

TEST_F(RetryTest, FailedTaskKeepsWorkDirectoryUntilEviction) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    uploads_->script({scripted_engine::outcome::fail_permanent});
    auto b = base_builder();
    start(b);

    auto id = submit("alice");
    ASSERT_TRUE(scheduler_->wait_for(id, std::chrono::seconds(5)).has_value());
    EXPECT_TRUE(std::filesystem::exists(work_dir_ / id.to_string()));

    ASSERT_TRUE(scheduler_->acknowledge(id).has_value());
    EXPECT_FALSE(std::filesystem::exists(work_dir_ / id.to_string()));
}

TEST_F(RetryTest, ManualRetryRequeuesFailedTask) {
    downloads_->script({scripted_engine::outcome::fail_permanent,
                        scripted_engine::outcome::succeed});
    uploads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto b = base_builder();
    start(b);

    auto s = link_submission("alice");
    s.max_retries = 1;
    auto id = scheduler_->submit(s);
    ASSERT_TRUE(id.has_value());
    auto failed = scheduler_->wait_for(id.value(), std::chrono::seconds(5));
    ASSERT_TRUE(failed.has_value());
    ASSERT_EQ(failed.value().state, task_state::failed);

    ASSERT_TRUE(scheduler_->retry_now(id.value()).has_value());
    auto done = scheduler_->wait_for(id.value(), std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::completed);
    EXPECT_EQ(done.value().retry_count, 1u);

    auto again = scheduler_->retry_now(id.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::not_retryable);
}

TEST_F(RetryTest, ManualRetryRespectsBudget) {
    downloads_->script({scripted_engine::outcome::fail_permanent});
    auto b = base_builder();
    b.with_max_retries(0);
    start(b);

    auto id = submit("alice");
    ASSERT_TRUE(scheduler_->wait_for(id, std::chrono::seconds(5)).has_value());

    auto retried = scheduler_->retry_now(id);
    ASSERT_FALSE(retried.has_value());
    EXPECT_EQ(retried.error().code, error_code::not_retryable);
}

TEST_F(RetryTest, ManualRetryRejectsUnretryableKind) {
    downloads_->script({scripted_engine::outcome::reject_start});
    auto b = base_builder();
    start(b);

    auto id = submit("alice");
    ASSERT_TRUE(scheduler_->wait_for(id, std::chrono::seconds(5)).has_value());

    auto retried = scheduler_->retry_now(id);
    ASSERT_FALSE(retried.has_value());
    EXPECT_EQ(retried.error().code, error_code::not_retryable);
}

TEST_F(RetryTest, RetryNowSkipsBackoff) {
    downloads_->script({scripted_engine::outcome::fail_retryable,
                        scripted_engine::outcome::succeed});
    uploads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto b = base_builder();
    b.with_retry_policy(retry_policy{std::chrono::seconds(30), std::chrono::seconds(60), 2.0});
    start(b);

    auto id = submit("alice");
    ASSERT_TRUE(downloads_->wait_for_starts(1));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (scheduler_->get_status(id).value().retry_count != 1 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    auto waiting = scheduler_->get_status(id).value();
    ASSERT_EQ(waiting.state, task_state::queued);
    EXPECT_FALSE(waiting.queue_position.has_value());

    ASSERT_TRUE(scheduler_->retry_now(id).has_value());
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::completed);
}

// =============================================================================
// Cancellation
// =============================================================================

class CancelTest : public SchedulerFixture {
protected:
    void SetUp() override {
        SchedulerFixture::SetUp();
        auto b = base_builder();
        b.with_global_limit(1);
        start(b);
    }
};

TEST_F(CancelTest, CancelQueuedTask) {
    auto running = submit("alice");
    auto waiting = submit("bob");
    ASSERT_TRUE(downloads_->wait_for_starts(1));
    ASSERT_EQ(scheduler_->get_status(waiting).value().state, task_state::queued);

    ASSERT_TRUE(scheduler_->cancel(waiting).has_value());

    auto status = scheduler_->get_status(waiting).value();
    EXPECT_EQ(status.state, task_state::canceled);
    EXPECT_FALSE(status.error.has_value());
    EXPECT_EQ(downloads_->start_count(), 1u);
    EXPECT_EQ(scheduler_->get_status(running).value().state, task_state::downloading);
    EXPECT_EQ(scheduler_->statistics().waiting, 0u);

    auto again = scheduler_->cancel(waiting);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::already_terminal);
}

TEST_F(CancelTest, CancelUnknownTask) {
    auto canceled = scheduler_->cancel(task_id{12345});
    ASSERT_FALSE(canceled.has_value());
    EXPECT_EQ(canceled.error().code, error_code::task_not_found);
}

TEST_F(CancelTest, CancelActiveTaskAdmitsNext) {
    auto running = submit("alice");
    auto waiting = submit("bob");
    ASSERT_TRUE(downloads_->wait_for_starts(1));

    ASSERT_TRUE(scheduler_->cancel(running).has_value());

    auto done = scheduler_->wait_for(running, std::chrono::seconds(5));
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::canceled);
    EXPECT_EQ(downloads_->cancel_count(), 1u);

    ASSERT_TRUE(wait_for_state(waiting, task_state::downloading));
    auto stats = scheduler_->statistics();
    EXPECT_EQ(stats.active, 1u);
    EXPECT_EQ(stats.waiting, 0u);
}

TEST_F(CancelTest, SuccessRacingCancelStillCancels) {
    downloads_->set_confirm_cancels(false);
    uploads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto running = submit("alice");
    auto waiting = submit("bob");
    ASSERT_TRUE(downloads_->wait_for_starts(1));
    auto handle = downloads_->handle_for(running);
    ASSERT_TRUE(handle.has_value());

    ASSERT_TRUE(scheduler_->cancel(running).has_value());
    EXPECT_EQ(scheduler_->get_status(running).value().state, task_state::downloading);

    downloads_->succeed(*handle);

    auto done = scheduler_->wait_for(running, std::chrono::seconds(5));
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::canceled);
    EXPECT_EQ(uploads_->start_count(), 0u);

    ASSERT_TRUE(wait_for_state(waiting, task_state::downloading));
    EXPECT_EQ(scheduler_->statistics().active, 1u);
}

TEST_F(CancelTest, CancelTimeoutFailsTaskAndFreesSlot) {
    downloads_->set_confirm_cancels(false);
    auto running = submit("alice");
    auto waiting = submit("bob");
    ASSERT_TRUE(downloads_->wait_for_starts(1));
    auto handle = downloads_->handle_for(running);
    ASSERT_TRUE(handle.has_value());

    ASSERT_TRUE(scheduler_->cancel(running).has_value());
    auto done = scheduler_->wait_for(running, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    ASSERT_TRUE(done.value().error.has_value());
    EXPECT_EQ(done.value().error->kind, transfer_error_kind::cancel_timeout);
    ASSERT_TRUE(wait_for_state(waiting, task_state::downloading));

    // A confirmation arriving after the timeout changes nothing
    downloads_->confirm_cancel(*handle);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(scheduler_->get_status(running).value().state, task_state::failed);
    EXPECT_EQ(scheduler_->statistics().active, 1u);
}

TEST_F(CancelTest, RepeatedCancelIsAccepted) {
    downloads_->set_confirm_cancels(false);
    auto running = submit("alice");
    ASSERT_TRUE(downloads_->wait_for_starts(1));

    ASSERT_TRUE(scheduler_->cancel(running).has_value());
    ASSERT_TRUE(scheduler_->cancel(running).has_value());
    EXPECT_EQ(downloads_->cancel_count(), 1u);
}

class CancelPostProcessingTest : public SchedulerFixture {};

/**
 * @brief Post step that blocks until the test releases it
 */
class gated_post_processor : public post_processor {
public:
    [[nodiscard]] auto name() const -> std::string override { return "gated"; }

    [[nodiscard]] auto process(const task_record&, const std::filesystem::path& input)
        -> result<std::filesystem::path> override {
        entered_.set_value();
        release_.wait();
        return input;
    }

    void wait_entered() { entered_future_.wait(); }
    void release() { release_promise_.set_value(); }

private:
    std::promise<void> entered_;
    std::future<void> entered_future_ = entered_.get_future();
    std::promise<void> release_promise_;
    std::shared_future<void> release_ = release_promise_.get_future().share();
};

TEST_F(CancelPostProcessingTest, CancelDuringPostProcessing) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    uploads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto step = std::make_shared<gated_post_processor>();
    auto b = base_builder();
    b.with_post_processor(step);
    start(b);

    auto id = submit("alice");
    step->wait_entered();
    ASSERT_EQ(scheduler_->get_status(id).value().state, task_state::post_processing);

    ASSERT_TRUE(scheduler_->cancel(id).has_value());
    EXPECT_EQ(scheduler_->get_status(id).value().state, task_state::canceled);
    EXPECT_EQ(scheduler_->statistics().active, 0u);

    step->release();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(scheduler_->get_status(id).value().state, task_state::canceled);
    EXPECT_EQ(uploads_->start_count(), 0u);
}

TEST_F(CancelPostProcessingTest, WorkDirectoryOutlivesCanceledPostStep) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto step = std::make_shared<gated_post_processor>();
    auto b = base_builder();
    b.with_post_processor(step);
    start(b);

    auto id = submit("alice");
    step->wait_entered();
    auto dir = work_dir_ / id.to_string();
    ASSERT_TRUE(std::filesystem::exists(dir));

    ASSERT_TRUE(scheduler_->cancel(id).has_value());
    EXPECT_TRUE(std::filesystem::exists(dir));

    step->release();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::filesystem::exists(dir) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(CancelPostProcessingTest, AcknowledgedTaskLeavesDirectoryToRunningStep) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto step = std::make_shared<gated_post_processor>();
    auto b = base_builder();
    b.with_post_processor(step);
    start(b);

    auto id = submit("alice");
    step->wait_entered();
    auto dir = work_dir_ / id.to_string();

    ASSERT_TRUE(scheduler_->cancel(id).has_value());
    ASSERT_TRUE(scheduler_->acknowledge(id).has_value());
    EXPECT_EQ(scheduler_->get_status(id).error().code, error_code::task_not_found);
    EXPECT_TRUE(std::filesystem::exists(dir));

    step->release();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::filesystem::exists(dir) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_FALSE(std::filesystem::exists(dir));
    EXPECT_EQ(uploads_->start_count(), 0u);
}

// =============================================================================
// Throwing engines and post steps
// =============================================================================

class ThrowingCollaboratorTest : public SchedulerFixture {};

/**
 * @brief Engine whose start() throws instead of returning an error
 */
class throwing_engine : public transfer_engine {
public:
    [[nodiscard]] auto name() const -> std::string override { return "throwing"; }

    [[nodiscard]] auto start(const transfer_request&, engine_event_sink)
        -> result<engine_handle> override {
        throw std::runtime_error("socket pool exhausted");
    }

    [[nodiscard]] auto cancel(engine_handle) -> result<void> override { return {}; }
};

class throwing_post_processor : public post_processor {
public:
    [[nodiscard]] auto name() const -> std::string override { return "extract"; }

    [[nodiscard]] auto process(const task_record&, const std::filesystem::path&)
        -> result<std::filesystem::path> override {
        throw std::runtime_error("corrupt archive");
    }
};

TEST_F(ThrowingCollaboratorTest, EngineThrowingFromStartFailsTask) {
    auto b = base_builder();
    b.with_download_engine(source_kind::direct_link, std::make_shared<throwing_engine>());
    start(b);

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    EXPECT_EQ(done.value().error->kind, transfer_error_kind::internal);
    EXPECT_NE(done.value().error->message.find("socket pool exhausted"), std::string::npos);
    EXPECT_EQ(scheduler_->statistics().active, 0u);

    // The scheduler keeps serving after the throw
    auto next = submit("bob");
    EXPECT_EQ(scheduler_->wait_for(next, std::chrono::seconds(5)).value().state,
              task_state::failed);
}

TEST_F(ThrowingCollaboratorTest, PostStepThrowingFailsTask) {
    downloads_->set_auto_outcome(scripted_engine::outcome::succeed);
    auto b = base_builder();
    b.with_post_processor(std::make_shared<throwing_post_processor>());
    start(b);

    auto id = submit("alice");
    auto done = scheduler_->wait_for(id, std::chrono::seconds(5));

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value().state, task_state::failed);
    EXPECT_EQ(done.value().error->kind, transfer_error_kind::post_processing_failed);
    EXPECT_NE(done.value().error->message.find("corrupt archive"), std::string::npos);
    EXPECT_EQ(uploads_->start_count(), 0u);
}

// =============================================================================
// Shutdown
// =============================================================================

class ShutdownTest : public SchedulerFixture {};

TEST_F(ShutdownTest, ShutdownCancelsUnfinishedTasks) {
    auto b = base_builder();
    b.with_global_limit(2).with_per_owner_limit(1);
    start(b);

    auto a = submit("alice");
    auto c = submit("carol");
    auto w = submit("walter");
    ASSERT_TRUE(downloads_->wait_for_starts(2));

    ASSERT_TRUE(scheduler_->shutdown().has_value());

    for (const auto& id : {a, c, w}) {
        auto status = scheduler_->get_status(id);
        ASSERT_TRUE(status.has_value());
        EXPECT_EQ(status.value().state, task_state::canceled);
    }
    EXPECT_EQ(downloads_->start_count(), 2u);
}

TEST_F(ShutdownTest, ShutdownWaitsForUnconfirmedCancel) {
    downloads_->set_confirm_cancels(false);
    auto b = base_builder();
    b.with_cancel_timeout(std::chrono::milliseconds(100));
    start(b);

    auto id = submit("alice");
    ASSERT_TRUE(downloads_->wait_for_starts(1));

    ASSERT_TRUE(scheduler_->shutdown().has_value());

    auto status = scheduler_->get_status(id).value();
    EXPECT_EQ(status.state, task_state::failed);
    EXPECT_EQ(status.error->kind, transfer_error_kind::cancel_timeout);
}

}  // namespace kcenon::orchestrator::test
