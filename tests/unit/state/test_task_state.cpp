/**
 * @file test_task_state.cpp
 * @brief Unit tests for the task lifecycle state machine
 */

#include <gtest/gtest.h>

#include <kcenon/orchestrator/core/task_state.h>

#include <array>

namespace kcenon::orchestrator::test {

namespace {

constexpr std::array<task_state, 7> kAllStates{
    task_state::queued,   task_state::downloading, task_state::post_processing,
    task_state::uploading, task_state::completed,  task_state::failed,
    task_state::canceled};

constexpr std::array<task_trigger, 11> kAllTriggers{
    task_trigger::admitted,          task_trigger::download_succeeded,
    task_trigger::post_step_succeeded, task_trigger::post_step_failed,
    task_trigger::upload_succeeded,  task_trigger::transfer_failed,
    task_trigger::cancel_requested,  task_trigger::cancel_confirmed,
    task_trigger::cancel_timed_out,  task_trigger::interrupted,
    task_trigger::manual_retry};

auto everything_true() -> transition_context {
    transition_context ctx;
    ctx.download_complete = true;
    ctx.has_post_steps = true;
    ctx.more_destinations = true;
    ctx.retryable = true;
    ctx.budget_remaining = true;
    return ctx;
}

}  // namespace

// =============================================================================
// task_state Tests
// =============================================================================

class TaskStateTest : public ::testing::Test {};

TEST_F(TaskStateTest, ToString) {
    EXPECT_STREQ(to_string(task_state::queued), "queued");
    EXPECT_STREQ(to_string(task_state::post_processing), "post_processing");
    EXPECT_STREQ(to_string(task_state::canceled), "canceled");
    EXPECT_STREQ(to_string(static_cast<task_state>(999)), "unknown");
}

TEST_F(TaskStateTest, FromStringRoundTrip) {
    for (auto state : kAllStates) {
        EXPECT_EQ(task_state_from_string(to_string(state)), std::optional<task_state>(state));
    }
    EXPECT_FALSE(task_state_from_string("paused").has_value());
}

TEST_F(TaskStateTest, Classification) {
    EXPECT_TRUE(is_terminal_state(task_state::completed));
    EXPECT_TRUE(is_terminal_state(task_state::failed));
    EXPECT_TRUE(is_terminal_state(task_state::canceled));
    EXPECT_FALSE(is_terminal_state(task_state::queued));

    EXPECT_TRUE(is_active_state(task_state::post_processing));
    EXPECT_FALSE(is_active_state(task_state::queued));
    EXPECT_FALSE(is_active_state(task_state::failed));

    EXPECT_TRUE(is_engine_bound_state(task_state::uploading));
    EXPECT_FALSE(is_engine_bound_state(task_state::post_processing));
}

// =============================================================================
// next_state Tests
// =============================================================================

class NextStateTest : public ::testing::Test {};

TEST_F(NextStateTest, AdmissionSkipsDownloadWhenContentKept) {
    EXPECT_EQ(next_state(task_state::queued, task_trigger::admitted).value(),
              task_state::downloading);

    transition_context ctx;
    ctx.download_complete = true;
    EXPECT_EQ(next_state(task_state::queued, task_trigger::admitted, ctx).value(),
              task_state::uploading);
}

TEST_F(NextStateTest, DownloadSuccessRoutesThroughPostProcessing) {
    EXPECT_EQ(next_state(task_state::downloading, task_trigger::download_succeeded).value(),
              task_state::uploading);

    transition_context ctx;
    ctx.has_post_steps = true;
    EXPECT_EQ(next_state(task_state::downloading, task_trigger::download_succeeded, ctx).value(),
              task_state::post_processing);
    EXPECT_EQ(next_state(task_state::post_processing, task_trigger::post_step_succeeded).value(),
              task_state::uploading);
    EXPECT_EQ(next_state(task_state::post_processing, task_trigger::post_step_failed).value(),
              task_state::failed);
}

TEST_F(NextStateTest, UploadsAdvanceUntilLastDestination) {
    transition_context more;
    more.more_destinations = true;
    EXPECT_EQ(next_state(task_state::uploading, task_trigger::upload_succeeded, more).value(),
              task_state::uploading);
    EXPECT_EQ(next_state(task_state::uploading, task_trigger::upload_succeeded).value(),
              task_state::completed);
}

TEST_F(NextStateTest, FailureRequeuesOnlyWithBudget) {
    transition_context ctx;
    ctx.retryable = true;
    ctx.budget_remaining = true;
    EXPECT_EQ(next_state(task_state::downloading, task_trigger::transfer_failed, ctx).value(),
              task_state::queued);

    ctx.budget_remaining = false;
    EXPECT_EQ(next_state(task_state::uploading, task_trigger::transfer_failed, ctx).value(),
              task_state::failed);

    ctx.budget_remaining = true;
    ctx.retryable = false;
    EXPECT_EQ(next_state(task_state::downloading, task_trigger::transfer_failed, ctx).value(),
              task_state::failed);
}

TEST_F(NextStateTest, CancelDependsOnBinding) {
    EXPECT_EQ(next_state(task_state::queued, task_trigger::cancel_requested).value(),
              task_state::canceled);
    EXPECT_EQ(next_state(task_state::post_processing, task_trigger::cancel_requested).value(),
              task_state::canceled);

    // Engine-bound tasks stay put until the engine answers
    EXPECT_EQ(next_state(task_state::downloading, task_trigger::cancel_requested).value(),
              task_state::downloading);
    EXPECT_EQ(next_state(task_state::downloading, task_trigger::cancel_confirmed).value(),
              task_state::canceled);
    EXPECT_EQ(next_state(task_state::uploading, task_trigger::cancel_timed_out).value(),
              task_state::failed);

    auto terminal = next_state(task_state::completed, task_trigger::cancel_requested);
    ASSERT_FALSE(terminal.has_value());
    EXPECT_EQ(terminal.error().code, error_code::invalid_state_transition);
}

TEST_F(NextStateTest, InterruptedActiveTaskFails) {
    EXPECT_EQ(next_state(task_state::post_processing, task_trigger::interrupted).value(),
              task_state::failed);
    EXPECT_FALSE(next_state(task_state::queued, task_trigger::interrupted).has_value());
}

TEST_F(NextStateTest, ManualRetryRequiresRetryableBudget) {
    transition_context ctx;
    ctx.retryable = true;
    ctx.budget_remaining = true;
    EXPECT_EQ(next_state(task_state::failed, task_trigger::manual_retry, ctx).value(),
              task_state::queued);

    ctx.budget_remaining = false;
    EXPECT_FALSE(next_state(task_state::failed, task_trigger::manual_retry, ctx).has_value());
    EXPECT_FALSE(next_state(task_state::canceled, task_trigger::manual_retry,
                            everything_true()).has_value());
}

TEST_F(NextStateTest, RejectionNamesTriggerAndState) {
    auto rejected = next_state(task_state::queued, task_trigger::upload_succeeded);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_NE(rejected.error().message.find("upload_succeeded"), std::string::npos);
    EXPECT_NE(rejected.error().message.find("queued"), std::string::npos);
}

TEST_F(NextStateTest, CompletedAndCanceledAreAbsorbing) {
    for (auto trigger : kAllTriggers) {
        EXPECT_FALSE(next_state(task_state::completed, trigger, everything_true()).has_value())
            << to_string(trigger);
        EXPECT_FALSE(next_state(task_state::canceled, trigger, everything_true()).has_value())
            << to_string(trigger);
    }
}

TEST_F(NextStateTest, EveryProducedEdgeIsInTheGraph) {
    for (auto state : kAllStates) {
        for (auto trigger : kAllTriggers) {
            for (int bits = 0; bits < 32; ++bits) {
                transition_context ctx;
                ctx.download_complete = (bits & 1) != 0;
                ctx.has_post_steps = (bits & 2) != 0;
                ctx.more_destinations = (bits & 4) != 0;
                ctx.retryable = (bits & 8) != 0;
                ctx.budget_remaining = (bits & 16) != 0;

                auto next = next_state(state, trigger, ctx);
                if (!next || next.value() == state) {
                    continue;
                }
                EXPECT_TRUE(is_valid_transition(state, next.value()))
                    << to_string(state) << " -> " << to_string(next.value())
                    << " on " << to_string(trigger);
            }
        }
    }
}

}  // namespace kcenon::orchestrator::test
