#include "fixloop/model/transition.hpp"

#include "gtest/gtest.h"

using namespace fixloop;

TEST(TransitionTest, HappyPath_FollowsPhaseOrder) {
  EXPECT_EQ(next_transition(TaskStatus::Pending, Event::Claimed)->to,
            TaskStatus::Planning);

  auto planned = next_transition(TaskStatus::Planning, Event::PlanProduced);
  ASSERT_TRUE(planned);
  EXPECT_EQ(planned->to, TaskStatus::Coding);
  EXPECT_EQ(planned->effect, Effect::CreateFirstAttempt);

  EXPECT_EQ(next_transition(TaskStatus::Coding, Event::PatchProduced)->to,
            TaskStatus::Reviewing);
  EXPECT_EQ(next_transition(TaskStatus::Reviewing, Event::ReviewApproved)->to,
            TaskStatus::Testing);

  auto passed = next_transition(TaskStatus::Testing, Event::TestPassed);
  ASSERT_TRUE(passed);
  EXPECT_EQ(passed->to, TaskStatus::Success);
  EXPECT_EQ(passed->effect, Effect::Succeed);
}

TEST(TransitionTest, ReviewRejected_WithRetriesLeft_RetriesSameAttempt) {
  GuardInputs in{.rejection_count = 1, .review_retry_limit = 2,
                 .attempt_index = 0, .max_attempts = 3};

  auto t = next_transition(TaskStatus::Reviewing, Event::ReviewRejected, in);

  ASSERT_TRUE(t);
  EXPECT_EQ(t->to, TaskStatus::Coding);
  EXPECT_EQ(t->effect, Effect::RetryCoding);
}

TEST(TransitionTest, ReviewRejected_Exhausted_CountsAsAttemptFailure) {
  GuardInputs in{.rejection_count = 2, .review_retry_limit = 2,
                 .attempt_index = 0, .max_attempts = 3};

  auto t = next_transition(TaskStatus::Reviewing, Event::ReviewRejected, in);

  ASSERT_TRUE(t);
  EXPECT_EQ(t->to, TaskStatus::Coding);
  EXPECT_EQ(t->effect, Effect::AppendAttempt);
}

TEST(TransitionTest, ReviewRejected_ExhaustedOnLastAttempt_FailsLogic) {
  GuardInputs in{.rejection_count = 2, .review_retry_limit = 2,
                 .attempt_index = 2, .max_attempts = 3};

  auto t = next_transition(TaskStatus::Reviewing, Event::ReviewRejected, in);

  ASSERT_TRUE(t);
  EXPECT_EQ(t->to, TaskStatus::Failed);
  EXPECT_EQ(t->effect, Effect::FailLogic);
}

TEST(TransitionTest, TestFailed_WithAttemptsLeft_AppendsAttempt) {
  GuardInputs in{.attempt_index = 1, .max_attempts = 3};

  auto t = next_transition(TaskStatus::Testing, Event::TestFailed, in);

  ASSERT_TRUE(t);
  EXPECT_EQ(t->to, TaskStatus::Coding);
  EXPECT_EQ(t->effect, Effect::AppendAttempt);
}

TEST(TransitionTest, TestFailed_OnLastAttempt_FailsLogic) {
  GuardInputs in{.attempt_index = 2, .max_attempts = 3};

  auto t = next_transition(TaskStatus::Testing, Event::TestFailed, in);

  ASSERT_TRUE(t);
  EXPECT_EQ(t->to, TaskStatus::Failed);
  EXPECT_EQ(t->effect, Effect::FailLogic);
}

TEST(TransitionTest, SingleAttemptBudget_FirstFailureIsFinal) {
  GuardInputs in{.attempt_index = 0, .max_attempts = 1};

  auto t = next_transition(TaskStatus::Testing, Event::TestFailed, in);

  ASSERT_TRUE(t);
  EXPECT_EQ(t->to, TaskStatus::Failed);
}

TEST(TransitionTest, Cancel_FromEveryNonTerminalState) {
  for (auto s : {TaskStatus::Pending, TaskStatus::Planning, TaskStatus::Coding,
                 TaskStatus::Reviewing, TaskStatus::Testing}) {
    auto t = next_transition(s, Event::CancelRequested);
    ASSERT_TRUE(t);
    EXPECT_EQ(t->to, TaskStatus::Cancelled);
    EXPECT_EQ(t->effect, Effect::Cancel);
  }
}

TEST(TransitionTest, InfrastructureError_FromEveryNonTerminalState) {
  for (auto s : {TaskStatus::Pending, TaskStatus::Planning, TaskStatus::Coding,
                 TaskStatus::Reviewing, TaskStatus::Testing}) {
    auto t = next_transition(s, Event::InfrastructureError);
    ASSERT_TRUE(t);
    EXPECT_EQ(t->to, TaskStatus::Failed);
    EXPECT_EQ(t->effect, Effect::FailInfrastructure);
  }
}

TEST(TransitionTest, TerminalStates_HaveNoOutgoingEdges) {
  for (auto s :
       {TaskStatus::Success, TaskStatus::Failed, TaskStatus::Cancelled}) {
    EXPECT_FALSE(next_transition(s, Event::CancelRequested));
    EXPECT_FALSE(next_transition(s, Event::InfrastructureError));
    EXPECT_FALSE(next_transition(s, Event::Claimed));
  }
}

TEST(TransitionTest, EventOutOfPhase_HasNoEdge) {
  EXPECT_FALSE(next_transition(TaskStatus::Planning, Event::TestPassed));
  EXPECT_FALSE(next_transition(TaskStatus::Coding, Event::ReviewApproved));
  EXPECT_FALSE(next_transition(TaskStatus::Pending, Event::PlanProduced));
}

static_assert(next_transition(TaskStatus::Pending, Event::Claimed)->to ==
              TaskStatus::Planning);
