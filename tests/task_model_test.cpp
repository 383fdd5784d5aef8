#include "fixloop/model/json.hpp"
#include "fixloop/model/state_strings.hpp"
#include "fixloop/model/task.hpp"

#include "gtest/gtest.h"

using namespace fixloop;

TEST(AttemptTest, IsWellOrdered_RequiresPhaseOrder) {
  Attempt a;
  EXPECT_TRUE(a.is_well_ordered());

  a.patch = Patch{.filename = "main.py"};
  EXPECT_FALSE(a.is_well_ordered());

  a.plan = "plan";
  EXPECT_TRUE(a.is_well_ordered());

  a.test = TestResult{};
  EXPECT_FALSE(a.is_well_ordered());

  a.review = Review{.approved = true};
  EXPECT_TRUE(a.is_well_ordered());
}

TEST(StateStringsTest, ParseTaskStatus_IsStrict) {
  EXPECT_EQ(parse_task_status("TESTING"), TaskStatus::Testing);
  EXPECT_EQ(parse_task_status("CANCELLED"), TaskStatus::Cancelled);
  EXPECT_FALSE(parse_task_status("testing"));
  EXPECT_FALSE(parse_task_status("RUNNING"));
}

TEST(StateStringsTest, FailureKindNames) {
  EXPECT_STREQ(failure_kind_name(FailureKind::LogicExhausted), "logic");
  EXPECT_STREQ(failure_kind_name(FailureKind::Infrastructure), "infrastructure");
  EXPECT_EQ(parse_failure_kind("cancelled"), FailureKind::Cancelled);
  EXPECT_EQ(parse_failure_kind("bogus"), FailureKind::None);
}

TEST(AttemptJsonTest, PreservesCarriedContextAndDiagnostics) {
  Attempt a;
  a.index = 1;
  a.plan = "guard the divisor";
  a.rejection_count = 1;
  a.carried.previous_patch = Patch{.filename = "main.py", .code = "x = 1"};
  a.carried.test_stderr_tail = "ZeroDivisionError";
  a.diagnostics = {"review rejected, round 1 of 2"};
  a.usage = Usage{.generation_calls = 3, .tokens_used = 42};

  auto parsed = attempt_from_string(attempt_to_string(a));

  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->index, 1);
  EXPECT_EQ(parsed->plan, "guard the divisor");
  EXPECT_FALSE(parsed->patch.has_value());
  ASSERT_TRUE(parsed->carried.previous_patch.has_value());
  EXPECT_EQ(parsed->carried.previous_patch->code, "x = 1");
  EXPECT_EQ(parsed->carried.test_stderr_tail, "ZeroDivisionError");
  EXPECT_EQ(parsed->diagnostics.size(), 1u);
  EXPECT_EQ(parsed->usage.tokens_used, 42);
}

TEST(AttemptJsonTest, Malformed_IsParseError) {
  auto parsed = attempt_from_string("{not json");

  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), Error::ParseError);
}

TEST(TaskViewTest, NonTerminal_HidesResult) {
  Task task;
  task.id = TaskId{"t1"};
  task.status = TaskStatus::Coding;
  task.result_summary = "stale";
  Attempt a;
  a.plan = "p";
  task.attempts.push_back(a);

  auto view = make_view(task);

  EXPECT_FALSE(view.result_summary.has_value());
  EXPECT_FALSE(view.final_patch.has_value());
  ASSERT_EQ(view.attempts.size(), 1u);
  EXPECT_FALSE(view.attempts[0].has_patch);
}

TEST(TaskViewTest, Success_ExposesFinalPatch) {
  Task task;
  task.id = TaskId{"t1"};
  task.status = TaskStatus::Success;
  task.completed_at = Clock::now();
  task.result_summary = "Fix validated";
  Attempt a;
  a.plan = "p";
  a.patch = Patch{.filename = "main.py", .code = "print(1)"};
  a.review = Review{.approved = true};
  a.test = TestResult{.success = true, .exit_code = 0};
  task.attempts.push_back(a);

  auto view = make_view(task);

  ASSERT_TRUE(view.result_summary.has_value());
  ASSERT_TRUE(view.final_patch.has_value());
  EXPECT_EQ(view.final_patch->filename, "main.py");
  EXPECT_EQ(view.attempts[0].test_success, true);
  EXPECT_EQ(view.attempts[0].review_approved, true);
}
