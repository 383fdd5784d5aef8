#include "fixloop/queue/sqlite_task_queue.hpp"
#include "fixloop/service/task_service.hpp"
#include "fixloop/storage/sqlite_task_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;

namespace {

auto valid_request() -> SubmitRequest {
  SubmitRequest r;
  r.repository_url = "https://example.com/org/repo.git";
  r.branch = "main";
  r.issue_description = "compute() crashes on empty input";
  r.test_command = "pytest -q";
  return r;
}

}  // namespace

TEST(ValidateSubmissionTest, AcceptsWellFormedRequest) {
  EXPECT_EQ(validate_submission(valid_request()), "");

  auto local = valid_request();
  local.repository_url = "/srv/repos/app";
  EXPECT_EQ(validate_submission(local), "");

  auto scp = valid_request();
  scp.repository_url = "git@example.com:org/repo.git";
  EXPECT_EQ(validate_submission(scp), "");
}

TEST(ValidateSubmissionTest, RejectsBadRepositoryUrl) {
  auto r = valid_request();
  r.repository_url = "ftp://example.com/repo";
  EXPECT_NE(validate_submission(r).find("repository url"), std::string::npos);

  r.repository_url = "https://";
  EXPECT_FALSE(validate_submission(r).empty());

  r.repository_url = "";
  EXPECT_FALSE(validate_submission(r).empty());
}

TEST(ValidateSubmissionTest, RejectsBadBranch) {
  for (const char* branch : {"", "-rf", "a..b", "has space"}) {
    auto r = valid_request();
    r.branch = branch;
    EXPECT_NE(validate_submission(r).find("branch"), std::string::npos)
        << branch;
  }
}

TEST(ValidateSubmissionTest, RejectsBlankIssue) {
  auto r = valid_request();
  r.issue_description = " \n\t";
  EXPECT_EQ(validate_submission(r), "issue description is empty");
}

TEST(ValidateSubmissionTest, RejectsUnknownLanguage) {
  auto r = valid_request();
  r.language = "cobol";
  EXPECT_EQ(validate_submission(r), "unsupported language 'cobol'");

  r.language = "go";
  EXPECT_EQ(validate_submission(r), "");
}

TEST(ValidateSubmissionTest, MaxAttemptsBounds) {
  auto r = valid_request();
  r.max_attempts = 0;
  EXPECT_FALSE(validate_submission(r).empty());
  r.max_attempts = limits::kMaxAttemptsCeiling + 1;
  EXPECT_FALSE(validate_submission(r).empty());
  r.max_attempts = limits::kMaxAttemptsCeiling;
  EXPECT_EQ(validate_submission(r), "");
}

class TaskServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<SqliteTaskStore>(db_.path());
    queue_ = std::make_unique<SqliteTaskQueue>(db_.path());
    ASSERT_TRUE(store_->open().has_value());
    ASSERT_TRUE(queue_->open().has_value());
    service_ = std::make_unique<TaskService>(*store_, *queue_, 3);
  }

  auto submit(SubmitRequest r = valid_request()) -> TaskId {
    auto resp = service_->submit(r);
    EXPECT_TRUE(resp.has_value());
    return resp ? resp->id : TaskId{};
  }

  TempDb db_;
  std::unique_ptr<SqliteTaskStore> store_;
  std::unique_ptr<SqliteTaskQueue> queue_;
  std::unique_ptr<TaskService> service_;
};

TEST_F(TaskServiceTest, Submit_StoresAndQueuesPendingTask) {
  auto resp = service_->submit(valid_request());

  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->status, TaskStatus::Pending);
  EXPECT_FALSE(resp->id.str().empty());
  EXPECT_TRUE(*queue_->contains(resp->id));

  auto task = store_->get(resp->id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->repo.url, "https://example.com/org/repo.git");
  EXPECT_EQ(task->language, "python");
  EXPECT_EQ(task->max_attempts, 3);
  ASSERT_TRUE(task->test_command.has_value());
  EXPECT_EQ(*task->test_command, "pytest -q");
}

TEST_F(TaskServiceTest, Submit_BlankTestCommandIsDropped) {
  auto r = valid_request();
  r.test_command = "   ";
  r.max_attempts = 5;

  auto id = submit(r);

  auto task = store_->get(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_FALSE(task->test_command.has_value());
  EXPECT_EQ(task->max_attempts, 5);
}

TEST_F(TaskServiceTest, Submit_InvalidRequestStoresNothing) {
  auto r = valid_request();
  r.issue_description = "";

  auto resp = service_->submit(r);

  ASSERT_FALSE(resp.has_value());
  EXPECT_EQ(resp.error(), Error::ValidationError);
  EXPECT_EQ(*queue_->depth(), 0u);
  auto all = service_->list({});
  ASSERT_TRUE(all.has_value());
  EXPECT_TRUE(all->items.empty());
  EXPECT_EQ(all->total, 0u);
}

TEST_F(TaskServiceTest, Submit_IdsAreUnique) {
  auto a = submit();
  auto b = submit();
  EXPECT_NE(a, b);
  EXPECT_EQ(*queue_->depth(), 2u);
}

TEST_F(TaskServiceTest, Query_ReturnsViewOrNotFound) {
  auto id = submit();

  auto view = service_->query(id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->id, id);
  EXPECT_EQ(view->status, TaskStatus::Pending);
  EXPECT_TRUE(view->attempts.empty());
  EXPECT_FALSE(view->result_summary.has_value());

  auto missing = service_->query(task_id("nope"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(TaskServiceTest, Cancel_PendingTaskBecomesCancelled) {
  auto id = submit();

  auto outcome = service_->cancel(id);

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, CancelOutcome::Requested);
  auto view = service_->query(id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, TaskStatus::Cancelled);
  EXPECT_EQ(view->failure_kind, FailureKind::Cancelled);
  EXPECT_EQ(view->failure_reason, "cancelled before start");
  EXPECT_TRUE(view->completed_at.has_value());

  auto again = service_->cancel(id);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, CancelOutcome::AlreadyTerminal);
}

TEST_F(TaskServiceTest, Cancel_RunningTaskGetsMarker) {
  auto id = submit();
  auto task = store_->get(id);
  ASSERT_TRUE(task.has_value());
  Task next = *task;
  next.status = TaskStatus::Planning;
  ASSERT_TRUE(*store_->compare_and_set(next, TaskStatus::Pending));

  auto first = service_->cancel(id);
  auto second = service_->cancel(id);

  ASSERT_TRUE(first.has_value() && second.has_value());
  EXPECT_EQ(*first, CancelOutcome::Requested);
  EXPECT_EQ(*second, CancelOutcome::AlreadyRequested);
  auto view = service_->query(id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->status, TaskStatus::Planning);
  EXPECT_TRUE(view->cancel_requested);
}

TEST_F(TaskServiceTest, Cancel_UnknownTaskIsNotFound) {
  auto r = service_->cancel(task_id("ghost"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotFound);
}

TEST_F(TaskServiceTest, List_FiltersByStatus) {
  auto a = submit();
  auto b = submit();
  ASSERT_TRUE(service_->cancel(a).has_value());

  auto pending = service_->list({.status = TaskStatus::Pending});
  auto cancelled = service_->list({.status = TaskStatus::Cancelled});

  ASSERT_TRUE(pending.has_value() && cancelled.has_value());
  ASSERT_EQ(pending->items.size(), 1u);
  EXPECT_EQ(pending->items.front().id, b);
  EXPECT_EQ(pending->total, 1u);
  ASSERT_EQ(cancelled->items.size(), 1u);
  EXPECT_EQ(cancelled->items.front().id, a);
  EXPECT_EQ(cancelled->items.front().failure_kind, FailureKind::Cancelled);
}

TEST_F(TaskServiceTest, List_TotalCountsBeyondThePage) {
  for (int i = 0; i < 5; ++i) {
    submit();
  }

  auto page = service_->list({.status = std::nullopt, .limit = 2, .offset = 2});

  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->items.size(), 2u);
  EXPECT_EQ(page->total, 5u);
}
