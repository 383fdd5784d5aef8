#include "fixloop/queue/sqlite_task_queue.hpp"
#include "fixloop/storage/sqlite_task_store.hpp"
#include "fixloop/worker/coordinator.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <format>
#include <thread>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;
using namespace std::chrono_literals;

class CoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<SqliteTaskStore>(db_.path());
    queue_ = std::make_unique<SqliteTaskQueue>(db_.path());
    ASSERT_TRUE(store_->open().has_value());
    ASSERT_TRUE(queue_->open().has_value());

    orchestrator_options_.backoff_base = 1ms;
    orchestrator_options_.backoff_max = 4ms;
    orchestrator_options_.slot_acquire_timeout = 30s;
    orchestrator_ = std::make_unique<Orchestrator>(
        *store_, generator_, sandbox_, slots_, orchestrator_options_);

    options_.owner = "test-worker";
    options_.concurrency = 4;
    options_.poll_interval = 10ms;
    options_.visibility_timeout = 60s;
    options_.heartbeat_interval = 20ms;
  }

  auto coordinator() -> std::unique_ptr<Coordinator> {
    return std::make_unique<Coordinator>(*store_, *queue_, *orchestrator_,
                                         options_);
  }

  auto submit(Task task) -> TaskId {
    auto id = task.id;
    EXPECT_TRUE(store_->create(task).has_value());
    EXPECT_TRUE(queue_->enqueue(id).has_value());
    return id;
  }

  auto status(const TaskId& id) -> TaskStatus {
    auto t = store_->get(id);
    EXPECT_TRUE(t.has_value());
    return t ? t->status : TaskStatus::Pending;
  }

  TempDb db_;
  std::unique_ptr<SqliteTaskStore> store_;
  std::unique_ptr<SqliteTaskQueue> queue_;
  ScriptedGenerator generator_;
  FakeSandbox sandbox_;
  SlotPool slots_{2};
  OrchestratorOptions orchestrator_options_;
  std::unique_ptr<Orchestrator> orchestrator_;
  CoordinatorOptions options_;
};

TEST_F(CoordinatorTest, ProcessNext_EmptyQueue_ReturnsFalse) {
  auto c = coordinator();

  auto r = c->process_next();

  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(*r);
}

TEST_F(CoordinatorTest, ProcessNext_RunsTaskAndAcks) {
  auto id = submit(make_task("one"));
  auto c = coordinator();

  auto r = c->process_next();

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(*r);
  EXPECT_EQ(status(id), TaskStatus::Success);
  EXPECT_EQ(*queue_->depth(), 0u);
  EXPECT_EQ(c->active_count(), 0u);
}

TEST_F(CoordinatorTest, ClaimNext_SkipsUnknownAndTerminalTasks) {
  ASSERT_TRUE(queue_->enqueue(task_id("ghost")).has_value());
  auto done = make_task("done");
  ASSERT_TRUE(store_->create(done).has_value());
  done.status = TaskStatus::Cancelled;
  done.completed_at = Clock::now();
  ASSERT_TRUE(*store_->compare_and_set(done, TaskStatus::Pending));
  ASSERT_TRUE(queue_->enqueue(done.id).has_value());
  auto c = coordinator();

  auto first = c->claim_next();
  auto second = c->claim_next();

  ASSERT_TRUE(first.has_value() && second.has_value());
  EXPECT_FALSE(first->has_value());
  EXPECT_FALSE(second->has_value());
  EXPECT_EQ(*queue_->depth(), 0u);
}

TEST_F(CoordinatorTest, Workers_DrainQueueConcurrently) {
  constexpr int kTasks = 8;
  std::vector<TaskId> ids;
  for (int i = 0; i < kTasks; ++i) {
    ids.push_back(submit(make_task(std::format("t{}", i))));
  }
  auto c = coordinator();

  c->start();
  EXPECT_TRUE(c->is_running());
  bool drained = wait_until(
      [&] {
        return std::ranges::all_of(ids, [&](const TaskId& id) {
          return status(id) == TaskStatus::Success;
        });
      },
      10s);
  c->stop();

  EXPECT_TRUE(drained);
  EXPECT_FALSE(c->is_running());
  EXPECT_EQ(sandbox_.requests().size(), static_cast<std::size_t>(kTasks));
  EXPECT_EQ(sandbox_.live(), 0);
  EXPECT_EQ(*queue_->depth(), 0u);
  EXPECT_EQ(slots_.in_use(), 0u);
}

TEST_F(CoordinatorTest, StoredCancelRequest_InterruptsRunningTest) {
  sandbox_.set_blocking(true);
  auto id = submit(make_task("cancel-me"));
  auto c = coordinator();
  c->start();

  ASSERT_TRUE(wait_until([&] { return sandbox_.live() == 1; }));
  ASSERT_EQ(*store_->request_cancel(id), CancelOutcome::Requested);

  EXPECT_TRUE(wait_until([&] { return status(id) == TaskStatus::Cancelled; }));
  EXPECT_TRUE(wait_until([&] { return sandbox_.live() == 0; }));
  c->stop();

  auto task = store_->get(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->failure_kind, FailureKind::Cancelled);
  EXPECT_EQ(*queue_->depth(), 0u);
}

TEST_F(CoordinatorTest, Stop_SuspendsTaskForLaterResume) {
  orchestrator_options_.backoff_base = 10s;
  orchestrator_options_.backoff_max = 10s;
  orchestrator_ = std::make_unique<Orchestrator>(
      *store_, generator_, sandbox_, slots_, orchestrator_options_);
  generator_.script(Role::Manager, fail(Error::TransientProvider));
  auto id = submit(make_task("pause"));
  auto c = coordinator();
  c->start();

  ASSERT_TRUE(wait_until([&] { return generator_.calls(Role::Manager) == 1; }));
  c->stop();

  EXPECT_EQ(status(id), TaskStatus::Planning);
  EXPECT_TRUE(*queue_->contains(id));

  auto next = coordinator();
  auto r = next->process_next();
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(*r);
  EXPECT_EQ(status(id), TaskStatus::Success);
}

TEST_F(CoordinatorTest, RedeliveryWhileInFlight_IsDeferred) {
  options_.visibility_timeout = 0s;
  sandbox_.set_blocking(true);
  auto id = submit(make_task("dup"));
  auto c = coordinator();

  std::optional<Result<bool>> first;
  std::thread runner([&] { first.emplace(c->process_next()); });
  ASSERT_TRUE(wait_until([&] { return sandbox_.live() == 1; }));

  // The lease already expired, so the queue hands the id out again
  auto again = c->claim_next();
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(again->has_value());
  EXPECT_TRUE(*queue_->contains(id));

  sandbox_.release();
  runner.join();
  ASSERT_TRUE(first && first->has_value());
  EXPECT_EQ(status(id), TaskStatus::Success);
  EXPECT_EQ(sandbox_.requests().size(), 1u);
}

TEST_F(CoordinatorTest, ClaimedTask_StaysRegisteredUntilProcessed) {
  options_.visibility_timeout = 0s;
  auto id = submit(make_task("held"));
  auto c = coordinator();

  auto claimed = c->claim_next();
  ASSERT_TRUE(claimed.has_value() && claimed->has_value());
  EXPECT_EQ(c->active_count(), 1u);

  // The expired lease makes the id claimable again, but not here
  auto again = c->claim_next();
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(again->has_value());
  EXPECT_EQ(c->active_count(), 1u);

  auto outcome = c->process(std::move(**claimed));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, RunOutcome::Completed);
  EXPECT_EQ(status(id), TaskStatus::Success);
  EXPECT_EQ(c->active_count(), 0u);
}

TEST_F(CoordinatorTest, Process_UnderForeignReceipt_LeavesOwnerRegistered) {
  auto id = submit(make_task("owned"));
  auto c = coordinator();
  auto claimed = c->claim_next();
  ASSERT_TRUE(claimed.has_value() && claimed->has_value());

  ClaimedTask stray = **claimed;
  stray.delivery.receipt = ReceiptId{"not-the-lease"};
  auto lost = c->process(stray);

  ASSERT_TRUE(lost.has_value());
  EXPECT_EQ(*lost, RunOutcome::LostRace);
  EXPECT_EQ(c->active_count(), 1u);
  EXPECT_TRUE(sandbox_.requests().empty());

  auto outcome = c->process(std::move(**claimed));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, RunOutcome::Completed);
  EXPECT_EQ(status(id), TaskStatus::Success);
  EXPECT_EQ(c->active_count(), 0u);
}

TEST_F(CoordinatorTest, PurgeExpired_RemovesOldFinishedTasks) {
  auto old = make_task("old");
  ASSERT_TRUE(store_->create(old).has_value());
  old.status = TaskStatus::Cancelled;
  old.completed_at = Clock::now() - 48h;
  ASSERT_TRUE(*store_->compare_and_set(old, TaskStatus::Pending));
  auto fresh = make_task("fresh");
  ASSERT_TRUE(store_->create(fresh).has_value());

  auto disabled = coordinator();
  EXPECT_EQ(disabled->purge_expired().value_or(9), 0u);
  EXPECT_TRUE(store_->get(old.id).has_value());

  options_.retention = 24h;
  auto c = coordinator();
  auto purged = c->purge_expired();

  ASSERT_TRUE(purged.has_value());
  EXPECT_EQ(*purged, 1u);
  EXPECT_EQ(store_->get(old.id).error(), Error::NotFound);
  EXPECT_TRUE(store_->get(fresh.id).has_value());
}

TEST_F(CoordinatorTest, Watcher_RunsRetentionSweep) {
  auto old = make_task("stale");
  ASSERT_TRUE(store_->create(old).has_value());
  old.status = TaskStatus::Cancelled;
  old.completed_at = Clock::now() - 48h;
  ASSERT_TRUE(*store_->compare_and_set(old, TaskStatus::Pending));
  options_.retention = 24h;
  options_.retention_interval = 10ms;
  auto c = coordinator();

  c->start();
  EXPECT_TRUE(wait_until([&] { return !store_->get(old.id).has_value(); }));
  c->stop();
}

TEST_F(CoordinatorTest, Heartbeat_ExtendsLease) {
  options_.visibility_timeout = 1s;
  sandbox_.set_blocking(true);
  auto id = submit(make_task("long"));
  auto c = coordinator();
  c->start();

  ASSERT_TRUE(wait_until([&] { return sandbox_.live() == 1; }));
  std::this_thread::sleep_for(1500ms);

  // Still leased: another consumer cannot claim it
  SqliteTaskQueue other(db_.path());
  ASSERT_TRUE(other.open().has_value());
  auto stolen = other.claim("intruder", 60s);
  ASSERT_TRUE(stolen.has_value());
  EXPECT_FALSE(stolen->has_value());

  sandbox_.release();
  EXPECT_TRUE(wait_until([&] { return status(id) == TaskStatus::Success; }));
  c->stop();
}
