#include "fixloop/orchestrator/orchestrator.hpp"
#include "fixloop/sandbox/process_sandbox.hpp"
#include "fixloop/storage/sqlite_task_store.hpp"

#include "test_utils.hpp"

#include <fstream>
#include <optional>
#include <thread>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

// Orchestrator runs against a real process sandbox: the generated patch is
// written into a copy of a local repository and the test command really runs.
class ProcessOrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::ofstream(repo_.path() / "main.py") << "print(1 / 0)\n";
    store_ = std::make_unique<SqliteTaskStore>(db_.path());
    ASSERT_TRUE(store_->open().has_value());
    options_.backoff_base = 1ms;
    options_.backoff_max = 4ms;
    options_.slot_acquire_timeout = 5s;
    options_.limits.timeout = 20s;
  }

  auto submit(std::string id, std::string command) -> TaskId {
    auto task = make_task(std::move(id), std::move(command));
    task.repo.url = repo_.path().string();
    EXPECT_TRUE(store_->create(task).has_value());
    return task.id;
  }

  auto load(const TaskId& id) -> Task {
    auto t = store_->get(id);
    EXPECT_TRUE(t.has_value());
    return t ? *t : Task{};
  }

  auto sandbox_dirs() const -> std::size_t {
    std::size_t n = 0;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(sandbox_.owner_root(), ec)) {
      n += e.path().filename().string().starts_with(kSandboxPrefix) ? 1 : 0;
    }
    return n;
  }

  TempDb db_;
  TempDir repo_;
  TempDir root_;
  std::unique_ptr<SqliteTaskStore> store_;
  ScriptedGenerator generator_;
  ProcessSandbox sandbox_{ProcessSandboxOptions{
      .workspace_root = root_.path(),
      .owner = "it-worker",
      .network_isolation = false,
  }};
  SlotPool slots_{1};
  OrchestratorOptions options_;
};

TEST_F(ProcessOrchestratorTest, PassingCommand_Succeeds) {
  auto id = submit("pass", "grep -q \"print('ok')\" main.py");
  Orchestrator orchestrator(*store_, generator_, sandbox_, slots_, options_);

  auto r = orchestrator.run(id, RunSignals{});

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, RunOutcome::Completed);
  auto task = load(id);
  EXPECT_EQ(task.status, TaskStatus::Success);
  EXPECT_TRUE(task.completed_at.has_value());
  ASSERT_EQ(task.attempts.size(), 1u);
  ASSERT_TRUE(task.attempts[0].test.has_value());
  EXPECT_EQ(task.attempts[0].test->exit_code, 0);
  EXPECT_EQ(sandbox_dirs(), 0u);
}

TEST_F(ProcessOrchestratorTest, FailingCommand_ExhaustsAttempts) {
  auto id = submit("fail", "echo broken >&2; exit 1");
  Orchestrator orchestrator(*store_, generator_, sandbox_, slots_, options_);

  auto r = orchestrator.run(id, RunSignals{});

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, RunOutcome::Completed);
  auto task = load(id);
  EXPECT_EQ(task.status, TaskStatus::Failed);
  EXPECT_EQ(task.failure_kind, FailureKind::LogicExhausted);
  ASSERT_EQ(task.attempts.size(), 3u);
  for (const auto& a : task.attempts) {
    ASSERT_TRUE(a.test.has_value());
    EXPECT_EQ(a.test->exit_code, 1);
  }
  EXPECT_EQ(task.attempts[2].carried.test_stderr_tail, "broken\n");
  EXPECT_EQ(sandbox_dirs(), 0u);
}

TEST_F(ProcessOrchestratorTest, CancelWhileTesting_KillsAndCleansUp) {
  auto id = submit("slow", "sleep 30");
  CancellationSource cancel;
  auto started = std::chrono::steady_clock::now();

  std::optional<Result<RunOutcome>> outcome;
  std::thread runner([&] {
    Orchestrator orchestrator(*store_, generator_, sandbox_, slots_, options_);
    outcome.emplace(
        orchestrator.run(id, RunSignals{.cancel = cancel.token(), .shutdown = {}}));
  });

  EXPECT_TRUE(wait_until([&] {
    return fs::exists(sandbox_.owner_root() / "fixloop-slow-a0-r0" / "pgid");
  }));
  EXPECT_EQ(load(id).status, TaskStatus::Testing);
  EXPECT_TRUE(store_->request_cancel(id).has_value());
  cancel.cancel();
  runner.join();

  ASSERT_TRUE(outcome && outcome->has_value());
  EXPECT_EQ(**outcome, RunOutcome::Completed);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 20s);
  auto task = load(id);
  EXPECT_EQ(task.status, TaskStatus::Cancelled);
  EXPECT_EQ(task.failure_kind, FailureKind::Cancelled);
  EXPECT_EQ(sandbox_dirs(), 0u);
}
