#include "fixloop/core/cancellation.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <thread>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;
using namespace std::chrono_literals;

TEST(CancellationTest, CallbackRunsOnCancel) {
  CancellationSource source;
  int calls = 0;
  auto reg = source.token().on_cancel([&calls] { ++calls; });

  source.cancel();
  source.cancel();

  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(source.token().is_cancelled());
}

TEST(CancellationTest, RegisterAfterCancel_RunsImmediately) {
  CancellationSource source;
  source.cancel();
  bool ran = false;

  auto reg = source.token().on_cancel([&ran] { ran = true; });

  EXPECT_TRUE(ran);
}

TEST(CancellationTest, ResetBeforeCancel_CallbackNeverRuns) {
  CancellationSource source;
  bool ran = false;
  auto reg = source.token().on_cancel([&ran] { ran = true; });

  reg.reset();
  source.cancel();

  EXPECT_FALSE(ran);
}

TEST(CancellationTest, Reset_WaitsForRunningCallback) {
  CancellationSource source;
  std::atomic<bool> started{false};
  std::atomic<bool> finished{false};
  auto reg = source.token().on_cancel([&] {
    started.store(true);
    std::this_thread::sleep_for(200ms);
    finished.store(true);
  });

  std::thread canceller([&] { source.cancel(); });
  ASSERT_TRUE(wait_until([&] { return started.load(); }));
  reg.reset();

  // Locals captured by reference must stay valid until the callback is done
  EXPECT_TRUE(finished.load());
  canceller.join();
}

TEST(CancellationTest, CallbackMayResetItsOwnRegistration) {
  CancellationSource source;
  CancellationRegistration reg;
  bool ran = false;
  reg = source.token().on_cancel([&] {
    ran = true;
    reg.reset();
  });

  source.cancel();

  EXPECT_TRUE(ran);
}

TEST(CancellationTest, WaitForWakesOnCancel) {
  CancellationSource source;
  auto token = source.token();
  std::thread canceller([&] {
    std::this_thread::sleep_for(50ms);
    source.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.wait_for(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  canceller.join();
}

TEST(CancellationTest, NoneTokenIsNeverCancelled) {
  auto token = CancellationToken::none();
  EXPECT_FALSE(token.is_cancelled());
  EXPECT_FALSE(token.wait_for(1ms));
}
