#include "fixloop/sandbox/slot_pool.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace fixloop;
using namespace fixloop::test;
using namespace std::chrono_literals;

TEST(SlotPoolTest, Acquire_UpToCapacity_ThenTimesOut) {
  SlotPool pool(2);

  auto a = pool.acquire(100ms, CancellationToken::none());
  auto b = pool.acquire(100ms, CancellationToken::none());
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(pool.in_use(), 2u);

  auto c = pool.acquire(50ms, CancellationToken::none());
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error(), Error::SandboxSlotTimeout);
  EXPECT_EQ(pool.waiting(), 0u);
}

TEST(SlotPoolTest, Lease_ReleasesOnDestruction) {
  SlotPool pool(1);
  {
    auto lease = pool.acquire(100ms, CancellationToken::none());
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(pool.in_use(), 1u);
  }
  EXPECT_EQ(pool.in_use(), 0u);
  EXPECT_TRUE(pool.acquire(100ms, CancellationToken::none()).has_value());
}

TEST(SlotPoolTest, Lease_MoveTransfersOwnership) {
  SlotPool pool(1);
  auto lease = pool.acquire(100ms, CancellationToken::none());
  ASSERT_TRUE(lease.has_value());

  SlotPool::Lease moved = std::move(*lease);
  EXPECT_TRUE(static_cast<bool>(moved));
  EXPECT_FALSE(static_cast<bool>(*lease));
  EXPECT_EQ(pool.in_use(), 1u);

  moved.reset();
  EXPECT_EQ(pool.in_use(), 0u);
}

TEST(SlotPoolTest, ZeroCapacity_IsClampedToOne) {
  SlotPool pool(0);
  EXPECT_EQ(pool.capacity(), 1u);
}

TEST(SlotPoolTest, Cancel_WakesWaiter) {
  SlotPool pool(1);
  auto held = pool.acquire(100ms, CancellationToken::none());
  ASSERT_TRUE(held.has_value());

  CancellationSource source;
  std::optional<Result<SlotPool::Lease>> result;
  std::thread waiter([&] { result.emplace(pool.acquire(10s, source.token())); });

  ASSERT_TRUE(wait_until([&] { return pool.waiting() == 1; }));
  auto started = std::chrono::steady_clock::now();
  source.cancel();
  waiter.join();

  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->has_value());
  EXPECT_EQ(result->error(), Error::Cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
  EXPECT_EQ(pool.waiting(), 0u);
}

TEST(SlotPoolTest, Waiters_AreServedInArrivalOrder) {
  SlotPool pool(1);
  auto held = pool.acquire(100ms, CancellationToken::none());
  ASSERT_TRUE(held.has_value());

  std::mutex mutex;
  std::vector<int> order;
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&, i] {
      auto lease = pool.acquire(10s, CancellationToken::none());
      ASSERT_TRUE(lease.has_value());
      std::lock_guard lock(mutex);
      order.push_back(i);
    });
    // Make arrival order deterministic
    ASSERT_TRUE(wait_until([&] {
      return pool.waiting() == static_cast<std::size_t>(i + 1);
    }));
  }

  held->reset();
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(SlotPoolTest, ConcurrentUse_NeverExceedsCapacity) {
  constexpr std::size_t kCapacity = 3;
  SlotPool pool(kCapacity);
  std::atomic<int> live{0};
  std::atomic<int> peak{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 12; ++i) {
    threads.emplace_back([&] {
      auto lease = pool.acquire(10s, CancellationToken::none());
      ASSERT_TRUE(lease.has_value());
      int now = ++live;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(5ms);
      --live;
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_LE(peak.load(), static_cast<int>(kCapacity));
  EXPECT_EQ(pool.in_use(), 0u);
}
