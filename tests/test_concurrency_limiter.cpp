#include <gtest/gtest.h>

#include "core/concurrency_limiter.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tw::core;
using namespace std::chrono_literals;

TEST(ConcurrencyLimiter, CapacityIsAtLeastOne) {
  ConcurrencyLimiter zero(0);
  EXPECT_EQ(zero.capacity(), 1);
  ConcurrencyLimiter negative(-3);
  EXPECT_EQ(negative.capacity(), 1);
}

TEST(ConcurrencyLimiter, AcquireAndReleaseTrackUnits) {
  ConcurrencyLimiter limiter(2);
  ASSERT_TRUE(limiter.acquire());
  ASSERT_TRUE(limiter.acquire());
  EXPECT_EQ(limiter.available(), 0);
  EXPECT_EQ(limiter.in_use(), 2);
  EXPECT_FALSE(limiter.try_acquire_for(20ms));

  limiter.release();
  EXPECT_EQ(limiter.available(), 1);
  EXPECT_TRUE(limiter.try_acquire_for(20ms));
}

TEST(ConcurrencyLimiter, ReleaseNeverExceedsCapacity) {
  ConcurrencyLimiter limiter(2);
  limiter.release();
  limiter.release();
  EXPECT_EQ(limiter.available(), 2);
}

TEST(ConcurrencyLimiter, BlockedAcquireWakesOnRelease) {
  ConcurrencyLimiter limiter(1);
  ASSERT_TRUE(limiter.acquire());

  std::atomic<bool> acquired{false};
  std::thread waiter([&]() { acquired = limiter.acquire(); });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());
  limiter.release();
  waiter.join();
  EXPECT_TRUE(acquired.load());
}

TEST(ConcurrencyLimiter, CloseFailsWaiters) {
  ConcurrencyLimiter limiter(1);
  ASSERT_TRUE(limiter.acquire());

  std::atomic<int> result{-1};
  std::thread waiter([&]() { result = limiter.acquire() ? 1 : 0; });
  std::this_thread::sleep_for(30ms);
  limiter.close();
  waiter.join();

  EXPECT_EQ(result.load(), 0);
  EXPECT_TRUE(limiter.closed());
  EXPECT_FALSE(limiter.acquire());
}

TEST(ConcurrencyLimiter, BoundsConcurrentHolders) {
  constexpr int kCapacity = 3;
  ConcurrencyLimiter limiter(kCapacity);
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 12; ++i) {
    threads.emplace_back([&]() {
      if (!limiter.acquire()) {
        return;
      }
      LimiterPermit permit(limiter);
      const int now = running.fetch_add(1) + 1;
      int observed = max_running.load();
      while (observed < now && !max_running.compare_exchange_weak(observed, now)) {
      }
      std::this_thread::sleep_for(10ms);
      running.fetch_sub(1);
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_LE(max_running.load(), kCapacity);
  EXPECT_EQ(limiter.available(), kCapacity);
}

TEST(LimiterPermit, ReleasesOnceOnScopeExitOrReset) {
  ConcurrencyLimiter limiter(1);
  ASSERT_TRUE(limiter.acquire());
  {
    LimiterPermit permit(limiter);
    EXPECT_TRUE(permit.held());
    LimiterPermit moved(std::move(permit));
    EXPECT_FALSE(permit.held());
    EXPECT_TRUE(moved.held());
    moved.reset();
    EXPECT_FALSE(moved.held());
    EXPECT_EQ(limiter.available(), 1);
  }
  EXPECT_EQ(limiter.available(), 1);
}
