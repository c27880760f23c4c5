/***
 * Name: test_gc_safe
 * Purpose: GC-safe lock wrappers: state transitions, lock semantics, once-cell.
 */
#include <gtest/gtest.h>
#include "tether/runtime/All.h"
#include "tether/runtime/c_api.h"
#include "tether/sync/FairMutex.h"
#include "tether/sync/GcSafe.h"
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tether;
using namespace tether::sync;

namespace {
class GcSafe : public ::testing::Test {
 protected:
  void SetUp() override {
    rt::reset_for_tests();
    ASSERT_EQ(rt::init(), 0);
    ASSERT_EQ(rt::adopt_thread(), 0);
  }
  void TearDown() override {
    rt::release_thread();
    rt::atexit_hook(0);
  }
};
} // namespace

TEST_F(GcSafe, RegionRestoresPreviousState) {
  EXPECT_EQ(rt::gc_state(), rt::GcState::Unsafe);
  {
    const GcSafeRegion outer;
    EXPECT_EQ(rt::gc_state(), rt::GcState::Safe);
    {
      const GcSafeRegion inner;
      EXPECT_EQ(rt::gc_state(), rt::GcState::Safe);
    }
    EXPECT_EQ(rt::gc_state(), rt::GcState::Safe);
  }
  EXPECT_EQ(rt::gc_state(), rt::GcState::Unsafe);
}

TEST_F(GcSafe, RegionIsNoOpOffRuntimeThreads) {
  bool ok = false;
  std::thread other([&ok] {
    const GcSafeRegion safe;
    ok = !rt::is_adopted();
  });
  other.join();
  EXPECT_TRUE(ok);
}

TEST_F(GcSafe, BlockedLockerDoesNotStallCollection) {
  GcSafeMutex<> mutex;
  std::atomic<bool> adopted{false};
  std::atomic<bool> acquired{false};
  mutex.lock();
  std::thread contender([&] {
    ASSERT_EQ(rt::adopt_thread(), 0);
    adopted.store(true);
    mutex.lock();
    acquired.store(true);
    mutex.unlock();
    rt::release_thread();
  });
  while (!adopted.load()) { std::this_thread::yield(); }
  // The contender is parked in the GC-safe state, so the collection completes.
  const std::size_t before = rt::gc_stats().numCollections;
  tether_rt_gc_collect(TETHER_GC_FULL);
  EXPECT_EQ(rt::gc_stats().numCollections, before + 1);
  EXPECT_FALSE(acquired.load());
  mutex.unlock();
  {
    const GcSafeRegion safe;
    contender.join();
  }
  EXPECT_TRUE(acquired.load());
}

TEST_F(GcSafe, RwLockAllowsSharedReaders) {
  GcSafeRwLock<> lock;
  {
    const std::shared_lock<GcSafeRwLock<>> a(lock);
    EXPECT_TRUE(lock.try_lock_shared());
    lock.unlock_shared();
    EXPECT_FALSE(lock.try_lock());
  }
  EXPECT_TRUE(lock.try_lock());
  lock.unlock();
}

TEST_F(GcSafe, OnceLockInitializesOnce) {
  GcSafeOnceLock<int> cell;
  EXPECT_EQ(cell.get(), nullptr);
  std::atomic<int> calls{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      ASSERT_EQ(rt::adopt_thread(), 0);
      EXPECT_EQ(cell.get_or_init([&] { ++calls; return 5; }), 5);
      rt::release_thread();
    });
  }
  {
    const GcSafeRegion safe;
    for (auto& t : threads) { t.join(); }
  }
  EXPECT_EQ(calls.load(), 1);
  ASSERT_NE(cell.get(), nullptr);
  EXPECT_EQ(*cell.get(), 5);
}

TEST_F(GcSafe, OnceLockStaysEmptyWhenInitThrows) {
  GcSafeOnceLock<int> cell;
  EXPECT_THROW(cell.get_or_init([]() -> int { throw std::runtime_error("no"); }), std::runtime_error);
  EXPECT_FALSE(cell.is_initialized());
  EXPECT_EQ(cell.get_or_init([] { return 9; }), 9);
}

TEST_F(GcSafe, FairMutexTryLockFailsWhileHeld) {
  GcSafeMutex<FairMutex> mutex;
  const std::lock_guard<GcSafeMutex<FairMutex>> held(mutex);
  EXPECT_FALSE(mutex.try_lock());
}
