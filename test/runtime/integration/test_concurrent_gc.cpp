/***
 * Name: test_concurrent_gc
 * Purpose: Stop-the-world collections with two mutator threads allocating at once.
 */
#include <gtest/gtest.h>
#include "tether/handle/LocalHandle.h"
#include "tether/memory/Value.h"
#include "tether/runtime/All.h"
#include "tether/sync/GcSafe.h"
#include <atomic>
#include <string>
#include <thread>

using namespace tether;
using handle::LocalHandle;
using memory::GcFrame;

namespace {

// Allocate rooted strings and garbage, collecting along the way; false if a root was lost.
bool churn(LocalHandle& local, const std::string& tag, int rounds) {
  return local.scope([&](GcFrame& frame) {
    const Value keep = Value::new_string(frame, tag);
    for (int i = 0; i < rounds; ++i) {
      local.scope([&](GcFrame& inner) {
        for (int j = 0; j < 16; ++j) { (void)Value::new_string(inner, tag + std::to_string(j)); }
      });
      if (i % 8 == 0) { local.gc_collect(i % 16 == 0 ? TETHER_GC_FULL : TETHER_GC_INCREMENTAL); }
      if (keep.as_string() != tag) { return false; }
    }
    return true;
  });
}

class ConcurrentGc : public ::testing::Test {
 protected:
  void SetUp() override {
    rt::reset_for_tests();
    rt::gc_set_threshold(4096);
  }
};

} // namespace

TEST_F(ConcurrentGc, TwoMutatorsKeepTheirRoots) {
  LocalHandle owner{handle::LocalConfig{}};
  std::atomic<bool> workerOk{false};
  std::thread worker([&workerOk] {
    LocalHandle local(LocalHandle::WorkerTag{}, handle::LocalConfig{});
    workerOk.store(churn(local, "worker", 200));
  });
  const bool ownerOk = churn(owner, "owner", 200);
  {
    const sync::GcSafeRegion safe;
    worker.join();
  }
  EXPECT_TRUE(ownerOk);
  EXPECT_TRUE(workerOk.load());
  EXPECT_GT(rt::gc_stats().numCollections, 0u);
}
