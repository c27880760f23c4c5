/***
 * Name: test_persistent
 * Purpose: Registration and persistent tasks on an async runtime: rooted state across calls,
 *   init failures, call failures and the ways a persistent task ends.
 */
#include <gtest/gtest.h>
#include "tether/handle/AsyncHandle.h"
#include "tether/handle/Builder.h"
#include "tether/handle/Persistent.h"
#include "tether/memory/Target.h"
#include "tether/memory/Value.h"
#include "tether/runtime/All.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>

using namespace tether;
using handle::Async;
using handle::AsyncFrame;
using handle::AsyncHandle;
using handle::Builder;
using handle::JoinHandle;
using handle::PersistentHandle;

namespace {

struct Observed {
  std::atomic<int> exits{0};
  std::atomic<int64_t> lastTotal{0};
};

// Keeps a running total in a one-element foreign list rooted for the task's lifetime.
struct Accumulator {
  using State = Value;
  using Input = int64_t;
  using Output = int64_t;

  std::shared_ptr<Observed> observed;

  static Async<void> setup(AsyncFrame& frame) {
    co_await frame.yield_now();
    const CallResult<Value> defined = Value::eval_string(frame, "(define accumulator-start 5)");
    if (!defined) { defined.error().rethrow(); }
  }

  static Async<Value> make_state(AsyncFrame& child, memory::Output& out) {
    const CallResult<Value> start = Value::global(child, "accumulator-start");
    if (!start) { start.error().rethrow(); }
    const Value list = Value::new_list(out, 1);
    list.set_index(0, *start);
    co_return list;
  }

  Async<Value> init(AsyncFrame& frame) {
    co_await frame.yield_now();
    memory::Output out = frame.output();
    co_return co_await frame.async_scope([&](AsyncFrame& child) { return make_state(child, out); });
  }

  Async<int64_t> run(AsyncFrame& frame, Value& state, int64_t input) {
    if (input < 0) { throw std::invalid_argument("negative input"); }
    co_await frame.yield_now();
    tether_rt_gc_collect(TETHER_GC_FULL);
    const int64_t total = state.get_index(frame, 0).as_int() + input;
    state.set_index(0, Value::new_int(frame, total));
    co_return total;
  }

  Async<void> exit(AsyncFrame& frame, Value& state) {
    observed->lastTotal.store(state.get_index(frame, 0).as_int());
    observed->exits.fetch_add(1);
    co_return;
  }
};

class PersistentTasks : public ::testing::Test {
 protected:
  void SetUp() override { rt::reset_for_tests(); }

  static PersistentHandle<Accumulator> start_accumulator(AsyncHandle& runtime, std::shared_ptr<Observed> observed) {
    const CallResult<void> registered = runtime.register_task<Accumulator>().dispatch().join();
    EXPECT_TRUE(registered.has_value()) << registered.error().message;
    CallResult<PersistentHandle<Accumulator>> started =
        runtime.persistent(Accumulator{std::move(observed)}, 2).dispatch().join();
    if (!started) { throw std::runtime_error(started.error().message); }
    return std::move(*started);
  }
};

} // namespace

TEST_F(PersistentTasks, StateSurvivesCollectionsBetweenCalls) {
  AsyncHandle runtime = Builder::async_runtime().max_concurrent_tasks(2).start();
  auto observed = std::make_shared<Observed>();
  PersistentHandle<Accumulator> acc = start_accumulator(runtime, observed);
  JoinHandle<int64_t> first = acc.call(5);
  JoinHandle<int64_t> second = acc.call(10);
  const CallResult<int64_t> a = first.join();
  const CallResult<int64_t> b = second.join();
  ASSERT_TRUE(a.has_value()) << a.error().message;
  ASSERT_TRUE(b.has_value()) << b.error().message;
  EXPECT_EQ(*a, 10);
  EXPECT_EQ(*b, 20);
  runtime.close();
  EXPECT_EQ(observed->exits.load(), 1);
  EXPECT_EQ(observed->lastTotal.load(), 20);
}

TEST_F(PersistentTasks, InitFailureResolvesTheStartHandle) {
  AsyncHandle runtime = Builder::async_runtime().max_concurrent_tasks(2).start();
  auto observed = std::make_shared<Observed>();
  const CallResult<PersistentHandle<Accumulator>> started =
      runtime.persistent(Accumulator{observed}).dispatch().join();
  ASSERT_FALSE(started.has_value());
  EXPECT_TRUE(started.error().is_exception());
  EXPECT_EQ(started.error().message, "UndefVarError: accumulator-start not defined");
  runtime.close();
  EXPECT_EQ(observed->exits.load(), 0);
}

TEST_F(PersistentTasks, FailedCallLeavesTheTaskServing) {
  AsyncHandle runtime = Builder::async_runtime().max_concurrent_tasks(2).start();
  auto observed = std::make_shared<Observed>();
  PersistentHandle<Accumulator> acc = start_accumulator(runtime, observed);
  const CallResult<int64_t> bad = acc.call(-1).join();
  ASSERT_FALSE(bad.has_value());
  EXPECT_TRUE(bad.error().is_panic());
  EXPECT_EQ(bad.error().message, "negative input");
  const CallResult<int64_t> good = acc.call(1).join();
  ASSERT_TRUE(good.has_value()) << good.error().message;
  EXPECT_EQ(*good, 6);
}

TEST_F(PersistentTasks, DroppingTheLastHandleRunsExit) {
  AsyncHandle runtime = Builder::async_runtime().max_concurrent_tasks(1).start();
  auto observed = std::make_shared<Observed>();
  {
    PersistentHandle<Accumulator> acc = start_accumulator(runtime, observed);
    PersistentHandle<Accumulator> copy = acc;
    ASSERT_TRUE(copy.call(3).join().has_value());
  }
  // The only task slot takes new work once the persistent task has ended.
  const CallResult<int> after = runtime.blocking_task([](memory::GcFrame&) { return 1; }).dispatch().join();
  ASSERT_TRUE(after.has_value());
  runtime.close();
  EXPECT_EQ(observed->exits.load(), 1);
  EXPECT_EQ(observed->lastTotal.load(), 8);
}

TEST_F(PersistentTasks, RuntimeShutdownEndsTheTask) {
  AsyncHandle runtime = Builder::async_runtime().max_concurrent_tasks(2).start();
  auto observed = std::make_shared<Observed>();
  PersistentHandle<Accumulator> acc = start_accumulator(runtime, observed);
  runtime.close();
  EXPECT_TRUE(acc.is_closed());
  EXPECT_EQ(observed->exits.load(), 1);
  const CallResult<int64_t> late = acc.call(1).join();
  ASSERT_FALSE(late.has_value());
  EXPECT_TRUE(late.error().is_closed());
  auto refused = acc.try_call(1);
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error(), sync::ChannelStatus::Closed);
}
