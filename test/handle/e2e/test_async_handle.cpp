/***
 * Name: test_async_handle
 * Purpose: Async runtime end to end: dispatch, backpressure, cancellation, failures, shutdown.
 */
#include <gtest/gtest.h>
#include "tether/exceptions/file_read_error.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/handle/AsyncHandle.h"
#include "tether/handle/Builder.h"
#include "tether/memory/Value.h"
#include "tether/runtime/All.h"
#include "tether/sync/Channel.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tether;
using handle::AsyncFrame;
using handle::AsyncHandle;
using handle::Async;
using handle::Builder;
using handle::JoinHandle;
using memory::GcFrame;

namespace {

CallResult<int64_t> eval_int(GcFrame& frame, const std::string& source) {
  const CallResult<Value> v = Value::eval_string(frame, source);
  if (!v) { return std::unexpected(v.error()); }
  return v->as_int();
}

Async<int64_t> sum_with_yields(AsyncFrame& frame) {
  const Value acc = Value::new_int(frame, 0);
  int64_t total = 0;
  for (int i = 1; i <= 4; ++i) {
    total += i;
    co_await frame.yield_now();
  }
  co_return total + acc.as_int();
}

Async<void> spin_until_cancelled(AsyncFrame& frame) {
  for (;;) { co_await frame.checkpoint(); }
}

Async<int> raise_foreign(AsyncFrame& frame) {
  co_await frame.yield_now();
  const CallResult<Value> v = Value::eval_string(frame, "(error \"task failed\")");
  if (!v) { v.error().rethrow(); }
  co_return 0;
}

Async<int> raise_host(AsyncFrame& frame) {
  co_await frame.yield_now();
  throw std::logic_error("host side broke");
}

class AsyncHandles : public ::testing::Test {
 protected:
  void SetUp() override { rt::reset_for_tests(); }
};

} // namespace

TEST_F(AsyncHandles, BlockingTaskEvaluatesOnTheMainThread) {
  AsyncHandle runtime = Builder::async_runtime().start();
  JoinHandle<int64_t> job =
      runtime.blocking_task([](GcFrame& frame) { return eval_int(frame, "(+ 1 2)"); }).dispatch();
  const CallResult<int64_t> out = job.join();
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_EQ(*out, 3);
}

TEST_F(AsyncHandles, AsyncTasksInterleaveOnWorkers) {
  AsyncHandle runtime = Builder::async_runtime().n_workers(2).max_concurrent_tasks(4).start();
  EXPECT_EQ(runtime.n_workers(), 2u);
  std::vector<JoinHandle<int64_t>> jobs;
  for (int i = 0; i < 8; ++i) { jobs.push_back(runtime.task(sum_with_yields).dispatch()); }
  for (auto& job : jobs) {
    const CallResult<int64_t> out = job.join();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, 10);
  }
  EXPECT_EQ(runtime.metrics().counter(obs::kTasksCompleted), 8u);
}

TEST_F(AsyncHandles, BoundedQueueReportsFull) {
  AsyncHandle runtime = Builder::async_runtime().n_workers(0).channel_capacity(1).start();
  std::atomic<bool> started{false};
  std::atomic<bool> release{false};
  JoinHandle<int> first = runtime.blocking_task([&](GcFrame&) {
                              started.store(true);
                              while (!release.load()) { std::this_thread::yield(); }
                              return 1;
                            }).dispatch();
  while (!started.load()) { std::this_thread::yield(); }
  auto second = runtime.blocking_task([](GcFrame&) { return 2; });
  auto third = runtime.blocking_task([](GcFrame&) { return 3; });
  auto sent = second.try_dispatch();
  ASSERT_TRUE(sent.has_value());
  auto refused = third.try_dispatch();
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error(), sync::ChannelStatus::Full);
  EXPECT_FALSE(third.is_spent());
  release.store(true);
  EXPECT_EQ(*first.join(), 1);
  EXPECT_EQ(*sent->join(), 2);
  EXPECT_EQ(*third.dispatch().join(), 3);
  EXPECT_THROW((void)third.dispatch(), exceptions::InvalidHandleState);
}

TEST_F(AsyncHandles, CancelledTaskStopsAtCheckpoint) {
  AsyncHandle runtime = Builder::async_runtime().n_workers(1).start();
  JoinHandle<void> job = runtime.task(spin_until_cancelled, handle::Affinity::ToWorker).dispatch();
  job.cancel();
  const CallResult<void> out = job.join();
  ASSERT_FALSE(out.has_value());
  EXPECT_TRUE(out.error().is_cancelled());
  EXPECT_EQ(runtime.metrics().counter(obs::kTasksCancelled), 1u);
}

TEST_F(AsyncHandles, FailuresAreClassified) {
  AsyncHandle runtime = Builder::async_runtime().start();
  const CallResult<int> foreign = runtime.task(raise_foreign).dispatch().join();
  ASSERT_FALSE(foreign.has_value());
  EXPECT_TRUE(foreign.error().is_exception());
  EXPECT_EQ(foreign.error().message, "ErrorException: task failed");
  const CallResult<int> host = runtime.task(raise_host, handle::Affinity::ToMain).dispatch().join();
  ASSERT_FALSE(host.has_value());
  EXPECT_TRUE(host.error().is_panic());
  EXPECT_EQ(host.error().message, "host side broke");
  EXPECT_EQ(runtime.metrics().counter(obs::kTasksFailed), 2u);
}

TEST_F(AsyncHandles, IncludeLoadsDefinitions) {
  AsyncHandle runtime = Builder::async_runtime().start();
  const CallResult<void> loaded = runtime.include(std::string(TETHER_TEST_DATA_DIR) + "/prelude.tl").dispatch().join();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const CallResult<int64_t> out =
      runtime.blocking_task([](GcFrame& frame) { return eval_int(frame, "(square 7)"); }).dispatch().join();
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, 49);
  EXPECT_THROW((void)runtime.include("/definitely/not/here.tl"), exceptions::FileReadError);
}

TEST_F(AsyncHandles, ErrorColorReturnsPreviousSetting) {
  AsyncHandle runtime = Builder::async_runtime().start();
  const CallResult<bool> first = runtime.error_color(true).dispatch().join();
  ASSERT_TRUE(first.has_value());
  EXPECT_FALSE(*first);
  const CallResult<bool> second = runtime.error_color(false).dispatch().join();
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(*second);
}

TEST_F(AsyncHandles, WorkerAffinityNeedsWorkers) {
  AsyncHandle runtime = Builder::async_runtime().n_workers(0).start();
  EXPECT_THROW((void)runtime.task(sum_with_yields, handle::Affinity::ToWorker).dispatch(),
               exceptions::InvalidHandleState);
}

TEST_F(AsyncHandles, ClosedRuntimeResolvesClosed) {
  AsyncHandle runtime = Builder::async_runtime().n_workers(1).start();
  runtime.close(true);
  EXPECT_TRUE(runtime.is_closed());
  const CallResult<int64_t> out = runtime.task(sum_with_yields).dispatch().join();
  ASSERT_FALSE(out.has_value());
  EXPECT_TRUE(out.error().is_closed());
  auto refused = runtime.blocking_task([](GcFrame&) { return 1; }).try_dispatch();
  ASSERT_FALSE(refused.has_value());
  EXPECT_EQ(refused.error(), sync::ChannelStatus::Closed);
}

TEST_F(AsyncHandles, SecondRuntimeIsRejectedWhileRunning) {
  AsyncHandle runtime = Builder::async_runtime().start();
  EXPECT_THROW((void)Builder::async_runtime().start(), exceptions::InvalidHandleState);
}

TEST_F(AsyncHandles, LastCopyReleasedInsideTaskShutsDownWithoutJoiningItself) {
  std::atomic<bool> released{false};
  JoinHandle<int64_t> job = [&] {
    AsyncHandle runtime = Builder::async_runtime().start();
    return runtime
        .blocking_task([keep = runtime, &released](GcFrame& frame) {
          while (!released.load()) { std::this_thread::yield(); }
          return eval_int(frame, "(+ 2 3)");
        })
        .dispatch();
  }();
  released.store(true);
  const CallResult<int64_t> out = job.join();
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_EQ(*out, 5);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (rt::lifecycle() != rt::Lifecycle::Exited && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_EQ(rt::lifecycle(), rt::Lifecycle::Exited);
}

TEST_F(AsyncHandles, CloseFromInsideTaskReturnsAndOuterCloseWaits) {
  AsyncHandle runtime = Builder::async_runtime().n_workers(1).start();
  JoinHandle<bool> job = runtime
                             .blocking_task([inner = runtime](GcFrame&) mutable {
                               inner.close();
                               return inner.is_closed();
                             })
                             .dispatch();
  const CallResult<bool> out = job.join();
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_TRUE(*out);
  runtime.close();
  EXPECT_EQ(rt::lifecycle(), rt::Lifecycle::Exited);
}
