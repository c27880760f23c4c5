/***
 * Name: test_task_messages
 * Purpose: Task and blocking-task messages resolve their join handles and count outcomes.
 */
#include <gtest/gtest.h>
#include "tether/handle/LocalHandle.h"
#include "tether/handle/Message.h"
#include "tether/memory/Value.h"
#include "tether/observability/Metrics.h"
#include "tether/runtime/All.h"
#include <memory>
#include <stdexcept>
#include <string>

using namespace tether;
using namespace tether::handle;

namespace {

Async<int> add_after_yield(AsyncFrame& frame) {
  co_await frame.yield_now();
  co_return 40 + 2;
}

Async<void> wait_for_cancel(AsyncFrame& frame) {
  for (;;) { co_await frame.checkpoint(); }
}

void run_to_completion(AsyncFrame& frame, TaskMessage& msg) {
  Async<void> task = msg.start(frame);
  frame.set_resume_point(task.handle());
  while (!task.done()) { frame.resume_point().resume(); }
}

class TaskMessages : public ::testing::Test {
 protected:
  void SetUp() override {
    rt::reset_for_tests();
    local_ = std::make_unique<LocalHandle>(LocalConfig{});
    metrics_ = std::make_shared<obs::Metrics>();
  }
  void TearDown() override { local_.reset(); }

  LocalHandle& local() { return *local_; }
  std::shared_ptr<obs::Metrics> metrics() { return metrics_; }

 private:
  std::unique_ptr<LocalHandle> local_;
  std::shared_ptr<obs::Metrics> metrics_;
};

} // namespace

TEST_F(TaskMessages, TaskResolvesWithItsValue) {
  auto [msg, join] = make_task(add_after_yield, metrics());
  EXPECT_FALSE(join.try_join().has_value());
  AsyncFrame frame(local().stack(), msg.token);
  run_to_completion(frame, msg);
  const CallResult<int> out = join.join();
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, 42);
  EXPECT_EQ(metrics()->counter(obs::kTasksCompleted), 1u);
}

TEST_F(TaskMessages, CancelledTaskReportsCancelled) {
  auto [msg, join] = make_task(wait_for_cancel, metrics());
  AsyncFrame frame(local().stack(), msg.token);
  Async<void> task = msg.start(frame);
  frame.set_resume_point(task.handle());
  frame.resume_point().resume();
  frame.resume_point().resume();
  EXPECT_FALSE(join.is_finished());
  join.cancel();
  while (!task.done()) { frame.resume_point().resume(); }
  const CallResult<void> out = join.join();
  ASSERT_FALSE(out.has_value());
  EXPECT_TRUE(out.error().is_cancelled());
  EXPECT_EQ(metrics()->counter(obs::kTasksCancelled), 1u);
}

TEST_F(TaskMessages, DroppedMessageResolvesClosed) {
  auto [msg, join] = make_task(add_after_yield, metrics());
  { TaskMessage dropped = std::move(msg); }
  const CallResult<int> out = join.join();
  ASSERT_FALSE(out.has_value());
  EXPECT_TRUE(out.error().is_closed());
  EXPECT_EQ(metrics()->counter(obs::kTasksCompleted), 0u);
}

TEST_F(TaskMessages, BlockingTaskFlattensCallResults) {
  auto [msg, join] = make_blocking_task(
      [](memory::GcFrame& frame) -> CallResult<int64_t> {
        const CallResult<Value> v = Value::eval_string(frame, "(* 6 7)");
        if (!v) { return std::unexpected(v.error()); }
        return v->as_int();
      },
      metrics());
  local().scope([&](memory::GcFrame& frame) { msg.run(frame); });
  const CallResult<int64_t> out = join.join();
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, 42);
}

TEST_F(TaskMessages, BlockingTaskClassifiesForeignAndHostFailures) {
  auto [foreign, foreignJoin] = make_blocking_task(
      [](memory::GcFrame& frame) -> CallResult<Value> { return Value::eval_string(frame, "(error \"bad\")"); },
      metrics());
  auto [host, hostJoin] = make_blocking_task(
      [](memory::GcFrame&) -> int { throw std::logic_error("host bug"); }, metrics());
  local().scope([&](memory::GcFrame& frame) {
    foreign.run(frame);
    host.run(frame);
  });
  const CallResult<Value> a = foreignJoin.join();
  ASSERT_FALSE(a.has_value());
  EXPECT_TRUE(a.error().is_exception());
  EXPECT_EQ(a.error().message, "ErrorException: bad");
  const CallResult<int> b = hostJoin.join();
  ASSERT_FALSE(b.has_value());
  EXPECT_TRUE(b.error().is_panic());
  EXPECT_EQ(metrics()->counter(obs::kTasksFailed), 2u);
}

TEST(AffinityNames, Display) {
  EXPECT_STREQ(to_string(Affinity::ToAny), "any");
  EXPECT_STREQ(to_string(Affinity::ToWorker), "worker");
}
