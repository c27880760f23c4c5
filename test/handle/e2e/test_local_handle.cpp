/***
 * Name: test_local_handle
 * Purpose: Local handles end to end: rooting across collections, host functions, thread ownership.
 */
#include <gtest/gtest.h>
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/handle/Builder.h"
#include "tether/handle/LocalHandle.h"
#include "tether/memory/Value.h"
#include "tether/runtime/All.h"
#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>

using namespace tether;
using handle::Builder;
using handle::LocalHandle;
using memory::GcFrame;

namespace {
class LocalHandles : public ::testing::Test {
 protected:
  void SetUp() override { rt::reset_for_tests(); }
};
} // namespace

TEST_F(LocalHandles, SingleSlotScopeKeepsValueAcrossCollection) {
  LocalHandle local = Builder::local().start();
  local.local_scope<1>([&](memory::LocalFrame<1>& frame) {
    const Value text = Value::new_string(frame, "still here");
    for (int i = 0; i < 3; ++i) {
      local.scope([](GcFrame& junk) {
        for (int j = 0; j < 32; ++j) { (void)Value::new_list(junk, 8); }
      });
      local.gc_collect(TETHER_GC_FULL);
    }
    EXPECT_TRUE(text.is_valid());
    EXPECT_EQ(text.as_string(), "still here");
  });
}

TEST_F(LocalHandles, SecondOwningHandleIsRejected) {
  LocalHandle local{handle::LocalConfig{}};
  EXPECT_THROW(LocalHandle second{handle::LocalConfig{}}, exceptions::InvalidHandleState);
}

TEST_F(LocalHandles, HostFunctionsAreCallableFromForeignCode) {
  LocalHandle local = Builder::local().start();
  local.register_function("host-twice", [](GcFrame& frame, std::span<const Value> args) {
    return Value::new_int(frame, args[0].as_int() * 2);
  });
  local.scope([](GcFrame& frame) {
    const CallResult<Value> out = Value::eval_string(frame, "(+ 1 (host-twice 20))");
    ASSERT_TRUE(out.has_value()) << out.error().message;
    EXPECT_EQ(out->as_int(), 41);
  });
}

TEST_F(LocalHandles, HostFunctionFailureBecomesForeignException) {
  LocalHandle local{handle::LocalConfig{}};
  local.register_function("host-strict", [](GcFrame& frame, std::span<const Value> args) {
    if (args.size() < 2) { throw std::out_of_range("host-strict takes two arguments"); }
    return Value::new_int(frame, args[0].as_int() + args[1].as_int());
  });
  local.scope([](GcFrame& frame) {
    const CallResult<Value> out = Value::eval_string(frame, "(host-strict 1)");
    ASSERT_FALSE(out.has_value());
    EXPECT_TRUE(out.error().is_exception());
    EXPECT_EQ(out.error().message, "HostPanic: host-strict: host-strict takes two arguments");
  });
}

TEST_F(LocalHandles, CallsForeignFunctionsWithRootedArguments) {
  LocalHandle local{handle::LocalConfig{}};
  local.scope([](GcFrame& frame) {
    ASSERT_TRUE(Value::eval_string(frame, "(define (join a b) (string a \"-\" b))").has_value());
    const CallResult<Value> fn = Value::global(frame, "join");
    ASSERT_TRUE(fn.has_value());
    const std::array<Value, 2> args{Value::new_string(frame, "left"), Value::new_int(frame, 7)};
    const CallResult<Value> out = fn->call(frame, args);
    ASSERT_TRUE(out.has_value()) << out.error().message;
    EXPECT_EQ(out->as_string(), "left-7");
  });
}

TEST_F(LocalHandles, UseFromAnotherThreadIsRejected) {
  LocalHandle local{handle::LocalConfig{}};
  bool rejected = false;
  std::thread other([&] {
    try {
      local.scope([](GcFrame&) {});
    } catch (const exceptions::InvalidHandleState&) {
      rejected = true;
    }
  });
  other.join();
  EXPECT_TRUE(rejected);
}
