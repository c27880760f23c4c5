/***
 * Name: test_frames
 * Purpose: Scope protocol: nesting, capacity errors, pop discipline, targets and stale values.
 */
#include <gtest/gtest.h>
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/exceptions/stack_overflow.h"
#include "tether/handle/LocalHandle.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Target.h"
#include "tether/memory/Value.h"
#include "tether/runtime/Runtime.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

using namespace tether;
using memory::GcFrame;
using memory::LocalFrame;
using memory::UnsizedFrame;

namespace {
class Frames : public ::testing::Test {
 protected:
  void SetUp() override {
    rt::reset_for_tests();
    local_ = std::make_unique<handle::LocalHandle>(handle::LocalConfig{});
  }
  void TearDown() override { local_.reset(); }

  handle::LocalHandle& local() { return *local_; }

 private:
  std::unique_ptr<handle::LocalHandle> local_;
};

template <std::size_t N>
void overflow_local_frame(memory::Stack& stack) {
  memory::local_scope<N>(stack, [](LocalFrame<N>& frame) {
    for (std::size_t i = 0; i < N; ++i) { (void)Value::new_int(frame, static_cast<int64_t>(i)); }
    try {
      (void)Value::new_int(frame, -1);
      FAIL() << "rooting past capacity " << N << " did not throw";
    } catch (const exceptions::StackOverflow& e) {
      EXPECT_EQ(e.requested(), N + 1);
      EXPECT_EQ(e.capacity(), N);
    }
    EXPECT_EQ(frame.n_roots(), N);
  });
}
} // namespace

TEST_F(Frames, NestedScopesLeaveRootCountUnchanged) {
  memory::Stack& stack = local().stack();
  local().scope([&](GcFrame& outer) {
    (void)Value::new_int(outer, 1);
    const std::size_t before = stack.live_slots();
    outer.scope([&](GcFrame& a) {
      (void)Value::new_string(a, "nested");
      a.local_scope<3>([&](LocalFrame<3>& b) {
        (void)Value::new_float(b, 1.5);
        b.unsized_local_scope(5, [&](UnsizedFrame& c) {
          (void)Value::new_bool(c, true);
          (void)Value::new_list(c, 2);
        });
      });
    });
    EXPECT_EQ(stack.live_slots(), before);
    EXPECT_EQ(outer.n_roots(), 1u);
  });
  EXPECT_EQ(stack.live_slots(), 0u);
}

TEST_F(Frames, LocalFrameOverflowAtEverySize) {
  memory::Stack& stack = local().stack();
  overflow_local_frame<0>(stack);
  overflow_local_frame<1>(stack);
  overflow_local_frame<2>(stack);
  overflow_local_frame<7>(stack);
  overflow_local_frame<64>(stack);
  overflow_local_frame<65>(stack);
  overflow_local_frame<1000>(stack);
  EXPECT_EQ(stack.live_slots(), 0u);
}

TEST_F(Frames, UnsizedFrameOverflowAtEverySize) {
  for (const std::size_t size : {0U, 1U, 3U, 63U, 64U, 129U, 5000U}) {
    local().unsized_local_scope(size, [size](UnsizedFrame& frame) {
      EXPECT_EQ(frame.capacity(), size);
      for (std::size_t i = 0; i < size; ++i) { (void)Value::new_int(frame, static_cast<int64_t>(i)); }
      EXPECT_THROW((void)Value::new_int(frame, -1), exceptions::StackOverflow);
      EXPECT_EQ(frame.n_roots(), size);
    });
  }
  EXPECT_EQ(local().stack().live_slots(), 0u);
}

TEST_F(Frames, LocalFrameSlotsAreReusable) {
  local().local_scope<2>([](LocalFrame<2>& frame) {
    memory::ReusableSlot slot = frame.slot<1>();
    const Value first = Value::new_int(slot, 1);
    EXPECT_EQ(first.as_int(), 1);
    const Value second = Value::new_int(slot, 2);
    EXPECT_EQ(second.as_int(), 2);
    EXPECT_FALSE(first.is_valid());
    EXPECT_THROW((void)first.as_int(), exceptions::InvalidHandleState);
    const Value other = Value::new_int(frame, 3);
    EXPECT_EQ(other.as_int(), 3);
    EXPECT_THROW((void)Value::new_int(frame, 4), exceptions::StackOverflow);
  });
}

TEST_F(Frames, RootingIntoParentWhileChildIsLiveThrows) {
  local().scope([](GcFrame& outer) {
    outer.scope([&](GcFrame& inner) {
      EXPECT_FALSE(outer.is_top());
      EXPECT_TRUE(inner.is_top());
      EXPECT_THROW((void)Value::new_int(outer, 1), exceptions::InvalidHandleState);
      EXPECT_THROW(outer.pop(), exceptions::InvalidHandleState);
    });
    EXPECT_TRUE(outer.is_top());
  });
}

TEST_F(Frames, PopIsIdempotentAndStalesValues) {
  memory::Stack& stack = local().stack();
  GcFrame outer(stack);
  Value kept;
  {
    GcFrame inner(stack);
    kept = Value::new_int(inner, 9);
    EXPECT_TRUE(kept.is_valid());
    inner.pop();
    inner.pop();
    EXPECT_TRUE(inner.is_popped());
    EXPECT_THROW((void)Value::new_int(inner, 1), exceptions::InvalidHandleState);
  }
  EXPECT_FALSE(kept.is_valid());
  EXPECT_THROW((void)kept.get(), exceptions::InvalidHandleState);
  EXPECT_TRUE(outer.is_top());
}

TEST_F(Frames, ScopePopsOnException) {
  memory::Stack& stack = local().stack();
  EXPECT_THROW(local().scope([](GcFrame& frame) {
    (void)Value::new_int(frame, 1);
    throw std::runtime_error("leaving early");
  }),
               std::runtime_error);
  EXPECT_TRUE(stack.empty());
  EXPECT_EQ(stack.live_slots(), 0u);
}

TEST_F(Frames, OutputCarriesResultOutOfNestedScope) {
  local().scope([](GcFrame& outer) {
    memory::Output out = outer.output();
    const Value result = outer.scope([&](GcFrame& inner) {
      const Value a = Value::new_int(inner, 40);
      const Value b = Value::new_int(inner, 2);
      return Value::new_int(out, a.as_int() + b.as_int());
    });
    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(result.as_int(), 42);
    EXPECT_TRUE(out.is_spent());
    EXPECT_THROW((void)Value::new_int(out, 0), exceptions::InvalidHandleState);
  });
}

TEST_F(Frames, OutputCannotOutliveItsFrame) {
  memory::Stack& stack = local().stack();
  GcFrame base(stack);
  std::optional<memory::Output> escaped;
  base.scope([&](GcFrame& inner) { escaped.emplace(inner.output()); });
  EXPECT_THROW((void)Value::new_int(*escaped, 1), exceptions::InvalidHandleState);
}

TEST_F(Frames, UnrootedTargetDoesNotTakeSlots) {
  local().scope([](GcFrame& frame) {
    memory::Unrooted unrooted;
    const Value v = Value::new_int(unrooted, 5);
    EXPECT_FALSE(v.is_rooted());
    EXPECT_EQ(v.as_int(), 5);
    EXPECT_EQ(frame.n_roots(), 0u);
  });
}
