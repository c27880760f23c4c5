/***
 * Name: test_stack
 * Purpose: Page arena growth, cursor restore on pop and root enumeration.
 */
#include <gtest/gtest.h>
#include "tether/exceptions/stack_overflow.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Stack.h"
#include <cstdint>
#include <vector>

using namespace tether::memory;

namespace {
// Distinct non-null addresses standing in for objects; scan() never dereferences them.
std::vector<uint64_t> g_fake(256);
void* fake(std::size_t i) { return &g_fake[i]; }
} // namespace

TEST(Stack, PageSizeHasAFloor) {
  const Stack small(8);
  EXPECT_EQ(small.page_slots(), StackPage::kMinSlots);
  EXPECT_EQ(small.n_pages(), 1u);
  EXPECT_TRUE(small.empty());
}

TEST(Stack, GrowsByPagesAndKeepsThem) {
  Stack stack;
  {
    GcFrame frame(stack);
    for (std::size_t i = 0; i < StackPage::kMinSlots * 3; ++i) { (void)frame.root(fake(i % g_fake.size())); }
    EXPECT_GE(stack.n_pages(), 3u);
    EXPECT_EQ(stack.live_slots(), StackPage::kMinSlots * 3);
  }
  EXPECT_GE(stack.n_pages(), 3u);
  EXPECT_EQ(stack.live_slots(), 0u);
  EXPECT_TRUE(stack.empty());
}

TEST(Stack, LargeRequestGetsItsOwnPage) {
  Stack stack;
  {
    LocalFrame<StackPage::kMinSlots * 2> frame(stack);
    EXPECT_EQ(frame.capacity(), StackPage::kMinSlots * 2);
    (void)frame.root(fake(0));
  }
  EXPECT_EQ(stack.live_slots(), 0u);
}

TEST(Stack, OversizedRequestThrows) {
  Stack stack;
  EXPECT_THROW((void)stack.take(Stack::kMaxFrameSlots + 1), tether::exceptions::StackOverflow);
  EXPECT_THROW({ const UnsizedFrame frame(stack, Stack::kMaxFrameSlots + 1); }, tether::exceptions::StackOverflow);
  EXPECT_TRUE(stack.empty());
}

TEST(Stack, ScanVisitsOnlyLiveSlots) {
  Stack stack;
  GcFrame outer(stack);
  (void)outer.root(fake(1));
  {
    GcFrame inner(stack);
    (void)inner.root(fake(2));
    UnsizedFrame side(stack, 4);
    (void)side.root(fake(3));
    std::vector<void*> seen;
    stack.scan([](void* obj, void* ctx) { static_cast<std::vector<void*>*>(ctx)->push_back(obj); }, &seen);
    EXPECT_EQ(seen.size(), 3u);
  }
  EXPECT_EQ(stack.live_slots(), 1u);
}

TEST(Stack, ReserveAvoidsPageGrowthLater) {
  Stack stack;
  stack.reserve(StackPage::kMinSlots * 4);
  const std::size_t pages = stack.n_pages();
  {
    GcFrame frame(stack);
    (void)frame.root(fake(0));
  }
  LocalFrame<StackPage::kMinSlots * 4> big(stack);
  (void)big;
  EXPECT_EQ(stack.n_pages(), pages);
}
