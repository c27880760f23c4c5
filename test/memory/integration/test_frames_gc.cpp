/***
 * Name: test_frames_gc
 * Purpose: Rooted values survive collections; popped roots become collectable.
 */
#include <gtest/gtest.h>
#include "tether/handle/LocalHandle.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Target.h"
#include "tether/memory/Value.h"
#include "tether/runtime/All.h"
#include <cstddef>
#include <string>
#include <vector>

using namespace tether;
using memory::GcFrame;

namespace {
class FramesGc : public ::testing::Test {
 protected:
  void SetUp() override { rt::reset_for_tests(); }
};
} // namespace

TEST_F(FramesGc, OutputsSurviveFullCollectionsBetweenScopes) {
  handle::LocalHandle local{handle::LocalConfig{}};
  constexpr std::size_t kValues = 50;
  local.scope([&](GcFrame& outer) {
    std::vector<Value> kept;
    for (std::size_t i = 0; i < kValues; ++i) {
      memory::Output out = outer.output();
      kept.push_back(outer.scope([&](GcFrame& inner) {
        (void)Value::new_string(inner, "garbage " + std::to_string(i));
        return Value::new_string(out, "kept " + std::to_string(i));
      }));
      local.gc_collect(TETHER_GC_FULL);
    }
    for (std::size_t i = 0; i < kValues; ++i) {
      ASSERT_TRUE(kept[i].is_valid());
      EXPECT_EQ(kept[i].as_string(), "kept " + std::to_string(i));
    }
  });
}

TEST_F(FramesGc, PoppedRootsAreCollected) {
  handle::LocalHandle local{handle::LocalConfig{}};
  local.gc_collect(TETHER_GC_FULL);
  const std::size_t baseline = rt::gc_object_count();
  local.scope([](GcFrame& frame) {
    for (int i = 0; i < 100; ++i) { (void)Value::new_int(frame, 1000 + i); }
  });
  local.gc_collect(TETHER_GC_FULL);
  EXPECT_EQ(rt::gc_object_count(), baseline);
}

TEST_F(FramesGc, ListChildrenSurviveThroughTheirParent) {
  handle::LocalHandle local{handle::LocalConfig{}};
  local.scope([&](GcFrame& frame) {
    const Value list = Value::new_list(frame, 3);
    frame.scope([&](GcFrame& inner) {
      for (std::size_t i = 0; i < 3; ++i) {
        list.set_index(i, Value::new_string(inner, "item" + std::to_string(i)));
      }
    });
    local.gc_collect(TETHER_GC_FULL);
    local.gc_collect(TETHER_GC_INCREMENTAL);
    memory::ReusableSlot slot = frame.reusable_slot();
    for (std::size_t i = 0; i < 3; ++i) {
      EXPECT_EQ(list.get_index(slot, i).as_string(), "item" + std::to_string(i));
    }
    EXPECT_EQ(list.length(), 3u);
  });
}

TEST_F(FramesGc, UnsizedFrameRootsAreScanned) {
  handle::LocalHandle local{handle::LocalConfig{}};
  local.unsized_local_scope(16, [&](memory::UnsizedFrame& frame) {
    std::vector<Value> values;
    for (int i = 0; i < 16; ++i) { values.push_back(Value::new_float(frame, i * 0.5)); }
    local.gc_collect(TETHER_GC_FULL);
    for (int i = 0; i < 16; ++i) { EXPECT_DOUBLE_EQ(values[static_cast<std::size_t>(i)].as_float(), i * 0.5); }
  });
}
