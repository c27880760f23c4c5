/***
 * Name: tether::memory::Stack
 * Purpose: Shadow stack of root slots for one thread or one async task.
 * Inputs: Frame push/pop requests from the frame classes
 * Outputs: Slot ranges; enumeration of live roots for the collector
 * Theory of Operation:
 *   An arena of StackPages addressed by a (page, offset) cursor. A frame records the cursor
 *   when it is pushed and restores it when popped, clearing every slot handed out in
 *   between. A request that does not fit the rest of the current page moves the cursor to
 *   the next page, appending one when none is large enough. Pages stay owned by the stack
 *   until it is destroyed, so stale slot addresses always point at valid (zeroed) memory.
 *
 *   Unsized frames draw from a second LIFO arena of side buffers that follows the frame
 *   chain. The collector scans the pages up to the cursor and the side buffers in use.
 *
 *   A Stack is owned by exactly one thread or task and is never shared.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "tether/memory/StackPage.h"
#include "tether/runtime/c_api.h"

namespace tether::memory {

class Frame;

struct Cursor {
  std::size_t page{0};
  std::size_t offset{0};
};

struct SlotRef {
  void** slot{nullptr};
  uint64_t* stamp{nullptr};
};

class Stack {
 public:
  static constexpr std::size_t kMaxFrameSlots = std::size_t{1} << 20;

  explicit Stack(std::size_t pageSlots = StackPage::kMinSlots);
  Stack(const Stack&) = delete;
  Stack& operator=(const Stack&) = delete;
  ~Stack();

  // n contiguous zeroed slots at the cursor. Throws StackOverflow above kMaxFrameSlots.
  SlotRef take(std::size_t n);

  // n contiguous zeroed slots from the side arena.
  SlotRef take_side(std::size_t n);

  // Write obj into the slot with a fresh stamp and return the stamp.
  uint64_t write(SlotRef ref, void* obj) noexcept;

  // Make sure the next take(n) needs no page allocation.
  void reserve(std::size_t n);

  Frame* top() const noexcept { return top_; }
  bool empty() const noexcept { return top_ == nullptr; }

  // Visit every non-null slot owned by a live frame.
  void scan(tether_root_visitor_t visit, void* visitCtx) const;

  // Root scanner entry point for tether_rt_set_root_scanner; ctx is a Stack*.
  static void scan_roots(void* ctx, tether_root_visitor_t visit, void* visitCtx);

  std::size_t live_slots() const;
  std::size_t n_pages() const noexcept { return pages_.size(); }
  std::size_t page_slots() const noexcept { return pageSlots_; }

 private:
  friend class Frame;

  struct Mark {
    Cursor cursor;
    std::size_t side{0};
  };

  Mark push_frame(Frame* frame) noexcept;
  void pop_frame(const Mark& mark, Frame* previous) noexcept;

  std::vector<std::unique_ptr<StackPage>> pages_;
  std::vector<std::unique_ptr<StackPage>> side_;
  Cursor cursor_{};
  std::size_t sideTop_{0};
  Frame* top_{nullptr};
  uint64_t epoch_{0};
  std::size_t pageSlots_;
};

} // namespace tether::memory
