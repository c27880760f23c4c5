/***
 * Name: tether::memory::Frame, GcFrame, UnsizedFrame
 * Purpose: Frame push/pop and slot claiming.
 */
#include "tether/memory/Frame.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/exceptions/stack_overflow.h"

namespace tether::memory {

Frame::Frame(Stack& stack) noexcept : stack_(stack), previous_(stack.top()), mark_(stack.push_frame(this)) {}

Frame::~Frame() {
  if (!popped_) {
    popped_ = true;
    stack_.pop_frame(mark_, previous_);
  }
}

void Frame::pop() {
  if (popped_) { return; }
  if (stack_.top() != this) { throw exceptions::InvalidHandleState("frame popped while a nested frame is live"); }
  popped_ = true;
  stack_.pop_frame(mark_, previous_);
}

SlotRef Frame::claim_top() {
  if (popped_) { throw exceptions::InvalidHandleState("frame already popped"); }
  if (stack_.top() != this) {
    throw exceptions::InvalidHandleState("cannot root into a frame while a nested frame is live");
  }
  const SlotRef ref = claim();
  count_root();
  return ref;
}

Value Frame::root(void* obj) {
  const SlotRef ref = claim_top();
  const uint64_t stamp = stack_.write(ref, obj);
  return Value::bound(obj, ref, stamp);
}

Output Frame::output() {
  const SlotRef ref = claim_top();
  const uint64_t stamp = stack_.write(ref, nullptr);
  return Output(stack_, ref, stamp);
}

ReusableSlot Frame::reusable_slot() {
  const SlotRef ref = claim_top();
  const uint64_t stamp = stack_.write(ref, nullptr);
  return ReusableSlot(stack_, ref, stamp);
}

SlotRef GcFrame::claim() {
  if (n_roots() >= Stack::kMaxFrameSlots) { throw exceptions::StackOverflow(n_roots() + 1, Stack::kMaxFrameSlots); }
  return stack().take(1);
}

UnsizedFrame::UnsizedFrame(Stack& stack, std::size_t size) : Frame(stack), size_(size) {
  if (size_ > 0) { base_ = stack.take_side(size_); }
}

SlotRef UnsizedFrame::claim() {
  if (next_ >= size_) { throw exceptions::StackOverflow(n_roots() + 1, size_); }
  const SlotRef ref{base_.slot + next_, base_.stamp + next_};
  ++next_;
  return ref;
}

} // namespace tether::memory
