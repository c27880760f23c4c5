/***
 * Name: tether::memory::Frame, GcFrame, LocalFrame<N>, UnsizedFrame
 * Purpose: Activations on a shadow stack that own the root slots of one scope.
 * Inputs: The Stack the frame is pushed on
 * Outputs: Rooted values, reserved targets, nested scopes
 * Theory of Operation:
 *   A frame is pushed by its constructor and popped by its destructor (or an explicit,
 *   idempotent pop()). Popping clears every slot handed out since the push, including those
 *   of a growable frame that spilled onto further pages, and zeroes their stamps.
 *
 *   - GcFrame: grows one slot per root, up to Stack::kMaxFrameSlots.
 *   - LocalFrame<N>: N contiguous slots taken at push time; slot<I>() is checked at compile
 *     time, root() throws StackOverflow past N.
 *   - UnsizedFrame: size slots from the stack's side arena; root() throws StackOverflow past
 *     size.
 *
 *   Fresh slots can only be taken while the frame is the top of its stack. Nested scopes
 *   push a child frame on the same stack and pop it before returning, on every exit path.
 */
#pragma once

#include <bitset>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

#include "tether/exceptions/invalid_handle_state.h"
#include "tether/exceptions/stack_overflow.h"
#include "tether/memory/Stack.h"
#include "tether/memory/Target.h"
#include "tether/memory/Value.h"

namespace tether::memory {

class GcFrame;
class UnsizedFrame;
template <std::size_t N>
class LocalFrame;

class Frame : public Target {
 public:
  Frame(const Frame&) = delete;
  Frame& operator=(const Frame&) = delete;
  ~Frame() override;

  // Root obj in a fresh slot of this frame.
  Value root(void* obj) override;

  // Reserve a slot of this frame for a single later write, usually from a nested scope.
  Output output();
  ReusableSlot reusable_slot();

  // Throws InvalidHandleState when a frame pushed after this one is still live.
  void pop();

  bool is_popped() const noexcept { return popped_; }
  bool is_top() const noexcept { return !popped_ && stack_.top() == this; }
  Frame* previous() const noexcept { return previous_; }
  Stack& stack() noexcept { return stack_; }

  // Slots in use, including reserved targets.
  std::size_t n_roots() const noexcept { return nRoots_; }
  virtual std::size_t capacity() const noexcept = 0;

  template <typename F>
  auto scope(F&& func) -> std::invoke_result_t<F&, GcFrame&>;

  template <std::size_t N, typename F>
  auto local_scope(F&& func) -> std::invoke_result_t<F&, LocalFrame<N>&>;

  template <typename F>
  auto unsized_local_scope(std::size_t size, F&& func) -> std::invoke_result_t<F&, UnsizedFrame&>;

 protected:
  explicit Frame(Stack& stack) noexcept;

  // Hand out the next slot; throws StackOverflow when the frame is full.
  virtual SlotRef claim() = 0;

  void count_root() noexcept { ++nRoots_; }

 private:
  SlotRef claim_top();

  Stack& stack_;
  Frame* previous_;
  Stack::Mark mark_;
  std::size_t nRoots_{0};
  bool popped_{false};
};

class GcFrame final : public Frame {
 public:
  explicit GcFrame(Stack& stack) noexcept : Frame(stack) {}
  ~GcFrame() override = default;

  std::size_t capacity() const noexcept override { return Stack::kMaxFrameSlots; }

 protected:
  SlotRef claim() override;
};

template <std::size_t N>
class LocalFrame final : public Frame {
 public:
  explicit LocalFrame(Stack& stack) : Frame(stack), base_(stack.take(N)) {}
  ~LocalFrame() override = default;

  std::size_t capacity() const noexcept override { return N; }

  // Slot I as a reusable target. A slot already handed out by root() cannot be claimed.
  template <std::size_t I>
  ReusableSlot slot() {
    static_assert(I < N, "slot index out of range for this frame");
    if (!claimed_.test(I)) {
      if (I < next_) { throw exceptions::InvalidHandleState("slot already holds a rooted value"); }
      claimed_.set(I);
      count_root();
    }
    const SlotRef ref{base_.slot + I, base_.stamp + I};
    if (*ref.stamp == 0) { stack().write(ref, nullptr); }
    return ReusableSlot(stack(), ref, *ref.stamp);
  }

 protected:
  SlotRef claim() override {
    while (next_ < N && claimed_.test(next_)) { ++next_; }
    if (next_ >= N) { throw exceptions::StackOverflow(n_roots() + 1, N); }
    const SlotRef ref{base_.slot + next_, base_.stamp + next_};
    ++next_;
    return ref;
  }

 private:
  SlotRef base_;
  std::bitset<N> claimed_{};
  std::size_t next_{0};
};

class UnsizedFrame final : public Frame {
 public:
  UnsizedFrame(Stack& stack, std::size_t size);
  ~UnsizedFrame() override = default;

  std::size_t capacity() const noexcept override { return size_; }

 protected:
  SlotRef claim() override;

 private:
  std::size_t size_;
  SlotRef base_{};
  std::size_t next_{0};
};

// Scopes on a bare stack: the base of a handle or task.
template <typename F>
auto scope(Stack& stack, F&& func) -> std::invoke_result_t<F&, GcFrame&> {
  GcFrame frame(stack);
  return std::invoke(func, frame);
}

template <std::size_t N, typename F>
auto local_scope(Stack& stack, F&& func) -> std::invoke_result_t<F&, LocalFrame<N>&> {
  LocalFrame<N> frame(stack);
  return std::invoke(func, frame);
}

template <typename F>
auto unsized_local_scope(Stack& stack, std::size_t size, F&& func) -> std::invoke_result_t<F&, UnsizedFrame&> {
  UnsizedFrame frame(stack, size);
  return std::invoke(func, frame);
}

template <typename F>
auto Frame::scope(F&& func) -> std::invoke_result_t<F&, GcFrame&> {
  return memory::scope(stack_, std::forward<F>(func));
}

template <std::size_t N, typename F>
auto Frame::local_scope(F&& func) -> std::invoke_result_t<F&, LocalFrame<N>&> {
  return memory::local_scope<N>(stack_, std::forward<F>(func));
}

template <typename F>
auto Frame::unsized_local_scope(std::size_t size, F&& func) -> std::invoke_result_t<F&, UnsizedFrame&> {
  return memory::unsized_local_scope(stack_, size, std::forward<F>(func));
}

} // namespace tether::memory
