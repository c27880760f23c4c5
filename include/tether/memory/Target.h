/***
 * Name: tether::memory::Target, Output, ReusableSlot, Unrooted
 * Purpose: Destinations for freshly allocated foreign values.
 * Theory of Operation:
 *   Every operation that returns a new foreign value takes a Target and roots the value there
 *   before anything else can allocate. Frames are targets too (each root takes a fresh slot
 *   of the frame, which must be the top of its stack).
 *
 *   - Output: one slot reserved in an ancestor frame, written at most once, typically from a
 *     nested scope whose result must outlive it.
 *   - ReusableSlot: one reserved slot that every write replaces; the previous value becomes
 *     unreachable (and its Values stale) at once.
 *   - Unrooted: no rooting. The caller guarantees the value is global or otherwise
 *     reachable, or that nothing allocates before the value is dropped.
 */
#pragma once

#include <cstdint>

#include "tether/memory/Stack.h"
#include "tether/memory/Value.h"

namespace tether::memory {

class Target {
 public:
  virtual ~Target() = default;
  virtual Value root(void* obj) = 0;

 protected:
  Target() = default;
  Target(const Target&) = default;
  Target& operator=(const Target&) = default;
};

class Output final : public Target {
 public:
  Output(Stack& stack, SlotRef ref, uint64_t stamp) noexcept : stack_(&stack), ref_(ref), stamp_(stamp) {}
  Output(Output&& other) noexcept;
  Output& operator=(Output&&) = delete;
  Output(const Output&) = delete;
  Output& operator=(const Output&) = delete;

  // Throws InvalidHandleState when already used or when the owning frame was popped.
  Value root(void* obj) override;
  bool is_spent() const noexcept { return spent_; }

 private:
  Stack* stack_;
  SlotRef ref_;
  uint64_t stamp_;
  bool spent_{false};
};

class ReusableSlot final : public Target {
 public:
  ReusableSlot(Stack& stack, SlotRef ref, uint64_t stamp) noexcept : stack_(&stack), ref_(ref), stamp_(stamp) {}

  // Throws InvalidHandleState when the owning frame was popped.
  Value root(void* obj) override;
  // Drop the current value; it is unrooted from here on.
  void reset();

 private:
  void check_live() const;

  Stack* stack_;
  SlotRef ref_;
  uint64_t stamp_;
};

class Unrooted final : public Target {
 public:
  Value root(void* obj) override { return Value::unrooted(obj); }
};

} // namespace tether::memory
