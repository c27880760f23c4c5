/***
 * Name: tether::memory::Output, ReusableSlot
 * Purpose: Writes into slots reserved earlier in a (possibly non-top) frame.
 */
#include "tether/memory/Target.h"
#include "tether/exceptions/invalid_handle_state.h"

namespace tether::memory {

Output::Output(Output&& other) noexcept
    : Target(other), stack_(other.stack_), ref_(other.ref_), stamp_(other.stamp_), spent_(other.spent_) {
  other.spent_ = true;
}

Value Output::root(void* obj) {
  if (spent_) { throw exceptions::InvalidHandleState("output target already used"); }
  if (*ref_.stamp != stamp_) { throw exceptions::InvalidHandleState("output target outlived its frame"); }
  spent_ = true;
  const uint64_t stamp = stack_->write(ref_, obj);
  return Value::bound(obj, ref_, stamp);
}

void ReusableSlot::check_live() const {
  if (*ref_.stamp != stamp_) { throw exceptions::InvalidHandleState("reusable slot outlived its frame"); }
}

Value ReusableSlot::root(void* obj) {
  check_live();
  stamp_ = stack_->write(ref_, obj);
  return Value::bound(obj, ref_, stamp_);
}

void ReusableSlot::reset() {
  check_live();
  stamp_ = stack_->write(ref_, nullptr);
}

} // namespace tether::memory
