/***
 * Name: tether::memory::StackPage
 * Purpose: Fixed-size block of root slots with one generation stamp per slot.
 * Inputs: Slot count (at least kMinSlots)
 * Outputs: Stable slot and stamp addresses
 * Theory of Operation:
 *   The arrays are allocated once and never resized, so a slot's address is stable for the
 *   lifetime of the page. A stamp of zero marks a slot that no live frame has written.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace tether::memory {

class StackPage {
 public:
  static constexpr std::size_t kMinSlots = 64;

  explicit StackPage(std::size_t nSlots);
  StackPage(const StackPage&) = delete;
  StackPage& operator=(const StackPage&) = delete;

  std::size_t size() const noexcept { return size_; }
  void** slot(std::size_t index) noexcept { return &slots_[index]; }
  void* const* slot(std::size_t index) const noexcept { return &slots_[index]; }
  uint64_t* stamp(std::size_t index) noexcept { return &stamps_[index]; }

  // Null the slots in [from, to) and zero their stamps.
  void clear(std::size_t from, std::size_t to) noexcept;

 private:
  std::size_t size_;
  std::unique_ptr<void*[]> slots_;
  std::unique_ptr<uint64_t[]> stamps_;
};

} // namespace tether::memory
