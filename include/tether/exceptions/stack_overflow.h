/***
 * Name: tether::exceptions::StackOverflow
 * Purpose: Capacity error raised when a frame would root more values than it can hold.
 * Inputs: Requested slot count and the frame's capacity
 * Outputs: Exception object carrying both counts
 * Theory of Operation: Thrown before any slot is written, so a full frame is never overrun.
 */
#pragma once

#include <cstddef>

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class StackOverflow : public TetherException {
 public:
  StackOverflow(std::size_t requested, std::size_t capacity);

  std::size_t requested() const noexcept { return requested_; }
  std::size_t capacity() const noexcept { return capacity_; }

 private:
  std::size_t requested_;
  std::size_t capacity_;
};

}  // namespace exceptions
}  // namespace tether
