/***
 * Name: tether::exceptions::InvalidHandleState
 * Purpose: Exception for misuse of runtime handles, frames, targets and rooted values.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TetherException. Raised for double init,
 *   use after shutdown, use from a non-owning thread, stale rooted values and spent targets.
 */
#pragma once

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class InvalidHandleState : public TetherException {
 public:
  using TetherException::TetherException;
};

}  // namespace exceptions
}  // namespace tether
