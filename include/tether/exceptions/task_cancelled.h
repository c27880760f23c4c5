/***
 * Name: tether::exceptions::TaskCancelled
 * Purpose: Raised inside an async task at the checkpoint that observes its cancellation token.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TetherException. It unwinds the task's
 *   coroutine frames and is reported to the caller as CallError::Kind::Cancelled.
 */
#pragma once

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class TaskCancelled : public TetherException {
 public:
  using TetherException::TetherException;
};

}  // namespace exceptions
}  // namespace tether
