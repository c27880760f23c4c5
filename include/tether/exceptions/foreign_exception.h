/***
 * Name: tether::exceptions::ForeignException
 * Purpose: Host-side rethrow of a foreign exception previously captured as a CallError.
 * Inputs: Rendered foreign exception message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TetherException; see CallError::rethrow().
 */
#pragma once

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class ForeignException : public TetherException {
 public:
  using TetherException::TetherException;
};

}  // namespace exceptions
}  // namespace tether
