/***
 * Name: tether::exceptions::TypeMismatch
 * Purpose: Exception for unboxing or indexing a value of the wrong runtime type.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TetherException.
 */
#pragma once

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class TypeMismatch : public TetherException {
 public:
  using TetherException::TetherException;
};

}  // namespace exceptions
}  // namespace tether
