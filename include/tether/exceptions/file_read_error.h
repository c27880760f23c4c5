/***
 * Name: tether::exceptions::FileReadError
 * Purpose: Exception for include targets that do not exist or cannot be read.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TetherException.
 */
#pragma once

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class FileReadError : public TetherException {
 public:
  using TetherException::TetherException;
};

}  // namespace exceptions
}  // namespace tether
