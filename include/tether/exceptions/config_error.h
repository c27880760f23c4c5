/***
 * Name: tether::exceptions::ConfigError
 * Purpose: Exception for builder and command-line configuration errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TetherException.
 */
#pragma once

#include "tether/exceptions/tether_exception.h"

namespace tether {
namespace exceptions {

class ConfigError : public TetherException {
 public:
  using TetherException::TetherException;
};

}  // namespace exceptions
}  // namespace tether
