/***
 * Name: tether::exceptions::TetherException
 * Purpose: Base class for all tether exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites.
 *   Exceptions report programmer errors (misuse of handles, frames and targets);
 *   expected failures of foreign calls are returned as CallResult values instead.
 */
#pragma once

#include <exception>
#include <string>

namespace tether {
namespace exceptions {

class TetherException : public std::exception {
 public:
  explicit TetherException(std::string msg) noexcept;
  virtual ~TetherException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  std::string message_;
};

}  // namespace exceptions
}  // namespace tether
