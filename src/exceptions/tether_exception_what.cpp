/***
 * Name: tether::exceptions::TetherException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "tether/exceptions/tether_exception.h"

namespace tether::exceptions {

const char* TetherException::what() const noexcept { return message_.c_str(); }

}  // namespace tether::exceptions
