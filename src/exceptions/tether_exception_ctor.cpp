/***
 * Name: tether::exceptions::TetherException::TetherException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "tether/exceptions/tether_exception.h"

#include <utility>

namespace tether {
namespace exceptions {

TetherException::TetherException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace tether
