/***
 * Name: tether::exceptions::StackOverflow::StackOverflow
 * Purpose: Build the capacity error message from the requested and available slot counts.
 */
#include "tether/exceptions/stack_overflow.h"

#include <string>

namespace tether::exceptions {

StackOverflow::StackOverflow(std::size_t requested, std::size_t capacity)
    : TetherException("frame capacity exceeded: requested " + std::to_string(requested) +
                      " slots, capacity " + std::to_string(capacity)),
      requested_(requested),
      capacity_(capacity) {}

}  // namespace tether::exceptions
