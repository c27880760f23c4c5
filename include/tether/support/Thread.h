/***
 * Name: tether::support (thread naming)
 * Purpose: Name runtime threads so debuggers and `top -H` show which handle owns them.
 * Inputs: Thread name (truncated to the platform limit)
 * Outputs: None
 */
#pragma once

#include <string>

namespace tether {
namespace support {

/*** SetThreadName: Name the calling thread; a no-op where the platform has no API for it. */
void SetThreadName(const std::string& name);

}  // namespace support
}  // namespace tether
