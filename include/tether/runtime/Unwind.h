/***
 * Name: tether::rt::ForeignUnwind
 * Purpose: Unwinding token for a raised foreign exception.
 * Theory of Operation: The exception object itself stays in the raising thread's exception
 *   slot; the token only carries control to the nearest try_catch boundary. It does not
 *   derive from std::exception so host catch sites for std::exception never intercept it.
 */
#pragma once

namespace tether::rt {

struct ForeignUnwind {};

} // namespace tether::rt
