/***
 * Name: tether::support::debug_log
 * Purpose: Tagged diagnostic lines on stderr, enabled by TETHER_RT_DEBUG.
 */
#include "tether/support/Debug.h"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace tether::support {

bool debug_enabled() {
  static const bool enabled = (std::getenv("TETHER_RT_DEBUG") != nullptr);
  return enabled;
}

void debug_log(const char* tag, const char* fmt, ...) {
  if (!debug_enabled()) { return; }
  std::va_list args;
  va_start(args, fmt);
  std::fprintf(stderr, "[%s] ", tag);
  std::vfprintf(stderr, fmt, args);
  std::fputc('\n', stderr);
  va_end(args);
}

}  // namespace tether::support
