/***
 * Name: tether::support::SetThreadName
 * Purpose: Name the calling thread (Linux limits names to 15 bytes).
 */
#include "tether/support/Thread.h"

#include <cstddef>
#include <string>
#ifdef __linux__
#include <pthread.h>
#endif

namespace tether::support {

void SetThreadName(const std::string& name) {
#ifdef __linux__
  constexpr std::size_t kMaxThreadName = 15;
  const std::string shortName = name.substr(0, kMaxThreadName);
  pthread_setname_np(pthread_self(), shortName.c_str());
#else
  (void)name;
#endif
}

}  // namespace tether::support
