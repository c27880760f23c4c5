/***
 * Name: tether::rt (lifecycle and exceptions)
 * Purpose: Runtime init/shutdown, test reset, and the per-thread foreign exception slot.
 * Theory of Operation:
 *   The runtime moves Uninitialized -> Running -> Exited exactly once per process; only
 *   reset_for_tests() returns it to Uninitialized. raise() stores the exception object in the
 *   calling thread's slot (a root) and unwinds with ForeignUnwind.
 */
#include "tether/runtime/Runtime.h"
#include "tether/runtime/detail/Heap.h"
#include "tether/support/Debug.h"
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <string>

namespace tether::rt {
namespace {
std::mutex g_life_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<Lifecycle> g_lifecycle{Lifecycle::Uninitialized}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void apply_env_threshold() {
  const char* env = std::getenv("TETHER_GC_THRESHOLD");
  if (env == nullptr) { return; }
  char* end = nullptr;
  const unsigned long long bytes = std::strtoull(env, &end, 10);
  if (end != env && bytes > 0ULL) { gc_set_threshold(static_cast<std::size_t>(bytes)); }
}

void drop_all_state() {
  detail::reset_eval();
  detail::reset_threads();
  detail::free_all_objects();
}
} // namespace

int init() {
  const std::lock_guard<std::mutex> lock(g_life_mu);
  switch (g_lifecycle.load(std::memory_order_acquire)) {
    case Lifecycle::Running: return 1;
    case Lifecycle::Exited: return 2;
    case Lifecycle::Uninitialized: break;
  }
  apply_env_threshold();
  g_lifecycle.store(Lifecycle::Running, std::memory_order_release);
  detail::init_eval();
  support::debug_log("runtime", "init threshold=%zu", gc_threshold());
  return 0;
}

Lifecycle lifecycle() { return g_lifecycle.load(std::memory_order_acquire); }

void atexit_hook(int code) {
  const std::lock_guard<std::mutex> lock(g_life_mu);
  if (g_lifecycle.load(std::memory_order_acquire) != Lifecycle::Running) { return; }
  support::debug_log("runtime", "atexit code=%d threads=%zu", code, n_threads());
  g_lifecycle.store(Lifecycle::Exited, std::memory_order_release);
  drop_all_state();
}

void reset_for_tests() {
  const std::lock_guard<std::mutex> lock(g_life_mu);
  drop_all_state();
  g_lifecycle.store(Lifecycle::Uninitialized, std::memory_order_release);
}

void raise(const char* type_name, const std::string& message) {
  detail::ThreadState& ts = detail::this_thread();
  void* exc = detail::alloc_object(sizeof(detail::ExceptionPayload), TypeTag::Exception);
  ts.exception = exc;
  auto* payload = static_cast<detail::ExceptionPayload*>(exc);
  void* type = string_from_cstr(type_name);
  payload->type = type;
  gc_write_barrier(exc, type);
  void* msg = string_new(message.data(), message.size());
  payload->message = msg;
  gc_write_barrier(exc, msg);
  support::debug_log("runtime", "raise %s: %s", type_name, message.c_str());
  throw ForeignUnwind{};
}

void* current_exception() { return detail::this_thread().exception; }

void clear_exception() { detail::this_thread().exception = nullptr; }

} // namespace tether::rt
