/***
 * Name: tether::rt (mutator registry)
 * Purpose: Thread adoption, GC-safe/unsafe transitions, safepoints and the stop-the-world protocol.
 * Theory of Operation:
 *   All state transitions happen under g_sp_mu. A collecting thread sets g_gc_running and waits
 *   on g_sp_cv until every other adopted thread is Safe. Threads that poll a safepoint, or leave
 *   the Safe state, park on the same condition variable until the collection ends. Adoption and
 *   release also wait, so the registry is stable while roots are marked.
 */
#include "tether/runtime/Runtime.h"
#include "tether/runtime/Threads.h"
#include "tether/runtime/detail/Heap.h"
#include "tether/support/Debug.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

namespace tether::rt {
namespace detail {
namespace {
std::mutex g_sp_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::condition_variable g_sp_cv; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
bool g_gc_running = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<bool> g_gc_pending{false}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::vector<ThreadState*> g_threads; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
thread_local ThreadState t_state; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

bool others_safe(const ThreadState* self) {
  return std::all_of(g_threads.begin(), g_threads.end(),
                     [self](const ThreadState* ts) { return ts == self || ts->state == GcState::Safe; });
}

// Requires g_sp_mu held through lk.
void park(std::unique_lock<std::mutex>& lk, ThreadState* self) {
  GcState prev = GcState::Safe;
  if (self != nullptr) {
    prev = self->state;
    self->state = GcState::Safe;
    g_sp_cv.notify_all();
  }
  g_sp_cv.wait(lk, [] { return !g_gc_running; });
  if (self != nullptr) { self->state = prev; }
}

void visit_root(void* obj, void* /*visitCtx*/) { mark_object(obj); }

void unregister(ThreadState* ts) {
  if (!ts->adopted) { return; }
  std::unique_lock<std::mutex> lk(g_sp_mu);
  ts->state = GcState::Safe;
  g_sp_cv.notify_all();
  g_sp_cv.wait(lk, [] { return !g_gc_running; });
  g_threads.erase(std::remove(g_threads.begin(), g_threads.end(), ts), g_threads.end());
  ts->adopted = false;
  ts->scanner = nullptr;
  ts->scanner_ctx = nullptr;
  ts->exception = nullptr;
  ts->eval_roots.clear();
  g_sp_cv.notify_all();
  support::debug_log("runtime", "release_thread remaining=%zu", g_threads.size());
}
} // namespace

ThreadState::~ThreadState() { unregister(this); }

ThreadState& this_thread() { return t_state; }

void stop_the_world() {
  ThreadState* self = t_state.adopted ? &t_state : nullptr;
  std::unique_lock<std::mutex> lk(g_sp_mu);
  while (g_gc_running) { park(lk, self); }
  g_gc_running = true;
  g_gc_pending.store(true, std::memory_order_release);
  g_sp_cv.wait(lk, [self] { return others_safe(self); });
}

void resume_the_world() {
  {
    const std::lock_guard<std::mutex> lk(g_sp_mu);
    g_gc_running = false;
    g_gc_pending.store(false, std::memory_order_release);
  }
  g_sp_cv.notify_all();
}

void mark_thread_roots() {
  for (ThreadState* ts : g_threads) {
    mark_object(ts->exception);
    for (void* obj : ts->eval_roots) { mark_object(obj); }
    if (ts->scanner != nullptr) { ts->scanner(ts->scanner_ctx, &visit_root, nullptr); }
  }
}

void reset_threads() {
  const std::lock_guard<std::mutex> lk(g_sp_mu);
  for (ThreadState* ts : g_threads) {
    ts->adopted = false;
    ts->scanner = nullptr;
    ts->scanner_ctx = nullptr;
    ts->exception = nullptr;
    ts->eval_roots.clear();
  }
  g_threads.clear();
  t_state.exception = nullptr;
  t_state.eval_roots.clear();
  g_gc_running = false;
  g_gc_pending.store(false, std::memory_order_release);
  g_sp_cv.notify_all();
}

} // namespace detail

int adopt_thread() {
  if (lifecycle() != Lifecycle::Running) { return 2; }
  detail::ThreadState& ts = detail::t_state;
  if (ts.adopted) { return 1; }
  std::unique_lock<std::mutex> lk(detail::g_sp_mu);
  detail::g_sp_cv.wait(lk, [] { return !detail::g_gc_running; });
  ts.adopted = true;
  ts.state = GcState::Unsafe;
  detail::g_threads.push_back(&ts);
  support::debug_log("runtime", "adopt_thread count=%zu", detail::g_threads.size());
  return 0;
}

void release_thread() { detail::unregister(&detail::t_state); }

bool is_adopted() { return detail::t_state.adopted; }

void set_root_scanner(RootScanner scanner, void* ctx) {
  detail::ThreadState& ts = detail::t_state;
  std::unique_lock<std::mutex> lk(detail::g_sp_mu);
  // An Unsafe mutator cannot be scanned right now; anyone else may be.
  if (!ts.adopted || ts.state == GcState::Safe) {
    detail::g_sp_cv.wait(lk, [] { return !detail::g_gc_running; });
  }
  ts.scanner = scanner;
  ts.scanner_ctx = ctx;
}

GcState gc_safe_enter() {
  detail::ThreadState& ts = detail::t_state;
  if (!ts.adopted) { return GcState::Safe; }
  const std::lock_guard<std::mutex> lk(detail::g_sp_mu);
  const GcState prev = ts.state;
  ts.state = GcState::Safe;
  detail::g_sp_cv.notify_all();
  return prev;
}

void gc_safe_leave(GcState previous) {
  detail::ThreadState& ts = detail::t_state;
  if (!ts.adopted) { return; }
  std::unique_lock<std::mutex> lk(detail::g_sp_mu);
  if (previous == GcState::Unsafe) {
    detail::g_sp_cv.wait(lk, [] { return !detail::g_gc_running; });
  }
  ts.state = previous;
}

GcState gc_unsafe_enter() {
  detail::ThreadState& ts = detail::t_state;
  if (!ts.adopted) { return GcState::Safe; }
  std::unique_lock<std::mutex> lk(detail::g_sp_mu);
  const GcState prev = ts.state;
  detail::g_sp_cv.wait(lk, [] { return !detail::g_gc_running; });
  ts.state = GcState::Unsafe;
  return prev;
}

void gc_unsafe_leave(GcState previous) {
  detail::ThreadState& ts = detail::t_state;
  if (!ts.adopted) { return; }
  const std::lock_guard<std::mutex> lk(detail::g_sp_mu);
  ts.state = previous;
  if (previous == GcState::Safe) { detail::g_sp_cv.notify_all(); }
}

GcState gc_state() { return detail::t_state.state; }

void safepoint() {
  if (!detail::g_gc_pending.load(std::memory_order_acquire)) { return; }
  detail::ThreadState& ts = detail::t_state;
  if (!ts.adopted || ts.state == GcState::Safe) { return; }
  std::unique_lock<std::mutex> lk(detail::g_sp_mu);
  if (!detail::g_gc_running) { return; }
  detail::park(lk, &ts);
}

std::size_t n_threads() {
  const std::lock_guard<std::mutex> lk(detail::g_sp_mu);
  return detail::g_threads.size();
}

} // namespace tether::rt
