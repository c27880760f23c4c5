/***
 * Name: tether::handle::AsyncHandle
 * Purpose: Handle to a runtime driven by a main runtime thread and optional worker threads.
 * Inputs: Task bodies, blocking bodies, include paths, control messages
 * Outputs: Dispatch<T> objects that queue the work and hand back JoinHandles
 * Theory of Operation:
 *   Copies share one runtime. When the last copy is dropped, or close() is called, the
 *   queues close, queued messages run (or are dropped when cancelling), running tasks
 *   complete, the threads exit and the runtime shuts down.
 *
 *   - task(body): body(AsyncFrame&) -> Async<T>, a coroutine that may yield.
 *   - blocking_task(body): body(GcFrame&) -> T, runs to completion on the runtime thread.
 *   - include(path): evaluates a source file; FileReadError at once if it cannot be read.
 *   - error_color(enabled): result is the previous setting.
 *   - register_task<R>(): runs R::setup(AsyncFrame&) -> Async<void>, one-time setup such as
 *     defining globals a task type relies on.
 *   - persistent(task, capacity): starts a persistent task (see Persistent.h); the result is
 *     its PersistentHandle, or the error init raised.
 *   A body returning CallResult<U> resolves to CallResult<U>, not a nested result.
 *
 *   Dropping the last copy (or calling close()) from inside a task closes the queues and
 *   returns; the runtime finishes shutting down once that task's thread is done.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "tether/handle/Config.h"
#include "tether/handle/Dispatch.h"
#include "tether/handle/Message.h"
#include "tether/handle/Persistent.h"
#include "tether/handle/detail/AsyncState.h"
#include "tether/observability/Metrics.h"

namespace tether::handle {

class AsyncHandle {
 public:
  explicit AsyncHandle(const AsyncConfig& config);

  template <typename F>
  auto task(F body, Affinity affinity = Affinity::ToAny) -> Dispatch<TaskValue<TaskBodyValue<F>>> {
    auto [msg, join] = make_task(std::move(body), state().metrics());
    return Dispatch<TaskValue<TaskBodyValue<F>>>(shared_state(), Envelope{affinity, Message{std::move(msg)}},
                                                 std::move(join));
  }

  template <typename F>
  auto blocking_task(F body, Affinity affinity = Affinity::ToAny)
      -> Dispatch<TaskValue<std::invoke_result_t<F&, memory::GcFrame&>>> {
    auto [msg, join] = make_blocking_task(std::move(body), state().metrics());
    return Dispatch<TaskValue<std::invoke_result_t<F&, memory::GcFrame&>>>(
        shared_state(), Envelope{affinity, Message{std::move(msg)}}, std::move(join));
  }

  template <typename R>
  auto register_task(Affinity affinity = Affinity::ToAny) {
    return task([](AsyncFrame& frame) { return R::setup(frame); }, affinity);
  }

  template <typename P>
  Dispatch<PersistentHandle<P>> persistent(P body, std::size_t capacity = 0, Affinity affinity = Affinity::ToAny) {
    auto calls = std::make_shared<PersistentChannel<P>>(capacity);
    std::weak_ptr<PersistentChannel<P>> weak = calls;
    state().track_persistent(weak, [weak](bool cancel) {
      if (auto channel = weak.lock()) {
        channel->close();
        if (cancel) { channel->drain(); }
      }
    });
    auto [msg, join] = make_persistent_task(std::move(body), std::move(calls), state().metrics());
    return Dispatch<PersistentHandle<P>>(shared_state(), Envelope{affinity, Message{std::move(msg)}},
                                         std::move(join));
  }

  Dispatch<void> include(const std::string& path, Affinity affinity = Affinity::ToAny);
  Dispatch<bool> error_color(bool enabled, Affinity affinity = Affinity::ToAny);

  void close(bool cancel = false);
  bool is_closed() const;
  std::size_t n_workers() const;
  const obs::Metrics& metrics() const;

 private:
  struct Owner;

  detail::AsyncState& state() const;
  std::shared_ptr<detail::AsyncState> shared_state() const;

  std::shared_ptr<Owner> owner_;
};

} // namespace tether::handle
