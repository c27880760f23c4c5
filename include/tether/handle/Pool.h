/***
 * Name: tether::handle::Pool
 * Purpose: A fixed set of worker threads, each running the runtime through its own LocalHandle.
 * Inputs: Callables F(LocalHandle&) -> T
 * Outputs: JoinHandle<T> per submitted callable
 * Theory of Operation:
 *   The pool owns the runtime. Each worker has its own FIFO queue and runs one item at a time
 *   inside a worker-form LocalHandle, so items get the full scope protocol on that worker's
 *   stack. spawn() picks the worker with the fewest queued plus running items (ties go to the
 *   lowest index). Items run inside the catch boundary: foreign exceptions resolve Exception,
 *   host exceptions resolve Panic. Dropping the pool closes the queues, lets the workers finish
 *   what is queued, joins them and shuts the runtime down.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "tether/catch/Catch.h"
#include "tether/handle/Config.h"
#include "tether/handle/JoinHandle.h"
#include "tether/handle/LocalHandle.h"
#include "tether/handle/Message.h"
#include "tether/observability/Metrics.h"
#include "tether/sync/Oneshot.h"

namespace tether::handle {

namespace detail {
class PoolState;
}

class Pool {
 public:
  using Item = std::move_only_function<void(LocalHandle&)>;

  explicit Pool(const PoolConfig& config);
  ~Pool();
  Pool(Pool&& other) noexcept;
  Pool& operator=(Pool&& other) noexcept;
  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  template <typename F>
  auto spawn(F func) -> JoinHandle<TaskValue<std::invoke_result_t<F&, LocalHandle&>>> {
    return spawn_on(least_loaded(), std::move(func));
  }

  // Throws InvalidHandleState when index is not a worker.
  template <typename F>
  auto spawn_on(std::size_t index, F func) -> JoinHandle<TaskValue<std::invoke_result_t<F&, LocalHandle&>>> {
    using T = std::invoke_result_t<F&, LocalHandle&>;
    auto [tx, rx] = sync::oneshot<CallResult<TaskValue<T>>>();
    submit(index, [func = std::move(func), tx = std::move(tx), metrics = shared_metrics()](LocalHandle& handle) mutable {
      detail::resolve(*metrics, tx, TaskResult<T>::flatten(invoke_foreign([&] { return func(handle); })));
    });
    return JoinHandle<TaskValue<T>>(std::move(rx), CancellationToken{});
  }

  std::size_t n_workers() const;

  // Queued plus running items on one worker.
  std::size_t load(std::size_t index) const;

  const obs::Metrics& metrics() const;

 private:
  std::size_t least_loaded() const;
  void submit(std::size_t index, Item item);
  std::shared_ptr<obs::Metrics> shared_metrics() const;
  void shutdown();

  std::unique_ptr<detail::PoolState> state_;
};

} // namespace tether::handle
