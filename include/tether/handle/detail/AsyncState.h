/***
 * Name: tether::handle::detail::AsyncState
 * Purpose: Queues, runtime threads and shutdown of one async runtime.
 * Theory of Operation:
 *   Two FIFO queues: the main queue, consumed only by the main runtime thread, and the worker
 *   queue, shared by the workers. ToMain goes to the main queue, ToWorker to the worker queue
 *   (an error when there are no workers), ToAny to the worker queue when workers exist and to
 *   the main queue otherwise.
 *
 *   start() spawns the main runtime thread, which initializes the runtime and reports back
 *   through a startup handshake, then spawns the workers. shutdown() closes both queues,
 *   optionally drops what is still queued, joins every thread and shuts the runtime down.
 *   Runtime threads never own the state; handles and dispatches share it. A shutdown that
 *   starts on a runtime thread hands the joins to a detached thread holding a reference.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "tether/handle/Config.h"
#include "tether/handle/Message.h"
#include "tether/observability/Metrics.h"
#include "tether/sync/Channel.h"

namespace tether::handle::detail {

class AsyncState : public std::enable_shared_from_this<AsyncState> {
 public:
  explicit AsyncState(AsyncConfig config);
  ~AsyncState();
  AsyncState(const AsyncState&) = delete;
  AsyncState& operator=(const AsyncState&) = delete;

  // Throws InvalidHandleState when the runtime cannot be initialized.
  void start();

  // Idempotent. With cancel, queued messages are dropped and resolve Closed.
  // Off the runtime threads this returns once the runtime has shut down. On a runtime
  // thread it only closes the queues; a detached reaper joins the threads afterwards.
  void shutdown(bool cancel);

  // Persistent task channels are closed on shutdown (and drained when cancelling) so their
  // tasks end. A channel tracked after shutdown began is closed at once.
  void track_persistent(std::weak_ptr<void> alive, std::function<void(bool)> close);

  // Throws InvalidHandleState for ToWorker on a runtime without workers.
  sync::Channel<Envelope>& queue_for(Affinity affinity);

  std::size_t n_workers() const noexcept { return config_.nWorkers; }
  bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }
  const std::shared_ptr<obs::Metrics>& metrics() const noexcept { return metrics_; }
  const AsyncConfig& config() const noexcept { return config_; }

 private:
  void run_main();
  void run_worker(std::size_t index);
  bool on_runtime_thread() const;
  void join_threads();

  AsyncConfig config_;
  sync::Channel<Envelope> mainQueue_;
  sync::Channel<Envelope> workerQueue_;
  std::shared_ptr<obs::Metrics> metrics_;
  std::thread mainThread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> closed_{false};

  std::mutex startupMu_;
  std::condition_variable startupCv_;
  bool startupDone_{false};
  int startupCode_{0};

  std::mutex shutdownMu_;
  std::condition_variable joinedCv_;
  bool closing_{false};
  bool cancelled_{false};
  std::vector<std::pair<std::weak_ptr<void>, std::function<void(bool)>>> persistent_;
  bool joined_{false};
};

} // namespace tether::handle::detail
