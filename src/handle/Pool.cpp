/***
 * Name: tether::handle::Pool
 * Purpose: Worker threads, per-worker queues and load tracking for the handle pool.
 */
#include "tether/handle/Pool.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/exceptions/tether_exception.h"
#include "tether/runtime/c_api.h"
#include "tether/support/Debug.h"
#include "tether/support/Thread.h"
#include "tether/sync/Channel.h"
#include "tether/sync/GcSafe.h"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tether::handle {

namespace detail {

struct PoolWorker {
  explicit PoolWorker(std::size_t capacity) : queue(capacity) {}

  sync::Channel<Pool::Item> queue;
  std::atomic<std::size_t> load{0};
  std::thread thread;
};

class PoolState {
 public:
  explicit PoolState(PoolConfig cfg) : config(std::move(cfg)), metrics(std::make_shared<obs::Metrics>()) {}

  PoolConfig config;
  std::shared_ptr<obs::Metrics> metrics;
  std::vector<std::unique_ptr<PoolWorker>> workers;
};

} // namespace detail

namespace {

void run_worker(detail::PoolWorker& worker, const PoolConfig& config, std::size_t index) {
  support::SetThreadName(config.threadPrefix + "-" + std::to_string(index));
  try {
    LocalHandle handle(LocalHandle::WorkerTag{}, LocalConfig{config.pageSlots});
    Pool::Item item;
    while (worker.queue.recv(item) == sync::ChannelStatus::Ok) {
      item(handle);
      item = nullptr;
      worker.load.fetch_sub(1, std::memory_order_acq_rel);
    }
  } catch (const exceptions::TetherException& e) {
    support::debug_log("pool", "worker %zu stopped: %s", index, e.what());
    worker.queue.close();
    const std::size_t dropped = worker.queue.drain().size();
    worker.load.fetch_sub(dropped, std::memory_order_acq_rel);
  }
  support::debug_log("pool", "worker %zu exited", index);
}

} // namespace

Pool::Pool(const PoolConfig& config) : state_(std::make_unique<detail::PoolState>(config)) {
  switch (tether_rt_init()) {
    case 0: break;
    case 1: throw exceptions::InvalidHandleState("runtime is already running");
    default: throw exceptions::InvalidHandleState("runtime has already shut down");
  }
  for (std::size_t i = 0; i < config.nWorkers; ++i) {
    state_->workers.push_back(std::make_unique<detail::PoolWorker>(config.channelCapacity));
  }
  const detail::PoolState* state = state_.get();
  for (std::size_t i = 0; i < config.nWorkers; ++i) {
    detail::PoolWorker& worker = *state_->workers[i];
    worker.thread = std::thread([&worker, state, i] { run_worker(worker, state->config, i); });
  }
  support::debug_log("pool", "started workers=%zu", config.nWorkers);
}

Pool::~Pool() { shutdown(); }

Pool::Pool(Pool&& other) noexcept = default;

Pool& Pool::operator=(Pool&& other) noexcept {
  if (this != &other) {
    shutdown();
    state_ = std::move(other.state_);
  }
  return *this;
}

void Pool::shutdown() {
  if (!state_) { return; }
  for (const auto& worker : state_->workers) { worker->queue.close(); }
  {
    const sync::GcSafeRegion safe;
    for (const auto& worker : state_->workers) {
      if (worker->thread.joinable()) { worker->thread.join(); }
    }
  }
  tether_rt_atexit_hook(0);
  support::debug_log("pool", "shut down");
  state_.reset();
}

std::size_t Pool::n_workers() const { return state_->workers.size(); }

std::size_t Pool::load(std::size_t index) const {
  if (index >= state_->workers.size()) {
    throw exceptions::InvalidHandleState("pool has no worker " + std::to_string(index));
  }
  return state_->workers[index]->load.load(std::memory_order_acquire);
}

const obs::Metrics& Pool::metrics() const { return *state_->metrics; }

std::shared_ptr<obs::Metrics> Pool::shared_metrics() const { return state_->metrics; }

std::size_t Pool::least_loaded() const {
  std::size_t best = 0;
  std::size_t bestLoad = load(0);
  for (std::size_t i = 1; i < state_->workers.size(); ++i) {
    const std::size_t current = load(i);
    if (current < bestLoad) {
      best = i;
      bestLoad = current;
    }
  }
  return best;
}

void Pool::submit(std::size_t index, Item item) {
  if (index >= state_->workers.size()) {
    throw exceptions::InvalidHandleState("pool has no worker " + std::to_string(index));
  }
  detail::PoolWorker& worker = *state_->workers[index];
  worker.load.fetch_add(1, std::memory_order_acq_rel);
  if (worker.queue.send(item) != sync::ChannelStatus::Ok) {
    worker.load.fetch_sub(1, std::memory_order_acq_rel);
    support::debug_log("pool", "worker %zu is closed; item dropped", index);
    return;
  }
  state_->metrics->incCounter(obs::kTasksDispatched);
}

} // namespace tether::handle
