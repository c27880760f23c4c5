/***
 * Name: tether::handle::AsyncHandle, detail::AsyncState
 * Purpose: Runtime threads of the async handle and their cooperative task scheduler.
 * Theory of Operation:
 *   Each runtime thread owns max_concurrent_tasks task slots, each with its own Stack. The
 *   thread's root scanner enumerates all slot stacks. A thread takes a new message only
 *   while a slot is free: it blocks on its queue when no task is suspended and polls without
 *   blocking otherwise. After every poll it resumes each suspended task once. The loop ends
 *   when the queue is closed and drained and no task is left.
 */
#include "tether/handle/AsyncHandle.h"
#include "tether/exceptions/file_read_error.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Stack.h"
#include "tether/memory/Value.h"
#include "tether/runtime/c_api.h"
#include "tether/support/Debug.h"
#include "tether/support/fs.h"
#include "tether/support/Thread.h"
#include "tether/sync/GcSafe.h"
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace tether::handle {

namespace {

template <typename... Fs>
struct Overloaded : Fs... {
  using Fs::operator()...;
};

class TaskSlot {
 public:
  explicit TaskSlot(std::size_t pageSlots) : stack_(pageSlots) {}

  bool busy() const noexcept { return task_.has_value(); }
  memory::Stack& stack() noexcept { return stack_; }

  void start(std::move_only_function<Async<void>(AsyncFrame&)>& body, const CancellationToken& token) {
    frame_.emplace(stack_, token);
    task_.emplace(body(*frame_));
    frame_->set_resume_point(task_->handle());
    resume();
  }

  void resume() {
    if (!task_) { return; }
    frame_->resume_point().resume();
    if (task_->done()) { finish(); }
  }

 private:
  void finish() {
    if (task_->handle().promise().error) {
      try {
        std::rethrow_exception(task_->handle().promise().error);
      } catch (const std::exception& e) {
        support::debug_log("async", "task wrapper failed: %s", e.what());
      }
    }
    task_.reset();
    frame_.reset();
  }

  memory::Stack stack_;
  std::optional<AsyncFrame> frame_;
  std::optional<Async<void>> task_;
};

struct ThreadSlots {
  std::vector<std::unique_ptr<TaskSlot>> slots;

  static void scan(void* ctx, tether_root_visitor_t visit, void* visitCtx) {
    for (const auto& slot : static_cast<ThreadSlots*>(ctx)->slots) { slot->stack().scan(visit, visitCtx); }
  }

  TaskSlot* free_slot() const {
    for (const auto& slot : slots) {
      if (!slot->busy()) { return slot.get(); }
    }
    return nullptr;
  }

  bool any_busy() const {
    for (const auto& slot : slots) {
      if (slot->busy()) { return true; }
    }
    return false;
  }
};

void execute(TaskSlot& slot, Envelope& envelope, obs::Metrics& metrics) {
  std::visit(
      Overloaded{
          [&](TaskMessage& msg) { slot.start(msg.start, msg.token); },
          [&](PersistentMessage& msg) { slot.start(msg.start, msg.token); },
          [&](BlockingTaskMessage& msg) { memory::scope(slot.stack(), [&](memory::GcFrame& frame) { msg.run(frame); }); },
          [&](IncludeMessage& msg) {
            memory::scope(slot.stack(), [&](memory::GcFrame& frame) {
              CallResult<Value> included = Value::include(frame, msg.path);
              CallResult<void> out;
              if (!included) { out = std::unexpected(std::move(included.error())); }
              detail::resolve(metrics, msg.result, std::move(out));
            });
          },
          [&](ErrorColorMessage& msg) {
            const bool previous = tether_rt_set_error_color(msg.enabled ? 1 : 0) != 0;
            detail::resolve(metrics, msg.result, CallResult<bool>(previous));
          },
      },
      envelope.message);
}

void run_loop(sync::Channel<Envelope>& queue, const AsyncConfig& config, obs::Metrics& metrics) {
  ThreadSlots slots;
  for (std::size_t i = 0; i < config.maxConcurrentTasks; ++i) {
    slots.slots.push_back(std::make_unique<TaskSlot>(config.pageSlots));
  }
  tether_rt_set_root_scanner(&ThreadSlots::scan, &slots);
  bool open = true;
  while (open || slots.any_busy()) {
    TaskSlot* slot = open ? slots.free_slot() : nullptr;
    if (slot != nullptr) {
      Envelope envelope;
      const sync::ChannelStatus status = slots.any_busy() ? queue.try_recv(envelope) : queue.recv(envelope);
      if (status == sync::ChannelStatus::Ok) {
        execute(*slot, envelope, metrics);
      } else if (status == sync::ChannelStatus::Closed) {
        open = false;
      } else {
        std::this_thread::yield();
      }
    }
    for (const auto& s : slots.slots) { s->resume(); }
  }
  tether_rt_set_root_scanner(nullptr, nullptr);
}

} // namespace

namespace detail {

AsyncState::AsyncState(AsyncConfig config)
    : config_(std::move(config)),
      mainQueue_(config_.channelCapacity),
      workerQueue_(config_.channelCapacity),
      metrics_(std::make_shared<obs::Metrics>()) {}

AsyncState::~AsyncState() { shutdown(false); }

void AsyncState::start() {
  mainThread_ = std::thread([this] { run_main(); });
  std::unique_lock<std::mutex> lk(startupMu_);
  startupCv_.wait(lk, [this] { return startupDone_; });
  if (startupCode_ != 0) {
    lk.unlock();
    mainThread_.join();
    closed_.store(true, std::memory_order_release);
    closing_ = true;
    joined_ = true;
    throw exceptions::InvalidHandleState(startupCode_ == 1 ? "runtime is already running"
                                                           : "runtime has already shut down");
  }
  lk.unlock();
  for (std::size_t i = 0; i < config_.nWorkers; ++i) {
    workers_.emplace_back([this, i] { run_worker(i); });
  }
  support::debug_log("async", "started workers=%zu capacity=%zu", config_.nWorkers, config_.channelCapacity);
}

void AsyncState::run_main() {
  support::SetThreadName(config_.threadPrefix + "-main");
  const int code = tether_rt_init();
  if (code == 0) { tether_rt_adopt_thread(); }
  {
    const std::lock_guard<std::mutex> lk(startupMu_);
    startupCode_ = code;
    startupDone_ = true;
  }
  startupCv_.notify_all();
  if (code != 0) { return; }
  run_loop(mainQueue_, config_, *metrics_);
  tether_rt_release_thread();
  support::debug_log("async", "main runtime thread exited");
}

void AsyncState::run_worker(std::size_t index) {
  support::SetThreadName(config_.threadPrefix + "-w" + std::to_string(index));
  if (tether_rt_adopt_thread() != 0) {
    support::debug_log("async", "worker %zu could not join the runtime", index);
    return;
  }
  run_loop(workerQueue_, config_, *metrics_);
  tether_rt_release_thread();
  support::debug_log("async", "worker %zu exited", index);
}

sync::Channel<Envelope>& AsyncState::queue_for(Affinity affinity) {
  switch (affinity) {
    case Affinity::ToMain: return mainQueue_;
    case Affinity::ToWorker:
      if (config_.nWorkers == 0) { throw exceptions::InvalidHandleState("runtime has no worker threads"); }
      return workerQueue_;
    case Affinity::ToAny: break;
  }
  return config_.nWorkers > 0 ? workerQueue_ : mainQueue_;
}

bool AsyncState::on_runtime_thread() const {
  const std::thread::id self = std::this_thread::get_id();
  if (self == mainThread_.get_id()) { return true; }
  for (const std::thread& worker : workers_) {
    if (self == worker.get_id()) { return true; }
  }
  return false;
}

void AsyncState::track_persistent(std::weak_ptr<void> alive, std::function<void(bool)> close) {
  std::unique_lock<std::mutex> lk(shutdownMu_);
  if (closing_) {
    const bool cancel = cancelled_;
    lk.unlock();
    close(cancel);
    return;
  }
  std::erase_if(persistent_, [](const auto& entry) { return entry.first.expired(); });
  persistent_.emplace_back(std::move(alive), std::move(close));
}

void AsyncState::shutdown(bool cancel) {
  std::unique_lock<std::mutex> lk(shutdownMu_);
  if (closing_) {
    if (on_runtime_thread()) { return; }
    const sync::GcSafeRegion safe;
    joinedCv_.wait(lk, [this] { return joined_; });
    return;
  }
  closing_ = true;
  cancelled_ = cancel;
  closed_.store(true, std::memory_order_release);
  mainQueue_.close();
  workerQueue_.close();
  if (cancel) {
    const std::size_t dropped = mainQueue_.drain().size() + workerQueue_.drain().size();
    support::debug_log("async", "close dropped %zu queued messages", dropped);
  }
  for (auto& [alive, close] : persistent_) { close(cancel); }
  persistent_.clear();
  if (on_runtime_thread()) {
    // A runtime thread cannot join itself; a reaper thread finishes the shutdown.
    std::shared_ptr<AsyncState> self = shared_from_this();
    lk.unlock();
    support::debug_log("async", "shutdown requested from a runtime thread");
    std::thread([self] { self->join_threads(); }).detach();
    return;
  }
  lk.unlock();
  join_threads();
}

void AsyncState::join_threads() {
  {
    const sync::GcSafeRegion safe;
    for (std::thread& worker : workers_) {
      if (worker.joinable()) { worker.join(); }
    }
    if (mainThread_.joinable()) { mainThread_.join(); }
  }
  tether_rt_atexit_hook(0);
  {
    const std::lock_guard<std::mutex> lk(shutdownMu_);
    joined_ = true;
  }
  joinedCv_.notify_all();
  support::debug_log("async", "runtime shut down");
}

} // namespace detail

struct AsyncHandle::Owner {
  std::shared_ptr<detail::AsyncState> state;

  explicit Owner(std::shared_ptr<detail::AsyncState> s) : state(std::move(s)) {}
  Owner(const Owner&) = delete;
  Owner& operator=(const Owner&) = delete;
  ~Owner() { state->shutdown(false); }
};

AsyncHandle::AsyncHandle(const AsyncConfig& config) {
  auto state = std::make_shared<detail::AsyncState>(config);
  state->start();
  owner_ = std::make_shared<Owner>(std::move(state));
}

detail::AsyncState& AsyncHandle::state() const { return *owner_->state; }

std::shared_ptr<detail::AsyncState> AsyncHandle::shared_state() const { return owner_->state; }

Dispatch<void> AsyncHandle::include(const std::string& path, Affinity affinity) {
  if (!support::IsReadableFile(path)) { throw exceptions::FileReadError("cannot read include file: " + path); }
  auto [tx, rx] = sync::oneshot<CallResult<void>>();
  return Dispatch<void>(shared_state(), Envelope{affinity, Message{IncludeMessage{path, std::move(tx)}}},
                        JoinHandle<void>(std::move(rx), CancellationToken{}));
}

Dispatch<bool> AsyncHandle::error_color(bool enabled, Affinity affinity) {
  auto [tx, rx] = sync::oneshot<CallResult<bool>>();
  return Dispatch<bool>(shared_state(), Envelope{affinity, Message{ErrorColorMessage{enabled, std::move(tx)}}},
                        JoinHandle<bool>(std::move(rx), CancellationToken{}));
}

void AsyncHandle::close(bool cancel) { state().shutdown(cancel); }

bool AsyncHandle::is_closed() const { return state().is_closed(); }

std::size_t AsyncHandle::n_workers() const { return state().n_workers(); }

const obs::Metrics& AsyncHandle::metrics() const { return *state().metrics(); }

} // namespace tether::handle
