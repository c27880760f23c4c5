/***
 * Name: tether::handle::LocalHandle
 * Purpose: Single-thread handle: the calling thread becomes the runtime's mutator.
 * Inputs: LocalConfig
 * Outputs: Scopes on the handle's shadow stack; host functions callable from foreign code
 * Theory of Operation:
 *   The owning form initializes the runtime and shuts it down when dropped. The worker form
 *   (used by Pool) joins a runtime that is already running and leaves it running.
 *   Either form adopts the constructing thread and registers its stack as that thread's
 *   roots. Every operation checks that it runs on the owning thread and throws
 *   InvalidHandleState otherwise. A handle is neither copyable nor movable; the Stack is
 *   heap-allocated so frames and the registered scanner can point at it.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "tether/handle/Config.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Stack.h"
#include "tether/memory/Value.h"
#include "tether/runtime/c_api.h"

namespace tether::handle {

// Host function callable from foreign code. Args are rooted by the caller for the duration of
// the call; the frame is a fresh scope on the registering handle's stack.
using HostFunction = std::function<Value(memory::GcFrame& frame, std::span<const Value> args)>;

namespace detail {
struct HostFunctionRecord;
}

class LocalHandle {
 public:
  struct WorkerTag {};

  explicit LocalHandle(const LocalConfig& config);
  LocalHandle(WorkerTag, const LocalConfig& config);
  ~LocalHandle();
  LocalHandle(const LocalHandle&) = delete;
  LocalHandle& operator=(const LocalHandle&) = delete;
  LocalHandle(LocalHandle&&) = delete;
  LocalHandle& operator=(LocalHandle&&) = delete;

  template <typename F>
  auto scope(F&& func) {
    check_thread();
    return memory::scope(*stack_, std::forward<F>(func));
  }

  template <std::size_t N, typename F>
  auto local_scope(F&& func) {
    check_thread();
    return memory::local_scope<N>(*stack_, std::forward<F>(func));
  }

  template <typename F>
  auto unsized_local_scope(std::size_t size, F&& func) {
    check_thread();
    return memory::unsized_local_scope(*stack_, size, std::forward<F>(func));
  }

  // Bind `name` in the global environment to a builtin that runs fn on this thread. Host
  // exceptions escaping fn become foreign HostPanic exceptions.
  void register_function(const std::string& name, HostFunction fn);

  void gc_collect(tether_gc_mode_t mode = TETHER_GC_FULL);

  // Returns the previous setting.
  bool set_error_color(bool enabled);

  bool owns_runtime() const noexcept { return owning_; }
  std::thread::id owner() const noexcept { return owner_; }
  memory::Stack& stack() noexcept { return *stack_; }

 private:
  LocalHandle(const LocalConfig& config, bool owning);
  void check_thread() const;

  bool owning_;
  std::thread::id owner_;
  std::unique_ptr<memory::Stack> stack_;
  std::vector<std::unique_ptr<detail::HostFunctionRecord>> functions_;
};

} // namespace tether::handle
