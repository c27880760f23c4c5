/***
 * Name: tether::handle::LocalHandle
 * Purpose: Runtime ownership, thread adoption and host function thunks for local handles.
 */
#include "tether/handle/LocalHandle.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/runtime/Unwind.h"
#include "tether/support/Debug.h"
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tether::handle {

namespace detail {
struct HostFunctionRecord {
  std::string name;
  HostFunction fn;
  memory::Stack* stack;
  std::thread::id owner;
};
} // namespace detail

namespace {

void* host_function_thunk(void* ctx, void** args, std::size_t nargs) {
  auto* rec = static_cast<detail::HostFunctionRecord*>(ctx);
  if (std::this_thread::get_id() != rec->owner) {
    tether_rt_raise("HostPanic", (rec->name + " called from a thread that does not own its handle").c_str());
    return nullptr;
  }
  std::string failure;
  try {
    return memory::scope(*rec->stack, [&](memory::GcFrame& frame) -> void* {
      std::vector<Value> argv;
      argv.reserve(nargs);
      for (std::size_t i = 0; i < nargs; ++i) { argv.push_back(Value::unrooted(args[i])); } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      return rec->fn(frame, argv).get();
    });
  } catch (const rt::ForeignUnwind&) {
    throw;
  } catch (const std::exception& e) {
    failure = rec->name + ": " + e.what();
  } catch (...) {
    failure = rec->name + ": unknown host exception";
  }
  tether_rt_raise("HostPanic", failure.c_str());
  return nullptr;
}

} // namespace

LocalHandle::LocalHandle(const LocalConfig& config) : LocalHandle(config, true) {}

LocalHandle::LocalHandle(WorkerTag /*tag*/, const LocalConfig& config) : LocalHandle(config, false) {}

LocalHandle::LocalHandle(const LocalConfig& config, bool owning)
    : owning_(owning), owner_(std::this_thread::get_id()), stack_(std::make_unique<memory::Stack>(config.pageSlots)) {
  if (owning_) {
    switch (tether_rt_init()) {
      case 0: break;
      case 1: throw exceptions::InvalidHandleState("runtime is already running");
      default: throw exceptions::InvalidHandleState("runtime has already shut down");
    }
  }
  switch (tether_rt_adopt_thread()) {
    case 0: break;
    case 1:
      if (owning_) { tether_rt_atexit_hook(0); }
      throw exceptions::InvalidHandleState("thread already runs a handle");
    default: throw exceptions::InvalidHandleState("runtime is not running");
  }
  tether_rt_set_root_scanner(&memory::Stack::scan_roots, stack_.get());
  support::debug_log("handle", "local handle started owning=%d", owning_ ? 1 : 0);
}

LocalHandle::~LocalHandle() {
  if (std::this_thread::get_id() == owner_) {
    tether_rt_set_root_scanner(nullptr, nullptr);
    tether_rt_release_thread();
  } else {
    support::debug_log("handle", "local handle dropped off its owning thread");
  }
  if (owning_) { tether_rt_atexit_hook(0); }
}

void LocalHandle::check_thread() const {
  if (std::this_thread::get_id() != owner_) {
    throw exceptions::InvalidHandleState("local handle used from a thread that does not own it");
  }
}

void LocalHandle::register_function(const std::string& name, HostFunction fn) {
  check_thread();
  functions_.push_back(std::make_unique<detail::HostFunctionRecord>(detail::HostFunctionRecord{name, std::move(fn), stack_.get(), owner_}));
  tether_rt_register_builtin(name.c_str(), &host_function_thunk, functions_.back().get());
}

void LocalHandle::gc_collect(tether_gc_mode_t mode) {
  check_thread();
  tether_rt_gc_collect(mode);
}

bool LocalHandle::set_error_color(bool enabled) {
  check_thread();
  return tether_rt_set_error_color(enabled ? 1 : 0) != 0;
}

} // namespace tether::handle
