/***
 * Name: tether::rt::detail (heap internals)
 * Purpose: Object layout and the cross-file hooks shared by the runtime sources.
 * Theory of Operation:
 *   Every object is an ObjectHeader followed by a payload; handles point at the payload.
 *   Heap.cpp owns allocation and collection, Threads.cpp owns the mutator registry and
 *   the stop-the-world protocol, Eval.cpp owns the global environment.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "tether/runtime/Threads.h"
#include "tether/runtime/TypeTag.h"

namespace tether::rt::detail {

struct ObjectHeader {
  uint32_t mark{0};
  uint32_t tag{0};
  std::size_t size{0}; // total allocation size including header
  uint8_t gen{0};      // 0 = young, 1 = old
  uint8_t age{0};      // survival count in young gen
  uint16_t pad{0};
  ObjectHeader* next{nullptr};
};

struct StringPayload { std::size_t len{}; /* char data[] follows */ };
struct ListPayload { std::size_t len{}; /* void* items[] follow */ };
struct ExceptionPayload { void* type{nullptr}; void* message{nullptr}; };
struct CallablePayload { std::size_t index{}; };

inline ObjectHeader* header_of(void* obj) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return reinterpret_cast<ObjectHeader*>(static_cast<unsigned char*>(obj) - sizeof(ObjectHeader));
}

inline void** list_items(void* list) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return reinterpret_cast<void**>(static_cast<ListPayload*>(list) + 1);
}

// Allocate a zeroed payload. Polls for safepoints and may run a collection first.
void* alloc_object(std::size_t payload_size, TypeTag tag);

// Push an object onto the mark worklist (no-op for nullptr).
void mark_object(void* obj);

void free_all_objects();

// Per-thread mutator state. Lives in thread-local storage for the whole thread lifetime.
struct ThreadState {
  bool adopted{false};
  GcState state{GcState::Safe};
  RootScanner scanner{nullptr};
  void* scanner_ctx{nullptr};
  void* exception{nullptr};
  std::vector<void*> eval_roots;
  ~ThreadState();
};

ThreadState& this_thread();

// Stop-the-world bracket used by collections. Blocks until every other adopted thread is
// GC-safe; the caller's own state is left untouched.
void stop_the_world();
void resume_the_world();

// Mark every thread's exception slot, evaluation roots and host scanner.
void mark_thread_roots();

// Mark globals and singletons.
void mark_runtime_roots();

void reset_threads();
void reset_eval();
void init_eval();

// Nothing/true/false singletons (Objects.cpp)
void init_singletons();
void mark_singletons();
void reset_singletons();

// Display name of a Function or Builtin object (Eval.cpp)
std::string callable_name(void* obj);

// Scoped evaluation roots on the current thread: everything pushed after construction is
// released on destruction.
class RootMark {
 public:
  RootMark() : roots_(this_thread().eval_roots), base_(roots_.size()) {}
  ~RootMark() { roots_.resize(base_); }
  RootMark(const RootMark&) = delete;
  RootMark& operator=(const RootMark&) = delete;

  std::size_t push(void* obj) { roots_.push_back(obj); return roots_.size() - 1; }
  void* get(std::size_t idx) const { return roots_[idx]; }
  void set(std::size_t idx, void* obj) { roots_[idx] = obj; }

 private:
  std::vector<void*>& roots_;
  std::size_t base_;
};

} // namespace tether::rt::detail
