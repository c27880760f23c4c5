/***
 * Name: tether::rt (heap and collector)
 * Purpose: Object allocation, segregated free lists, stop-the-world generational mark-sweep.
 */
#include "tether/runtime/GC.h"
#include "tether/runtime/Runtime.h"
#include "tether/runtime/detail/Heap.h"
#include "tether/support/Debug.h"
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <new>
#include <vector>

namespace tether::rt {
namespace detail {
namespace {
constexpr uint64_t kDefaultThresholdBytes = 1ULL << 20U;
constexpr uint8_t kPromoteAge = 1;
constexpr std::size_t kClassSizes[] = { 64, 96, 128, 256, 512, 1024 };
constexpr int kNumClasses = static_cast<int>(sizeof(kClassSizes) / sizeof(kClassSizes[0]));

std::mutex g_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
ObjectHeader* g_head = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::size_t g_object_count = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
uint64_t g_threshold = kDefaultThresholdBytes; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
uint64_t g_trigger = kDefaultThresholdBytes; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
RuntimeStats g_stats; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<bool> g_enabled{true}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::mutex g_rem_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::vector<void*> g_remembered; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::vector<ObjectHeader*> g_free_lists[kNumClasses]; // NOLINT
std::vector<ObjectHeader*> g_mark_stack; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
bool g_young_only = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

int class_index_for(std::size_t total) {
  for (int i = 0; i < kNumClasses; ++i) { if (total <= kClassSizes[i]) return i; }
  return -1;
}

void* payload_of(ObjectHeader* header) {
  return reinterpret_cast<unsigned char*>(header) + sizeof(ObjectHeader); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

// Requires g_mu.
ObjectHeader* alloc_raw(std::size_t payload_size, TypeTag tag) {
  std::size_t total = sizeof(ObjectHeader) + payload_size;
  const int ci = class_index_for(total);
  unsigned char* mem = nullptr;
  if (ci >= 0) {
    total = kClassSizes[ci];
    if (!g_free_lists[ci].empty()) {
      mem = reinterpret_cast<unsigned char*>(g_free_lists[ci].back()); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      g_free_lists[ci].pop_back();
    }
  }
  if (mem == nullptr) { mem = static_cast<unsigned char*>(::operator new(total)); }
  std::memset(mem, 0, total);
  auto* header = new (mem) ObjectHeader{};
  header->tag = static_cast<uint32_t>(tag);
  header->size = total;
  header->next = g_head;
  g_head = header;
  ++g_object_count;
  g_stats.numAllocated++;
  g_stats.bytesAllocated += total;
  g_stats.bytesLive += total;
  g_stats.peakBytesLive = std::max(g_stats.peakBytesLive, g_stats.bytesLive);
  return header;
}

void free_obj(ObjectHeader* header) {
  g_stats.numFreed++;
  g_stats.bytesLive -= header->size;
  --g_object_count;
  const int ci = class_index_for(header->size);
  if (ci >= 0) {
    g_free_lists[ci].push_back(header);
  } else {
    ::operator delete(header);
  }
}

void trace_children(ObjectHeader* header) {
  void* payload = payload_of(header);
  switch (static_cast<TypeTag>(header->tag)) {
    case TypeTag::List: {
      const std::size_t len = static_cast<ListPayload*>(payload)->len;
      void** items = list_items(payload);
      for (std::size_t i = 0; i < len; ++i) { mark_object(items[i]); } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      break;
    }
    case TypeTag::Exception: {
      auto* exc = static_cast<ExceptionPayload*>(payload);
      mark_object(exc->type);
      mark_object(exc->message);
      break;
    }
    case TypeTag::Nothing:
    case TypeTag::Int:
    case TypeTag::Float:
    case TypeTag::Bool:
    case TypeTag::String:
    case TypeTag::Function:
    case TypeTag::Builtin:
      break; // no interior pointers
  }
}

void drain_mark_stack() {
  while (!g_mark_stack.empty()) {
    ObjectHeader* header = g_mark_stack.back();
    g_mark_stack.pop_back();
    trace_children(header);
  }
}

void mark_from_remembered() {
  std::vector<void*> owners;
  {
    const std::lock_guard<std::mutex> remLock(g_rem_mu);
    owners.swap(g_remembered);
  }
  for (void* owner : owners) { trace_children(header_of(owner)); }
}

// NOLINTNEXTLINE(readability-function-size)
void sweep(bool young_only) {
  ObjectHeader* prev = nullptr; ObjectHeader* cur = g_head;
  std::size_t reclaimed = 0;
  while (cur != nullptr) {
    if (young_only && cur->gen != 0U) {
      prev = cur;
      cur = cur->next;
      continue;
    }
    if (cur->mark == 0U) {
      ObjectHeader* dead = cur;
      cur = cur->next;
      if (prev != nullptr) { prev->next = cur; } else { g_head = cur; }
      reclaimed += dead->size;
      free_obj(dead);
    } else {
      // Survivor: clear mark and update generation/age
      cur->mark = 0;
      if (cur->gen == 0U) {
        if (cur->age < 2U) { cur->age += 1; }
        if (cur->age >= kPromoteAge) { cur->gen = 1; }
      }
      prev = cur;
      cur = cur->next;
    }
  }
  g_stats.lastReclaimedBytes = static_cast<uint64_t>(reclaimed);
}

// Requires g_mu and a stopped world.
void run_cycle(bool young_only) {
  g_young_only = young_only;
  g_stats.numCollections++;
  if (young_only) { g_stats.numYoungCollections++; }
  mark_runtime_roots();
  mark_thread_roots();
  if (young_only) {
    mark_from_remembered();
  } else {
    const std::lock_guard<std::mutex> remLock(g_rem_mu);
    g_remembered.clear();
  }
  drain_mark_stack();
  sweep(young_only);
  g_young_only = false;
  g_trigger = std::max<uint64_t>(g_threshold, g_stats.bytesLive * 2U);
  support::debug_log("runtime", "collect young_only=%d reclaimed=%llu live=%llu", young_only ? 1 : 0,
                     static_cast<unsigned long long>(g_stats.lastReclaimedBytes),
                     static_cast<unsigned long long>(g_stats.bytesLive));
}

struct WorldStop {
  WorldStop() { stop_the_world(); }
  ~WorldStop() { resume_the_world(); }
  WorldStop(const WorldStop&) = delete;
  WorldStop& operator=(const WorldStop&) = delete;
};
} // namespace

void mark_object(void* obj) {
  if (obj == nullptr) { return; }
  ObjectHeader* header = header_of(obj);
  if (header->mark != 0U) { return; }
  if (g_young_only && header->gen != 0U) { return; }
  header->mark = 1;
  g_mark_stack.push_back(header);
}

void* alloc_object(std::size_t payload_size, TypeTag tag) {
  safepoint();
  if (g_enabled.load(std::memory_order_relaxed)) {
    bool over = false;
    {
      const std::lock_guard<std::mutex> lock(g_mu);
      over = g_stats.bytesLive > g_trigger;
    }
    if (over) { gc_collect(GcMode::Auto); }
  }
  const std::lock_guard<std::mutex> lock(g_mu);
  return payload_of(alloc_raw(payload_size, tag));
}

void free_all_objects() {
  {
    const std::lock_guard<std::mutex> remLock(g_rem_mu);
    g_remembered.clear();
  }
  const std::lock_guard<std::mutex> lock(g_mu);
  ObjectHeader* cur = g_head; g_head = nullptr;
  while (cur != nullptr) { ObjectHeader* nextHeader = cur->next; ::operator delete(cur); cur = nextHeader; }
  for (auto& freeList : g_free_lists) {
    for (ObjectHeader* header : freeList) { ::operator delete(header); }
    freeList.clear();
  }
  g_mark_stack.clear();
  g_object_count = 0;
  g_stats = {};
  g_threshold = kDefaultThresholdBytes;
  g_trigger = kDefaultThresholdBytes;
  g_enabled.store(true, std::memory_order_relaxed);
}

} // namespace detail

void gc_collect(GcMode mode) {
  if (!detail::g_enabled.load(std::memory_order_relaxed)) { return; }
  if (lifecycle() != Lifecycle::Running) { return; }
  if (mode == GcMode::Auto) {
    const std::lock_guard<std::mutex> lock(detail::g_mu);
    if (detail::g_stats.bytesLive <= detail::g_trigger) { return; }
  }
  const detail::WorldStop stop;
  const std::lock_guard<std::mutex> lock(detail::g_mu);
  switch (mode) {
    case GcMode::Incremental:
      detail::run_cycle(true);
      break;
    case GcMode::Full:
      detail::run_cycle(false);
      break;
    case GcMode::Auto:
      // Young first; escalate when the old generation alone is over budget.
      detail::run_cycle(true);
      if (detail::g_stats.bytesLive > detail::g_threshold) { detail::run_cycle(false); }
      break;
  }
}

bool gc_enable(bool enabled) {
  return detail::g_enabled.exchange(enabled, std::memory_order_acq_rel);
}

bool gc_is_enabled() { return detail::g_enabled.load(std::memory_order_acquire); }

void gc_set_threshold(std::size_t bytes) {
  const std::lock_guard<std::mutex> lock(detail::g_mu);
  detail::g_threshold = bytes;
  detail::g_trigger = bytes;
}

std::size_t gc_threshold() {
  const std::lock_guard<std::mutex> lock(detail::g_mu);
  return static_cast<std::size_t>(detail::g_threshold);
}

void gc_write_barrier(void* owner, void* child) {
  if (owner == nullptr || child == nullptr) { return; }
  if (detail::header_of(owner)->gen == 0U || detail::header_of(child)->gen != 0U) { return; }
  const std::lock_guard<std::mutex> remLock(detail::g_rem_mu);
  detail::g_remembered.push_back(owner);
}

RuntimeStats gc_stats() {
  const std::lock_guard<std::mutex> lock(detail::g_mu);
  return detail::g_stats;
}

std::size_t gc_object_count() {
  const std::lock_guard<std::mutex> lock(detail::g_mu);
  return detail::g_object_count;
}

} // namespace tether::rt
