/***
 * Name: tether::sync::GcSafeRegion
 * Purpose: Scoped GC-safe state over the runtime's transition calls.
 */
#include "tether/sync/GcSafe.h"
#include "tether/runtime/c_api.h"

namespace tether::sync {

GcSafeRegion::GcSafeRegion() noexcept : previous_(tether_rt_gc_safe_enter()) {}

GcSafeRegion::~GcSafeRegion() { tether_rt_gc_safe_leave(previous_); }

} // namespace tether::sync
