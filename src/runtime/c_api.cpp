/***
 * Name: tether runtime C API (impl)
 * Purpose: extern "C" entry points over tether::rt for the binding layer and other embedders.
 */
#include "tether/runtime/c_api.h"
#include "tether/runtime/Runtime.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

using namespace tether::rt;

extern "C" int tether_rt_init(void) { return init(); }
extern "C" int tether_rt_is_initialized(void) { return lifecycle() == Lifecycle::Running ? 1 : 0; }
extern "C" void tether_rt_atexit_hook(int code) { atexit_hook(code); }

extern "C" int tether_rt_adopt_thread(void) { return adopt_thread(); }
extern "C" void tether_rt_release_thread(void) { release_thread(); }
extern "C" int tether_rt_is_adopted(void) { return is_adopted() ? 1 : 0; }
extern "C" void tether_rt_set_root_scanner(tether_root_scanner_t scanner, void* ctx) { set_root_scanner(scanner, ctx); }
extern "C" int8_t tether_rt_gc_safe_enter(void) { return static_cast<int8_t>(gc_safe_enter()); }
extern "C" void tether_rt_gc_safe_leave(int8_t state) { gc_safe_leave(static_cast<GcState>(state)); }
extern "C" int8_t tether_rt_gc_unsafe_enter(void) { return static_cast<int8_t>(gc_unsafe_enter()); }
extern "C" void tether_rt_gc_unsafe_leave(int8_t state) { gc_unsafe_leave(static_cast<GcState>(state)); }
extern "C" void tether_rt_safepoint(void) { safepoint(); }

extern "C" void tether_rt_gc_collect(tether_gc_mode_t mode) { gc_collect(static_cast<GcMode>(mode)); }
extern "C" int tether_rt_gc_enable(int enabled) { return gc_enable(enabled != 0) ? 1 : 0; }
extern "C" int tether_rt_gc_is_enabled(void) { return gc_is_enabled() ? 1 : 0; }
extern "C" void tether_rt_gc_wb(void* owner, void* child) { gc_write_barrier(owner, child); }
extern "C" void tether_rt_gc_set_threshold(size_t bytes) { gc_set_threshold(bytes); }
extern "C" tether_gc_stats_t tether_rt_gc_stats(void) {
  const RuntimeStats st = gc_stats();
  return tether_gc_stats_t{st.numAllocated, st.numFreed, st.numCollections,
                           st.bytesAllocated, st.bytesLive, st.peakBytesLive};
}

// Foreign exceptions stop here; host exceptions are the trampoline's to capture and report.
extern "C" tether_catch_t tether_rt_try_catch(void* callback, tether_trampoline_t trampoline, void* result) {
  tether_catch_t out{TETHER_CATCH_OK, nullptr};
  try {
    if (trampoline(callback, result) != 0) { out.tag = TETHER_CATCH_PANIC; }
  } catch (const ForeignUnwind&) {
    out.tag = TETHER_CATCH_EXCEPTION;
    out.error = current_exception();
  }
  return out;
}
extern "C" void tether_rt_raise(const char* type_name, const char* message) {
  raise(type_name, message != nullptr ? std::string(message) : std::string());
}
extern "C" void* tether_rt_current_exception(void) { return current_exception(); }
extern "C" void tether_rt_clear_exception(void) { clear_exception(); }
extern "C" int tether_rt_set_error_color(int enabled) { return set_error_color(enabled != 0) ? 1 : 0; }

extern "C" uint32_t tether_rt_typeof(void* obj) { return static_cast<uint32_t>(type_of(obj)); }
extern "C" void* tether_rt_nothing(void) { return nothing(); }
extern "C" void* tether_rt_box_int(int64_t v) { return box_int(v); }
extern "C" int64_t tether_rt_unbox_int(void* obj) { return box_int_value(obj); }
extern "C" void* tether_rt_box_float(double v) { return box_float(v); }
extern "C" double tether_rt_unbox_float(void* obj) { return box_float_value(obj); }
extern "C" void* tether_rt_box_bool(int v) { return box_bool(v != 0); }
extern "C" int tether_rt_unbox_bool(void* obj) { return box_bool_value(obj) ? 1 : 0; }
extern "C" void* tether_rt_string_new(const char* data, size_t len) { return string_new(data, len); }
extern "C" const char* tether_rt_string_data(void* str) { return string_data(str); }
extern "C" size_t tether_rt_string_len(void* str) { return string_len(str); }
extern "C" void* tether_rt_list_new(size_t len) { return list_new(len); }
extern "C" size_t tether_rt_list_len(void* list) { return list_len(list); }
extern "C" void* tether_rt_list_get(void* list, size_t index) { return list_get(list, index); }
extern "C" void tether_rt_list_set(void* list, size_t index, void* value) { list_set(list, index, value); }
extern "C" void* tether_rt_render(void* obj) { return render(obj); }

extern "C" void* tether_rt_eval_string(const char* source, size_t len) { return eval_string(std::string_view(source, len)); }
extern "C" void* tether_rt_include(const char* path) { return include_file(path); }
extern "C" void* tether_rt_call(void* fn, void** args, size_t nargs) { return call(fn, args, nargs); }
extern "C" void* tether_rt_global_get(const char* name) { return global_get(name); }
extern "C" void tether_rt_global_set(const char* name, void* value) { global_set(name, value); }
extern "C" void* tether_rt_register_builtin(const char* name, tether_builtin_t fn, void* ctx) {
  return register_builtin(name, fn, ctx);
}
