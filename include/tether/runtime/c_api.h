// tether runtime C API for embedders (C-compatible)
#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    TETHER_GC_AUTO = 0,
    TETHER_GC_FULL = 1,
    TETHER_GC_INCREMENTAL = 2
} tether_gc_mode_t;

typedef enum {
    TETHER_CATCH_OK = 0,
    TETHER_CATCH_EXCEPTION = 1,
    TETHER_CATCH_PANIC = 2
} tether_catch_tag_t;

// error is the exception object for TETHER_CATCH_EXCEPTION, NULL otherwise.
typedef struct {
    tether_catch_tag_t tag;
    void* error;
} tether_catch_t;

// Returns 0 on success; any other value reports a host panic captured by the callback.
typedef int (*tether_trampoline_t)(void* callback, void* result);

typedef void (*tether_root_visitor_t)(void* object, void* visit_ctx);
typedef void (*tether_root_scanner_t)(void* ctx, tether_root_visitor_t visit, void* visit_ctx);
typedef void* (*tether_builtin_t)(void* ctx, void** args, size_t nargs);

typedef struct {
    uint64_t num_allocated;
    uint64_t num_freed;
    uint64_t num_collections;
    uint64_t bytes_allocated;
    uint64_t bytes_live;
    uint64_t peak_bytes_live;
} tether_gc_stats_t;

// Lifecycle: 0 on success, 1 already running, 2 exited
int tether_rt_init(void);
int tether_rt_is_initialized(void);
void tether_rt_atexit_hook(int code);

// Threads and GC states
int tether_rt_adopt_thread(void);
void tether_rt_release_thread(void);
int tether_rt_is_adopted(void);
void tether_rt_set_root_scanner(tether_root_scanner_t scanner, void* ctx);
int8_t tether_rt_gc_safe_enter(void);
void tether_rt_gc_safe_leave(int8_t state);
int8_t tether_rt_gc_unsafe_enter(void);
void tether_rt_gc_unsafe_leave(int8_t state);
void tether_rt_safepoint(void);

// GC controls
void tether_rt_gc_collect(tether_gc_mode_t mode);
int tether_rt_gc_enable(int enabled);
int tether_rt_gc_is_enabled(void);
void tether_rt_gc_wb(void* owner, void* child);
void tether_rt_gc_set_threshold(size_t bytes);
tether_gc_stats_t tether_rt_gc_stats(void);

// Exceptions
tether_catch_t tether_rt_try_catch(void* callback, tether_trampoline_t trampoline, void* result);
void tether_rt_raise(const char* type_name, const char* message);
void* tether_rt_current_exception(void);
void tether_rt_clear_exception(void);
int tether_rt_set_error_color(int enabled);

// Values
uint32_t tether_rt_typeof(void* obj);
void* tether_rt_nothing(void);
void* tether_rt_box_int(int64_t v);
int64_t tether_rt_unbox_int(void* obj);
void* tether_rt_box_float(double v);
double tether_rt_unbox_float(void* obj);
void* tether_rt_box_bool(int v);
int tether_rt_unbox_bool(void* obj);
void* tether_rt_string_new(const char* data, size_t len);
const char* tether_rt_string_data(void* str);
size_t tether_rt_string_len(void* str);
void* tether_rt_list_new(size_t len);
size_t tether_rt_list_len(void* list);
void* tether_rt_list_get(void* list, size_t index);
void tether_rt_list_set(void* list, size_t index, void* value);
void* tether_rt_render(void* obj);

// Evaluation and globals
void* tether_rt_eval_string(const char* source, size_t len);
void* tether_rt_include(const char* path);
void* tether_rt_call(void* fn, void** args, size_t nargs);
void* tether_rt_global_get(const char* name);
void tether_rt_global_set(const char* name, void* value);
void* tether_rt_register_builtin(const char* name, tether_builtin_t fn, void* ctx);

#ifdef __cplusplus
}
#endif
