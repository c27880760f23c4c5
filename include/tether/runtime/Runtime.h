/***
 * Name: tether::rt (Runtime API)
 * Purpose: Embedded garbage-collected runtime: lifecycle, heap values, evaluation and exceptions.
 * Theory of Operation:
 *   - Precise mark-sweep collector (see GC.h) over objects addressed by payload pointer.
 *   - Values returned by allocating functions are unrooted; the caller must root them
 *     before the next allocation or safepoint.
 *   - Foreign source text is a small s-expression language evaluated against a global
 *     environment. Errors inside the runtime raise foreign exceptions: the exception
 *     object is stored in the calling thread's exception slot and the C++ stack unwinds
 *     with ForeignUnwind until a try_catch boundary stops it.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "tether/runtime/TypeTag.h"
#include "tether/runtime/GCStats.h"
#include "tether/runtime/GC.h"
#include "tether/runtime/Threads.h"
#include "tether/runtime/Unwind.h"

namespace tether::rt {
    enum class Lifecycle : uint8_t {
        Uninitialized = 0,
        Running = 1,
        Exited = 2
    };

    // Returns 0 on success, 1 if the runtime is already running, 2 if it has exited.
    // Does not adopt the calling thread.
    int init();

    Lifecycle lifecycle();

    // Shut the runtime down: frees the heap and drops every global binding.
    void atexit_hook(int code);

    // Return to the Uninitialized state and drop all state. Tests only.
    void reset_for_tests();

    // Singletons
    void *nothing();

    void *box_bool(bool value);

    bool box_bool_value(void *obj);

    // Boxed numbers
    void *box_int(int64_t value);

    int64_t box_int_value(void *obj);

    void *box_float(double value);

    double box_float_value(void *obj);

    // String objects (immutable, byte strings)
    void *string_new(const char *data, std::size_t len);

    void *string_from_cstr(const char *cstr);

    std::size_t string_len(void *str);

    const char *string_data(void *str);

    // Fixed-length lists, filled with nothing
    void *list_new(std::size_t len);

    std::size_t list_len(void *list);

    void *list_get(void *list, std::size_t index);

    // Stores with the write barrier applied.
    void list_set(void *list, std::size_t index, void *value);

    TypeTag type_of(void *obj);

    // Display text of any value; exceptions render as "Type: message".
    std::string render_text(void *obj);

    // Same as render_text but returned as a new (unrooted) string object.
    void *render(void *obj);

    // Exceptions
    [[noreturn]] void raise(const char *type_name, const std::string &message);

    void *current_exception();

    void clear_exception();

    void *exception_type(void *exc);

    void *exception_message(void *exc);

    // Returns the previous setting.
    bool set_error_color(bool enabled);

    bool error_color();

    // Evaluation. All of these may raise.
    void *eval_string(std::string_view source);

    void *include_file(const std::string &path);

    void *call(void *fn, void *const *args, std::size_t nargs);

    // nullptr when unbound
    void *global_get(const std::string &name);

    void global_set(const std::string &name, void *value);

    using BuiltinFn = void *(*)(void *ctx, void **args, std::size_t nargs);

    // Bind `name` to a builtin function object that calls fn(ctx, args, nargs).
    void *register_builtin(const std::string &name, BuiltinFn fn, void *ctx);
} // namespace tether::rt
