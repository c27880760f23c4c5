/***
 * Name: tether::rt (evaluator)
 * Purpose: Evaluate s-expression forms against the global environment; builtin functions.
 * Theory of Operation:
 *   - Intermediate values are pushed on the thread's evaluation roots through RootMark so a
 *     collection triggered by any allocation sees them.
 *   - Local bindings (function parameters, let) live in those roots; Env maps names to indices.
 *   - Functions do not capture locals: bodies see their parameters and the globals.
 *   - Function and builtin definitions are host-side tables; heap objects carry an index.
 */
#include "tether/runtime/Runtime.h"
#include "tether/runtime/detail/Heap.h"
#include "tether/runtime/detail/Reader.h"
#include "tether/support/fs.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether::rt {
namespace detail {
namespace {
constexpr std::size_t kMaxDepth = 1000;

struct FunctionDef {
  std::string name;
  std::vector<std::string> params;
  std::vector<Form> body;
};

struct BuiltinDef {
  std::string name;
  BuiltinFn fn{nullptr};
  void* ctx{nullptr};
};

std::mutex g_eval_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::unordered_map<std::string, void*> g_globals; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::vector<std::shared_ptr<const FunctionDef>> g_functions; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::vector<std::shared_ptr<const BuiltinDef>> g_builtins; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<bool> g_error_color{false}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::size_t t_depth = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

struct Env {
  const Env* parent{nullptr};
  std::vector<std::pair<std::string_view, std::size_t>> vars; // name -> evaluation root index
};

struct DepthGuard {
  DepthGuard() {
    if (++t_depth > kMaxDepth) {
      --t_depth;
      raise("StackOverflowError", "maximum evaluation depth exceeded");
    }
  }
  ~DepthGuard() { --t_depth; }
  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;
};

std::size_t callable_index(void* obj) { return static_cast<CallablePayload*>(obj)->index; }

std::shared_ptr<const FunctionDef> function_def(void* obj) {
  const std::lock_guard<std::mutex> lock(g_eval_mu);
  return g_functions.at(callable_index(obj));
}

std::shared_ptr<const BuiltinDef> builtin_def(void* obj) {
  const std::lock_guard<std::mutex> lock(g_eval_mu);
  return g_builtins.at(callable_index(obj));
}

void* make_callable(TypeTag tag, std::size_t index) {
  void* obj = alloc_object(sizeof(CallablePayload), tag);
  static_cast<CallablePayload*>(obj)->index = index;
  return obj;
}

[[noreturn]] void arity_error(const char* name, std::size_t nargs) {
  raise("MethodError", std::string("no method matching ") + name + " with " + std::to_string(nargs) + " arguments");
}

[[noreturn]] void method_error(const char* name, void* arg) {
  raise("MethodError", std::string("no method matching ") + name + "(" + type_name(type_of(arg)) + ")");
}

bool truthy(void* v) {
  const TypeTag tag = type_of(v);
  if (tag == TypeTag::Nothing) { return false; }
  if (tag == TypeTag::Bool) { return box_bool_value(v); }
  return true;
}

// ----- numbers -----
struct Num {
  bool isFloat{false};
  int64_t i{0};
  double f{0.0};
  double asDouble() const { return isFloat ? f : static_cast<double>(i); }
};

Num to_num(void* v, const char* op) {
  switch (type_of(v)) {
    case TypeTag::Int: return Num{false, box_int_value(v), 0.0};
    case TypeTag::Float: return Num{true, 0, box_float_value(v)};
    default: method_error(op, v);
  }
}

bool is_number(void* v) {
  const TypeTag tag = type_of(v);
  return tag == TypeTag::Int || tag == TypeTag::Float;
}

void* box_num(const Num& n) { return n.isFloat ? box_float(n.f) : box_int(n.i); }

// Int arithmetic wraps modulo 2^64.
int64_t wrap_int(char op, int64_t a, int64_t b) {
  const auto x = static_cast<uint64_t>(a);
  const auto y = static_cast<uint64_t>(b);
  switch (op) {
    case '+': return static_cast<int64_t>(x + y);
    case '-': return static_cast<int64_t>(x - y);
    default: return static_cast<int64_t>(x * y);
  }
}

Num apply_op(char op, const Num& a, const Num& b) {
  if (a.isFloat || b.isFloat) {
    const double x = a.asDouble();
    const double y = b.asDouble();
    switch (op) {
      case '+': return Num{true, 0, x + y};
      case '-': return Num{true, 0, x - y};
      default: return Num{true, 0, x * y};
    }
  }
  return Num{false, wrap_int(op, a.i, b.i), 0.0};
}

void* fold_arith(char op, const char* name, void** args, std::size_t nargs) {
  if (nargs == 0U) {
    if (op == '-') { arity_error(name, nargs); }
    return box_int(op == '*' ? 1 : 0);
  }
  Num acc = to_num(args[0], name); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (op == '-' && nargs == 1U) {
    return acc.isFloat ? box_float(-acc.f) : box_int(wrap_int('-', 0, acc.i));
  }
  for (std::size_t k = 1; k < nargs; ++k) {
    acc = apply_op(op, acc, to_num(args[k], name)); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return box_num(acc);
}

bool values_equal(void* a, void* b) {
  if (a == b) { return true; }
  if (is_number(a) && is_number(b)) {
    const Num x = to_num(a, "=");
    const Num y = to_num(b, "=");
    if (!x.isFloat && !y.isFloat) { return x.i == y.i; }
    return x.asDouble() == y.asDouble();
  }
  const TypeTag ta = type_of(a);
  if (ta != type_of(b)) { return false; }
  if (ta == TypeTag::String) {
    return string_len(a) == string_len(b) && std::memcmp(string_data(a), string_data(b), string_len(a)) == 0;
  }
  if (ta == TypeTag::Bool) { return box_bool_value(a) == box_bool_value(b); }
  return ta == TypeTag::Nothing;
}

// ----- builtins -----
// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
void* bi_add(void* /*ctx*/, void** args, std::size_t nargs) { return fold_arith('+', "+", args, nargs); }
void* bi_sub(void* /*ctx*/, void** args, std::size_t nargs) { return fold_arith('-', "-", args, nargs); }
void* bi_mul(void* /*ctx*/, void** args, std::size_t nargs) { return fold_arith('*', "*", args, nargs); }

void* bi_div(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 2U) { arity_error("/", nargs); }
  const Num a = to_num(args[0], "/");
  const Num b = to_num(args[1], "/");
  if (!a.isFloat && !b.isFloat) {
    if (b.i == 0 || (b.i == -1 && a.i == std::numeric_limits<int64_t>::min())) {
      raise("DivideError", "integer division error");
    }
    return box_int(a.i / b.i);
  }
  return box_float(a.asDouble() / b.asDouble());
}

void* bi_eq(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 2U) { arity_error("=", nargs); }
  return box_bool(values_equal(args[0], args[1]));
}

void* bi_lt(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 2U) { arity_error("<", nargs); }
  const Num a = to_num(args[0], "<");
  const Num b = to_num(args[1], "<");
  if (!a.isFloat && !b.isFloat) { return box_bool(a.i < b.i); }
  return box_bool(a.asDouble() < b.asDouble());
}

void* bi_gt(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 2U) { arity_error(">", nargs); }
  const Num a = to_num(args[0], ">");
  const Num b = to_num(args[1], ">");
  if (!a.isFloat && !b.isFloat) { return box_bool(a.i > b.i); }
  return box_bool(a.asDouble() > b.asDouble());
}

void* bi_list(void* /*ctx*/, void** args, std::size_t nargs) {
  void* list = list_new(nargs);
  for (std::size_t k = 0; k < nargs; ++k) { list_set(list, k, args[k]); }
  return list;
}

void* bi_length(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 1U) { arity_error("length", nargs); }
  switch (type_of(args[0])) {
    case TypeTag::List: return box_int(static_cast<int64_t>(list_len(args[0])));
    case TypeTag::String: return box_int(static_cast<int64_t>(string_len(args[0])));
    default: method_error("length", args[0]);
  }
}

void* bi_nth(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 2U) { arity_error("nth", nargs); }
  if (type_of(args[0]) != TypeTag::List) { method_error("nth", args[0]); }
  if (type_of(args[1]) != TypeTag::Int) { method_error("nth", args[1]); }
  const int64_t idx = box_int_value(args[1]);
  const std::size_t len = list_len(args[0]);
  if (idx < 0 || static_cast<std::size_t>(idx) >= len) {
    raise("BoundsError", "attempt to access " + std::to_string(len) + "-element List at index [" +
                             std::to_string(idx) + "]");
  }
  return list_get(args[0], static_cast<std::size_t>(idx));
}

void* bi_string(void* /*ctx*/, void** args, std::size_t nargs) {
  std::string text;
  for (std::size_t k = 0; k < nargs; ++k) { text += render_text(args[k]); }
  return string_new(text.data(), text.size());
}

void* bi_error(void* /*ctx*/, void** args, std::size_t nargs) {
  std::string text;
  for (std::size_t k = 0; k < nargs; ++k) { text += render_text(args[k]); }
  raise("ErrorException", text);
}

void* bi_typeof(void* /*ctx*/, void** args, std::size_t nargs) {
  if (nargs != 1U) { arity_error("typeof", nargs); }
  return string_from_cstr(type_name(type_of(args[0])));
}

void* bi_collect(void* /*ctx*/, void** /*args*/, std::size_t /*nargs*/) {
  gc_collect(GcMode::Full);
  return nothing();
}
// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

// ----- evaluation -----
void* eval(const Form& form, const Env* env);
void* call_value(void* fn, void** args, std::size_t nargs);

void* lookup(const std::string& name, const Env* env) {
  const auto& roots = this_thread().eval_roots;
  for (const Env* scope = env; scope != nullptr; scope = scope->parent) {
    for (auto it = scope->vars.rbegin(); it != scope->vars.rend(); ++it) {
      if (it->first == name) { return roots[it->second]; }
    }
  }
  if (name == "nothing") { return nothing(); }
  if (name == "true") { return box_bool(true); }
  if (name == "false") { return box_bool(false); }
  if (void* value = global_get(name)) { return value; }
  raise("UndefVarError", name + " not defined");
}

void* eval_body(const std::vector<Form>& forms, std::size_t first, const Env* env) {
  void* result = nothing();
  for (std::size_t k = first; k < forms.size(); ++k) { result = eval(forms[k], env); }
  return result;
}

void* eval_define(const Form& form, const Env* env) {
  if (form.items.size() < 3U) { raise("SyntaxError", "define expects a name and a value"); }
  const Form& target = form.items[1];
  if (target.kind == Form::Kind::Symbol) {
    void* value = eval(form.items[2], env);
    global_set(target.text, value);
    return value;
  }
  if (target.kind != Form::Kind::List || target.items.empty()) {
    raise("SyntaxError", "define expects a symbol or (name params...)");
  }
  auto def = std::make_shared<FunctionDef>();
  for (const Form& part : target.items) {
    if (part.kind != Form::Kind::Symbol) { raise("SyntaxError", "function parameters must be symbols"); }
  }
  def->name = target.items.front().text;
  for (std::size_t k = 1; k < target.items.size(); ++k) { def->params.push_back(target.items[k].text); }
  def->body.assign(form.items.begin() + 2, form.items.end());
  std::size_t index = 0;
  {
    const std::lock_guard<std::mutex> lock(g_eval_mu);
    index = g_functions.size();
    g_functions.push_back(def);
  }
  void* fn = make_callable(TypeTag::Function, index);
  global_set(def->name, fn);
  return fn;
}

void* eval_if(const Form& form, const Env* env) {
  if (form.items.size() != 3U && form.items.size() != 4U) { raise("SyntaxError", "if expects 2 or 3 arguments"); }
  if (truthy(eval(form.items[1], env))) { return eval(form.items[2], env); }
  if (form.items.size() == 4U) { return eval(form.items[3], env); }
  return nothing();
}

void* eval_let(const Form& form, const Env* env) {
  if (form.items.size() < 2U || form.items[1].kind != Form::Kind::List) {
    raise("SyntaxError", "let expects a binding list");
  }
  RootMark mark;
  Env scope;
  scope.parent = env;
  for (const Form& binding : form.items[1].items) {
    if (binding.kind != Form::Kind::List || binding.items.size() != 2U || binding.items[0].kind != Form::Kind::Symbol) {
      raise("SyntaxError", "let binding must be (name value)");
    }
    const std::size_t idx = mark.push(eval(binding.items[1], &scope));
    scope.vars.emplace_back(binding.items[0].text, idx);
  }
  return eval_body(form.items, 2, &scope);
}

void* eval_call(const Form& form, const Env* env) {
  const DepthGuard depth;
  RootMark mark;
  const std::size_t fnIdx = mark.push(eval(form.items.front(), env));
  for (std::size_t k = 1; k < form.items.size(); ++k) { mark.push(eval(form.items[k], env)); }
  const auto& roots = this_thread().eval_roots;
  std::vector<void*> args(roots.begin() + static_cast<std::ptrdiff_t>(fnIdx + 1), roots.end());
  return call_value(mark.get(fnIdx), args.data(), args.size());
}

void* eval(const Form& form, const Env* env) {
  safepoint();
  switch (form.kind) {
    case Form::Kind::Int: return box_int(form.intValue);
    case Form::Kind::Float: return box_float(form.floatValue);
    case Form::Kind::String: return string_new(form.text.data(), form.text.size());
    case Form::Kind::Symbol: return lookup(form.text, env);
    case Form::Kind::List: break;
  }
  if (form.items.empty()) { return nothing(); }
  const Form& head = form.items.front();
  if (head.kind == Form::Kind::Symbol) {
    if (head.text == "define") { return eval_define(form, env); }
    if (head.text == "if") { return eval_if(form, env); }
    if (head.text == "begin") { return eval_body(form.items, 1, env); }
    if (head.text == "let") { return eval_let(form, env); }
  }
  return eval_call(form, env);
}

void* call_function(const FunctionDef& def, void** args, std::size_t nargs) {
  if (nargs != def.params.size()) { arity_error(def.name.c_str(), nargs); }
  const DepthGuard depth;
  RootMark mark;
  Env scope;
  for (std::size_t k = 0; k < nargs; ++k) {
    scope.vars.emplace_back(def.params[k], mark.push(args[k])); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return eval_body(def.body, 0, &scope);
}

void* call_value(void* fn, void** args, std::size_t nargs) {
  switch (type_of(fn)) {
    case TypeTag::Builtin: {
      const auto def = builtin_def(fn);
      return def->fn(def->ctx, args, nargs);
    }
    case TypeTag::Function: {
      const auto def = function_def(fn);
      return call_function(*def, args, nargs);
    }
    default:
      raise("MethodError", std::string("objects of type ") + type_name(type_of(fn)) + " are not callable");
  }
}

void register_core_builtins() {
  register_builtin("+", &bi_add, nullptr);
  register_builtin("-", &bi_sub, nullptr);
  register_builtin("*", &bi_mul, nullptr);
  register_builtin("/", &bi_div, nullptr);
  register_builtin("=", &bi_eq, nullptr);
  register_builtin("<", &bi_lt, nullptr);
  register_builtin(">", &bi_gt, nullptr);
  register_builtin("list", &bi_list, nullptr);
  register_builtin("length", &bi_length, nullptr);
  register_builtin("nth", &bi_nth, nullptr);
  register_builtin("string", &bi_string, nullptr);
  register_builtin("error", &bi_error, nullptr);
  register_builtin("typeof", &bi_typeof, nullptr);
  register_builtin("collect", &bi_collect, nullptr);
}
} // namespace

void init_eval() {
  init_singletons();
  register_core_builtins();
}

void reset_eval() {
  {
    const std::lock_guard<std::mutex> lock(g_eval_mu);
    g_globals.clear();
    g_functions.clear();
    g_builtins.clear();
  }
  reset_singletons();
  g_error_color.store(false, std::memory_order_relaxed);
}

void mark_runtime_roots() {
  mark_singletons();
  const std::lock_guard<std::mutex> lock(g_eval_mu);
  for (const auto& [name, value] : g_globals) { mark_object(value); }
}

std::string callable_name(void* obj) {
  const std::lock_guard<std::mutex> lock(g_eval_mu);
  const std::size_t idx = callable_index(obj);
  if (type_of(obj) == TypeTag::Function) {
    return idx < g_functions.size() ? g_functions[idx]->name : std::string("?");
  }
  return idx < g_builtins.size() ? g_builtins[idx]->name : std::string("?");
}

} // namespace detail

void* eval_string(std::string_view source) {
  const std::vector<detail::Form> forms = detail::read_forms(source);
  return detail::eval_body(forms, 0, nullptr);
}

void* include_file(const std::string& path) {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) { raise("SystemError", err); }
  return eval_string(text);
}

void* call(void* fn, void* const* args, std::size_t nargs) {
  detail::RootMark mark;
  mark.push(fn);
  std::vector<void*> copy(args, args + nargs); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (void* arg : copy) { mark.push(arg); }
  return detail::call_value(fn, copy.data(), copy.size());
}

void* global_get(const std::string& name) {
  const std::lock_guard<std::mutex> lock(detail::g_eval_mu);
  const auto it = detail::g_globals.find(name);
  return it == detail::g_globals.end() ? nullptr : it->second;
}

void global_set(const std::string& name, void* value) {
  const std::lock_guard<std::mutex> lock(detail::g_eval_mu);
  detail::g_globals[name] = value;
}

void* register_builtin(const std::string& name, BuiltinFn fn, void* ctx) {
  std::size_t index = 0;
  {
    const std::lock_guard<std::mutex> lock(detail::g_eval_mu);
    index = detail::g_builtins.size();
    detail::g_builtins.push_back(std::make_shared<const detail::BuiltinDef>(detail::BuiltinDef{name, fn, ctx}));
  }
  void* obj = detail::make_callable(TypeTag::Builtin, index);
  global_set(name, obj);
  return obj;
}

bool set_error_color(bool enabled) {
  return detail::g_error_color.exchange(enabled, std::memory_order_acq_rel);
}

bool error_color() { return detail::g_error_color.load(std::memory_order_acquire); }

} // namespace tether::rt
