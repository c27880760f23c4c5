/***
 * Name: tether::Value
 * Purpose: Validated access to rooted foreign objects and the value-producing runtime calls.
 */
#include "tether/memory/Value.h"
#include "tether/catch/Catch.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/exceptions/type_mismatch.h"
#include "tether/memory/Target.h"
#include "tether/runtime/c_api.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tether {

namespace {
rt::TypeTag tag_of(void* obj) { return static_cast<rt::TypeTag>(tether_rt_typeof(obj)); }

// Root the result of a runtime call that may raise.
template <typename F>
CallResult<Value> root_result(memory::Target& out, F&& produce) {
  CallResult<void*> raw = invoke_foreign(std::forward<F>(produce));
  if (!raw) { return std::unexpected(std::move(raw.error())); }
  return out.root(*raw);
}
} // namespace

Value Value::unrooted(void* obj) noexcept { return Value(obj, nullptr, nullptr, 0); }

Value Value::bound(void* obj, memory::SlotRef ref, uint64_t stamp) noexcept {
  return Value(obj, ref.slot, ref.stamp, stamp);
}

bool Value::is_valid() const noexcept {
  if (obj_ == nullptr) { return false; }
  if (stampCell_ == nullptr) { return true; }
  return *stampCell_ == stamp_ && *slot_ == obj_;
}

void* Value::get() const {
  if (obj_ == nullptr) { throw exceptions::InvalidHandleState("empty value"); }
  if (!is_valid()) { throw exceptions::InvalidHandleState("value used after its frame was popped or its slot reused"); }
  return obj_;
}

rt::TypeTag Value::tag() const { return tag_of(get()); }

void* Value::expect(rt::TypeTag tag) const {
  void* obj = get();
  const rt::TypeTag actual = tag_of(obj);
  if (actual != tag) {
    throw exceptions::TypeMismatch(std::string("expected ") + rt::type_name(tag) + ", got " + rt::type_name(actual));
  }
  return obj;
}

int64_t Value::as_int() const { return tether_rt_unbox_int(expect(rt::TypeTag::Int)); }

double Value::as_float() const { return tether_rt_unbox_float(expect(rt::TypeTag::Float)); }

bool Value::as_bool() const { return tether_rt_unbox_bool(expect(rt::TypeTag::Bool)) != 0; }

std::string Value::as_string() const {
  void* str = expect(rt::TypeTag::String);
  return std::string(tether_rt_string_data(str), tether_rt_string_len(str));
}

std::size_t Value::length() const {
  void* obj = get();
  switch (tag_of(obj)) {
    case rt::TypeTag::List: return tether_rt_list_len(obj);
    case rt::TypeTag::String: return tether_rt_string_len(obj);
    default: break;
  }
  throw exceptions::TypeMismatch(std::string("length of ") + rt::type_name(tag_of(obj)));
}

Value Value::get_index(memory::Target& out, std::size_t index) const {
  void* list = expect(rt::TypeTag::List);
  if (index >= tether_rt_list_len(list)) { throw std::out_of_range("list index " + std::to_string(index)); }
  return out.root(tether_rt_list_get(list, index));
}

void Value::set_index(std::size_t index, const Value& item) const {
  void* list = expect(rt::TypeTag::List);
  if (index >= tether_rt_list_len(list)) { throw std::out_of_range("list index " + std::to_string(index)); }
  tether_rt_list_set(list, index, item.get());
}

std::string Value::render() const {
  void* text = tether_rt_render(get());
  return std::string(tether_rt_string_data(text), tether_rt_string_len(text));
}

CallResult<Value> Value::call(memory::Target& out, std::span<const Value> args) const {
  void* fn = get();
  std::vector<void*> raw;
  raw.reserve(args.size());
  for (const Value& arg : args) { raw.push_back(arg.get()); }
  return root_result(out, [&] { return tether_rt_call(fn, raw.data(), raw.size()); });
}

Value Value::nothing() { return unrooted(tether_rt_nothing()); }

Value Value::new_int(memory::Target& out, int64_t value) { return out.root(tether_rt_box_int(value)); }

Value Value::new_float(memory::Target& out, double value) { return out.root(tether_rt_box_float(value)); }

Value Value::new_bool(memory::Target& out, bool value) { return out.root(tether_rt_box_bool(value ? 1 : 0)); }

Value Value::new_string(memory::Target& out, std::string_view text) {
  return out.root(tether_rt_string_new(text.data(), text.size()));
}

Value Value::new_list(memory::Target& out, std::size_t len) { return out.root(tether_rt_list_new(len)); }

CallResult<Value> Value::eval_string(memory::Target& out, std::string_view source) {
  return root_result(out, [source] { return tether_rt_eval_string(source.data(), source.size()); });
}

CallResult<Value> Value::include(memory::Target& out, const std::string& path) {
  return root_result(out, [&path] { return tether_rt_include(path.c_str()); });
}

CallResult<Value> Value::global(memory::Target& out, const std::string& name) {
  return root_result(out, [&name] {
    void* obj = tether_rt_global_get(name.c_str());
    if (obj == nullptr) { tether_rt_raise("UndefVarError", (name + " not defined").c_str()); }
    return obj;
  });
}

void Value::set_global(const std::string& name, const Value& value) { tether_rt_global_set(name.c_str(), value.get()); }

} // namespace tether
