/***
 * Name: tether::rt (objects)
 * Purpose: Boxed scalars, strings, lists, singletons and display rendering.
 */
#include "tether/runtime/Runtime.h"
#include "tether/runtime/detail/Heap.h"
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace tether::rt {
namespace detail {
namespace {
void* g_nothing = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
void* g_true = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
void* g_false = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

constexpr const char* kErrorColorOn = "\x1b[31m";
constexpr const char* kErrorColorOff = "\x1b[0m";

void render_float(std::string& out, double value) {
  char buf[64]; // NOLINT(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
  const auto res = std::to_chars(buf, buf + sizeof(buf), value); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  std::string text(buf, res.ptr);
  // Keep floats distinguishable from ints ("2.0", not "2"); inf/nan contain 'n'.
  if (text.find_first_of(".eEn") == std::string::npos) { text += ".0"; }
  out += text;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void render_into(std::string& out, void* obj, bool quoted) {
  if (obj == nullptr) { out += "#<null>"; return; }
  switch (type_of(obj)) {
    case TypeTag::Nothing: out += "nothing"; break;
    case TypeTag::Int: out += std::to_string(box_int_value(obj)); break;
    case TypeTag::Float: render_float(out, box_float_value(obj)); break;
    case TypeTag::Bool: out += box_bool_value(obj) ? "true" : "false"; break;
    case TypeTag::String:
      if (quoted) { out += '"'; }
      out.append(string_data(obj), string_len(obj));
      if (quoted) { out += '"'; }
      break;
    case TypeTag::List: {
      out += '[';
      const std::size_t len = list_len(obj);
      for (std::size_t i = 0; i < len; ++i) {
        if (i != 0U) { out += ", "; }
        render_into(out, list_get(obj, i), true);
      }
      out += ']';
      break;
    }
    case TypeTag::Exception: {
      void* type = exception_type(obj);
      void* message = exception_message(obj);
      const bool color = error_color();
      if (color) { out += kErrorColorOn; }
      if (type != nullptr) { out.append(string_data(type), string_len(type)); } else { out += "Exception"; }
      if (color) { out += kErrorColorOff; }
      if (message != nullptr && string_len(message) != 0U) {
        out += ": ";
        out.append(string_data(message), string_len(message));
      }
      break;
    }
    case TypeTag::Function: out += "#<function " + callable_name(obj) + ">"; break;
    case TypeTag::Builtin: out += "#<builtin " + callable_name(obj) + ">"; break;
  }
}
} // namespace

void init_singletons() {
  g_nothing = alloc_object(0, TypeTag::Nothing);
  g_true = alloc_object(sizeof(uint8_t), TypeTag::Bool);
  *static_cast<uint8_t*>(g_true) = 1;
  g_false = alloc_object(sizeof(uint8_t), TypeTag::Bool);
}

void mark_singletons() {
  mark_object(g_nothing);
  mark_object(g_true);
  mark_object(g_false);
}

void reset_singletons() {
  g_nothing = nullptr;
  g_true = nullptr;
  g_false = nullptr;
}

} // namespace detail

const char* type_name(TypeTag tag) {
  switch (tag) {
    case TypeTag::Nothing: return "Nothing";
    case TypeTag::Int: return "Int";
    case TypeTag::Float: return "Float";
    case TypeTag::Bool: return "Bool";
    case TypeTag::String: return "String";
    case TypeTag::List: return "List";
    case TypeTag::Exception: return "Exception";
    case TypeTag::Function: return "Function";
    case TypeTag::Builtin: return "Builtin";
  }
  return "Unknown";
}

void* nothing() { return detail::g_nothing; }

void* box_bool(bool value) { return value ? detail::g_true : detail::g_false; }

bool box_bool_value(void* obj) { return *static_cast<uint8_t*>(obj) != 0U; }

void* box_int(int64_t value) {
  void* obj = detail::alloc_object(sizeof(int64_t), TypeTag::Int);
  *static_cast<int64_t*>(obj) = value;
  return obj;
}

int64_t box_int_value(void* obj) { return *static_cast<int64_t*>(obj); }

void* box_float(double value) {
  void* obj = detail::alloc_object(sizeof(double), TypeTag::Float);
  *static_cast<double*>(obj) = value;
  return obj;
}

double box_float_value(void* obj) { return *static_cast<double*>(obj); }

void* string_new(const char* data, std::size_t len) {
  const std::size_t payloadSize = sizeof(detail::StringPayload) + len + 1; // include NUL
  void* obj = detail::alloc_object(payloadSize, TypeTag::String);
  auto* plen = static_cast<std::size_t*>(obj);
  *plen = len;
  char* buf = reinterpret_cast<char*>(plen + 1); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (len != 0U && data != nullptr) { std::memcpy(buf, data, len); }
  buf[len] = '\0'; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return obj;
}

void* string_from_cstr(const char* cstr) {
  return string_new(cstr, cstr != nullptr ? std::strlen(cstr) : 0U);
}

std::size_t string_len(void* str) { return static_cast<detail::StringPayload*>(str)->len; }

const char* string_data(void* str) {
  return reinterpret_cast<const char*>(static_cast<detail::StringPayload*>(str) + 1); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

void* list_new(std::size_t len) {
  void* obj = detail::alloc_object(sizeof(detail::ListPayload) + len * sizeof(void*), TypeTag::List);
  static_cast<detail::ListPayload*>(obj)->len = len;
  void** items = detail::list_items(obj);
  for (std::size_t i = 0; i < len; ++i) { items[i] = detail::g_nothing; } // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return obj;
}

std::size_t list_len(void* list) { return static_cast<detail::ListPayload*>(list)->len; }

void* list_get(void* list, std::size_t index) {
  return detail::list_items(list)[index]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

void list_set(void* list, std::size_t index, void* value) {
  detail::list_items(list)[index] = value; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  gc_write_barrier(list, value);
}

TypeTag type_of(void* obj) { return static_cast<TypeTag>(detail::header_of(obj)->tag); }

std::string render_text(void* obj) {
  std::string out;
  detail::render_into(out, obj, false);
  return out;
}

void* render(void* obj) {
  const std::string text = render_text(obj);
  return string_new(text.data(), text.size());
}

void* exception_type(void* exc) { return static_cast<detail::ExceptionPayload*>(exc)->type; }

void* exception_message(void* exc) { return static_cast<detail::ExceptionPayload*>(exc)->message; }

} // namespace tether::rt
