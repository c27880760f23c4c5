/***
 * Name: tether::Value
 * Purpose: Host reference to a foreign object, optionally tied to a root slot.
 * Inputs: Objects produced through a Target
 * Outputs: Typed accessors and runtime operations that produce new values
 * Theory of Operation:
 *   A rooted value remembers its slot, the slot's stamp cell and the stamp written with it.
 *   Every access compares the stamp; a popped frame zeroes its stamps and a reused slot gets
 *   a new one, so a value that outlived its frame fails with InvalidHandleState instead of
 *   reading a reclaimed object. Unrooted values are not checked.
 *
 *   All operations require the calling thread to be an adopted mutator of a running runtime.
 *   Operations that can raise in the runtime return CallResult; the rest throw on misuse.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "tether/catch/CallResult.h"
#include "tether/memory/Stack.h"
#include "tether/runtime/TypeTag.h"

namespace tether {

namespace memory {
class Target;
}

class Value {
 public:
  Value() = default;

  static Value unrooted(void* obj) noexcept;
  static Value bound(void* obj, memory::SlotRef ref, uint64_t stamp) noexcept;

  bool is_rooted() const noexcept { return stampCell_ != nullptr; }
  bool is_empty() const noexcept { return obj_ == nullptr; }
  // False once the slot this value was rooted in has been popped or overwritten.
  bool is_valid() const noexcept;

  // Raw object pointer; throws InvalidHandleState when empty or stale.
  void* get() const;

  rt::TypeTag tag() const;
  bool is_nothing() const { return tag() == rt::TypeTag::Nothing; }

  // Throw TypeMismatch on the wrong type.
  int64_t as_int() const;
  double as_float() const;
  bool as_bool() const;
  std::string as_string() const;

  std::size_t length() const;
  Value get_index(memory::Target& out, std::size_t index) const;
  void set_index(std::size_t index, const Value& item) const;

  // Runtime display text, the same text a foreign error carries.
  std::string render() const;

  CallResult<Value> call(memory::Target& out, std::span<const Value> args = {}) const;

  static Value nothing();
  static Value new_int(memory::Target& out, int64_t value);
  static Value new_float(memory::Target& out, double value);
  static Value new_bool(memory::Target& out, bool value);
  static Value new_string(memory::Target& out, std::string_view text);
  static Value new_list(memory::Target& out, std::size_t len);

  static CallResult<Value> eval_string(memory::Target& out, std::string_view source);
  static CallResult<Value> include(memory::Target& out, const std::string& path);
  // Exception UndefVarError when the name is unbound.
  static CallResult<Value> global(memory::Target& out, const std::string& name);
  static void set_global(const std::string& name, const Value& value);

 private:
  Value(void* obj, void* const* slot, const uint64_t* stampCell, uint64_t stamp) noexcept
      : obj_(obj), slot_(slot), stampCell_(stampCell), stamp_(stamp) {}

  void* expect(rt::TypeTag tag) const;

  void* obj_{nullptr};
  void* const* slot_{nullptr};
  const uint64_t* stampCell_{nullptr};
  uint64_t stamp_{0};
};

} // namespace tether
