/***
 * Name: tether::rt::detail::Form, read_forms
 * Purpose: Parse foreign source text into s-expression forms.
 * Inputs: Source text
 * Outputs: Top-level forms in source order
 * Theory of Operation:
 *   Forms are host-side values, never heap objects, so parsed code needs no rooting.
 *   Syntax errors raise a foreign ParseError.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tether::rt::detail {

struct Form {
  enum class Kind : uint8_t { Int, Float, String, Symbol, List };
  Kind kind{Kind::List};
  int64_t intValue{0};
  double floatValue{0.0};
  std::string text;
  std::vector<Form> items;
  std::size_t line{1};
};

std::vector<Form> read_forms(std::string_view source);

} // namespace tether::rt::detail
