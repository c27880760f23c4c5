/***
 * Name: tether::support::ParseDigitsStrict
 * Purpose: Parse contiguous base-10 digits; stop at whitespace; report errors.
 * Inputs: text view, inclusive upper bound, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
#include "tether/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace tether {
namespace support {

auto ParseDigitsStrict(std::string_view text, std::size_t max_val, std::size_t& value, std::string* err) -> bool {
  value = 0;
  constexpr std::size_t kBase10 = 10;
  constexpr char kZeroChar = '0';
  bool is_success = true;
  std::string local_err;
  for (const char digit_char : text) {
    if (std::isspace(static_cast<unsigned char>(digit_char)) != 0) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in count";
      is_success = false;
      break;
    }
    const auto digit = static_cast<std::size_t>(digit_char - kZeroChar);
    if (value > (max_val - digit) / kBase10) {
      local_err = "count out of range";
      is_success = false;
      break;
    }
    value = (value * kBase10) + digit;
  }
  if (!is_success) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace tether
