/***
 * Name: tether::support::ParseCount
 * Purpose: Parse a non-negative base-10 count without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the count
 *   - max_val: inclusive upper bound
 * Outputs:
 *   - out_val: parsed count on success
 *   - err: optional error message on failure
 */
#include "tether/support/parse.h"
#include "tether/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace tether::support {

auto ParseCount(std::string_view text, std::size_t max_val, std::size_t& out_val, std::string* err) -> bool {
  TrimLeadingSpaces(text);
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) == 0) {
    if (err != nullptr) {
      *err = "invalid count";
    }
    return false;
  }
  std::size_t value = 0;
  if (!ParseDigitsStrict(text, max_val, value, err)) {
    return false;
  }
  std::size_t index = 0;
  while (index < text.size() && std::isdigit(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  for (; index < text.size(); ++index) {
    if (std::isspace(static_cast<unsigned char>(text[index])) == 0) {
      if (err != nullptr) {
        *err = "trailing characters after count";
      }
      return false;
    }
  }
  out_val = value;
  return true;
}

}  // namespace tether::support
