/***
 * Name: tether::support::TrimLeadingSpaces
 * Purpose: Drop leading ASCII whitespace from a view in place (count parsing accepts " 4").
 */
#include "tether/support/parse_util.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string_view>

namespace tether::support {

void TrimLeadingSpaces(std::string_view& text) {
  const auto first = std::find_if_not(text.begin(), text.end(),
                                      [](unsigned char c) { return std::isspace(c) != 0; });
  text.remove_prefix(static_cast<std::size_t>(first - text.begin()));
}

} // namespace tether::support
