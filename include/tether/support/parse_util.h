/***
 * Name: tether::support (parse_util)
 * Purpose: Small helpers for parsing string_view inputs.
 * Inputs: std::string_view by reference, outputs via refs/pointers
 * Outputs: Mutated views and status booleans
 * Theory of Operation: Used to keep ParseCount simple and readable.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tether {
namespace support {

/*** TrimLeadingSpaces: Remove leading ASCII whitespace from view. */
void TrimLeadingSpaces(std::string_view& text);

/*** ParseDigitsStrict: Parse contiguous base-10 digits up to max_val; stop at whitespace; set err on failure. */
bool ParseDigitsStrict(std::string_view text, std::size_t max_val, std::size_t& value, std::string* err);

}  // namespace support
}  // namespace tether
