/***
 * Name: tether::support::ParseCount
 * Purpose: Parse a non-negative base-10 count (thread counts, capacities) without throwing.
 * Inputs: Text with optional leading whitespace and digits; inclusive upper bound; optional error out
 * Outputs: Parsed count via out_val; returns true on success
 * Theory of Operation: Validates characters and range; ignores trailing whitespace.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tether {
namespace support {

bool ParseCount(std::string_view text, std::size_t max_val, std::size_t& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace tether
