/***
 * Name: tether::support (debug logging)
 * Purpose: Opt-in diagnostic logging to stderr shared by the runtime and the handles.
 * Inputs: TETHER_RT_DEBUG environment variable (any value enables logging)
 * Outputs: Lines of the form "[tag] message" on stderr
 * Theory of Operation: The environment is read once; debug_log is a no-op when disabled.
 */
#pragma once

namespace tether {
namespace support {

/*** debug_enabled: True when TETHER_RT_DEBUG was set at first use. */
bool debug_enabled();

/*** debug_log: printf-style line prefixed with "[tag] ". */
void debug_log(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

}  // namespace support
}  // namespace tether
