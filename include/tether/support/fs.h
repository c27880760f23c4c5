/***
 * Name: tether::support (fs)
 * Purpose: Minimal file helpers for including foreign source files.
 * Inputs: Paths
 * Outputs: File contents from disk
 * Theory of Operation: Thin wrappers over fstream to centralize error handling.
 */
#pragma once

#include <string>

namespace tether {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** IsReadableFile: True when path names a regular file that can be opened. */
bool IsReadableFile(const std::string& path);

}  // namespace support
}  // namespace tether
