/***
 * Name: tether::support::ReadFile
 * Purpose: Load a source file for include().
 * Theory of Operation: Binary read, so the reader sees the file byte for byte. A stream that
 *   fails mid-read is an error rather than a truncated source.
 */
#include "tether/support/fs.h"

#include <fstream>
#include <iterator>
#include <string>

namespace tether::support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    err = "cannot open " + path;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    err = "read error in " + path;
    return false;
  }
  return true;
}

} // namespace tether::support
