/***
 * Name: tether::support::IsReadableFile
 * Purpose: Check that an include target exists before a request is queued.
 * Inputs:
 *   - path: filesystem path
 * Outputs: true when path is a regular file that opens for reading
 */
#include "tether/support/fs.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace tether::support {

bool IsReadableFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) { return false; }
  const std::ifstream file_stream(path);
  return file_stream.good();
}

}  // namespace tether::support
