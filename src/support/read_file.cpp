/***
 * Name: pytdc::support::ReadFile
 * Purpose: Load one stub source.
 * Inputs:
 *   - path: filesystem path, or "-" for standard input
 * Outputs:
 *   - out: the bytes read, unchanged (line endings are the lexer's concern)
 *   - err: error message on failure
 */
#include "pytdc/support/fs.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <sstream>
#include <string>
#include <system_error>

namespace pytdc {
namespace support {

namespace {
bool slurp(std::istream& input, std::string& out) {
  std::ostringstream stream;
  stream << input.rdbuf();
  if (input.bad()) { return false; }
  out = stream.str();
  return true;
}
}  // namespace

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  if (path == kStdinPath) {
    if (!slurp(std::cin, out)) {
      err = "failed to read standard input";
      return false;
    }
    return true;
  }
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "is a directory: " + path;
    return false;
  }
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    err = "failed to open file: " + path;
    return false;
  }
  if (!slurp(file_stream, out)) {
    err = "failed to read file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pytdc
