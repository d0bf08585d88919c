/***
 * Name: pytdc::support::WriteFile
 * Purpose: Replace the -o target with the printed stub.
 * Inputs:
 *   - path: destination
 *   - data: printed output
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: Write "<path>.tmp" next to the target, flush, then
 *   rename over the target. The temporary is removed on any failure.
 */
#include "pytdc/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace pytdc {
namespace support {

namespace {
bool writeAll(const std::filesystem::path& target, const std::string& data) {
  std::ofstream file_stream(target, std::ios::binary | std::ios::trunc);
  if (!file_stream.is_open()) { return false; }
  file_stream.write(data.data(), static_cast<std::streamsize>(data.size()));
  file_stream.flush();
  return file_stream.good();
}
}  // namespace

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::filesystem::path target(path);
  std::filesystem::path staging = target;
  staging += ".tmp";
  if (!writeAll(staging, data)) {
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);
    err = "failed to write file: " + path;
    return false;
  }
  std::error_code ec;
  std::filesystem::rename(staging, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);
    err = "failed to replace " + path + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pytdc
