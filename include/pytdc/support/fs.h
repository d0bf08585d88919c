/***
 * Name: pytdc::support (fs)
 * Purpose: Stub file input and canonical output.
 * Inputs: Paths and string buffers; the path "-" names standard input
 * Outputs: File contents to/from disk
 * Theory of Operation: Both helpers report failure through err instead of
 *   throwing so the tool decides the exit status. Output goes to a sibling
 *   temporary which is renamed over the target, so a failed write never
 *   leaves a truncated stub behind.
 */
#pragma once

#include <string>

namespace pytdc {
namespace support {

/*** Path that ReadFile treats as standard input. */
inline constexpr const char* kStdinPath = "-";

/*** ReadFile: Read a whole stub (or stdin for "-") into out. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Replace path with data. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace pytdc
