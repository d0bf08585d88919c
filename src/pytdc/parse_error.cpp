/***
 * Name: pytdc::ParseError::str
 * Purpose: Format a parse error for display.
 * Inputs: The error's fields
 * Outputs: Text ending with `ParseError: <message>`
 * Theory of Operation:
 *   A `File:` header is printed when either the filename or the line is
 *   known, with `None` standing in for the missing part. The source excerpt
 *   and caret are printed only when both text and column are known; the
 *   excerpt has its leading whitespace removed and the caret is shifted by
 *   the same amount.
 */
#include "pytdc/parse_error.h"

#include <sstream>
#include <string>
#include <utility>

namespace pytdc {

ParseError::ParseError(std::string msg, std::optional<int> lineNo)
    : message(std::move(msg)), line(lineNo) {}

std::string ParseError::str() const {
  std::ostringstream out;
  if (filename || line) {
    out << "  File: \"" << (filename ? *filename : std::string("None")) << "\", line "
        << (line ? std::to_string(*line) : std::string("None")) << "\n";
  }
  if (text && column) {
    const std::string& raw = *text;
    const size_t first = raw.find_first_not_of(" \t\f");
    const size_t stripped = first == std::string::npos ? raw.size() : first;
    out << "    " << raw.substr(stripped) << "\n";
    const int offset = 4 + (*column - 1) - static_cast<int>(stripped);
    out << std::string(static_cast<size_t>(offset > 0 ? offset : 0), ' ') << "^\n";
  }
  out << "ParseError: " << message;
  return out.str();
}

}  // namespace pytdc
