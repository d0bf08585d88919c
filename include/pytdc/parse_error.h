/***
 * Name: pytdc::ParseError
 * Purpose: Structured description of a failed parse.
 * Inputs: Message plus optional line, filename, source text and column
 * Outputs: Display string via str()
 * Theory of Operation:
 *   Every stage reports failure by returning one of these by value; nothing
 *   is thrown inside the pipeline. The column is 1-based and refers to the
 *   undedented source line held in `text`.
 */
#pragma once

#include <optional>
#include <string>

namespace pytdc {

struct ParseError {
  std::string message;
  std::optional<int> line{};
  std::optional<std::string> filename{};
  std::optional<std::string> text{};
  std::optional<int> column{};

  ParseError() = default;
  explicit ParseError(std::string msg, std::optional<int> lineNo = std::nullopt);

  /*** str: Render the multi-line, caret-annotated display form. */
  std::string str() const;
};

}  // namespace pytdc
