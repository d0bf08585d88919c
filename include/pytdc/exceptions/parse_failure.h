/***
 * Name: pytdc::exceptions::ParseFailure
 * Purpose: Exception carrying the ParseError of a failed parse.
 * Inputs: ParseError value
 * Outputs: Exception object; what() is the rendered error
 * Theory of Operation: Raised by ParseResult::value() on a failed result.
 */
#pragma once

#include "pytdc/exceptions/pytdc_exception.h"
#include "pytdc/parse_error.h"

namespace pytdc {
namespace exceptions {

class ParseFailure : public PytdcException {
 public:
  explicit ParseFailure(ParseError err);
  const ParseError& error() const noexcept { return error_; }

 private:
  ParseError error_;
};

}  // namespace exceptions
}  // namespace pytdc
