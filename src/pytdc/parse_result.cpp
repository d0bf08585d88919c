/***
 * Name: pytdc::ParseResult
 * Purpose: Success-or-error holder returned by ParseString.
 */
#include "pytdc/parse.h"
#include "pytdc/exceptions/parse_failure.h"

#include <utility>

namespace pytdc {

ParseResult ParseResult::success(pytd::Module module) { return ParseResult(std::move(module)); }

ParseResult ParseResult::failure(ParseError error) { return ParseResult(std::move(error)); }

const pytd::Module& ParseResult::value() const {
  if (const auto* error = std::get_if<ParseError>(&state_)) { throw exceptions::ParseFailure(*error); }
  return std::get<pytd::Module>(state_);
}

const pytd::Module& ParseResult::module() const { return value(); }

pytd::Module ParseResult::takeModule() {
  if (const auto* error = std::get_if<ParseError>(&state_)) { throw exceptions::ParseFailure(*error); }
  return std::move(std::get<pytd::Module>(state_));
}

const ParseError& ParseResult::error() const {
  static const ParseError kNone{};
  if (const auto* error = std::get_if<ParseError>(&state_)) { return *error; }
  return kNone;
}

} // namespace pytdc
