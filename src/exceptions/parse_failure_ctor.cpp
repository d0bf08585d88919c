/***
 * Name: pytdc::exceptions::ParseFailure::ParseFailure
 * Purpose: Wrap a ParseError for exception-based callers.
 * Inputs:
 *   - err: the failed parse's error
 * Outputs: Exception whose what() is the rendered error text
 */
#include "pytdc/exceptions/parse_failure.h"

#include <utility>

namespace pytdc::exceptions {

ParseFailure::ParseFailure(ParseError err) : PytdcException(err.str()), error_(std::move(err)) {}

}  // namespace pytdc::exceptions
