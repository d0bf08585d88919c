/***
 * Name: pytdc::exceptions::PytdcException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pytdc/exceptions/pytdc_exception.h"

namespace pytdc::exceptions {

const char* PytdcException::what() const noexcept { return message_.c_str(); }

}  // namespace pytdc::exceptions
