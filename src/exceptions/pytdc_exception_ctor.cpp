/***
 * Name: pytdc::exceptions::PytdcException::PytdcException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pytdc/exceptions/pytdc_exception.h"

namespace pytdc {
namespace exceptions {

PytdcException::PytdcException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pytdc
