/***
 * Name: pytdc::exceptions::UsageError
 * Purpose: Exception for invalid command-line option values.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PytdcException.
 */
#pragma once

#include "pytdc/exceptions/pytdc_exception.h"

#include <string>
#include <utility>

namespace pytdc {
namespace exceptions {

class UsageError : public PytdcException {
 public:
  explicit UsageError(std::string msg) noexcept : PytdcException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pytdc
