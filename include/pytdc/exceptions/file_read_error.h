/***
 * Name: pytdc::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public PytdcException {
 public:
  explicit FileReadError(std::string msg) noexcept : PytdcException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pytdc
