/***
 * Name: pytdc::exceptions::PytdcException
 * Purpose: Base class for all pytdc exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites.
 *   The parse core reports through return values; exceptions are raised only
 *   at the convenience and tool boundaries.
 */
#pragma once

#include <exception>
#include <string>

namespace pytdc {
namespace exceptions {

class PytdcException : public std::exception {
 public:
  virtual ~PytdcException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PytdcException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pytdc
