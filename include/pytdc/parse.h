/***
 * Name: pytdc::ParseString
 * Purpose: Public entry point: stub source text to a canonical module.
 * Inputs:
 *   - source: stub text
 *   - options: module name, target version/platform, display filename,
 *     optional metrics sink
 * Outputs:
 *   - ParseResult holding a pytd::Module or the first ParseError
 * Theory of Operation:
 *   Lex, parse, build (prescan + conversion + merge), validate, then
 *   qualify names when a module name was given. Each stage is timed into
 *   options.metrics when present. Every call owns its context; calls
 *   share no state.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "observability/Metrics.h"
#include "pytd/Decls.h"
#include "pytdc/parse_error.h"

namespace pytdc {

struct ParseOptions {
  std::optional<std::string> name;      // default: md5 hex of source
  std::vector<int> targetVersion{2, 7, 6};
  std::string targetPlatform{"linux"};
  std::optional<std::string> filename;  // for error display only
  obs::Metrics* metrics{nullptr};       // optional stage timings
};

class ParseResult {
 public:
  static ParseResult success(pytd::Module module);
  static ParseResult failure(ParseError error);

  bool ok() const { return std::holds_alternative<pytd::Module>(state_); }

  // Both throw exceptions::ParseFailure on a failed result
  const pytd::Module& module() const;
  const pytd::Module& value() const;
  pytd::Module takeModule();

  // Empty ParseError on success
  const ParseError& error() const;

 private:
  explicit ParseResult(std::variant<pytd::Module, ParseError> state) : state_(std::move(state)) {}
  std::variant<pytd::Module, ParseError> state_;
};

ParseResult ParseString(const std::string& source, const ParseOptions& options = {});

} // namespace pytdc
