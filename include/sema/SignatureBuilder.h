/***
 * Name: pytdc::sema::SignatureBuilder
 * Purpose: Convert one raw `def` into a signature with its decorator.
 * Inputs:
 *   - FunctionDef from the raw tree
 * Outputs:
 *   - RawDef, or false with the context error set at the def line
 * Theory of Operation:
 *   Parameters are checked for ordering in one left-to-right pass:
 *   nothing may follow `**kw` or `...`, a second `*` is rejected, and a
 *   bare `*` needs at least one keyword-only parameter after it.
 *   Untyped parameters take their type from an int, float or bool default;
 *   a declared type with a `None` default becomes optional.
 */
#pragma once

#include "ast/FunctionDef.h"
#include "sema/BuildContext.h"
#include "sema/TypeNormalizer.h"
#include "sema/detail/types/RawDef.h"

namespace pytdc::sema {

class SignatureBuilder {
 public:
  SignatureBuilder(BuildContext& ctx, TypeNormalizer& types) : ctx_(ctx), types_(types) {}

  bool build(const ast::FunctionDef& def, RawDef& out);

 private:
  BuildContext& ctx_;
  TypeNormalizer& types_;

  bool buildParams(const ast::FunctionDef& def, pytd::Signature& sig, size_t& positional);
  pytd::TypePtr paramType(const ast::Param& param, int line);
  bool hasParameter(const pytd::Signature& sig, const std::string& name) const;
};

} // namespace pytdc::sema
