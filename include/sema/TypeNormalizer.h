/***
 * Name: pytdc::sema::TypeNormalizer
 * Purpose: Turn raw type expressions into canonical model types.
 * Inputs:
 *   - Type expression from the raw tree and the line it belongs to
 * Outputs:
 *   - Model type, or nullptr with the context error set at that line
 * Theory of Operation:
 *   Names resolve through the registry. Subscripts dispatch on their
 *   resolved base: Callable, Union/Optional, or the homogeneous rules where
 *   a trailing `...` makes `B[T, ...]` the repeated form `B[T]`.
 *   `[A, B]` is the implied tuple. `NamedTuple(...)` synthesizes a class
 *   into the context and yields a reference to it.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "pytd/Type.h"
#include "sema/BuildContext.h"

namespace pytdc::sema {

class TypeNormalizer {
 public:
  explicit TypeNormalizer(BuildContext& ctx) : ctx_(ctx) {}

  pytd::TypePtr convert(const ast::Expr& expr, int line);

 private:
  BuildContext& ctx_;
  int line_{0};

  pytd::TypePtr convertExpr(const ast::Expr& expr);
  pytd::TypePtr convertSubscript(const ast::Subscript& sub);
  pytd::TypePtr convertParameters(pytd::TypePtr base, const std::vector<std::unique_ptr<ast::Expr>>& elements);
  pytd::TypePtr convertCallable(pytd::TypePtr base, const std::vector<std::unique_ptr<ast::Expr>>& elements);
  pytd::TypePtr convertImpliedTuple(const ast::ListLiteral& list);
  pytd::TypePtr convertNamedTuple(const ast::NamedTupleExpr& record);
  bool convertAll(const std::vector<std::unique_ptr<ast::Expr>>& elements, std::vector<pytd::TypePtr>& out);
  pytd::TypePtr fail(const std::string& msg);
};

} // namespace pytdc::sema
