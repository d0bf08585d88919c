/**
 * @file
 * @brief AST list literal declarations.
 */
/***
 * Name: pytdc::ast::ListLiteral
 * Purpose: A bracketed list of types: the implied tuple shorthand `[A, B]`
 *   or the argument list of `Callable[[A, B], R]`.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pytdc::ast {

struct ListLiteral final : Expr, KindOf<NodeKind::ListLiteral> {
  std::vector<std::unique_ptr<Expr>> elements;
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

} // namespace pytdc::ast
