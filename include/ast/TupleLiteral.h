/**
 * @file
 * @brief AST tuple literal declarations.
 */
/***
 * Name: pytdc::ast::TupleLiteral
 * Purpose: Represent a parenthesized tuple of literals in a condition.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pytdc::ast {

struct TupleLiteral final : Expr, KindOf<NodeKind::TupleLiteral> {
  std::vector<std::unique_ptr<Expr>> elements;
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace pytdc::ast
