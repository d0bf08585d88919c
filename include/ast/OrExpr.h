#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pytdc::ast {

// `a or b or c`: a union in type position, a disjunction in a condition
struct OrExpr final : Expr, KindOf<NodeKind::OrExpr> {
  std::vector<std::unique_ptr<Expr>> operands;
  OrExpr() : Expr(NodeKind::OrExpr) {}
};

} // namespace pytdc::ast
