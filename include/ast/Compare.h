/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include "Expr.h"

namespace pytdc::ast {

enum class CompareOp { Eq, NotEq, Lt, Le, Gt, Ge };

const char* to_string(CompareOp op);

struct Compare final : Expr, KindOf<NodeKind::Compare> {
  std::unique_ptr<Expr> left;
  CompareOp op{CompareOp::Eq};
  std::unique_ptr<Expr> right;
  Compare() : Expr(NodeKind::Compare) {}
};

} // namespace pytdc::ast
