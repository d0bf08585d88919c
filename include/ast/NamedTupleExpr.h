#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Expr.h"

namespace pytdc::ast {

// NamedTuple(name, [(field, type), ...]) in a type position
struct NamedTupleExpr final : Expr, KindOf<NodeKind::NamedTupleExpr> {
  std::string name;
  std::vector<std::pair<std::string, std::unique_ptr<Expr>>> fields;
  explicit NamedTupleExpr(std::string n) : Expr(NodeKind::NamedTupleExpr), name(std::move(n)) {}
};

} // namespace pytdc::ast
