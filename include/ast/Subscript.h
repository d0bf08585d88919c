#pragma once

#include <memory>
#include <utility>
#include <vector>
#include "ast/Expr.h"

namespace pytdc::ast {

// `value[e1, e2, ...]`: generic type parameters, or a single index/slice
// on `sys.version_info` in conditions.
struct Subscript final : Expr, KindOf<NodeKind::Subscript> {
  std::unique_ptr<Expr> value;
  std::vector<std::unique_ptr<Expr>> elements;
  explicit Subscript(std::unique_ptr<Expr> v)
      : Expr(NodeKind::Subscript), value(std::move(v)) {}
};

} // namespace pytdc::ast
