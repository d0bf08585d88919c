#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pytdc::ast {

// start:stop:step, each part optional
struct Slice final : Expr, KindOf<NodeKind::Slice> {
  std::unique_ptr<Expr> start;
  std::unique_ptr<Expr> stop;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace pytdc::ast
