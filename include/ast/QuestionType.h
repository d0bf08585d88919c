#pragma once

#include "ast/Expr.h"

namespace pytdc::ast {

// `?` in a type position: the open type
struct QuestionType final : Expr, KindOf<NodeKind::QuestionType> {
  QuestionType() : Expr(NodeKind::QuestionType) {}
};

} // namespace pytdc::ast
