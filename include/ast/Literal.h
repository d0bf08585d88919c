/**
 * @file
 * @brief Literal expression nodes.
 */
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include "ast/Expr.h"

namespace pytdc::ast {

template <typename T, NodeKind K>
struct Literal final : Expr, KindOf<K> {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

using IntLiteral = Literal<int64_t, NodeKind::IntLiteral>;
using FloatLiteral = Literal<double, NodeKind::FloatLiteral>;
// Value is the unquoted string contents
using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

// `...` as a value, a default, or a slice of Tuple[int, ...]
struct EllipsisLiteral final : Expr, KindOf<NodeKind::EllipsisLiteral> {
    EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
};

} // namespace pytdc::ast
