#pragma once

#include "ast/Nodes.h"

namespace pytdc::ast {

template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<const Module&>(n)); break;
        case NodeKind::FunctionDef: v.visit(static_cast<const FunctionDef&>(n)); break;
        case NodeKind::ClassDef: v.visit(static_cast<const ClassDef&>(n)); break;
        case NodeKind::IfStmt: v.visit(static_cast<const IfStmt&>(n)); break;
        case NodeKind::AssignStmt: v.visit(static_cast<const AssignStmt&>(n)); break;
        case NodeKind::TypeVarStmt: v.visit(static_cast<const TypeVarStmt&>(n)); break;
        case NodeKind::Import: v.visit(static_cast<const Import&>(n)); break;
        case NodeKind::ImportFrom: v.visit(static_cast<const ImportFrom&>(n)); break;
        case NodeKind::Name: v.visit(static_cast<const Name&>(n)); break;
        case NodeKind::IntLiteral: v.visit(static_cast<const IntLiteral&>(n)); break;
        case NodeKind::FloatLiteral: v.visit(static_cast<const FloatLiteral&>(n)); break;
        case NodeKind::StringLiteral: v.visit(static_cast<const StringLiteral&>(n)); break;
        case NodeKind::BoolLiteral: v.visit(static_cast<const BoolLiteral&>(n)); break;
        case NodeKind::EllipsisLiteral: v.visit(static_cast<const EllipsisLiteral&>(n)); break;
        case NodeKind::QuestionType: v.visit(static_cast<const QuestionType&>(n)); break;
        case NodeKind::TupleLiteral: v.visit(static_cast<const TupleLiteral&>(n)); break;
        case NodeKind::ListLiteral: v.visit(static_cast<const ListLiteral&>(n)); break;
        case NodeKind::Subscript: v.visit(static_cast<const Subscript&>(n)); break;
        case NodeKind::Slice: v.visit(static_cast<const Slice&>(n)); break;
        case NodeKind::OrExpr: v.visit(static_cast<const OrExpr&>(n)); break;
        case NodeKind::Compare: v.visit(static_cast<const Compare&>(n)); break;
        case NodeKind::NamedTupleExpr: v.visit(static_cast<const NamedTupleExpr&>(n)); break;
    }
}

} // namespace pytdc::ast
