/***
 * Name: pytdc::ast::Node
 * Purpose: Visitor entry point and stable node kind names.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"
#include "ast/VisitorBase.h"

namespace pytdc::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

const char* to_string(const NodeKind k) {
  switch (k) {
    case NodeKind::Module: return "Module";
    case NodeKind::FunctionDef: return "FunctionDef";
    case NodeKind::ClassDef: return "ClassDef";
    case NodeKind::IfStmt: return "IfStmt";
    case NodeKind::AssignStmt: return "AssignStmt";
    case NodeKind::TypeVarStmt: return "TypeVarStmt";
    case NodeKind::Import: return "Import";
    case NodeKind::ImportFrom: return "ImportFrom";
    case NodeKind::Name: return "Name";
    case NodeKind::IntLiteral: return "IntLiteral";
    case NodeKind::FloatLiteral: return "FloatLiteral";
    case NodeKind::StringLiteral: return "StringLiteral";
    case NodeKind::BoolLiteral: return "BoolLiteral";
    case NodeKind::EllipsisLiteral: return "EllipsisLiteral";
    case NodeKind::QuestionType: return "QuestionType";
    case NodeKind::TupleLiteral: return "TupleLiteral";
    case NodeKind::ListLiteral: return "ListLiteral";
    case NodeKind::Subscript: return "Subscript";
    case NodeKind::Slice: return "Slice";
    case NodeKind::OrExpr: return "OrExpr";
    case NodeKind::Compare: return "Compare";
    case NodeKind::NamedTupleExpr: return "NamedTupleExpr";
  }
  return "Unknown";
}

} // namespace pytdc::ast
