#pragma once

#include <cstdint>
#include <string>
#include "ast/NodeKind.h"

namespace pytdc::ast {

// Forward declarations to break include cycles
template <typename T, NodeKind K> struct Literal;
struct Name; struct EllipsisLiteral; struct QuestionType; struct TupleLiteral; struct ListLiteral;
struct Subscript; struct Slice; struct OrExpr; struct Compare; struct NamedTupleExpr;
struct Import; struct ImportFrom; struct AssignStmt; struct TypeVarStmt; struct FunctionDef;
struct ClassDef; struct IfStmt; struct Module;

// Virtual visitor interface for AST traversal using polymorphism.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  // One visit overload per concrete node type
  virtual void visit(const Module&) = 0;
  virtual void visit(const FunctionDef&) = 0;
  virtual void visit(const ClassDef&) = 0;
  virtual void visit(const IfStmt&) = 0;
  virtual void visit(const AssignStmt&) = 0;
  virtual void visit(const TypeVarStmt&) = 0;
  virtual void visit(const Import&) = 0;
  virtual void visit(const ImportFrom&) = 0;
  virtual void visit(const Name&) = 0;
  virtual void visit(const Literal<int64_t, NodeKind::IntLiteral>&) = 0;
  virtual void visit(const Literal<double, NodeKind::FloatLiteral>&) = 0;
  virtual void visit(const Literal<std::string, NodeKind::StringLiteral>&) = 0;
  virtual void visit(const Literal<bool, NodeKind::BoolLiteral>&) = 0;
  // Default no-ops for leaf and structural nodes
  virtual void visit(const EllipsisLiteral&) {}
  virtual void visit(const QuestionType&) {}
  virtual void visit(const TupleLiteral&) {}
  virtual void visit(const ListLiteral&) {}
  virtual void visit(const Subscript&) {}
  virtual void visit(const Slice&) {}
  virtual void visit(const OrExpr&) {}
  virtual void visit(const Compare&) {}
  virtual void visit(const NamedTupleExpr&) {}
};

} // namespace pytdc::ast
