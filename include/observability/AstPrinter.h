/***
 * Name: pytdc::obs::AstPrinter
 * Purpose: Visitor-based raw tree pretty-printer for --dump-ast.
 * Inputs:
 *   - ast::Module
 * Outputs:
 *   - Formatted string with node kinds and salient fields.
 * Theory of Operation:
 *   Implements ast::VisitorBase to traverse nodes, collecting a textual
 *   representation with indentation reflecting tree depth.
 */
#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace pytdc::obs {

class AstPrinter : public ast::VisitorBase {
 public:
  std::string print(const ast::Module& m) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    m.accept(*this);
    return ss_.str();
  }

  void visit(const ast::Module& m) override { line("Module"); block(m.body); }
  void visit(const ast::FunctionDef& f) override {
    std::string head = std::string("FunctionDef name=") + f.name;
    if (f.external) { head += " PYTHONCODE"; }
    for (const auto& d : f.decorators) { head += " @" + d->id; }
    line(head);
    depth_++;
    for (const auto& p : f.params) { param(p); }
    if (f.returnType) { line("Returns:"); child(*f.returnType); }
    for (const auto& r : f.raises) { line("Raises:"); child(*r); }
    for (const auto& m : f.mutators) { line("Mutates " + m.name + ":"); child(*m.type); }
    depth_--;
  }
  void visit(const ast::ClassDef& c) override {
    line(std::string("ClassDef name=") + c.name);
    depth_++;
    for (const auto& a : c.args) {
      line(a.keyword.empty() ? std::string("Base:") : "Keyword " + a.keyword + ":");
      child(*a.value);
    }
    depth_--;
    block(c.body);
  }
  void visit(const ast::IfStmt& i) override {
    line(i.isElif ? "ElifStmt" : "IfStmt");
    depth_++;
    if (i.cond) { line("Cond:"); child(*i.cond); }
    if (!i.thenBody.empty()) { line("Then:"); block(i.thenBody); }
    if (!i.elseBody.empty()) { line("Else:"); block(i.elseBody); }
    depth_--;
  }
  void visit(const ast::AssignStmt& a) override {
    line(std::string("AssignStmt target=") + a.target);
    depth_++;
    if (a.annotation) { line("Annotation:"); child(*a.annotation); }
    if (a.value) { a.value->accept(*this); }
    if (a.typeComment) { line("TypeComment:"); child(*a.typeComment); }
    depth_--;
  }
  void visit(const ast::TypeVarStmt& t) override {
    line(std::string("TypeVarStmt name=") + t.name);
    depth_++;
    for (const auto& c : t.constraints) { c->accept(*this); }
    depth_--;
  }
  void visit(const ast::Import& i) override {
    std::string text = "Import";
    for (const auto& n : i.names) { text += " " + aliasText(n); }
    line(text);
  }
  void visit(const ast::ImportFrom& i) override {
    std::string text = "ImportFrom module=" + i.module;
    if (i.star) { text += " *"; }
    for (const auto& n : i.names) { text += " " + aliasText(n); }
    line(text);
  }
  void visit(const ast::IntLiteral& lit) override { line(std::string("IntLiteral ") + std::to_string(lit.value)); }
  void visit(const ast::BoolLiteral& lit) override { line(std::string("BoolLiteral ") + (lit.value ? "True" : "False")); }
  void visit(const ast::FloatLiteral& lit) override { line(std::string("FloatLiteral ") + std::to_string(lit.value)); }
  void visit(const ast::StringLiteral& lit) override { line(std::string("StringLiteral \"") + lit.value + "\""); }
  void visit(const ast::Name& n) override { line(std::string("Name ") + n.id); }
  void visit(const ast::EllipsisLiteral&) override { line("Ellipsis"); }
  void visit(const ast::QuestionType&) override { line("QuestionType"); }
  void visit(const ast::TupleLiteral& t) override { line("TupleLiteral"); list(t.elements); }
  void visit(const ast::ListLiteral& t) override { line("ListLiteral"); list(t.elements); }
  void visit(const ast::OrExpr& o) override { line("OrExpr"); list(o.operands); }
  void visit(const ast::Subscript& s) override {
    line("Subscript");
    depth_++;
    s.value->accept(*this);
    depth_--;
    list(s.elements);
  }
  void visit(const ast::Slice& s) override {
    line("Slice");
    depth_++;
    if (s.start) { line("Start:"); child(*s.start); }
    if (s.stop) { line("Stop:"); child(*s.stop); }
    if (s.step) { line("Step:"); child(*s.step); }
    depth_--;
  }
  void visit(const ast::Compare& c) override {
    line(std::string("Compare ") + ast::to_string(c.op));
    depth_++;
    c.left->accept(*this);
    c.right->accept(*this);
    depth_--;
  }
  void visit(const ast::NamedTupleExpr& n) override {
    line(std::string("NamedTuple name=") + n.name);
    depth_++;
    for (const auto& [field, type] : n.fields) { line("Field " + field + ":"); child(*type); }
    depth_--;
  }

 private:
  template <typename NodeT>
  void block(const std::vector<std::unique_ptr<NodeT>>& nodes) {
    depth_++;
    for (const auto& n : nodes) { n->accept(*this); }
    depth_--;
  }
  void list(const std::vector<std::unique_ptr<ast::Expr>>& nodes) { block(nodes); }
  void child(const ast::Node& n) { depth_++; n.accept(*this); depth_--; }
  void param(const ast::Param& p) {
    std::string text = "Param ";
    switch (p.kind) {
      case ast::ParamKind::Normal: text += p.name; break;
      case ast::ParamKind::Star: text += "*" + p.name; break;
      case ast::ParamKind::StarStar: text += "**" + p.name; break;
      case ast::ParamKind::Ellipsis: text += "..."; break;
    }
    line(text);
    if (p.annotation) { child(*p.annotation); }
    if (p.defaultValue) { depth_++; line("Default:"); child(*p.defaultValue); depth_--; }
  }
  static std::string aliasText(const ast::Alias& a) { return a.asname.empty() ? a.name : a.name + " as " + a.asname; }
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace pytdc::obs
