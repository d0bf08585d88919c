/***
 * Name: pytdc::parse::Parser
 * Purpose: Build the raw declaration tree from stub source tokens.
 * Inputs:
 *   - Lexer holding the source (tokens are drained eagerly)
 * Outputs:
 *   - Module AST, or nullptr with error() describing the first failure
 * Theory of Operation:
 *   Recursive descent over the token vector. The grammar is small:
 *     unit      := { stmt } END
 *     stmt      := decorated_def | classdef | if_stmt | import | from_import
 *                | typevar | assign | pep526 | 'pass' NEWLINE
 *     classdef  := 'class' NAME [ '(' [ args ] ')' ] ':' class_body
 *     def       := 'def' NAME PYTHONCODE NEWLINE
 *                | 'def' NAME '(' [ params ] ')' [ '->' type ] ( ':' body | NEWLINE )
 *     if_stmt   := 'if' cond ':' block { 'elif' cond ':' block } [ 'else' ':' block ]
 *     cond      := cond_term { 'or' cond_term }
 *     type      := type_atom { 'or' type_atom }
 *   The first error stops the parse; it is reported bison style
 *   ("syntax error, unexpected X, expecting A or B") at the offending token,
 *   with the source line attached for display.
 */
#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "pytdc/parse_error.h"

namespace pytdc::parse {

class Parser {
 public:
  explicit Parser(lex::Lexer& lexer) : lexer_(lexer) {}
  std::unique_ptr<ast::Module> parseModule();

  const ParseError& error() const { return error_; }
  size_t tokenCount() const { return tokens_.size(); }

 private:
  enum class Scope { Module, Class };

  lex::Lexer& lexer_;
  std::vector<lex::Token> tokens_;
  size_t pos_{0};
  bool failed_{false};
  ParseError error_{};
  int nesting_{0};

  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  const lex::Token& peekAt(size_t offset) const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  bool expect(lex::TokenKind tokenKind);

  // Error recording; each returns false so callers can `return fail...`
  bool failAt(const lex::Token& tok, const std::string& msg);
  bool syntaxError(std::initializer_list<lex::TokenKind> expected = {});
  bool enterNesting();

  bool parseStatement(ast::StmtList& out, Scope scope);
  bool parseBlock(ast::StmtList& out, Scope scope);
  bool parseFunction(ast::StmtList& out);
  bool parseFunctionBody(ast::FunctionDef& def);
  bool parseBodyStatement(ast::FunctionDef& def);
  bool parseIgnoreComment();
  bool atIgnoreComment() const;
  bool parseParamList(ast::FunctionDef& def);
  bool parseParam(ast::FunctionDef& def);
  std::unique_ptr<ast::Expr> parseDefaultValue();
  bool parseClass(ast::StmtList& out);
  bool parseClassArgs(ast::ClassDef& cls);
  bool parseIf(ast::StmtList& out, Scope scope);
  bool parseIfChain(ast::IfStmt& node, Scope scope);
  bool parseImport(ast::StmtList& out);
  bool parseFromImport(ast::StmtList& out);
  bool parseImportNames(std::vector<ast::Alias>& names, bool parenthesized);
  bool parseAssign(ast::StmtList& out, Scope scope);
  bool parseTypeVar(ast::StmtList& out, const lex::Token& target);
  bool parseTrailingTypeComment(ast::AssignStmt& stmt);
  bool parseDottedName(std::string& out);

  std::unique_ptr<ast::Expr> parseType();
  std::unique_ptr<ast::Expr> parseTypeAtom();
  bool parseTypeList(std::vector<std::unique_ptr<ast::Expr>>& out, bool allowEmpty);
  std::unique_ptr<ast::Expr> parseNamedTuple();

  std::unique_ptr<ast::Expr> parseCondition();
  std::unique_ptr<ast::Expr> parseConditionTerm();
  std::unique_ptr<ast::Expr> parseIndexOrSlice();
  std::unique_ptr<ast::Expr> parseConditionValue();
  std::unique_ptr<ast::Expr> parseSignedNumber();

  static std::string unquoteString(const std::string& text);
};

} // namespace pytdc::parse
