/***
 * Name: pytdc::parse::Parser (impl)
 * Purpose: Recursive-descent parser for stub source.
 */
#include "parser/Parser.h"
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "lexer/TokenKind.h"
#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace pytdc::parse {

using TK = lex::TokenKind;

namespace {
constexpr int kMaxNesting = 100;

template <typename NodeT, typename... Args>
std::unique_ptr<NodeT> makeAt(const lex::Token& tok, Args&&... args) {
  auto node = std::make_unique<NodeT>(std::forward<Args>(args)...);
  node->line = tok.line;
  node->col = tok.col;
  return node;
}

struct DepthGuard {
  int& depth;
  explicit DepthGuard(int& counter) : depth(counter) { ++depth; }
  ~DepthGuard() { --depth; }
  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;
};

std::string stripDigits(const std::string& text) {
  std::string out = text;
  out.erase(std::remove(out.begin(), out.end(), '_'), out.end());
  if (!out.empty() && (out.back() == 'l' || out.back() == 'L')) { out.pop_back(); }
  return out;
}

bool parseIntText(const std::string& text, int64_t& out) {
  const std::string digits = stripDigits(text);
  int base = 10;
  size_t offset = 0;
  if (digits.size() > 1 && digits[0] == '0') {
    const char tag = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
    if (tag == 'x') { base = 16; offset = 2; }
    else if (tag == 'o') { base = 8; offset = 2; }
    else if (tag == 'b') { base = 2; offset = 2; }
    else { base = 8; offset = 1; } // Python 2 octal
  }
  const char* begin = digits.data() + offset;
  const char* end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out, base);
  return ec == std::errc() && ptr == end;
}

bool parseFloatText(const std::string& text, double& out) {
  const std::string digits = stripDigits(text);
  char* endp = nullptr;
  out = std::strtod(digits.c_str(), &endp);
  return endp != nullptr && *endp == '\0';
}

ast::CompareOp compareOpFor(TK kind, bool& ok) {
  ok = true;
  switch (kind) {
    case TK::EqEq: return ast::CompareOp::Eq;
    case TK::NotEq: return ast::CompareOp::NotEq;
    case TK::Lt: return ast::CompareOp::Lt;
    case TK::Le: return ast::CompareOp::Le;
    case TK::Gt: return ast::CompareOp::Gt;
    case TK::Ge: return ast::CompareOp::Ge;
    default: break;
  }
  ok = false;
  return ast::CompareOp::Eq;
}
} // namespace

const lex::Token& Parser::peek() const { return peekAt(0); }
const lex::Token& Parser::peekNext() const { return peekAt(1); }
const lex::Token& Parser::peekAt(size_t offset) const {
  // Safe in presence of End sentry
  const size_t idx = pos_ + offset;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}
lex::Token Parser::get() {
  if (pos_ + 1 < tokens_.size()) { return tokens_[pos_++]; }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

bool Parser::expect(TK tokenKind) {
  if (match(tokenKind)) { return true; }
  return syntaxError({tokenKind});
}

bool Parser::failAt(const lex::Token& tok, const std::string& msg) {
  if (failed_) { return false; }
  failed_ = true;
  error_ = ParseError(msg, tok.line);
  error_.column = tok.col;
  const std::string& src = lexer_.sourceLine(tok.line);
  if (!src.empty()) { error_.text = src; }
  return false;
}

bool Parser::syntaxError(std::initializer_list<TK> expected) {
  const lex::Token& tok = peek();
  // Lexical errors carry their own message
  if (tok.kind == TK::Error) { return failAt(tok, tok.text); }
  std::string msg = "syntax error, unexpected ";
  msg += lex::to_string(tok.kind);
  bool first = true;
  for (const TK kind : expected) {
    msg += first ? ", expecting " : " or ";
    msg += lex::to_string(kind);
    first = false;
  }
  return failAt(tok, msg);
}

bool Parser::enterNesting() {
  return nesting_ <= kMaxNesting || failAt(peek(), "Nesting too deep");
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  tokens_ = lexer_.tokens();
  if (tokens_.empty()) { tokens_.push_back(lex::Token{TK::End, "", 1, 1}); }
  pos_ = 0;
  failed_ = false;
  error_ = ParseError{};
  nesting_ = 0;
  auto mod = std::make_unique<ast::Module>();
  mod->line = 1;
  while (peek().kind != TK::End) {
    if (!parseStatement(mod->body, Scope::Module)) { return nullptr; }
  }
  return mod;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Parser::parseStatement(ast::StmtList& out, Scope scope) {
  switch (peek().kind) {
    case TK::Newline: (void)get(); return true;
    case TK::At:
    case TK::Def: return parseFunction(out);
    case TK::Class:
      if (scope == Scope::Class) { return syntaxError(); }
      return parseClass(out);
    case TK::If: return parseIf(out, scope);
    case TK::Import:
      if (scope == Scope::Class) { return syntaxError(); }
      return parseImport(out);
    case TK::From:
      if (scope == Scope::Class) { return syntaxError(); }
      return parseFromImport(out);
    case TK::Pass:
    case TK::Ellipsis:
    case TK::String: // docstring
      (void)get();
      return expect(TK::Newline);
    case TK::TypeComment:
      return parseIgnoreComment() && expect(TK::Newline);
    case TK::Ident: return parseAssign(out, scope);
    default: return syntaxError();
  }
}

bool Parser::parseBlock(ast::StmtList& out, Scope scope) {
  DepthGuard guard(nesting_);
  if (!enterNesting()) { return false; }
  if (!expect(TK::Newline) || !expect(TK::Indent)) { return false; }
  while (!match(TK::Dedent)) {
    if (!parseStatement(out, scope)) { return false; }
  }
  return true;
}

bool Parser::parseDottedName(std::string& out) {
  const lex::Token first = peek();
  if (!expect(TK::Ident)) { return false; }
  out = first.text;
  while (peek().kind == TK::Dot && peekNext().kind == TK::Ident) {
    (void)get();
    out += ".";
    out += get().text;
  }
  return true;
}

// ---- functions ----

bool Parser::parseFunction(ast::StmtList& out) {
  std::vector<std::unique_ptr<ast::Name>> decorators;
  while (match(TK::At)) {
    const lex::Token nameTok = peek();
    std::string dotted;
    if (!parseDottedName(dotted)) { return false; }
    decorators.push_back(makeAt<ast::Name>(nameTok, dotted));
    if (!expect(TK::Newline)) { return false; }
  }
  const lex::Token defTok = peek();
  if (!expect(TK::Def)) { return false; }
  const lex::Token nameTok = peek();
  if (!expect(TK::Ident)) { return false; }
  auto def = makeAt<ast::FunctionDef>(defTok, nameTok.text);
  def->decorators = std::move(decorators);
  if (match(TK::PythonCode)) {
    def->external = true;
    if (!expect(TK::Newline)) { return false; }
    out.push_back(std::move(def));
    return true;
  }
  if (!expect(TK::LParen) || !parseParamList(*def)) { return false; }
  if (match(TK::Arrow)) {
    def->returnType = parseType();
    if (!def->returnType) { return false; }
  }
  if (!match(TK::Newline)) {
    if (!match(TK::Colon)) { return syntaxError({TK::Colon}); }
    if (!parseFunctionBody(*def)) { return false; }
  }
  out.push_back(std::move(def));
  return true;
}

bool Parser::parseFunctionBody(ast::FunctionDef& def) {
  if (peek().kind == TK::TypeComment && !parseIgnoreComment()) { return false; }
  if (match(TK::Newline)) {
    if (!expect(TK::Indent)) { return false; }
    while (!match(TK::Dedent)) {
      if (!parseBodyStatement(def)) { return false; }
    }
    return true;
  }
  return parseBodyStatement(def);
}

bool Parser::parseBodyStatement(ast::FunctionDef& def) {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Ellipsis:
    case TK::Pass:
    case TK::String:
      (void)get();
      break;
    case TK::TypeComment:
      break;
    case TK::Raise: {
      (void)get();
      auto exc = parseType();
      if (!exc) { return false; }
      if (match(TK::LParen) && !expect(TK::RParen)) { return false; }
      def.raises.push_back(std::move(exc));
      break;
    }
    case TK::Ident: {
      if (peekNext().kind != TK::ColonEqual) {
        (void)get();
        return syntaxError({TK::ColonEqual});
      }
      (void)get();
      (void)get();
      auto type = parseType();
      if (!type) { return false; }
      def.mutators.push_back(ast::MutatorDecl{tok.text, std::move(type)});
      break;
    }
    default: return syntaxError();
  }
  if (peek().kind == TK::TypeComment && !parseIgnoreComment()) { return false; }
  return expect(TK::Newline);
}

bool Parser::atIgnoreComment() const {
  if (peek().kind != TK::TypeComment) { return false; }
  const lex::Token& word = peekNext();
  if (word.kind != TK::Ident || word.text != "ignore") { return false; }
  const TK after = peekAt(2).kind;
  return after == TK::Newline || after == TK::LBracket || after == TK::End;
}

// `# type: ignore` or `# type: ignore[code, ...]`
bool Parser::parseIgnoreComment() {
  if (!expect(TK::TypeComment)) { return false; }
  const lex::Token& word = peek();
  if (word.kind != TK::Ident || word.text != "ignore") { return syntaxError(); }
  (void)get();
  if (match(TK::LBracket)) {
    while (peek().kind == TK::Ident || peek().kind == TK::Comma || peek().kind == TK::Minus) { (void)get(); }
    return expect(TK::RBracket);
  }
  return true;
}

bool Parser::parseParamList(ast::FunctionDef& def) {
  if (match(TK::RParen)) { return true; }
  while (true) {
    if (!parseParam(def)) { return false; }
    if (match(TK::RParen)) { return true; }
    if (!match(TK::Comma)) { return syntaxError({TK::Comma, TK::RParen}); }
    if (match(TK::RParen)) { return true; }
  }
}

bool Parser::parseParam(ast::FunctionDef& def) {
  ast::Param param;
  if (match(TK::Ellipsis)) {
    param.kind = ast::ParamKind::Ellipsis;
    def.params.push_back(std::move(param));
    return true;
  }
  if (match(TK::StarStar)) {
    param.kind = ast::ParamKind::StarStar;
    const lex::Token nameTok = peek();
    if (!expect(TK::Ident)) { return false; }
    param.name = nameTok.text;
  } else if (match(TK::Star)) {
    param.kind = ast::ParamKind::Star;
    if (peek().kind == TK::Ident) { param.name = get().text; }
  } else {
    const lex::Token nameTok = peek();
    if (!expect(TK::Ident)) { return false; }
    param.name = nameTok.text;
  }
  if (!param.name.empty() && match(TK::Colon)) {
    param.annotation = parseType();
    if (!param.annotation) { return false; }
  }
  if (param.kind == ast::ParamKind::Normal && match(TK::Equal)) {
    param.defaultValue = parseDefaultValue();
    if (!param.defaultValue) { return false; }
  }
  def.params.push_back(std::move(param));
  return true;
}

std::unique_ptr<ast::Expr> Parser::parseDefaultValue() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Int:
    case TK::Float:
    case TK::Minus:
      return parseSignedNumber();
    case TK::BoolLit:
      (void)get();
      return makeAt<ast::BoolLiteral>(tok, tok.text == "True");
    case TK::Ellipsis:
      (void)get();
      return makeAt<ast::EllipsisLiteral>(tok);
    case TK::String:
      (void)get();
      return makeAt<ast::StringLiteral>(tok, unquoteString(tok.text));
    case TK::Ident: {
      std::string dotted;
      if (!parseDottedName(dotted)) { return nullptr; }
      return makeAt<ast::Name>(tok, dotted);
    }
    default:
      (void)syntaxError();
      return nullptr;
  }
}

std::unique_ptr<ast::Expr> Parser::parseSignedNumber() {
  const lex::Token first = peek();
  const bool negative = match(TK::Minus);
  const lex::Token tok = peek();
  if (tok.kind == TK::Int) {
    int64_t value = 0;
    if (!parseIntText(tok.text, value)) { (void)syntaxError(); return nullptr; }
    (void)get();
    return makeAt<ast::IntLiteral>(first, negative ? -value : value);
  }
  if (tok.kind == TK::Float) {
    double value = 0.0;
    if (!parseFloatText(tok.text, value)) { (void)syntaxError(); return nullptr; }
    (void)get();
    return makeAt<ast::FloatLiteral>(first, negative ? -value : value);
  }
  (void)syntaxError({TK::Int});
  return nullptr;
}

// ---- classes ----

bool Parser::parseClass(ast::StmtList& out) {
  const lex::Token classTok = get();
  const lex::Token nameTok = peek();
  if (!expect(TK::Ident)) { return false; }
  auto cls = makeAt<ast::ClassDef>(classTok, nameTok.text);
  if (match(TK::LParen) && !parseClassArgs(*cls)) { return false; }
  if (!expect(TK::Colon)) { return false; }
  if (peek().kind == TK::Newline) {
    if (!parseBlock(cls->body, Scope::Class)) { return false; }
  } else {
    // class Foo: pass / class Foo: ...
    if (peek().kind != TK::Pass && peek().kind != TK::Ellipsis) { return syntaxError({TK::Newline}); }
    (void)get();
    if (!expect(TK::Newline)) { return false; }
  }
  out.push_back(std::move(cls));
  return true;
}

bool Parser::parseClassArgs(ast::ClassDef& cls) {
  if (match(TK::RParen)) { return true; }
  while (true) {
    ast::ClassArg arg;
    if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
      arg.keyword = get().text;
      (void)get();
    }
    arg.value = parseType();
    if (!arg.value) { return false; }
    cls.args.push_back(std::move(arg));
    if (match(TK::RParen)) { return true; }
    if (!match(TK::Comma)) { return syntaxError({TK::Comma, TK::RParen}); }
    if (match(TK::RParen)) { return true; }
  }
}

// ---- conditionals ----

bool Parser::parseIf(ast::StmtList& out, Scope scope) {
  const lex::Token ifTok = get();
  auto cond = parseCondition();
  if (!cond) { return false; }
  auto node = makeAt<ast::IfStmt>(ifTok, std::move(cond));
  if (!parseIfChain(*node, scope)) { return false; }
  out.push_back(std::move(node));
  return true;
}

bool Parser::parseIfChain(ast::IfStmt& node, Scope scope) {
  if (!expect(TK::Colon) || !parseBlock(node.thenBody, scope)) { return false; }
  const lex::Token tok = peek();
  if (tok.kind == TK::Elif) {
    (void)get();
    auto cond = parseCondition();
    if (!cond) { return false; }
    auto elif = makeAt<ast::IfStmt>(tok, std::move(cond));
    elif->isElif = true;
    if (!parseIfChain(*elif, scope)) { return false; }
    node.elseBody.push_back(std::move(elif));
    return true;
  }
  if (match(TK::Else)) {
    return expect(TK::Colon) && parseBlock(node.elseBody, scope);
  }
  return true;
}

std::unique_ptr<ast::Expr> Parser::parseCondition() {
  DepthGuard guard(nesting_);
  if (!enterNesting()) { return nullptr; }
  const lex::Token first = peek();
  auto term = parseConditionTerm();
  if (!term) { return nullptr; }
  if (peek().kind != TK::Or) { return term; }
  auto node = makeAt<ast::OrExpr>(first);
  node->operands.push_back(std::move(term));
  while (match(TK::Or)) {
    auto next = parseConditionTerm();
    if (!next) { return nullptr; }
    node->operands.push_back(std::move(next));
  }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseConditionTerm() {
  const lex::Token tok = peek();
  if (match(TK::LParen)) {
    auto inner = parseCondition();
    if (!inner || !expect(TK::RParen)) { return nullptr; }
    return inner;
  }
  std::string dotted;
  if (!parseDottedName(dotted)) { return nullptr; }
  std::unique_ptr<ast::Expr> left = makeAt<ast::Name>(tok, dotted);
  if (match(TK::LBracket)) {
    auto sub = makeAt<ast::Subscript>(tok, std::move(left));
    auto index = parseIndexOrSlice();
    if (!index) { return nullptr; }
    sub->elements.push_back(std::move(index));
    if (!expect(TK::RBracket)) { return nullptr; }
    left = std::move(sub);
  }
  bool ok = false;
  const ast::CompareOp op = compareOpFor(peek().kind, ok);
  if (!ok) { (void)syntaxError(); return nullptr; }
  (void)get();
  auto cmp = makeAt<ast::Compare>(tok);
  cmp->left = std::move(left);
  cmp->op = op;
  cmp->right = parseConditionValue();
  if (!cmp->right) { return nullptr; }
  return cmp;
}

std::unique_ptr<ast::Expr> Parser::parseIndexOrSlice() {
  const lex::Token tok = peek();
  std::unique_ptr<ast::Expr> start;
  if (peek().kind != TK::Colon) {
    start = parseSignedNumber();
    if (!start) { return nullptr; }
  }
  if (!match(TK::Colon)) { return start; }
  auto slice = makeAt<ast::Slice>(tok);
  slice->start = std::move(start);
  if (peek().kind != TK::Colon && peek().kind != TK::RBracket) {
    slice->stop = parseSignedNumber();
    if (!slice->stop) { return nullptr; }
  }
  if (match(TK::Colon) && peek().kind != TK::RBracket) {
    slice->step = parseSignedNumber();
    if (!slice->step) { return nullptr; }
  }
  return slice;
}

std::unique_ptr<ast::Expr> Parser::parseConditionValue() {
  DepthGuard guard(nesting_);
  if (!enterNesting()) { return nullptr; }
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Int:
    case TK::Float:
    case TK::Minus:
      return parseSignedNumber();
    case TK::String:
      (void)get();
      return makeAt<ast::StringLiteral>(tok, unquoteString(tok.text));
    case TK::LParen: {
      (void)get();
      auto tuple = makeAt<ast::TupleLiteral>(tok);
      while (!match(TK::RParen)) {
        auto elem = parseConditionValue();
        if (!elem) { return nullptr; }
        tuple->elements.push_back(std::move(elem));
        if (!match(TK::Comma)) {
          if (!expect(TK::RParen)) { return nullptr; }
          break;
        }
      }
      return tuple;
    }
    default:
      (void)syntaxError();
      return nullptr;
  }
}

// ---- imports ----

bool Parser::parseImport(ast::StmtList& out) {
  const lex::Token tok = get();
  auto node = makeAt<ast::Import>(tok);
  do {
    ast::Alias alias;
    if (!parseDottedName(alias.name)) { return false; }
    if (match(TK::As)) {
      const lex::Token asTok = peek();
      if (!expect(TK::Ident)) { return false; }
      alias.asname = asTok.text;
    }
    node->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  if (!expect(TK::Newline)) { return false; }
  out.push_back(std::move(node));
  return true;
}

bool Parser::parseFromImport(ast::StmtList& out) {
  const lex::Token tok = get();
  auto node = makeAt<ast::ImportFrom>(tok);
  // Relative imports: leading dots
  while (match(TK::Dot)) { node->module += "."; }
  if (peek().kind == TK::Ident || node->module.empty()) {
    std::string dotted;
    if (!parseDottedName(dotted)) { return false; }
    node->module += dotted;
  }
  if (!expect(TK::Import)) { return false; }
  if (match(TK::Star)) {
    node->star = true;
  } else if (match(TK::LParen)) {
    if (!parseImportNames(node->names, true)) { return false; }
  } else if (!parseImportNames(node->names, false)) {
    return false;
  }
  if (!expect(TK::Newline)) { return false; }
  out.push_back(std::move(node));
  return true;
}

bool Parser::parseImportNames(std::vector<ast::Alias>& names, bool parenthesized) {
  while (true) {
    const lex::Token nameTok = peek();
    if (!expect(TK::Ident)) { return false; }
    ast::Alias alias(nameTok.text, "");
    if (match(TK::As)) {
      const lex::Token asTok = peek();
      if (!expect(TK::Ident)) { return false; }
      alias.asname = asTok.text;
    }
    names.push_back(std::move(alias));
    if (!match(TK::Comma)) { break; }
    // A trailing comma is only legal inside parentheses
    if (parenthesized && peek().kind == TK::RParen) { break; }
  }
  return !parenthesized || expect(TK::RParen);
}

// ---- assignments ----

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Parser::parseAssign(ast::StmtList& out, Scope scope) {
  const lex::Token target = get();
  if (match(TK::Colon)) {
    // x: T [= ...]
    auto annotation = parseType();
    if (!annotation) { return false; }
    auto stmt = makeAt<ast::AssignStmt>(target, target.text, nullptr);
    stmt->annotation = std::move(annotation);
    if (match(TK::Equal)) {
      const lex::Token valueTok = peek();
      if (!expect(TK::Ellipsis)) { return false; }
      stmt->value = makeAt<ast::EllipsisLiteral>(valueTok);
    }
    if (!expect(TK::Newline)) { return false; }
    out.push_back(std::move(stmt));
    return true;
  }
  if (!match(TK::Equal)) { return syntaxError({TK::Colon, TK::Equal}); }

  const lex::Token valueTok = peek();
  if (valueTok.kind == TK::Ident && valueTok.text == "TypeVar" && peekNext().kind == TK::LParen) {
    if (scope == Scope::Class) { return syntaxError(); }
    return parseTypeVar(out, target);
  }
  std::unique_ptr<ast::Expr> value;
  switch (valueTok.kind) {
    case TK::Ellipsis:
      (void)get();
      value = makeAt<ast::EllipsisLiteral>(valueTok);
      break;
    case TK::Int:
    case TK::Float:
    case TK::Minus:
      value = parseSignedNumber();
      break;
    case TK::BoolLit:
      (void)get();
      value = makeAt<ast::BoolLiteral>(valueTok, valueTok.text == "True");
      break;
    default:
      value = parseType();
      break;
  }
  if (!value) { return false; }
  auto stmt = makeAt<ast::AssignStmt>(target, target.text, std::move(value));
  if (!parseTrailingTypeComment(*stmt)) { return false; }
  out.push_back(std::move(stmt));
  return true;
}

bool Parser::parseTrailingTypeComment(ast::AssignStmt& stmt) {
  if (atIgnoreComment()) {
    if (!parseIgnoreComment()) { return false; }
  } else if (match(TK::TypeComment)) {
    stmt.typeComment = parseType();
    if (!stmt.typeComment) { return false; }
  }
  if (!expect(TK::Newline)) { return false; }
  // x = ...
  // # type: T
  const bool bareEllipsis = stmt.value && stmt.value->kind == ast::NodeKind::EllipsisLiteral;
  if (!stmt.typeComment && bareEllipsis && peek().kind == TK::TypeComment && !atIgnoreComment()) {
    (void)get();
    stmt.typeComment = parseType();
    if (!stmt.typeComment) { return false; }
    return expect(TK::Newline);
  }
  return true;
}

bool Parser::parseTypeVar(ast::StmtList& out, const lex::Token& target) {
  (void)get(); // TypeVar
  (void)get(); // (
  const lex::Token nameTok = peek();
  if (!expect(TK::String)) { return false; }
  auto stmt = makeAt<ast::TypeVarStmt>(target, target.text, unquoteString(nameTok.text));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) { break; }
    if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
      std::string key = get().text;
      (void)get();
      std::unique_ptr<ast::Expr> value;
      const lex::Token valueTok = peek();
      if (match(TK::BoolLit)) {
        value = makeAt<ast::BoolLiteral>(valueTok, valueTok.text == "True");
      } else {
        value = parseType();
      }
      if (!value) { return false; }
      stmt->keywords.emplace_back(std::move(key), std::move(value));
      continue;
    }
    // Positional constraints may not follow keywords
    if (!stmt->keywords.empty()) { return syntaxError(); }
    auto constraint = parseType();
    if (!constraint) { return false; }
    stmt->constraints.push_back(std::move(constraint));
  }
  if (!expect(TK::RParen) || !expect(TK::Newline)) { return false; }
  out.push_back(std::move(stmt));
  return true;
}

// ---- types ----

std::unique_ptr<ast::Expr> Parser::parseType() {
  DepthGuard guard(nesting_);
  if (!enterNesting()) { return nullptr; }
  const lex::Token first = peek();
  auto atom = parseTypeAtom();
  if (!atom) { return nullptr; }
  if (peek().kind != TK::Or) { return atom; }
  auto node = makeAt<ast::OrExpr>(first);
  node->operands.push_back(std::move(atom));
  while (match(TK::Or)) {
    auto next = parseTypeAtom();
    if (!next) { return nullptr; }
    node->operands.push_back(std::move(next));
  }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseTypeAtom() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Question:
      (void)get();
      return makeAt<ast::QuestionType>(tok);
    case TK::Ellipsis:
      (void)get();
      return makeAt<ast::EllipsisLiteral>(tok);
    case TK::LParen: {
      (void)get();
      auto inner = parseType();
      if (!inner || !expect(TK::RParen)) { return nullptr; }
      return inner;
    }
    case TK::LBracket: {
      (void)get();
      auto list = makeAt<ast::ListLiteral>(tok);
      if (!parseTypeList(list->elements, true)) { return nullptr; }
      return list;
    }
    case TK::Ident: {
      if (tok.text == "NamedTuple" && peekNext().kind == TK::LParen) { return parseNamedTuple(); }
      std::string dotted;
      if (!parseDottedName(dotted)) { return nullptr; }
      auto name = makeAt<ast::Name>(tok, dotted);
      if (!match(TK::LBracket)) { return name; }
      auto sub = makeAt<ast::Subscript>(tok, std::move(name));
      if (!parseTypeList(sub->elements, false)) { return nullptr; }
      return sub;
    }
    default:
      (void)syntaxError();
      return nullptr;
  }
}

// Elements up to and including the closing ']'; a trailing comma is allowed
bool Parser::parseTypeList(std::vector<std::unique_ptr<ast::Expr>>& out, bool allowEmpty) {
  if (allowEmpty && match(TK::RBracket)) { return true; }
  while (true) {
    auto elem = parseType();
    if (!elem) { return false; }
    out.push_back(std::move(elem));
    if (match(TK::RBracket)) { return true; }
    if (!match(TK::Comma)) { return syntaxError({TK::Comma, TK::RBracket}); }
    if (match(TK::RBracket)) { return true; }
  }
}

std::unique_ptr<ast::Expr> Parser::parseNamedTuple() {
  const lex::Token tok = get(); // NamedTuple
  (void)get();                  // (
  auto fieldName = [this](std::string& out) {
    const lex::Token nameTok = peek();
    if (nameTok.kind == TK::Ident) { out = get().text; return true; }
    if (nameTok.kind == TK::String) { out = unquoteString(get().text); return true; }
    return syntaxError({TK::Ident, TK::String});
  };
  std::string name;
  if (!fieldName(name)) { return nullptr; }
  auto node = makeAt<ast::NamedTupleExpr>(tok, name);
  if (!expect(TK::Comma) || !expect(TK::LBracket)) { return nullptr; }
  while (!match(TK::RBracket)) {
    std::string field;
    if (!expect(TK::LParen) || !fieldName(field) || !expect(TK::Comma)) { return nullptr; }
    auto type = parseType();
    if (!type) { return nullptr; }
    (void)match(TK::Comma);
    if (!expect(TK::RParen)) { return nullptr; }
    node->fields.emplace_back(std::move(field), std::move(type));
    if (!match(TK::Comma)) {
      if (!expect(TK::RBracket)) { return nullptr; }
      break;
    }
  }
  (void)match(TK::Comma);
  if (!expect(TK::RParen)) { return nullptr; }
  return node;
}

std::string Parser::unquoteString(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && text[start] != '"' && text[start] != '\'') { ++start; }
  if (start >= text.size()) { return text; }
  const char quote = text[start];
  const bool triple = text.compare(start, 3, std::string(3, quote)) == 0 && text.size() - start >= 6;
  const size_t width = triple ? 3 : 1;
  if (text.size() < start + (2 * width)) { return std::string(); }
  return text.substr(start + width, text.size() - start - (2 * width));
}

} // namespace pytdc::parse
