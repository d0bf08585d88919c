/***
 * Name: test_parser_tree
 * Purpose: Verify raw declaration tree shapes and parser error reporting.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace pytdc;

namespace {
struct Parsed {
  lex::Lexer lexer;
  std::unique_ptr<parse::Parser> parser;
  std::unique_ptr<ast::Module> module;
};

std::unique_ptr<Parsed> parseSrc(const std::string& src) {
  auto out = std::make_unique<Parsed>();
  out->lexer.pushString(src, "test.pyi");
  out->parser = std::make_unique<parse::Parser>(out->lexer);
  out->module = out->parser->parseModule();
  return out;
}

template <typename T>
const T& as(const ast::Node& node, ast::NodeKind kind) {
  EXPECT_EQ(node.kind, kind);
  return static_cast<const T&>(node);
}
} // namespace

TEST(ParserTree, ClassArgsKeepOrderAndKeywords) {
  auto res = parseSrc("class Foo(Bar, metaclass=Meta):\n    pass\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  ASSERT_EQ(res->module->body.size(), 1U);
  const auto& cls = as<ast::ClassDef>(*res->module->body[0], ast::NodeKind::ClassDef);
  EXPECT_EQ(cls.name, "Foo");
  EXPECT_EQ(cls.line, 1);
  ASSERT_EQ(cls.args.size(), 2U);
  EXPECT_TRUE(cls.args[0].keyword.empty());
  EXPECT_EQ(as<ast::Name>(*cls.args[0].value, ast::NodeKind::Name).id, "Bar");
  EXPECT_EQ(cls.args[1].keyword, "metaclass");
  EXPECT_TRUE(cls.body.empty());
}

TEST(ParserTree, DecoratedFunctionWithParams) {
  auto res = parseSrc("@foo.setter\n@overload\ndef f(x: int = 3, *args, **kw) -> int: ...\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  const auto& def = as<ast::FunctionDef>(*res->module->body[0], ast::NodeKind::FunctionDef);
  EXPECT_EQ(def.line, 3);
  ASSERT_EQ(def.decorators.size(), 2U);
  EXPECT_EQ(def.decorators[0]->id, "foo.setter");
  EXPECT_EQ(def.decorators[1]->id, "overload");
  ASSERT_EQ(def.params.size(), 3U);
  EXPECT_EQ(def.params[0].kind, ast::ParamKind::Normal);
  EXPECT_EQ(as<ast::Name>(*def.params[0].annotation, ast::NodeKind::Name).id, "int");
  EXPECT_EQ(as<ast::IntLiteral>(*def.params[0].defaultValue, ast::NodeKind::IntLiteral).value, 3);
  EXPECT_EQ(def.params[1].kind, ast::ParamKind::Star);
  EXPECT_EQ(def.params[1].name, "args");
  EXPECT_EQ(def.params[2].kind, ast::ParamKind::StarStar);
  EXPECT_EQ(def.params[2].name, "kw");
  ASSERT_TRUE(def.returnType);
  EXPECT_FALSE(def.external);
}

TEST(ParserTree, FunctionBodyCollectsMutatorsAndRaises) {
  auto res = parseSrc("def f(x) -> int:\n    x := List[int]\n    raise E()\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  const auto& def = as<ast::FunctionDef>(*res->module->body[0], ast::NodeKind::FunctionDef);
  ASSERT_EQ(def.mutators.size(), 1U);
  EXPECT_EQ(def.mutators[0].name, "x");
  const auto& sub = as<ast::Subscript>(*def.mutators[0].type, ast::NodeKind::Subscript);
  EXPECT_EQ(sub.elements.size(), 1U);
  ASSERT_EQ(def.raises.size(), 1U);
  EXPECT_EQ(as<ast::Name>(*def.raises[0], ast::NodeKind::Name).id, "E");
}

TEST(ParserTree, ExternalFunction) {
  auto res = parseSrc("def foo PYTHONCODE\n");
  ASSERT_TRUE(res->module);
  const auto& def = as<ast::FunctionDef>(*res->module->body[0], ast::NodeKind::FunctionDef);
  EXPECT_TRUE(def.external);
  EXPECT_TRUE(def.params.empty());
}

TEST(ParserTree, ElifNestsInElseBody) {
  auto res = parseSrc("if a == 1:\n  x = ...\nelif b < (3, 4):\n  y = ...\nelse:\n  z = ...\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  ASSERT_EQ(res->module->body.size(), 1U);
  const auto& top = as<ast::IfStmt>(*res->module->body[0], ast::NodeKind::IfStmt);
  EXPECT_FALSE(top.isElif);
  EXPECT_EQ(top.thenBody.size(), 1U);
  ASSERT_EQ(top.elseBody.size(), 1U);
  const auto& elif = as<ast::IfStmt>(*top.elseBody[0], ast::NodeKind::IfStmt);
  EXPECT_TRUE(elif.isElif);
  EXPECT_EQ(elif.line, 3);
  const auto& cmp = as<ast::Compare>(*elif.cond, ast::NodeKind::Compare);
  EXPECT_EQ(cmp.op, ast::CompareOp::Lt);
  EXPECT_EQ(as<ast::TupleLiteral>(*cmp.right, ast::NodeKind::TupleLiteral).elements.size(), 2U);
  ASSERT_EQ(elif.elseBody.size(), 1U);
  EXPECT_EQ(as<ast::AssignStmt>(*elif.elseBody[0], ast::NodeKind::AssignStmt).target, "z");
}

TEST(ParserTree, ConditionOrAndSlice) {
  auto res = parseSrc("if sys.version_info[:2] >= (3, 5) or sys.platform == 'linux':\n  x = ...\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  const auto& stmt = as<ast::IfStmt>(*res->module->body[0], ast::NodeKind::IfStmt);
  const auto& disj = as<ast::OrExpr>(*stmt.cond, ast::NodeKind::OrExpr);
  ASSERT_EQ(disj.operands.size(), 2U);
  const auto& left = as<ast::Compare>(*disj.operands[0], ast::NodeKind::Compare);
  const auto& sub = as<ast::Subscript>(*left.left, ast::NodeKind::Subscript);
  EXPECT_EQ(as<ast::Name>(*sub.value, ast::NodeKind::Name).id, "sys.version_info");
  const auto& slice = as<ast::Slice>(*sub.elements.at(0), ast::NodeKind::Slice);
  EXPECT_FALSE(slice.start);
  EXPECT_EQ(as<ast::IntLiteral>(*slice.stop, ast::NodeKind::IntLiteral).value, 2);
  EXPECT_FALSE(slice.step);
  const auto& right = as<ast::Compare>(*disj.operands[1], ast::NodeKind::Compare);
  EXPECT_EQ(as<ast::StringLiteral>(*right.right, ast::NodeKind::StringLiteral).value, "linux");
}

TEST(ParserTree, TypeVarConstraintsAndKeywords) {
  auto res = parseSrc("T = TypeVar('T', int, str, bound=Foo)\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  const auto& tv = as<ast::TypeVarStmt>(*res->module->body[0], ast::NodeKind::TypeVarStmt);
  EXPECT_EQ(tv.name, "T");
  EXPECT_EQ(tv.declaredName, "T");
  EXPECT_EQ(tv.constraints.size(), 2U);
  ASSERT_EQ(tv.keywords.size(), 1U);
  EXPECT_EQ(tv.keywords[0].first, "bound");
}

TEST(ParserTree, TypeVarPositionalAfterKeyword) {
  auto res = parseSrc("T = TypeVar('T', bound=Foo, int)\n");
  EXPECT_FALSE(res->module);
  EXPECT_EQ(res->parser->error().message, "syntax error, unexpected NAME");
}

TEST(ParserTree, Imports) {
  auto res = parseSrc("import a.b as c, d\nfrom ..foo import (x as y, z,)\nfrom m import *\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  ASSERT_EQ(res->module->body.size(), 3U);
  const auto& imp = as<ast::Import>(*res->module->body[0], ast::NodeKind::Import);
  ASSERT_EQ(imp.names.size(), 2U);
  EXPECT_EQ(imp.names[0].name, "a.b");
  EXPECT_EQ(imp.names[0].asname, "c");
  EXPECT_TRUE(imp.names[1].asname.empty());
  const auto& from = as<ast::ImportFrom>(*res->module->body[1], ast::NodeKind::ImportFrom);
  EXPECT_EQ(from.module, "..foo");
  ASSERT_EQ(from.names.size(), 2U);
  EXPECT_EQ(from.names[0].asname, "y");
  EXPECT_FALSE(from.star);
  EXPECT_TRUE(as<ast::ImportFrom>(*res->module->body[2], ast::NodeKind::ImportFrom).star);
}

TEST(ParserTree, AssignmentForms) {
  auto res = parseSrc("a = ...  # type: int or str\nb: List[int] = ...\nc = 0\nd = Foo\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  ASSERT_EQ(res->module->body.size(), 4U);
  const auto& first = as<ast::AssignStmt>(*res->module->body[0], ast::NodeKind::AssignStmt);
  EXPECT_EQ(as<ast::OrExpr>(*first.typeComment, ast::NodeKind::OrExpr).operands.size(), 2U);
  const auto& second = as<ast::AssignStmt>(*res->module->body[1], ast::NodeKind::AssignStmt);
  EXPECT_TRUE(second.annotation);
  EXPECT_EQ(second.value->kind, ast::NodeKind::EllipsisLiteral);
  EXPECT_FALSE(second.typeComment);
  const auto& third = as<ast::AssignStmt>(*res->module->body[2], ast::NodeKind::AssignStmt);
  EXPECT_EQ(as<ast::IntLiteral>(*third.value, ast::NodeKind::IntLiteral).value, 0);
  const auto& fourth = as<ast::AssignStmt>(*res->module->body[3], ast::NodeKind::AssignStmt);
  EXPECT_EQ(as<ast::Name>(*fourth.value, ast::NodeKind::Name).id, "Foo");
}

TEST(ParserTree, NamedTupleExpression) {
  auto res = parseSrc("x = ...  # type: NamedTuple('foo', [('a', int), ('b', str)])\n");
  ASSERT_TRUE(res->module) << res->parser->error().str();
  const auto& stmt = as<ast::AssignStmt>(*res->module->body[0], ast::NodeKind::AssignStmt);
  const auto& tuple = as<ast::NamedTupleExpr>(*stmt.typeComment, ast::NodeKind::NamedTupleExpr);
  EXPECT_EQ(tuple.name, "foo");
  ASSERT_EQ(tuple.fields.size(), 2U);
  EXPECT_EQ(tuple.fields[1].first, "b");
}

TEST(ParserTree, SyntaxErrorCarriesColumnAndText) {
  auto res = parseSrc("def f(x: int) -> :\n");
  ASSERT_FALSE(res->module);
  const auto& err = res->parser->error();
  EXPECT_EQ(err.message, "syntax error, unexpected ':'");
  EXPECT_EQ(err.line, 1);
  EXPECT_EQ(err.column, 18);
  EXPECT_EQ(err.text, "def f(x: int) -> :");
}

TEST(ParserTree, ExpectedTokensListed) {
  auto res = parseSrc("def f() -> int x\n");
  ASSERT_FALSE(res->module);
  EXPECT_EQ(res->parser->error().message, "syntax error, unexpected NAME, expecting ':'");
}

TEST(ParserTree, ImportInsideClassRejected) {
  auto res = parseSrc("class A:\n  import os\n");
  ASSERT_FALSE(res->module);
  EXPECT_EQ(res->parser->error().message, "syntax error, unexpected IMPORT");
  EXPECT_EQ(res->parser->error().line, 2);
  EXPECT_EQ(res->parser->error().column, 3);
}

TEST(ParserTree, LexicalErrorSurfaces) {
  auto res = parseSrc("x = $\n");
  ASSERT_FALSE(res->module);
  EXPECT_EQ(res->parser->error().message, "Illegal character '$'");
  EXPECT_EQ(res->parser->error().column, 5);
}

TEST(ParserTree, NestingLimit) {
  std::string type = "int";
  for (int i = 0; i < 150; ++i) { type = "List[" + type + "]"; }
  auto res = parseSrc("x = ...  # type: " + type + "\n");
  ASSERT_FALSE(res->module);
  EXPECT_EQ(res->parser->error().message, "Nesting too deep");
}

TEST(ParserTree, TokenCountReported) {
  auto res = parseSrc("x = ...\n");
  ASSERT_TRUE(res->module);
  EXPECT_EQ(res->parser->tokenCount(), 5U);
}
