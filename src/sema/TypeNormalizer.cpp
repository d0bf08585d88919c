/***
 * Name: pytdc::sema::TypeNormalizer (impl)
 * Purpose: Canonicalize type expressions.
 */
#include "sema/TypeNormalizer.h"
#include "pytd/Decls.h"
#include "pytd/TypeUtils.h"
#include "pytd/Types.h"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pytdc::sema {

namespace {
bool isEllipsis(const ast::Expr& expr) { return expr.kind == ast::NodeKind::EllipsisLiteral; }

pytd::TypePtr tupleBase() { return pytd::MakeNamed("tuple"); }
} // namespace

pytd::TypePtr TypeNormalizer::fail(const std::string& msg) {
  (void)ctx_.fail(msg, line_);
  return nullptr;
}

pytd::TypePtr TypeNormalizer::convert(const ast::Expr& expr, int line) {
  line_ = line;
  return convertExpr(expr);
}

bool TypeNormalizer::convertAll(const std::vector<std::unique_ptr<ast::Expr>>& elements,
                                std::vector<pytd::TypePtr>& out) {
  for (const auto& elem : elements) {
    auto type = convertExpr(*elem);
    if (!type) { return false; }
    out.push_back(std::move(type));
  }
  return true;
}

pytd::TypePtr TypeNormalizer::convertExpr(const ast::Expr& expr) {
  switch (expr.kind) {
    case ast::NodeKind::Name: {
      auto type = ctx_.registry.resolve(ast::cast<ast::Name>(expr).id);
      if (pytd::IsNamed(*type, "typing.Union")) { return fail("Missing options to typing.Union"); }
      if (pytd::IsNamed(*type, "typing.Optional")) { return fail("Missing options to typing.Optional"); }
      return type;
    }
    case ast::NodeKind::QuestionType:
    case ast::NodeKind::EllipsisLiteral:
      return pytd::MakeAnything();
    case ast::NodeKind::OrExpr: {
      std::vector<pytd::TypePtr> members;
      if (!convertAll(ast::cast<ast::OrExpr>(expr).operands, members)) { return nullptr; }
      return pytd::MakeUnion(std::move(members));
    }
    case ast::NodeKind::ListLiteral:
      return convertImpliedTuple(ast::cast<ast::ListLiteral>(expr));
    case ast::NodeKind::Subscript:
      return convertSubscript(ast::cast<ast::Subscript>(expr));
    case ast::NodeKind::NamedTupleExpr:
      return convertNamedTuple(ast::cast<ast::NamedTupleExpr>(expr));
    default:
      break;
  }
  return fail(std::string("Unexpected ") + ast::to_string(expr.kind) + " in type");
}

pytd::TypePtr TypeNormalizer::convertSubscript(const ast::Subscript& sub) {
  if (sub.value->kind != ast::NodeKind::Name) { return fail("Unexpected subscript in type"); }
  auto base = ctx_.registry.resolve(ast::cast<ast::Name>(*sub.value).id);
  if (pytd::IsNamed(*base, "typing.Callable")) { return convertCallable(std::move(base), sub.elements); }
  const bool isUnion = pytd::IsNamed(*base, "typing.Union");
  const bool isOptional = pytd::IsNamed(*base, "typing.Optional");
  if (isUnion || isOptional) {
    std::vector<pytd::TypePtr> members;
    if (!convertAll(sub.elements, members)) { return nullptr; }
    if (isOptional) { members.push_back(pytd::MakeNamed("NoneType")); }
    return pytd::MakeUnion(std::move(members));
  }
  return convertParameters(std::move(base), sub.elements);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
pytd::TypePtr TypeNormalizer::convertParameters(pytd::TypePtr base,
                                                const std::vector<std::unique_ptr<ast::Expr>>& elements) {
  const size_t count = elements.size();
  if (count == 2 && isEllipsis(*elements[0]) && isEllipsis(*elements[1])) {
    return fail("[..., ...] not supported");
  }
  for (size_t i = 0; i + 1 < count; ++i) {
    if (isEllipsis(*elements[i])) { return fail("ellipsis (...) must be last type parameter"); }
  }
  const bool isTuple = pytd::IsNamed(*base, "tuple");
  std::vector<pytd::TypePtr> params;
  if (!convertAll(elements, params)) { return nullptr; }
  if (isEllipsis(*elements.back())) {
    // B[T, ...] is the homogeneous B[T]
    if (count <= 2) {
      params.resize(1);
      return std::make_unique<pytd::GenericType>(std::move(base), std::move(params));
    }
  }
  if (isTuple) { return std::make_unique<pytd::TupleType>(std::move(base), std::move(params)); }
  return std::make_unique<pytd::GenericType>(std::move(base), std::move(params));
}

pytd::TypePtr TypeNormalizer::convertCallable(pytd::TypePtr base,
                                              const std::vector<std::unique_ptr<ast::Expr>>& elements) {
  if (elements.size() > 2) {
    return fail("Expected 2 parameters to Callable, got " + std::to_string(elements.size()));
  }
  pytd::TypePtr ret = pytd::MakeAnything();
  if (elements.size() == 2) {
    ret = convertExpr(*elements[1]);
    if (!ret) { return nullptr; }
  }
  const ast::Expr& first = *elements.front();
  if (first.kind != ast::NodeKind::ListLiteral) {
    auto argType = convertExpr(first);
    if (!argType) { return nullptr; }
    if (argType->kind != pytd::TypeKind::Anything) {
      return fail("First argument to Callable must be a list of argument types");
    }
    // Callable[..., R]
    std::vector<pytd::TypePtr> params;
    params.push_back(std::move(argType));
    params.push_back(std::move(ret));
    return std::make_unique<pytd::GenericType>(std::move(base), std::move(params));
  }
  const auto& list = ast::cast<ast::ListLiteral>(first);
  std::vector<pytd::TypePtr> args;
  // [], [...] and [nothing] all mean no arguments
  const bool noArgs = list.elements.size() == 1
      && (isEllipsis(*list.elements.front())
          || (list.elements.front()->kind == ast::NodeKind::Name
              && ast::cast<ast::Name>(*list.elements.front()).id == "nothing"));
  if (!noArgs && !convertAll(list.elements, args)) { return nullptr; }
  return std::make_unique<pytd::CallableType>(std::move(base), std::move(args), std::move(ret));
}

pytd::TypePtr TypeNormalizer::convertImpliedTuple(const ast::ListLiteral& list) {
  if (list.elements.empty()) {
    std::vector<pytd::TypePtr> params;
    params.push_back(pytd::MakeNothing());
    return std::make_unique<pytd::GenericType>(tupleBase(), std::move(params));
  }
  return convertParameters(tupleBase(), list.elements);
}

pytd::TypePtr TypeNormalizer::convertNamedTuple(const ast::NamedTupleExpr& record) {
  int& seen = ctx_.synthesizedCounts[record.name];
  std::string className = "`" + record.name;
  if (seen > 0) { className += "~" + std::to_string(seen); }
  className += "`";
  ++seen;

  pytd::Class cls;
  cls.name = className;
  std::vector<pytd::TypePtr> fieldTypes;
  for (const auto& [fieldName, fieldExpr] : record.fields) {
    auto type = convertExpr(*fieldExpr);
    if (!type) { return nullptr; }
    fieldTypes.push_back(type->clone());
    cls.constants.push_back(pytd::Constant{fieldName, std::move(type)});
  }
  if (fieldTypes.empty()) {
    fieldTypes.push_back(pytd::MakeNothing());
    cls.parents.push_back(std::make_unique<pytd::GenericType>(tupleBase(), std::move(fieldTypes)));
  } else {
    cls.parents.push_back(std::make_unique<pytd::TupleType>(tupleBase(), std::move(fieldTypes)));
  }
  ctx_.synthesized.push_back(std::move(cls));
  return pytd::MakeNamed(className);
}

} // namespace pytdc::sema
