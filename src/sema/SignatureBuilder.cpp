/***
 * Name: pytdc::sema::SignatureBuilder (impl)
 * Purpose: Parameter ordering, default inference and signature bodies.
 */
#include "sema/SignatureBuilder.h"
#include "ast/Nodes.h"
#include "pytd/TypeUtils.h"
#include <utility>
#include <vector>

namespace pytdc::sema {

namespace {
pytd::TypePtr inferFromDefault(const ast::Expr& value) {
  switch (value.kind) {
    case ast::NodeKind::IntLiteral: return pytd::MakeNamed("int");
    case ast::NodeKind::FloatLiteral: return pytd::MakeNamed("float");
    case ast::NodeKind::BoolLiteral: return pytd::MakeNamed("bool");
    default: return pytd::MakeNamed("object");
  }
}

bool isNoneDefault(const ast::Expr& value) {
  return value.kind == ast::NodeKind::Name && ast::cast<ast::Name>(value).id == "None";
}

pytd::TypePtr wrapped(const char* base, std::vector<pytd::TypePtr> params) {
  return std::make_unique<pytd::GenericType>(pytd::MakeNamed(base), std::move(params));
}
} // namespace

pytd::TypePtr SignatureBuilder::paramType(const ast::Param& param, int line) {
  if (!param.annotation) {
    if (param.defaultValue) { return inferFromDefault(*param.defaultValue); }
    return pytd::MakeNamed("object");
  }
  auto declared = types_.convert(*param.annotation, line);
  if (!declared) { return nullptr; }
  if (param.defaultValue && isNoneDefault(*param.defaultValue)) {
    std::vector<pytd::TypePtr> members;
    members.push_back(std::move(declared));
    members.push_back(pytd::MakeNamed("NoneType"));
    return pytd::MakeUnion(std::move(members));
  }
  return declared;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool SignatureBuilder::buildParams(const ast::FunctionDef& def, pytd::Signature& sig, size_t& positional) {
  const int line = def.line;
  bool sawStar = false;
  bool bareStar = false;
  bool sawEllipsis = false;
  std::string starStarName;
  size_t kwonlyCount = 0;

  for (const auto& param : def.params) {
    if (!starStarName.empty()) { return ctx_.fail("**" + starStarName + " must be last parameter", line); }
    if (sawEllipsis) { return ctx_.fail("ellipsis (...) must be last parameter", line); }
    switch (param.kind) {
      case ast::ParamKind::Normal: {
        auto type = paramType(param, line);
        if (!type) { return false; }
        pytd::Parameter out{param.name, std::move(type), param.defaultValue != nullptr, sawStar};
        if (sawStar) { ++kwonlyCount; } else { ++positional; }
        sig.params.push_back(std::move(out));
        break;
      }
      case ast::ParamKind::Star: {
        if (sawStar) { return ctx_.fail("Unexpected second *", line); }
        sawStar = true;
        if (param.name.empty()) {
          bareStar = true;
          break;
        }
        pytd::TypePtr type;
        if (param.annotation) {
          auto elem = types_.convert(*param.annotation, line);
          if (!elem) { return false; }
          std::vector<pytd::TypePtr> params;
          params.push_back(std::move(elem));
          type = wrapped("tuple", std::move(params));
        } else {
          type = pytd::MakeNamed("tuple");
        }
        sig.starargs = pytd::Parameter{param.name, std::move(type), false, false};
        break;
      }
      case ast::ParamKind::StarStar: {
        pytd::TypePtr type;
        if (param.annotation) {
          auto value = types_.convert(*param.annotation, line);
          if (!value) { return false; }
          std::vector<pytd::TypePtr> params;
          params.push_back(pytd::MakeNamed("str"));
          params.push_back(std::move(value));
          type = wrapped("dict", std::move(params));
        } else {
          type = pytd::MakeNamed("dict");
        }
        sig.starstarargs = pytd::Parameter{param.name, std::move(type), false, false};
        starStarName = param.name;
        break;
      }
      case ast::ParamKind::Ellipsis: {
        if (bareStar && kwonlyCount == 0) { return ctx_.fail("ellipsis (...) not compatible with bare *", line); }
        sawEllipsis = true;
        if (!sig.starargs) { sig.starargs = pytd::Parameter{"args", pytd::MakeNamed("tuple"), false, false}; }
        if (!sig.starstarargs) { sig.starstarargs = pytd::Parameter{"kwargs", pytd::MakeNamed("dict"), false, false}; }
        break;
      }
    }
  }
  if (bareStar && kwonlyCount == 0) { return ctx_.fail("Named arguments must follow bare *", line); }
  return true;
}

bool SignatureBuilder::hasParameter(const pytd::Signature& sig, const std::string& name) const {
  for (const auto& param : sig.params) {
    if (param.name == name) { return true; }
  }
  return (sig.starargs && sig.starargs->name == name) || (sig.starstarargs && sig.starstarargs->name == name);
}

bool SignatureBuilder::build(const ast::FunctionDef& def, RawDef& out) {
  out.name = def.name;
  out.line = def.line;
  if (def.decorators.size() > 1) { return ctx_.fail("Too many decorators for " + def.name, def.line); }
  if (!def.decorators.empty()) { out.decorator = RecognizeDecorator(def.decorators.front()->id); }
  if (def.external) {
    out.external = true;
    return true;
  }

  pytd::Signature& sig = out.signature;
  if (!buildParams(def, sig, out.positionalCount)) { return false; }

  if (def.returnType) {
    sig.returnType = types_.convert(*def.returnType, def.line);
    if (!sig.returnType) { return false; }
  } else {
    sig.returnType = pytd::MakeAnything();
  }

  for (const auto& raised : def.raises) {
    auto type = types_.convert(*raised, def.line);
    if (!type) { return false; }
    sig.exceptions.push_back(std::move(type));
  }

  for (const auto& mut : def.mutators) {
    if (!hasParameter(sig, mut.name)) { return ctx_.fail("No parameter named " + mut.name, def.line); }
    auto type = types_.convert(*mut.type, def.line);
    if (!type) { return false; }
    sig.mutators.push_back(pytd::Mutator{mut.name, std::move(type)});
  }
  return true;
}

} // namespace pytdc::sema
