/***
 * Name: pytdc::sema::Builder (impl)
 * Purpose: Statement conversion over live branches.
 */
#include "sema/Builder.h"
#include "pytd/TypeUtils.h"
#include "sema/detail/checks/MergeSignatures.h"
#include "sema/detail/checks/Prescan.h"
#include <string>
#include <utility>

namespace pytdc::sema {

const Builder::Body &Builder::liveBranch(const ast::IfStmt &ifs) const {
  const auto it = ctx_.liveness.find(&ifs);
  const bool live = it != ctx_.liveness.end() && it->second;
  return live ? ifs.thenBody : ifs.elseBody;
}

bool Builder::build(const ast::Module &raw, pytd::Module &out) {
  out.name = ctx_.moduleName;
  if (!detail::prescanModule(raw, ctx_)) { return false; }

  std::vector<RawDef> defs;
  if (!buildModuleBody(raw.body, out, defs)) { return false; }
  if (!detail::mergeModuleDefs(std::move(defs), ctx_, out.functions)) { return false; }

  for (auto &cls : ctx_.synthesized) { out.classes.push_back(std::move(cls)); }
  ctx_.synthesized.clear();
  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Builder::buildModuleBody(const Body &body, pytd::Module &out, std::vector<RawDef> &defs) {
  for (const auto &stmt : body) {
    bool ok = true;
    switch (stmt->kind) {
      case ast::NodeKind::IfStmt:
        ok = buildModuleBody(liveBranch(ast::cast<ast::IfStmt>(*stmt)), out, defs);
        break;
      case ast::NodeKind::ClassDef:
        ok = buildClass(ast::cast<ast::ClassDef>(*stmt), out);
        break;
      case ast::NodeKind::FunctionDef:
        ok = buildDef(ast::cast<ast::FunctionDef>(*stmt), defs);
        break;
      case ast::NodeKind::AssignStmt:
        ok = buildModuleAssign(ast::cast<ast::AssignStmt>(*stmt), out);
        break;
      case ast::NodeKind::Import:
        ok = buildImport(ast::cast<ast::Import>(*stmt));
        break;
      case ast::NodeKind::ImportFrom:
        ok = buildImportFrom(ast::cast<ast::ImportFrom>(*stmt), out);
        break;
      case ast::NodeKind::TypeVarStmt:
        ok = buildTypeVar(ast::cast<ast::TypeVarStmt>(*stmt), out);
        break;
      default:
        ok = ctx_.fail(std::string("Unexpected ") + ast::to_string(stmt->kind) + " at module level", stmt->line);
        break;
    }
    if (!ok) { return false; }
  }
  return true;
}

bool Builder::buildClassBody(const Body &body, int classLine, pytd::Class &out, std::vector<RawDef> &defs) {
  for (const auto &stmt : body) {
    bool ok = true;
    switch (stmt->kind) {
      case ast::NodeKind::IfStmt:
        ok = buildClassBody(liveBranch(ast::cast<ast::IfStmt>(*stmt)), classLine, out, defs);
        break;
      case ast::NodeKind::FunctionDef:
        ok = buildDef(ast::cast<ast::FunctionDef>(*stmt), defs);
        break;
      case ast::NodeKind::AssignStmt:
        ok = buildClassAssign(ast::cast<ast::AssignStmt>(*stmt), classLine, out);
        break;
      default:
        ok = ctx_.fail(std::string("Unexpected ") + ast::to_string(stmt->kind) + " in class body", stmt->line);
        break;
    }
    if (!ok) { return false; }
  }
  return true;
}

bool Builder::buildClassArgs(const ast::ClassDef &cls, pytd::Class &out) {
  for (const auto &arg : cls.args) {
    if (!arg.keyword.empty() && arg.keyword != "metaclass") {
      return ctx_.fail("Only 'metaclass' allowed as classdef kwarg", cls.line);
    }
    if (out.metaclass) { return ctx_.fail("metaclass must be last argument", cls.line); }
    auto type = types_.convert(*arg.value, cls.line);
    if (!type) { return false; }
    if (!arg.keyword.empty()) {
      out.metaclass = std::move(type);
    } else if (type->kind != pytd::TypeKind::Nothing) {
      out.parents.push_back(std::move(type));
    }
  }
  return true;
}

bool Builder::buildClass(const ast::ClassDef &cls, pytd::Module &out) {
  pytd::Class built;
  built.name = cls.name;
  ctx_.classLines.emplace(cls.name, cls.line);
  if (!buildClassArgs(cls, built)) { return false; }

  std::vector<RawDef> defs;
  if (!buildClassBody(cls.body, cls.line, built, defs)) { return false; }
  std::vector<pytd::Constant> properties;
  if (!detail::mergeClassDefs(std::move(defs), cls.line, ctx_, built.methods, properties)) { return false; }
  for (auto &prop : properties) { built.constants.push_back(std::move(prop)); }
  out.classes.push_back(std::move(built));
  return true;
}

bool Builder::buildDef(const ast::FunctionDef &def, std::vector<RawDef> &defs) {
  RawDef raw;
  if (!sigs_.build(def, raw)) { return false; }
  defs.push_back(std::move(raw));
  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
pytd::TypePtr Builder::constantType(const ast::AssignStmt &stmt, bool &handled) {
  handled = true;
  if (stmt.annotation) { return types_.convert(*stmt.annotation, stmt.line); }
  switch (stmt.value->kind) {
    case ast::NodeKind::EllipsisLiteral:
      if (stmt.typeComment) { return types_.convert(*stmt.typeComment, stmt.line); }
      return pytd::MakeAnything();
    case ast::NodeKind::IntLiteral:
      if (ast::cast<ast::IntLiteral>(*stmt.value).value != 0) {
        (void)ctx_.fail("Only '0' allowed as int literal", stmt.line);
        return nullptr;
      }
      if (stmt.typeComment) { return types_.convert(*stmt.typeComment, stmt.line); }
      return pytd::MakeNamed("int");
    case ast::NodeKind::FloatLiteral:
      (void)ctx_.fail("Only '0' allowed as int literal", stmt.line);
      return nullptr;
    case ast::NodeKind::BoolLiteral:
      if (stmt.typeComment) { return types_.convert(*stmt.typeComment, stmt.line); }
      return pytd::MakeNamed("bool");
    default:
      handled = false;
      return nullptr;
  }
}

bool Builder::buildModuleAssign(const ast::AssignStmt &stmt, pytd::Module &out) {
  bool handled = false;
  auto type = constantType(stmt, handled);
  if (handled) {
    if (!type) { return false; }
    out.constants.push_back(pytd::Constant{stmt.target, std::move(type)});
    return true;
  }
  auto target = types_.convert(*stmt.value, stmt.line);
  if (!target) { return false; }
  out.aliases.push_back(pytd::Alias{stmt.target, std::move(target)});
  return true;
}

// Inside a class `y = x` copies the type of the already declared constant x
bool Builder::buildClassAssign(const ast::AssignStmt &stmt, int classLine, pytd::Class &out) {
  bool handled = false;
  auto type = constantType(stmt, handled);
  if (handled) {
    if (!type) { return false; }
    out.constants.push_back(pytd::Constant{stmt.target, std::move(type)});
    return true;
  }
  if (stmt.value->kind == ast::NodeKind::Name) {
    const std::string &source = ast::cast<ast::Name>(*stmt.value).id;
    pytd::TypePtr copied;
    for (const auto &constant : out.constants) {
      if (constant.name == source) { copied = constant.type->clone(); }
    }
    if (copied) {
      out.constants.push_back(pytd::Constant{stmt.target, std::move(copied)});
      return true;
    }
  }
  return ctx_.fail("Illegal value for alias '" + stmt.target + "'", classLine);
}

bool Builder::buildImport(const ast::Import &stmt) {
  for (const auto &name : stmt.names) {
    if (!name.asname.empty()) { return ctx_.fail("Renaming of modules not supported", stmt.line); }
  }
  return true;
}

bool Builder::buildImportFrom(const ast::ImportFrom &stmt, pytd::Module &out) {
  if (stmt.star) { return true; }
  for (const auto &name : stmt.names) {
    const std::string local = name.asname.empty() ? name.name : name.asname;
    const std::string target = stmt.module + "." + name.name;
    ctx_.registry.addImport(local, target);
    if (stmt.module != "typing") { out.aliases.push_back(pytd::Alias{local, pytd::MakeNamed(target)}); }
  }
  return true;
}

bool Builder::buildTypeVar(const ast::TypeVarStmt &stmt, pytd::Module &out) {
  if (stmt.declaredName != stmt.name) {
    return ctx_.fail("TypeVar name needs to be '" + stmt.declaredName + "' (not '" + stmt.name + "')", stmt.line);
  }
  pytd::TypeVariable tv{stmt.name, {}};
  for (const auto &constraint : stmt.constraints) {
    auto type = types_.convert(*constraint, stmt.line);
    if (!type) { return false; }
    tv.constraints.push_back(std::move(type));
  }
  out.typeVariables.push_back(std::move(tv));
  return true;
}

} // namespace pytdc::sema
