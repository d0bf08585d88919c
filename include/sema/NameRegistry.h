/***
 * Name: pytdc::sema::NameRegistry
 * Purpose: Resolve bare type names to model types.
 * Inputs:
 *   - Local class and type variable names (registered before the build pass)
 *   - `from M import X` bindings (registered as they are built)
 * Outputs:
 *   - A NamedType, TypeParameter, AnythingType or NothingType per name
 * Theory of Operation:
 *   Precedence: fixed names (`nothing`, `None`, `NoneType`), then local
 *   classes and type variables, then the built-in alias table (skipped for
 *   the `typing` module itself), then imported bindings. Anything else is
 *   a plain NamedType. The built-in table is a function-local constant.
 */
#pragma once

#include <map>
#include <set>
#include <string>
#include "pytd/Type.h"

namespace pytdc::sema {

class NameRegistry {
 public:
  explicit NameRegistry(bool useBuiltins = true) : useBuiltins_(useBuiltins) {}

  void addLocalClass(const std::string& name) { classes_.insert(name); }
  void addTypeVar(const std::string& name) { typeVars_.insert(name); }
  // `from module import name as local`
  void addImport(const std::string& local, const std::string& target) { imports_[local] = target; }

  bool isLocalClass(const std::string& name) const { return classes_.count(name) != 0; }
  bool isTypeVar(const std::string& name) const { return typeVars_.count(name) != 0; }

  pytd::TypePtr resolve(const std::string& name) const;

  // Built-in alias target for `name`, empty when there is none
  static std::string builtinTarget(const std::string& name);

 private:
  bool useBuiltins_;
  std::set<std::string> classes_;
  std::set<std::string> typeVars_;
  std::map<std::string, std::string> imports_;
};

} // namespace pytdc::sema
