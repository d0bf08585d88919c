/***
 * Name: pytdc::pytd::Printer
 * Purpose: Render a module in canonical stub syntax.
 * Inputs:
 *   - A built Module
 * Outputs:
 *   - Text whose re-parse prints identically
 * Theory of Operation:
 *   Two passes. The first walks every type the module declares (mutators
 *   and `from M import N` aliases excluded) and records the imports needed
 *   to resolve the printed names. The second renders the sections: imports,
 *   aliases, constants, type variables, classes, functions, joined by a
 *   blank line.
 */
#pragma once

#include <set>
#include <string>
#include "pytd/Decls.h"
#include "pytd/Type.h"

namespace pytdc::pytd {

class Printer {
 public:
  explicit Printer(const Module& module) : module_(module) {}

  std::string print();
  std::string typeText(const Type& type);

 private:
  struct Imports {
    std::set<std::string> modules;
    std::set<std::string> typing;
  };

  const Module& module_;
  Imports* sink_{nullptr}; // set during the collection pass only

  void noteTyping(const std::string& name);
  void noteModule(const std::string& name);
  std::string baseText(const Type& base);

  std::string paramText(const Parameter& param);
  std::string starText(const Parameter& param, bool doubleStar);
  std::string signatureText(const std::string& name, FunctionKind kind, const Signature& sig);
  std::string functionText(const Function& fn);
  std::string classText(const Class& cls);
  std::string constantText(const Constant& constant);
  std::string aliasText(const Alias& alias);
  std::string typeVariableText(const TypeVariable& tv);
  std::string importsText(const Imports& imports) const;

  void collect(Imports& imports);
};

// Convenience wrappers
std::string Print(const Module& module);
std::string PrintType(const Type& type);

} // namespace pytdc::pytd
