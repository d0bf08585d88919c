/***
 * Name: pytdc::pytd declarations (impl)
 */
#include "pytd/Decls.h"
#include <string>

namespace pytdc::pytd {

const char* to_string(const FunctionKind k) {
  switch (k) {
    case FunctionKind::Method: return "method";
    case FunctionKind::ClassMethod: return "classmethod";
    case FunctionKind::StaticMethod: return "staticmethod";
  }
  return "method";
}

const Class* Module::findClass(const std::string& className) const {
  for (const auto& cls : classes) {
    if (cls.name == className) { return &cls; }
  }
  return nullptr;
}

const Function* Module::findFunction(const std::string& functionName) const {
  for (const auto& fn : functions) {
    if (fn.name == functionName) { return &fn; }
  }
  return nullptr;
}

} // namespace pytdc::pytd
