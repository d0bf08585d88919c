/**
 * @file
 * @brief validateModule: duplicate identifiers at module and class scope.
 */
#include "sema/detail/checks/ValidateModule.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pytdc::sema::detail {

namespace {
std::string duplicatesOf(const std::vector<std::string>& names) {
  std::map<std::string, int> counts;
  for (const auto& name : names) { ++counts[name]; }
  std::string out;
  for (const auto& [name, count] : counts) {
    if (count < 2) { continue; }
    if (!out.empty()) { out += ", "; }
    out += name;
  }
  return out;
}
} // namespace

bool validateModule(const pytd::Module& module, BuildContext& ctx) {
  std::vector<std::string> names;
  for (const auto& constant : module.constants) { names.push_back(constant.name); }
  for (const auto& fn : module.functions) { names.push_back(fn.name); }
  for (const auto& cls : module.classes) { names.push_back(cls.name); }
  for (const auto& alias : module.aliases) { names.push_back(alias.name); }
  for (const auto& tv : module.typeVariables) { names.push_back(tv.name); }
  const std::string dups = duplicatesOf(names);
  if (!dups.empty()) { return ctx.fail("Duplicate top-level identifier(s): " + dups); }

  for (const auto& cls : module.classes) {
    std::vector<std::string> members;
    for (const auto& constant : cls.constants) { members.push_back(constant.name); }
    for (const auto& method : cls.methods) { members.push_back(method.name); }
    const std::string clsDups = duplicatesOf(members);
    if (clsDups.empty()) { continue; }
    const auto it = ctx.classLines.find(cls.name);
    std::optional<int> line;
    if (it != ctx.classLines.end()) { line = it->second; }
    return ctx.fail("Duplicate identifier(s): " + clsDups, line);
  }
  return true;
}

} // namespace pytdc::sema::detail
