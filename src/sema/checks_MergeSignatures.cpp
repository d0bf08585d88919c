/**
 * @file
 * @brief mergeClassDefs/mergeModuleDefs: group definitions by name in order
 *        of first appearance and fold each group.
 */
#include "sema/detail/checks/MergeSignatures.h"
#include "pytd/TypeUtils.h"
#include <map>
#include <string>
#include <utility>

namespace pytdc::sema::detail {

namespace {
using Group = std::vector<RawDef>;

std::vector<Group> groupByName(std::vector<RawDef> defs) {
  std::vector<Group> groups;
  std::map<std::string, size_t> index;
  for (auto& def : defs) {
    const auto it = index.find(def.name);
    if (it == index.end()) {
      index.emplace(def.name, groups.size());
      groups.emplace_back();
      groups.back().push_back(std::move(def));
    } else {
      groups[it->second].push_back(std::move(def));
    }
  }
  return groups;
}

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) { out += ", "; }
    out += name;
  }
  return out;
}

bool isPropertyType(const pytd::Type& type) {
  return type.kind != pytd::TypeKind::Anything && !pytd::IsNamed(type, "object");
}

// Getter takes self, setter self and value, deleter self
bool propertyArityOk(const RawDef& def) {
  using Tag = Decorator::Tag;
  switch (def.decorator.tag) {
    case Tag::Property: return def.positionalCount == 1;
    case Tag::Setter: return def.decorator.target == def.name && def.positionalCount == 2;
    case Tag::Deleter: return def.decorator.target == def.name && def.positionalCount == 1;
    default: return false;
  }
}

bool mergeProperty(Group& group, std::optional<int> line, BuildContext& ctx, std::vector<pytd::Constant>& out) {
  pytd::TypePtr type;
  for (auto& def : group) {
    if (def.external || !propertyArityOk(def)) { return ctx.fail("Unhandled decorator: " + def.decorator.text, line); }
    auto& sig = def.signature;
    if (def.decorator.tag == Decorator::Tag::Property && isPropertyType(*sig.returnType)) {
      type = std::move(sig.returnType);
    } else if (def.decorator.tag == Decorator::Tag::Setter && isPropertyType(*sig.params[1].type)) {
      type = std::move(sig.params[1].type);
    }
  }
  out.push_back(pytd::Constant{group.front().name, type ? std::move(type) : pytd::MakeAnything()});
  return true;
}

pytd::FunctionKind kindOf(const RawDef& def) {
  if (def.name == "__new__") { return pytd::FunctionKind::StaticMethod; }
  switch (def.decorator.tag) {
    case Decorator::Tag::ClassMethod: return pytd::FunctionKind::ClassMethod;
    case Decorator::Tag::StaticMethod: return pytd::FunctionKind::StaticMethod;
    default: return pytd::FunctionKind::Method;
  }
}

bool mergeFunction(Group& group, std::optional<int> line, BuildContext& ctx, std::vector<pytd::Function>& out) {
  const std::string& name = group.front().name;
  size_t externals = 0;
  for (const auto& def : group) {
    if (def.external) { ++externals; }
  }
  if (externals > 1) { return ctx.fail("Multiple PYTHONCODEs for " + name, line); }
  if (externals == 1) {
    if (group.size() > 1) { return ctx.fail("Mixed pytd and PYTHONCODEs for " + name, line); }
    out.push_back(pytd::Function{name, {}, pytd::FunctionKind::Method, true});
    return true;
  }
  const pytd::FunctionKind kind = kindOf(group.front());
  pytd::Function fn{name, {}, kind, false};
  for (auto& def : group) {
    if (kindOf(def) != kind) { return ctx.fail("Overloaded signatures for " + name + " disagree on decorators", line); }
    fn.signatures.push_back(std::move(def.signature));
  }
  out.push_back(std::move(fn));
  return true;
}

// Returns the group's property state: 0 none, 1 all, -1 mixed
int propertyState(const Group& group) {
  size_t count = 0;
  for (const auto& def : group) {
    if (def.decorator.isPropertyFamily()) { ++count; }
  }
  if (count == 0) { return 0; }
  return count == group.size() ? 1 : -1;
}

bool checkRecognized(const Group& group, std::optional<int> line, BuildContext& ctx) {
  for (const auto& def : group) {
    if (def.decorator.tag == Decorator::Tag::Unrecognized) {
      return ctx.fail("Unhandled decorator: " + def.decorator.text, line);
    }
  }
  return true;
}
} // namespace

bool mergeClassDefs(std::vector<RawDef> defs, int classLine, BuildContext& ctx,
                    std::vector<pytd::Function>& methods, std::vector<pytd::Constant>& properties) {
  for (auto& group : groupByName(std::move(defs))) {
    if (!checkRecognized(group, classLine, ctx)) { return false; }
    const int state = propertyState(group);
    if (state < 0) { return ctx.fail("Incompatible signatures for " + group.front().name, classLine); }
    const bool ok = state > 0 ? mergeProperty(group, classLine, ctx, properties)
                              : mergeFunction(group, classLine, ctx, methods);
    if (!ok) { return false; }
  }
  return true;
}

bool mergeModuleDefs(std::vector<RawDef> defs, BuildContext& ctx, std::vector<pytd::Function>& functions) {
  std::vector<std::string> propertyNames;
  for (auto& group : groupByName(std::move(defs))) {
    if (propertyState(group) != 0) {
      propertyNames.push_back(group.front().name);
      continue;
    }
    if (!checkRecognized(group, std::nullopt, ctx) || !mergeFunction(group, std::nullopt, ctx, functions)) {
      return false;
    }
  }
  if (!propertyNames.empty()) {
    return ctx.fail("Module-level functions with property decorators: " + joinNames(propertyNames));
  }
  return true;
}

} // namespace pytdc::sema::detail
