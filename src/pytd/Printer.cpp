/***
 * Name: pytdc::pytd::Printer (impl)
 * Purpose: Canonical module rendering.
 */
#include "pytd/Printer.h"
#include "pytd/TypeUtils.h"
#include "pytd/Types.h"
#include <cstddef>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace pytdc::pytd {

namespace {
constexpr const char* kIndent = "    ";

const std::map<std::string, std::string>& capitalizedNames() {
  static const std::map<std::string, std::string> kNames{
      {"list", "List"}, {"dict", "Dict"}, {"tuple", "Tuple"}, {"set", "Set"},
      {"frozenset", "FrozenSet"}, {"type", "Type"}, {"generator", "Generator"}};
  return kNames;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) { out += sep; }
    out += parts[i];
  }
  return out;
}

bool isFromAlias(const Alias& alias) {
  return alias.type->kind == TypeKind::Named
      && static_cast<const NamedType&>(*alias.type).name.find('.') != std::string::npos;
}
} // namespace

void Printer::noteTyping(const std::string& name) {
  if (sink_ != nullptr) { sink_->typing.insert(name); }
}

void Printer::noteModule(const std::string& name) {
  if (sink_ != nullptr) { sink_->modules.insert(name); }
}

// The base of a parametrized type prints with its typing spelling
std::string Printer::baseText(const Type& base) {
  if (base.kind == TypeKind::Named) {
    const auto& named = static_cast<const NamedType&>(base);
    const auto it = capitalizedNames().find(named.name);
    if (it != capitalizedNames().end()) {
      noteTyping(it->second);
      return it->second;
    }
  }
  return typeText(base);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string Printer::typeText(const Type& type) {
  switch (type.kind) {
    case TypeKind::Named: {
      const std::string& name = static_cast<const NamedType&>(type).name;
      if (name == "NoneType") { return "None"; }
      if (name.rfind("typing.", 0) == 0) {
        const std::string bare = name.substr(7);
        noteTyping(bare);
        return bare;
      }
      const size_t dot = name.rfind('.');
      if (dot != std::string::npos) {
        const std::string prefix = name.substr(0, dot);
        if (prefix != module_.name) { noteModule(prefix); }
      }
      return name;
    }
    case TypeKind::Anything:
      noteTyping("Any");
      return "Any";
    case TypeKind::Nothing:
      return "nothing";
    case TypeKind::Parameter:
      return static_cast<const TypeParameter&>(type).name;
    case TypeKind::Generic: {
      const auto& gen = static_cast<const GenericType&>(type);
      const std::string base = baseText(*gen.base);
      std::vector<std::string> params;
      for (const auto& param : gen.params) { params.push_back(typeText(*param)); }
      if (IsNamed(*gen.base, "tuple") && params.size() == 1) { return base + "[" + params.front() + ", ...]"; }
      return base + "[" + join(params, ", ") + "]";
    }
    case TypeKind::Tuple: {
      const auto& tup = static_cast<const TupleType&>(type);
      const std::string base = baseText(*tup.base);
      std::vector<std::string> params;
      for (const auto& param : tup.params) { params.push_back(typeText(*param)); }
      return base + "[" + join(params, ", ") + "]";
    }
    case TypeKind::Callable: {
      const auto& call = static_cast<const CallableType&>(type);
      const std::string base = baseText(*call.base);
      std::vector<std::string> args;
      for (const auto& arg : call.args) { args.push_back(typeText(*arg)); }
      return base + "[[" + join(args, ", ") + "], " + typeText(*call.ret) + "]";
    }
    case TypeKind::Union: {
      const auto& uni = static_cast<const UnionType&>(type);
      std::vector<std::string> others;
      bool hasNone = false;
      for (const auto& member : uni.members) {
        if (IsNamed(*member, "NoneType")) { hasNone = true; continue; }
        others.push_back(typeText(*member));
      }
      if (!hasNone) {
        noteTyping("Union");
        return "Union[" + join(others, ", ") + "]";
      }
      noteTyping("Optional");
      if (others.size() == 1) { return "Optional[" + others.front() + "]"; }
      noteTyping("Union");
      return "Optional[Union[" + join(others, ", ") + "]]";
    }
  }
  return "?";
}

std::string Printer::paramText(const Parameter& param) {
  std::string out = param.name;
  if (!IsNamed(*param.type, "object")) { out += ": " + typeText(*param.type); }
  if (param.optional) { out += " = ..."; }
  return out;
}

// *args: T is stored as Tuple[T, ...], **kwargs: T as Dict[str, T]
std::string Printer::starText(const Parameter& param, bool doubleStar) {
  std::string out = (doubleStar ? "**" : "*") + param.name;
  if (param.type->kind != TypeKind::Generic) { return out; }
  if (sink_ != nullptr) { (void)typeText(*param.type); }
  const auto& gen = static_cast<const GenericType&>(*param.type);
  if (gen.params.empty()) { return out; }
  return out + ": " + typeText(*gen.params.back());
}

std::string Printer::signatureText(const std::string& name, FunctionKind kind, const Signature& sig) {
  std::vector<std::string> parts;
  bool starEmitted = false;
  for (const auto& param : sig.params) {
    if (param.kwonly && !starEmitted) {
      parts.push_back(sig.starargs ? starText(*sig.starargs, false) : std::string("*"));
      starEmitted = true;
    }
    parts.push_back(paramText(param));
  }
  if (!starEmitted && sig.starargs) { parts.push_back(starText(*sig.starargs, false)); }
  if (sig.starstarargs) { parts.push_back(starText(*sig.starstarargs, true)); }

  std::string out;
  if (kind == FunctionKind::StaticMethod && name != "__new__") { out += "@staticmethod\n"; }
  if (kind == FunctionKind::ClassMethod) { out += "@classmethod\n"; }
  out += "def " + name + "(" + join(parts, ", ") + ") -> " + typeText(*sig.returnType);

  std::vector<std::string> body;
  {
    // Mutated types do not contribute imports
    Imports* saved = sink_;
    sink_ = nullptr;
    for (const auto& mut : sig.mutators) { body.push_back(mut.name + " := " + typeText(*mut.type)); }
    sink_ = saved;
  }
  for (const auto& exc : sig.exceptions) { body.push_back("raise " + typeText(*exc) + "()"); }
  if (body.empty()) { return out + ": ..."; }
  out += ":";
  for (const auto& line : body) { out += std::string("\n") + kIndent + line; }
  return out;
}

std::string Printer::functionText(const Function& fn) {
  if (fn.external) { return "def " + fn.name + " PYTHONCODE"; }
  std::vector<std::string> sigs;
  for (const auto& sig : fn.signatures) { sigs.push_back(signatureText(fn.name, fn.kind, sig)); }
  return join(sigs, "\n");
}

std::string Printer::constantText(const Constant& constant) {
  return constant.name + " = ...  # type: " + typeText(*constant.type);
}

std::string Printer::aliasText(const Alias& alias) {
  if (isFromAlias(alias)) {
    const std::string& target = static_cast<const NamedType&>(*alias.type).name;
    const size_t dot = target.rfind('.');
    const std::string member = target.substr(dot + 1);
    // The import form binds a local name, so a module-name prefix is dropped
    std::string local = alias.name;
    const std::string prefix = module_.name + ".";
    if (local.compare(0, prefix.size(), prefix) == 0) { local.erase(0, prefix.size()); }
    std::string out = "from " + target.substr(0, dot) + " import " + member;
    if (member != local) { out += " as " + local; }
    return out;
  }
  return alias.name + " = " + typeText(*alias.type);
}

std::string Printer::typeVariableText(const TypeVariable& tv) {
  noteTyping("TypeVar");
  std::string out = tv.name + " = TypeVar('" + tv.name + "'";
  for (const auto& constraint : tv.constraints) { out += ", " + typeText(*constraint); }
  return out + ")";
}

std::string Printer::classText(const Class& cls) {
  std::vector<std::string> bases;
  for (const auto& parent : cls.parents) { bases.push_back(typeText(*parent)); }
  if (cls.metaclass) { bases.push_back("metaclass=" + typeText(*cls.metaclass)); }
  std::string out = "class " + cls.name;
  if (!bases.empty()) { out += "(" + join(bases, ", ") + ")"; }
  out += ":";
  if (cls.constants.empty() && cls.methods.empty()) { return out + "\n" + kIndent + "pass\n"; }
  for (const auto& constant : cls.constants) { out += std::string("\n") + kIndent + constantText(constant); }
  for (const auto& method : cls.methods) {
    std::istringstream lines(functionText(method));
    std::string line;
    while (std::getline(lines, line)) { out += std::string("\n") + kIndent + line; }
  }
  return out + "\n";
}

std::string Printer::importsText(const Imports& imports) const {
  std::vector<std::string> lines;
  for (const auto& mod : imports.modules) { lines.push_back("import " + mod); }
  if (!imports.typing.empty()) {
    const std::vector<std::string> names(imports.typing.begin(), imports.typing.end());
    lines.push_back("from typing import " + join(names, ", "));
  }
  return join(lines, "\n");
}

void Printer::collect(Imports& imports) {
  sink_ = &imports;
  for (const auto& alias : module_.aliases) { (void)aliasText(alias); }
  for (const auto& constant : module_.constants) { (void)constantText(constant); }
  for (const auto& tv : module_.typeVariables) { (void)typeVariableText(tv); }
  for (const auto& cls : module_.classes) { (void)classText(cls); }
  for (const auto& fn : module_.functions) { (void)functionText(fn); }
  sink_ = nullptr;
}

std::string Printer::print() {
  Imports imports;
  collect(imports);

  std::vector<std::string> sections;
  auto addSection = [&sections](const std::vector<std::string>& items) {
    if (!items.empty()) { sections.push_back(join(items, "\n")); }
  };
  const std::string importLines = importsText(imports);
  if (!importLines.empty()) { sections.push_back(importLines); }

  std::vector<std::string> items;
  for (const auto& alias : module_.aliases) { items.push_back(aliasText(alias)); }
  addSection(items);
  items.clear();
  for (const auto& constant : module_.constants) { items.push_back(constantText(constant)); }
  addSection(items);
  items.clear();
  for (const auto& tv : module_.typeVariables) { items.push_back(typeVariableText(tv)); }
  addSection(items);
  items.clear();
  for (const auto& cls : module_.classes) { items.push_back(classText(cls)); }
  addSection(items);
  items.clear();
  for (const auto& fn : module_.functions) { items.push_back(functionText(fn)); }
  addSection(items);
  return join(sections, "\n\n");
}

std::string Print(const Module& module) {
  Printer printer(module);
  return printer.print();
}

std::string PrintType(const Type& type) {
  const Module empty{};
  Printer printer(empty);
  return printer.typeText(type);
}

} // namespace pytdc::pytd
