/***
 * Name: pytdc::sema::NameRegistry (impl)
 */
#include "sema/NameRegistry.h"
#include "pytd/TypeUtils.h"
#include "pytd/Types.h"
#include <map>
#include <memory>
#include <string>

namespace pytdc::sema {

namespace {
constexpr const char* kAnyTarget = "<any>";

const std::map<std::string, std::string>& builtinTable() {
  static const std::map<std::string, std::string> kTable = [] {
    std::map<std::string, std::string> table{
        {"Any", kAnyTarget},
        {"List", "list"},
        {"Dict", "dict"},
        {"Tuple", "tuple"},
        {"Set", "set"},
        {"FrozenSet", "frozenset"},
        {"Type", "type"},
        {"Generator", "generator"},
    };
    for (const char* name : {"AbstractSet", "AnyStr", "AsyncIterable", "AsyncIterator", "Awaitable",
                             "BinaryIO", "ByteString", "Callable", "ClassVar", "Container",
                             "ContextManager", "Coroutine", "Counter", "DefaultDict", "Deque",
                             "Generic", "Hashable", "IO", "ItemsView", "Iterable", "Iterator",
                             "KeysView", "Mapping", "MappingView", "Match", "MutableMapping",
                             "MutableSequence", "MutableSet", "NamedTuple", "NoReturn", "Optional",
                             "Pattern", "Reversible", "Sequence", "Sized", "SupportsAbs",
                             "SupportsBytes", "SupportsComplex", "SupportsFloat", "SupportsInt",
                             "SupportsRound", "Text", "TextIO", "TypeVar", "Union", "ValuesView"}) {
      table.emplace(name, std::string("typing.") + name);
    }
    return table;
  }();
  return kTable;
}

pytd::TypePtr targetType(const std::string& target) {
  if (target == kAnyTarget) { return pytd::MakeAnything(); }
  return pytd::MakeNamed(target);
}
} // namespace

std::string NameRegistry::builtinTarget(const std::string& name) {
  const auto it = builtinTable().find(name);
  return it == builtinTable().end() ? std::string() : it->second;
}

pytd::TypePtr NameRegistry::resolve(const std::string& name) const {
  if (name == "nothing") { return pytd::MakeNothing(); }
  if (name == "None" || name == "NoneType") { return pytd::MakeNamed("NoneType"); }
  if (typeVars_.count(name) != 0) { return std::make_unique<pytd::TypeParameter>(name); }
  if (classes_.count(name) != 0) { return pytd::MakeNamed(name); }
  if (useBuiltins_) {
    std::string target = builtinTarget(name);
    // typing.List and friends resolve like their bare spelling
    if (target.empty() && name.rfind("typing.", 0) == 0) { target = builtinTarget(name.substr(7)); }
    if (!target.empty()) { return targetType(target); }
  }
  const auto imported = imports_.find(name);
  if (imported != imports_.end()) {
    if (useBuiltins_) {
      const std::string target = imported->second.rfind("typing.", 0) == 0
          ? builtinTarget(imported->second.substr(7)) : std::string();
      if (!target.empty()) { return targetType(target); }
    }
    return pytd::MakeNamed(imported->second);
  }
  return pytd::MakeNamed(name);
}

} // namespace pytdc::sema
