/**
 * @file
 * @brief applyNamePrefix: module-qualified declaration names.
 */
#include "sema/detail/checks/NamePrefix.h"
#include "pytd/Types.h"
#include <set>
#include <utility>

namespace pytdc::sema::detail {

namespace {
class PrefixRewriter {
 public:
  PrefixRewriter(std::string prefix, std::set<std::string> classes)
      : prefix_(std::move(prefix)), classes_(std::move(classes)) {}

  std::string qualified(const std::string& name) const { return prefix_ + "." + name; }

  void rewrite(pytd::TypePtr& type) const {
    if (type) { rewrite(*type); }
  }

  // NOLINTNEXTLINE(readability-function-cognitive-complexity)
  void rewrite(pytd::Type& type) const {
    switch (type.kind) {
      case pytd::TypeKind::Named: {
        auto& named = static_cast<pytd::NamedType&>(type);
        if (classes_.count(named.name) != 0) { named.name = qualified(named.name); }
        break;
      }
      case pytd::TypeKind::Generic: {
        auto& gen = static_cast<pytd::GenericType&>(type);
        rewrite(gen.base);
        for (auto& param : gen.params) { rewrite(param); }
        break;
      }
      case pytd::TypeKind::Tuple: {
        auto& tup = static_cast<pytd::TupleType&>(type);
        rewrite(tup.base);
        for (auto& param : tup.params) { rewrite(param); }
        break;
      }
      case pytd::TypeKind::Callable: {
        auto& call = static_cast<pytd::CallableType&>(type);
        rewrite(call.base);
        for (auto& arg : call.args) { rewrite(arg); }
        rewrite(call.ret);
        break;
      }
      case pytd::TypeKind::Union: {
        for (auto& member : static_cast<pytd::UnionType&>(type).members) { rewrite(member); }
        break;
      }
      default:
        break;
    }
  }

  void rewrite(pytd::Signature& sig) const {
    for (auto& param : sig.params) { rewrite(param.type); }
    if (sig.starargs) { rewrite(sig.starargs->type); }
    if (sig.starstarargs) { rewrite(sig.starstarargs->type); }
    rewrite(sig.returnType);
    for (auto& exc : sig.exceptions) { rewrite(exc); }
    for (auto& mut : sig.mutators) { rewrite(mut.type); }
  }

  void rewrite(pytd::Function& fn) const {
    for (auto& sig : fn.signatures) { rewrite(sig); }
  }

 private:
  std::string prefix_;
  std::set<std::string> classes_;
};
} // namespace

void applyNamePrefix(pytd::Module& module, const std::string& prefix) {
  std::set<std::string> classes;
  for (const auto& cls : module.classes) { classes.insert(cls.name); }
  const PrefixRewriter rw(prefix, std::move(classes));

  for (auto& alias : module.aliases) {
    alias.name = rw.qualified(alias.name);
    rw.rewrite(alias.type);
  }
  for (auto& constant : module.constants) {
    constant.name = rw.qualified(constant.name);
    rw.rewrite(constant.type);
  }
  for (auto& tv : module.typeVariables) {
    tv.name = rw.qualified(tv.name);
    for (auto& constraint : tv.constraints) { rw.rewrite(constraint); }
  }
  for (auto& cls : module.classes) {
    cls.name = rw.qualified(cls.name);
    for (auto& parent : cls.parents) { rw.rewrite(parent); }
    rw.rewrite(cls.metaclass);
    for (auto& constant : cls.constants) { rw.rewrite(constant.type); }
    for (auto& method : cls.methods) { rw.rewrite(method); }
  }
  for (auto& fn : module.functions) {
    fn.name = rw.qualified(fn.name);
    rw.rewrite(fn);
  }
}

} // namespace pytdc::sema::detail
