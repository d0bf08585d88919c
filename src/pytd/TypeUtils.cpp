/***
 * Name: pytdc::pytd type utilities (impl)
 */
#include "pytd/TypeUtils.h"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pytdc::pytd {

namespace {
bool listEqual(const std::vector<TypePtr>& lhs, const std::vector<TypePtr>& rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!TypeEqual(*lhs[i], *rhs[i])) { return false; }
  }
  return true;
}

void flattenInto(TypePtr type, std::vector<TypePtr>& out) {
  if (type->kind == TypeKind::Union) {
    auto& uni = static_cast<UnionType&>(*type);
    for (auto& member : uni.members) { flattenInto(std::move(member), out); }
    return;
  }
  if (type->kind == TypeKind::Nothing) { return; }
  for (const auto& seen : out) {
    if (TypeEqual(*seen, *type)) { return; }
  }
  out.push_back(std::move(type));
}
} // namespace

TypePtr MakeNamed(std::string name) { return std::make_unique<NamedType>(std::move(name)); }
TypePtr MakeAnything() { return std::make_unique<AnythingType>(); }
TypePtr MakeNothing() { return std::make_unique<NothingType>(); }

std::vector<TypePtr> CloneTypes(const std::vector<TypePtr>& types) {
  std::vector<TypePtr> out;
  out.reserve(types.size());
  for (const auto& type : types) { out.push_back(type->clone()); }
  return out;
}

bool IsNamed(const Type& type, const std::string& name) {
  return type.kind == TypeKind::Named && static_cast<const NamedType&>(type).name == name;
}

bool TypeEqual(const Type& lhs, const Type& rhs) {
  if (lhs.kind != rhs.kind) { return false; }
  switch (lhs.kind) {
    case TypeKind::Named:
      return static_cast<const NamedType&>(lhs).name == static_cast<const NamedType&>(rhs).name;
    case TypeKind::Anything:
    case TypeKind::Nothing:
      return true;
    case TypeKind::Parameter:
      return static_cast<const TypeParameter&>(lhs).name == static_cast<const TypeParameter&>(rhs).name;
    case TypeKind::Generic: {
      const auto& left = static_cast<const GenericType&>(lhs);
      const auto& right = static_cast<const GenericType&>(rhs);
      return TypeEqual(*left.base, *right.base) && listEqual(left.params, right.params);
    }
    case TypeKind::Tuple: {
      const auto& left = static_cast<const TupleType&>(lhs);
      const auto& right = static_cast<const TupleType&>(rhs);
      return TypeEqual(*left.base, *right.base) && listEqual(left.params, right.params);
    }
    case TypeKind::Callable: {
      const auto& left = static_cast<const CallableType&>(lhs);
      const auto& right = static_cast<const CallableType&>(rhs);
      return TypeEqual(*left.base, *right.base) && listEqual(left.args, right.args)
          && TypeEqual(*left.ret, *right.ret);
    }
    case TypeKind::Union:
      return listEqual(static_cast<const UnionType&>(lhs).members, static_cast<const UnionType&>(rhs).members);
  }
  return false;
}

TypePtr MakeUnion(std::vector<TypePtr> members) {
  std::vector<TypePtr> flat;
  for (auto& member : members) { flattenInto(std::move(member), flat); }
  if (flat.empty()) { return MakeNothing(); }
  if (flat.size() == 1) { return std::move(flat.front()); }
  return std::make_unique<UnionType>(std::move(flat));
}

} // namespace pytdc::pytd
