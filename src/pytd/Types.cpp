/***
 * Name: pytdc::pytd type kinds (impl)
 * Purpose: Deep copies and kind names.
 */
#include "pytd/Types.h"
#include "pytd/TypeUtils.h"
#include <memory>

namespace pytdc::pytd {

const char* to_string(const TypeKind k) {
  using enum pytdc::pytd::TypeKind;
  switch (k) {
    case Named: return "NamedType";
    case Anything: return "AnythingType";
    case Nothing: return "NothingType";
    case Parameter: return "TypeParameter";
    case Generic: return "GenericType";
    case Tuple: return "TupleType";
    case Callable: return "CallableType";
    case Union: return "UnionType";
  }
  return "Unknown";
}

TypePtr NamedType::clone() const { return std::make_unique<NamedType>(name); }
TypePtr AnythingType::clone() const { return std::make_unique<AnythingType>(); }
TypePtr NothingType::clone() const { return std::make_unique<NothingType>(); }
TypePtr TypeParameter::clone() const { return std::make_unique<TypeParameter>(name); }

TypePtr GenericType::clone() const {
  return std::make_unique<GenericType>(base->clone(), CloneTypes(params));
}

TypePtr TupleType::clone() const {
  return std::make_unique<TupleType>(base->clone(), CloneTypes(params));
}

TypePtr CallableType::clone() const {
  return std::make_unique<CallableType>(base->clone(), CloneTypes(args), ret->clone());
}

TypePtr UnionType::clone() const { return std::make_unique<UnionType>(CloneTypes(members)); }

} // namespace pytdc::pytd
