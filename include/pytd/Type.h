/***
 * Name: pytdc::pytd::Type
 * Purpose: Base of the canonical type model produced by the builder.
 * Theory of Operation:
 *   Types form owned trees (TypePtr). They are immutable once built; code
 *   that needs a second reference takes a deep copy with clone(). Concrete
 *   kinds live in pytd/Types.h and are told apart by `kind`.
 */
#pragma once

#include <memory>

namespace pytdc::pytd {

enum class TypeKind {
    Named,     // a class or external name, e.g. int, foo.Bar
    Anything,  // the open type, printed Any
    Nothing,   // the bottom type, printed nothing
    Parameter, // a TypeVar reference
    Generic,   // homogeneous parametrized type, e.g. List[int]
    Tuple,     // fixed arity tuple, e.g. Tuple[int, str]
    Callable,  // Callable[[A, B], R]
    Union
};

const char* to_string(TypeKind k);

struct Type;
using TypePtr = std::unique_ptr<Type>;

struct Type {
    TypeKind kind;
    explicit Type(const TypeKind k) : kind(k) {}
    virtual ~Type() = default;
    Type(const Type&) = delete;
    Type& operator=(const Type&) = delete;

    virtual TypePtr clone() const = 0;
};

} // namespace pytdc::pytd
