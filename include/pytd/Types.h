/**
 * @file
 * @brief Concrete type kinds of the declaration model.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "pytd/Type.h"

namespace pytdc::pytd {

    struct NamedType final : Type {
        std::string name;
        explicit NamedType(std::string n) : Type(TypeKind::Named), name(std::move(n)) {}
        TypePtr clone() const override;
    };

    struct AnythingType final : Type {
        AnythingType() : Type(TypeKind::Anything) {}
        TypePtr clone() const override;
    };

    struct NothingType final : Type {
        NothingType() : Type(TypeKind::Nothing) {}
        TypePtr clone() const override;
    };

    struct TypeParameter final : Type {
        std::string name;
        explicit TypeParameter(std::string n) : Type(TypeKind::Parameter), name(std::move(n)) {}
        TypePtr clone() const override;
    };

    // base[params...]; for tuples a single element type repeated
    struct GenericType final : Type {
        TypePtr base;
        std::vector<TypePtr> params;
        GenericType(TypePtr b, std::vector<TypePtr> p)
            : Type(TypeKind::Generic), base(std::move(b)), params(std::move(p)) {}
        TypePtr clone() const override;
    };

    struct TupleType final : Type {
        TypePtr base;
        std::vector<TypePtr> params;
        TupleType(TypePtr b, std::vector<TypePtr> p)
            : Type(TypeKind::Tuple), base(std::move(b)), params(std::move(p)) {}
        TypePtr clone() const override;
    };

    struct CallableType final : Type {
        TypePtr base;
        std::vector<TypePtr> args;
        TypePtr ret;
        CallableType(TypePtr b, std::vector<TypePtr> a, TypePtr r)
            : Type(TypeKind::Callable), base(std::move(b)), args(std::move(a)), ret(std::move(r)) {}
        TypePtr clone() const override;
    };

    struct UnionType final : Type {
        std::vector<TypePtr> members;
        explicit UnionType(std::vector<TypePtr> m) : Type(TypeKind::Union), members(std::move(m)) {}
        TypePtr clone() const override;
    };

} // namespace pytdc::pytd
