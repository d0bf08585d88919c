/***
 * Name: pytdc::pytd declarations
 * Purpose: The canonical module model returned by a parse.
 * Theory of Operation:
 *   Plain move-only aggregates owning their types. Order of every list is
 *   the order the printer emits, so the builder appends in declaration
 *   order and never re-sorts.
 *   Untyped parameters carry the type `object`; untyped `*args`/`**kwargs`
 *   carry plain `tuple`/`dict`, typed ones `Tuple[T, ...]`/`Dict[str, T]`.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "pytd/Type.h"

namespace pytdc::pytd {

enum class FunctionKind { Method, ClassMethod, StaticMethod };

const char* to_string(FunctionKind k);

struct Parameter {
    std::string name;
    TypePtr type;
    bool optional{false}; // has a default, printed `= ...`
    bool kwonly{false};   // declared after `*` or `*args`
};

// `name := Type` inside a signature body
struct Mutator {
    std::string name;
    TypePtr type;
};

struct Signature {
    std::vector<Parameter> params;
    std::optional<Parameter> starargs;
    std::optional<Parameter> starstarargs;
    TypePtr returnType;
    std::vector<TypePtr> exceptions;
    std::vector<Mutator> mutators;
};

struct Function {
    std::string name;
    std::vector<Signature> signatures; // empty for an external function
    FunctionKind kind{FunctionKind::Method};
    bool external{false};              // def NAME PYTHONCODE
};

struct Constant {
    std::string name;
    TypePtr type;
};

struct Alias {
    std::string name;
    TypePtr type;
};

struct TypeVariable {
    std::string name;
    std::vector<TypePtr> constraints;
};

struct Class {
    std::string name;
    std::vector<TypePtr> parents;
    TypePtr metaclass; // null when absent
    std::vector<Constant> constants;
    std::vector<Function> methods;
};

struct Module {
    std::string name;
    std::vector<Alias> aliases;
    std::vector<Constant> constants;
    std::vector<TypeVariable> typeVariables;
    std::vector<Class> classes;
    std::vector<Function> functions;

    const Class* findClass(const std::string& className) const;
    const Function* findFunction(const std::string& functionName) const;
};

} // namespace pytdc::pytd
