/***
 * Name: pytdc::pytd type utilities
 * Purpose: Construction, comparison and union building for model types.
 */
#pragma once

#include <string>
#include <vector>
#include "pytd/Type.h"
#include "pytd/Types.h"

namespace pytdc::pytd {

TypePtr MakeNamed(std::string name);
TypePtr MakeAnything();
TypePtr MakeNothing();

std::vector<TypePtr> CloneTypes(const std::vector<TypePtr>& types);

// Structural equality
bool TypeEqual(const Type& lhs, const Type& rhs);

// True for a NamedType carrying exactly `name`
bool IsNamed(const Type& type, const std::string& name);

/***
 * MakeUnion: Build a union from members.
 * Nested unions are flattened, duplicates dropped keeping the first
 * occurrence, and `nothing` members removed. A single survivor is returned
 * as is; no survivors yield `nothing`.
 */
TypePtr MakeUnion(std::vector<TypePtr> members);

} // namespace pytdc::pytd
