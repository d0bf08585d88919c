/***
 * Name: pytdc::sema::BuildContext
 * Purpose: All mutable state of one parse call.
 * Theory of Operation:
 *   Created by the builder for a single module and destroyed when the call
 *   returns; nothing here outlives a parse. The first failure wins: later
 *   calls to fail() keep the original error.
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "ast/IfStmt.h"
#include "pytd/Decls.h"
#include "pytdc/parse_error.h"
#include "sema/NameRegistry.h"
#include "sema/TargetEnv.h"

namespace pytdc::sema {

struct BuildContext {
    std::string moduleName;
    bool prefixNames{false}; // explicit module name given
    TargetEnv target;
    NameRegistry registry;

    // Condition value of every evaluated if/elif, filled by the prescan
    std::unordered_map<const ast::IfStmt*, bool> liveness;

    // Synthesized record classes in creation order, and per-name counts
    std::vector<pytd::Class> synthesized;
    std::map<std::string, int> synthesizedCounts;

    // Line of each built class statement, for class-scoped validation errors
    std::map<std::string, int> classLines;

    ParseError error;
    bool failed{false};

    BuildContext(std::string name, bool explicitName, TargetEnv env)
        : moduleName(std::move(name)), prefixNames(explicitName), target(std::move(env)),
          registry(moduleName != "typing") {}

    bool fail(const std::string& msg, std::optional<int> line = std::nullopt) {
        if (!failed) {
            failed = true;
            error = ParseError(msg, line);
        }
        return false;
    }
};

} // namespace pytdc::sema
