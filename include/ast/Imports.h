/**
 * @file
 * @brief Import statement nodes.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "ast/Stmt.h"

namespace pytdc::ast {
    // One `name [as asname]` entry of an import statement
    struct Alias {
        std::string name;
        std::string asname; // empty if none
        Alias() = default;
        Alias(std::string n, std::string a) : name(std::move(n)), asname(std::move(a)) {}
    };

    // import a.b [as c], ...
    struct Import final : Stmt, KindOf<NodeKind::Import> {
        std::vector<Alias> names;
        Import() : Stmt(NodeKind::Import) {}
    };

    // from a.b import x [as y], ... | from a.b import *
    struct ImportFrom final : Stmt, KindOf<NodeKind::ImportFrom> {
        std::string module; // dotted module path
        std::vector<Alias> names;
        bool star{false};
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
