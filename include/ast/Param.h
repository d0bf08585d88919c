#pragma once

#include <memory>
#include <string>

namespace pytdc::ast {
    struct Expr; // fwd

    enum class ParamKind {
        Normal,   // name[: type][= default]
        Star,     // *name or bare *
        StarStar, // **name
        Ellipsis  // ... standing for *args, **kwargs
    };

    struct Param {
        std::string name; // empty for a bare * or ...
        ParamKind kind{ParamKind::Normal};
        std::unique_ptr<Expr> annotation{};   // optional
        std::unique_ptr<Expr> defaultValue{}; // optional
    };
} // namespace pytdc::ast
