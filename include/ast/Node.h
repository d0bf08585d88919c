/**
 * @file
 * @brief AST base node declarations and kind-checked casts.
 */
#pragma once

#include "NodeKind.h"

namespace pytdc::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        // Polymorphic dispatch through the central kind switch
        virtual void accept(VisitorBase& v) const;

        int line{0}; // 1-based source position of the first token
        int col{0};
    };

    // Base of every concrete node; exposes the kind to isa/cast
    template <NodeKind K>
    struct KindOf {
        static constexpr NodeKind kKind = K;
    };

    template <typename T>
    bool isa(const Node& n) { return n.kind == T::kKind; }

    template <typename T>
    bool isa(const Node* n) { return n != nullptr && n->kind == T::kKind; }

    // Caller has checked the kind (the parser fixes kinds at construction)
    template <typename T>
    const T& cast(const Node& n) { return static_cast<const T&>(n); }

    template <typename T>
    const T* dynCast(const Node* n) { return isa<T>(n) ? static_cast<const T*>(n) : nullptr; }

} // namespace pytdc::ast
