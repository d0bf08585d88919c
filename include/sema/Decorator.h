/***
 * Name: pytdc::sema::Decorator
 * Purpose: Closed classification of a definition's decorator.
 * Theory of Operation:
 *   Recognized once from its dotted spelling; the merger switches over the
 *   tag exhaustively. `name.setter`/`name.deleter` keep the prefix so the
 *   merger can check it against the definition's own name.
 */
#pragma once

#include <string>

namespace pytdc::sema {

struct Decorator {
    enum class Tag {
        None, // undecorated
        Property,
        Setter,
        Deleter,
        ClassMethod,
        StaticMethod,
        Overload,
        AbstractMethod,
        Unrecognized
    };
    Tag tag{Tag::None};
    std::string target; // property name for Setter/Deleter
    std::string text;   // original spelling

    bool isPropertyFamily() const { return tag == Tag::Property || tag == Tag::Setter || tag == Tag::Deleter; }
};

Decorator RecognizeDecorator(const std::string& text);

} // namespace pytdc::sema
