/**
 * Name: pytdc::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace pytdc::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // original text; message for Error tokens
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
};

} // namespace pytdc::lex
