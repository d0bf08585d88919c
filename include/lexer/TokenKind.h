/**
 * Name: pytdc::lex::TokenKind
 * Purpose: Token kinds for the stub lexer.
 */
#pragma once

namespace pytdc::lex {

enum class TokenKind {
    End, // EOF
    Newline, // \n
    Indent, // indentation increase
    Dedent, // indentation decrease
    Error, // lexical error; text carries the message

    Def, // def
    Class, // class
    If, // if
    Elif, // elif
    Else, // else
    Import, // import
    From, // from
    As, // as
    Pass, // pass
    Raise, // raise
    Or, // or
    And, // and
    PythonCode, // PYTHONCODE
    BoolLit, // True/False

    Arrow, // ->
    Colon, // :
    ColonEqual, // :=
    Comma, // ,
    Equal, // =
    Star, // *
    StarStar, // **
    At, // @
    Question, // ?
    Minus, // -
    Dot, // .
    EqEq, // ==
    NotEq, // !=
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]

    Ident, // identifier
    Int, // integer literal
    Float, // float literal
    String, // string literal (quotes and prefix kept)
    Ellipsis, // ...
    TypeComment // # type:
};

// Bison-style token name used in syntax error messages
const char* to_string(TokenKind k);

} // namespace pytdc::lex
