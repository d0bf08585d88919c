/**
 * Name: pytdc::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace pytdc::lex {
    const char *to_string(const TokenKind k) {
        using enum pytdc::lex::TokenKind;
        switch (k) {
            case End: return "end of file";
            case Newline: return "NEWLINE";
            case Indent: return "INDENT";
            case Dedent: return "DEDENT";
            case Error: return "error";
            case Def: return "DEF";
            case Class: return "CLASS";
            case If: return "IF";
            case Elif: return "ELIF";
            case Else: return "ELSE";
            case Import: return "IMPORT";
            case From: return "FROM";
            case As: return "AS";
            case Pass: return "PASS";
            case Raise: return "RAISE";
            case Or: return "OR";
            case And: return "AND";
            case PythonCode: return "PYTHONCODE";
            case BoolLit: return "BOOL";
            case Arrow: return "ARROW";
            case Colon: return "':'";
            case ColonEqual: return "COLONEQUALS";
            case Comma: return "','";
            case Equal: return "'='";
            case Star: return "'*'";
            case StarStar: return "'**'";
            case At: return "'@'";
            case Question: return "'?'";
            case Minus: return "'-'";
            case Dot: return "'.'";
            case EqEq: return "EQ";
            case NotEq: return "NE";
            case Lt: return "'<'";
            case Le: return "LE";
            case Gt: return "'>'";
            case Ge: return "GE";
            case LParen: return "'('";
            case RParen: return "')'";
            case LBracket: return "'['";
            case RBracket: return "']'";
            case Ident: return "NAME";
            case Int: return "NUMBER";
            case Float: return "NUMBER";
            case String: return "STRING";
            case Ellipsis: return "ELLIPSIS";
            case TypeComment: return "TYPECOMMENT";
        }
        return "Unknown";
    }
} // namespace pytdc::lex
