/**
 * Name: pytdc::lex::Lexer
 * Purpose: Tokenize stub source text into a flat token vector.
 * Theory of Operation:
 *   Eager and line oriented. Each physical line is measured for indentation
 *   (unless inside brackets or after a backslash continuation) and then
 *   scanned. Comment-only and blank lines are skipped, except `# type:`
 *   comments, which surface as a TypeComment token followed by the comment's
 *   own tokens. A lexical error stops scanning: an Error token is emitted
 *   and the stream ends.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "lexer/Token.h"

namespace pytdc::lex {

class Lexer {
public:
    Lexer() = default;

    void pushString(const std::string& text, const std::string& name);

    std::vector<Token> tokens();

    // Source line by 1-based number, empty when out of range
    const std::string& sourceLine(int lineNo) const;

    const std::string& name() const { return name_; }

private:
    bool finalized_{false};
    std::string name_{};
    std::vector<std::string> lines_{};
    std::vector<Token> tokens_{};

    size_t row_{0}; // current line (0-based)
    int depth_{0}; // open brackets
    bool joined_{false}; // previous line ended with a backslash

    void splitLines(const std::string& text);
    void emit(TokenKind kind, std::string text, size_t row, size_t col);
    bool fail(const std::string& message, size_t col); // emits Error then End
    bool emitIndentTokens(std::vector<size_t>& indentStack, size_t width, size_t col);
    bool scanLine(size_t idx);
    bool scanString(size_t& idx);
    void scanNumber(size_t& idx);

    void buildAll();
};

} // namespace pytdc::lex
