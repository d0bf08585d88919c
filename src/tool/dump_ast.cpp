#include "tool/Tool.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "parser/Parser.h"

namespace pytdc {
    /***
     * Name: pytdc::Tool::dump_ast
     * Purpose: Render the raw declaration tree of a source for --dump-ast.
     * Theory of Operation:
     *   Runs only the lexer and parser; false when the source does not parse,
     *   leaving the error to be reported by the full parse.
     */
    bool Tool::dump_ast(const std::string &source, const std::string &filename, std::string &out) {
        lex::Lexer lexer;
        lexer.pushString(source, filename);
        parse::Parser parser(lexer);
        const auto mod = parser.parseModule();
        if (!mod) { return false; }
        obs::AstPrinter printer;
        out = printer.print(*mod);
        return true;
    }
} // namespace pytdc
