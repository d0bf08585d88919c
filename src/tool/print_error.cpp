#include "tool/Tool.h"
#include "pytdc/parse_error.h"
#include <iostream>

namespace pytdc {
    /***
     * Name: pytdc::Tool::print_error
     * Purpose: Write a parse failure to stderr in the ParseError format.
     */
    void Tool::print_error(const ParseError &err) {
        std::cerr << err.str() << "\n";
    }
} // namespace pytdc
