/**
 * Name: pytdc::ast::CompareOp helpers
 * Purpose: Spelling of comparison operators for dumps and messages.
 */
#include "ast/Compare.h"

namespace pytdc::ast {

const char* to_string(const CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "==";
        case CompareOp::NotEq: return "!=";
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
    }
    return "?";
}

} // namespace pytdc::ast
