/**
 * Name: AST headers umbrella
 * Purpose: Provide a stable include that aggregates single-declaration headers.
 */
#pragma once

#include "ast/NodeKind.h"
#include "ast/Node.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"
#include "ast/Name.h"
#include "ast/Literal.h"
#include "ast/QuestionType.h"
#include "ast/TupleLiteral.h"
#include "ast/ListLiteral.h"
#include "ast/Subscript.h"
#include "ast/Slice.h"
#include "ast/OrExpr.h"
#include "ast/Compare.h"
#include "ast/NamedTupleExpr.h"
#include "ast/Imports.h"
#include "ast/AssignStmt.h"
#include "ast/TypeVarStmt.h"
#include "ast/FunctionDef.h"
#include "ast/ClassDef.h"
#include "ast/IfStmt.h"
#include "ast/Module.h"
