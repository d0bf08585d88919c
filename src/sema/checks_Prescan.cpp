/**
 * @file
 * @brief prescanModule: liveness and forward name registration.
 */
#include "sema/detail/checks/Prescan.h"
#include "ast/Nodes.h"
#include "sema/ConditionEvaluator.h"
#include <memory>
#include <vector>

namespace pytdc::sema::detail {

namespace {
bool scanBody(const ast::StmtList& body, BuildContext& ctx) {
  for (const auto& stmt : body) {
    switch (stmt->kind) {
      case ast::NodeKind::IfStmt: {
        const auto& ifs = ast::cast<ast::IfStmt>(*stmt);
        ConditionEvaluator eval(ctx.target);
        bool live = false;
        if (!eval.evaluate(*ifs.cond, live)) { return ctx.fail(eval.error(), ifs.line); }
        ctx.liveness[&ifs] = live;
        if (!scanBody(live ? ifs.thenBody : ifs.elseBody, ctx)) { return false; }
        break;
      }
      case ast::NodeKind::ClassDef: {
        const auto& cls = ast::cast<ast::ClassDef>(*stmt);
        ctx.registry.addLocalClass(cls.name);
        if (!scanBody(cls.body, ctx)) { return false; }
        break;
      }
      case ast::NodeKind::TypeVarStmt:
        ctx.registry.addTypeVar(ast::cast<ast::TypeVarStmt>(*stmt).name);
        break;
      default:
        break;
    }
  }
  return true;
}
} // namespace

bool prescanModule(const ast::Module& module, BuildContext& ctx) { return scanBody(module.body, ctx); }

} // namespace pytdc::sema::detail
