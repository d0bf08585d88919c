/***
 * Name: pytdc::ParseString (impl)
 * Purpose: Run the stage pipeline for one source text.
 */
#include "pytdc/parse.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pytdc/support/digest.h"
#include "sema/BuildContext.h"
#include "sema/Builder.h"
#include "sema/TargetEnv.h"
#include "sema/detail/checks/NamePrefix.h"
#include "sema/detail/checks/ValidateModule.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace pytdc {

namespace {
ParseResult failed(ParseError error, const ParseOptions& options) {
  if (options.filename) { error.filename = options.filename; }
  if (options.metrics != nullptr) { options.metrics->setGauge("parse.ok", 0U); }
  return ParseResult::failure(std::move(error));
}

void recordCounts(obs::Metrics* metrics, const pytd::Module& module) {
  if (metrics == nullptr) { return; }
  uint64_t methods = 0;
  for (const auto& cls : module.classes) { methods += cls.methods.size(); }
  metrics->incCounter("build.classes", module.classes.size());
  metrics->incCounter("build.functions", module.functions.size());
  metrics->incCounter("build.methods", methods);
  metrics->incCounter("build.constants", module.constants.size());
  metrics->incCounter("parse.inputs");
  metrics->setGauge("parse.ok", 1U);
}
} // namespace

ParseResult ParseString(const std::string& source, const ParseOptions& options) {
  std::string name;
  if (options.name) {
    name = *options.name;
  } else {
    std::string err;
    if (!support::Md5Hex(source, name, err)) { return failed(ParseError(err), options); }
  }

  lex::Lexer lexer;
  {
    const obs::ScopedStage timer(options.metrics, "Lex");
    lexer.pushString(source, options.filename.value_or("<string>"));
    (void)lexer.tokens();
  }

  std::unique_ptr<ast::Module> raw;
  {
    const obs::ScopedStage timer(options.metrics, "Parse");
    parse::Parser parser(lexer);
    raw = parser.parseModule();
    if (options.metrics != nullptr) { options.metrics->incCounter("lex.tokens", parser.tokenCount()); }
    if (!raw) { return failed(parser.error(), options); }
  }

  sema::TargetEnv target;
  target.version.assign(options.targetVersion.begin(), options.targetVersion.end());
  target.platform = options.targetPlatform;
  sema::BuildContext ctx(name, options.name.has_value(), std::move(target));

  pytd::Module module;
  {
    const obs::ScopedStage timer(options.metrics, "Build");
    sema::Builder builder(ctx);
    if (!builder.build(*raw, module)) { return failed(ctx.error, options); }
  }
  {
    const obs::ScopedStage timer(options.metrics, "Validate");
    if (!sema::detail::validateModule(module, ctx)) { return failed(ctx.error, options); }
  }
  if (ctx.prefixNames) { sema::detail::applyNamePrefix(module, ctx.moduleName); }
  recordCounts(options.metrics, module);
  return ParseResult::success(std::move(module));
}

} // namespace pytdc
