/***
 * Name: pytdc::Tool::run
 * Purpose: Execute the read, parse, print pipeline per input.
 */
#include "tool/Tool.h"
#include "cli/Options.h"
#include "observability/Metrics.h"
#include "pytd/Printer.h"
#include "pytdc/exceptions/file_read_error.h"
#include "pytdc/parse.h"
#include "pytdc/support/fs.h"

#include <iostream>
#include <string>

namespace pytdc {

int Tool::run(const cli::Options& opts) {
  if (opts.inputs.empty()) {
    std::cerr << "pytdc: no input files provided\n";
    return 2;
  }

  obs::Metrics metrics;
  const bool wantMetrics = opts.metrics || opts.metricsJson;
  std::string output;
  for (const auto& input : opts.inputs) {
    std::string source;
    std::string err;
    if (!support::ReadFile(input, source, err)) { throw exceptions::FileReadError(err); }

    const std::string label = input == support::kStdinPath ? "<stdin>" : input;

    if (opts.dumpAst) {
      std::string dump;
      if (dump_ast(source, label, dump)) { std::cout << "== AST: " << label << " ==\n" << dump; }
    }

    ParseOptions parseOpts;
    parseOpts.name = opts.moduleName;
    parseOpts.targetVersion = opts.targetVersion;
    parseOpts.targetPlatform = opts.targetPlatform;
    parseOpts.filename = label;
    parseOpts.metrics = wantMetrics ? &metrics : nullptr;
    const ParseResult result = ParseString(source, parseOpts);
    if (!result.ok()) {
      print_error(result.error());
      return 1;
    }
    std::string text = pytd::Print(result.module());
    if (!text.empty() && text.back() != '\n') { text += '\n'; }
    output += text;
  }

  if (opts.outputFile.empty()) {
    std::cout << output;
  } else {
    std::string err;
    if (!support::WriteFile(opts.outputFile, output, err)) {
      std::cerr << "pytdc: " << err << "\n";
      return 1;
    }
  }

  if (opts.metrics) { std::cerr << metrics.summaryText(); }
  if (opts.metricsJson) { std::cerr << metrics.summaryJson(); }
  return 0;
}

} // namespace pytdc
