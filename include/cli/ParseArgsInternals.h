/**
 * @file
 * @brief Declarations for pytdc CLI argument parsing helpers.
 */
#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "cli/Options.h"

namespace pytdc::cli::detail {

/** Return true if `arg` is exactly one of the given spellings. */
bool matchesAny(std::string_view arg, std::initializer_list<std::string_view> spellings);

/** Parse `a.b[.c]` into version components; false when malformed. */
bool parseVersionValue(std::string_view value, std::vector<int>& out);

/** Option-like argument that no handler accepted; a lone "-" is stdin, not an option. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible settings (e.g., -o with several inputs). */
bool hasConflictingOutputs(const Options& opts);

/** Handle boolean, flag-only options like -h, --metrics, --dump-ast. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (name, python-version, platform). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Outcome of looking at one argument for the output flag. */
enum class OutputFlag { NotOutput, Consumed, MissingValue };

/** Handle `-o <file>` (consuming the next argv item) and the attached `-o<file>`. */
OutputFlag handleOutputFileFlag(int& idx, int argc, char** argv, Options& out);

} // namespace pytdc::cli::detail
