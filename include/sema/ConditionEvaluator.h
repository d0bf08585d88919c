/***
 * Name: pytdc::sema::ConditionEvaluator
 * Purpose: Decide `if`/`elif` liveness against a target environment.
 * Inputs:
 *   - Condition expression from the raw tree (Compare, OrExpr)
 * Outputs:
 *   - true/false, or failure with error() holding the message
 * Theory of Operation:
 *   Only `sys.version_info` (optionally indexed or sliced) and
 *   `sys.platform` may be tested. Version tuples of different lengths are
 *   compared after zero padding the shorter one; the target itself is
 *   padded to three elements. `or` short-circuits left to right.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "sema/TargetEnv.h"

namespace pytdc::sema {

class ConditionEvaluator {
 public:
  explicit ConditionEvaluator(const TargetEnv& target);

  bool evaluate(const ast::Expr& cond, bool& result);
  const std::string& error() const { return error_; }

  // Lexicographic comparison after zero padding; -1, 0 or 1
  static int compareVersions(const std::vector<int64_t>& lhs, const std::vector<int64_t>& rhs);

 private:
  std::vector<int64_t> version_;
  std::string platform_;
  std::string error_;

  bool fail(const std::string& msg);
  bool evalCompare(const ast::Compare& cmp, bool& result);
  bool evalVersion(const ast::Compare& cmp, bool& result);
  bool evalPlatform(const ast::Compare& cmp, bool& result);
  bool sliceVersion(const ast::Slice& slice, std::vector<int64_t>& out);
};

} // namespace pytdc::sema
