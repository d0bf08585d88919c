/***
 * Name: pytdc::sema::ConditionEvaluator (impl)
 * Purpose: Evaluate version/platform predicates.
 */
#include "sema/ConditionEvaluator.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pytdc::sema {

namespace {
constexpr size_t kVersionWidth = 3;
constexpr const char* kVersionInfo = "sys.version_info";
constexpr const char* kPlatform = "sys.platform";

bool applyOp(ast::CompareOp op, int cmp) {
  switch (op) {
    case ast::CompareOp::Eq: return cmp == 0;
    case ast::CompareOp::NotEq: return cmp != 0;
    case ast::CompareOp::Lt: return cmp < 0;
    case ast::CompareOp::Le: return cmp <= 0;
    case ast::CompareOp::Gt: return cmp > 0;
    case ast::CompareOp::Ge: return cmp >= 0;
  }
  return false;
}

// Dotted name of a condition's left operand, looking through a subscript
const ast::Name* leftName(const ast::Expr& left) {
  if (const auto* name = ast::dynCast<ast::Name>(&left)) { return name; }
  if (const auto* sub = ast::dynCast<ast::Subscript>(&left)) { return ast::dynCast<ast::Name>(sub->value.get()); }
  return nullptr;
}

bool intTuple(const ast::Expr& expr, std::vector<int64_t>& out) {
  if (expr.kind != ast::NodeKind::TupleLiteral) { return false; }
  for (const auto& elem : ast::cast<ast::TupleLiteral>(expr).elements) {
    if (elem->kind != ast::NodeKind::IntLiteral) { return false; }
    out.push_back(ast::cast<ast::IntLiteral>(*elem).value);
  }
  return true;
}

std::optional<int64_t> optionalInt(const ast::Expr* expr, bool& ok) {
  if (expr == nullptr) { return std::nullopt; }
  if (expr->kind != ast::NodeKind::IntLiteral) { ok = false; return std::nullopt; }
  return ast::cast<ast::IntLiteral>(*expr).value;
}

// Clamp a slice bound the way sequence slicing does
int64_t adjustBound(std::optional<int64_t> bound, int64_t size, int64_t step, bool isStart) {
  if (!bound) {
    if (step > 0) { return isStart ? 0 : size; }
    return isStart ? size - 1 : -1;
  }
  int64_t value = *bound;
  if (value < 0) {
    value += size;
    if (value < 0) { value = step < 0 ? -1 : 0; }
  } else if (value >= size) {
    value = step < 0 ? size - 1 : size;
  }
  return value;
}
} // namespace

ConditionEvaluator::ConditionEvaluator(const TargetEnv& target)
    : version_(target.version), platform_(target.platform) {
  if (version_.size() < kVersionWidth) { version_.resize(kVersionWidth, 0); }
}

bool ConditionEvaluator::fail(const std::string& msg) {
  error_ = msg;
  return false;
}

int ConditionEvaluator::compareVersions(const std::vector<int64_t>& lhs, const std::vector<int64_t>& rhs) {
  const size_t width = std::max(lhs.size(), rhs.size());
  for (size_t i = 0; i < width; ++i) {
    const int64_t left = i < lhs.size() ? lhs[i] : 0;
    const int64_t right = i < rhs.size() ? rhs[i] : 0;
    if (left != right) { return left < right ? -1 : 1; }
  }
  return 0;
}

bool ConditionEvaluator::evaluate(const ast::Expr& cond, bool& result) {
  if (ast::isa<ast::OrExpr>(cond)) {
    for (const auto& operand : ast::cast<ast::OrExpr>(cond).operands) {
      if (!evaluate(*operand, result)) { return false; }
      if (result) { return true; }
    }
    result = false;
    return true;
  }
  if (ast::isa<ast::Compare>(cond)) { return evalCompare(ast::cast<ast::Compare>(cond), result); }
  return fail("Unsupported condition");
}

bool ConditionEvaluator::evalCompare(const ast::Compare& cmp, bool& result) {
  const ast::Name* name = leftName(*cmp.left);
  if (name == nullptr) { return fail("Unsupported condition"); }
  if (name->id == kVersionInfo) { return evalVersion(cmp, result); }
  if (name->id == kPlatform && cmp.left->kind == ast::NodeKind::Name) { return evalPlatform(cmp, result); }
  return fail("Unsupported condition: '" + name->id + "'");
}

bool ConditionEvaluator::evalVersion(const ast::Compare& cmp, bool& result) {
  std::vector<int64_t> actual = version_;
  if (cmp.left->kind == ast::NodeKind::Subscript) {
    const auto& sub = ast::cast<ast::Subscript>(*cmp.left);
    const ast::Expr& index = *sub.elements.front();
    if (ast::isa<ast::Slice>(index)) {
      if (!sliceVersion(ast::cast<ast::Slice>(index), actual)) { return false; }
    } else {
      if (index.kind != ast::NodeKind::IntLiteral) { return fail("tuple indices must be integers"); }
      int64_t pos = ast::cast<ast::IntLiteral>(index).value;
      const auto size = static_cast<int64_t>(version_.size());
      if (pos < 0) { pos += size; }
      if (pos < 0 || pos >= size) { return fail("tuple index out of range"); }
      if (cmp.right->kind != ast::NodeKind::IntLiteral) {
        return fail("an element of sys.version_info must be compared to an integer");
      }
      const int64_t element = version_[static_cast<size_t>(pos)];
      const int64_t expected = ast::cast<ast::IntLiteral>(*cmp.right).value;
      result = applyOp(cmp.op, element == expected ? 0 : (element < expected ? -1 : 1));
      return true;
    }
  }
  std::vector<int64_t> expected;
  if (!intTuple(*cmp.right, expected)) { return fail("sys.version_info must be compared to a tuple of integers"); }
  result = applyOp(cmp.op, compareVersions(actual, expected));
  return true;
}

bool ConditionEvaluator::sliceVersion(const ast::Slice& slice, std::vector<int64_t>& out) {
  bool ok = true;
  const auto start = optionalInt(slice.start.get(), ok);
  const auto stop = optionalInt(slice.stop.get(), ok);
  const auto step = optionalInt(slice.step.get(), ok);
  if (!ok) { return fail("slice indices must be integers"); }
  const int64_t stride = step.value_or(1);
  if (stride == 0) { return fail("slice step cannot be zero"); }
  const auto size = static_cast<int64_t>(version_.size());
  const int64_t first = adjustBound(start, size, stride, true);
  const int64_t last = adjustBound(stop, size, stride, false);
  out.clear();
  for (int64_t i = first; stride > 0 ? i < last : i > last; i += stride) {
    out.push_back(version_[static_cast<size_t>(i)]);
  }
  return true;
}

bool ConditionEvaluator::evalPlatform(const ast::Compare& cmp, bool& result) {
  if (cmp.right->kind != ast::NodeKind::StringLiteral) { return fail("sys.platform must be compared to a string"); }
  if (cmp.op != ast::CompareOp::Eq && cmp.op != ast::CompareOp::NotEq) {
    return fail("sys.platform must be compared using == or !=");
  }
  const bool same = ast::cast<ast::StringLiteral>(*cmp.right).value == platform_;
  result = cmp.op == ast::CompareOp::Eq ? same : !same;
  return true;
}

} // namespace pytdc::sema
