/***
 * Name: test_condition_evaluator
 * Purpose: Version and platform predicates against a fixed target.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "sema/ConditionEvaluator.h"
#include "sema/TargetEnv.h"

using namespace pytdc;

namespace {
// Parses `if <cond>:` and evaluates the condition against the target.
struct Outcome {
  bool ok{false};
  bool value{false};
  std::string error;
};

Outcome evalCond(const std::string& cond, const sema::TargetEnv& target = sema::TargetEnv{}) {
  lex::Lexer lexer;
  lexer.pushString("if " + cond + ":\n  x = ...\n", "cond.pyi");
  parse::Parser parser(lexer);
  auto mod = parser.parseModule();
  Outcome out;
  if (!mod) {
    out.error = parser.error().message;
    return out;
  }
  const auto& stmt = ast::cast<ast::IfStmt>(*mod->body.at(0));
  sema::ConditionEvaluator evaluator(target);
  out.ok = evaluator.evaluate(*stmt.cond, out.value);
  out.error = evaluator.error();
  return out;
}

::testing::AssertionResult Holds(const std::string& cond, const sema::TargetEnv& target = sema::TargetEnv{}) {
  const Outcome out = evalCond(cond, target);
  if (!out.ok) { return ::testing::AssertionFailure() << cond << ": " << out.error; }
  if (!out.value) { return ::testing::AssertionFailure() << cond << " evaluated false"; }
  return ::testing::AssertionSuccess();
}

::testing::AssertionResult Fails(const std::string& cond) {
  const Outcome out = evalCond(cond);
  if (!out.ok) { return ::testing::AssertionSuccess(); }
  return ::testing::AssertionFailure() << cond << " evaluated " << (out.value ? "true" : "false");
}

sema::TargetEnv target(std::vector<int64_t> version, std::string platform = "linux") {
  sema::TargetEnv env;
  env.version = std::move(version);
  env.platform = std::move(platform);
  return env;
}
} // namespace

TEST(CompareVersions, PadsWithZeros) {
  using sema::ConditionEvaluator;
  EXPECT_EQ(ConditionEvaluator::compareVersions({2, 7}, {2, 7, 0}), 0);
  EXPECT_EQ(ConditionEvaluator::compareVersions({2, 7, 6}, {2, 7}), 1);
  EXPECT_EQ(ConditionEvaluator::compareVersions({2}, {3}), -1);
  EXPECT_EQ(ConditionEvaluator::compareVersions({}, {}), 0);
  EXPECT_EQ(ConditionEvaluator::compareVersions({3, 10}, {3, 9, 9}), 1);
}

TEST(ConditionEvaluator, DefaultTarget) {
  EXPECT_TRUE(Holds("sys.version_info == (2, 7, 6)"));
  EXPECT_TRUE(Holds("sys.version_info >= (2, 7)"));
  EXPECT_TRUE(Holds("sys.version_info < (3,)"));
  EXPECT_TRUE(Holds("sys.platform == 'linux'"));
  EXPECT_TRUE(Holds("sys.platform != \"win32\""));
}

TEST(ConditionEvaluator, ShortTargetIsPadded) {
  EXPECT_TRUE(Holds("sys.version_info == (3, 6, 0)", target({3, 6})));
  EXPECT_TRUE(Holds("sys.version_info[2] == 0", target({3})));
}

TEST(ConditionEvaluator, IndexAndSlice) {
  const auto env = target({3, 6, 1});
  EXPECT_TRUE(Holds("sys.version_info[0] == 3", env));
  EXPECT_TRUE(Holds("sys.version_info[-1] == 1", env));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3, 6)", env));
  EXPECT_TRUE(Holds("sys.version_info[1:] == (6, 1)", env));
  EXPECT_TRUE(Holds("sys.version_info[::2] == (3, 1)", env));
  EXPECT_TRUE(Holds("sys.version_info[::-1] == (1, 6, 3)", env));
  EXPECT_TRUE(Holds("sys.version_info[:-1] >= (3, 6)", env));
}

TEST(ConditionEvaluator, OrShortCircuits) {
  EXPECT_TRUE(Holds("sys.platform == 'win32' or sys.version_info >= (2,)"));
  // The second operand is never evaluated
  EXPECT_TRUE(Holds("sys.platform == 'linux' or foo.bar == 1"));
  const Outcome out = evalCond("sys.platform == 'win32' or sys.platform == 'darwin'");
  EXPECT_TRUE(out.ok);
  EXPECT_FALSE(out.value);
}

TEST(ConditionEvaluator, Errors) {
  const Outcome unsupported = evalCond("foo.bar == 1");
  EXPECT_FALSE(unsupported.ok);
  EXPECT_EQ(unsupported.error, "Unsupported condition: 'foo.bar'");
  EXPECT_EQ(evalCond("sys.version_info[5] == 1").error, "tuple index out of range");
  EXPECT_EQ(evalCond("sys.version_info[0] == (1,)").error,
            "an element of sys.version_info must be compared to an integer");
  EXPECT_EQ(evalCond("sys.version_info == 3").error, "sys.version_info must be compared to a tuple of integers");
  EXPECT_EQ(evalCond("sys.version_info[::0] == (1,)").error, "slice step cannot be zero");
  EXPECT_EQ(evalCond("sys.platform == 1").error, "sys.platform must be compared to a string");
  EXPECT_EQ(evalCond("sys.platform < 'linux'").error, "sys.platform must be compared using == or !=");
  EXPECT_TRUE(Fails("sys.platform[0] == 'l'"));
}

TEST(ConditionEvaluator, ParenthesizedNumberIsATuple) {
  EXPECT_TRUE(Holds("sys.version_info >= (3)", target({3, 0, 0})));
  EXPECT_FALSE(Holds("sys.version_info >= (3)", target({2, 7, 6})));
}
