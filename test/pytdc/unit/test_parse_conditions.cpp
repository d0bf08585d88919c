/***
 * Name: test_parse_conditions
 * Purpose: Conditional blocks at module and class scope, and the
 *          version/platform predicates that select them.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "pytdc/parse.h"
#include "util/StubCheck.h"

using namespace pytdc;
using testutil::FailsWith;
using testutil::Prints;
using testutil::WithVersion;

namespace {
std::string guarded(const std::string& condition) {
  return "if " + condition + ":\n  x = ...  # type: int\n";
}

::testing::AssertionResult Holds(const std::string& condition, bool expected, const ParseOptions& options = {}) {
  return Prints(guarded(condition), expected ? "x = ...  # type: int" : "", "", options);
}

::testing::AssertionResult Rejects(const std::string& condition, const std::string& message) {
  return FailsWith(guarded(condition), 1, message);
}
} // namespace

TEST(ParseIf, BranchSelection) {
  EXPECT_TRUE(Prints("if sys.version_info == (2, 7, 6):\n  x = ...  # type: int\n", "x = ...  # type: int"));
  EXPECT_TRUE(Prints("if sys.version_info == (1, 2, 3):\n  x = ...  # type: int\n", ""));
  EXPECT_TRUE(Prints("if sys.version_info == (1, 2, 3):\n  x = ...  # type: int\n"
                     "else:\n  y = ...  # type: str\n",
                     "y = ...  # type: str"));
  EXPECT_TRUE(Prints("if sys.version_info == (2, 7, 6):\n  x = ...  # type: int\n"
                     "else:\n  y = ...  # type: str\n",
                     "x = ...  # type: int"));
}

TEST(ParseIf, ElifChains) {
  EXPECT_TRUE(Prints("if sys.version_info == (1, 2, 3):\n  x = ...  # type: int\n"
                     "elif sys.version_info == (2, 7, 6):\n  y = ...  # type: float\n"
                     "else:\n  z = ...  # type: str\n",
                     "y = ...  # type: float"));
  EXPECT_TRUE(Prints("if sys.version_info > (1, 2, 3):\n  x = ...  # type: int\n"
                     "elif sys.version_info == (2, 7, 6):\n  y = ...  # type: float\n"
                     "else:\n  z = ...  # type: str\n",
                     "x = ...  # type: int"));
  EXPECT_TRUE(Prints("if sys.version_info == (1, 2, 3):\n  x = ...  # type: int\n"
                     "elif sys.version_info == (4, 5, 6):\n  y = ...  # type: float\n"
                     "else:\n  z = ...  # type: str\n",
                     "z = ...  # type: str"));
}

TEST(ParseIf, NestedIf) {
  EXPECT_TRUE(Prints("if sys.version_info >= (2, 0):\n"
                     "  if sys.platform == \"linux\":\n"
                     "    a = ...  # type: int\n"
                     "  else:\n"
                     "    b = ...  # type: int\n"
                     "else:\n"
                     "  if sys.platform == \"linux\":\n"
                     "    c = ...  # type: int\n"
                     "  else:\n"
                     "    d = ...  # type: int\n",
                     "a = ...  # type: int"));
}

TEST(ParseIf, OrConditions) {
  EXPECT_TRUE(Prints("if sys.version_info >= (2, 0) or sys.version_info < (0, 0, 0):\n"
                     "  a = ...  # type: int\n"
                     "if sys.version_info < (0, 0, 0) or sys.version_info >= (2, 0):\n"
                     "  b = ...  # type: int\n"
                     "if sys.version_info < (0, 0, 0) or sys.version_info > (3,):\n"
                     "  c = ...  # type: int\n"
                     "if sys.version_info >= (2, 0) or sys.version_info >= (2, 7):\n"
                     "  d = ...  # type: int\n"
                     "if (sys.platform == \"windows\" or sys.version_info < (0,) or\n"
                     "    sys.version_info >= (2, 7)):\n"
                     "  e = ...  # type: int\n",
                     "a = ...  # type: int\n"
                     "b = ...  # type: int\n"
                     "d = ...  # type: int\n"
                     "e = ...  # type: int"));
}

TEST(ParseIf, SideEffectsOnlyInLiveBranch) {
  EXPECT_TRUE(Prints("if sys.version_info == (2, 7, 6):\n  from foo import Processed\n"
                     "else:\n  from foo import Ignored\n",
                     "from foo import Processed"));
  EXPECT_TRUE(Prints("if sys.version_info == (2, 7, 6):\n  x = Processed\n"
                     "else:\n  y = Ignored\n",
                     "x = Processed"));
  EXPECT_TRUE(Prints("if sys.version_info == (2, 7, 6):\n  class Processed: pass\n"
                     "else:\n  class Ignored: pass\n",
                     "class Processed:\n    pass\n"));
  EXPECT_TRUE(Prints("if sys.version_info == (2, 7, 6):\n  T = TypeVar('T')\n"
                     "else:\n  F = TypeVar('F')\n",
                     "from typing import TypeVar\n\nT = TypeVar('T')"));
}

TEST(ParseIf, ConditionalClassRegistration) {
  // Only the live Dict shadows the typing name; List still maps to list
  EXPECT_TRUE(Prints("from typing import List\n"
                     "if sys.version_info == (2, 7, 6):\n"
                     "  class Dict: pass\n"
                     "else:\n"
                     "  class List: pass\n"
                     "\n"
                     "x = ...  # type: Dict\n"
                     "y = ...  # type: List\n",
                     "x = ...  # type: Dict\n"
                     "y = ...  # type: list\n"
                     "\n"
                     "class Dict:\n"
                     "    pass\n"));
}

TEST(ParseClassIf, ConditionalMembers) {
  EXPECT_TRUE(Prints("class Foo:\n"
                     "  if sys.version_info == (2, 7, 0):\n"
                     "    x = ...  # type: int\n"
                     "  elif sys.version_info == (2, 7, 6):\n"
                     "    y = ...  # type: str\n"
                     "  else:\n"
                     "    z = ...  # type: float\n",
                     "class Foo:\n    y = ...  # type: str\n"));
  EXPECT_TRUE(Prints("class Foo:\n"
                     "  if sys.version_info == (2, 7, 0):\n"
                     "    def a(self, x: int) -> str: ...\n"
                     "  elif sys.version_info == (2, 7, 6):\n"
                     "    def b(self, x: int) -> str: ...\n"
                     "  else:\n"
                     "    def c(self, x: int) -> str: ...\n",
                     "class Foo:\n    def b(self, x: int) -> str: ...\n"));
  EXPECT_TRUE(Prints("class Foo:\n"
                     "  if sys.version_info > (2, 7, 0):\n"
                     "    if sys.version_info == (2, 7, 6):\n"
                     "      def b(self, x: int) -> str: ...\n",
                     "class Foo:\n    def b(self, x: int) -> str: ...\n"));
}

TEST(ParseClassIf, ModuleOnlyStatementsRejected) {
  EXPECT_TRUE(FailsWith("class Foo:\n  if sys.version_info > (2, 7, 0):\n    import foo\n", 3, "syntax error"));
  EXPECT_TRUE(FailsWith("class Foo:\n  if sys.version_info > (2, 7, 0):\n    class Bar: ...\n", 3, "syntax error"));
  EXPECT_TRUE(FailsWith("class Foo:\n  if sys.version_info > (2, 7, 0):\n    T = TypeVar('T')\n", 3,
                        "syntax error"));
  EXPECT_TRUE(FailsWith("class Foo:\n  if sys.version_info > (2, 7, 0):\n    a = b\n", 1,
                        "Illegal value for alias 'a'"));
}

TEST(ParseCondition, VersionComparisons) {
  EXPECT_TRUE(Holds("sys.version_info == (2, 7, 5)", false));
  EXPECT_TRUE(Holds("sys.version_info == (2, 7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info == (2, 7, 7)", false));
  EXPECT_TRUE(Holds("sys.version_info != (2, 7, 5)", true));
  EXPECT_TRUE(Holds("sys.version_info != (2, 7, 6)", false));
  EXPECT_TRUE(Holds("sys.version_info < (2, 7, 6)", false));
  EXPECT_TRUE(Holds("sys.version_info < (2, 8, 0)", true));
  EXPECT_TRUE(Holds("sys.version_info <= (2, 7, 5)", false));
  EXPECT_TRUE(Holds("sys.version_info <= (2, 7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info > (2, 6, 0)", true));
  EXPECT_TRUE(Holds("sys.version_info > (2, 7, 6)", false));
  EXPECT_TRUE(Holds("sys.version_info >= (2, 7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info >= (2, 7, 7)", false));
}

TEST(ParseCondition, VersionItem) {
  EXPECT_TRUE(Holds("sys.version_info[0] == 2", true));
  EXPECT_TRUE(Holds("sys.version_info[-1] == 6", true));
}

TEST(ParseCondition, VersionSlices) {
  EXPECT_TRUE(Holds("sys.version_info[:] == (2, 7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (2, 7)", true));
  EXPECT_TRUE(Holds("sys.version_info[2:] == (6,)", true));
  EXPECT_TRUE(Holds("sys.version_info[0:1] == (2,)", true));
  EXPECT_TRUE(Holds("sys.version_info[::] == (2, 7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info[1::] == (7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info[:2:] == (2, 7)", true));
  EXPECT_TRUE(Holds("sys.version_info[::-2] == (6, 2)", true));
  EXPECT_TRUE(Holds("sys.version_info[1:3:] == (7, 6)", true));
  EXPECT_TRUE(Holds("sys.version_info[1::2] == (7,)", true));
  EXPECT_TRUE(Holds("sys.version_info[:2:2] == (2,)", true));
  EXPECT_TRUE(Holds("sys.version_info[3:1:-1] == (6,)", true));
}

TEST(ParseCondition, ShorterTuplesArePadded) {
  EXPECT_TRUE(Holds("sys.version_info == (3,)", true, WithVersion({3, 0, 0})));
  EXPECT_TRUE(Holds("sys.version_info == (3, 0)", true, WithVersion({3, 0, 0})));
  EXPECT_TRUE(Holds("sys.version_info == (3, 0, 0)", true, WithVersion({3, 0, 0})));
  EXPECT_TRUE(Holds("sys.version_info == (3,)", false, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info == (3, 0)", false, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info > (3,)", true, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info > (3, 0)", true, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info == (3, 0, 0)", true, WithVersion({3})));
  EXPECT_TRUE(Holds("sys.version_info == (3, 0, 0)", true, WithVersion({3, 0})));
}

TEST(ParseCondition, SlicesOfShorterTuples) {
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3,)", true, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3, 0)", true, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3, 0, 0)", true, WithVersion({3, 0, 1})));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3,)", false, WithVersion({3, 1, 0})));
  EXPECT_TRUE(Holds("sys.version_info[:2] > (3, 0)", true, WithVersion({3, 1, 0})));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3, 0, 0)", true, WithVersion({3})));
  EXPECT_TRUE(Holds("sys.version_info[:2] == (3, 0, 0)", true, WithVersion({3, 0})));
}

TEST(ParseCondition, VersionErrors) {
  const std::string tupleMsg = "sys.version_info must be compared to a tuple of integers";
  const std::string elementMsg = "an element of sys.version_info must be compared to an integer";
  EXPECT_TRUE(Rejects("sys.version_info == \"foo\"", tupleMsg));
  EXPECT_TRUE(Rejects("sys.version_info == (1.2, 3)", tupleMsg));
  EXPECT_TRUE(Rejects("sys.version_info[0] == 2.0", elementMsg));
  EXPECT_TRUE(Rejects("sys.version_info[0] == (2,)", elementMsg));
  EXPECT_TRUE(Rejects("sys.version_info[:2] == (2.0, 7)", tupleMsg));
  EXPECT_TRUE(Rejects("sys.version_info[:2] == 2", tupleMsg));
  EXPECT_TRUE(Rejects("sys.version_info[42] == 42", "tuple index out of range"));
}

TEST(ParseCondition, Platform) {
  EXPECT_TRUE(Holds("sys.platform == \"linux\"", true));
  EXPECT_TRUE(Holds("sys.platform == \"win32\"", false));
  EXPECT_TRUE(Holds("sys.platform != \"win32\"", true));
  ParseOptions options;
  options.targetPlatform = "foo";
  EXPECT_TRUE(Holds("sys.platform == \"foo\"", true, options));
}

TEST(ParseCondition, PlatformErrors) {
  EXPECT_TRUE(Rejects("sys.platform == (1, 2, 3)", "sys.platform must be compared to a string"));
  for (const char* op : {"<", "<=", ">", ">="}) {
    EXPECT_TRUE(Rejects(std::string("sys.platform ") + op + " \"linux\"",
                        "sys.platform must be compared using == or !="));
  }
}

TEST(ParseCondition, UnsupportedCondition) {
  EXPECT_TRUE(Rejects("foo.bar == (1, 2, 3)", "Unsupported condition: 'foo.bar'"));
}
