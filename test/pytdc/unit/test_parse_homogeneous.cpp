/***
 * Name: test_parse_homogeneous
 * Purpose: Parametrized types: Callable, ellipsis forms, tuples and
 *          synthesized NamedTuple record classes.
 */
#include <gtest/gtest.h>
#include "pytdc/parse.h"
#include "util/StubCheck.h"

using testutil::FailsWith;
using testutil::Idempotent;
using testutil::Prints;
using testutil::RoundTrips;

TEST(ParseHomogeneous, CallableParameters) {
  EXPECT_TRUE(RoundTrips("from typing import Callable\n"
                         "\n"
                         "x = ...  # type: Callable[[int, str], bool]"));
  EXPECT_TRUE(Prints("from typing import Callable\n"
                     "\n"
                     "x = ...  # type: Callable[..., bool]",
                     "from typing import Any, Callable\n"
                     "\n"
                     "x = ...  # type: Callable[Any, bool]"));
  EXPECT_TRUE(RoundTrips("from typing import Any, Callable\n"
                         "\n"
                         "x = ...  # type: Callable[Any, bool]"));
  EXPECT_TRUE(RoundTrips("from typing import Any, Callable\n"
                         "\n"
                         "x = ...  # type: Callable[[Any], bool]"));
  EXPECT_TRUE(RoundTrips("from typing import Callable\n"
                         "\n"
                         "x = ...  # type: Callable[[], bool]"));
  EXPECT_TRUE(Prints("from typing import Callable\n"
                     "\n"
                     "x = ...  # type: Callable[[nothing], bool]",
                     "from typing import Callable\n"
                     "\n"
                     "x = ...  # type: Callable[[], bool]"));
  EXPECT_TRUE(Prints("from typing import Callable\n"
                     "\n"
                     "x = ...  # type: Callable[[int]]",
                     "from typing import Any, Callable\n"
                     "\n"
                     "x = ...  # type: Callable[[int], Any]"));
  EXPECT_TRUE(Prints("from typing import Callable\n"
                     "\n"
                     "x = ...  # type: Callable[[], ...]",
                     "from typing import Any, Callable\n"
                     "\n"
                     "x = ...  # type: Callable[[], Any]"));
}

TEST(ParseHomogeneous, CallableErrors) {
  EXPECT_TRUE(FailsWith("import typing\n\nx = ...  # type: typing.Callable[int]", 3,
                        "First argument to Callable must be a list of argument types"));
  EXPECT_TRUE(FailsWith("import typing\n\nx = ...  # type: typing.Callable[[], bool, bool]", 3,
                        "Expected 2 parameters to Callable, got 3"));
}

TEST(ParseHomogeneous, Ellipsis) {
  // B[T, ...] is B[T]
  EXPECT_TRUE(Prints("from typing import List\n\nx = ...  # type: List[int, ...]",
                     "from typing import List\n\nx = ...  # type: List[int]"));
  EXPECT_TRUE(FailsWith("x = ...  # type: List[..., ...]", 1, "not supported"));
  // Tuple[T] and Tuple[T, ...] differ
  EXPECT_TRUE(RoundTrips("from typing import Tuple\n\nx = ...  # type: Tuple[int]"));
  EXPECT_TRUE(RoundTrips("from typing import Tuple\n\nx = ...  # type: Tuple[int, ...]"));
}

TEST(ParseHomogeneous, MisplacedEllipsis) {
  EXPECT_TRUE(FailsWith("x = ...  # type: Foo[..., int]", 1, "ellipsis (...) must be last type parameter"));
}

TEST(ParseHomogeneous, Tuple) {
  EXPECT_TRUE(RoundTrips("from typing import Tuple\n\nx = ...  # type: Tuple[int, str]"));
  EXPECT_TRUE(Prints("from typing import Tuple\n\nx = ...  # type: Tuple[int, str, ...]",
                     "from typing import Any, Tuple\n\nx = ...  # type: Tuple[int, str, Any]"));
}

TEST(ParseHomogeneous, SimpleGeneric) {
  EXPECT_TRUE(RoundTrips("x = ...  # type: Foo[int, str]"));
}

TEST(ParseHomogeneous, ImpliedTuple) {
  EXPECT_TRUE(Prints("x = ...  # type: []", "x = ...  # type: Tuple[nothing, ...]", "from typing import Tuple"));
  EXPECT_TRUE(Prints("x = ...  # type: [int]", "x = ...  # type: Tuple[int]", "from typing import Tuple"));
  EXPECT_TRUE(Prints("x = ...  # type: [int, str]", "x = ...  # type: Tuple[int, str]",
                     "from typing import Tuple"));
}

TEST(ParseNamedTuple, NoFields) {
  EXPECT_TRUE(Prints("x = ...  # type: NamedTuple(foo, [])",
                     "from typing import Tuple\n"
                     "\n"
                     "x = ...  # type: `foo`\n"
                     "\n"
                     "class `foo`(Tuple[nothing, ...]):\n"
                     "    pass\n"));
}

TEST(ParseNamedTuple, MultipleFields) {
  const std::string expected =
      "from typing import Tuple\n"
      "\n"
      "x = ...  # type: `foo`\n"
      "\n"
      "class `foo`(Tuple[int, str]):\n"
      "    a = ...  # type: int\n"
      "    b = ...  # type: str\n";
  EXPECT_TRUE(Prints("x = ...  # type: NamedTuple(foo, [(a, int), (b, str)])", expected));
  EXPECT_TRUE(Prints("x = ...  # type: NamedTuple(foo, [(a, int), (b, str),])", expected));
  EXPECT_TRUE(Prints("x = ...  # type: NamedTuple(foo, [(a, int,), (b, str),])", expected));
}

TEST(ParseNamedTuple, DuplicateBaseNamesGetSuffix) {
  EXPECT_TRUE(Prints("x = ...  # type: NamedTuple(foo, [(a, int,)])\n"
                     "y = ...  # type: NamedTuple(foo, [(b, str,)])",
                     "from typing import Tuple\n"
                     "\n"
                     "x = ...  # type: `foo`\n"
                     "y = ...  # type: `foo~1`\n"
                     "\n"
                     "class `foo`(Tuple[int]):\n"
                     "    a = ...  # type: int\n"
                     "\n"
                     "class `foo~1`(Tuple[str]):\n"
                     "    b = ...  # type: str\n"));
}

TEST(ParseHomogeneous, CanonicalFormsReparseToThemselves) {
  const char* sources[] = {
      "from typing import Callable\n\nx = ...  # type: Callable[..., bool]",
      "from typing import Callable\n\nx = ...  # type: Callable[[nothing], bool]",
      "from typing import Callable\n\nx = ...  # type: Callable[[int]]",
      "from typing import Callable\n\nx = ...  # type: Callable[[], ...]",
      "from typing import List\n\nx = ...  # type: List[int, ...]",
      "from typing import Tuple\n\nx = ...  # type: Tuple[int, str, ...]",
      "x = ...  # type: []",
      "x = ...  # type: [int]",
      "x = ...  # type: [int, str]",
  };
  for (const char* src : sources) { EXPECT_TRUE(Idempotent(src)) << src; }
}

TEST(ParseNamedTuple, SynthesizedClassesReparseToThemselves) {
  const char* sources[] = {
      "x = ...  # type: NamedTuple(foo, [])",
      "x = ...  # type: NamedTuple(foo, [(a, int), (b, str)])",
      "x = ...  # type: NamedTuple(foo, [(a, int), (b, str),])",
      "x = ...  # type: NamedTuple(foo, [(a, int,), (b, str),])",
      "x = ...  # type: NamedTuple(foo, [(a, int,)])\ny = ...  # type: NamedTuple(foo, [(b, str,)])",
  };
  for (const char* src : sources) { EXPECT_TRUE(Idempotent(src)) << src; }
}

TEST(ParseNamedTuple, PrintedBacktickNamesResolveToLocalClasses) {
  const std::string printed =
      "from typing import Tuple\n"
      "\n"
      "x = ...  # type: `foo`\n"
      "y = ...  # type: `foo~1`\n"
      "\n"
      "class `foo`(Tuple[int]):\n"
      "    a = ...  # type: int\n"
      "\n"
      "class `foo~1`(Tuple[str]):\n"
      "    b = ...  # type: str\n";
  EXPECT_TRUE(RoundTrips(printed));
  const pytdc::ParseResult result = pytdc::ParseString(printed);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.module().classes.size(), 2U);
  EXPECT_NE(result.module().findClass("`foo~1`"), nullptr);
}
