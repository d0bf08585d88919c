/***
 * Name: test_parse_error_display
 * Purpose: ParseError rendering and the location data attached by a failed parse.
 */
#include <gtest/gtest.h>
#include "pytdc/exceptions/parse_failure.h"
#include "pytdc/parse.h"
#include "pytdc/parse_error.h"

using namespace pytdc;

TEST(ParseErrorDisplay, PlainMessage) {
  const ParseError err("my message");
  EXPECT_EQ(err.str(), "ParseError: my message");
}

TEST(ParseErrorDisplay, FullError) {
  ParseError err("my message", 123);
  err.filename = "foo.py";
  err.text = "this is a test";
  err.column = 6;
  EXPECT_EQ(err.str(),
            "  File: \"foo.py\", line 123\n"
            "    this is a test\n"
            "         ^\n"
            "ParseError: my message");
}

TEST(ParseErrorDisplay, IndentedTextShiftsCaret) {
  ParseError err("my message", 123);
  err.filename = "foo.py";
  err.text = "          this is a test";
  err.column = 16;
  EXPECT_EQ(err.str(),
            "  File: \"foo.py\", line 123\n"
            "    this is a test\n"
            "         ^\n"
            "ParseError: my message");
}

TEST(ParseErrorDisplay, LineWithoutFilename) {
  const ParseError err("my message", 1);
  EXPECT_EQ(err.str(), "  File: \"None\", line 1\nParseError: my message");
}

TEST(ParseErrorDisplay, FilenameWithoutLine) {
  ParseError err("my message");
  err.filename = "foo.py";
  EXPECT_EQ(err.str(), "  File: \"foo.py\", line None\nParseError: my message");
}

TEST(ParseErrorDisplay, TextWithoutColumnIsDropped) {
  ParseError err("my message");
  err.text = "this is  a test";
  EXPECT_EQ(err.str(), "ParseError: my message");
}

TEST(ParseErrorDisplay, ColumnWithoutTextIsDropped) {
  ParseError err("my message");
  err.column = 5;
  EXPECT_EQ(err.str(), "ParseError: my message");
}

TEST(ParseErrorDisplay, SyntaxErrorCarriesSourceLocation) {
  ParseOptions options;
  options.filename = "foo.py";
  const auto result = ParseString("class Foo:\n  this is not valid", options);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().str(),
            "  File: \"foo.py\", line 2\n"
            "    this is not valid\n"
            "         ^\n"
            "ParseError: syntax error, unexpected NAME, expecting ':' or '='");
}

TEST(ParseErrorDisplay, SemanticErrorHasLineOnly) {
  const auto result = ParseString("\nx = 123");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().line, 2);
  EXPECT_FALSE(result.error().column.has_value());
  EXPECT_EQ(result.error().str(), "  File: \"None\", line 2\nParseError: Only '0' allowed as int literal");
}

TEST(ParseErrorDisplay, ValueThrowsParseFailure) {
  const auto result = ParseString("^");
  ASSERT_FALSE(result.ok());
  try {
    (void)result.value();
    FAIL() << "ParseFailure expected";
  } catch (const exceptions::ParseFailure& failure) {
    EXPECT_EQ(failure.error().message, "Illegal character '^'");
    EXPECT_EQ(failure.error().line, 1);
    EXPECT_NE(std::string(failure.what()).find("Illegal character '^'"), std::string::npos);
  }
}

TEST(ParseErrorDisplay, SuccessHasEmptyError) {
  const auto result = ParseString("x = ...  # type: int");
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.error().message.empty());
  EXPECT_NO_THROW((void)result.value());
}
