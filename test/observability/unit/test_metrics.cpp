/***
 * Name: test_metrics
 * Purpose: Verify stage timing, counters, summaries and hints.
 */
#include <gtest/gtest.h>
#include <string>
#include "observability/Metrics.h"

using namespace pytdc::obs;

TEST(Metrics, StartStopRecordsDuration) {
  Metrics metrics;
  metrics.start("Lex");
  metrics.stop("Lex");
  EXPECT_EQ(metrics.durations().count("Lex"), 1U);
}

TEST(Metrics, StopWithoutStartIsIgnored) {
  Metrics metrics;
  metrics.stop("Build");
  EXPECT_TRUE(metrics.durations().empty());
}

TEST(Metrics, CountersAccumulate) {
  Metrics metrics;
  metrics.incCounter("build.classes");
  metrics.incCounter("build.classes", 2);
  metrics.setCounter("lex.tokens", 7);
  EXPECT_EQ(metrics.counters().at("build.classes"), 3U);
  EXPECT_EQ(metrics.counters().at("lex.tokens"), 7U);
}

TEST(Metrics, SummaryText) {
  Metrics metrics;
  metrics.setCounter("build.classes", 2);
  const std::string text = metrics.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0U);
  EXPECT_NE(text.find("  build.classes=2\n"), std::string::npos);
}

TEST(Metrics, SummaryJsonWithoutDurations) {
  Metrics metrics;
  metrics.setCounter("a", 2);
  EXPECT_EQ(metrics.summaryJson(),
            "{\n"
            "  \"durations_ms\": {\n"
            "  },\n"
            "  \"counters\": {\n"
            "    \"a\": 2\n"
            "  }\n"
            "}\n");
}

TEST(Metrics, SummaryJsonLowercasesStages) {
  Metrics metrics;
  metrics.start("Parse");
  metrics.stop("Parse");
  metrics.setGauge("parse.ok", 0);
  const std::string json = metrics.summaryJson();
  EXPECT_NE(json.find("\"parse\": "), std::string::npos);
  EXPECT_NE(json.find("\"gauges\": {\n    \"parse.ok\": 0\n  }"), std::string::npos);
  EXPECT_NE(json.find("\"hints\": [\"parse_failed\"]"), std::string::npos);
}

TEST(Metrics, Hints) {
  Metrics metrics;
  EXPECT_TRUE(metrics.hints().empty());
  metrics.setGauge("parse.ok", 1);
  metrics.setCounter("lex.tokens", 100001);
  ASSERT_EQ(metrics.hints().size(), 1U);
  EXPECT_EQ(metrics.hints()[0], "large_input");
}

TEST(Metrics, TextListsPipelineStagesInOrder) {
  Metrics metrics;
  for (const char* stage : {"Validate", "Lex", "Build", "Parse", "Extra"}) {
    metrics.start(stage);
    metrics.stop(stage);
  }
  const std::string text = metrics.summaryText();
  const auto lex = text.find("  Lex: ");
  const auto parse = text.find("  Parse: ");
  const auto build = text.find("  Build: ");
  const auto validate = text.find("  Validate: ");
  const auto extra = text.find("  Extra: ");
  const auto total = text.find("  total: ");
  ASSERT_NE(lex, std::string::npos);
  EXPECT_LT(lex, parse);
  EXPECT_LT(parse, build);
  EXPECT_LT(build, validate);
  EXPECT_LT(validate, extra);
  EXPECT_LT(extra, total);
  EXPECT_NE(metrics.summaryJson().find("\"total\": "), std::string::npos);
}

TEST(Metrics, TextIncludesGaugesAndHints) {
  Metrics metrics;
  metrics.setGauge("parse.ok", 0);
  const std::string text = metrics.summaryText();
  EXPECT_NE(text.find("  parse.ok=0\n"), std::string::npos);
  EXPECT_NE(text.find("  hints: parse_failed\n"), std::string::npos);
  EXPECT_EQ(text.find("total"), std::string::npos);
}

TEST(ScopedStage, RecordsOnDestruction) {
  Metrics metrics;
  {
    const ScopedStage stage(&metrics, "Build");
    EXPECT_TRUE(metrics.durations().empty());
  }
  EXPECT_EQ(metrics.durations().count("Build"), 1U);
}

TEST(ScopedStage, NullSinkIsNoOp) {
  const ScopedStage stage(nullptr, "Build");
  SUCCEED();
}
