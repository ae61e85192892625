/***
 * Name: test_metrics
 * Purpose: Validate Metrics timers, counters, hints and both summary formats.
 */
#include <gtest/gtest.h>
#include "observability/Metrics.h"

using namespace spindle::obs;

TEST(Metrics, TimersAccumulateAndIgnoreUnmatchedStop) {
  Metrics m;
  m.stop("never.started");
  EXPECT_TRUE(m.durationsMicros().empty());
  m.start("Pass"); m.stop("Pass");
  m.start("Pass"); m.stop("Pass");
  EXPECT_EQ(m.durationsMicros().size(), 1u);
}

TEST(Metrics, TotalsByPrefix) {
  Metrics m;
  m.start("compile.a"); m.stop("compile.a");
  m.start("compile.b"); m.stop("compile.b");
  m.start("vm.run"); m.stop("vm.run");
  const auto& d = m.durationsMicros();
  EXPECT_EQ(m.totalMicros("compile."), d.at("compile.a") + d.at("compile.b"));
  EXPECT_EQ(m.totalMicros("nothing."), 0u);
  EXPECT_NE(m.summaryJson().find("\"compile_total_ms\": "), std::string::npos);
}

TEST(Metrics, CountersInJson) {
  Metrics m;
  m.start("Stage"); m.stop("Stage");
  m.setCounter("compile.files", 3);
  m.incCounter("vm.instructions", 2);
  m.incCounter("vm.instructions");
  EXPECT_EQ(m.counter("vm.instructions"), 3u);
  EXPECT_EQ(m.counter("absent"), 0u);
  const auto js = m.summaryJson();
  EXPECT_NE(js.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(js.find("\"stage\": "), std::string::npos);
  EXPECT_NE(js.find("\"counters\""), std::string::npos);
  EXPECT_NE(js.find("\"compile.files\": 3"), std::string::npos);
  EXPECT_NE(js.find("\"vm.instructions\": 3"), std::string::npos);
  EXPECT_EQ(js.find("\"ast\""), std::string::npos);
}

TEST(Metrics, TextSummaryIncludesGeometry) {
  Metrics m;
  m.setAstGeometry(AstGeometry{12, 4});
  m.setCounter("compile.nodes", 2);
  const auto text = m.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(text.find("  AST: nodes=12, max_depth=4\n"), std::string::npos);
  EXPECT_NE(text.find("  compile.nodes = 2\n"), std::string::npos);
  EXPECT_NE(m.summaryJson().find("\"ast\": { \"nodes\": 12, \"max_depth\": 4 }"), std::string::npos);
}

TEST(MetricsHints, DerivedFromCounters) {
  Metrics m;
  EXPECT_TRUE(m.hints().empty());
  m.setCounter("compile.files", 1);
  m.setCounter("compile.nodes", 0);
  m.setCounter("compile.diagnostics", 2);
  m.setCounter("vm.instructions", 100001);
  const auto js = m.summaryJson();
  EXPECT_NE(js.find("\"hints\""), std::string::npos);
  EXPECT_NE(js.find("compile_diagnostics_present"), std::string::npos);
  EXPECT_NE(js.find("no_nodes"), std::string::npos);
  EXPECT_NE(js.find("long_running_dialogue"), std::string::npos);
}
