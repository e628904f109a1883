// Ticket: 0011_chain_explanation

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "ili-core/src/Analysis/ChainExplainer.hpp"

using namespace ili_core;

namespace
{

AnomalyChain makeChain(const std::string& id,
                       std::array<double, 3> depth,
                       std::array<double, 2> similarities = {0.95, 0.95})
{
  AnomalyChain chain;
  chain.chainId = id;
  chain.runIds = {"RUN_2007", "RUN_2015", "RUN_2022"};
  chain.anomalyIds = {"A", "B", "C"};
  chain.matchSimilarities = similarities;
  chain.depthPct = depth;
  chain.intervalYears = {8.0, 7.0};
  chain.growthRates = {(depth[1] - depth[0]) / 8.0,
                       (depth[2] - depth[1]) / 7.0};
  chain.acceleration = chain.growthRates[1] - chain.growthRates[0];
  chain.isAccelerating = chain.acceleration > kAccelerationThreshold;
  return chain;
}

bool contains(const std::string& text, const std::string& fragment)
{
  return text.find(fragment) != std::string::npos;
}

}  // namespace

// ============================================================================
// Classification helpers
// ============================================================================

TEST(ChainExplainer, ClassifyTrend_ThresholdIsExclusive)
{
  EXPECT_EQ(classifyTrend(0.1), GrowthTrend::Stable);
  EXPECT_EQ(classifyTrend(0.11), GrowthTrend::Accelerating);
  EXPECT_EQ(classifyTrend(-0.1), GrowthTrend::Stable);
  EXPECT_EQ(classifyTrend(-0.2), GrowthTrend::Decelerating);
}

TEST(ChainExplainer, ProjectYearsToCritical_Cases)
{
  EXPECT_DOUBLE_EQ(*projectYearsToCritical(50.0, 3.0, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(*projectYearsToCritical(50.0, 2.0, 0.4), 10.0);
  EXPECT_DOUBLE_EQ(*projectYearsToCritical(50.0, 1.0, -0.5), 30.0);
  EXPECT_DOUBLE_EQ(*projectYearsToCritical(85.0, 1.0, 0.0), 0.0);
  EXPECT_FALSE(projectYearsToCritical(50.0, -1.0, 0.0).has_value());
  EXPECT_FALSE(projectYearsToCritical(50.0, 0.0, 0.0).has_value());
}

TEST(ChainExplainer, AssessUrgency_Bands)
{
  EXPECT_EQ(assessUrgency(std::nullopt, 30.0), UrgencyLevel::Monitor);
  EXPECT_EQ(assessUrgency(std::nullopt, 72.0), UrgencyLevel::Immediate);
  EXPECT_EQ(assessUrgency(2.0, 30.0), UrgencyLevel::Immediate);
  EXPECT_EQ(assessUrgency(3.0, 30.0), UrgencyLevel::Immediate);
  EXPECT_EQ(assessUrgency(5.0, 30.0), UrgencyLevel::NearTerm);
  EXPECT_EQ(assessUrgency(10.0, 30.0), UrgencyLevel::Scheduled);
  EXPECT_EQ(assessUrgency(20.0, 30.0), UrgencyLevel::Monitor);
}

TEST(ChainExplainer, Severity_Wording)
{
  EXPECT_EQ(ChainExplainer::severityFor(1.5), "rapidly accelerating");
  EXPECT_EQ(ChainExplainer::severityFor(0.7), "moderately accelerating");
  EXPECT_EQ(ChainExplainer::severityFor(0.2), "slightly accelerating");
  EXPECT_EQ(ChainExplainer::severityFor(0.05), "stable");
  EXPECT_EQ(ChainExplainer::severityFor(-0.7), "moderately decelerating");
  EXPECT_EQ(ChainExplainer::severityFor(-1.5), "rapidly decelerating");
}

// ============================================================================
// Explanations
// ============================================================================

TEST(ChainExplainer, AcceleratingDeepChain_ImmediateWithConcerns)
{
  ChainExplainer const explainer;
  auto const e = explainer.explain(makeChain("CHAIN_0000", {30.0, 45.0, 66.0},
                                             {0.9, 0.65}));

  EXPECT_EQ(e.chainId, "CHAIN_0000");
  EXPECT_EQ(e.trend, GrowthTrend::Accelerating);
  EXPECT_EQ(e.severity, "rapidly accelerating");
  ASSERT_TRUE(e.yearsToCritical.has_value());
  EXPECT_NEAR(*e.yearsToCritical, 14.0 / 5.8125, 1e-9);
  EXPECT_EQ(e.urgency, UrgencyLevel::Immediate);

  EXPECT_TRUE(contains(e.lifecycleNarrative, "RUN_2007 at 30.0%"));
  EXPECT_TRUE(contains(e.lifecycleNarrative, "RUN_2022 it reached 66.0%"));
  EXPECT_TRUE(contains(e.trendAnalysis, "+1.125"));
  EXPECT_TRUE(contains(e.trendAnalysis, "ACCELERATING"));
  EXPECT_TRUE(contains(e.projectionAnalysis, "2.4 years"));
  EXPECT_TRUE(contains(e.recommendation, "Immediate action"));
  EXPECT_EQ(e.concerns.size(), 3u);
}

TEST(ChainExplainer, SlowSteadyChain_MonitorWithoutConcerns)
{
  ChainExplainer const explainer;
  auto const e = explainer.explain(makeChain("CHAIN_0001", {20.0, 24.0, 27.5}));

  EXPECT_EQ(e.trend, GrowthTrend::Stable);
  EXPECT_EQ(e.urgency, UrgencyLevel::Monitor);
  EXPECT_TRUE(e.concerns.empty());
  EXPECT_TRUE(contains(e.recommendation, "Continue standard monitoring"));
}

TEST(ChainExplainer, ShrinkingChain_NoProjection)
{
  ChainExplainer const explainer;
  auto const e = explainer.explain(makeChain("CHAIN_0002", {30.0, 35.0, 33.0}));

  EXPECT_EQ(e.trend, GrowthTrend::Decelerating);
  EXPECT_FALSE(e.yearsToCritical.has_value());
  EXPECT_EQ(e.urgency, UrgencyLevel::Monitor);
  EXPECT_TRUE(contains(e.projectionAnalysis, "not positive"));
}

TEST(ChainExplainer, AlreadyCritical_ReportsBeyondThreshold)
{
  ChainExplainer const explainer;
  auto const e = explainer.explain(makeChain("CHAIN_0003", {70.0, 78.0, 85.0}));

  ASSERT_TRUE(e.yearsToCritical.has_value());
  EXPECT_DOUBLE_EQ(*e.yearsToCritical, 0.0);
  EXPECT_EQ(e.urgency, UrgencyLevel::Immediate);
  EXPECT_TRUE(contains(e.projectionAnalysis, "Already beyond"));
}

TEST(ChainExplainer, CustomConcernDepth_Applied)
{
  ChainExplainer::Config config;
  config.concernDepthPct = 25.0;
  ChainExplainer const explainer{config};

  auto const e = explainer.explain(makeChain("CHAIN_0004", {20.0, 24.0, 27.5}));

  ASSERT_EQ(e.concerns.size(), 1u);
  EXPECT_TRUE(contains(e.concerns[0], "27.5%"));
}

TEST(ChainExplainer, ExplainAll_TruncatesInGivenOrder)
{
  std::vector<AnomalyChain> const chains{
    makeChain("CHAIN_0002", {30.0, 45.0, 66.0}),
    makeChain("CHAIN_0000", {20.0, 24.0, 27.5}),
    makeChain("CHAIN_0001", {30.0, 35.0, 33.0})};

  ChainExplainer const explainer;
  auto const top = explainer.explainAll(chains, 2);

  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].chainId, "CHAIN_0002");
  EXPECT_EQ(top[1].chainId, "CHAIN_0000");
  EXPECT_EQ(explainer.explainAll(chains, 10).size(), 3u);
}

TEST(ChainExplainer, EnumNames_Stable)
{
  EXPECT_EQ(toString(UrgencyLevel::NearTerm), "NEAR_TERM");
  EXPECT_EQ(toString(GrowthTrend::Decelerating), "DECELERATING");
}
