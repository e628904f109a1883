// Ticket: 0008_growth_analysis

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "ili-core/src/Growth/GrowthAnalyzer.hpp"
#include "ili-core/src/Matching/HungarianMatcher.hpp"
#include "ili-core/test/Helpers/RecordFactory.hpp"

using namespace ili_core;
using ili_core::test::AnomalySpec;
using ili_core::test::makeAnomaly;

namespace
{

/// Two matched pairs: A1->B1 grows 16 pp, A2->B2 grows 2 pp
struct TwoRunFixture
{
  std::vector<AnomalyRecord> run1{makeAnomaly("A1", 100.0, 3.0, 30.0, "R1"),
                                  makeAnomaly("A2", 500.0, 6.0, 20.0, "R1")};
  std::vector<AnomalyRecord> run2{makeAnomaly("B1", 100.0, 3.0, 46.0, "R2"),
                                  makeAnomaly("B2", 500.0, 6.0, 22.0, "R2")};
  std::vector<Match> matches = HungarianMatcher{}.match(run1, run2).matches;
};

GrowthMetrics metricsWithDepthRate(double rate, bool rapid)
{
  GrowthMetrics metrics;
  metrics.depthGrowthRate = rate;
  metrics.isRapidGrowth = rapid;
  return metrics;
}

}  // namespace

// ============================================================================
// Rates
// ============================================================================

TEST(GrowthAnalyzer, GrowthRate_ChangePerYear)
{
  EXPECT_DOUBLE_EQ(GrowthAnalyzer::growthRate(30.0, 40.0, 5.0), 2.0);
  EXPECT_DOUBLE_EQ(GrowthAnalyzer::growthRate(40.0, 35.0, 5.0), -1.0);
}

TEST(GrowthAnalyzer, GrowthRate_OddUnderEndpointSwap)
{
  double const forward = GrowthAnalyzer::growthRate(22.5, 31.0, 7.25);
  double const backward = GrowthAnalyzer::growthRate(31.0, 22.5, 7.25);
  EXPECT_DOUBLE_EQ(forward, -backward);
}

TEST(GrowthAnalyzer, GrowthRate_NonPositiveInterval_Throws)
{
  EXPECT_THROW((void)GrowthAnalyzer::growthRate(30.0, 40.0, 0.0),
               std::invalid_argument);
  EXPECT_THROW((void)GrowthAnalyzer::growthRate(30.0, 40.0, -1.0),
               std::invalid_argument);
}

TEST(GrowthAnalyzer, RapidGrowth_StrictlyAboveThreshold)
{
  GrowthAnalyzer const analyzer;
  EXPECT_FALSE(analyzer.isRapidGrowth(5.0));
  EXPECT_TRUE(analyzer.isRapidGrowth(5.01));

  GrowthAnalyzer const strict{GrowthAnalyzer::Config{2.0}};
  EXPECT_TRUE(strict.isRapidGrowth(2.5));
}

TEST(GrowthAnalyzer, FortyToFiftyOverTwoYears_BoundaryNotRapid)
{
  std::vector<AnomalyRecord> const run1{makeAnomaly("A1", 100.0, 3.0, 40.0)};
  std::vector<AnomalyRecord> const run2{makeAnomaly("B1", 100.0, 3.0, 50.0)};
  auto const matches = HungarianMatcher{}.match(run1, run2).matches;
  ASSERT_EQ(matches.size(), 1u);

  GrowthAnalyzer const analyzer;
  GrowthMetrics const metrics =
    analyzer.calculateMatchGrowth(matches[0], run1[0], run2[0], 2.0);

  EXPECT_DOUBLE_EQ(metrics.depthGrowthRate, 5.0);
  EXPECT_FALSE(metrics.isRapidGrowth);
  EXPECT_DOUBLE_EQ(metrics.lengthGrowthRate, 0.0);
  EXPECT_EQ(metrics.matchId, "A1_B1");
  EXPECT_DOUBLE_EQ(metrics.timeIntervalYears, 2.0);
}

// ============================================================================
// Batch analysis
// ============================================================================

TEST(GrowthAnalyzer, Analyze_MetricsStatisticsAndRapidList)
{
  TwoRunFixture const f;
  ASSERT_EQ(f.matches.size(), 2u);

  GrowthAnalyzer const analyzer;
  auto const analysis = analyzer.analyze(f.matches, f.run1, f.run2, 2.0);

  ASSERT_EQ(analysis.growthMetrics.size(), 2u);
  EXPECT_DOUBLE_EQ(analysis.growthMetrics[0].depthGrowthRate, 8.0);
  EXPECT_TRUE(analysis.growthMetrics[0].isRapidGrowth);
  EXPECT_DOUBLE_EQ(analysis.growthMetrics[1].depthGrowthRate, 1.0);

  const GrowthStatistics& stats = analysis.statistics;
  EXPECT_EQ(stats.totalMatches, 2u);
  EXPECT_EQ(stats.rapidGrowthCount, 1u);
  EXPECT_DOUBLE_EQ(stats.rapidGrowthPercentage, 50.0);
  EXPECT_DOUBLE_EQ(stats.depth.mean, 4.5);
  EXPECT_DOUBLE_EQ(stats.depth.median, 4.5);
  EXPECT_NEAR(stats.depth.stdDev, std::sqrt(24.5), 1e-12);
  EXPECT_DOUBLE_EQ(stats.depth.min, 1.0);
  EXPECT_DOUBLE_EQ(stats.depth.max, 8.0);

  ASSERT_EQ(analysis.rapidGrowthAnomalies.size(), 1u);
  EXPECT_EQ(analysis.rapidGrowthAnomalies[0].anomalyId, "B1");
  EXPECT_DOUBLE_EQ(analysis.rapidGrowthAnomalies[0].currentDepthPct, 46.0);
  EXPECT_DOUBLE_EQ(analysis.rapidGrowthAnomalies[0].distance, 100.0);
}

TEST(GrowthAnalyzer, Analyze_NonPositiveInterval_Throws)
{
  TwoRunFixture const f;
  GrowthAnalyzer const analyzer;
  EXPECT_THROW((void)analyzer.analyze(f.matches, f.run1, f.run2, 0.0),
               std::invalid_argument);
}

TEST(GrowthAnalyzer, Analyze_UnknownAnomalyIds_Skipped)
{
  TwoRunFixture const f;
  std::vector<AnomalyRecord> const run2WithoutB2{f.run2[0]};

  GrowthAnalyzer const analyzer;
  auto const analysis = analyzer.analyze(f.matches, f.run1, run2WithoutB2, 2.0);

  ASSERT_EQ(analysis.growthMetrics.size(), 1u);
  EXPECT_EQ(analysis.growthMetrics[0].anomaly2Id, "B1");
}

TEST(GrowthAnalyzer, Statistics_EmptyAndSingle)
{
  auto const empty = GrowthAnalyzer::computeStatistics({});
  EXPECT_EQ(empty.totalMatches, 0u);
  EXPECT_DOUBLE_EQ(empty.depth.mean, 0.0);

  auto const single =
    GrowthAnalyzer::computeStatistics({metricsWithDepthRate(3.0, false)});
  EXPECT_DOUBLE_EQ(single.depth.mean, 3.0);
  EXPECT_DOUBLE_EQ(single.depth.median, 3.0);
  EXPECT_DOUBLE_EQ(single.depth.stdDev, 0.0);
}

TEST(GrowthAnalyzer, Statistics_OddCountMedian)
{
  auto const stats =
    GrowthAnalyzer::computeStatistics({metricsWithDepthRate(9.0, true),
                                       metricsWithDepthRate(-1.0, false),
                                       metricsWithDepthRate(2.0, false)});
  EXPECT_DOUBLE_EQ(stats.depth.median, 2.0);
  EXPECT_DOUBLE_EQ(stats.depth.min, -1.0);
  EXPECT_NEAR(stats.rapidGrowthPercentage, 100.0 / 3.0, 1e-12);
}

TEST(GrowthAnalyzer, Distribution_GroupsByCurrentFeatureType)
{
  TwoRunFixture f;
  AnomalySpec dent;
  dent.id = "B2";
  dent.runId = "R2";
  dent.distance = 500.0;
  dent.clock = 6.0;
  dent.depth = 22.0;
  dent.type = FeatureType::Dent;
  f.run2[1] = makeAnomaly(dent);

  GrowthAnalyzer const analyzer;
  auto const analysis = analyzer.analyze(f.matches, f.run1, f.run2, 2.0);
  auto const distribution =
    GrowthAnalyzer::distributionByFeatureType(analysis.growthMetrics, f.run2);

  ASSERT_EQ(distribution.size(), 2u);
  EXPECT_EQ(distribution.at(FeatureType::ExternalCorrosion).totalMatches, 1u);
  EXPECT_DOUBLE_EQ(distribution.at(FeatureType::Dent).depth.mean, 1.0);
}
