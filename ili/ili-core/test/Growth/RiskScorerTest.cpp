// Ticket: 0009_risk_scoring

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "ili-core/src/Growth/RiskScorer.hpp"
#include "ili-core/test/Helpers/RecordFactory.hpp"

using namespace ili_core;
using ili_core::test::makeAnomaly;
using ili_core::test::makeWelds;

namespace
{

RiskAssessment assessmentWithScore(const std::string& id, double score)
{
  RiskAssessment assessment;
  assessment.anomalyId = id;
  assessment.riskScore = score;
  return assessment;
}

}  // namespace

// ============================================================================
// Location factor
// ============================================================================

TEST(RiskScorer, LocationFactor_NoReferencePoints_Baseline)
{
  RiskScorer const scorer;
  EXPECT_DOUBLE_EQ(scorer.locationFactor(makeAnomaly("A1", 100.0), {}), 0.5);
}

TEST(RiskScorer, LocationFactor_DecaysWithWeldDistance)
{
  RiskScorer const scorer;
  auto const welds = makeWelds("R", {0.0, 100.0});

  EXPECT_DOUBLE_EQ(scorer.locationFactor(makeAnomaly("A1", 102.0), welds), 1.0);
  EXPECT_DOUBLE_EQ(scorer.locationFactor(makeAnomaly("A2", 106.5), welds),
                   0.75);
  EXPECT_DOUBLE_EQ(scorer.locationFactor(makeAnomaly("A3", 110.0), welds), 0.5);
  EXPECT_DOUBLE_EQ(scorer.locationFactor(makeAnomaly("A4", 50.0), welds), 0.5);
}

// ============================================================================
// Score
// ============================================================================

TEST(RiskScorer, Score_WeightedBlend)
{
  RiskScorer const scorer;
  auto const anomaly = makeAnomaly("A1", 100.0, 12.0, 50.0);

  EXPECT_NEAR(scorer.score(anomaly, 5.0, 1.0), 0.55, 1e-12);
}

TEST(RiskScorer, Score_ClusteredAnomalyBoosted)
{
  RiskScorer const scorer;
  auto const anomaly =
    makeAnomaly("A1", 100.0, 12.0, 50.0).withClusterId("ZONE_R_0000");

  EXPECT_NEAR(scorer.score(anomaly, 5.0, 1.0), 0.65, 1e-12);
}

TEST(RiskScorer, Score_ClippedToUnitInterval)
{
  RiskScorer const scorer;
  auto const deep =
    makeAnomaly("A1", 100.0, 12.0, 100.0).withClusterId("ZONE_R_0000");
  EXPECT_DOUBLE_EQ(scorer.score(deep, 20.0, 1.0), 1.0);

  auto const shrinking = makeAnomaly("A2", 100.0, 12.0, 50.0);
  EXPECT_NEAR(scorer.score(shrinking, -3.0, 0.5), 0.35, 1e-12);
}

TEST(RiskScorer, Assess_ReportsContributions)
{
  RiskScorer const scorer;
  auto const anomaly =
    makeAnomaly("A1", 102.0, 12.0, 50.0).withClusterId("ZONE_R_0000");
  auto const welds = makeWelds("R", {100.0});

  RiskAssessment const a = scorer.assess(anomaly, 5.0, welds);

  EXPECT_EQ(a.anomalyId, "A1");
  EXPECT_TRUE(a.isClustered);
  EXPECT_DOUBLE_EQ(a.locationFactor, 1.0);
  EXPECT_NEAR(a.depthContribution, 0.3, 1e-12);
  EXPECT_NEAR(a.growthContribution, 0.15, 1e-12);
  EXPECT_NEAR(a.locationContribution, 0.1, 1e-12);
  EXPECT_NEAR(a.clusterContribution, 0.1, 1e-12);
  EXPECT_NEAR(a.riskScore, 0.65, 1e-12);
}

TEST(RiskScorer, ScoreAnomalies_MissingGrowthDefaultsToZero)
{
  RiskScorer const scorer;
  std::vector<AnomalyRecord> const anomalies{
    makeAnomaly("B1", 100.0, 12.0, 40.0), makeAnomaly("B2", 500.0, 12.0, 40.0)};

  GrowthMetrics metrics;
  metrics.anomaly2Id = "B1";
  metrics.depthGrowthRate = 10.0;

  auto const assessments = scorer.scoreAnomalies(anomalies, {metrics}, {});

  ASSERT_EQ(assessments.size(), 2u);
  EXPECT_DOUBLE_EQ(assessments[0].growthRate, 10.0);
  EXPECT_DOUBLE_EQ(assessments[1].growthRate, 0.0);
  EXPECT_GT(assessments[0].riskScore, assessments[1].riskScore);
}

TEST(RiskScorer, ScoreGrowthMetrics_FillsRiskFromCurrentAnomaly)
{
  RiskScorer const scorer;
  std::vector<AnomalyRecord> const run2{makeAnomaly("B1", 100.0, 12.0, 50.0)};

  GrowthMetrics metrics;
  metrics.anomaly2Id = "B1";
  metrics.depthGrowthRate = 5.0;

  auto const scored = scorer.scoreGrowthMetrics({metrics}, run2, {});

  ASSERT_EQ(scored.size(), 1u);
  EXPECT_NEAR(scored[0].riskScore, 0.3 + 0.15 + 0.05, 1e-12);
}

// ============================================================================
// Views
// ============================================================================

TEST(RiskScorer, RankByRisk_DescendingStableAndTruncated)
{
  std::vector<RiskAssessment> const input{assessmentWithScore("A", 0.2),
                                          assessmentWithScore("B", 0.9),
                                          assessmentWithScore("C", 0.5),
                                          assessmentWithScore("D", 0.5)};

  auto const ranked = RiskScorer::rankByRisk(input);
  ASSERT_EQ(ranked.size(), 4u);
  EXPECT_EQ(ranked[0].anomalyId, "B");
  EXPECT_EQ(ranked[1].anomalyId, "C");
  EXPECT_EQ(ranked[2].anomalyId, "D");
  EXPECT_EQ(ranked[3].anomalyId, "A");

  auto const top = RiskScorer::rankByRisk(input, 2);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[1].anomalyId, "C");

  EXPECT_EQ(input[0].anomalyId, "A");
}

TEST(RiskScorer, HighRisk_FiltersAtThreshold)
{
  std::vector<RiskAssessment> const input{assessmentWithScore("A", 0.7),
                                          assessmentWithScore("B", 0.69),
                                          assessmentWithScore("C", 0.95)};

  auto const high = RiskScorer::highRiskAnomalies(input);

  ASSERT_EQ(high.size(), 2u);
  EXPECT_EQ(high[0].anomalyId, "C");
  EXPECT_EQ(high[1].anomalyId, "A");
  EXPECT_EQ(RiskScorer::highRiskAnomalies(input, 0.9).size(), 1u);
}

TEST(RiskScorer, WeightsNotSummingToOne_Throws)
{
  RiskScorer::Config config;
  config.depthWeight = 0.7;
  EXPECT_THROW(RiskScorer{config}, std::invalid_argument);
}

TEST(RiskScorer, NegativeClusterBoost_Throws)
{
  RiskScorer::Config config;
  config.clusterBoost = -0.1;
  EXPECT_THROW(RiskScorer{config}, std::invalid_argument);
}
