// Ticket: 0005_anomaly_similarity

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "ili-core/src/Matching/SimilarityCalculator.hpp"
#include "ili-core/test/Helpers/RecordFactory.hpp"

using namespace ili_core;
using ili_core::test::AnomalySpec;
using ili_core::test::makeAnomaly;

// ============================================================================
// Component kernels
// ============================================================================

TEST(SimilarityCalculator, DistanceKernel_OneSigmaApartIsExpMinusOne)
{
  SimilarityCalculator const calc;
  EXPECT_DOUBLE_EQ(calc.distanceSimilarity(100.0, 100.0), 1.0);
  EXPECT_NEAR(calc.distanceSimilarity(100.0, 105.0), std::exp(-1.0), 1e-12);
  EXPECT_NEAR(calc.distanceSimilarity(105.0, 100.0), std::exp(-1.0), 1e-12);
}

TEST(SimilarityCalculator, ClockKernel_WrapsAroundTwelve)
{
  SimilarityCalculator const calc;
  EXPECT_NEAR(calc.clockSimilarity(12.0, 1.0), std::exp(-1.0), 1e-12);
  EXPECT_NEAR(calc.clockSimilarity(11.5, 0.5), std::exp(-1.0), 1e-12);
  EXPECT_NEAR(calc.clockSimilarity(3.0, 9.0), std::exp(-36.0), 1e-20);
}

TEST(SimilarityCalculator, ClockKernel_SymmetricAndOneAtSamePosition)
{
  SimilarityCalculator const calc;
  EXPECT_DOUBLE_EQ(calc.clockSimilarity(1.0, 12.0),
                   calc.clockSimilarity(12.0, 1.0));
  EXPECT_DOUBLE_EQ(calc.clockSimilarity(4.5, 9.0),
                   calc.clockSimilarity(9.0, 4.5));
  for (double const clock : {1.0, 3.25, 6.0, 12.0})
  {
    EXPECT_DOUBLE_EQ(calc.clockSimilarity(clock, clock), 1.0);
  }
}

TEST(SimilarityCalculator, TypeKernel_ExactMatchOnly)
{
  EXPECT_DOUBLE_EQ(SimilarityCalculator::typeSimilarity(
                     FeatureType::Dent, FeatureType::Dent),
                   1.0);
  EXPECT_DOUBLE_EQ(SimilarityCalculator::typeSimilarity(
                     FeatureType::ExternalCorrosion,
                     FeatureType::InternalCorrosion),
                   0.0);
}

TEST(SimilarityCalculator, DimensionKernel_RelativeToCombinedSize)
{
  SimilarityCalculator const calc;
  double const sigma = 63.0 + 1e-6;
  EXPECT_NEAR(calc.dimensionSimilarity(30.0, 33.0),
              std::exp(-(3.0 / sigma) * (3.0 / sigma)),
              1e-12);
  EXPECT_DOUBLE_EQ(calc.dimensionSimilarity(0.0, 0.0), 1.0);
}

TEST(SimilarityCalculator, DimensionKernel_FixedSigmaWhenConfigured)
{
  SimilarityCalculator::Config config;
  config.dimensionSigma = 2.0;
  SimilarityCalculator const calc{config};

  EXPECT_NEAR(calc.dimensionSimilarity(10.0, 12.0), std::exp(-1.0), 1e-12);
}

// ============================================================================
// Weighted score
// ============================================================================

TEST(SimilarityCalculator, IdenticalAnomalies_ScoreOne)
{
  SimilarityCalculator const calc;
  auto const a = makeAnomaly("A1", 1234.5, 4.0, 45.0);
  auto const b = makeAnomaly("B1", 1234.5, 4.0, 45.0, "RUN_B");

  auto const breakdown = calc.calculate(a, b);

  EXPECT_NEAR(breakdown.overall, 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(breakdown.type, 1.0);
  EXPECT_NEAR(calc.similarity(a, b), 1.0, 1e-12);
}

TEST(SimilarityCalculator, DistanceOffsetOnly_WeightedByDistanceTerm)
{
  SimilarityCalculator const calc;
  auto const a = makeAnomaly("A1", 100.0);
  auto const b = makeAnomaly("B1", 105.0);

  EXPECT_NEAR(calc.similarity(a, b), 0.35 * std::exp(-1.0) + 0.65, 1e-12);
}

TEST(SimilarityCalculator, TypeMismatch_LosesTypeWeight)
{
  SimilarityCalculator const calc;
  AnomalySpec spec;
  auto const a = makeAnomaly(spec);
  spec.type = FeatureType::Crack;
  auto const b = makeAnomaly(spec);

  EXPECT_NEAR(calc.similarity(a, b), 0.85, 1e-12);
}

TEST(SimilarityCalculator, Matrix_RowsRunOneColumnsRunTwo)
{
  SimilarityCalculator const calc;
  std::vector<AnomalyRecord> const run1{makeAnomaly("A1", 100.0),
                                        makeAnomaly("A2", 500.0)};
  std::vector<AnomalyRecord> const run2{makeAnomaly("B1", 500.0),
                                        makeAnomaly("B2", 100.0),
                                        makeAnomaly("B3", 900.0)};

  Eigen::MatrixXd const m = calc.similarityMatrix(run1, run2);

  ASSERT_EQ(m.rows(), 2);
  ASSERT_EQ(m.cols(), 3);
  EXPECT_NEAR(m(0, 1), 1.0, 1e-12);
  EXPECT_NEAR(m(1, 0), 1.0, 1e-12);
  EXPECT_LT(m(0, 0), 0.7);
  EXPECT_TRUE((m.array() >= 0.0).all());
  EXPECT_TRUE((m.array() <= 1.0).all());
}

// ============================================================================
// Configuration
// ============================================================================

TEST(SimilarityCalculator, WeightsNotSummingToOne_Throws)
{
  SimilarityCalculator::Config config;
  config.weights.distance = 0.25;
  EXPECT_THROW(SimilarityCalculator{config}, std::invalid_argument);
}

TEST(SimilarityCalculator, NegativeWeight_Throws)
{
  SimilarityCalculator::Config config;
  config.weights.distance = -0.05;
  config.weights.clock = 0.60;
  EXPECT_THROW(SimilarityCalculator{config}, std::invalid_argument);
}

TEST(SimilarityCalculator, NonPositiveSigma_Throws)
{
  SimilarityCalculator::Config config;
  config.distanceSigma = 0.0;
  EXPECT_THROW(SimilarityCalculator{config}, std::invalid_argument);

  SimilarityCalculator::Config dimension;
  dimension.dimensionSigma = -1.0;
  EXPECT_THROW(SimilarityCalculator{dimension}, std::invalid_argument);
}

TEST(SimilarityCalculator, DefaultWeights_SumToOne)
{
  SimilarityCalculator::Weights const weights;
  EXPECT_NEAR(weights.sum(), 1.0, SimilarityCalculator::kWeightTolerance);
}
