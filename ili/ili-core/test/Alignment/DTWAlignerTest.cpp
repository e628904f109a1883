// Ticket: 0002_dtw_alignment

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "ili-core/src/Alignment/AlignmentQualityError.hpp"
#include "ili-core/src/Alignment/DTWAligner.hpp"
#include "ili-core/test/Helpers/RecordFactory.hpp"

using namespace ili_core;
using ili_core::test::makeWelds;

namespace
{

constexpr double kInf = std::numeric_limits<double>::infinity();

}  // namespace

// ============================================================================
// End-to-end alignment
// ============================================================================

TEST(DTWAligner, IdenticalSequences_PerfectAlignment)
{
  auto const run1 = makeWelds("R1", {0.0, 100.0, 200.0, 300.0});
  auto const run2 = makeWelds("R2", {0.0, 100.0, 200.0, 300.0});

  DTWAligner const aligner;
  AlignmentResult const result = aligner.align(run1, run2);

  EXPECT_EQ(result.run1Id(), "R1");
  EXPECT_EQ(result.run2Id(), "R2");
  EXPECT_NEAR(result.matchRate(), 100.0, 1e-12);
  EXPECT_NEAR(result.rmse(), 0.0, 1e-12);
  ASSERT_EQ(result.matchedPoints().size(), 4u);
  EXPECT_EQ(result.matchedPoints()[2].first, "R1-GW2");
  EXPECT_EQ(result.matchedPoints()[2].second, "R2-GW2");
}

TEST(DTWAligner, SmallDrift_PairsEachWeldDiagonally)
{
  auto const run1 = makeWelds("R1", {0.0, 500.0, 1000.0});
  auto const run2 = makeWelds("R2", {0.0, 520.0, 980.0});

  DTWAligner const aligner;
  DTWAligner::Alignment const raw = aligner.computeAlignment(run1, run2);

  ASSERT_EQ(raw.pairs.size(), 3u);
  EXPECT_NEAR(raw.matchRate, 100.0, 1e-12);
  EXPECT_NEAR(raw.rmse, std::sqrt(800.0 / 3.0), 1e-9);
  EXPECT_NEAR(raw.totalCost, 40.0, 1e-12);
  EXPECT_DOUBLE_EQ(raw.pairs[1].sourceDistance, 500.0);
  EXPECT_DOUBLE_EQ(raw.pairs[1].targetDistance, 520.0);
}

TEST(DTWAligner, RmseAboveGate_ThrowsQualityErrorWithMetrics)
{
  auto const run1 = makeWelds("R1", {0.0, 500.0, 1000.0});
  auto const run2 = makeWelds("R2", {0.0, 520.0, 980.0});

  DTWAligner const aligner;
  try
  {
    (void)aligner.align(run1, run2);
    FAIL() << "Expected AlignmentQualityError";
  }
  catch (const AlignmentQualityError& e)
  {
    EXPECT_NEAR(e.rmse(), std::sqrt(800.0 / 3.0), 1e-9);
    EXPECT_NEAR(e.matchRate(), 100.0, 1e-12);
  }
}

TEST(DTWAligner, DriftBeyondBand_NoPathAndQualityError)
{
  auto const run1 = makeWelds("R1", {1000.0});
  auto const run2 = makeWelds("R2", {1200.0});

  DTWAligner const aligner;
  DTWAligner::Alignment const raw = aligner.computeAlignment(run1, run2);

  EXPECT_TRUE(raw.pairs.empty());
  EXPECT_DOUBLE_EQ(raw.matchRate, 0.0);
  EXPECT_DOUBLE_EQ(raw.rmse, 0.0);
  EXPECT_THROW((void)aligner.align(run1, run2), AlignmentQualityError);
}

TEST(DTWAligner, ManyToOne_TrailingPointsShareTarget)
{
  auto const run1 = makeWelds("R1", {0.0, 100.0, 200.0, 210.0});
  auto const run2 = makeWelds("R2", {0.0, 100.0, 205.0});

  DTWAligner const aligner;
  DTWAligner::Alignment const raw = aligner.computeAlignment(run1, run2);

  ASSERT_EQ(raw.pairs.size(), 4u);
  EXPECT_EQ(raw.pairs[2].targetId, "R2-GW2");
  EXPECT_EQ(raw.pairs[3].targetId, "R2-GW2");
  EXPECT_NEAR(raw.matchRate, 100.0, 1e-12);
  EXPECT_NEAR(raw.rmse, std::sqrt(12.5), 1e-9);
}

TEST(DTWAligner, EmptySequence_ThrowsInvalidArgument)
{
  auto const run1 = makeWelds("R1", {0.0, 100.0});
  std::vector<ReferencePoint> const empty;

  DTWAligner const aligner;
  EXPECT_THROW((void)aligner.align(run1, empty), std::invalid_argument);
  EXPECT_THROW((void)aligner.computeAlignment(empty, run1),
               std::invalid_argument);
}

TEST(DTWAligner, NegativeDrift_ThrowsInvalidArgument)
{
  DTWAligner::Config config;
  config.driftConstraint = -0.1;
  EXPECT_THROW(DTWAligner{config}, std::invalid_argument);
}

// ============================================================================
// DTW stages
// ============================================================================

TEST(DTWAligner, DistanceMatrix_OutOfBandCellsInfinite)
{
  Eigen::VectorXd d1(2);
  d1 << 100.0, 200.0;
  Eigen::VectorXd d2(2);
  d2 << 105.0, 260.0;

  DTWAligner const aligner;
  Eigen::MatrixXd const m = aligner.computeDistanceMatrix(d1, d2);

  EXPECT_DOUBLE_EQ(m(0, 0), 5.0);
  EXPECT_TRUE(std::isinf(m(0, 1)));
  EXPECT_TRUE(std::isinf(m(1, 0)));
  EXPECT_TRUE(std::isinf(m(1, 1)));  // 60 > 0.1 * 230
}

TEST(DTWAligner, DistanceMatrix_ZeroDistancesAreFinite)
{
  Eigen::VectorXd zero(1);
  zero << 0.0;

  DTWAligner const aligner;
  Eigen::MatrixXd const m = aligner.computeDistanceMatrix(zero, zero);

  EXPECT_DOUBLE_EQ(m(0, 0), 0.0);
}

TEST(DTWAligner, Backtrack_DiagonalWinsThreeWayTie)
{
  Eigen::MatrixXd cost(3, 3);
  cost << 0.0, kInf, kInf,  //
    kInf, 2.0, 2.0,         //
    kInf, 2.0, 7.0;

  auto const path = DTWAligner::backtrack(cost);

  ASSERT_EQ(path.size(), 2u);
  EXPECT_EQ(path[0], (DTWAligner::Step{0, 0}));
  EXPECT_EQ(path[1], (DTWAligner::Step{1, 1}));
}

TEST(DTWAligner, Backtrack_VerticalWinsOverHorizontalTie)
{
  Eigen::MatrixXd cost(3, 3);
  cost << 0.0, kInf, kInf,  //
    kInf, 5.0, 2.0,         //
    kInf, 2.0, 9.0;

  auto const path = DTWAligner::backtrack(cost);

  ASSERT_EQ(path.size(), 3u);
  EXPECT_EQ(path[0], (DTWAligner::Step{0, 0}));
  EXPECT_EQ(path[1], (DTWAligner::Step{0, 1}));
  EXPECT_EQ(path[2], (DTWAligner::Step{1, 1}));
}

TEST(DTWAligner, AccumulateCost_BordersInfiniteOriginZero)
{
  Eigen::MatrixXd distance(2, 2);
  distance << 1.0, 3.0,  //
    2.0, 1.0;

  Eigen::MatrixXd const cost = DTWAligner::accumulateCost(distance);

  EXPECT_DOUBLE_EQ(cost(0, 0), 0.0);
  EXPECT_TRUE(std::isinf(cost(0, 1)));
  EXPECT_TRUE(std::isinf(cost(1, 0)));
  EXPECT_DOUBLE_EQ(cost(1, 1), 1.0);
  EXPECT_DOUBLE_EQ(cost(1, 2), 4.0);
  EXPECT_DOUBLE_EQ(cost(2, 1), 3.0);
  EXPECT_DOUBLE_EQ(cost(2, 2), 2.0);
}
