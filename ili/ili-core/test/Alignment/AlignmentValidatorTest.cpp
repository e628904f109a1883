// Ticket: 0004_alignment_validation

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ili-core/src/Alignment/AlignmentValidator.hpp"
#include "ili-core/test/Helpers/RecordFactory.hpp"

using namespace ili_core;
using ili_core::test::makeWelds;

namespace
{

using Reason = AlignmentValidator::UnmatchedReason;

DTWAligner::MatchedPair pairOf(const ReferencePoint& source,
                               const ReferencePoint& target)
{
  return DTWAligner::MatchedPair{
    source.id, target.id, source.distance, target.distance};
}

}  // namespace

TEST(AlignmentValidator, PerfectAlignment_ValidWithoutWarnings)
{
  auto const source = makeWelds("R1", {0.0, 100.0, 200.0});
  auto const target = makeWelds("R2", {0.0, 100.0, 200.0});

  DTWAligner const aligner;
  auto const alignment = aligner.computeAlignment(source, target);

  AlignmentValidator const validator;
  auto const report = validator.validate(alignment, source, target);

  EXPECT_TRUE(report.isValid);
  EXPECT_TRUE(report.matchRatePassed);
  EXPECT_TRUE(report.rmsePassed);
  EXPECT_TRUE(report.unmatchedSource.empty());
  EXPECT_TRUE(report.unmatchedTarget.empty());
  EXPECT_TRUE(report.warnings.empty());
  EXPECT_EQ(report.diagnostics.totalPairs, 3u);
  EXPECT_DOUBLE_EQ(report.diagnostics.maxDistanceError, 0.0);
}

TEST(AlignmentValidator, UnmatchedPoints_DiagnosedByPosition)
{
  auto const source = makeWelds("R1", {0.0, 90.0, 100.0, 250.0, 300.0, 400.0});
  auto const target = makeWelds("R2", {0.0, 100.0, 200.0, 300.0});

  DTWAligner::Alignment alignment;
  alignment.pairs = {pairOf(source[0], target[1]),
                     pairOf(source[2], target[1]),
                     pairOf(source[4], target[2]),
                     pairOf(source[5], target[2])};
  alignment.matchRate = 50.0;
  alignment.rmse = 2.0;
  alignment.totalCost = 400.0;

  AlignmentValidator const validator;
  auto const report = validator.validate(alignment, source, target);

  EXPECT_FALSE(report.isValid);
  EXPECT_FALSE(report.matchRatePassed);
  EXPECT_TRUE(report.rmsePassed);

  ASSERT_EQ(report.unmatchedSource.size(), 2u);
  EXPECT_EQ(report.unmatchedSource[0].id, "R1-GW1");
  EXPECT_EQ(report.unmatchedSource[0].reason, Reason::NearMatched);
  EXPECT_EQ(report.unmatchedSource[1].id, "R1-GW3");
  EXPECT_EQ(report.unmatchedSource[1].reason, Reason::Isolated);

  ASSERT_EQ(report.unmatchedTarget.size(), 2u);
  EXPECT_EQ(report.unmatchedTarget[0].reason, Reason::RunStart);
  EXPECT_EQ(report.unmatchedTarget[1].reason, Reason::RunEnd);

  EXPECT_EQ(report.diagnostics.boundaryPoints, 2u);
  EXPECT_EQ(report.diagnostics.isolatedPoints, 1u);
  EXPECT_EQ(report.diagnostics.otherUnmatched, 1u);
  EXPECT_EQ(report.diagnostics.dataQualityIssues, 0u);
  EXPECT_DOUBLE_EQ(report.diagnostics.avgDistanceError, 100.0);
  EXPECT_DOUBLE_EQ(report.diagnostics.maxDistanceError, 200.0);
  EXPECT_DOUBLE_EQ(report.diagnostics.totalCost, 400.0);

  EXPECT_EQ(report.warnings.size(), 3u);
}

TEST(AlignmentValidator, InteriorGapWithoutNearbyMatch_DataQuality)
{
  auto const source = makeWelds("R1", {0.0, 50.0, 100.0});
  auto const target = makeWelds("R2", {0.0, 50.0, 100.0});

  DTWAligner::Alignment alignment;
  alignment.pairs = {pairOf(source[0], target[0]),
                     pairOf(source[2], target[2])};
  alignment.matchRate = 66.7;

  AlignmentValidator const validator;
  auto const report = validator.validate(alignment, source, target);

  ASSERT_EQ(report.unmatchedSource.size(), 1u);
  EXPECT_EQ(report.unmatchedSource[0].reason, Reason::DataQuality);
  ASSERT_EQ(report.unmatchedTarget.size(), 1u);
  EXPECT_EQ(report.unmatchedTarget[0].reason, Reason::DataQuality);
  EXPECT_EQ(report.diagnostics.dataQualityIssues, 2u);
}

TEST(AlignmentValidator, NoPairs_EveryPointUnmatchedWithoutThrowing)
{
  auto const source = makeWelds("R1", {1000.0});
  auto const target = makeWelds("R2", {1200.0});

  DTWAligner const aligner;
  auto const alignment = aligner.computeAlignment(source, target);

  AlignmentValidator const validator;
  AlignmentValidator::Report report;
  ASSERT_NO_THROW(report = validator.validate(alignment, source, target));

  EXPECT_FALSE(report.isValid);
  ASSERT_EQ(report.unmatchedSource.size(), 1u);
  EXPECT_EQ(report.unmatchedSource[0].reason, Reason::NoAlignmentPairs);
  ASSERT_EQ(report.unmatchedTarget.size(), 1u);
  EXPECT_EQ(report.unmatchedTarget[0].reason, Reason::NoAlignmentPairs);
  EXPECT_DOUBLE_EQ(report.diagnostics.totalCost, 0.0);
}

TEST(AlignmentValidator, FormatReport_NamesStatusAndUnmatchedIds)
{
  auto const source = makeWelds("R1", {1000.0});
  auto const target = makeWelds("R2", {1200.0});

  DTWAligner const aligner;
  AlignmentValidator const validator;
  auto const report = validator.validate(
    aligner.computeAlignment(source, target), source, target);

  std::string const text = validator.formatReport(report);

  EXPECT_NE(text.find("FAILED"), std::string::npos);
  EXPECT_NE(text.find("R1-GW0"), std::string::npos);
  EXPECT_NE(text.find("R2-GW0"), std::string::npos);
}

TEST(AlignmentValidator, ReasonNames_StableStrings)
{
  EXPECT_EQ(toString(Reason::RunStart), "run_start");
  EXPECT_EQ(toString(Reason::Isolated), "isolated");
  EXPECT_EQ(toString(Reason::NearMatched), "near_matched");
}
