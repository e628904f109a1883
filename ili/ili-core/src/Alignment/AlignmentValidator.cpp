// Ticket: 0004_alignment_validation

#include "ili-core/src/Alignment/AlignmentValidator.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace ili_core
{

namespace
{

using UnmatchedReason = AlignmentValidator::UnmatchedReason;

std::string formatFeet(double value)
{
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value << "ft";
  return oss.str();
}

/**
 * @brief Explain why points[idx] is absent from the warping path.
 */
AlignmentValidator::UnmatchedPoint diagnose(
  size_t idx,
  const std::vector<ReferencePoint>& points,
  const std::unordered_set<std::string>& matchedIds,
  bool anyPairs)
{
  AlignmentValidator::UnmatchedPoint result;
  result.id = points[idx].id;
  result.distance = points[idx].distance;

  if (!anyPairs)
  {
    result.reason = UnmatchedReason::NoAlignmentPairs;
    result.detail = "No alignment pairs found";
    return result;
  }
  if (idx == 0)
  {
    result.reason = UnmatchedReason::RunStart;
    result.detail = "Point at beginning of run, outside alignment window";
    return result;
  }
  if (idx == points.size() - 1)
  {
    result.reason = UnmatchedReason::RunEnd;
    result.detail = "Point at end of run, outside alignment window";
    return result;
  }

  double const gapBefore =
    std::abs(points[idx].distance - points[idx - 1].distance);
  double const gapAfter =
    std::abs(points[idx + 1].distance - points[idx].distance);
  if (gapBefore > AlignmentValidator::kIsolationGapFt ||
      gapAfter > AlignmentValidator::kIsolationGapFt)
  {
    result.reason = UnmatchedReason::Isolated;
    result.detail = "Isolated point (gaps: " + formatFeet(gapBefore) +
                    " before, " + formatFeet(gapAfter) + " after)";
    return result;
  }

  double nearest = std::numeric_limits<double>::infinity();
  for (const auto& point : points)
  {
    if (matchedIds.contains(point.id))
    {
      nearest = std::min(nearest, std::abs(point.distance - result.distance));
    }
  }
  if (nearest < AlignmentValidator::kNearMatchedFt)
  {
    result.reason = UnmatchedReason::NearMatched;
    result.detail = "Close to matched point (" + formatFeet(nearest) +
                    ") but not selected by DTW";
    return result;
  }

  result.reason = UnmatchedReason::DataQuality;
  result.detail = "Could not be aligned, possible data quality issue";
  return result;
}

std::vector<AlignmentValidator::UnmatchedPoint> findUnmatched(
  const std::vector<ReferencePoint>& points,
  const std::unordered_set<std::string>& matchedIds,
  bool anyPairs)
{
  std::vector<AlignmentValidator::UnmatchedPoint> unmatched;
  for (size_t i = 0; i < points.size(); ++i)
  {
    if (!matchedIds.contains(points[i].id))
    {
      unmatched.push_back(diagnose(i, points, matchedIds, anyPairs));
    }
  }
  return unmatched;
}

}  // anonymous namespace

std::string_view toString(AlignmentValidator::UnmatchedReason reason)
{
  switch (reason)
  {
    case UnmatchedReason::NoAlignmentPairs:
      return "no_alignment_pairs";
    case UnmatchedReason::RunStart:
      return "run_start";
    case UnmatchedReason::RunEnd:
      return "run_end";
    case UnmatchedReason::Isolated:
      return "isolated";
    case UnmatchedReason::NearMatched:
      return "near_matched";
    case UnmatchedReason::DataQuality:
      return "data_quality";
  }
  return "data_quality";
}

AlignmentValidator::Report AlignmentValidator::validate(
  const DTWAligner::Alignment& alignment,
  const std::vector<ReferencePoint>& source,
  const std::vector<ReferencePoint>& target) const
{
  Report report;
  report.matchRate = alignment.matchRate;
  report.rmse = alignment.rmse;
  report.matchRatePassed = alignment.matchRate >= thresholds_.minMatchRate;
  report.rmsePassed = alignment.rmse <= thresholds_.maxRmse;
  report.isValid = report.matchRatePassed && report.rmsePassed;

  std::unordered_set<std::string> matchedSource;
  std::unordered_set<std::string> matchedTarget;
  for (const auto& pair : alignment.pairs)
  {
    matchedSource.insert(pair.sourceId);
    matchedTarget.insert(pair.targetId);
  }

  bool const anyPairs = !alignment.pairs.empty();
  report.unmatchedSource = findUnmatched(source, matchedSource, anyPairs);
  report.unmatchedTarget = findUnmatched(target, matchedTarget, anyPairs);

  // ===== Warnings =====
  if (!report.matchRatePassed)
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "Match rate "
        << report.matchRate << "% is below threshold "
        << thresholds_.minMatchRate << "%";
    report.warnings.push_back(oss.str());
  }
  if (!report.rmsePassed)
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << "RMSE " << report.rmse
        << " ft exceeds threshold " << thresholds_.maxRmse << " ft";
    report.warnings.push_back(oss.str());
  }
  if (!report.unmatchedSource.empty())
  {
    report.warnings.push_back(std::to_string(report.unmatchedSource.size()) +
                              " reference points unmatched in " +
                              (source.empty() ? "source" : source.front().runId));
  }
  if (!report.unmatchedTarget.empty())
  {
    report.warnings.push_back(std::to_string(report.unmatchedTarget.size()) +
                              " reference points unmatched in " +
                              (target.empty() ? "target" : target.front().runId));
  }

  // ===== Diagnostics =====
  Diagnostics& diag = report.diagnostics;
  diag.totalPairs = alignment.pairs.size();
  diag.totalCost = anyPairs ? alignment.totalCost : 0.0;

  if (anyPairs)
  {
    Eigen::VectorXd errors(static_cast<Eigen::Index>(alignment.pairs.size()));
    for (size_t i = 0; i < alignment.pairs.size(); ++i)
    {
      errors(static_cast<Eigen::Index>(i)) =
        std::abs(alignment.pairs[i].sourceDistance -
                 alignment.pairs[i].targetDistance);
    }
    diag.avgDistanceError = errors.mean();
    diag.maxDistanceError = errors.maxCoeff();
    diag.stdDistanceError =
      std::sqrt((errors.array() - diag.avgDistanceError).square().mean());
  }

  auto categorize = [&diag](const std::vector<UnmatchedPoint>& points)
  {
    for (const auto& point : points)
    {
      switch (point.reason)
      {
        case UnmatchedReason::RunStart:
        case UnmatchedReason::RunEnd:
          ++diag.boundaryPoints;
          break;
        case UnmatchedReason::Isolated:
          ++diag.isolatedPoints;
          break;
        case UnmatchedReason::DataQuality:
          ++diag.dataQualityIssues;
          break;
        case UnmatchedReason::NoAlignmentPairs:
        case UnmatchedReason::NearMatched:
          ++diag.otherUnmatched;
          break;
      }
    }
  };
  categorize(report.unmatchedSource);
  categorize(report.unmatchedTarget);

  return report;
}

std::string AlignmentValidator::formatReport(const Report& report) const
{
  std::ostringstream oss;
  oss << std::fixed;
  oss << "ALIGNMENT VALIDATION REPORT\n";
  oss << "Overall Status: " << (report.isValid ? "PASSED" : "FAILED") << "\n";
  oss << std::setprecision(1) << "Match Rate: " << report.matchRate
      << "% (threshold: " << thresholds_.minMatchRate << "%)"
      << (report.matchRatePassed ? "" : " FAILED") << "\n";
  oss << std::setprecision(2) << "RMSE: " << report.rmse
      << " ft (threshold: " << thresholds_.maxRmse << " ft)"
      << (report.rmsePassed ? "" : " FAILED") << "\n";

  const Diagnostics& diag = report.diagnostics;
  oss << "Aligned pairs: " << diag.totalPairs << "\n";
  oss << "Distance error avg/max/std: " << diag.avgDistanceError << " / "
      << diag.maxDistanceError << " / " << diag.stdDistanceError << " ft\n";

  auto const totalUnmatched =
    report.unmatchedSource.size() + report.unmatchedTarget.size();
  if (totalUnmatched > 0)
  {
    oss << "Unmatched reference points: " << totalUnmatched << "\n";
    for (const auto* list : {&report.unmatchedSource, &report.unmatchedTarget})
    {
      for (const auto& point : *list)
      {
        oss << "  " << point.id << " @ " << std::setprecision(1)
            << point.distance << " ft: " << point.detail << "\n";
      }
    }
  }

  for (const auto& warning : report.warnings)
  {
    oss << "Warning: " << warning << "\n";
  }

  return oss.str();
}

}  // namespace ili_core
